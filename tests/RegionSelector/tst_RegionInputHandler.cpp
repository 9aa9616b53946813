#include <QtTest>

#include <QMouseEvent>
#include <QSignalSpy>

#include <optional>

#include "cursor/CursorManager.h"
#include "region/RegionInputHandler.h"
#include "region/SelectionStateManager.h"

namespace {

QMouseEvent makeMouseEvent(QEvent::Type type,
                           const QPoint& pos,
                           Qt::MouseButton button,
                           Qt::MouseButtons buttons)
{
    const QPointF point(pos);
    return QMouseEvent(type, point, point, point, button, buttons, Qt::NoModifier);
}

} // namespace

class tst_RegionInputHandler : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testDragCreatesSelection();
    void testDragWithDevicePixelRatio();
    void testRightButtonIgnored();
    void testMoveHandleResizes();
    void testPredefinedRegionClickSelects();
    void testPressOutsidePredefinedRegionStartsDrag();
    void testHoverPredefinedRegionUsesPointerCursor();
    void testHoverDoesNotEmitCropChange();
    void testCursorApplyDeduplicated();
    void testCursorAfterReleaseFollowsPosition();
    void testEnterAndLeave();
    void testSelectAll();
    void testWithoutSelectionManager();

private:
    void recordCropRegions();

    RegionInputHandler* m_handler = nullptr;
    SelectionStateManager* m_selectionManager = nullptr;
    CursorManager* m_cursorManager = nullptr;
    QVector<std::optional<QRect>> m_cropRegions;
};

void tst_RegionInputHandler::init()
{
    m_handler = new RegionInputHandler();
    m_selectionManager = new SelectionStateManager();
    m_selectionManager->setBounds(QSizeF(1920, 1080));
    m_cursorManager = new CursorManager();

    m_handler->setSelectionManager(m_selectionManager);
    m_handler->setCursorManager(m_cursorManager);
    m_cropRegions.clear();
}

void tst_RegionInputHandler::cleanup()
{
    delete m_cursorManager;
    m_cursorManager = nullptr;

    delete m_selectionManager;
    m_selectionManager = nullptr;

    delete m_handler;
    m_handler = nullptr;
}

void tst_RegionInputHandler::recordCropRegions()
{
    connect(m_handler, &RegionInputHandler::cropRegionChanged, this,
            [this](const std::optional<QRect>& region) { m_cropRegions.append(region); });
}

void tst_RegionInputHandler::testDragCreatesSelection()
{
    recordCropRegions();
    QSignalSpy updateSpy(m_handler, &RegionInputHandler::updateRequested);

    auto pressEvent = makeMouseEvent(QEvent::MouseButtonPress, QPoint(100, 100), Qt::LeftButton, Qt::LeftButton);
    m_handler->handleMousePress(&pressEvent);
    QVERIFY(m_handler->isDragActive());
    QVERIFY(m_selectionManager->isCreating());

    auto moveEvent = makeMouseEvent(QEvent::MouseMove, QPoint(300, 250), Qt::NoButton, Qt::LeftButton);
    m_handler->handleMouseMove(&moveEvent);

    auto releaseEvent = makeMouseEvent(QEvent::MouseButtonRelease, QPoint(300, 250), Qt::LeftButton, Qt::NoButton);
    m_handler->handleMouseRelease(&releaseEvent);

    QVERIFY(!m_handler->isDragActive());
    QVERIFY(!m_selectionManager->isDragging());
    QCOMPARE(m_cropRegions.size(), 3);
    QVERIFY(m_cropRegions.at(0).has_value());
    QCOMPARE(*m_cropRegions.at(0), QRect(100, 100, 0, 0));
    QCOMPARE(*m_cropRegions.at(1), QRect(100, 100, 200, 150));
    QCOMPARE(*m_cropRegions.at(2), QRect(100, 100, 200, 150));
    QCOMPARE(updateSpy.count(), 3);
    QCOMPARE(m_handler->currentPoint(), QPointF(300, 250));
}

void tst_RegionInputHandler::testDragWithDevicePixelRatio()
{
    m_handler->setDevicePixelRatio(2.0);
    recordCropRegions();

    auto pressEvent = makeMouseEvent(QEvent::MouseButtonPress, QPoint(50, 50), Qt::LeftButton, Qt::LeftButton);
    m_handler->handleMousePress(&pressEvent);
    auto moveEvent = makeMouseEvent(QEvent::MouseMove, QPoint(150, 125), Qt::NoButton, Qt::LeftButton);
    m_handler->handleMouseMove(&moveEvent);
    auto releaseEvent = makeMouseEvent(QEvent::MouseButtonRelease, QPoint(150, 125), Qt::LeftButton, Qt::NoButton);
    m_handler->handleMouseRelease(&releaseEvent);

    QVERIFY(!m_cropRegions.isEmpty());
    QCOMPARE(*m_cropRegions.last(), QRect(100, 100, 200, 150));
    QCOMPARE(m_handler->currentPoint(), QPointF(300, 250));
}

void tst_RegionInputHandler::testRightButtonIgnored()
{
    recordCropRegions();

    auto pressEvent = makeMouseEvent(QEvent::MouseButtonPress, QPoint(100, 100), Qt::RightButton, Qt::RightButton);
    m_handler->handleMousePress(&pressEvent);
    auto releaseEvent = makeMouseEvent(QEvent::MouseButtonRelease, QPoint(100, 100), Qt::RightButton, Qt::NoButton);
    m_handler->handleMouseRelease(&releaseEvent);

    QVERIFY(!m_selectionManager->hasRect());
    QVERIFY(!m_handler->isDragActive());
    QVERIFY(m_cropRegions.isEmpty());
}

void tst_RegionInputHandler::testMoveHandleResizes()
{
    m_selectionManager->setRect(SelectionRect(100, 100, 400, 300));
    recordCropRegions();

    m_handler->pressAt(QPointF(500, 400));
    QVERIFY(m_selectionManager->isResizing());
    QCOMPARE(m_cursorManager->currentCursorName(), QString("se-resize"));

    m_handler->moveTo(QPointF(600, 450));
    m_handler->releaseAt(QPointF(600, 450));

    QCOMPARE(*m_cropRegions.last(), QRect(100, 100, 500, 350));
}

void tst_RegionInputHandler::testPredefinedRegionClickSelects()
{
    m_selectionManager->setPredefinedRegions({SelectionRect(50, 50, 200, 100)});
    recordCropRegions();

    m_handler->pressAt(QPointF(60, 60));

    QVERIFY(!m_handler->isDragActive());
    QVERIFY(!m_selectionManager->isDragging());
    QCOMPARE(m_cropRegions.size(), 1);
    QCOMPARE(*m_cropRegions.first(), QRect(50, 50, 200, 100));

    // Release after a one-click selection leaves the rect alone
    m_handler->releaseAt(QPointF(60, 60));
    QCOMPARE(m_cropRegions.size(), 1);
    QCOMPARE(m_selectionManager->rect()->toRectF(), QRectF(50, 50, 200, 100));
}

void tst_RegionInputHandler::testPressOutsidePredefinedRegionStartsDrag()
{
    m_selectionManager->setPredefinedRegions({SelectionRect(50, 50, 200, 100)});

    m_handler->pressAt(QPointF(400, 400));

    QVERIFY(m_handler->isDragActive());
    QVERIFY(m_selectionManager->isCreating());
}

void tst_RegionInputHandler::testHoverPredefinedRegionUsesPointerCursor()
{
    m_selectionManager->setPredefinedRegions({SelectionRect(50, 50, 200, 100)});

    m_handler->hoverAt(QPointF(60, 60));
    QCOMPARE(m_selectionManager->hoveredRegion(), 0);
    QCOMPARE(m_cursorManager->currentCursorName(), QString("pointer"));

    m_handler->hoverAt(QPointF(600, 600));
    QCOMPARE(m_selectionManager->hoveredRegion(), -1);
    QCOMPARE(m_cursorManager->currentCursorName(), QString("crosshair"));
}

void tst_RegionInputHandler::testHoverDoesNotEmitCropChange()
{
    recordCropRegions();
    QSignalSpy updateSpy(m_handler, &RegionInputHandler::updateRequested);

    auto moveEvent = makeMouseEvent(QEvent::MouseMove, QPoint(300, 300), Qt::NoButton, Qt::NoButton);
    m_handler->handleMouseMove(&moveEvent);

    QVERIFY(m_cropRegions.isEmpty());
    QCOMPARE(updateSpy.count(), 1);
    QVERIFY(m_handler->isPointerInside());
    QVERIFY(!m_selectionManager->hasRect());
}

void tst_RegionInputHandler::testCursorApplyDeduplicated()
{
    m_handler->hoverAt(QPointF(500, 500));
    QCOMPARE(m_cursorManager->applyCount(), 1);

    m_handler->hoverAt(QPointF(510, 510));
    m_handler->hoverAt(QPointF(520, 520));
    QCOMPARE(m_cursorManager->applyCount(), 1);

    m_selectionManager->setRect(SelectionRect(100, 100, 400, 300));
    m_handler->hoverAt(QPointF(300, 250));
    QCOMPARE(m_cursorManager->currentCursorName(), QString("grab"));
    QCOMPARE(m_cursorManager->applyCount(), 2);
}

void tst_RegionInputHandler::testCursorAfterReleaseFollowsPosition()
{
    m_selectionManager->setRect(SelectionRect(100, 100, 400, 300));

    m_handler->pressAt(QPointF(300, 250));
    QCOMPARE(m_cursorManager->currentCursorName(), QString("grabbing"));

    m_handler->moveTo(QPointF(320, 260));
    m_handler->releaseAt(QPointF(320, 260));
    QCOMPARE(m_cursorManager->currentCursorName(), QString("grab"));
}

void tst_RegionInputHandler::testEnterAndLeave()
{
    m_handler->setDevicePixelRatio(2.0);
    QSignalSpy updateSpy(m_handler, &RegionInputHandler::updateRequested);

    QVERIFY(!m_handler->isPointerInside());
    m_handler->handleEnter(QPointF(10, 20));
    QVERIFY(m_handler->isPointerInside());
    QCOMPARE(m_handler->currentPoint(), QPointF(20, 40));

    m_handler->handleLeave();
    QVERIFY(!m_handler->isPointerInside());
    QCOMPARE(updateSpy.count(), 2);
}

void tst_RegionInputHandler::testSelectAll()
{
    recordCropRegions();

    m_handler->selectAll();

    QCOMPARE(m_cropRegions.size(), 1);
    QCOMPARE(*m_cropRegions.first(), QRect(0, 0, 1920, 1080));
}

void tst_RegionInputHandler::testWithoutSelectionManager()
{
    RegionInputHandler handler;
    int cropChanges = 0;
    connect(&handler, &RegionInputHandler::cropRegionChanged, this,
            [&cropChanges](const std::optional<QRect>&) { ++cropChanges; });

    handler.pressAt(QPointF(10, 10));
    handler.moveTo(QPointF(50, 50));
    handler.releaseAt(QPointF(50, 50));
    handler.selectAll();

    QCOMPARE(cropChanges, 0);
    QVERIFY(!handler.isDragActive());
}

QTEST_MAIN(tst_RegionInputHandler)
#include "tst_RegionInputHandler.moc"
