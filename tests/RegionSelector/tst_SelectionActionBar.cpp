#include <QtTest>

#include <QPushButton>
#include <QSignalSpy>

#include "region/SelectionActionBar.h"

namespace {

QPushButton* findButton(QWidget* parent, const QString& text)
{
    const auto buttons = parent->findChildren<QPushButton*>();
    for (QPushButton* button : buttons) {
        if (button->text() == text) {
            return button;
        }
    }
    return nullptr;
}

} // namespace

class tst_SelectionActionBar : public QObject
{
    Q_OBJECT

private slots:
    void testComputePosition_data();
    void testComputePosition();

    void testHiddenInitially();
    void testShowsForValidRegion();
    void testHidesForSmallOrMissingRegion();
    void testDevicePixelRatioMapping();
    void testButtonsEmitSignals();
};

void tst_SelectionActionBar::testComputePosition_data()
{
    QTest::addColumn<QRect>("selection");
    QTest::addColumn<QPoint>("expected");

    QTest::newRow("below") << QRect(100, 100, 400, 300) << QPoint(200, 412);
    QTest::newRow("above") << QRect(100, 700, 400, 330) << QPoint(200, 648);
    QTest::newRow("inside") << QRect(0, 0, 1920, 1080) << QPoint(860, 1028);
    QTest::newRow("clamp left") << QRect(0, 100, 100, 100) << QPoint(10, 212);
    QTest::newRow("clamp right") << QRect(1850, 100, 70, 100) << QPoint(1710, 212);
}

void tst_SelectionActionBar::testComputePosition()
{
    QFETCH(QRect, selection);
    QFETCH(QPoint, expected);

    const QPoint pos = SelectionActionBar::computePosition(selection, QSize(200, 40), QSize(1920, 1080));
    QCOMPARE(pos, expected);
}

void tst_SelectionActionBar::testHiddenInitially()
{
    QWidget container;
    container.resize(800, 600);
    SelectionActionBar bar(&container);

    QVERIFY(bar.isHidden());
}

void tst_SelectionActionBar::testShowsForValidRegion()
{
    QWidget container;
    container.resize(800, 600);
    SelectionActionBar bar(&container);

    bar.updateForCropRegion(QRect(100, 100, 300, 200));

    QVERIFY(!bar.isHidden());
    QCOMPARE(bar.pos(), SelectionActionBar::computePosition(QRect(100, 100, 300, 200),
                                                            bar.size(), container.size()));
}

void tst_SelectionActionBar::testHidesForSmallOrMissingRegion()
{
    QWidget container;
    container.resize(800, 600);
    SelectionActionBar bar(&container);

    bar.updateForCropRegion(QRect(100, 100, 300, 200));
    QVERIFY(!bar.isHidden());

    bar.updateForCropRegion(QRect(100, 100, 19, 200));
    QVERIFY(bar.isHidden());

    bar.updateForCropRegion(QRect(100, 100, 300, 200));
    bar.updateForCropRegion(std::nullopt);
    QVERIFY(bar.isHidden());
}

void tst_SelectionActionBar::testDevicePixelRatioMapping()
{
    QWidget container;
    container.resize(800, 600);
    SelectionActionBar bar(&container);
    bar.setDevicePixelRatio(2.0);

    bar.updateForCropRegion(QRect(200, 200, 400, 300));

    QVERIFY(!bar.isHidden());
    QCOMPARE(bar.pos(), SelectionActionBar::computePosition(QRect(100, 100, 200, 150),
                                                            bar.size(), container.size()));
}

void tst_SelectionActionBar::testButtonsEmitSignals()
{
    SelectionActionBar bar;
    QSignalSpy copySpy(&bar, &SelectionActionBar::copyRequested);
    QSignalSpy saveSpy(&bar, &SelectionActionBar::saveRequested);
    QSignalSpy cancelSpy(&bar, &SelectionActionBar::cancelRequested);

    QPushButton* copy = findButton(&bar, "Copy");
    QPushButton* save = findButton(&bar, "Save");
    QPushButton* cancel = findButton(&bar, "Cancel");
    QVERIFY(copy);
    QVERIFY(save);
    QVERIFY(cancel);

    copy->click();
    save->click();
    save->click();
    cancel->click();

    QCOMPARE(copySpy.count(), 1);
    QCOMPARE(saveSpy.count(), 2);
    QCOMPARE(cancelSpy.count(), 1);
}

QTEST_MAIN(tst_SelectionActionBar)
#include "tst_SelectionActionBar.moc"
