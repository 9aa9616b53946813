#include "RegionSelector.h"
#include "cursor/CursorManager.h"
#include "region/RegionExportManager.h"
#include "region/RegionInputHandler.h"
#include "region/SelectionActionBar.h"
#include "region/SelectionStateManager.h"
#include "settings/RegionCaptureSettingsManager.h"

#include <QDebug>
#include <QEnterEvent>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QPainter>

RegionSelector::RegionSelector(QWidget *parent)
    : QWidget(parent)
    , m_selectionManager(new SelectionStateManager(this))
    , m_cursorManager(new CursorManager(this))
    , m_inputHandler(new RegionInputHandler(this))
    , m_exportManager(new RegionExportManager(this))
    , m_actionBar(new SelectionActionBar(this))
{
    setWindowFlags(Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint | Qt::Tool);
    setAttribute(Qt::WA_DeleteOnClose);
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);

    m_cursorManager->setTargetWidget(this);
    m_cursorManager->applyCursor(QStringLiteral("crosshair"));

    m_inputHandler->setSelectionManager(m_selectionManager);
    m_inputHandler->setCursorManager(m_cursorManager);

    connect(m_inputHandler, &RegionInputHandler::updateRequested,
            this, QOverload<>::of(&QWidget::update));
    connect(m_inputHandler, &RegionInputHandler::cropRegionChanged,
            m_actionBar, &SelectionActionBar::updateForCropRegion);

    connect(m_actionBar, &SelectionActionBar::copyRequested, this, &RegionSelector::copyToClipboard);
    connect(m_actionBar, &SelectionActionBar::saveRequested, this, &RegionSelector::saveToFile);
    connect(m_actionBar, &SelectionActionBar::cancelRequested, this, &RegionSelector::cancel);

    connect(m_exportManager, &RegionExportManager::exportFailed, this, [](const QString &error) {
        qWarning() << "RegionSelector: Export failed:" << error;
    });

    applySettings();
}

RegionSelector::~RegionSelector()
{
    qDebug() << "RegionSelector: Destroyed";
}

void RegionSelector::initialize(const QImage &screenshot, qreal devicePixelRatio,
                                const QVector<SelectionRect> &predefinedRegions)
{
    m_devicePixelRatio = devicePixelRatio > 0 ? devicePixelRatio : 1.0;
    m_backgroundImage = screenshot;
    m_backgroundPixmap = QPixmap::fromImage(screenshot);
    m_backgroundPixmap.setDevicePixelRatio(m_devicePixelRatio);

    m_selectionManager->setBounds(QSizeF(screenshot.size()));
    m_selectionManager->setPredefinedRegions(predefinedRegions);
    m_inputHandler->setDevicePixelRatio(m_devicePixelRatio);
    m_actionBar->setDevicePixelRatio(m_devicePixelRatio);
    m_exportManager->setSourceImage(screenshot);

    qDebug() << "RegionSelector: Initialized, image size:" << screenshot.size()
             << "devicePixelRatio:" << m_devicePixelRatio
             << "predefined regions:" << predefinedRegions.size();
}

void RegionSelector::applySettings()
{
    auto &settings = RegionCaptureSettingsManager::instance();

    RegionRenderStyle style;
    style.dimColor = QColor(0, 0, 0, settings.loadDimOpacity());
    style.borderWidth = settings.loadBorderWidth();
    style.showMagnifier = settings.isMagnifierEnabled();
    m_painter.setStyle(style);
    m_painter.magnifier().setShowHexColor(settings.isHexColorEnabled());
}

DrawList RegionSelector::currentDrawList() const
{
    return m_painter.buildDrawList(renderInput());
}

RenderInput RegionSelector::renderInput() const
{
    RenderInput input;
    input.image = &m_backgroundImage;
    input.selection = m_selectionManager;
    input.cursor = m_inputHandler->currentPoint();
    input.pointerInside = m_inputHandler->isPointerInside();
    input.canvasSize = QSizeF(m_backgroundImage.size());
    return input;
}

// ============================================================================
// Events
// ============================================================================

void RegionSelector::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    if (!m_backgroundPixmap.isNull()) {
        painter.drawPixmap(0, 0, m_backgroundPixmap);
    }

    // The draw list is in image pixels
    painter.scale(1.0 / m_devicePixelRatio, 1.0 / m_devicePixelRatio);
    RegionPainter::paint(painter, currentDrawList());
}

void RegionSelector::mousePressEvent(QMouseEvent *event)
{
    if (event->button() == Qt::RightButton) {
        cancel();
        return;
    }
    m_inputHandler->handleMousePress(event);
}

void RegionSelector::mouseMoveEvent(QMouseEvent *event)
{
    m_inputHandler->handleMouseMove(event);
}

void RegionSelector::mouseReleaseEvent(QMouseEvent *event)
{
    m_inputHandler->handleMouseRelease(event);
}

void RegionSelector::enterEvent(QEnterEvent *event)
{
    m_inputHandler->handleEnter(event->position());
    QWidget::enterEvent(event);
}

void RegionSelector::leaveEvent(QEvent *event)
{
    m_inputHandler->handleLeave();
    QWidget::leaveEvent(event);
}

void RegionSelector::keyPressEvent(QKeyEvent *event)
{
    if (event->key() == Qt::Key_Escape) {
        qDebug() << "RegionSelector: Cancelled via Escape";
        cancel();
    }
    else if (event->matches(QKeySequence::SelectAll)) {
        m_inputHandler->selectAll();
    }
    else if (event->key() == Qt::Key_Return || event->key() == Qt::Key_Enter ||
             event->matches(QKeySequence::Copy)) {
        if (m_selectionManager->hasValidSelection()) {
            copyToClipboard();
        }
    }
    else if (event->matches(QKeySequence::Save)) {
        if (m_selectionManager->hasValidSelection()) {
            saveToFile();
        }
    }
    else if (event->key() == Qt::Key_Shift && m_painter.isMagnifierVisible(renderInput())) {
        // Switch RGB/HEX color format display
        m_painter.magnifier().toggleColorFormat();
        update();
    }
    else {
        QWidget::keyPressEvent(event);
    }
}

// ============================================================================
// Actions
// ============================================================================

void RegionSelector::copyToClipboard()
{
    const auto region = m_selectionManager->cropRegion();
    if (!region) {
        return;
    }
    if (m_exportManager->copyToClipboard(*region)) {
        emit copyFinished();
        close();
    }
}

void RegionSelector::saveToFile()
{
    const auto region = m_selectionManager->cropRegion();
    if (!region) {
        return;
    }
    const QString filePath = m_exportManager->saveToFile(*region);
    if (!filePath.isEmpty()) {
        emit saveFinished(filePath);
        close();
    }
}

void RegionSelector::cancel()
{
    emit selectionCancelled();
    close();
}
