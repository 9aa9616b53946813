#include "region/SelectionStateManager.h"
#include "region/SelectionResizeHelper.h"

#include <QDebug>

SelectionStateManager::SelectionStateManager(QObject* parent)
    : QObject(parent)
{
}

void SelectionStateManager::setBounds(const QSizeF& size)
{
    m_screenWidth = size.width();
    m_screenHeight = size.height();
}

void SelectionStateManager::setRect(const SelectionRect& rect)
{
    m_rect = rect;
}

void SelectionStateManager::selectAll()
{
    m_rect = SelectionRect(0.0, 0.0, m_screenWidth, m_screenHeight);
    setHoveredRegion(-1);
}

// ============================================================================
// Hit Testing
// ============================================================================

QVector<SelectionStateManager::HandleRect> SelectionStateManager::cornerHandles() const
{
    if (!m_rect) {
        return {};
    }

    const SelectionRect rect = m_rect->normalized();
    const qreal hs = kHandleSize;
    const qreal half = hs / 2.0;

    return {
        {ResizeHandle::TopLeft, SelectionRect(rect.x() - half, rect.y() - half, hs, hs)},
        {ResizeHandle::TopRight, SelectionRect(rect.right() - half, rect.y() - half, hs, hs)},
        {ResizeHandle::BottomRight, SelectionRect(rect.right() - half, rect.bottom() - half, hs, hs)},
        {ResizeHandle::BottomLeft, SelectionRect(rect.x() - half, rect.bottom() - half, hs, hs)},
    };
}

SelectionStateManager::ResizeHandle SelectionStateManager::hitTestCorner(const QPointF& pos) const
{
    const QVector<HandleRect> handles = cornerHandles();
    for (const HandleRect& handle : handles) {
        if (handle.rect.contains(pos)) {
            return handle.handle;
        }
    }
    return ResizeHandle::None;
}

SelectionStateManager::ResizeHandle SelectionStateManager::hitTestEdge(const QPointF& pos) const
{
    if (!m_rect) {
        return ResizeHandle::None;
    }

    const SelectionRect rect = m_rect->normalized();
    const qreal grab = kEdgeGrabWidth;
    const qreal half = kHandleSize / 2.0;
    const qreal x = pos.x();
    const qreal y = pos.y();

    // Edge zones stop where the corner handles begin
    const bool inHorizontalSpan = x > rect.x() + half && x < rect.right() - half;
    const bool inVerticalSpan = y > rect.y() + half && y < rect.bottom() - half;

    if (inHorizontalSpan && y >= rect.y() - grab && y <= rect.y() + grab)
        return ResizeHandle::Top;
    if (inHorizontalSpan && y >= rect.bottom() - grab && y <= rect.bottom() + grab)
        return ResizeHandle::Bottom;
    if (inVerticalSpan && x >= rect.x() - grab && x <= rect.x() + grab)
        return ResizeHandle::Left;
    if (inVerticalSpan && x >= rect.right() - grab && x <= rect.right() + grab)
        return ResizeHandle::Right;

    return ResizeHandle::None;
}

SelectionStateManager::DragMode SelectionStateManager::hitTest(const QPointF& pos) const
{
    // Corners first (highest priority)
    ResizeHandle handle = hitTestCorner(pos);
    if (handle != ResizeHandle::None) {
        return DragMode::resizing(handle);
    }

    handle = hitTestEdge(pos);
    if (handle != ResizeHandle::None) {
        return DragMode::resizing(handle);
    }

    if (m_rect && m_rect->contains(pos)) {
        return DragMode::moving();
    }

    return DragMode::creating();
}

QString SelectionStateManager::cursorForPosition(const QPointF& pos) const
{
    // Keep the closed hand for the whole move, even when passing over a handle
    if (isMoving()) {
        return QStringLiteral("grabbing");
    }

    ResizeHandle handle = hitTestCorner(pos);
    if (handle == ResizeHandle::None) {
        handle = hitTestEdge(pos);
    }
    if (handle != ResizeHandle::None) {
        return SelectionResizeHelper::cursorForHandle(handle);
    }

    if (m_rect && m_rect->contains(pos)) {
        return QStringLiteral("grab");
    }

    return QStringLiteral("crosshair");
}

// ============================================================================
// Drag Lifecycle
// ============================================================================

void SelectionStateManager::startDrag(const QPointF& pos)
{
    m_dragMode = hitTest(pos);
    m_dragStart = pos;
    m_dragCurrent = pos;
    m_dragStartRect = m_rect;

    if (m_dragMode.kind == DragMode::Kind::Creating) {
        m_rect = SelectionRect(pos.x(), pos.y(), 0.0, 0.0);
        setHoveredRegion(-1);
    }
}

void SelectionStateManager::updateDrag(const QPointF& pos)
{
    m_dragCurrent = pos;

    // Always relative to the press so repeated moves do not accumulate error
    const qreal dx = pos.x() - m_dragStart.x();
    const qreal dy = pos.y() - m_dragStart.y();

    switch (m_dragMode.kind) {
    case DragMode::Kind::None:
        break;
    case DragMode::Kind::Creating:
        m_rect = SelectionRect(m_dragStart.x(), m_dragStart.y(), dx, dy);
        break;
    case DragMode::Kind::Moving:
        if (m_dragStartRect) {
            m_rect = m_dragStartRect->translated(dx, dy)
                         .constrained(m_screenWidth, m_screenHeight);
        }
        break;
    case DragMode::Kind::Resizing:
        if (m_dragStartRect) {
            m_rect = SelectionResizeHelper::applyResize(*m_dragStartRect, m_dragMode.handle, dx, dy)
                         .normalized()
                         .constrained(m_screenWidth, m_screenHeight);
        }
        break;
    }
}

std::optional<SelectionRect> SelectionStateManager::unnormalizedResizeRect() const
{
    if (!isResizing() || !m_dragStartRect) {
        return std::nullopt;
    }
    return SelectionResizeHelper::applyResize(*m_dragStartRect, m_dragMode.handle,
                                              m_dragCurrent.x() - m_dragStart.x(),
                                              m_dragCurrent.y() - m_dragStart.y());
}

void SelectionStateManager::endDrag()
{
    if (m_rect) {
        m_rect = m_rect->normalized().constrained(m_screenWidth, m_screenHeight);
    }
    m_dragMode = DragMode::none();
    m_dragStartRect.reset();
}

// ============================================================================
// Predefined Regions
// ============================================================================

void SelectionStateManager::setPredefinedRegions(const QVector<SelectionRect>& regions)
{
    if (m_predefinedRegionsSet) {
        qWarning() << "SelectionStateManager: Predefined regions already set, ignoring"
                   << regions.size() << "new regions";
        return;
    }
    m_predefinedRegions = regions;
    m_predefinedRegionsSet = true;
}

int SelectionStateManager::findPredefinedRegionAt(const QPointF& pos) const
{
    for (int i = 0; i < m_predefinedRegions.size(); ++i) {
        if (m_predefinedRegions[i].contains(pos)) {
            return i;
        }
    }
    return -1;
}

void SelectionStateManager::updateHoveredRegion(const QPointF& pos)
{
    // Hover only applies before a selection exists
    setHoveredRegion(m_rect ? -1 : findPredefinedRegionAt(pos));
}

bool SelectionStateManager::selectPredefinedRegion(int index)
{
    if (index < 0 || index >= m_predefinedRegions.size()) {
        return false;
    }

    // Taken verbatim: external regions are not constrained
    m_rect = m_predefinedRegions[index];
    setHoveredRegion(-1);
    return true;
}

void SelectionStateManager::setHoveredRegion(int index)
{
    if (m_hoveredRegion != index) {
        m_hoveredRegion = index;
        emit hoveredRegionChanged(m_hoveredRegion);
    }
}

// ============================================================================
// Export View
// ============================================================================

std::optional<QRect> SelectionStateManager::cropRegion() const
{
    if (!m_rect) {
        return std::nullopt;
    }
    return m_rect->toCropRegion();
}

bool SelectionStateManager::hasValidSelection() const
{
    if (!m_rect) {
        return false;
    }
    const SelectionRect norm = m_rect->normalized();
    return norm.width() >= SelectionRect::kMinSize && norm.height() >= SelectionRect::kMinSize;
}
