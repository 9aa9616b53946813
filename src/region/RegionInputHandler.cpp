#include "region/RegionInputHandler.h"
#include "region/SelectionStateManager.h"
#include "cursor/CursorManager.h"

#include <QMouseEvent>

RegionInputHandler::RegionInputHandler(QObject* parent)
    : QObject(parent)
{
}

void RegionInputHandler::setSelectionManager(SelectionStateManager* manager)
{
    m_selectionManager = manager;
}

void RegionInputHandler::setCursorManager(CursorManager* manager)
{
    m_cursorManager = manager;
}

QPointF RegionInputHandler::toCanvas(const QPointF& logicalPos) const
{
    return logicalPos * m_devicePixelRatio;
}

// ============================================================================
// Qt Events
// ============================================================================

void RegionInputHandler::handleMousePress(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) {
        return;
    }
    pressAt(toCanvas(event->position()));
}

void RegionInputHandler::handleMouseMove(QMouseEvent* event)
{
    const QPointF pos = toCanvas(event->position());
    if (event->buttons() & Qt::LeftButton) {
        moveTo(pos);
    } else {
        hoverAt(pos);
    }
}

void RegionInputHandler::handleMouseRelease(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) {
        return;
    }
    releaseAt(toCanvas(event->position()));
}

void RegionInputHandler::handleEnter(const QPointF& logicalPos)
{
    m_pointerInside = true;
    m_currentPoint = toCanvas(logicalPos);
    emit updateRequested();
}

void RegionInputHandler::handleLeave()
{
    m_pointerInside = false;
    emit updateRequested();
}

// ============================================================================
// Canvas-space Operations
// ============================================================================

void RegionInputHandler::pressAt(const QPointF& pos)
{
    if (!m_selectionManager) {
        return;
    }

    m_currentPoint = pos;
    m_pointerInside = true;

    // One-click selection of a predefined region, before any rect exists
    if (!m_selectionManager->hasRect()) {
        const int index = m_selectionManager->findPredefinedRegionAt(pos);
        if (index >= 0 && m_selectionManager->selectPredefinedRegion(index)) {
            m_dragActive = false;
            refreshCursor(pos);
            notifySelectionChanged();
            return;
        }
    }

    m_selectionManager->startDrag(pos);
    m_dragActive = true;
    refreshCursor(pos);
    notifySelectionChanged();
}

void RegionInputHandler::moveTo(const QPointF& pos)
{
    m_currentPoint = pos;
    if (!m_selectionManager || !m_dragActive) {
        hoverAt(pos);
        return;
    }

    m_selectionManager->updateDrag(pos);
    refreshCursor(pos);
    notifySelectionChanged();
}

void RegionInputHandler::releaseAt(const QPointF& pos)
{
    m_currentPoint = pos;
    if (!m_selectionManager || !m_dragActive) {
        return;
    }

    m_dragActive = false;
    m_selectionManager->endDrag();
    refreshCursor(pos);
    notifySelectionChanged();
}

void RegionInputHandler::hoverAt(const QPointF& pos)
{
    m_currentPoint = pos;
    m_pointerInside = true;
    if (m_selectionManager) {
        m_selectionManager->updateHoveredRegion(pos);
        refreshCursor(pos);
    }
    emit updateRequested();
}

void RegionInputHandler::selectAll()
{
    if (!m_selectionManager) {
        return;
    }
    m_selectionManager->selectAll();
    refreshCursor(m_currentPoint);
    notifySelectionChanged();
}

void RegionInputHandler::refreshCursor(const QPointF& pos)
{
    if (!m_cursorManager || !m_selectionManager) {
        return;
    }

    if (!m_selectionManager->hasRect() && m_selectionManager->hoveredRegion() >= 0) {
        m_cursorManager->applyCursor(QStringLiteral("pointer"));
        return;
    }
    m_cursorManager->applyCursor(m_selectionManager->cursorForPosition(pos));
}

void RegionInputHandler::notifySelectionChanged()
{
    emit updateRequested();
    emit cropRegionChanged(m_selectionManager->cropRegion());
}
