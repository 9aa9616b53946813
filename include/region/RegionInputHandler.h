#ifndef REGIONINPUTHANDLER_H
#define REGIONINPUTHANDLER_H

#include <QObject>
#include <QPointF>
#include <QRect>

#include <optional>

class QMouseEvent;
class CursorManager;
class SelectionStateManager;

/**
 * @brief Handles mouse input for RegionSelector.
 *
 * Turns pointer events into selection lifecycle calls, keeps the
 * pointer-inside flag and the current canvas point, and picks the cursor.
 * Event positions are logical; they are scaled by the device pixel ratio
 * into canvas pixels before reaching the selection.
 */
class RegionInputHandler : public QObject
{
    Q_OBJECT

public:
    explicit RegionInputHandler(QObject* parent = nullptr);

    // Dependency injection
    void setSelectionManager(SelectionStateManager* manager);
    void setCursorManager(CursorManager* manager);
    void setDevicePixelRatio(qreal ratio) { m_devicePixelRatio = ratio; }

    // Event handlers (called from RegionSelector)
    void handleMousePress(QMouseEvent* event);
    void handleMouseMove(QMouseEvent* event);
    void handleMouseRelease(QMouseEvent* event);
    void handleEnter(const QPointF& logicalPos);
    void handleLeave();

    // Canvas-space entry points
    void pressAt(const QPointF& pos);
    void moveTo(const QPointF& pos);
    void releaseAt(const QPointF& pos);
    void hoverAt(const QPointF& pos);

    void selectAll();

    // State accessors
    QPointF currentPoint() const { return m_currentPoint; }
    bool isPointerInside() const { return m_pointerInside; }
    bool isDragActive() const { return m_dragActive; }

signals:
    void updateRequested();
    void cropRegionChanged(const std::optional<QRect>& region);

private:
    QPointF toCanvas(const QPointF& logicalPos) const;
    void refreshCursor(const QPointF& pos);
    void notifySelectionChanged();

    // Dependencies (non-owning pointers)
    SelectionStateManager* m_selectionManager = nullptr;
    CursorManager* m_cursorManager = nullptr;

    qreal m_devicePixelRatio = 1.0;
    QPointF m_currentPoint;
    bool m_pointerInside = false;
    bool m_dragActive = false;
};

#endif // REGIONINPUTHANDLER_H
