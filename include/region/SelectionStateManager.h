#ifndef SELECTIONSTATEMANAGER_H
#define SELECTIONSTATEMANAGER_H

#include <QObject>
#include <QPointF>
#include <QRect>
#include <QSizeF>
#include <QString>
#include <QVector>

#include <optional>

#include "region/SelectionRect.h"

/**
 * @brief Selection state and operation management
 *
 * Responsible for:
 * - The optional selection rectangle and its drag lifecycle
 * - Corner handle / edge zone hit testing
 * - Bounds and minimum size constraining
 * - Predefined region hover and one-click selection
 */
class SelectionStateManager : public QObject {
    Q_OBJECT

public:
    enum class ResizeHandle {
        None,
        TopLeft, Top, TopRight,
        Left, Right,
        BottomLeft, Bottom, BottomRight
    };
    Q_ENUM(ResizeHandle)

    /**
     * @brief The interaction in progress. Resizing carries the grabbed anchor.
     */
    struct DragMode {
        enum class Kind {
            None,
            Creating,
            Moving,
            Resizing
        };

        Kind kind = Kind::None;
        ResizeHandle handle = ResizeHandle::None;

        static DragMode none() { return {}; }
        static DragMode creating() { return {Kind::Creating, ResizeHandle::None}; }
        static DragMode moving() { return {Kind::Moving, ResizeHandle::None}; }
        static DragMode resizing(ResizeHandle h) { return {Kind::Resizing, h}; }

        bool operator==(const DragMode& other) const
        {
            return kind == other.kind && handle == other.handle;
        }
        bool operator!=(const DragMode& other) const { return !(*this == other); }
    };

    struct HandleRect {
        ResizeHandle handle;
        SelectionRect rect;
    };

    static constexpr qreal kHandleSize = 14.0;
    static constexpr qreal kEdgeGrabWidth = 8.0;

    explicit SelectionStateManager(QObject* parent = nullptr);

    // Bounds setting
    void setBounds(const QSizeF& size);
    QSizeF bounds() const { return QSizeF(m_screenWidth, m_screenHeight); }

    // State queries
    DragMode dragMode() const { return m_dragMode; }
    bool isDragging() const { return m_dragMode.kind != DragMode::Kind::None; }
    bool isCreating() const { return m_dragMode.kind == DragMode::Kind::Creating; }
    bool isMoving() const { return m_dragMode.kind == DragMode::Kind::Moving; }
    bool isResizing() const { return m_dragMode.kind == DragMode::Kind::Resizing; }

    // Selection rectangle (raw, possibly un-normalized while creating)
    bool hasRect() const { return m_rect.has_value(); }
    std::optional<SelectionRect> rect() const { return m_rect; }
    void setRect(const SelectionRect& rect);
    void selectAll();

    QPointF dragStart() const { return m_dragStart; }
    QPointF dragCurrent() const { return m_dragCurrent; }
    std::optional<SelectionRect> dragStartRect() const { return m_dragStartRect; }

    /**
     * @brief Resize result before normalizing and constraining.
     *
     * The grabbed anchor keeps its role here even after crossing the
     * opposite edge. Absent unless a resize is in progress.
     */
    std::optional<SelectionRect> unnormalizedResizeRect() const;

    // Hit testing
    QVector<HandleRect> cornerHandles() const;
    DragMode hitTest(const QPointF& pos) const;
    QString cursorForPosition(const QPointF& pos) const;

    // Drag lifecycle
    void startDrag(const QPointF& pos);
    void updateDrag(const QPointF& pos);
    void endDrag();

    // Predefined regions
    void setPredefinedRegions(const QVector<SelectionRect>& regions);
    const QVector<SelectionRect>& predefinedRegions() const { return m_predefinedRegions; }
    int hoveredRegion() const { return m_hoveredRegion; }
    int findPredefinedRegionAt(const QPointF& pos) const;
    void updateHoveredRegion(const QPointF& pos);
    bool selectPredefinedRegion(int index);

    // Export view
    std::optional<QRect> cropRegion() const;
    bool hasValidSelection() const;

signals:
    void hoveredRegionChanged(int index);

private:
    ResizeHandle hitTestCorner(const QPointF& pos) const;
    ResizeHandle hitTestEdge(const QPointF& pos) const;
    void setHoveredRegion(int index);

    std::optional<SelectionRect> m_rect;
    qreal m_screenWidth = 0.0;
    qreal m_screenHeight = 0.0;

    // Operation temporaries
    DragMode m_dragMode;
    QPointF m_dragStart;
    QPointF m_dragCurrent;
    std::optional<SelectionRect> m_dragStartRect;

    QVector<SelectionRect> m_predefinedRegions;
    bool m_predefinedRegionsSet = false;
    int m_hoveredRegion = -1;
};

#endif // SELECTIONSTATEMANAGER_H
