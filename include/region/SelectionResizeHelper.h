#ifndef SELECTIONRESIZEHELPER_H
#define SELECTIONRESIZEHELPER_H

#include <QPointF>
#include <QString>

#include "region/SelectionRect.h"
#include "region/SelectionStateManager.h"

/**
 * @brief Provides static helper functions for selection resize operations.
 *
 * Handles the per-anchor resize transform, cursor mapping for resize
 * handles and the magnifier snap point. These are pure utility functions
 * with no state.
 */
class SelectionResizeHelper
{
public:
    using ResizeHandle = SelectionStateManager::ResizeHandle;

    /**
     * @brief Apply a pointer delta to the rect captured at drag start.
     *
     * The result is not normalized; dragging an anchor past the opposite
     * edge yields a negative size.
     */
    static SelectionRect applyResize(const SelectionRect& start, ResizeHandle handle,
                                     qreal dx, qreal dy);

    /**
     * @brief Cursor identity for a resize handle ("nw-resize", "n-resize", ...).
     */
    static QString cursorForHandle(ResizeHandle handle);

    /**
     * @brief Point the magnifier follows while an anchor is dragged.
     *
     * The anchor is read from @p resized, the un-normalized applyResize()
     * result, so it stays on the moving side after crossing the opposite
     * edge. Coordinates taken from the rect are clamped into @p bounds, the
     * normalized and constrained selection. Corners snap to the corner
     * itself; Top/Bottom keep the cursor x, Left/Right keep the cursor y.
     */
    static QPointF snapPosition(const SelectionRect& resized, const SelectionRect& bounds,
                                ResizeHandle handle, const QPointF& cursor);

private:
    // Static utility class - no instances
    SelectionResizeHelper() = delete;
};

#endif // SELECTIONRESIZEHELPER_H
