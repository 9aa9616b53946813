#include "region/SelectionResizeHelper.h"

#include <QtGlobal>

SelectionRect SelectionResizeHelper::applyResize(const SelectionRect& start, ResizeHandle handle,
                                                 qreal dx, qreal dy)
{
    qreal x = start.x();
    qreal y = start.y();
    qreal w = start.width();
    qreal h = start.height();

    switch (handle) {
    case ResizeHandle::TopLeft:
        x += dx;
        y += dy;
        w -= dx;
        h -= dy;
        break;
    case ResizeHandle::Top:
        y += dy;
        h -= dy;
        break;
    case ResizeHandle::TopRight:
        y += dy;
        w += dx;
        h -= dy;
        break;
    case ResizeHandle::Right:
        w += dx;
        break;
    case ResizeHandle::BottomRight:
        w += dx;
        h += dy;
        break;
    case ResizeHandle::Bottom:
        h += dy;
        break;
    case ResizeHandle::BottomLeft:
        x += dx;
        w -= dx;
        h += dy;
        break;
    case ResizeHandle::Left:
        x += dx;
        w -= dx;
        break;
    case ResizeHandle::None:
        break;
    }

    return SelectionRect(x, y, w, h);
}

QString SelectionResizeHelper::cursorForHandle(ResizeHandle handle)
{
    switch (handle) {
    case ResizeHandle::TopLeft:
        return QStringLiteral("nw-resize");
    case ResizeHandle::TopRight:
        return QStringLiteral("ne-resize");
    case ResizeHandle::BottomRight:
        return QStringLiteral("se-resize");
    case ResizeHandle::BottomLeft:
        return QStringLiteral("sw-resize");
    case ResizeHandle::Top:
        return QStringLiteral("n-resize");
    case ResizeHandle::Right:
        return QStringLiteral("e-resize");
    case ResizeHandle::Bottom:
        return QStringLiteral("s-resize");
    case ResizeHandle::Left:
        return QStringLiteral("w-resize");
    case ResizeHandle::None:
        break;
    }
    return QStringLiteral("crosshair");
}

QPointF SelectionResizeHelper::snapPosition(const SelectionRect& resized, const SelectionRect& bounds,
                                            ResizeHandle handle, const QPointF& cursor)
{
    const SelectionRect b = bounds.normalized();
    const qreal left = resized.x();
    const qreal top = resized.y();
    const qreal right = resized.x() + resized.width();
    const qreal bottom = resized.y() + resized.height();

    auto clampX = [&b](qreal x) { return qBound(b.x(), x, b.right()); };
    auto clampY = [&b](qreal y) { return qBound(b.y(), y, b.bottom()); };

    switch (handle) {
    case ResizeHandle::TopLeft:
        return QPointF(clampX(left), clampY(top));
    case ResizeHandle::TopRight:
        return QPointF(clampX(right), clampY(top));
    case ResizeHandle::BottomRight:
        return QPointF(clampX(right), clampY(bottom));
    case ResizeHandle::BottomLeft:
        return QPointF(clampX(left), clampY(bottom));
    case ResizeHandle::Top:
        return QPointF(cursor.x(), clampY(top));
    case ResizeHandle::Bottom:
        return QPointF(cursor.x(), clampY(bottom));
    case ResizeHandle::Left:
        return QPointF(clampX(left), cursor.y());
    case ResizeHandle::Right:
        return QPointF(clampX(right), cursor.y());
    case ResizeHandle::None:
        break;
    }
    return cursor;
}
