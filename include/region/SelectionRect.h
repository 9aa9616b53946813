#ifndef SELECTIONRECT_H
#define SELECTIONRECT_H

#include <QPointF>
#include <QRect>
#include <QRectF>
#include <QString>
#include <QtGlobal>

#include <optional>

class QDebug;

/**
 * @brief Axis-aligned selection rectangle in canvas coordinates.
 *
 * Unlike QRectF, width and height are allowed to stay negative while a
 * selection is being dragged out; normalized() folds them back into the
 * origin. Containment is inclusive on all four edges.
 */
class SelectionRect
{
public:
    static constexpr qreal kMinSize = 20.0;

    SelectionRect() = default;
    SelectionRect(qreal x, qreal y, qreal width, qreal height);

    qreal x() const { return m_x; }
    qreal y() const { return m_y; }
    qreal width() const { return m_width; }
    qreal height() const { return m_height; }
    qreal right() const { return m_x + m_width; }
    qreal bottom() const { return m_y + m_height; }

    SelectionRect normalized() const;
    SelectionRect translated(qreal dx, qreal dy) const;

    bool contains(qreal px, qreal py) const;
    bool contains(const QPointF& point) const { return contains(point.x(), point.y()); }

    /**
     * @brief Normalize, enforce kMinSize and keep the rect inside the screen.
     *
     * The origin is shifted back inside when the rect would overflow the
     * right or bottom edge. A screen smaller than kMinSize clamps the size
     * to the screen.
     */
    SelectionRect constrained(qreal screenWidth, qreal screenHeight) const;

    /**
     * @brief Integer crop region: the normalized rect rounded to nearest.
     */
    QRect toCropRegion() const;

    QRectF toRectF() const;

    /**
     * @brief Parse "x1,y1 x2,y2" (opposite corners).
     * @return The rect, or nullopt for malformed text or a non-positive size.
     */
    static std::optional<SelectionRect> parse(const QString& text);

    bool operator==(const SelectionRect& other) const;
    bool operator!=(const SelectionRect& other) const { return !(*this == other); }

private:
    qreal m_x = 0.0;
    qreal m_y = 0.0;
    qreal m_width = 0.0;
    qreal m_height = 0.0;
};

QDebug operator<<(QDebug debug, const SelectionRect& rect);

#endif // SELECTIONRECT_H
