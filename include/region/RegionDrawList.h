#ifndef REGIONDRAWLIST_H
#define REGIONDRAWLIST_H

#include <QColor>
#include <QImage>
#include <QLineF>
#include <QRectF>
#include <QString>
#include <QVector>

/**
 * @brief What a draw command is for. Lets the painter and tests pick
 * commands out of a list without relying on their order.
 */
enum class DrawRole {
    Dim,
    Border,
    HandleRing,
    Handle,
    RegionOutline,
    RegionHighlight,
    Crosshair,
    MagnifierBackground,
    MagnifierPixels,
    MagnifierGrid,
    MagnifierCrosshair,
    MagnifierCenter,
    MagnifierBorder,
    MagnifierInfo
};

/**
 * @brief One primitive in canvas pixel coordinates.
 */
struct DrawCommand {
    enum class Kind {
        FillRect,
        StrokeRect,
        FillRoundedRect,
        Line,
        Image,
        Text
    };

    Kind kind = Kind::FillRect;
    DrawRole role = DrawRole::Dim;
    QRectF rect;
    QLineF line;
    QColor color;
    qreal width = 1.0;      // Pen width
    qreal radius = 0.0;     // Corner radius for FillRoundedRect
    int fontPixelSize = 0;  // Text only
    QImage image;
    QString text;

    static DrawCommand fillRect(DrawRole role, const QRectF& rect, const QColor& color)
    {
        DrawCommand cmd;
        cmd.kind = Kind::FillRect;
        cmd.role = role;
        cmd.rect = rect;
        cmd.color = color;
        return cmd;
    }

    static DrawCommand strokeRect(DrawRole role, const QRectF& rect, const QColor& color, qreal width)
    {
        DrawCommand cmd;
        cmd.kind = Kind::StrokeRect;
        cmd.role = role;
        cmd.rect = rect;
        cmd.color = color;
        cmd.width = width;
        return cmd;
    }

    static DrawCommand fillRoundedRect(DrawRole role, const QRectF& rect, qreal radius, const QColor& color)
    {
        DrawCommand cmd;
        cmd.kind = Kind::FillRoundedRect;
        cmd.role = role;
        cmd.rect = rect;
        cmd.radius = radius;
        cmd.color = color;
        return cmd;
    }

    static DrawCommand lineTo(DrawRole role, const QLineF& line, const QColor& color, qreal width)
    {
        DrawCommand cmd;
        cmd.kind = Kind::Line;
        cmd.role = role;
        cmd.line = line;
        cmd.color = color;
        cmd.width = width;
        return cmd;
    }

    static DrawCommand imageIn(DrawRole role, const QRectF& target, const QImage& image)
    {
        DrawCommand cmd;
        cmd.kind = Kind::Image;
        cmd.role = role;
        cmd.rect = target;
        cmd.image = image;
        return cmd;
    }

    static DrawCommand textIn(DrawRole role, const QRectF& rect, const QString& text,
                              const QColor& color, int fontPixelSize)
    {
        DrawCommand cmd;
        cmd.kind = Kind::Text;
        cmd.role = role;
        cmd.rect = rect;
        cmd.text = text;
        cmd.color = color;
        cmd.fontPixelSize = fontPixelSize;
        return cmd;
    }
};

using DrawList = QVector<DrawCommand>;

#endif // REGIONDRAWLIST_H
