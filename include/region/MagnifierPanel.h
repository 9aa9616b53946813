#ifndef MAGNIFIERPANEL_H
#define MAGNIFIERPANEL_H

#include <QColor>
#include <QImage>
#include <QPoint>
#include <QPointF>
#include <QRect>
#include <QRectF>
#include <QSize>
#include <QSizeF>
#include <QString>

#include "region/RegionDrawList.h"

/**
 * @brief Placement and sampling window of one magnifier frame.
 */
struct MagnifierGeometry {
    QRectF panelRect;      // Zoomed pixels plus info strip
    QRectF magnifierRect;  // Zoomed pixels only
    QRect sourceRect;      // Image pixels actually sampled (clamped to the image)
    QPoint destOffset;     // Cell offset of sourceRect inside the grid
    QPoint centerPixel;    // floor(target)
};

/**
 * @brief MagnifierPanel produces the zoomed-in view around a target point.
 *
 * Provides:
 * - A 15x15 grid of source pixels at 8x zoom with grid lines
 * - Crosshair and highlighted centre cell
 * - Coordinate and colour (RGB or HEX) info strip
 */
class MagnifierPanel
{
public:
    MagnifierPanel() = default;

    // Configuration
    void setShowHexColor(bool show) { m_showHexColor = show; }
    bool showHexColor() const { return m_showHexColor; }
    void toggleColorFormat() { m_showHexColor = !m_showHexColor; }

    /**
     * @brief Compute where the panel goes and which pixels it samples.
     *
     * The panel sits kCursorOffset below right of the cursor, flips to the
     * other side on each axis it would overflow, then clamps on-canvas.
     * The sampled window is centered on floor(target) and clamped to the
     * image; destOffset keeps the target in the centre cell.
     */
    static MagnifierGeometry computeGeometry(const QPointF& target, const QPointF& cursor,
                                             const QSizeF& canvasSize, const QSize& imageSize);

    /**
     * @brief Append the magnifier commands for target to list.
     */
    void appendCommands(DrawList& list, const QPointF& target, const QPointF& cursor,
                        const QSizeF& canvasSize, const QImage& image) const;

    /**
     * @brief Colour of a pixel, or black outside the image.
     */
    static QColor pixelColor(const QImage& image, const QPoint& pixel);

    /**
     * @brief Format a colour as "#rrggbb" or "RGB: r,g,b".
     */
    QString colorString(const QColor& color) const;

    // Layout constants
    static constexpr int kGridCount = 15;
    static constexpr int kZoom = 8;
    static constexpr int kBoxSize = kGridCount * kZoom;
    static constexpr int kInfoHeight = 40;
    static constexpr int kCursorOffset = 20;

private:
    void appendInfoStrip(DrawList& list, const QRectF& stripRect, const QPoint& pixel,
                         const QColor& color) const;
    static QColor adaptiveBorderColor(const QImage& image, const QRect& sourceRect);

    bool m_showHexColor = true;
};

#endif // MAGNIFIERPANEL_H
