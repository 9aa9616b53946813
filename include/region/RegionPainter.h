#ifndef REGIONPAINTER_H
#define REGIONPAINTER_H

#include <QColor>
#include <QImage>
#include <QPointF>
#include <QSizeF>

#include <optional>

#include "region/MagnifierPanel.h"
#include "region/RegionDrawList.h"

class QPainter;
class SelectionStateManager;

/**
 * @brief Colours and widths used for the selection overlay.
 */
struct RegionRenderStyle {
    QColor dimColor = QColor(0, 0, 0, 128);
    QColor borderColor = QColor(0, 174, 255);
    qreal borderWidth = 2.0;
    QColor handleRingColor = QColor(255, 255, 255);
    QColor regionOutlineColor = QColor(0, 174, 255, 160);
    QColor regionHighlightColor = QColor(0, 174, 255, 50);
    QColor hoveredOutlineColor = QColor(0, 174, 255);
    QColor crosshairColor = QColor(65, 105, 225);
    bool showMagnifier = true;
};

/**
 * @brief Everything one frame depends on. Pointers are non-owning.
 */
struct RenderInput {
    const QImage* image = nullptr;
    const SelectionStateManager* selection = nullptr;
    QPointF cursor;
    bool pointerInside = false;
    QSizeF canvasSize;
};

/**
 * @brief Builds the overlay draw list for RegionSelector and replays it.
 *
 * buildDrawList() only reads the selection; paint() is the only place
 * that touches a QPainter.
 */
class RegionPainter
{
public:
    RegionPainter() = default;

    void setStyle(const RegionRenderStyle& style) { m_style = style; }
    const RegionRenderStyle& style() const { return m_style; }

    MagnifierPanel& magnifier() { return m_magnifier; }
    const MagnifierPanel& magnifier() const { return m_magnifier; }

    DrawList buildDrawList(const RenderInput& input) const;

    /**
     * @brief Where the crosshair and magnifier go this frame, if anywhere.
     *
     * No rect: the cursor while the pointer is inside. Creating: the cursor.
     * Resizing: the snap position of the grabbed anchor. Moving: none.
     * Idle: the cursor, only outside the rect and off its handles and edges.
     */
    std::optional<QPointF> feedbackTarget(const RenderInput& input) const;
    bool isMagnifierVisible(const RenderInput& input) const;

    static void paint(QPainter& painter, const DrawList& list);

private:
    void appendDimming(DrawList& list, const RenderInput& input) const;
    void appendPredefinedRegions(DrawList& list, const RenderInput& input) const;
    void appendSelection(DrawList& list, const RenderInput& input) const;
    void appendCrosshair(DrawList& list, const QPointF& target, const QSizeF& canvasSize) const;

    RegionRenderStyle m_style;
    MagnifierPanel m_magnifier;
};

#endif // REGIONPAINTER_H
