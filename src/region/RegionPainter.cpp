#include "region/RegionPainter.h"
#include "region/SelectionResizeHelper.h"
#include "region/SelectionStateManager.h"

#include <QPainter>
#include <QPen>

DrawList RegionPainter::buildDrawList(const RenderInput& input) const
{
    DrawList list;
    if (!input.selection) {
        return list;
    }

    appendDimming(list, input);

    if (input.selection->hasRect()) {
        appendSelection(list, input);
    } else {
        appendPredefinedRegions(list, input);
    }

    // Crosshair and magnifier share one visibility rule and one target
    const auto target = feedbackTarget(input);
    if (target) {
        appendCrosshair(list, *target, input.canvasSize);
        if (m_style.showMagnifier && input.image) {
            m_magnifier.appendCommands(list, *target, input.cursor, input.canvasSize, *input.image);
        }
    }
    return list;
}

std::optional<QPointF> RegionPainter::feedbackTarget(const RenderInput& input) const
{
    const SelectionStateManager* selection = input.selection;
    if (!selection) {
        return std::nullopt;
    }

    const auto rect = selection->rect();
    if (!rect) {
        if (input.pointerInside) {
            return input.cursor;
        }
        return std::nullopt;
    }

    const auto mode = selection->dragMode();
    switch (mode.kind) {
    case SelectionStateManager::DragMode::Kind::Creating:
        return input.cursor;
    case SelectionStateManager::DragMode::Kind::Resizing: {
        const auto resized = selection->unnormalizedResizeRect();
        return SelectionResizeHelper::snapPosition(resized ? *resized : *rect, *rect,
                                                   mode.handle, input.cursor);
    }
    case SelectionStateManager::DragMode::Kind::Moving:
        return std::nullopt;
    case SelectionStateManager::DragMode::Kind::None:
        if (input.pointerInside && !rect->contains(input.cursor) &&
            selection->hitTest(input.cursor).kind == SelectionStateManager::DragMode::Kind::Creating) {
            return input.cursor;
        }
        return std::nullopt;
    }
    return std::nullopt;
}

bool RegionPainter::isMagnifierVisible(const RenderInput& input) const
{
    return m_style.showMagnifier && input.image && feedbackTarget(input).has_value();
}

void RegionPainter::appendDimming(DrawList& list, const RenderInput& input) const
{
    const qreal w = input.canvasSize.width();
    const qreal h = input.canvasSize.height();

    const auto rect = input.selection->rect();
    if (!rect) {
        list.append(DrawCommand::fillRect(DrawRole::Dim, QRectF(0, 0, w, h), m_style.dimColor));
        return;
    }

    // Four strips around the selection; top and bottom span the full width
    const SelectionRect sel = rect->normalized();
    const qreal left = qBound(0.0, sel.x(), w);
    const qreal right = qBound(0.0, sel.right(), w);
    const qreal top = qBound(0.0, sel.y(), h);
    const qreal bottom = qBound(0.0, sel.bottom(), h);

    const QRectF strips[] = {
        QRectF(0, 0, w, top),                          // Top
        QRectF(0, bottom, w, h - bottom),              // Bottom
        QRectF(0, top, left, bottom - top),            // Left
        QRectF(right, top, w - right, bottom - top),   // Right
    };
    for (const QRectF& strip : strips) {
        if (strip.width() > 0 && strip.height() > 0) {
            list.append(DrawCommand::fillRect(DrawRole::Dim, strip, m_style.dimColor));
        }
    }
}

void RegionPainter::appendPredefinedRegions(DrawList& list, const RenderInput& input) const
{
    const QVector<SelectionRect>& regions = input.selection->predefinedRegions();
    const int hovered = input.selection->hoveredRegion();

    for (int i = 0; i < regions.size(); ++i) {
        const QRectF bounds = regions[i].toRectF();
        if (i == hovered) {
            list.append(DrawCommand::fillRect(DrawRole::RegionHighlight, bounds,
                                              m_style.regionHighlightColor));
            list.append(DrawCommand::strokeRect(DrawRole::RegionOutline, bounds,
                                                m_style.hoveredOutlineColor, 2.0));
        } else {
            list.append(DrawCommand::strokeRect(DrawRole::RegionOutline, bounds,
                                                m_style.regionOutlineColor, 1.0));
        }
    }
}

void RegionPainter::appendSelection(DrawList& list, const RenderInput& input) const
{
    // Stroke lies entirely outside the selection
    const QRectF sel = input.selection->rect()->toRectF();
    const qreal half = m_style.borderWidth / 2.0;
    list.append(DrawCommand::strokeRect(DrawRole::Border, sel.adjusted(-half, -half, half, half),
                                        m_style.borderColor, m_style.borderWidth));

    // Corner handles: rounded square over a contrasting ring
    const qreal inset = 2.0;
    const auto handles = input.selection->cornerHandles();
    for (const auto& handle : handles) {
        const QRectF outer = handle.rect.toRectF();
        list.append(DrawCommand::fillRoundedRect(DrawRole::HandleRing, outer, 4.0,
                                                 m_style.handleRingColor));
        list.append(DrawCommand::fillRoundedRect(DrawRole::Handle,
                                                 outer.adjusted(inset, inset, -inset, -inset),
                                                 3.0, m_style.borderColor));
    }
}

void RegionPainter::appendCrosshair(DrawList& list, const QPointF& target,
                                    const QSizeF& canvasSize) const
{
    list.append(DrawCommand::lineTo(DrawRole::Crosshair,
                                    QLineF(0, target.y(), canvasSize.width(), target.y()),
                                    m_style.crosshairColor, 1.0));
    list.append(DrawCommand::lineTo(DrawRole::Crosshair,
                                    QLineF(target.x(), 0, target.x(), canvasSize.height()),
                                    m_style.crosshairColor, 1.0));
}

// ============================================================================
// Draw List Execution
// ============================================================================

void RegionPainter::paint(QPainter& painter, const DrawList& list)
{
    painter.save();

    for (const DrawCommand& cmd : list) {
        switch (cmd.kind) {
        case DrawCommand::Kind::FillRect:
            painter.fillRect(cmd.rect, cmd.color);
            break;
        case DrawCommand::Kind::StrokeRect:
            painter.setRenderHint(QPainter::Antialiasing, false);
            painter.setPen(QPen(cmd.color, cmd.width));
            painter.setBrush(Qt::NoBrush);
            painter.drawRect(cmd.rect);
            break;
        case DrawCommand::Kind::FillRoundedRect:
            painter.setRenderHint(QPainter::Antialiasing, true);
            painter.setPen(Qt::NoPen);
            painter.setBrush(cmd.color);
            painter.drawRoundedRect(cmd.rect, cmd.radius, cmd.radius);
            break;
        case DrawCommand::Kind::Line:
            painter.setRenderHint(QPainter::Antialiasing, false);
            painter.setPen(QPen(cmd.color, cmd.width));
            painter.drawLine(cmd.line);
            break;
        case DrawCommand::Kind::Image:
            // Crisp pixels when zooming
            painter.setRenderHint(QPainter::SmoothPixmapTransform, false);
            painter.drawImage(cmd.rect, cmd.image);
            break;
        case DrawCommand::Kind::Text: {
            QFont font = painter.font();
            font.setPixelSize(cmd.fontPixelSize > 0 ? cmd.fontPixelSize : 12);
            painter.setFont(font);
            painter.setPen(cmd.color);
            painter.drawText(cmd.rect, Qt::AlignVCenter | Qt::AlignHCenter, cmd.text);
            break;
        }
        }
    }

    painter.restore();
}
