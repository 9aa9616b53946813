#include "region/SelectionRect.h"

#include <QDebug>
#include <QRegularExpression>
#include <QStringList>
#include <QtMath>

SelectionRect::SelectionRect(qreal x, qreal y, qreal width, qreal height)
    : m_x(x)
    , m_y(y)
    , m_width(width)
    , m_height(height)
{
}

SelectionRect SelectionRect::normalized() const
{
    SelectionRect rect = *this;
    if (rect.m_width < 0) {
        rect.m_x += rect.m_width;
        rect.m_width = -rect.m_width;
    }
    if (rect.m_height < 0) {
        rect.m_y += rect.m_height;
        rect.m_height = -rect.m_height;
    }
    return rect;
}

SelectionRect SelectionRect::translated(qreal dx, qreal dy) const
{
    return SelectionRect(m_x + dx, m_y + dy, m_width, m_height);
}

bool SelectionRect::contains(qreal px, qreal py) const
{
    const SelectionRect norm = normalized();
    return px >= norm.m_x && px <= norm.right() &&
           py >= norm.m_y && py <= norm.bottom();
}

SelectionRect SelectionRect::constrained(qreal screenWidth, qreal screenHeight) const
{
    SelectionRect rect = normalized();

    rect.m_width = qMax(rect.m_width, kMinSize);
    rect.m_height = qMax(rect.m_height, kMinSize);

    rect.m_x = qMax(rect.m_x, 0.0);
    rect.m_y = qMax(rect.m_y, 0.0);

    if (rect.m_x + rect.m_width > screenWidth) {
        rect.m_x = screenWidth - rect.m_width;
    }
    if (rect.m_y + rect.m_height > screenHeight) {
        rect.m_y = screenHeight - rect.m_height;
    }

    // Screens smaller than kMinSize end up with a negative origin above
    rect.m_x = qMax(rect.m_x, 0.0);
    rect.m_y = qMax(rect.m_y, 0.0);
    rect.m_width = qMin(rect.m_width, screenWidth);
    rect.m_height = qMin(rect.m_height, screenHeight);

    return rect;
}

QRect SelectionRect::toCropRegion() const
{
    const SelectionRect norm = normalized();
    return QRect(qRound(norm.m_x), qRound(norm.m_y),
                 qRound(norm.m_width), qRound(norm.m_height));
}

QRectF SelectionRect::toRectF() const
{
    const SelectionRect norm = normalized();
    return QRectF(norm.m_x, norm.m_y, norm.m_width, norm.m_height);
}

std::optional<SelectionRect> SelectionRect::parse(const QString& text)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    const QStringList corners = text.trimmed().split(whitespace, Qt::SkipEmptyParts);
    if (corners.size() != 2) {
        return std::nullopt;
    }

    qreal coords[4];
    for (int i = 0; i < 2; ++i) {
        const QStringList parts = corners[i].split(',');
        if (parts.size() != 2) {
            return std::nullopt;
        }
        for (int j = 0; j < 2; ++j) {
            bool ok = false;
            coords[i * 2 + j] = parts[j].toDouble(&ok);
            if (!ok || !qIsFinite(coords[i * 2 + j])) {
                return std::nullopt;
            }
        }
    }

    const qreal width = coords[2] - coords[0];
    const qreal height = coords[3] - coords[1];
    if (width <= 0 || height <= 0) {
        return std::nullopt;
    }
    return SelectionRect(coords[0], coords[1], width, height);
}

bool SelectionRect::operator==(const SelectionRect& other) const
{
    return m_x == other.m_x && m_y == other.m_y &&
           m_width == other.m_width && m_height == other.m_height;
}

QDebug operator<<(QDebug debug, const SelectionRect& rect)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "SelectionRect(" << rect.x() << ", " << rect.y()
                    << " " << rect.width() << "x" << rect.height() << ")";
    return debug;
}
