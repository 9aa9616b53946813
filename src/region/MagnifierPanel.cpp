#include "region/MagnifierPanel.h"

#include <QtMath>

MagnifierGeometry MagnifierPanel::computeGeometry(const QPointF& target, const QPointF& cursor,
                                                  const QSizeF& canvasSize, const QSize& imageSize)
{
    MagnifierGeometry geometry;

    // Panel position: below right of the cursor, flipped per overflowing axis
    const qreal panelWidth = kBoxSize;
    const qreal panelHeight = kBoxSize + kInfoHeight;

    qreal panelX = cursor.x() + kCursorOffset;
    qreal panelY = cursor.y() + kCursorOffset;
    if (panelX + panelWidth > canvasSize.width()) {
        panelX = cursor.x() - kCursorOffset - panelWidth;
    }
    if (panelY + panelHeight > canvasSize.height()) {
        panelY = cursor.y() - kCursorOffset - panelHeight;
    }
    panelX = qMax(0.0, qMin(panelX, canvasSize.width() - panelWidth));
    panelY = qMax(0.0, qMin(panelY, canvasSize.height() - panelHeight));

    geometry.panelRect = QRectF(panelX, panelY, panelWidth, panelHeight);
    geometry.magnifierRect = QRectF(panelX, panelY, kBoxSize, kBoxSize);

    // Sampling window
    const int half = kGridCount / 2;
    geometry.centerPixel = QPoint(qFloor(target.x()), qFloor(target.y()));
    const QRect ideal(geometry.centerPixel.x() - half, geometry.centerPixel.y() - half,
                      kGridCount, kGridCount);
    geometry.sourceRect = ideal.intersected(QRect(QPoint(0, 0), imageSize));
    if (geometry.sourceRect.isEmpty()) {
        geometry.sourceRect = QRect();
        geometry.destOffset = QPoint(0, 0);
    } else {
        geometry.destOffset = geometry.sourceRect.topLeft() - ideal.topLeft();
    }

    return geometry;
}

QColor MagnifierPanel::pixelColor(const QImage& image, const QPoint& pixel)
{
    if (image.isNull() || !image.rect().contains(pixel)) {
        return QColor(Qt::black);
    }
    return QColor(image.pixel(pixel));
}

QString MagnifierPanel::colorString(const QColor& color) const
{
    if (m_showHexColor) {
        return QString("#%1%2%3")
            .arg(color.red(), 2, 16, QChar('0'))
            .arg(color.green(), 2, 16, QChar('0'))
            .arg(color.blue(), 2, 16, QChar('0'));
    }
    return QString("RGB: %1,%2,%3")
        .arg(color.red())
        .arg(color.green())
        .arg(color.blue());
}

void MagnifierPanel::appendCommands(DrawList& list, const QPointF& target, const QPointF& cursor,
                                    const QSizeF& canvasSize, const QImage& image) const
{
    const MagnifierGeometry geometry = computeGeometry(target, cursor, canvasSize, image.size());
    const QRectF& mag = geometry.magnifierRect;

    // Out-of-image cells stay black
    list.append(DrawCommand::fillRect(DrawRole::MagnifierBackground, mag, QColor(Qt::black)));
    list.append(DrawCommand::fillRect(DrawRole::MagnifierBackground,
                                      QRectF(mag.left(), mag.bottom(), mag.width(), kInfoHeight),
                                      QColor(30, 35, 45, 240)));

    if (!geometry.sourceRect.isEmpty()) {
        const QRectF dest(mag.left() + geometry.destOffset.x() * kZoom,
                          mag.top() + geometry.destOffset.y() * kZoom,
                          geometry.sourceRect.width() * kZoom,
                          geometry.sourceRect.height() * kZoom);
        list.append(DrawCommand::imageIn(DrawRole::MagnifierPixels, dest,
                                         image.copy(geometry.sourceRect)));
    }

    // Grid lines (light gray, subtle)
    const QColor gridColor(200, 200, 200, 80);
    for (int i = 1; i < kGridCount; ++i) {
        const qreal x = mag.left() + i * kZoom;
        const qreal y = mag.top() + i * kZoom;
        list.append(DrawCommand::lineTo(DrawRole::MagnifierGrid,
                                        QLineF(x, mag.top(), x, mag.bottom()), gridColor, 1.0));
        list.append(DrawCommand::lineTo(DrawRole::MagnifierGrid,
                                        QLineF(mag.left(), y, mag.right(), y), gridColor, 1.0));
    }

    const QPointF center = mag.center();
    const QColor crosshairColor(100, 150, 255);
    list.append(DrawCommand::lineTo(DrawRole::MagnifierCrosshair,
                                    QLineF(mag.left(), center.y(), mag.right(), center.y()),
                                    crosshairColor, 2.0));
    list.append(DrawCommand::lineTo(DrawRole::MagnifierCrosshair,
                                    QLineF(center.x(), mag.top(), center.x(), mag.bottom()),
                                    crosshairColor, 2.0));

    const int half = kGridCount / 2;
    list.append(DrawCommand::strokeRect(DrawRole::MagnifierCenter,
                                        QRectF(mag.left() + half * kZoom, mag.top() + half * kZoom,
                                               kZoom, kZoom),
                                        QColor(Qt::white), 2.0));

    list.append(DrawCommand::strokeRect(DrawRole::MagnifierBorder, mag,
                                        adaptiveBorderColor(image, geometry.sourceRect), 1.0));

    appendInfoStrip(list, QRectF(mag.left(), mag.bottom(), mag.width(), kInfoHeight),
                    geometry.centerPixel, pixelColor(image, geometry.centerPixel));
}

void MagnifierPanel::appendInfoStrip(DrawList& list, const QRectF& stripRect, const QPoint& pixel,
                                     const QColor& color) const
{
    const int lineHeight = kInfoHeight / 2;

    list.append(DrawCommand::textIn(DrawRole::MagnifierInfo,
                                    QRectF(stripRect.left(), stripRect.top(), stripRect.width(), lineHeight),
                                    QString("(%1 , %2)").arg(pixel.x()).arg(pixel.y()),
                                    QColor(Qt::white), 12));

    // Colour swatch then value
    const qreal swatchSize = 12.0;
    const qreal rowTop = stripRect.top() + lineHeight;
    const QRectF swatch(stripRect.left() + 8, rowTop + (lineHeight - swatchSize) / 2,
                        swatchSize, swatchSize);
    list.append(DrawCommand::fillRect(DrawRole::MagnifierInfo, swatch, color));
    list.append(DrawCommand::strokeRect(DrawRole::MagnifierInfo, swatch, QColor(200, 200, 200), 1.0));

    const qreal textLeft = swatch.right() + 8;
    list.append(DrawCommand::textIn(DrawRole::MagnifierInfo,
                                    QRectF(textLeft, rowTop, stripRect.right() - textLeft, lineHeight),
                                    colorString(color), QColor(Qt::white), 12));
}

QColor MagnifierPanel::adaptiveBorderColor(const QImage& image, const QRect& sourceRect)
{
    if (image.isNull() || sourceRect.isEmpty()) {
        return QColor(Qt::white);
    }

    // Average luminance of the sampled window's outline
    qint64 totalLuminance = 0;
    int sampleCount = 0;
    auto sample = [&](int x, int y) {
        const QRgb pixel = image.pixel(x, y);
        totalLuminance += qRed(pixel) * 299 + qGreen(pixel) * 587 + qBlue(pixel) * 114;
        ++sampleCount;
    };

    for (int x = sourceRect.left(); x <= sourceRect.right(); ++x) {
        sample(x, sourceRect.top());
        sample(x, sourceRect.bottom());
    }
    for (int y = sourceRect.top(); y <= sourceRect.bottom(); ++y) {
        sample(sourceRect.left(), y);
        sample(sourceRect.right(), y);
    }

    const int avgLuminance = static_cast<int>(totalLuminance / sampleCount / 1000);
    return avgLuminance > 128 ? QColor(40, 40, 40) : QColor(Qt::white);
}
