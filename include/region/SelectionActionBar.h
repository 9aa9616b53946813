#ifndef SELECTIONACTIONBAR_H
#define SELECTIONACTIONBAR_H

#include <QPoint>
#include <QRect>
#include <QSize>
#include <QWidget>

#include <optional>

class QPushButton;

/**
 * @brief Copy / Save / Cancel buttons that follow the selection.
 *
 * Child of the overlay widget; positions are in the overlay's logical
 * coordinates.
 */
class SelectionActionBar : public QWidget
{
    Q_OBJECT

public:
    explicit SelectionActionBar(QWidget* parent = nullptr);

    void setDevicePixelRatio(qreal ratio) { m_devicePixelRatio = ratio; }

    /**
     * @brief Where the bar goes for a selection of the given logical rect.
     *
     * Centered under the selection; above it if that would leave the
     * container; inside the selection's bottom when neither fits.
     */
    static QPoint computePosition(const QRect& selection, const QSize& barSize,
                                  const QSize& containerSize);

    static constexpr int kMargin = 12;
    static constexpr int kEdgeInset = 10;

public slots:
    /**
     * @brief Show and place the bar for a crop region in canvas pixels.
     *
     * Hidden when the region is absent or smaller than the minimum size.
     */
    void updateForCropRegion(const std::optional<QRect>& cropRegion);

signals:
    void copyRequested();
    void saveRequested();
    void cancelRequested();

private:
    QPushButton* m_copyButton = nullptr;
    QPushButton* m_saveButton = nullptr;
    QPushButton* m_cancelButton = nullptr;
    qreal m_devicePixelRatio = 1.0;
};

#endif // SELECTIONACTIONBAR_H
