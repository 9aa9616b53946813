#include "region/SelectionActionBar.h"
#include "region/SelectionRect.h"

#include <QHBoxLayout>
#include <QPushButton>

#include <algorithm>

SelectionActionBar::SelectionActionBar(QWidget* parent)
    : QWidget(parent)
{
    setAttribute(Qt::WA_StyledBackground);
    setCursor(Qt::ArrowCursor);

    auto* layout = new QHBoxLayout(this);
    layout->setContentsMargins(8, 6, 8, 6);
    layout->setSpacing(6);

    m_copyButton = new QPushButton(tr("Copy"), this);
    m_saveButton = new QPushButton(tr("Save"), this);
    m_cancelButton = new QPushButton(tr("Cancel"), this);
    m_copyButton->setToolTip(tr("Copy to clipboard (Enter)"));
    m_saveButton->setToolTip(tr("Save to screenshot folder (Ctrl+S)"));
    m_cancelButton->setToolTip(tr("Cancel (Esc)"));

    layout->addWidget(m_copyButton);
    layout->addWidget(m_saveButton);
    layout->addWidget(m_cancelButton);

    connect(m_copyButton, &QPushButton::clicked, this, &SelectionActionBar::copyRequested);
    connect(m_saveButton, &QPushButton::clicked, this, &SelectionActionBar::saveRequested);
    connect(m_cancelButton, &QPushButton::clicked, this, &SelectionActionBar::cancelRequested);

    setStyleSheet(
        "SelectionActionBar { background: rgba(24, 24, 24, 232); border: 1px solid rgba(255,255,255,35); border-radius: 8px; }"
        "QPushButton { color: #f3f3f3; background: rgba(255,255,255,24); border: 1px solid rgba(255,255,255,35); border-radius: 6px; padding: 4px 10px; }"
        "QPushButton:hover { background: rgba(255,255,255,34); }"
    );

    adjustSize();
    hide();
}

QPoint SelectionActionBar::computePosition(const QRect& selection, const QSize& barSize,
                                           const QSize& containerSize)
{
    const int x = selection.x() + (selection.width() - barSize.width()) / 2;

    int y = selection.y() + selection.height() + kMargin;
    if (y + barSize.height() > containerSize.height() - kEdgeInset) {
        y = selection.y() - kMargin - barSize.height();
        if (y < kEdgeInset) {
            // No room on either side
            y = selection.y() + selection.height() - kMargin - barSize.height();
        }
    }

    const int maxX = std::max(kEdgeInset, containerSize.width() - kEdgeInset - barSize.width());
    return QPoint(std::clamp(x, kEdgeInset, maxX), y);
}

void SelectionActionBar::updateForCropRegion(const std::optional<QRect>& cropRegion)
{
    if (!cropRegion || cropRegion->width() < SelectionRect::kMinSize ||
        cropRegion->height() < SelectionRect::kMinSize) {
        hide();
        return;
    }

    const QWidget* container = parentWidget();
    if (!container) {
        return;
    }

    const qreal dpr = m_devicePixelRatio > 0 ? m_devicePixelRatio : 1.0;
    const QRect logical(qRound(cropRegion->x() / dpr), qRound(cropRegion->y() / dpr),
                        qRound(cropRegion->width() / dpr), qRound(cropRegion->height() / dpr));

    adjustSize();
    move(computePosition(logical, size(), container->size()));
    show();
    raise();
}
