#ifndef REGIONSELECTOR_H
#define REGIONSELECTOR_H

#include <QImage>
#include <QPixmap>
#include <QRect>
#include <QVector>
#include <QWidget>

#include <optional>

#include "region/RegionDrawList.h"
#include "region/RegionPainter.h"
#include "region/SelectionRect.h"

class QEnterEvent;
class QKeyEvent;
class QMouseEvent;
class QPaintEvent;
class CursorManager;
class RegionExportManager;
class RegionInputHandler;
class SelectionActionBar;
class SelectionStateManager;

class RegionSelector : public QWidget
{
    Q_OBJECT

public:
    explicit RegionSelector(QWidget *parent = nullptr);
    ~RegionSelector() override;

    /**
     * @brief Start a session on a captured screen image.
     * @param screenshot Captured image in device pixels
     * @param devicePixelRatio Ratio between image pixels and widget coordinates
     * @param predefinedRegions Regions offered for one-click selection, in image pixels
     */
    void initialize(const QImage &screenshot, qreal devicePixelRatio,
                    const QVector<SelectionRect> &predefinedRegions = {});

    SelectionStateManager *selectionManager() const { return m_selectionManager; }
    RegionInputHandler *inputHandler() const { return m_inputHandler; }
    SelectionActionBar *actionBar() const { return m_actionBar; }

    /**
     * @brief Draw list for the current frame, in image pixels.
     */
    DrawList currentDrawList() const;

    const RegionPainter &painter() const { return m_painter; }

signals:
    void selectionCancelled();
    void copyFinished();
    void saveFinished(const QString &filePath);

protected:
    void paintEvent(QPaintEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;
    void enterEvent(QEnterEvent *event) override;
    void leaveEvent(QEvent *event) override;

private:
    void applySettings();
    RenderInput renderInput() const;
    void copyToClipboard();
    void saveToFile();
    void cancel();

    QImage m_backgroundImage;
    QPixmap m_backgroundPixmap;
    qreal m_devicePixelRatio = 1.0;

    SelectionStateManager *m_selectionManager = nullptr;
    CursorManager *m_cursorManager = nullptr;
    RegionInputHandler *m_inputHandler = nullptr;
    RegionExportManager *m_exportManager = nullptr;
    SelectionActionBar *m_actionBar = nullptr;
    RegionPainter m_painter;
};

#endif // REGIONSELECTOR_H
