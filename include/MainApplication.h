#ifndef MAINAPPLICATION_H
#define MAINAPPLICATION_H

#include <QObject>
#include <QPointer>
#include <QVector>

#include "region/SelectionRect.h"

class QScreen;
class RegionSelector;

class MainApplication : public QObject
{
    Q_OBJECT

public:
    explicit MainApplication(QObject *parent = nullptr);
    ~MainApplication() override;

    void setPredefinedRegions(const QVector<SelectionRect> &regions);

    /**
     * @brief Capture the primary screen and show the overlay.
     * @return false if the screen could not be captured
     */
    bool initialize();

private slots:
    void onSelectorClosed();

private:
    void reportFatalError(const QString &message);

    QPointer<RegionSelector> m_regionSelector;
    QVector<SelectionRect> m_predefinedRegions;
};

#endif // MAINAPPLICATION_H
