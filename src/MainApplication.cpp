#include "MainApplication.h"
#include "RegionSelector.h"

#include <QApplication>
#include <QDebug>
#include <QGuiApplication>
#include <QMessageBox>
#include <QPixmap>
#include <QScreen>

MainApplication::MainApplication(QObject *parent)
    : QObject(parent)
{
}

MainApplication::~MainApplication()
{
    if (m_regionSelector) {
        m_regionSelector->close();
    }
}

void MainApplication::setPredefinedRegions(const QVector<SelectionRect> &regions)
{
    m_predefinedRegions = regions;
}

bool MainApplication::initialize()
{
    QScreen *screen = QGuiApplication::primaryScreen();
    if (!screen) {
        reportFatalError(tr("No screen available to capture."));
        return false;
    }

    const QPixmap capture = screen->grabWindow(0);
    if (capture.isNull()) {
        reportFatalError(tr("Failed to capture the screen."));
        return false;
    }
    qDebug() << "MainApplication: Screenshot captured, size:" << capture.size()
             << "devicePixelRatio:" << screen->devicePixelRatio();

    m_regionSelector = new RegionSelector();
    m_regionSelector->initialize(capture.toImage(), screen->devicePixelRatio(), m_predefinedRegions);
    connect(m_regionSelector, &QObject::destroyed, this, &MainApplication::onSelectorClosed);

    m_regionSelector->setGeometry(screen->geometry());
    m_regionSelector->showFullScreen();
    m_regionSelector->activateWindow();
    m_regionSelector->raise();
    return true;
}

void MainApplication::onSelectorClosed()
{
    qDebug() << "MainApplication: Overlay closed, quitting";
    QCoreApplication::quit();
}

void MainApplication::reportFatalError(const QString &message)
{
    qCritical() << "MainApplication:" << message;
    QMessageBox::critical(nullptr, QStringLiteral("Waysnip"), message);
}
