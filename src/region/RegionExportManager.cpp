#include "region/RegionExportManager.h"
#include "settings/FileSettingsManager.h"

#include <QClipboard>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QGuiApplication>
#include <QImageWriter>
#include <QSaveFile>

RegionExportManager::RegionExportManager(QObject *parent)
    : QObject(parent)
{
}

void RegionExportManager::setSourceImage(const QImage &image)
{
    m_sourceImage = image;
}

QImage RegionExportManager::getSelectedRegion(const QRect &cropRegion) const
{
    if (m_sourceImage.isNull() || cropRegion.isEmpty()) {
        return QImage();
    }

    const QRect clamped = cropRegion.intersected(m_sourceImage.rect());
    if (clamped.isEmpty()) {
        return QImage();
    }
    return m_sourceImage.copy(clamped);
}

bool RegionExportManager::copyToClipboard(const QRect &cropRegion)
{
    const QImage selectedRegion = getSelectedRegion(cropRegion);
    if (selectedRegion.isNull()) {
        qWarning() << "RegionExportManager: Cannot copy - no valid selection";
        emit exportFailed(tr("No valid selection to copy"));
        return false;
    }

    QClipboard *clipboard = QGuiApplication::clipboard();
    if (!clipboard) {
        qWarning() << "RegionExportManager: Clipboard unavailable";
        emit exportFailed(tr("Clipboard unavailable"));
        return false;
    }

    clipboard->setImage(selectedRegion);
    qDebug() << "RegionExportManager: Copied to clipboard" << selectedRegion.size();

    emit copyCompleted(selectedRegion);
    return true;
}

QString RegionExportManager::saveToFile(const QRect &cropRegion)
{
    return saveToDirectory(cropRegion, FileSettingsManager::instance().loadScreenshotPath());
}

QString RegionExportManager::saveToDirectory(const QRect &cropRegion, const QString &directory,
                                             const QDateTime &timestamp)
{
    const QImage selectedRegion = getSelectedRegion(cropRegion);
    if (selectedRegion.isNull()) {
        qWarning() << "RegionExportManager: Cannot save - no valid selection";
        emit exportFailed(tr("No valid selection to save"));
        return QString();
    }

    QDir dir(directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qWarning() << "RegionExportManager: Failed to create directory" << directory;
        emit exportFailed(tr("Cannot create directory %1").arg(directory));
        return QString();
    }

    const QString filePath = generateScreenshotPath(dir.absolutePath(), timestamp);
    QString error;
    if (!writePng(selectedRegion, filePath, &error)) {
        qWarning() << "RegionExportManager: Failed to save to" << filePath << error;
        emit exportFailed(tr("Failed to save %1: %2").arg(filePath, error));
        return QString();
    }

    qDebug() << "RegionExportManager: Saved to" << filePath;
    emit saveCompleted(selectedRegion, filePath);
    return filePath;
}

QString RegionExportManager::generateScreenshotPath(const QString &directory, const QDateTime &timestamp)
{
    const QDir dir(directory);
    const QString baseName = QStringLiteral("screenshot-%1")
                                 .arg(timestamp.toString(QStringLiteral("yyyy-MM-dd-HH-mm-ss")));

    QString candidate = dir.filePath(baseName + QStringLiteral(".png"));
    if (!QFileInfo::exists(candidate)) {
        return candidate;
    }

    for (int suffix = 1; suffix <= kMaxFilenameSuffix; ++suffix) {
        candidate = dir.filePath(QStringLiteral("%1-%2.png").arg(baseName).arg(suffix));
        if (!QFileInfo::exists(candidate)) {
            return candidate;
        }
    }

    return dir.filePath(QStringLiteral("%1-%2.png").arg(baseName).arg(timestamp.toMSecsSinceEpoch()));
}

bool RegionExportManager::writePng(const QImage &image, const QString &filePath, QString *error) const
{
    QSaveFile saveFile(filePath);
    saveFile.setDirectWriteFallback(true);
    if (!saveFile.open(QIODevice::WriteOnly)) {
        *error = saveFile.errorString();
        return false;
    }

    QImageWriter writer(&saveFile, QByteArrayLiteral("png"));
    if (!writer.write(image)) {
        saveFile.cancelWriting();
        *error = writer.errorString();
        return false;
    }

    if (!saveFile.commit()) {
        *error = saveFile.errorString();
        return false;
    }
    return true;
}
