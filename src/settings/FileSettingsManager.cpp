#include "settings/FileSettingsManager.h"
#include "settings/Settings.h"

#include <QDir>
#include <QStandardPaths>

FileSettingsManager& FileSettingsManager::instance()
{
    static FileSettingsManager instance;
    return instance;
}

QString FileSettingsManager::defaultScreenshotPath()
{
    const QString pictures = QStandardPaths::writableLocation(QStandardPaths::PicturesLocation);
    return pictures.isEmpty() ? QDir::homePath() : pictures;
}

QString FileSettingsManager::expandHomePath(const QString& path)
{
    if (path == QLatin1String("~")) {
        return QDir::homePath();
    }
    if (path.startsWith(QLatin1String("~/"))) {
        return QDir::homePath() + path.mid(1);
    }
    return path;
}

QString FileSettingsManager::loadScreenshotPath() const
{
    auto settings = Waysnip::getSettings();
    const QString stored = settings.value(kSettingsKeyScreenshotPath).toString().trimmed();
    if (stored.isEmpty()) {
        return defaultScreenshotPath();
    }
    return expandHomePath(stored);
}

void FileSettingsManager::saveScreenshotPath(const QString& path)
{
    auto settings = Waysnip::getSettings();
    settings.setValue(kSettingsKeyScreenshotPath, path.trimmed());
}
