#ifndef FILESETTINGSMANAGER_H
#define FILESETTINGSMANAGER_H

#include <QString>

/**
 * @brief Where saved selections go.
 *
 * The stored directory may start with "~/"; it is expanded against the
 * home directory on load. Blank values fall back to the Pictures location.
 */
class FileSettingsManager
{
public:
    static FileSettingsManager& instance();

    QString loadScreenshotPath() const;
    void saveScreenshotPath(const QString& path);

    static QString defaultScreenshotPath();
    static QString expandHomePath(const QString& path);

private:
    FileSettingsManager() = default;
    FileSettingsManager(const FileSettingsManager&) = delete;
    FileSettingsManager& operator=(const FileSettingsManager&) = delete;

    static constexpr const char* kSettingsKeyScreenshotPath = "files/screenshotPath";
};

#endif // FILESETTINGSMANAGER_H
