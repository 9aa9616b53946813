#ifndef REGIONEXPORTMANAGER_H
#define REGIONEXPORTMANAGER_H

#include <QDateTime>
#include <QImage>
#include <QObject>
#include <QRect>
#include <QString>

/**
 * @brief Manages screenshot export operations (copy, save)
 *
 * Crops the captured image by the crop region (canvas pixels) and
 * hands the result to the clipboard or a PNG file.
 */
class RegionExportManager : public QObject
{
    Q_OBJECT

public:
    explicit RegionExportManager(QObject *parent = nullptr);

    /**
     * @brief Set the captured image to crop from
     */
    void setSourceImage(const QImage &image);

    /**
     * @brief Get the pixels under the crop region
     * @return The cropped image, or a null image if the region misses the source
     */
    QImage getSelectedRegion(const QRect &cropRegion) const;

    /**
     * @brief Copy selection to clipboard
     */
    bool copyToClipboard(const QRect &cropRegion);

    /**
     * @brief Save selection as PNG in the configured screenshot directory
     * @return The written file path, or an empty string on failure
     */
    QString saveToFile(const QRect &cropRegion);

    /**
     * @brief Save selection as PNG into directory
     */
    QString saveToDirectory(const QRect &cropRegion, const QString &directory,
                            const QDateTime &timestamp = QDateTime::currentDateTime());

    /**
     * @brief First free "screenshot-YYYY-MM-DD-HH-MM-SS[-N].png" in directory.
     *
     * Suffixes -1..-999 are tried when the plain name is taken; after that a
     * millisecond timestamp is appended.
     */
    static QString generateScreenshotPath(const QString &directory, const QDateTime &timestamp);

    static constexpr int kMaxFilenameSuffix = 999;

signals:
    /**
     * @brief Emitted when screenshot is copied to clipboard
     */
    void copyCompleted(const QImage &image);

    /**
     * @brief Emitted when screenshot is saved to file
     */
    void saveCompleted(const QImage &image, const QString &filePath);

    void exportFailed(const QString &error);

private:
    bool writePng(const QImage &image, const QString &filePath, QString *error) const;

    QImage m_sourceImage;
};

#endif // REGIONEXPORTMANAGER_H
