#include <QtTest>

#include <QDir>
#include <QFile>
#include <QImageReader>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "region/RegionExportManager.h"

class tst_RegionExportManager : public QObject
{
    Q_OBJECT

private slots:
    void init();

    void testSelectedRegionCropsPixels();
    void testSelectedRegionClampedToImage();
    void testSelectedRegionOutsideImage();
    void testCopyToClipboard();
    void testCopyWithoutSourceFails();
    void testSaveToDirectoryWritesPng();
    void testSaveToDirectoryCreatesMissingDirectory();
    void testGenerateScreenshotPathSuffixes();

private:
    QImage m_image;
    QDateTime m_timestamp;
};

void tst_RegionExportManager::init()
{
    m_image = QImage(200, 100, QImage::Format_RGB32);
    m_image.fill(Qt::blue);
    for (int y = 10; y < 30; ++y) {
        for (int x = 20; x < 60; ++x) {
            m_image.setPixelColor(x, y, Qt::red);
        }
    }
    m_timestamp = QDateTime(QDate(2024, 3, 5), QTime(14, 7, 9));
}

void tst_RegionExportManager::testSelectedRegionCropsPixels()
{
    RegionExportManager manager;
    manager.setSourceImage(m_image);

    const QImage region = manager.getSelectedRegion(QRect(20, 10, 40, 20));
    QCOMPARE(region.size(), QSize(40, 20));
    QCOMPARE(region.pixelColor(0, 0), QColor(Qt::red));
    QCOMPARE(region.pixelColor(39, 19), QColor(Qt::red));
}

void tst_RegionExportManager::testSelectedRegionClampedToImage()
{
    RegionExportManager manager;
    manager.setSourceImage(m_image);

    const QImage region = manager.getSelectedRegion(QRect(150, 50, 100, 100));
    QCOMPARE(region.size(), QSize(50, 50));
}

void tst_RegionExportManager::testSelectedRegionOutsideImage()
{
    RegionExportManager manager;
    manager.setSourceImage(m_image);

    QVERIFY(manager.getSelectedRegion(QRect(500, 500, 50, 50)).isNull());
    QVERIFY(manager.getSelectedRegion(QRect(10, 10, 0, 0)).isNull());
}

void tst_RegionExportManager::testCopyToClipboard()
{
    RegionExportManager manager;
    manager.setSourceImage(m_image);
    QSignalSpy copySpy(&manager, &RegionExportManager::copyCompleted);

    QVERIFY(manager.copyToClipboard(QRect(20, 10, 40, 20)));

    QCOMPARE(copySpy.count(), 1);
    const QImage copied = copySpy.first().at(0).value<QImage>();
    QCOMPARE(copied.size(), QSize(40, 20));
}

void tst_RegionExportManager::testCopyWithoutSourceFails()
{
    RegionExportManager manager;
    QSignalSpy copySpy(&manager, &RegionExportManager::copyCompleted);
    QSignalSpy failSpy(&manager, &RegionExportManager::exportFailed);

    QTest::ignoreMessage(QtWarningMsg, "RegionExportManager: Cannot copy - no valid selection");
    QVERIFY(!manager.copyToClipboard(QRect(0, 0, 50, 50)));

    QCOMPARE(copySpy.count(), 0);
    QCOMPARE(failSpy.count(), 1);
}

void tst_RegionExportManager::testSaveToDirectoryWritesPng()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    RegionExportManager manager;
    manager.setSourceImage(m_image);
    QSignalSpy saveSpy(&manager, &RegionExportManager::saveCompleted);

    const QString path = manager.saveToDirectory(QRect(20, 10, 40, 20), tempDir.path(), m_timestamp);

    QCOMPARE(QFileInfo(path).fileName(), QString("screenshot-2024-03-05-14-07-09.png"));
    QVERIFY(QFile::exists(path));
    QCOMPARE(saveSpy.count(), 1);
    QCOMPARE(saveSpy.first().at(1).toString(), path);

    QImageReader reader(path);
    QCOMPARE(reader.format(), QByteArray("png"));
    const QImage written = reader.read();
    QCOMPARE(written.size(), QSize(40, 20));
    QCOMPARE(written.pixelColor(5, 5), QColor(Qt::red));
}

void tst_RegionExportManager::testSaveToDirectoryCreatesMissingDirectory()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString nested = QDir(tempDir.path()).filePath("shots/today");

    RegionExportManager manager;
    manager.setSourceImage(m_image);

    const QString path = manager.saveToDirectory(QRect(0, 0, 50, 50), nested, m_timestamp);

    QVERIFY(!path.isEmpty());
    QVERIFY(QDir(nested).exists());
    QVERIFY(QFile::exists(path));
}

void tst_RegionExportManager::testGenerateScreenshotPathSuffixes()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QDir dir(tempDir.path());

    const QString first = RegionExportManager::generateScreenshotPath(dir.path(), m_timestamp);
    QCOMPARE(first, dir.filePath("screenshot-2024-03-05-14-07-09.png"));

    QFile firstFile(first);
    QVERIFY(firstFile.open(QIODevice::WriteOnly));
    firstFile.close();

    const QString second = RegionExportManager::generateScreenshotPath(dir.path(), m_timestamp);
    QCOMPARE(second, dir.filePath("screenshot-2024-03-05-14-07-09-1.png"));

    QFile secondFile(second);
    QVERIFY(secondFile.open(QIODevice::WriteOnly));
    secondFile.close();

    const QString third = RegionExportManager::generateScreenshotPath(dir.path(), m_timestamp);
    QCOMPARE(third, dir.filePath("screenshot-2024-03-05-14-07-09-2.png"));
}

QTEST_MAIN(tst_RegionExportManager)
#include "tst_RegionExportManager.moc"
