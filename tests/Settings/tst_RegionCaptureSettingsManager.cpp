#include <QtTest/QtTest>

#include "settings/RegionCaptureSettingsManager.h"
#include "settings/Settings.h"

class tst_RegionCaptureSettingsManager : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testSingletonInstance();
    void testDefaults();
    void testMagnifierRoundtrip();
    void testHexColorRoundtrip();
    void testDimOpacityRoundtrip();
    void testDimOpacityClamp();
    void testBorderWidthClamp();
    void testStoredOutOfRangeValueClamped();

private:
    void clearSettings();
};

void tst_RegionCaptureSettingsManager::init()
{
    clearSettings();
}

void tst_RegionCaptureSettingsManager::cleanup()
{
    clearSettings();
}

void tst_RegionCaptureSettingsManager::clearSettings()
{
    auto settings = Waysnip::getSettings();
    settings.remove("regionCapture");
    settings.sync();
}

void tst_RegionCaptureSettingsManager::testSingletonInstance()
{
    auto& instance1 = RegionCaptureSettingsManager::instance();
    auto& instance2 = RegionCaptureSettingsManager::instance();
    QCOMPARE(&instance1, &instance2);
}

void tst_RegionCaptureSettingsManager::testDefaults()
{
    auto& manager = RegionCaptureSettingsManager::instance();
    QCOMPARE(manager.isMagnifierEnabled(), RegionCaptureSettingsManager::kDefaultMagnifierEnabled);
    QCOMPARE(manager.isHexColorEnabled(), RegionCaptureSettingsManager::kDefaultHexColorEnabled);
    QCOMPARE(manager.loadDimOpacity(), RegionCaptureSettingsManager::kDefaultDimOpacity);
    QCOMPARE(manager.loadBorderWidth(), RegionCaptureSettingsManager::kDefaultBorderWidth);
}

void tst_RegionCaptureSettingsManager::testMagnifierRoundtrip()
{
    auto& manager = RegionCaptureSettingsManager::instance();
    manager.setMagnifierEnabled(false);
    QCOMPARE(manager.isMagnifierEnabled(), false);

    manager.setMagnifierEnabled(true);
    QCOMPARE(manager.isMagnifierEnabled(), true);
}

void tst_RegionCaptureSettingsManager::testHexColorRoundtrip()
{
    auto& manager = RegionCaptureSettingsManager::instance();
    manager.setHexColorEnabled(false);
    QCOMPARE(manager.isHexColorEnabled(), false);
}

void tst_RegionCaptureSettingsManager::testDimOpacityRoundtrip()
{
    auto& manager = RegionCaptureSettingsManager::instance();
    manager.saveDimOpacity(200);
    QCOMPARE(manager.loadDimOpacity(), 200);
}

void tst_RegionCaptureSettingsManager::testDimOpacityClamp()
{
    auto& manager = RegionCaptureSettingsManager::instance();
    manager.saveDimOpacity(-5);
    QCOMPARE(manager.loadDimOpacity(), 0);

    manager.saveDimOpacity(1000);
    QCOMPARE(manager.loadDimOpacity(), 255);
}

void tst_RegionCaptureSettingsManager::testBorderWidthClamp()
{
    auto& manager = RegionCaptureSettingsManager::instance();
    manager.saveBorderWidth(0);
    QCOMPARE(manager.loadBorderWidth(), RegionCaptureSettingsManager::kMinBorderWidth);

    manager.saveBorderWidth(50);
    QCOMPARE(manager.loadBorderWidth(), RegionCaptureSettingsManager::kMaxBorderWidth);

    manager.saveBorderWidth(4);
    QCOMPARE(manager.loadBorderWidth(), 4);
}

void tst_RegionCaptureSettingsManager::testStoredOutOfRangeValueClamped()
{
    auto settings = Waysnip::getSettings();
    settings.setValue("regionCapture/dimOpacity", 999);
    settings.setValue("regionCapture/borderWidth", -3);
    settings.sync();

    auto& manager = RegionCaptureSettingsManager::instance();
    QCOMPARE(manager.loadDimOpacity(), 255);
    QCOMPARE(manager.loadBorderWidth(), RegionCaptureSettingsManager::kMinBorderWidth);
}

QTEST_MAIN(tst_RegionCaptureSettingsManager)
#include "tst_RegionCaptureSettingsManager.moc"
