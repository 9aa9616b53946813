#include "settings/RegionCaptureSettingsManager.h"
#include "settings/Settings.h"

#include <QtGlobal>

namespace {

int clampDimOpacity(int opacity)
{
    return qBound(0, opacity, 255);
}

int clampBorderWidth(int width)
{
    return qBound(RegionCaptureSettingsManager::kMinBorderWidth, width,
                  RegionCaptureSettingsManager::kMaxBorderWidth);
}

} // namespace

RegionCaptureSettingsManager& RegionCaptureSettingsManager::instance()
{
    static RegionCaptureSettingsManager instance;
    return instance;
}

bool RegionCaptureSettingsManager::isMagnifierEnabled() const
{
    auto settings = Waysnip::getSettings();
    return settings.value(kSettingsKeyShowMagnifier, kDefaultMagnifierEnabled).toBool();
}

void RegionCaptureSettingsManager::setMagnifierEnabled(bool enabled)
{
    auto settings = Waysnip::getSettings();
    settings.setValue(kSettingsKeyShowMagnifier, enabled);
}

bool RegionCaptureSettingsManager::isHexColorEnabled() const
{
    auto settings = Waysnip::getSettings();
    return settings.value(kSettingsKeyShowHexColor, kDefaultHexColorEnabled).toBool();
}

void RegionCaptureSettingsManager::setHexColorEnabled(bool enabled)
{
    auto settings = Waysnip::getSettings();
    settings.setValue(kSettingsKeyShowHexColor, enabled);
}

int RegionCaptureSettingsManager::loadDimOpacity() const
{
    auto settings = Waysnip::getSettings();
    const int stored = settings.value(kSettingsKeyDimOpacity, kDefaultDimOpacity).toInt();
    return clampDimOpacity(stored);
}

void RegionCaptureSettingsManager::saveDimOpacity(int opacity)
{
    auto settings = Waysnip::getSettings();
    settings.setValue(kSettingsKeyDimOpacity, clampDimOpacity(opacity));
}

int RegionCaptureSettingsManager::loadBorderWidth() const
{
    auto settings = Waysnip::getSettings();
    const int stored = settings.value(kSettingsKeyBorderWidth, kDefaultBorderWidth).toInt();
    return clampBorderWidth(stored);
}

void RegionCaptureSettingsManager::saveBorderWidth(int width)
{
    auto settings = Waysnip::getSettings();
    settings.setValue(kSettingsKeyBorderWidth, clampBorderWidth(width));
}
