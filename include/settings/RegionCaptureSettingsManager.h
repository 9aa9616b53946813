#ifndef REGIONCAPTURESETTINGSMANAGER_H
#define REGIONCAPTURESETTINGSMANAGER_H

class RegionCaptureSettingsManager
{
public:
    static RegionCaptureSettingsManager& instance();

    bool isMagnifierEnabled() const;
    void setMagnifierEnabled(bool enabled);

    bool isHexColorEnabled() const;
    void setHexColorEnabled(bool enabled);

    int loadDimOpacity() const;
    void saveDimOpacity(int opacity);

    int loadBorderWidth() const;
    void saveBorderWidth(int width);

    static constexpr bool kDefaultMagnifierEnabled = true;
    static constexpr bool kDefaultHexColorEnabled = true;
    static constexpr int kDefaultDimOpacity = 128;
    static constexpr int kDefaultBorderWidth = 2;
    static constexpr int kMinBorderWidth = 1;
    static constexpr int kMaxBorderWidth = 8;

private:
    RegionCaptureSettingsManager() = default;
    ~RegionCaptureSettingsManager() = default;
    RegionCaptureSettingsManager(const RegionCaptureSettingsManager&) = delete;
    RegionCaptureSettingsManager& operator=(const RegionCaptureSettingsManager&) = delete;

    static constexpr const char* kSettingsKeyShowMagnifier = "regionCapture/showMagnifier";
    static constexpr const char* kSettingsKeyShowHexColor = "regionCapture/showHexColor";
    static constexpr const char* kSettingsKeyDimOpacity = "regionCapture/dimOpacity";
    static constexpr const char* kSettingsKeyBorderWidth = "regionCapture/borderWidth";
};

#endif // REGIONCAPTURESETTINGSMANAGER_H
