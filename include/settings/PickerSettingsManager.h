#ifndef PICKERSETTINGSMANAGER_H
#define PICKERSETTINGSMANAGER_H

#include "colorwidgets/Color.h"
#include "colorwidgets/ColorFormat.h"
#include "colorwidgets/PickerLayout.h"

#include <QString>

/**
 * @brief Singleton class for managing color picker preferences.
 *
 * Provides centralized access to the seed color, the output format,
 * the authoritative polar model and the window layout. Invalid stored
 * values fall back to defaults; layout sizes are clamped to valid ranges.
 */
class PickerSettingsManager
{
public:
    static PickerSettingsManager& instance();

    // Seed color when none is given on the command line
    tinct::colorwidgets::Color loadDefaultColor() const;
    void saveDefaultColor(const QString& text);

    tinct::colorwidgets::ColorFormat loadOutputFormat() const;
    void saveOutputFormat(tinct::colorwidgets::ColorFormat format);

    tinct::colorwidgets::PolarModel loadPolarModel() const;
    void savePolarModel(tinct::colorwidgets::PolarModel model);

    tinct::colorwidgets::PickerLayout loadLayout() const;
    void saveLayout(const tinct::colorwidgets::PickerLayout& layout);

    // Default values
    static constexpr const char* kDefaultColor = "#123456";
    static constexpr const char* kDefaultOutputFormat = "hex";
    static constexpr const char* kDefaultPolarModel = "hsv";

    // Layout ranges
    static constexpr int kMinPadding = 0;
    static constexpr int kMaxPadding = 64;
    static constexpr int kMinPickerSize = 64;
    static constexpr int kMaxPickerSize = 1024;
    static constexpr int kMinSliderSize = 10;
    static constexpr int kMaxSliderSize = 100;
    static constexpr int kMinSwatchSize = 10;
    static constexpr int kMaxSwatchSize = 200;
    static constexpr int kMinCheckerSize = 2;
    static constexpr int kMaxCheckerSize = 32;

    static constexpr const char* kSettingsKeyDefaultColor = "picker/defaultColor";
    static constexpr const char* kSettingsKeyOutputFormat = "picker/outputFormat";
    static constexpr const char* kSettingsKeyPolarModel = "picker/polarModel";
    static constexpr const char* kSettingsKeyPadding = "layout/padding";
    static constexpr const char* kSettingsKeyPickerSize = "layout/pickerSize";
    static constexpr const char* kSettingsKeySliderSize = "layout/sliderSize";
    static constexpr const char* kSettingsKeyCurrentSwatchSize = "layout/currentSwatchSize";
    static constexpr const char* kSettingsKeyInitialSwatchSize = "layout/initialSwatchSize";
    static constexpr const char* kSettingsKeyCheckerSize = "layout/checkerSize";

private:
    PickerSettingsManager() = default;
    PickerSettingsManager(const PickerSettingsManager&) = delete;
    PickerSettingsManager& operator=(const PickerSettingsManager&) = delete;
};

#endif // PICKERSETTINGSMANAGER_H
