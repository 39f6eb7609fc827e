#include "settings/PickerSettingsManager.h"
#include "settings/Settings.h"
#include "colorwidgets/ColorParser.h"

#include <QDebug>
#include <QSettings>

using tinct::colorwidgets::Color;
using tinct::colorwidgets::ColorFormat;
using tinct::colorwidgets::ColorParser;
using tinct::colorwidgets::PickerLayout;
using tinct::colorwidgets::PolarModel;

namespace {

int loadClampedInt(const QSettings& settings, const char* key, int defaultValue,
                   int minValue, int maxValue)
{
    bool ok = false;
    int value = settings.value(key, defaultValue).toInt(&ok);
    if (!ok) {
        qWarning() << "PickerSettingsManager: Ignoring non-numeric value for" << key;
        return defaultValue;
    }
    // Clamp to valid range
    if (value < minValue) value = minValue;
    if (value > maxValue) value = maxValue;
    return value;
}

} // namespace

PickerSettingsManager& PickerSettingsManager::instance()
{
    static PickerSettingsManager instance;
    return instance;
}

Color PickerSettingsManager::loadDefaultColor() const
{
    auto settings = Tinct::getSettings();
    const QString text = settings.value(kSettingsKeyDefaultColor, kDefaultColor).toString();
    const PolarModel model = loadPolarModel();

    auto result = ColorParser::parse(text, model);
    if (!result.isSuccess()) {
        qWarning() << "PickerSettingsManager:" << result.error.message()
                   << "- using" << kDefaultColor;
        result = ColorParser::parse(QString::fromLatin1(kDefaultColor), model);
    }
    return *result.color;
}

void PickerSettingsManager::saveDefaultColor(const QString& text)
{
    auto settings = Tinct::getSettings();
    settings.setValue(kSettingsKeyDefaultColor, text);
}

ColorFormat PickerSettingsManager::loadOutputFormat() const
{
    auto settings = Tinct::getSettings();
    const QString name = settings.value(kSettingsKeyOutputFormat, kDefaultOutputFormat).toString();
    const auto format = tinct::colorwidgets::formatFromName(name);
    if (!format) {
        qWarning() << "PickerSettingsManager: Unknown output format" << name;
        return ColorFormat::Hex;
    }
    return *format;
}

void PickerSettingsManager::saveOutputFormat(ColorFormat format)
{
    auto settings = Tinct::getSettings();
    settings.setValue(kSettingsKeyOutputFormat, tinct::colorwidgets::formatName(format));
}

PolarModel PickerSettingsManager::loadPolarModel() const
{
    auto settings = Tinct::getSettings();
    const QString name = settings.value(kSettingsKeyPolarModel, kDefaultPolarModel).toString();
    const auto model = tinct::colorwidgets::modelFromName(name);
    if (!model) {
        qWarning() << "PickerSettingsManager: Unknown polar model" << name;
        return PolarModel::Hsv;
    }
    return *model;
}

void PickerSettingsManager::savePolarModel(PolarModel model)
{
    auto settings = Tinct::getSettings();
    settings.setValue(kSettingsKeyPolarModel, tinct::colorwidgets::modelName(model));
}

PickerLayout PickerSettingsManager::loadLayout() const
{
    auto settings = Tinct::getSettings();
    const PickerLayout defaults;

    PickerLayout layout;
    layout.padding = loadClampedInt(settings, kSettingsKeyPadding, defaults.padding,
                                    kMinPadding, kMaxPadding);
    layout.pickerSize = loadClampedInt(settings, kSettingsKeyPickerSize, defaults.pickerSize,
                                       kMinPickerSize, kMaxPickerSize);
    layout.sliderSize = loadClampedInt(settings, kSettingsKeySliderSize, defaults.sliderSize,
                                       kMinSliderSize, kMaxSliderSize);
    layout.currentSwatchSize = loadClampedInt(settings, kSettingsKeyCurrentSwatchSize,
                                              defaults.currentSwatchSize,
                                              kMinSwatchSize, kMaxSwatchSize);
    layout.initialSwatchSize = loadClampedInt(settings, kSettingsKeyInitialSwatchSize,
                                              defaults.initialSwatchSize,
                                              kMinSwatchSize, kMaxSwatchSize);
    layout.checkerSize = loadClampedInt(settings, kSettingsKeyCheckerSize, defaults.checkerSize,
                                        kMinCheckerSize, kMaxCheckerSize);
    return layout;
}

void PickerSettingsManager::saveLayout(const PickerLayout& layout)
{
    auto settings = Tinct::getSettings();
    settings.setValue(kSettingsKeyPadding, layout.padding);
    settings.setValue(kSettingsKeyPickerSize, layout.pickerSize);
    settings.setValue(kSettingsKeySliderSize, layout.sliderSize);
    settings.setValue(kSettingsKeyCurrentSwatchSize, layout.currentSwatchSize);
    settings.setValue(kSettingsKeyInitialSwatchSize, layout.initialSwatchSize);
    settings.setValue(kSettingsKeyCheckerSize, layout.checkerSize);
}
