#include "cli/commands/ConfigCommand.h"

#include "colorwidgets/ColorParser.h"
#include "settings/PickerSettingsManager.h"
#include "settings/Settings.h"

#include <QSettings>
#include <QTextStream>

using tinct::colorwidgets::ColorParser;
using tinct::colorwidgets::PickerLayout;

namespace Tinct {
namespace CLI {

namespace {

struct IntRange
{
    int min;
    int max;
};

bool layoutRange(const QString& key, IntRange* range)
{
    using M = PickerSettingsManager;
    if (key == M::kSettingsKeyPadding) {
        *range = {M::kMinPadding, M::kMaxPadding};
    }
    else if (key == M::kSettingsKeyPickerSize) {
        *range = {M::kMinPickerSize, M::kMaxPickerSize};
    }
    else if (key == M::kSettingsKeySliderSize) {
        *range = {M::kMinSliderSize, M::kMaxSliderSize};
    }
    else if (key == M::kSettingsKeyCurrentSwatchSize || key == M::kSettingsKeyInitialSwatchSize) {
        *range = {M::kMinSwatchSize, M::kMaxSwatchSize};
    }
    else if (key == M::kSettingsKeyCheckerSize) {
        *range = {M::kMinCheckerSize, M::kMaxCheckerSize};
    }
    else {
        return false;
    }
    return true;
}

} // namespace

QString ConfigCommand::name() const { return "config"; }

QString ConfigCommand::description() const { return "Manage stored preferences"; }

void ConfigCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({"get", "Get setting value", "key"});
    parser.addOption({"set", "Set setting value (use with positional arg)", "key"});
    parser.addOption({"list", "List all settings"});
    parser.addOption({"reset", "Reset to default values"});
    parser.addPositionalArgument("value", "Value to set (when using --set)");
}

QStringList ConfigCommand::knownKeys()
{
    using M = PickerSettingsManager;
    return {M::kSettingsKeyDefaultColor,     M::kSettingsKeyOutputFormat,
            M::kSettingsKeyPolarModel,       M::kSettingsKeyPadding,
            M::kSettingsKeyPickerSize,       M::kSettingsKeySliderSize,
            M::kSettingsKeyCurrentSwatchSize, M::kSettingsKeyInitialSwatchSize,
            M::kSettingsKeyCheckerSize};
}

QString ConfigCommand::effectiveValue(const QString& key)
{
    using M = PickerSettingsManager;
    const M& manager = M::instance();

    if (key == M::kSettingsKeyDefaultColor) {
        return Tinct::getSettings().value(key, M::kDefaultColor).toString();
    }
    if (key == M::kSettingsKeyOutputFormat) {
        return tinct::colorwidgets::formatName(manager.loadOutputFormat());
    }
    if (key == M::kSettingsKeyPolarModel) {
        return tinct::colorwidgets::modelName(manager.loadPolarModel());
    }

    const PickerLayout layout = manager.loadLayout();
    if (key == M::kSettingsKeyPadding) return QString::number(layout.padding);
    if (key == M::kSettingsKeyPickerSize) return QString::number(layout.pickerSize);
    if (key == M::kSettingsKeySliderSize) return QString::number(layout.sliderSize);
    if (key == M::kSettingsKeyCurrentSwatchSize) return QString::number(layout.currentSwatchSize);
    if (key == M::kSettingsKeyInitialSwatchSize) return QString::number(layout.initialSwatchSize);
    if (key == M::kSettingsKeyCheckerSize) return QString::number(layout.checkerSize);
    return QString();
}

// Empty string when valid, otherwise the reason
QString ConfigCommand::validateValue(const QString& key, const QString& value)
{
    using M = PickerSettingsManager;

    if (key == M::kSettingsKeyDefaultColor) {
        const auto result = ColorParser::parse(value);
        return result.isSuccess() ? QString() : result.error.message();
    }
    if (key == M::kSettingsKeyOutputFormat) {
        if (tinct::colorwidgets::formatFromName(value))
            return QString();
        return QString("Unknown format: %1 (expected one of %2)")
            .arg(value, tinct::colorwidgets::formatNames().join(", "));
    }
    if (key == M::kSettingsKeyPolarModel) {
        if (tinct::colorwidgets::modelFromName(value))
            return QString();
        return QString("Unknown model: %1 (expected hsv or hsl)").arg(value);
    }

    IntRange range{0, 0};
    if (layoutRange(key, &range)) {
        bool ok = false;
        const int number = value.toInt(&ok);
        if (!ok || number < range.min || number > range.max) {
            return QString("Invalid value for %1: %2 (expected %3-%4)")
                .arg(key, value)
                .arg(range.min)
                .arg(range.max);
        }
        return QString();
    }

    return QString("Unknown setting: %1").arg(key);
}

CLIResult ConfigCommand::execute(const QCommandLineParser& parser)
{
    QSettings settings = Tinct::getSettings();

    // --get: Get setting value
    if (parser.isSet("get")) {
        QString key = parser.value("get");
        if (!knownKeys().contains(key)) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments, QString("Setting not found: %1").arg(key));
        }
        return CLIResult::success(effectiveValue(key));
    }

    // --set: Set setting value
    if (parser.isSet("set")) {
        QString key = parser.value("set");
        QStringList positionalArgs = parser.positionalArguments();
        if (positionalArgs.isEmpty()) {
            return CLIResult::error(CLIResult::Code::InvalidArguments, "Value required for --set");
        }
        QString value = positionalArgs.first();
        const QString problem = validateValue(key, value);
        if (!problem.isEmpty()) {
            return CLIResult::error(CLIResult::Code::InvalidArguments, problem);
        }
        settings.setValue(key, value);
        settings.sync();
        return CLIResult::success(QString("Set %1 = %2").arg(key, value));
    }

    // --reset: Reset to defaults
    if (parser.isSet("reset")) {
        for (const QString& key : knownKeys()) {
            settings.remove(key);
        }
        settings.sync();
        return CLIResult::success("Settings reset to defaults");
    }

    // --list (and no options): List all settings
    QString output;
    QTextStream out(&output);
    out << "Current settings:\n";
    for (const QString& key : knownKeys()) {
        out << QString("  %1 = %2").arg(key, effectiveValue(key));
        if (!settings.contains(key)) {
            out << " (default)";
        }
        out << "\n";
    }
    return CLIResult::success(output);
}

} // namespace CLI
} // namespace Tinct
