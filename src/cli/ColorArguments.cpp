#include "cli/ColorArguments.h"

#include "colorwidgets/ColorParser.h"
#include "settings/PickerSettingsManager.h"

#include <QCommandLineParser>
#include <QDebug>

using tinct::colorwidgets::ColorParser;

namespace Tinct {
namespace CLI {

void addColorOptions(QCommandLineParser& parser)
{
    const QString formats = tinct::colorwidgets::formatNames().join(", ");
    parser.addOption({{"f", "format"}, QString("Output format (%1)").arg(formats), "format"});
    parser.addOption({{"m", "model"}, "Polar model (hsv, hsl)", "model"});
}

CLIResult resolveColorArguments(const QCommandLineParser& parser, const QString& colorText,
                                ColorArguments* out)
{
    const PickerSettingsManager& settings = PickerSettingsManager::instance();

    ColorArguments args;
    args.format = settings.loadOutputFormat();
    args.model = settings.loadPolarModel();

    if (parser.isSet("format")) {
        const QString value = parser.value("format");
        const auto format = tinct::colorwidgets::formatFromName(value);
        if (!format) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments,
                QString("Unknown format: %1 (expected one of %2)")
                    .arg(value, tinct::colorwidgets::formatNames().join(", ")));
        }
        args.format = *format;
    }

    if (parser.isSet("model")) {
        const QString value = parser.value("model");
        const auto model = tinct::colorwidgets::modelFromName(value);
        if (!model) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments,
                QString("Unknown model: %1 (expected hsv or hsl)").arg(value));
        }
        args.model = *model;
    }

    if (colorText.isEmpty()) {
        args.color = settings.loadDefaultColor().toModel(args.model);
    }
    else {
        const auto result = ColorParser::parse(colorText, args.model);
        if (!result.isSuccess()) {
            qWarning() << "ColorArguments:" << result.error.message();
            return CLIResult::error(CLIResult::Code::InvalidArguments, result.error.message());
        }
        args.color = *result.color;
    }

    *out = args;
    return CLIResult::success();
}

} // namespace CLI
} // namespace Tinct
