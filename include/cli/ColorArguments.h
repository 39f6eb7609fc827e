#ifndef COLOR_ARGUMENTS_H
#define COLOR_ARGUMENTS_H

#include "cli/CLIResult.h"
#include "colorwidgets/Color.h"
#include "colorwidgets/ColorFormat.h"

#include <QString>

class QCommandLineParser;

namespace Tinct {
namespace CLI {

struct ColorArguments
{
    tinct::colorwidgets::Color color;
    tinct::colorwidgets::ColorFormat format = tinct::colorwidgets::ColorFormat::Hex;
    tinct::colorwidgets::PolarModel model = tinct::colorwidgets::PolarModel::Hsv;
};

// Adds --format and --model
void addColorOptions(QCommandLineParser& parser);

// Unset options fall back to the stored preferences; an empty colorText
// falls back to the stored default color.
CLIResult resolveColorArguments(const QCommandLineParser& parser, const QString& colorText,
                                ColorArguments* out);

} // namespace CLI
} // namespace Tinct

#endif // COLOR_ARGUMENTS_H
