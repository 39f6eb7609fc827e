#include "cli/commands/ConvertCommand.h"

#include "cli/ColorArguments.h"

#include <QTextStream>

namespace Tinct {
namespace CLI {

QString ConvertCommand::name() const { return "convert"; }

QString ConvertCommand::description() const { return "Convert a color between formats"; }

void ConvertCommand::setupOptions(QCommandLineParser& parser)
{
    addColorOptions(parser);
    parser.addOption({{"a", "all"}, "Print the color in every format"});
    parser.addPositionalArgument("color", "Color to convert (any CSS color, hex or vec)");
}

CLIResult ConvertCommand::execute(const QCommandLineParser& parser)
{
    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, "Color required");
    }
    if (positional.size() > 1) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            QString("Expected one color, got %1").arg(positional.size()));
    }

    ColorArguments args;
    CLIResult resolved = resolveColorArguments(parser, positional.first(), &args);
    if (!resolved.isSuccess()) {
        return resolved;
    }

    if (!parser.isSet("all")) {
        return CLIResult::success(args.color.toString(args.format));
    }

    QString output;
    QTextStream out(&output);
    const QStringList names = tinct::colorwidgets::formatNames();
    for (int i = 0; i < names.size(); ++i) {
        const auto format = tinct::colorwidgets::formatFromName(names.at(i));
        if (i > 0) {
            out << "\n";
        }
        out << names.at(i) << ": " << args.color.toString(*format);
    }
    return CLIResult::success(output);
}

} // namespace CLI
} // namespace Tinct
