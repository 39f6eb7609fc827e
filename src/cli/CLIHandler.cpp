#include "cli/CLIHandler.h"

#include "cli/commands/ConfigCommand.h"
#include "cli/commands/ConvertCommand.h"
#include "cli/commands/PickCommand.h"
#include "version.h"

#include <QCommandLineParser>
#include <QTextStream>

namespace Tinct {
namespace CLI {

CLIHandler::CLIHandler() { registerCommands(); }

CLIHandler::~CLIHandler() = default;

void CLIHandler::registerCommands()
{
    auto addCmd = [this](CLICommandPtr cmd) { m_commands[cmd->name()] = std::move(cmd); };

    addCmd(std::make_unique<PickCommand>());
    addCmd(std::make_unique<ConvertCommand>());
    addCmd(std::make_unique<ConfigCommand>());
}

CLICommand* CLIHandler::resolveCommand(const QStringList& arguments, QStringList* commandArgs) const
{
    *commandArgs = arguments;
    if (arguments.size() >= 2) {
        if (CLICommand* command = findCommand(arguments.at(1))) {
            commandArgs->removeAt(1); // Remove command name
            return command;
        }
    }
    // Anything else (including a bare color) goes to the default command
    return findCommand(kDefaultCommand);
}

bool CLIHandler::requiresGUI(const QStringList& arguments) const
{
    if (arguments.size() >= 2) {
        const QString& option = arguments.at(1);
        if (option == "--help" || option == "-h" || option == "--version" || option == "-v") {
            return false;
        }
    }
    QStringList cmdArgs;
    CLICommand* command = resolveCommand(arguments, &cmdArgs);
    if (cmdArgs.contains("--help") || cmdArgs.contains("-h")) {
        return false;
    }
    return command && command->requiresGUI();
}

CLIResult CLIHandler::process(const QStringList& arguments)
{
    if (arguments.size() >= 2) {
        const QString& cmdOrOption = arguments.at(1);

        // Handle global options
        if (cmdOrOption == "--help" || cmdOrOption == "-h") {
            return CLIResult::success(getHelpText());
        }
        if (cmdOrOption == "--version" || cmdOrOption == "-v") {
            return CLIResult::success(getVersionText());
        }
    }

    QStringList cmdArgs;
    CLICommand* command = resolveCommand(arguments, &cmdArgs);
    if (!command) {
        return CLIResult::error(CLIResult::Code::GeneralError, "No default command registered");
    }

    // Setup and parse command arguments
    QCommandLineParser parser;
    parser.setApplicationDescription(command->description());
    parser.addHelpOption();

    command->setupOptions(parser);

    if (cmdArgs.isEmpty()) {
        cmdArgs.append(QString::fromLatin1(TINCT_APP_NAME));
    }
    if (!parser.parse(cmdArgs)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, parser.errorText());
    }

    if (parser.isSet("help")) {
        return CLIResult::success(parser.helpText());
    }

    return command->execute(parser);
}

CLICommand* CLIHandler::findCommand(const QString& name) const
{
    auto it = m_commands.find(name.toLower());
    return it != m_commands.end() ? it->second.get() : nullptr;
}

QString CLIHandler::getHelpText() const
{
    QString help;
    QTextStream out(&help);

    out << "Tinct - Color Picker\n\n";
    out << "Usage: tinct [command] [options] [color]\n\n";
    out << "Commands:\n";

    // Sort commands for consistent display
    QStringList names;
    for (const auto& [name, cmd] : m_commands) {
        names.append(name);
    }
    names.sort();

    for (const QString& name : names) {
        const auto& cmd = m_commands.at(name);
        out << QString("  %1  %2\n").arg(name, -10).arg(cmd->description());
    }

    out << "\nGlobal Options:\n";
    out << "  -h, --help     Display this help message\n";
    out << "  -v, --version  Display version information\n";
    out << "\nWithout a command, 'tinct [color]' runs 'tinct pick [color]'.\n";
    out << "Use 'tinct <command> --help' for more information about a command.\n";

    return help;
}

QString CLIHandler::getVersionText() { return QString("Tinct version %1").arg(TINCT_VERSION); }

} // namespace CLI
} // namespace Tinct
