#ifndef CLI_HANDLER_H
#define CLI_HANDLER_H

#include "CLICommand.h"
#include "CLIResult.h"

#include <QString>
#include <QStringList>
#include <map>
#include <memory>

namespace Tinct {
namespace CLI {

/**
 * @brief CLI handler for parsing and executing commands
 *
 * The first argument selects the command. When it is not a command name or
 * a global option, the arguments are handed to the default "pick" command,
 * so "tinct '#ff8800'" opens the picker seeded with that color.
 */
class CLIHandler
{
public:
    CLIHandler();
    ~CLIHandler();

    /**
     * @brief Parse and execute command line
     * @param arguments Command line arguments (including program name)
     * @return Execution result
     */
    CLIResult process(const QStringList& arguments);

    /**
     * @brief Whether the command selected by arguments opens a window
     */
    bool requiresGUI(const QStringList& arguments) const;

    /**
     * @brief Get main help text
     */
    QString getHelpText() const;

    /**
     * @brief Get version text
     */
    static QString getVersionText();

    static constexpr const char* kDefaultCommand = "pick";

private:
    void registerCommands();
    CLICommand* findCommand(const QString& name) const;
    CLICommand* resolveCommand(const QStringList& arguments, QStringList* commandArgs) const;

    std::map<QString, CLICommandPtr> m_commands;
};

} // namespace CLI
} // namespace Tinct

#endif // CLI_HANDLER_H
