#ifndef CONVERT_COMMAND_H
#define CONVERT_COMMAND_H

#include "cli/CLICommand.h"

namespace Tinct {
namespace CLI {

/**
 * @brief Convert a color to another text format without opening a window
 */
class ConvertCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace Tinct

#endif // CONVERT_COMMAND_H
