#ifndef PICK_COMMAND_H
#define PICK_COMMAND_H

#include "cli/CLICommand.h"

namespace Tinct {
namespace CLI {

/**
 * @brief Open the picker window and print the accepted color
 */
class PickCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
    bool requiresGUI() const override { return true; }
};

} // namespace CLI
} // namespace Tinct

#endif // PICK_COMMAND_H
