#ifndef CONFIG_COMMAND_H
#define CONFIG_COMMAND_H

#include "cli/CLICommand.h"

#include <QStringList>

namespace Tinct {
namespace CLI {

/**
 * @brief Get, set, list or reset the stored picker preferences
 */
class ConfigCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;

    // Keys accepted by --get and --set
    static QStringList knownKeys();

private:
    static QString effectiveValue(const QString& key);
    static QString validateValue(const QString& key, const QString& value);
};

} // namespace CLI
} // namespace Tinct

#endif // CONFIG_COMMAND_H
