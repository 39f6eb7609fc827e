#include <QApplication>
#include <QCoreApplication>
#include <QTextStream>

#include <memory>

#include "cli/CLIHandler.h"
#include "version.h"

using Tinct::CLI::CLIHandler;
using Tinct::CLI::CLIResult;

int main(int argc, char *argv[])
{
    CLIHandler handler;

    QStringList arguments;
    for (int i = 0; i < argc; ++i) {
        arguments.append(QString::fromLocal8Bit(argv[i]));
    }

    // Only the picker needs a display; conversions and config run headless
    std::unique_ptr<QCoreApplication> app;
    if (handler.requiresGUI(arguments)) {
        app = std::make_unique<QApplication>(argc, argv);
    }
    else {
        app = std::make_unique<QCoreApplication>(argc, argv);
    }

    // Set application metadata
    app->setApplicationName(TINCT_APP_NAME);
    app->setOrganizationName("Tinct");
    app->setApplicationVersion(TINCT_VERSION);

    CLIResult result = handler.process(QCoreApplication::arguments());

    if (!result.message.isEmpty()) {
        if (result.isSuccess()) {
            QTextStream out(stdout);
            out << result.message;
            if (!result.message.endsWith('\n')) {
                out << '\n';
            }
        }
        else {
            QTextStream err(stderr);
            err << result.message;
            if (!result.message.endsWith('\n')) {
                err << '\n';
            }
        }
    }

    return static_cast<int>(result.code);
}
