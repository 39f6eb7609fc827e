#include "cli/commands/PickCommand.h"

#include "cli/ColorArguments.h"
#include "colorwidgets/ColorPickerWindow.h"
#include "settings/PickerSettingsManager.h"

#include <QApplication>
#include <QDebug>
#include <QEventLoop>

using tinct::colorwidgets::ColorPickerWindow;

namespace Tinct {
namespace CLI {

QString PickCommand::name() const { return "pick"; }

QString PickCommand::description() const { return "Open the color picker (default command)"; }

void PickCommand::setupOptions(QCommandLineParser& parser)
{
    addColorOptions(parser);
    parser.addPositionalArgument("color", "Initial color (any CSS color, hex or vec)", "[color]");
}

CLIResult PickCommand::execute(const QCommandLineParser& parser)
{
    const QStringList positional = parser.positionalArguments();
    if (positional.size() > 1) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            QString("Expected at most one color, got %1").arg(positional.size()));
    }

    // Validate everything before any window is created
    ColorArguments args;
    CLIResult resolved = resolveColorArguments(
        parser, positional.isEmpty() ? QString() : positional.first(), &args);
    if (!resolved.isSuccess()) {
        return resolved;
    }

    if (!qobject_cast<QApplication*>(QCoreApplication::instance())) {
        return CLIResult::error(CLIResult::Code::GeneralError,
                                "The picker requires a graphical session");
    }

    ColorPickerWindow window(args.color, args.format,
                             PickerSettingsManager::instance().loadLayout());

    QString acceptedText;
    bool accepted = false;
    QEventLoop loop;
    QObject::connect(&window, &ColorPickerWindow::accepted, &loop,
                     [&](const QString& text) {
                         accepted = true;
                         acceptedText = text;
                         loop.quit();
                     });
    QObject::connect(&window, &ColorPickerWindow::cancelled, &loop, &QEventLoop::quit);

    qDebug() << "PickCommand: Opening picker with" << args.color.toHexString();
    window.show();
    window.raise();
    window.activateWindow();
    loop.exec();

    if (!accepted) {
        return CLIResult::error(CLIResult::Code::Cancelled, QString());
    }
    return CLIResult::success(acceptedText);
}

} // namespace CLI
} // namespace Tinct
