#include <QtTest>

#include "cli/commands/ConvertCommand.h"
#include "settings/PickerSettingsManager.h"
#include "settings/Settings.h"

using Tinct::CLI::CLIResult;
using Tinct::CLI::ConvertCommand;

class tst_ConvertCommand : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void convert_defaultsToHex();
    void convert_formatOption();
    void convert_shortOptions();
    void convert_allFormats();
    void convert_modelKeepsHslValues();
    void convert_usesStoredFormat();
    void convert_rejectsInvalidColor();
    void convert_rejectsUnknownFormat();
    void convert_requiresColor();
    void convert_rejectsExtraColors();

private:
    CLIResult run(const QStringList& arguments);
    void clearAllTestSettings();
};

void tst_ConvertCommand::init()
{
    clearAllTestSettings();
}

void tst_ConvertCommand::cleanup()
{
    clearAllTestSettings();
}

void tst_ConvertCommand::clearAllTestSettings()
{
    auto settings = Tinct::getSettings();
    settings.remove(PickerSettingsManager::kSettingsKeyOutputFormat);
    settings.remove(PickerSettingsManager::kSettingsKeyPolarModel);
    settings.sync();
}

CLIResult tst_ConvertCommand::run(const QStringList& arguments)
{
    ConvertCommand command;
    QCommandLineParser parser;
    command.setupOptions(parser);

    QStringList args = arguments;
    args.prepend("tinct");
    if (!parser.parse(args)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, parser.errorText());
    }
    return command.execute(parser);
}

void tst_ConvertCommand::convert_defaultsToHex()
{
    CLIResult result = run({"rgb(255, 128, 0)"});
    QCOMPARE(result.code, CLIResult::Code::Success);
    QCOMPARE(result.message, QString("#ff8000"));
}

void tst_ConvertCommand::convert_formatOption()
{
    CLIResult result = run({"--format", "rgb", "#ff8000"});
    QCOMPARE(result.code, CLIResult::Code::Success);
    QCOMPARE(result.message, QString("rgb(255, 128, 0)"));
}

void tst_ConvertCommand::convert_shortOptions()
{
    CLIResult result = run({"-f", "hsv", "-m", "hsl", "#0000ff80"});
    QCOMPARE(result.code, CLIResult::Code::Success);
    QCOMPARE(result.message, QString("hsva(240deg, 100%, 100%, 50%)"));
}

void tst_ConvertCommand::convert_allFormats()
{
    CLIResult result = run({"--all", "#ff8000"});
    QCOMPARE(result.code, CLIResult::Code::Success);
    QCOMPARE(result.message,
             QString("hex: #ff8000\n"
                     "rgb: rgb(255, 128, 0)\n"
                     "hsl: hsl(30deg, 100%, 50%)\n"
                     "hsv: hsv(30deg, 100%, 100%)\n"
                     "vec: vec3(1.00, 0.50, 0.00)"));
}

void tst_ConvertCommand::convert_modelKeepsHslValues()
{
    CLIResult result = run({"--model", "hsl", "--format", "hsl", "hsl(200deg 40% 30%)"});
    QCOMPARE(result.code, CLIResult::Code::Success);
    QCOMPARE(result.message, QString("hsl(200deg, 40%, 30%)"));
}

void tst_ConvertCommand::convert_usesStoredFormat()
{
    PickerSettingsManager::instance().saveOutputFormat(tinct::colorwidgets::ColorFormat::Rgb);

    CLIResult result = run({"#ff0000"});
    QCOMPARE(result.message, QString("rgb(255, 0, 0)"));

    // The option still wins
    result = run({"-f", "hex", "#ff0000"});
    QCOMPARE(result.message, QString("#ff0000"));
}

void tst_ConvertCommand::convert_rejectsInvalidColor()
{
    CLIResult result = run({"rgb(1, 2)"});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(result.message.startsWith("Invalid color \"rgb(1, 2)\": "));
}

void tst_ConvertCommand::convert_rejectsUnknownFormat()
{
    CLIResult result = run({"--format", "cmyk", "red"});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QCOMPARE(result.message,
             QString("Unknown format: cmyk (expected one of hex, rgb, hsl, hsv, vec)"));
}

void tst_ConvertCommand::convert_requiresColor()
{
    CLIResult result = run({"--format", "rgb"});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QCOMPARE(result.message, QString("Color required"));
}

void tst_ConvertCommand::convert_rejectsExtraColors()
{
    CLIResult result = run({"red", "green", "blue"});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QCOMPARE(result.message, QString("Expected one color, got 3"));
}

QTEST_MAIN(tst_ConvertCommand)
#include "tst_ConvertCommand.moc"
