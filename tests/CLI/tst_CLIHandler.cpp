#include <QtTest>

#include "cli/CLIHandler.h"
#include "settings/PickerSettingsManager.h"
#include "settings/Settings.h"

using Tinct::CLI::CLIHandler;
using Tinct::CLI::CLIResult;

/**
 * @brief Tests command dispatch in CLIHandler.
 *
 * Only argument combinations that fail validation reach the pick command
 * here, so no picker window is ever opened.
 */
class tst_CLIHandler : public QObject
{
    Q_OBJECT

private slots:
    void init();

    // Global options
    void process_versionOption();
    void process_helpListsCommands();

    // Dispatch
    void process_convertCommand();
    void process_commandNameIsCaseInsensitive();
    void process_bareColorGoesToPick();
    void process_pickRejectsUnknownFormat();
    void process_pickRejectsUnknownModel();
    void process_pickRejectsTwoColors();
    void process_rejectsUnknownOption();
    void process_commandHelp();
    void process_configCommand();

    // GUI selection
    void requiresGUI_data();
    void requiresGUI();
};

void tst_CLIHandler::init()
{
    auto settings = Tinct::getSettings();
    settings.remove(PickerSettingsManager::kSettingsKeyOutputFormat);
    settings.remove(PickerSettingsManager::kSettingsKeyPolarModel);
    settings.sync();
}

// ============================================================================
// Global options
// ============================================================================

void tst_CLIHandler::process_versionOption()
{
    CLIHandler handler;

    CLIResult result = handler.process({"tinct", "--version"});
    QCOMPARE(result.code, CLIResult::Code::Success);
    QVERIFY(result.message.startsWith("Tinct version "));

    QCOMPARE(handler.process({"tinct", "-v"}).message, result.message);
}

void tst_CLIHandler::process_helpListsCommands()
{
    CLIHandler handler;
    CLIResult result = handler.process({"tinct", "--help"});

    QCOMPARE(result.code, CLIResult::Code::Success);
    QVERIFY(result.message.contains("pick"));
    QVERIFY(result.message.contains("convert"));
    QVERIFY(result.message.contains("config"));
    QCOMPARE(result.message, handler.getHelpText());
}

// ============================================================================
// Dispatch
// ============================================================================

void tst_CLIHandler::process_convertCommand()
{
    CLIHandler handler;
    CLIResult result = handler.process({"tinct", "convert", "red"});

    QCOMPARE(result.code, CLIResult::Code::Success);
    QCOMPARE(result.message, QString("#ff0000"));
}

void tst_CLIHandler::process_commandNameIsCaseInsensitive()
{
    CLIHandler handler;
    CLIResult result = handler.process({"tinct", "CONVERT", "red", "--format", "vec"});

    QCOMPARE(result.code, CLIResult::Code::Success);
    QCOMPARE(result.message, QString("vec3(1.00, 0.00, 0.00)"));
}

void tst_CLIHandler::process_bareColorGoesToPick()
{
    CLIHandler handler;
    CLIResult result = handler.process({"tinct", "notacolor"});

    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(result.message.contains("Invalid color \"notacolor\""));
}

void tst_CLIHandler::process_pickRejectsUnknownFormat()
{
    CLIHandler handler;
    CLIResult result = handler.process({"tinct", "pick", "--format", "cmyk"});

    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(result.message.contains("Unknown format: cmyk"));
}

void tst_CLIHandler::process_pickRejectsUnknownModel()
{
    CLIHandler handler;
    CLIResult result = handler.process({"tinct", "#ff8800", "-m", "lab"});

    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(result.message.contains("Unknown model: lab"));
}

void tst_CLIHandler::process_pickRejectsTwoColors()
{
    CLIHandler handler;
    CLIResult result = handler.process({"tinct", "pick", "red", "blue"});

    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QCOMPARE(result.message, QString("Expected at most one color, got 2"));
}

void tst_CLIHandler::process_rejectsUnknownOption()
{
    CLIHandler handler;
    CLIResult result = handler.process({"tinct", "convert", "--bogus", "red"});

    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(result.message.contains("bogus"));
}

void tst_CLIHandler::process_commandHelp()
{
    CLIHandler handler;
    CLIResult result = handler.process({"tinct", "pick", "--help"});

    QCOMPARE(result.code, CLIResult::Code::Success);
    QVERIFY(result.message.contains("--format"));
    QVERIFY(result.message.contains("--model"));
}

void tst_CLIHandler::process_configCommand()
{
    CLIHandler handler;
    CLIResult result = handler.process({"tinct", "config", "--get", "picker/outputFormat"});

    QCOMPARE(result.code, CLIResult::Code::Success);
    QCOMPARE(result.message, QString("hex"));
}

// ============================================================================
// GUI selection
// ============================================================================

void tst_CLIHandler::requiresGUI_data()
{
    QTest::addColumn<QStringList>("arguments");
    QTest::addColumn<bool>("expected");

    QTest::newRow("no arguments") << QStringList{"tinct"} << true;
    QTest::newRow("bare color") << QStringList{"tinct", "#ff8800"} << true;
    QTest::newRow("pick") << QStringList{"tinct", "pick", "red"} << true;
    QTest::newRow("pick help") << QStringList{"tinct", "pick", "--help"} << false;
    QTest::newRow("convert") << QStringList{"tinct", "convert", "red"} << false;
    QTest::newRow("config") << QStringList{"tinct", "config", "--list"} << false;
    QTest::newRow("global help") << QStringList{"tinct", "--help"} << false;
    QTest::newRow("version") << QStringList{"tinct", "-v"} << false;
}

void tst_CLIHandler::requiresGUI()
{
    QFETCH(QStringList, arguments);
    QFETCH(bool, expected);

    CLIHandler handler;
    QCOMPARE(handler.requiresGUI(arguments), expected);
}

QTEST_MAIN(tst_CLIHandler)
#include "tst_CLIHandler.moc"
