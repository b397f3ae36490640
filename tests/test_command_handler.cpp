// test_command_handler.cpp - chalan-cli subcommands, exit codes and output

#include "cli_utils.h"
#include "command_handler.h"
#include "invoice.h"
#include "invoicestore.h"
#include "output_streams.h"

#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <climits>
#include <cstdio>

namespace {

bool writeText(const QString &path, const QString &text)
{
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return false;
    }
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        return false;
    }
    return file.write(text.toUtf8()) >= 0;
}

// Restores an environment variable when the test ends
class ScopedEnv
{
public:
    explicit ScopedEnv(const char *name)
        : m_name(name)
        , m_hadValue(qEnvironmentVariableIsSet(name))
        , m_value(qgetenv(name))
    {
    }
    ~ScopedEnv()
    {
        if (m_hadValue) {
            qputenv(m_name, m_value);
        } else {
            qunsetenv(m_name);
        }
    }

private:
    const char *m_name;
    bool m_hadValue;
    QByteArray m_value;
};

} // namespace

class CommandHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_confPath = m_dir.filePath(QStringLiteral("conf/chalan.conf"));
        ASSERT_TRUE(writeText(m_confPath, QStringLiteral(
            "# test configuration\n"
            "DATABASE_PATH=\"data/invoices.db\"\n"
            "PDF_DIR=\"pdf\"\n"
            "BACKUP_DIR=\"backups\"\n"
            "OPEN_PDF_AFTER_EXPORT=false\n")));

        qputenv("CHALAN_CONFIG", QFile::encodeName(m_confPath));
        qunsetenv("CHALAN_CONFIG_DIR");

        CommandHandler::registerCommands();
        cout.setString(&m_out, QIODevice::WriteOnly);
        cerr.setString(&m_err, QIODevice::WriteOnly);
    }

    void TearDown() override
    {
        CommandHandler::shutdown();

        static QFile stdoutFile;
        static QFile stderrFile;
        if (!stdoutFile.isOpen() && !stdoutFile.open(stdout, QIODevice::WriteOnly)) {
            ADD_FAILURE() << "cannot reopen stdout";
        }
        if (!stderrFile.isOpen() && !stderrFile.open(stderr, QIODevice::WriteOnly)) {
            ADD_FAILURE() << "cannot reopen stderr";
        }
        cout.setDevice(&stdoutFile);
        cerr.setDevice(&stderrFile);
    }

    int run(const QString &cmd, const QStringList &args = {})
    {
        m_out.clear();
        m_err.clear();
        const int code = CommandHandler::executeCommand(cmd, args);
        cout.flush();
        cerr.flush();
        return code;
    }

    QString confDir() const { return QFileInfo(m_confPath).absolutePath(); }
    QString dbPath() const { return confDir() + QStringLiteral("/data/invoices.db"); }

    void seedInvoice(int chalanNo)
    {
        InvoiceStore store;
        ASSERT_TRUE(store.open(dbPath())) << store.lastError().toStdString();
        Invoice inv;
        inv.chalanNo = chalanNo;
        inv.partyName = QStringLiteral("Bharat Hardware");
        inv.city = QStringLiteral("Bhavnagar");
        inv.date = QStringLiteral("03/07/2026");
        inv.taxPercent = 10.0;
        inv.items = {{QStringLiteral("Hinge"), 4.0, 25.0}};
        ASSERT_TRUE(store.saveInvoice(inv).has_value()) << store.lastError().toStdString();
    }

    ScopedEnv m_configGuard{"CHALAN_CONFIG"};
    ScopedEnv m_configDirGuard{"CHALAN_CONFIG_DIR"};
    QTemporaryDir m_dir;
    QString m_confPath;
    QString m_out;
    QString m_err;
};

TEST_F(CommandHandlerTest, UnknownSubcommandIsUsageError)
{
    EXPECT_EQ(run(QStringLiteral("frobnicate")), ExitUsage);
    EXPECT_TRUE(m_err.contains(QStringLiteral("Unknown subcommand 'frobnicate'")));
}

TEST_F(CommandHandlerTest, SubcommandHelpPrintsUsageWithoutOpeningStore)
{
    EXPECT_EQ(run(QStringLiteral("pdf"), {QStringLiteral("--help")}), ExitOk);
    EXPECT_TRUE(m_out.contains(QStringLiteral("Usage: chalan-cli pdf <chalan> [output.pdf]")));
    EXPECT_FALSE(QFileInfo::exists(dbPath()));
}

TEST_F(CommandHandlerTest, CounterShowNextAndReset)
{
    EXPECT_EQ(run(QStringLiteral("counter"), {QStringLiteral("show")}), ExitOk);
    EXPECT_EQ(m_out.trimmed(), QStringLiteral("1"));

    // Relative DATABASE_PATH resolves beside the config file
    EXPECT_TRUE(QFileInfo::exists(dbPath()));

    EXPECT_EQ(run(QStringLiteral("counter"), {QStringLiteral("next")}), ExitOk);
    EXPECT_EQ(m_out.trimmed(), QStringLiteral("1"));
    EXPECT_EQ(run(QStringLiteral("counter"), {QStringLiteral("show")}), ExitOk);
    EXPECT_EQ(m_out.trimmed(), QStringLiteral("2"));

    EXPECT_EQ(run(QStringLiteral("counter"), {QStringLiteral("reset"), QStringLiteral("41")}), ExitOk);
    EXPECT_TRUE(m_out.contains(QStringLiteral("next chalan is 42")));
    EXPECT_EQ(run(QStringLiteral("counter"), {QStringLiteral("next")}), ExitOk);
    EXPECT_EQ(m_out.trimmed(), QStringLiteral("42"));

    EXPECT_EQ(run(QStringLiteral("counter"), {QStringLiteral("reset")}), ExitOk);
    EXPECT_TRUE(m_out.contains(QStringLiteral("next chalan is 1")));
}

TEST_F(CommandHandlerTest, CounterRejectsBadValues)
{
    EXPECT_EQ(run(QStringLiteral("counter")), ExitUsage);
    EXPECT_EQ(run(QStringLiteral("counter"), {QStringLiteral("rewind")}), ExitUsage);
    EXPECT_EQ(run(QStringLiteral("counter"), {QStringLiteral("reset"), QStringLiteral("-3")}), ExitUsage);
    EXPECT_EQ(run(QStringLiteral("counter"), {QStringLiteral("reset"), QStringLiteral("abc")}), ExitUsage);
    EXPECT_EQ(run(QStringLiteral("counter"), {QStringLiteral("show"), QStringLiteral("x")}), ExitUsage);

    EXPECT_EQ(run(QStringLiteral("counter"),
                  {QStringLiteral("reset"), QString::number(INT_MAX)}), ExitFailed);
    EXPECT_TRUE(m_err.startsWith(QStringLiteral("Error: ")));

    // The stored counter is untouched
    EXPECT_EQ(run(QStringLiteral("counter"), {QStringLiteral("show")}), ExitOk);
    EXPECT_EQ(m_out.trimmed(), QStringLiteral("1"));
}

TEST_F(CommandHandlerTest, ShowPrintsInvoiceOrReportsNotFound)
{
    seedInvoice(3);

    EXPECT_EQ(run(QStringLiteral("show"), {QStringLiteral("3")}), ExitOk);
    EXPECT_TRUE(m_out.contains(QStringLiteral("Party:     Bharat Hardware")));
    EXPECT_TRUE(m_out.contains(QStringLiteral("Hinge")));
    EXPECT_TRUE(m_out.contains(QStringLiteral("Grand Total:")));
    EXPECT_TRUE(m_out.contains(QStringLiteral("110.00")));

    EXPECT_EQ(run(QStringLiteral("show"), {QStringLiteral("5")}), ExitNotFound);
    EXPECT_FALSE(m_err.isEmpty());

    EXPECT_EQ(run(QStringLiteral("show"), {QStringLiteral("0")}), ExitUsage);
    EXPECT_EQ(run(QStringLiteral("show")), ExitUsage);
}

TEST_F(CommandHandlerTest, ListShowsSavedInvoices)
{
    EXPECT_EQ(run(QStringLiteral("list")), ExitOk);
    EXPECT_TRUE(m_out.contains(QStringLiteral("No invoices saved.")));

    CommandHandler::shutdown();
    seedInvoice(8);

    EXPECT_EQ(run(QStringLiteral("list")), ExitOk);
    EXPECT_TRUE(m_out.contains(QStringLiteral("Bharat Hardware")));
    EXPECT_TRUE(m_out.contains(QStringLiteral("Grand Total")));
    EXPECT_EQ(run(QStringLiteral("list"), {QStringLiteral("extra")}), ExitUsage);
}

TEST_F(CommandHandlerTest, ItemsAddSetRemove)
{
    EXPECT_EQ(run(QStringLiteral("items"),
                  {QStringLiteral("add"), QStringLiteral("Steel Rod"), QStringLiteral("450")}), ExitOk);
    EXPECT_EQ(run(QStringLiteral("items"),
                  {QStringLiteral("add"), QStringLiteral(" Steel Rod "), QStringLiteral("1")}), ExitFailed);
    EXPECT_EQ(run(QStringLiteral("items"),
                  {QStringLiteral("add"), QStringLiteral("Nut"), QStringLiteral("-5")}), ExitUsage);

    EXPECT_EQ(run(QStringLiteral("items"), {QStringLiteral("list")}), ExitOk);
    EXPECT_TRUE(m_out.contains(QStringLiteral("Steel Rod")));
    EXPECT_TRUE(m_out.contains(QStringLiteral("450.00")));

    EXPECT_EQ(run(QStringLiteral("items"),
                  {QStringLiteral("set"), QStringLiteral("1"),
                   QStringLiteral("Steel Rod 8mm"), QStringLiteral("470.5")}), ExitOk);
    EXPECT_EQ(run(QStringLiteral("items"),
                  {QStringLiteral("set"), QStringLiteral("99"),
                   QStringLiteral("Ghost"), QStringLiteral("1")}), ExitNotFound);

    EXPECT_EQ(run(QStringLiteral("items"), {QStringLiteral("list")}), ExitOk);
    EXPECT_TRUE(m_out.contains(QStringLiteral("Steel Rod 8mm")));
    EXPECT_TRUE(m_out.contains(QStringLiteral("470.50")));

    EXPECT_EQ(run(QStringLiteral("items"), {QStringLiteral("remove"), QStringLiteral("99")}), ExitNotFound);
    EXPECT_EQ(run(QStringLiteral("items"), {QStringLiteral("remove"), QStringLiteral("abc")}), ExitUsage);
    EXPECT_EQ(run(QStringLiteral("items"), {QStringLiteral("remove"), QStringLiteral("1")}), ExitOk);
    EXPECT_EQ(run(QStringLiteral("items"), {QStringLiteral("remove"), QStringLiteral("1")}), ExitNotFound);
    EXPECT_EQ(run(QStringLiteral("items")), ExitUsage);
}

TEST_F(CommandHandlerTest, PdfBackupAndCsvUseConfiguredFolders)
{
    seedInvoice(6);

    EXPECT_EQ(run(QStringLiteral("pdf"), {QStringLiteral("6")}), ExitOk);
    const QString pdf = confDir() + QStringLiteral("/pdf/Invoice_6.pdf");
    EXPECT_TRUE(QFileInfo::exists(pdf));
    EXPECT_TRUE(m_out.contains(QStringLiteral("Saved to: ") + pdf));
    EXPECT_EQ(run(QStringLiteral("pdf"), {QStringLiteral("7")}), ExitNotFound);

    EXPECT_EQ(run(QStringLiteral("backup")), ExitOk);
    EXPECT_TRUE(m_out.contains(confDir() + QStringLiteral("/backups/invoices_backup_")));
    EXPECT_EQ(QDir(confDir() + QStringLiteral("/backups"))
                  .entryList(QDir::Files).size(), 1);

    const QString csv = m_dir.filePath(QStringLiteral("out/all.csv"));
    EXPECT_EQ(run(QStringLiteral("export-csv"), {csv}), ExitOk);
    EXPECT_TRUE(QFileInfo::exists(csv));
    EXPECT_TRUE(QFileInfo::exists(m_dir.filePath(QStringLiteral("out/all_items.csv"))));

    EXPECT_EQ(run(QStringLiteral("import-csv"),
                  {csv, m_dir.filePath(QStringLiteral("out/missing_items.csv"))}), ExitNotFound);
    EXPECT_EQ(run(QStringLiteral("import-csv"),
                  {csv, m_dir.filePath(QStringLiteral("out/all_items.csv"))}), ExitOk);
    EXPECT_TRUE(m_out.contains(QStringLiteral("Imported 0 invoices (skipped 1)")));
}

TEST_F(CommandHandlerTest, ExplicitConfigFileWinsOverConfigDirectory)
{
    const QString otherDir = m_dir.filePath(QStringLiteral("other"));
    ASSERT_TRUE(writeText(otherDir + QStringLiteral("/chalan.conf"),
                          QStringLiteral("DATABASE_PATH=\"other.db\"\n")));
    qputenv("CHALAN_CONFIG_DIR", QFile::encodeName(otherDir));

    EXPECT_EQ(run(QStringLiteral("counter"), {QStringLiteral("next")}), ExitOk);
    EXPECT_TRUE(QFileInfo::exists(dbPath()));
    EXPECT_FALSE(QFileInfo::exists(otherDir + QStringLiteral("/other.db")));

    CommandHandler::shutdown();
    qunsetenv("CHALAN_CONFIG");

    EXPECT_EQ(run(QStringLiteral("counter"), {QStringLiteral("show")}), ExitOk);
    EXPECT_EQ(m_out.trimmed(), QStringLiteral("1"));
    EXPECT_TRUE(QFileInfo::exists(otherDir + QStringLiteral("/other.db")));
}

TEST(CliArguments, ChalanNumbersRatesAndIds)
{
    int chalanNo = 0;
    EXPECT_TRUE(CLIUtils::parseChalanNumber(QStringLiteral(" 7 "), chalanNo));
    EXPECT_EQ(chalanNo, 7);
    EXPECT_FALSE(CLIUtils::parseChalanNumber(QStringLiteral("0"), chalanNo));
    EXPECT_FALSE(CLIUtils::parseChalanNumber(QStringLiteral("7a"), chalanNo));
    EXPECT_EQ(chalanNo, 7);

    double rate = -1.0;
    EXPECT_TRUE(CLIUtils::parseRate(QStringLiteral("0"), rate));
    EXPECT_DOUBLE_EQ(rate, 0.0);
    EXPECT_TRUE(CLIUtils::parseRate(QStringLiteral("12.75"), rate));
    EXPECT_DOUBLE_EQ(rate, 12.75);
    EXPECT_FALSE(CLIUtils::parseRate(QStringLiteral("-1"), rate));
    EXPECT_FALSE(CLIUtils::parseRate(QStringLiteral("inf"), rate));
    EXPECT_FALSE(CLIUtils::parseRate(QStringLiteral("ten"), rate));

    qint64 id = 0;
    EXPECT_TRUE(CLIUtils::parseId(QStringLiteral("3"), id));
    EXPECT_EQ(id, 3);
    EXPECT_FALSE(CLIUtils::parseId(QStringLiteral("0"), id));
    EXPECT_FALSE(CLIUtils::parseId(QStringLiteral(""), id));
}
