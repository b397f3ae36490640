// command_handler.cpp - Command registry and routing implementation

#include "command_handler.h"
#include "appconfig.h"
#include "chalan_debug.h"
#include "cli_utils.h"
#include "csvexchange.h"
#include "invoicestore.h"
#include "output_streams.h"
#include "pdfexporter.h"

#include <QDir>
#include <QFileInfo>

// Static member initialization
QMap<QString, CommandInfo> CommandHandler::commands_;
bool CommandHandler::registered_ = false;
std::unique_ptr<AppConfig> CommandHandler::config_;
std::unique_ptr<InvoiceStore> CommandHandler::store_;

void CommandHandler::registerCommands() {
    if (registered_) {
        return; // Already registered
    }

    commands_["list"] = {
        "list",
        "List saved invoices",
        "",
        true,
        handleList
    };

    commands_["show"] = {
        "show",
        "Show one invoice with its items and totals",
        "<chalan>",
        true,
        handleShow
    };

    commands_["pdf"] = {
        "pdf",
        "Export a saved invoice to PDF",
        "<chalan> [output.pdf]",
        true,
        handlePdf
    };

    commands_["export-csv"] = {
        "export-csv",
        "Export all invoices and items to CSV",
        "<invoices.csv>",
        true,
        handleExportCsv
    };

    commands_["import-csv"] = {
        "import-csv",
        "Import invoices and items from CSV, skipping known chalans",
        "<invoices.csv> <items.csv>",
        true,
        handleImportCsv
    };

    commands_["backup"] = {
        "backup",
        "Copy the database to a timestamped backup file",
        "[dir]",
        true,
        handleBackup
    };

    commands_["counter"] = {
        "counter",
        "Show, advance or reset the chalan counter",
        "show|next|reset [value]",
        true,
        handleCounter
    };

    commands_["items"] = {
        "items",
        "Manage the item master (names and default rates)",
        "list|add <name> <rate>|set <id> <name> <rate>|remove <id>",
        true,
        handleItems
    };

    registered_ = true;
}

int CommandHandler::executeCommand(const QString& cmd, const QStringList& args) {
    if (!commands_.contains(cmd)) {
        cerr << "Error: Unknown subcommand '" << cmd << "'" << Qt::endl;
        cerr << Qt::endl;
        showAvailableCommands();
        cerr << Qt::endl;
        cerr << "Use 'chalan-cli --help' for more information." << Qt::endl;
        return ExitUsage;
    }

    const CommandInfo& cmdInfo = commands_[cmd];

    if (args.contains("-h") || args.contains("--help")) {
        showHelp(cmd);
        return ExitOk;
    }

    if (cmdInfo.needsStore && !openStore()) {
        return ExitFailed;
    }

    qCDebug(CHALAN_CLI) << "Running" << cmd << args;
    return cmdInfo.handler(args);
}

void CommandHandler::showHelp(const QString& cmd) {
    if (!commands_.contains(cmd)) {
        cerr << "Error: Unknown command '" << cmd << "'" << Qt::endl;
        return;
    }

    const CommandInfo& cmdInfo = commands_[cmd];

    cout << "Usage: chalan-cli " << cmdInfo.name;
    if (!cmdInfo.usage.isEmpty()) {
        cout << " " << cmdInfo.usage;
    }
    cout << Qt::endl;
    cout << Qt::endl;
    cout << cmdInfo.description << Qt::endl;
    cout << Qt::endl;

    // Subcommand-specific help details
    if (cmd == "list") {
        cout << "Prints chalan number, date, party, city, item count and grand total" << Qt::endl;
        cout << "for every saved invoice, in chalan order." << Qt::endl;
    }
    else if (cmd == "show") {
        cout << "Arguments:" << Qt::endl;
        cout << "  <chalan>   Chalan number of a saved invoice" << Qt::endl;
        cout << Qt::endl;
        cout << "Exit status 3 when the chalan does not exist." << Qt::endl;
    }
    else if (cmd == "pdf") {
        cout << "Arguments:" << Qt::endl;
        cout << "  <chalan>        Chalan number of a saved invoice" << Qt::endl;
        cout << "  [output.pdf]    Target file (default: PDF_DIR/Invoice_<chalan>.pdf)" << Qt::endl;
        cout << Qt::endl;
        cout << "Examples:" << Qt::endl;
        cout << "  chalan-cli pdf 42" << Qt::endl;
        cout << "  chalan-cli pdf 42 ~/Desktop/invoice42.pdf" << Qt::endl;
    }
    else if (cmd == "export-csv") {
        cout << "Writes every invoice to <invoices.csv> and every item to" << Qt::endl;
        cout << "<invoices>_items.csv in the same folder." << Qt::endl;
        cout << Qt::endl;
        cout << "Examples:" << Qt::endl;
        cout << "  chalan-cli export-csv ~/all.csv      # also writes ~/all_items.csv" << Qt::endl;
    }
    else if (cmd == "import-csv") {
        cout << "Reads files in the layout written by export-csv.  Invoices whose" << Qt::endl;
        cout << "chalan number already exists are skipped together with their items." << Qt::endl;
        cout << "Nothing is written unless the whole import succeeds." << Qt::endl;
    }
    else if (cmd == "backup") {
        cout << "Arguments:" << Qt::endl;
        cout << "  [dir]   Destination folder (default: BACKUP_DIR)" << Qt::endl;
        cout << Qt::endl;
        cout << "Writes invoices_backup_<yyyyMMdd>_<HHmmss>.db and prints its path." << Qt::endl;
    }
    else if (cmd == "counter") {
        cout << "Subcommands:" << Qt::endl;
        cout << "  show            Print the number the next new invoice will get" << Qt::endl;
        cout << "  next            Take that number (it is consumed) and print it" << Qt::endl;
        cout << "  reset [value]   Store value as the last used number (default 0," << Qt::endl;
        cout << "                  so the next invoice is 1)" << Qt::endl;
    }
    else if (cmd == "items") {
        cout << "Subcommands:" << Qt::endl;
        cout << "  list                     Print id, name and default rate" << Qt::endl;
        cout << "  add <name> <rate>        Add an item (names are unique)" << Qt::endl;
        cout << "  set <id> <name> <rate>   Rename an item or change its rate" << Qt::endl;
        cout << "  remove <id>              Delete an item" << Qt::endl;
        cout << Qt::endl;
        cout << "Examples:" << Qt::endl;
        cout << "  chalan-cli items add \"Steel Rod\" 450" << Qt::endl;
        cout << "  chalan-cli items set 3 \"Steel Rod 8mm\" 470.50" << Qt::endl;
    }
}

void CommandHandler::showAvailableCommands() {
    for (const CommandInfo& cmd : commands_) {
        cout << "  " << cmd.name.leftJustified(18) << cmd.description << Qt::endl;
    }
}

void CommandHandler::shutdown() {
    store_.reset();
    config_.reset();
}

bool CommandHandler::openStore() {
    if (store_ && store_->isOpen()) {
        return true;
    }

    config_ = std::make_unique<AppConfig>();
    if (!config_->load()) {
        qCDebug(CHALAN_CLI) << "No chalan.conf found, using defaults";
    }

    store_ = std::make_unique<InvoiceStore>();
    if (!store_->open(config_->databasePath())) {
        CLIUtils::printError(QString("Cannot open database %1: %2")
                                 .arg(config_->databasePath(), store_->lastError()));
        return false;
    }
    return true;
}

// ============================================================================
// Command Handlers
// ============================================================================

int CommandHandler::handleList(const QStringList& args) {
    if (!args.isEmpty()) {
        cerr << "Error: 'list' takes no arguments" << Qt::endl;
        showHelp("list");
        return ExitUsage;
    }

    const QVector<InvoiceSummary> invoices = store_->listInvoices();
    if (store_->lastErrorKind() != StoreError::None) {
        CLIUtils::printError(store_->lastError());
        return ExitFailed;
    }

    if (invoices.isEmpty()) {
        cout << "No invoices saved." << Qt::endl;
        return ExitOk;
    }

    QVector<QStringList> rows;
    for (const InvoiceSummary& inv : invoices) {
        rows << QStringList{
            QString::number(inv.chalanNo),
            inv.date,
            inv.partyName,
            inv.city,
            QString::number(inv.itemCount),
            InvoiceMath::formatMoney(inv.grandTotal)
        };
    }
    CLIUtils::printTable({"Chalan", "Date", "Party", "City", "Items", "Grand Total"},
                         rows, {0, 4, 5});
    return ExitOk;
}

int CommandHandler::handleShow(const QStringList& args) {
    int chalanNo = 0;
    if (args.size() != 1 || !CLIUtils::parseChalanNumber(args[0], chalanNo)) {
        cerr << "Error: 'show' requires one chalan number" << Qt::endl;
        showHelp("show");
        return ExitUsage;
    }

    const std::optional<Invoice> invoice = store_->invoiceByChalan(chalanNo);
    if (!invoice) {
        CLIUtils::printError(store_->lastError());
        return store_->lastErrorKind() == StoreError::NotFound ? ExitNotFound : ExitFailed;
    }

    CLIUtils::printInvoice(*invoice);
    return ExitOk;
}

int CommandHandler::handlePdf(const QStringList& args) {
    int chalanNo = 0;
    if (args.isEmpty() || args.size() > 2 || !CLIUtils::parseChalanNumber(args[0], chalanNo)) {
        cerr << "Error: 'pdf' requires a chalan number and an optional output path" << Qt::endl;
        showHelp("pdf");
        return ExitUsage;
    }

    const std::optional<Invoice> invoice = store_->invoiceByChalan(chalanNo);
    if (!invoice) {
        CLIUtils::printError(store_->lastError());
        return store_->lastErrorKind() == StoreError::NotFound ? ExitNotFound : ExitFailed;
    }

    QString outPath = args.size() == 2
        ? QFileInfo(args[1]).absoluteFilePath()
        : QDir(config_->pdfDir()).filePath(InvoiceMath::defaultPdfFileName(chalanNo));

    InvoicePdfExporter exporter;
    if (!exporter.exportInvoice(*invoice, invoice->totals(), store_->companyProfile(), outPath)) {
        CLIUtils::printError(exporter.lastError());
        return ExitFailed;
    }

    cout << "Saved to: " << outPath << Qt::endl;
    return ExitOk;
}

int CommandHandler::handleExportCsv(const QStringList& args) {
    if (args.size() != 1) {
        cerr << "Error: 'export-csv' requires one output path" << Qt::endl;
        showHelp("export-csv");
        return ExitUsage;
    }

    CsvExchange exchange(store_.get());
    const std::optional<CsvExportResult> result =
        exchange.exportInvoices(QFileInfo(args[0]).absoluteFilePath());
    if (!result) {
        CLIUtils::printError(exchange.lastError());
        return ExitFailed;
    }

    cout << "Invoices (" << result->invoiceCount << ") -> " << result->invoicesPath << Qt::endl;
    cout << "Items (" << result->itemCount << ") -> " << result->itemsPath << Qt::endl;
    return ExitOk;
}

int CommandHandler::handleImportCsv(const QStringList& args) {
    if (args.size() != 2) {
        cerr << "Error: 'import-csv' requires the invoices and items CSV files" << Qt::endl;
        showHelp("import-csv");
        return ExitUsage;
    }

    for (const QString& path : args) {
        if (!QFileInfo::exists(path)) {
            CLIUtils::printError(QString("File not found: %1").arg(path));
            return ExitNotFound;
        }
    }

    CsvExchange exchange(store_.get());
    const int count = exchange.importInvoices(args[0], args[1]);
    if (count < 0) {
        CLIUtils::printError(exchange.lastError());
        return ExitFailed;
    }

    cout << "Imported " << count << " invoices (skipped " << exchange.skippedCount() << ")" << Qt::endl;
    return ExitOk;
}

int CommandHandler::handleBackup(const QStringList& args) {
    if (args.size() > 1) {
        cerr << "Error: 'backup' accepts at most one folder" << Qt::endl;
        showHelp("backup");
        return ExitUsage;
    }

    const QString folder = args.isEmpty() ? config_->backupDir()
                                          : QFileInfo(args[0]).absoluteFilePath();
    const QString dest = store_->backupTo(folder);
    if (dest.isEmpty()) {
        CLIUtils::printError(store_->lastError());
        return ExitFailed;
    }

    cout << "Backup saved to " << dest << Qt::endl;
    return ExitOk;
}

int CommandHandler::handleCounter(const QStringList& args) {
    const QStringList validSubcommands = {"show", "next", "reset"};
    if (args.isEmpty() || !validSubcommands.contains(args[0])) {
        cerr << "Error: 'counter' requires a subcommand" << Qt::endl;
        cerr << "Valid subcommands: " << validSubcommands.join(", ") << Qt::endl;
        return ExitUsage;
    }

    const QString sub = args[0];

    if (sub == "show" || sub == "next") {
        if (args.size() != 1) {
            cerr << "Error: 'counter " << sub << "' takes no arguments" << Qt::endl;
            return ExitUsage;
        }
        const int number = sub == "show" ? store_->peekChalanNumber()
                                         : store_->nextChalanNumber();
        if (number <= 0) {
            CLIUtils::printError(store_->lastError());
            return ExitFailed;
        }
        cout << number << Qt::endl;
        return ExitOk;
    }

    // reset [value]
    int value = 0;
    if (args.size() > 2) {
        cerr << "Error: 'counter reset' accepts at most one value" << Qt::endl;
        return ExitUsage;
    }
    if (args.size() == 2) {
        bool ok = false;
        value = args[1].toInt(&ok);
        if (!ok || value < 0) {
            cerr << "Error: Counter value must be a non-negative integer" << Qt::endl;
            return ExitUsage;
        }
    }

    if (!store_->resetChalanCounter(value)) {
        CLIUtils::printError(store_->lastError());
        return ExitFailed;
    }
    cout << "Counter reset; next chalan is " << value + 1 << Qt::endl;
    return ExitOk;
}

int CommandHandler::handleItems(const QStringList& args) {
    const QStringList validSubcommands = {"list", "add", "set", "remove"};
    if (args.isEmpty() || !validSubcommands.contains(args[0])) {
        cerr << "Error: 'items' requires a subcommand" << Qt::endl;
        cerr << "Valid subcommands: " << validSubcommands.join(", ") << Qt::endl;
        return ExitUsage;
    }

    const QString sub = args[0];

    auto reportStoreError = [](InvoiceStore* store) {
        CLIUtils::printError(store->lastError());
        return store->lastErrorKind() == StoreError::NotFound ? ExitNotFound : ExitFailed;
    };

    if (sub == "list") {
        const QVector<MasterItem> items = store_->masterItems();
        if (store_->lastErrorKind() != StoreError::None) {
            return reportStoreError(store_.get());
        }
        QVector<QStringList> rows;
        for (const MasterItem& item : items) {
            rows << QStringList{
                QString::number(item.id),
                item.name,
                InvoiceMath::formatMoney(item.defaultRate)
            };
        }
        CLIUtils::printTable({"ID", "Item Name", "Default Rate"}, rows, {0, 2});
        return ExitOk;
    }

    if (sub == "add") {
        double rate = 0.0;
        if (args.size() != 3 || args[1].trimmed().isEmpty() || !CLIUtils::parseRate(args[2], rate)) {
            cerr << "Error: Usage: chalan-cli items add <name> <rate>" << Qt::endl;
            return ExitUsage;
        }
        if (!store_->addMasterItem(args[1], rate)) {
            return reportStoreError(store_.get());
        }
        cout << "Added " << args[1].trimmed() << Qt::endl;
        return ExitOk;
    }

    if (sub == "set") {
        qint64 id = 0;
        double rate = 0.0;
        if (args.size() != 4 || !CLIUtils::parseId(args[1], id)
            || args[2].trimmed().isEmpty() || !CLIUtils::parseRate(args[3], rate)) {
            cerr << "Error: Usage: chalan-cli items set <id> <name> <rate>" << Qt::endl;
            return ExitUsage;
        }
        if (!store_->updateMasterItem(id, args[2], rate)) {
            return reportStoreError(store_.get());
        }
        cout << "Updated item " << id << Qt::endl;
        return ExitOk;
    }

    // remove <id>
    qint64 id = 0;
    if (args.size() != 2 || !CLIUtils::parseId(args[1], id)) {
        cerr << "Error: Usage: chalan-cli items remove <id>" << Qt::endl;
        return ExitUsage;
    }
    if (!store_->deleteMasterItem(id)) {
        return reportStoreError(store_.get());
    }
    cout << "Removed item " << id << Qt::endl;
    return ExitOk;
}
