// main.cpp - Entry point for chalan-cli dispatcher

#include <QGuiApplication>
#include <QStringList>
#include <QTextStream>

#include "command_handler.h"
#include "cli_utils.h"

#include "output_streams.h"

void showVersion() {
    cout << "chalan-cli version " << CHALAN_VERSION_STRING << Qt::endl;
    cout << "Delivery chalan and invoice book, command-line interface" << Qt::endl;
    cout << "Copyright (c) 2026 - Licensed under GPL-3.0" << Qt::endl;
}

void showGlobalHelp() {
    cout << "Usage: chalan-cli [--config <file>] <subcommand> [arguments]" << Qt::endl;
    cout << Qt::endl;
    cout << "Works on the same invoice database as the Chalan desktop application." << Qt::endl;
    cout << Qt::endl;
    cout << "Global Options:" << Qt::endl;
    cout << "  -h, --help       Show this help message" << Qt::endl;
    cout << "  -v, --version    Show version information" << Qt::endl;
    cout << "  --config <file>  Use alternate config file (default: ~/.config/chalan/chalan.conf)" << Qt::endl;
    cout << Qt::endl;
    cout << "Available Subcommands:" << Qt::endl;

    CommandHandler::showAvailableCommands();

    cout << Qt::endl;
    cout << "Use 'chalan-cli <subcommand> --help' for subcommand-specific help." << Qt::endl;
    cout << Qt::endl;
    cout << "Exit status: 0 success, 1 usage error, 2 operation failed, 3 not found" << Qt::endl;
    cout << Qt::endl;
    cout << "Examples:" << Qt::endl;
    cout << "  chalan-cli list                          # All saved invoices" << Qt::endl;
    cout << "  chalan-cli show 42                       # One invoice with totals" << Qt::endl;
    cout << "  chalan-cli pdf 42                        # Write PDF_DIR/Invoice_42.pdf" << Qt::endl;
    cout << "  chalan-cli export-csv ~/all.csv          # Writes all.csv and all_items.csv" << Qt::endl;
    cout << "  chalan-cli backup                        # Copy the database to BACKUP_DIR" << Qt::endl;
    cout << "  chalan-cli counter reset                 # Next invoice is chalan 1" << Qt::endl;
    cout << "  chalan-cli items add \"Steel Rod\" 450     # Add to the item master" << Qt::endl;
}

int main(int argc, char *argv[]) {
    // PDF export lays out text, which needs a platform plugin even without a display
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }

    QGuiApplication app(argc, argv);
    QGuiApplication::setApplicationName("chalan-cli");
    QGuiApplication::setApplicationVersion(CHALAN_VERSION_STRING);

    // Initialize command registry early so help can display available commands
    CommandHandler::registerCommands();

    QStringList args = QGuiApplication::arguments();

    // Remove program name (first argument)
    args.removeFirst();

    if (args.isEmpty()) {
        showGlobalHelp();
        return ExitUsage;
    }

    QString globalOption = args.first();

    if (globalOption == "-h" || globalOption == "--help") {
        showGlobalHelp();
        return ExitOk;
    }

    if (globalOption == "-v" || globalOption == "--version") {
        showVersion();
        return ExitOk;
    }

    if (globalOption == "--config") {
        if (args.size() < 2) {
            cerr << "Error: --config requires a path argument" << Qt::endl;
            return ExitUsage;
        }
        // AppConfig picks this up through ConfWriter::locateConfigFile()
        qputenv("CHALAN_CONFIG", args.at(1).toLocal8Bit());
        args.removeFirst(); // Remove --config
        args.removeFirst(); // Remove path

        if (args.isEmpty()) {
            cerr << "Error: No subcommand specified after --config" << Qt::endl;
            showGlobalHelp();
            return ExitUsage;
        }
    }

    QString subcommand = args.takeFirst();

    int exitCode = CommandHandler::executeCommand(subcommand, args);

    // Close the database while the application object still exists
    CommandHandler::shutdown();

    return exitCode;
}
