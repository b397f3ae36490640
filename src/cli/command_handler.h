// command_handler.h - Command registry and routing for chalan-cli

#ifndef COMMAND_HANDLER_H
#define COMMAND_HANDLER_H

#include <QMap>
#include <QString>
#include <QStringList>
#include <functional>
#include <memory>

class AppConfig;
class InvoiceStore;

/**
 * @brief Information about a registered subcommand
 */
struct CommandInfo {
    QString name;           // Command name (e.g., "list", "pdf")
    QString description;    // Short description for help text
    QString usage;          // Usage syntax (e.g., "<chalan> [output.pdf]")
    bool    needsStore;     // Open the database before calling the handler
    std::function<int(const QStringList&)> handler;  // Handler function
};

/**
 * @brief Central command registry and dispatcher
 *
 * Manages registration of all subcommands and routes invocations
 * to appropriate handlers. Handlers validate their arguments, run the
 * operation against the invoice store and return an ExitCode.
 */
class CommandHandler {
public:
    /**
     * @brief Register all available subcommands
     *
     * Must be called once during application startup before
     * executing any commands.
     */
    static void registerCommands();

    /**
     * @brief Execute a registered subcommand
     * @param cmd Subcommand name
     * @param args Arguments passed to the subcommand
     * @return Exit code (0=success, 1=usage, 2=failure, 3=not found)
     */
    static int executeCommand(const QString& cmd, const QStringList& args);

    /**
     * @brief Show help for a specific command
     */
    static void showHelp(const QString& cmd);

    /**
     * @brief Show list of available commands with descriptions
     */
    static void showAvailableCommands();

    /**
     * @brief Close the store and drop the loaded configuration
     */
    static void shutdown();

private:
    // Load chalan.conf and open the database it names
    static bool openStore();

    // Command handlers (one per subcommand)
    static int handleList(const QStringList& args);
    static int handleShow(const QStringList& args);
    static int handlePdf(const QStringList& args);
    static int handleExportCsv(const QStringList& args);
    static int handleImportCsv(const QStringList& args);
    static int handleBackup(const QStringList& args);
    static int handleCounter(const QStringList& args);
    static int handleItems(const QStringList& args);

    // Command registry
    static QMap<QString, CommandInfo> commands_;
    static bool registered_;

    // Shared state for the running command
    static std::unique_ptr<AppConfig> config_;
    static std::unique_ptr<InvoiceStore> store_;
};

#endif // COMMAND_HANDLER_H
