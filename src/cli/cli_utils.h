// cli_utils.h - CLI utility functions for chalan-cli

#ifndef CLI_UTILS_H
#define CLI_UTILS_H

#include "invoice.h"

#include <QString>
#include <QStringList>
#include <QVector>

/**
 * @brief Process exit codes shared by every subcommand
 */
enum ExitCode {
    ExitOk       = 0,   // success
    ExitUsage    = 1,   // bad arguments
    ExitFailed   = 2,   // store, file or PDF operation failed
    ExitNotFound = 3    // chalan number or item id does not exist
};

/**
 * @brief Argument parsing and table output helpers for chalan-cli
 */
class CLIUtils {
public:
    /**
     * @brief Parse a chalan number argument
     * @param text Argument as typed
     * @param chalanNo Receives the number on success
     * @return true if text is an integer >= 1
     */
    static bool parseChalanNumber(const QString& text, int& chalanNo);

    /**
     * @brief Parse a non-negative money value (rate)
     */
    static bool parseRate(const QString& text, double& rate);

    /**
     * @brief Parse a positive item-master id
     */
    static bool parseId(const QString& text, qint64& id);

    /**
     * @brief Print rows as an aligned text table
     * @param headers Column titles
     * @param rows Cell text, one QStringList per row
     * @param rightAligned Column indexes printed right-aligned (numbers)
     */
    static void printTable(const QStringList& headers,
                           const QVector<QStringList>& rows,
                           const QList<int>& rightAligned = {});

    /**
     * @brief Print an invoice header, item table and totals
     */
    static void printInvoice(const Invoice& invoice);

    /**
     * @brief Print a one-line error in the common "Error: ..." form
     */
    static void printError(const QString& message);
};

#endif // CLI_UTILS_H
