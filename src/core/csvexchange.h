// csvexchange.h
// Chalan core - CSV export and import of the invoice tables
// Copyright (c) 2026 Chalan Project

#ifndef CSVEXCHANGE_H
#define CSVEXCHANGE_H

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

class InvoiceStore;
class QTextStream;

struct CsvExportResult {
    QString invoicesPath;
    QString itemsPath;
    int     invoiceCount = 0;
    int     itemCount = 0;
};

/**
 * @brief Writes and reads the two-file CSV layout of the invoice tables.
 *
 * Export writes every invoice to the chosen file and every item to a
 * sibling "<name>_items.csv".  Import reads both files by header name,
 * skips invoices whose chalan number is already stored and re-links the
 * items to the ids the store assigns.
 */
class CsvExchange
{
public:
    explicit CsvExchange(InvoiceStore *store);

    std::optional<CsvExportResult> exportInvoices(const QString &path);

    /// Returns the number of invoices imported, or -1 on failure.
    int importInvoices(const QString &invoicesCsv, const QString &itemsCsv);

    /// Invoice rows skipped by the last import (duplicate or unreadable)
    int skippedCount() const { return m_skipped; }

    QString lastError() const { return m_lastError; }

    /// "/a/b/all.csv" -> "/a/b/all_items.csv"
    static QString itemsPathFor(const QString &invoicesPath);

    // ── RFC 4180 helpers ──

    static QString quoteField(const QString &field);
    static QString formatRecord(const QStringList &fields);

    /// Read one record, which may span several physical lines when a
    /// quoted field contains newlines.  Returns false at end of input.
    static bool readRecord(QTextStream &in, QStringList &fields);

private:
    struct Table {
        QHash<QString, int>   columns;
        QVector<QStringList>  rows;

        QString field(const QStringList &row, const char *name) const;
    };

    bool readTable(const QString &path, Table &table);

    InvoiceStore *m_store;
    QString       m_lastError;
    int           m_skipped = 0;
};

#endif // CSVEXCHANGE_H
