// invoicestore.h
// Chalan core - SQLite record store for invoices, items, item master and meta
//
// The table layout matches invoices.db files written by the earlier
// Tkinter tool, so an existing database can be opened directly.
//
// Copyright (c) 2026 Chalan Project

#ifndef INVOICESTORE_H
#define INVOICESTORE_H

#include "invoice.h"

#include <QObject>
#include <QString>
#include <QVector>

#include <optional>

class QSqlDatabase;
class QSqlQuery;

enum class StoreError {
    None,
    NotOpen,
    Duplicate,   // chalan number or item name already exists
    NotFound,
    Io,
    Sql,
    OutOfRange   // counter value outside 0 .. INT_MAX - 1
};

struct SavedInvoice {
    qint64        id = 0;
    InvoiceTotals totals;
};

/**
 * @brief Owns one QSQLITE connection and every query the application runs.
 *
 * Each instance registers its own named connection, so a GUI store and a
 * short-lived store in a test or in chalan-cli never share state.
 *
 * Operations report failure through their return value; the reason is then
 * available from lastError() / lastErrorKind() until the next operation.
 */
class InvoiceStore : public QObject
{
    Q_OBJECT

public:
    explicit InvoiceStore(QObject *parent = nullptr);
    ~InvoiceStore() override;

    /// Open (creating if needed) the database at path and make sure the
    /// schema and default meta rows exist.  Closes any previous database.
    bool open(const QString &path);
    void close();
    bool isOpen() const;
    QString databasePath() const { return m_path; }

    // --- Meta key/value rows -------------------------------------------------

    QString metaValue(const QString &key, const QString &fallback = QString());
    bool setMetaValue(const QString &key, const QString &value);

    CompanyProfile companyProfile();
    bool setCompanyProfile(const CompanyProfile &profile);

    // --- Chalan counter -----------------------------------------------------

    /// Hand out the next chalan number and persist it.
    /// Returns 0 on failure.
    int nextChalanNumber();

    /// The number nextChalanNumber() would return, without consuming it.
    int peekChalanNumber();

    /// Store value as the last handed-out number; the next one is value + 1.
    /// value must lie in 0 .. INT_MAX - 1.
    bool resetChalanCounter(int value = 0);

    // --- Invoices -----------------------------------------------------------

    /// Insert header and items.  Items are numbered 1..n in list order.
    std::optional<SavedInvoice> saveInvoice(const Invoice &invoice);

    std::optional<Invoice> invoiceByChalan(int chalanNo);
    bool chalanExists(int chalanNo);

    QVector<InvoiceSummary> listInvoices();

    // --- Item master --------------------------------------------------------

    QVector<MasterItem> masterItems();
    QStringList masterItemNames();

    /// Returns false (kind Duplicate) when the trimmed name already exists.
    bool addMasterItem(const QString &name, double rate);
    bool updateMasterItem(qint64 id, const QString &name, double rate);
    bool deleteMasterItem(qint64 id);
    std::optional<double> masterItemRate(const QString &name);

    /// Insert the item or update its default rate.
    bool rememberItemRate(const QString &name, double rate);

    // --- Maintenance --------------------------------------------------------

    /// Copy the database file to destDir/invoices_backup_<timestamp>.db.
    /// Returns the written path, or an empty string on failure.
    QString backupTo(const QString &destDir);

    /// Raw connection for bulk operations (CSV exchange).
    QSqlDatabase database() const;

    QString lastError() const { return m_lastError; }
    StoreError lastErrorKind() const { return m_lastErrorKind; }

    /// Emitted by the CSV importer after it committed new rows.
    void notifyInvoicesImported(int count);

Q_SIGNALS:
    void invoiceSaved(int chalanNo);
    void invoicesImported(int count);
    void itemMasterChanged();
    void counterChanged();
    void companyProfileChanged();

private:
    bool initSchema();
    bool ensureOpen();
    bool exec(QSqlQuery &query, const char *what);
    bool execStatement(const QString &sql, const char *what);
    void clearError();
    void setError(StoreError kind, const QString &message);
    static bool isUniqueViolation(const QString &message);
    int maxStoredChalan();

    QString    m_connectionName;
    QString    m_path;
    QString    m_lastError;
    StoreError m_lastErrorKind = StoreError::None;
};

#endif // INVOICESTORE_H
