// invoicestore.cpp
// Chalan core - SQLite record store implementation
// Copyright (c) 2026 Chalan Project

#include "invoicestore.h"
#include "chalan_debug.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>

#include <atomic>
#include <climits>

// ---------------------------------------------------------------------------
// Meta keys
// ---------------------------------------------------------------------------
static const QString META_CHALAN_NO = QStringLiteral("chalan_no");

namespace {

struct MetaDefault {
    const char *key;
    QString CompanyProfile::*field;
};

// Order matters only for seeding; every key maps to one profile field
const MetaDefault COMPANY_KEYS[] = {
    {"company_name",   &CompanyProfile::companyName},
    {"company_city",   &CompanyProfile::companyCity},
    {"company_mobile", &CompanyProfile::companyMobile},
    {"bank_ac_name",   &CompanyProfile::bankAccountName},
    {"bank_name",      &CompanyProfile::bankName},
    {"bank_ac_no",     &CompanyProfile::bankAccountNo},
    {"bank_ifsc",      &CompanyProfile::bankIfsc},
    {"logo_path",      &CompanyProfile::logoPath},
};

QString nextConnectionName()
{
    static std::atomic<int> counter{0};
    return QStringLiteral("chalan-store-%1").arg(++counter);
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
InvoiceStore::InvoiceStore(QObject *parent)
    : QObject(parent)
    , m_connectionName(nextConnectionName())
{
}

InvoiceStore::~InvoiceStore()
{
    close();
}

QSqlDatabase InvoiceStore::database() const
{
    return QSqlDatabase::database(m_connectionName, false);
}

void InvoiceStore::clearError()
{
    m_lastError.clear();
    m_lastErrorKind = StoreError::None;
}

void InvoiceStore::setError(StoreError kind, const QString &message)
{
    m_lastErrorKind = kind;
    m_lastError = message;
}

bool InvoiceStore::isUniqueViolation(const QString &message)
{
    return message.contains(QLatin1String("UNIQUE constraint failed"), Qt::CaseInsensitive)
        || message.contains(QLatin1String("is not unique"), Qt::CaseInsensitive);
}

bool InvoiceStore::exec(QSqlQuery &query, const char *what)
{
    if (query.exec()) {
        return true;
    }
    const QSqlError err = query.lastError();
    const QString text = err.text();
    setError(isUniqueViolation(text) ? StoreError::Duplicate : StoreError::Sql,
             QStringLiteral("%1: %2").arg(QLatin1String(what), text));
    qCWarning(CHALAN_STORE) << what << "failed:" << text;
    return false;
}

bool InvoiceStore::execStatement(const QString &sql, const char *what)
{
    QSqlQuery query(database());
    if (!query.prepare(sql)) {
        setError(StoreError::Sql, QStringLiteral("%1: %2")
                 .arg(QLatin1String(what), query.lastError().text()));
        qCWarning(CHALAN_STORE) << what << "prepare failed:" << query.lastError().text();
        return false;
    }
    return exec(query, what);
}

bool InvoiceStore::ensureOpen()
{
    if (isOpen()) {
        return true;
    }
    setError(StoreError::NotOpen, QStringLiteral("Database is not open"));
    return false;
}

// ===========================================================================
//  Open / close
// ===========================================================================

bool InvoiceStore::open(const QString &path)
{
    close();
    clearError();

    QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        setError(StoreError::Io, QStringLiteral("Cannot create directory %1").arg(info.absolutePath()));
        return false;
    }

    {
        QSqlDatabase db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_connectionName);
        db.setDatabaseName(info.absoluteFilePath());
        if (!db.open()) {
            setError(StoreError::Io, QStringLiteral("Cannot open %1: %2")
                     .arg(info.absoluteFilePath(), db.lastError().text()));
            qCWarning(CHALAN_STORE) << m_lastError;
        }
    }

    if (m_lastErrorKind != StoreError::None) {
        QSqlDatabase::removeDatabase(m_connectionName);
        return false;
    }

    m_path = info.absoluteFilePath();
    if (!initSchema()) {
        const QString reason = m_lastError;
        close();
        setError(StoreError::Sql, reason);
        return false;
    }

    qCDebug(CHALAN_STORE) << "Opened" << m_path;
    return true;
}

void InvoiceStore::close()
{
    if (!QSqlDatabase::contains(m_connectionName)) {
        return;
    }
    {
        QSqlDatabase db = QSqlDatabase::database(m_connectionName, false);
        if (db.isOpen()) {
            db.close();
        }
    }
    // All QSqlDatabase copies for this name are out of scope here
    QSqlDatabase::removeDatabase(m_connectionName);
    m_path.clear();
}

bool InvoiceStore::isOpen() const
{
    return QSqlDatabase::contains(m_connectionName) && database().isOpen();
}

bool InvoiceStore::initSchema()
{
    const QStringList statements = {
        QStringLiteral("PRAGMA foreign_keys = ON"),
        QStringLiteral(
            "CREATE TABLE IF NOT EXISTS meta ("
            " key TEXT PRIMARY KEY,"
            " value TEXT)"),
        QStringLiteral(
            "CREATE TABLE IF NOT EXISTS invoices ("
            " id INTEGER PRIMARY KEY AUTOINCREMENT,"
            " chalan_no INTEGER UNIQUE,"
            " party_name TEXT,"
            " city TEXT,"
            " lr_no TEXT,"
            " dt TEXT,"
            " tax_percent REAL,"
            " pandf REAL,"
            " subtotal REAL,"
            " tax_amount REAL,"
            " grand_total REAL)"),
        QStringLiteral(
            "CREATE TABLE IF NOT EXISTS invoice_items ("
            " id INTEGER PRIMARY KEY AUTOINCREMENT,"
            " invoice_id INTEGER,"
            " sr INTEGER,"
            " item_name TEXT,"
            " qty REAL,"
            " rate REAL,"
            " amount REAL,"
            " FOREIGN KEY(invoice_id) REFERENCES invoices(id))"),
        QStringLiteral(
            "CREATE TABLE IF NOT EXISTS item_master ("
            " id INTEGER PRIMARY KEY AUTOINCREMENT,"
            " name TEXT NOT NULL UNIQUE,"
            " default_rate REAL NOT NULL)"),
    };

    for (const QString &sql : statements) {
        if (!execStatement(sql, "schema")) {
            return false;
        }
    }

    // Seed counter and company defaults without touching existing rows
    QSqlQuery seed(database());
    seed.prepare(QStringLiteral("INSERT OR IGNORE INTO meta(key, value) VALUES(?, ?)"));

    seed.addBindValue(META_CHALAN_NO);
    seed.addBindValue(QStringLiteral("0"));
    if (!exec(seed, "seed counter")) {
        return false;
    }

    const CompanyProfile defaults;
    for (const MetaDefault &entry : COMPANY_KEYS) {
        seed.addBindValue(QString::fromLatin1(entry.key));
        seed.addBindValue(defaults.*(entry.field));
        if (!exec(seed, "seed company defaults")) {
            return false;
        }
    }
    return true;
}

// ===========================================================================
//  Meta
// ===========================================================================

QString InvoiceStore::metaValue(const QString &key, const QString &fallback)
{
    clearError();
    if (!ensureOpen()) {
        return fallback;
    }

    QSqlQuery query(database());
    query.prepare(QStringLiteral("SELECT value FROM meta WHERE key = ?"));
    query.addBindValue(key);
    if (!exec(query, "read meta")) {
        return fallback;
    }
    return query.next() ? query.value(0).toString() : fallback;
}

bool InvoiceStore::setMetaValue(const QString &key, const QString &value)
{
    clearError();
    if (!ensureOpen()) {
        return false;
    }

    QSqlQuery query(database());
    query.prepare(QStringLiteral("INSERT OR REPLACE INTO meta(key, value) VALUES(?, ?)"));
    query.addBindValue(key);
    query.addBindValue(value);
    return exec(query, "write meta");
}

CompanyProfile InvoiceStore::companyProfile()
{
    CompanyProfile profile;
    for (const MetaDefault &entry : COMPANY_KEYS) {
        QString &field = profile.*(entry.field);
        field = metaValue(QString::fromLatin1(entry.key), field);
    }
    return profile;
}

bool InvoiceStore::setCompanyProfile(const CompanyProfile &profile)
{
    clearError();
    if (!ensureOpen()) {
        return false;
    }

    QSqlDatabase db = database();
    if (!db.transaction()) {
        setError(StoreError::Sql, db.lastError().text());
        return false;
    }
    for (const MetaDefault &entry : COMPANY_KEYS) {
        if (!setMetaValue(QString::fromLatin1(entry.key), (profile.*(entry.field)).trimmed())) {
            db.rollback();
            return false;
        }
    }
    if (!db.commit()) {
        setError(StoreError::Sql, db.lastError().text());
        return false;
    }
    Q_EMIT companyProfileChanged();
    return true;
}

// ===========================================================================
//  Chalan counter
// ===========================================================================

int InvoiceStore::maxStoredChalan()
{
    QSqlQuery query(database());
    query.prepare(QStringLiteral("SELECT MAX(chalan_no) FROM invoices"));
    if (!exec(query, "max chalan") || !query.next()) {
        return 0;
    }
    return query.value(0).isNull() ? 0 : query.value(0).toInt();
}

int InvoiceStore::peekChalanNumber()
{
    clearError();
    if (!ensureOpen()) {
        return 0;
    }

    QSqlQuery query(database());
    query.prepare(QStringLiteral("SELECT value FROM meta WHERE key = ?"));
    query.addBindValue(META_CHALAN_NO);
    if (!exec(query, "read counter")) {
        return 0;
    }

    if (query.next()) {
        bool ok = false;
        const int current = query.value(0).toString().trimmed().toInt(&ok);
        if (ok && current >= 0 && current < INT_MAX) {
            return current + 1;
        }
        if (ok) {
            setError(StoreError::OutOfRange,
                     QStringLiteral("Chalan counter %1 is out of range; reset the counter").arg(current));
            return 0;
        }
        qCWarning(CHALAN_STORE) << "Counter value" << query.value(0).toString()
                                << "is not a number, deriving from stored invoices";
    }
    const int highest = maxStoredChalan();
    if (m_lastErrorKind != StoreError::None) {
        return 0;
    }
    if (highest >= INT_MAX) {
        setError(StoreError::OutOfRange,
                 QStringLiteral("No chalan number left after %1").arg(highest));
        return 0;
    }
    return qMax(highest, 0) + 1;
}

int InvoiceStore::nextChalanNumber()
{
    const int next = peekChalanNumber();
    if (next <= 0) {
        return 0;
    }
    if (!setMetaValue(META_CHALAN_NO, QString::number(next))) {
        return 0;
    }
    qCDebug(CHALAN_STORE) << "Handed out chalan" << next;
    Q_EMIT counterChanged();
    return next;
}

bool InvoiceStore::resetChalanCounter(int value)
{
    clearError();
    if (value < 0 || value >= INT_MAX) {
        setError(StoreError::OutOfRange,
                 QStringLiteral("Counter value must be between 0 and %1").arg(INT_MAX - 1));
        return false;
    }
    if (!setMetaValue(META_CHALAN_NO, QString::number(value))) {
        return false;
    }
    qCDebug(CHALAN_STORE) << "Counter reset to" << value;
    Q_EMIT counterChanged();
    return true;
}

// ===========================================================================
//  Invoices
// ===========================================================================

bool InvoiceStore::chalanExists(int chalanNo)
{
    clearError();
    if (!ensureOpen()) {
        return false;
    }
    QSqlQuery query(database());
    query.prepare(QStringLiteral("SELECT 1 FROM invoices WHERE chalan_no = ?"));
    query.addBindValue(chalanNo);
    return exec(query, "lookup chalan") && query.next();
}

std::optional<SavedInvoice> InvoiceStore::saveInvoice(const Invoice &invoice)
{
    if (chalanExists(invoice.chalanNo)) {
        setError(StoreError::Duplicate,
                 QStringLiteral("Chalan number already exists. Start a new invoice."));
        return std::nullopt;
    }
    if (m_lastErrorKind != StoreError::None) {
        return std::nullopt;
    }

    SavedInvoice saved;
    saved.totals = invoice.totals();

    QSqlDatabase db = database();
    if (!db.transaction()) {
        setError(StoreError::Sql, db.lastError().text());
        return std::nullopt;
    }

    QSqlQuery header(db);
    header.prepare(QStringLiteral(
        "INSERT INTO invoices (chalan_no, party_name, city, lr_no, dt, tax_percent,"
        " pandf, subtotal, tax_amount, grand_total)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"));
    header.addBindValue(invoice.chalanNo);
    header.addBindValue(invoice.partyName);
    header.addBindValue(invoice.city);
    header.addBindValue(invoice.lrNo);
    header.addBindValue(invoice.date);
    header.addBindValue(invoice.taxPercent);
    header.addBindValue(invoice.packingForwarding);
    header.addBindValue(saved.totals.subtotal);
    header.addBindValue(saved.totals.taxAmount);
    header.addBindValue(saved.totals.grandTotal);

    if (!exec(header, "insert invoice")) {
        db.rollback();
        if (m_lastErrorKind == StoreError::Duplicate) {
            m_lastError = QStringLiteral("Chalan number already exists. Start a new invoice.");
        }
        return std::nullopt;
    }
    saved.id = header.lastInsertId().toLongLong();

    QSqlQuery item(db);
    item.prepare(QStringLiteral(
        "INSERT INTO invoice_items (invoice_id, sr, item_name, qty, rate, amount)"
        " VALUES (?, ?, ?, ?, ?, ?)"));

    int sr = 1;
    for (const LineItem &li : invoice.items) {
        item.addBindValue(saved.id);
        item.addBindValue(sr++);
        item.addBindValue(li.name);
        item.addBindValue(li.qty);
        item.addBindValue(li.rate);
        item.addBindValue(li.amount());
        if (!exec(item, "insert invoice item")) {
            db.rollback();
            return std::nullopt;
        }
    }

    if (!db.commit()) {
        setError(StoreError::Sql, db.lastError().text());
        db.rollback();
        return std::nullopt;
    }

    qCDebug(CHALAN_STORE) << "Saved chalan" << invoice.chalanNo << "as id" << saved.id
                          << "grand total" << saved.totals.grandTotal;
    Q_EMIT invoiceSaved(invoice.chalanNo);
    return saved;
}

std::optional<Invoice> InvoiceStore::invoiceByChalan(int chalanNo)
{
    clearError();
    if (!ensureOpen()) {
        return std::nullopt;
    }

    QSqlQuery header(database());
    header.prepare(QStringLiteral(
        "SELECT id, party_name, city, lr_no, dt, tax_percent, pandf"
        " FROM invoices WHERE chalan_no = ?"));
    header.addBindValue(chalanNo);
    if (!exec(header, "read invoice")) {
        return std::nullopt;
    }
    if (!header.next()) {
        setError(StoreError::NotFound, QStringLiteral("No invoice with chalan %1").arg(chalanNo));
        return std::nullopt;
    }

    Invoice invoice;
    invoice.id                = header.value(0).toLongLong();
    invoice.chalanNo          = chalanNo;
    invoice.partyName         = header.value(1).toString();
    invoice.city              = header.value(2).toString();
    invoice.lrNo              = header.value(3).toString();
    invoice.date              = header.value(4).toString();
    invoice.taxPercent        = header.value(5).toDouble();
    invoice.packingForwarding = header.value(6).toDouble();

    QSqlQuery items(database());
    items.prepare(QStringLiteral(
        "SELECT item_name, qty, rate FROM invoice_items"
        " WHERE invoice_id = ? ORDER BY sr"));
    items.addBindValue(invoice.id);
    if (!exec(items, "read invoice items")) {
        return std::nullopt;
    }
    while (items.next()) {
        LineItem li;
        li.name = items.value(0).toString();
        li.qty  = items.value(1).toDouble();
        li.rate = items.value(2).toDouble();
        invoice.items.append(li);
    }
    return invoice;
}

QVector<InvoiceSummary> InvoiceStore::listInvoices()
{
    QVector<InvoiceSummary> result;
    clearError();
    if (!ensureOpen()) {
        return result;
    }

    QSqlQuery query(database());
    query.prepare(QStringLiteral(
        "SELECT i.id, i.chalan_no, i.party_name, i.city, i.dt, i.grand_total,"
        " (SELECT COUNT(*) FROM invoice_items it WHERE it.invoice_id = i.id)"
        " FROM invoices i ORDER BY i.chalan_no"));
    if (!exec(query, "list invoices")) {
        return result;
    }
    while (query.next()) {
        InvoiceSummary s;
        s.id         = query.value(0).toLongLong();
        s.chalanNo   = query.value(1).toInt();
        s.partyName  = query.value(2).toString();
        s.city       = query.value(3).toString();
        s.date       = query.value(4).toString();
        s.grandTotal = query.value(5).toDouble();
        s.itemCount  = query.value(6).toInt();
        result.append(s);
    }
    return result;
}

void InvoiceStore::notifyInvoicesImported(int count)
{
    Q_EMIT invoicesImported(count);
}

// ===========================================================================
//  Item master
// ===========================================================================

QVector<MasterItem> InvoiceStore::masterItems()
{
    QVector<MasterItem> result;
    clearError();
    if (!ensureOpen()) {
        return result;
    }

    QSqlQuery query(database());
    query.prepare(QStringLiteral("SELECT id, name, default_rate FROM item_master ORDER BY name"));
    if (!exec(query, "list item master")) {
        return result;
    }
    while (query.next()) {
        MasterItem item;
        item.id          = query.value(0).toLongLong();
        item.name        = query.value(1).toString();
        item.defaultRate = query.value(2).toDouble();
        result.append(item);
    }
    return result;
}

QStringList InvoiceStore::masterItemNames()
{
    QStringList names;
    const QVector<MasterItem> items = masterItems();
    for (const MasterItem &item : items) {
        names << item.name;
    }
    return names;
}

bool InvoiceStore::addMasterItem(const QString &name, double rate)
{
    clearError();
    if (!ensureOpen()) {
        return false;
    }
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty()) {
        setError(StoreError::Sql, QStringLiteral("Item name required"));
        return false;
    }

    QSqlQuery query(database());
    query.prepare(QStringLiteral("INSERT INTO item_master (name, default_rate) VALUES (?, ?)"));
    query.addBindValue(trimmed);
    query.addBindValue(rate);
    if (!exec(query, "add master item")) {
        if (m_lastErrorKind == StoreError::Duplicate) {
            m_lastError = QStringLiteral("Item already exists");
        }
        return false;
    }
    Q_EMIT itemMasterChanged();
    return true;
}

bool InvoiceStore::updateMasterItem(qint64 id, const QString &name, double rate)
{
    clearError();
    if (!ensureOpen()) {
        return false;
    }
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty()) {
        setError(StoreError::Sql, QStringLiteral("Item name required"));
        return false;
    }

    QSqlQuery query(database());
    query.prepare(QStringLiteral("UPDATE item_master SET name = ?, default_rate = ? WHERE id = ?"));
    query.addBindValue(trimmed);
    query.addBindValue(rate);
    query.addBindValue(id);
    if (!exec(query, "update master item")) {
        if (m_lastErrorKind == StoreError::Duplicate) {
            m_lastError = QStringLiteral("Item already exists");
        }
        return false;
    }
    if (query.numRowsAffected() == 0) {
        setError(StoreError::NotFound, QStringLiteral("No item with id %1").arg(id));
        return false;
    }
    Q_EMIT itemMasterChanged();
    return true;
}

bool InvoiceStore::deleteMasterItem(qint64 id)
{
    clearError();
    if (!ensureOpen()) {
        return false;
    }

    QSqlQuery query(database());
    query.prepare(QStringLiteral("DELETE FROM item_master WHERE id = ?"));
    query.addBindValue(id);
    if (!exec(query, "delete master item")) {
        return false;
    }
    if (query.numRowsAffected() == 0) {
        setError(StoreError::NotFound, QStringLiteral("No item with id %1").arg(id));
        return false;
    }
    Q_EMIT itemMasterChanged();
    return true;
}

std::optional<double> InvoiceStore::masterItemRate(const QString &name)
{
    clearError();
    if (!ensureOpen()) {
        return std::nullopt;
    }

    QSqlQuery query(database());
    query.prepare(QStringLiteral("SELECT default_rate FROM item_master WHERE name = ?"));
    query.addBindValue(name.trimmed());
    if (!exec(query, "lookup item rate") || !query.next()) {
        return std::nullopt;
    }
    return query.value(0).toDouble();
}

bool InvoiceStore::rememberItemRate(const QString &name, double rate)
{
    clearError();
    if (!ensureOpen()) {
        return false;
    }
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty()) {
        return false;
    }

    QSqlQuery query(database());
    query.prepare(QStringLiteral(
        "INSERT INTO item_master (name, default_rate) VALUES (?, ?)"
        " ON CONFLICT(name) DO UPDATE SET default_rate = excluded.default_rate"));
    query.addBindValue(trimmed);
    query.addBindValue(rate);
    if (!exec(query, "remember item rate")) {
        return false;
    }
    Q_EMIT itemMasterChanged();
    return true;
}

// ===========================================================================
//  Backup
// ===========================================================================

QString InvoiceStore::backupTo(const QString &destDir)
{
    clearError();
    if (!ensureOpen()) {
        return QString();
    }
    if (!QDir().mkpath(destDir)) {
        setError(StoreError::Io, QStringLiteral("Cannot create directory %1").arg(destDir));
        return QString();
    }

    const QString stamp = QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss"));
    QDir dir(destDir);
    QString dest = dir.absoluteFilePath(QStringLiteral("invoices_backup_%1.db").arg(stamp));
    for (int n = 1; QFile::exists(dest); ++n) {
        dest = dir.absoluteFilePath(QStringLiteral("invoices_backup_%1_%2.db").arg(stamp).arg(n));
    }

    if (!QFile::copy(m_path, dest)) {
        setError(StoreError::Io, QStringLiteral("Cannot copy %1 to %2").arg(m_path, dest));
        qCWarning(CHALAN_STORE) << m_lastError;
        return QString();
    }

    // Copy keeps the source modification time
    QFile copy(dest);
    if (copy.open(QIODevice::ReadWrite)) {
        copy.setFileTime(QFileInfo(m_path).lastModified(), QFileDevice::FileModificationTime);
    }

    qCDebug(CHALAN_STORE) << "Backup written to" << dest;
    return dest;
}
