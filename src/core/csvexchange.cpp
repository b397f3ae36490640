// csvexchange.cpp
// Chalan core - CSV export and import of the invoice tables
// Copyright (c) 2026 Chalan Project

#include "csvexchange.h"
#include "chalan_debug.h"
#include "invoicestore.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QTextStream>
#include <QVariant>

static const QStringList INVOICE_HEADER = {
    QStringLiteral("id"), QStringLiteral("chalan_no"), QStringLiteral("party_name"),
    QStringLiteral("city"), QStringLiteral("lr_no"), QStringLiteral("dt"),
    QStringLiteral("tax_percent"), QStringLiteral("pandf"), QStringLiteral("subtotal"),
    QStringLiteral("tax_amount"), QStringLiteral("grand_total")
};

static const QStringList ITEM_HEADER = {
    QStringLiteral("id"), QStringLiteral("invoice_id"), QStringLiteral("sr"),
    QStringLiteral("item_name"), QStringLiteral("qty"), QStringLiteral("rate"),
    QStringLiteral("amount")
};

CsvExchange::CsvExchange(InvoiceStore *store)
    : m_store(store)
{
}

QString CsvExchange::itemsPathFor(const QString &invoicesPath)
{
    QFileInfo info(invoicesPath);
    const QString suffix = info.suffix();
    QString base = invoicesPath;
    if (!suffix.isEmpty()) {
        base.chop(suffix.size() + 1);
    }
    return base + QStringLiteral("_items.csv");
}

// ═════════════════════════════════════════════════════════════
// Record formatting / parsing
// ═════════════════════════════════════════════════════════════

QString CsvExchange::quoteField(const QString &field)
{
    const bool needsQuotes = field.contains(QLatin1Char(','))
        || field.contains(QLatin1Char('"'))
        || field.contains(QLatin1Char('\n'))
        || field.contains(QLatin1Char('\r'));
    if (!needsQuotes) {
        return field;
    }
    QString escaped = field;
    escaped.replace(QLatin1Char('"'), QLatin1String("\"\""));
    return QLatin1Char('"') + escaped + QLatin1Char('"');
}

QString CsvExchange::formatRecord(const QStringList &fields)
{
    QStringList quoted;
    quoted.reserve(fields.size());
    for (const QString &f : fields) {
        quoted << quoteField(f);
    }
    return quoted.join(QLatin1Char(','));
}

bool CsvExchange::readRecord(QTextStream &in, QStringList &fields)
{
    fields.clear();
    if (in.atEnd()) {
        return false;
    }

    QString current;
    bool inQuotes = false;
    QString line = in.readLine();

    while (true) {
        for (int i = 0; i < line.size(); ++i) {
            const QChar c = line.at(i);
            if (inQuotes) {
                if (c == QLatin1Char('"')) {
                    if (i + 1 < line.size() && line.at(i + 1) == QLatin1Char('"')) {
                        current += QLatin1Char('"');
                        ++i;
                    } else {
                        inQuotes = false;
                    }
                } else {
                    current += c;
                }
            } else if (c == QLatin1Char('"')) {
                inQuotes = true;
            } else if (c == QLatin1Char(',')) {
                fields << current;
                current.clear();
            } else if (c != QLatin1Char('\r')) {
                current += c;
            }
        }

        // A quoted field continues on the next physical line
        if (inQuotes && !in.atEnd()) {
            current += QLatin1Char('\n');
            line = in.readLine();
            continue;
        }
        break;
    }

    fields << current;
    return true;
}

// ═════════════════════════════════════════════════════════════
// Export
// ═════════════════════════════════════════════════════════════

static QString csvValue(const QVariant &value)
{
    if (value.isNull()) {
        return QString();
    }
    return value.toString();
}

static bool writeQuery(QSqlQuery &query, const QStringList &header,
                       const QString &path, int &rows, QString &error)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        error = QStringLiteral("Cannot write %1: %2").arg(path, file.errorString());
        return false;
    }

    QTextStream out(&file);
    out.setEncoding(QStringConverter::Utf8);
    out << CsvExchange::formatRecord(header) << "\r\n";

    rows = 0;
    while (query.next()) {
        QStringList fields;
        for (int col = 0; col < header.size(); ++col) {
            fields << csvValue(query.value(col));
        }
        out << CsvExchange::formatRecord(fields) << "\r\n";
        ++rows;
    }

    out.flush();
    if (!file.commit()) {
        error = QStringLiteral("Cannot write %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}

std::optional<CsvExportResult> CsvExchange::exportInvoices(const QString &path)
{
    m_lastError.clear();
    if (!m_store || !m_store->isOpen()) {
        m_lastError = QStringLiteral("Database is not open");
        return std::nullopt;
    }

    QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        m_lastError = QStringLiteral("Cannot create directory %1").arg(info.absolutePath());
        return std::nullopt;
    }

    CsvExportResult result;
    result.invoicesPath = info.absoluteFilePath();
    result.itemsPath = itemsPathFor(result.invoicesPath);

    QSqlQuery invoices(m_store->database());
    if (!invoices.exec(QStringLiteral("SELECT ") + INVOICE_HEADER.join(QLatin1Char(','))
                       + QStringLiteral(" FROM invoices ORDER BY id"))) {
        m_lastError = invoices.lastError().text();
        qCWarning(CHALAN_CSV) << "Export query failed:" << m_lastError;
        return std::nullopt;
    }
    if (!writeQuery(invoices, INVOICE_HEADER, result.invoicesPath, result.invoiceCount, m_lastError)) {
        qCWarning(CHALAN_CSV) << m_lastError;
        return std::nullopt;
    }

    QSqlQuery items(m_store->database());
    if (!items.exec(QStringLiteral("SELECT ") + ITEM_HEADER.join(QLatin1Char(','))
                    + QStringLiteral(" FROM invoice_items ORDER BY id"))) {
        m_lastError = items.lastError().text();
        qCWarning(CHALAN_CSV) << "Export query failed:" << m_lastError;
        return std::nullopt;
    }
    if (!writeQuery(items, ITEM_HEADER, result.itemsPath, result.itemCount, m_lastError)) {
        qCWarning(CHALAN_CSV) << m_lastError;
        return std::nullopt;
    }

    qCDebug(CHALAN_CSV) << "Exported" << result.invoiceCount << "invoices and"
                        << result.itemCount << "items to" << result.invoicesPath;
    return result;
}

// ═════════════════════════════════════════════════════════════
// Import
// ═════════════════════════════════════════════════════════════

QString CsvExchange::Table::field(const QStringList &row, const char *name) const
{
    const int col = columns.value(QString::fromLatin1(name), -1);
    if (col < 0 || col >= row.size()) {
        return QString();
    }
    return row.at(col);
}

bool CsvExchange::readTable(const QString &path, Table &table)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        m_lastError = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QTextStream in(&file);
    in.setEncoding(QStringConverter::Utf8);

    QStringList fields;
    if (!readRecord(in, fields)) {
        m_lastError = QStringLiteral("%1 is empty").arg(path);
        return false;
    }
    for (int i = 0; i < fields.size(); ++i) {
        QString name = fields.at(i).trimmed();
        // Strip a UTF-8 byte order mark left by spreadsheet programs
        if (i == 0 && name.startsWith(QChar(0xFEFF))) {
            name.remove(0, 1);
        }
        table.columns.insert(name, i);
    }

    while (readRecord(in, fields)) {
        if (fields.size() == 1 && fields.first().trimmed().isEmpty()) {
            continue;
        }
        table.rows.append(fields);
    }
    return true;
}

static double numberOrZero(const QString &text)
{
    bool ok = false;
    const double value = text.trimmed().toDouble(&ok);
    return ok ? value : 0.0;
}

int CsvExchange::importInvoices(const QString &invoicesCsv, const QString &itemsCsv)
{
    m_lastError.clear();
    m_skipped = 0;

    if (!m_store || !m_store->isOpen()) {
        m_lastError = QStringLiteral("Database is not open");
        return -1;
    }

    Table invoiceTable;
    Table itemTable;
    if (!readTable(invoicesCsv, invoiceTable) || !readTable(itemsCsv, itemTable)) {
        qCWarning(CHALAN_CSV) << m_lastError;
        return -1;
    }
    if (!invoiceTable.columns.contains(QStringLiteral("chalan_no"))) {
        m_lastError = QStringLiteral("%1 has no chalan_no column").arg(invoicesCsv);
        return -1;
    }

    QSqlDatabase db = m_store->database();
    if (!db.transaction()) {
        m_lastError = db.lastError().text();
        return -1;
    }

    QSqlQuery exists(db);
    exists.prepare(QStringLiteral("SELECT 1 FROM invoices WHERE chalan_no = ?"));

    QSqlQuery insertInvoice(db);
    insertInvoice.prepare(QStringLiteral(
        "INSERT INTO invoices (chalan_no, party_name, city, lr_no, dt, tax_percent,"
        " pandf, subtotal, tax_amount, grand_total)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"));

    // CSV invoice id -> id assigned by this database
    QHash<QString, qint64> idMap;
    int imported = 0;

    auto fail = [&](const QSqlQuery &query) {
        m_lastError = query.lastError().text();
        qCWarning(CHALAN_CSV) << "Import failed:" << m_lastError;
        db.rollback();
        return -1;
    };

    for (const QStringList &row : invoiceTable.rows) {
        bool ok = false;
        const int chalanNo = invoiceTable.field(row, "chalan_no").trimmed().toInt(&ok);
        if (!ok) {
            qCDebug(CHALAN_CSV) << "Skipping row with chalan_no"
                                << invoiceTable.field(row, "chalan_no");
            ++m_skipped;
            continue;
        }

        exists.addBindValue(chalanNo);
        if (!exists.exec()) {
            return fail(exists);
        }
        const bool duplicate = exists.next();
        exists.finish();
        if (duplicate) {
            ++m_skipped;
            continue;
        }

        insertInvoice.addBindValue(chalanNo);
        insertInvoice.addBindValue(invoiceTable.field(row, "party_name"));
        insertInvoice.addBindValue(invoiceTable.field(row, "city"));
        insertInvoice.addBindValue(invoiceTable.field(row, "lr_no"));
        insertInvoice.addBindValue(invoiceTable.field(row, "dt"));
        insertInvoice.addBindValue(numberOrZero(invoiceTable.field(row, "tax_percent")));
        insertInvoice.addBindValue(numberOrZero(invoiceTable.field(row, "pandf")));
        insertInvoice.addBindValue(numberOrZero(invoiceTable.field(row, "subtotal")));
        insertInvoice.addBindValue(numberOrZero(invoiceTable.field(row, "tax_amount")));
        insertInvoice.addBindValue(numberOrZero(invoiceTable.field(row, "grand_total")));
        if (!insertInvoice.exec()) {
            return fail(insertInvoice);
        }

        const QString csvId = invoiceTable.field(row, "id").trimmed();
        if (!csvId.isEmpty()) {
            idMap.insert(csvId, insertInvoice.lastInsertId().toLongLong());
        }
        ++imported;
    }

    QSqlQuery insertItem(db);
    insertItem.prepare(QStringLiteral(
        "INSERT INTO invoice_items (invoice_id, sr, item_name, qty, rate, amount)"
        " VALUES (?, ?, ?, ?, ?, ?)"));

    int itemCount = 0;
    for (const QStringList &row : itemTable.rows) {
        const auto it = idMap.constFind(itemTable.field(row, "invoice_id").trimmed());
        if (it == idMap.constEnd()) {
            continue;
        }
        insertItem.addBindValue(it.value());
        insertItem.addBindValue(itemTable.field(row, "sr").trimmed().toInt());
        insertItem.addBindValue(itemTable.field(row, "item_name"));
        insertItem.addBindValue(numberOrZero(itemTable.field(row, "qty")));
        insertItem.addBindValue(numberOrZero(itemTable.field(row, "rate")));
        insertItem.addBindValue(numberOrZero(itemTable.field(row, "amount")));
        if (!insertItem.exec()) {
            return fail(insertItem);
        }
        ++itemCount;
    }

    if (!db.commit()) {
        m_lastError = db.lastError().text();
        db.rollback();
        return -1;
    }

    qCDebug(CHALAN_CSV) << "Imported" << imported << "invoices," << itemCount
                        << "items, skipped" << m_skipped;
    if (imported > 0) {
        m_store->notifyInvoicesImported(imported);
    }
    return imported;
}
