#include "invoicelistmodel.h"
#include "invoicestore.h"

#include <QDate>

InvoiceListModel::InvoiceListModel(InvoiceStore *store, QObject *parent)
    : QAbstractTableModel(parent)
    , m_store(store)
{
    m_headers = {
        tr("Chalan No"), tr("Date"), tr("Party"), tr("City"), tr("Items"), tr("Grand Total")
    };

    // Any write through the store refreshes the history
    connect(m_store, &InvoiceStore::invoiceSaved, this, [this]() { reload(); });
    connect(m_store, &InvoiceStore::invoicesImported, this, [this]() { reload(); });

    if (m_store->isOpen())
        reload();
}

void InvoiceListModel::reload()
{
    QVector<InvoiceSummary> rows = m_store->listInvoices();
    if (m_store->lastErrorKind() != StoreError::None)
        emit loadError(m_store->lastError());

    beginResetModel();
    m_rows = rows;
    endResetModel();
}

int InvoiceListModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return m_rows.size();
}

int InvoiceListModel::columnCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return static_cast<int>(InvoiceListColumn::COUNT);
}

QVariant InvoiceListModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= m_rows.size())
        return QVariant();

    const InvoiceSummary &row = m_rows.at(index.row());
    const auto col = static_cast<InvoiceListColumn>(index.column());

    if (role == Qt::DisplayRole) {
        switch (col) {
        case InvoiceListColumn::ChalanNo:   return row.chalanNo;
        case InvoiceListColumn::Date:       return row.date;
        case InvoiceListColumn::Party:      return row.partyName;
        case InvoiceListColumn::City:       return row.city;
        case InvoiceListColumn::Items:      return row.itemCount;
        case InvoiceListColumn::GrandTotal: return InvoiceMath::formatMoney(row.grandTotal);
        default:                            return QVariant();
        }
    }

    if (role == Qt::TextAlignmentRole) {
        if (col == InvoiceListColumn::ChalanNo || col == InvoiceListColumn::Items
            || col == InvoiceListColumn::GrandTotal)
            return QVariant::fromValue(Qt::AlignRight | Qt::AlignVCenter);
    }

    // Provide raw values for correct sorting
    if (role == Qt::UserRole) {
        switch (col) {
        case InvoiceListColumn::ChalanNo:   return row.chalanNo;
        case InvoiceListColumn::Items:      return row.itemCount;
        case InvoiceListColumn::GrandTotal: return row.grandTotal;
        case InvoiceListColumn::Date: {
            // Dates are free text; sort the ones that parse chronologically
            const QDate d = QDate::fromString(row.date, QStringLiteral("dd/MM/yyyy"));
            return d.isValid() ? d.toString(Qt::ISODate) : row.date;
        }
        default:
            return data(index, Qt::DisplayRole).toString().toLower();
        }
    }

    return QVariant();
}

QVariant InvoiceListModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (role != Qt::DisplayRole) return QVariant();
    if (orientation == Qt::Horizontal && section < m_headers.size())
        return m_headers.at(section);
    return QVariant();
}

InvoiceSummary InvoiceListModel::summaryAt(int row) const
{
    if (row < 0 || row >= m_rows.size())
        return InvoiceSummary{};
    return m_rows.at(row);
}
