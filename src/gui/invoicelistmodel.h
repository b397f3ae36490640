#pragma once

#include "invoice.h"

#include <QAbstractTableModel>
#include <QStringList>
#include <QVector>

class InvoiceStore;

// Column indices - match InvoiceListModel headers
enum class InvoiceListColumn : int {
    ChalanNo   = 0,
    Date       = 1,
    Party      = 2,
    City       = 3,
    Items      = 4,
    GrandTotal = 5,
    COUNT      = 6
};

// Read-only history of saved invoices, refreshed from the store
class InvoiceListModel : public QAbstractTableModel
{
    Q_OBJECT

public:
    explicit InvoiceListModel(InvoiceStore *store, QObject *parent = nullptr);

    // Re-read all summaries from the store
    void reload();

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation,
                        int role = Qt::DisplayRole) const override;

    InvoiceSummary summaryAt(int row) const;

signals:
    void loadError(const QString &message);

private:
    InvoiceStore            *m_store;
    QVector<InvoiceSummary>  m_rows;
    QStringList              m_headers;
};
