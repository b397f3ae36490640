#pragma once

#include "invoice.h"

#include <QAbstractTableModel>
#include <QStringList>
#include <QVector>

// Column indices - match the item table of the invoice form
enum class LineItemColumn : int {
    Sr     = 0,
    Item   = 1,
    Qty    = 2,
    Rate   = 3,
    Amount = 4,
    COUNT  = 5
};

// Line items of the invoice being edited
class LineItemModel : public QAbstractTableModel
{
    Q_OBJECT

public:
    explicit LineItemModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation,
                        int role = Qt::DisplayRole) const override;

    void appendItem(const LineItem &item);

    // Remove the given source rows; order and duplicates do not matter
    void removeItems(QList<int> rows);

    void setItems(const QVector<LineItem> &items);
    void clear();

    const QVector<LineItem> &items() const { return m_items; }
    bool isEmpty() const { return m_items.isEmpty(); }

signals:
    void itemsChanged();

private:
    QVector<LineItem> m_items;
    QStringList       m_headers;
};
