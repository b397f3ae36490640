#include "lineitemmodel.h"

#include <algorithm>
#include <functional>

LineItemModel::LineItemModel(QObject *parent)
    : QAbstractTableModel(parent)
{
    m_headers = {
        tr("SR"), tr("ITEM"), tr("QTY"), tr("RATE"), tr("AMOUNT")
    };
}

int LineItemModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return m_items.size();
}

int LineItemModel::columnCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return static_cast<int>(LineItemColumn::COUNT);
}

QVariant LineItemModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= m_items.size())
        return QVariant();

    const LineItem &item = m_items.at(index.row());
    const auto col = static_cast<LineItemColumn>(index.column());

    if (role == Qt::DisplayRole) {
        switch (col) {
        case LineItemColumn::Sr:     return index.row() + 1;
        case LineItemColumn::Item:   return item.name;
        case LineItemColumn::Qty:    return InvoiceMath::formatQuantity(item.qty);
        case LineItemColumn::Rate:   return InvoiceMath::formatMoney(item.rate);
        case LineItemColumn::Amount: return InvoiceMath::formatMoney(item.amount());
        default:                     return QVariant();
        }
    }

    // Everything but the item name is right aligned
    if (role == Qt::TextAlignmentRole) {
        if (col == LineItemColumn::Item)
            return QVariant::fromValue(Qt::AlignLeft | Qt::AlignVCenter);
        return QVariant::fromValue(Qt::AlignRight | Qt::AlignVCenter);
    }

    return QVariant();
}

QVariant LineItemModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (role != Qt::DisplayRole) return QVariant();
    if (orientation == Qt::Horizontal && section < m_headers.size())
        return m_headers.at(section);
    return QVariant();
}

void LineItemModel::appendItem(const LineItem &item)
{
    const int row = m_items.size();
    beginInsertRows(QModelIndex(), row, row);
    m_items.append(item);
    endInsertRows();
    emit itemsChanged();
}

void LineItemModel::removeItems(QList<int> rows)
{
    if (rows.isEmpty())
        return;

    // Highest row first so earlier removals don't shift later ones
    std::sort(rows.begin(), rows.end(), std::greater<int>());
    rows.erase(std::unique(rows.begin(), rows.end()), rows.end());

    for (int row : rows) {
        if (row < 0 || row >= m_items.size())
            continue;
        beginRemoveRows(QModelIndex(), row, row);
        m_items.removeAt(row);
        endRemoveRows();
    }

    // Sr column is positional
    if (!m_items.isEmpty())
        emit dataChanged(index(0, 0), index(m_items.size() - 1, 0));
    emit itemsChanged();
}

void LineItemModel::setItems(const QVector<LineItem> &items)
{
    beginResetModel();
    m_items = items;
    endResetModel();
    emit itemsChanged();
}

void LineItemModel::clear()
{
    setItems({});
}
