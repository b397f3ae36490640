#pragma once

#include <QWidget>

class QTableView;
class QLineEdit;
class QLabel;
class QSortFilterProxyModel;
class InvoiceListModel;
class InvoiceStore;

// History of saved invoices with a text filter; double-click opens one
class InvoiceListView : public QWidget
{
    Q_OBJECT

public:
    explicit InvoiceListView(InvoiceStore *store, QWidget *parent = nullptr);

    // Re-read the invoice list from the store
    void reload();

    int invoiceCount() const;

signals:
    void openInvoiceRequested(int chalanNo);
    void statusMessage(const QString &message);

private slots:
    void onFilterChanged(const QString &text);
    void onModelLoadError(const QString &message);
    void onActivated(const QModelIndex &proxyIndex);

private:
    void updateCountLabel();

    InvoiceListModel      *m_model;
    QSortFilterProxyModel *m_proxyModel;
    QTableView            *m_tableView;
    QLineEdit             *m_filterEdit;
    QLabel                *m_countLabel;
};
