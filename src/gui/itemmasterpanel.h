#pragma once

#include <QWidget>

class QStandardItemModel;
class QTableView;
class QPushButton;
class InvoiceStore;

///
/// ItemMasterPanel: maintain the list of known items and their default
/// rates.  Rates are also updated implicitly whenever an item is added to
/// an invoice, so this panel is mostly for renaming and clean-up.
///
class ItemMasterPanel : public QWidget
{
    Q_OBJECT

public:
    explicit ItemMasterPanel(InvoiceStore *store, QWidget *parent = nullptr);

public slots:
    void reload();

private slots:
    void onAdd();
    void onEdit();
    void onDelete();

private:
    /// Ask for a name and rate.  Returns false when cancelled.
    bool promptForItem(const QString &title, QString &name, double &rate);

    /// Row of the single selected item, or -1
    int selectedRow() const;

    InvoiceStore       *m_store;
    QStandardItemModel *m_model;
    QTableView         *m_tableView;
    QPushButton        *m_editBtn;
    QPushButton        *m_deleteBtn;
};
