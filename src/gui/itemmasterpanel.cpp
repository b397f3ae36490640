#include "itemmasterpanel.h"
#include "invoice.h"
#include "invoicestore.h"

#include <QDialog>
#include <QDialogButtonBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QIcon>
#include <QItemSelectionModel>
#include <QLineEdit>
#include <QMessageBox>
#include <QPushButton>
#include <QStandardItemModel>
#include <QTableView>
#include <QVBoxLayout>

enum ItemMasterColumn { ColId = 0, ColName, ColRate, ColCount };

ItemMasterPanel::ItemMasterPanel(InvoiceStore *store, QWidget *parent)
    : QWidget(parent)
    , m_store(store)
    , m_model(new QStandardItemModel(0, ColCount, this))
    , m_tableView(new QTableView(this))
    , m_editBtn(nullptr)
    , m_deleteBtn(nullptr)
{
    m_model->setHorizontalHeaderLabels({tr("ID"), tr("Item Name"), tr("Default Rate")});

    m_tableView->setModel(m_model);
    m_tableView->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_tableView->setSelectionMode(QAbstractItemView::SingleSelection);
    m_tableView->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_tableView->setAlternatingRowColors(true);
    m_tableView->verticalHeader()->hide();
    m_tableView->horizontalHeader()->setSectionResizeMode(ColName, QHeaderView::Stretch);

    auto *addBtn = new QPushButton(QIcon::fromTheme(QStringLiteral("list-add")), tr("Add"), this);
    m_editBtn    = new QPushButton(QIcon::fromTheme(QStringLiteral("document-edit")), tr("Edit"), this);
    m_deleteBtn  = new QPushButton(QIcon::fromTheme(QStringLiteral("edit-delete")), tr("Delete"), this);

    auto *btnRow = new QHBoxLayout;
    btnRow->addWidget(addBtn);
    btnRow->addWidget(m_editBtn);
    btnRow->addWidget(m_deleteBtn);
    btnRow->addStretch();

    auto *mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(4, 4, 4, 4);
    mainLayout->addWidget(m_tableView, 1);
    mainLayout->addLayout(btnRow);

    connect(addBtn, &QPushButton::clicked, this, &ItemMasterPanel::onAdd);
    connect(m_editBtn, &QPushButton::clicked, this, &ItemMasterPanel::onEdit);
    connect(m_deleteBtn, &QPushButton::clicked, this, &ItemMasterPanel::onDelete);
    connect(m_tableView, &QTableView::doubleClicked, this, &ItemMasterPanel::onEdit);
    connect(m_store, &InvoiceStore::itemMasterChanged, this, &ItemMasterPanel::reload);

    // Edit and Delete need a selected row
    connect(m_tableView->selectionModel(), &QItemSelectionModel::selectionChanged,
            this, [this]() {
                const bool hasRow = selectedRow() >= 0;
                m_editBtn->setEnabled(hasRow);
                m_deleteBtn->setEnabled(hasRow);
            });

    reload();
}

void ItemMasterPanel::reload()
{
    const QVector<MasterItem> items = m_store->masterItems();

    m_model->removeRows(0, m_model->rowCount());
    for (const MasterItem &item : items) {
        auto *idItem = new QStandardItem(QString::number(item.id));
        idItem->setData(item.id, Qt::UserRole);
        auto *rateItem = new QStandardItem(InvoiceMath::formatMoney(item.defaultRate));
        rateItem->setData(item.defaultRate, Qt::UserRole);
        rateItem->setTextAlignment(Qt::AlignRight | Qt::AlignVCenter);
        m_model->appendRow({idItem, new QStandardItem(item.name), rateItem});
    }
    m_editBtn->setEnabled(false);
    m_deleteBtn->setEnabled(false);
}

int ItemMasterPanel::selectedRow() const
{
    const QModelIndexList rows = m_tableView->selectionModel()->selectedRows();
    return rows.isEmpty() ? -1 : rows.first().row();
}

bool ItemMasterPanel::promptForItem(const QString &title, QString &name, double &rate)
{
    QDialog dialog(this);
    dialog.setWindowTitle(title);

    auto *nameEdit = new QLineEdit(name, &dialog);
    auto *rateSpin = new QDoubleSpinBox(&dialog);
    rateSpin->setDecimals(2);
    rateSpin->setRange(0.0, 1e9);
    rateSpin->setValue(rate);

    auto *buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, &dialog);
    connect(buttons, &QDialogButtonBox::accepted, &dialog, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, &dialog, &QDialog::reject);

    auto *form = new QFormLayout(&dialog);
    form->addRow(tr("Item name:"), nameEdit);
    form->addRow(tr("Default rate:"), rateSpin);
    form->addRow(buttons);

    while (dialog.exec() == QDialog::Accepted) {
        if (nameEdit->text().trimmed().isEmpty()) {
            QMessageBox::warning(this, title, tr("Item name required"));
            continue;
        }
        name = nameEdit->text().trimmed();
        rate = rateSpin->value();
        return true;
    }
    return false;
}

void ItemMasterPanel::onAdd()
{
    QString name;
    double rate = 0.0;
    if (!promptForItem(tr("Add Item"), name, rate))
        return;

    if (!m_store->addMasterItem(name, rate)) {
        if (m_store->lastErrorKind() == StoreError::Duplicate)
            QMessageBox::critical(this, tr("Exists"), tr("Item already exists"));
        else
            QMessageBox::critical(this, tr("Add Item"), m_store->lastError());
    }
}

void ItemMasterPanel::onEdit()
{
    const int row = selectedRow();
    if (row < 0)
        return;

    const qint64 id = m_model->item(row, ColId)->data(Qt::UserRole).toLongLong();
    QString name = m_model->item(row, ColName)->text();
    double rate = m_model->item(row, ColRate)->data(Qt::UserRole).toDouble();
    if (!promptForItem(tr("Edit Item"), name, rate))
        return;

    if (!m_store->updateMasterItem(id, name, rate)) {
        if (m_store->lastErrorKind() == StoreError::Duplicate)
            QMessageBox::critical(this, tr("Exists"), tr("Item already exists"));
        else
            QMessageBox::critical(this, tr("Edit Item"), m_store->lastError());
    }
}

void ItemMasterPanel::onDelete()
{
    const int row = selectedRow();
    if (row < 0)
        return;

    const qint64 id = m_model->item(row, ColId)->data(Qt::UserRole).toLongLong();
    const QString name = m_model->item(row, ColName)->text();
    if (QMessageBox::question(this, tr("Delete"), tr("Delete '%1'?").arg(name))
        != QMessageBox::Yes)
        return;

    if (!m_store->deleteMasterItem(id))
        QMessageBox::critical(this, tr("Delete"), m_store->lastError());
}
