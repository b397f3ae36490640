#include "invoicelistview.h"
#include "invoicelistmodel.h"

#include <QTableView>
#include <QLineEdit>
#include <QLabel>
#include <QPushButton>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QIcon>
#include <QSortFilterProxyModel>
#include <QMessageBox>

InvoiceListView::InvoiceListView(InvoiceStore *store, QWidget *parent)
    : QWidget(parent)
    , m_model(new InvoiceListModel(store, this))
    , m_proxyModel(new QSortFilterProxyModel(this))
    , m_tableView(new QTableView(this))
    , m_filterEdit(new QLineEdit(this))
    , m_countLabel(new QLabel(this))
{
    // --- Filter bar ---
    m_filterEdit->setPlaceholderText(tr("Filter by chalan, party, city or date..."));
    m_filterEdit->setClearButtonEnabled(true);

    auto *refreshBtn = new QPushButton(QIcon::fromTheme(QStringLiteral("view-refresh")),
                                       tr("Refresh"), this);

    QHBoxLayout *filterLayout = new QHBoxLayout();
    filterLayout->addWidget(new QLabel(tr("Filter:"), this));
    filterLayout->addWidget(m_filterEdit, 1);
    filterLayout->addWidget(m_countLabel);
    filterLayout->addWidget(refreshBtn);

    // --- Proxy model for filtering and sorting ---
    m_proxyModel->setSourceModel(m_model);
    m_proxyModel->setFilterCaseSensitivity(Qt::CaseInsensitive);
    m_proxyModel->setFilterKeyColumn(-1); // search all columns
    m_proxyModel->setSortRole(Qt::UserRole);

    // --- Table view ---
    m_tableView->setModel(m_proxyModel);
    m_tableView->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_tableView->setSelectionMode(QAbstractItemView::SingleSelection);
    m_tableView->setAlternatingRowColors(true);
    m_tableView->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_tableView->verticalHeader()->hide();
    m_tableView->horizontalHeader()->setSectionResizeMode(QHeaderView::Interactive);
    m_tableView->horizontalHeader()->setSectionResizeMode(
        static_cast<int>(InvoiceListColumn::Party), QHeaderView::Stretch);
    m_tableView->setSortingEnabled(true);
    m_tableView->sortByColumn(static_cast<int>(InvoiceListColumn::ChalanNo), Qt::DescendingOrder);
    m_tableView->setToolTip(tr("Double-click an invoice to open it"));

    // --- Main layout ---
    QVBoxLayout *mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(4, 4, 4, 4);
    mainLayout->addLayout(filterLayout);
    mainLayout->addWidget(m_tableView, 1);
    setLayout(mainLayout);

    // --- Connections ---
    connect(m_filterEdit, &QLineEdit::textChanged,
            this, &InvoiceListView::onFilterChanged);
    connect(m_model, &InvoiceListModel::loadError,
            this, &InvoiceListView::onModelLoadError);
    connect(m_model, &QAbstractItemModel::modelReset,
            this, &InvoiceListView::updateCountLabel);
    connect(m_tableView, &QTableView::doubleClicked,
            this, &InvoiceListView::onActivated);
    connect(refreshBtn, &QPushButton::clicked,
            this, &InvoiceListView::reload);

    // The model has already read the store by now
    m_tableView->resizeColumnsToContents();
    updateCountLabel();
}

void InvoiceListView::reload()
{
    m_model->reload();
    m_tableView->resizeColumnsToContents();
    emit statusMessage(tr("%1 invoices").arg(m_model->rowCount()));
}

int InvoiceListView::invoiceCount() const
{
    return m_model->rowCount();
}

void InvoiceListView::updateCountLabel()
{
    if (m_proxyModel->rowCount() == m_model->rowCount())
        m_countLabel->setText(tr("%1 invoices").arg(m_model->rowCount()));
    else
        m_countLabel->setText(tr("%1 of %2 invoices")
                                  .arg(m_proxyModel->rowCount())
                                  .arg(m_model->rowCount()));
}

void InvoiceListView::onFilterChanged(const QString &text)
{
    m_proxyModel->setFilterFixedString(text);
    updateCountLabel();
}

void InvoiceListView::onModelLoadError(const QString &message)
{
    QMessageBox::warning(this, tr("Invoices"), message);
}

void InvoiceListView::onActivated(const QModelIndex &proxyIndex)
{
    if (!proxyIndex.isValid())
        return;

    const QModelIndex source = m_proxyModel->mapToSource(proxyIndex);
    if (source.isValid())
        emit openInvoiceRequested(m_model->summaryAt(source.row()).chalanNo);
}
