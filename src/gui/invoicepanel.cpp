#include "invoicepanel.h"
#include "appconfig.h"
#include "chalan_debug.h"
#include "invoicestore.h"
#include "lineitemmodel.h"
#include "pdfexporter.h"

#include <QComboBox>
#include <QDate>
#include <QDesktopServices>
#include <QDir>
#include <QFont>
#include <QGridLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QIcon>
#include <QInputDialog>
#include <QItemSelectionModel>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QPushButton>
#include <QTableView>
#include <QUrl>
#include <QVBoxLayout>

#include <climits>

// ============================================================================
//  Construction
// ============================================================================

InvoicePanel::InvoicePanel(InvoiceStore *store, AppConfig *config, QWidget *parent)
    : QWidget(parent)
    , m_store(store)
    , m_config(config)
    , m_items(new LineItemModel(this))
{
    buildUi();

    connect(m_items, &LineItemModel::itemsChanged,
            this, &InvoicePanel::recomputeTotals);
    connect(m_store, &InvoiceStore::itemMasterChanged,
            this, &InvoicePanel::refreshItemNames);

    refreshItemNames();
    recomputeTotals();
}

void InvoicePanel::buildUi()
{
    auto *mainLayout = new QVBoxLayout(this);

    // --- Invoice details ---------------------------------------------------
    auto *details = new QGroupBox(tr("Invoice Details"));
    auto *grid = new QGridLayout(details);

    m_chalanLabel = new QLabel;
    QFont bold = m_chalanLabel->font();
    bold.setBold(true);
    m_chalanLabel->setFont(bold);

    m_partyEdit = new QLineEdit;
    m_cityEdit  = new QLineEdit;
    m_lrEdit    = new QLineEdit;
    m_dateEdit  = new QLineEdit;
    m_dateEdit->setPlaceholderText(tr("Today"));

    grid->addWidget(m_chalanLabel, 0, 0, 1, 2);
    grid->addWidget(new QLabel(tr("Date")), 0, 2, Qt::AlignRight);
    grid->addWidget(m_dateEdit, 0, 3);
    grid->addWidget(new QLabel(tr("Party Name")), 1, 0, Qt::AlignRight);
    grid->addWidget(m_partyEdit, 1, 1);
    grid->addWidget(new QLabel(tr("City")), 1, 2, Qt::AlignRight);
    grid->addWidget(m_cityEdit, 1, 3);
    grid->addWidget(new QLabel(tr("L.R. No.")), 2, 0, Qt::AlignRight);
    grid->addWidget(m_lrEdit, 2, 1);
    grid->setColumnStretch(1, 2);
    grid->setColumnStretch(3, 1);
    mainLayout->addWidget(details);

    // --- Add item ----------------------------------------------------------
    auto *entry = new QGroupBox(tr("Add Item"));
    auto *entryRow = new QHBoxLayout(entry);

    m_itemCombo = new QComboBox;
    m_itemCombo->setEditable(true);
    m_itemCombo->setInsertPolicy(QComboBox::NoInsert);
    m_itemCombo->setMinimumWidth(260);
    m_qtyEdit  = new QLineEdit;
    m_qtyEdit->setMaximumWidth(90);
    m_rateEdit = new QLineEdit;
    m_rateEdit->setMaximumWidth(110);
    m_addBtn   = new QPushButton(QIcon::fromTheme(QStringLiteral("list-add")), tr("Add"));

    entryRow->addWidget(new QLabel(tr("Item Name")));
    entryRow->addWidget(m_itemCombo, 1);
    entryRow->addWidget(new QLabel(tr("Qty")));
    entryRow->addWidget(m_qtyEdit);
    entryRow->addWidget(new QLabel(tr("Rate")));
    entryRow->addWidget(m_rateEdit);
    entryRow->addWidget(m_addBtn);
    mainLayout->addWidget(entry);

    connect(m_addBtn, &QPushButton::clicked, this, &InvoicePanel::addItem);
    connect(m_rateEdit, &QLineEdit::returnPressed, this, &InvoicePanel::addItem);
    connect(m_itemCombo, QOverload<int>::of(&QComboBox::activated),
            this, &InvoicePanel::onMasterItemActivated);

    // --- Item table --------------------------------------------------------
    m_tableView = new QTableView;
    m_tableView->setModel(m_items);
    m_tableView->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_tableView->setSelectionMode(QAbstractItemView::ExtendedSelection);
    m_tableView->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_tableView->setAlternatingRowColors(true);
    m_tableView->verticalHeader()->hide();
    m_tableView->horizontalHeader()->setSectionResizeMode(
        static_cast<int>(LineItemColumn::Item), QHeaderView::Stretch);
    mainLayout->addWidget(m_tableView, 1);

    // --- Totals ------------------------------------------------------------
    auto *totals = new QGroupBox(tr("Totals"));
    auto *totalsRow = new QHBoxLayout(totals);

    m_taxEdit = new QLineEdit(QStringLiteral("0"));
    m_taxEdit->setMaximumWidth(80);
    m_pandfEdit = new QLineEdit(QStringLiteral("0"));
    m_pandfEdit->setMaximumWidth(100);
    m_subtotalLabel = new QLabel;
    m_taxAmtLabel   = new QLabel;
    m_grandLabel    = new QLabel;
    m_grandLabel->setFont(bold);

    totalsRow->addWidget(new QLabel(tr("Tax %")));
    totalsRow->addWidget(m_taxEdit);
    totalsRow->addWidget(new QLabel(tr("P & F")));
    totalsRow->addWidget(m_pandfEdit);
    totalsRow->addStretch();
    totalsRow->addWidget(new QLabel(tr("Sub Total")));
    totalsRow->addWidget(m_subtotalLabel);
    totalsRow->addSpacing(12);
    totalsRow->addWidget(new QLabel(tr("Tax Amount")));
    totalsRow->addWidget(m_taxAmtLabel);
    totalsRow->addSpacing(12);
    totalsRow->addWidget(new QLabel(tr("Grand Total")));
    totalsRow->addWidget(m_grandLabel);
    mainLayout->addWidget(totals);

    connect(m_taxEdit, &QLineEdit::textChanged, this, &InvoicePanel::recomputeTotals);
    connect(m_pandfEdit, &QLineEdit::textChanged, this, &InvoicePanel::recomputeTotals);
    connect(m_taxEdit, &QLineEdit::editingFinished, this, &InvoicePanel::normalizeChargeField);
    connect(m_pandfEdit, &QLineEdit::editingFinished, this, &InvoicePanel::normalizeChargeField);

    // --- Actions -----------------------------------------------------------
    auto *actions = new QHBoxLayout;
    m_deleteBtn = new QPushButton(QIcon::fromTheme(QStringLiteral("edit-delete")),
                                  tr("Delete Selected"));
    m_saveBtn   = new QPushButton(QIcon::fromTheme(QStringLiteral("document-save")),
                                  tr("Save Invoice"));
    m_pdfBtn    = new QPushButton(QIcon::fromTheme(QStringLiteral("application-pdf")),
                                  tr("Export PDF"));
    m_newBtn    = new QPushButton(QIcon::fromTheme(QStringLiteral("document-new")),
                                  tr("New Invoice"));
    actions->addWidget(m_deleteBtn);
    actions->addWidget(m_saveBtn);
    actions->addWidget(m_pdfBtn);
    actions->addStretch();
    actions->addWidget(m_newBtn);
    mainLayout->addLayout(actions);

    connect(m_deleteBtn, &QPushButton::clicked, this, &InvoicePanel::deleteSelected);
    connect(m_saveBtn, &QPushButton::clicked, this, &InvoicePanel::saveInvoice);
    connect(m_pdfBtn, &QPushButton::clicked, this, &InvoicePanel::exportPdf);
    connect(m_newBtn, &QPushButton::clicked, this, [this]() { startNewInvoice(true); });
}

// ============================================================================
//  Form state
// ============================================================================

QString InvoicePanel::today() const
{
    return QDate::currentDate().toString(m_dateFormat);
}

void InvoicePanel::setDateFormat(const QString &format)
{
    if (!format.trimmed().isEmpty())
        m_dateFormat = format.trimmed();
}

void InvoicePanel::setDefaultTaxPercent(double percent)
{
    m_defaultTaxPercent = percent;
}

void InvoicePanel::updateChalanLabel()
{
    m_chalanLabel->setText(tr("Chalan No: %1").arg(m_chalanNo));
}

void InvoicePanel::clearForm()
{
    m_items->clear();
    m_partyEdit->clear();
    m_cityEdit->clear();
    m_lrEdit->clear();
    m_dateEdit->setText(today());
    m_taxEdit->setText(QString::number(m_defaultTaxPercent, 'g', 6));
    m_pandfEdit->setText(QStringLiteral("0"));
    m_itemCombo->setCurrentText(QString());
    m_qtyEdit->clear();
    m_rateEdit->clear();
}

void InvoicePanel::startNewInvoice(bool announce)
{
    clearForm();

    const int next = m_store->nextChalanNumber();
    if (next <= 0) {
        QMessageBox::critical(this, tr("New Invoice"),
                              tr("Could not take the next chalan number:\n%1")
                                  .arg(m_store->lastError()));
        return;
    }
    m_chalanNo = next;
    updateChalanLabel();
    qCDebug(CHALAN_GUI) << "Editing new chalan" << m_chalanNo;

    if (announce)
        QMessageBox::information(this, tr("New Invoice"), tr("Chalan No: %1").arg(m_chalanNo));
    emit statusMessage(tr("New invoice, chalan %1").arg(m_chalanNo));
}

bool InvoicePanel::loadInvoice(int chalanNo)
{
    std::optional<Invoice> invoice = m_store->invoiceByChalan(chalanNo);
    if (!invoice) {
        if (m_store->lastErrorKind() == StoreError::NotFound)
            QMessageBox::critical(this, tr("Not found"),
                                  tr("No invoice with chalan %1").arg(chalanNo));
        else
            QMessageBox::critical(this, tr("Open Invoice"), m_store->lastError());
        return false;
    }

    m_chalanNo = invoice->chalanNo;
    m_partyEdit->setText(invoice->partyName);
    m_cityEdit->setText(invoice->city);
    m_lrEdit->setText(invoice->lrNo);
    m_dateEdit->setText(invoice->date);
    m_taxEdit->setText(QString::number(invoice->taxPercent, 'g', 6));
    m_pandfEdit->setText(QString::number(invoice->packingForwarding, 'g', 10));
    m_items->setItems(invoice->items);
    updateChalanLabel();

    emit statusMessage(tr("Opened chalan %1").arg(m_chalanNo));
    return true;
}

void InvoicePanel::openInvoiceDialog()
{
    bool ok = false;
    const int chalanNo = QInputDialog::getInt(this, tr("Open Invoice"), tr("Enter chalan no"),
                                              m_chalanNo > 0 ? m_chalanNo : 1,
                                              0, INT_MAX, 1, &ok);
    if (ok)
        loadInvoice(chalanNo);
}

Invoice InvoicePanel::currentInvoice() const
{
    Invoice invoice;
    invoice.chalanNo  = m_chalanNo;
    invoice.partyName = m_partyEdit->text().trimmed();
    invoice.city      = m_cityEdit->text().trimmed();
    invoice.lrNo      = m_lrEdit->text().trimmed();
    invoice.date      = m_dateEdit->text().trimmed();
    if (invoice.date.isEmpty())
        invoice.date = today();
    invoice.taxPercent        = InvoiceMath::parseChargeOrZero(m_taxEdit->text());
    invoice.packingForwarding = InvoiceMath::parseChargeOrZero(m_pandfEdit->text());
    invoice.items = m_items->items();
    return invoice;
}

// ============================================================================
//  Items
// ============================================================================

void InvoicePanel::refreshItemNames()
{
    const QString typed = m_itemCombo->currentText();
    m_itemCombo->blockSignals(true);
    m_itemCombo->clear();
    m_itemCombo->addItems(m_store->masterItemNames());
    m_itemCombo->setCurrentIndex(-1);
    m_itemCombo->setCurrentText(typed);
    m_itemCombo->blockSignals(false);
}

void InvoicePanel::onMasterItemActivated(int index)
{
    if (index < 0)
        return;
    const std::optional<double> rate = m_store->masterItemRate(m_itemCombo->itemText(index));
    if (rate)
        m_rateEdit->setText(InvoiceMath::formatMoney(*rate));
}

bool InvoicePanel::addItem()
{
    QString error;
    const std::optional<LineItem> item = InvoiceMath::parseLineItem(
        m_itemCombo->currentText(), m_qtyEdit->text(), m_rateEdit->text(), &error);
    if (!item) {
        QMessageBox::critical(this, tr("Invalid Input"), error);
        return false;
    }

    m_items->appendItem(*item);

    if (!m_store->rememberItemRate(item->name, item->rate))
        qCWarning(CHALAN_GUI) << "Could not update item master:" << m_store->lastError();

    m_itemCombo->setCurrentText(QString());
    m_qtyEdit->clear();
    m_rateEdit->clear();
    m_itemCombo->setFocus();
    return true;
}

bool InvoicePanel::addPendingItem()
{
    const bool complete = !m_itemCombo->currentText().trimmed().isEmpty()
        && !m_qtyEdit->text().trimmed().isEmpty()
        && !m_rateEdit->text().trimmed().isEmpty();
    return complete ? addItem() : true;
}

void InvoicePanel::deleteSelected()
{
    const QModelIndexList selected = m_tableView->selectionModel()->selectedRows();
    QList<int> rows;
    for (const QModelIndex &idx : selected)
        rows << idx.row();
    m_items->removeItems(rows);
}

// ============================================================================
//  Totals
// ============================================================================

void InvoicePanel::recomputeTotals()
{
    const InvoiceTotals totals = InvoiceMath::computeTotals(
        m_items->items(),
        InvoiceMath::parseChargeOrZero(m_taxEdit->text()),
        InvoiceMath::parseChargeOrZero(m_pandfEdit->text()));

    m_subtotalLabel->setText(InvoiceMath::formatMoney(totals.subtotal));
    m_taxAmtLabel->setText(InvoiceMath::formatMoney(totals.taxAmount));
    m_grandLabel->setText(InvoiceMath::formatMoney(totals.grandTotal));
}

void InvoicePanel::normalizeChargeField()
{
    auto *edit = qobject_cast<QLineEdit *>(sender());
    if (!edit)
        return;
    bool ok = true;
    InvoiceMath::parseChargeOrZero(edit->text(), &ok);
    if (!ok)
        edit->setText(QStringLiteral("0"));
}

// ============================================================================
//  Save / export
// ============================================================================

bool InvoicePanel::saveInvoice()
{
    if (!addPendingItem())
        return false;

    if (m_items->isEmpty()) {
        QMessageBox::warning(this, tr("No items"), tr("Please add at least one item"));
        return false;
    }

    const Invoice invoice = currentInvoice();
    m_dateEdit->setText(invoice.date);

    const std::optional<SavedInvoice> saved = m_store->saveInvoice(invoice);
    if (!saved) {
        QMessageBox::critical(this, tr("Save Failed"), m_store->lastError());
        return false;
    }

    QMessageBox::information(this, tr("Saved"), tr("Invoice saved with ID #%1").arg(saved->id));
    emit statusMessage(tr("Saved chalan %1, grand total %2")
                           .arg(invoice.chalanNo)
                           .arg(InvoiceMath::formatMoney(saved->totals.grandTotal)));
    return true;
}

bool InvoicePanel::exportPdf()
{
    if (!addPendingItem())
        return false;

    if (m_items->isEmpty()) {
        QMessageBox::warning(this, tr("No items"), tr("Please add at least one item"));
        return false;
    }

    const Invoice invoice = currentInvoice();
    m_dateEdit->setText(invoice.date);

    const QString path = QDir(m_config->pdfDir())
                             .absoluteFilePath(InvoiceMath::defaultPdfFileName(invoice.chalanNo));

    InvoicePdfExporter exporter;
    if (!exporter.exportInvoice(invoice, invoice.totals(), m_store->companyProfile(), path)) {
        QMessageBox::critical(this, tr("PDF Error"), exporter.lastError());
        return false;
    }

    if (m_config->openPdfAfterExport()
        && !QDesktopServices::openUrl(QUrl::fromLocalFile(path))) {
        qCWarning(CHALAN_GUI) << "No viewer opened" << path;
    }

    QMessageBox::information(this, tr("PDF Exported"), tr("Saved to: %1").arg(path));
    emit statusMessage(tr("Exported %1").arg(path));
    return true;
}
