#pragma once

#include "invoice.h"

#include <QWidget>
#include <QString>

class QComboBox;
class QLabel;
class QLineEdit;
class QPushButton;
class QTableView;
class AppConfig;
class InvoiceStore;
class LineItemModel;

///
/// InvoicePanel: the invoice editor.
///
/// Holds the chalan number the form will be saved under, the party
/// details, the line items and the live totals.  The chalan number is
/// taken from the store's counter when a new invoice is started, so every
/// opened form consumes a number whether or not it is saved.
///
/// Save and Export first add a fully typed pending item row, then
/// require at least one item.  An empty date is replaced by today.
///
class InvoicePanel : public QWidget
{
    Q_OBJECT

public:
    InvoicePanel(InvoiceStore *store, AppConfig *config, QWidget *parent = nullptr);

    int chalanNumber() const { return m_chalanNo; }

    /// The form contents as an invoice (date defaulted, charges parsed).
    Invoice currentInvoice() const;

    /// Replace the form with a stored invoice.  Shows "Not found" and
    /// returns false when the chalan does not exist.
    bool loadInvoice(int chalanNo);

    void setDateFormat(const QString &format);
    void setDefaultTaxPercent(double percent);

public slots:
    /// Clear the form and take the next chalan number.
    /// announce shows the "New Invoice" confirmation box.
    void startNewInvoice(bool announce = true);

    /// Ask for a chalan number and load it.
    void openInvoiceDialog();

    bool addItem();
    void deleteSelected();
    bool saveInvoice();
    bool exportPdf();

    /// Reload the item name suggestions from the item master.
    void refreshItemNames();

signals:
    void statusMessage(const QString &message);

private slots:
    void onMasterItemActivated(int index);
    void recomputeTotals();
    void normalizeChargeField();

private:
    void buildUi();
    void clearForm();
    void updateChalanLabel();

    /// Add the pending item row when all three inputs are filled.
    /// Returns false only when such a row failed validation.
    bool addPendingItem();

    QString today() const;

    InvoiceStore  *m_store  = nullptr;
    AppConfig     *m_config = nullptr;
    LineItemModel *m_items  = nullptr;

    int     m_chalanNo = 0;
    QString m_dateFormat = QStringLiteral("dd/MM/yyyy");
    double  m_defaultTaxPercent = 0.0;

    // Invoice details
    QLabel    *m_chalanLabel = nullptr;
    QLineEdit *m_partyEdit   = nullptr;
    QLineEdit *m_cityEdit    = nullptr;
    QLineEdit *m_lrEdit      = nullptr;
    QLineEdit *m_dateEdit    = nullptr;

    // Add item row
    QComboBox   *m_itemCombo = nullptr;
    QLineEdit   *m_qtyEdit   = nullptr;
    QLineEdit   *m_rateEdit  = nullptr;
    QPushButton *m_addBtn    = nullptr;

    QTableView *m_tableView = nullptr;

    // Totals
    QLineEdit *m_taxEdit       = nullptr;
    QLineEdit *m_pandfEdit     = nullptr;
    QLabel    *m_subtotalLabel = nullptr;
    QLabel    *m_taxAmtLabel   = nullptr;
    QLabel    *m_grandLabel    = nullptr;

    // Actions
    QPushButton *m_deleteBtn = nullptr;
    QPushButton *m_saveBtn   = nullptr;
    QPushButton *m_pdfBtn    = nullptr;
    QPushButton *m_newBtn    = nullptr;
};
