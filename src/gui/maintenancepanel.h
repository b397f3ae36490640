#pragma once

#include <QWidget>
#include <QString>

class QPlainTextEdit;
class QPushButton;
class QGroupBox;
class AppConfig;
class InvoiceStore;

///
/// MaintenancePanel: GUI panel for the database housekeeping operations.
///
/// Operations:
///   1. Export CSV     : all invoices plus a sibling <name>_items.csv
///   2. Import CSV     : invoices and items, duplicates skipped
///   3. Backup         : copy invoices.db to a timestamped file
///   4. Reset counter  : next chalan number becomes 1
///
/// Every operation reports to a shared, timestamped log at the bottom of
/// the panel.  The File and Admin menu entries call the same public slots,
/// so results show up here whichever way the operation was started.
///
class MaintenancePanel : public QWidget
{
    Q_OBJECT

public:
    MaintenancePanel(InvoiceStore *store, AppConfig *config, QWidget *parent = nullptr);

public slots:
    void exportCsv();
    void importCsv();
    void backupDatabase();
    void resetCounter();

    /// Append a timestamped line to the log.
    void logStatus(const QString &message);

signals:
    /// The counter was reset; the invoice form should take a new number.
    void counterReset();
    void statusMessage(const QString &message);

private:
    // --- UI construction helpers -------------------------------------------
    void buildUi();
    QGroupBox *createCsvGroup();
    QGroupBox *createBackupGroup();
    QGroupBox *createCounterGroup();

    // --- Members -----------------------------------------------------------
    InvoiceStore *m_store  = nullptr;
    AppConfig    *m_config = nullptr;

    // Shared log area
    QPlainTextEdit *m_logOutput   = nullptr;
    QPushButton    *m_clearLogBtn = nullptr;
};
