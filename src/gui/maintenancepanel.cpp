#include "maintenancepanel.h"
#include "appconfig.h"
#include "csvexchange.h"
#include "invoicestore.h"

#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QGroupBox>
#include <QLabel>
#include <QPushButton>
#include <QPlainTextEdit>
#include <QScrollArea>
#include <QFileDialog>
#include <QMessageBox>
#include <QDir>
#include <QFileInfo>
#include <QFont>
#include <QIcon>
#include <QDateTime>

// ============================================================================
//  Construction
// ============================================================================

MaintenancePanel::MaintenancePanel(InvoiceStore *store, AppConfig *config, QWidget *parent)
    : QWidget(parent)
    , m_store(store)
    , m_config(config)
{
    buildUi();
}

// ============================================================================
//  UI Construction
// ============================================================================

void MaintenancePanel::buildUi()
{
    // --- Top-level: scroll area wrapping everything -------------------------
    auto *outerLayout = new QVBoxLayout(this);
    outerLayout->setContentsMargins(0, 0, 0, 0);

    auto *scrollArea = new QScrollArea;
    scrollArea->setWidgetResizable(true);
    scrollArea->setFrameShape(QFrame::NoFrame);

    auto *scrollWidget = new QWidget;
    auto *mainLayout   = new QVBoxLayout(scrollWidget);

    // --- Operation group boxes ---------------------------------------------
    mainLayout->addWidget(createCsvGroup());
    mainLayout->addWidget(createBackupGroup());
    mainLayout->addWidget(createCounterGroup());

    // --- Log output area ---------------------------------------------------
    m_clearLogBtn = new QPushButton(tr("Clear Log"));
    mainLayout->addWidget(m_clearLogBtn);

    m_logOutput = new QPlainTextEdit;
    m_logOutput->setReadOnly(true);
    m_logOutput->setMaximumBlockCount(5000);
    QFont monoFont(QStringLiteral("Monospace"));
    monoFont.setStyleHint(QFont::Monospace);
    monoFont.setPointSize(9);
    m_logOutput->setFont(monoFont);
    m_logOutput->setMinimumHeight(200);
    mainLayout->addWidget(m_logOutput, 1);  // log takes the extra space

    connect(m_clearLogBtn, &QPushButton::clicked,
            m_logOutput, &QPlainTextEdit::clear);

    scrollArea->setWidget(scrollWidget);
    outerLayout->addWidget(scrollArea);
}

// ---------------------------------------------------------------------------
//  CSV group
// ---------------------------------------------------------------------------
QGroupBox *MaintenancePanel::createCsvGroup()
{
    auto *group  = new QGroupBox(tr("CSV Exchange"));
    auto *layout = new QVBoxLayout(group);

    auto *desc = new QLabel(
        tr("Export writes every invoice to the chosen file and every item to "
           "a second file named <name>_items.csv beside it.  Import reads such "
           "a pair back; invoices whose chalan number already exists are skipped."));
    desc->setWordWrap(true);
    desc->setTextFormat(Qt::PlainText);
    layout->addWidget(desc);

    auto *btnRow = new QHBoxLayout;
    auto *exportBtn = new QPushButton(QIcon::fromTheme(QStringLiteral("document-export")),
                                      tr("Export CSV…"));
    auto *importBtn = new QPushButton(QIcon::fromTheme(QStringLiteral("document-import")),
                                      tr("Import CSV…"));
    btnRow->addStretch();
    btnRow->addWidget(exportBtn);
    btnRow->addWidget(importBtn);
    layout->addLayout(btnRow);

    connect(exportBtn, &QPushButton::clicked, this, &MaintenancePanel::exportCsv);
    connect(importBtn, &QPushButton::clicked, this, &MaintenancePanel::importCsv);

    return group;
}

// ---------------------------------------------------------------------------
//  Backup group
// ---------------------------------------------------------------------------
QGroupBox *MaintenancePanel::createBackupGroup()
{
    auto *group  = new QGroupBox(tr("Backup Database"));
    auto *layout = new QVBoxLayout(group);

    auto *desc = new QLabel(
        tr("Copies the invoice database to invoices_backup_<date>_<time>.db "
           "in a folder of your choice."));
    desc->setWordWrap(true);
    desc->setTextFormat(Qt::PlainText);
    layout->addWidget(desc);

    auto *btnRow = new QHBoxLayout;
    auto *backupBtn = new QPushButton(QIcon::fromTheme(QStringLiteral("document-save-as")),
                                      tr("Backup…"));
    btnRow->addStretch();
    btnRow->addWidget(backupBtn);
    layout->addLayout(btnRow);

    connect(backupBtn, &QPushButton::clicked, this, &MaintenancePanel::backupDatabase);

    return group;
}

// ---------------------------------------------------------------------------
//  Counter group
// ---------------------------------------------------------------------------
QGroupBox *MaintenancePanel::createCounterGroup()
{
    auto *group  = new QGroupBox(tr("Chalan Counter"));
    auto *layout = new QVBoxLayout(group);

    auto *desc = new QLabel(
        tr("Restart chalan numbering at 1.  Saving an invoice under a number "
           "that is already stored will fail."));
    desc->setWordWrap(true);
    layout->addWidget(desc);

    auto *btnRow = new QHBoxLayout;
    auto *resetBtn = new QPushButton(QIcon::fromTheme(QStringLiteral("edit-undo")),
                                     tr("Reset Counter…"));
    btnRow->addStretch();
    btnRow->addWidget(resetBtn);
    layout->addLayout(btnRow);

    connect(resetBtn, &QPushButton::clicked, this, &MaintenancePanel::resetCounter);

    return group;
}

// ============================================================================
//  Operations
// ============================================================================

void MaintenancePanel::exportCsv()
{
    QString path = QFileDialog::getSaveFileName(
        this, tr("Export invoices to CSV"),
        QDir::home().absoluteFilePath(QStringLiteral("invoices.csv")),
        tr("CSV Files (*.csv)"));
    if (path.isEmpty())
        return;
    if (QFileInfo(path).suffix().isEmpty())
        path += QStringLiteral(".csv");

    logStatus(QStringLiteral("=== Export CSV ==="));

    CsvExchange exchange(m_store);
    const std::optional<CsvExportResult> result = exchange.exportInvoices(path);
    if (!result) {
        logStatus(QStringLiteral("ERROR: %1").arg(exchange.lastError()));
        QMessageBox::critical(this, tr("Export Failed"), exchange.lastError());
        return;
    }

    logStatus(QStringLiteral("Invoices (%1) -> %2").arg(result->invoiceCount).arg(result->invoicesPath));
    logStatus(QStringLiteral("Items (%1) -> %2").arg(result->itemCount).arg(result->itemsPath));
    QMessageBox::information(this, tr("Exported"),
                             tr("Invoices -> %1\nItems -> %2")
                                 .arg(result->invoicesPath, result->itemsPath));
    emit statusMessage(tr("Exported %1 invoices").arg(result->invoiceCount));
}

void MaintenancePanel::importCsv()
{
    const QString invoicesCsv = QFileDialog::getOpenFileName(
        this, tr("Select invoices CSV"), QDir::homePath(),
        tr("CSV Files (*.csv);;All Files (*)"));
    if (invoicesCsv.isEmpty())
        return;

    QString itemsGuess = CsvExchange::itemsPathFor(invoicesCsv);
    if (!QFileInfo::exists(itemsGuess))
        itemsGuess = QFileInfo(invoicesCsv).absolutePath();

    const QString itemsCsv = QFileDialog::getOpenFileName(
        this, tr("Select invoice_items CSV"), itemsGuess,
        tr("CSV Files (*.csv);;All Files (*)"));
    if (itemsCsv.isEmpty())
        return;

    logStatus(QStringLiteral("=== Import CSV ==="));
    logStatus(QStringLiteral("Invoices: %1").arg(invoicesCsv));
    logStatus(QStringLiteral("Items:    %1").arg(itemsCsv));

    CsvExchange exchange(m_store);
    const int count = exchange.importInvoices(invoicesCsv, itemsCsv);
    if (count < 0) {
        logStatus(QStringLiteral("ERROR: %1").arg(exchange.lastError()));
        QMessageBox::critical(this, tr("Import Failed"), exchange.lastError());
        return;
    }

    logStatus(QStringLiteral("Imported %1 invoices, skipped %2.")
                  .arg(count).arg(exchange.skippedCount()));
    QMessageBox::information(this, tr("Imported"),
                             tr("Imported %1 invoices (skipped duplicates)").arg(count));
    emit statusMessage(tr("Imported %1 invoices").arg(count));
}

void MaintenancePanel::backupDatabase()
{
    const QString folder = QFileDialog::getExistingDirectory(
        this, tr("Select backup folder"), m_config->backupDir(),
        QFileDialog::ShowDirsOnly | QFileDialog::DontResolveSymlinks);
    if (folder.isEmpty())
        return;

    logStatus(QStringLiteral("=== Backup ==="));

    const QString dest = m_store->backupTo(folder);
    if (dest.isEmpty()) {
        logStatus(QStringLiteral("ERROR: %1").arg(m_store->lastError()));
        QMessageBox::critical(this, tr("Backup Failed"), m_store->lastError());
        return;
    }

    logStatus(QStringLiteral("Backup saved to %1").arg(dest));
    QMessageBox::information(this, tr("Backup"), tr("Backup saved to %1").arg(dest));
    emit statusMessage(tr("Backup saved"));
}

void MaintenancePanel::resetCounter()
{
    if (QMessageBox::question(this, tr("Reset Counter"),
                              tr("Are you sure you want to reset Chalan counter to 1?"))
        != QMessageBox::Yes)
        return;

    logStatus(QStringLiteral("=== Reset Counter ==="));

    if (!m_store->resetChalanCounter(0)) {
        logStatus(QStringLiteral("ERROR: %1").arg(m_store->lastError()));
        QMessageBox::critical(this, tr("Reset Counter"), m_store->lastError());
        return;
    }

    logStatus(QStringLiteral("Counter reset; next chalan is 1."));
    emit counterReset();
}

// ============================================================================
//  Helpers
// ============================================================================

void MaintenancePanel::logStatus(const QString &message)
{
    QString timestamp = QDateTime::currentDateTime().toString(QStringLiteral("hh:mm:ss"));
    m_logOutput->appendPlainText(QStringLiteral("[%1] %2").arg(timestamp, message));
}
