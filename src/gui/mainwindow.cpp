// mainwindow.cpp
// Chalan Qt GUI - Main Window Implementation (Dolphin-style sidebar layout)
// Copyright (c) 2026 Chalan Project

#include "mainwindow.h"
#include "appconfig.h"
#include "chalan_debug.h"
#include "chalansettings.h"
#include "invoicelistview.h"
#include "invoicepanel.h"
#include "invoicestore.h"
#include "itemmasterpanel.h"
#include "maintenancepanel.h"
#include "settingsdialog.h"

#include <KActionCollection>
#include <KStandardAction>
#include <KLocalizedString>

#include <QApplication>
#include <QHBoxLayout>
#include <QSplitter>
#include <QStatusBar>
#include <QAction>
#include <QFileInfo>
#include <QIcon>
#include <QKeySequence>
#include <QMessageBox>

// ═════════════════════════════════════════════════════════════
// Construction / Destruction
// ═════════════════════════════════════════════════════════════

MainWindow::MainWindow(QWidget *parent)
    : KXmlGuiWindow(parent)
    , m_sidebar(nullptr)
    , m_panelStack(nullptr)
    , m_invoicePanel(nullptr)
    , m_historyPanel(nullptr)
    , m_itemMasterPanel(nullptr)
    , m_maintenancePanel(nullptr)
    , m_statusLabel(nullptr)
    , m_databaseLabel(nullptr)
    , m_config(nullptr)
    , m_store(nullptr)
{
    setWindowTitle(i18n("Chalan"));

    // ── Load chalan.conf and open the database ──
    setupStore();

    // ── Build UI ──
    setupSidebar();
    setupPanels();
    setupStatusBar();
    setupActions();

    // Assemble main layout: sidebar | panel stack
    auto *centralWidget = new QWidget(this);
    auto *splitter = new QSplitter(Qt::Horizontal, centralWidget);

    splitter->addWidget(m_sidebar);
    splitter->addWidget(m_panelStack);

    splitter->setStretchFactor(0, 0);   // sidebar: don't stretch
    splitter->setStretchFactor(1, 1);   // panels: stretch to fill
    splitter->setSizes({160, 760});     // initial sizes in pixels

    auto *centralLayout = new QHBoxLayout(centralWidget);
    centralLayout->setContentsMargins(0, 0, 0, 0);
    centralLayout->addWidget(splitter);

    setCentralWidget(centralWidget);

    // Every session starts on a fresh chalan number
    applyInvoiceSettings();
    if (m_store->isOpen()) {
        m_invoicePanel->startNewInvoice(false);
    }
    updateDatabaseLabel();

    // Default to Invoice panel
    m_sidebar->setCurrentRow(PanelInvoice);

    // KXmlGuiWindow standard setup (menus, accelerators)
    setupGUI(Default, QStringLiteral("chalan-qtui.rc"));

    resize(1000, 700);
}

MainWindow::~MainWindow()
{
    // m_store is parented to this; AppConfig is not a QObject.
    delete m_config;
}

// ═════════════════════════════════════════════════════════════
// Configuration and store
// ═════════════════════════════════════════════════════════════

void MainWindow::setupStore()
{
    m_config = new AppConfig();
    if (!m_config->load()) {
        qCInfo(CHALAN_GUI) << "No chalan.conf found, using defaults under"
                           << AppConfig::defaultDataDir();
    }

    m_store = new InvoiceStore(this);
    if (!m_store->open(m_config->databasePath())) {
        qCCritical(CHALAN_GUI) << "Cannot open database" << m_config->databasePath()
                               << m_store->lastError();
        QMessageBox::critical(this, i18n("Database Error"),
                              i18n("Could not open the invoice database:\n%1\n\n%2",
                                   m_config->databasePath(), m_store->lastError()));
    }

    connect(m_store, &InvoiceStore::counterChanged,
            this, &MainWindow::updateDatabaseLabel);
}

// ═════════════════════════════════════════════════════════════
// Sidebar setup
// ═════════════════════════════════════════════════════════════

void MainWindow::setupSidebar()
{
    m_sidebar = new QListWidget(this);
    m_sidebar->setViewMode(QListView::ListMode);
    m_sidebar->setIconSize(QSize(22, 22));
    m_sidebar->setSpacing(2);
    m_sidebar->setMaximumWidth(200);
    m_sidebar->setMinimumWidth(120);
    m_sidebar->setFrameStyle(QFrame::NoFrame);

    auto addItem = [this](const QString &text, const QString &iconName) {
        auto *item = new QListWidgetItem(QIcon::fromTheme(iconName), text);
        item->setSizeHint(QSize(0, 36));  // comfortable row height
        m_sidebar->addItem(item);
    };

    addItem(i18n("Invoice"),     QStringLiteral("document-edit"));
    addItem(i18n("Invoices"),    QStringLiteral("view-list-details"));
    addItem(i18n("Item Master"), QStringLiteral("view-list-text"));
    addItem(i18n("Maintenance"), QStringLiteral("configure"));
    addItem(i18n("Settings"),    QStringLiteral("preferences-system"));

    connect(m_sidebar, &QListWidget::currentRowChanged,
            this, &MainWindow::onSidebarItemChanged);
}

// ═════════════════════════════════════════════════════════════
// Panel setup
// ═════════════════════════════════════════════════════════════

void MainWindow::setupPanels()
{
    m_panelStack = new QStackedWidget(this);

    m_invoicePanel = new InvoicePanel(m_store, m_config, this);
    m_panelStack->addWidget(m_invoicePanel);       // index 0

    m_historyPanel = new InvoiceListView(m_store, this);
    m_panelStack->addWidget(m_historyPanel);       // index 1

    m_itemMasterPanel = new ItemMasterPanel(m_store, this);
    m_panelStack->addWidget(m_itemMasterPanel);    // index 2

    m_maintenancePanel = new MaintenancePanel(m_store, m_config, this);
    m_panelStack->addWidget(m_maintenancePanel);   // index 3

    connect(m_historyPanel, &InvoiceListView::openInvoiceRequested,
            this, &MainWindow::openInvoice);
    connect(m_maintenancePanel, &MaintenancePanel::counterReset,
            this, &MainWindow::onCounterReset);

    connect(m_invoicePanel, &InvoicePanel::statusMessage,
            this, &MainWindow::showStatusMessage);
    connect(m_historyPanel, &InvoiceListView::statusMessage,
            this, &MainWindow::showStatusMessage);
    connect(m_maintenancePanel, &MaintenancePanel::statusMessage,
            this, &MainWindow::showStatusMessage);
}

// ═════════════════════════════════════════════════════════════
// Status bar setup
// ═════════════════════════════════════════════════════════════

void MainWindow::setupStatusBar()
{
    m_statusLabel = new QLabel(i18n("Ready"), this);
    statusBar()->addWidget(m_statusLabel, 1);

    m_databaseLabel = new QLabel(this);
    statusBar()->addPermanentWidget(m_databaseLabel);
}

void MainWindow::showStatusMessage(const QString &message)
{
    m_statusLabel->setText(message);
}

void MainWindow::updateDatabaseLabel()
{
    if (!m_store->isOpen()) {
        m_databaseLabel->setText(i18n("No database"));
        return;
    }
    m_databaseLabel->setText(i18n("Next chalan %1 | %2",
                                  m_store->peekChalanNumber(),
                                  QFileInfo(m_store->databasePath()).fileName()));
    m_databaseLabel->setToolTip(m_store->databasePath());
}

// ═════════════════════════════════════════════════════════════
// Actions (wired to menus and toolbar by chalan-qtui.rc)
// ═════════════════════════════════════════════════════════════

void MainWindow::setupActions()
{
    KActionCollection *ac = actionCollection();

    // ── File ──
    QAction *newAction = KStandardAction::openNew(this, [this]() {
        m_invoicePanel->startNewInvoice(true);
        switchToPanel(PanelInvoice);
    }, ac);
    newAction->setText(i18n("New Invoice"));

    QAction *openAction = KStandardAction::open(this, [this]() {
        switchToPanel(PanelInvoice);
        m_invoicePanel->openInvoiceDialog();
    }, ac);
    openAction->setText(i18n("Open Invoice…"));

    QAction *saveAction = KStandardAction::save(m_invoicePanel, &InvoicePanel::saveInvoice, ac);
    saveAction->setText(i18n("Save Invoice"));

    QAction *pdfAction = ac->addAction(QStringLiteral("export_pdf"));
    pdfAction->setText(i18n("Export PDF"));
    pdfAction->setIcon(QIcon::fromTheme(QStringLiteral("application-pdf")));
    ac->setDefaultShortcut(pdfAction, QKeySequence(Qt::CTRL | Qt::Key_P));
    connect(pdfAction, &QAction::triggered, m_invoicePanel, &InvoicePanel::exportPdf);

    QAction *exportCsvAction = ac->addAction(QStringLiteral("export_csv"));
    exportCsvAction->setText(i18n("Export All to CSV…"));
    exportCsvAction->setIcon(QIcon::fromTheme(QStringLiteral("document-export")));
    connect(exportCsvAction, &QAction::triggered,
            m_maintenancePanel, &MaintenancePanel::exportCsv);

    QAction *backupAction = ac->addAction(QStringLiteral("backup_db"));
    backupAction->setText(i18n("Backup DB…"));
    backupAction->setIcon(QIcon::fromTheme(QStringLiteral("document-save-as")));
    connect(backupAction, &QAction::triggered,
            m_maintenancePanel, &MaintenancePanel::backupDatabase);

    KStandardAction::quit(qApp, &QCoreApplication::quit, ac);

    // ── Admin ──
    KStandardAction::preferences(this, &MainWindow::showSettingsDialog, ac);

    QAction *itemMasterAction = ac->addAction(QStringLiteral("item_master"));
    itemMasterAction->setText(i18n("Item Master"));
    itemMasterAction->setIcon(QIcon::fromTheme(QStringLiteral("view-list-text")));
    connect(itemMasterAction, &QAction::triggered,
            this, [this]() { switchToPanel(PanelItemMaster); });

    QAction *importCsvAction = ac->addAction(QStringLiteral("import_csv"));
    importCsvAction->setText(i18n("Import Invoices from CSV…"));
    importCsvAction->setIcon(QIcon::fromTheme(QStringLiteral("document-import")));
    connect(importCsvAction, &QAction::triggered,
            m_maintenancePanel, &MaintenancePanel::importCsv);

    QAction *resetAction = ac->addAction(QStringLiteral("reset_counter"));
    resetAction->setText(i18n("Reset Chalan Counter"));
    resetAction->setIcon(QIcon::fromTheme(QStringLiteral("edit-undo")));
    connect(resetAction, &QAction::triggered,
            m_maintenancePanel, &MaintenancePanel::resetCounter);
}

// ═════════════════════════════════════════════════════════════
// Slot: Sidebar navigation changed
// ═════════════════════════════════════════════════════════════

void MainWindow::onSidebarItemChanged(int currentRow)
{
    if (currentRow == PanelSettings) {
        // Open the dialog and put the highlight back on the previous panel
        showSettingsDialog();

        m_sidebar->blockSignals(true);
        m_sidebar->setCurrentRow(m_lastSidebarIndex);
        m_sidebar->blockSignals(false);
        return;
    }

    if (currentRow >= 0 && currentRow < m_panelStack->count()) {
        m_panelStack->setCurrentIndex(currentRow);
        m_lastSidebarIndex = currentRow;
    }
}

void MainWindow::switchToPanel(int index)
{
    if (index >= 0 && index < PanelSettings) {
        m_sidebar->setCurrentRow(index);
    }
}

void MainWindow::openInvoice(int chalanNo)
{
    if (m_invoicePanel->loadInvoice(chalanNo)) {
        switchToPanel(PanelInvoice);
    }
}

void MainWindow::onCounterReset()
{
    m_invoicePanel->startNewInvoice(false);
    switchToPanel(PanelInvoice);
    QMessageBox::information(this, i18n("Reset Done"),
                             i18n("Chalan counter reset. Current chalan: %1",
                                  m_invoicePanel->chalanNumber()));
}

// ═════════════════════════════════════════════════════════════
// Settings dialog
// ═════════════════════════════════════════════════════════════

void MainWindow::showSettingsDialog()
{
    // KConfigDialog manages singleton instances by name.
    // If the dialog already exists, it just raises it.
    if (KConfigDialog::showDialog(QString::fromLatin1(SettingsDialog::DIALOG_NAME))) {
        return;
    }

    auto *dialog = new SettingsDialog(this, m_store, m_config);

    connect(dialog, &SettingsDialog::databasePathChanged,
            this, &MainWindow::onDatabasePathChanged);
    connect(dialog, &KConfigDialog::settingsChanged,
            this, &MainWindow::applyInvoiceSettings);

    dialog->show();
}

void MainWindow::applyInvoiceSettings()
{
    m_invoicePanel->setDateFormat(ChalanSettings::dateFormat());
    m_invoicePanel->setDefaultTaxPercent(ChalanSettings::defaultTaxPercent());
}

void MainWindow::onDatabasePathChanged()
{
    const QString path = m_config->databasePath();
    qCInfo(CHALAN_GUI) << "Reopening store at" << path;

    if (!m_store->open(path)) {
        QMessageBox::critical(this, i18n("Database Error"),
                              i18n("Could not open the invoice database:\n%1\n\n%2",
                                   path, m_store->lastError()));
        updateDatabaseLabel();
        return;
    }

    m_historyPanel->reload();
    m_itemMasterPanel->reload();
    m_invoicePanel->refreshItemNames();
    m_invoicePanel->startNewInvoice(false);
    updateDatabaseLabel();
    showStatusMessage(i18n("Using database %1", path));
}
