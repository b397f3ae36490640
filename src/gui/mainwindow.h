// mainwindow.h
// Chalan Qt GUI - Main Window (Dolphin-style sidebar layout)
//
//   - QListWidget sidebar for panel navigation (Dolphin Places-style)
//   - QStackedWidget for panel content
//   - KXmlGui menus (File / Admin / Help) and main toolbar
//   - Status bar with the next chalan number and the database in use
//
// Settings panel is a KConfigDialog opened on demand (not embedded in
// the stacked widget).  Sidebar "Settings" entry triggers the dialog.
//
// Copyright (c) 2026 Chalan Project

#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <KXmlGuiWindow>

#include <QListWidget>
#include <QStackedWidget>
#include <QLabel>

// Forward declarations - panels
class InvoicePanel;
class InvoiceListView;
class ItemMasterPanel;
class MaintenancePanel;

// Forward declarations - data and settings
class AppConfig;
class InvoiceStore;
class SettingsDialog;

/**
 * @brief Main application window with Dolphin-style sidebar navigation.
 *
 * Layout:
 *   ┌─────────────┬──────────────────────────────────┐
 *   │ Toolbar: New | Open | Save | Export PDF | Settings │
 *   ├─────────────┼──────────────────────────────────┤
 *   │ Invoice     │                                  │
 *   │ Invoices    │     Active Panel Content         │
 *   │ Item Master │                                  │
 *   │ Maintenance │                                  │
 *   │ Settings    │                                  │
 *   ├─────────────┴──────────────────────────────────┤
 *   │ Status: last action            Next chalan | invoices.db │
 *   └────────────────────────────────────────────────┘
 */
class MainWindow : public KXmlGuiWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

    /// Switch to a specific panel by index
    void switchToPanel(int index);

    /// Panel indices for sidebar navigation
    /// Note: PanelSettings is a virtual entry.  Clicking it opens the
    /// KConfigDialog rather than switching the stacked widget.
    enum PanelIndex {
        PanelInvoice = 0,
        PanelHistory,
        PanelItemMaster,
        PanelMaintenance,
        PanelSettings,       // opens dialog, not a panel
        PanelCount           // sentinel - must be last
    };

public Q_SLOTS:
    /// Open the Settings dialog (KConfigDialog).
    void showSettingsDialog();

    /// Load a stored invoice into the editor and show it.
    void openInvoice(int chalanNo);

private Q_SLOTS:
    /// Sidebar selection changed
    void onSidebarItemChanged(int currentRow);

    /// Settings dialog reported a database path change
    void onDatabasePathChanged();

    /// Apply the KConfigXT invoice defaults to the editor
    void applyInvoiceSettings();

    /// Maintenance panel reset the chalan counter
    void onCounterReset();

    void showStatusMessage(const QString &message);
    void updateDatabaseLabel();

private:
    // ── Setup methods ──
    void setupStore();
    void setupSidebar();
    void setupPanels();
    void setupStatusBar();
    void setupActions();

    // ── Layout widgets ──
    QListWidget    *m_sidebar;         ///< Left navigation panel
    QStackedWidget *m_panelStack;      ///< Stacked content panels

    // ── Panels ──
    InvoicePanel     *m_invoicePanel;       ///< Invoice editor
    InvoiceListView  *m_historyPanel;       ///< Saved invoices
    ItemMasterPanel  *m_itemMasterPanel;    ///< Item name / rate list
    MaintenancePanel *m_maintenancePanel;   ///< CSV, backup, counter

    // ── Status bar widgets ──
    QLabel *m_statusLabel;             ///< Last action
    QLabel *m_databaseLabel;           ///< Next chalan and database file

    // ── Data ──
    AppConfig    *m_config;            ///< chalan.conf
    InvoiceStore *m_store;             ///< SQLite invoice store

    int m_lastSidebarIndex = 0;        ///< Tracks previous sidebar selection
                                       ///  (used to restore after Settings dialog)
};

#endif // MAINWINDOW_H
