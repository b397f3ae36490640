// settingsdialog.h
// Chalan Qt GUI - Settings Dialog (KConfigDialog + chalan.conf + store meta)
//
// Three-page KConfigDialog:
//   Company: seller and bank details printed on every PDF (store meta)
//   Storage: database file, PDF folder, backup folder (chalan.conf)
//   Invoice: default tax percent and date format (chalanrc, KConfigXT)
//
// On Apply/OK:
//   1. KConfigDialogManager writes the kcfg_ widgets to ChalanSettings
//   2. updateSettings() writes the company page to the store and the
//      storage page to chalan.conf, then refreshes the KConfig mirrors
//   3. databasePathChanged() is emitted when the store must be reopened
//
// Copyright (c) 2026 Chalan Project

#ifndef SETTINGSDIALOG_H
#define SETTINGSDIALOG_H

#include "invoice.h"

#include <KConfigDialog>

class AppConfig;
class InvoiceStore;
class QCheckBox;
class QDoubleSpinBox;
class QLabel;
class QLineEdit;
class KUrlRequester;

/**
 * @brief Settings dialog with three pages, backed by KConfigXT.
 *
 * Only one instance exists at a time; KConfigDialog finds it by
 * DIALOG_NAME.
 */
class SettingsDialog : public KConfigDialog
{
    Q_OBJECT

public:
    static constexpr const char *DIALOG_NAME = "ChalanSettings";

    SettingsDialog(QWidget *parent, InvoiceStore *store, AppConfig *config);
    ~SettingsDialog() override;

Q_SIGNALS:
    void databasePathChanged();
    void storageChanged();

protected Q_SLOTS:
    void updateSettings() override;
    void updateWidgets() override;
    void updateWidgetsDefault() override;
    bool hasChanged() override;
    bool isDefault() override;

private:
    // ── Page builders ──
    QWidget *createCompanyPage();
    QWidget *createStoragePage();
    QWidget *createInvoicePage();

    // ── Sync helpers ──
    void syncConfToKConfig();
    CompanyProfile profileFromWidgets() const;
    void setProfileWidgets(const CompanyProfile &profile);
    static QString pathOf(const KUrlRequester *requester);
    void updateDatePreview();

    // ── External references ──
    InvoiceStore *m_store;
    AppConfig    *m_config;

    // ── Company page widgets ──
    QLineEdit     *m_companyNameEdit;
    QLineEdit     *m_companyCityEdit;
    QLineEdit     *m_companyMobileEdit;
    QLineEdit     *m_bankAccountNameEdit;
    QLineEdit     *m_bankNameEdit;
    QLineEdit     *m_bankAccountNoEdit;
    QLineEdit     *m_bankIfscEdit;
    KUrlRequester *m_logoUrl;

    // ── Storage page widgets ──
    KUrlRequester *m_databaseUrl;
    KUrlRequester *m_pdfDirUrl;
    KUrlRequester *m_backupDirUrl;
    QCheckBox     *m_openPdfCheck;

    // ── Invoice page widgets (managed through kcfg_ names) ──
    QDoubleSpinBox *m_taxSpin;
    QLineEdit      *m_dateFormatEdit;
    QLabel         *m_datePreview;

    // ── Snapshot of unmanaged values at dialog open (for hasChanged) ──
    CompanyProfile m_savedProfile;
    QString        m_savedDatabasePath;
    QString        m_savedPdfDir;
    QString        m_savedBackupDir;
    bool           m_savedOpenPdf = true;
};

#endif // SETTINGSDIALOG_H
