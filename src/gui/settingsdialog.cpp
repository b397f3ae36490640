// settingsdialog.cpp
// Chalan Qt GUI - Settings Dialog implementation
// Copyright (c) 2026 Chalan Project

#include "settingsdialog.h"
#include "appconfig.h"
#include "chalan_debug.h"
#include "chalansettings.h"
#include "invoicestore.h"

#include <KLocalizedString>
#include <KUrlRequester>

#include <QCheckBox>
#include <QDate>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QUrl>
#include <QVBoxLayout>

// ═════════════════════════════════════════════════════════════
// Construction
// ═════════════════════════════════════════════════════════════

SettingsDialog::SettingsDialog(QWidget *parent, InvoiceStore *store, AppConfig *config)
    : KConfigDialog(parent, QString::fromLatin1(DIALOG_NAME), ChalanSettings::self())
    , m_store(store)
    , m_config(config)
{
    setWindowTitle(i18n("Configure Chalan"));
    setFaceType(KPageDialog::List);

    // KConfig mirrors must hold the chalan.conf values before the
    // managed widgets are created and read from the skeleton
    syncConfToKConfig();

    addPage(createCompanyPage(), i18n("Company"),
            QStringLiteral("office-address-book"),
            i18n("Seller and bank details printed on every invoice"));
    addPage(createStoragePage(), i18n("Storage"),
            QStringLiteral("drive-harddisk"),
            i18n("Where invoices, PDFs and backups are kept"));
    addPage(createInvoicePage(), i18n("Invoice"),
            QStringLiteral("document-edit"),
            i18n("Defaults for new invoices"));

    updateWidgets();
}

SettingsDialog::~SettingsDialog() = default;

// ═════════════════════════════════════════════════════════════
// Page builders
// ═════════════════════════════════════════════════════════════

QWidget *SettingsDialog::createCompanyPage()
{
    auto *page = new QWidget(this);
    auto *layout = new QVBoxLayout(page);

    auto *companyGroup = new QGroupBox(i18n("Company"), page);
    auto *companyForm = new QFormLayout(companyGroup);
    m_companyNameEdit   = new QLineEdit(companyGroup);
    m_companyCityEdit   = new QLineEdit(companyGroup);
    m_companyMobileEdit = new QLineEdit(companyGroup);
    companyForm->addRow(i18n("Company name:"), m_companyNameEdit);
    companyForm->addRow(i18n("City:"), m_companyCityEdit);
    companyForm->addRow(i18n("Mobile:"), m_companyMobileEdit);

    m_logoUrl = new KUrlRequester(companyGroup);
    m_logoUrl->setMode(KFile::File | KFile::ExistingOnly | KFile::LocalOnly);
    m_logoUrl->setNameFilters({i18n("Images (*.png *.jpg *.jpeg *.gif)"), i18n("All files (*)")});
    m_logoUrl->setPlaceholderText(i18n("No logo"));
    companyForm->addRow(i18n("Logo:"), m_logoUrl);
    layout->addWidget(companyGroup);

    auto *bankGroup = new QGroupBox(i18n("Bank"), page);
    auto *bankForm = new QFormLayout(bankGroup);
    m_bankAccountNameEdit = new QLineEdit(bankGroup);
    m_bankNameEdit        = new QLineEdit(bankGroup);
    m_bankAccountNoEdit   = new QLineEdit(bankGroup);
    m_bankIfscEdit        = new QLineEdit(bankGroup);
    bankForm->addRow(i18n("Bank A/C name:"), m_bankAccountNameEdit);
    bankForm->addRow(i18n("Bank name:"), m_bankNameEdit);
    bankForm->addRow(i18n("Bank A/C no:"), m_bankAccountNoEdit);
    bankForm->addRow(i18n("IFSC:"), m_bankIfscEdit);
    layout->addWidget(bankGroup);
    layout->addStretch();

    const QList<QLineEdit *> edits = {
        m_companyNameEdit, m_companyCityEdit, m_companyMobileEdit,
        m_bankAccountNameEdit, m_bankNameEdit, m_bankAccountNoEdit, m_bankIfscEdit
    };
    for (QLineEdit *edit : edits) {
        connect(edit, &QLineEdit::textChanged, this, &SettingsDialog::updateButtons);
    }
    connect(m_logoUrl, &KUrlRequester::textChanged, this, &SettingsDialog::updateButtons);

    return page;
}

QWidget *SettingsDialog::createStoragePage()
{
    auto *page = new QWidget(this);
    auto *layout = new QVBoxLayout(page);

    auto *pathsGroup = new QGroupBox(i18n("Locations"), page);
    auto *form = new QFormLayout(pathsGroup);

    m_databaseUrl = new KUrlRequester(pathsGroup);
    m_databaseUrl->setMode(KFile::File | KFile::LocalOnly);
    m_databaseUrl->setNameFilters({i18n("SQLite databases (*.db)"), i18n("All files (*)")});
    form->addRow(i18n("Database file:"), m_databaseUrl);

    m_pdfDirUrl = new KUrlRequester(pathsGroup);
    m_pdfDirUrl->setMode(KFile::Directory | KFile::LocalOnly);
    form->addRow(i18n("PDF folder:"), m_pdfDirUrl);

    m_backupDirUrl = new KUrlRequester(pathsGroup);
    m_backupDirUrl->setMode(KFile::Directory | KFile::LocalOnly);
    form->addRow(i18n("Backup folder:"), m_backupDirUrl);

    m_openPdfCheck = new QCheckBox(i18n("Open the PDF after export"), pathsGroup);
    form->addRow(QString(), m_openPdfCheck);
    layout->addWidget(pathsGroup);

    auto *note = new QLabel(
        i18n("These settings are stored in %1 and are shared with chalan-cli.",
             m_config->configFilePath()),
        page);
    note->setWordWrap(true);
    layout->addWidget(note);
    layout->addStretch();

    connect(m_databaseUrl, &KUrlRequester::textChanged, this, &SettingsDialog::updateButtons);
    connect(m_pdfDirUrl, &KUrlRequester::textChanged, this, &SettingsDialog::updateButtons);
    connect(m_backupDirUrl, &KUrlRequester::textChanged, this, &SettingsDialog::updateButtons);
    connect(m_openPdfCheck, &QCheckBox::toggled, this, &SettingsDialog::updateButtons);

    return page;
}

QWidget *SettingsDialog::createInvoicePage()
{
    auto *page = new QWidget(this);
    auto *layout = new QVBoxLayout(page);
    auto *form = new QFormLayout;

    // Managed by KConfigDialogManager through the kcfg_ object names
    m_taxSpin = new QDoubleSpinBox(page);
    m_taxSpin->setObjectName(QStringLiteral("kcfg_DefaultTaxPercent"));
    m_taxSpin->setRange(0.0, 100.0);
    m_taxSpin->setDecimals(2);
    m_taxSpin->setSuffix(QStringLiteral(" %"));
    form->addRow(i18n("Default tax:"), m_taxSpin);

    m_dateFormatEdit = new QLineEdit(page);
    m_dateFormatEdit->setObjectName(QStringLiteral("kcfg_DateFormat"));
    form->addRow(i18n("Date format:"), m_dateFormatEdit);

    m_datePreview = new QLabel(page);
    form->addRow(i18n("Today:"), m_datePreview);

    layout->addLayout(form);
    auto *hint = new QLabel(i18n("Uses Qt date format codes, e.g. dd/MM/yyyy or dd-MMM-yy."), page);
    hint->setWordWrap(true);
    layout->addWidget(hint);
    layout->addStretch();

    connect(m_dateFormatEdit, &QLineEdit::textChanged, this, &SettingsDialog::updateDatePreview);

    return page;
}

void SettingsDialog::updateDatePreview()
{
    const QString format = m_dateFormatEdit->text().trimmed();
    m_datePreview->setText(format.isEmpty() ? QString()
                                            : QDate::currentDate().toString(format));
}

// ═════════════════════════════════════════════════════════════
// Sync helpers
// ═════════════════════════════════════════════════════════════

void SettingsDialog::syncConfToKConfig()
{
    ChalanSettings::setDatabasePath(m_config->databasePath());
    ChalanSettings::setPdfDir(m_config->pdfDir());
    ChalanSettings::setBackupDir(m_config->backupDir());
    ChalanSettings::setOpenPdfAfterExport(m_config->openPdfAfterExport());
    ChalanSettings::self()->save();
}

QString SettingsDialog::pathOf(const KUrlRequester *requester)
{
    const QUrl url = requester->url();
    if (url.isLocalFile()) {
        return url.toLocalFile();
    }
    return requester->text().trimmed();
}

CompanyProfile SettingsDialog::profileFromWidgets() const
{
    CompanyProfile profile;
    profile.companyName     = m_companyNameEdit->text().trimmed();
    profile.companyCity     = m_companyCityEdit->text().trimmed();
    profile.companyMobile   = m_companyMobileEdit->text().trimmed();
    profile.bankAccountName = m_bankAccountNameEdit->text().trimmed();
    profile.bankName        = m_bankNameEdit->text().trimmed();
    profile.bankAccountNo   = m_bankAccountNoEdit->text().trimmed();
    profile.bankIfsc        = m_bankIfscEdit->text().trimmed();
    profile.logoPath        = pathOf(m_logoUrl);
    return profile;
}

void SettingsDialog::setProfileWidgets(const CompanyProfile &profile)
{
    m_companyNameEdit->setText(profile.companyName);
    m_companyCityEdit->setText(profile.companyCity);
    m_companyMobileEdit->setText(profile.companyMobile);
    m_bankAccountNameEdit->setText(profile.bankAccountName);
    m_bankNameEdit->setText(profile.bankName);
    m_bankAccountNoEdit->setText(profile.bankAccountNo);
    m_bankIfscEdit->setText(profile.bankIfsc);
    if (profile.logoPath.isEmpty()) {
        m_logoUrl->clear();
    } else {
        m_logoUrl->setUrl(QUrl::fromLocalFile(profile.logoPath));
    }
}

static bool sameProfile(const CompanyProfile &a, const CompanyProfile &b)
{
    return a.companyName == b.companyName
        && a.companyCity == b.companyCity
        && a.companyMobile == b.companyMobile
        && a.bankAccountName == b.bankAccountName
        && a.bankName == b.bankName
        && a.bankAccountNo == b.bankAccountNo
        && a.bankIfsc == b.bankIfsc
        && a.logoPath == b.logoPath;
}

// ═════════════════════════════════════════════════════════════
// KConfigDialog overrides
// ═════════════════════════════════════════════════════════════

void SettingsDialog::updateWidgets()
{
    m_savedProfile = m_store->companyProfile();
    setProfileWidgets(m_savedProfile);

    m_savedDatabasePath = m_config->databasePath();
    m_savedPdfDir       = m_config->pdfDir();
    m_savedBackupDir    = m_config->backupDir();
    m_savedOpenPdf      = m_config->openPdfAfterExport();

    m_databaseUrl->setUrl(QUrl::fromLocalFile(m_savedDatabasePath));
    m_pdfDirUrl->setUrl(QUrl::fromLocalFile(m_savedPdfDir));
    m_backupDirUrl->setUrl(QUrl::fromLocalFile(m_savedBackupDir));
    m_openPdfCheck->setChecked(m_savedOpenPdf);

    updateDatePreview();
}

void SettingsDialog::updateWidgetsDefault()
{
    setProfileWidgets(CompanyProfile());

    const QString dataDir = AppConfig::defaultDataDir();
    m_databaseUrl->setUrl(QUrl::fromLocalFile(dataDir + QStringLiteral("/invoices.db")));
    m_pdfDirUrl->setUrl(QUrl::fromLocalFile(dataDir + QStringLiteral("/pdf")));
    m_backupDirUrl->setUrl(QUrl::fromLocalFile(dataDir + QStringLiteral("/backups")));
    m_openPdfCheck->setChecked(true);
}

bool SettingsDialog::hasChanged()
{
    return !sameProfile(profileFromWidgets(), m_savedProfile)
        || pathOf(m_databaseUrl) != m_savedDatabasePath
        || pathOf(m_pdfDirUrl) != m_savedPdfDir
        || pathOf(m_backupDirUrl) != m_savedBackupDir
        || m_openPdfCheck->isChecked() != m_savedOpenPdf;
}

bool SettingsDialog::isDefault()
{
    const QString dataDir = AppConfig::defaultDataDir();
    return sameProfile(profileFromWidgets(), CompanyProfile())
        && pathOf(m_databaseUrl) == dataDir + QStringLiteral("/invoices.db")
        && pathOf(m_pdfDirUrl) == dataDir + QStringLiteral("/pdf")
        && pathOf(m_backupDirUrl) == dataDir + QStringLiteral("/backups")
        && m_openPdfCheck->isChecked();
}

void SettingsDialog::updateSettings()
{
    // ── Company page -> store meta ──
    const CompanyProfile profile = profileFromWidgets();
    if (!sameProfile(profile, m_savedProfile)) {
        if (m_store->setCompanyProfile(profile)) {
            m_savedProfile = profile;
        } else {
            QMessageBox::critical(this, i18n("Settings"),
                                  i18n("Could not save company details:\n%1", m_store->lastError()));
        }
    }

    // ── Storage page -> chalan.conf ──
    const QString databasePath = pathOf(m_databaseUrl);
    const QString pdfDir       = pathOf(m_pdfDirUrl);
    const QString backupDir    = pathOf(m_backupDirUrl);
    const bool openPdf         = m_openPdfCheck->isChecked();

    const bool storageChangedNow = databasePath != m_savedDatabasePath
        || pdfDir != m_savedPdfDir
        || backupDir != m_savedBackupDir
        || openPdf != m_savedOpenPdf;
    if (!storageChangedNow) {
        return;
    }

    const bool databaseMoved = databasePath != m_savedDatabasePath;

    m_config->setDatabasePath(databasePath);
    m_config->setPdfDir(pdfDir);
    m_config->setBackupDir(backupDir);
    m_config->setOpenPdfAfterExport(openPdf);
    if (!m_config->save()) {
        QMessageBox::critical(this, i18n("Settings"),
                              i18n("Could not write %1", m_config->configFilePath()));
        return;
    }
    qCDebug(CHALAN_GUI) << "Storage settings written to" << m_config->configFilePath();

    syncConfToKConfig();
    m_savedDatabasePath = m_config->databasePath();
    m_savedPdfDir       = m_config->pdfDir();
    m_savedBackupDir    = m_config->backupDir();
    m_savedOpenPdf      = m_config->openPdfAfterExport();

    Q_EMIT storageChanged();
    if (databaseMoved) {
        Q_EMIT databasePathChanged();
    }
}
