#include "appconfig.h"
#include "chalan_debug.h"

#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

AppConfig::AppConfig()
{
}

bool AppConfig::load()
{
    return m_conf.loadFromDefaultLocation();
}

bool AppConfig::loadFromFile(const QString &filePath)
{
    return m_conf.loadFromFile(filePath);
}

bool AppConfig::save()
{
    return m_conf.save();
}

QString AppConfig::defaultDataDir()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
        + QStringLiteral("/chalan");
}

QString AppConfig::resolvePath(const QString &key, const QString &fallback) const
{
    QString raw = m_conf.value(key).trimmed();

    if (raw.isEmpty()) {
        return fallback;
    }
    if (raw.contains(QLatin1Char('$'))) {
        qCWarning(CHALAN_CONFIG) << key << "contains an unexpanded variable, using" << fallback;
        return fallback;
    }

    if (raw == QLatin1String("~")) {
        raw = QDir::homePath();
    } else if (raw.startsWith(QLatin1String("~/"))) {
        raw = QDir::homePath() + raw.mid(1);
    }

    if (QDir::isRelativePath(raw)) {
        QFileInfo confInfo(m_conf.filePath());
        raw = confInfo.absoluteDir().absoluteFilePath(raw);
    }
    return QDir::cleanPath(raw);
}

QString AppConfig::databasePath() const
{
    return resolvePath(QLatin1String(KEY_DATABASE_PATH),
                       defaultDataDir() + QStringLiteral("/invoices.db"));
}

QString AppConfig::pdfDir() const
{
    return resolvePath(QLatin1String(KEY_PDF_DIR), defaultDataDir() + QStringLiteral("/pdf"));
}

QString AppConfig::backupDir() const
{
    return resolvePath(QLatin1String(KEY_BACKUP_DIR),
                       defaultDataDir() + QStringLiteral("/backups"));
}

bool AppConfig::openPdfAfterExport() const
{
    return m_conf.boolValue(QLatin1String(KEY_OPEN_PDF), true);
}

void AppConfig::setDatabasePath(const QString &path)
{
    m_conf.setValue(QLatin1String(KEY_DATABASE_PATH), path);
}

void AppConfig::setPdfDir(const QString &path)
{
    m_conf.setValue(QLatin1String(KEY_PDF_DIR), path);
}

void AppConfig::setBackupDir(const QString &path)
{
    m_conf.setValue(QLatin1String(KEY_BACKUP_DIR), path);
}

void AppConfig::setOpenPdfAfterExport(bool open)
{
    m_conf.setBoolValue(QLatin1String(KEY_OPEN_PDF), open);
}
