// appconfig.h
// Chalan core - typed view over chalan.conf with resolved defaults
// Copyright (c) 2026 Chalan Project

#ifndef APPCONFIG_H
#define APPCONFIG_H

#include "confwriter.h"

#include <QString>

/**
 * @brief Storage locations and export behaviour, read from chalan.conf.
 *
 * Every path getter returns an absolute path.  Missing values, and values
 * that still contain an unexpanded shell variable, fall back to the
 * defaults under $XDG_DATA_HOME/chalan.  A leading "~" is expanded and
 * relative paths are taken relative to the config file's directory.
 */
class AppConfig
{
public:
    static constexpr const char *KEY_DATABASE_PATH = "DATABASE_PATH";
    static constexpr const char *KEY_PDF_DIR = "PDF_DIR";
    static constexpr const char *KEY_BACKUP_DIR = "BACKUP_DIR";
    static constexpr const char *KEY_OPEN_PDF = "OPEN_PDF_AFTER_EXPORT";

    AppConfig();

    /// (Re)load from ConfWriter::locateConfigFile().
    bool load();
    bool loadFromFile(const QString &filePath);
    bool save();

    QString databasePath() const;
    QString pdfDir() const;
    QString backupDir() const;
    bool openPdfAfterExport() const;

    void setDatabasePath(const QString &path);
    void setPdfDir(const QString &path);
    void setBackupDir(const QString &path);
    void setOpenPdfAfterExport(bool open);

    QString configFilePath() const { return m_conf.filePath(); }

    static QString defaultDataDir();

private:
    QString resolvePath(const QString &key, const QString &fallback) const;

    ConfWriter m_conf;
};

#endif // APPCONFIG_H
