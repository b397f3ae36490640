// confwriter.h
// Chalan core - chalan.conf reader/writer
//
// Reads and writes chalan.conf as a shell-style KEY="value" file.
// Preserves comments, blank lines and unknown lines when rewriting, so a
// hand-edited file survives a round trip through the settings dialog.
//
// Copyright (c) 2026 Chalan Project

#ifndef CONFWRITER_H
#define CONFWRITER_H

#include <QString>
#include <QStringList>
#include <QMap>

/**
 * @brief Reads and writes chalan.conf while preserving its structure.
 *
 * The file format is simple shell assignment:
 *   KEY="value"        (string)
 *   KEY=42             (integer, no quotes)
 *   KEY=true           (boolean, no quotes)
 *   # comment lines    (preserved verbatim)
 *   blank lines        (preserved verbatim)
 *
 * Keys that are set but were not present in the loaded file are appended
 * at the end on save().
 */
class ConfWriter
{
public:
    ConfWriter();

    /// Load config from the standard location.
    /// Returns true if a config file was found and parsed.  When nothing
    /// is found, filePath() still names the location save() will create.
    bool loadFromDefaultLocation();

    /// Load config from an explicit file path.
    bool loadFromFile(const QString &filePath);

    /// Write all current values back to the file that was loaded.
    bool save();

    /// Write current values to an explicit file path (creates parent dirs).
    bool saveToFile(const QString &filePath);

    QString filePath() const;

    /// Search order:
    ///   1. $CHALAN_CONFIG                     (explicit file, set by chalan-cli --config)
    ///   2. $CHALAN_CONFIG_DIR/chalan.conf
    ///   3. $XDG_CONFIG_HOME/chalan/chalan.conf
    /// Returns the XDG path when no file exists yet.
    static QString locateConfigFile();

    // ── Value access ──

    QString value(const QString &key, const QString &defaultValue = QString()) const;
    bool boolValue(const QString &key, bool defaultValue = false) const;

    void setValue(const QString &key, const QString &value);
    void setBoolValue(const QString &key, bool value);

private:
    bool parseLine(const QString &line, QString &key, QString &value) const;
    static QString formatAssignment(const QString &key, const QString &value);

    QString m_filePath;

    /// Raw lines of the loaded file, kept to preserve layout on save.
    QStringList m_rawLines;

    QMap<QString, QString> m_values;
};

#endif // CONFWRITER_H
