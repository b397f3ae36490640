// confwriter.cpp
// Chalan core - chalan.conf reader/writer implementation
// Copyright (c) 2026 Chalan Project

#include "confwriter.h"
#include "chalan_debug.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSaveFile>
#include <QSet>
#include <QStandardPaths>
#include <QTextStream>

// ═════════════════════════════════════════════════════════════
// Construction
// ═════════════════════════════════════════════════════════════

ConfWriter::ConfWriter()
{
}

// ═════════════════════════════════════════════════════════════
// File location
// ═════════════════════════════════════════════════════════════

QString ConfWriter::locateConfigFile()
{
    const QString explicitFile = QString::fromLocal8Bit(qgetenv("CHALAN_CONFIG"));
    if (!explicitFile.isEmpty()) {
        return explicitFile;
    }

    const QString envDir = QString::fromLocal8Bit(qgetenv("CHALAN_CONFIG_DIR"));
    if (!envDir.isEmpty()) {
        QString path = envDir + QStringLiteral("/chalan.conf");
        if (QFile::exists(path)) {
            return path;
        }
    }

    QString xdgConfig = QStandardPaths::writableLocation(
        QStandardPaths::GenericConfigLocation);
    return xdgConfig + QStringLiteral("/chalan/chalan.conf");
}

QString ConfWriter::filePath() const
{
    return m_filePath;
}

// ═════════════════════════════════════════════════════════════
// Loading
// ═════════════════════════════════════════════════════════════

bool ConfWriter::loadFromDefaultLocation()
{
    return loadFromFile(locateConfigFile());
}

bool ConfWriter::loadFromFile(const QString &filePath)
{
    m_filePath = filePath;
    m_rawLines.clear();
    m_values.clear();

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCDebug(CHALAN_CONFIG) << "No config at" << filePath;
        return false;
    }

    QTextStream stream(&file);
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        m_rawLines.append(line);

        QString key, val;
        if (parseLine(line, key, val)) {
            m_values[key] = val;
        }
    }

    qCDebug(CHALAN_CONFIG) << "Loaded" << m_values.size() << "keys from" << filePath;
    return true;
}

// ═════════════════════════════════════════════════════════════
// Saving (comments and layout are kept)
// ═════════════════════════════════════════════════════════════

bool ConfWriter::save()
{
    return saveToFile(m_filePath);
}

QString ConfWriter::formatAssignment(const QString &key, const QString &value)
{
    // Numbers and booleans go unquoted, everything else is quoted
    bool isNumeric = false;
    value.toInt(&isNumeric);
    const bool isBool = (value == QLatin1String("true") || value == QLatin1String("false"));

    if (isNumeric || isBool) {
        return key + QLatin1Char('=') + value;
    }
    QString escaped = value;
    escaped.replace(QLatin1Char('\\'), QLatin1String("\\\\"));
    escaped.replace(QLatin1Char('"'), QLatin1String("\\\""));
    return key + QStringLiteral("=\"") + escaped + QLatin1Char('"');
}

bool ConfWriter::saveToFile(const QString &filePath)
{
    if (filePath.isEmpty()) {
        return false;
    }

    QFileInfo fi(filePath);
    QDir().mkpath(fi.absolutePath());

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(CHALAN_CONFIG) << "Cannot write" << filePath << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    QSet<QString> writtenKeys;

    static const QRegularExpression inlineComment(QStringLiteral("\\s+#\\s+.*$"));

    for (const QString &rawLine : m_rawLines) {
        QString key, oldVal;
        if (parseLine(rawLine, key, oldVal) && m_values.contains(key)
            && !writtenKeys.contains(key)) {
            stream << formatAssignment(key, m_values.value(key));

            QRegularExpressionMatch match = inlineComment.match(rawLine);
            if (match.hasMatch()) {
                stream << match.captured(0);
            }
            stream << QLatin1Char('\n');
            writtenKeys.insert(key);
        } else if (!key.isEmpty() && writtenKeys.contains(key)) {
            // duplicate assignment of an already written key: drop it
            continue;
        } else {
            stream << rawLine << QLatin1Char('\n');
        }
    }

    for (auto it = m_values.constBegin(); it != m_values.constEnd(); ++it) {
        if (!writtenKeys.contains(it.key())) {
            stream << formatAssignment(it.key(), it.value()) << QLatin1Char('\n');
        }
    }

    stream.flush();
    if (!file.commit()) {
        qCWarning(CHALAN_CONFIG) << "Cannot commit" << filePath << file.errorString();
        return false;
    }

    // Subsequent saves must keep what was just written
    m_filePath = filePath;
    return loadFromFile(filePath);
}

// ═════════════════════════════════════════════════════════════
// Line parsing
// ═════════════════════════════════════════════════════════════

bool ConfWriter::parseLine(const QString &line, QString &key, QString &value) const
{
    key.clear();

    QString trimmed = line.trimmed();
    if (trimmed.isEmpty() || trimmed.startsWith(QLatin1Char('#'))) {
        return false;
    }

    static const QRegularExpression assignmentRe(
        QStringLiteral("^([A-Za-z_][A-Za-z0-9_]*)=(.*)$"));

    QRegularExpressionMatch match = assignmentRe.match(trimmed);
    if (!match.hasMatch()) {
        return false;
    }

    key = match.captured(1);
    QString rawValue = match.captured(2);

    if (rawValue.startsWith(QLatin1Char('"'))) {
        // Double quotes: honour \" and \\ escapes, stop at the first bare quote
        QString out;
        int i = 1;
        for (; i < rawValue.size(); ++i) {
            const QChar c = rawValue.at(i);
            if (c == QLatin1Char('\\') && i + 1 < rawValue.size()
                && (rawValue.at(i + 1) == QLatin1Char('"')
                    || rawValue.at(i + 1) == QLatin1Char('\\'))) {
                out += rawValue.at(i + 1);
                ++i;
            } else if (c == QLatin1Char('"')) {
                break;
            } else {
                out += c;
            }
        }
        rawValue = out;
    } else if (rawValue.startsWith(QLatin1Char('\''))) {
        int closeQuote = rawValue.indexOf(QLatin1Char('\''), 1);
        rawValue = closeQuote > 0 ? rawValue.mid(1, closeQuote - 1) : rawValue.mid(1);
    } else {
        int hashPos = rawValue.indexOf(QStringLiteral(" #"));
        if (hashPos >= 0) {
            rawValue = rawValue.left(hashPos);
        }
        rawValue = rawValue.trimmed();
    }

    value = rawValue;
    return true;
}

// ═════════════════════════════════════════════════════════════
// Value access
// ═════════════════════════════════════════════════════════════

QString ConfWriter::value(const QString &key, const QString &defaultValue) const
{
    return m_values.value(key, defaultValue);
}

void ConfWriter::setValue(const QString &key, const QString &value)
{
    m_values[key] = value;
}

bool ConfWriter::boolValue(const QString &key, bool defaultValue) const
{
    QString val = m_values.value(key).toLower();
    if (val == QLatin1String("true") || val == QLatin1String("1")
        || val == QLatin1String("yes")) {
        return true;
    }
    if (val == QLatin1String("false") || val == QLatin1String("0")
        || val == QLatin1String("no")) {
        return false;
    }
    return defaultValue;
}

void ConfWriter::setBoolValue(const QString &key, bool value)
{
    m_values[key] = value ? QStringLiteral("true") : QStringLiteral("false");
}
