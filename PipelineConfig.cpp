// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "PipelineConfig.h"
#include "Utils.h"

#include <QDebug>
#include <QDir>
#include <QSettings>
#include <QStandardPaths>

// Reads a positive integer key from the current group; anything else falls back to `def`.
static qint64 readPositive(QSettings& s, const QString& key, qint64 def) {
    if (!s.contains(key)) return def;

    bool ok = false;
    const qint64 v = s.value(key).toLongLong(&ok);
    if (!ok || v <= 0) {
        qWarning().noquote() << QStringLiteral("[config] %1/%2=%3 is invalid, using %4")
                                .arg(s.group(), key, s.value(key).toString())
                                .arg(def);
        return def;
    }
    return v;
}

QString PipelineConfig::defaultDatabasePath() {
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (base.isEmpty()) base = QDir::homePath() + QStringLiteral("/.local/share/comicdex");
    return QDir(base).filePath(QStringLiteral("index.sqlite3"));
}

std::optional<PipelineConfig> PipelineConfig::fromSettings(QSettings& s, QString* errorOut) {
    PipelineConfig c;

    s.beginGroup(QStringLiteral("library"));
    for (const QString& raw : s.value(QStringLiteral("roots")).toStringList()) {
        const QString trimmed = raw.trimmed();
        if (trimmed.isEmpty()) continue;
        const QString root = Utils::canonicalPath(trimmed);
        if (!c.roots.contains(root)) c.roots.push_back(root);
    }
    for (const QString& raw : s.value(QStringLiteral("extensions")).toStringList()) {
        QString ext = raw.trimmed().toLower();
        if (ext.startsWith(QLatin1Char('.'))) ext.remove(0, 1);
        if (!ext.isEmpty() && !c.extensions.contains(ext)) c.extensions.push_back(ext);
    }
    s.endGroup();

    if (c.extensions.isEmpty()) c.extensions = Utils::defaultArchiveExtensions();

    s.beginGroup(QStringLiteral("index"));
    c.databasePath = s.value(QStringLiteral("databasePath")).toString().trimmed();
    s.endGroup();
    if (c.databasePath.isEmpty()) c.databasePath = defaultDatabasePath();

    s.beginGroup(QStringLiteral("debounce"));
    c.quietPeriod = std::chrono::milliseconds(readPositive(s, QStringLiteral("quietPeriodMs"), c.quietPeriod.count()));
    s.endGroup();

    s.beginGroup(QStringLiteral("scanner"));
    c.workerCount = static_cast<int>(readPositive(s, QStringLiteral("workerCount"), c.workerCount));
    c.deferDelay = std::chrono::milliseconds(readPositive(s, QStringLiteral("deferDelayMs"), c.deferDelay.count()));
    c.ioTimeout = std::chrono::milliseconds(readPositive(s, QStringLiteral("ioTimeoutMs"), c.ioTimeout.count()));
    c.maxDescriptorBytes = readPositive(s, QStringLiteral("maxDescriptorBytes"), c.maxDescriptorBytes);
    c.failureSuppressThreshold = static_cast<quint32>(
        readPositive(s, QStringLiteral("failureSuppressThreshold"), c.failureSuppressThreshold));
    s.endGroup();

    static constexpr quint64 kMiB = 1024ull * 1024;

    s.beginGroup(QStringLiteral("memory"));
    c.memory.elevatedBytes = static_cast<quint64>(readPositive(s, QStringLiteral("elevatedMiB"), 1024)) * kMiB;
    c.memory.criticalBytes = static_cast<quint64>(readPositive(s, QStringLiteral("criticalMiB"), 2048)) * kMiB;
    c.memory.hysteresisBytes = static_cast<quint64>(readPositive(s, QStringLiteral("hysteresisMiB"), 64)) * kMiB;
    c.memory.interval = std::chrono::milliseconds(readPositive(s, QStringLiteral("sampleIntervalMs"), 1000));
    s.endGroup();

    if (c.memory.criticalBytes <= c.memory.elevatedBytes) {
        qWarning().noquote() << QStringLiteral("[config] memory/criticalMiB must exceed memory/elevatedMiB, using defaults");
        c.memory.elevatedBytes = 1024 * kMiB;
        c.memory.criticalBytes = 2048 * kMiB;
    }

    s.beginGroup(QStringLiteral("sweep"));
    c.sweepOnStartup = s.value(QStringLiteral("onStartup"), true).toBool();
    s.endGroup();

    if (c.roots.isEmpty()) {
        if (errorOut) *errorOut = QStringLiteral("no library roots configured (library/roots)");
        return std::nullopt;
    }

    return c;
}
