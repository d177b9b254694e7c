// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef COMICDEX_PIPELINECONFIG_H
#define COMICDEX_PIPELINECONFIG_H

#include <QString>
#include <QStringList>

#include <chrono>
#include <optional>

#include "MemoryMonitor.h"

class QSettings;

struct PipelineConfig {
    // [library]
    QStringList roots;      // canonical, deduplicated
    QStringList extensions; // lower case, without dot

    // [index]
    QString databasePath;

    // [debounce]
    std::chrono::milliseconds quietPeriod{2000};

    // [scanner]
    int workerCount = 2;
    std::chrono::milliseconds deferDelay{2000};
    std::chrono::milliseconds ioTimeout{30000};
    qint64 maxDescriptorBytes = 4 * 1024 * 1024;
    quint32 failureSuppressThreshold = 3;

    // [memory]
    MemoryMonitor::Options memory;

    // [sweep]
    bool sweepOnStartup = true;

    [[nodiscard]] static QString defaultDatabasePath();

    /**
     * Reads the configuration from an INI-style QSettings.
     *
     * Missing keys take their defaults; values that are present but invalid are logged
     * and replaced by the default as well.
     *
     * @return std::nullopt if no library root is configured.
     */
    [[nodiscard]] static std::optional<PipelineConfig> fromSettings(QSettings& settings, QString* errorOut = nullptr);
};

#endif //COMICDEX_PIPELINECONFIG_H
