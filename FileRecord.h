// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef COMICDEX_FILERECORD_H
#define COMICDEX_FILERECORD_H

#include <QString>
#include <QStringList>
#include <QtGlobal>

#include <chrono>
#include <map>
#include <optional>
#include <variant>

/**
 * Lifecycle of a tracked archive.
 *
 * Unscanned -> Queued -> Scanning -> {Clean | Failed}, and Clean | Failed -> Queued
 * when a new change arrives. Values are persisted; do not renumber.
 */
enum class ScanState : quint8 {
    Unscanned = 0,
    Queued = 1,
    Scanning = 2,
    Clean = 3,
    Failed = 4,
};

[[nodiscard]] bool isAllowedTransition(ScanState from, ScanState to);
[[nodiscard]] QString scanStateName(ScanState s);
[[nodiscard]] std::optional<ScanState> scanStateFromName(const QString& name);
[[nodiscard]] std::optional<ScanState> scanStateFromInt(int v);

// Metadata is an open schema: field name -> string | integer | list of strings.
using MetadataValue = std::variant<QString, qint64, QStringList>;
using MetadataMap = std::map<QString, MetadataValue>;

// Renders any metadata value as text ("a, b" for lists).
[[nodiscard]] QString metadataValueToText(const MetadataValue& v);

struct FileRecord {
    QString path;

    qint64 size = 0;
    qint64 mtimeMs = 0;
    QString fingerprint;

    MetadataMap metadata;

    ScanState scanState = ScanState::Unscanned;
    qint64 lastScannedAt = 0; // unix ms; 0 = never
    std::optional<QString> lastError;

    // Consecutive failed scans; reset by a Clean commit.
    quint32 failureCount = 0;

    bool operator==(const FileRecord& o) const = default;
};

enum class ScanReason : quint8 {
    Create,
    Modify,
    Delete,
    Move,
    Manual,
    Sweep,
};

/**
 * Ordering class of a job; higher dequeues first.
 *
 * Delete and move outrank explicit user requests: a stale index entry is worse
 * than making the user wait one extra job.
 */
enum class ScanPriority : quint8 {
    BackgroundSweep = 0,
    FilesystemChange = 1,
    Manual = 2,
    Structural = 3,
};

[[nodiscard]] ScanPriority priorityForReason(ScanReason r);
[[nodiscard]] QString scanReasonName(ScanReason r);

struct ScanJob {
    using Clock = std::chrono::steady_clock;

    QString path;
    QString oldPath;   // Move only: where the record currently lives
    bool subtree = false; // Delete / Move of a whole directory

    ScanReason reason = ScanReason::Modify;
    ScanPriority priority = ScanPriority::FilesystemChange;

    Clock::time_point enqueuedAt{};
    Clock::time_point notBefore{}; // deferred jobs only

    [[nodiscard]] static ScanJob make(const QString& path, ScanReason reason) {
        ScanJob j;
        j.path = path;
        j.reason = reason;
        j.priority = priorityForReason(reason);
        return j;
    }

    [[nodiscard]] static ScanJob makeMove(const QString& from, const QString& to, bool subtree = false) {
        ScanJob j = make(to, ScanReason::Move);
        j.oldPath = from;
        j.subtree = subtree;
        return j;
    }
};

#endif //COMICDEX_FILERECORD_H
