// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef COMICDEX_CHANGEDETECTOR_H
#define COMICDEX_CHANGEDETECTOR_H

#include <QString>
#include <QStringList>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "FileRecord.h"

// Raw filesystem notification, as delivered by the watch layer.
struct FsEvent {
    enum class Kind : quint8 { Created, Modified, Deleted, Moved };

    Kind kind = Kind::Modified;
    QString path;    // Moved: destination
    QString oldPath; // Moved only
    bool isDir = false;
};

/**
 * Turns raw filesystem events into a debounced, deduplicated stream of scan jobs.
 *
 * Create/modify events are held per path in a bucket; every new event for the path
 * overwrites the bucket and pushes its deadline out to now + quietPeriod. When a deadline
 * passes, the flush thread removes the bucket and emits one job whose reason is the last
 * event kind seen. Deletes and moves skip the buckets and are emitted immediately.
 *
 * While a root is reported lost, nothing below it is emitted; buckets and structural
 * jobs are held and released once the root is restored.
 */
class ChangeDetector final {
public:
    using Clock = std::chrono::steady_clock;
    using Sink = std::function<void(ScanJob job)>;

    struct Options {
        std::chrono::milliseconds quietPeriod{2000};
        QStringList extensions;
        QStringList roots; // canonical paths; empty accepts every path
    };

    struct RootStatus {
        QString state; // "watching" | "error"
        QString error; // empty if OK
    };

    ChangeDetector(Options options, Sink sink);
    ~ChangeDetector();

    ChangeDetector(const ChangeDetector&) = delete;
    ChangeDetector& operator=(const ChangeDetector&) = delete;

    void start();

    // Stops the flush thread. Pending buckets are discarded.
    void stop();

    // Returns immediately; the sink is only ever invoked outside the bucket lock.
    void observe(const FsEvent& event);

    void reportWatchError(const QString& root, const QString& message);
    void reportWatchRestored(const QString& root);

    [[nodiscard]] std::map<QString, RootStatus> status() const;
    [[nodiscard]] size_t pendingBuckets() const;

    [[nodiscard]] const Options& options() const { return m_opts; }

private:
    struct Bucket {
        ScanReason reason = ScanReason::Modify;
        Clock::time_point deadline;
    };

    // Root containing path, or empty if none (or roots are not configured).
    [[nodiscard]] QString rootFor(const QString& path) const;
    [[nodiscard]] bool isInScope(const QString& path) const;
    [[nodiscard]] bool isTrackedFile(const QString& path) const;

    void touchBucketLocked(const QString& path, ScanReason reason);
    void dropBucketsLocked(const QString& path, bool subtree);
    void emitOrHoldLocked(ScanJob job, std::vector<ScanJob>& out);
    [[nodiscard]] bool isSuspendedLocked(const QString& path) const;

    void run();
    void deliver(std::vector<ScanJob>& jobs);

    const Options m_opts;
    const Sink m_sink;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::unordered_map<QString, Bucket> m_buckets;
    std::map<QString, RootStatus> m_rootStatus;
    std::vector<ScanJob> m_held;

    bool m_stopRequested = false;
    std::thread m_thread;
};

#endif //COMICDEX_CHANGEDETECTOR_H
