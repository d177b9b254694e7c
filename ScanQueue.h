// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef COMICDEX_SCANQUEUE_H
#define COMICDEX_SCANQUEUE_H

#include <QString>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <set>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

#include "FileRecord.h"

/**
 * Pending scan jobs, at most one per path, ordered by priority then enqueue time.
 *
 * A dequeued path stays "in flight" until complete() is called for it. While a path is
 * in flight, a newer job for the same path waits in the queue and is skipped by
 * dequeue(), so one path is never scanned by two workers at once.
 */
class ScanQueue final {
public:
    using Clock = ScanJob::Clock;

    ScanQueue() = default;

    ScanQueue(const ScanQueue&) = delete;
    ScanQueue& operator=(const ScanQueue&) = delete;

    /**
     * Adds a job, or replaces the job already queued for the same path when the new
     * job's priority is at least as high (the replacement takes a fresh timestamp).
     * A lower-priority job for an already queued path is dropped. Never blocks.
     */
    void enqueue(ScanJob job);

    /**
     * Puts a job back that must not run before now + delay. Dropped if a job for the
     * same path is already queued, since that one was produced by a newer event.
     */
    void enqueueDeferred(ScanJob job, std::chrono::milliseconds delay);

    /**
     * Takes the highest-priority, oldest eligible job and marks its path in flight.
     * Blocks while nothing is eligible. Returns std::nullopt once shutdown() was called.
     */
    std::optional<ScanJob> dequeue();

    // Non-blocking variant of dequeue().
    std::optional<ScanJob> tryDequeue();

    void complete(const QString& path);

    // Wakes every blocked dequeue() with std::nullopt. Idempotent.
    void shutdown();

    [[nodiscard]] bool isShutdown() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t inFlightCount() const;
    [[nodiscard]] bool contains(const QString& path) const;
    [[nodiscard]] std::optional<ScanJob> queuedJob(const QString& path) const;

private:
    struct ReadyKey {
        ScanPriority priority;
        Clock::time_point enqueuedAt;
        quint64 seq;
        QString path;

        bool operator<(const ReadyKey& o) const {
            if (priority != o.priority) return priority > o.priority;
            if (enqueuedAt != o.enqueuedAt) return enqueuedAt < o.enqueuedAt;
            return seq < o.seq;
        }
    };

    using DeferredKey = std::tuple<Clock::time_point, quint64, QString>;

    struct Slot {
        ScanJob job;
        quint64 seq = 0;
        bool deferred = false;
    };

    void insertLocked(ScanJob job, bool deferred);
    void eraseLocked(const QString& path);
    void promoteDueLocked(Clock::time_point now);
    std::optional<ScanJob> takeEligibleLocked();

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;

    std::unordered_map<QString, Slot> m_byPath;
    std::set<ReadyKey> m_ready;
    std::set<DeferredKey> m_deferred;
    std::unordered_set<QString> m_inFlight;

    quint64 m_nextSeq = 1;
    bool m_shutdown = false;
};

#endif //COMICDEX_SCANQUEUE_H
