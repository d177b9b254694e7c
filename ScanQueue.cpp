// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "ScanQueue.h"

#include <QDebug>

void ScanQueue::insertLocked(ScanJob job, bool deferred) {
    const quint64 seq = m_nextSeq++;
    const QString path = job.path;

    if (deferred) {
        m_deferred.emplace(job.notBefore, seq, path);
    } else {
        m_ready.insert(ReadyKey{job.priority, job.enqueuedAt, seq, path});
    }

    m_byPath[path] = Slot{std::move(job), seq, deferred};
}

void ScanQueue::eraseLocked(const QString& path) {
    auto it = m_byPath.find(path);
    if (it == m_byPath.end()) return;

    const Slot& s = it->second;
    if (s.deferred) {
        m_deferred.erase(DeferredKey{s.job.notBefore, s.seq, path});
    } else {
        m_ready.erase(ReadyKey{s.job.priority, s.job.enqueuedAt, s.seq, path});
    }
    m_byPath.erase(it);
}

void ScanQueue::enqueue(ScanJob job) {
    {
        std::lock_guard lk(m_mutex);
        if (m_shutdown) return;

        job.enqueuedAt = Clock::now();
        job.notBefore = {};

        auto it = m_byPath.find(job.path);
        if (it != m_byPath.end()) {
            const ScanJob& existing = it->second.job;
            if (job.priority < existing.priority) {
                qDebug().noquote() << QStringLiteral("[queue] keep %1 job for %2 (ignoring lower-priority %3)")
                                      .arg(scanReasonName(existing.reason), job.path, scanReasonName(job.reason));
                return;
            }

            // A move that gets replaced still owes a cleanup of its source path,
            // otherwise the record at the old location would never be touched again.
            if (existing.reason == ScanReason::Move && !existing.oldPath.isEmpty() &&
                !(job.reason == ScanReason::Move && job.oldPath == existing.oldPath)) {
                ScanJob cleanup = ScanJob::make(existing.oldPath, ScanReason::Delete);
                cleanup.subtree = existing.subtree;
                cleanup.enqueuedAt = job.enqueuedAt;
                if (!m_byPath.contains(cleanup.path)) insertLocked(std::move(cleanup), false);
            }

            eraseLocked(job.path);
        }

        insertLocked(std::move(job), false);
    }
    m_cv.notify_all();
}

void ScanQueue::enqueueDeferred(ScanJob job, std::chrono::milliseconds delay) {
    {
        std::lock_guard lk(m_mutex);
        if (m_shutdown) return;
        if (m_byPath.contains(job.path)) return;

        job.enqueuedAt = Clock::now();
        job.notBefore = job.enqueuedAt + delay;
        insertLocked(std::move(job), true);
    }
    m_cv.notify_all();
}

void ScanQueue::promoteDueLocked(Clock::time_point now) {
    while (!m_deferred.empty()) {
        auto first = m_deferred.begin();
        if (std::get<0>(*first) > now) break;

        const QString path = std::get<2>(*first);
        m_deferred.erase(first);

        auto it = m_byPath.find(path);
        if (it == m_byPath.end()) continue;

        Slot& s = it->second;
        s.deferred = false;
        m_ready.insert(ReadyKey{s.job.priority, s.job.enqueuedAt, s.seq, path});
    }
}

std::optional<ScanJob> ScanQueue::takeEligibleLocked() {
    for (auto it = m_ready.begin(); it != m_ready.end(); ++it) {
        if (m_inFlight.contains(it->path)) continue;

        const QString path = it->path;
        auto slotIt = m_byPath.find(path);
        ScanJob job = std::move(slotIt->second.job);

        m_ready.erase(it);
        m_byPath.erase(slotIt);
        m_inFlight.insert(path);
        return job;
    }
    return std::nullopt;
}

std::optional<ScanJob> ScanQueue::dequeue() {
    std::unique_lock lk(m_mutex);

    while (true) {
        if (m_shutdown) return std::nullopt;

        promoteDueLocked(Clock::now());
        if (auto job = takeEligibleLocked()) return job;

        if (!m_deferred.empty()) {
            m_cv.wait_until(lk, std::get<0>(*m_deferred.begin()));
        } else {
            m_cv.wait(lk);
        }
    }
}

std::optional<ScanJob> ScanQueue::tryDequeue() {
    std::lock_guard lk(m_mutex);
    if (m_shutdown) return std::nullopt;

    promoteDueLocked(Clock::now());
    return takeEligibleLocked();
}

void ScanQueue::complete(const QString& path) {
    {
        std::lock_guard lk(m_mutex);
        m_inFlight.erase(path);
        if (!m_byPath.contains(path)) return;
    }
    m_cv.notify_all();
}

void ScanQueue::shutdown() {
    {
        std::lock_guard lk(m_mutex);
        if (m_shutdown) return;
        m_shutdown = true;
    }
    m_cv.notify_all();
}

bool ScanQueue::isShutdown() const {
    std::lock_guard lk(m_mutex);
    return m_shutdown;
}

size_t ScanQueue::size() const {
    std::lock_guard lk(m_mutex);
    return m_byPath.size();
}

size_t ScanQueue::inFlightCount() const {
    std::lock_guard lk(m_mutex);
    return m_inFlight.size();
}

bool ScanQueue::contains(const QString& path) const {
    std::lock_guard lk(m_mutex);
    return m_byPath.contains(path);
}

std::optional<ScanJob> ScanQueue::queuedJob(const QString& path) const {
    std::lock_guard lk(m_mutex);
    auto it = m_byPath.find(path);
    if (it == m_byPath.end()) return std::nullopt;
    return it->second.job;
}
