// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "ChangeDetector.h"
#include "PipelineError.h"
#include "Utils.h"

#include <QDebug>
#include <QDir>

#include <algorithm>
#include <utility>

ChangeDetector::ChangeDetector(Options options, Sink sink)
    : m_opts(std::move(options)), m_sink(std::move(sink)) {
    for (const QString& root : m_opts.roots) {
        m_rootStatus[root] = RootStatus{QStringLiteral("watching"), QString()};
    }
}

ChangeDetector::~ChangeDetector() {
    stop();
}

void ChangeDetector::start() {
    std::lock_guard lk(m_mutex);
    if (m_thread.joinable()) return;
    m_stopRequested = false;
    m_thread = std::thread([this]() { run(); });
}

void ChangeDetector::stop() {
    {
        std::lock_guard lk(m_mutex);
        m_stopRequested = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) m_thread.join();

    std::lock_guard lk(m_mutex);
    if (!m_buckets.empty()) {
        qInfo().noquote() << QStringLiteral("[debounce] stopping with %1 pending bucket(s)").arg(m_buckets.size());
    }
    m_buckets.clear();
}

QString ChangeDetector::rootFor(const QString& path) const {
    QString best;
    for (const QString& root : m_opts.roots) {
        if (Utils::isSameOrBelow(path, root) && root.size() > best.size()) best = root;
    }
    return best;
}

bool ChangeDetector::isInScope(const QString& path) const {
    if (m_opts.roots.isEmpty()) return !Utils::isHiddenBelow(path, QString());

    const QString root = rootFor(path);
    if (root.isEmpty()) return false;
    return !Utils::isHiddenBelow(path, root);
}

bool ChangeDetector::isTrackedFile(const QString& path) const {
    return Utils::hasArchiveExtension(path, m_opts.extensions) && isInScope(path);
}

bool ChangeDetector::isSuspendedLocked(const QString& path) const {
    const QString root = rootFor(path);
    if (root.isEmpty()) return false;
    auto it = m_rootStatus.find(root);
    return it != m_rootStatus.end() && it->second.state != QStringLiteral("watching");
}

void ChangeDetector::touchBucketLocked(const QString& path, ScanReason reason) {
    Bucket& b = m_buckets[path];
    b.reason = reason;
    b.deadline = Clock::now() + m_opts.quietPeriod;
}

void ChangeDetector::dropBucketsLocked(const QString& path, bool subtree) {
    if (!subtree) {
        m_buckets.erase(path);
        return;
    }
    for (auto it = m_buckets.begin(); it != m_buckets.end(); ) {
        if (Utils::isSameOrBelow(it->first, path)) it = m_buckets.erase(it);
        else ++it;
    }
}

void ChangeDetector::emitOrHoldLocked(ScanJob job, std::vector<ScanJob>& out) {
    if (isSuspendedLocked(job.path) || (!job.oldPath.isEmpty() && isSuspendedLocked(job.oldPath))) {
        m_held.push_back(std::move(job));
        return;
    }
    out.push_back(std::move(job));
}

void ChangeDetector::observe(const FsEvent& event) {
    const QString path = QDir::cleanPath(event.path);
    const QString oldPath = event.oldPath.isEmpty() ? QString() : QDir::cleanPath(event.oldPath);

    std::vector<ScanJob> immediate;
    bool wake = false;

    {
        std::lock_guard lk(m_mutex);

        switch (event.kind) {
            case FsEvent::Kind::Created:
            case FsEvent::Kind::Modified: {
                if (event.isDir || !isTrackedFile(path)) return;
                touchBucketLocked(path, event.kind == FsEvent::Kind::Created ? ScanReason::Create : ScanReason::Modify);
                wake = true;
                break;
            }

            case FsEvent::Kind::Deleted: {
                if (event.isDir) {
                    if (!isInScope(path)) return;
                    dropBucketsLocked(path, true);
                    ScanJob j = ScanJob::make(path, ScanReason::Delete);
                    j.subtree = true;
                    emitOrHoldLocked(std::move(j), immediate);
                    break;
                }
                if (!isTrackedFile(path)) return;
                dropBucketsLocked(path, false);
                emitOrHoldLocked(ScanJob::make(path, ScanReason::Delete), immediate);
                break;
            }

            case FsEvent::Kind::Moved: {
                if (event.isDir) {
                    const bool fromVisible = !oldPath.isEmpty() && isInScope(oldPath);
                    const bool toVisible = isInScope(path);
                    if (fromVisible) dropBucketsLocked(oldPath, true);

                    if (fromVisible && toVisible) {
                        emitOrHoldLocked(ScanJob::makeMove(oldPath, path, true), immediate);
                    } else if (fromVisible) {
                        ScanJob j = ScanJob::make(oldPath, ScanReason::Delete);
                        j.subtree = true;
                        emitOrHoldLocked(std::move(j), immediate);
                    }
                    // A directory arriving from outside is enumerated by the watch layer.
                    break;
                }

                const bool fromTracked = !oldPath.isEmpty() && isTrackedFile(oldPath);
                const bool toTracked = isTrackedFile(path);

                if (fromTracked) dropBucketsLocked(oldPath, false);

                if (fromTracked && toTracked) {
                    dropBucketsLocked(path, false);
                    emitOrHoldLocked(ScanJob::makeMove(oldPath, path), immediate);
                } else if (fromTracked) {
                    emitOrHoldLocked(ScanJob::make(oldPath, ScanReason::Delete), immediate);
                } else if (toTracked) {
                    touchBucketLocked(path, ScanReason::Create);
                    wake = true;
                }
                break;
            }
        }
    }

    if (wake) m_cv.notify_all();
    deliver(immediate);
}

void ChangeDetector::deliver(std::vector<ScanJob>& jobs) {
    if (!m_sink) {
        jobs.clear();
        return;
    }
    for (ScanJob& j : jobs) {
        qDebug().noquote() << QStringLiteral("[debounce] emit %1 %2").arg(scanReasonName(j.reason), j.path);
        m_sink(std::move(j));
    }
    jobs.clear();
}

void ChangeDetector::reportWatchError(const QString& root, const QString& message) {
    {
        std::lock_guard lk(m_mutex);
        RootStatus& st = m_rootStatus[root];
        const bool edge = st.state != QStringLiteral("error");
        st = RootStatus{QStringLiteral("error"), message};
        if (!edge) return;
    }

    qCritical().noquote() << QStringLiteral("[watch] %1")
                                 .arg(formatPipelineError(PipelineErrorKind::WatchError,
                                                          QStringLiteral("%1: %2").arg(root, message)));
}

void ChangeDetector::reportWatchRestored(const QString& root) {
    std::vector<ScanJob> released;
    {
        std::lock_guard lk(m_mutex);
        RootStatus& st = m_rootStatus[root];
        if (st.state == QStringLiteral("watching")) return;
        st = RootStatus{QStringLiteral("watching"), QString()};

        std::vector<ScanJob> stillHeld;
        for (ScanJob& j : m_held) {
            if (isSuspendedLocked(j.path) || (!j.oldPath.isEmpty() && isSuspendedLocked(j.oldPath)))
                stillHeld.push_back(std::move(j));
            else
                released.push_back(std::move(j));
        }
        m_held = std::move(stillHeld);
    }

    qInfo().noquote() << QStringLiteral("[watch] %1 is observable again (%2 held job(s) released)")
                             .arg(root)
                             .arg(released.size());

    m_cv.notify_all();
    deliver(released);
}

std::map<QString, ChangeDetector::RootStatus> ChangeDetector::status() const {
    std::lock_guard lk(m_mutex);
    return m_rootStatus;
}

size_t ChangeDetector::pendingBuckets() const {
    std::lock_guard lk(m_mutex);
    return m_buckets.size();
}

void ChangeDetector::run() {
    std::unique_lock lk(m_mutex);

    while (!m_stopRequested) {
        const Clock::time_point now = Clock::now();

        std::vector<std::pair<Clock::time_point, ScanJob>> due;
        std::optional<Clock::time_point> earliest;

        for (auto it = m_buckets.begin(); it != m_buckets.end(); ) {
            if (isSuspendedLocked(it->first)) {
                ++it;
                continue;
            }
            if (it->second.deadline <= now) {
                due.emplace_back(it->second.deadline, ScanJob::make(it->first, it->second.reason));
                it = m_buckets.erase(it);
                continue;
            }
            if (!earliest || it->second.deadline < *earliest) earliest = it->second.deadline;
            ++it;
        }

        if (!due.empty()) {
            std::stable_sort(due.begin(), due.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

            std::vector<ScanJob> jobs;
            jobs.reserve(due.size());
            for (auto& d : due) jobs.push_back(std::move(d.second));

            lk.unlock();
            deliver(jobs);
            lk.lock();
            continue;
        }

        if (earliest) m_cv.wait_until(lk, *earliest);
        else m_cv.wait(lk);
    }
}
