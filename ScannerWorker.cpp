// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "ScannerWorker.h"
#include "ArchiveReader.h"
#include "ComicInfoParser.h"
#include "IndexStore.h"
#include "IndexWriter.h"
#include "MemoryMonitor.h"
#include "ScanQueue.h"
#include "Utils.h"

#include <QDebug>
#include <QDeadlineTimer>

#include <algorithm>

ScannerWorker::ScannerWorker(Options options, ScanQueue& queue, IndexWriter& writer, MemoryMonitor& monitor)
    : m_opts(std::move(options)), m_queue(queue), m_writer(writer), m_monitor(monitor) {}

ScannerWorker::~ScannerWorker() {
    join();
}

bool ScannerWorker::start(QString* errorOut) {
    if (!m_threads.empty()) return true;

    const int n = std::max(1, m_opts.workerCount);

    m_readers.clear();
    for (int i = 0; i < n; ++i) {
        auto reader = std::make_unique<IndexStore>();
        if (!reader->open(m_opts.databasePath, IndexStore::Mode::ReadOnly, errorOut)) {
            m_readers.clear();
            return false;
        }
        m_readers.push_back(std::move(reader));
    }

    m_dropCache = std::make_unique<std::atomic<bool>[]>(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) m_dropCache[i].store(false);

    m_threads.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        IndexStore& reader = *m_readers[static_cast<size_t>(i)];
        m_threads.emplace_back([this, i, &reader]() { run(i, reader); });
    }

    qInfo().noquote() << QStringLiteral("[scan] %1 decode thread(s) started").arg(n);
    return true;
}

void ScannerWorker::join() {
    for (std::thread& t : m_threads) {
        if (t.joinable()) t.join();
    }
    m_threads.clear();
    m_readers.clear();
}

int ScannerWorker::addInvalidationHook(InvalidationHook hook) {
    std::lock_guard lk(m_hookMutex);
    const int id = m_nextHookId++;
    m_hooks.emplace(id, std::move(hook));
    return id;
}

void ScannerWorker::removeInvalidationHook(int id) {
    std::lock_guard lk(m_hookMutex);
    m_hooks.erase(id);
}

void ScannerWorker::invalidate(const QString& path) {
    std::vector<InvalidationHook> hooks;
    {
        std::lock_guard lk(m_hookMutex);
        hooks.reserve(m_hooks.size());
        for (const auto& kv : m_hooks) hooks.push_back(kv.second);
    }
    for (const auto& h : hooks) h(path);
}

void ScannerWorker::dropCaches() {
    if (!m_dropCache) return;
    for (size_t i = 0; i < m_threads.size(); ++i) m_dropCache[i].store(true, std::memory_order_release);
}

ScannerWorker::Stats ScannerWorker::stats() const {
    Stats s;
    s.decoded = m_counters.decoded.load();
    s.clean = m_counters.clean.load();
    s.failed = m_counters.failed.load();
    s.unchanged = m_counters.unchanged.load();
    s.deferred = m_counters.deferred.load();
    s.suppressed = m_counters.suppressed.load();
    s.removed = m_counters.removed.load();
    s.moved = m_counters.moved.load();
    return s;
}

void ScannerWorker::run(int index, IndexStore& reader) {
    while (std::optional<ScanJob> job = m_queue.dequeue()) {
        if (m_dropCache[index].exchange(false, std::memory_order_acq_rel)) {
            reader.releaseMemory();
        }

        handle(*job, reader);
        m_queue.complete(job->path);
    }
}

void ScannerWorker::handle(const ScanJob& job, IndexStore& reader) {
    switch (job.reason) {
        case ScanReason::Delete:
            handleDelete(job, reader);
            return;
        case ScanReason::Move:
            handleMove(job, reader);
            return;
        case ScanReason::Create:
        case ScanReason::Modify:
        case ScanReason::Manual:
        case ScanReason::Sweep:
            scan(job, reader);
            return;
    }
}

void ScannerWorker::removeVanished(const QString& path) {
    const WriteResult r = m_writer.remove(path).get();
    if (!r.ok) return; // logged by the writer

    if (r.affected > 0) {
        ++m_counters.removed;
        qInfo().noquote() << QStringLiteral("[scan] removed %1").arg(path);
    }
    invalidate(path);
}

void ScannerWorker::handleDelete(const ScanJob& job, IndexStore& reader) {
    if (job.subtree) {
        const WriteResult r = m_writer.removeSubtree(job.path).get();
        if (!r.ok) return;

        m_counters.removed += static_cast<quint64>(r.affected);
        qInfo().noquote() << QStringLiteral("[scan] removed %1 record(s) below %2").arg(r.affected).arg(job.path);
        invalidate(job.path);
        return;
    }

    // Deleted and re-created before we got here (e.g. an editor replacing the file).
    if (Utils::statFile(job.path)) {
        qDebug().noquote() << QStringLiteral("[scan] %1 exists again, rescanning").arg(job.path);
        scan(ScanJob::make(job.path, ScanReason::Create), reader);
        return;
    }

    removeVanished(job.path);
}

void ScannerWorker::handleMove(const ScanJob& job, IndexStore& reader) {
    if (job.subtree) {
        const WriteResult r = m_writer.moveSubtree(job.oldPath, job.path).get();
        if (!r.ok) return;

        m_counters.moved += static_cast<quint64>(r.affected);
        qInfo().noquote() << QStringLiteral("[scan] moved %1 record(s) %2 -> %3").arg(r.affected).arg(job.oldPath, job.path);
        invalidate(job.oldPath);
        return;
    }

    const WriteResult r = m_writer.move(job.oldPath, job.path).get();
    if (!r.ok) return;

    if (r.affected == 0) {
        qDebug().noquote() << QStringLiteral("[scan] no record at %1, scanning %2 as new").arg(job.oldPath, job.path);
        scan(ScanJob::make(job.path, ScanReason::Create), reader);
        return;
    }

    ++m_counters.moved;
    qInfo().noquote() << QStringLiteral("[scan] moved %1 -> %2").arg(job.oldPath, job.path);
    invalidate(job.oldPath);

    // A rename keeps size, mtime and inode; only rescan when the content changed as well.
    const auto st = Utils::statFile(job.path);
    const auto rec = reader.get(job.path);
    if (!st || !rec || rec->fingerprint != st->fingerprint || rec->scanState != ScanState::Clean) {
        scan(ScanJob::make(job.path, ScanReason::Modify), reader);
    }
}

void ScannerWorker::scan(const ScanJob& job, IndexStore& reader) {
    QString statErr;
    const std::optional<Utils::FileStat> st = Utils::statFile(job.path, &statErr);
    if (!st) {
        qDebug().noquote() << QStringLiteral("[scan] %1 is gone: %2").arg(job.path, statErr);
        removeVanished(job.path);
        return;
    }

    QString readErr;
    const std::optional<FileRecord> rec = reader.get(job.path, &readErr);
    if (!rec && !readErr.isEmpty()) {
        qWarning().noquote() << QStringLiteral("[scan] lookup of %1 failed: %2").arg(job.path, readErr);
    }

    // Unchanged since the last successful scan: reuse the stored metadata.
    if (job.reason != ScanReason::Manual && rec && rec->lastScannedAt > 0 && !rec->lastError &&
        rec->fingerprint == st->fingerprint) {
        const WriteResult r = m_writer.commitClean(job.path, *st, rec->metadata).get();
        if (r.ok) ++m_counters.unchanged;
        return;
    }

    if (job.reason != ScanReason::Manual && m_monitor.currentTier() == MemoryTier::Critical) {
        // Only sweep jobs count as automatic retries; a filesystem event always gets its deferred scan.
        if (job.reason == ScanReason::Sweep && rec && rec->failureCount >= m_opts.failureSuppressThreshold) {
            qInfo().noquote() << QStringLiteral("[scan] dropping sweep of %1 under memory pressure (%2 consecutive failures)")
                                 .arg(job.path)
                                 .arg(rec->failureCount);
            const WriteResult r = m_writer.restoreFailed(job.path).get();
            if (!r.ok) return; // logged by the writer
            ++m_counters.suppressed;
            return;
        }

        m_queue.enqueueDeferred(job, m_opts.deferDelay);
        ++m_counters.deferred;
        qDebug().noquote() << QStringLiteral("[scan] memory critical, deferring %1 by %2ms")
                              .arg(job.path)
                              .arg(m_opts.deferDelay.count());
        return;
    }

    if (!m_writer.markScanning(job.path, *st).get().ok) return;

    ++m_counters.decoded;
    Extraction ex = extractMetadata(job.path, m_opts.ioTimeout, m_opts.maxDescriptorBytes);

    if (ex.error.isEmpty()) {
        const WriteResult r = m_writer.commitClean(job.path, *st, std::move(ex.metadata)).get();
        if (r.ok) {
            ++m_counters.clean;
            qDebug().noquote() << QStringLiteral("[scan] %1 clean (%2)").arg(job.path, scanReasonName(job.reason));
        }
        return;
    }

    const QString error = formatPipelineError(ex.errorKind, ex.error);
    qWarning().noquote() << QStringLiteral("[scan] %1 failed: %2").arg(job.path, error);

    const WriteResult r = m_writer.commitFailed(job.path, *st, error).get();
    if (r.ok) ++m_counters.failed;
}

ScannerWorker::Extraction ScannerWorker::extractMetadata(const QString& path,
                                                         std::chrono::milliseconds ioTimeout,
                                                         qint64 maxDescriptorBytes) {
    Extraction out;

    std::unique_ptr<ArchiveReader> archive = ArchiveReader::forPath(path);
    if (!archive) return out; // tracked, but contents are not readable

    archive->setDeadline(QDeadlineTimer(ioTimeout));

    QString err;
    if (!archive->open(path, &err)) {
        out.errorKind = archive->timedOut() ? PipelineErrorKind::IoTimeoutError : PipelineErrorKind::ArchiveOpenError;
        out.error = err;
        return out;
    }

    if (const ArchiveReader::Entry* entry = archive->findByFileName(ComicInfoParser::kDescriptorName)) {
        std::optional<QByteArray> xml = archive->readEntry(*entry, maxDescriptorBytes, &err);
        if (!xml) {
            out.errorKind = archive->timedOut() ? PipelineErrorKind::IoTimeoutError : PipelineErrorKind::ArchiveOpenError;
            out.error = err;
            return out;
        }

        std::optional<MetadataMap> parsed = ComicInfoParser::parse(*xml, &err);
        if (!parsed) {
            out.errorKind = PipelineErrorKind::ParseError;
            out.error = QStringLiteral("%1: %2").arg(entry->name, err);
            return out;
        }
        out.metadata = std::move(*parsed);
    }

    const QString pageCountKey = QStringLiteral("PageCount");
    if (out.metadata.find(pageCountKey) == out.metadata.end()) {
        const quint32 images = archive->imageEntryCount();
        if (images > 0) out.metadata[pageCountKey] = static_cast<qint64>(images);
    }

    archive->close();
    return out;
}
