// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef COMICDEX_SCANNERWORKER_H
#define COMICDEX_SCANNERWORKER_H

#include <QString>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "FileRecord.h"
#include "PipelineError.h"

class IndexStore;
class IndexWriter;
class MemoryMonitor;
class ScanQueue;

/**
 * Pool of decode threads draining the scan queue.
 *
 * Each thread owns a read-only index connection for its lookups; every mutation goes
 * through the shared IndexWriter and is awaited before the job's path is released, so a
 * path's next job always sees the previous job's commit.
 */
class ScannerWorker final {
public:
    // Invoked with a path whose cached view is stale (the old side of a move, or a removed path).
    using InvalidationHook = std::function<void(const QString& path)>;

    struct Options {
        QString databasePath;
        int workerCount = 2;
        std::chrono::milliseconds deferDelay{2000};
        std::chrono::milliseconds ioTimeout{30000};
        qint64 maxDescriptorBytes = 4 * 1024 * 1024;
        quint32 failureSuppressThreshold = 3;
    };

    struct Stats {
        quint64 decoded = 0;
        quint64 clean = 0;
        quint64 failed = 0;
        quint64 unchanged = 0;
        quint64 deferred = 0;
        quint64 suppressed = 0;
        quint64 removed = 0;
        quint64 moved = 0;
    };

    struct Extraction {
        MetadataMap metadata;
        PipelineErrorKind errorKind = PipelineErrorKind::ArchiveOpenError;
        QString error; // empty on success
    };

    ScannerWorker(Options options, ScanQueue& queue, IndexWriter& writer, MemoryMonitor& monitor);
    ~ScannerWorker();

    ScannerWorker(const ScannerWorker&) = delete;
    ScannerWorker& operator=(const ScannerWorker&) = delete;

    // The index must already exist (IndexWriter::start() creates it).
    bool start(QString* errorOut = nullptr);

    // Waits for the threads; they exit once the queue is shut down.
    void join();

    int addInvalidationHook(InvalidationHook hook);
    void removeInvalidationHook(int id);

    // Asks every thread to drop its connection cache before its next job.
    void dropCaches();

    [[nodiscard]] Stats stats() const;

    /**
     * Opens an archive and extracts its embedded descriptor.
     *
     * Only the descriptor entry is inflated, capped at maxDescriptorBytes; the whole
     * operation is bounded by ioTimeout. Archives without a descriptor (or in a format
     * whose contents cannot be read) yield empty metadata. PageCount falls back to the
     * number of image entries.
     */
    [[nodiscard]] static Extraction extractMetadata(const QString& path,
                                                    std::chrono::milliseconds ioTimeout,
                                                    qint64 maxDescriptorBytes);

private:
    struct Counters {
        std::atomic<quint64> decoded{0};
        std::atomic<quint64> clean{0};
        std::atomic<quint64> failed{0};
        std::atomic<quint64> unchanged{0};
        std::atomic<quint64> deferred{0};
        std::atomic<quint64> suppressed{0};
        std::atomic<quint64> removed{0};
        std::atomic<quint64> moved{0};
    };

    void run(int index, IndexStore& reader);
    void handle(const ScanJob& job, IndexStore& reader);
    void handleDelete(const ScanJob& job, IndexStore& reader);
    void handleMove(const ScanJob& job, IndexStore& reader);
    void scan(const ScanJob& job, IndexStore& reader);
    void removeVanished(const QString& path);
    void invalidate(const QString& path);

    const Options m_opts;
    ScanQueue& m_queue;
    IndexWriter& m_writer;
    MemoryMonitor& m_monitor;

    std::vector<std::unique_ptr<IndexStore>> m_readers;
    std::vector<std::thread> m_threads;
    std::unique_ptr<std::atomic<bool>[]> m_dropCache;

    std::mutex m_hookMutex;
    std::map<int, InvalidationHook> m_hooks;
    int m_nextHookId = 1;

    Counters m_counters;
};

#endif //COMICDEX_SCANNERWORKER_H
