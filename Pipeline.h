// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef COMICDEX_PIPELINE_H
#define COMICDEX_PIPELINE_H

#include <QString>

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

#include "ChangeDetector.h"
#include "IndexWriter.h"
#include "MemoryMonitor.h"
#include "PipelineConfig.h"
#include "ScanQueue.h"
#include "ScannerWorker.h"

/**
 * Owns and wires the indexing components:
 * ChangeDetector -> ScanQueue -> ScannerWorker -> IndexWriter, with the MemoryMonitor
 * throttling the workers.
 *
 * Everything is constructed here and passed down by reference; nothing is global.
 * Readers open their own IndexStore on config().databasePath.
 */
class Pipeline final {
public:
    using HealthHook = std::function<void()>;

    struct Health {
        std::map<QString, ChangeDetector::RootStatus> roots;
        bool storeDegraded = false;
        QString lastStoreError;
        MemorySample memory;
        size_t queueLength = 0;
        size_t inFlight = 0;
        bool sweepRunning = false;
        ScannerWorker::Stats scanner;
    };

    explicit Pipeline(PipelineConfig config, MemoryMonitor::Sampler sampler = {});
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    bool start(QString* errorOut = nullptr);

    // Stops intake, lets in-flight jobs commit, drains the writer and joins every thread.
    void stop();

    [[nodiscard]] bool isRunning() const { return m_running.load(); }

    /**
     * Queues a manual re-scan. A directory re-scans every archive below it.
     *
     * @return false with errorOut set if the path is outside every library root, does
     *         not exist, or is not an archive.
     */
    bool requestManualRescan(const QString& path, QString* errorOut = nullptr);

    /**
     * Starts a background sweep: a sweep job for every tracked path, a delete for every
     * tracked path that vanished, and a sweep job for every untracked archive found under
     * the roots. Paths at or above the failure threshold are skipped.
     *
     * @return false if a sweep is already running or the pipeline is stopped.
     */
    bool requestFullSweep(QString* errorOut = nullptr);

    // Blocks until the running sweep (if any) has emitted all of its jobs.
    void waitForSweep();

    [[nodiscard]] Health health() const;

    // Called from pipeline threads when the store's degraded flag flips or memory turns critical.
    void setHealthHook(HealthHook hook);

    int addInvalidationHook(ScannerWorker::InvalidationHook hook) { return m_scanner.addInvalidationHook(std::move(hook)); }
    void removeInvalidationHook(int id) { m_scanner.removeInvalidationHook(id); }

    [[nodiscard]] const PipelineConfig& config() const { return m_config; }
    [[nodiscard]] ChangeDetector& detector() { return m_detector; }
    [[nodiscard]] ScanQueue& queue() { return m_queue; }
    [[nodiscard]] IndexWriter& writer() { return m_writer; }
    [[nodiscard]] MemoryMonitor& monitor() { return m_monitor; }
    [[nodiscard]] ScannerWorker& scanner() { return m_scanner; }

private:
    void submit(ScanJob job);
    void runSweep();
    void notifyHealth();

    [[nodiscard]] bool isUnderRoot(const QString& path) const;

    const PipelineConfig m_config;

    ScanQueue m_queue;
    IndexWriter m_writer;
    MemoryMonitor m_monitor;
    ScannerWorker m_scanner;
    ChangeDetector m_detector;

    std::atomic<bool> m_running{false};
    int m_criticalHookId = 0;

    mutable std::mutex m_sweepMutex;
    std::thread m_sweepThread;
    std::atomic<bool> m_sweepRunning{false};
    std::atomic<bool> m_sweepCancel{false};

    std::mutex m_hookMutex;
    HealthHook m_healthHook;
};

#endif //COMICDEX_PIPELINE_H
