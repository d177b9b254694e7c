// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "Pipeline.h"
#include "IndexStore.h"
#include "Utils.h"

#include <QDebug>
#include <QDirIterator>
#include <QFileInfo>
#include <QSet>

static ScannerWorker::Options scannerOptionsFor(const PipelineConfig& c) {
    ScannerWorker::Options o;
    o.databasePath = c.databasePath;
    o.workerCount = c.workerCount;
    o.deferDelay = c.deferDelay;
    o.ioTimeout = c.ioTimeout;
    o.maxDescriptorBytes = c.maxDescriptorBytes;
    o.failureSuppressThreshold = c.failureSuppressThreshold;
    return o;
}

static ChangeDetector::Options detectorOptionsFor(const PipelineConfig& c) {
    ChangeDetector::Options o;
    o.quietPeriod = c.quietPeriod;
    o.extensions = c.extensions;
    o.roots = c.roots;
    return o;
}

Pipeline::Pipeline(PipelineConfig config, MemoryMonitor::Sampler sampler)
    : m_config(std::move(config)),
      m_writer(m_config.databasePath),
      m_monitor(m_config.memory, std::move(sampler)),
      m_scanner(scannerOptionsFor(m_config), m_queue, m_writer, m_monitor),
      m_detector(detectorOptionsFor(m_config), [this](ScanJob job) { submit(std::move(job)); }) {}

Pipeline::~Pipeline() {
    stop();
}

bool Pipeline::start(QString* errorOut) {
    if (m_running.load()) return true;

    if (!m_writer.start(errorOut)) return false;
    m_writer.setHealthHook([this]() { notifyHealth(); });

    if (!m_scanner.start(errorOut)) {
        m_writer.stop();
        return false;
    }

    m_criticalHookId = m_monitor.addCriticalHook([this]() {
        qWarning().noquote() << QStringLiteral("[memory] critical, dropping caches");
        m_scanner.dropCaches();
        notifyHealth();
    });
    m_monitor.start();
    m_detector.start();

    m_running = true;

    qInfo().noquote() << QStringLiteral("[scan] pipeline started: %1 root(s), index %2")
                         .arg(m_config.roots.size())
                         .arg(m_config.databasePath);

    if (m_config.sweepOnStartup) {
        QString err;
        if (!requestFullSweep(&err)) {
            qWarning().noquote() << QStringLiteral("[sweep] startup sweep not started: %1").arg(err);
        }
    }
    return true;
}

void Pipeline::stop() {
    if (!m_running.exchange(false)) return;

    m_detector.stop();

    m_sweepCancel = true;
    waitForSweep();

    m_queue.shutdown();
    m_scanner.join();

    m_monitor.stop();
    if (m_criticalHookId) {
        m_monitor.removeCriticalHook(m_criticalHookId);
        m_criticalHookId = 0;
    }

    m_writer.stop();

    qInfo().noquote() << QStringLiteral("[scan] pipeline stopped (%1 job(s) left unprocessed)").arg(m_queue.size());
}

void Pipeline::setHealthHook(HealthHook hook) {
    std::lock_guard lk(m_hookMutex);
    m_healthHook = std::move(hook);
}

void Pipeline::notifyHealth() {
    HealthHook hook;
    {
        std::lock_guard lk(m_hookMutex);
        hook = m_healthHook;
    }
    if (hook) hook();
}

Pipeline::Health Pipeline::health() const {
    Health h;
    h.roots = m_detector.status();

    const IndexWriter::Health wh = m_writer.health();
    h.storeDegraded = wh.degraded;
    h.lastStoreError = wh.lastError;

    h.memory = m_monitor.lastSample();
    h.queueLength = m_queue.size();
    h.inFlight = m_queue.inFlightCount();
    h.sweepRunning = m_sweepRunning.load();
    h.scanner = m_scanner.stats();
    return h;
}

bool Pipeline::isUnderRoot(const QString& path) const {
    for (const QString& root : m_config.roots) {
        if (Utils::isSameOrBelow(path, root)) return true;
    }
    return false;
}

void Pipeline::submit(ScanJob job) {
    switch (job.reason) {
        case ScanReason::Create:
        case ScanReason::Modify:
        case ScanReason::Manual:
        case ScanReason::Sweep:
            // Submitted before the job is visible to workers, so the writer applies it first.
            m_writer.markQueued(job.path, Utils::statFile(job.path));
            break;
        case ScanReason::Delete:
        case ScanReason::Move:
            break;
    }
    m_queue.enqueue(std::move(job));
}

bool Pipeline::requestManualRescan(const QString& rawPath, QString* errorOut) {
    if (!m_running.load()) {
        if (errorOut) *errorOut = QStringLiteral("pipeline is not running");
        return false;
    }

    const QString path = Utils::canonicalPath(rawPath);
    if (!isUnderRoot(path)) {
        if (errorOut) *errorOut = QStringLiteral("%1 is not inside a library root").arg(path);
        return false;
    }

    const QFileInfo fi(path);
    if (!fi.exists()) {
        if (errorOut) *errorOut = QStringLiteral("%1 does not exist").arg(path);
        return false;
    }

    if (fi.isDir()) {
        int queued = 0;
        QDirIterator it(path, QDir::Files | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
        while (it.hasNext()) {
            const QString p = QDir::cleanPath(it.next());
            if (!Utils::hasArchiveExtension(p, m_config.extensions)) continue;
            if (Utils::isHiddenBelow(p, path)) continue;
            submit(ScanJob::make(p, ScanReason::Manual));
            ++queued;
        }
        qInfo().noquote() << QStringLiteral("[queue] manual rescan of %1: %2 archive(s)").arg(path).arg(queued);
        return true;
    }

    if (!Utils::hasArchiveExtension(path, m_config.extensions)) {
        if (errorOut) *errorOut = QStringLiteral("%1 is not an archive").arg(path);
        return false;
    }

    submit(ScanJob::make(path, ScanReason::Manual));
    qInfo().noquote() << QStringLiteral("[queue] manual rescan of %1").arg(path);
    return true;
}

bool Pipeline::requestFullSweep(QString* errorOut) {
    std::lock_guard lk(m_sweepMutex);

    if (!m_running.load() || m_queue.isShutdown()) {
        if (errorOut) *errorOut = QStringLiteral("pipeline is not running");
        return false;
    }
    if (m_sweepRunning.load()) {
        if (errorOut) *errorOut = QStringLiteral("a sweep is already running");
        return false;
    }

    if (m_sweepThread.joinable()) m_sweepThread.join();

    m_sweepCancel = false;
    m_sweepRunning = true;
    m_sweepThread = std::thread([this]() { runSweep(); });
    return true;
}

void Pipeline::waitForSweep() {
    std::lock_guard lk(m_sweepMutex);
    if (m_sweepThread.joinable()) m_sweepThread.join();
}

void Pipeline::runSweep() {
    IndexStore reader;
    QString err;

    quint64 tracked = 0, vanished = 0, suppressed = 0, discovered = 0;
    QSet<QString> known;

    if (!reader.open(m_config.databasePath, IndexStore::Mode::ReadOnly, &err)) {
        qWarning().noquote() << QStringLiteral("[sweep] cannot open index: %1").arg(err);
        m_sweepRunning = false;
        return;
    }

    qInfo().noquote() << QStringLiteral("[sweep] started");

    RecordCursor cursor = reader.query();
    while (!m_sweepCancel.load()) {
        std::optional<FileRecord> rec = cursor.next(&err);
        if (!rec) break;

        known.insert(rec->path);
        ++tracked;

        if (!Utils::statFile(rec->path)) {
            submit(ScanJob::make(rec->path, ScanReason::Delete));
            ++vanished;
            continue;
        }
        if (rec->failureCount >= m_config.failureSuppressThreshold) {
            ++suppressed;
            continue;
        }
        submit(ScanJob::make(rec->path, ScanReason::Sweep));
    }

    if (!err.isEmpty()) {
        qWarning().noquote() << QStringLiteral("[sweep] reading the index failed: %1").arg(err);
    }

    // Archives nobody told us about (e.g. added while the daemon was down).
    for (const QString& root : m_config.roots) {
        if (m_sweepCancel.load()) break;

        QDirIterator it(root, QDir::Files | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
        while (it.hasNext() && !m_sweepCancel.load()) {
            const QString p = QDir::cleanPath(it.next());
            if (known.contains(p)) continue;
            if (!Utils::hasArchiveExtension(p, m_config.extensions)) continue;
            if (Utils::isHiddenBelow(p, root)) continue;

            submit(ScanJob::make(p, ScanReason::Sweep));
            ++discovered;
        }
    }

    qInfo().noquote() << QStringLiteral("[sweep] %1: %2 tracked, %3 vanished, %4 suppressed, %5 new")
                         .arg(m_sweepCancel.load() ? QStringLiteral("cancelled") : QStringLiteral("done"))
                         .arg(tracked)
                         .arg(vanished)
                         .arg(suppressed)
                         .arg(discovered);

    m_sweepRunning = false;
}
