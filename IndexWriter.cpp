// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "IndexWriter.h"
#include "PipelineError.h"

#include <QDebug>

#include <utility>

namespace {
    void applyStat(FileRecord& r, const Utils::FileStat& st) {
        r.size = st.size;
        r.mtimeMs = st.mtimeMs;
        r.fingerprint = st.fingerprint;
    }

    // Moves a record along the legal path to Scanning (via Queued when it is at rest).
    bool advanceToScanning(FileRecord& r) {
        if (r.scanState == ScanState::Scanning) return true;
        if (r.scanState != ScanState::Queued) {
            if (!isAllowedTransition(r.scanState, ScanState::Queued)) return false;
            r.scanState = ScanState::Queued;
        }
        if (!isAllowedTransition(r.scanState, ScanState::Scanning)) return false;
        r.scanState = ScanState::Scanning;
        return true;
    }

    bool rejectTransition(WriteResult& res, QString* err, ScanState from, const char* to) {
        res.rejected = true;
        if (err) *err = QStringLiteral("illegal transition %1 -> %2").arg(scanStateName(from), QLatin1String(to));
        return false;
    }
}

IndexWriter::IndexWriter(QString databasePath)
    : m_dbPath(std::move(databasePath)) {}

IndexWriter::~IndexWriter() {
    stop();
}

bool IndexWriter::start(QString* errorOut) {
    std::lock_guard lk(m_mutex);
    if (m_thread.joinable()) return true;

    if (!m_store.open(m_dbPath, IndexStore::Mode::ReadWrite, errorOut)) return false;

    qInfo().noquote() << QStringLiteral("[writer] index %1 open (schema v%2)").arg(m_dbPath).arg(m_store.schemaVersion());

    m_accepting = true;
    m_stopRequested = false;
    m_thread = std::thread([this]() { run(); });
    return true;
}

void IndexWriter::stop() {
    {
        std::lock_guard lk(m_mutex);
        m_accepting = false;
        m_stopRequested = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) m_thread.join();
    m_store.close();
}

void IndexWriter::setHealthHook(HealthHook hook) {
    std::lock_guard lk(m_healthMutex);
    m_healthHook = std::move(hook);
}

IndexWriter::Health IndexWriter::health() const {
    std::lock_guard lk(m_healthMutex);
    return m_health;
}

void IndexWriter::recordOutcome(bool ok, const QString& error) {
    const bool degraded = !ok;
    HealthHook hook;
    {
        std::lock_guard lk(m_healthMutex);
        if (ok) {
            ++m_health.committed;
        } else {
            ++m_health.failed;
            m_health.lastError = error;
        }
        if (m_health.degraded == degraded) return;
        m_health.degraded = degraded;
        hook = m_healthHook;
    }
    if (hook) hook();
}

std::future<WriteResult> IndexWriter::submit(QString label, Apply apply) {
    Intent intent{std::move(label), std::move(apply), {}};
    std::future<WriteResult> fut = intent.done.get_future();

    {
        std::lock_guard lk(m_mutex);
        if (!m_accepting) {
            WriteResult r;
            r.error = QStringLiteral("index writer is not running");
            intent.done.set_value(std::move(r));
            return fut;
        }
        m_intents.push_back(std::move(intent));
    }
    m_cv.notify_one();
    return fut;
}

void IndexWriter::run() {
    while (true) {
        Intent intent;
        {
            std::unique_lock lk(m_mutex);
            m_cv.wait(lk, [this]() { return m_stopRequested || !m_intents.empty(); });
            if (m_intents.empty()) break; // stop requested and drained
            intent = std::move(m_intents.front());
            m_intents.pop_front();
        }
        execute(intent);
    }

    qInfo().noquote() << QStringLiteral("[writer] drained, stopping");
}

void IndexWriter::execute(Intent& intent) {
    WriteResult result;
    QString err;

    bool ok = m_store.runInTransaction([&](QString* e) {
        result = WriteResult{};
        return intent.apply(m_store, result, e);
    }, &err);

    if (!ok && result.rejected) {
        qWarning().noquote() << QStringLiteral("[writer] %1 rejected: %2").arg(intent.label, err);
        result.error = err;
        intent.done.set_value(std::move(result));
        return;
    }

    if (!ok) {
        qWarning().noquote() << QStringLiteral("[writer] %1 failed, retrying: %2").arg(intent.label, err);
        err.clear();
        ok = m_store.runInTransaction([&](QString* e) {
            result = WriteResult{};
            return intent.apply(m_store, result, e);
        }, &err);
    }

    if (ok) {
        result.ok = true;
        recordOutcome(true, QString());
    } else {
        result.ok = false;
        result.error = formatPipelineError(PipelineErrorKind::StoreTransactionError, err);
        qCritical().noquote() << QStringLiteral("[writer] %1: %2").arg(intent.label, result.error);
        recordOutcome(false, result.error);
    }

    intent.done.set_value(std::move(result));
}

std::future<WriteResult> IndexWriter::markQueued(const QString& path, std::optional<Utils::FileStat> stat) {
    return submit(QStringLiteral("markQueued(%1)").arg(path),
                  [path, stat](IndexStore& store, WriteResult& res, QString* err) {
        QString getErr;
        std::optional<FileRecord> rec = store.get(path, &getErr);
        if (!rec && !getErr.isEmpty()) {
            if (err) *err = getErr;
            return false;
        }

        if (!rec) {
            FileRecord r;
            r.path = path;
            if (stat) applyStat(r, *stat);
            r.scanState = ScanState::Queued;
            res.affected = 1;
            return store.upsert(r, err);
        }

        // The running scan commits first; the queued job rescans afterwards.
        if (rec->scanState == ScanState::Scanning || rec->scanState == ScanState::Queued) return true;

        if (!isAllowedTransition(rec->scanState, ScanState::Queued)) {
            return rejectTransition(res, err, rec->scanState, "queued");
        }
        rec->scanState = ScanState::Queued;
        res.affected = 1;
        return store.upsert(*rec, err);
    });
}

std::future<WriteResult> IndexWriter::markScanning(const QString& path, const Utils::FileStat& stat) {
    return submit(QStringLiteral("markScanning(%1)").arg(path),
                  [path, stat](IndexStore& store, WriteResult& res, QString* err) {
        QString getErr;
        std::optional<FileRecord> rec = store.get(path, &getErr);
        if (!rec && !getErr.isEmpty()) {
            if (err) *err = getErr;
            return false;
        }

        FileRecord r = rec.value_or(FileRecord{});
        r.path = path;
        if (!rec) applyStat(r, stat);

        if (!advanceToScanning(r)) {
            return rejectTransition(res, err, r.scanState, "scanning");
        }
        res.affected = 1;
        return store.upsert(r, err);
    });
}

std::future<WriteResult> IndexWriter::commitClean(const QString& path, const Utils::FileStat& stat, MetadataMap metadata) {
    return submit(QStringLiteral("commitClean(%1)").arg(path),
                  [path, stat, metadata = std::move(metadata)](IndexStore& store, WriteResult& res, QString* err) {
        QString getErr;
        std::optional<FileRecord> rec = store.get(path, &getErr);
        if (!rec) {
            if (!getErr.isEmpty()) {
                if (err) *err = getErr;
                return false;
            }
            // Removed while the scan ran (e.g. its directory was deleted); do not resurrect it.
            qDebug().noquote() << QStringLiteral("[writer] dropping result for vanished record %1").arg(path);
            return true;
        }

        if (!advanceToScanning(*rec) || !isAllowedTransition(rec->scanState, ScanState::Clean)) {
            return rejectTransition(res, err, rec->scanState, "clean");
        }

        applyStat(*rec, stat);
        rec->metadata = metadata;
        rec->scanState = ScanState::Clean;
        rec->lastScannedAt = Utils::nowMsUtc();
        rec->lastError.reset();
        rec->failureCount = 0;

        res.affected = 1;
        return store.upsert(*rec, err);
    });
}

std::future<WriteResult> IndexWriter::commitFailed(const QString& path, std::optional<Utils::FileStat> stat, QString error) {
    return submit(QStringLiteral("commitFailed(%1)").arg(path),
                  [path, stat, error = std::move(error)](IndexStore& store, WriteResult& res, QString* err) {
        QString getErr;
        std::optional<FileRecord> rec = store.get(path, &getErr);
        if (!rec) {
            if (!getErr.isEmpty()) {
                if (err) *err = getErr;
                return false;
            }
            qDebug().noquote() << QStringLiteral("[writer] dropping failure for vanished record %1").arg(path);
            return true;
        }

        if (!advanceToScanning(*rec) || !isAllowedTransition(rec->scanState, ScanState::Failed)) {
            return rejectTransition(res, err, rec->scanState, "failed");
        }

        if (stat) applyStat(*rec, *stat);
        rec->scanState = ScanState::Failed;
        rec->lastScannedAt = Utils::nowMsUtc();
        rec->lastError = error;
        rec->failureCount += 1;

        res.affected = 1;
        return store.upsert(*rec, err);
    });
}

std::future<WriteResult> IndexWriter::restoreFailed(const QString& path) {
    return submit(QStringLiteral("restoreFailed(%1)").arg(path),
                  [path](IndexStore& store, WriteResult& res, QString* err) {
        QString getErr;
        std::optional<FileRecord> rec = store.get(path, &getErr);
        if (!rec) {
            if (err && !getErr.isEmpty()) *err = getErr;
            return getErr.isEmpty();
        }
        if (rec->scanState == ScanState::Failed) return true;

        if (!advanceToScanning(*rec)) {
            return rejectTransition(res, err, rec->scanState, "failed");
        }
        rec->scanState = ScanState::Failed;
        res.affected = 1;
        return store.upsert(*rec, err);
    });
}

std::future<WriteResult> IndexWriter::remove(const QString& path) {
    return submit(QStringLiteral("remove(%1)").arg(path),
                  [path](IndexStore& store, WriteResult& res, QString* err) {
        bool removed = false;
        if (!store.remove(path, &removed, err)) return false;
        res.affected = removed ? 1 : 0;
        return true;
    });
}

std::future<WriteResult> IndexWriter::removeSubtree(const QString& dir) {
    return submit(QStringLiteral("removeSubtree(%1)").arg(dir),
                  [dir](IndexStore& store, WriteResult& res, QString* err) {
        int removed = 0;
        if (!store.removeSubtree(dir, &removed, err)) return false;
        res.affected = removed;
        return true;
    });
}

std::future<WriteResult> IndexWriter::move(const QString& from, const QString& to) {
    return submit(QStringLiteral("move(%1 -> %2)").arg(from, to),
                  [from, to](IndexStore& store, WriteResult& res, QString* err) {
        bool moved = false;
        if (!store.rename(from, to, &moved, err)) return false;
        res.affected = moved ? 1 : 0;
        return true;
    });
}

std::future<WriteResult> IndexWriter::moveSubtree(const QString& fromDir, const QString& toDir) {
    return submit(QStringLiteral("moveSubtree(%1 -> %2)").arg(fromDir, toDir),
                  [fromDir, toDir](IndexStore& store, WriteResult& res, QString* err) {
        int moved = 0;
        if (!store.renameSubtree(fromDir, toDir, &moved, err)) return false;
        res.affected = moved;
        return true;
    });
}
