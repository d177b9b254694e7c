// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef COMICDEX_INDEXWRITER_H
#define COMICDEX_INDEXWRITER_H

#include <QString>

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <thread>

#include "FileRecord.h"
#include "IndexStore.h"
#include "Utils.h"

struct WriteResult {
    bool ok = false;
    int affected = 0; // records created, updated, removed or moved
    bool rejected = false; // the record's state did not allow the change; nothing was written
    QString error;
};

/**
 * The single thread allowed to commit to the index.
 *
 * Other threads submit intents; each intent runs in its own transaction on the writer
 * thread, strictly in submission order, and resolves its future once committed (or
 * failed). A failed intent is retried once right away; if the retry fails too, the
 * writer reports itself degraded and moves on to the next intent. An intent rejected by
 * the record state machine is resolved at once and does not degrade the writer.
 */
class IndexWriter final {
public:
    using HealthHook = std::function<void()>;

    struct Health {
        bool degraded = false;
        QString lastError;
        quint64 committed = 0;
        quint64 failed = 0;
    };

    explicit IndexWriter(QString databasePath);
    ~IndexWriter();

    IndexWriter(const IndexWriter&) = delete;
    IndexWriter& operator=(const IndexWriter&) = delete;

    // Opens (creating or migrating) the database and starts the writer thread.
    bool start(QString* errorOut = nullptr);

    // Commits everything already submitted, then stops. Later submissions fail.
    void stop();

    [[nodiscard]] const QString& databasePath() const { return m_dbPath; }

    // Called on the writer thread whenever the degraded flag flips.
    void setHealthHook(HealthHook hook);
    [[nodiscard]] Health health() const;

    // Unscanned | Clean | Failed -> Queued; creates the record if needed. No-op while Scanning.
    std::future<WriteResult> markQueued(const QString& path, std::optional<Utils::FileStat> stat = std::nullopt);

    // -> Scanning, passing through Queued when needed.
    std::future<WriteResult> markScanning(const QString& path, const Utils::FileStat& stat);

    // Scanning -> Clean. Replaces metadata and stats, clears lastError and failureCount.
    std::future<WriteResult> commitClean(const QString& path, const Utils::FileStat& stat, MetadataMap metadata);

    // Scanning -> Failed. Keeps the previous metadata, records the error, bumps failureCount.
    std::future<WriteResult> commitFailed(const QString& path, std::optional<Utils::FileStat> stat, QString error);

    // Back to Failed without counting another failure; for jobs dropped after repeated failures.
    std::future<WriteResult> restoreFailed(const QString& path);

    std::future<WriteResult> remove(const QString& path);
    std::future<WriteResult> removeSubtree(const QString& dir);

    // affected == 0 means there was no record at `from`.
    std::future<WriteResult> move(const QString& from, const QString& to);
    std::future<WriteResult> moveSubtree(const QString& fromDir, const QString& toDir);

    using Apply = std::function<bool(IndexStore& store, WriteResult& result, QString* errorOut)>;

    // Runs `apply` in its own transaction on the writer thread. Returning false rolls back;
    // setting result.rejected as well skips the retry and leaves the health untouched.
    std::future<WriteResult> submit(QString label, Apply apply);

private:

    struct Intent {
        QString label;
        Apply apply;
        std::promise<WriteResult> done;
    };

    void run();
    void execute(Intent& intent);
    void recordOutcome(bool ok, const QString& error);

    const QString m_dbPath;
    IndexStore m_store;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<Intent> m_intents;
    bool m_accepting = false;
    bool m_stopRequested = false;
    std::thread m_thread;

    mutable std::mutex m_healthMutex;
    Health m_health;
    HealthHook m_healthHook;
};

#endif //COMICDEX_INDEXWRITER_H
