// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef COMICDEX_INDEXSTORE_H
#define COMICDEX_INDEXSTORE_H

#include <QByteArray>
#include <QString>

#include <deque>
#include <functional>
#include <optional>
#include <vector>

#include "FileRecord.h"

struct sqlite3;
class IndexStore;

struct RecordFilter {
    // Directory whose descendants are returned; empty = everything.
    QString pathPrefix;

    std::optional<ScanState> state;

    // Metadata field equality, compared case-insensitively against the textual
    // rendering of the value. A list value matches if any element matches.
    QString field;
    QString value;

    std::optional<quint32> minFailureCount;

    // Resume after this path (exclusive); empty starts at the first path.
    QString afterPath;

    int pageSize = 256;
};

/**
 * Lazy, restartable sequence of records matching a filter.
 *
 * Records are fetched in path order, one page at a time. Every page is read in its
 * own read transaction, so a long iteration observes commits that happen while it
 * runs instead of a frozen snapshot. restart() rewinds to the first path.
 *
 * The cursor borrows the store; it must not outlive it.
 */
class RecordCursor {
public:
    std::optional<FileRecord> next(QString* errorOut = nullptr);
    void restart();

    [[nodiscard]] bool exhausted() const { return m_exhausted && m_page.empty(); }

private:
    friend class IndexStore;
    RecordCursor(const IndexStore* store, RecordFilter filter);

    const IndexStore* m_store = nullptr;
    RecordFilter m_filter;

    std::deque<FileRecord> m_page;
    QString m_lastPath;
    bool m_started = false;
    bool m_exhausted = false;
};

/**
 * Durable FileRecord table backed by SQLite.
 *
 * One IndexStore is one connection and must be used by one thread at a time.
 * The database runs in WAL mode: any number of ReadOnly stores can read while the
 * single ReadWrite store commits, and each read statement sees either the state
 * before or after a commit, never a partial one. Commits use synchronous=FULL, so an
 * acknowledged commit survives a crash.
 */
class IndexStore final {
public:
    enum class Mode { ReadWrite, ReadOnly };

    // v1: initial layout. v2: files.failure_count.
    static constexpr int kSchemaVersion = 2;

    IndexStore();
    ~IndexStore();

    IndexStore(const IndexStore&) = delete;
    IndexStore& operator=(const IndexStore&) = delete;

    bool open(const QString& path, Mode mode, QString* errorOut = nullptr);
    void close();

    [[nodiscard]] bool isOpen() const { return m_db != nullptr; }
    [[nodiscard]] const QString& path() const { return m_path; }
    [[nodiscard]] Mode mode() const { return m_mode; }
    [[nodiscard]] int schemaVersion() const { return m_schemaVersion; }

    bool upsert(const FileRecord& record, QString* errorOut = nullptr);
    bool remove(const QString& path, bool* removedOut = nullptr, QString* errorOut = nullptr);
    bool removeSubtree(const QString& dir, int* removedOut = nullptr, QString* errorOut = nullptr);

    /**
     * Moves the record stored under `from` to `to`, keeping every other column.
     * A record already stored at `to` is replaced.
     *
     * @param movedOut Set to false if there was no record at `from` (nothing changed).
     */
    bool rename(const QString& from, const QString& to, bool* movedOut = nullptr, QString* errorOut = nullptr);
    bool renameSubtree(const QString& fromDir, const QString& toDir, int* movedOut = nullptr, QString* errorOut = nullptr);

    [[nodiscard]] std::optional<FileRecord> get(const QString& path, QString* errorOut = nullptr) const;
    [[nodiscard]] RecordCursor query(RecordFilter filter = {}) const;
    [[nodiscard]] std::optional<quint64> count(const RecordFilter& filter = {}, QString* errorOut = nullptr) const;

    /**
     * Runs body inside one IMMEDIATE transaction. Returning false (or failing to
     * commit) rolls everything back. Nested calls join the outer transaction.
     */
    bool runInTransaction(const std::function<bool(QString* errorOut)>& body, QString* errorOut = nullptr);

    // Drops as much of the connection's page cache as possible.
    bool releaseMemory();

    [[nodiscard]] static QByteArray encodeMetadata(const MetadataMap& metadata);
    [[nodiscard]] static MetadataMap decodeMetadata(const QByteArray& json);

private:
    friend class RecordCursor;

    bool exec(const char* sql, QString* errorOut);
    bool migrate(QString* errorOut);
    [[nodiscard]] bool requireWritable(QString* errorOut) const;
    [[nodiscard]] QString lastDbError() const;

    bool fetchPage(const RecordFilter& filter,
                   const QString& afterPath,
                   bool first,
                   std::vector<FileRecord>& out,
                   QString* errorOut) const;

    bool renameInTx(const QString& from, const QString& to, bool* movedOut, QString* errorOut);
    [[nodiscard]] std::optional<std::vector<QString>> pathsBelow(const QString& dir, QString* errorOut) const;

    sqlite3* m_db = nullptr;
    QString m_path;
    Mode m_mode = Mode::ReadOnly;
    int m_schemaVersion = 0;
    int m_txDepth = 0;
};

#endif //COMICDEX_INDEXSTORE_H
