// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "IndexStore.h"
#include "Utils.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>
#include <cmath>

#include <sqlite3.h>

static constexpr int kBusyTimeoutMs = 5000;
static constexpr int kDefaultPageSize = 256;

static constexpr const char* kSelectColumns =
    "SELECT path, size, mtime_ms, fingerprint, metadata, scan_state, last_scanned_at, last_error, failure_count "
    "FROM files";

namespace {
    /**
     * Owns one prepared statement; finalized on scope exit.
     */
    class Statement {
    public:
        Statement(sqlite3* db, const QString& sql) {
            const QByteArray utf8 = sql.toUtf8();
            m_rc = sqlite3_prepare_v2(db, utf8.constData(), static_cast<int>(utf8.size()), &m_stmt, nullptr);
        }

        ~Statement() {
            if (m_stmt) sqlite3_finalize(m_stmt);
        }

        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        [[nodiscard]] bool ok() const { return m_rc == SQLITE_OK && m_stmt != nullptr; }

        void bindText(int idx, const QString& v) {
            const QByteArray utf8 = v.toUtf8();
            sqlite3_bind_text(m_stmt, idx, utf8.constData(), static_cast<int>(utf8.size()), SQLITE_TRANSIENT);
        }

        void bindBlobText(int idx, const QByteArray& v) {
            sqlite3_bind_text(m_stmt, idx, v.constData(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        }

        void bindInt64(int idx, qint64 v) { sqlite3_bind_int64(m_stmt, idx, v); }
        void bindNull(int idx) { sqlite3_bind_null(m_stmt, idx); }

        int step() { return sqlite3_step(m_stmt); }

        [[nodiscard]] bool isNull(int col) const { return sqlite3_column_type(m_stmt, col) == SQLITE_NULL; }
        [[nodiscard]] qint64 int64At(int col) const { return sqlite3_column_int64(m_stmt, col); }

        [[nodiscard]] QByteArray bytesAt(int col) const {
            const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, col));
            const int n = sqlite3_column_bytes(m_stmt, col);
            return p ? QByteArray(p, n) : QByteArray();
        }

        [[nodiscard]] QString textAt(int col) const { return QString::fromUtf8(bytesAt(col)); }

    private:
        sqlite3_stmt* m_stmt = nullptr;
        int m_rc = SQLITE_ERROR;
    };

    FileRecord readRecordRow(const Statement& st) {
        FileRecord r;
        r.path = st.textAt(0);
        r.size = st.int64At(1);
        r.mtimeMs = st.int64At(2);
        r.fingerprint = st.textAt(3);
        r.metadata = IndexStore::decodeMetadata(st.bytesAt(4));
        r.scanState = scanStateFromInt(static_cast<int>(st.int64At(5))).value_or(ScanState::Unscanned);
        r.lastScannedAt = st.int64At(6);
        if (!st.isNull(7)) r.lastError = st.textAt(7);
        r.failureCount = static_cast<quint32>(std::max<qint64>(0, st.int64At(8)));
        return r;
    }

    // [dir + "/", dir + "0") covers every path strictly below dir ('0' follows '/').
    QString subtreeLow(const QString& dir) {
        return dir.endsWith(QLatin1Char('/')) ? dir : dir + QLatin1Char('/');
    }

    QString subtreeHigh(const QString& dir) {
        QString low = subtreeLow(dir);
        low.chop(1);
        return low + QLatin1Char('0');
    }

    bool matchesField(const RecordFilter& f, const FileRecord& r) {
        if (f.field.isEmpty()) return true;

        auto it = r.metadata.find(f.field);
        if (it == r.metadata.end()) return false;

        if (const auto* list = std::get_if<QStringList>(&it->second)) {
            for (const QString& s : *list) {
                if (s.compare(f.value, Qt::CaseInsensitive) == 0) return true;
            }
            return false;
        }

        return metadataValueToText(it->second).compare(f.value, Qt::CaseInsensitive) == 0;
    }
}

// ---------------------------------------------------------------------------
// RecordCursor

RecordCursor::RecordCursor(const IndexStore* store, RecordFilter filter)
    : m_store(store), m_filter(std::move(filter)) {
    if (m_filter.pageSize <= 0) m_filter.pageSize = kDefaultPageSize;
    restart();
}

std::optional<FileRecord> RecordCursor::next(QString* errorOut) {
    while (true) {
        if (!m_page.empty()) {
            FileRecord r = std::move(m_page.front());
            m_page.pop_front();
            return r;
        }

        if (m_exhausted || !m_store) return std::nullopt;

        std::vector<FileRecord> rows;
        if (!m_store->fetchPage(m_filter, m_lastPath, !m_started, rows, errorOut)) {
            m_exhausted = true;
            return std::nullopt;
        }

        m_started = true;
        if (static_cast<int>(rows.size()) < m_filter.pageSize) m_exhausted = true;
        if (!rows.empty()) m_lastPath = rows.back().path;

        for (auto& r : rows) {
            if (matchesField(m_filter, r)) m_page.push_back(std::move(r));
        }
    }
}

void RecordCursor::restart() {
    m_page.clear();
    m_lastPath = m_filter.afterPath;
    m_started = !m_filter.afterPath.isEmpty();
    m_exhausted = false;
}

// ---------------------------------------------------------------------------
// IndexStore

IndexStore::IndexStore() = default;

IndexStore::~IndexStore() {
    close();
}

QString IndexStore::lastDbError() const {
    if (!m_db) return QStringLiteral("database not open");
    return QString::fromUtf8(sqlite3_errmsg(m_db));
}

bool IndexStore::exec(const char* sql, QString* errorOut) {
    char* msg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &msg);
    if (rc != SQLITE_OK) {
        if (errorOut) {
            *errorOut = QStringLiteral("%1 (sql: %2)")
                            .arg(msg ? QString::fromUtf8(msg) : lastDbError(), QString::fromUtf8(sql));
        }
        if (msg) sqlite3_free(msg);
        return false;
    }
    if (msg) sqlite3_free(msg);
    return true;
}

bool IndexStore::requireWritable(QString* errorOut) const {
    if (!m_db) {
        if (errorOut) *errorOut = QStringLiteral("Index store is not open.");
        return false;
    }
    if (m_mode != Mode::ReadWrite) {
        if (errorOut) *errorOut = QStringLiteral("Index store was opened read-only.");
        return false;
    }
    return true;
}

bool IndexStore::open(const QString& path, Mode mode, QString* errorOut) {
    close();

    m_path = path;
    m_mode = mode;

    int flags = SQLITE_OPEN_NOMUTEX;
    if (mode == Mode::ReadWrite) {
        QDir().mkpath(QFileInfo(path).absolutePath());
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    } else {
        flags |= SQLITE_OPEN_READONLY;
    }

    const QByteArray native = QFile::encodeName(path);
    const int rc = sqlite3_open_v2(native.constData(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK) {
        if (errorOut) {
            *errorOut = QStringLiteral("Failed to open index %1: %2")
                            .arg(path, m_db ? lastDbError() : QString::fromUtf8(sqlite3_errstr(rc)));
        }
        sqlite3_close(m_db);
        m_db = nullptr;
        return false;
    }

    sqlite3_busy_timeout(m_db, kBusyTimeoutMs);

    if (mode == Mode::ReadWrite) {
        if (!exec("PRAGMA journal_mode=WAL", errorOut) ||
            !exec("PRAGMA synchronous=FULL", errorOut) ||
            !migrate(errorOut)) {
            close();
            return false;
        }
        return true;
    }

    // Readers only need the schema version; the writer owns creation and migration.
    Statement st(m_db, QStringLiteral("SELECT value FROM meta WHERE key = 'schema_version'"));
    if (!st.ok()) {
        if (errorOut) *errorOut = QStringLiteral("Index %1 has not been initialized: %2").arg(path, lastDbError());
        close();
        return false;
    }
    m_schemaVersion = st.step() == SQLITE_ROW ? st.textAt(0).toInt() : 1;
    return true;
}

void IndexStore::close() {
    if (!m_db) return;

    const int rc = sqlite3_close(m_db);
    if (rc != SQLITE_OK) {
        qWarning().noquote() << QStringLiteral("[store] close(%1) failed: %2").arg(m_path, lastDbError());
        sqlite3_close_v2(m_db);
    }
    m_db = nullptr;
    m_txDepth = 0;
    m_schemaVersion = 0;
}

bool IndexStore::migrate(QString* errorOut) {
    auto tableExists = [this](const char* name) {
        Statement st(m_db, QStringLiteral("SELECT count(*) FROM sqlite_master WHERE type = 'table' AND name = ?1"));
        if (!st.ok()) return false;
        st.bindText(1, QString::fromLatin1(name));
        return st.step() == SQLITE_ROW && st.int64At(0) > 0;
    };

    return runInTransaction([&](QString* err) {
        const bool hasFiles = tableExists("files");
        const bool hasMeta = tableExists("meta");

        int version = 0;
        if (hasMeta) {
            Statement st(m_db, QStringLiteral("SELECT value FROM meta WHERE key = 'schema_version'"));
            if (!st.ok()) {
                if (err) *err = lastDbError();
                return false;
            }
            if (st.step() == SQLITE_ROW) version = st.textAt(0).toInt();
        }
        if (version == 0 && hasFiles) version = 1; // files table predates the meta table

        if (!hasMeta &&
            !exec("CREATE TABLE meta (key TEXT PRIMARY KEY, value TEXT NOT NULL)", err)) {
            return false;
        }

        if (!hasFiles) {
            if (!exec("CREATE TABLE files ("
                      " path TEXT PRIMARY KEY,"
                      " size INTEGER NOT NULL DEFAULT 0,"
                      " mtime_ms INTEGER NOT NULL DEFAULT 0,"
                      " fingerprint TEXT NOT NULL DEFAULT '',"
                      " metadata TEXT NOT NULL DEFAULT '{}',"
                      " scan_state INTEGER NOT NULL DEFAULT 0,"
                      " last_scanned_at INTEGER NOT NULL DEFAULT 0,"
                      " last_error TEXT,"
                      " failure_count INTEGER NOT NULL DEFAULT 0)", err) ||
                !exec("CREATE INDEX files_scan_state ON files (scan_state)", err)) {
                return false;
            }
            version = kSchemaVersion;
        }

        if (version == 1) {
            if (!exec("ALTER TABLE files ADD COLUMN failure_count INTEGER NOT NULL DEFAULT 0", err) ||
                !exec("CREATE INDEX IF NOT EXISTS files_scan_state ON files (scan_state)", err)) {
                return false;
            }
            qInfo().noquote() << QStringLiteral("[store] migrated %1 from schema v1 to v2").arg(m_path);
            version = 2;
        }

        if (version > kSchemaVersion) {
            // Newer layouts only ever add columns with defaults; keep reading what we know.
            qWarning().noquote() << QStringLiteral("[store] %1 has schema v%2, newer than supported v%3")
                                    .arg(m_path).arg(version).arg(kSchemaVersion);
            m_schemaVersion = version;
            return true;
        }

        Statement put(m_db, QStringLiteral("INSERT INTO meta (key, value) VALUES ('schema_version', ?1) "
                                           "ON CONFLICT(key) DO UPDATE SET value = excluded.value"));
        if (!put.ok()) {
            if (err) *err = lastDbError();
            return false;
        }
        put.bindText(1, QString::number(version));
        if (put.step() != SQLITE_DONE) {
            if (err) *err = lastDbError();
            return false;
        }

        m_schemaVersion = version;
        return true;
    }, errorOut);
}

bool IndexStore::runInTransaction(const std::function<bool(QString*)>& body, QString* errorOut) {
    if (!requireWritable(errorOut)) return false;

    if (m_txDepth > 0) return body(errorOut);

    if (!exec("BEGIN IMMEDIATE", errorOut)) return false;

    ++m_txDepth;
    QString bodyErr;
    const bool ok = body(&bodyErr);
    --m_txDepth;

    if (ok) {
        QString commitErr;
        if (exec("COMMIT", &commitErr)) return true;
        bodyErr = QStringLiteral("commit failed: %1").arg(commitErr);
    }

    QString rollbackErr;
    if (!exec("ROLLBACK", &rollbackErr)) {
        qWarning().noquote() << QStringLiteral("[store] rollback failed: %1").arg(rollbackErr);
    }

    if (errorOut) *errorOut = bodyErr.isEmpty() ? QStringLiteral("transaction aborted") : bodyErr;
    return false;
}

bool IndexStore::upsert(const FileRecord& record, QString* errorOut) {
    return runInTransaction([&](QString* err) {
        Statement st(m_db, QStringLiteral(
            "INSERT INTO files (path, size, mtime_ms, fingerprint, metadata, scan_state,"
            "                   last_scanned_at, last_error, failure_count) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9) "
            "ON CONFLICT(path) DO UPDATE SET"
            " size = excluded.size,"
            " mtime_ms = excluded.mtime_ms,"
            " fingerprint = excluded.fingerprint,"
            " metadata = excluded.metadata,"
            " scan_state = excluded.scan_state,"
            " last_scanned_at = excluded.last_scanned_at,"
            " last_error = excluded.last_error,"
            " failure_count = excluded.failure_count"));
        if (!st.ok()) {
            if (err) *err = lastDbError();
            return false;
        }

        st.bindText(1, record.path);
        st.bindInt64(2, record.size);
        st.bindInt64(3, record.mtimeMs);
        st.bindText(4, record.fingerprint);
        st.bindBlobText(5, encodeMetadata(record.metadata));
        st.bindInt64(6, static_cast<qint64>(record.scanState));
        st.bindInt64(7, record.lastScannedAt);
        if (record.lastError) st.bindText(8, *record.lastError);
        else st.bindNull(8);
        st.bindInt64(9, static_cast<qint64>(record.failureCount));

        if (st.step() != SQLITE_DONE) {
            if (err) *err = QStringLiteral("upsert(%1): %2").arg(record.path, lastDbError());
            return false;
        }
        return true;
    }, errorOut);
}

bool IndexStore::remove(const QString& path, bool* removedOut, QString* errorOut) {
    if (removedOut) *removedOut = false;

    return runInTransaction([&](QString* err) {
        Statement st(m_db, QStringLiteral("DELETE FROM files WHERE path = ?1"));
        if (!st.ok()) {
            if (err) *err = lastDbError();
            return false;
        }
        st.bindText(1, path);
        if (st.step() != SQLITE_DONE) {
            if (err) *err = QStringLiteral("remove(%1): %2").arg(path, lastDbError());
            return false;
        }
        if (removedOut) *removedOut = sqlite3_changes(m_db) > 0;
        return true;
    }, errorOut);
}

bool IndexStore::removeSubtree(const QString& dir, int* removedOut, QString* errorOut) {
    if (removedOut) *removedOut = 0;

    return runInTransaction([&](QString* err) {
        Statement st(m_db, QStringLiteral("DELETE FROM files WHERE path >= ?1 AND path < ?2"));
        if (!st.ok()) {
            if (err) *err = lastDbError();
            return false;
        }
        st.bindText(1, subtreeLow(dir));
        st.bindText(2, subtreeHigh(dir));
        if (st.step() != SQLITE_DONE) {
            if (err) *err = QStringLiteral("removeSubtree(%1): %2").arg(dir, lastDbError());
            return false;
        }
        if (removedOut) *removedOut = sqlite3_changes(m_db);
        return true;
    }, errorOut);
}

bool IndexStore::renameInTx(const QString& from, const QString& to, bool* movedOut, QString* errorOut) {
    if (movedOut) *movedOut = false;

    {
        Statement existing(m_db, QStringLiteral("SELECT 1 FROM files WHERE path = ?1"));
        if (!existing.ok()) {
            if (errorOut) *errorOut = lastDbError();
            return false;
        }
        existing.bindText(1, from);
        if (existing.step() != SQLITE_ROW) return true; // nothing to move
    }

    if (from == to) {
        if (movedOut) *movedOut = true;
        return true;
    }

    Statement drop(m_db, QStringLiteral("DELETE FROM files WHERE path = ?1"));
    Statement move(m_db, QStringLiteral("UPDATE files SET path = ?1 WHERE path = ?2"));
    if (!drop.ok() || !move.ok()) {
        if (errorOut) *errorOut = lastDbError();
        return false;
    }

    drop.bindText(1, to);
    if (drop.step() != SQLITE_DONE) {
        if (errorOut) *errorOut = QStringLiteral("rename(%1 -> %2): %3").arg(from, to, lastDbError());
        return false;
    }

    move.bindText(1, to);
    move.bindText(2, from);
    if (move.step() != SQLITE_DONE) {
        if (errorOut) *errorOut = QStringLiteral("rename(%1 -> %2): %3").arg(from, to, lastDbError());
        return false;
    }

    if (movedOut) *movedOut = true;
    return true;
}

bool IndexStore::rename(const QString& from, const QString& to, bool* movedOut, QString* errorOut) {
    return runInTransaction([&](QString* err) {
        return renameInTx(from, to, movedOut, err);
    }, errorOut);
}

std::optional<std::vector<QString>> IndexStore::pathsBelow(const QString& dir, QString* errorOut) const {
    Statement st(m_db, QStringLiteral("SELECT path FROM files WHERE path >= ?1 AND path < ?2 ORDER BY path"));
    if (!st.ok()) {
        if (errorOut) *errorOut = lastDbError();
        return std::nullopt;
    }
    st.bindText(1, subtreeLow(dir));
    st.bindText(2, subtreeHigh(dir));

    std::vector<QString> out;
    int rc = SQLITE_ROW;
    while ((rc = st.step()) == SQLITE_ROW) out.push_back(st.textAt(0));
    if (rc != SQLITE_DONE) {
        if (errorOut) *errorOut = lastDbError();
        return std::nullopt;
    }
    return out;
}

bool IndexStore::renameSubtree(const QString& fromDir, const QString& toDir, int* movedOut, QString* errorOut) {
    if (movedOut) *movedOut = 0;

    return runInTransaction([&](QString* err) {
        auto paths = pathsBelow(fromDir, err);
        if (!paths) return false;

        // Whatever was indexed at the destination has been replaced on disk.
        if (!removeSubtree(toDir, nullptr, err)) return false;

        int moved = 0;
        for (const QString& p : *paths) {
            bool one = false;
            if (!renameInTx(p, Utils::rebasePath(p, fromDir, toDir), &one, err)) return false;
            if (one) ++moved;
        }

        if (movedOut) *movedOut = moved;
        return true;
    }, errorOut);
}

std::optional<FileRecord> IndexStore::get(const QString& path, QString* errorOut) const {
    if (!m_db) {
        if (errorOut) *errorOut = QStringLiteral("Index store is not open.");
        return std::nullopt;
    }

    Statement st(m_db, QString::fromLatin1(kSelectColumns) + QStringLiteral(" WHERE path = ?1"));
    if (!st.ok()) {
        if (errorOut) *errorOut = lastDbError();
        return std::nullopt;
    }
    st.bindText(1, path);

    const int rc = st.step();
    if (rc == SQLITE_ROW) return readRecordRow(st);
    if (rc != SQLITE_DONE && errorOut) *errorOut = QStringLiteral("get(%1): %2").arg(path, lastDbError());
    return std::nullopt;
}

RecordCursor IndexStore::query(RecordFilter filter) const {
    return RecordCursor(this, std::move(filter));
}

bool IndexStore::fetchPage(const RecordFilter& filter,
                           const QString& afterPath,
                           bool first,
                           std::vector<FileRecord>& out,
                           QString* errorOut) const {
    out.clear();
    if (!m_db) {
        if (errorOut) *errorOut = QStringLiteral("Index store is not open.");
        return false;
    }

    QString sql = QString::fromLatin1(kSelectColumns) + QStringLiteral(" WHERE 1 = 1");
    if (!first) sql += QStringLiteral(" AND path > ?");
    if (!filter.pathPrefix.isEmpty()) sql += QStringLiteral(" AND path >= ? AND path < ?");
    if (filter.state) sql += QStringLiteral(" AND scan_state = ?");
    if (filter.minFailureCount) sql += QStringLiteral(" AND failure_count >= ?");
    sql += QStringLiteral(" ORDER BY path LIMIT ?");

    Statement st(m_db, sql);
    if (!st.ok()) {
        if (errorOut) *errorOut = lastDbError();
        return false;
    }

    int idx = 1;
    if (!first) st.bindText(idx++, afterPath);
    if (!filter.pathPrefix.isEmpty()) {
        st.bindText(idx++, subtreeLow(filter.pathPrefix));
        st.bindText(idx++, subtreeHigh(filter.pathPrefix));
    }
    if (filter.state) st.bindInt64(idx++, static_cast<qint64>(*filter.state));
    if (filter.minFailureCount) st.bindInt64(idx++, static_cast<qint64>(*filter.minFailureCount));
    st.bindInt64(idx++, filter.pageSize > 0 ? filter.pageSize : kDefaultPageSize);

    int rc = SQLITE_ROW;
    while ((rc = st.step()) == SQLITE_ROW) out.push_back(readRecordRow(st));

    if (rc != SQLITE_DONE) {
        if (errorOut) *errorOut = QStringLiteral("query: %1").arg(lastDbError());
        return false;
    }
    return true;
}

std::optional<quint64> IndexStore::count(const RecordFilter& filter, QString* errorOut) const {
    if (!filter.field.isEmpty()) {
        RecordCursor c = query(filter);
        quint64 n = 0;
        QString err;
        while (c.next(&err)) ++n;
        if (!err.isEmpty()) {
            if (errorOut) *errorOut = err;
            return std::nullopt;
        }
        return n;
    }

    if (!m_db) {
        if (errorOut) *errorOut = QStringLiteral("Index store is not open.");
        return std::nullopt;
    }

    QString sql = QStringLiteral("SELECT count(*) FROM files WHERE 1 = 1");
    if (!filter.pathPrefix.isEmpty()) sql += QStringLiteral(" AND path >= ? AND path < ?");
    if (filter.state) sql += QStringLiteral(" AND scan_state = ?");
    if (filter.minFailureCount) sql += QStringLiteral(" AND failure_count >= ?");

    Statement st(m_db, sql);
    if (!st.ok()) {
        if (errorOut) *errorOut = lastDbError();
        return std::nullopt;
    }

    int idx = 1;
    if (!filter.pathPrefix.isEmpty()) {
        st.bindText(idx++, subtreeLow(filter.pathPrefix));
        st.bindText(idx++, subtreeHigh(filter.pathPrefix));
    }
    if (filter.state) st.bindInt64(idx++, static_cast<qint64>(*filter.state));
    if (filter.minFailureCount) st.bindInt64(idx++, static_cast<qint64>(*filter.minFailureCount));

    if (st.step() != SQLITE_ROW) {
        if (errorOut) *errorOut = lastDbError();
        return std::nullopt;
    }
    return static_cast<quint64>(st.int64At(0));
}

bool IndexStore::releaseMemory() {
    if (!m_db) return false;
    return sqlite3_db_release_memory(m_db) == SQLITE_OK;
}

QByteArray IndexStore::encodeMetadata(const MetadataMap& metadata) {
    QJsonObject obj;
    for (const auto& [key, value] : metadata) {
        if (const auto* s = std::get_if<QString>(&value)) {
            obj.insert(key, *s);
        } else if (const auto* i = std::get_if<qint64>(&value)) {
            obj.insert(key, QJsonValue(*i));
        } else if (const auto* l = std::get_if<QStringList>(&value)) {
            obj.insert(key, QJsonArray::fromStringList(*l));
        }
    }
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

MetadataMap IndexStore::decodeMetadata(const QByteArray& json) {
    MetadataMap out;
    if (json.isEmpty()) return out;

    const QJsonDocument doc = QJsonDocument::fromJson(json);
    if (!doc.isObject()) return out;

    const QJsonObject obj = doc.object();
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        const QJsonValue v = it.value();
        if (v.isString()) {
            out.emplace(it.key(), v.toString());
        } else if (v.isDouble()) {
            const double d = v.toDouble();
            const qint64 i = v.toInteger();
            if (std::isfinite(d) && static_cast<double>(i) == d) out.emplace(it.key(), i);
        } else if (v.isArray()) {
            QStringList items;
            for (const QJsonValue& e : v.toArray()) {
                if (e.isString()) items << e.toString();
            }
            out.emplace(it.key(), items);
        }
        // Anything else was written by a newer build; skip it rather than fail the read.
    }
    return out;
}
