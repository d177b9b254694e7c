// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "IndexStore.h"

#include <QTemporaryDir>

#include <sqlite3.h>

#include <cassert>
#include <cstdio>

namespace {
    FileRecord makeRecord(const QString& path, ScanState state = ScanState::Clean) {
        FileRecord r;
        r.path = path;
        r.size = 1234;
        r.mtimeMs = 1700000000000;
        r.fingerprint = QStringLiteral("00ff00ff00ff00ff");
        r.scanState = state;
        r.lastScannedAt = 1700000000500;
        return r;
    }

    QStringList drain(RecordCursor c) {
        QStringList out;
        QString err;
        while (auto r = c.next(&err)) out << r->path;
        assert(err.isEmpty() && "cursor error");
        return out;
    }
}

static void test_round_trip() {
    QTemporaryDir tmp;
    assert(tmp.isValid());

    IndexStore store;
    QString err;
    assert(store.open(tmp.filePath("index.sqlite3"), IndexStore::Mode::ReadWrite, &err) && "open");
    assert(store.schemaVersion() == IndexStore::kSchemaVersion);

    FileRecord r = makeRecord("/lib/Watchmen/01.cbz");
    r.metadata["Title"] = QStringLiteral("At Midnight, All the Agents");
    r.metadata["Number"] = QStringLiteral("1");
    r.metadata["Year"] = qint64(1986);
    r.metadata["Writer"] = QStringList{"Alan Moore"};
    r.lastError = QStringLiteral("ParseError: earlier problem");
    r.failureCount = 2;
    assert(store.upsert(r, &err));

    auto back = store.get(r.path, &err);
    assert(back && "record stored");
    assert(*back == r && "every field survives");

    assert(!store.get("/lib/missing.cbz", &err) && err.isEmpty() && "absent is not an error");
}

static void test_remove_and_rename() {
    QTemporaryDir tmp;
    IndexStore store;
    assert(store.open(tmp.filePath("index.sqlite3"), IndexStore::Mode::ReadWrite));

    assert(store.upsert(makeRecord("/lib/a.cbz")));
    FileRecord withMeta = makeRecord("/lib/b.cbz");
    withMeta.metadata["Series"] = QStringLiteral("Saga");
    assert(store.upsert(withMeta));

    bool removed = false;
    assert(store.remove("/lib/a.cbz", &removed) && removed);
    assert(store.remove("/lib/a.cbz", &removed) && !removed && "removing twice is harmless");

    bool moved = false;
    assert(store.rename("/lib/b.cbz", "/lib/c.cbz", &moved) && moved);
    assert(!store.get("/lib/b.cbz"));
    auto c = store.get("/lib/c.cbz");
    assert(c && c->metadata.at("Series") == MetadataValue(QStringLiteral("Saga")) && "metadata kept");

    assert(store.rename("/lib/nothing.cbz", "/lib/x.cbz", &moved) && !moved);
    assert(!store.get("/lib/x.cbz"));
}

static void test_subtree_operations() {
    QTemporaryDir tmp;
    IndexStore store;
    assert(store.open(tmp.filePath("index.sqlite3"), IndexStore::Mode::ReadWrite));

    assert(store.upsert(makeRecord("/lib/dir/a.cbz")));
    assert(store.upsert(makeRecord("/lib/dir/sub/b.cbz")));
    assert(store.upsert(makeRecord("/lib/dir2/c.cbz")));
    assert(store.upsert(makeRecord("/lib/dir.cbz")));

    int moved = 0;
    assert(store.renameSubtree("/lib/dir", "/lib/renamed", &moved));
    assert(moved == 2 && "only descendants move");
    assert(store.get("/lib/renamed/sub/b.cbz"));
    assert(store.get("/lib/dir2/c.cbz") && store.get("/lib/dir.cbz") && "siblings sharing a prefix untouched");

    int removed = 0;
    assert(store.removeSubtree("/lib/renamed", &removed));
    assert(removed == 2);
    assert(*store.count() == 2);
}

static void test_query_filters() {
    QTemporaryDir tmp;
    IndexStore store;
    assert(store.open(tmp.filePath("index.sqlite3"), IndexStore::Mode::ReadWrite));

    for (int i = 0; i < 10; ++i) {
        FileRecord r = makeRecord(QStringLiteral("/lib/s/%1.cbz").arg(i, 2, 10, QLatin1Char('0')));
        r.metadata["Series"] = (i % 2 == 0) ? QStringLiteral("Saga") : QStringLiteral("Bone");
        r.metadata["Writer"] = QStringList{"Brian K. Vaughan", i == 3 ? "Guest" : "Fiona Staples"};
        if (i >= 8) {
            r.scanState = ScanState::Failed;
            r.failureCount = static_cast<quint32>(i - 5);
        }
        assert(store.upsert(r));
    }
    assert(store.upsert(makeRecord("/other/z.cbz")));

    RecordFilter all;
    all.pageSize = 3; // forces several pages
    assert(drain(store.query(all)).size() == 11);

    RecordFilter prefix;
    prefix.pathPrefix = "/lib/s";
    prefix.pageSize = 4;
    QStringList paths = drain(store.query(prefix));
    assert(paths.size() == 10);
    assert(paths.first() == "/lib/s/00.cbz" && paths.last() == "/lib/s/09.cbz" && "path order");

    RecordFilter series;
    series.field = "Series";
    series.value = "saga";
    series.pageSize = 2;
    assert(drain(store.query(series)).size() == 5 && "case-insensitive value match");
    assert(*store.count(series) == 5);

    RecordFilter writer;
    writer.field = "Writer";
    writer.value = "guest";
    paths = drain(store.query(writer));
    assert(paths == QStringList{"/lib/s/03.cbz"} && "list value matches any element");

    RecordFilter failed;
    failed.state = ScanState::Failed;
    assert(*store.count(failed) == 2);

    RecordFilter hot;
    hot.minFailureCount = 4;
    assert(drain(store.query(hot)) == QStringList{"/lib/s/09.cbz"});

    RecordFilter resume;
    resume.pathPrefix = "/lib/s";
    resume.afterPath = "/lib/s/07.cbz";
    assert(drain(store.query(resume)) == (QStringList{"/lib/s/08.cbz", "/lib/s/09.cbz"}));

    RecordCursor c = store.query(prefix);
    assert(c.next()->path == "/lib/s/00.cbz");
    assert(c.next()->path == "/lib/s/01.cbz");
    c.restart();
    assert(c.next()->path == "/lib/s/00.cbz" && "restart rewinds");
}

static void test_reader_sees_commits() {
    QTemporaryDir tmp;
    const QString db = tmp.filePath("index.sqlite3");

    IndexStore writer;
    assert(writer.open(db, IndexStore::Mode::ReadWrite));

    IndexStore reader;
    QString err;
    assert(reader.open(db, IndexStore::Mode::ReadOnly, &err) && "reader opens an initialized index");
    assert(!reader.upsert(makeRecord("/lib/a.cbz")) && "readers cannot write");

    assert(writer.upsert(makeRecord("/lib/a.cbz")));
    assert(reader.get("/lib/a.cbz") && "commit visible to reader");

    // A body that fails rolls back everything it did.
    const bool ok = writer.runInTransaction([&](QString* e) {
        if (!writer.upsert(makeRecord("/lib/b.cbz"), e)) return false;
        if (e) *e = QStringLiteral("abort");
        return false;
    }, &err);
    assert(!ok && err == "abort");
    assert(!reader.get("/lib/b.cbz") && "rolled back");
    assert(!writer.get("/lib/b.cbz"));
}

static void test_reader_rejects_uninitialized() {
    QTemporaryDir tmp;
    IndexStore reader;
    QString err;
    assert(!reader.open(tmp.filePath("absent.sqlite3"), IndexStore::Mode::ReadOnly, &err));
    assert(!err.isEmpty());
    assert(!reader.isOpen());
}

static void test_v1_migration() {
    QTemporaryDir tmp;
    const QString db = tmp.filePath("old.sqlite3");

    sqlite3* raw = nullptr;
    assert(sqlite3_open(db.toUtf8().constData(), &raw) == SQLITE_OK);
    const char* v1 =
        "CREATE TABLE files ("
        " path TEXT PRIMARY KEY, size INTEGER NOT NULL DEFAULT 0, mtime_ms INTEGER NOT NULL DEFAULT 0,"
        " fingerprint TEXT NOT NULL DEFAULT '', metadata TEXT NOT NULL DEFAULT '{}',"
        " scan_state INTEGER NOT NULL DEFAULT 0, last_scanned_at INTEGER NOT NULL DEFAULT 0, last_error TEXT);"
        "INSERT INTO files (path, size, metadata, scan_state, last_scanned_at)"
        " VALUES ('/lib/old.cbz', 10, '{\"Title\":\"Old\",\"Rating\":{\"stars\":5}}', 3, 42);";
    assert(sqlite3_exec(raw, v1, nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(raw);

    IndexStore store;
    QString err;
    assert(store.open(db, IndexStore::Mode::ReadWrite, &err) && "migrates in place");
    assert(store.schemaVersion() == 2);

    auto r = store.get("/lib/old.cbz", &err);
    assert(r && "existing rows kept");
    assert(r->failureCount == 0 && "new column defaulted");
    assert(r->scanState == ScanState::Clean);
    assert(r->metadata.size() == 1 && "unknown value types are skipped");
    assert(r->metadata.at("Title") == MetadataValue(QStringLiteral("Old")));
    store.close();

    assert(store.open(db, IndexStore::Mode::ReadWrite, &err) && "reopening is a no-op");
    assert(store.schemaVersion() == 2);
}

int main() {
    test_round_trip();
    test_remove_and_rename();
    test_subtree_operations();
    test_query_filters();
    test_reader_sees_commits();
    test_reader_rejects_uninitialized();
    test_v1_migration();

    std::printf("index store test ok\n");
    return 0;
}
