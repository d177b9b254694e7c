// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "IndexStore.h"
#include "Pipeline.h"
#include "TestSupport.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <atomic>
#include <cassert>
#include <cstdio>
#include <mutex>

using namespace std::chrono_literals;
using TestSupport::ZipEntry;

namespace {
    constexpr quint64 MiB = 1024ull * 1024;

    struct Fixture {
        QTemporaryDir tmp;
        QString root;
        std::atomic<quint64> rss{10 * MiB};

        Fixture() {
            assert(tmp.isValid());
            QDir(tmp.path()).mkpath("library");
            root = QDir(tmp.path()).canonicalPath() + "/library";
        }

        PipelineConfig config(bool sweepOnStartup = false) const {
            PipelineConfig c;
            c.roots = {root};
            c.extensions = Utils::defaultArchiveExtensions();
            c.databasePath = tmp.filePath("index/index.sqlite3");
            c.quietPeriod = 50ms;
            c.workerCount = 2;
            c.deferDelay = 40ms;
            c.ioTimeout = 5s;
            c.failureSuppressThreshold = 3;
            c.memory.elevatedBytes = 100 * MiB;
            c.memory.criticalBytes = 200 * MiB;
            c.memory.hysteresisBytes = 10 * MiB;
            c.memory.interval = 20ms;
            c.sweepOnStartup = sweepOnStartup;
            return c;
        }

        MemoryMonitor::Sampler sampler() {
            return [this](QString*) -> std::optional<quint64> { return rss.load(); };
        }

        QString path(const QString& rel) const { return root + "/" + rel; }
    };

    // Reads through a fresh connection so every poll sees the latest commit.
    std::optional<FileRecord> record(const Pipeline& p, const QString& path) {
        IndexStore reader;
        if (!reader.open(p.config().databasePath, IndexStore::Mode::ReadOnly)) return std::nullopt;
        return reader.get(path);
    }

    bool waitForState(const Pipeline& p, const QString& path, ScanState state) {
        return TestSupport::waitUntil([&] {
            auto r = record(p, path);
            return r && r->scanState == state;
        });
    }

    bool waitForAbsent(const Pipeline& p, const QString& path) {
        return TestSupport::waitUntil([&] { return !record(p, path); });
    }

    bool waitIdle(Pipeline& p) {
        return TestSupport::waitUntil([&] {
            const auto h = p.health();
            return h.queueLength == 0 && h.inFlight == 0 && !h.sweepRunning;
        });
    }

    FsEvent fsEvent(FsEvent::Kind kind, const QString& path, const QString& oldPath = {}) {
        FsEvent e;
        e.kind = kind;
        e.path = path;
        e.oldPath = oldPath;
        return e;
    }
}

static void test_create_delete_rename() {
    Fixture f;
    Pipeline p(f.config(), f.sampler());
    QString err;
    assert(p.start(&err) && "pipeline starts");

    std::mutex invMutex;
    QStringList invalidated;
    p.addInvalidationHook([&](const QString& path) {
        std::lock_guard lk(invMutex);
        invalidated << path;
    });

    // An archive without a descriptor is indexed with empty metadata.
    const QString a = f.path("A.cbz");
    assert(TestSupport::writeZip(a, {ZipEntry{"readme.txt", "nothing to see", false}}));
    p.detector().observe(fsEvent(FsEvent::Kind::Created, a));
    assert(waitForState(p, a, ScanState::Clean) && "new archive scanned");
    auto rec = record(p, a);
    assert(rec->metadata.empty() && !rec->lastError && rec->lastScannedAt > 0);

    assert(QFile::remove(a));
    p.detector().observe(fsEvent(FsEvent::Kind::Deleted, a));
    assert(waitForAbsent(p, a) && "deleted archive removed");

    // Renames keep the metadata without decoding again.
    const QString b = f.path("B.cbz");
    const QString c = f.path("C.cbz");
    assert(TestSupport::writeZip(b, {ZipEntry{"ComicInfo.xml", TestSupport::comicInfoXml("Rename", "Me", 4), true}}));
    p.detector().observe(fsEvent(FsEvent::Kind::Created, b));
    assert(waitForState(p, b, ScanState::Clean));
    assert(waitIdle(p));
    const quint64 decodedBefore = p.health().scanner.decoded;

    assert(QFile::rename(b, c));
    p.detector().observe(fsEvent(FsEvent::Kind::Moved, c, b));
    assert(waitForAbsent(p, b) && "old path gone");
    assert(waitForState(p, c, ScanState::Clean) && "record now at the new path");
    rec = record(p, c);
    assert(rec->metadata.at("Title") == MetadataValue(QStringLiteral("Rename")) && "metadata carried over");
    assert(waitIdle(p));
    assert(p.health().scanner.decoded == decodedBefore && "rename does not decode");

    {
        std::lock_guard lk(invMutex);
        assert(invalidated.contains(a) && invalidated.contains(b));
    }

    p.stop();
    assert(!p.isRunning());
}

static void test_unchanged_file_is_not_decoded() {
    Fixture f;
    Pipeline p(f.config(), f.sampler());
    assert(p.start());

    const QString a = f.path("series/001.cbz");
    assert(TestSupport::writeZip(a, {ZipEntry{"ComicInfo.xml", TestSupport::comicInfoXml("One", "S", 1), true}}));
    p.detector().observe(fsEvent(FsEvent::Kind::Created, a));
    assert(waitForState(p, a, ScanState::Clean));
    assert(waitIdle(p));

    const auto before = p.health().scanner;
    p.detector().observe(fsEvent(FsEvent::Kind::Modified, a));
    assert(TestSupport::waitUntil([&] { return p.health().scanner.unchanged == before.unchanged + 1; }));
    assert(waitIdle(p));
    assert(p.health().scanner.decoded == before.decoded && "same fingerprint, metadata reused");
    assert(record(p, a)->scanState == ScanState::Clean);

    // A manual request always decodes.
    assert(p.requestManualRescan(a));
    assert(TestSupport::waitUntil([&] { return p.health().scanner.decoded == before.decoded + 1; }));

    p.stop();
}

static void test_critical_memory_defers_decoding() {
    Fixture f;
    Pipeline p(f.config(), f.sampler());
    assert(p.start());

    f.rss = 500 * MiB;
    p.monitor().sampleNow();
    assert(p.monitor().currentTier() == MemoryTier::Critical);

    const QString a = f.path("pressure.cbz");
    assert(TestSupport::writeZip(a, {ZipEntry{"ComicInfo.xml", TestSupport::comicInfoXml("P", "Q", 2), true}}));
    p.detector().observe(fsEvent(FsEvent::Kind::Created, a));

    assert(TestSupport::waitUntil([&] { return p.health().scanner.deferred >= 2; }) && "job keeps being deferred");
    assert(p.health().scanner.decoded == 0 && "nothing decoded while critical");
    assert(record(p, a)->scanState == ScanState::Queued);
    assert(p.health().memory.tier == MemoryTier::Critical);

    f.rss = 10 * MiB;
    p.monitor().sampleNow();
    assert(waitForState(p, a, ScanState::Clean) && "deferred job runs once pressure drops");
    assert(p.health().scanner.decoded == 1);

    p.stop();
}

static void test_failing_path_skips_sweeps_but_not_changes() {
    Fixture f;
    Pipeline p(f.config(), f.sampler());
    assert(p.start());

    const QString bad = f.path("broken.cbz");
    assert(TestSupport::writeFile(bad, QByteArray(256, 'x')));

    for (quint32 i = 1; i <= 3; ++i) {
        assert(p.requestManualRescan(bad));
        assert(TestSupport::waitUntil([&] {
            auto r = record(p, bad);
            return r && r->scanState == ScanState::Failed && r->failureCount == i;
        }) && "each manual rescan counts a failure");
    }
    auto rec = record(p, bad);
    assert(rec->lastError && rec->lastError->startsWith("ArchiveOpenError"));

    f.rss = 500 * MiB;
    p.monitor().sampleNow();
    assert(waitIdle(p));

    const auto before = p.health().scanner;
    assert(p.requestFullSweep());
    p.waitForSweep();
    assert(waitIdle(p));
    assert(p.health().scanner.decoded == before.decoded && "sweeps skip a path that keeps failing");
    rec = record(p, bad);
    assert(rec->scanState == ScanState::Failed && rec->failureCount == 3);

    // The file gets fixed while memory is still critical.
    assert(TestSupport::writeZip(bad, {ZipEntry{"ComicInfo.xml", TestSupport::comicInfoXml("Fixed", "S", 1), true}}));
    p.detector().observe(fsEvent(FsEvent::Kind::Modified, bad));
    assert(TestSupport::waitUntil([&] { return p.health().scanner.deferred > before.deferred; }) &&
           "a filesystem event is deferred, not dropped");
    assert(p.health().scanner.decoded == before.decoded);
    assert(p.health().scanner.suppressed == before.suppressed);

    f.rss = 10 * MiB;
    p.monitor().sampleNow();
    assert(waitForState(p, bad, ScanState::Clean) && "deferred scan runs once memory drops");
    rec = record(p, bad);
    assert(rec->failureCount == 0 && !rec->lastError);
    assert(rec->metadata.at("Title") == MetadataValue(QStringLiteral("Fixed")));

    p.stop();
}

static void test_manual_requests_collapse() {
    Fixture f;
    PipelineConfig cfg = f.config();
    cfg.workerCount = 1;
    Pipeline p(cfg, f.sampler());
    assert(p.start());

    const QString a = f.path("manual.cbz");
    const QString b = f.path("manual-renamed.cbz");
    assert(TestSupport::writeZip(a, {ZipEntry{"ComicInfo.xml", TestSupport::comicInfoXml("M", "N", 7), true}}));
    assert(p.requestManualRescan(a));
    assert(waitForState(p, a, ScanState::Clean));
    assert(waitIdle(p));
    const quint64 decoded = p.health().scanner.decoded;
    assert(decoded == 1);

    // Park the worker inside the move of a -> b, after the move has committed but
    // while b is still in flight.
    std::atomic<bool> parked{false};
    std::atomic<bool> release{false};
    const int hookId = p.addInvalidationHook([&](const QString& path) {
        if (path != a) return;
        parked = true;
        while (!release.load()) std::this_thread::sleep_for(5ms);
    });

    assert(QFile::rename(a, b));
    p.detector().observe(fsEvent(FsEvent::Kind::Moved, b, a));
    assert(TestSupport::waitUntil([&] { return parked.load(); }));

    assert(p.requestManualRescan(b));
    assert(p.requestManualRescan(b));
    assert(p.health().queueLength == 1 && "both requests share one job");
    assert(p.health().inFlight == 1);

    release = true;
    assert(waitForState(p, b, ScanState::Clean));
    assert(waitIdle(p));
    p.removeInvalidationHook(hookId);

    assert(p.health().scanner.decoded == decoded + 1 && "exactly one scan follows the running job");
    assert(!record(p, a));

    assert(p.requestManualRescan(f.root) && "a directory rescans its archives");
    assert(TestSupport::waitUntil([&] { return p.health().scanner.decoded == decoded + 2; }));
    assert(waitIdle(p));
    assert(p.health().scanner.decoded == decoded + 2);

    p.stop();
}

static void test_manual_rescan_validation() {
    Fixture f;
    Pipeline p(f.config(), f.sampler());

    QString err;
    assert(!p.requestManualRescan(f.path("x.cbz"), &err) && "refused while stopped");

    assert(p.start());
    assert(TestSupport::writeFile(f.tmp.filePath("outside.cbz"), "PK"));
    assert(TestSupport::writeFile(f.path("notes.txt"), "hi"));

    err.clear();
    assert(!p.requestManualRescan(f.tmp.filePath("outside.cbz"), &err));
    assert(err.contains("not inside a library root"));

    err.clear();
    assert(!p.requestManualRescan(f.path("missing.cbz"), &err));
    assert(err.contains("does not exist"));

    err.clear();
    assert(!p.requestManualRescan(f.path("notes.txt"), &err));
    assert(err.contains("not an archive"));

    p.stop();
}

static void test_sweep_discovers_and_prunes() {
    Fixture f;
    const QString a = f.path("one/a.cbz");
    const QString b = f.path("two/b.cbz");
    const QString hidden = f.path(".stash/c.cbz");
    assert(TestSupport::writeZip(a, {ZipEntry{"1.jpg", "x", false}}));
    assert(TestSupport::writeZip(b, {ZipEntry{"1.jpg", "x", false}, ZipEntry{"2.jpg", "y", false}}));
    assert(TestSupport::writeZip(hidden, {ZipEntry{"1.jpg", "x", false}}));

    Pipeline p(f.config(true), f.sampler());
    assert(p.start());

    assert(waitForState(p, a, ScanState::Clean) && "startup sweep found a");
    assert(waitForState(p, b, ScanState::Clean) && "startup sweep found b");
    p.waitForSweep();
    assert(waitIdle(p));
    assert(!record(p, hidden) && "hidden directories are skipped");
    assert(record(p, b)->metadata.at("PageCount") == MetadataValue(qint64(2)));

    // Removed while nobody was watching.
    assert(QFile::remove(a));
    QString err;
    assert(p.requestFullSweep(&err));
    p.waitForSweep();
    assert(waitForAbsent(p, a) && "sweep prunes vanished archives");
    assert(waitIdle(p));
    assert(record(p, b) && record(p, b)->scanState == ScanState::Clean);

    p.stop();
    assert(!p.requestFullSweep(&err) && "no sweep once stopped");
}

static void test_restart_keeps_index() {
    Fixture f;
    const QString a = f.path("keep.cbz");
    assert(TestSupport::writeZip(a, {ZipEntry{"ComicInfo.xml", TestSupport::comicInfoXml("Keep", "K", 1), true}}));

    {
        Pipeline p(f.config(), f.sampler());
        assert(p.start());
        assert(p.requestManualRescan(a));
        assert(waitForState(p, a, ScanState::Clean));
        p.stop();
    }

    Pipeline p(f.config(true), f.sampler());
    assert(p.start());
    p.waitForSweep();
    assert(waitIdle(p));
    auto rec = record(p, a);
    assert(rec && rec->scanState == ScanState::Clean);
    assert(rec->metadata.at("Title") == MetadataValue(QStringLiteral("Keep")) && "committed work survives a restart");
    assert(p.health().scanner.decoded == 0 && "unchanged archives are not decoded again");
    p.stop();
}

int main() {
    test_create_delete_rename();
    test_unchanged_file_is_not_decoded();
    test_critical_memory_defers_decoding();
    test_failing_path_skips_sweeps_but_not_changes();
    test_manual_requests_collapse();
    test_manual_rescan_validation();
    test_sweep_discovers_and_prunes();
    test_restart_keeps_index();

    std::printf("pipeline test ok\n");
    return 0;
}
