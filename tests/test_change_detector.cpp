// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "ChangeDetector.h"
#include "TestSupport.h"
#include "Utils.h"

#include <cassert>
#include <cstdio>
#include <mutex>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {
    // Collects emitted jobs; the detector calls the sink from its own thread.
    struct Collector {
        std::mutex mutex;
        std::vector<ScanJob> jobs;

        ChangeDetector::Sink sink() {
            return [this](ScanJob job) {
                std::lock_guard lk(mutex);
                jobs.push_back(std::move(job));
            };
        }

        size_t count() {
            std::lock_guard lk(mutex);
            return jobs.size();
        }

        std::vector<ScanJob> take() {
            std::lock_guard lk(mutex);
            std::vector<ScanJob> out;
            out.swap(jobs);
            return out;
        }
    };

    ChangeDetector::Options options(std::chrono::milliseconds quiet = 100ms) {
        ChangeDetector::Options o;
        o.quietPeriod = quiet;
        o.extensions = Utils::defaultArchiveExtensions();
        o.roots = {QStringLiteral("/lib")};
        return o;
    }

    FsEvent event(FsEvent::Kind kind, const QString& path, const QString& oldPath = {}, bool isDir = false) {
        FsEvent e;
        e.kind = kind;
        e.path = path;
        e.oldPath = oldPath;
        e.isDir = isDir;
        return e;
    }
}

static void test_burst_collapses_into_one_job() {
    Collector c;
    ChangeDetector d(options(), c.sink());
    d.start();

    for (int i = 0; i < 5; ++i) {
        d.observe(event(FsEvent::Kind::Modified, "/lib/a.cbz"));
        std::this_thread::sleep_for(20ms);
    }
    assert(d.pendingBuckets() == 1 && "one bucket for the burst");
    assert(c.count() == 0 && "nothing emitted inside the quiet period");

    assert(TestSupport::waitUntil([&] { return c.count() == 1; }) && "burst flushed");
    std::this_thread::sleep_for(150ms);

    auto jobs = c.take();
    assert(jobs.size() == 1 && "exactly one job");
    assert(jobs[0].path == "/lib/a.cbz");
    assert(jobs[0].reason == ScanReason::Modify && "reason is the last event kind");
    assert(d.pendingBuckets() == 0);

    d.stop();
}

static void test_create_then_modify_reports_modify() {
    Collector c;
    ChangeDetector d(options(50ms), c.sink());
    d.start();

    d.observe(event(FsEvent::Kind::Created, "/lib/new.cbz"));
    d.observe(event(FsEvent::Kind::Modified, "/lib/new.cbz"));
    assert(TestSupport::waitUntil([&] { return c.count() == 1; }));
    assert(c.take()[0].reason == ScanReason::Modify);

    d.stop();
}

static void test_filtering() {
    Collector c;
    ChangeDetector d(options(30ms), c.sink());
    d.start();

    d.observe(event(FsEvent::Kind::Modified, "/lib/.cache/a.cbz"));
    d.observe(event(FsEvent::Kind::Modified, "/lib/.a.cbz"));
    d.observe(event(FsEvent::Kind::Modified, "/lib/notes.txt"));
    d.observe(event(FsEvent::Kind::Modified, "/elsewhere/a.cbz"));
    d.observe(event(FsEvent::Kind::Created, "/lib/folder.cbz", {}, true));
    d.observe(event(FsEvent::Kind::Deleted, "/lib/.cache/b.cbz"));
    assert(d.pendingBuckets() == 0 && "filtered events never reach a bucket");

    d.observe(event(FsEvent::Kind::Modified, "/lib/Sub/Upper.CBZ"));
    assert(TestSupport::waitUntil([&] { return c.count() == 1; }));
    std::this_thread::sleep_for(80ms);

    auto jobs = c.take();
    assert(jobs.size() == 1 && "only the tracked archive produced a job");
    assert(jobs[0].path == "/lib/Sub/Upper.CBZ" && "extension match is case-insensitive");

    d.stop();
}

static void test_delete_bypasses_debounce() {
    Collector c;
    ChangeDetector d(options(10s), c.sink());
    d.start();

    d.observe(event(FsEvent::Kind::Modified, "/lib/a.cbz"));
    assert(d.pendingBuckets() == 1);

    d.observe(event(FsEvent::Kind::Deleted, "/lib/a.cbz"));
    assert(d.pendingBuckets() == 0 && "pending modify dropped by the delete");

    auto jobs = c.take();
    assert(jobs.size() == 1 && "delete emitted synchronously");
    assert(jobs[0].reason == ScanReason::Delete);
    assert(jobs[0].priority == ScanPriority::Structural);

    d.observe(event(FsEvent::Kind::Modified, "/lib/dir/x.cbz"));
    d.observe(event(FsEvent::Kind::Modified, "/lib/dir/y.cbz"));
    d.observe(event(FsEvent::Kind::Deleted, "/lib/dir", {}, true));
    assert(d.pendingBuckets() == 0 && "subtree buckets dropped");

    jobs = c.take();
    assert(jobs.size() == 1 && jobs[0].subtree && jobs[0].path == "/lib/dir");

    d.stop();
}

static void test_move_mapping() {
    Collector c;
    ChangeDetector d(options(30ms), c.sink());
    d.start();

    d.observe(event(FsEvent::Kind::Moved, "/lib/b.cbz", "/lib/a.cbz"));
    auto jobs = c.take();
    assert(jobs.size() == 1 && jobs[0].reason == ScanReason::Move && "archive rename");
    assert(jobs[0].oldPath == "/lib/a.cbz" && jobs[0].path == "/lib/b.cbz");

    d.observe(event(FsEvent::Kind::Moved, "/lib/a.bak", "/lib/a.cbz"));
    jobs = c.take();
    assert(jobs.size() == 1 && jobs[0].reason == ScanReason::Delete && jobs[0].path == "/lib/a.cbz");

    d.observe(event(FsEvent::Kind::Moved, "/lib/.trash/a.cbz", "/lib/a.cbz"));
    jobs = c.take();
    assert(jobs.size() == 1 && jobs[0].reason == ScanReason::Delete && "moved into a hidden directory");

    d.observe(event(FsEvent::Kind::Moved, "/lib/c.cbz", "/lib/c.part"));
    assert(c.count() == 0 && d.pendingBuckets() == 1 && "becoming an archive is a debounced create");
    assert(TestSupport::waitUntil([&] { return c.count() == 1; }));
    jobs = c.take();
    assert(jobs[0].reason == ScanReason::Create && jobs[0].path == "/lib/c.cbz");

    d.observe(event(FsEvent::Kind::Moved, "/lib/new", "/lib/old", true));
    jobs = c.take();
    assert(jobs.size() == 1 && jobs[0].reason == ScanReason::Move && jobs[0].subtree);

    d.observe(event(FsEvent::Kind::Moved, "/lib/.old2", "/lib/old2", true));
    jobs = c.take();
    assert(jobs.size() == 1 && jobs[0].reason == ScanReason::Delete && jobs[0].subtree && jobs[0].path == "/lib/old2");

    d.stop();
}

static void test_lost_root_holds_jobs() {
    Collector c;
    ChangeDetector d(options(30ms), c.sink());
    d.start();

    d.reportWatchError("/lib", "mount went away");
    auto st = d.status();
    assert(st["/lib"].state == "error" && st["/lib"].error == "mount went away");

    d.observe(event(FsEvent::Kind::Modified, "/lib/a.cbz"));
    d.observe(event(FsEvent::Kind::Deleted, "/lib/b.cbz"));
    std::this_thread::sleep_for(120ms);
    assert(c.count() == 0 && "nothing emitted for a lost root");

    d.reportWatchRestored("/lib");
    assert(d.status()["/lib"].state == "watching");
    assert(TestSupport::waitUntil([&] { return c.count() == 2; }) && "held work released");

    auto jobs = c.take();
    bool sawDelete = false;
    bool sawModify = false;
    for (const ScanJob& j : jobs) {
        if (j.path == "/lib/b.cbz" && j.reason == ScanReason::Delete) sawDelete = true;
        if (j.path == "/lib/a.cbz" && j.reason == ScanReason::Modify) sawModify = true;
    }
    assert(sawDelete && sawModify);

    d.stop();
}

static void test_stop_discards_buckets() {
    Collector c;
    ChangeDetector d(options(10s), c.sink());
    d.start();
    d.observe(event(FsEvent::Kind::Modified, "/lib/a.cbz"));
    d.stop();
    assert(d.pendingBuckets() == 0);
    assert(c.count() == 0);
}

int main() {
    test_burst_collapses_into_one_job();
    test_create_then_modify_reports_modify();
    test_filtering();
    test_delete_bypasses_debounce();
    test_move_mapping();
    test_lost_root_holds_jobs();
    test_stop_discards_buckets();

    std::printf("change detector test ok\n");
    return 0;
}
