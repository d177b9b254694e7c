// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "MemoryMonitor.h"
#include "TestSupport.h"

#include <atomic>
#include <cassert>
#include <cstdio>

using namespace std::chrono_literals;

namespace {
    constexpr quint64 MiB = 1024ull * 1024;

    MemoryMonitor::Options options() {
        MemoryMonitor::Options o;
        o.elevatedBytes = 100 * MiB;
        o.criticalBytes = 200 * MiB;
        o.hysteresisBytes = 10 * MiB;
        o.interval = 10ms;
        return o;
    }
}

static void test_classify_thresholds() {
    const auto o = options();
    assert(MemoryMonitor::classify(50 * MiB, MemoryTier::Normal, o) == MemoryTier::Normal);
    assert(MemoryMonitor::classify(100 * MiB, MemoryTier::Normal, o) == MemoryTier::Elevated);
    assert(MemoryMonitor::classify(250 * MiB, MemoryTier::Normal, o) == MemoryTier::Critical && "upgrades are immediate");
}

static void test_classify_hysteresis() {
    const auto o = options();
    assert(MemoryMonitor::classify(195 * MiB, MemoryTier::Critical, o) == MemoryTier::Critical && "inside the margin");
    assert(MemoryMonitor::classify(189 * MiB, MemoryTier::Critical, o) == MemoryTier::Elevated);
    assert(MemoryMonitor::classify(95 * MiB, MemoryTier::Elevated, o) == MemoryTier::Elevated);
    assert(MemoryMonitor::classify(80 * MiB, MemoryTier::Elevated, o) == MemoryTier::Normal);
    assert(MemoryMonitor::classify(10 * MiB, MemoryTier::Critical, o) == MemoryTier::Normal && "large drop steps all the way");
}

static void test_injected_sampler_and_hook() {
    std::atomic<quint64> rss{50 * MiB};
    MemoryMonitor m(options(), [&](QString*) -> std::optional<quint64> { return rss.load(); });

    std::atomic<int> criticalEntries{0};
    const int id = m.addCriticalHook([&] { ++criticalEntries; });

    assert(m.sampleNow().tier == MemoryTier::Normal);
    assert(m.currentTier() == MemoryTier::Normal);

    rss = 300 * MiB;
    MemorySample s = m.sampleNow();
    assert(s.valid && s.tier == MemoryTier::Critical && s.residentBytes == 300 * MiB);
    assert(criticalEntries == 1 && "hook fires on entering critical");

    m.sampleNow();
    assert(criticalEntries == 1 && "staying critical does not refire");

    rss = 50 * MiB;
    assert(m.sampleNow().tier == MemoryTier::Normal);
    rss = 300 * MiB;
    m.sampleNow();
    assert(criticalEntries == 2);

    m.removeCriticalHook(id);
    rss = 0;
    m.sampleNow();
    rss = 300 * MiB;
    m.sampleNow();
    assert(criticalEntries == 2 && "removed hook is not called");
}

static void test_sampler_failure_reads_as_normal() {
    std::atomic<bool> fail{false};
    MemoryMonitor m(options(), [&](QString* err) -> std::optional<quint64> {
        if (fail) {
            if (err) *err = QStringLiteral("no procfs");
            return std::nullopt;
        }
        return 300 * MiB;
    });

    assert(m.sampleNow().tier == MemoryTier::Critical);
    fail = true;
    MemorySample s = m.sampleNow();
    assert(!s.valid && s.tier == MemoryTier::Normal);
    assert(m.currentTier() == MemoryTier::Normal);
    assert(!m.lastSample().valid);
}

static void test_background_sampling() {
    std::atomic<quint64> rss{10 * MiB};
    std::atomic<int> calls{0};
    MemoryMonitor m(options(), [&](QString*) -> std::optional<quint64> {
        ++calls;
        return rss.load();
    });
    m.start();

    assert(TestSupport::waitUntil([&] { return calls.load() >= 3; }) && "sampled periodically");
    rss = 150 * MiB;
    assert(TestSupport::waitUntil([&] { return m.currentTier() == MemoryTier::Elevated; }));

    m.stop();
    const int after = calls.load();
    std::this_thread::sleep_for(50ms);
    assert(calls.load() == after && "no samples after stop");
}

static void test_proc_self_status() {
    QString err;
    auto bytes = MemoryMonitor::sampleProcSelfStatus(&err);
    assert(bytes && *bytes > 0 && "reads VmRSS on Linux");
}

int main() {
    test_classify_thresholds();
    test_classify_hysteresis();
    test_injected_sampler_and_hook();
    test_sampler_failure_reads_as_normal();
    test_background_sampling();
    test_proc_self_status();

    std::printf("memory monitor test ok\n");
    return 0;
}
