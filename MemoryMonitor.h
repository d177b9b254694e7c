// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef COMICDEX_MEMORYMONITOR_H
#define COMICDEX_MEMORYMONITOR_H

#include <QString>
#include <QtGlobal>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

enum class MemoryTier : quint8 { Normal = 0, Elevated = 1, Critical = 2 };

[[nodiscard]] QString memoryTierName(MemoryTier t);

struct MemorySample {
    quint64 residentBytes = 0;
    MemoryTier tier = MemoryTier::Normal;
    bool valid = false; // false when the sampler failed
};

/**
 * Samples process memory on a background thread and classifies it into tiers.
 *
 * Upgrades are immediate. A downgrade needs usage to fall below the lower tier's
 * threshold by hysteresisBytes, so usage hovering at a boundary does not flap.
 * currentTier() never blocks.
 */
class MemoryMonitor final {
public:
    // Returns resident bytes, or std::nullopt with errorOut set.
    using Sampler = std::function<std::optional<quint64>(QString* errorOut)>;
    using Hook = std::function<void()>;

    struct Options {
        quint64 elevatedBytes = 1024ull * 1024 * 1024;
        quint64 criticalBytes = 2048ull * 1024 * 1024;
        quint64 hysteresisBytes = 64ull * 1024 * 1024;
        std::chrono::milliseconds interval{1000};
    };

    explicit MemoryMonitor(Options options, Sampler sampler = {});
    ~MemoryMonitor();

    MemoryMonitor(const MemoryMonitor&) = delete;
    MemoryMonitor& operator=(const MemoryMonitor&) = delete;

    void start();
    void stop();

    [[nodiscard]] MemoryTier currentTier() const { return m_tier.load(std::memory_order_acquire); }
    [[nodiscard]] MemorySample lastSample() const;

    // Takes one sample synchronously and applies it; used by the loop and by tests.
    MemorySample sampleNow();

    /**
     * Registers a callback fired (on the sampling thread) every time the tier enters
     * Critical. Hooks must be quick and must not call back into the monitor.
     */
    int addCriticalHook(Hook hook);
    void removeCriticalHook(int id);

    // Reads VmRSS from /proc/self/status.
    [[nodiscard]] static std::optional<quint64> sampleProcSelfStatus(QString* errorOut);

    [[nodiscard]] static MemoryTier classify(quint64 bytes, MemoryTier previous, const Options& o);

private:
    void run();

    const Options m_opts;
    const Sampler m_sampler;

    std::atomic<MemoryTier> m_tier{MemoryTier::Normal};

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    MemorySample m_last;
    bool m_stopRequested = false;
    std::thread m_thread;

    std::mutex m_hookMutex;
    std::map<int, Hook> m_hooks;
    int m_nextHookId = 1;
};

#endif //COMICDEX_MEMORYMONITOR_H
