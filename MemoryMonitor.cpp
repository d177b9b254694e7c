// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "MemoryMonitor.h"
#include "PipelineError.h"

#include <QDebug>
#include <QFile>

#include <vector>

QString memoryTierName(MemoryTier t) {
    switch (t) {
        case MemoryTier::Normal:   return QStringLiteral("normal");
        case MemoryTier::Elevated: return QStringLiteral("elevated");
        case MemoryTier::Critical: return QStringLiteral("critical");
    }
    return QStringLiteral("unknown");
}

MemoryMonitor::MemoryMonitor(Options options, Sampler sampler)
    : m_opts(options),
      m_sampler(sampler ? std::move(sampler) : Sampler(&MemoryMonitor::sampleProcSelfStatus)) {}

MemoryMonitor::~MemoryMonitor() {
    stop();
}

void MemoryMonitor::start() {
    std::lock_guard lk(m_mutex);
    if (m_thread.joinable()) return;
    m_stopRequested = false;
    m_thread = std::thread([this]() { run(); });
}

void MemoryMonitor::stop() {
    {
        std::lock_guard lk(m_mutex);
        m_stopRequested = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) m_thread.join();
}

void MemoryMonitor::run() {
    while (true) {
        sampleNow();

        std::unique_lock lk(m_mutex);
        if (m_cv.wait_for(lk, m_opts.interval, [this]() { return m_stopRequested; })) return;
    }
}

MemoryTier MemoryMonitor::classify(quint64 bytes, MemoryTier previous, const Options& o) {
    MemoryTier raw = MemoryTier::Normal;
    if (bytes >= o.criticalBytes) raw = MemoryTier::Critical;
    else if (bytes >= o.elevatedBytes) raw = MemoryTier::Elevated;

    if (raw >= previous) return raw;

    // Downgrade one step at a time, each gated by the margin below its threshold.
    auto below = [&](quint64 threshold) {
        return threshold <= o.hysteresisBytes ? bytes == 0 : bytes < threshold - o.hysteresisBytes;
    };

    MemoryTier tier = previous;
    if (tier == MemoryTier::Critical && below(o.criticalBytes)) tier = MemoryTier::Elevated;
    if (tier == MemoryTier::Elevated && below(o.elevatedBytes)) tier = MemoryTier::Normal;
    return tier;
}

MemorySample MemoryMonitor::sampleNow() {
    QString err;
    const std::optional<quint64> bytes = m_sampler(&err);

    MemorySample s;
    const MemoryTier previous = m_tier.load(std::memory_order_acquire);

    if (!bytes) {
        // Starving the pipeline is worse than scanning under unknown pressure.
        qWarning().noquote() << QStringLiteral("[memory] %1")
                                .arg(formatPipelineError(PipelineErrorKind::MemorySampleError, err));
        s.tier = MemoryTier::Normal;
        s.valid = false;
    } else {
        s.residentBytes = *bytes;
        s.tier = classify(*bytes, previous, m_opts);
        s.valid = true;
    }

    {
        std::lock_guard lk(m_mutex);
        m_last = s;
    }
    m_tier.store(s.tier, std::memory_order_release);

    if (s.tier != previous) {
        qInfo().noquote() << QStringLiteral("[memory] tier %1 -> %2 (rss=%3 MiB)")
                             .arg(memoryTierName(previous), memoryTierName(s.tier))
                             .arg(s.residentBytes / (1024 * 1024));
    }

    if (s.tier == MemoryTier::Critical && previous != MemoryTier::Critical) {
        std::vector<Hook> hooks;
        {
            std::lock_guard lk(m_hookMutex);
            for (const auto& kv : m_hooks) hooks.push_back(kv.second);
        }
        for (const Hook& h : hooks) h();
    }

    return s;
}

MemorySample MemoryMonitor::lastSample() const {
    std::lock_guard lk(m_mutex);
    return m_last;
}

int MemoryMonitor::addCriticalHook(Hook hook) {
    std::lock_guard lk(m_hookMutex);
    const int id = m_nextHookId++;
    m_hooks.emplace(id, std::move(hook));
    return id;
}

void MemoryMonitor::removeCriticalHook(int id) {
    std::lock_guard lk(m_hookMutex);
    m_hooks.erase(id);
}

std::optional<quint64> MemoryMonitor::sampleProcSelfStatus(QString* errorOut) {
    QFile f(QStringLiteral("/proc/self/status"));
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorOut) *errorOut = QStringLiteral("cannot open /proc/self/status: %1").arg(f.errorString());
        return std::nullopt;
    }

    // Line format: "VmRSS:	  123456 kB"
    while (!f.atEnd()) {
        const QByteArray line = f.readLine();
        if (!line.startsWith("VmRSS:")) continue;

        const QList<QByteArray> parts = line.mid(6).simplified().split(' ');
        bool ok = false;
        const quint64 kb = parts.isEmpty() ? 0 : parts.first().toULongLong(&ok);
        if (!ok) {
            if (errorOut) *errorOut = QStringLiteral("unparsable VmRSS line: %1").arg(QString::fromLatin1(line.trimmed()));
            return std::nullopt;
        }
        return kb * 1024;
    }

    if (errorOut) *errorOut = QStringLiteral("VmRSS not present in /proc/self/status");
    return std::nullopt;
}
