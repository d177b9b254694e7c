// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "FileRecord.h"

bool isAllowedTransition(ScanState from, ScanState to) {
    if (from == to && from == ScanState::Queued) return true;

    switch (from) {
        case ScanState::Unscanned:
            return to == ScanState::Queued;
        case ScanState::Queued:
            return to == ScanState::Scanning;
        case ScanState::Scanning:
            return to == ScanState::Clean || to == ScanState::Failed;
        case ScanState::Clean:
        case ScanState::Failed:
            return to == ScanState::Queued;
    }
    return false;
}

QString scanStateName(ScanState s) {
    switch (s) {
        case ScanState::Unscanned: return QStringLiteral("unscanned");
        case ScanState::Queued:    return QStringLiteral("queued");
        case ScanState::Scanning:  return QStringLiteral("scanning");
        case ScanState::Clean:     return QStringLiteral("clean");
        case ScanState::Failed:    return QStringLiteral("failed");
    }
    return QStringLiteral("unknown");
}

std::optional<ScanState> scanStateFromName(const QString& name) {
    const QString n = name.trimmed().toLower();
    if (n == QStringLiteral("unscanned")) return ScanState::Unscanned;
    if (n == QStringLiteral("queued"))    return ScanState::Queued;
    if (n == QStringLiteral("scanning"))  return ScanState::Scanning;
    if (n == QStringLiteral("clean"))     return ScanState::Clean;
    if (n == QStringLiteral("failed"))    return ScanState::Failed;
    return std::nullopt;
}

std::optional<ScanState> scanStateFromInt(int v) {
    if (v < static_cast<int>(ScanState::Unscanned) || v > static_cast<int>(ScanState::Failed))
        return std::nullopt;
    return static_cast<ScanState>(v);
}

QString metadataValueToText(const MetadataValue& v) {
    if (const auto* s = std::get_if<QString>(&v)) return *s;
    if (const auto* i = std::get_if<qint64>(&v)) return QString::number(*i);
    if (const auto* l = std::get_if<QStringList>(&v)) return l->join(QStringLiteral(", "));
    return {};
}

ScanPriority priorityForReason(ScanReason r) {
    switch (r) {
        case ScanReason::Delete:
        case ScanReason::Move:
            return ScanPriority::Structural;
        case ScanReason::Manual:
            return ScanPriority::Manual;
        case ScanReason::Create:
        case ScanReason::Modify:
            return ScanPriority::FilesystemChange;
        case ScanReason::Sweep:
            return ScanPriority::BackgroundSweep;
    }
    return ScanPriority::BackgroundSweep;
}

QString scanReasonName(ScanReason r) {
    switch (r) {
        case ScanReason::Create: return QStringLiteral("create");
        case ScanReason::Modify: return QStringLiteral("modify");
        case ScanReason::Delete: return QStringLiteral("delete");
        case ScanReason::Move:   return QStringLiteral("move");
        case ScanReason::Manual: return QStringLiteral("manual");
        case ScanReason::Sweep:  return QStringLiteral("sweep");
    }
    return QStringLiteral("unknown");
}
