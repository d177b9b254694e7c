// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef COMICDEX_PIPELINEERROR_H
#define COMICDEX_PIPELINEERROR_H

#include <QString>

enum class PipelineErrorKind {
    WatchError,             // root unobservable; retried with backoff
    ArchiveOpenError,       // per file
    ParseError,             // per file
    IoTimeoutError,         // per file
    StoreTransactionError,  // commit failed after one retry
    MemorySampleError,      // sampler failed; tier falls back to Normal
};

inline QString pipelineErrorKindName(PipelineErrorKind k) {
    switch (k) {
        case PipelineErrorKind::WatchError:            return QStringLiteral("WatchError");
        case PipelineErrorKind::ArchiveOpenError:      return QStringLiteral("ArchiveOpenError");
        case PipelineErrorKind::ParseError:            return QStringLiteral("ParseError");
        case PipelineErrorKind::IoTimeoutError:        return QStringLiteral("IoTimeoutError");
        case PipelineErrorKind::StoreTransactionError: return QStringLiteral("StoreTransactionError");
        case PipelineErrorKind::MemorySampleError:     return QStringLiteral("MemorySampleError");
    }
    return QStringLiteral("Error");
}

// Formats an error for FileRecord::lastError / log lines, e.g. "ParseError: unexpected end of document".
inline QString formatPipelineError(PipelineErrorKind k, const QString& message) {
    return QStringLiteral("%1: %2").arg(pipelineErrorKindName(k), message);
}

#endif //COMICDEX_PIPELINEERROR_H
