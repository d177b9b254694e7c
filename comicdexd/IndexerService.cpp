// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "IndexerService.h"
#include "WatchManager.h"
#include "../Pipeline.h"
#include "../Utils.h"
#include "../Version.h"

#include <QDebug>
#include <QMetaObject>

#include <QtDBus/QDBusConnection>
#include <QtDBus/QDBusError>

static constexpr quint32 kMaxQueryLimit = 1000;

IndexerService::IndexerService(Pipeline* pipeline, QObject* parent)
    : QObject(parent), m_pipeline(pipeline) {
    if (!m_pipeline) return;

    // Hooks fire on pipeline threads; signals are emitted from the event loop.
    m_invalidationHookId = m_pipeline->addInvalidationHook([this](const QString& path) {
        QMetaObject::invokeMethod(this, [this, path]() { Q_EMIT PathInvalidated(path); }, Qt::QueuedConnection);
    });
    m_pipeline->setHealthHook([this]() {
        QMetaObject::invokeMethod(this, [this]() { Q_EMIT HealthChanged(); }, Qt::QueuedConnection);
    });
}

IndexerService::~IndexerService() {
    if (m_pipeline) {
        // The hooks capture this. Join the pipeline threads first so none is still inside one.
        m_pipeline->stop();
        m_pipeline->removeInvalidationHook(m_invalidationHookId);
        m_pipeline->setHealthHook({});
    }
}

bool IndexerService::openIndex(QString* errorOut) {
    if (!m_pipeline) {
        if (errorOut) *errorOut = QStringLiteral("no pipeline");
        return false;
    }
    return m_store.open(m_pipeline->config().databasePath, IndexStore::Mode::ReadOnly, errorOut);
}

bool IndexerService::ensureIndex() {
    if (m_store.isOpen()) return true;

    QString err;
    if (openIndex(&err)) return true;

    qWarning().noquote() << QStringLiteral("[dbus] index unavailable: %1").arg(err);
    sendErrorReply(QDBusError::Failed, QStringLiteral("Index is not available: %1").arg(err));
    return false;
}

void IndexerService::setWatchManager(WatchManager* watch) {
    if (m_watch) disconnect(m_watch, nullptr, this, nullptr);
    m_watch = watch;
    if (m_watch) connect(m_watch, &WatchManager::statusChanged, this, &IndexerService::HealthChanged);
}

QVariantMap IndexerService::metadataToVariant(const MetadataMap& metadata) {
    QVariantMap m;
    for (const auto& [key, value] : metadata) {
        if (const auto* s = std::get_if<QString>(&value)) {
            m.insert(key, *s);
        } else if (const auto* i = std::get_if<qint64>(&value)) {
            m.insert(key, QVariant::fromValue<qlonglong>(*i));
        } else if (const auto* l = std::get_if<QStringList>(&value)) {
            m.insert(key, *l);
        }
    }
    return m;
}

QVariantMap IndexerService::recordToVariant(const FileRecord& r) {
    QVariantMap m;
    m.insert(QStringLiteral("path"), r.path);
    m.insert(QStringLiteral("size"), QVariant::fromValue<qlonglong>(r.size));
    m.insert(QStringLiteral("mtimeMs"), QVariant::fromValue<qlonglong>(r.mtimeMs));
    m.insert(QStringLiteral("fingerprint"), r.fingerprint);
    m.insert(QStringLiteral("state"), scanStateName(r.scanState));
    m.insert(QStringLiteral("lastScannedAt"), QVariant::fromValue<qlonglong>(r.lastScannedAt));
    m.insert(QStringLiteral("lastError"), r.lastError.value_or(QString()));
    m.insert(QStringLiteral("failureCount"), QVariant::fromValue<uint>(r.failureCount));
    m.insert(QStringLiteral("metadata"), metadataToVariant(r.metadata));
    return m;
}

void IndexerService::Ping(QString& versionOut, quint32& apiVersionOut) const {
    versionOut = QStringLiteral("comicdexd %1").arg(QString::fromLatin1(Version::VERSION.data(),
                                                                        static_cast<qsizetype>(Version::VERSION.size())));
    apiVersionOut = Version::API_VERSION;
}

QVariantMap IndexerService::GetRecord(const QString& path) {
    if (!ensureIndex()) return {};

    const QString key = Utils::canonicalPath(path);

    QString err;
    const std::optional<FileRecord> rec = m_store.get(key, &err);
    if (!rec) {
        if (!err.isEmpty()) {
            sendErrorReply(QDBusError::Failed, err);
        } else {
            sendErrorReply(QDBusError::InvalidArgs, QStringLiteral("Not tracked: %1").arg(key));
        }
        return {};
    }
    return recordToVariant(*rec);
}

void IndexerService::Query(const QVariantMap& filter,
                           const QString& after,
                           quint32 limit,
                           QVariantList& rowsOut,
                           QString& nextAfterOut) {
    rowsOut.clear();
    nextAfterOut.clear();

    if (!ensureIndex()) return;

    if (limit == 0 || limit > kMaxQueryLimit) {
        sendErrorReply(QDBusError::InvalidArgs, QStringLiteral("limit must be between 1 and %1").arg(kMaxQueryLimit));
        return;
    }

    RecordFilter f;
    f.pathPrefix = filter.value(QStringLiteral("pathPrefix")).toString();
    if (!f.pathPrefix.isEmpty()) f.pathPrefix = Utils::canonicalPath(f.pathPrefix);

    if (filter.contains(QStringLiteral("state"))) {
        const QString stateName = filter.value(QStringLiteral("state")).toString();
        f.state = scanStateFromName(stateName);
        if (!f.state) {
            sendErrorReply(QDBusError::InvalidArgs, QStringLiteral("Unknown state: %1").arg(stateName));
            return;
        }
    }

    f.field = filter.value(QStringLiteral("field")).toString();
    f.value = filter.value(QStringLiteral("value")).toString();
    if (filter.contains(QStringLiteral("minFailureCount"))) {
        f.minFailureCount = filter.value(QStringLiteral("minFailureCount")).toUInt();
    }
    f.afterPath = after;
    f.pageSize = static_cast<int>(limit);

    RecordCursor cursor = m_store.query(f);

    QString err;
    rowsOut.reserve(static_cast<qsizetype>(limit));
    while (rowsOut.size() < static_cast<qsizetype>(limit)) {
        std::optional<FileRecord> rec = cursor.next(&err);
        if (!rec) break;
        nextAfterOut = rec->path;
        rowsOut.push_back(recordToVariant(*rec));
    }

    if (!err.isEmpty()) {
        rowsOut.clear();
        nextAfterOut.clear();
        sendErrorReply(QDBusError::Failed, err);
        return;
    }

    if (rowsOut.size() < static_cast<qsizetype>(limit)) nextAfterOut.clear();
}

QVariantMap IndexerService::Status(const QString& path) {
    QVariantMap m;
    if (!ensureIndex()) return m;

    const QString key = Utils::canonicalPath(path);

    QString err;
    const std::optional<FileRecord> rec = m_store.get(key, &err);
    if (!rec && !err.isEmpty()) {
        sendErrorReply(QDBusError::Failed, err);
        return m;
    }

    m.insert(QStringLiteral("path"), key);
    m.insert(QStringLiteral("queued"), m_pipeline && m_pipeline->queue().contains(key));

    if (!rec) {
        m.insert(QStringLiteral("state"), QStringLiteral("untracked"));
        return m;
    }

    m.insert(QStringLiteral("state"), scanStateName(rec->scanState));
    m.insert(QStringLiteral("lastError"), rec->lastError.value_or(QString()));
    m.insert(QStringLiteral("failureCount"), QVariant::fromValue<uint>(rec->failureCount));
    m.insert(QStringLiteral("lastScannedAt"), QVariant::fromValue<qlonglong>(rec->lastScannedAt));
    return m;
}

void IndexerService::Rescan(const QString& path) {
    if (!m_pipeline) {
        sendErrorReply(QDBusError::Failed, QStringLiteral("Pipeline is not running."));
        return;
    }

    QString err;
    if (!m_pipeline->requestManualRescan(path, &err)) {
        qInfo().noquote() << QStringLiteral("[dbus] Rescan(%1) rejected: %2").arg(path, err);
        sendErrorReply(QDBusError::InvalidArgs, err);
    }
}

void IndexerService::FullSweep() {
    if (!m_pipeline) {
        sendErrorReply(QDBusError::Failed, QStringLiteral("Pipeline is not running."));
        return;
    }

    QString err;
    if (!m_pipeline->requestFullSweep(&err)) {
        sendErrorReply(QDBusError::Failed, err);
        return;
    }
    Q_EMIT HealthChanged();
}

QVariantMap IndexerService::Health() {
    QVariantMap m;
    if (!m_pipeline) return m;

    const Pipeline::Health h = m_pipeline->health();

    QVariantMap roots;
    for (const auto& [root, st] : h.roots) {
        QVariantMap r;
        r.insert(QStringLiteral("state"), st.state);
        r.insert(QStringLiteral("error"), st.error);
        roots.insert(root, r);
    }

    m.insert(QStringLiteral("roots"), roots);
    m.insert(QStringLiteral("storeDegraded"), h.storeDegraded);
    m.insert(QStringLiteral("lastStoreError"), h.lastStoreError);
    m.insert(QStringLiteral("memoryTier"), memoryTierName(h.memory.tier));
    m.insert(QStringLiteral("residentBytes"), QVariant::fromValue<qulonglong>(h.memory.residentBytes));
    m.insert(QStringLiteral("queueLength"), QVariant::fromValue<qulonglong>(h.queueLength));
    m.insert(QStringLiteral("inFlight"), QVariant::fromValue<qulonglong>(h.inFlight));
    m.insert(QStringLiteral("sweepRunning"), h.sweepRunning);

    if (m_store.isOpen()) {
        QString err;
        if (const auto n = m_store.count({}, &err)) {
            m.insert(QStringLiteral("trackedFiles"), QVariant::fromValue<qulonglong>(*n));
        } else {
            qWarning().noquote() << QStringLiteral("[dbus] count failed: %1").arg(err);
        }
    }
    return m;
}
