// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef COMICDEX_COMICDEXD_INDEXERSERVICE_H
#define COMICDEX_COMICDEXD_INDEXERSERVICE_H

#include <QObject>
#include <QString>
#include <QVariantList>
#include <QVariantMap>

#include <QtDBus/QDBusContext>

#include "../FileRecord.h"
#include "../IndexStore.h"

class Pipeline;
class WatchManager;

class IndexerService final : public QObject, protected QDBusContext {
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "net.comicdex.Indexer1")

public:
    explicit IndexerService(Pipeline* pipeline, QObject* parent = nullptr);

    // Stops the pipeline before unregistering its hooks.
    ~IndexerService() override;

    // Opens the read-only index connection used by the query methods.
    bool openIndex(QString* errorOut = nullptr);

    void setWatchManager(WatchManager* watch);

    [[nodiscard]] static QVariantMap recordToVariant(const FileRecord& r);
    [[nodiscard]] static QVariantMap metadataToVariant(const MetadataMap& metadata);

public slots:
    /**
     * Provides version information about the IndexerService and its API.
     *
     * @param versionOut A reference to a QString object that will be populated with the service version string.
     * @param apiVersionOut A reference to a quint32 variable that will be populated with the API version integer.
     */
    void Ping(QString& versionOut, quint32& apiVersionOut) const;

    /**
     * Looks up the record of one archive.
     *
     * @param path Absolute path of the archive. It is canonicalized before the lookup.
     * @return A dictionary (a{sv}) with the keys:
     *         - path: string
     *         - size: int64
     *         - mtimeMs: int64 (unix milliseconds)
     *         - fingerprint: string
     *         - state: string ("unscanned", "queued", "scanning", "clean", "failed")
     *         - lastScannedAt: int64 (unix milliseconds; 0 = never)
     *         - lastError: string (empty if none)
     *         - failureCount: uint32
     *         - metadata: a{sv} of field -> string | int64 | string list
     *         Replies with an error if the path is not tracked.
     */
    QVariantMap GetRecord(const QString& path);

    /**
     * Returns one page of records matching a filter, in path order.
     *
     * @param filter Dictionary with optional keys:
     *               - pathPrefix: string (directory whose descendants are returned)
     *               - state: string (scan state name)
     *               - field, value: string (metadata equality, case-insensitive)
     *               - minFailureCount: uint32
     * @param after Path of the last record of the previous page; empty for the first page.
     * @param limit Maximum number of records to return (1..1000).
     * @param rowsOut Populated with records, each in the GetRecord format.
     * @param nextAfterOut Set to the `after` value for the next page, or empty if this was the last.
     */
    void Query(const QVariantMap& filter,
               const QString& after,
               quint32 limit,
               QVariantList& rowsOut,
               QString& nextAfterOut);

    /**
     * Reports the scan status of one path.
     *
     * @return A dictionary with state, lastError, failureCount, lastScannedAt and queued
     *         (true while a job for the path is waiting). An untracked path reports state
     *         "untracked".
     */
    QVariantMap Status(const QString& path);

    /**
     * Queues a manual re-scan of an archive, or of every archive below a directory.
     * Replies with an error if the path is outside every library root or does not exist.
     */
    void Rescan(const QString& path);

    /**
     * Starts a background sweep of every library root.
     * Replies with an error if a sweep is already running.
     */
    void FullSweep();

    /**
     * Reports pipeline health.
     *
     * @return A dictionary with the keys:
     *         - roots: a{sv} of root -> {state, error}
     *         - storeDegraded: bool
     *         - lastStoreError: string
     *         - memoryTier: string ("normal", "elevated", "critical")
     *         - residentBytes: uint64
     *         - queueLength: uint64
     *         - inFlight: uint64
     *         - sweepRunning: bool
     *         - trackedFiles: uint64
     */
    QVariantMap Health();

signals:
    // A cached view of this path is stale (the record was moved away or removed).
    void PathInvalidated(const QString& path);

    void HealthChanged();

private:
    [[nodiscard]] bool ensureIndex();

    Pipeline* m_pipeline = nullptr;
    WatchManager* m_watch = nullptr;

    IndexStore m_store;
    int m_invalidationHookId = 0;
};

#endif //COMICDEX_COMICDEXD_INDEXERSERVICE_H
