// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef COMICDEX_COMICDEXD_WATCHMANAGER_H
#define COMICDEX_COMICDEXD_WATCHMANAGER_H

#include <QObject>
#include <QString>
#include <QTimer>

#include <map>
#include <unordered_map>

class QSocketNotifier;
class Pipeline;
struct inotify_event;

/**
 * Recursive inotify watches over every library root, translated into FsEvents for the
 * pipeline's ChangeDetector.
 *
 * Runs on the Qt event loop. A lost root (deleted, moved away, or not openable) is
 * reported to the detector and re-armed with exponential backoff; once it is back, a
 * full sweep catches up on whatever changed in the meantime.
 */
class WatchManager final : public QObject {
    Q_OBJECT
public:
    struct Status {
        QString state; // "watching" | "error"
        QString error; // empty if OK
    };

    explicit WatchManager(Pipeline* pipeline, QObject* parent = nullptr);
    ~WatchManager() override;

    bool start(QString* errorOut = nullptr);

    [[nodiscard]] Status statusFor(const QString& root) const;

signals:
    void statusChanged();

private:
    struct RootEntry {
        QString root;
        Status status{QStringLiteral("error"), QStringLiteral("Not initialized")};

        int failCount = 0;
        qint64 nextRetryMs = 0;
        QTimer* retryTimer = nullptr;
    };

    struct PendingMove {
        QString path;
        bool isDir = false;
    };

    void armRoot(RootEntry& e);
    void failRoot(RootEntry& e, const QString& message);

    // Adds watches for dir and every non-hidden directory below it.
    bool addWatchTree(const QString& dir, const QString& root, bool emitExisting, QString* errorOut);
    void dropWatchTree(const QString& dir);
    void rebaseWatchTree(const QString& fromDir, const QString& toDir);

    void onInotifyReadable();
    void handleEvent(const inotify_event* ev);
    void flushPendingMoves();

    [[nodiscard]] RootEntry* rootEntryForWatch(const QString& dirPath);
    [[nodiscard]] QString rootFor(const QString& path) const;

    Pipeline* m_pipeline = nullptr;

    int m_fd = -1;
    QSocketNotifier* m_notifier = nullptr;

    std::unordered_map<int, QString> m_wdToPath;
    std::unordered_map<QString, int> m_pathToWd;

    std::map<QString, RootEntry> m_roots;

    // MOVED_FROM halves waiting for their MOVED_TO, keyed by cookie.
    std::unordered_map<quint32, PendingMove> m_pendingMoves;
    QTimer* m_moveTimer = nullptr;

    static constexpr int kMovePairMs = 250;
};

#endif //COMICDEX_COMICDEXD_WATCHMANAGER_H
