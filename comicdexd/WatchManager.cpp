// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "WatchManager.h"
#include "../Pipeline.h"
#include "../Utils.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QSocketNotifier>

#include <algorithm>
#include <vector>

#include <cerrno>
#include <cstring>

#include <sys/inotify.h>
#include <unistd.h>

static constexpr uint32_t kWatchMask =
    IN_CREATE | IN_DELETE | IN_MODIFY | IN_CLOSE_WRITE |
    IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE_SELF | IN_MOVE_SELF |
    IN_ONLYDIR | IN_DONT_FOLLOW | IN_EXCL_UNLINK;

static qint64 backoffMsForFailCount(int failCount) {
    // 0 -> 0ms (no backoff), 1 -> 30s, 2 -> 60s, 3 -> 120s, ... capped at 10 minutes.
    static constexpr qint64 kBase = 30'000;
    static constexpr qint64 kCap  = 10 * 60'000;

    if (failCount <= 0) return 0;

    qint64 ms = kBase;
    for (int i = 1; i < failCount; ++i) {
        if (ms > (kCap / 2)) { ms = kCap; break; }
        ms *= 2;
    }
    if (ms > kCap) ms = kCap;
    return ms;
}

static QString errnoString(int err) {
    return QStringLiteral("(%1): %2").arg(err).arg(QString::fromLocal8Bit(std::strerror(err)));
}

WatchManager::WatchManager(Pipeline* pipeline, QObject* parent)
    : QObject(parent), m_pipeline(pipeline) {}

WatchManager::~WatchManager() {
    for (auto& kv : m_roots) {
        if (kv.second.retryTimer) kv.second.retryTimer->stop();
    }
    if (m_notifier) {
        m_notifier->setEnabled(false);
        delete m_notifier;
        m_notifier = nullptr;
    }
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

bool WatchManager::start(QString* errorOut) {
    if (!m_pipeline) {
        if (errorOut) *errorOut = QStringLiteral("no pipeline");
        return false;
    }

    m_fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (m_fd < 0) {
        if (errorOut) *errorOut = QStringLiteral("inotify_init1 failed %1").arg(errnoString(errno));
        return false;
    }

    m_notifier = new QSocketNotifier(m_fd, QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, [this]() { onInotifyReadable(); });

    m_moveTimer = new QTimer(this);
    m_moveTimer->setSingleShot(true);
    connect(m_moveTimer, &QTimer::timeout, this, [this]() { flushPendingMoves(); });

    for (const QString& root : m_pipeline->config().roots) {
        RootEntry& e = m_roots[root];
        e.root = root;

        e.retryTimer = new QTimer(this);
        e.retryTimer->setSingleShot(true);
        connect(e.retryTimer, &QTimer::timeout, this, [this, root]() {
            auto it = m_roots.find(root);
            if (it == m_roots.end()) return;
            armRoot(it->second);
        });

        armRoot(e);
    }

    return true;
}

WatchManager::Status WatchManager::statusFor(const QString& root) const {
    auto it = m_roots.find(root);
    if (it == m_roots.end()) {
        return Status{QStringLiteral("error"), QStringLiteral("Not a configured library root.")};
    }
    return it->second.status;
}

void WatchManager::armRoot(RootEntry& e) {
    const bool wasError = e.status.state != QStringLiteral("watching");
    const bool firstAttempt = e.failCount == 0 && e.status.error == QStringLiteral("Not initialized");

    QString err;
    if (!addWatchTree(e.root, e.root, false, &err)) {
        dropWatchTree(e.root);
        failRoot(e, err);
        return;
    }

    e.status = Status{QStringLiteral("watching"), QString()};
    e.failCount = 0;
    e.nextRetryMs = 0;

    qInfo().noquote() << QStringLiteral("[watch] %1 armed (%2 directories watched in total)")
                         .arg(e.root)
                         .arg(m_wdToPath.size());

    if (wasError && !firstAttempt) {
        m_pipeline->detector().reportWatchRestored(e.root);

        // Anything that happened while the root was gone was not observed.
        QString sweepErr;
        if (!m_pipeline->requestFullSweep(&sweepErr)) {
            qInfo().noquote() << QStringLiteral("[watch] catch-up sweep for %1 not started: %2").arg(e.root, sweepErr);
        }
    }

    Q_EMIT statusChanged();
}

void WatchManager::failRoot(RootEntry& e, const QString& message) {
    e.status = Status{QStringLiteral("error"), message};
    e.failCount = std::min(e.failCount + 1, 30);

    const qint64 delay = backoffMsForFailCount(e.failCount);
    e.nextRetryMs = Utils::nowMsUtc() + delay;
    if (e.retryTimer) e.retryTimer->start(static_cast<int>(delay));

    m_pipeline->detector().reportWatchError(e.root, message);

    qWarning().noquote() << QStringLiteral("[watch] %1 unavailable (attempt %2), retrying in %3s: %4")
                            .arg(e.root)
                            .arg(e.failCount)
                            .arg(delay / 1000)
                            .arg(message);

    Q_EMIT statusChanged();
}

bool WatchManager::addWatchTree(const QString& dir, const QString& root, bool emitExisting, QString* errorOut) {
    const QStringList& exts = m_pipeline->config().extensions;

    std::vector<QString> pending{QDir::cleanPath(dir)};
    while (!pending.empty()) {
        const QString d = pending.back();
        pending.pop_back();

        const QByteArray native = QFile::encodeName(d);
        const int wd = inotify_add_watch(m_fd, native.constData(), kWatchMask);
        if (wd < 0) {
            const int err = errno;
            const QString msg = QStringLiteral("inotify_add_watch(%1) failed %2").arg(d, errnoString(err));

            // The top directory must be watchable; a subdirectory vanishing mid-walk is not fatal.
            if (d == QDir::cleanPath(dir)) {
                if (errorOut) *errorOut = msg;
                return false;
            }
            if (err == ENOSPC) {
                qWarning().noquote() << QStringLiteral("[watch] %1 (raise fs.inotify.max_user_watches)").arg(msg);
            }
            continue;
        }

        m_wdToPath[wd] = d;
        m_pathToWd[d] = wd;

        QDirIterator it(d, QDir::Dirs | QDir::Files | QDir::NoDotAndDotDot | QDir::NoSymLinks);
        while (it.hasNext()) {
            const QString p = QDir::cleanPath(it.next());
            if (Utils::isHiddenBelow(p, root)) continue;

            const QFileInfo fi = it.fileInfo();
            if (fi.isDir()) {
                pending.push_back(p);
            } else if (emitExisting && Utils::hasArchiveExtension(p, exts)) {
                m_pipeline->detector().observe(FsEvent{FsEvent::Kind::Created, p, QString(), false});
            }
        }
    }
    return true;
}

void WatchManager::dropWatchTree(const QString& dir) {
    for (auto it = m_pathToWd.begin(); it != m_pathToWd.end(); ) {
        if (Utils::isSameOrBelow(it->first, dir)) {
            inotify_rm_watch(m_fd, it->second);
            m_wdToPath.erase(it->second);
            it = m_pathToWd.erase(it);
        } else {
            ++it;
        }
    }
}

void WatchManager::rebaseWatchTree(const QString& fromDir, const QString& toDir) {
    std::vector<std::pair<QString, int>> moved;
    for (auto it = m_pathToWd.begin(); it != m_pathToWd.end(); ) {
        if (Utils::isSameOrBelow(it->first, fromDir)) {
            moved.emplace_back(Utils::rebasePath(it->first, fromDir, toDir), it->second);
            it = m_pathToWd.erase(it);
        } else {
            ++it;
        }
    }
    for (const auto& [path, wd] : moved) {
        m_pathToWd[path] = wd;
        m_wdToPath[wd] = path;
    }
}

WatchManager::RootEntry* WatchManager::rootEntryForWatch(const QString& dirPath) {
    auto it = m_roots.find(dirPath);
    return it == m_roots.end() ? nullptr : &it->second;
}

QString WatchManager::rootFor(const QString& path) const {
    QString best;
    for (const auto& kv : m_roots) {
        if (Utils::isSameOrBelow(path, kv.first) && kv.first.size() > best.size()) best = kv.first;
    }
    return best;
}

void WatchManager::onInotifyReadable() {
    if (m_fd < 0) return;

    alignas(inotify_event) char buf[64 * 1024];

    while (true) {
        const ssize_t nread = ::read(m_fd, buf, sizeof(buf));
        if (nread < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            if (errno == EINTR) continue;

            qWarning().noquote() << QStringLiteral("[watch] inotify read failed %1").arg(errnoString(errno));
            break;
        }
        if (nread == 0) break;

        for (ssize_t off = 0; off < nread; ) {
            const auto* ev = reinterpret_cast<const inotify_event*>(buf + off);
            handleEvent(ev);
            off += static_cast<ssize_t>(sizeof(inotify_event) + ev->len);
        }
    }

    if (!m_pendingMoves.empty() && m_moveTimer && !m_moveTimer->isActive()) {
        m_moveTimer->start(kMovePairMs);
    }
}

void WatchManager::handleEvent(const inotify_event* ev) {
    if (ev->mask & IN_Q_OVERFLOW) {
        qWarning().noquote() << QStringLiteral("[watch] event queue overflowed, requesting a full sweep");
        QString err;
        if (!m_pipeline->requestFullSweep(&err)) {
            qInfo().noquote() << QStringLiteral("[watch] sweep not started: %1").arg(err);
        }
        return;
    }

    auto wdIt = m_wdToPath.find(ev->wd);
    if (wdIt == m_wdToPath.end()) return;
    const QString dirPath = wdIt->second;

    // Events about the watched directory itself.
    if (ev->mask & (IN_DELETE_SELF | IN_MOVE_SELF | IN_IGNORED)) {
        if (RootEntry* root = rootEntryForWatch(dirPath)) {
            if (root->status.state != QStringLiteral("watching")) return;

            dropWatchTree(root->root);
            const QString why = (ev->mask & IN_MOVE_SELF) ? QStringLiteral("root was moved away")
                                : (ev->mask & IN_DELETE_SELF) ? QStringLiteral("root was deleted")
                                : QStringLiteral("root watch was removed");
            failRoot(*root, why);
            return;
        }

        // Subdirectories: the parent reports the delete / move; just forget the watch.
        if (ev->mask & IN_IGNORED) {
            m_pathToWd.erase(dirPath);
            m_wdToPath.erase(ev->wd);
        }
        return;
    }

    if (ev->len == 0) return;

    const QString name = QFile::decodeName(QByteArray(ev->name));
    const QString path = QDir(dirPath).filePath(name);
    const bool isDir = (ev->mask & IN_ISDIR) != 0;

    ChangeDetector& detector = m_pipeline->detector();

    if (ev->mask & IN_MOVED_FROM) {
        m_pendingMoves[ev->cookie] = PendingMove{path, isDir};
        return;
    }

    if (ev->mask & IN_MOVED_TO) {
        auto pm = m_pendingMoves.find(ev->cookie);
        if (pm == m_pendingMoves.end()) {
            // Arrived from outside the watched tree.
            if (isDir) {
                QString err;
                if (!Utils::isHiddenBelow(path, rootFor(path)) && !addWatchTree(path, rootFor(path), true, &err)) {
                    qWarning().noquote() << QStringLiteral("[watch] %1").arg(err);
                }
            } else {
                detector.observe(FsEvent{FsEvent::Kind::Created, path, QString(), false});
            }
            return;
        }

        const QString oldPath = pm->second.path;
        m_pendingMoves.erase(pm);

        if (isDir) {
            const QString root = rootFor(path);
            if (m_pathToWd.contains(oldPath)) {
                rebaseWatchTree(oldPath, path);
                if (Utils::isHiddenBelow(path, root)) dropWatchTree(path);
            } else if (!Utils::isHiddenBelow(path, root)) {
                // Was hidden (unwatched) before the move.
                QString err;
                if (!addWatchTree(path, root, true, &err)) {
                    qWarning().noquote() << QStringLiteral("[watch] %1").arg(err);
                }
            }
        }

        detector.observe(FsEvent{FsEvent::Kind::Moved, path, oldPath, isDir});
        return;
    }

    if (ev->mask & IN_CREATE) {
        if (isDir) {
            QString err;
            if (!Utils::isHiddenBelow(path, rootFor(path)) && !addWatchTree(path, rootFor(path), true, &err)) {
                qWarning().noquote() << QStringLiteral("[watch] %1").arg(err);
            }
            return;
        }
        detector.observe(FsEvent{FsEvent::Kind::Created, path, QString(), false});
        return;
    }

    if (ev->mask & IN_DELETE) {
        if (isDir) dropWatchTree(path);
        detector.observe(FsEvent{FsEvent::Kind::Deleted, path, QString(), isDir});
        return;
    }

    if (ev->mask & (IN_MODIFY | IN_CLOSE_WRITE)) {
        if (!isDir) detector.observe(FsEvent{FsEvent::Kind::Modified, path, QString(), false});
    }
}

void WatchManager::flushPendingMoves() {
    if (m_pendingMoves.empty()) return;

    // Never paired: moved out of the watched tree.
    for (const auto& kv : m_pendingMoves) {
        const PendingMove& pm = kv.second;
        if (pm.isDir) dropWatchTree(pm.path);
        m_pipeline->detector().observe(FsEvent{FsEvent::Kind::Deleted, pm.path, QString(), pm.isDir});
    }
    m_pendingMoves.clear();
}
