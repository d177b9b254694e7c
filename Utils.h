// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef COMICDEX_UTILS_H
#define COMICDEX_UTILS_H

#include <QString>
#include <QStringList>
#include <QtGlobal>
#include <optional>

namespace Utils {
    /**
     * Default set of archive extensions tracked by the index (lower case, without dot).
     */
    QStringList defaultArchiveExtensions();

    /**
     * Normalizes a path to the canonical absolute form used as the index key.
     *
     * Symlinks are resolved when the path exists. For paths that no longer exist
     * (delete / move-from events) the path is only cleaned, since there is nothing
     * left on disk to resolve.
     */
    QString canonicalPath(const QString& path);

    // True when any component of path below root starts with '.'.
    bool isHiddenBelow(const QString& path, const QString& root);

    bool hasArchiveExtension(const QString& path, const QStringList& extensions);

    // True if path equals dir or is located somewhere beneath it.
    bool isSameOrBelow(const QString& path, const QString& dir);

    // Rewrites a path located under fromDir so that it is located under toDir instead.
    QString rebasePath(const QString& path, const QString& fromDir, const QString& toDir);

    struct FileStat {
        qint64 size = 0;
        qint64 mtimeMs = 0;
        QString fingerprint;
    };

    /**
     * Stats a regular file and derives its content fingerprint.
     *
     * The fingerprint is a size + mtime(ns) + inode composite hashed down to 16 hex
     * characters. It is cheap (no file content is read) and changes on every rewrite.
     *
     * @return std::nullopt if the file does not exist or is not a regular file.
     */
    std::optional<FileStat> statFile(const QString& path, QString* errorOut = nullptr);

    qint64 nowMsUtc();
}

#endif //COMICDEX_UTILS_H
