// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "Utils.h"

#include <QCryptographicHash>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <cerrno>
#include <cstring>

#include <sys/stat.h>

namespace Utils {
    QStringList defaultArchiveExtensions() {
        return {
            QStringLiteral("cbz"), QStringLiteral("zip"),
            QStringLiteral("cbr"), QStringLiteral("rar"),
            QStringLiteral("cb7"), QStringLiteral("7z")
        };
    }

    QString canonicalPath(const QString& path) {
        const QString abs = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
        const QString resolved = QFileInfo(abs).canonicalFilePath();
        return resolved.isEmpty() ? abs : resolved;
    }

    bool isHiddenBelow(const QString& path, const QString& root) {
        QString rel = path;
        if (isSameOrBelow(path, root)) {
            rel = QDir(root).relativeFilePath(path);
        }

        const QStringList parts = rel.split(QLatin1Char('/'), Qt::SkipEmptyParts);
        for (const QString& part : parts) {
            if (part.startsWith(QLatin1Char('.')) && part != QStringLiteral(".") && part != QStringLiteral(".."))
                return true;
        }
        return false;
    }

    bool hasArchiveExtension(const QString& path, const QStringList& extensions) {
        const QString suffix = QFileInfo(path).suffix().toLower();
        if (suffix.isEmpty()) return false;
        return extensions.contains(suffix);
    }

    bool isSameOrBelow(const QString& path, const QString& dir) {
        if (dir.isEmpty()) return false;
        if (path == dir) return true;

        const QString prefix = dir.endsWith(QLatin1Char('/')) ? dir : dir + QLatin1Char('/');
        return path.startsWith(prefix);
    }

    QString rebasePath(const QString& path, const QString& fromDir, const QString& toDir) {
        if (path == fromDir) return toDir;
        if (!isSameOrBelow(path, fromDir)) return path;
        return toDir + path.mid(fromDir.size());
    }

    std::optional<FileStat> statFile(const QString& path, QString* errorOut) {
        const QByteArray native = QFile::encodeName(path);

        struct stat st {};
        if (::stat(native.constData(), &st) != 0) {
            if (errorOut) {
                *errorOut = QStringLiteral("stat(%1) failed (%2): %3")
                                .arg(path)
                                .arg(errno)
                                .arg(QString::fromLocal8Bit(std::strerror(errno)));
            }
            return std::nullopt;
        }

        if (!S_ISREG(st.st_mode)) {
            if (errorOut) *errorOut = QStringLiteral("Not a regular file: %1").arg(path);
            return std::nullopt;
        }

        const qint64 mtimeNs = static_cast<qint64>(st.st_mtim.tv_sec) * 1'000'000'000LL + st.st_mtim.tv_nsec;

        FileStat out;
        out.size = static_cast<qint64>(st.st_size);
        out.mtimeMs = mtimeNs / 1'000'000LL;

        QCryptographicHash h(QCryptographicHash::Sha1);
        h.addData(QByteArray::number(out.size));
        h.addData(QByteArrayView(":"));
        h.addData(QByteArray::number(mtimeNs));
        h.addData(QByteArrayView(":"));
        h.addData(QByteArray::number(static_cast<qulonglong>(st.st_ino)));
        out.fingerprint = QString::fromLatin1(h.result().toHex().left(16));

        return out;
    }

    qint64 nowMsUtc() {
        return QDateTime::currentMSecsSinceEpoch();
    }
}
