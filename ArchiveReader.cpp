// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "ArchiveReader.h"
#include "archives/ZipArchiveReader.h"

#include <QFileInfo>

const ArchiveReader::Entry* ArchiveReader::findByFileName(const QString& fileName) const {
    const Entry* best = nullptr;
    qsizetype bestDepth = 0;

    for (const Entry& e : m_entries) {
        if (e.isDirectory) continue;

        const qsizetype slash = e.name.lastIndexOf(QLatin1Char('/'));
        const QStringView base = slash < 0 ? QStringView(e.name) : QStringView(e.name).mid(slash + 1);
        if (base.compare(fileName, Qt::CaseInsensitive) != 0) continue;

        const qsizetype depth = e.name.count(QLatin1Char('/'));
        if (!best || depth < bestDepth) {
            best = &e;
            bestDepth = depth;
        }
    }
    return best;
}

bool ArchiveReader::isImageName(const QString& name) {
    static const QStringList kImageSuffixes = {
        QStringLiteral("jpg"), QStringLiteral("jpeg"), QStringLiteral("png"), QStringLiteral("gif"),
        QStringLiteral("webp"), QStringLiteral("bmp"), QStringLiteral("avif"), QStringLiteral("jxl")
    };
    return kImageSuffixes.contains(QFileInfo(name).suffix().toLower());
}

quint32 ArchiveReader::imageEntryCount() const {
    quint32 n = 0;
    for (const Entry& e : m_entries) {
        if (!e.isDirectory && isImageName(e.name)) ++n;
    }
    return n;
}

bool ArchiveReader::checkDeadline(QString* errorOut) {
    if (!m_deadline.hasExpired()) return true;
    m_timedOut = true;
    if (errorOut) *errorOut = QStringLiteral("archive I/O exceeded its time budget");
    return false;
}

std::unique_ptr<ArchiveReader> ArchiveReader::forPath(const QString& path) {
    const QString suffix = QFileInfo(path).suffix().toLower();
    if (suffix == QStringLiteral("cbz") || suffix == QStringLiteral("zip")) {
        return std::make_unique<ZipArchiveReader>();
    }
    return nullptr;
}
