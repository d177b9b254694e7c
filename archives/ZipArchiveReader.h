// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef COMICDEX_ARCHIVES_ZIPARCHIVEREADER_H
#define COMICDEX_ARCHIVES_ZIPARCHIVEREADER_H

#include <QFile>

#include "../ArchiveReader.h"

/**
 * ZIP reader for .cbz / .zip archives.
 *
 * Only the end-of-central-directory record and the central directory are read on
 * open(). Entries are inflated with zlib in fixed-size chunks, so peak memory is
 * bounded by the chunk buffers plus the caller's maxBytes cap. ZIP64 archives are
 * supported; multi-disk archives and encrypted entries are not.
 */
class ZipArchiveReader final : public ArchiveReader {
public:
    ZipArchiveReader() = default;
    ~ZipArchiveReader() override;

    bool open(const QString& path, QString* errorOut = nullptr) override;
    void close() override;

    [[nodiscard]] QString formatName() const override { return QStringLiteral("zip"); }

    std::optional<QByteArray> readEntry(const Entry& entry, qint64 maxBytes, QString* errorOut = nullptr) override;

private:
    struct DirectoryLocation {
        quint64 offset = 0;
        quint64 size = 0;
        quint64 entryCount = 0;
    };

    std::optional<DirectoryLocation> locateCentralDirectory(QString* errorOut);
    bool parseCentralDirectory(const DirectoryLocation& loc, QString* errorOut);
    bool readExact(quint64 offset, char* dst, qint64 len, QString* errorOut);

    static constexpr qint64 kChunkBytes = 64 * 1024;
    static constexpr quint64 kMaxCentralDirectoryBytes = 64ull * 1024 * 1024;
    static constexpr quint64 kMaxEntries = 1'000'000;

    QFile m_file;
    quint64 m_fileSize = 0;
};

#endif //COMICDEX_ARCHIVES_ZIPARCHIVEREADER_H
