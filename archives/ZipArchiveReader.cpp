// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "ZipArchiveReader.h"

#include <QtEndian>

#include <zlib.h>

#include <algorithm>
#include <memory>

static constexpr quint32 kSigLocalHeader   = 0x04034b50;
static constexpr quint32 kSigCentralHeader = 0x02014b50;
static constexpr quint32 kSigEndOfCentral  = 0x06054b50;
static constexpr quint32 kSigZip64End      = 0x06064b50;
static constexpr quint32 kSigZip64Locator  = 0x07064b50;

static constexpr int kEndOfCentralSize  = 22;
static constexpr int kZip64LocatorSize  = 20;
static constexpr int kZip64EndSize      = 56;
static constexpr int kCentralHeaderSize = 46;
static constexpr int kLocalHeaderSize   = 30;
static constexpr int kMaxCommentSize    = 0xFFFF;

static constexpr quint16 kMethodStored  = 0;
static constexpr quint16 kMethodDeflate = 8;

static constexpr quint16 kFlagEncrypted = 1u << 0;
static constexpr quint16 kFlagUtf8Names = 1u << 11;

static quint16 le16(const char* p) { return qFromLittleEndian<quint16>(p); }
static quint32 le32(const char* p) { return qFromLittleEndian<quint32>(p); }
static quint64 le64(const char* p) { return qFromLittleEndian<quint64>(p); }

namespace {
    // inflateEnd() on every exit path.
    struct InflateStream {
        z_stream zs{};
        bool initialized = false;

        ~InflateStream() {
            if (initialized) inflateEnd(&zs);
        }
    };
}

ZipArchiveReader::~ZipArchiveReader() {
    close();
}

void ZipArchiveReader::close() {
    if (m_file.isOpen()) m_file.close();
    m_entries.clear();
    m_fileSize = 0;
}

bool ZipArchiveReader::readExact(quint64 offset, char* dst, qint64 len, QString* errorOut) {
    if (!checkDeadline(errorOut)) return false;

    if (offset + static_cast<quint64>(len) > m_fileSize) {
        if (errorOut) *errorOut = QStringLiteral("truncated archive (need %1 bytes at offset %2)").arg(len).arg(offset);
        return false;
    }
    if (!m_file.seek(static_cast<qint64>(offset))) {
        if (errorOut) *errorOut = QStringLiteral("seek failed: %1").arg(m_file.errorString());
        return false;
    }

    qint64 done = 0;
    while (done < len) {
        const qint64 n = m_file.read(dst + done, len - done);
        if (n <= 0) {
            if (errorOut) *errorOut = QStringLiteral("read failed: %1").arg(m_file.errorString());
            return false;
        }
        done += n;
        if (!checkDeadline(errorOut)) return false;
    }
    return true;
}

bool ZipArchiveReader::open(const QString& path, QString* errorOut) {
    close();
    m_timedOut = false;

    m_file.setFileName(path);
    if (!m_file.open(QIODevice::ReadOnly)) {
        if (errorOut) *errorOut = QStringLiteral("cannot open %1: %2").arg(path, m_file.errorString());
        return false;
    }
    m_fileSize = static_cast<quint64>(m_file.size());

    const auto loc = locateCentralDirectory(errorOut);
    if (!loc || !parseCentralDirectory(*loc, errorOut)) {
        close();
        return false;
    }
    return true;
}

std::optional<ZipArchiveReader::DirectoryLocation> ZipArchiveReader::locateCentralDirectory(QString* errorOut) {
    if (m_fileSize < static_cast<quint64>(kEndOfCentralSize)) {
        if (errorOut) *errorOut = QStringLiteral("not a zip archive (file too small)");
        return std::nullopt;
    }

    // The EOCD record sits at the very end, followed only by a comment of up to 64 KiB.
    const quint64 tailLen = std::min<quint64>(m_fileSize, kEndOfCentralSize + kMaxCommentSize);
    const quint64 tailStart = m_fileSize - tailLen;

    QByteArray tail(static_cast<qsizetype>(tailLen), Qt::Uninitialized);
    if (!readExact(tailStart, tail.data(), tail.size(), errorOut)) return std::nullopt;

    qsizetype eocd = -1;
    for (qsizetype i = tail.size() - kEndOfCentralSize; i >= 0; --i) {
        if (le32(tail.constData() + i) == kSigEndOfCentral) {
            eocd = i;
            break;
        }
    }
    if (eocd < 0) {
        if (errorOut) *errorOut = QStringLiteral("not a zip archive (end of central directory not found)");
        return std::nullopt;
    }

    const char* p = tail.constData() + eocd;
    const quint16 diskNo = le16(p + 4);
    const quint16 cdDisk = le16(p + 6);

    DirectoryLocation loc;
    loc.entryCount = le16(p + 10);
    loc.size = le32(p + 12);
    loc.offset = le32(p + 16);

    const bool needsZip64 = loc.entryCount == 0xFFFF || loc.size == 0xFFFFFFFFu || loc.offset == 0xFFFFFFFFu;
    const quint64 eocdAbs = tailStart + static_cast<quint64>(eocd);

    if (needsZip64) {
        if (eocdAbs < static_cast<quint64>(kZip64LocatorSize)) {
            if (errorOut) *errorOut = QStringLiteral("zip64 locator missing");
            return std::nullopt;
        }

        char locator[kZip64LocatorSize];
        if (!readExact(eocdAbs - kZip64LocatorSize, locator, kZip64LocatorSize, errorOut)) return std::nullopt;
        if (le32(locator) != kSigZip64Locator) {
            if (errorOut) *errorOut = QStringLiteral("zip64 locator missing");
            return std::nullopt;
        }

        char rec[kZip64EndSize];
        if (!readExact(le64(locator + 8), rec, kZip64EndSize, errorOut)) return std::nullopt;
        if (le32(rec) != kSigZip64End) {
            if (errorOut) *errorOut = QStringLiteral("zip64 end of central directory is corrupt");
            return std::nullopt;
        }

        if (le32(rec + 16) != 0 || le32(rec + 20) != 0) {
            if (errorOut) *errorOut = QStringLiteral("multi-disk zip archives are not supported");
            return std::nullopt;
        }

        loc.entryCount = le64(rec + 32);
        loc.size = le64(rec + 40);
        loc.offset = le64(rec + 48);
    } else if (diskNo != 0 || cdDisk != 0) {
        if (errorOut) *errorOut = QStringLiteral("multi-disk zip archives are not supported");
        return std::nullopt;
    }

    if (loc.size > kMaxCentralDirectoryBytes || loc.entryCount > kMaxEntries) {
        if (errorOut) {
            *errorOut = QStringLiteral("central directory too large (%1 entries, %2 bytes)")
                            .arg(loc.entryCount).arg(loc.size);
        }
        return std::nullopt;
    }
    if (loc.offset + loc.size > m_fileSize) {
        if (errorOut) *errorOut = QStringLiteral("central directory points past end of file");
        return std::nullopt;
    }

    return loc;
}

bool ZipArchiveReader::parseCentralDirectory(const DirectoryLocation& loc, QString* errorOut) {
    QByteArray cd(static_cast<qsizetype>(loc.size), Qt::Uninitialized);
    if (loc.size > 0 && !readExact(loc.offset, cd.data(), cd.size(), errorOut)) return false;

    m_entries.clear();
    m_entries.reserve(static_cast<size_t>(loc.entryCount));

    qsizetype pos = 0;
    for (quint64 i = 0; i < loc.entryCount; ++i) {
        if (pos + kCentralHeaderSize > cd.size() || le32(cd.constData() + pos) != kSigCentralHeader) {
            if (errorOut) *errorOut = QStringLiteral("corrupt central directory at entry %1").arg(i);
            return false;
        }

        const char* h = cd.constData() + pos;
        const quint16 nameLen = le16(h + 28);
        const quint16 extraLen = le16(h + 30);
        const quint16 commentLen = le16(h + 32);

        if (pos + kCentralHeaderSize + nameLen + extraLen + commentLen > cd.size()) {
            if (errorOut) *errorOut = QStringLiteral("corrupt central directory at entry %1").arg(i);
            return false;
        }

        Entry e;
        e.flags = le16(h + 8);
        e.method = le16(h + 10);
        e.crc32 = le32(h + 16);
        e.compressedSize = le32(h + 20);
        e.uncompressedSize = le32(h + 24);
        e.localHeaderOffset = le32(h + 42);

        const char* name = h + kCentralHeaderSize;
        // Without the UTF-8 flag names are CP437; Latin-1 matches it for the ASCII names we look up.
        e.name = (e.flags & kFlagUtf8Names) ? QString::fromUtf8(name, nameLen) : QString::fromLatin1(name, nameLen);
        e.isDirectory = e.name.endsWith(QLatin1Char('/'));

        // ZIP64 extended information: only the fields saturated in the header are present, in this order.
        const char* extra = name + nameLen;
        const char* extraEnd = extra + extraLen;
        while (extra + 4 <= extraEnd) {
            const quint16 id = le16(extra);
            const quint16 len = le16(extra + 2);
            const char* data = extra + 4;
            if (data + len > extraEnd) break;

            if (id == 0x0001) {
                const char* q = data;
                const char* qEnd = data + len;
                if (e.uncompressedSize == 0xFFFFFFFFu && q + 8 <= qEnd) { e.uncompressedSize = le64(q); q += 8; }
                if (e.compressedSize == 0xFFFFFFFFu && q + 8 <= qEnd) { e.compressedSize = le64(q); q += 8; }
                if (e.localHeaderOffset == 0xFFFFFFFFu && q + 8 <= qEnd) { e.localHeaderOffset = le64(q); }
            }
            extra = data + len;
        }

        m_entries.push_back(std::move(e));
        pos += kCentralHeaderSize + nameLen + extraLen + commentLen;
    }

    return true;
}

std::optional<QByteArray> ZipArchiveReader::readEntry(const Entry& entry, qint64 maxBytes, QString* errorOut) {
    if (!m_file.isOpen()) {
        if (errorOut) *errorOut = QStringLiteral("archive is not open");
        return std::nullopt;
    }
    if (entry.flags & kFlagEncrypted) {
        if (errorOut) *errorOut = QStringLiteral("entry %1 is encrypted").arg(entry.name);
        return std::nullopt;
    }
    if (entry.method != kMethodStored && entry.method != kMethodDeflate) {
        if (errorOut) *errorOut = QStringLiteral("entry %1 uses unsupported compression method %2").arg(entry.name).arg(entry.method);
        return std::nullopt;
    }
    if (static_cast<quint64>(maxBytes) < entry.uncompressedSize) {
        if (errorOut) {
            *errorOut = QStringLiteral("entry %1 is %2 bytes, limit is %3")
                            .arg(entry.name).arg(entry.uncompressedSize).arg(maxBytes);
        }
        return std::nullopt;
    }

    char local[kLocalHeaderSize];
    if (!readExact(entry.localHeaderOffset, local, kLocalHeaderSize, errorOut)) return std::nullopt;
    if (le32(local) != kSigLocalHeader) {
        if (errorOut) *errorOut = QStringLiteral("corrupt local header for %1").arg(entry.name);
        return std::nullopt;
    }

    const quint64 dataStart = entry.localHeaderOffset + kLocalHeaderSize + le16(local + 26) + le16(local + 28);
    if (dataStart + entry.compressedSize > m_fileSize) {
        if (errorOut) *errorOut = QStringLiteral("entry %1 extends past end of file").arg(entry.name);
        return std::nullopt;
    }
    if (!m_file.seek(static_cast<qint64>(dataStart))) {
        if (errorOut) *errorOut = QStringLiteral("seek failed: %1").arg(m_file.errorString());
        return std::nullopt;
    }

    QByteArray out;
    out.reserve(static_cast<qsizetype>(std::min<quint64>(entry.uncompressedSize, static_cast<quint64>(maxBytes))));

    auto inBuf = std::make_unique<char[]>(kChunkBytes);
    quint64 remaining = entry.compressedSize;

    if (entry.method == kMethodStored) {
        while (remaining > 0) {
            if (!checkDeadline(errorOut)) return std::nullopt;

            const qint64 want = static_cast<qint64>(std::min<quint64>(remaining, kChunkBytes));
            const qint64 n = m_file.read(inBuf.get(), want);
            if (n <= 0) {
                if (errorOut) *errorOut = QStringLiteral("read failed in %1: %2").arg(entry.name, m_file.errorString());
                return std::nullopt;
            }
            if (out.size() + n > maxBytes) {
                if (errorOut) *errorOut = QStringLiteral("entry %1 exceeds limit of %2 bytes").arg(entry.name).arg(maxBytes);
                return std::nullopt;
            }
            out.append(inBuf.get(), n);
            remaining -= static_cast<quint64>(n);
        }
    } else {
        InflateStream inflater;
        if (inflateInit2(&inflater.zs, -MAX_WBITS) != Z_OK) {
            if (errorOut) *errorOut = QStringLiteral("inflateInit2 failed");
            return std::nullopt;
        }
        inflater.initialized = true;

        auto outBuf = std::make_unique<char[]>(kChunkBytes);
        int zrc = Z_OK;

        while (zrc != Z_STREAM_END) {
            if (!checkDeadline(errorOut)) return std::nullopt;

            if (inflater.zs.avail_in == 0) {
                if (remaining == 0) {
                    if (errorOut) *errorOut = QStringLiteral("deflate stream of %1 ended early").arg(entry.name);
                    return std::nullopt;
                }
                const qint64 want = static_cast<qint64>(std::min<quint64>(remaining, kChunkBytes));
                const qint64 n = m_file.read(inBuf.get(), want);
                if (n <= 0) {
                    if (errorOut) *errorOut = QStringLiteral("read failed in %1: %2").arg(entry.name, m_file.errorString());
                    return std::nullopt;
                }
                remaining -= static_cast<quint64>(n);
                inflater.zs.next_in = reinterpret_cast<Bytef*>(inBuf.get());
                inflater.zs.avail_in = static_cast<uInt>(n);
            }

            inflater.zs.next_out = reinterpret_cast<Bytef*>(outBuf.get());
            inflater.zs.avail_out = static_cast<uInt>(kChunkBytes);

            zrc = inflate(&inflater.zs, Z_NO_FLUSH);
            if (zrc != Z_OK && zrc != Z_STREAM_END) {
                if (errorOut) {
                    *errorOut = QStringLiteral("inflate failed in %1: %2")
                                    .arg(entry.name, QString::fromLatin1(inflater.zs.msg ? inflater.zs.msg : "data error"));
                }
                return std::nullopt;
            }

            const qint64 produced = kChunkBytes - static_cast<qint64>(inflater.zs.avail_out);
            if (out.size() + produced > maxBytes) {
                if (errorOut) *errorOut = QStringLiteral("entry %1 exceeds limit of %2 bytes").arg(entry.name).arg(maxBytes);
                return std::nullopt;
            }
            out.append(outBuf.get(), produced);
        }
    }

    const auto crc = static_cast<quint32>(crc32(0L, reinterpret_cast<const Bytef*>(out.constData()),
                                                static_cast<uInt>(out.size())));
    if (crc != entry.crc32) {
        if (errorOut) *errorOut = QStringLiteral("CRC mismatch in %1").arg(entry.name);
        return std::nullopt;
    }

    return out;
}
