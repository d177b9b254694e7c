// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef COMICDEX_ARCHIVEREADER_H
#define COMICDEX_ARCHIVEREADER_H

#include <QByteArray>
#include <QDeadlineTimer>
#include <QString>

#include <memory>
#include <optional>
#include <vector>

/**
 * Read-only view over the entries of an archive file.
 *
 * Implementations only load the entry table on open(); entry contents are streamed
 * on demand with a caller-supplied size cap, so the archive body is never held in
 * memory as a whole. Every I/O step checks the deadline; once it expires the current
 * call fails and timedOut() reports true.
 */
class ArchiveReader {
public:
    struct Entry {
        QString name;           // path inside the archive, '/' separated
        quint64 compressedSize = 0;
        quint64 uncompressedSize = 0;
        bool isDirectory = false;

        // Format specific location data.
        quint64 localHeaderOffset = 0;
        quint32 crc32 = 0;
        quint16 method = 0;
        quint16 flags = 0;
    };

    virtual ~ArchiveReader() = default;

    virtual bool open(const QString& path, QString* errorOut = nullptr) = 0;
    virtual void close() = 0;

    [[nodiscard]] virtual QString formatName() const = 0;

    /**
     * Inflates one entry.
     *
     * @param maxBytes Upper bound on the inflated size; larger entries fail without
     *                 allocating more than maxBytes.
     * @return The entry bytes, or std::nullopt with errorOut set.
     */
    virtual std::optional<QByteArray> readEntry(const Entry& entry, qint64 maxBytes, QString* errorOut = nullptr) = 0;

    [[nodiscard]] const std::vector<Entry>& entries() const { return m_entries; }

    // Shallowest entry whose file name (last path component) matches, case-insensitively.
    [[nodiscard]] const Entry* findByFileName(const QString& fileName) const;

    [[nodiscard]] quint32 imageEntryCount() const;

    void setDeadline(QDeadlineTimer deadline) { m_deadline = deadline; }
    [[nodiscard]] bool timedOut() const { return m_timedOut; }

    /**
     * Picks the reader for a path by extension.
     *
     * @return nullptr for archive kinds that are tracked but whose contents we cannot
     *         read (e.g. RAR, 7z); callers treat those as "no embedded descriptor".
     */
    [[nodiscard]] static std::unique_ptr<ArchiveReader> forPath(const QString& path);

    [[nodiscard]] static bool isImageName(const QString& name);

protected:
    bool checkDeadline(QString* errorOut);

    std::vector<Entry> m_entries;
    QDeadlineTimer m_deadline{QDeadlineTimer::Forever};
    bool m_timedOut = false;
};

#endif //COMICDEX_ARCHIVEREADER_H
