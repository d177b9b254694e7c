// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef COMICDEX_COMICINFOPARSER_H
#define COMICDEX_COMICINFOPARSER_H

#include <QByteArray>
#include <QString>
#include <optional>

#include "FileRecord.h"

namespace ComicInfoParser {
    // Name of the embedded descriptor entry, matched case-insensitively.
    inline const QString kDescriptorName = QStringLiteral("ComicInfo.xml");

    /**
     * Parses a ComicInfo.xml document into metadata fields.
     *
     * Numeric fields (Volume, Year, Month, Day, Count, PageCount, AlternateCount) become
     * integers when their text is a valid number. Credit and classification fields
     * (Writer, Genre, Tags, ...) become lists split on commas. Everything else, including
     * Number (issue numbers such as "1.5" or "12AU"), is kept as a string. Empty
     * elements are omitted.
     *
     * When the document has no PageCount element but lists pages under <Pages>, the
     * number of <Page> entries is used.
     *
     * @return std::nullopt with errorOut set if the document is not well-formed or its
     *         root element is not ComicInfo.
     */
    std::optional<MetadataMap> parse(const QByteArray& xml, QString* errorOut = nullptr);
}

#endif //COMICDEX_COMICINFOPARSER_H
