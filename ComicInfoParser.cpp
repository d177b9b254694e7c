// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "ComicInfoParser.h"

#include <QSet>
#include <QXmlStreamReader>

namespace {
    const QSet<QString>& integerFields() {
        static const QSet<QString> kFields = {
            QStringLiteral("Volume"), QStringLiteral("Year"), QStringLiteral("Month"),
            QStringLiteral("Day"), QStringLiteral("Count"), QStringLiteral("PageCount"),
            QStringLiteral("AlternateCount")
        };
        return kFields;
    }

    const QSet<QString>& listFields() {
        static const QSet<QString> kFields = {
            QStringLiteral("Writer"), QStringLiteral("Penciller"), QStringLiteral("Inker"),
            QStringLiteral("Colorist"), QStringLiteral("Letterer"), QStringLiteral("CoverArtist"),
            QStringLiteral("Editor"), QStringLiteral("Translator"), QStringLiteral("Genre"),
            QStringLiteral("Tags"), QStringLiteral("Characters"), QStringLiteral("Teams"),
            QStringLiteral("Locations"), QStringLiteral("StoryArc"), QStringLiteral("SeriesGroup")
        };
        return kFields;
    }

    QStringList splitList(const QString& text) {
        QStringList out;
        for (const QString& part : text.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
            const QString t = part.trimmed();
            if (!t.isEmpty()) out.push_back(t);
        }
        return out;
    }

    qint64 countPages(QXmlStreamReader& xml) {
        qint64 pages = 0;
        while (xml.readNextStartElement()) {
            if (xml.name().compare(QLatin1String("Page"), Qt::CaseInsensitive) == 0) ++pages;
            xml.skipCurrentElement();
        }
        return pages;
    }
}

namespace ComicInfoParser {
    std::optional<MetadataMap> parse(const QByteArray& data, QString* errorOut) {
        if (data.trimmed().isEmpty()) {
            if (errorOut) *errorOut = QStringLiteral("descriptor is empty");
            return std::nullopt;
        }

        QXmlStreamReader xml(data);

        if (!xml.readNextStartElement()) {
            if (errorOut) {
                *errorOut = xml.hasError()
                    ? QStringLiteral("line %1, column %2: %3").arg(xml.lineNumber()).arg(xml.columnNumber()).arg(xml.errorString())
                    : QStringLiteral("descriptor has no root element");
            }
            return std::nullopt;
        }

        if (xml.name().compare(QLatin1String("ComicInfo"), Qt::CaseInsensitive) != 0) {
            if (errorOut) *errorOut = QStringLiteral("unexpected root element <%1>").arg(xml.name().toString());
            return std::nullopt;
        }

        MetadataMap out;
        std::optional<qint64> listedPages;

        while (xml.readNextStartElement()) {
            const QString field = xml.name().toString();

            if (field.compare(QLatin1String("Pages"), Qt::CaseInsensitive) == 0) {
                listedPages = countPages(xml);
                continue;
            }

            // Nested structures other than Pages are not part of the flat field set.
            const QString text = xml.readElementText(QXmlStreamReader::SkipChildElements).trimmed();
            if (xml.hasError()) break;
            if (text.isEmpty()) continue;

            if (integerFields().contains(field)) {
                bool ok = false;
                const qint64 n = text.toLongLong(&ok);
                if (ok) out[field] = n;
                else out[field] = text;
            } else if (listFields().contains(field)) {
                const QStringList items = splitList(text);
                if (!items.isEmpty()) out[field] = items;
            } else {
                out[field] = text;
            }
        }

        if (xml.hasError()) {
            if (errorOut) {
                *errorOut = QStringLiteral("line %1, column %2: %3")
                                .arg(xml.lineNumber()).arg(xml.columnNumber()).arg(xml.errorString());
            }
            return std::nullopt;
        }

        if (listedPages && *listedPages > 0 && out.find(QStringLiteral("PageCount")) == out.end()) {
            out[QStringLiteral("PageCount")] = *listedPages;
        }

        return out;
    }
}
