// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "Pipeline.h"
#include "TestSupport.h"
#include "comicdexd/IndexerService.h"

#include <QCoreApplication>
#include <QDir>
#include <QTemporaryDir>

#include <cassert>
#include <cstdio>

using namespace std::chrono_literals;
using TestSupport::ZipEntry;

namespace {
    PipelineConfig configFor(const QTemporaryDir& tmp, const QString& root) {
        PipelineConfig c;
        c.roots = {root};
        c.extensions = Utils::defaultArchiveExtensions();
        c.databasePath = tmp.filePath("index.sqlite3");
        c.quietPeriod = 50ms;
        c.workerCount = 2;
        c.sweepOnStartup = true;
        return c;
    }

    MemoryMonitor::Sampler lowUsage() {
        return [](QString*) -> std::optional<quint64> { return 10ull * 1024 * 1024; };
    }
}

static void test_destroying_the_service_stops_the_pipeline() {
    QTemporaryDir tmp;
    assert(tmp.isValid());
    QDir(tmp.path()).mkpath("library");
    const QString root = QDir(tmp.path()).canonicalPath() + "/library";

    // Enough work that the startup sweep and the workers are still busy below.
    for (int i = 0; i < 40; ++i) {
        const QString path = QStringLiteral("%1/vol%2.cbz").arg(root).arg(i);
        assert(TestSupport::writeZip(path, {ZipEntry{"ComicInfo.xml", TestSupport::comicInfoXml("T", "S", i), true}}));
    }

    Pipeline p(configFor(tmp, root), lowUsage());
    assert(p.start());

    {
        IndexerService svc(&p);
        assert(svc.openIndex());
        assert(p.isRunning());
    }
    assert(!p.isRunning() && "no pipeline thread outlives the service hooks");

    // Events queued to the destroyed service must have been dropped with it.
    QCoreApplication::processEvents();
    p.stop();
}

static void test_record_to_variant() {
    FileRecord r;
    r.path = "/lib/a.cbz";
    r.size = 42;
    r.scanState = ScanState::Failed;
    r.lastError = QStringLiteral("ParseError: line 1");
    r.failureCount = 2;
    r.metadata["Title"] = QStringLiteral("Watchmen");
    r.metadata["Number"] = qint64(1);
    r.metadata["Writer"] = QStringList{"Alan Moore"};

    const QVariantMap m = IndexerService::recordToVariant(r);
    assert(m.value("path").toString() == "/lib/a.cbz");
    assert(m.value("size").toLongLong() == 42);
    assert(m.value("state").toString() == "failed");
    assert(m.value("lastError").toString().startsWith("ParseError"));
    assert(m.value("failureCount").toUInt() == 2);

    const QVariantMap md = m.value("metadata").toMap();
    assert(md.value("Title").toString() == "Watchmen");
    assert(md.value("Number").toLongLong() == 1);
    assert(md.value("Writer").toStringList() == QStringList{"Alan Moore"});
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    test_destroying_the_service_stops_the_pipeline();
    test_record_to_variant();

    std::printf("indexer service test ok\n");
    return 0;
}
