// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "PipelineConfig.h"
#include "TestSupport.h"

#include <QDir>
#include <QSettings>
#include <QTemporaryDir>

#include <cassert>
#include <cstdio>

using namespace std::chrono_literals;

namespace {
    constexpr quint64 MiB = 1024ull * 1024;

    std::optional<PipelineConfig> load(const QString& iniPath, const QByteArray& ini, QString* err) {
        assert(TestSupport::writeFile(iniPath, ini));
        QSettings settings(iniPath, QSettings::IniFormat);
        return PipelineConfig::fromSettings(settings, err);
    }
}

static void test_defaults() {
    QTemporaryDir tmp;
    QDir(tmp.path()).mkpath("comics");
    const QString root = QDir(tmp.path()).canonicalPath() + "/comics";

    QString err;
    auto c = load(tmp.filePath("a.ini"), "[library]\nroots=" + root.toUtf8() + "\n", &err);
    assert(c && "roots are enough");
    assert(c->roots == QStringList{root});
    assert(c->extensions.contains("cbz") && c->extensions.contains("cbr") && "default extensions");
    assert(!c->databasePath.isEmpty());
    assert(c->quietPeriod == 2000ms);
    assert(c->workerCount == 2);
    assert(c->failureSuppressThreshold == 3);
    assert(c->memory.elevatedBytes == 1024 * MiB && c->memory.criticalBytes == 2048 * MiB);
    assert(c->sweepOnStartup);
}

static void test_explicit_values() {
    QTemporaryDir tmp;
    QDir(tmp.path()).mkpath("a");
    QDir(tmp.path()).mkpath("b");
    const QString base = QDir(tmp.path()).canonicalPath();

    const QByteArray ini =
        "[library]\n"
        "roots=" + base.toUtf8() + "/a, " + base.toUtf8() + "/b/, " + base.toUtf8() + "/a\n"
        "extensions=.CBZ, cbt\n"
        "[index]\n"
        "databasePath=" + base.toUtf8() + "/db/index.sqlite3\n"
        "[debounce]\n"
        "quietPeriodMs=250\n"
        "[scanner]\n"
        "workerCount=4\n"
        "ioTimeoutMs=1500\n"
        "failureSuppressThreshold=5\n"
        "[memory]\n"
        "elevatedMiB=300\n"
        "criticalMiB=600\n"
        "[sweep]\n"
        "onStartup=false\n";

    QString err;
    auto c = load(tmp.filePath("b.ini"), ini, &err);
    assert(c);
    assert(c->roots == (QStringList{base + "/a", base + "/b"}) && "roots canonicalized and deduplicated");
    assert(c->extensions == (QStringList{"cbz", "cbt"}));
    assert(c->databasePath == base + "/db/index.sqlite3");
    assert(c->quietPeriod == 250ms);
    assert(c->workerCount == 4);
    assert(c->ioTimeout == 1500ms);
    assert(c->failureSuppressThreshold == 5);
    assert(c->memory.elevatedBytes == 300 * MiB && c->memory.criticalBytes == 600 * MiB);
    assert(!c->sweepOnStartup);
}

static void test_invalid_values_fall_back() {
    QTemporaryDir tmp;
    const QString root = QDir(tmp.path()).canonicalPath();

    const QByteArray ini =
        "[library]\nroots=" + root.toUtf8() + "\n"
        "[debounce]\nquietPeriodMs=-5\n"
        "[scanner]\nworkerCount=lots\n"
        "[memory]\nelevatedMiB=900\ncriticalMiB=800\n";

    QString err;
    auto c = load(tmp.filePath("c.ini"), ini, &err);
    assert(c && "bad values do not reject the file");
    assert(c->quietPeriod == 2000ms);
    assert(c->workerCount == 2);
    assert(c->memory.elevatedBytes == 1024 * MiB && c->memory.criticalBytes == 2048 * MiB && "inverted thresholds reset");
}

static void test_missing_roots() {
    QTemporaryDir tmp;
    QString err;
    auto c = load(tmp.filePath("d.ini"), "[scanner]\nworkerCount=3\n", &err);
    assert(!c && "roots are mandatory");
    assert(err.contains("roots"));
}

int main() {
    test_defaults();
    test_explicit_values();
    test_invalid_values_fall_back();
    test_missing_roots();

    std::printf("pipeline config test ok\n");
    return 0;
}
