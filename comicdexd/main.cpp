// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDBusConnection>
#include <QDBusError>
#include <QDebug>
#include <QFileInfo>
#include <QSettings>
#include <QSocketNotifier>
#include <QStandardPaths>

#include <csignal>

#include <sys/socket.h>
#include <unistd.h>

#include "IndexerService.h"
#include "WatchManager.h"
#include "../Pipeline.h"
#include "../PipelineConfig.h"
#include "../Version.h"

static int s_signalFds[2] = {-1, -1};

static void onTerminationSignal(int) {
    const char c = 1;
    const ssize_t n = ::write(s_signalFds[0], &c, sizeof(c));
    (void)n;
}

// SIGINT/SIGTERM quit the event loop so the pipeline can drain its writer.
static bool installTerminationHandler(QCoreApplication& app) {
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, s_signalFds) != 0) return false;

    auto* notifier = new QSocketNotifier(s_signalFds[1], QSocketNotifier::Read, &app);
    QObject::connect(notifier, &QSocketNotifier::activated, &app, [notifier]() {
        notifier->setEnabled(false);
        char c = 0;
        const ssize_t n = ::read(s_signalFds[1], &c, sizeof(c));
        (void)n;
        qInfo().noquote() << QStringLiteral("termination requested");
        QCoreApplication::quit();
    });

    struct sigaction sa {};
    sa.sa_handler = onTerminationSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    return ::sigaction(SIGINT, &sa, nullptr) == 0 && ::sigaction(SIGTERM, &sa, nullptr) == 0;
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("comicdexd");
    QCoreApplication::setOrganizationDomain("comicdex.net");
    QCoreApplication::setApplicationVersion(QString::fromLatin1(Version::VERSION.data(),
                                                                static_cast<qsizetype>(Version::VERSION.size())));

    qSetMessagePattern(QStringLiteral("%{time yyyy-MM-dd hh:mm:ss.zzz} %{type} %{message}"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Comic archive metadata indexing daemon"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(QStringList{QStringLiteral("c"), QStringLiteral("config")},
                                          QStringLiteral("Configuration file (INI)."),
                                          QStringLiteral("file"));
    parser.addOption(configOption);
    parser.process(app);

    QString configPath = parser.value(configOption);
    if (configPath.isEmpty()) {
        configPath = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation) + QStringLiteral("/comicdexd.ini");
    }
    if (!QFileInfo::exists(configPath)) {
        qCritical().noquote() << QStringLiteral("Configuration file %1 does not exist").arg(configPath);
        return 1;
    }

    QSettings settings(configPath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        qCritical().noquote() << QStringLiteral("Failed to read configuration %1").arg(configPath);
        return 1;
    }

    QString err;
    std::optional<PipelineConfig> config = PipelineConfig::fromSettings(settings, &err);
    if (!config) {
        qCritical().noquote() << QStringLiteral("Invalid configuration %1: %2").arg(configPath, err);
        return 1;
    }

    Pipeline pipeline(std::move(*config));
    if (!pipeline.start(&err)) {
        qCritical().noquote() << QStringLiteral("Failed to start the indexing pipeline: %1").arg(err);
        return 2;
    }

    IndexerService svc(&pipeline);
    if (!svc.openIndex(&err)) {
        qCritical().noquote() << QStringLiteral("Failed to open the index for reading: %1").arg(err);
        return 2;
    }

    WatchManager watch(&pipeline);
    if (!watch.start(&err)) {
        qCritical().noquote() << QStringLiteral("Failed to start filesystem watches: %1").arg(err);
        return 3;
    }
    svc.setWatchManager(&watch);

    constexpr const char* kServiceName = "net.comicdex.Indexer1";
    constexpr const char* kObjectPath  = "/net/comicdex/Indexer1";

    auto conn = QDBusConnection::sessionBus();
    if (!conn.isConnected()) {
        qCritical() << "Failed to connect to session bus:" << conn.lastError().message();
        return 4;
    }

    if (!conn.registerService(kServiceName)) {
        qCritical() << "Failed to register service" << kServiceName << ":" << conn.lastError().message();
        return 5;
    }

    if (!conn.registerObject(kObjectPath, &svc,
                             QDBusConnection::ExportAllSlots | QDBusConnection::ExportAllSignals)) {
        qCritical() << "Failed to register object" << kObjectPath << ":" << conn.lastError().message();
        return 6;
    }

    if (!installTerminationHandler(app)) {
        qWarning() << "Failed to install signal handlers; SIGTERM will not shut down cleanly";
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &app, [&pipeline]() { pipeline.stop(); });

    qInfo() << "comicdexd running on session bus as" << kServiceName << "object" << kObjectPath;
    return app.exec();
}
