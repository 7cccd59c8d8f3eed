// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon.h"
#include "signalwatcher.h"
#include "../core/logging.h"
#include <QCommandLineParser>
#include <QGuiApplication>
#include <KAboutData>
#include <KDBusService>
#include <KLocalizedString>
#include <signal.h>

using namespace LaunchDock;

int main(int argc, char* argv[])
{
    QGuiApplication app(argc, argv);
    app.setQuitOnLastWindowClosed(false);

    // Set translation domain BEFORE any i18n() calls
    KLocalizedString::setApplicationDomain("launchdockd");

    KAboutData aboutData(QStringLiteral("launchdockd"), i18n("LaunchDock Daemon"), QStringLiteral("1.0.0"),
                         i18n("Tracks running and docked application launchers"), KAboutLicense::GPL_V3,
                         i18n("© 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    aboutData.setDesktopFileName(QStringLiteral("org.launchdock.daemon"));

    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    QCommandLineOption replaceOption(QStringList{QStringLiteral("r"), QStringLiteral("replace")},
                                     i18n("Replace existing daemon instance"));
    parser.addOption(replaceOption);

    parser.process(app);
    aboutData.processCommandLine(&parser);

    // Ensure single instance
    KDBusService::StartupOptions options = KDBusService::Unique;
    if (parser.isSet(replaceOption)) {
        options |= KDBusService::Replace;
    }

    KDBusService service(options);

    // Clean shutdown: leave the event loop, daemon.stop() runs after exec()
    SignalWatcher signalWatcher;
    for (int signal : {SIGINT, SIGTERM, SIGHUP}) {
        if (!signalWatcher.watch(signal)) {
            qCWarning(LaunchDock::lcDaemon) << "Signal" << signal << "will not shut down cleanly";
        }
    }
    QObject::connect(&signalWatcher, &SignalWatcher::signalReceived, &app, &QCoreApplication::quit);

    Daemon daemon;

    if (!daemon.init()) {
        qCCritical(LaunchDock::lcDaemon) << "Failed to initialize daemon";
        return 1;
    }

    qCInfo(LaunchDock::lcDaemon) << "Started successfully";
    daemon.start();

    QObject::connect(&service, &KDBusService::activateRequested, &daemon, []() {
        qCDebug(LaunchDock::lcDaemon) << "Already running - activation request ignored";
    });

    const int result = app.exec();

    daemon.stop();

    return result;
}
