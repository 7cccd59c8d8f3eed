// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon.h"

#include <QDBusConnection>
#include <QDBusError>
#include <QThread>

#include "../config/settings.h"
#include "../core/constants.h"
#include "../core/dockedsetstore.h"
#include "../core/dockmanager.h"
#include "../core/logging.h"
#include "../core/windowidentifier.h"
#include "../dbus/dockadaptor.h"

namespace LaunchDock {

Daemon::Daemon(QObject* parent)
    : QObject(parent)
    , m_settings(std::make_unique<Settings>())
{
}

Daemon::~Daemon()
{
    stop();
}

bool Daemon::init()
{
    const QString scratchDir = m_settings->scratchDirectory();

    m_windowIdentifier = std::make_unique<DesktopWindowIdentifier>();
    m_dockedSetStore = std::make_unique<KConfigDockedSetStore>(m_settings->configName());
    m_dockManager = std::make_unique<DockManager>(scratchDir, m_windowIdentifier.get(), m_dockedSetStore.get());

    if (!m_dockManager->scratchStore().ensureDirectory()) {
        // Not fatal: docking of launcher-less apps fails until the directory can be created
        qCWarning(lcDaemon) << "Scratch directory unavailable:" << scratchDir;
    }

    // Restore the docked set before the bus interface becomes reachable
    const int restored = m_dockManager->loadDockedApps();
    qCInfo(lcDaemon) << "Restored" << restored << "docked apps";

    m_dockAdaptor = new DockAdaptor(m_dockManager.get(), this);

    return registerDBus();
}

bool Daemon::registerDBus()
{
    auto bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        qCCritical(lcDaemon) << "Cannot connect to session D-Bus - daemon cannot function without D-Bus";
        return false;
    }

    // Retry D-Bus service registration (linear backoff)
    const int maxRetries = 3;
    bool serviceRegistered = false;
    for (int attempt = 0; attempt < maxRetries; ++attempt) {
        if (bus.registerService(QString(DBus::ServiceName))) {
            serviceRegistered = true;
            break;
        }

        const QDBusError error = bus.lastError();
        if (error.type() == QDBusError::ServiceUnknown || error.type() == QDBusError::NoReply) {
            if (attempt < maxRetries - 1) {
                const int delayMs = 1000 * (attempt + 1);
                qCWarning(lcDaemon) << "Failed to register D-Bus service (attempt" << (attempt + 1) << "/" << maxRetries
                                    << "):" << error.message() << "- retrying in" << delayMs << "ms";
                QThread::msleep(delayMs);
                continue;
            }
        }

        qCCritical(lcDaemon) << "Failed to register D-Bus service:" << DBus::ServiceName << "Error:" << error.message()
                             << "Type:" << error.type();
        return false;
    }

    if (!serviceRegistered) {
        qCCritical(lcDaemon) << "Failed to register D-Bus service after" << maxRetries << "attempts";
        return false;
    }

    // Service is already registered, no retry needed
    if (!bus.registerObject(QString(DBus::ObjectPath), this)) {
        const QDBusError error = bus.lastError();
        qCCritical(lcDaemon) << "Failed to register D-Bus object:" << DBus::ObjectPath << "Error:" << error.message();
        bus.unregisterService(QString(DBus::ServiceName));
        return false;
    }

    qCInfo(lcDaemon) << "D-Bus service registered service=" << DBus::ServiceName << "path=" << DBus::ObjectPath;
    return true;
}

void Daemon::start()
{
    if (m_running) {
        return;
    }
    m_running = true;
    qCDebug(lcDaemon) << "Tracking" << m_dockManager->entryCount() << "entries";
}

void Daemon::stop()
{
    if (!m_running) {
        return;
    }

    m_dockManager->saveDockedApps();

    // Unregister D-Bus service to prevent late calls during shutdown
    QDBusConnection::sessionBus().unregisterObject(QString(DBus::ObjectPath));
    QDBusConnection::sessionBus().unregisterService(QString(DBus::ServiceName));

    m_running = false;
}

} // namespace LaunchDock
