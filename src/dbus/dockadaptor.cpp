// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dockadaptor.h"
#include "../core/dockmanager.h"
#include "../core/logging.h"
#include "../core/utils.h"

namespace LaunchDock {

DockAdaptor::DockAdaptor(DockManager* manager, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , m_manager(manager)
{
    Q_ASSERT(manager);

    // Forward manager signals to D-Bus
    connect(m_manager, &DockManager::entryAdded, this, &DockAdaptor::entryAdded);
    connect(m_manager, &DockManager::entryRemoved, this, &DockAdaptor::entryRemoved);
    connect(m_manager, &DockManager::dockedAppsChanged, this, &DockAdaptor::dockedAppsChanged);
}

bool DockAdaptor::requestDock(const QString& desktopFile, int index)
{
    if (desktopFile.isEmpty()) {
        qCWarning(lcDbus) << "Cannot dock - empty desktop file";
        return false;
    }

    const DockResult result = m_manager->requestDock(desktopFile, index);
    qCDebug(lcDbus) << "requestDock" << desktopFile << "index=" << index << "status=" << int(result.status);
    return !result.isFailure();
}

bool DockAdaptor::requestUndock(const QString& desktopFile)
{
    if (desktopFile.isEmpty()) {
        qCWarning(lcDbus) << "Cannot undock - empty desktop file";
        return false;
    }
    return !m_manager->requestUndock(desktopFile).isFailure();
}

bool DockAdaptor::isDocked(const QString& desktopFile)
{
    return m_manager->isDocked(desktopFile);
}

bool DockAdaptor::dockEntry(const QString& entryId)
{
    if (entryId.isEmpty()) {
        qCWarning(lcDbus) << "Cannot dock - empty entry ID";
        return false;
    }
    return !m_manager->dock(entryId).isFailure();
}

bool DockAdaptor::undockEntry(const QString& entryId)
{
    if (entryId.isEmpty()) {
        qCWarning(lcDbus) << "Cannot undock - empty entry ID";
        return false;
    }
    return !m_manager->undock(entryId).isFailure();
}

QStringList DockAdaptor::dockedApps()
{
    QStringList encoded;
    const QStringList files = m_manager->dockedAppsDesktopFiles();
    for (const QString& file : files) {
        encoded.append(m_manager->pathCodec().zip(file));
    }
    return encoded;
}

QStringList DockAdaptor::dockedAppsDesktopFiles()
{
    return m_manager->dockedAppsDesktopFiles();
}

QStringList DockAdaptor::entryIds()
{
    QStringList ids;
    const QVector<AppEntryPtr> entries = m_manager->entries();
    for (const AppEntryPtr& entry : entries) {
        ids.append(entry->id());
    }
    return ids;
}

void DockAdaptor::windowAdded(const QString& windowId, const QString& appId, const QString& title,
                              const QString& icon, const QString& exec)
{
    if (windowId.isEmpty()) {
        qCWarning(lcDbus) << "Cannot track window - empty window ID";
        return;
    }

    WindowInfo window;
    window.windowId = windowId;
    window.innerId = Utils::windowInnerId(appId, exec);
    window.appId = appId;
    window.title = title;
    window.icon = icon;
    window.exec = exec;
    m_manager->windowAdded(window);
}

void DockAdaptor::windowRemoved(const QString& windowId)
{
    if (windowId.isEmpty()) {
        qCWarning(lcDbus) << "Cannot untrack window - empty window ID";
        return;
    }
    m_manager->windowRemoved(windowId);
}

} // namespace LaunchDock
