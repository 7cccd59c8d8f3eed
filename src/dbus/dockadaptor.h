// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "launchdock_export.h"
#include <QDBusAbstractAdaptor>
#include <QObject>
#include <QStringList>

namespace LaunchDock {

class DockManager;

/**
 * @brief D-Bus adaptor for dock operations
 *
 * Provides D-Bus interface: org.launchdock.Dock
 *
 * Thin facade over DockManager: arguments are validated and forwarded,
 * DockManager signals are re-emitted on the bus.
 *
 * NOTE: Interface name must match the DBus::Interface::Dock constant.
 */
class LAUNCHDOCK_EXPORT DockAdaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.launchdock.Dock")

public:
    explicit DockAdaptor(DockManager* manager, QObject* parent);
    ~DockAdaptor() override = default;

public Q_SLOTS:
    // Docking by launcher file
    bool requestDock(const QString& desktopFile, int index);
    bool requestUndock(const QString& desktopFile);
    bool isDocked(const QString& desktopFile);

    // Docking by entry
    bool dockEntry(const QString& entryId);
    bool undockEntry(const QString& entryId);

    // Queries
    QStringList dockedApps();
    QStringList dockedAppsDesktopFiles();
    QStringList entryIds();

    // Window lifecycle, fed by the window-manager integration
    void windowAdded(const QString& windowId, const QString& appId, const QString& title, const QString& icon,
                     const QString& exec);
    void windowRemoved(const QString& windowId);

Q_SIGNALS:
    void entryAdded(const QString& entryId);
    void entryRemoved(const QString& entryId);
    void dockedAppsChanged(const QStringList& dockedApps);

private:
    DockManager* m_manager;
};

} // namespace LaunchDock
