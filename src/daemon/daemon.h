// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QObject>
#include <memory>

namespace LaunchDock {

class Settings;
class DockManager;
class DockAdaptor;
class DesktopWindowIdentifier;
class KConfigDockedSetStore;

/**
 * @brief Main daemon for LaunchDock
 *
 * The daemon runs in the background and handles:
 * - Restoring the docked set at startup
 * - Exposing DockManager on the session bus
 * - Persisting the docked set on shutdown
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class Daemon : public QObject
{
    Q_OBJECT

public:
    explicit Daemon(QObject* parent = nullptr);
    ~Daemon() override;

    // Initialization
    bool init();
    void start();
    void stop();

    // Component access
    Settings* settings() const
    {
        return m_settings.get();
    }
    DockManager* dockManager() const
    {
        return m_dockManager.get();
    }

private:
    bool registerDBus();

    std::unique_ptr<Settings> m_settings;
    std::unique_ptr<DesktopWindowIdentifier> m_windowIdentifier;
    std::unique_ptr<KConfigDockedSetStore> m_dockedSetStore;
    std::unique_ptr<DockManager> m_dockManager;

    // D-Bus adaptor (owned by this via QObject parent)
    DockAdaptor* m_dockAdaptor = nullptr;

    bool m_running = false;
};

} // namespace LaunchDock
