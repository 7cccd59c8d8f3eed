// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "launchdock_export.h"
#include "launcherinfo.h"
#include "scratchlauncherstore.h"
#include "types.h"
#include <QReadWriteLock>
#include <QString>
#include <QStringList>
#include <QVector>
#include <memory>
#include <optional>

namespace LaunchDock {

/**
 * @brief One application tracked by the dock
 *
 * An entry is backed by windows, by a launcher, or by both. Its mutable
 * fields are guarded by a per-entry reader/writer lock so unrelated entries
 * never serialize each other.
 *
 * The public getters take the read lock themselves. DockManager drives the
 * transitions and uses the private, unlocked accessors while it holds
 * propsLock().
 *
 * Invariant: isDocked() implies launcherInfo() != nullptr.
 */
class LAUNCHDOCK_EXPORT AppEntry
{
public:
    AppEntry(const QString& id, const QString& innerId);

    /**
     * @brief Stable external handle, never changes
     */
    QString id() const
    {
        return m_id;
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Thread-safe getters (take the read lock)
    // ═══════════════════════════════════════════════════════════════════════════

    QString innerId() const;
    bool isDocked() const;
    LauncherInfoPtr launcherInfo() const;
    std::optional<WindowInfo> currentWindow() const;
    QStringList windowIds() const;
    bool hasWindow() const;
    QString name() const;
    QString icon() const;
    MenuItems menu() const;

    /**
     * @brief Launcher file path, empty for window-only entries
     */
    QString desktopFile() const;

    /**
     * @brief True once the entry was dropped from the tracked set
     */
    bool isRemoved() const;

private:
    friend class DockManager;

    QReadWriteLock& propsLock() const
    {
        return m_propsLock;
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Unlocked accessors - caller holds propsLock()
    // ═══════════════════════════════════════════════════════════════════════════

    void setInnerId(const QString& innerId)
    {
        m_innerId = innerId;
    }
    void setLauncherInfo(const LauncherInfoPtr& launcher)
    {
        m_launcherInfo = launcher;
    }
    void setDocked(bool docked)
    {
        m_isDocked = docked;
    }
    void markRemoved()
    {
        m_removed = true;
    }

    bool hasWindowUnlocked() const
    {
        return !m_windows.isEmpty();
    }
    bool containsWindowUnlocked(const QString& windowId) const;
    const WindowInfo* currentWindowUnlocked() const;

    /**
     * @brief Attach a window, or refresh it if already attached; it becomes current
     */
    void attachWindow(const WindowInfo& window);

    /**
     * @brief Detach a window; the most recently attached remaining window becomes current
     * @return true if the window was attached
     */
    bool detachWindow(const QString& windowId);

    /**
     * @brief Resolved launch command: the current window's, else the launcher's
     */
    QString execUnlocked() const;

    /**
     * @brief Snapshot of what a scratch synthesis needs
     */
    ScratchSource scratchSource() const;

    // Derived display state
    void updateName();
    void updateIcon();
    void updateMenu();

    const QString m_id;
    mutable QReadWriteLock m_propsLock;

    QString m_innerId;
    bool m_isDocked = false;
    bool m_removed = false;
    LauncherInfoPtr m_launcherInfo;
    QVector<WindowInfo> m_windows;
    QString m_currentWindowId;

    QString m_name;
    QString m_icon;
    MenuItems m_menu;
};

using AppEntryPtr = std::shared_ptr<AppEntry>;

} // namespace LaunchDock
