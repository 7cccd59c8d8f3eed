// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "appentry.h"
#include "constants.h"
#include "logging.h"
#include <KLocalizedString>
#include <QReadLocker>

namespace LaunchDock {

AppEntry::AppEntry(const QString& id, const QString& innerId)
    : m_id(id)
    , m_innerId(innerId)
{
}

// ═══════════════════════════════════════════════════════════════════════════════
// Thread-safe getters
// ═══════════════════════════════════════════════════════════════════════════════

QString AppEntry::innerId() const
{
    QReadLocker locker(&m_propsLock);
    return m_innerId;
}

bool AppEntry::isDocked() const
{
    QReadLocker locker(&m_propsLock);
    return m_isDocked;
}

LauncherInfoPtr AppEntry::launcherInfo() const
{
    QReadLocker locker(&m_propsLock);
    return m_launcherInfo;
}

std::optional<WindowInfo> AppEntry::currentWindow() const
{
    QReadLocker locker(&m_propsLock);
    const WindowInfo* window = currentWindowUnlocked();
    if (!window) {
        return std::nullopt;
    }
    return *window;
}

QStringList AppEntry::windowIds() const
{
    QReadLocker locker(&m_propsLock);
    QStringList ids;
    for (const WindowInfo& window : m_windows) {
        ids.append(window.windowId);
    }
    return ids;
}

bool AppEntry::hasWindow() const
{
    QReadLocker locker(&m_propsLock);
    return hasWindowUnlocked();
}

QString AppEntry::name() const
{
    QReadLocker locker(&m_propsLock);
    return m_name;
}

QString AppEntry::icon() const
{
    QReadLocker locker(&m_propsLock);
    return m_icon;
}

MenuItems AppEntry::menu() const
{
    QReadLocker locker(&m_propsLock);
    return m_menu;
}

QString AppEntry::desktopFile() const
{
    QReadLocker locker(&m_propsLock);
    return m_launcherInfo ? m_launcherInfo->fileName() : QString();
}

bool AppEntry::isRemoved() const
{
    QReadLocker locker(&m_propsLock);
    return m_removed;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Windows
// ═══════════════════════════════════════════════════════════════════════════════

bool AppEntry::containsWindowUnlocked(const QString& windowId) const
{
    for (const WindowInfo& window : m_windows) {
        if (window.windowId == windowId) {
            return true;
        }
    }
    return false;
}

const WindowInfo* AppEntry::currentWindowUnlocked() const
{
    for (const WindowInfo& window : m_windows) {
        if (window.windowId == m_currentWindowId) {
            return &window;
        }
    }
    return nullptr;
}

void AppEntry::attachWindow(const WindowInfo& window)
{
    for (WindowInfo& existing : m_windows) {
        if (existing.windowId == window.windowId) {
            existing = window;
            m_currentWindowId = window.windowId;
            return;
        }
    }
    m_windows.append(window);
    m_currentWindowId = window.windowId;
}

bool AppEntry::detachWindow(const QString& windowId)
{
    for (int i = 0; i < m_windows.size(); ++i) {
        if (m_windows.at(i).windowId == windowId) {
            m_windows.removeAt(i);
            if (m_currentWindowId == windowId) {
                m_currentWindowId = m_windows.isEmpty() ? QString() : m_windows.constLast().windowId;
            }
            return true;
        }
    }
    return false;
}

QString AppEntry::execUnlocked() const
{
    if (const WindowInfo* window = currentWindowUnlocked()) {
        if (!window->exec.isEmpty()) {
            return window->exec;
        }
    }
    return m_launcherInfo ? m_launcherInfo->exec() : QString();
}

ScratchSource AppEntry::scratchSource() const
{
    ScratchSource source;
    source.launcher = m_launcherInfo;
    if (const WindowInfo* window = currentWindowUnlocked()) {
        source.window = *window;
    }
    source.exec = execUnlocked();
    return source;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Derived display state
// ═══════════════════════════════════════════════════════════════════════════════

void AppEntry::updateName()
{
    QString name;
    if (m_launcherInfo) {
        name = m_launcherInfo->name();
    }
    if (name.isEmpty()) {
        if (const WindowInfo* window = currentWindowUnlocked()) {
            name = window->title;
        }
    }
    m_name = name;
}

void AppEntry::updateIcon()
{
    QString icon;
    if (m_launcherInfo) {
        icon = m_launcherInfo->icon();
    }
    if (icon.isEmpty()) {
        if (const WindowInfo* window = currentWindowUnlocked()) {
            icon = window->icon;
        }
    }
    m_icon = icon.isEmpty() ? QString(Defaults::FallbackIconName) : icon;
}

void AppEntry::updateMenu()
{
    MenuItems menu;
    menu.append(MenuItem{MenuItemId::Open, i18n("Open")});

    if (m_launcherInfo) {
        for (const LauncherInfo::Action& action : m_launcherInfo->actions()) {
            menu.append(MenuItem{MenuItemId::ActionPrefix + action.id, action.name});
        }
    }

    if (hasWindowUnlocked()) {
        menu.append(MenuItem{MenuItemId::CloseAll, i18n("Close All")});
    }

    if (m_isDocked) {
        menu.append(MenuItem{MenuItemId::Undock, i18n("Undock")});
    } else {
        menu.append(MenuItem{MenuItemId::Dock, i18n("Dock")});
    }

    m_menu = menu;
    qCDebug(lcEntry) << "Updated menu of" << m_id << "items=" << m_menu.size();
}

} // namespace LaunchDock
