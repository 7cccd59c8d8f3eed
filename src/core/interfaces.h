// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "launchdock_export.h"
#include "launcherinfo.h"
#include "types.h"
#include <QString>
#include <QStringList>

namespace LaunchDock {

/**
 * @brief Identity of a window as decided by a window identifier
 */
struct LAUNCHDOCK_EXPORT WindowIdentity
{
    QString innerId;            ///< Identity to use for the entry
    LauncherInfoPtr launcher;   ///< Matching launcher, nullptr if none
};

/**
 * @brief Abstract interface mapping a window to an entry identity
 *
 * Used when a window first appears and when an undocked entry drops a
 * scratch launcher that was a copy of another descriptor, since the window
 * may now belong to a different installed application.
 *
 * Implementations must be callable from any thread.
 */
class LAUNCHDOCK_EXPORT IWindowIdentifier
{
public:
    IWindowIdentifier() = default;
    virtual ~IWindowIdentifier();

    /**
     * @brief Identify a window
     * @return The window's identity; launcher is nullptr when no launcher
     *         matches, which is not an error
     */
    virtual WindowIdentity identifyWindow(const WindowInfo& window) = 0;
};

/**
 * @brief Abstract interface for the durable docked-set record
 *
 * Stores an ordered list of encoded launcher paths. setDockedApps() always
 * replaces the whole list.
 */
class LAUNCHDOCK_EXPORT IDockedSetStore
{
public:
    IDockedSetStore() = default;
    virtual ~IDockedSetStore();

    virtual QStringList dockedApps() const = 0;
    virtual void setDockedApps(const QStringList& encodedPaths) = 0;
};

} // namespace LaunchDock
