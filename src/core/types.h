// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "launchdock_export.h"
#include <QString>
#include <QStringList>
#include <QVector>

namespace LaunchDock {

// ═══════════════════════════════════════════════════════════════════════════════
// Shared Types - Result Objects and Value Types
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Failure kinds of dock operations
 */
enum class DockError {
    None = 0,
    IoError = 1,    ///< Scratch file create/write/copy failure
    StateError = 2  ///< Entry lacks a precondition (no launcher and no window, unknown entry)
};

/**
 * @brief Outcome of a dock or undock transition
 */
enum class DockStatus {
    Changed = 0,        ///< Transition was applied
    AlreadyInState = 1, ///< Idempotent no-op (dock when docked, undock when undocked)
    Failed = 2          ///< Transition aborted, see DockError
};

/**
 * @brief Result of a dock/undock request
 *
 * A failed result never comes with a partial state change: the entry keeps
 * the fields it had before the request.
 */
struct LAUNCHDOCK_EXPORT DockResult
{
    DockStatus status = DockStatus::Failed;
    DockError error = DockError::None;
    QString message;
    QString entryId;

    bool isChanged() const
    {
        return status == DockStatus::Changed;
    }

    bool isFailure() const
    {
        return status == DockStatus::Failed;
    }

    static DockResult changed(const QString& entryId)
    {
        return DockResult{DockStatus::Changed, DockError::None, QString(), entryId};
    }

    static DockResult alreadyInState(const QString& entryId)
    {
        return DockResult{DockStatus::AlreadyInState, DockError::None, QString(), entryId};
    }

    static DockResult failure(DockError error, const QString& message, const QString& entryId = QString())
    {
        return DockResult{DockStatus::Failed, error, message, entryId};
    }
};

/**
 * @brief Result of a scratch file synthesis
 */
struct LAUNCHDOCK_EXPORT ScratchResult
{
    QString path;                       ///< Descriptor path, empty on failure
    DockError error = DockError::None;
    QString message;

    bool isValid() const
    {
        return error == DockError::None && !path.isEmpty();
    }

    static ScratchResult ok(const QString& path)
    {
        return ScratchResult{path, DockError::None, QString()};
    }

    static ScratchResult failure(DockError error, const QString& message)
    {
        return ScratchResult{QString(), error, message};
    }
};

/**
 * @brief Report of a best-effort scratch set removal
 *
 * Only logged; callers never branch on it.
 */
struct LAUNCHDOCK_EXPORT CleanupReport
{
    QStringList removed;
    QStringList failed;

    bool isClean() const
    {
        return failed.isEmpty();
    }
};

/**
 * @brief A window as reported by the window tracker
 */
struct LAUNCHDOCK_EXPORT WindowInfo
{
    QString windowId;   ///< Window handle
    QString innerId;    ///< "w:" identity, see Utils::windowInnerId()
    QString appId;      ///< Application id / window class
    QString title;      ///< Display name
    QString icon;       ///< Theme icon name, file path or data:image URI
    QString exec;       ///< Resolved command line of the owning process

    bool isValid() const
    {
        return !windowId.isEmpty();
    }
};

/**
 * @brief One item of an entry's context menu
 */
struct LAUNCHDOCK_EXPORT MenuItem
{
    QString id;
    QString text;

    bool operator==(const MenuItem& other) const
    {
        return id == other.id && text == other.text;
    }
};

using MenuItems = QVector<MenuItem>;

} // namespace LaunchDock
