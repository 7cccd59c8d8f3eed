// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "launchdock_export.h"
#include <QString>
#include <QStringList>
#include <QVector>
#include <memory>

namespace LaunchDock {

/**
 * @brief Resolved metadata of a launcher (.desktop) file
 *
 * Immutable once built. Entries hold it through a shared pointer, so
 * replacing the launcher of an entry never touches the file on disk.
 */
class LAUNCHDOCK_EXPORT LauncherInfo
{
public:
    struct Action
    {
        QString id;
        QString name;
    };

    LauncherInfo(const QString& filePath, bool installed, const QString& innerId);

    /**
     * @brief Parse a launcher file
     * @param filePath Absolute path of a .desktop file
     * @return Launcher metadata, or nullptr if the file is missing or has no
     *         [Desktop Entry] group
     */
    static std::shared_ptr<const LauncherInfo> fromFile(const QString& filePath);

    /**
     * @brief Check whether a path lies in one of the XDG applications directories
     */
    static bool isInstalledPath(const QString& filePath);

    QString fileName() const
    {
        return m_filePath;
    }
    bool isInstalled() const
    {
        return m_installed;
    }
    QString innerId() const
    {
        return m_innerId;
    }

    QString name() const
    {
        return m_name;
    }
    void setName(const QString& name)
    {
        m_name = name;
    }

    QString icon() const
    {
        return m_icon;
    }
    void setIcon(const QString& icon)
    {
        m_icon = icon;
    }

    QString exec() const
    {
        return m_exec;
    }
    void setExec(const QString& exec)
    {
        m_exec = exec;
    }

    const QVector<Action>& actions() const
    {
        return m_actions;
    }
    void setActions(const QVector<Action>& actions)
    {
        m_actions = actions;
    }

private:
    QString m_filePath;
    bool m_installed = false;
    QString m_innerId;
    QString m_name;
    QString m_icon;
    QString m_exec;
    QVector<Action> m_actions;
};

using LauncherInfoPtr = std::shared_ptr<const LauncherInfo>;

} // namespace LaunchDock
