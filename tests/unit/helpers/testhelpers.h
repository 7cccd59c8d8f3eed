// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QAtomicInt>
#include <QDir>
#include <QFile>
#include <QHash>
#include <QMutex>
#include <QMutexLocker>
#include <QString>
#include <QStringList>

#include "core/interfaces.h"
#include "core/types.h"
#include "core/utils.h"

namespace LaunchDock {
namespace TestHelpers {

/**
 * @brief Window identifier with a fixed appId -> identity table
 *
 * Unknown windows keep their own identity. Calls are counted.
 */
class FakeWindowIdentifier : public IWindowIdentifier
{
public:
    WindowIdentity identifyWindow(const WindowInfo& window) override
    {
        m_calls.fetchAndAddOrdered(1);
        QMutexLocker locker(&m_mutex);
        const auto it = m_identities.constFind(window.appId);
        if (it != m_identities.constEnd()) {
            return it.value();
        }
        return WindowIdentity{window.innerId, nullptr};
    }

    void map(const QString& appId, const LauncherInfoPtr& launcher)
    {
        QMutexLocker locker(&m_mutex);
        m_identities.insert(appId, WindowIdentity{launcher->innerId(), launcher});
    }

    void clear()
    {
        QMutexLocker locker(&m_mutex);
        m_identities.clear();
    }

    int calls() const
    {
        return m_calls.loadAcquire();
    }

private:
    QAtomicInt m_calls;
    QMutex m_mutex;
    QHash<QString, WindowIdentity> m_identities;
};

/**
 * @brief In-memory docked-set record
 */
class MemoryDockedSetStore : public IDockedSetStore
{
public:
    QStringList dockedApps() const override
    {
        QMutexLocker locker(&m_mutex);
        return m_apps;
    }

    void setDockedApps(const QStringList& encodedPaths) override
    {
        QMutexLocker locker(&m_mutex);
        m_apps = encodedPaths;
        ++m_writes;
    }

    int writes() const
    {
        QMutexLocker locker(&m_mutex);
        return m_writes;
    }

private:
    mutable QMutex m_mutex;
    QStringList m_apps;
    int m_writes = 0;
};

/**
 * @brief Write a minimal launcher descriptor
 * @return Absolute path of the written file, empty on failure
 */
inline QString writeLauncher(const QString& dir, const QString& fileName, const QString& name, const QString& exec,
                             const QString& icon = QString(), const QStringList& actions = QStringList())
{
    QDir().mkpath(dir);
    const QString path = QDir(dir).absoluteFilePath(fileName);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return QString();
    }

    QString content = QStringLiteral("[Desktop Entry]\nType=Application\n");
    content += QStringLiteral("Name=") + name + QLatin1Char('\n');
    if (!exec.isEmpty()) {
        content += QStringLiteral("Exec=") + exec + QLatin1Char('\n');
    }
    if (!icon.isEmpty()) {
        content += QStringLiteral("Icon=") + icon + QLatin1Char('\n');
    }
    if (!actions.isEmpty()) {
        content += QStringLiteral("Actions=") + actions.join(QLatin1Char(';')) + QStringLiteral(";\n");
        for (const QString& action : actions) {
            content += QStringLiteral("\n[Desktop Action ") + action + QStringLiteral("]\nName=") + action
                + QStringLiteral(" action\nExec=") + exec + QLatin1Char(' ') + action + QLatin1Char('\n');
        }
    }
    file.write(content.toUtf8());
    file.close();
    return path;
}

inline WindowInfo makeWindow(const QString& windowId, const QString& appId, const QString& title,
                             const QString& exec, const QString& icon = QString())
{
    WindowInfo window;
    window.windowId = windowId;
    window.innerId = Utils::windowInnerId(appId, exec);
    window.appId = appId;
    window.title = title;
    window.icon = icon;
    window.exec = exec;
    return window;
}

} // namespace TestHelpers
} // namespace LaunchDock
