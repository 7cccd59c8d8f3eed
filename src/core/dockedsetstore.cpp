// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dockedsetstore.h"
#include "constants.h"
#include "logging.h"
#include <KConfigGroup>
#include <KSharedConfig>
#include <QMutexLocker>

namespace LaunchDock {

KConfigDockedSetStore::KConfigDockedSetStore(const QString& configName)
    : m_configName(configName)
{
}

QStringList KConfigDockedSetStore::dockedApps() const
{
    QMutexLocker locker(&m_mutex);
    auto config = KSharedConfig::openConfig(m_configName);
    config->reparseConfiguration();
    const KConfigGroup group = config->group(QString(ConfigKeys::DockGroup));
    return group.readEntry(QString(ConfigKeys::DockedApps), QStringList());
}

void KConfigDockedSetStore::setDockedApps(const QStringList& encodedPaths)
{
    QMutexLocker locker(&m_mutex);
    auto config = KSharedConfig::openConfig(m_configName);
    KConfigGroup group = config->group(QString(ConfigKeys::DockGroup));
    group.writeEntry(QString(ConfigKeys::DockedApps), encodedPaths);
    if (!config->sync()) {
        qCWarning(lcPersistence) << "Failed to sync docked apps to" << m_configName;
        return;
    }
    qCDebug(lcPersistence) << "Saved" << encodedPaths.size() << "docked apps:" << encodedPaths;
}

} // namespace LaunchDock
