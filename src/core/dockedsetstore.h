// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "launchdock_export.h"
#include "interfaces.h"
#include <QMutex>
#include <QString>

namespace LaunchDock {

/**
 * @brief Docked-set record stored in KConfig
 *
 * Written to the [Dock] group of the config file as a string list and
 * synced to disk on every change.
 */
class LAUNCHDOCK_EXPORT KConfigDockedSetStore : public IDockedSetStore
{
public:
    /**
     * @param configName Config file name or absolute path
     */
    explicit KConfigDockedSetStore(const QString& configName);
    ~KConfigDockedSetStore() override = default;

    QStringList dockedApps() const override;
    void setDockedApps(const QStringList& encodedPaths) override;

private:
    QString m_configName;
    // KSharedConfig objects are not thread-safe
    mutable QMutex m_mutex;
};

} // namespace LaunchDock
