// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "launchdock_export.h"
#include "../core/constants.h"
#include <QObject>
#include <QString>

namespace LaunchDock {

/**
 * @brief Daemon settings backed by launchdockrc
 *
 * Values are read once by load(). The scratch directory is handed to the
 * core components at construction, so changing it takes effect on the next
 * daemon start.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class LAUNCHDOCK_EXPORT Settings : public QObject
{
    Q_OBJECT

    Q_PROPERTY(QString scratchDirectory READ scratchDirectory WRITE setScratchDirectory NOTIFY
                   scratchDirectoryChanged)

public:
    /**
     * @param configName KConfig file name, launchdockrc unless overridden by tests
     */
    explicit Settings(const QString& configName = QString(Defaults::ConfigFileName), QObject* parent = nullptr);
    ~Settings() override = default;

    /**
     * @brief Effective scratch directory
     *
     * The configured value when set, otherwise
     * $XDG_CONFIG_HOME/launchdock/scratch.
     */
    QString scratchDirectory() const;
    void setScratchDirectory(const QString& directory);

    /**
     * @brief Configured value only, empty when the default applies
     */
    QString configuredScratchDirectory() const
    {
        return m_scratchDirectory;
    }

    static QString defaultScratchDirectory();

    QString configName() const
    {
        return m_configName;
    }

    void load();
    void save();
    void reset();

Q_SIGNALS:
    void scratchDirectoryChanged();
    void settingsChanged();

private:
    QString m_configName;
    QString m_scratchDirectory;
};

} // namespace LaunchDock
