// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "../core/logging.h"
#include <KConfigGroup>
#include <KSharedConfig>
#include <QDir>
#include <QStandardPaths>

namespace LaunchDock {

Settings::Settings(const QString& configName, QObject* parent)
    : QObject(parent)
    , m_configName(configName)
{
    load();
}

QString Settings::defaultScratchDirectory()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation) + QLatin1Char('/')
        + Defaults::ScratchSubdirectory;
}

QString Settings::scratchDirectory() const
{
    return m_scratchDirectory.isEmpty() ? defaultScratchDirectory() : m_scratchDirectory;
}

void Settings::setScratchDirectory(const QString& directory)
{
    if (!directory.isEmpty() && QDir::isRelativePath(directory)) {
        qCWarning(lcConfig) << "Rejecting relative scratch directory" << directory;
        return;
    }

    const QString cleaned = directory.isEmpty() ? QString() : QDir::cleanPath(directory);
    if (m_scratchDirectory != cleaned) {
        m_scratchDirectory = cleaned;
        Q_EMIT scratchDirectoryChanged();
        Q_EMIT settingsChanged();
    }
}

void Settings::load()
{
    auto config = KSharedConfig::openConfig(m_configName);

    // KSharedConfig caches in memory; pick up edits made by other processes
    config->reparseConfiguration();

    KConfigGroup general = config->group(QString(ConfigKeys::GeneralGroup));
    QString scratchDir = general.readEntry(QString(ConfigKeys::ScratchDirectory), QString());

    if (!scratchDir.isEmpty() && QDir::isRelativePath(scratchDir)) {
        qCWarning(lcConfig) << "Ignoring relative scratch directory" << scratchDir << "using default";
        scratchDir.clear();
    }
    m_scratchDirectory = scratchDir.isEmpty() ? QString() : QDir::cleanPath(scratchDir);

    qCInfo(lcConfig) << "Settings loaded, scratch directory:" << scratchDirectory();
}

void Settings::save()
{
    auto config = KSharedConfig::openConfig(m_configName);
    KConfigGroup general = config->group(QString(ConfigKeys::GeneralGroup));

    if (m_scratchDirectory.isEmpty()) {
        general.deleteEntry(QString(ConfigKeys::ScratchDirectory));
    } else {
        general.writeEntry(QString(ConfigKeys::ScratchDirectory), m_scratchDirectory);
    }

    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to write settings to" << m_configName;
    }
}

void Settings::reset()
{
    auto config = KSharedConfig::openConfig(m_configName);
    config->deleteGroup(QString(ConfigKeys::GeneralGroup));
    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to reset settings in" << m_configName;
    }

    load();
    Q_EMIT scratchDirectoryChanged();
    Q_EMIT settingsChanged();

    qCInfo(lcConfig) << "Settings reset to defaults";
}

} // namespace LaunchDock
