// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "launcherinfo.h"
#include "logging.h"
#include "utils.h"
#include <KConfigGroup>
#include <KDesktopFile>
#include <QDir>
#include <QFileInfo>

namespace LaunchDock {

LauncherInfo::LauncherInfo(const QString& filePath, bool installed, const QString& innerId)
    : m_filePath(filePath)
    , m_installed(installed)
    , m_innerId(innerId)
{
}

bool LauncherInfo::isInstalledPath(const QString& filePath)
{
    const QStringList dirs = Utils::applicationsDirectories();
    for (const QString& dir : dirs) {
        if (Utils::isPathUnder(filePath, dir)) {
            return true;
        }
    }
    return false;
}

std::shared_ptr<const LauncherInfo> LauncherInfo::fromFile(const QString& filePath)
{
    if (filePath.isEmpty()) {
        return nullptr;
    }

    const QFileInfo fileInfo(filePath);
    if (!fileInfo.isFile()) {
        qCDebug(lcCore) << "Launcher file does not exist:" << filePath;
        return nullptr;
    }

    const QString absolutePath = QDir::cleanPath(fileInfo.absoluteFilePath());
    KDesktopFile desktopFile(absolutePath);
    if (!desktopFile.hasGroup(QStringLiteral("Desktop Entry"))) {
        qCWarning(lcCore) << "Not a launcher file, no [Desktop Entry] group:" << absolutePath;
        return nullptr;
    }

    const KConfigGroup group = desktopFile.desktopGroup();
    const QString exec = group.readEntry("Exec", QString());

    auto info = std::make_shared<LauncherInfo>(absolutePath, isInstalledPath(absolutePath),
                                               Utils::desktopInnerId(exec, absolutePath));
    info->setName(desktopFile.readName());
    info->setIcon(desktopFile.readIcon());
    info->setExec(exec);

    QVector<Action> actions;
    const QStringList actionIds = desktopFile.readActions();
    for (const QString& actionId : actionIds) {
        const KConfigGroup actionGroup = desktopFile.actionGroup(actionId);
        actions.append(Action{actionId, actionGroup.readEntry("Name", actionId)});
    }
    info->setActions(actions);

    qCDebug(lcCore) << "Resolved launcher" << absolutePath << "innerId=" << info->innerId()
                    << "installed=" << info->isInstalled();
    return info;
}

} // namespace LaunchDock
