// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowidentifier.h"
#include "constants.h"
#include "logging.h"
#include <QStandardPaths>

namespace LaunchDock {

WindowIdentity DesktopWindowIdentifier::identifyWindow(const WindowInfo& window)
{
    if (!window.appId.isEmpty()) {
        QStringList candidates{QString(window.appId + ScratchExt::Desktop)};
        const QString lowered = window.appId.toLower();
        if (lowered != window.appId) {
            candidates.append(lowered + ScratchExt::Desktop);
        }

        for (const QString& candidate : candidates) {
            const QString path = QStandardPaths::locate(QStandardPaths::ApplicationsLocation, candidate);
            if (path.isEmpty()) {
                continue;
            }
            LauncherInfoPtr launcher = LauncherInfo::fromFile(path);
            if (launcher) {
                qCDebug(lcEntry) << "Identified window" << window.windowId << "as" << path;
                return WindowIdentity{launcher->innerId(), launcher};
            }
        }
    }

    qCDebug(lcEntry) << "No launcher for window" << window.windowId << "appId=" << window.appId;
    return WindowIdentity{window.innerId, nullptr};
}

} // namespace LaunchDock
