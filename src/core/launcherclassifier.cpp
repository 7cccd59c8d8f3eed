// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "launcherclassifier.h"
#include "launcherinfo.h"
#include "logging.h"
#include "utils.h"
#include <QDir>

namespace LaunchDock {

LauncherClassifier::LauncherClassifier(const QString& scratchDir)
    : m_scratchDir(QDir::cleanPath(scratchDir))
{
}

bool LauncherClassifier::needsScratch(const LauncherInfo* info) const
{
    if (!info) {
        qCDebug(lcCore) << "needsScratch: yes, no launcher";
        return true;
    }
    if (info->isInstalled()) {
        qCDebug(lcCore) << "needsScratch: no, launcher is installed";
        return false;
    }
    if (isInScratchDir(info->fileName())) {
        qCDebug(lcCore) << "needsScratch: no, launcher is in the scratch directory";
        return false;
    }
    qCDebug(lcCore) << "needsScratch: yes," << info->fileName() << "is neither installed nor scratch";
    return true;
}

bool LauncherClassifier::isInScratchDir(const QString& filePath) const
{
    return isFileInDir(filePath, m_scratchDir);
}

bool LauncherClassifier::isFileInDir(const QString& filePath, const QString& dir)
{
    if (filePath.isEmpty() || dir.isEmpty()) {
        return false;
    }
    return Utils::parentDirectory(filePath) == QDir::cleanPath(dir);
}

} // namespace LaunchDock
