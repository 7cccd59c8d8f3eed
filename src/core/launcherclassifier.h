// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "launchdock_export.h"
#include <QString>

namespace LaunchDock {

class LauncherInfo;

/**
 * @brief Decides whether an application needs a synthesized launcher
 *
 * Only installed launchers and launchers already living in the scratch
 * directory are reused as they are. Anything else (no launcher at all, or a
 * descriptor found somewhere ad hoc) gets a scratch launcher when docked.
 */
class LAUNCHDOCK_EXPORT LauncherClassifier
{
public:
    explicit LauncherClassifier(const QString& scratchDir);

    QString scratchDirectory() const
    {
        return m_scratchDir;
    }

    /**
     * @brief Check whether docking needs a scratch launcher
     * @param info Launcher metadata, nullptr when no launcher is known
     */
    bool needsScratch(const LauncherInfo* info) const;

    /**
     * @brief Check whether a file is directly inside the scratch directory
     */
    bool isInScratchDir(const QString& filePath) const;

    /**
     * @brief Check whether a file's immediate parent directory is @p dir
     *
     * Subdirectories of @p dir don't count.
     */
    static bool isFileInDir(const QString& filePath, const QString& dir);

private:
    QString m_scratchDir;
};

} // namespace LaunchDock
