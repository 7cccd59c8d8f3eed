// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "launchdock_export.h"
#include "launcherinfo.h"
#include "types.h"
#include <QString>
#include <optional>

namespace LaunchDock {

/**
 * @brief Snapshot of the entry fields a scratch synthesis reads
 *
 * Taken while the caller holds the entry lock, so the store itself never
 * touches entries.
 */
struct LAUNCHDOCK_EXPORT ScratchSource
{
    LauncherInfoPtr launcher;           ///< Known launcher, copied verbatim when set
    std::optional<WindowInfo> window;   ///< Representative window for window-only entries
    QString exec;                       ///< Resolved launch command of the entry
};

/**
 * @brief Creates and deletes synthesized launchers in the scratch directory
 *
 * A scratch asset set is a descriptor plus an optional launch script and an
 * optional icon image, all sharing one base name:
 *
 *   <scratchDir>/<base>.desktop
 *   <scratchDir>/<base>.sh
 *   <scratchDir>/<base>.png
 *
 * The base name is the inner identity the set was derived from ("w:..." for a
 * window-backed synthesis, "d:..." for a copy of an existing descriptor).
 *
 * The store is stateless apart from the directory path and can be used from
 * any thread.
 */
class LAUNCHDOCK_EXPORT ScratchLauncherStore
{
public:
    explicit ScratchLauncherStore(const QString& scratchDir);

    QString scratchDirectory() const
    {
        return m_scratchDir;
    }

    /**
     * @brief Create the scratch directory if missing
     * @return false if the directory could not be created
     */
    bool ensureDirectory() const;

    /**
     * @brief Write a launcher descriptor named after @p id
     * @param id Filesystem-safe base name
     * @param title Name= value
     * @param icon Icon= value
     * @param execCommand Exec= value
     * @return Path of the descriptor, or IoError
     */
    ScratchResult createLauncher(const QString& id, const QString& title, const QString& icon,
                                 const QString& execCommand) const;

    /**
     * @brief Synthesize the scratch asset set for an entry
     *
     * With a known launcher, the descriptor is copied verbatim under the
     * launcher's inner identity. Otherwise the set is built from the window:
     * icon image (for inline icons), launch script and descriptor.
     *
     * @return Path of the descriptor; StateError when the source has neither a
     *         launcher nor a window, IoError on any file failure
     */
    ScratchResult createScratchSetForEntry(const ScratchSource& source) const;

    /**
     * @brief Delete every file of the scratch set @p path belongs to
     * @param path Any member of the set (descriptor, script or image)
     * @return Files removed and files that could not be removed
     */
    CleanupReport removeScratchSet(const QString& path) const;

    /**
     * @brief Check whether a file is directly inside the scratch directory
     */
    bool contains(const QString& filePath) const;

    /**
     * @brief Write an inline "data:image/..." icon as a PNG file
     * @return true on success
     */
    static bool writeDataUriImage(const QString& dataUri, const QString& filePath);

private:
    QString filePathFor(const QString& base, QLatin1String extension) const;
    ScratchResult copyDescriptor(const LauncherInfo& launcher) const;
    ScratchResult createFromWindow(const WindowInfo& window, const QString& exec) const;

    QString m_scratchDir;
};

} // namespace LaunchDock
