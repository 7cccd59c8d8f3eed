// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "constants.h"
#include <QByteArray>
#include <QCryptographicHash>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QString>
#include <QStringList>

namespace LaunchDock {
namespace Utils {

// ═══════════════════════════════════════════════════════════════════════════════
// Inner Identity Utilities
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Hex-encoded MD5 of a string
 */
inline QString md5Hex(const QString& text)
{
    return QString::fromLatin1(QCryptographicHash::hash(text.toUtf8(), QCryptographicHash::Md5).toHex());
}

/**
 * @brief Inner identity of a window
 *
 * Windows of the same application share the identity, so they group under
 * one entry. The application id is preferred; the command line is the
 * fallback for clients that don't set one.
 *
 * @param appId Application id / window class (may be empty)
 * @param exec Command line of the owning process
 * @return "w:" followed by a hash
 */
inline QString windowInnerId(const QString& appId, const QString& exec)
{
    const QString key = appId.isEmpty() ? exec : appId;
    return InnerId::WindowPrefix + md5Hex(key);
}

/**
 * @brief Inner identity of a launcher descriptor
 *
 * Two descriptors launching the same command line share the identity.
 *
 * @param exec Exec= value of the descriptor
 * @param filePath Descriptor path, hashed when exec is empty
 * @return "d:" followed by a hash
 */
inline QString desktopInnerId(const QString& exec, const QString& filePath)
{
    return InnerId::DesktopPrefix + md5Hex(exec.isEmpty() ? filePath : exec);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Path Utilities
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Strip a trailing ".desktop" from a path
 */
inline QString trimDesktopExt(const QString& path)
{
    if (path.endsWith(ScratchExt::Desktop)) {
        return path.chopped(ScratchExt::Desktop.size());
    }
    return path;
}

/**
 * @brief Strip the last extension of a file path, keeping its directory
 *
 * Only the suffix after the last dot of the file name is removed, so base
 * names containing dots or colons survive.
 */
inline QString stripExtension(const QString& path)
{
    const QFileInfo info(path);
    const QString suffix = info.suffix();
    if (suffix.isEmpty()) {
        return path;
    }
    return path.chopped(suffix.size() + 1);
}

/**
 * @brief Absolute, cleaned directory of a file path
 */
inline QString parentDirectory(const QString& filePath)
{
    return QDir::cleanPath(QFileInfo(filePath).absolutePath());
}

/**
 * @brief All XDG applications directories, cleaned, most local first
 */
inline QStringList applicationsDirectories()
{
    QStringList dirs;
    const QStringList locations = QStandardPaths::standardLocations(QStandardPaths::ApplicationsLocation);
    for (const QString& dir : locations) {
        const QString cleaned = QDir::cleanPath(dir);
        if (!dirs.contains(cleaned)) {
            dirs.append(cleaned);
        }
    }
    return dirs;
}

/**
 * @brief Check whether a path lies under a directory, at any depth
 */
inline bool isPathUnder(const QString& path, const QString& dir)
{
    if (dir.isEmpty()) {
        return false;
    }
    const QString cleanedDir = QDir::cleanPath(dir) + QLatin1Char('/');
    return QDir::cleanPath(path).startsWith(cleanedDir);
}

} // namespace Utils
} // namespace LaunchDock
