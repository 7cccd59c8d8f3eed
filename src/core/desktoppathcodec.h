// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "launchdock_export.h"
#include <QString>
#include <QVector>

namespace LaunchDock {

/**
 * @brief Encodes launcher paths into a root-independent form
 *
 * The docked set is restored across sessions where the absolute scratch or
 * home directory may differ, so well-known launcher roots are replaced by
 * short codes and the ".desktop" suffix is dropped:
 *
 *   <scratchDir>/w:1a2b.desktop                    -> /D@w:1a2b
 *   ~/.local/share/applications/foo.desktop        -> /H@foo
 *   /usr/share/applications/org.kde.kate.desktop   -> /S@org.kde.kate
 *   /usr/local/share/applications/bar.desktop      -> /L@bar
 *
 * Paths under no known root are kept as they are.
 */
class LAUNCHDOCK_EXPORT DesktopPathCodec
{
public:
    /**
     * @param scratchDir Scratch directory of this session
     * @param userApplicationsDir User applications directory; empty = XDG default
     */
    explicit DesktopPathCodec(const QString& scratchDir, const QString& userApplicationsDir = QString());

    QString zip(const QString& path) const;
    QString unzip(const QString& encoded) const;

private:
    struct Root
    {
        QString code;
        QString dir; ///< With trailing slash
    };

    QVector<Root> m_roots;
};

} // namespace LaunchDock
