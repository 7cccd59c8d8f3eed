// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "desktoppathcodec.h"
#include "constants.h"
#include "utils.h"
#include <QDir>
#include <QStandardPaths>

namespace LaunchDock {

namespace {
QString withTrailingSlash(const QString& dir)
{
    const QString cleaned = QDir::cleanPath(dir);
    return cleaned.endsWith(QLatin1Char('/')) ? cleaned : QString(cleaned + QLatin1Char('/'));
}
} // namespace

DesktopPathCodec::DesktopPathCodec(const QString& scratchDir, const QString& userApplicationsDir)
{
    const QString userDir = userApplicationsDir.isEmpty()
        ? QStandardPaths::writableLocation(QStandardPaths::ApplicationsLocation)
        : userApplicationsDir;

    // Most specific roots first
    if (!scratchDir.isEmpty()) {
        m_roots.append(Root{PathCode::Scratch, withTrailingSlash(scratchDir)});
    }
    if (!userDir.isEmpty()) {
        m_roots.append(Root{PathCode::UserApplications, withTrailingSlash(userDir)});
    }
    m_roots.append(Root{PathCode::LocalApplications, QStringLiteral("/usr/local/share/applications/")});
    m_roots.append(Root{PathCode::SystemApplications, QStringLiteral("/usr/share/applications/")});
}

QString DesktopPathCodec::zip(const QString& path) const
{
    const QString cleaned = QDir::cleanPath(path);

    // unzip() appends the suffix back, so only launcher files get a root code
    if (!cleaned.endsWith(ScratchExt::Desktop)) {
        return path;
    }

    for (const Root& root : m_roots) {
        if (cleaned.startsWith(root.dir)) {
            return root.code + Utils::trimDesktopExt(cleaned.mid(root.dir.size()));
        }
    }
    return path;
}

QString DesktopPathCodec::unzip(const QString& encoded) const
{
    for (const Root& root : m_roots) {
        if (encoded.startsWith(root.code)) {
            return root.dir + encoded.mid(root.code.size()) + ScratchExt::Desktop;
        }
    }
    return encoded;
}

} // namespace LaunchDock
