// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "scratchlauncherstore.h"
#include "constants.h"
#include "launcherclassifier.h"
#include "logging.h"
#include "utils.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QSaveFile>

namespace LaunchDock {

namespace {

QString descriptorContent(const QString& title, const QString& icon, const QString& execCommand)
{
    // Plain concatenation: titles and commands may contain '%' sequences
    QString content = QStringLiteral("[Desktop Entry]\n");
    content += QStringLiteral("Name=") + title + QLatin1Char('\n');
    content += QStringLiteral("Exec=") + execCommand + QLatin1Char('\n');
    content += QStringLiteral("Icon=") + icon + QLatin1Char('\n');
    content += QStringLiteral("Type=Application\n");
    content += QStringLiteral("Terminal=false\n");
    content += QStringLiteral("StartupNotify=false\n");
    return content;
}

/**
 * @brief Write a whole file through QSaveFile and apply permissions
 * @return Empty string on success, error message otherwise
 */
QString writeWholeFile(const QString& filePath, const QByteArray& data, QFileDevice::Permissions permissions)
{
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return file.errorString();
    }
    if (file.write(data) != data.size()) {
        const QString error = file.errorString();
        file.cancelWriting();
        return error;
    }
    if (!file.commit()) {
        return file.errorString();
    }
    if (!QFile::setPermissions(filePath, permissions)) {
        qCWarning(lcScratch) << "Failed to set permissions on" << filePath;
    }
    return QString();
}

} // namespace

ScratchLauncherStore::ScratchLauncherStore(const QString& scratchDir)
    : m_scratchDir(QDir::cleanPath(scratchDir))
{
}

bool ScratchLauncherStore::ensureDirectory() const
{
    const QFileInfo info(m_scratchDir);
    if (info.isDir()) {
        return true;
    }

    if (!QDir().mkpath(m_scratchDir)) {
        qCWarning(lcScratch) << "Failed to create scratch directory:" << m_scratchDir;
        return false;
    }
    if (!QFile::setPermissions(m_scratchDir, Defaults::ScratchDirPermissions)) {
        qCWarning(lcScratch) << "Failed to set permissions on scratch directory:" << m_scratchDir;
    }
    qCDebug(lcScratch) << "Created scratch directory" << m_scratchDir;
    return true;
}

QString ScratchLauncherStore::filePathFor(const QString& base, QLatin1String extension) const
{
    return m_scratchDir + QLatin1Char('/') + base + extension;
}

bool ScratchLauncherStore::contains(const QString& filePath) const
{
    return LauncherClassifier::isFileInDir(filePath, m_scratchDir);
}

ScratchResult ScratchLauncherStore::createLauncher(const QString& id, const QString& title, const QString& icon,
                                                   const QString& execCommand) const
{
    qCDebug(lcScratch) << "Create scratch launcher for" << id;
    const QString filePath = filePathFor(id, ScratchExt::Desktop);
    qCDebug(lcScratch) << "Launcher name=" << title << "icon=" << icon << "exec=" << execCommand;

    const QString error =
        writeWholeFile(filePath, descriptorContent(title, icon, execCommand).toUtf8(), Defaults::DescriptorPermissions);
    if (!error.isEmpty()) {
        qCWarning(lcScratch) << "Failed to write scratch launcher:" << filePath << "Error:" << error;
        return ScratchResult::failure(DockError::IoError, error);
    }
    return ScratchResult::ok(filePath);
}

ScratchResult ScratchLauncherStore::createScratchSetForEntry(const ScratchSource& source) const
{
    if (!ensureDirectory()) {
        return ScratchResult::failure(DockError::IoError,
                                      QStringLiteral("cannot create scratch directory %1").arg(m_scratchDir));
    }

    if (source.launcher) {
        return copyDescriptor(*source.launcher);
    }

    if (!source.window) {
        qCWarning(lcScratch) << "Cannot synthesize a launcher: entry has neither launcher nor window";
        return ScratchResult::failure(DockError::StateError, QStringLiteral("entry has no launcher and no window"));
    }

    const QString exec = source.exec.isEmpty() ? source.window->exec : source.exec;
    return createFromWindow(*source.window, exec);
}

ScratchResult ScratchLauncherStore::copyDescriptor(const LauncherInfo& launcher) const
{
    const QString sourcePath = launcher.fileName();
    const QString targetPath = filePathFor(launcher.innerId(), ScratchExt::Desktop);

    QFile sourceFile(sourcePath);
    if (!sourceFile.open(QIODevice::ReadOnly)) {
        qCWarning(lcScratch) << "Failed to open launcher for copying:" << sourcePath
                             << "Error:" << sourceFile.errorString();
        return ScratchResult::failure(DockError::IoError, sourceFile.errorString());
    }
    const QByteArray content = sourceFile.readAll();
    sourceFile.close();

    const QString error = writeWholeFile(targetPath, content, Defaults::DescriptorPermissions);
    if (!error.isEmpty()) {
        qCWarning(lcScratch) << "Failed to copy launcher" << sourcePath << "to" << targetPath << "Error:" << error;
        return ScratchResult::failure(DockError::IoError, error);
    }

    qCDebug(lcScratch) << "Copied launcher" << sourcePath << "to" << targetPath;
    return ScratchResult::ok(targetPath);
}

ScratchResult ScratchLauncherStore::createFromWindow(const WindowInfo& window, const QString& exec) const
{
    const QString appId = window.innerId;
    if (appId.isEmpty()) {
        return ScratchResult::failure(DockError::StateError, QStringLiteral("window has no inner id"));
    }

    QString icon = window.icon;
    if (icon.startsWith(DataImagePrefix)) {
        const QString iconPath = filePathFor(appId, ScratchExt::Icon);
        if (writeDataUriImage(icon, iconPath)) {
            icon = iconPath;
        } else {
            qCWarning(lcScratch) << "Failed to write inline icon of" << appId << "to" << iconPath;
            icon.clear();
        }
    }
    if (icon.isEmpty()) {
        icon = Defaults::FallbackIconName;
    }

    const QString scriptPath = filePathFor(appId, ScratchExt::Script);
    const QString error = writeWholeFile(scriptPath, exec.toUtf8(), Defaults::ScriptPermissions);
    if (!error.isEmpty()) {
        qCWarning(lcScratch) << "Failed to write launch script:" << scriptPath << "Error:" << error;
        return ScratchResult::failure(DockError::IoError, error);
    }

    return createLauncher(appId, window.title, icon, scriptPath + Defaults::ExecFileArgument);
}

CleanupReport ScratchLauncherStore::removeScratchSet(const QString& path) const
{
    CleanupReport report;
    const QString base = Utils::stripExtension(path);
    qCDebug(lcScratch) << "Remove scratch set" << base;

    for (QLatin1String extension : {ScratchExt::Desktop, ScratchExt::Script, ScratchExt::Icon}) {
        const QString file = base + extension;
        if (!QFileInfo::exists(file)) {
            continue;
        }
        QFile scratchFile(file);
        if (scratchFile.remove()) {
            qCDebug(lcScratch) << "Removed scratch file" << file;
            report.removed.append(file);
        } else {
            qCWarning(lcScratch) << "Failed to remove scratch file" << file << "Error:" << scratchFile.errorString();
            report.failed.append(file);
        }
    }
    return report;
}

bool ScratchLauncherStore::writeDataUriImage(const QString& dataUri, const QString& filePath)
{
    // data:image/png;base64,<payload>
    const auto comma = dataUri.indexOf(QLatin1Char(','));
    if (!dataUri.startsWith(DataImagePrefix) || comma < 0) {
        return false;
    }

    const QStringView header = QStringView(dataUri).left(comma);
    const QByteArray payload = dataUri.mid(comma + 1).toLatin1();
    const QByteArray bytes = header.endsWith(QLatin1String(";base64")) ? QByteArray::fromBase64(payload)
                                                                       : QByteArray::fromPercentEncoding(payload);

    QImage image;
    if (!image.loadFromData(bytes)) {
        qCDebug(lcScratch) << "Inline icon is not a decodable image";
        return false;
    }
    return image.save(filePath, "PNG");
}

} // namespace LaunchDock
