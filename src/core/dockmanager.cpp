// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dockmanager.h"
#include "constants.h"
#include "interfaces.h"
#include "logging.h"
#include "utils.h"
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QReadLocker>
#include <QWriteLocker>

namespace LaunchDock {

DockManager::DockManager(const QString& scratchDir, IWindowIdentifier* identifier, IDockedSetStore* dockedSetStore,
                         QObject* parent)
    : QObject(parent)
    , m_scratchStore(scratchDir)
    , m_classifier(scratchDir)
    , m_pathCodec(scratchDir)
    , m_identifier(identifier)
    , m_dockedSetStore(dockedSetStore)
{
    qCDebug(lcCore) << "DockManager created, scratch directory:" << m_classifier.scratchDirectory();
}

DockManager::~DockManager() = default;

// ═══════════════════════════════════════════════════════════════════════════════
// Entry Lookup
// ═══════════════════════════════════════════════════════════════════════════════

QVector<AppEntryPtr> DockManager::entries() const
{
    QReadLocker locker(&m_entriesLock);
    return m_entries;
}

int DockManager::entryCount() const
{
    QReadLocker locker(&m_entriesLock);
    return m_entries.size();
}

AppEntryPtr DockManager::entryById(const QString& entryId) const
{
    QReadLocker locker(&m_entriesLock);
    for (const AppEntryPtr& entry : m_entries) {
        if (entry->id() == entryId) {
            return entry;
        }
    }
    return nullptr;
}

AppEntryPtr DockManager::entryByInnerId(const QString& innerId) const
{
    QReadLocker locker(&m_entriesLock);
    return m_entriesByInnerId.value(innerId);
}

AppEntryPtr DockManager::dockedAppEntryByDesktopFilePath(const QString& desktopFilePath) const
{
    const QString cleaned = QDir::cleanPath(desktopFilePath);
    const QVector<AppEntryPtr> snapshot = entries();
    for (const AppEntryPtr& entry : snapshot) {
        QReadLocker locker(&entry->propsLock());
        if (entry->m_removed || !entry->m_isDocked || !entry->m_launcherInfo) {
            continue;
        }
        if (QDir::cleanPath(entry->m_launcherInfo->fileName()) == cleaned) {
            return entry;
        }
    }
    return nullptr;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Dock / Undock
// ═══════════════════════════════════════════════════════════════════════════════

DockResult DockManager::dock(const QString& entryId)
{
    AppEntryPtr entry = entryById(entryId);
    if (!entry) {
        qCWarning(lcEntry) << "dock: unknown entry" << entryId;
        return DockResult::failure(DockError::StateError, QStringLiteral("unknown entry"), entryId);
    }

    const DockResult result = dockEntry(entry);
    if (result.isChanged()) {
        saveDockedApps();
        Q_EMIT entryDockedChanged(entryId, true);
    }
    return result;
}

DockResult DockManager::undock(const QString& entryId)
{
    AppEntryPtr entry = entryById(entryId);
    if (!entry) {
        qCWarning(lcEntry) << "undock: unknown entry" << entryId;
        return DockResult::failure(DockError::StateError, QStringLiteral("unknown entry"), entryId);
    }

    const DockResult result = undockEntry(entry);
    if (result.isChanged()) {
        const bool removed = entry->isRemoved();
        saveDockedApps();
        Q_EMIT entryDockedChanged(entryId, false);
        if (removed) {
            Q_EMIT entryRemoved(entryId);
        }
    }
    return result;
}

DockResult DockManager::requestDock(const QString& desktopFile, int index)
{
    LauncherInfoPtr launcher = LauncherInfo::fromFile(desktopFile);
    if (!launcher) {
        qCWarning(lcEntry) << "requestDock: not a readable launcher:" << desktopFile;
        return DockResult::failure(DockError::StateError, QStringLiteral("not a launcher file: %1").arg(desktopFile));
    }

    bool created = false;
    AppEntryPtr entry = findOrCreateEntry(launcher->innerId(), index, &created);
    if (created) {
        Q_EMIT entryAdded(entry->id());
    }

    const DockResult result = dockEntry(entry, launcher);
    if (result.isFailure()) {
        if (created && discardIfEmpty(entry)) {
            Q_EMIT entryRemoved(entry->id());
        }
        return result;
    }

    if (result.isChanged()) {
        saveDockedApps();
        Q_EMIT entryDockedChanged(entry->id(), true);
    }
    return result;
}

DockResult DockManager::requestUndock(const QString& desktopFile)
{
    AppEntryPtr entry = dockedAppEntryByDesktopFilePath(desktopFile);
    if (!entry) {
        qCWarning(lcEntry) << "requestUndock: no docked entry for" << desktopFile;
        return DockResult::failure(DockError::StateError, QStringLiteral("not docked: %1").arg(desktopFile));
    }
    return undock(entry->id());
}

bool DockManager::isDocked(const QString& desktopFile) const
{
    return dockedAppEntryByDesktopFilePath(desktopFile) != nullptr;
}

QStringList DockManager::dockedAppsDesktopFiles() const
{
    QStringList files;
    const QVector<AppEntryPtr> snapshot = entries();
    for (const AppEntryPtr& entry : snapshot) {
        QReadLocker locker(&entry->propsLock());
        if (!entry->m_removed && entry->m_isDocked && entry->m_launcherInfo) {
            files.append(entry->m_launcherInfo->fileName());
        }
    }
    return files;
}

// ═══════════════════════════════════════════════════════════════════════════════
// State Machine
// ═══════════════════════════════════════════════════════════════════════════════

DockResult DockManager::dockEntry(const AppEntryPtr& entry, const LauncherInfoPtr& candidate)
{
    const QString entryId = entry->id();
    QWriteLocker locker(&entry->propsLock());

    if (entry->m_removed) {
        return DockResult::failure(DockError::StateError, QStringLiteral("entry was removed"), entryId);
    }
    if (entry->m_isDocked) {
        qCWarning(lcEntry) << "Entry" << entryId << "is already docked";
        return DockResult::alreadyInState(entryId);
    }

    LauncherInfoPtr launcher = entry->m_launcherInfo ? entry->m_launcherInfo : candidate;

    if (m_classifier.needsScratch(launcher.get())) {
        ScratchSource source = entry->scratchSource();
        source.launcher = launcher;

        const ScratchResult scratch = m_scratchStore.createScratchSetForEntry(source);
        if (!scratch.isValid()) {
            qCWarning(lcEntry) << "Failed to dock" << entryId << "- scratch launcher not created:" << scratch.message;
            return DockResult::failure(scratch.error, scratch.message, entryId);
        }
        qCDebug(lcEntry) << "Scratch launcher for" << entryId << "at" << scratch.path;

        launcher = LauncherInfo::fromFile(scratch.path);
        if (!launcher) {
            qCWarning(lcEntry) << "Failed to dock" << entryId << "- scratch launcher unreadable:" << scratch.path;
            return DockResult::failure(DockError::IoError,
                                       QStringLiteral("cannot read scratch launcher %1").arg(scratch.path), entryId);
        }
    }

    // Nothing is mutated before this point
    if (launcher != entry->m_launcherInfo) {
        const QString oldInnerId = entry->m_innerId;
        if (!reassignInnerId(entry, oldInnerId, launcher->innerId())) {
            // The scratch set written above stays behind; it is overwritten on the next attempt
            qCWarning(lcEntry) << "Failed to dock" << entryId << "- inner id" << launcher->innerId()
                               << "belongs to another entry";
            return DockResult::failure(DockError::StateError, QStringLiteral("inner id already in use"), entryId);
        }
        entry->setLauncherInfo(launcher);
        entry->setInnerId(launcher->innerId());
        entry->updateName();
        entry->updateIcon();
    }

    entry->setDocked(true);
    entry->updateMenu();

    qCInfo(lcEntry) << "Docked" << entryId << "launcher=" << launcher->fileName();
    return DockResult::changed(entryId);
}

DockResult DockManager::undockEntry(const AppEntryPtr& entry)
{
    const QString entryId = entry->id();
    QString desktopFile;
    bool scratchBacked = false;

    // Shared phase: other readers may proceed while scratch files are removed
    {
        QReadLocker locker(&entry->propsLock());
        if (entry->m_removed) {
            return DockResult::failure(DockError::StateError, QStringLiteral("entry was removed"), entryId);
        }
        if (!entry->m_isDocked) {
            qCWarning(lcEntry) << "Entry" << entryId << "is not docked";
            return DockResult::alreadyInState(entryId);
        }
        if (!entry->m_launcherInfo) {
            qCWarning(lcEntry) << "Docked entry" << entryId << "has no launcher";
            return DockResult::failure(DockError::StateError, QStringLiteral("docked entry has no launcher"),
                                       entryId);
        }

        desktopFile = entry->m_launcherInfo->fileName();
        if (m_classifier.isInScratchDir(desktopFile)) {
            scratchBacked = true;
            const CleanupReport report = m_scratchStore.removeScratchSet(desktopFile);
            if (!report.isClean()) {
                qCWarning(lcEntry) << "Undock of" << entryId << "left scratch files behind:" << report.failed;
            }
        }
    }

    QWriteLocker locker(&entry->propsLock());

    // A concurrent undock may have committed while the lock was released
    if (entry->m_removed || !entry->m_isDocked || !entry->m_launcherInfo
        || entry->m_launcherInfo->fileName() != desktopFile) {
        qCDebug(lcEntry) << "Entry" << entryId << "was undocked concurrently";
        return DockResult::alreadyInState(entryId);
    }

    // Re-created by a dock that committed between the two phases
    if (scratchBacked && QFileInfo::exists(desktopFile)) {
        const CleanupReport report = m_scratchStore.removeScratchSet(desktopFile);
        if (!report.isClean()) {
            qCWarning(lcEntry) << "Undock of" << entryId << "left scratch files behind:" << report.failed;
        }
    }

    if (!entry->hasWindowUnlocked()) {
        entry->setDocked(false);
        removeAppEntryLocked(*entry);
        qCInfo(lcEntry) << "Undocked" << entryId << "and destroyed it (no windows)";
        return DockResult::changed(entryId);
    }

    commitUndockWithWindow(entry, scratchBacked ? desktopFile : QString());
    qCInfo(lcEntry) << "Undocked" << entryId << "innerId=" << entry->m_innerId;
    return DockResult::changed(entryId);
}

void DockManager::commitUndockWithWindow(const AppEntryPtr& entry, const QString& scratchDesktop)
{
    const WindowInfo window = *entry->currentWindowUnlocked();
    const QString oldInnerId = entry->m_innerId;

    if (!scratchDesktop.isEmpty()) {
        QString newInnerId;
        LauncherInfoPtr newLauncher;

        const QString baseName = QFileInfo(scratchDesktop).completeBaseName();
        if (baseName.startsWith(InnerId::WindowPrefix)) {
            // Synthesized from this window: go back to the window's own identity
            newInnerId = window.innerId;
        } else {
            const WindowIdentity identity =
                m_identifier ? m_identifier->identifyWindow(window) : WindowIdentity{window.innerId, nullptr};
            newInnerId = identity.innerId.isEmpty() ? window.innerId : identity.innerId;
            newLauncher = identity.launcher;
        }

        if (!reassignInnerId(entry, oldInnerId, newInnerId)) {
            qCWarning(lcEntry) << "Inner id" << newInnerId << "of" << entry->id()
                               << "is taken, falling back to the window identity";
            newInnerId = window.innerId;
            newLauncher = nullptr;
            if (!reassignInnerId(entry, oldInnerId, newInnerId)) {
                qCWarning(lcEntry) << "Window identity of" << entry->id() << "is taken too, keeping" << oldInnerId;
                newInnerId = oldInnerId;
            }
        }

        entry->setInnerId(newInnerId);
        entry->setLauncherInfo(newLauncher);
    }

    entry->setDocked(false);
    entry->updateIcon();
    entry->updateName();
    entry->updateMenu();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Window Lifecycle
// ═══════════════════════════════════════════════════════════════════════════════

QString DockManager::windowAdded(const WindowInfo& window)
{
    if (!window.isValid()) {
        qCWarning(lcEntry) << "windowAdded: window without id ignored";
        return QString();
    }

    WindowInfo info = window;
    if (info.innerId.isEmpty()) {
        info.innerId = Utils::windowInnerId(info.appId, info.exec);
    }

    const WindowIdentity identity =
        m_identifier ? m_identifier->identifyWindow(info) : WindowIdentity{info.innerId, nullptr};
    const QString innerId = identity.innerId.isEmpty() ? info.innerId : identity.innerId;

    // The entry found may be destroyed before its lock is taken; it is gone
    // from the registry then, so the next lookup creates a fresh one
    for (;;) {
        bool created = false;
        AppEntryPtr entry = findEntryByWindowId(info.windowId);
        if (!entry) {
            entry = findEntryForWindow(info, innerId);
        }
        if (!entry) {
            entry = findOrCreateEntry(innerId, -1, &created);
        }

        {
            QWriteLocker locker(&entry->propsLock());
            if (entry->m_removed) {
                continue;
            }
            if (!entry->m_launcherInfo && identity.launcher && entry->m_innerId == identity.launcher->innerId()) {
                entry->setLauncherInfo(identity.launcher);
            }
            entry->attachWindow(info);
            entry->updateName();
            entry->updateIcon();
            entry->updateMenu();
        }

        qCDebug(lcEntry) << "Window" << info.windowId << "attached to" << entry->id();
        if (created) {
            Q_EMIT entryAdded(entry->id());
        }
        return entry->id();
    }
}

void DockManager::windowRemoved(const QString& windowId)
{
    AppEntryPtr entry = findEntryByWindowId(windowId);
    if (!entry) {
        qCDebug(lcEntry) << "windowRemoved: untracked window" << windowId;
        return;
    }

    bool destroyed = false;
    {
        QWriteLocker locker(&entry->propsLock());
        if (!entry->detachWindow(windowId)) {
            return;
        }
        if (!entry->m_isDocked && !entry->hasWindowUnlocked()) {
            removeAppEntryLocked(*entry);
            destroyed = true;
        } else {
            entry->updateName();
            entry->updateIcon();
            entry->updateMenu();
        }
    }

    qCDebug(lcEntry) << "Window" << windowId << "detached from" << entry->id() << "destroyed=" << destroyed;
    if (destroyed) {
        Q_EMIT entryRemoved(entry->id());
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Registry helpers
// ═══════════════════════════════════════════════════════════════════════════════

AppEntryPtr DockManager::findOrCreateEntry(const QString& innerId, int index, bool* created)
{
    QWriteLocker locker(&m_entriesLock);

    if (AppEntryPtr existing = m_entriesByInnerId.value(innerId)) {
        *created = false;
        return existing;
    }

    auto entry = std::make_shared<AppEntry>(QStringLiteral("e%1").arg(m_nextEntryId++), innerId);
    if (index < 0 || index > m_entries.size()) {
        m_entries.append(entry);
    } else {
        m_entries.insert(index, entry);
    }
    m_entriesByInnerId.insert(innerId, entry);
    *created = true;

    qCDebug(lcEntry) << "Created entry" << entry->id() << "innerId=" << innerId;
    return entry;
}

AppEntryPtr DockManager::findEntryForWindow(const WindowInfo& window, const QString& identityInnerId) const
{
    if (AppEntryPtr entry = entryByInnerId(identityInnerId)) {
        return entry;
    }
    if (identityInnerId != window.innerId) {
        if (AppEntryPtr entry = entryByInnerId(window.innerId)) {
            return entry;
        }
    }

    // A docked scratch launcher synthesized from an earlier window of this application
    const QVector<AppEntryPtr> snapshot = entries();
    for (const AppEntryPtr& entry : snapshot) {
        QReadLocker locker(&entry->propsLock());
        if (entry->m_removed || !entry->m_launcherInfo) {
            continue;
        }
        const QString file = entry->m_launcherInfo->fileName();
        if (m_classifier.isInScratchDir(file) && QFileInfo(file).completeBaseName() == window.innerId) {
            return entry;
        }
    }
    return nullptr;
}

AppEntryPtr DockManager::findEntryByWindowId(const QString& windowId) const
{
    const QVector<AppEntryPtr> snapshot = entries();
    for (const AppEntryPtr& entry : snapshot) {
        QReadLocker locker(&entry->propsLock());
        if (!entry->m_removed && entry->containsWindowUnlocked(windowId)) {
            return entry;
        }
    }
    return nullptr;
}

bool DockManager::reassignInnerId(const AppEntryPtr& entry, const QString& oldInnerId, const QString& newInnerId)
{
    if (oldInnerId == newInnerId) {
        return true;
    }

    QWriteLocker locker(&m_entriesLock);
    const AppEntryPtr holder = m_entriesByInnerId.value(newInnerId);
    if (holder && holder != entry) {
        return false;
    }
    if (m_entriesByInnerId.value(oldInnerId) == entry) {
        m_entriesByInnerId.remove(oldInnerId);
    }
    m_entriesByInnerId.insert(newInnerId, entry);
    return true;
}

void DockManager::removeAppEntryLocked(AppEntry& entry)
{
    entry.markRemoved();

    QWriteLocker locker(&m_entriesLock);
    for (int i = 0; i < m_entries.size(); ++i) {
        if (m_entries.at(i).get() == &entry) {
            m_entries.removeAt(i);
            break;
        }
    }
    const auto it = m_entriesByInnerId.constFind(entry.m_innerId);
    if (it != m_entriesByInnerId.constEnd() && it.value().get() == &entry) {
        m_entriesByInnerId.erase(it);
    }
    qCDebug(lcEntry) << "Removed entry" << entry.id();
}

bool DockManager::discardIfEmpty(const AppEntryPtr& entry)
{
    QWriteLocker locker(&entry->propsLock());
    if (entry->m_removed || entry->m_isDocked || entry->hasWindowUnlocked()) {
        return false;
    }
    removeAppEntryLocked(*entry);
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Docked-Set Persistence
// ═══════════════════════════════════════════════════════════════════════════════

QStringList DockManager::saveDockedApps()
{
    QMutexLocker saveLocker(&m_saveMutex);

    QStringList encoded;
    const QVector<AppEntryPtr> snapshot = entries();
    for (const AppEntryPtr& entry : snapshot) {
        QReadLocker locker(&entry->propsLock());
        if (entry->m_removed || !entry->m_isDocked || !entry->m_launcherInfo) {
            continue;
        }
        encoded.append(m_pathCodec.zip(entry->m_launcherInfo->fileName()));
    }

    if (m_dockedSetStore) {
        m_dockedSetStore->setDockedApps(encoded);
    }
    qCDebug(lcPersistence) << "Saved" << encoded.size() << "docked apps";

    saveLocker.unlock();
    Q_EMIT dockedAppsChanged(encoded);
    return encoded;
}

int DockManager::loadDockedApps()
{
    if (!m_dockedSetStore) {
        return 0;
    }

    const QStringList encoded = m_dockedSetStore->dockedApps();
    int docked = 0;

    for (const QString& item : encoded) {
        const QString path = m_pathCodec.unzip(item);
        LauncherInfoPtr launcher = LauncherInfo::fromFile(path);
        if (!launcher) {
            qCWarning(lcPersistence) << "Skipping docked app, launcher not found:" << path;
            continue;
        }

        bool created = false;
        AppEntryPtr entry = findOrCreateEntry(launcher->innerId(), -1, &created);
        if (created) {
            Q_EMIT entryAdded(entry->id());
        }

        const DockResult result = dockEntry(entry, launcher);
        if (result.isChanged()) {
            ++docked;
            Q_EMIT entryDockedChanged(entry->id(), true);
        } else if (result.isFailure()) {
            qCWarning(lcPersistence) << "Failed to restore docked app" << path << ":" << result.message;
            if (created && discardIfEmpty(entry)) {
                Q_EMIT entryRemoved(entry->id());
            }
        }
    }

    qCInfo(lcPersistence) << "Restored" << docked << "of" << encoded.size() << "docked apps";
    return docked;
}

} // namespace LaunchDock
