// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "launchdock_export.h"
#include "appentry.h"
#include "desktoppathcodec.h"
#include "launcherclassifier.h"
#include "scratchlauncherstore.h"
#include "types.h"
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QReadWriteLock>
#include <QString>
#include <QStringList>
#include <QVector>

namespace LaunchDock {

class IDockedSetStore;
class IWindowIdentifier;

/**
 * @brief Tracks dock entries and runs their dock/undock transitions
 *
 * Business logic layer behind DockAdaptor. It handles:
 *
 * - The tracked set of entries, ordered as shown in the dock
 * - Window added/removed events (grouping windows by inner identity)
 * - Docking: synthesizing scratch launchers for applications that have no
 *   usable launcher, then pinning the entry
 * - Undocking: discarding scratch launchers, re-identifying the entry's
 *   windows, destroying entries left without windows
 * - Persisting the docked set after every change, and restoring it
 *
 * All public methods are safe to call from several threads at once.
 *
 * Locking: every entry has its own lock and the entry list has another one.
 * An entry lock may be taken first and the list lock inside it, never the
 * other way round. Signals are emitted once every lock has been released.
 */
class LAUNCHDOCK_EXPORT DockManager : public QObject
{
    Q_OBJECT

public:
    /**
     * @param scratchDir Scratch directory, shared by the store and the classifier
     * @param identifier Window re-identification collaborator (not owned)
     * @param dockedSetStore Durable docked-set record (not owned)
     */
    explicit DockManager(const QString& scratchDir, IWindowIdentifier* identifier, IDockedSetStore* dockedSetStore,
                         QObject* parent = nullptr);
    ~DockManager() override;

    // ═══════════════════════════════════════════════════════════════════════════
    // Entry Lookup
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Snapshot of all tracked entries, in dock order
     */
    QVector<AppEntryPtr> entries() const;
    int entryCount() const;
    AppEntryPtr entryById(const QString& entryId) const;
    AppEntryPtr entryByInnerId(const QString& innerId) const;

    /**
     * @brief Find the docked entry whose launcher file is @p desktopFilePath
     */
    AppEntryPtr dockedAppEntryByDesktopFilePath(const QString& desktopFilePath) const;

    // ═══════════════════════════════════════════════════════════════════════════
    // Dock / Undock
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Dock an entry and persist the docked set
     * @return Changed, AlreadyInState, or Failed with IoError/StateError; on
     *         failure the entry is left exactly as it was
     */
    DockResult dock(const QString& entryId);

    /**
     * @brief Undock an entry and persist the docked set
     *
     * Scratch launchers are deleted. An entry without windows is destroyed.
     */
    DockResult undock(const QString& entryId);

    /**
     * @brief Dock the application described by a launcher file
     * @param desktopFile Absolute launcher path
     * @param index Position in the dock for a new entry; out of range appends
     */
    DockResult requestDock(const QString& desktopFile, int index = -1);

    /**
     * @brief Undock the docked entry backed by a launcher file
     */
    DockResult requestUndock(const QString& desktopFile);

    bool isDocked(const QString& desktopFile) const;

    /**
     * @brief Launcher paths of all docked entries, in dock order
     */
    QStringList dockedAppsDesktopFiles() const;

    // ═══════════════════════════════════════════════════════════════════════════
    // Window Lifecycle
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Attach a new window to its entry, creating the entry if needed
     * @return Id of the entry the window was attached to
     */
    QString windowAdded(const WindowInfo& window);

    /**
     * @brief Detach a closed window; an undocked entry left without windows is destroyed
     */
    void windowRemoved(const QString& windowId);

    // ═══════════════════════════════════════════════════════════════════════════
    // Docked-Set Persistence
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Rebuild the docked-set record from the current entries
     * @return The encoded list that was written
     */
    QStringList saveDockedApps();

    /**
     * @brief Create docked entries from the persisted record
     *
     * Paths that no longer resolve to a launcher are skipped.
     *
     * @return Number of entries docked
     */
    int loadDockedApps();

    const ScratchLauncherStore& scratchStore() const
    {
        return m_scratchStore;
    }
    const LauncherClassifier& classifier() const
    {
        return m_classifier;
    }
    const DesktopPathCodec& pathCodec() const
    {
        return m_pathCodec;
    }

Q_SIGNALS:
    void entryAdded(const QString& entryId);
    void entryRemoved(const QString& entryId);
    void entryDockedChanged(const QString& entryId, bool docked);
    void dockedAppsChanged(const QStringList& dockedApps);

private:
    // State machine - callers persist afterwards

    /**
     * @brief Dock transition
     * @param candidate Launcher to adopt when the entry has none yet; only
     *        committed if the transition succeeds
     */
    DockResult dockEntry(const AppEntryPtr& entry, const LauncherInfoPtr& candidate = nullptr);
    DockResult undockEntry(const AppEntryPtr& entry);

    /**
     * @brief Commit the window-present branch of an undock
     *
     * Caller holds the entry's write lock.
     *
     * @param scratchDesktop Discarded scratch launcher, empty if none
     */
    void commitUndockWithWindow(const AppEntryPtr& entry, const QString& scratchDesktop);

    // Registry helpers
    AppEntryPtr findOrCreateEntry(const QString& innerId, int index, bool* created);
    AppEntryPtr findEntryForWindow(const WindowInfo& window, const QString& identityInnerId) const;
    AppEntryPtr findEntryByWindowId(const QString& windowId) const;

    /**
     * @brief Move an entry's inner identity in the lookup index
     *
     * Caller holds the entry's write lock.
     *
     * @return false if another entry already uses @p newInnerId
     */
    bool reassignInnerId(const AppEntryPtr& entry, const QString& oldInnerId, const QString& newInnerId);

    /**
     * @brief Drop an entry from the tracked set
     *
     * Caller holds the entry's write lock.
     */
    void removeAppEntryLocked(AppEntry& entry);

    /**
     * @brief Destroy an entry that is undocked and has no window
     * @return true if the entry was destroyed
     */
    bool discardIfEmpty(const AppEntryPtr& entry);

    ScratchLauncherStore m_scratchStore;
    LauncherClassifier m_classifier;
    DesktopPathCodec m_pathCodec;
    IWindowIdentifier* m_identifier;
    IDockedSetStore* m_dockedSetStore;

    mutable QReadWriteLock m_entriesLock;
    QVector<AppEntryPtr> m_entries;
    QHash<QString, AppEntryPtr> m_entriesByInnerId;
    int m_nextEntryId = 0;

    // Serializes docked-set rebuilds so the last write wins with the newest snapshot
    QMutex m_saveMutex;
};

} // namespace LaunchDock
