// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QList>
#include <QObject>

class QSocketNotifier;

namespace LaunchDock {

/**
 * @brief Delivers Unix signals through the event loop
 *
 * The installed handler only writes the signal number to a socket pair;
 * signalReceived() is emitted from the thread owning the watcher, where
 * it is safe to stop the daemon. One watcher per process.
 */
class SignalWatcher : public QObject
{
    Q_OBJECT

public:
    explicit SignalWatcher(QObject* parent = nullptr);
    ~SignalWatcher() override;

    /**
     * @brief Route @p signal to signalReceived()
     * @return false if the handler could not be installed
     */
    bool watch(int signal);

Q_SIGNALS:
    void signalReceived(int signal);

private:
    void readSignal();

    QSocketNotifier* m_notifier = nullptr;
    QList<int> m_watched;
};

} // namespace LaunchDock
