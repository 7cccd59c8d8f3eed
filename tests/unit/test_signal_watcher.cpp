// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QSignalSpy>
#include <QTest>

#include <signal.h>

#include "daemon/signalwatcher.h"

using namespace LaunchDock;

/**
 * @brief Unit tests for SignalWatcher
 *
 * Signals raised in-process must surface as signalReceived() on the event
 * loop, never run daemon code inside the handler.
 */
class TestSignalWatcher : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testRaisedSignal_deliveredThroughEventLoop()
    {
        SignalWatcher watcher;
        QVERIFY(watcher.watch(SIGUSR1));

        QSignalSpy spy(&watcher, &SignalWatcher::signalReceived);
        QCOMPARE(::raise(SIGUSR1), 0);

        // Nothing is emitted from inside the handler
        QCOMPARE(spy.count(), 0);

        QTRY_COMPARE(spy.count(), 1);
        QCOMPARE(spy.first().at(0).toInt(), SIGUSR1);
    }

    void testSeveralSignals_deliveredInOrder()
    {
        SignalWatcher watcher;
        QVERIFY(watcher.watch(SIGUSR1));
        QVERIFY(watcher.watch(SIGUSR2));

        QSignalSpy spy(&watcher, &SignalWatcher::signalReceived);
        QCOMPARE(::raise(SIGUSR2), 0);
        QCOMPARE(::raise(SIGUSR1), 0);

        QTRY_COMPARE(spy.count(), 2);
        QCOMPARE(spy.at(0).at(0).toInt(), SIGUSR2);
        QCOMPARE(spy.at(1).at(0).toInt(), SIGUSR1);
    }
};

QTEST_MAIN(TestSignalWatcher)
#include "test_signal_watcher.moc"
