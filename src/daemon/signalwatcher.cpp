// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "signalwatcher.h"
#include "../core/logging.h"
#include <QSocketNotifier>
#include <cerrno>
#include <cstring>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace LaunchDock {

namespace {
int s_signalFds[2] = {-1, -1};

void writeSignal(int signal)
{
    // Only async-signal-safe calls here
    const unsigned char byte = static_cast<unsigned char>(signal);
    const int savedErrno = errno;
    [[maybe_unused]] const ssize_t written = ::write(s_signalFds[0], &byte, sizeof(byte));
    errno = savedErrno;
}
} // namespace

SignalWatcher::SignalWatcher(QObject* parent)
    : QObject(parent)
{
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, s_signalFds) != 0) {
        qCCritical(lcDaemon) << "Cannot create signal socket pair:" << std::strerror(errno);
        s_signalFds[0] = s_signalFds[1] = -1;
        return;
    }

    m_notifier = new QSocketNotifier(s_signalFds[1], QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &SignalWatcher::readSignal);
}

SignalWatcher::~SignalWatcher()
{
    for (int signal : std::as_const(m_watched)) {
        ::signal(signal, SIG_DFL);
    }

    delete m_notifier;
    m_notifier = nullptr;

    for (int& fd : s_signalFds) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

bool SignalWatcher::watch(int signal)
{
    if (!m_notifier) {
        qCWarning(lcDaemon) << "Signal socket unavailable, not watching signal" << signal;
        return false;
    }

    struct sigaction action = {};
    action.sa_handler = writeSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    if (::sigaction(signal, &action, nullptr) != 0) {
        qCWarning(lcDaemon) << "Cannot install handler for signal" << signal << ":" << std::strerror(errno);
        return false;
    }

    m_watched.append(signal);
    return true;
}

void SignalWatcher::readSignal()
{
    unsigned char byte = 0;
    const ssize_t count = ::read(s_signalFds[1], &byte, sizeof(byte));
    if (count != ssize_t(sizeof(byte))) {
        qCWarning(lcDaemon) << "Short read on signal socket";
        return;
    }

    qCInfo(lcDaemon) << "Received signal" << int(byte);
    Q_EMIT signalReceived(int(byte));
}

} // namespace LaunchDock
