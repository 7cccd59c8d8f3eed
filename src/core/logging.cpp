// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace LaunchDock {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "launchdock.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcScratch, "launchdock.core.scratch", QtInfoMsg)
Q_LOGGING_CATEGORY(lcEntry, "launchdock.core.entry", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPersistence, "launchdock.core.persistence", QtInfoMsg)

// D-Bus module categories
Q_LOGGING_CATEGORY(lcDbus, "launchdock.dbus", QtInfoMsg)

// Daemon module categories
Q_LOGGING_CATEGORY(lcDaemon, "launchdock.daemon", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "launchdock.config", QtInfoMsg)

} // namespace LaunchDock
