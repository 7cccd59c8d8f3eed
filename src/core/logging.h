// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "launchdock_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for LaunchDock
 *
 * Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcScratch) << "Debug message";
 *   qCWarning(lcEntry) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="launchdock.*=true"                  # Enable all
 *   QT_LOGGING_RULES="launchdock.*.debug=false"           # Disable debug only
 *   QT_LOGGING_RULES="launchdock.core.scratch=true"       # Enable scratch files only
 *
 * Severity Guidelines:
 *   qCDebug    - Development tracing, disabled in release builds
 *   qCInfo     - Significant operational events (startup, entry docked/undocked)
 *   qCWarning  - Recoverable errors, rejected transitions, failed cleanup
 *   qCCritical - System failures preventing normal operation
 */

namespace LaunchDock {

// Core module - entries, classifier, docked set
LAUNCHDOCK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
LAUNCHDOCK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcScratch)
LAUNCHDOCK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcEntry)
LAUNCHDOCK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcPersistence)

// D-Bus module
LAUNCHDOCK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDbus)

// Daemon module
LAUNCHDOCK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDaemon)

// Configuration module - settings loading/saving
LAUNCHDOCK_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

} // namespace LaunchDock
