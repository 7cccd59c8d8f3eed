// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "launchdock_export.h"
#include "interfaces.h"

namespace LaunchDock {

/**
 * @brief Identifies windows by looking up "<appId>.desktop" launchers
 *
 * Searches the XDG applications directories for a launcher named after the
 * window's application id (as is, then lowercased). A window without a
 * matching launcher keeps its own "w:" identity.
 */
class LAUNCHDOCK_EXPORT DesktopWindowIdentifier : public IWindowIdentifier
{
public:
    DesktopWindowIdentifier() = default;
    ~DesktopWindowIdentifier() override = default;

    WindowIdentity identifyWindow(const WindowInfo& window) override;
};

} // namespace LaunchDock
