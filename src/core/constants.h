// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>
#include <QFileDevice>

namespace LaunchDock {

/**
 * @brief Default values and fixed names used by the core module
 *
 * User-configurable values are read by Settings; these are the fallbacks
 * and the structural constants the scratch file format depends on.
 */
namespace Defaults {
// Icon name used when a window provides no usable icon
inline constexpr QLatin1String FallbackIconName{"application-default-icon"};

// Scratch directory, relative to the generic config location
inline constexpr QLatin1String ScratchSubdirectory{"launchdock/scratch"};

// Config file holding settings and the docked set
inline constexpr QLatin1String ConfigFileName{"launchdockrc"};

// Positional file argument appended to the launch script in Exec=
inline constexpr QLatin1String ExecFileArgument{" %U"};

// rwxr-xr-x
constexpr QFileDevice::Permissions ScratchDirPermissions =
    QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner | QFileDevice::ReadGroup
    | QFileDevice::ExeGroup | QFileDevice::ReadOther | QFileDevice::ExeOther;
// rw-r--r--
constexpr QFileDevice::Permissions DescriptorPermissions =
    QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ReadGroup | QFileDevice::ReadOther;
// rwxr--r--
constexpr QFileDevice::Permissions ScriptPermissions = QFileDevice::ReadOwner | QFileDevice::WriteOwner
    | QFileDevice::ExeOwner | QFileDevice::ReadGroup | QFileDevice::ReadOther;
}

/**
 * @brief Prefixes of inner identities
 *
 * A window-derived identity starts with "w:", a descriptor-derived one with
 * "d:". Scratch file names are built from inner identities, so the prefix of
 * a scratch file tells how it was synthesized.
 */
namespace InnerId {
inline constexpr QLatin1String WindowPrefix{"w:"};
inline constexpr QLatin1String DesktopPrefix{"d:"};
}

/**
 * @brief Extensions of the files making up one scratch asset set
 */
namespace ScratchExt {
inline constexpr QLatin1String Desktop{".desktop"};
inline constexpr QLatin1String Script{".sh"};
inline constexpr QLatin1String Icon{".png"};
}

/**
 * @brief Prefix identifying an inline-encoded icon
 */
inline constexpr QLatin1String DataImagePrefix{"data:image"};

/**
 * @brief KConfig group and key names
 */
namespace ConfigKeys {
inline constexpr QLatin1String GeneralGroup{"General"};
inline constexpr QLatin1String ScratchDirectory{"ScratchDirectory"};
inline constexpr QLatin1String DockGroup{"Dock"};
inline constexpr QLatin1String DockedApps{"DockedApps"};
}

/**
 * @brief Short codes used to store launcher paths independently of their root
 */
namespace PathCode {
inline constexpr QLatin1String Scratch{"/D@"};
inline constexpr QLatin1String UserApplications{"/H@"};
inline constexpr QLatin1String SystemApplications{"/S@"};
inline constexpr QLatin1String LocalApplications{"/L@"};
}

/**
 * @brief Menu item identifiers of a dock entry
 */
namespace MenuItemId {
inline constexpr QLatin1String Open{"open"};
inline constexpr QLatin1String Dock{"dock"};
inline constexpr QLatin1String Undock{"undock"};
inline constexpr QLatin1String CloseAll{"close-all"};
inline constexpr QLatin1String ActionPrefix{"action:"};
}

namespace DBus {
inline constexpr QLatin1String ServiceName{"org.launchdock"};
inline constexpr QLatin1String ObjectPath{"/LaunchDock"};

namespace Interface {
inline constexpr QLatin1String Dock{"org.launchdock.Dock"};
}
}

} // namespace LaunchDock
