#pragma once

#include <QSettings>
#include "version.h"

namespace Waysnip {

inline constexpr const char* kOrganizationName = "Waysnip";
inline constexpr const char* kApplicationName = WAYSNIP_APP_NAME;

inline QSettings getSettings()
{
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace Waysnip
