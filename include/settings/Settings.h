#pragma once

#include <QSettings>
#include "version.h"

namespace Tinct {

inline constexpr const char* kOrganizationName = "Tinct";
inline constexpr const char* kApplicationName = TINCT_APP_NAME;

inline QSettings getSettings()
{
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace Tinct
