#pragma once

#include <QSettings>
#include "version.h"

namespace BoxLabel {

inline constexpr const char* kOrganizationName = "BoxLabel";
inline constexpr const char* kApplicationName = BOXLABEL_APP_NAME;

inline QSettings getSettings()
{
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace BoxLabel
