// === Version Metadata ========================================================
//
// Exposes the service's semantic version string used in logs and health checks.

#pragma once

#include <string_view>

namespace geofence_service {

inline constexpr std::string_view k_version{"0.1.0"};

}  // namespace geofence_service
