// === Version Metadata ========================================================
//
// Exposes the flight-safety core's semantic version string used in logs.

#pragma once

#include <string_view>

namespace flight_safety {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace flight_safety
