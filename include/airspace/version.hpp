// === Version Metadata ========================================================
//
// Exposes the admission engine's semantic version string used in logs.

#pragma once

#include <string_view>

namespace airspace {

inline constexpr std::string_view k_version{"0.1.0"};

}  // namespace airspace
