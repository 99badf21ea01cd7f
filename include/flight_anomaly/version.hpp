// === Version Metadata ========================================================
//
// Semantic version of the rule engine, stamped into every report.

#pragma once

#include <string_view>

namespace flight_anomaly {

inline constexpr std::string_view k_version{"1.4.0"};

}  // namespace flight_anomaly
