// === Rule Support ============================================================
//
// Small helpers shared by the evaluators in this directory.

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "flight_anomaly/types.hpp"

namespace flight_anomaly::rules {

/** @brief Ground speed in knots, or @p fallback when unknown. */
[[nodiscard]] double speed_or(const TrackPoint& point, double fallback) noexcept;

/** @brief Field elevation in feet; airports without one sit at sea level. */
[[nodiscard]] double elevation_ft(const Airport* airport) noexcept;

[[nodiscard]] std::string trim(std::string_view text);
[[nodiscard]] std::string to_upper(std::string_view text);

/** @brief Trimmed upper-case code, or nothing for empty and "UNK" values. */
[[nodiscard]] std::optional<std::string> normalize_code(const std::optional<std::string>& code);

/** @brief Callsign of the first sample that carries one, else the metadata callsign. */
[[nodiscard]] std::optional<std::string> first_callsign(const std::vector<TrackPoint>& points, const FlightMetadata* metadata);

}  // namespace flight_anomaly::rules
