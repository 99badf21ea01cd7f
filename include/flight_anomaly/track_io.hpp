// === Track Documents =========================================================
//
// JSON input for the evaluator executable: a track document carrying the
// flight id and its samples, and an optional flight-plan metadata document.

#pragma once

#include <filesystem>

#include <nlohmann/json_fwd.hpp>

#include "flight_anomaly/types.hpp"

namespace flight_anomaly {

/**
 * @brief Parse `{flight_id, points: [...]}` into a track.
 *
 * Each sample needs timestamp, lat and lon. Missing or null optional fields
 * stay unknown; a missing altitude reads as 0 ft. Throws ConfigurationError on
 * a malformed document.
 */
[[nodiscard]] FlightTrack parse_track(const nlohmann::json& document);
[[nodiscard]] FlightTrack load_track(const std::filesystem::path& path);

/** @brief Parse a metadata object; unknown keys are ignored. */
[[nodiscard]] FlightMetadata parse_metadata(const nlohmann::json& document);
[[nodiscard]] FlightMetadata load_metadata(const std::filesystem::path& path);

}  // namespace flight_anomaly
