// === Physics Plausibility Filter =============================================
//
// Advisory checks that reject samples no aircraft could have produced. Rules
// skip flagged samples instead of raising, so a corrupted point never hides a
// genuine anomaly elsewhere in the track.

#pragma once

#include <cstddef>
#include <vector>

#include "flight_anomaly/airport_catalog.hpp"
#include "flight_anomaly/rule_parameters.hpp"
#include "flight_anomaly/types.hpp"

namespace flight_anomaly {

/**
 * @brief Flags an interior sample whose neighbours are unreachable.
 *
 * A point is impossible when the distance to either neighbour exceeds
 * max(gspeed, neighbour gspeed, floor) * dt * buffer, when the turn rate to
 * either neighbour exceeds the ceiling (both tracks known), or when the
 * vertical rate to either neighbour exceeds the ceiling. The first and last
 * samples are never flagged.
 *
 * @param points Samples sorted by timestamp.
 * @param index Position of the sample under test.
 */
[[nodiscard]] bool is_impossible_point(const std::vector<TrackPoint>& points, std::size_t index, const PhysicsLimits& limits = {});

/**
 * @brief Segment-level rejection used by the turn and off-course rules.
 *
 * Rejects non-increasing time, jumps beyond three times the reachable distance,
 * heading jumps above 80 degrees, cruise samples far from every airport (ocean
 * relay gaps) and sub-200 ft samples at jet speed.
 */
[[nodiscard]] bool is_bad_segment(const TrackPoint& previous, const TrackPoint& current, const AirportCatalog& airports);

}  // namespace flight_anomaly
