#include "flight_anomaly/rule_evaluator.hpp"

#include <algorithm>
#include <cstddef>
#include <vector>

#include <fmt/format.h>

#include "flight_anomaly/geodesy.hpp"
#include "flight_anomaly/physics_filter.hpp"
#include "rule_support.hpp"

namespace flight_anomaly {

namespace {
constexpr std::size_t k_min_points{4};
constexpr double k_ground_tolerance_ft{10.0};
}  // namespace

RuleResult ReturnToFieldRule::evaluate(const RuleContext& context) const {
    const auto& points = context.points();
    const auto& parameters = context.parameters().return_to_field;
    if (points.size() < k_min_points) {
        return RuleResult::evaluated(id(), false, "Insufficient points");
    }

    const NearestAirport origin = context.airports().nearest(points.front());
    if (origin.airport == nullptr || origin.distance_nm > parameters.near_airport_nm) {
        return RuleResult::evaluated(id(), false, "Origin airport unknown");
    }
    const Airport& airport = *origin.airport;
    const double elevation = rules::elevation_ft(&airport);

    // Tracks entering coverage at altitude never departed from this field.
    const double first_alt = points.front().alt;
    if (first_alt > elevation + k_ground_tolerance_ft) {
        return RuleResult::evaluated(
            id(),
            false,
            fmt::format("First point at {:.0f} ft - not a ground departure", first_alt)
        );
    }

    const auto takeoff = std::find_if(points.begin(), points.end(), [&](const TrackPoint& point) {
        return point.alt >= elevation + parameters.takeoff_alt_ft;
    });
    if (takeoff == points.end()) {
        return RuleResult::evaluated(id(), false, "Flight never departed");
    }

    double max_outbound_nm = 0.0;
    for (auto iter = takeoff; iter != points.end(); ++iter) {
        max_outbound_nm = std::max(max_outbound_nm, geodesy::haversine_nm(iter->lat, iter->lon, airport.lat, airport.lon));
    }
    if (max_outbound_nm < parameters.min_outbound_nm) {
        return RuleResult::evaluated(id(), false, "No meaningful outbound leg");
    }

    const TrackPoint& first_point = points.front();
    for (std::size_t index = 0; index < points.size(); ++index) {
        const TrackPoint& point = points[index];
        if (is_impossible_point(points, index, context.parameters().physics) || point.timestamp <= takeoff->timestamp) {
            continue;
        }
        const double distance_home = geodesy::haversine_nm(point.lat, point.lon, airport.lat, airport.lon);
        if (point.alt >= elevation + parameters.landing_alt_ft || distance_home > parameters.near_airport_nm) {
            continue;
        }
        const auto elapsed = point.timestamp - takeoff->timestamp;
        if (elapsed > parameters.time_limit_seconds || elapsed < parameters.min_elapsed_seconds) {
            continue;
        }
        const double start_to_end_nm = geodesy::haversine_nm(first_point.lat, first_point.lon, point.lat, point.lon);
        if (start_to_end_nm >= parameters.max_start_to_end_nm) {
            continue;
        }

        ReturnToFieldDetails details{};
        details.airport = airport.code;
        details.takeoff_ts = takeoff->timestamp;
        details.landing_ts = point.timestamp;
        details.elapsed_s = static_cast<double>(elapsed);
        details.max_outbound_nm = geodesy::round_to(max_outbound_nm, 2);
        details.start_to_end_distance_nm = geodesy::round_to(start_to_end_nm, 2);
        return RuleResult::evaluated(id(), true, "Return-to-field detected", details);
    }
    return RuleResult::evaluated(id(), false, "No immediate return detected");
}

}  // namespace flight_anomaly
