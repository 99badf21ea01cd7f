#include "flight_anomaly/rule_evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "flight_anomaly/errors.hpp"
#include "flight_anomaly/geodesy.hpp"
#include "flight_anomaly/logging.hpp"
#include "flight_anomaly/physics_filter.hpp"

namespace flight_anomaly {

namespace {
constexpr double k_min_own_altitude_ft{100.0};
constexpr double k_ground_clutter_nm{0.5};
constexpr double k_ground_clutter_alt_diff_ft{200.0};
constexpr double k_ground_clutter_alt_ft{1000.0};

/** @brief Drops the samples of each traffic flight that fail its own physics check. */
std::vector<TrackPoint> plausible_traffic(std::vector<TrackPoint> samples, const PhysicsLimits& limits) {
    std::map<std::string, std::vector<TrackPoint>> map_by_flight;
    for (auto& sample : samples) {
        map_by_flight[sample.flight_id].push_back(std::move(sample));
    }

    std::vector<TrackPoint> plausible;
    for (auto& [flight_id, flight_points] : map_by_flight) {
        std::stable_sort(flight_points.begin(), flight_points.end(), [](const TrackPoint& lhs, const TrackPoint& rhs) {
            return lhs.timestamp < rhs.timestamp;
        });
        for (std::size_t index = 0; index < flight_points.size(); ++index) {
            if (!is_impossible_point(flight_points, index, limits)) {
                plausible.push_back(flight_points[index]);
            }
        }
    }
    return plausible;
}

}  // namespace

ProximityRule::ProximityRule()
    : logger_(get_logger()) {}

RuleResult ProximityRule::evaluate(const RuleContext& context) const {
    const auto& points = context.points();
    if (points.empty()) {
        return RuleResult::evaluated(id(), false, "No track data");
    }
    if (context.repository() == nullptr) {
        return RuleResult::skipped(id(), "Skipped: No flight database available");
    }

    const auto& parameters = context.parameters().proximity;
    const std::string& own_flight = context.track().flight_id();
    const Timestamp window_start = points.front().timestamp - parameters.time_window_seconds;
    const Timestamp window_end = points.back().timestamp + parameters.time_window_seconds;

    std::vector<TrackPoint> others;
    try {
        for (auto& other : context.repository()->fetch_points_between(window_start, window_end)) {
            if (other.flight_id != own_flight) {
                others.push_back(std::move(other));
            }
        }
    } catch (const RepositoryError& exc) {
        logger_->warn("Proximity lookup failed for flight {}: {}", own_flight, exc.what());
        return RuleResult::skipped(id(), "Skipped: Repository error", NoteDetails{exc.what()});
    }

    others = plausible_traffic(std::move(others), context.parameters().physics);

    // Candidate order must not depend on repository iteration order.
    std::sort(others.begin(), others.end(), [](const TrackPoint& lhs, const TrackPoint& rhs) {
        if (lhs.timestamp != rhs.timestamp) {
            return lhs.timestamp < rhs.timestamp;
        }
        return lhs.flight_id < rhs.flight_id;
    });

    ProximityDetails details{};
    for (std::size_t index = 0; index < points.size(); ++index) {
        const TrackPoint& point = points[index];
        if (is_impossible_point(points, index, context.parameters().physics) || point.alt < k_min_own_altitude_ft) {
            continue;
        }
        if (parameters.airport_exclusion_nm > 0.0
            && context.airports().nearest(point).distance_nm <= parameters.airport_exclusion_nm) {
            continue;
        }

        const auto first = std::lower_bound(others.begin(), others.end(), point.timestamp - parameters.time_sync_seconds, [](const TrackPoint& other, Timestamp value) {
            return other.timestamp < value;
        });
        for (auto iter = first; iter != others.end() && iter->timestamp <= point.timestamp + parameters.time_sync_seconds; ++iter) {
            const TrackPoint& other = *iter;
            if (point.alt < parameters.min_altitude_ft || other.alt < parameters.min_altitude_ft) {
                continue;
            }
            const double distance_nm = geodesy::haversine_nm(point.lat, point.lon, other.lat, other.lon);
            const double altitude_diff = std::abs(point.alt - other.alt);
            if (distance_nm < k_ground_clutter_nm && altitude_diff < k_ground_clutter_alt_diff_ft && point.alt < k_ground_clutter_alt_ft) {
                continue;
            }
            if (distance_nm <= parameters.distance_nm && altitude_diff <= parameters.altitude_ft) {
                details.events.push_back(ProximityEvent{
                    point.timestamp,
                    other.flight_id,
                    other.callsign,
                    geodesy::round_to(distance_nm, 2),
                    geodesy::round_to(altitude_diff, 1),
                });
                break;
            }
        }
    }

    const bool matched = !details.events.empty();
    return RuleResult::evaluated(
        id(),
        matched,
        matched ? "Proximity alert triggered" : "No proximity conflicts",
        std::move(details)
    );
}

}  // namespace flight_anomaly
