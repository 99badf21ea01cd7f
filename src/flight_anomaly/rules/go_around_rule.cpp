#include "flight_anomaly/rule_evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

#include "flight_anomaly/geodesy.hpp"
#include "flight_anomaly/physics_filter.hpp"

namespace flight_anomaly {

namespace {
constexpr std::size_t k_min_points_near_airport{3};
constexpr double k_max_vertical_rate_ft_s{200.0};
constexpr double k_low_altitude_buffer_ft{150.0};
constexpr double k_min_agl_ft{-200.0};
constexpr double k_min_descent_ft{300.0};

/** @brief Vertical rate to either time neighbour inside the airport segment is implausible. */
bool is_vertical_glitch(const std::vector<TrackPoint>& points, const std::vector<std::size_t>& segment, std::size_t position) {
    const TrackPoint& candidate = points[segment[position]];
    const auto exceeds = [&candidate](const TrackPoint& other) {
        const double dt = std::abs(static_cast<double>(candidate.timestamp - other.timestamp));
        return dt > 0.0 && std::abs(candidate.alt - other.alt) / dt > k_max_vertical_rate_ft_s;
    };
    if (position > 0 && exceeds(points[segment[position - 1]])) {
        return true;
    }
    return position + 1 < segment.size() && exceeds(points[segment[position + 1]]);
}

}  // namespace

RuleResult GoAroundRule::evaluate(const RuleContext& context) const {
    const auto& points = context.points();
    const auto& parameters = context.parameters().go_around;
    const auto& limits = context.parameters().physics;

    GoAroundDetails details{};
    for (const Airport& airport : context.airports().airports()) {
        std::vector<std::size_t> segment;
        for (std::size_t index = 0; index < points.size(); ++index) {
            if (geodesy::haversine_nm(points[index].lat, points[index].lon, airport.lat, airport.lon) <= parameters.radius_nm) {
                segment.push_back(index);
            }
        }
        if (segment.size() < k_min_points_near_airport) {
            continue;
        }

        std::vector<std::size_t> by_altitude(segment.size());
        for (std::size_t position = 0; position < segment.size(); ++position) {
            by_altitude[position] = position;
        }
        std::stable_sort(by_altitude.begin(), by_altitude.end(), [&](std::size_t lhs, std::size_t rhs) {
            return points[segment[lhs]].alt < points[segment[rhs]].alt;
        });

        const double elevation = airport.elevation_ft.value_or(0.0);
        for (const std::size_t position : by_altitude) {
            const TrackPoint& candidate = points[segment[position]];
            if (is_impossible_point(points, segment[position], limits) || is_vertical_glitch(points, segment, position)) {
                continue;
            }

            const double agl = candidate.alt - elevation;
            if (agl < k_min_agl_ft || agl > parameters.min_low_alt_ft + k_low_altitude_buffer_ft) {
                continue;
            }
            if (!context.airports().is_runway_aligned(airport.code, candidate.track)) {
                continue;
            }

            double max_before = -1.0;
            double max_after = -1.0;
            bool has_before = false;
            bool has_after = false;
            for (const std::size_t index : segment) {
                const TrackPoint& point = points[index];
                if (point.timestamp < candidate.timestamp) {
                    max_before = has_before ? std::max(max_before, point.alt) : point.alt;
                    has_before = true;
                } else if (point.timestamp > candidate.timestamp) {
                    max_after = has_after ? std::max(max_after, point.alt) : point.alt;
                    has_after = true;
                }
            }
            if (!has_before || !has_after) {
                continue;
            }
            const double descent = max_before - candidate.alt;
            const double climb = max_after - candidate.alt;
            if (descent < k_min_descent_ft || climb < parameters.recovery_ft) {
                continue;
            }

            details.events.push_back(GoAroundEvent{
                airport.code,
                candidate.timestamp,
                geodesy::round_to(candidate.alt, 1),
                geodesy::round_to(climb, 1),
                geodesy::round_to(descent, 1),
                true,
            });
            break;
        }
    }

    const bool matched = !details.events.empty();
    return RuleResult::evaluated(id(), matched, matched ? "Go-around detected" : "No go-around patterns", std::move(details));
}

}  // namespace flight_anomaly
