#include "flight_anomaly/rule_evaluator.hpp"

#include <cstddef>
#include <optional>
#include <utility>

#include "flight_anomaly/physics_filter.hpp"
#include "rule_support.hpp"

namespace flight_anomaly {

namespace {
constexpr double k_elevation_radius_nm{10.0};
constexpr double k_min_airborne_agl_ft{300.0};

double height_above_ground(const RuleContext& context, const TrackPoint& point) {
    const NearestAirport nearest = context.airports().nearest(point);
    const double elevation = nearest.distance_nm < k_elevation_radius_nm ? rules::elevation_ft(nearest.airport) : 0.0;
    return point.alt - elevation;
}

}  // namespace

RuleResult SignalLossRule::evaluate(const RuleContext& context) const {
    const auto& points = context.points();
    const auto& parameters = context.parameters().signal_loss;
    if (points.size() < 2) {
        return RuleResult::evaluated(id(), false, "Insufficient points");
    }

    // Gaps run between consecutive plausible samples, so a glitch inside a
    // coverage hole cannot split it.
    SignalLossDetails details{};
    std::optional<std::size_t> previous_index;
    for (std::size_t index = 0; index < points.size(); ++index) {
        if (is_impossible_point(points, index, context.parameters().physics)) {
            continue;
        }
        if (!previous_index) {
            previous_index = index;
            continue;
        }
        const TrackPoint& previous = points[*previous_index];
        const TrackPoint& current = points[index];
        previous_index = index;
        // Gaps on the ground are normal taxi and parking coverage holes.
        if (height_above_ground(context, previous) < k_min_airborne_agl_ft || height_above_ground(context, current) < k_min_airborne_agl_ft) {
            continue;
        }
        const auto gap = current.timestamp - previous.timestamp;
        if (gap >= parameters.gap_seconds) {
            details.gaps.push_back(SignalGap{previous.timestamp, current.timestamp, static_cast<double>(gap)});
        }
    }

    const bool matched = static_cast<int>(details.gaps.size()) >= parameters.repeat_count;
    return RuleResult::evaluated(id(), matched, matched ? "Signal loss" : "Nominal", std::move(details));
}

}  // namespace flight_anomaly
