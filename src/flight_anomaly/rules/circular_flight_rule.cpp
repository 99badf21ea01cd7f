#include "flight_anomaly/rule_evaluator.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <fmt/format.h>

#include "flight_anomaly/geodesy.hpp"
#include "rule_support.hpp"

namespace flight_anomaly {

namespace {
constexpr double k_ground_margin_ft{10.0};
constexpr double k_no_airport_ground_ft{1000.0};

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });
    return text;
}

bool is_commercial(const std::string& category, const std::vector<std::string>& commercial_categories) {
    const std::string lowered = to_lower(category);
    return std::any_of(commercial_categories.begin(), commercial_categories.end(), [&lowered](const std::string& commercial) {
        return lowered.find(to_lower(commercial)) != std::string::npos;
    });
}

}  // namespace

RuleResult CircularFlightRule::evaluate(const RuleContext& context) const {
    const auto& points = context.points();
    if (points.empty()) {
        return RuleResult::evaluated(id(), false, "No track data");
    }
    const auto& parameters = context.parameters().circular_flight;

    std::optional<std::string> category;
    if (context.metadata() != nullptr && context.metadata()->category.has_value() && !context.metadata()->category->empty()) {
        category = context.metadata()->category;
    }
    if (category.has_value() && is_commercial(*category, parameters.commercial_categories)) {
        return RuleResult::evaluated(id(), false, fmt::format("Aircraft is commercial category: {}", *category));
    }

    const TrackPoint& first = points.front();
    const TrackPoint& last = points.back();
    const NearestAirport departure = context.airports().nearest(first);
    const double ground_ceiling_ft = departure.airport != nullptr
        ? rules::elevation_ft(departure.airport) + k_ground_margin_ft
        : k_no_airport_ground_ft;
    if (first.alt > ground_ceiling_ft) {
        return RuleResult::evaluated(
            id(),
            false,
            fmt::format("First point at {:.0f} ft - not a ground departure", first.alt)
        );
    }

    const auto duration_s = last.timestamp - first.timestamp;
    if (duration_s < parameters.min_duration_seconds) {
        return RuleResult::evaluated(
            id(),
            false,
            fmt::format("Flight duration too short: {}s (need {}s)", duration_s, parameters.min_duration_seconds)
        );
    }

    const double closure_nm = geodesy::haversine_nm(first.lat, first.lon, last.lat, last.lon);
    if (closure_nm > parameters.max_circle_closure_nm) {
        return RuleResult::evaluated(
            id(),
            false,
            fmt::format("Not a circular flight: closure distance {:.2f} NM (need < {} NM)", closure_nm, parameters.max_circle_closure_nm)
        );
    }

    const auto points_above = std::count_if(points.begin(), points.end(), [&parameters](const TrackPoint& point) {
        return point.alt > parameters.min_altitude_ft;
    });
    if (points_above == 0) {
        return RuleResult::evaluated(id(), false, "No valid high-altitude points to analyze");
    }

    CircularFlightDetails details{};
    details.category = category;
    if (departure.airport != nullptr) {
        details.departure_airport = departure.airport->code;
    }
    details.duration_s = static_cast<double>(duration_s);
    details.closure_distance_nm = geodesy::round_to(closure_nm, 2);
    details.points_above_min_altitude = static_cast<int>(points_above);

    // Route deviation only applies once corridors have been learned.
    const PathLibrary& library = context.library();
    if (!library.paths().empty()) {
        const auto off_route = std::count_if(points.begin(), points.end(), [&library](const TrackPoint& point) {
            return !library.is_in_learned_corridor(point.lat, point.lon);
        });
        const double ratio = static_cast<double>(off_route) / static_cast<double>(points.size());
        details.off_route_ratio = geodesy::round_to(ratio, 3);
        if (ratio < parameters.min_off_route_ratio) {
            return RuleResult::evaluated(
                id(),
                false,
                fmt::format("Flight stayed on known routes for {:.0f}% of samples", (1.0 - ratio) * 100.0),
                std::move(details)
            );
        }
    }

    std::string summary = fmt::format(
        "Circular flight detected: {} category, {}min duration, {:.1f} NM closure",
        category.value_or("unknown"),
        duration_s / 60,
        closure_nm
    );
    return RuleResult::evaluated(id(), true, std::move(summary), std::move(details));
}

}  // namespace flight_anomaly
