#include "flight_anomaly/rule_evaluator.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "flight_anomaly/geodesy.hpp"
#include "flight_anomaly/logging.hpp"
#include "flight_anomaly/physics_filter.hpp"
#include "rule_support.hpp"

namespace flight_anomaly {

namespace {
constexpr std::size_t k_max_samples{50};
constexpr std::size_t k_min_tube_vertices{3};

/** @brief Membership of one sample against the selected geometry. */
struct Membership final {
    const std::string* geometry_id{nullptr};
    double distance_nm{0.0};
    double clearance_nm{std::numeric_limits<double>::infinity()};  /**< Lateral distance outside the nearest corridor edge. */
};

Membership match_tubes(const TrackPoint& point, const std::vector<const TubeRecord*>& tubes, const PathLearningParameters& parameters) {
    const GeoPoint position{point.lat, point.lon};
    Membership membership{};
    for (const TubeRecord* tube : tubes) {
        if (tube->geometry.size() < k_min_tube_vertices) {
            continue;
        }
        const bool inside = geodesy::is_point_in_polygon(position, tube->geometry);
        const double boundary_nm = inside ? 0.0 : geodesy::distance_to_polygon_boundary_nm(position, tube->geometry);
        membership.clearance_nm = std::min(membership.clearance_nm, boundary_nm);

        const bool in_band = point.alt >= tube->min_alt_ft - parameters.tube_altitude_tolerance_ft
            && point.alt <= tube->max_alt_ft + parameters.tube_altitude_tolerance_ft;
        if (membership.geometry_id == nullptr && in_band && boundary_nm <= parameters.tube_lateral_tolerance_nm) {
            membership.geometry_id = &tube->id;
            membership.distance_nm = boundary_nm;
        }
    }
    return membership;
}

Membership match_paths(const TrackPoint& point, const std::vector<const PathRecord*>& paths) {
    const GeoPoint position{point.lat, point.lon};
    Membership membership{};
    double best_distance = std::numeric_limits<double>::infinity();
    for (const PathRecord* path : paths) {
        if (path->centerline.size() < 2) {
            continue;
        }
        const double distance_nm = geodesy::point_to_polyline_distance_nm(position, path->centerline).distance_nm;
        membership.clearance_nm = std::min(membership.clearance_nm, distance_nm - path->width_nm);
        if (distance_nm <= path->width_nm && distance_nm < best_distance) {
            best_distance = distance_nm;
            membership.geometry_id = &path->id;
            membership.distance_nm = distance_nm;
        }
    }
    return membership;
}

std::string describe_route(const std::optional<std::string>& origin, const std::optional<std::string>& destination) {
    return fmt::format("{} -> {}", origin.value_or("any"), destination.value_or("any"));
}

}  // namespace

OffCourseRule::OffCourseRule()
    : logger_(get_logger()) {}

RuleResult OffCourseRule::evaluate(const RuleContext& context) const {
    const auto& points = context.points();
    if (points.empty()) {
        return RuleResult::evaluated(id(), false, "No track data");
    }
    const auto& parameters = context.parameters().path_learning;

    std::optional<std::string> origin;
    std::optional<std::string> destination;
    if (context.metadata() != nullptr) {
        origin = rules::normalize_code(context.metadata()->origin);
        destination = rules::normalize_code(context.metadata()->planned_destination);
    }
    if (origin && destination && *origin == *destination) {
        return RuleResult::evaluated(
            id(),
            false,
            fmt::format("Origin and destination are the same ({}) - cannot check deviation", *origin)
        );
    }

    const PathLibrary& library = context.library();
    const GeometrySelection<TubeRecord> tubes = library.select_tubes(origin, destination);
    const bool using_tubes = !tubes.records.empty();
    GeometrySelection<PathRecord> paths{};
    if (!using_tubes) {
        paths = library.select_paths(origin, destination);
    }
    if (!using_tubes && paths.records.empty()) {
        return RuleResult::evaluated(
            id(),
            false,
            fmt::format("No learned geometry for route {} - cannot check deviation", describe_route(origin, destination))
        );
    }

    OffCourseDetails details{};
    details.threshold_points = parameters.min_off_course_points;
    details.geometry = using_tubes ? "tubes" : "paths";
    details.geometry_checked = static_cast<int>(using_tubes ? tubes.records.size() : paths.records.size());
    details.used_od_filter = using_tubes ? tubes.used_od_filter : paths.used_od_filter;

    std::vector<TrackPoint> far_points;
    for (std::size_t index = 0; index < points.size(); ++index) {
        const TrackPoint& point = points[index];
        if (is_impossible_point(points, index, context.parameters().physics)) {
            continue;
        }
        if (index > 0 && is_bad_segment(points[index - 1], point, context.airports())) {
            continue;
        }
        if (point.alt <= parameters.min_altitude_ft) {
            continue;
        }

        const Membership membership = using_tubes ? match_tubes(point, tubes.records, parameters) : match_paths(point, paths.records);
        if (membership.geometry_id != nullptr) {
            ++details.on_path_points;
            ++details.assignments[*membership.geometry_id];
            if (details.on_path_samples.size() < k_max_samples) {
                details.on_path_samples.push_back(OnPathSample{point.timestamp, *membership.geometry_id, geodesy::round_to(membership.distance_nm, 2)});
            }
            continue;
        }

        const bool wrong_region = !library.is_flightable(point.lat, point.lon);
        ++details.off_path_points;
        if (wrong_region) {
            ++details.wrong_region_points;
        }
        if (details.off_path_samples.size() < k_max_samples) {
            OffPathSample sample{point.timestamp, point.lat, point.lon, point.alt, std::nullopt, wrong_region};
            if (membership.clearance_nm != std::numeric_limits<double>::infinity()) {
                sample.distance_nm = geodesy::round_to(std::max(membership.clearance_nm, 0.0), 2);
            }
            details.off_path_samples.push_back(std::move(sample));
        }
        if (membership.clearance_nm >= parameters.emerging_distance_nm) {
            far_points.push_back(point);
        }
    }

    if (!far_points.empty() && context.promoter() != nullptr) {
        try {
            const auto update = context.promoter()->record_off_path_flight(context.track().flight_id(), points, far_points);
            if (update.has_value()) {
                details.emerging_bucket_count = update->bucket_count;
                details.emerging_promoted = update->promoted_path_id;
            }
        } catch (const std::runtime_error& exc) {
            logger_->error("Emerging path update failed for flight {}: {}", context.track().flight_id(), exc.what());
        }
    }

    const bool matched = details.off_path_points >= parameters.min_off_course_points || details.wrong_region_points > 0;
    std::string summary = matched ? "Flight deviated from known paths" : "Flight stayed within known corridors";
    if (details.wrong_region_points > 0) {
        summary = "Entered low-activity region";
    }
    return RuleResult::evaluated(id(), matched, std::move(summary), std::move(details));
}

}  // namespace flight_anomaly
