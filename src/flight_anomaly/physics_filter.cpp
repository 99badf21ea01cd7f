#include "flight_anomaly/physics_filter.hpp"

#include <algorithm>
#include <cmath>

#include "flight_anomaly/geodesy.hpp"

namespace flight_anomaly {

namespace {
constexpr double k_seconds_per_hour{3600.0};
constexpr double k_segment_default_speed_kts{350.0};
constexpr double k_segment_teleport_factor{3.0};
constexpr double k_segment_max_heading_jump_deg{80.0};
constexpr double k_segment_cruise_alt_ft{15000.0};
constexpr double k_segment_max_airport_distance_nm{60.0};
constexpr double k_segment_unknown_airport_distance_nm{999.0};
constexpr double k_segment_ground_alt_ft{200.0};
constexpr double k_segment_ground_max_speed_kts{200.0};

double speed_or_zero(const TrackPoint& point) {
    return point.gspeed.value_or(0.0);
}

bool exceeds_reachable_distance(const TrackPoint& from, const TrackPoint& to, const PhysicsLimits& limits) {
    const double dt = static_cast<double>(to.timestamp - from.timestamp);
    if (dt <= 0.0) {
        return false;
    }
    const double distance = geodesy::haversine_nm(from.lat, from.lon, to.lat, to.lon);
    const double speed = std::max({speed_or_zero(from), speed_or_zero(to), limits.min_assumed_speed_kts});
    return distance > (speed * dt / k_seconds_per_hour) * limits.speed_buffer;
}

bool exceeds_turn_rate(const TrackPoint& from, const TrackPoint& to, const PhysicsLimits& limits) {
    const double dt = static_cast<double>(to.timestamp - from.timestamp);
    if (!from.track || !to.track || dt <= 0.0) {
        return false;
    }
    const double change = std::abs(geodesy::signed_heading_delta(*to.track, *from.track));
    return change / dt > limits.max_turn_rate_deg_s;
}

bool exceeds_vertical_rate(const TrackPoint& from, const TrackPoint& to, const PhysicsLimits& limits) {
    const double dt = static_cast<double>(to.timestamp - from.timestamp);
    if (dt <= 0.0) {
        return false;
    }
    return std::abs(to.alt - from.alt) / dt > limits.max_vertical_speed_ft_s;
}

}  // namespace

bool is_impossible_point(const std::vector<TrackPoint>& points, std::size_t index, const PhysicsLimits& limits) {
    if (index == 0 || index + 1 >= points.size()) {
        return false;
    }
    const TrackPoint& previous = points[index - 1];
    const TrackPoint& current = points[index];
    const TrackPoint& next = points[index + 1];

    return exceeds_reachable_distance(previous, current, limits)
        || exceeds_reachable_distance(current, next, limits)
        || exceeds_turn_rate(previous, current, limits)
        || exceeds_turn_rate(current, next, limits)
        || exceeds_vertical_rate(previous, current, limits)
        || exceeds_vertical_rate(current, next, limits);
}

bool is_bad_segment(const TrackPoint& previous, const TrackPoint& current, const AirportCatalog& airports) {
    const Timestamp dt = current.timestamp - previous.timestamp;
    if (dt <= 0) {
        return true;
    }

    // A zero speed report is treated like a missing one.
    double speed = k_segment_default_speed_kts;
    if (current.gspeed && *current.gspeed != 0.0) {
        speed = *current.gspeed;
    } else if (previous.gspeed && *previous.gspeed != 0.0) {
        speed = *previous.gspeed;
    }
    const double reachable_nm = speed * static_cast<double>(dt) / k_seconds_per_hour;
    if (geodesy::haversine_nm(previous.lat, previous.lon, current.lat, current.lon) > reachable_nm * k_segment_teleport_factor) {
        return true;
    }

    if (previous.track && current.track) {
        if (std::abs(geodesy::signed_heading_delta(*current.track, *previous.track)) > k_segment_max_heading_jump_deg) {
            return true;
        }
    }

    if (current.alt > k_segment_cruise_alt_ft) {
        const double airport_distance = airports.nearest_distance_nm(current, k_segment_unknown_airport_distance_nm);
        if (airport_distance > k_segment_max_airport_distance_nm) {
            return true;
        }
    }

    return current.alt < k_segment_ground_alt_ft && speed_or_zero(current) > k_segment_ground_max_speed_kts;
}

}  // namespace flight_anomaly
