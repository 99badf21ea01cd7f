#include "flight_anomaly/rule_evaluator.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "flight_anomaly/geodesy.hpp"
#include "flight_anomaly/physics_filter.hpp"
#include "rule_support.hpp"

namespace flight_anomaly {

namespace {
constexpr double k_climb_out_fpm{300.0};
constexpr double k_ground_alt_ft{50.0};
constexpr double k_just_departed_s{60.0};
constexpr double k_departure_area_nm{25.0};
constexpr double k_ground_glitch_alt_ft{200.0};
constexpr double k_ground_glitch_airport_nm{15.0};
constexpr double k_fast_low_alt_ft{800.0};
constexpr double k_fast_low_speed_kts{200.0};
constexpr double k_remote_airport_nm{10.0};
constexpr double k_max_descent_ft_s{100.0};
constexpr double k_approach_radius_nm{40.0};
constexpr double k_approach_heading_deg{45.0};
constexpr double k_approach_min_speed_kts{90.0};
constexpr double k_approach_max_speed_kts{200.0};

/** @brief Descending towards the nearest airport at approach speed. */
bool is_approach(const std::vector<TrackPoint>& points, std::size_t index, const NearestAirport& nearest, double speed, double vspeed) {
    const TrackPoint& point = points[index];
    if (nearest.airport == nullptr || nearest.distance_nm <= 0.0 || nearest.distance_nm > k_approach_radius_nm || vspeed >= 0.0) {
        return false;
    }
    if (!point.track.has_value()) {
        return false;
    }
    const double bearing = geodesy::initial_bearing_deg(point.lat, point.lon, nearest.airport->lat, nearest.airport->lon);
    if (geodesy::heading_diff(bearing, *point.track) > k_approach_heading_deg) {
        return false;
    }

    bool descent_confirmed = false;
    if (index >= 1) {
        const TrackPoint& previous = points[index - 1];
        if (previous.alt > point.alt) {
            descent_confirmed = true;
        }
        const double previous_distance = geodesy::haversine_nm(previous.lat, previous.lon, nearest.airport->lat, nearest.airport->lon);
        if (nearest.distance_nm < previous_distance) {
            descent_confirmed = true;
        }
    }
    return descent_confirmed && speed >= k_approach_min_speed_kts && speed <= k_approach_max_speed_kts;
}

}  // namespace

RuleResult LowAltitudeRule::evaluate(const RuleContext& context) const {
    const auto& points = context.points();
    const auto& parameters = context.parameters().low_altitude;

    LowAltitudeDetails details{};
    std::optional<double> last_alt;
    Timestamp last_ts{0};

    for (std::size_t index = 0; index < points.size(); ++index) {
        const TrackPoint& point = points[index];
        const double alt = point.alt;
        const double speed = rules::speed_or(point, 0.0);
        const double vspeed = point.vspeed.value_or(0.0);
        const NearestAirport nearest = context.airports().nearest(point);
        const double distance = nearest.distance_nm;

        const bool skip = [&]() {
            if (is_impossible_point(points, index, context.parameters().physics)) {
                return true;
            }
            if (vspeed > k_climb_out_fpm) {
                return true;
            }
            if (last_alt.has_value() && *last_alt < k_ground_alt_ft && static_cast<double>(point.timestamp - last_ts) < k_just_departed_s) {
                return true;
            }
            if (nearest.airport != nullptr && distance < k_departure_area_nm && vspeed > 0.0) {
                return true;
            }
            if (alt < k_ground_glitch_alt_ft && distance > k_ground_glitch_airport_nm) {
                return true;
            }
            if (alt < k_fast_low_alt_ft && speed > k_fast_low_speed_kts && distance > k_remote_airport_nm) {
                return true;
            }
            if (last_alt.has_value()) {
                const auto dt = point.timestamp - last_ts;
                const double rate = dt > 0 ? (*last_alt - alt) / static_cast<double>(dt) : 0.0;
                if (rate > k_max_descent_ft_s && distance > k_remote_airport_nm) {
                    return true;
                }
            }
            return false;
        }();

        if (!skip && alt < parameters.threshold_ft) {
            const bool flicker = index + 1 < points.size() && points[index + 1].alt >= parameters.threshold_ft;
            const bool protected_zone = nearest.airport != nullptr && distance <= parameters.airport_radius_nm;
            if (!flicker && !protected_zone && !is_approach(points, index, nearest, speed, vspeed)) {
                details.events.push_back(LowAltitudeEvent{
                    point.timestamp,
                    geodesy::round_to(alt, 1),
                    speed,
                    nearest.airport != nullptr ? geodesy::round_to(distance, 1) : -1.0,
                    point.vspeed,
                });
            }
        }

        last_alt = alt;
        last_ts = point.timestamp;
    }

    const bool matched = !details.events.empty();
    return RuleResult::evaluated(
        id(),
        matched,
        matched ? "Low altitude detected outside protected zones" : "Altitude remained above minima",
        std::move(details)
    );
}

}  // namespace flight_anomaly
