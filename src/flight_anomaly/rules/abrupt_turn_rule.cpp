#include "flight_anomaly/rule_evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "flight_anomaly/geodesy.hpp"
#include "flight_anomaly/physics_filter.hpp"
#include "rule_support.hpp"

namespace flight_anomaly {

namespace {
constexpr std::size_t k_min_points{4};
constexpr double k_seconds_per_hour{3600.0};

// Single-turn pass.
constexpr double k_default_speed_kts{300.0};
constexpr double k_teleport_factor{3.0};
constexpr double k_max_smoothed_rate_deg_s{5.0};

// Holding scan.
constexpr double k_holding_min_duration_s{45.0};
constexpr double k_holding_max_rate_deg_s{12.0};
constexpr double k_holding_min_speed_kts{80.0};
constexpr double k_holding_max_speed_kts{600.0};
constexpr double k_holding_min_alt_ft{1500.0};
constexpr double k_holding_max_accel_kts_s{10.0};
constexpr double k_holding_descent_airport_nm{5.0};
constexpr double k_holding_gap_s{10.0};
constexpr double k_holding_teleport_factor{2.5};
constexpr double k_holding_floor_speed_kts{300.0};
constexpr double k_track_check_min_speed_kts{50.0};
constexpr double k_track_check_min_dt_s{2.0};
constexpr double k_track_bearing_max_deg{90.0};
constexpr double k_opposite_blip_deg{10.0};
constexpr double k_full_orbit_min_duration_s{60.0};
constexpr double k_half_orbit_min_duration_s{70.0};
constexpr double k_max_average_speed_kts{650.0};
constexpr double k_max_orbit_displacement_nm{10.0};
constexpr double k_min_orbit_path_ratio{2.0};
constexpr double k_approach_radius_nm{5.0};
constexpr double k_approach_max_agl_ft{2000.0};

// Geometric fallback.
constexpr double k_fallback_min_duration_s{70.0};
constexpr double k_fallback_max_duration_s{240.0};
constexpr double k_fallback_min_path_ratio{1.35};
constexpr double k_fallback_min_orbit_deg{320.0};
constexpr double k_fallback_double_orbit_deg{640.0};
constexpr double k_fallback_end_heading_deg{90.0};
constexpr double k_fallback_max_turn_rate_deg_s{6.0};
constexpr double k_fallback_path_buffer{1.5};
constexpr double k_fallback_true_orbit_min_displacement_nm{3.0};

// Glitch detector.
constexpr double k_glitch_max_rate_deg_s{8.0};
constexpr double k_glitch_reversal_deg{20.0};
constexpr double k_glitch_bearing_mismatch_deg{120.0};
constexpr double k_glitch_min_move_nm{0.1};
constexpr double k_glitch_ratio{0.05};
constexpr double k_reversal_ratio{0.08};
constexpr double k_combined_reversal_ratio{0.05};

std::optional<double> smooth_heading(const std::vector<TrackPoint>& points, std::size_t index) {
    if (index == 0 || index + 1 == points.size()) {
        return points[index].track;
    }
    const auto& previous = points[index - 1].track;
    const auto& current = points[index].track;
    const auto& next = points[index + 1].track;
    if (!previous || !current || !next) {
        return current;
    }
    return (*previous + *current + *next) / 3.0;
}

double seconds_between(const TrackPoint& from, const TrackPoint& to) {
    return static_cast<double>(to.timestamp - from.timestamp);
}

double path_length_nm(const std::vector<TrackPoint>& points, std::size_t first, std::size_t last) {
    double total = 0.0;
    for (std::size_t index = first; index < last; ++index) {
        total += geodesy::haversine_nm(points[index].lat, points[index].lon, points[index + 1].lat, points[index + 1].lon);
    }
    return total;
}

bool is_near_airport(const RuleContext& context, const TrackPoint& point, double radius_nm) {
    return context.airports().nearest(point).distance_nm < radius_nm;
}

bool is_on_known_procedure(const RuleContext& context, const TrackPoint& point) {
    const auto& learned = context.parameters().learned_behavior;
    return context.library().is_in_turn_zone(point.lat, point.lon, learned.turn_zone_tolerance_nm)
        || context.library().is_on_procedure(point.lat, point.lon, learned.sid_star_tolerance_nm);
}

/** @brief Any sample of the orbit low and close to an airport, as on an approach. */
bool is_approach_pattern(const RuleContext& context, std::size_t first, std::size_t last) {
    const auto& points = context.points();
    for (std::size_t index = first; index <= last; ++index) {
        const NearestAirport nearest = context.airports().nearest(points[index]);
        if (nearest.airport == nullptr) {
            continue;
        }
        const double agl = points[index].alt - rules::elevation_ft(nearest.airport);
        if (nearest.distance_nm < k_approach_radius_nm && agl < k_approach_max_agl_ft) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Detects jamming or spoofing artifacts inside a candidate orbit.
 *
 * Counts impossible speeds, teleports, impossible turn rates and track/bearing
 * mismatches as glitches, and sign flips of large heading changes as reversals.
 */
bool has_gps_glitches(const std::vector<TrackPoint>& points, std::size_t first, std::size_t last) {
    if (last <= first) {
        return false;
    }
    int glitch_count = 0;
    int reversal_count = 0;
    double previous_change = 0.0;

    for (std::size_t index = first; index < last; ++index) {
        const TrackPoint& a = points[index];
        const TrackPoint& b = points[index + 1];
        const double dt = seconds_between(a, b);
        if (dt <= 0.0) {
            continue;
        }
        if (rules::speed_or(b, 0.0) > k_holding_max_speed_kts || rules::speed_or(a, 0.0) > k_holding_max_speed_kts) {
            ++glitch_count;
            continue;
        }
        const double distance_nm = geodesy::haversine_nm(a.lat, a.lon, b.lat, b.lon);
        const double reachable_nm = std::max({rules::speed_or(b, 0.0), rules::speed_or(a, 0.0), k_holding_floor_speed_kts}) * dt / k_seconds_per_hour;
        if (distance_nm > reachable_nm * k_holding_teleport_factor) {
            ++glitch_count;
            continue;
        }
        if (a.track && b.track) {
            const double change = geodesy::signed_heading_delta(*b.track, *a.track);
            if (std::abs(change) / dt > k_glitch_max_rate_deg_s) {
                ++glitch_count;
            }
            if (previous_change != 0.0) {
                if ((previous_change > k_glitch_reversal_deg && change < -k_glitch_reversal_deg)
                    || (previous_change < -k_glitch_reversal_deg && change > k_glitch_reversal_deg)) {
                    ++reversal_count;
                }
            }
            previous_change = change;
        }
        if (b.track && distance_nm > k_glitch_min_move_nm) {
            const double bearing = geodesy::initial_bearing_deg(a.lat, a.lon, b.lat, b.lon);
            if (std::abs(geodesy::signed_heading_delta(*b.track, bearing)) > k_glitch_bearing_mismatch_deg) {
                ++glitch_count;
            }
        }
    }

    const double segments = static_cast<double>(last - first);
    const double glitch_ratio = glitch_count / segments;
    const double reversal_ratio = reversal_count / segments;
    if (glitch_ratio > k_glitch_ratio || reversal_ratio > k_reversal_ratio) {
        return true;
    }
    return glitch_count > 0 && reversal_ratio > k_combined_reversal_ratio;
}

struct OrbitCheck final {
    bool complete{false};
    double cumulative_deg{0.0};
};

/** @brief Signed heading accumulation of at least one full turn ending near the start heading. */
OrbitCheck check_orbit(const std::vector<TrackPoint>& points, std::size_t first, std::size_t last) {
    double signed_total = 0.0;
    for (std::size_t index = first; index < last; ++index) {
        if (points[index].track && points[index + 1].track) {
            signed_total += geodesy::signed_heading_delta(*points[index + 1].track, *points[index].track);
        }
    }
    OrbitCheck check{false, std::abs(signed_total)};
    if (check.cumulative_deg < k_fallback_min_orbit_deg) {
        return check;
    }
    const auto& start_heading = points[first].track;
    const auto& end_heading = points[last].track;
    if (!start_heading || !end_heading) {
        return check;
    }
    if (std::abs(geodesy::signed_heading_delta(*end_heading, *start_heading)) <= k_fallback_end_heading_deg
        || check.cumulative_deg >= k_fallback_double_orbit_deg) {
        check.complete = true;
    }
    return check;
}

void detect_single_turns(const RuleContext& context, TurnDetails& details) {
    const auto& points = context.points();
    const auto& parameters = context.parameters().abrupt_turn;
    const auto& limits = context.parameters().physics;

    for (std::size_t index = 1; index < points.size(); ++index) {
        const TrackPoint& previous = points[index - 1];
        const TrackPoint& current = points[index];

        if (is_impossible_point(points, index, limits) || is_bad_segment(previous, current, context.airports())) {
            continue;
        }
        if (!previous.track || !current.track) {
            continue;
        }
        const double dt = seconds_between(previous, current);
        if (dt <= 0.0 || dt > parameters.window_seconds) {
            continue;
        }
        const double distance_nm = geodesy::haversine_nm(previous.lat, previous.lon, current.lat, current.lon);
        const double reachable_nm = rules::speed_or(current, k_default_speed_kts) * dt / k_seconds_per_hour;
        if (distance_nm > reachable_nm * k_teleport_factor) {
            continue;
        }

        const std::optional<double> previous_heading = smooth_heading(points, index - 1);
        const std::optional<double> current_heading = smooth_heading(points, index);
        if (!previous_heading || !current_heading) {
            continue;
        }
        const double diff = geodesy::heading_diff(*current_heading, *previous_heading);
        if (diff / dt > k_max_smoothed_rate_deg_s) {
            continue;
        }
        if (rules::speed_or(current, 0.0) < parameters.min_speed_kts || diff < parameters.heading_change_deg) {
            continue;
        }
        if (context.library().is_in_turn_zone(current.lat, current.lon, 0.0)
            || is_near_airport(context, current, parameters.airport_suppression_nm)) {
            continue;
        }
        details.turns.push_back(AbruptTurnEvent{
            current.timestamp,
            geodesy::round_to(diff, 2),
            dt,
            geodesy::round_to(*previous_heading, 2),
            geodesy::round_to(*current_heading, 2),
        });
    }
}

bool is_suspect_anchor(const std::vector<TrackPoint>& points, std::size_t start_index, int accumulation_window_s) {
    if (start_index == 0) {
        return false;
    }
    const TrackPoint& start = points[start_index];
    const TrackPoint& previous = points[start_index - 1];
    const double dt = seconds_between(previous, start);
    if (dt <= 0.0 || dt >= accumulation_window_s || !previous.track) {
        return false;
    }
    const double rate = std::abs(geodesy::signed_heading_delta(*start.track, *previous.track)) / dt;
    const double accel = std::abs(rules::speed_or(start, 0.0) - rules::speed_or(previous, 0.0)) / dt;
    return rate > k_holding_max_rate_deg_s || accel > k_holding_max_accel_kts_s;
}

/** @brief Accumulates one-directional heading change from @p start_index until an orbit is confirmed. */
void scan_holding_from(const RuleContext& context, std::size_t start_index, TurnDetails& details) {
    const auto& points = context.points();
    const auto& parameters = context.parameters().abrupt_turn;
    const auto& limits = context.parameters().physics;
    const TrackPoint& start = points[start_index];

    double cumulative = 0.0;
    int direction = 0;
    std::size_t previous_index = start_index;

    for (std::size_t end_index = start_index + 1; end_index < points.size(); ++end_index) {
        const TrackPoint& p0 = points[previous_index];
        const TrackPoint& p1 = points[end_index];

        if (is_impossible_point(points, end_index, limits)) {
            continue;
        }
        if (seconds_between(start, p1) > parameters.accumulation_window_seconds) {
            break;
        }
        if (!p1.track) {
            continue;
        }
        const double speed = rules::speed_or(p1, 0.0);
        if (speed < k_holding_min_speed_kts || p1.alt < k_holding_min_alt_ft || speed > k_holding_max_speed_kts) {
            continue;
        }
        const double dt = seconds_between(p0, p1);
        if (dt <= 0.0) {
            continue;
        }
        if (is_near_airport(context, p1, k_holding_descent_airport_nm) && p1.alt < p0.alt) {
            continue;
        }
        if (dt >= k_holding_gap_s) {
            previous_index = end_index;
            continue;
        }
        if (std::abs(speed - rules::speed_or(p0, 0.0)) / dt > k_holding_max_accel_kts_s) {
            previous_index = end_index;
            continue;
        }
        const double distance_nm = geodesy::haversine_nm(p0.lat, p0.lon, p1.lat, p1.lon);
        const double reachable_nm = std::max({speed, rules::speed_or(p0, 0.0), k_holding_floor_speed_kts}) * dt / k_seconds_per_hour;
        if (distance_nm > reachable_nm * k_holding_teleport_factor) {
            previous_index = end_index;
            continue;
        }

        // p0 always carries a track: it is either the anchor or an accepted sample.
        const double change = geodesy::signed_heading_delta(*p1.track, p0.track.value_or(*p1.track));
        if (std::abs(change) / dt > k_holding_max_rate_deg_s) {
            continue;
        }
        if (speed > k_track_check_min_speed_kts && dt > k_track_check_min_dt_s) {
            const double bearing = geodesy::initial_bearing_deg(p0.lat, p0.lon, p1.lat, p1.lon);
            if (std::abs(geodesy::signed_heading_delta(*p1.track, bearing)) > k_track_bearing_max_deg) {
                continue;
            }
        }

        previous_index = end_index;
        if (change == 0.0) {
            continue;
        }
        const int sign = change > 0.0 ? 1 : -1;
        if (direction == 0) {
            direction = sign;
        } else if (sign != direction) {
            if (std::abs(change) <= k_opposite_blip_deg) {
                continue;
            }
            break;
        }

        cumulative += std::abs(change);
        const double duration = seconds_between(start, p1);
        if (duration < k_holding_min_duration_s) {
            continue;
        }

        if (cumulative >= parameters.holding_full_turn_deg && duration >= k_full_orbit_min_duration_s) {
            const double displacement_nm = geodesy::haversine_nm(start.lat, start.lon, p1.lat, p1.lon);
            const double path_nm = path_length_nm(points, start_index, end_index);
            if (path_nm / duration * k_seconds_per_hour > k_max_average_speed_kts) {
                continue;
            }
            if (displacement_nm > k_max_orbit_displacement_nm) {
                continue;
            }
            if (displacement_nm > 0.0 && path_nm / displacement_nm < k_min_orbit_path_ratio) {
                continue;
            }
            if (!is_near_airport(context, p1, parameters.airport_suppression_nm) && !is_approach_pattern(context, start_index, end_index)) {
                HoldingPatternEvent event{};
                event.pattern = "360_turn";
                event.timestamp = p1.timestamp;
                event.start_ts = start.timestamp;
                event.end_ts = p1.timestamp;
                event.duration_s = duration;
                event.cumulative_turn_deg = geodesy::round_to(cumulative, 2);
                event.displacement_nm = geodesy::round_to(displacement_nm, 2);
                event.path_length_nm = geodesy::round_to(path_nm, 2);
                details.holding_patterns.push_back(std::move(event));
            }
            return;
        }

        if (cumulative >= parameters.holding_half_turn_deg && duration >= k_half_orbit_min_duration_s) {
            const bool suppressed = context.library().is_in_learned_corridor(p1.lat, p1.lon)
                || is_near_airport(context, p1, parameters.airport_suppression_nm)
                || is_on_known_procedure(context, p1);
            // A suppressed half orbit keeps accumulating towards a full one.
            if (!suppressed) {
                HoldingPatternEvent event{};
                event.pattern = "180_turn";
                event.timestamp = p1.timestamp;
                event.start_ts = start.timestamp;
                event.end_ts = p1.timestamp;
                event.duration_s = duration;
                event.cumulative_turn_deg = geodesy::round_to(cumulative, 2);
                details.holding_patterns.push_back(std::move(event));
                return;
            }
        }
    }
}

void detect_holding_patterns(const RuleContext& context, TurnDetails& details) {
    const auto& points = context.points();
    const int window = context.parameters().abrupt_turn.accumulation_window_seconds;

    for (std::size_t start_index = 0; start_index < points.size(); ++start_index) {
        const TrackPoint& start = points[start_index];
        if (!start.track || rules::speed_or(start, 0.0) < k_holding_min_speed_kts || start.alt < k_holding_min_alt_ft) {
            continue;
        }
        if (is_suspect_anchor(points, start_index, window)) {
            continue;
        }
        scan_holding_from(context, start_index, details);
    }
}

bool is_fallback_candidate(const TrackPoint& point) {
    return rules::speed_or(point, 0.0) >= k_holding_min_speed_kts && point.alt >= k_holding_min_alt_ft;
}

/** @brief Path-versus-displacement loop detector for sparse tracks; reports the first loop only. */
void detect_geometric_loop(const RuleContext& context, TurnDetails& details) {
    const auto& points = context.points();
    const double suppression_nm = context.parameters().abrupt_turn.airport_suppression_nm;

    for (std::size_t i = 0; i < points.size(); ++i) {
        const TrackPoint& start = points[i];
        if (!is_fallback_candidate(start)) {
            continue;
        }
        for (std::size_t j = i + 2; j < points.size(); ++j) {
            const TrackPoint& end = points[j];
            const double duration = seconds_between(start, end);
            if (duration < k_fallback_min_duration_s) {
                continue;
            }
            if (duration > k_fallback_max_duration_s) {
                break;
            }
            if (!is_fallback_candidate(end) || has_gps_glitches(points, i, j)) {
                continue;
            }

            const double displacement_nm = geodesy::haversine_nm(start.lat, start.lon, end.lat, end.lon);
            if (displacement_nm <= 0.0) {
                continue;
            }
            const double path_nm = path_length_nm(points, i, j);
            const double ratio = path_nm / displacement_nm;
            if (ratio < k_fallback_min_path_ratio) {
                continue;
            }
            const OrbitCheck orbit = check_orbit(points, i, j);
            if (path_nm / duration * k_seconds_per_hour > k_max_average_speed_kts || displacement_nm > k_max_orbit_displacement_nm) {
                continue;
            }
            if (!orbit.complete || orbit.cumulative_deg / duration > k_fallback_max_turn_rate_deg_s) {
                continue;
            }
            if (path_nm > k_holding_floor_speed_kts * duration / k_seconds_per_hour * k_fallback_path_buffer) {
                continue;
            }
            if (is_near_airport(context, end, suppression_nm) || is_near_airport(context, start, suppression_nm)) {
                continue;
            }
            const bool is_true_orbit = ratio >= k_min_orbit_path_ratio && displacement_nm >= k_fallback_true_orbit_min_displacement_nm;
            if (!is_true_orbit
                && (context.library().is_in_learned_corridor(end.lat, end.lon) || is_on_known_procedure(context, end))) {
                continue;
            }

            HoldingPatternEvent event{};
            event.pattern = "360_turn_fallback";
            event.timestamp = end.timestamp;
            event.start_ts = start.timestamp;
            event.end_ts = end.timestamp;
            event.duration_s = duration;
            event.cumulative_turn_deg = geodesy::round_to(orbit.cumulative_deg, 2);
            event.displacement_nm = geodesy::round_to(displacement_nm, 2);
            event.path_length_nm = geodesy::round_to(path_nm, 2);
            event.path_ratio = geodesy::round_to(ratio, 2);
            details.holding_patterns.push_back(std::move(event));
            return;
        }
    }
}

}  // namespace

RuleResult AbruptTurnRule::evaluate(const RuleContext& context) const {
    if (context.points().size() < k_min_points) {
        return RuleResult::evaluated(id(), false, "Not enough datapoints");
    }

    TurnDetails details{};
    detect_single_turns(context, details);
    detect_holding_patterns(context, details);
    if (details.turns.empty() && details.holding_patterns.empty()) {
        detect_geometric_loop(context, details);
    }

    const bool matched = !details.turns.empty() || !details.holding_patterns.empty();
    return RuleResult::evaluated(
        id(),
        matched,
        matched ? "Abrupt heading change or holding pattern observed" : "Heading profile nominal",
        std::move(details)
    );
}

}  // namespace flight_anomaly
