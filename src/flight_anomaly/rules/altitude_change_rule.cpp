#include "flight_anomaly/rule_evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

#include "flight_anomaly/geodesy.hpp"
#include "flight_anomaly/physics_filter.hpp"
#include "rule_support.hpp"

namespace flight_anomaly {

namespace {
constexpr double k_noise_altitude_ft{500.0};
constexpr double k_noise_similarity_ft{5000.0};
constexpr double k_noise_max_duration_s{300.0};
constexpr double k_noise_min_airport_nm{5.0};
constexpr double k_collapse_min_airport_nm{7.0};
constexpr double k_collapse_recovery_ft{3000.0};
constexpr double k_ground_altitude_ft{200.0};
constexpr double k_ground_max_speed_kts{200.0};
constexpr double k_ground_min_airport_nm{3.0};

double min_distance(const std::vector<double>& distances, std::size_t first, std::size_t last) {
    return *std::min_element(distances.begin() + static_cast<std::ptrdiff_t>(first), distances.begin() + static_cast<std::ptrdiff_t>(last) + 1);
}

/** @brief Low-altitude run bracketed by similar cruise altitudes, short and away from airports. */
bool is_noise_sequence(
    const std::vector<TrackPoint>& points,
    const std::vector<double>& distances,
    std::size_t start,
    std::size_t end,
    double min_cruise_ft
) {
    if (start == 0 || start >= end || end + 1 >= points.size()) {
        return false;
    }
    const bool has_low_point = std::any_of(points.begin() + static_cast<std::ptrdiff_t>(start), points.begin() + static_cast<std::ptrdiff_t>(end) + 1, [](const TrackPoint& point) {
        return point.alt < k_noise_altitude_ft;
    });
    if (!has_low_point) {
        return false;
    }

    const double previous_alt = points[start - 1].alt;
    const double next_alt = points[end + 1].alt;
    if (previous_alt < min_cruise_ft || next_alt < min_cruise_ft) {
        return false;
    }
    if (std::abs(next_alt - previous_alt) >= k_noise_similarity_ft) {
        return false;
    }
    const double duration = static_cast<double>(points[end].timestamp - points[start].timestamp);
    return duration < k_noise_max_duration_s && min_distance(distances, start, end) > k_noise_min_airport_nm;
}

}  // namespace

RuleResult AltitudeChangeRule::evaluate(const RuleContext& context) const {
    const auto& points = context.points();
    const auto& parameters = context.parameters().altitude_change;
    const auto& limits = context.parameters().physics;

    std::vector<double> distances;
    distances.reserve(points.size());
    for (const auto& point : points) {
        distances.push_back(context.airports().nearest(point).distance_nm);
    }

    AltitudeChangeDetails details{};
    std::size_t index = 0;
    while (index + 1 < points.size()) {
        const TrackPoint& previous = points[index];
        const TrackPoint& current = points[index + 1];

        if (is_impossible_point(points, index + 1, limits)) {
            ++index;
            continue;
        }

        const auto dt = current.timestamp - previous.timestamp;
        if (dt <= 0 || dt > parameters.window_seconds) {
            ++index;
            continue;
        }
        if (previous.alt < parameters.min_cruise_ft) {
            ++index;
            continue;
        }

        // Look ahead: cruise dropping into a run of near-zero samples.
        if (current.alt < k_noise_altitude_ft) {
            const std::size_t noise_start = index + 1;
            std::size_t noise_end = noise_start;
            while (noise_end + 1 < points.size() && points[noise_end + 1].alt < k_noise_altitude_ft) {
                ++noise_end;
            }
            const bool recovers = noise_end + 1 < points.size() && points[noise_end + 1].alt >= parameters.min_cruise_ft;
            if ((noise_end > noise_start || recovers)
                && is_noise_sequence(points, distances, noise_start, noise_end, parameters.min_cruise_ft)) {
                index = noise_end + 1;
                if (index + 1 < points.size() && std::abs(points[noise_end + 1].alt - previous.alt) < k_noise_similarity_ft) {
                    ++index;
                }
                continue;
            }
        }

        // Look back: a near-zero run recovering to cruise.
        if (previous.alt < k_noise_altitude_ft && current.alt >= parameters.min_cruise_ft) {
            const std::size_t noise_end = index;
            std::size_t noise_start = index;
            while (noise_start > 0 && points[noise_start - 1].alt < k_noise_altitude_ft) {
                --noise_start;
            }
            if (noise_start > 0) {
                const double before_alt = points[noise_start - 1].alt;
                if (before_alt >= parameters.min_cruise_ft && std::abs(current.alt - before_alt) < k_noise_similarity_ft) {
                    if (noise_start < noise_end) {
                        const double duration = static_cast<double>(points[noise_end].timestamp - points[noise_start].timestamp);
                        if (duration < k_noise_max_duration_s && min_distance(distances, noise_start, noise_end) > k_noise_min_airport_nm) {
                            ++index;
                            continue;
                        }
                    } else if (distances[index] > k_noise_min_airport_nm) {
                        ++index;
                        continue;
                    }
                }
            }
        }

        if (current.alt <= 0.0 && previous.alt > k_noise_altitude_ft) {
            ++index;
            continue;
        }

        // Collapse to 0 ft far from airports that recovers on the next sample.
        if (current.alt == 0.0 && distances[index + 1] > k_collapse_min_airport_nm && index + 2 < points.size()) {
            if (std::abs(points[index + 2].alt - previous.alt) < k_collapse_recovery_ft) {
                ++index;
                continue;
            }
        }

        if (current.alt < k_ground_altitude_ft && rules::speed_or(current, 0.0) > k_ground_max_speed_kts
            && distances[index + 1] > k_ground_min_airport_nm) {
            ++index;
            continue;
        }

        const double delta = current.alt - previous.alt;
        if (std::abs(delta) >= parameters.delta_ft) {
            details.events.push_back(AltitudeEvent{
                current.timestamp,
                geodesy::round_to(delta, 2),
                geodesy::round_to(delta / static_cast<double>(dt), 2),
            });
        }
        ++index;
    }

    const bool matched = !details.events.empty();
    return RuleResult::evaluated(
        id(),
        matched,
        matched ? "Detected rapid altitude changes" : "Altitude profile nominal",
        std::move(details)
    );
}

}  // namespace flight_anomaly
