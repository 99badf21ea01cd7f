// === Trajectory Utilities ====================================================
//
// Shape helpers used by the path library: distance-uniform resampling of a
// track and the compact heading signature that groups similar off-path
// trajectories.

#pragma once

#include <vector>

#include "flight_anomaly/types.hpp"

namespace flight_anomaly {

struct ResampledPoint final {
    double lat{};
    double lon{};
    double alt{};
};

/**
 * @brief Interpolate a track to @p num_samples points spaced evenly by distance.
 *
 * Samples sharing a timestamp keep only the first occurrence. Returns an empty
 * vector when fewer than two distinct timestamps remain or the track never
 * moves.
 */
[[nodiscard]] std::vector<ResampledPoint> resample_track_points(const std::vector<TrackPoint>& points, int num_samples);

/**
 * @brief Mean heading per @p bin_seconds window quantised into @p bin_size_deg bins.
 *
 * Samples with an unknown track use the bearing from the previous sample.
 */
[[nodiscard]] std::vector<int> compress_heading_signature(
    const std::vector<TrackPoint>& points,
    int bin_seconds,
    int bin_size_deg
);

}  // namespace flight_anomaly
