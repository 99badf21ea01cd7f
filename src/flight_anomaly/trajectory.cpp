#include "flight_anomaly/trajectory.hpp"

#include <algorithm>
#include <cmath>

#include "flight_anomaly/geodesy.hpp"

namespace flight_anomaly {

namespace {

std::vector<TrackPoint> sorted_by_time(const std::vector<TrackPoint>& points) {
    std::vector<TrackPoint> ordered = points;
    std::stable_sort(ordered.begin(), ordered.end(), [](const TrackPoint& lhs, const TrackPoint& rhs) {
        return lhs.timestamp < rhs.timestamp;
    });
    return ordered;
}

int quantise_heading(const std::vector<double>& headings, int bin_size_deg) {
    double sum = 0.0;
    for (const double heading : headings) {
        sum += heading;
    }
    const double mean = sum / static_cast<double>(headings.size());
    return static_cast<int>(std::floor(mean / static_cast<double>(bin_size_deg)));
}

}  // namespace

std::vector<ResampledPoint> resample_track_points(const std::vector<TrackPoint>& points, int num_samples) {
    if (points.size() < 2 || num_samples < 2) {
        return {};
    }

    const std::vector<TrackPoint> ordered = sorted_by_time(points);
    std::vector<const TrackPoint*> unique_points{};
    unique_points.reserve(ordered.size());
    for (const TrackPoint& point : ordered) {
        if (unique_points.empty() || unique_points.back()->timestamp != point.timestamp) {
            unique_points.push_back(&point);
        }
    }
    if (unique_points.size() < 2) {
        return {};
    }

    std::vector<double> cumulative(unique_points.size(), 0.0);
    for (std::size_t index = 1; index < unique_points.size(); ++index) {
        const TrackPoint& previous = *unique_points[index - 1];
        const TrackPoint& current = *unique_points[index];
        cumulative[index] = cumulative[index - 1] + geodesy::haversine_nm(previous.lat, previous.lon, current.lat, current.lon);
    }
    const double total = cumulative.back();
    if (total == 0.0) {
        return {};
    }

    std::vector<ResampledPoint> resampled{};
    resampled.reserve(static_cast<std::size_t>(num_samples));
    std::size_t segment = 0;
    for (int sample = 0; sample < num_samples; ++sample) {
        const double target = total * static_cast<double>(sample) / static_cast<double>(num_samples - 1);
        while (segment + 2 < cumulative.size() && cumulative[segment + 1] < target) {
            ++segment;
        }
        const TrackPoint& start = *unique_points[segment];
        const TrackPoint& end = *unique_points[segment + 1];
        const double span = cumulative[segment + 1] - cumulative[segment];
        const double t = span > 0.0 ? std::clamp((target - cumulative[segment]) / span, 0.0, 1.0) : 1.0;
        resampled.push_back(ResampledPoint{
            start.lat + t * (end.lat - start.lat),
            start.lon + t * (end.lon - start.lon),
            start.alt + t * (end.alt - start.alt),
        });
    }
    return resampled;
}

std::vector<int> compress_heading_signature(const std::vector<TrackPoint>& points, int bin_seconds, int bin_size_deg) {
    if (points.empty()) {
        return {};
    }

    const std::vector<TrackPoint> ordered = sorted_by_time(points);
    Timestamp next_bucket_ts = ordered.front().timestamp + bin_seconds;
    std::vector<double> bucket_headings{};
    std::vector<int> signature{};

    for (std::size_t index = 1; index < ordered.size(); ++index) {
        const TrackPoint& previous = ordered[index - 1];
        const TrackPoint& current = ordered[index];
        double heading = current.track
            ? *current.track
            : geodesy::initial_bearing_deg(previous.lat, previous.lon, current.lat, current.lon);
        heading = std::fmod(heading, 360.0);
        if (heading < 0.0) {
            heading += 360.0;
        }
        bucket_headings.push_back(heading);

        if (current.timestamp >= next_bucket_ts) {
            signature.push_back(quantise_heading(bucket_headings, bin_size_deg));
            bucket_headings.clear();
            next_bucket_ts += bin_seconds;
        }
    }

    if (!bucket_headings.empty()) {
        signature.push_back(quantise_heading(bucket_headings, bin_size_deg));
    }
    return signature;
}

}  // namespace flight_anomaly
