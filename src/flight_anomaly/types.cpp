#include "flight_anomaly/types.hpp"

#include <algorithm>

namespace flight_anomaly {

FlightTrack::FlightTrack(std::string flight_id, std::vector<TrackPoint> points)
    : str_flight_id_(std::move(flight_id)),
      list_points_(std::move(points)) {
    for (TrackPoint& point : list_points_) {
        if (point.flight_id.empty()) {
            point.flight_id = str_flight_id_;
        }
    }
}

const std::string& FlightTrack::flight_id() const noexcept {
    return str_flight_id_;
}

const std::vector<TrackPoint>& FlightTrack::points() const noexcept {
    return list_points_;
}

bool FlightTrack::empty() const noexcept {
    return list_points_.empty();
}

std::size_t FlightTrack::size() const noexcept {
    return list_points_.size();
}

void FlightTrack::add_point(TrackPoint point) {
    if (point.flight_id.empty()) {
        point.flight_id = str_flight_id_;
    }
    list_points_.push_back(std::move(point));
}

std::vector<TrackPoint> FlightTrack::sorted_points() const {
    std::vector<TrackPoint> sorted = list_points_;
    std::stable_sort(sorted.begin(), sorted.end(), [](const TrackPoint& lhs, const TrackPoint& rhs) {
        return lhs.timestamp < rhs.timestamp;
    });
    return sorted;
}

}  // namespace flight_anomaly
