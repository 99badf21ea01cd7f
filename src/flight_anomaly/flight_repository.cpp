#include "flight_anomaly/flight_repository.hpp"

#include <mutex>
#include <stdexcept>

namespace flight_anomaly {

void InMemoryFlightRepository::upsert_flight(FlightTrack track) {
    if (track.flight_id().empty()) {
        throw std::invalid_argument("Flight track requires an identifier");
    }
    std::unique_lock lock{mutex_};
    const std::string flight_id = track.flight_id();
    map_flights_.insert_or_assign(flight_id, std::move(track));
}

void InMemoryFlightRepository::add_point(const TrackPoint& point) {
    if (point.flight_id.empty()) {
        throw std::invalid_argument("Track point requires a flight identifier");
    }
    std::unique_lock lock{mutex_};
    auto iter = map_flights_.find(point.flight_id);
    if (iter == map_flights_.end()) {
        iter = map_flights_.emplace(point.flight_id, FlightTrack{point.flight_id}).first;
    }
    iter->second.add_point(point);
}

void InMemoryFlightRepository::remove_flight(const std::string& flight_id) {
    std::unique_lock lock{mutex_};
    map_flights_.erase(flight_id);
}

std::size_t InMemoryFlightRepository::flight_count() const {
    std::shared_lock lock{mutex_};
    return map_flights_.size();
}

std::vector<std::string> InMemoryFlightRepository::flight_ids() const {
    std::shared_lock lock{mutex_};
    std::vector<std::string> identifiers{};
    identifiers.reserve(map_flights_.size());
    for (const auto& [flight_id, track] : map_flights_) {
        identifiers.push_back(flight_id);
    }
    return identifiers;
}

std::vector<TrackPoint> InMemoryFlightRepository::fetch_points_between(Timestamp start_ts, Timestamp end_ts) const {
    std::shared_lock lock{mutex_};
    std::vector<TrackPoint> results{};
    for (const auto& [flight_id, track] : map_flights_) {
        for (const TrackPoint& point : track.points()) {
            if (point.timestamp >= start_ts && point.timestamp <= end_ts) {
                results.push_back(point);
            }
        }
    }
    return results;
}

std::optional<FlightTrack> InMemoryFlightRepository::fetch_flight(const std::string& flight_id) const {
    std::shared_lock lock{mutex_};
    const auto iter = map_flights_.find(flight_id);
    if (iter == map_flights_.end()) {
        return std::nullopt;
    }
    return iter->second;
}

}  // namespace flight_anomaly
