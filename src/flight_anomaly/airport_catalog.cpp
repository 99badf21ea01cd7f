#include "flight_anomaly/airport_catalog.hpp"

#include <algorithm>

#include "flight_anomaly/geodesy.hpp"

namespace flight_anomaly {

AirportCatalog::AirportCatalog(std::vector<Airport> airports, std::map<std::string, std::vector<double>> runway_headings)
    : list_airports_(std::move(airports)),
      map_runway_headings_(std::move(runway_headings)) {}

const std::vector<Airport>& AirportCatalog::airports() const noexcept {
    return list_airports_;
}

bool AirportCatalog::empty() const noexcept {
    return list_airports_.empty();
}

NearestAirport AirportCatalog::nearest(double lat, double lon) const {
    NearestAirport best{};
    for (const Airport& airport : list_airports_) {
        const double distance = geodesy::haversine_nm(lat, lon, airport.lat, airport.lon);
        if (distance < best.distance_nm) {
            best.distance_nm = distance;
            best.airport = &airport;
        }
    }
    return best;
}

NearestAirport AirportCatalog::nearest(const TrackPoint& point) const {
    return nearest(point.lat, point.lon);
}

double AirportCatalog::nearest_distance_nm(const TrackPoint& point, double fallback_nm) const {
    const NearestAirport result = nearest(point);
    return result.airport == nullptr ? fallback_nm : result.distance_nm;
}

const Airport* AirportCatalog::find(const std::string& code) const {
    const auto iter = std::find_if(list_airports_.begin(), list_airports_.end(), [&code](const Airport& airport) {
        return airport.code == code;
    });
    return iter == list_airports_.end() ? nullptr : &*iter;
}

bool AirportCatalog::is_runway_aligned(const std::string& code, const std::optional<double>& heading_deg, double tolerance_deg) const {
    const auto iter = map_runway_headings_.find(code);
    if (iter == map_runway_headings_.end()) {
        return true;
    }
    if (!heading_deg.has_value()) {
        return false;
    }
    const double heading = *heading_deg;
    return std::any_of(iter->second.begin(), iter->second.end(), [heading, tolerance_deg](double runway_heading) {
        return geodesy::heading_diff(heading, runway_heading) <= tolerance_deg;
    });
}

}  // namespace flight_anomaly
