#include "flight_anomaly/geodesy.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>

namespace flight_anomaly::geodesy {

namespace {

constexpr double k_nm_per_degree_lat{60.0};
constexpr int k_segment_samples{10};
constexpr double k_degenerate_segment_deg{1e-7};

constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

constexpr double radians_to_degrees(double radians) {
    return radians * 180.0 / std::numbers::pi;
}

double positive_fmod(double value, double modulus) {
    const double remainder = std::fmod(value, modulus);
    return remainder < 0.0 ? remainder + modulus : remainder;
}

double angular_distance_rad(double lat1, double lon1, double lat2, double lon2) {
    const double delta_lat = lat2 - lat1;
    const double delta_lon = lon2 - lon1;
    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    return 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
}

double bearing_rad(double lat1, double lon1, double lat2, double lon2) {
    const double y = std::sin(lon2 - lon1) * std::cos(lat2);
    const double x = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(lon2 - lon1);
    return std::atan2(y, x);
}

}  // namespace

double haversine_nm(double lat1, double lon1, double lat2, double lon2) {
    const double angle = angular_distance_rad(
        degrees_to_radians(lat1), degrees_to_radians(lon1), degrees_to_radians(lat2), degrees_to_radians(lon2)
    );
    return k_earth_radius_km * angle * k_nm_per_km;
}

double haversine_nm(const GeoPoint& from, const GeoPoint& to) {
    return haversine_nm(from.lat, from.lon, to.lat, to.lon);
}

double initial_bearing_deg(double lat1, double lon1, double lat2, double lon2) {
    const double bearing = bearing_rad(
        degrees_to_radians(lat1), degrees_to_radians(lon1), degrees_to_radians(lat2), degrees_to_radians(lon2)
    );
    return positive_fmod(radians_to_degrees(bearing) + 360.0, 360.0);
}

double cross_track_distance_nm(const GeoPoint& origin, const GeoPoint& destination, const GeoPoint& point) {
    const double lat1 = degrees_to_radians(origin.lat);
    const double lon1 = degrees_to_radians(origin.lon);
    const double lat2 = degrees_to_radians(destination.lat);
    const double lon2 = degrees_to_radians(destination.lon);
    const double lat3 = degrees_to_radians(point.lat);
    const double lon3 = degrees_to_radians(point.lon);

    const double dist13 = angular_distance_rad(lat1, lon1, lat3, lon3);
    if (dist13 == 0.0) {
        return 0.0;
    }
    const double bearing13 = bearing_rad(lat1, lon1, lat3, lon3);
    const double bearing12 = bearing_rad(lat1, lon1, lat2, lon2);
    const double sin_xt = std::clamp(std::sin(dist13) * std::sin(bearing13 - bearing12), -1.0, 1.0);
    return std::abs(std::asin(sin_xt) * k_earth_radius_km * k_nm_per_km);
}

GeoPoint destination_point(const GeoPoint& start, double bearing_deg, double distance_nm) {
    const double angular_distance = (distance_nm / k_nm_per_km) / k_earth_radius_km;
    const double lat1 = degrees_to_radians(start.lat);
    const double lon1 = degrees_to_radians(start.lon);
    const double bearing = degrees_to_radians(bearing_deg);

    const double lat2 = std::asin(
        std::sin(lat1) * std::cos(angular_distance) + std::cos(lat1) * std::sin(angular_distance) * std::cos(bearing)
    );
    const double lon2 = lon1
        + std::atan2(
            std::sin(bearing) * std::sin(angular_distance) * std::cos(lat1),
            std::cos(angular_distance) - std::sin(lat1) * std::sin(lat2)
        );
    return GeoPoint{radians_to_degrees(lat2), radians_to_degrees(lon2)};
}

Polygon create_corridor_polygon(const Polyline& path, double radius_nm) {
    if (path.size() < 2) {
        return {};
    }

    Polygon left_boundary{};
    Polygon right_boundary{};
    left_boundary.reserve(path.size());
    right_boundary.reserve(path.size());

    for (std::size_t index = 0; index < path.size(); ++index) {
        const GeoPoint& current = path[index];
        double bearing = 0.0;
        if (index + 1 < path.size()) {
            bearing = initial_bearing_deg(current.lat, current.lon, path[index + 1].lat, path[index + 1].lon);
        } else {
            bearing = initial_bearing_deg(path[index - 1].lat, path[index - 1].lon, current.lat, current.lon);
        }
        left_boundary.push_back(destination_point(current, bearing - 90.0, radius_nm));
        right_boundary.push_back(destination_point(current, bearing + 90.0, radius_nm));
    }

    Polygon polygon = left_boundary;
    polygon.insert(polygon.end(), right_boundary.rbegin(), right_boundary.rend());
    polygon.push_back(left_boundary.front());
    return polygon;
}

bool is_point_in_polygon(const GeoPoint& point, const Polygon& polygon) {
    if (polygon.empty()) {
        return false;
    }
    const double x = point.lat;
    const double y = point.lon;
    const std::size_t count = polygon.size();
    bool inside = false;

    double p1x = polygon.front().lat;
    double p1y = polygon.front().lon;
    for (std::size_t index = 0; index <= count; ++index) {
        const GeoPoint& vertex = polygon[index % count];
        const double p2x = vertex.lat;
        const double p2y = vertex.lon;
        if (y > std::min(p1y, p2y) && y <= std::max(p1y, p2y) && x <= std::max(p1x, p2x) && p1y != p2y) {
            const double x_intersection = (y - p1y) * (p2x - p1x) / (p2y - p1y) + p1x;
            if (p1x == p2x || x <= x_intersection) {
                inside = !inside;
            }
        }
        p1x = p2x;
        p1y = p2y;
    }
    return inside;
}

PolylineProjection point_to_polyline_distance_nm(const GeoPoint& point, const Polyline& polyline) {
    if (polyline.size() < 2) {
        throw std::invalid_argument("Polyline must contain at least two points");
    }

    const double cos_lat = std::cos(degrees_to_radians(polyline.front().lat));
    const auto project_y = [](const GeoPoint& coordinate) { return coordinate.lat * k_nm_per_degree_lat; };
    const auto project_x = [cos_lat](const GeoPoint& coordinate) { return coordinate.lon * k_nm_per_degree_lat * cos_lat; };

    const double query_y = project_y(point);
    const double query_x = project_x(point);

    double best_distance = std::numeric_limits<double>::infinity();
    std::size_t best_segment = 0;
    double best_t = 0.0;
    std::vector<double> segment_lengths{};
    segment_lengths.reserve(polyline.size() - 1);

    for (std::size_t index = 0; index + 1 < polyline.size(); ++index) {
        const double start_y = project_y(polyline[index]);
        const double start_x = project_x(polyline[index]);
        const double seg_y = project_y(polyline[index + 1]) - start_y;
        const double seg_x = project_x(polyline[index + 1]) - start_x;
        const double length_sq = seg_y * seg_y + seg_x * seg_x;
        segment_lengths.push_back(std::sqrt(length_sq));

        double t = 0.0;
        if (length_sq > 0.0) {
            t = ((query_y - start_y) * seg_y + (query_x - start_x) * seg_x) / length_sq;
            t = std::clamp(t, 0.0, 1.0);
        }
        const double closest_y = start_y + t * seg_y;
        const double closest_x = start_x + t * seg_x;
        const double distance = std::hypot(query_y - closest_y, query_x - closest_x);
        if (distance < best_distance) {
            best_distance = distance;
            best_segment = index;
            best_t = t;
        }
    }

    double total_length = 0.0;
    for (const double length : segment_lengths) {
        total_length += length;
    }
    if (total_length == 0.0) {
        total_length = 1.0;
    }
    double cumulative = best_t * segment_lengths[best_segment];
    for (std::size_t index = 0; index < best_segment; ++index) {
        cumulative += segment_lengths[index];
    }
    return PolylineProjection{best_distance, cumulative / total_length};
}

double distance_point_to_segment_nm(const GeoPoint& point, const GeoPoint& start, const GeoPoint& end) {
    if (std::abs(start.lat - end.lat) < k_degenerate_segment_deg && std::abs(start.lon - end.lon) < k_degenerate_segment_deg) {
        return haversine_nm(point, start);
    }

    double min_distance = std::min(haversine_nm(point, start), haversine_nm(point, end));
    for (int sample = 1; sample < k_segment_samples; ++sample) {
        const double t = static_cast<double>(sample) / k_segment_samples;
        const GeoPoint sampled{start.lat + t * (end.lat - start.lat), start.lon + t * (end.lon - start.lon)};
        min_distance = std::min(min_distance, haversine_nm(point, sampled));
    }
    return min_distance;
}

double distance_to_polygon_boundary_nm(const GeoPoint& point, const Polygon& polygon) {
    double min_distance = std::numeric_limits<double>::infinity();
    for (std::size_t index = 0; index < polygon.size(); ++index) {
        const GeoPoint& start = polygon[index];
        const GeoPoint& end = polygon[(index + 1) % polygon.size()];
        min_distance = std::min(min_distance, distance_point_to_segment_nm(point, start, end));
    }
    return min_distance;
}

double heading_diff(double h1, double h2) {
    const double diff = std::fmod(std::abs(h1 - h2), 360.0);
    return diff <= 180.0 ? diff : 360.0 - diff;
}

double signed_heading_delta(double h1, double h0) {
    return positive_fmod(h1 - h0 + 540.0, 360.0) - 180.0;
}

double round_to(double value, int digits) {
    const double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

}  // namespace flight_anomaly::geodesy
