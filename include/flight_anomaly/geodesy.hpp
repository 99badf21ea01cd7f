// === Geodesy =================================================================
//
// Spherical-earth helpers shared by the physics filter, the path library and
// every rule: great-circle distance and bearing, cross-track distance,
// corridor buffering, polygon containment, and polyline projection. All
// functions are pure and distances are expressed in nautical miles.

#pragma once

#include "flight_anomaly/types.hpp"

namespace flight_anomaly::geodesy {

inline constexpr double k_earth_radius_km{6371.0};
inline constexpr double k_nm_per_km{0.539957};

/** @brief Result of projecting a point onto a polyline. */
struct PolylineProjection final {
    double distance_nm{};  /**< Closest lateral distance to any segment. */
    double position{};     /**< Fraction [0, 1] along the polyline of the closest point. */
};

double haversine_nm(double lat1, double lon1, double lat2, double lon2);
double haversine_nm(const GeoPoint& from, const GeoPoint& to);

/** @brief Initial great-circle bearing in [0, 360). */
double initial_bearing_deg(double lat1, double lon1, double lat2, double lon2);

/** @brief Distance of @p point from the great circle through @p origin and @p destination. */
double cross_track_distance_nm(const GeoPoint& origin, const GeoPoint& destination, const GeoPoint& point);

/** @brief Point reached after travelling @p distance_nm along @p bearing_deg. */
GeoPoint destination_point(const GeoPoint& start, double bearing_deg, double distance_nm);

/**
 * @brief Buffer a centerline into a closed polygon of half-width @p radius_nm.
 *
 * Returns the left boundary followed by the reversed right boundary and the
 * first left point again. Paths with fewer than two points yield an empty
 * polygon.
 */
Polygon create_corridor_polygon(const Polyline& path, double radius_nm);

/** @brief Ray-casting containment test on raw lat/lon coordinates. */
bool is_point_in_polygon(const GeoPoint& point, const Polygon& polygon);

/**
 * @brief Minimum distance to a polyline using a local equirectangular projection.
 *
 * @throws std::invalid_argument when the polyline has fewer than two points.
 */
PolylineProjection point_to_polyline_distance_nm(const GeoPoint& point, const Polyline& polyline);

/** @brief Sampled great-circle distance from a point to a lat/lon segment. */
double distance_point_to_segment_nm(const GeoPoint& point, const GeoPoint& start, const GeoPoint& end);

/** @brief Minimum distance to the closed boundary of @p polygon. */
double distance_to_polygon_boundary_nm(const GeoPoint& point, const Polygon& polygon);

/** @brief Smallest absolute difference between two headings, in [0, 180]. */
double heading_diff(double h1, double h2);

/** @brief Signed heading change from @p h0 to @p h1, in [-180, 180). */
double signed_heading_delta(double h1, double h0);

/** @brief Round half away from zero to @p digits decimals, used for report values. */
double round_to(double value, int digits);

}  // namespace flight_anomaly::geodesy
