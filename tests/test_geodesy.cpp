#include <stdexcept>

#include <catch2/catch.hpp>

#include "flight_anomaly/geodesy.hpp"
#include "flight_anomaly/trajectory.hpp"
#include "flight_builders.hpp"

using namespace flight_anomaly;

TEST_CASE("haversine_nm measures one degree of longitude at the equator") {
    REQUIRE(geodesy::haversine_nm(0.0, 0.0, 0.0, 1.0) == Approx(60.04).margin(0.01));
    REQUIRE(geodesy::haversine_nm(32.0, 34.8, 32.0, 34.8) == Approx(0.0).margin(1e-9));
}

TEST_CASE("initial_bearing_deg is normalised to [0, 360)") {
    REQUIRE(geodesy::initial_bearing_deg(0.0, 0.0, 1.0, 0.0) == Approx(0.0).margin(1e-9));
    REQUIRE(geodesy::initial_bearing_deg(0.0, 0.0, 0.0, 1.0) == Approx(90.0));
    REQUIRE(geodesy::initial_bearing_deg(0.0, 0.0, 0.0, -1.0) == Approx(270.0));
}

TEST_CASE("destination_point inverts distance and bearing") {
    const GeoPoint start{32.0, 34.8};
    const GeoPoint end = geodesy::destination_point(start, 45.0, 25.0);
    REQUIRE(geodesy::haversine_nm(start, end) == Approx(25.0).margin(1e-6));
    REQUIRE(geodesy::initial_bearing_deg(start.lat, start.lon, end.lat, end.lon) == Approx(45.0).margin(1e-6));
}

TEST_CASE("Heading helpers wrap around north") {
    REQUIRE(geodesy::heading_diff(350.0, 10.0) == Approx(20.0));
    REQUIRE(geodesy::heading_diff(90.0, 270.0) == Approx(180.0));
    REQUIRE(geodesy::signed_heading_delta(10.0, 350.0) == Approx(20.0));
    REQUIRE(geodesy::signed_heading_delta(350.0, 10.0) == Approx(-20.0));
    REQUIRE(geodesy::signed_heading_delta(270.0, 90.0) == Approx(-180.0));
}

TEST_CASE("round_to rounds half away from zero") {
    REQUIRE(geodesy::round_to(2.346, 2) == Approx(2.35));
    REQUIRE(geodesy::round_to(-2.5, 0) == Approx(-3.0));
}

TEST_CASE("Corridor polygon contains its centerline and excludes distant points") {
    const Polyline centerline{{32.0, 34.0}, {32.0, 35.0}};
    const Polygon corridor = geodesy::create_corridor_polygon(centerline, 8.0);

    REQUIRE(corridor.size() == 5);
    REQUIRE(geodesy::is_point_in_polygon(GeoPoint{32.0, 34.5}, corridor));
    REQUIRE(geodesy::is_point_in_polygon(GeoPoint{32.1, 34.5}, corridor));
    REQUIRE_FALSE(geodesy::is_point_in_polygon(GeoPoint{32.5, 34.5}, corridor));
    REQUIRE(geodesy::create_corridor_polygon(Polyline{{32.0, 34.0}}, 8.0).empty());
}

TEST_CASE("point_to_polyline_distance_nm reports lateral distance and position") {
    const Polyline centerline{{32.0, 34.0}, {32.0, 35.0}};
    const auto projection = geodesy::point_to_polyline_distance_nm(GeoPoint{32.5, 34.5}, centerline);

    REQUIRE(projection.distance_nm == Approx(30.0).margin(0.01));
    REQUIRE(projection.position == Approx(0.5).margin(1e-6));
    REQUIRE_THROWS_AS(geodesy::point_to_polyline_distance_nm(GeoPoint{32.0, 34.0}, Polyline{{32.0, 34.0}}), std::invalid_argument);
}

TEST_CASE("cross_track_distance_nm measures offset from the great circle") {
    const double offset = geodesy::cross_track_distance_nm(GeoPoint{0.0, 0.0}, GeoPoint{0.0, 10.0}, GeoPoint{0.5, 5.0});
    REQUIRE(offset == Approx(30.02).margin(0.05));
}

TEST_CASE("distance_to_polygon_boundary_nm is zero on an edge") {
    const Polygon square{{0.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}, {1.0, 0.0}};
    REQUIRE(geodesy::distance_to_polygon_boundary_nm(GeoPoint{0.0, 0.5}, square) == Approx(0.0).margin(1e-9));
    REQUIRE(geodesy::distance_to_polygon_boundary_nm(GeoPoint{-0.5, 0.5}, square) == Approx(30.02).margin(0.05));
}

TEST_CASE("resample_track_points spaces samples evenly by distance") {
    const auto points = test::straight_track(GeoPoint{32.0, 34.0}, 90.0, 360.0, 10000.0, 11, 10);
    const auto resampled = resample_track_points(points, 5);

    REQUIRE(resampled.size() == 5);
    REQUIRE(resampled.front().lon == Approx(points.front().lon));
    REQUIRE(resampled.back().lon == Approx(points.back().lon));
    REQUIRE(resampled[2].lon == Approx(points[5].lon).margin(1e-6));
    REQUIRE(resample_track_points({points.front()}, 5).empty());
}

TEST_CASE("compress_heading_signature bins headings per time window") {
    const auto points = test::straight_track(GeoPoint{32.0, 34.0}, 95.0, 300.0, 12000.0, 7, 5);
    const auto signature = compress_heading_signature(points, 10, 30);

    REQUIRE_FALSE(signature.empty());
    for (const int bin : signature) {
        REQUIRE(bin == 3);
    }
}
