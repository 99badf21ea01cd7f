#include <vector>

#include <catch2/catch.hpp>

#include "flight_anomaly/airport_catalog.hpp"
#include "flight_anomaly/physics_filter.hpp"
#include "flight_builders.hpp"

using namespace flight_anomaly;
using flight_anomaly::test::k_t0;
using flight_anomaly::test::make_airport;
using flight_anomaly::test::make_point;

TEST_CASE("Smooth cruise samples are physically possible") {
    const auto points = test::straight_track(GeoPoint{32.0, 34.0}, 90.0, 450.0, 30000.0, 10, 10);
    for (std::size_t index = 0; index < points.size(); ++index) {
        REQUIRE_FALSE(is_impossible_point(points, index));
    }
}

TEST_CASE("A teleporting sample is impossible but its boundary neighbours are not") {
    auto points = test::straight_track(GeoPoint{32.0, 34.0}, 90.0, 300.0, 30000.0, 5, 10);
    points[2].lat += 1.0;

    REQUIRE(is_impossible_point(points, 2));
    REQUIRE_FALSE(is_impossible_point(points, 0));

    auto short_track = test::straight_track(GeoPoint{32.0, 34.0}, 90.0, 300.0, 30000.0, 2, 10);
    short_track[1].lat += 1.0;
    REQUIRE_FALSE(is_impossible_point(short_track, 1));
}

TEST_CASE("Turn and vertical rate ceilings flag a sample") {
    auto turning = test::straight_track(GeoPoint{32.0, 34.0}, 90.0, 300.0, 30000.0, 3, 5);
    turning[1].track = 180.0;
    REQUIRE(is_impossible_point(turning, 1));

    auto diving = test::straight_track(GeoPoint{32.0, 34.0}, 90.0, 300.0, 30000.0, 3, 5);
    diving[1].alt = 25000.0;
    REQUIRE(is_impossible_point(diving, 1));

    PhysicsLimits relaxed{};
    relaxed.max_vertical_speed_ft_s = 2000.0;
    REQUIRE_FALSE(is_impossible_point(diving, 1, relaxed));
}

TEST_CASE("Segment filter rejects non-increasing time and heading jumps") {
    const AirportCatalog airports{};
    TrackPoint previous = make_point(k_t0, 32.0, 34.0, 10000.0);
    TrackPoint current = make_point(k_t0, 32.0, 34.01, 10000.0);
    REQUIRE(is_bad_segment(previous, current, airports));

    current.timestamp = k_t0 + 10;
    REQUIRE_FALSE(is_bad_segment(previous, current, airports));

    previous.track = 0.0;
    current.track = 90.0;
    REQUIRE(is_bad_segment(previous, current, airports));
}

TEST_CASE("Segment filter rejects cruise far from every airport") {
    const TrackPoint previous = make_point(k_t0, 32.0, 34.0, 20000.0);
    const TrackPoint current = make_point(k_t0 + 10, 32.0, 34.01, 20000.0);

    const AirportCatalog empty_catalog{};
    REQUIRE(is_bad_segment(previous, current, empty_catalog));

    const AirportCatalog nearby{{make_airport("NEAR", 32.1, 34.1)}, {}};
    REQUIRE_FALSE(is_bad_segment(previous, current, nearby));
}

TEST_CASE("Segment filter rejects ground altitude at jet speed") {
    const AirportCatalog airports{};
    const TrackPoint previous = make_point(k_t0, 32.0, 34.0, 150.0);
    TrackPoint current = make_point(k_t0 + 10, 32.0, 34.01, 150.0);
    current.gspeed = 250.0;
    REQUIRE(is_bad_segment(previous, current, airports));

    current.gspeed = 140.0;
    REQUIRE_FALSE(is_bad_segment(previous, current, airports));
}
