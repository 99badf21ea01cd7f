#include <optional>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "flight_builders.hpp"
#include "logging_test_fixture.hpp"

using namespace flight_anomaly;
using flight_anomaly::test::details_of;
using flight_anomaly::test::make_track;
using flight_anomaly::test::RuleHarness;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    flight_anomaly::test::ensure_logger_initialized();
    return true;
}();

PathRecord east_west_path() {
    PathRecord path{};
    path.id = "aaa_bbb";
    path.origin = "AAA";
    path.destination = "BBB";
    path.centerline = Polyline{{32.0, 34.0}, {32.0, 35.0}};
    path.width_nm = 8.0;
    return path;
}

PathLibrary library_with_path(OccupancyHeatmap heatmap = {}) {
    return PathLibrary{{east_west_path()}, {}, {}, {}, std::move(heatmap), {}};
}

FlightTrack eastbound(double lat) {
    return make_track("east", test::straight_track(GeoPoint{lat, 34.1}, 90.0, 400.0, 12000.0, 20, 10));
}

constexpr double k_forty_nm_north{32.0 + 40.0 / 60.0};

}  // namespace

TEST_CASE("Flights inside a learned corridor are on course") {
    RuleHarness harness{RuleParameters{}, library_with_path()};
    const RuleResult result = harness.run(OffCourseRule{}, eastbound(32.0));

    REQUIRE_FALSE(result.matched);
    REQUIRE(result.summary == "Flight stayed within known corridors");
    const auto& details = details_of<OffCourseDetails>(result);
    REQUIRE(details.geometry == "paths");
    REQUIRE(details.on_path_points == 20);
    REQUIRE(details.off_path_points == 0);
    REQUIRE(details.assignments.at("aaa_bbb") == 20);
}

TEST_CASE("Flights far from every corridor deviate and feed the emerging buckets") {
    RuleHarness harness{RuleParameters{}, library_with_path()};

    const RuleResult result = harness.run(OffCourseRule{}, eastbound(k_forty_nm_north), nullptr, nullptr, true);
    REQUIRE(result.matched);
    REQUIRE(result.summary == "Flight deviated from known paths");

    const auto& details = details_of<OffCourseDetails>(result);
    REQUIRE(details.off_path_points == 20);
    REQUIRE(details.wrong_region_points == 0);
    REQUIRE(details.off_path_samples.front().distance_nm.has_value());
    REQUIRE(*details.off_path_samples.front().distance_nm > 30.0);
    REQUIRE(details.emerging_bucket_count == std::optional<int>{1});
    REQUIRE(harness.store().snapshot()->emerging_buckets().size() == 1);
}

TEST_CASE("Off-course never records buckets without a promoter") {
    RuleHarness harness{RuleParameters{}, library_with_path()};
    const RuleResult result = harness.run(OffCourseRule{}, eastbound(k_forty_nm_north));

    REQUIRE(result.matched);
    REQUIRE_FALSE(details_of<OffCourseDetails>(result).emerging_bucket_count.has_value());
    REQUIRE(harness.store().snapshot()->emerging_buckets().empty());
}

TEST_CASE("Samples in an unvisited heatmap cell are a low-activity entry") {
    const OccupancyHeatmap heatmap{GeoPoint{31.0, 34.0}, 1.0, 5, 2, 2, {10, 10, 0, 10}};
    RuleHarness harness{RuleParameters{}, library_with_path(heatmap)};

    const RuleResult result = harness.run(OffCourseRule{}, eastbound(k_forty_nm_north));
    REQUIRE(result.matched);
    REQUIRE(result.summary == "Entered low-activity region");
    REQUIRE(details_of<OffCourseDetails>(result).wrong_region_points == 20);
}

TEST_CASE("Off-course cannot judge closed loops or unknown routes") {
    RuleHarness harness{RuleParameters{}, library_with_path()};
    FlightMetadata loop{};
    loop.origin = "LLBG";
    loop.planned_destination = " llbg";

    const RuleResult same = harness.run(OffCourseRule{}, eastbound(32.0), &loop);
    REQUIRE_FALSE(same.matched);
    REQUIRE(same.summary == "Origin and destination are the same (LLBG) - cannot check deviation");

    RuleHarness empty_library{};
    const RuleResult nothing = empty_library.run(OffCourseRule{}, eastbound(32.0));
    REQUIRE_FALSE(nothing.matched);
    REQUIRE(nothing.summary == "No learned geometry for route any -> any - cannot check deviation");
}

TEST_CASE("Samples below the corridor floor are not judged") {
    RuleHarness harness{RuleParameters{}, library_with_path()};
    const auto points = test::straight_track(GeoPoint{k_forty_nm_north, 34.1}, 90.0, 400.0, 6000.0, 20, 10);
    const RuleResult result = harness.run(OffCourseRule{}, make_track("low", points));

    REQUIRE_FALSE(result.matched);
    REQUIRE(details_of<OffCourseDetails>(result).off_path_points == 0);
}

TEST_CASE("A tube buffered from a centerline accepts the same on-path samples") {
    const PathRecord path = east_west_path();
    TubeRecord tube{};
    tube.id = "aaa_bbb_tube";
    tube.geometry = geodesy::create_corridor_polygon(path.centerline, path.width_nm);

    RuleHarness by_path{RuleParameters{}, library_with_path()};
    RuleHarness by_tube{RuleParameters{}, PathLibrary{{}, {tube}, {}, {}, OccupancyHeatmap{}, {}}};

    for (const double lat : {32.0, 32.0 + 5.0 / 60.0, 32.0 - 7.0 / 60.0}) {
        const auto track = eastbound(lat);
        const RuleResult path_result = by_path.run(OffCourseRule{}, track);
        const RuleResult tube_result = by_tube.run(OffCourseRule{}, track);
        const auto& path_details = details_of<OffCourseDetails>(path_result);
        const auto& tube_details = details_of<OffCourseDetails>(tube_result);
        REQUIRE(tube_details.geometry == "tubes");
        REQUIRE(path_details.on_path_points == 20);
        REQUIRE(tube_details.on_path_points == path_details.on_path_points);
    }
}
