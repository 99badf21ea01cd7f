#include <optional>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "flight_builders.hpp"
#include "logging_test_fixture.hpp"

using namespace flight_anomaly;
using flight_anomaly::test::details_of;
using flight_anomaly::test::k_seconds_per_hour;
using flight_anomaly::test::k_t0;
using flight_anomaly::test::make_point;
using flight_anomaly::test::make_track;
using flight_anomaly::test::RuleHarness;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    flight_anomaly::test::ensure_logger_initialized();
    return true;
}();

FlightMetadata with_category(std::string category) {
    FlightMetadata metadata{};
    metadata.category = std::move(category);
    return metadata;
}

FlightMetadata with_type(std::optional<std::string> aircraft_type) {
    FlightMetadata metadata{};
    metadata.aircraft_type = std::move(aircraft_type);
    return metadata;
}

/** @brief Twenty-minute local loop that departs from and returns to the same spot. */
std::vector<TrackPoint> local_loop(Timestamp duration_s = 1200) {
    return {
        make_point(k_t0, 32.0, 34.0, 0.0),
        make_point(k_t0 + duration_s / 4, 32.2, 34.0, 6000.0),
        make_point(k_t0 + duration_s / 2, 32.2, 34.2, 6000.0),
        make_point(k_t0 + 3 * duration_s / 4, 32.0, 34.2, 6000.0),
        make_point(k_t0 + duration_s, 32.01, 34.0, 6000.0),
    };
}

std::vector<TrackPoint> endurance_track(double hours) {
    const auto end = k_t0 + static_cast<Timestamp>(hours * k_seconds_per_hour);
    return {make_point(k_t0, 32.0, 34.0, 2000.0), make_point(end, 32.1, 34.1, 2000.0)};
}

RuleParameters with_endurance_table() {
    RuleParameters parameters{};
    parameters.endurance_breach.max_endurance_hours = {{"C172", 5.5}};
    return parameters;
}

}  // namespace

TEST_CASE("Military callsigns are identified") {
    auto points = test::straight_track(GeoPoint{32.0, 34.0}, 90.0, 350.0, 25000.0, 4, 10);
    points[1].callsign = "RCH123";

    RuleHarness harness{};
    const RuleResult result = harness.run(MilitaryAircraftRule{}, make_track("mil", points));

    REQUIRE(result.matched);
    REQUIRE(result.summary == "Military aircraft detected: US Air Force (Air Mobility Command)");
    const auto& details = details_of<MilitaryDetails>(result);
    REQUIRE(details.callsign == std::optional<std::string>{"RCH123"});
    REQUIRE(details.military_type == "transport");
    REQUIRE(details.detection_method == "callsign");
}

TEST_CASE("Civilian flights carry no military identification") {
    auto points = test::straight_track(GeoPoint{32.0, 34.0}, 90.0, 350.0, 25000.0, 4, 10);
    for (auto& point : points) {
        point.callsign = "ELY381";
    }
    const FlightMetadata metadata = with_category("passenger");

    RuleHarness harness{};
    const RuleResult result = harness.run(MilitaryAircraftRule{}, make_track("civ", points), &metadata);
    REQUIRE_FALSE(result.matched);
    REQUIRE(result.summary == "No military identification");
}

TEST_CASE("A ground departure that returns overhead is a circular flight") {
    RuleHarness harness{};
    const RuleResult result = harness.run(CircularFlightRule{}, make_track("loop", local_loop()));

    REQUIRE(result.matched);
    REQUIRE(result.summary == "Circular flight detected: unknown category, 20min duration, 0.6 NM closure");
    const auto& details = details_of<CircularFlightDetails>(result);
    REQUIRE(details.points_above_min_altitude == 4);
    REQUIRE_FALSE(details.off_route_ratio.has_value());
}

TEST_CASE("Circular flight exempts airline traffic, airborne entries and short hops") {
    RuleHarness harness{};

    const FlightMetadata airline = with_category("Passenger");
    REQUIRE(harness.run(CircularFlightRule{}, make_track("loop", local_loop()), &airline).summary == "Aircraft is commercial category: Passenger");

    auto airborne = local_loop();
    airborne.front().alt = 5000.0;
    REQUIRE(harness.run(CircularFlightRule{}, make_track("loop", airborne)).summary == "First point at 5000 ft - not a ground departure");

    REQUIRE(harness.run(CircularFlightRule{}, make_track("loop", local_loop(600))).summary == "Flight duration too short: 600s (need 900s)");
}

TEST_CASE("Circular flight along learned corridors is not reported") {
    PathRecord box{};
    box.id = "local_box";
    box.centerline = Polyline{{32.0, 34.0}, {32.2, 34.0}, {32.2, 34.2}, {32.0, 34.2}, {32.0, 34.0}};
    box.width_nm = 4.0;
    RuleHarness harness{RuleParameters{}, PathLibrary{{box}, {}, {}, {}, OccupancyHeatmap{}, {}}};

    const RuleResult result = harness.run(CircularFlightRule{}, make_track("loop", local_loop()));
    REQUIRE_FALSE(result.matched);
    REQUIRE(result.summary == "Flight stayed on known routes for 100% of samples");
    REQUIRE(details_of<CircularFlightDetails>(result).off_route_ratio == std::optional<double>{0.0});
}

TEST_CASE("Endurance breach compares duration with the type limit") {
    RuleHarness harness{with_endurance_table()};
    const FlightMetadata cessna = with_type(std::string{" c172"});

    const RuleResult breach = harness.run(EnduranceBreachRule{}, make_track("long", endurance_track(8.0)), &cessna);
    REQUIRE(breach.matched);
    REQUIRE(breach.summary == "Endurance breach: C172 flew 8.0h exceeding 6.6h limit (21% over)");
    const auto& details = details_of<EnduranceBreachDetails>(breach);
    REQUIRE(details.threshold_hours == Approx(6.6));
    REQUIRE(details.exceedance_pct == Approx(21.2));

    const RuleResult normal = harness.run(EnduranceBreachRule{}, make_track("short", endurance_track(4.0)), &cessna);
    REQUIRE_FALSE(normal.matched);
    REQUIRE(normal.summary == "Flight duration within normal limits");
}

TEST_CASE("Endurance breach needs a known aircraft type") {
    RuleHarness harness{with_endurance_table()};

    const FlightMetadata jet = with_type(std::string{"B738"});
    REQUIRE(harness.run(EnduranceBreachRule{}, make_track("e", endurance_track(8.0)), &jet).summary == "Max endurance unknown for B738");

    const FlightMetadata untyped = with_type(std::nullopt);
    const RuleResult without_type = harness.run(EnduranceBreachRule{}, make_track("e", endurance_track(8.0)), &untyped);
    REQUIRE(without_type.status == RuleStatus::Skipped);
    REQUIRE_FALSE(without_type.matched);
    REQUIRE(without_type.summary == "Skipped: Aircraft type not available");
    REQUIRE(harness.run(EnduranceBreachRule{}, make_track("e", endurance_track(8.0))).status == RuleStatus::Skipped);

    const FlightMetadata cessna = with_type(std::string{"C172"});
    REQUIRE(harness.run(EnduranceBreachRule{}, make_track("e", {make_point(k_t0, 32.0, 34.0, 2000.0)}), &cessna).summary == "Insufficient track data");
}
