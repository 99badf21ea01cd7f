#include <optional>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "flight_builders.hpp"
#include "logging_test_fixture.hpp"

using namespace flight_anomaly;
using flight_anomaly::test::details_of;
using flight_anomaly::test::k_t0;
using flight_anomaly::test::make_airport;
using flight_anomaly::test::make_point;
using flight_anomaly::test::make_track;
using flight_anomaly::test::RuleHarness;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    flight_anomaly::test::ensure_logger_initialized();
    return true;
}();

constexpr GeoPoint k_field{32.0, 34.8};

/** @brief Eastbound approach down to 1000 ft followed by a climb-out. */
std::vector<TrackPoint> missed_approach() {
    const GeoPoint start = geodesy::destination_point(k_field, 270.0, 4.0);
    auto points = test::straight_track(start, 90.0, 150.0, 0.0, 20, 10);
    for (std::size_t index = 0; index < points.size(); ++index) {
        const double step = static_cast<double>(index);
        points[index].alt = index <= 10 ? 2500.0 - 150.0 * step : 1000.0 + 200.0 * (step - 10.0);
    }
    return points;
}

RuleParameters field_with_runways(std::vector<double> runways) {
    RuleParameters parameters{};
    parameters.airports = {make_airport("TEST", k_field.lat, k_field.lon, 100.0)};
    parameters.runway_headings = {{"TEST", std::move(runways)}};
    return parameters;
}

/** @brief Departure 13.5 nm east and straight back onto the departure field. */
std::vector<TrackPoint> out_and_back() {
    const GeoPoint home{32.0, 34.0};
    const std::vector<double> outbound_alts{0.0, 1000.0, 2000.0, 3000.0, 4000.0, 5000.0, 5000.0, 5000.0, 5000.0, 5000.0};
    const std::vector<double> inbound_alts{5000.0, 5000.0, 5000.0, 4000.0, 3000.0, 2000.0, 1000.0, 200.0, 0.0};

    std::vector<GeoPoint> positions;
    for (std::size_t index = 0; index < outbound_alts.size(); ++index) {
        positions.push_back(geodesy::destination_point(home, 90.0, 1.5 * static_cast<double>(index)));
    }

    std::vector<TrackPoint> points;
    Timestamp timestamp = k_t0;
    for (std::size_t index = 0; index < outbound_alts.size(); ++index, timestamp += 30) {
        points.push_back(make_point(timestamp, positions[index].lat, positions[index].lon, outbound_alts[index]));
    }
    for (std::size_t step = 0; step < inbound_alts.size(); ++step, timestamp += 30) {
        const GeoPoint& position = positions[positions.size() - 2 - step];
        points.push_back(make_point(timestamp, position.lat, position.lon, inbound_alts[step]));
    }
    return points;
}

RuleParameters two_airports() {
    RuleParameters parameters{};
    parameters.airports = {make_airport("LLBG", 32.0, 34.88), make_airport("LLHA", 32.81, 35.04)};
    return parameters;
}

std::vector<TrackPoint> ending_at(double lat, double lon) {
    return {
        make_point(k_t0, 31.5, 34.5, 20000.0),
        make_point(k_t0 + 600, 31.8, 34.7, 8000.0),
        make_point(k_t0 + 1200, lat, lon, 200.0),
    };
}

FlightMetadata planned_for(std::optional<std::string> destination) {
    FlightMetadata metadata{};
    metadata.planned_destination = std::move(destination);
    return metadata;
}

}  // namespace

TEST_CASE("Go-around is detected on a runway-aligned missed approach") {
    RuleHarness harness{field_with_runways({90.0, 270.0})};
    const RuleResult result = harness.run(GoAroundRule{}, make_track("missed", missed_approach()));

    REQUIRE(result.matched);
    REQUIRE(result.summary == "Go-around detected");
    const auto& events = details_of<GoAroundDetails>(result).events;
    REQUIRE(events.size() == 1);
    REQUIRE(events.front().airport == "TEST");
    REQUIRE(events.front().timestamp == k_t0 + 100);
    REQUIRE(events.front().min_alt_ft == Approx(1000.0));
    REQUIRE(events.front().descent_into_low_ft == Approx(1500.0));
    REQUIRE(events.front().recovered_ft == Approx(1800.0));
}

TEST_CASE("Go-around needs the low point to line up with a runway") {
    RuleHarness harness{field_with_runways({0.0, 180.0})};
    const RuleResult result = harness.run(GoAroundRule{}, make_track("missed", missed_approach()));
    REQUIRE_FALSE(result.matched);
    REQUIRE(result.summary == "No go-around patterns");
}

TEST_CASE("Return to field is detected after a short outbound leg") {
    RuleParameters parameters{};
    parameters.airports = {make_airport("HOME", 32.0, 34.0)};
    RuleHarness harness{parameters};

    const RuleResult result = harness.run(ReturnToFieldRule{}, make_track("rtf", out_and_back()));

    REQUIRE(result.matched);
    REQUIRE(result.summary == "Return-to-field detected");
    const auto& details = details_of<ReturnToFieldDetails>(result);
    REQUIRE(details.airport == "HOME");
    REQUIRE(details.takeoff_ts == k_t0 + 30);
    REQUIRE(details.landing_ts == k_t0 + 510);
    REQUIRE(details.elapsed_s == Approx(480.0));
    REQUIRE(details.max_outbound_nm == Approx(13.5).margin(0.05));
}

TEST_CASE("Return to field ignores flights first seen airborne or far from any field") {
    RuleParameters parameters{};
    parameters.airports = {make_airport("HOME", 32.0, 34.0)};
    RuleHarness harness{parameters};

    auto airborne = out_and_back();
    airborne.front().alt = 5000.0;
    REQUIRE(harness.run(ReturnToFieldRule{}, make_track("rtf", airborne)).summary == "First point at 5000 ft - not a ground departure");

    RuleHarness without_airports{};
    REQUIRE(without_airports.run(ReturnToFieldRule{}, make_track("rtf", out_and_back())).summary == "Origin airport unknown");
    REQUIRE(without_airports.run(ReturnToFieldRule{}, make_track("rtf", {make_point(k_t0, 32.0, 34.0, 0.0)})).summary == "Insufficient points");
}

TEST_CASE("Diversion compares the final airport with the plan") {
    RuleHarness harness{two_airports()};
    const auto track = make_track("div", ending_at(32.81, 35.02));

    const FlightMetadata to_ben_gurion = planned_for(std::string{"llbg "});
    const RuleResult diverted = harness.run(DiversionRule{}, track, &to_ben_gurion);
    REQUIRE(diverted.matched);
    REQUIRE(diverted.summary == "Flight diverted to alternate airport");
    REQUIRE(details_of<LandingDetails>(diverted).planned == std::optional<std::string>{"LLBG"});
    REQUIRE(details_of<LandingDetails>(diverted).actual == std::optional<std::string>{"LLHA"});

    const FlightMetadata to_haifa = planned_for(std::string{"LLHA"});
    const RuleResult on_plan = harness.run(DiversionRule{}, track, &to_haifa);
    REQUIRE_FALSE(on_plan.matched);
    REQUIRE(on_plan.summary == "Flight landed at planned destination");
}

TEST_CASE("Diversion reports flights ending away from every airport") {
    RuleHarness harness{two_airports()};
    const FlightMetadata to_haifa = planned_for(std::string{"LLHA"});
    const RuleResult result = harness.run(DiversionRule{}, make_track("div", ending_at(31.0, 33.0)), &to_haifa);

    REQUIRE(result.matched);
    REQUIRE(result.summary == "Flight ended away from any known airport");
    REQUIRE(details_of<LandingDetails>(result).type == std::optional<std::string>{"ended_away_from_airport"});
    REQUIRE_FALSE(details_of<LandingDetails>(result).actual.has_value());
}

TEST_CASE("Diversion needs a known planned destination") {
    RuleHarness harness{two_airports()};
    const auto track = make_track("div", ending_at(32.81, 35.02));

    const RuleResult without_plan = harness.run(DiversionRule{}, track);
    REQUIRE(without_plan.status == RuleStatus::Skipped);
    REQUIRE_FALSE(without_plan.matched);
    REQUIRE(without_plan.summary == "Skipped: No planned destination provided");
    const FlightMetadata unknown = planned_for(std::string{"KJFK"});
    REQUIRE(harness.run(DiversionRule{}, track, &unknown).summary == "Planned destination not in airport list");
}

TEST_CASE("Unplanned landing names both airports") {
    RuleHarness harness{two_airports()};
    const auto track = make_track("ul", ending_at(32.81, 35.02));

    const FlightMetadata to_ben_gurion = planned_for(std::string{"LLBG"});
    const RuleResult wrong = harness.run(UnplannedLandingRule{}, track, &to_ben_gurion);
    REQUIRE(wrong.matched);
    REQUIRE(wrong.summary == "Flight landed at LLHA instead of planned LLBG");
    REQUIRE(details_of<LandingDetails>(wrong).type == std::optional<std::string>{"wrong_landing_airport"});

    const FlightMetadata to_haifa = planned_for(std::string{"LLHA"});
    REQUIRE_FALSE(harness.run(UnplannedLandingRule{}, track, &to_haifa).matched);
}

TEST_CASE("Unplanned landing stays quiet without a plan or an airport") {
    RuleHarness harness{two_airports()};
    const FlightMetadata blank = planned_for(std::string{"  "});
    const RuleResult without_plan = harness.run(UnplannedLandingRule{}, make_track("ul", ending_at(32.81, 35.02)), &blank);
    REQUIRE(without_plan.status == RuleStatus::Skipped);
    REQUIRE(without_plan.summary == "Skipped: Missing planned destination");
    REQUIRE(harness.run(UnplannedLandingRule{}, make_track("ul", ending_at(32.81, 35.02))).status == RuleStatus::Skipped);

    const FlightMetadata to_haifa = planned_for(std::string{"LLHA"});
    const RuleResult away = harness.run(UnplannedLandingRule{}, make_track("ul", ending_at(31.0, 33.0)), &to_haifa);
    REQUIRE_FALSE(away.matched);
    REQUIRE(away.summary == "Flight did not land at a known airport");
}
