#include <cmath>
#include <optional>
#include <vector>

#include <catch2/catch.hpp>

#include "flight_builders.hpp"
#include "logging_test_fixture.hpp"

using namespace flight_anomaly;
using flight_anomaly::test::details_of;
using flight_anomaly::test::k_t0;
using flight_anomaly::test::make_airport;
using flight_anomaly::test::make_track;
using flight_anomaly::test::RuleHarness;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    flight_anomaly::test::ensure_logger_initialized();
    return true;
}();

/** @brief Constant-rate right-hand orbit: +12 degrees every 4 seconds. */
std::vector<TrackPoint> orbit(std::size_t count) {
    std::vector<std::optional<double>> headings;
    for (std::size_t index = 0; index < count; ++index) {
        headings.emplace_back(std::fmod(12.0 * static_cast<double>(index), 360.0));
    }
    return test::track_from_headings(GeoPoint{32.5, 35.5}, headings, 250.0, 10000.0, 4);
}

}  // namespace

TEST_CASE("Abrupt turn needs at least four samples") {
    RuleHarness harness{};
    const auto points = test::straight_track(GeoPoint{32.0, 34.0}, 90.0, 300.0, 10000.0, 3, 10);
    const RuleResult result = harness.run(AbruptTurnRule{}, make_track("short", points));
    REQUIRE_FALSE(result.matched);
    REQUIRE(result.summary == "Not enough datapoints");
}

TEST_CASE("A single sharp heading change is reported once") {
    RuleParameters parameters{};
    parameters.abrupt_turn.heading_change_deg = 60.0;

    const std::vector<std::optional<double>> headings{0.0, std::nullopt, 0.0, 75.0, std::nullopt, 75.0};
    const auto points = test::track_from_headings(GeoPoint{32.0, 34.0}, headings, 300.0, 10000.0, 20);

    RuleHarness harness{parameters};
    const RuleResult result = harness.run(AbruptTurnRule{}, make_track("turn", points));

    REQUIRE(result.matched);
    const auto& details = details_of<TurnDetails>(result);
    REQUIRE(details.turns.size() == 1);
    REQUIRE(details.turns.front().timestamp == k_t0 + 60);
    REQUIRE(details.turns.front().turn_deg == Approx(75.0));
    REQUIRE(details.turns.front().dt_s == Approx(20.0));
    REQUIRE(details.holding_patterns.empty());
}

TEST_CASE("A turn near an airport is suppressed") {
    RuleParameters parameters{};
    parameters.abrupt_turn.heading_change_deg = 60.0;
    parameters.airports = {make_airport("NEAR", 32.0, 34.0)};

    const std::vector<std::optional<double>> headings{0.0, std::nullopt, 0.0, 75.0, std::nullopt, 75.0};
    const auto points = test::track_from_headings(GeoPoint{32.0, 34.0}, headings, 300.0, 10000.0, 20);

    RuleHarness harness{parameters};
    const RuleResult result = harness.run(AbruptTurnRule{}, make_track("turn", points));
    REQUIRE(details_of<TurnDetails>(result).turns.empty());
}

TEST_CASE("A sustained orbit is reported as a holding pattern") {
    RuleHarness harness{};
    const RuleResult result = harness.run(AbruptTurnRule{}, make_track("orbit", orbit(40)));

    REQUIRE(result.matched);
    REQUIRE(result.summary == "Abrupt heading change or holding pattern observed");
    const auto& details = details_of<TurnDetails>(result);
    REQUIRE(details.turns.empty());
    REQUIRE_FALSE(details.holding_patterns.empty());

    const HoldingPatternEvent& first = details.holding_patterns.front();
    REQUIRE(first.pattern == "180_turn");
    REQUIRE(first.start_ts == k_t0);
    REQUIRE(first.timestamp == k_t0 + 76);
    REQUIRE(first.cumulative_turn_deg == Approx(228.0));
}

TEST_CASE("An orbit inside a learned turn zone is not a half-orbit anomaly") {
    const PathLibrary library{{}, {}, {TurnZone{"hold", 32.5, 35.5, 5.0}}, {}, OccupancyHeatmap{}, {}};
    RuleHarness harness{RuleParameters{}, library};

    const RuleResult result = harness.run(AbruptTurnRule{}, make_track("orbit", orbit(30)));
    const auto& details = details_of<TurnDetails>(result);
    for (const HoldingPatternEvent& event : details.holding_patterns) {
        REQUIRE(event.pattern != "180_turn");
    }
}

TEST_CASE("Straight flight has a nominal heading profile") {
    RuleHarness harness{};
    const auto points = test::straight_track(GeoPoint{32.0, 34.0}, 45.0, 250.0, 10000.0, 60, 5);
    const RuleResult result = harness.run(AbruptTurnRule{}, make_track("straight", points));

    REQUIRE_FALSE(result.matched);
    REQUIRE(result.summary == "Heading profile nominal");
}

TEST_CASE("Heading reversals beyond the turn-rate ceiling are not reported") {
    std::vector<std::optional<double>> headings;
    for (int index = 0; index < 60; ++index) {
        headings.emplace_back(index % 2 == 0 ? 90.0 : 270.0);
    }
    const auto points = test::track_from_headings(GeoPoint{32.0, 34.0}, headings, 250.0, 10000.0, 1);

    RuleHarness harness{};
    const RuleResult result = harness.run(AbruptTurnRule{}, make_track("jammed", points));
    REQUIRE_FALSE(result.matched);
    REQUIRE(details_of<TurnDetails>(result).holding_patterns.empty());
}
