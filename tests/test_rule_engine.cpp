#include <algorithm>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "flight_anomaly/errors.hpp"
#include "flight_anomaly/flight_repository.hpp"
#include "flight_anomaly/rule_engine.hpp"
#include "flight_anomaly/track_io.hpp"
#include "flight_builders.hpp"
#include "logging_test_fixture.hpp"

using namespace flight_anomaly;
using flight_anomaly::test::make_track;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    flight_anomaly::test::ensure_logger_initialized();
    return true;
}();

const std::filesystem::path k_data_dir{FLIGHT_ANOMALY_TEST_DATA_DIR};

RuleDefinition definition(int id, std::string name) {
    RuleDefinition rule{};
    rule.id = id;
    rule.name = std::move(name);
    return rule;
}

std::vector<RuleDefinition> small_rule_set() {
    return {
        definition(1, "Emergency squawk"),
        definition(4, "Dangerous proximity"),
        definition(10, "Signal loss"),
        definition(99, "Reserved"),
    };
}

FlightTrack squawking_flight(const std::string& flight_id, double lat = 32.0, const char* callsign = "ELY381") {
    auto points = test::straight_track(GeoPoint{lat, 34.0}, 90.0, 420.0, 30000.0, 8, 10);
    for (auto& point : points) {
        point.callsign = callsign;
    }
    points[3].squawk = "7700";
    return make_track(flight_id, points);
}

/** @brief Repository whose range scans fail with a non-repository error. */
class BrokenScanRepository final : public FlightRepository {
  public:
    std::vector<TrackPoint> fetch_points_between(Timestamp, Timestamp) const override {
        throw std::runtime_error("boom");
    }

    std::optional<FlightTrack> fetch_flight(const std::string&) const override {
        return std::nullopt;
    }
};

/** @brief Repository whose driver fails with its own exception type for one flight. */
class FlakyDriverRepository final : public FlightRepository {
  public:
    explicit FlakyDriverRepository(const InMemoryFlightRepository& backing)
        : backing_(backing) {}

    std::vector<TrackPoint> fetch_points_between(Timestamp start, Timestamp end) const override {
        return backing_.fetch_points_between(start, end);
    }

    std::optional<FlightTrack> fetch_flight(const std::string& flight_id) const override {
        if (flight_id == "a") {
            throw std::runtime_error("driver connection lost");
        }
        return backing_.fetch_flight(flight_id);
    }

  private:
    const InMemoryFlightRepository& backing_;
};

const RuleResult& result_for(const FlightReport& report, int rule_id) {
    const auto iter = std::find_if(report.evaluations.begin(), report.evaluations.end(), [rule_id](const RuleResult& result) {
        return result.rule_id == rule_id;
    });
    if (iter == report.evaluations.end()) {
        throw std::out_of_range("rule not evaluated");
    }
    return *iter;
}

}  // namespace

TEST_CASE("Gateway exempts low flights and excluded callsigns") {
    const GatewayParameters gateway{};

    auto low = test::straight_track(GeoPoint{32.0, 34.0}, 90.0, 300.0, 4000.0, 10, 10);
    for (std::size_t index = 0; index < 3; ++index) {
        low[index].alt = 6000.0;
    }
    REQUIRE(gateway_exemption(low, gateway) == std::optional<std::string>{"Only 3 points above 5600 ft (need 5)"});

    auto training = test::straight_track(GeoPoint{32.0, 34.0}, 90.0, 300.0, 20000.0, 10, 10);
    training[7].callsign = " 4xcab";
    REQUIRE(gateway_exemption(training, gateway) == std::optional<std::string>{"Excluded callsign prefix 4XC (4XCAB)"});

    training[7].callsign = "ELY381";
    REQUIRE_FALSE(gateway_exemption(training, gateway).has_value());
}

TEST_CASE("Exempt flights report every rule as filtered") {
    PathLibraryStore store{PathLibrary{}, PathLearningParameters{}};
    const RuleEngine engine{RuleParameters{}, small_rule_set(), store};

    const FlightReport report = engine.evaluate_track(squawking_flight("training", 32.0, "4XCAB"));

    REQUIRE(report.filtered);
    REQUIRE(report.filter_reason == std::optional<std::string>{"Excluded callsign prefix 4XC (4XCAB)"});
    REQUIRE(report.evaluations.size() == 4);
    REQUIRE(report.matched_rules.empty());
    for (const RuleResult& result : report.evaluations) {
        REQUIRE(result.status == RuleStatus::Filtered);
        REQUIRE_FALSE(result.matched);
        REQUIRE_FALSE(result.rule_name.empty());
    }
    REQUIRE(report.evaluations.front().summary == "Filtered: Excluded callsign prefix 4XC (4XCAB)");
}

TEST_CASE("Every configured rule yields one result in configuration order") {
    PathLibraryStore store{PathLibrary{}, PathLearningParameters{}};
    const RuleEngine engine{RuleParameters{}, small_rule_set(), store};

    const FlightReport report = engine.evaluate_track(squawking_flight("ely"));

    REQUIRE_FALSE(report.filtered);
    REQUIRE(report.evaluations.size() == 4);
    REQUIRE(report.evaluations[0].rule_id == 1);
    REQUIRE(report.evaluations[0].rule_name == "Emergency squawk");
    REQUIRE(report.evaluations[1].status == RuleStatus::Skipped);
    REQUIRE(report.evaluations[3].status == RuleStatus::NotImplemented);
    REQUIRE(report.evaluations[3].summary == "Rule not implemented");
    REQUIRE(report.evaluations[3].rule_name == "Reserved");

    REQUIRE(report.matched_rules.size() == 1);
    REQUIRE(report.matched_rules.front().rule_id == 1);
}

TEST_CASE("Evaluating the same flight twice gives identical reports") {
    InMemoryFlightRepository repository{};
    repository.upsert_flight(squawking_flight("ely"));
    repository.upsert_flight(squawking_flight("nearby", 32.0 + 2.0 / 60.0));

    PathLibraryStore store{PathLibrary{}, PathLearningParameters{}};
    const RuleEngine engine{RuleParameters{}, small_rule_set(), store, &repository};

    const nlohmann::json first = engine.evaluate_flight("ely");
    const nlohmann::json second = engine.evaluate_flight("ely");
    REQUIRE(first == second);
    REQUIRE(first["matched_rules"].size() == 2);
}

TEST_CASE("Batches keep the requested order and drop unknown flights") {
    InMemoryFlightRepository repository{};
    repository.upsert_flight(squawking_flight("a"));
    repository.upsert_flight(squawking_flight("b", 33.0));
    repository.upsert_flight(squawking_flight("c", 34.0));

    PathLibraryStore store{PathLibrary{}, PathLearningParameters{}};
    const RuleEngine engine{RuleParameters{}, small_rule_set(), store, &repository, 3};

    const auto reports = engine.evaluate_batch({"c", "missing", "a", "b"});
    REQUIRE(reports.size() == 3);
    REQUIRE(reports[0].flight_id == "c");
    REQUIRE(reports[1].flight_id == "a");
    REQUIRE(reports[2].flight_id == "b");

    REQUIRE_THROWS_AS(engine.evaluate_flight("missing"), RepositoryError);
}

TEST_CASE("Batches survive unexpected driver failures") {
    InMemoryFlightRepository backing{};
    backing.upsert_flight(squawking_flight("a"));
    backing.upsert_flight(squawking_flight("b", 33.0));
    const FlakyDriverRepository repository{backing};

    PathLibraryStore store{PathLibrary{}, PathLearningParameters{}};
    const RuleEngine engine{RuleParameters{}, small_rule_set(), store, &repository, 2};

    std::vector<FlightReport> reports;
    REQUIRE_NOTHROW(reports = engine.evaluate_batch({"a", "b"}));
    REQUIRE(reports.size() == 1);
    REQUIRE(reports.front().flight_id == "b");
}

TEST_CASE("A failing rule is skipped without stopping the others") {
    const BrokenScanRepository repository{};
    PathLibraryStore store{PathLibrary{}, PathLearningParameters{}};
    const RuleEngine engine{RuleParameters{}, small_rule_set(), store, &repository};

    const FlightReport report = engine.evaluate_track(squawking_flight("ely"));
    const RuleResult& proximity = result_for(report, 4);
    REQUIRE(proximity.status == RuleStatus::Skipped);
    REQUIRE(proximity.summary == "Skipped: boom");
    REQUIRE(proximity.rule_name == "Dangerous proximity");
    REQUIRE(result_for(report, 1).matched);
}

TEST_CASE("Reports serialise with the engine version") {
    PathLibraryStore store{PathLibrary{}, PathLearningParameters{}};
    const RuleEngine engine{RuleParameters{}, small_rule_set(), store};

    const nlohmann::json document = engine.evaluate_track(squawking_flight("ely"));
    REQUIRE(document["flight_id"] == "ely");
    REQUIRE(document["filtered"] == false);
    REQUIRE(document["filter_reason"].is_null());
    REQUIRE(document["total_rules"] == 4);
    REQUIRE(document["engine_version"] == "1.4.0");
    REQUIRE(document["evaluations"][0]["status"] == "evaluated");
    REQUIRE(document["matched_rules"][0]["details"]["events"][0]["squawk"] == "7700");
}

TEST_CASE("The bundled sample matches the emergency squawk rule") {
    const RuleParameters parameters = load_rule_parameters(k_data_dir / "rule_config.json");
    const auto definitions = load_rule_definitions(k_data_dir / "anomaly_rules.json");

    LibraryDocumentPaths documents{};
    documents.paths_file = k_data_dir / "learned_paths.json";
    documents.turns_file = k_data_dir / "learned_turns.json";
    // Promotions must not write back into the bundled documents.
    const PathLibraryStore bundled{documents, parameters.path_learning};
    PathLibraryStore store{*bundled.snapshot(), parameters.path_learning};
    const RuleEngine engine{parameters, definitions, store};

    const FlightTrack track = load_track(k_data_dir / "samples" / "track_emergency.json");
    const FlightMetadata metadata = load_metadata(k_data_dir / "samples" / "metadata_emergency.json");
    const FlightReport report = engine.evaluate_track(track, &metadata);

    REQUIRE_FALSE(report.filtered);
    REQUIRE(report.evaluations.size() == definitions.size());
    const bool squawk_matched = std::any_of(report.matched_rules.begin(), report.matched_rules.end(), [](const RuleResult& result) {
        return result.rule_id == 1;
    });
    REQUIRE(squawk_matched);
    REQUIRE(result_for(report, 4).summary == "Skipped: No flight database available");
}

TEST_CASE("Tracks below the gateway floor are filtered for every rule") {
    PathLibraryStore store{PathLibrary{}, PathLearningParameters{}};
    const RuleEngine engine{RuleParameters{}, small_rule_set(), store};
    const auto points = test::straight_track(GeoPoint{32.0, 34.0}, 90.0, 200.0, 4000.0, 30, 10);

    const FlightReport report = engine.evaluate_track(make_track("low", points));
    REQUIRE(report.filtered);
    REQUIRE(report.filter_reason == std::optional<std::string>{"Only 0 points above 5600 ft (need 5)"});
    for (const RuleResult& result : report.evaluations) {
        REQUIRE(result.status == RuleStatus::Filtered);
        REQUIRE_FALSE(result.matched);
    }
}

TEST_CASE("Sample order in the input does not change the report") {
    PathLibraryStore store{PathLibrary{}, PathLearningParameters{}};
    const RuleEngine engine{RuleParameters{}, small_rule_set(), store};

    const FlightTrack ordered = squawking_flight("ely");
    std::vector<TrackPoint> reversed = ordered.points();
    std::reverse(reversed.begin(), reversed.end());

    const nlohmann::json from_ordered = engine.evaluate_track(ordered);
    const nlohmann::json from_reversed = engine.evaluate_track(make_track("ely", reversed));
    REQUIRE(from_ordered == from_reversed);
}

TEST_CASE("An impossible sample does not change any verdict") {
    std::vector<RuleDefinition> rules{};
    for (const int rule_id : {1, 2, 3, 4, 6, 7, 8, 9, 10, 11, 12, 13, 14, 19}) {
        rules.push_back(definition(rule_id, fmt::format("Rule {}", rule_id)));
    }
    PathLibraryStore store{PathLibrary{}, PathLearningParameters{}};
    const RuleEngine engine{RuleParameters{}, rules, store};

    std::vector<TrackPoint> points = squawking_flight("ely").points();
    for (std::size_t index = 6; index < points.size(); ++index) {
        points[index].timestamp += 400;
    }
    const FlightTrack clean = make_track("ely", points);

    TrackPoint jump = points[3];
    jump.timestamp += 5;
    jump.lat += 200.0 / 60.0;
    jump.track.reset();
    jump.squawk.reset();
    points.insert(points.begin() + 4, jump);

    const FlightReport baseline = engine.evaluate_track(clean);
    const FlightReport with_jump = engine.evaluate_track(make_track("ely", points));
    REQUIRE(result_for(baseline, 10).matched);
    REQUIRE(with_jump.evaluations.size() == baseline.evaluations.size());
    for (std::size_t index = 0; index < baseline.evaluations.size(); ++index) {
        INFO("rule " << baseline.evaluations[index].rule_id);
        REQUIRE(with_jump.evaluations[index].status == baseline.evaluations[index].status);
        REQUIRE(with_jump.evaluations[index].matched == baseline.evaluations[index].matched);
    }
}
