// === Rule Parameters =========================================================
//
// Strongly-typed thresholds for the gateway filter, the physics filter and
// every rule evaluator, plus the ordered rule definition list. Both are parsed
// from JSON documents once at startup so that tuning a threshold never needs a
// rebuild. A missing required section aborts loading with ConfigurationError.

#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "flight_anomaly/types.hpp"

namespace flight_anomaly {

/** @brief Limits used to reject physically impossible samples. */
struct PhysicsLimits final {
    double speed_buffer{1.5};               /**< Multiplier applied to the reachable distance. */
    double min_assumed_speed_kts{300.0};    /**< Floor speed used when reported speeds are low or unknown. */
    double max_turn_rate_deg_s{8.0};        /**< Instantaneous turn-rate ceiling. */
    double max_vertical_speed_ft_s{200.0};  /**< Vertical-rate ceiling. */
};

/** @brief Cheap pre-checks that exempt a flight from evaluation. */
struct GatewayParameters final {
    double min_altitude_ft{5600.0};
    int min_points_above{5};
    std::vector<std::string> excluded_callsign_prefixes{"4XC", "4XB", "CHLE", "4XA", "HMR"};
};

struct AltitudeChangeParameters final {
    double delta_ft{};
    int window_seconds{};
    double min_cruise_ft{};
};

struct AbruptTurnParameters final {
    double heading_change_deg{};
    int window_seconds{};
    double min_speed_kts{};
    int accumulation_window_seconds{300};
    double holding_half_turn_deg{220.0};   /**< Cumulative heading for a suspicious half orbit. */
    double holding_full_turn_deg{320.0};   /**< Cumulative heading for a full orbit. */
    double airport_suppression_nm{6.0};
};

struct ProximityParameters final {
    double distance_nm{};
    double altitude_ft{};
    int time_window_seconds{};
    double airport_exclusion_nm{0.0};
    double min_altitude_ft{5000.0};
    int time_sync_seconds{5};
};

struct GoAroundParameters final {
    double radius_nm{};
    double min_low_alt_ft{};
    double recovery_ft{};
};

struct ReturnToFieldParameters final {
    int time_limit_seconds{};
    double near_airport_nm{};
    double takeoff_alt_ft{};
    double landing_alt_ft{};
    double min_outbound_nm{0.0};
    int min_elapsed_seconds{0};
    double max_start_to_end_nm{8.0};
};

struct DiversionParameters final {
    double near_airport_nm{};
};

struct LowAltitudeParameters final {
    double threshold_ft{};
    double airport_radius_nm{};
};

struct SignalLossParameters final {
    int gap_seconds{};
    int repeat_count{};
};

struct UnplannedLandingParameters final {
    double near_airport_nm{};
};

/** @brief Reference geometry files and off-course / emerging-path thresholds. */
struct PathLearningParameters final {
    std::string paths_file{"learned_paths.json"};
    std::string tubes_file{"learned_tubes.json"};
    std::string heatmap_file{"flight_heatmap.json"};
    int num_samples{120};
    double heatmap_cell_deg{0.05};
    int heatmap_threshold{5};
    int min_off_course_points{15};
    double min_altitude_ft{9000.0};
    double emerging_distance_nm{12.0};
    int emerging_bucket_size{5};
    int emerging_similarity_deg{30};
    int emerging_bin_seconds{10};
    double default_width_nm{8.0};
    double min_emerging_width_nm{2.0};
    double tube_lateral_tolerance_nm{6.0};
    double tube_altitude_tolerance_ft{2000.0};
    int tube_min_od_members{80};
    bool promotion_enabled{true};
};

struct LearnedBehaviorParameters final {
    std::string turns_file{"learned_turns.json"};
    std::string sid_file{"learned_sid.json"};
    std::string star_file{"learned_star.json"};
    double turn_zone_tolerance_nm{3.0};
    double sid_star_tolerance_nm{5.0};
};

struct CircularFlightParameters final {
    int min_duration_seconds{900};
    double max_circle_closure_nm{5.0};
    double min_off_route_ratio{0.6};
    double min_altitude_ft{5000.0};
    std::vector<std::string> commercial_categories{"passenger", "cargo"};
};

struct EnduranceBreachParameters final {
    double alert_multiplier{1.2};
    std::map<std::string, double> max_endurance_hours{};
};

/**
 * @brief Every numeric threshold referenced by the rule engine.
 *
 * Constructed once at startup and shared by const reference across
 * concurrently evaluated flights.
 */
struct RuleParameters final {
    std::set<std::string> emergency_squawks{"7500", "7600", "7700"};
    std::vector<Airport> airports{};
    std::map<std::string, std::vector<double>> runway_headings{};
    GatewayParameters gateway{};
    PhysicsLimits physics{};
    AltitudeChangeParameters altitude_change{3000.0, 10, 10000.0};
    AbruptTurnParameters abrupt_turn{90.0, 20, 100.0};
    ProximityParameters proximity{5.0, 1000.0, 60};
    GoAroundParameters go_around{5.0, 1000.0, 500.0};
    ReturnToFieldParameters return_to_field{3600, 5.0, 500.0, 300.0, 3.0, 120};
    DiversionParameters diversion{5.0};
    LowAltitudeParameters low_altitude{800.0, 5.0};
    SignalLossParameters signal_loss{300, 1};
    UnplannedLandingParameters unplanned_landing{5.0};
    PathLearningParameters path_learning{};
    LearnedBehaviorParameters learned_behavior{};
    CircularFlightParameters circular_flight{};
    EnduranceBreachParameters endurance_breach{};
};

/** @brief One entry of the ordered rule configuration list. */
struct RuleDefinition final {
    int id{};
    std::string name{};
    std::string category{};
    std::string severity{};
    std::string definition{};
    std::string operational_significance{};
};

/** @brief Parse a parameters document; throws ConfigurationError on missing sections. */
RuleParameters parse_rule_parameters(const nlohmann::json& document);
RuleParameters load_rule_parameters(const std::filesystem::path& path);

/** @brief Parse the ordered rule definition array. */
std::vector<RuleDefinition> parse_rule_definitions(const nlohmann::json& document);
std::vector<RuleDefinition> load_rule_definitions(const std::filesystem::path& path);

/** @brief Read and parse a JSON file; throws ConfigurationError when unreadable or malformed. */
nlohmann::json read_json_document(const std::filesystem::path& path);

}  // namespace flight_anomaly
