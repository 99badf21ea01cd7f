#include "flight_anomaly/rule_parameters.hpp"

#include <fstream>
#include <string_view>

#include <nlohmann/json.hpp>

#include "flight_anomaly/errors.hpp"

namespace flight_anomaly {

namespace {

using nlohmann::json;

const json& require_section(const json& parent, std::string_view key, std::string_view parent_name) {
    const auto iter = parent.find(key);
    if (iter == parent.end() || !iter->is_object()) {
        throw ConfigurationError("Missing required section '" + std::string{key} + "' in " + std::string{parent_name});
    }
    return *iter;
}

template <typename T>
T require_value(const json& section, std::string_view key, std::string_view section_name) {
    const auto iter = section.find(key);
    if (iter == section.end() || iter->is_null()) {
        throw ConfigurationError("Missing required threshold '" + std::string{key} + "' in section '" + std::string{section_name} + "'");
    }
    try {
        return iter->get<T>();
    } catch (const json::exception& error) {
        throw ConfigurationError("Invalid value for '" + std::string{key} + "' in section '" + std::string{section_name} + "': " + error.what());
    }
}

template <typename T>
T optional_value(const json& section, std::string_view key, T fallback) {
    const auto iter = section.find(key);
    if (iter == section.end() || iter->is_null()) {
        return fallback;
    }
    try {
        return iter->get<T>();
    } catch (const json::exception& error) {
        throw ConfigurationError("Invalid value for '" + std::string{key} + "': " + error.what());
    }
}

std::vector<Airport> parse_airports(const json& document) {
    std::vector<Airport> airports{};
    const auto iter = document.find("airports");
    if (iter == document.end()) {
        return airports;
    }
    if (!iter->is_array()) {
        throw ConfigurationError("'airports' must be an array");
    }
    for (const json& entry : *iter) {
        Airport airport{};
        airport.code = require_value<std::string>(entry, "code", "airports");
        airport.name = optional_value<std::string>(entry, "name", airport.code);
        airport.lat = require_value<double>(entry, "lat", "airports");
        airport.lon = require_value<double>(entry, "lon", "airports");
        const auto elevation = entry.find("elevation_ft");
        if (elevation != entry.end() && !elevation->is_null()) {
            airport.elevation_ft = elevation->get<double>();
        }
        airports.push_back(std::move(airport));
    }
    return airports;
}

void parse_gateway(const json& document, GatewayParameters& gateway) {
    const auto iter = document.find("gateway");
    if (iter == document.end()) {
        return;
    }
    gateway.min_altitude_ft = optional_value(*iter, "min_altitude_ft", gateway.min_altitude_ft);
    gateway.min_points_above = optional_value(*iter, "min_points_above", gateway.min_points_above);
    gateway.excluded_callsign_prefixes = optional_value(*iter, "excluded_callsign_prefixes", gateway.excluded_callsign_prefixes);
}

void parse_physics(const json& document, PhysicsLimits& physics) {
    const auto iter = document.find("physics");
    if (iter == document.end()) {
        return;
    }
    physics.speed_buffer = optional_value(*iter, "speed_buffer", physics.speed_buffer);
    physics.min_assumed_speed_kts = optional_value(*iter, "min_assumed_speed_kts", physics.min_assumed_speed_kts);
    physics.max_turn_rate_deg_s = optional_value(*iter, "max_turn_rate_deg_s", physics.max_turn_rate_deg_s);
    physics.max_vertical_speed_ft_s = optional_value(*iter, "max_vertical_speed_ft_s", physics.max_vertical_speed_ft_s);
}

void parse_path_learning(const json& section, PathLearningParameters& path) {
    path.paths_file = optional_value(section, "paths_file", path.paths_file);
    path.tubes_file = optional_value(section, "tubes_file", path.tubes_file);
    path.heatmap_file = optional_value(section, "heatmap_file", path.heatmap_file);
    path.num_samples = optional_value(section, "num_samples", path.num_samples);
    path.heatmap_cell_deg = optional_value(section, "heatmap_cell_deg", path.heatmap_cell_deg);
    path.heatmap_threshold = optional_value(section, "heatmap_threshold", path.heatmap_threshold);
    path.min_off_course_points = optional_value(section, "min_off_course_points", path.min_off_course_points);
    path.min_altitude_ft = optional_value(section, "min_altitude_ft", path.min_altitude_ft);
    path.emerging_distance_nm = optional_value(section, "emerging_distance_nm", path.emerging_distance_nm);
    path.emerging_bucket_size = optional_value(section, "emerging_bucket_size", path.emerging_bucket_size);
    path.emerging_similarity_deg = optional_value(section, "emerging_similarity_deg", path.emerging_similarity_deg);
    path.emerging_bin_seconds = optional_value(section, "emerging_bin_seconds", path.emerging_bin_seconds);
    path.default_width_nm = optional_value(section, "default_width_nm", path.default_width_nm);
    path.min_emerging_width_nm = optional_value(section, "min_emerging_width_nm", path.min_emerging_width_nm);
    path.tube_lateral_tolerance_nm = optional_value(section, "tube_lateral_tolerance_nm", path.tube_lateral_tolerance_nm);
    path.tube_altitude_tolerance_ft = optional_value(section, "tube_altitude_tolerance_ft", path.tube_altitude_tolerance_ft);
    path.tube_min_od_members = optional_value(section, "tube_min_od_members", path.tube_min_od_members);
    path.promotion_enabled = optional_value(section, "promotion_enabled", path.promotion_enabled);
    if (path.num_samples < 2) {
        throw ConfigurationError("path_learning.num_samples must be at least 2");
    }
    if (path.emerging_bin_seconds <= 0 || path.emerging_similarity_deg <= 0) {
        throw ConfigurationError("path_learning emerging bin sizes must be positive");
    }
}

void parse_learned_behavior(const json& rules, LearnedBehaviorParameters& learned) {
    const auto iter = rules.find("learned_behavior");
    if (iter == rules.end()) {
        return;
    }
    learned.turns_file = optional_value(*iter, "turns_file", learned.turns_file);
    learned.sid_file = optional_value(*iter, "sid_file", learned.sid_file);
    learned.star_file = optional_value(*iter, "star_file", learned.star_file);
    learned.turn_zone_tolerance_nm = optional_value(*iter, "turn_zone_tolerance_nm", learned.turn_zone_tolerance_nm);
    learned.sid_star_tolerance_nm = optional_value(*iter, "sid_star_tolerance_nm", learned.sid_star_tolerance_nm);
}

void parse_circular_flight(const json& rules, CircularFlightParameters& circular) {
    const auto iter = rules.find("circular_flight");
    if (iter == rules.end()) {
        return;
    }
    circular.min_duration_seconds = optional_value(*iter, "min_duration_seconds", circular.min_duration_seconds);
    circular.max_circle_closure_nm = optional_value(*iter, "max_circle_closure_nm", circular.max_circle_closure_nm);
    circular.min_off_route_ratio = optional_value(*iter, "min_off_route_ratio", circular.min_off_route_ratio);
    circular.min_altitude_ft = optional_value(*iter, "min_altitude_ft", circular.min_altitude_ft);
    circular.commercial_categories = optional_value(*iter, "commercial_categories", circular.commercial_categories);
}

void parse_endurance_breach(const json& rules, EnduranceBreachParameters& endurance) {
    const auto iter = rules.find("endurance_breach");
    if (iter == rules.end()) {
        return;
    }
    endurance.alert_multiplier = optional_value(*iter, "alert_multiplier", endurance.alert_multiplier);
    endurance.max_endurance_hours = optional_value(*iter, "max_endurance_hours", endurance.max_endurance_hours);
}

}  // namespace

json read_json_document(const std::filesystem::path& path) {
    std::ifstream stream{path};
    if (!stream) {
        throw ConfigurationError("Unable to open " + path.string());
    }
    try {
        return json::parse(stream);
    } catch (const json::parse_error& error) {
        throw ConfigurationError("Malformed JSON in " + path.string() + ": " + error.what());
    }
}

RuleParameters parse_rule_parameters(const json& document) {
    if (!document.is_object()) {
        throw ConfigurationError("Rule parameters document must be an object");
    }

    RuleParameters parameters{};
    if (document.contains("emergency_squawks")) {
        parameters.emergency_squawks = optional_value(document, "emergency_squawks", parameters.emergency_squawks);
    }
    parameters.airports = parse_airports(document);
    parameters.runway_headings = optional_value(document, "runway_headings", parameters.runway_headings);
    parse_gateway(document, parameters.gateway);
    parse_physics(document, parameters.physics);

    const json& rules = require_section(document, "rules", "rule parameters");

    const json& altitude = require_section(rules, "altitude_change", "rules");
    parameters.altitude_change.delta_ft = require_value<double>(altitude, "delta_ft", "altitude_change");
    parameters.altitude_change.window_seconds = require_value<int>(altitude, "window_seconds", "altitude_change");
    parameters.altitude_change.min_cruise_ft = require_value<double>(altitude, "min_cruise_ft", "altitude_change");

    const json& turn = require_section(rules, "abrupt_turn", "rules");
    AbruptTurnParameters& abrupt = parameters.abrupt_turn;
    abrupt.heading_change_deg = require_value<double>(turn, "heading_change_deg", "abrupt_turn");
    abrupt.window_seconds = require_value<int>(turn, "window_seconds", "abrupt_turn");
    abrupt.min_speed_kts = require_value<double>(turn, "min_speed_kts", "abrupt_turn");
    abrupt.accumulation_window_seconds = optional_value(turn, "accumulation_window_seconds", abrupt.accumulation_window_seconds);
    abrupt.holding_half_turn_deg = optional_value(turn, "holding_half_turn_deg", abrupt.holding_half_turn_deg);
    abrupt.holding_full_turn_deg = optional_value(turn, "holding_full_turn_deg", abrupt.holding_full_turn_deg);
    abrupt.airport_suppression_nm = optional_value(turn, "airport_suppression_nm", abrupt.airport_suppression_nm);

    const json& proximity = require_section(rules, "proximity", "rules");
    parameters.proximity.distance_nm = require_value<double>(proximity, "distance_nm", "proximity");
    parameters.proximity.altitude_ft = require_value<double>(proximity, "altitude_ft", "proximity");
    parameters.proximity.time_window_seconds = require_value<int>(proximity, "time_window_seconds", "proximity");
    parameters.proximity.airport_exclusion_nm = optional_value(proximity, "airport_exclusion_nm", parameters.proximity.airport_exclusion_nm);
    parameters.proximity.min_altitude_ft = optional_value(proximity, "min_altitude_ft", parameters.proximity.min_altitude_ft);
    parameters.proximity.time_sync_seconds = optional_value(proximity, "time_sync_seconds", parameters.proximity.time_sync_seconds);

    const json& go_around = require_section(rules, "go_around", "rules");
    parameters.go_around.radius_nm = require_value<double>(go_around, "radius_nm", "go_around");
    parameters.go_around.min_low_alt_ft = require_value<double>(go_around, "min_low_alt_ft", "go_around");
    parameters.go_around.recovery_ft = require_value<double>(go_around, "recovery_ft", "go_around");

    const json& return_to_field = require_section(rules, "return_to_field", "rules");
    ReturnToFieldParameters& field = parameters.return_to_field;
    field.time_limit_seconds = require_value<int>(return_to_field, "time_limit_seconds", "return_to_field");
    field.near_airport_nm = require_value<double>(return_to_field, "near_airport_nm", "return_to_field");
    field.takeoff_alt_ft = require_value<double>(return_to_field, "takeoff_alt_ft", "return_to_field");
    field.landing_alt_ft = require_value<double>(return_to_field, "landing_alt_ft", "return_to_field");
    field.min_outbound_nm = optional_value(return_to_field, "min_outbound_nm", field.min_outbound_nm);
    field.min_elapsed_seconds = optional_value(return_to_field, "min_elapsed_seconds", field.min_elapsed_seconds);
    field.max_start_to_end_nm = optional_value(return_to_field, "max_start_to_end_nm", field.max_start_to_end_nm);

    const json& diversion = require_section(rules, "diversion", "rules");
    parameters.diversion.near_airport_nm = require_value<double>(diversion, "near_airport_nm", "diversion");

    const json& low_altitude = require_section(rules, "low_altitude", "rules");
    parameters.low_altitude.threshold_ft = require_value<double>(low_altitude, "threshold_ft", "low_altitude");
    parameters.low_altitude.airport_radius_nm = require_value<double>(low_altitude, "airport_radius_nm", "low_altitude");

    const json& signal = require_section(rules, "signal_loss", "rules");
    parameters.signal_loss.gap_seconds = require_value<int>(signal, "gap_seconds", "signal_loss");
    parameters.signal_loss.repeat_count = require_value<int>(signal, "repeat_count", "signal_loss");

    const json& unplanned = require_section(rules, "unplanned_landing", "rules");
    parameters.unplanned_landing.near_airport_nm = require_value<double>(unplanned, "near_airport_nm", "unplanned_landing");

    parse_path_learning(require_section(rules, "path_learning", "rules"), parameters.path_learning);
    parse_learned_behavior(rules, parameters.learned_behavior);
    parse_circular_flight(rules, parameters.circular_flight);
    parse_endurance_breach(rules, parameters.endurance_breach);

    return parameters;
}

RuleParameters load_rule_parameters(const std::filesystem::path& path) {
    return parse_rule_parameters(read_json_document(path));
}

std::vector<RuleDefinition> parse_rule_definitions(const json& document) {
    const json* entries = &document;
    if (document.is_object()) {
        const auto iter = document.find("rules");
        if (iter == document.end()) {
            throw ConfigurationError("Rule definitions document has no 'rules' array");
        }
        entries = &*iter;
    }
    if (!entries->is_array()) {
        throw ConfigurationError("Rule definitions must be an array");
    }

    std::vector<RuleDefinition> definitions{};
    definitions.reserve(entries->size());
    for (const json& entry : *entries) {
        RuleDefinition definition{};
        definition.id = require_value<int>(entry, "id", "rule definition");
        definition.name = optional_value<std::string>(entry, "name", "");
        definition.category = optional_value<std::string>(entry, "category", "");
        definition.severity = optional_value<std::string>(entry, "severity", "");
        definition.definition = optional_value<std::string>(entry, "definition", "");
        definition.operational_significance = optional_value<std::string>(entry, "operational_significance", "");
        definitions.push_back(std::move(definition));
    }
    return definitions;
}

std::vector<RuleDefinition> load_rule_definitions(const std::filesystem::path& path) {
    return parse_rule_definitions(read_json_document(path));
}

}  // namespace flight_anomaly
