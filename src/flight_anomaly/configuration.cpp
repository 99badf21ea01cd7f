// === Configuration Loader ====================================================
//
// Centralizes the environment-driven settings of the evaluator. The loader
// picks the log directory first so that every later diagnostic lands in the
// rotating log, then reads the rule parameter and rule definition documents
// and resolves the geometry document names they carry.
//
// Environment
// - FLIGHT_ANOMALY_LOG_DIR: log directory, default "logs".
// - FLIGHT_ANOMALY_LOG_LEVEL: spdlog level name, default "info".
// - FLIGHT_ANOMALY_RULE_CONFIG: parameters document, default "rule_config.json".
// - FLIGHT_ANOMALY_RULE_DEFINITIONS: rule list, default "anomaly_rules.json".
// - FLIGHT_ANOMALY_WORKERS: batch worker threads, default 4.
//
// Relative paths are resolved against the configuration root passed to load().

#include "flight_anomaly/configuration.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

#include "flight_anomaly/logging.hpp"

namespace flight_anomaly {

namespace {
constexpr int k_default_workers{4};
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};
constexpr std::string_view k_default_rule_config{"rule_config.json"};
constexpr std::string_view k_default_rule_definitions{"anomaly_rules.json"};

int parse_int(const char* raw_value, int fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        return parsed_value <= 0 ? fallback : parsed_value;
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse integer from environment; using fallback {}", fallback);
        return fallback;
    }
}

std::string parse_string(const char* variable, std::string_view fallback) {
    const char* raw_value = std::getenv(variable);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

std::filesystem::path resolve(const std::filesystem::path& config_root, const std::filesystem::path& path) {
    if (path.empty() || path.is_absolute()) {
        return path;
    }
    return config_root / path;
}

}  // namespace

Configuration ConfigurationLoader::load(const std::filesystem::path& config_root) {
    Configuration config{};
    config.config_root = config_root;
    config.logging.log_directory = parse_string("FLIGHT_ANOMALY_LOG_DIR", k_default_log_directory);
    config.logging.level = parse_string("FLIGHT_ANOMALY_LOG_LEVEL", k_default_log_level);

    auto logger = initialize_logger(config.logging);
    logger->info("Loading configuration from {}", config_root.string());

    const auto parameters_path = resolve(config_root, parse_string("FLIGHT_ANOMALY_RULE_CONFIG", k_default_rule_config));
    const auto definitions_path = resolve(config_root, parse_string("FLIGHT_ANOMALY_RULE_DEFINITIONS", k_default_rule_definitions));
    config.parameters = load_rule_parameters(parameters_path);
    config.definitions = load_rule_definitions(definitions_path);
    config.workers = load_workers();

    const auto& path_learning = config.parameters.path_learning;
    const auto& learned = config.parameters.learned_behavior;
    config.documents.paths_file = resolve(config_root, path_learning.paths_file);
    config.documents.tubes_file = resolve(config_root, path_learning.tubes_file);
    config.documents.heatmap_file = resolve(config_root, path_learning.heatmap_file);
    config.documents.turns_file = resolve(config_root, learned.turns_file);
    config.documents.sid_file = resolve(config_root, learned.sid_file);
    config.documents.star_file = resolve(config_root, learned.star_file);

    logger->info(
        "Configuration loaded: rules={} airports={} workers={} paths_file={}",
        config.definitions.size(),
        config.parameters.airports.size(),
        config.workers,
        config.documents.paths_file.string()
    );

    return config;
}

int ConfigurationLoader::load_workers() {
    return parse_int(std::getenv("FLIGHT_ANOMALY_WORKERS"), k_default_workers);
}

}  // namespace flight_anomaly
