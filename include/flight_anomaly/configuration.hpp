// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration bundle consumed by the evaluator
// executable. `ConfigurationLoader` reads a handful of environment variables,
// then parses the rule documents they point at so downstream modules never
// touch `std::getenv` directly.

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "flight_anomaly/logging.hpp"
#include "flight_anomaly/path_library.hpp"
#include "flight_anomaly/rule_parameters.hpp"

namespace flight_anomaly {

/**
 * @brief Immutable bundle of runtime knobs for the rule engine.
 *
 * Every field is populated by ConfigurationLoader; relative document paths
 * have already been resolved against the configuration root.
 */
struct Configuration final {
    LogSettings logging{};                    /**< Log directory and level for the shared logger. */
    std::filesystem::path config_root{};      /**< Directory the documents were resolved against. */
    RuleParameters parameters{};              /**< Thresholds for the gateway and every rule. */
    std::vector<RuleDefinition> definitions{};/**< Ordered rule list evaluated per flight. */
    LibraryDocumentPaths documents{};         /**< Geometry documents for the path library. */
    int workers{};                            /**< Thread count for batch evaluation. */
};

/**
 * @brief Hydrates Configuration from environment variables and the rule
 *        documents under a configuration root.
 *
 * Throws ConfigurationError when a rule document is missing or malformed.
 */
class ConfigurationLoader final {
  public:
    static Configuration load(const std::filesystem::path& config_root);

  private:
    static int load_workers();
};

}  // namespace flight_anomaly
