// === Rule Engine =============================================================
//
// Orchestrates one evaluation per flight: the gateway filter, then every
// configured evaluator against a shared RuleContext, then aggregation into a
// FlightReport. Batches fan out across a fixed pool of worker threads; each
// flight is still evaluated synchronously on one thread.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>
#include <spdlog/logger.h>

#include "flight_anomaly/airport_catalog.hpp"
#include "flight_anomaly/flight_repository.hpp"
#include "flight_anomaly/path_library.hpp"
#include "flight_anomaly/rule_evaluator.hpp"
#include "flight_anomaly/rule_parameters.hpp"
#include "flight_anomaly/rule_result.hpp"

namespace flight_anomaly {

/** @brief Every rule outcome for one flight plus the matched subset. */
struct FlightReport final {
    std::string flight_id{};
    bool filtered{false};
    std::optional<std::string> filter_reason{};
    std::vector<RuleResult> evaluations{};
    std::vector<RuleResult> matched_rules{};
};

void to_json(nlohmann::json& document, const FlightReport& report);

/**
 * @brief Decide whether a flight is exempt from evaluation.
 *
 * Returns the exemption reason, or nothing when the flight must be evaluated.
 * The altitude check runs first; the callsign check inspects every sample.
 */
[[nodiscard]] std::optional<std::string> gateway_exemption(
    const std::vector<TrackPoint>& sorted_points,
    const GatewayParameters& gateway
);

class RuleEngine final {
  public:
    /**
     * @param parameters Thresholds copied into the engine.
     * @param definitions Ordered rule list; ids without a detector report "not implemented".
     * @param library_store Geometry owner; must outlive the engine.
     * @param repository Optional source of other flights; must outlive the engine.
     * @param workers Thread count used by evaluate_batch.
     */
    RuleEngine(
        RuleParameters parameters,
        std::vector<RuleDefinition> definitions,
        PathLibraryStore& library_store,
        const FlightRepository* repository = nullptr,
        int workers = 1
    );

    [[nodiscard]] const std::vector<RuleDefinition>& definitions() const noexcept;

    /** @brief Evaluate a track that the caller already holds. */
    [[nodiscard]] FlightReport evaluate_track(const FlightTrack& track, const FlightMetadata* metadata = nullptr) const;

    /** @brief Fetch the flight from the repository and evaluate it; throws RepositoryError when absent. */
    [[nodiscard]] FlightReport evaluate_flight(const std::string& flight_id, const FlightMetadata* metadata = nullptr) const;

    /**
     * @brief Evaluate many repository flights on the worker pool.
     *
     * Reports keep the order of @p flight_ids. Flights that cannot be fetched
     * are logged and left out.
     */
    [[nodiscard]] std::vector<FlightReport> evaluate_batch(const std::vector<std::string>& flight_ids) const;

  private:
    [[nodiscard]] RuleResult run_rule(const RuleEvaluator& evaluator, const RuleDefinition& definition, const RuleContext& context) const;

    RuleParameters struct_parameters_;
    std::vector<RuleDefinition> list_definitions_;
    std::vector<std::unique_ptr<RuleEvaluator>> list_evaluators_;
    AirportCatalog airports_;
    PathLibraryStore& library_store_;
    const FlightRepository* repository_;
    int workers_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace flight_anomaly
