// === Rule Context ============================================================
//
// Everything one evaluator may read while scanning a flight. The context owns
// the time-sorted copy of the track points so that every rule of a single
// evaluation shares one sort; everything else is borrowed from the engine and
// must outlive the evaluation.

#pragma once

#include <memory>
#include <vector>

#include "flight_anomaly/airport_catalog.hpp"
#include "flight_anomaly/flight_repository.hpp"
#include "flight_anomaly/path_library.hpp"
#include "flight_anomaly/rule_parameters.hpp"
#include "flight_anomaly/types.hpp"

namespace flight_anomaly {

/** @brief Shared read-only state handed to every evaluation. */
struct RuleEnvironment final {
    const RuleParameters& parameters;
    const AirportCatalog& airports;
    std::shared_ptr<const PathLibrary> library;  /**< Snapshot taken when the evaluation starts. */
    PathLibraryStore* promoter{nullptr};         /**< Optional emerging-path writer. */
};

class RuleContext final {
  public:
    /**
     * @param track Flight under evaluation; copied points are sorted once.
     * @param metadata Optional flight plan; may be null.
     * @param repository Optional source of other flights; may be null.
     * @param environment Parameters, airports and geometry shared across flights.
     */
    RuleContext(
        const FlightTrack& track,
        const FlightMetadata* metadata,
        const FlightRepository* repository,
        RuleEnvironment environment
    );

    [[nodiscard]] const FlightTrack& track() const noexcept;
    [[nodiscard]] const std::vector<TrackPoint>& points() const noexcept;
    [[nodiscard]] const FlightMetadata* metadata() const noexcept;
    [[nodiscard]] const FlightRepository* repository() const noexcept;
    [[nodiscard]] const RuleParameters& parameters() const noexcept;
    [[nodiscard]] const AirportCatalog& airports() const noexcept;
    [[nodiscard]] const PathLibrary& library() const noexcept;
    [[nodiscard]] PathLibraryStore* promoter() const noexcept;

  private:
    const FlightTrack& track_;
    std::vector<TrackPoint> list_points_;
    const FlightMetadata* metadata_;
    const FlightRepository* repository_;
    RuleEnvironment struct_environment_;
};

}  // namespace flight_anomaly
