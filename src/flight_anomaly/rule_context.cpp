#include "flight_anomaly/rule_context.hpp"

#include <stdexcept>
#include <utility>

namespace flight_anomaly {

RuleContext::RuleContext(
    const FlightTrack& track,
    const FlightMetadata* metadata,
    const FlightRepository* repository,
    RuleEnvironment environment
)
    : track_(track),
      list_points_(track.sorted_points()),
      metadata_(metadata),
      repository_(repository),
      struct_environment_(std::move(environment)) {
    if (!struct_environment_.library) {
        throw std::invalid_argument("RuleContext requires a path library snapshot");
    }
}

const FlightTrack& RuleContext::track() const noexcept {
    return track_;
}

const std::vector<TrackPoint>& RuleContext::points() const noexcept {
    return list_points_;
}

const FlightMetadata* RuleContext::metadata() const noexcept {
    return metadata_;
}

const FlightRepository* RuleContext::repository() const noexcept {
    return repository_;
}

const RuleParameters& RuleContext::parameters() const noexcept {
    return struct_environment_.parameters;
}

const AirportCatalog& RuleContext::airports() const noexcept {
    return struct_environment_.airports;
}

const PathLibrary& RuleContext::library() const noexcept {
    return *struct_environment_.library;
}

PathLibraryStore* RuleContext::promoter() const noexcept {
    return struct_environment_.promoter;
}

}  // namespace flight_anomaly
