#include "flight_anomaly/rule_evaluator.hpp"

#include <utility>

#include <fmt/format.h>

#include "flight_anomaly/military_registry.hpp"
#include "rule_support.hpp"

namespace flight_anomaly {

RuleResult MilitaryAircraftRule::evaluate(const RuleContext& context) const {
    if (context.points().empty()) {
        return RuleResult::evaluated(id(), false, "No track data");
    }

    const FlightMetadata* metadata = context.metadata();
    MilitaryDetails details{};
    details.callsign = rules::first_callsign(context.points(), metadata);
    if (metadata != nullptr) {
        details.registration = metadata->aircraft_registration;
        details.category = metadata->category;
    }

    const auto identification = identify_military(details.callsign, details.registration, details.category);
    if (!identification.has_value()) {
        return RuleResult::evaluated(id(), false, "No military identification");
    }

    details.organization = identification->organization;
    details.detection_method = identification->detection_method;
    details.military_type = military_type(details.organization);
    std::string summary = fmt::format("Military aircraft detected: {}", details.organization);
    return RuleResult::evaluated(id(), true, std::move(summary), std::move(details));
}

}  // namespace flight_anomaly
