#include "flight_anomaly/rule_evaluator.hpp"

#include "flight_anomaly/geodesy.hpp"
#include "rule_support.hpp"

namespace flight_anomaly {

RuleResult DiversionRule::evaluate(const RuleContext& context) const {
    const FlightMetadata* metadata = context.metadata();
    if (metadata == nullptr || !metadata->planned_destination.has_value()) {
        return RuleResult::skipped(id(), "Skipped: No planned destination provided");
    }
    const Airport* planned = context.airports().find(rules::to_upper(rules::trim(*metadata->planned_destination)));
    if (planned == nullptr) {
        return RuleResult::evaluated(id(), false, "Planned destination not in airport list");
    }
    if (context.points().empty()) {
        return RuleResult::evaluated(id(), false, "No track data");
    }

    const NearestAirport actual = context.airports().nearest(context.points().back());
    if (actual.airport == nullptr || actual.distance_nm > context.parameters().diversion.near_airport_nm) {
        LandingDetails details{};
        details.type = "ended_away_from_airport";
        details.planned = planned->code;
        details.distance_to_airport_nm = geodesy::round_to(actual.distance_nm, 2);
        return RuleResult::evaluated(id(), true, "Flight ended away from any known airport", details);
    }

    const bool matched = actual.airport->code != planned->code;
    LandingDetails details{};
    details.planned = planned->code;
    details.actual = actual.airport->code;
    details.distance_nm = geodesy::round_to(actual.distance_nm, 2);
    return RuleResult::evaluated(
        id(),
        matched,
        matched ? "Flight diverted to alternate airport" : "Flight landed at planned destination",
        details
    );
}

}  // namespace flight_anomaly
