#include "flight_anomaly/rule_evaluator.hpp"

#include <fmt/format.h>

#include "flight_anomaly/geodesy.hpp"
#include "rule_support.hpp"

namespace flight_anomaly {

RuleResult UnplannedLandingRule::evaluate(const RuleContext& context) const {
    const FlightMetadata* metadata = context.metadata();
    if (metadata == nullptr || !metadata->planned_destination.has_value() || rules::trim(*metadata->planned_destination).empty()) {
        return RuleResult::skipped(id(), "Skipped: Missing planned destination");
    }
    const std::string planned = rules::to_upper(rules::trim(*metadata->planned_destination));

    if (context.points().empty()) {
        return RuleResult::evaluated(id(), false, "No track data");
    }
    const NearestAirport actual = context.airports().nearest(context.points().back());
    if (actual.airport == nullptr || actual.distance_nm > context.parameters().unplanned_landing.near_airport_nm) {
        return RuleResult::evaluated(id(), false, "Flight did not land at a known airport");
    }

    LandingDetails details{};
    details.planned = planned;
    details.actual = actual.airport->code;
    details.distance_nm = geodesy::round_to(actual.distance_nm, 2);
    if (planned != actual.airport->code) {
        details.type = "wrong_landing_airport";
        return RuleResult::evaluated(
            id(),
            true,
            fmt::format("Flight landed at {} instead of planned {}", actual.airport->code, planned),
            details
        );
    }
    return RuleResult::evaluated(id(), false, "Flight landed at planned destination", details);
}

}  // namespace flight_anomaly
