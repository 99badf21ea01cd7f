#include "flight_anomaly/rule_evaluator.hpp"

#include <utility>

#include <fmt/format.h>

#include "flight_anomaly/geodesy.hpp"
#include "rule_support.hpp"

namespace flight_anomaly {

namespace {
constexpr double k_seconds_per_hour{3600.0};
}  // namespace

RuleResult EnduranceBreachRule::evaluate(const RuleContext& context) const {
    const auto& points = context.points();
    if (points.size() < 2) {
        return RuleResult::evaluated(id(), false, "Insufficient track data");
    }
    const FlightMetadata* metadata = context.metadata();
    if (metadata == nullptr || !metadata->aircraft_type.has_value() || rules::trim(*metadata->aircraft_type).empty()) {
        return RuleResult::skipped(id(), "Skipped: Aircraft type not available");
    }

    const auto& parameters = context.parameters().endurance_breach;
    const std::string aircraft_type = rules::to_upper(rules::trim(*metadata->aircraft_type));
    const auto limit = parameters.max_endurance_hours.find(aircraft_type);
    if (limit == parameters.max_endurance_hours.end()) {
        return RuleResult::evaluated(id(), false, fmt::format("Max endurance unknown for {}", aircraft_type));
    }

    const double threshold_hours = limit->second * parameters.alert_multiplier;
    const double duration_hours = static_cast<double>(points.back().timestamp - points.front().timestamp) / k_seconds_per_hour;

    EnduranceBreachDetails details{};
    details.aircraft_type = aircraft_type;
    details.duration_hours = geodesy::round_to(duration_hours, 2);
    details.max_endurance_hours = limit->second;
    details.threshold_hours = geodesy::round_to(threshold_hours, 2);
    details.first_seen = points.front().timestamp;
    details.last_seen = points.back().timestamp;

    if (duration_hours <= threshold_hours) {
        return RuleResult::evaluated(id(), false, "Flight duration within normal limits", std::move(details));
    }

    const double exceedance_pct = (duration_hours - threshold_hours) / threshold_hours * 100.0;
    details.exceedance_pct = geodesy::round_to(exceedance_pct, 1);
    std::string summary = fmt::format(
        "Endurance breach: {} flew {:.1f}h exceeding {:.1f}h limit ({:.0f}% over)",
        aircraft_type,
        duration_hours,
        threshold_hours,
        exceedance_pct
    );
    return RuleResult::evaluated(id(), true, std::move(summary), std::move(details));
}

}  // namespace flight_anomaly
