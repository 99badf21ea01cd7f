#include "flight_anomaly/rule_evaluator.hpp"

#include <string>
#include <utility>

#include "rule_support.hpp"

namespace flight_anomaly {

RuleResult EmergencySquawkRule::evaluate(const RuleContext& context) const {
    const auto& squawks = context.parameters().emergency_squawks;

    EmergencySquawkDetails details{};
    for (const auto& point : context.points()) {
        if (!point.squawk.has_value()) {
            continue;
        }
        std::string code = rules::trim(*point.squawk);
        if (squawks.count(code) > 0) {
            details.events.push_back(SquawkEvent{point.timestamp, std::move(code)});
        }
    }

    const bool matched = !details.events.empty();
    return RuleResult::evaluated(
        id(),
        matched,
        matched ? "Emergency code transmitted" : "No emergency squawk detected",
        std::move(details)
    );
}

}  // namespace flight_anomaly
