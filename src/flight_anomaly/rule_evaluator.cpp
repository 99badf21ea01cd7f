#include "flight_anomaly/rule_evaluator.hpp"

namespace flight_anomaly {

RuleResult UnimplementedRule::evaluate(const RuleContext&) const {
    return RuleResult::not_implemented(rule_id_);
}

std::unique_ptr<RuleEvaluator> make_rule_evaluator(int rule_id) {
    switch (static_cast<RuleId>(rule_id)) {
        case RuleId::EmergencySquawk:
            return std::make_unique<EmergencySquawkRule>();
        case RuleId::AltitudeChange:
            return std::make_unique<AltitudeChangeRule>();
        case RuleId::AbruptTurn:
            return std::make_unique<AbruptTurnRule>();
        case RuleId::Proximity:
            return std::make_unique<ProximityRule>();
        case RuleId::GoAround:
            return std::make_unique<GoAroundRule>();
        case RuleId::ReturnToField:
            return std::make_unique<ReturnToFieldRule>();
        case RuleId::Diversion:
            return std::make_unique<DiversionRule>();
        case RuleId::LowAltitude:
            return std::make_unique<LowAltitudeRule>();
        case RuleId::SignalLoss:
            return std::make_unique<SignalLossRule>();
        case RuleId::OffCourse:
            return std::make_unique<OffCourseRule>();
        case RuleId::UnplannedLanding:
            return std::make_unique<UnplannedLandingRule>();
        case RuleId::MilitaryAircraft:
            return std::make_unique<MilitaryAircraftRule>();
        case RuleId::CircularFlight:
            return std::make_unique<CircularFlightRule>();
        case RuleId::EnduranceBreach:
            return std::make_unique<EnduranceBreachRule>();
    }
    return std::make_unique<UnimplementedRule>(rule_id);
}

}  // namespace flight_anomaly
