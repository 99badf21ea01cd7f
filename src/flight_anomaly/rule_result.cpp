#include "flight_anomaly/rule_result.hpp"

#include <utility>

#include <nlohmann/json.hpp>

namespace flight_anomaly {

namespace {

template <typename T>
void put_optional(nlohmann::json& document, const char* key, const std::optional<T>& value) {
    if (value.has_value()) {
        document[key] = *value;
    }
}

}  // namespace

// Event serialisers must stay in the library namespace for nlohmann's ADL lookup.

void to_json(nlohmann::json& document, const SquawkEvent& event) {
    document = nlohmann::json{{"timestamp", event.timestamp}, {"squawk", event.squawk}};
}

void to_json(nlohmann::json& document, const AltitudeEvent& event) {
    document = nlohmann::json{
        {"timestamp", event.timestamp},
        {"delta_ft", event.delta_ft},
        {"rate_ft_per_s", event.rate_ft_per_s},
    };
}

void to_json(nlohmann::json& document, const AbruptTurnEvent& event) {
    document = nlohmann::json{
        {"type", "abrupt_turn"},
        {"timestamp", event.timestamp},
        {"turn_deg", event.turn_deg},
        {"dt_s", event.dt_s},
        {"smoothed_prev", event.smoothed_prev},
        {"smoothed_curr", event.smoothed_curr},
    };
}

void to_json(nlohmann::json& document, const HoldingPatternEvent& event) {
    document = nlohmann::json{
        {"type", "holding_pattern"},
        {"pattern", event.pattern},
        {"timestamp", event.timestamp},
        {"start_ts", event.start_ts},
        {"end_ts", event.end_ts},
        {"duration_s", event.duration_s},
        {"cumulative_turn_deg", event.cumulative_turn_deg},
    };
    put_optional(document, "displacement_nm", event.displacement_nm);
    put_optional(document, "path_length_nm", event.path_length_nm);
    put_optional(document, "path_ratio", event.path_ratio);
}

void to_json(nlohmann::json& document, const ProximityEvent& event) {
    document = nlohmann::json{
        {"timestamp", event.timestamp},
        {"other_flight", event.other_flight},
        {"distance_nm", event.distance_nm},
        {"altitude_diff_ft", event.altitude_diff_ft},
    };
    put_optional(document, "other_callsign", event.other_callsign);
}

void to_json(nlohmann::json& document, const GoAroundEvent& event) {
    document = nlohmann::json{
        {"airport", event.airport},
        {"timestamp", event.timestamp},
        {"min_alt_ft", event.min_alt_ft},
        {"recovered_ft", event.recovered_ft},
        {"descent_into_low_ft", event.descent_into_low_ft},
        {"aligned_with_runway", event.aligned_with_runway},
    };
}

void to_json(nlohmann::json& document, const LowAltitudeEvent& event) {
    document = nlohmann::json{
        {"timestamp", event.timestamp},
        {"alt_ft", event.alt_ft},
        {"speed_kts", event.speed_kts},
        {"distance_to_airport_nm", event.distance_to_airport_nm},
    };
    put_optional(document, "vspeed_fpm", event.vspeed_fpm);
}

void to_json(nlohmann::json& document, const SignalGap& gap) {
    document = nlohmann::json{{"start_ts", gap.start_ts}, {"end_ts", gap.end_ts}, {"gap_s", gap.gap_s}};
}

void to_json(nlohmann::json& document, const OnPathSample& sample) {
    document = nlohmann::json{
        {"timestamp", sample.timestamp},
        {"geometry_id", sample.geometry_id},
        {"distance_nm", sample.distance_nm},
    };
}

void to_json(nlohmann::json& document, const OffPathSample& sample) {
    document = nlohmann::json{
        {"timestamp", sample.timestamp},
        {"lat", sample.lat},
        {"lon", sample.lon},
        {"alt_ft", sample.alt_ft},
        {"wrong_region", sample.wrong_region},
    };
    put_optional(document, "distance_nm", sample.distance_nm);
}

namespace {

struct DetailsSerializer final {
    nlohmann::json& document;

    void operator()(const std::monostate&) const { document = nlohmann::json::object(); }

    void operator()(const NoteDetails& details) const { document = nlohmann::json{{"reason", details.reason}}; }

    void operator()(const EmergencySquawkDetails& details) const { document = nlohmann::json{{"events", details.events}}; }

    void operator()(const AltitudeChangeDetails& details) const { document = nlohmann::json{{"events", details.events}}; }

    void operator()(const TurnDetails& details) const {
        nlohmann::json events = nlohmann::json::array();
        for (const auto& turn : details.turns) {
            events.push_back(turn);
        }
        for (const auto& pattern : details.holding_patterns) {
            events.push_back(pattern);
        }
        document = nlohmann::json{{"events", std::move(events)}};
    }

    void operator()(const ProximityDetails& details) const { document = nlohmann::json{{"events", details.events}}; }

    void operator()(const GoAroundDetails& details) const { document = nlohmann::json{{"events", details.events}}; }

    void operator()(const ReturnToFieldDetails& details) const {
        document = nlohmann::json{
            {"airport", details.airport},
            {"takeoff_ts", details.takeoff_ts},
            {"landing_ts", details.landing_ts},
            {"elapsed_s", details.elapsed_s},
            {"max_outbound_nm", details.max_outbound_nm},
            {"start_to_end_distance_nm", details.start_to_end_distance_nm},
        };
    }

    void operator()(const LandingDetails& details) const {
        document = nlohmann::json::object();
        put_optional(document, "type", details.type);
        put_optional(document, "planned", details.planned);
        put_optional(document, "actual", details.actual);
        put_optional(document, "distance_nm", details.distance_nm);
        put_optional(document, "distance_to_airport_nm", details.distance_to_airport_nm);
    }

    void operator()(const LowAltitudeDetails& details) const { document = nlohmann::json{{"events", details.events}}; }

    void operator()(const SignalLossDetails& details) const { document = nlohmann::json{{"gaps", details.gaps}}; }

    void operator()(const OffCourseDetails& details) const {
        document = nlohmann::json{
            {"on_path_points", details.on_path_points},
            {"off_path_points", details.off_path_points},
            {"wrong_region_points", details.wrong_region_points},
            {"threshold_points", details.threshold_points},
            {"geometry", details.geometry},
            {"geometry_checked", details.geometry_checked},
            {"used_od_filter", details.used_od_filter},
            {"assignments", details.assignments},
            {"on_path_samples", details.on_path_samples},
            {"off_path_samples", details.off_path_samples},
        };
        put_optional(document, "emerging_bucket_count", details.emerging_bucket_count);
        put_optional(document, "emerging_promoted", details.emerging_promoted);
    }

    void operator()(const MilitaryDetails& details) const {
        document = nlohmann::json{
            {"organization", details.organization},
            {"military_type", details.military_type},
            {"detection_method", details.detection_method},
        };
        put_optional(document, "callsign", details.callsign);
        put_optional(document, "registration", details.registration);
        put_optional(document, "category", details.category);
    }

    void operator()(const CircularFlightDetails& details) const {
        document = nlohmann::json{
            {"duration_s", details.duration_s},
            {"closure_distance_nm", details.closure_distance_nm},
            {"points_above_min_altitude", details.points_above_min_altitude},
        };
        put_optional(document, "category", details.category);
        put_optional(document, "departure_airport", details.departure_airport);
        put_optional(document, "off_route_ratio", details.off_route_ratio);
    }

    void operator()(const EnduranceBreachDetails& details) const {
        document = nlohmann::json{
            {"aircraft_type", details.aircraft_type},
            {"duration_hours", details.duration_hours},
            {"max_endurance_hours", details.max_endurance_hours},
            {"threshold_hours", details.threshold_hours},
            {"exceedance_pct", details.exceedance_pct},
            {"first_seen", details.first_seen},
            {"last_seen", details.last_seen},
        };
    }
};

}  // namespace

const char* to_string(RuleStatus status) noexcept {
    switch (status) {
        case RuleStatus::Evaluated:
            return "evaluated";
        case RuleStatus::Skipped:
            return "skipped";
        case RuleStatus::NotImplemented:
            return "not_implemented";
        case RuleStatus::Filtered:
            return "filtered";
    }
    return "unknown";
}

RuleResult RuleResult::evaluated(int rule_id, bool matched, std::string summary, RuleDetails details) {
    RuleResult result{};
    result.rule_id = rule_id;
    result.matched = matched;
    result.status = RuleStatus::Evaluated;
    result.summary = std::move(summary);
    result.details = std::move(details);
    return result;
}

RuleResult RuleResult::skipped(int rule_id, std::string summary, RuleDetails details) {
    RuleResult result{};
    result.rule_id = rule_id;
    result.status = RuleStatus::Skipped;
    result.summary = std::move(summary);
    result.details = std::move(details);
    return result;
}

RuleResult RuleResult::not_implemented(int rule_id) {
    RuleResult result{};
    result.rule_id = rule_id;
    result.status = RuleStatus::NotImplemented;
    result.summary = "Rule not implemented";
    return result;
}

RuleResult RuleResult::filtered(int rule_id, std::string reason) {
    RuleResult result{};
    result.rule_id = rule_id;
    result.status = RuleStatus::Filtered;
    result.summary = "Filtered: " + reason;
    result.details = NoteDetails{std::move(reason)};
    return result;
}

void to_json(nlohmann::json& document, const RuleDetails& details) {
    std::visit(DetailsSerializer{document}, details);
}

void to_json(nlohmann::json& document, const RuleResult& result) {
    nlohmann::json details;
    to_json(details, result.details);
    document = nlohmann::json{
        {"rule_id", result.rule_id},
        {"rule_name", result.rule_name},
        {"matched", result.matched},
        {"status", to_string(result.status)},
        {"summary", result.summary},
        {"details", std::move(details)},
    };
}

}  // namespace flight_anomaly
