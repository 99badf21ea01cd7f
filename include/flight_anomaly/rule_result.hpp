// === Rule Result =============================================================
//
// Output record of one evaluator. The evidence payload is a tagged union with
// one alternative per rule family; every alternative serialises into the same
// `{rule_id, rule_name, matched, status, summary, details}` envelope so that
// downstream consumers can treat details as semi-structured audit data.

#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "flight_anomaly/types.hpp"

namespace flight_anomaly {

/** @brief How a rule arrived at its result. */
enum class RuleStatus {
    Evaluated,       /**< The rule ran over the track. */
    Skipped,         /**< Required context was missing or a dependency failed. */
    NotImplemented,  /**< No evaluator is registered for the rule id. */
    Filtered,        /**< The gateway exempted the flight before any rule ran. */
};

[[nodiscard]] const char* to_string(RuleStatus status) noexcept;

struct SquawkEvent final {
    Timestamp timestamp{};
    std::string squawk{};
};

struct EmergencySquawkDetails final {
    std::vector<SquawkEvent> events{};
};

struct AltitudeEvent final {
    Timestamp timestamp{};
    double delta_ft{};
    double rate_ft_per_s{};
};

struct AltitudeChangeDetails final {
    std::vector<AltitudeEvent> events{};
};

/** @brief Single heading change above the threshold within the time window. */
struct AbruptTurnEvent final {
    Timestamp timestamp{};
    double turn_deg{};
    double dt_s{};
    double smoothed_prev{};
    double smoothed_curr{};
};

/** @brief Accumulated orbit detected by the holding scan or the geometric fallback. */
struct HoldingPatternEvent final {
    std::string pattern{};
    Timestamp timestamp{};
    Timestamp start_ts{};
    Timestamp end_ts{};
    double duration_s{};
    double cumulative_turn_deg{};
    std::optional<double> displacement_nm{};
    std::optional<double> path_length_nm{};
    std::optional<double> path_ratio{};
};

struct TurnDetails final {
    std::vector<AbruptTurnEvent> turns{};
    std::vector<HoldingPatternEvent> holding_patterns{};
};

struct ProximityEvent final {
    Timestamp timestamp{};
    std::string other_flight{};
    std::optional<std::string> other_callsign{};
    double distance_nm{};
    double altitude_diff_ft{};
};

struct ProximityDetails final {
    std::vector<ProximityEvent> events{};
};

struct GoAroundEvent final {
    std::string airport{};
    Timestamp timestamp{};
    double min_alt_ft{};
    double recovered_ft{};
    double descent_into_low_ft{};
    bool aligned_with_runway{};
};

struct GoAroundDetails final {
    std::vector<GoAroundEvent> events{};
};

struct ReturnToFieldDetails final {
    std::string airport{};
    Timestamp takeoff_ts{};
    Timestamp landing_ts{};
    double elapsed_s{};
    double max_outbound_nm{};
    double start_to_end_distance_nm{};
};

/** @brief Shared by the diversion and unplanned-landing rules. */
struct LandingDetails final {
    std::optional<std::string> type{};
    std::optional<std::string> planned{};
    std::optional<std::string> actual{};
    std::optional<double> distance_nm{};
    std::optional<double> distance_to_airport_nm{};
};

struct LowAltitudeEvent final {
    Timestamp timestamp{};
    double alt_ft{};
    double speed_kts{};
    double distance_to_airport_nm{};
    std::optional<double> vspeed_fpm{};
};

struct LowAltitudeDetails final {
    std::vector<LowAltitudeEvent> events{};
};

struct SignalGap final {
    Timestamp start_ts{};
    Timestamp end_ts{};
    double gap_s{};
};

struct SignalLossDetails final {
    std::vector<SignalGap> gaps{};
};

struct OnPathSample final {
    Timestamp timestamp{};
    std::string geometry_id{};
    double distance_nm{};
};

struct OffPathSample final {
    Timestamp timestamp{};
    double lat{};
    double lon{};
    double alt_ft{};
    std::optional<double> distance_nm{};
    bool wrong_region{};
};

struct OffCourseDetails final {
    int on_path_points{};
    int off_path_points{};
    int wrong_region_points{};
    int threshold_points{};
    std::string geometry{};                 /**< tubes or paths. */
    int geometry_checked{};
    bool used_od_filter{};
    std::map<std::string, int> assignments{};
    std::vector<OnPathSample> on_path_samples{};
    std::vector<OffPathSample> off_path_samples{};
    std::optional<int> emerging_bucket_count{};
    std::optional<std::string> emerging_promoted{};
};

struct MilitaryDetails final {
    std::optional<std::string> callsign{};
    std::optional<std::string> registration{};
    std::optional<std::string> category{};
    std::string organization{};
    std::string military_type{};
    std::string detection_method{};
};

struct CircularFlightDetails final {
    std::optional<std::string> category{};
    std::optional<std::string> departure_airport{};
    double duration_s{};
    double closure_distance_nm{};
    int points_above_min_altitude{};
    std::optional<double> off_route_ratio{};
};

struct EnduranceBreachDetails final {
    std::string aircraft_type{};
    double duration_hours{};
    double max_endurance_hours{};
    double threshold_hours{};
    double exceedance_pct{};
    Timestamp first_seen{};
    Timestamp last_seen{};
};

/** @brief Free-form reason attached to skipped or unmatched results. */
struct NoteDetails final {
    std::string reason{};
};

using RuleDetails = std::variant<
    std::monostate,
    NoteDetails,
    EmergencySquawkDetails,
    AltitudeChangeDetails,
    TurnDetails,
    ProximityDetails,
    GoAroundDetails,
    ReturnToFieldDetails,
    LandingDetails,
    LowAltitudeDetails,
    SignalLossDetails,
    OffCourseDetails,
    MilitaryDetails,
    CircularFlightDetails,
    EnduranceBreachDetails>;

/**
 * @brief Outcome of one rule for one flight.
 *
 * Use the factory helpers so that status and matched never disagree: only an
 * evaluated result can be matched.
 */
struct RuleResult final {
    int rule_id{};
    std::string rule_name{};
    bool matched{false};
    RuleStatus status{RuleStatus::Evaluated};
    std::string summary{};
    RuleDetails details{};

    static RuleResult evaluated(int rule_id, bool matched, std::string summary, RuleDetails details = {});
    static RuleResult skipped(int rule_id, std::string summary, RuleDetails details = {});
    static RuleResult not_implemented(int rule_id);
    static RuleResult filtered(int rule_id, std::string reason);
};

void to_json(nlohmann::json& document, const RuleDetails& details);
void to_json(nlohmann::json& document, const RuleResult& result);

}  // namespace flight_anomaly
