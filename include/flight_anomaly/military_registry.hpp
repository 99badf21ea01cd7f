// === Military Registry =======================================================
//
// Reference tables of military callsign and registration prefixes and the
// lookup that classifies a flight from its category, callsign and tail number.

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace flight_anomaly {

/** @brief Organisation matched for a military flight and which field matched it. */
struct MilitaryIdentification final {
    std::string organization{};
    std::string detection_method{};  /**< category, callsign or registration. */
};

/**
 * @brief Classify a flight as military.
 *
 * The category is checked first, then callsign prefixes and finally
 * registration prefixes, each in table order. Matching is case-insensitive
 * and ignores surrounding whitespace.
 */
[[nodiscard]] std::optional<MilitaryIdentification> identify_military(
    const std::optional<std::string>& callsign,
    const std::optional<std::string>& registration,
    const std::optional<std::string>& category
);

/** @brief Mission family derived from an organisation description, e.g. tanker or ISR. */
[[nodiscard]] std::string military_type(std::string_view organization);

}  // namespace flight_anomaly
