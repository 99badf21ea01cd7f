#include "rule_support.hpp"

#include <algorithm>
#include <cctype>

namespace flight_anomaly::rules {

double speed_or(const TrackPoint& point, double fallback) noexcept {
    return point.gspeed.value_or(fallback);
}

double elevation_ft(const Airport* airport) noexcept {
    if (airport == nullptr) {
        return 0.0;
    }
    return airport->elevation_ft.value_or(0.0);
}

std::string trim(std::string_view text) {
    const auto is_space = [](unsigned char character) { return std::isspace(character) != 0; };
    while (!text.empty() && is_space(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return std::string{text};
}

std::string to_upper(std::string_view text) {
    std::string upper{text};
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char character) {
        return static_cast<char>(std::toupper(character));
    });
    return upper;
}

std::optional<std::string> normalize_code(const std::optional<std::string>& code) {
    if (!code.has_value()) {
        return std::nullopt;
    }
    std::string normalized = to_upper(trim(*code));
    if (normalized.empty() || normalized == "UNK") {
        return std::nullopt;
    }
    return normalized;
}

std::optional<std::string> first_callsign(const std::vector<TrackPoint>& points, const FlightMetadata* metadata) {
    for (const auto& point : points) {
        if (point.callsign.has_value() && !trim(*point.callsign).empty()) {
            return trim(*point.callsign);
        }
    }
    if (metadata != nullptr && metadata->callsign.has_value() && !trim(*metadata->callsign).empty()) {
        return trim(*metadata->callsign);
    }
    return std::nullopt;
}

}  // namespace flight_anomaly::rules
