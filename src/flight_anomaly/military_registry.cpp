#include "flight_anomaly/military_registry.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>
#include <utility>

namespace flight_anomaly {

namespace {

using PrefixEntry = std::pair<std::string_view, std::string_view>;

// Order matters: the first matching prefix wins.
constexpr std::array<PrefixEntry, 48> k_callsign_prefixes{{
    {"RCH", "US Air Force (Air Mobility Command)"},
    {"REACH", "US Air Force (Air Mobility Command)"},
    {"TOPCAT", "US Air Force (Refueling)"},
    {"SPAR", "US Military (Senior Presence, Airborne)"},
    {"SAM", "US Air Force (Special Air Mission - VIP)"},
    {"PAT", "US Army (Priority Air Transport)"},
    {"NAVY", "US Navy"},
    {"VM", "US Marine Corps"},
    {"CNV", "US Navy (Convoy)"},
    {"CONVOY", "US Navy (Convoy)"},
    {"EVAC", "US Air Force (Medical Evacuation)"},
    {"TABOO", "US Air Force (Tanker)"},
    {"QID", "US Air Force (KC-135 Tanker)"},
    {"QUID", "US Air Force (KC-135 Tanker)"},
    {"LAGR", "US Air Force (Fighter)"},
    {"DARK", "US Air Force (ISR)"},
    {"FORTE", "US Air Force (RQ-4 Global Hawk)"},
    {"HOMER", "US Air Force (RC-135)"},
    {"DUKE", "Military (General)"},
    {"KING", "Military (General)"},
    {"VIPER", "Military (Fighter)"},
    {"HAWK", "Military (General)"},
    {"EAGLE", "Military (Fighter)"},
    {"N00", "US Navy"},
    {"RRR", "Royal Air Force (ASCOT)"},
    {"ASCOT", "Royal Air Force (Transport)"},
    {"SHF", "Royal Navy / RAF (Support Helicopter Force)"},
    {"AAC", "Army Air Corps"},
    {"SYS", "RAF Syerston (Training)"},
    {"TARTN", "Royal Air Force (Tanker)"},
    {"RAF", "Royal Air Force"},
    {"RFR", "Royal Air Force (Tanker)"},
    {"GAF", "German Air Force"},
    {"BAF", "Belgian Air Force"},
    {"FAF", "French Air Force"},
    {"CTM", "French Air Force (Transport)"},
    {"AME", "Spanish Air Force"},
    {"PLF", "Polish Air Force"},
    {"RDAF", "Royal Danish Air Force"},
    {"ASY", "Royal Australian Air Force"},
    {"CFC", "Canadian Armed Forces"},
    {"RFF", "Russian Air Force (Transport)"},
    {"RSD", "Russian State Flight"},
    {"SHAHD", "Royal Jordanian Air Force"},
    {"SHAHED", "Iranian Military (Shahed Drone)"},
    {"IAF", "Israeli Air Force"},
    {"ISF", "Israeli Air Force"},
    {"RSAF", "Republic of Singapore Air Force"},
}};

constexpr std::array<PrefixEntry, 12> k_registration_prefixes{{
    {"ZZ", "United Kingdom (RAF)"},
    {"ZM", "United Kingdom (RAF)"},
    {"ZH", "United Kingdom (RAF)"},
    {"10+", "Germany (Luftwaffe)"},
    {"11+", "Germany (Luftwaffe)"},
    {"2+", "Germany (Helicopters/Jets)"},
    {"MM", "Italy (Aeronautica Militare)"},
    {"FAC", "Colombia (Fuerza Aerea Colombiana)"},
    {"FAH", "Honduras"},
    {"4XA", "Israel (IDF Aircraft)"},
    {"4XB", "Israel (IDF Aircraft)"},
    {"4XC", "Israel (IDF Aircraft)"},
}};

std::string normalize(std::string_view text, int (*convert)(int)) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(), [convert](unsigned char character) {
        return static_cast<char>(convert(character));
    });
    return result;
}

template <std::size_t N>
std::optional<std::string_view> match_prefix(const std::string& value, const std::array<PrefixEntry, N>& table) {
    for (const auto& [prefix, organization] : table) {
        if (value.compare(0, prefix.size(), prefix) == 0) {
            return organization;
        }
    }
    return std::nullopt;
}

bool contains_any(const std::string& text, std::initializer_list<std::string_view> needles) {
    return std::any_of(needles.begin(), needles.end(), [&text](std::string_view needle) {
        return text.find(needle) != std::string::npos;
    });
}

}  // namespace

std::optional<MilitaryIdentification> identify_military(
    const std::optional<std::string>& callsign,
    const std::optional<std::string>& registration,
    const std::optional<std::string>& category
) {
    if (category.has_value()) {
        const std::string lowered = normalize(*category, ::tolower);
        if (lowered == "military" || lowered == "military_and_government") {
            return MilitaryIdentification{"Military (Category)", "category"};
        }
    }
    if (callsign.has_value()) {
        if (const auto organization = match_prefix(normalize(*callsign, ::toupper), k_callsign_prefixes)) {
            return MilitaryIdentification{std::string{*organization}, "callsign"};
        }
    }
    if (registration.has_value()) {
        if (const auto organization = match_prefix(normalize(*registration, ::toupper), k_registration_prefixes)) {
            return MilitaryIdentification{std::string{*organization}, "registration"};
        }
    }
    return std::nullopt;
}

std::string military_type(std::string_view organization) {
    const std::string lowered = normalize(organization, ::tolower);
    if (contains_any(lowered, {"transport", "mobility", "convoy"})) {
        return "transport";
    }
    if (contains_any(lowered, {"tanker", "refuel"})) {
        return "tanker";
    }
    if (contains_any(lowered, {"fighter"})) {
        return "fighter";
    }
    if (contains_any(lowered, {"(isr)", "recce", "hawk", "rc-135"})) {
        return "ISR";
    }
    if (contains_any(lowered, {"medical", "evac"})) {
        return "medical";
    }
    if (contains_any(lowered, {"vip", "special air mission", "executive"})) {
        return "vip";
    }
    if (contains_any(lowered, {"helicopter"})) {
        return "helicopter";
    }
    if (contains_any(lowered, {"training"})) {
        return "training";
    }
    if (contains_any(lowered, {"drone", "shahed"})) {
        return "drone";
    }
    return "military";
}

}  // namespace flight_anomaly
