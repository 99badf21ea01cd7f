#include "flight_anomaly/track_io.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "flight_anomaly/errors.hpp"
#include "flight_anomaly/rule_parameters.hpp"

namespace flight_anomaly {

namespace {

using nlohmann::json;

template <typename T>
std::optional<T> optional_field(const json& object, std::string_view key) {
    const auto iter = object.find(key);
    if (iter == object.end() || iter->is_null()) {
        return std::nullopt;
    }
    return iter->get<T>();
}

template <typename T>
T required_field(const json& object, std::string_view key, std::size_t index) {
    const auto iter = object.find(key);
    if (iter == object.end() || iter->is_null()) {
        throw ConfigurationError(fmt::format("Track sample {} is missing '{}'", index, key));
    }
    return iter->get<T>();
}

// Squawk codes arrive as strings or bare numbers depending on the feed.
std::optional<std::string> optional_code(const json& object, std::string_view key) {
    const auto iter = object.find(key);
    if (iter == object.end() || iter->is_null()) {
        return std::nullopt;
    }
    if (iter->is_number_integer()) {
        return fmt::format("{:04d}", iter->get<int>());
    }
    return iter->get<std::string>();
}

TrackPoint parse_point(const json& entry, std::size_t index) {
    if (!entry.is_object()) {
        throw ConfigurationError(fmt::format("Track sample {} is not an object", index));
    }
    TrackPoint point{};
    point.flight_id = optional_field<std::string>(entry, "flight_id").value_or("");
    point.timestamp = required_field<Timestamp>(entry, "timestamp", index);
    point.lat = required_field<double>(entry, "lat", index);
    point.lon = required_field<double>(entry, "lon", index);
    point.alt = optional_field<double>(entry, "alt").value_or(0.0);
    point.gspeed = optional_field<double>(entry, "gspeed");
    point.vspeed = optional_field<double>(entry, "vspeed");
    point.track = optional_field<double>(entry, "track");
    point.squawk = optional_code(entry, "squawk");
    point.callsign = optional_field<std::string>(entry, "callsign");
    point.source = optional_field<std::string>(entry, "source");
    return point;
}

}  // namespace

FlightTrack parse_track(const json& document) {
    try {
        if (!document.is_object()) {
            throw ConfigurationError("Track document must be an object");
        }
        const auto points = document.find("points");
        if (points == document.end() || !points->is_array()) {
            throw ConfigurationError("Track document has no 'points' array");
        }
        std::string flight_id = optional_field<std::string>(document, "flight_id").value_or("");
        if (flight_id.empty() && !points->empty()) {
            flight_id = optional_field<std::string>(points->front(), "flight_id").value_or("");
        }
        if (flight_id.empty()) {
            throw ConfigurationError("Track document has no flight_id");
        }

        FlightTrack track{std::move(flight_id)};
        for (std::size_t index = 0; index < points->size(); ++index) {
            track.add_point(parse_point((*points)[index], index));
        }
        return track;
    } catch (const json::exception& exc) {
        throw ConfigurationError(fmt::format("Malformed track document: {}", exc.what()));
    }
}

FlightTrack load_track(const std::filesystem::path& path) {
    return parse_track(read_json_document(path));
}

FlightMetadata parse_metadata(const json& document) {
    if (!document.is_object()) {
        throw ConfigurationError("Metadata document must be an object");
    }
    try {
        FlightMetadata metadata{};
        metadata.origin = optional_field<std::string>(document, "origin");
        metadata.planned_destination = optional_field<std::string>(document, "planned_destination");
        metadata.category = optional_field<std::string>(document, "category");
        metadata.aircraft_type = optional_field<std::string>(document, "aircraft_type");
        metadata.aircraft_registration = optional_field<std::string>(document, "aircraft_registration");
        metadata.hex_address = optional_field<std::string>(document, "hex_address");
        metadata.callsign = optional_field<std::string>(document, "callsign");

        const auto route = document.find("planned_route");
        if (route != document.end() && route->is_array()) {
            Polyline polyline{};
            for (const json& vertex : *route) {
                polyline.push_back(GeoPoint{vertex.at("lat").get<double>(), vertex.at("lon").get<double>()});
            }
            metadata.planned_route = std::move(polyline);
        }
        return metadata;
    } catch (const json::exception& exc) {
        throw ConfigurationError(fmt::format("Malformed metadata document: {}", exc.what()));
    }
}

FlightMetadata load_metadata(const std::filesystem::path& path) {
    return parse_metadata(read_json_document(path));
}

}  // namespace flight_anomaly
