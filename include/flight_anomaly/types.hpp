// === Core Types ==============================================================
//
// Collects the trajectory data model shared by every module: individual track
// samples, the per-flight track container, optional flight metadata, and the
// airport reference record.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flight_anomaly {

/**
 * @brief Alias for timestamps expressed in whole seconds since the epoch.
 */
using Timestamp = std::int64_t;

/**
 * @brief Latitude/longitude pair in decimal degrees.
 */
struct GeoPoint final {
    double lat{};  /**< Latitude in decimal degrees. */
    double lon{};  /**< Longitude in decimal degrees. */
};

using Polyline = std::vector<GeoPoint>;
using Polygon = std::vector<GeoPoint>;

/**
 * @brief A single surveillance sample for one flight.
 *
 * Optional members are genuinely unknown rather than zero. Rules must skip an
 * unknown heading instead of treating it as north.
 */
struct TrackPoint final {
    std::string flight_id{};               /**< Owning flight identifier. */
    Timestamp timestamp{};                 /**< Sample time in seconds. */
    double lat{};                          /**< Latitude in decimal degrees. */
    double lon{};                          /**< Longitude in decimal degrees. */
    double alt{};                          /**< Barometric altitude in feet, 0 when unknown. */
    std::optional<double> gspeed{};        /**< Ground speed in knots. */
    std::optional<double> vspeed{};        /**< Vertical speed in feet per minute. */
    std::optional<double> track{};         /**< Track angle in degrees. */
    std::optional<std::string> squawk{};   /**< Transponder code. */
    std::optional<std::string> callsign{}; /**< Reported callsign. */
    std::optional<std::string> source{};   /**< Provenance tag of the sample. */
};

/**
 * @brief Append-only collection of samples belonging to one flight.
 *
 * Input order is never trusted; scans always go through sorted_points().
 */
class FlightTrack final {
  public:
    FlightTrack() = default;
    /** @brief Samples without a flight id are stamped with @p flight_id. */
    explicit FlightTrack(std::string flight_id, std::vector<TrackPoint> points = {});

    [[nodiscard]] const std::string& flight_id() const noexcept;
    [[nodiscard]] const std::vector<TrackPoint>& points() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

    /** @brief Append a sample; a sample without a flight id is stamped with this one. */
    void add_point(TrackPoint point);

    /** @brief Stable sort of the samples by timestamp. */
    [[nodiscard]] std::vector<TrackPoint> sorted_points() const;

  private:
    std::string str_flight_id_;
    std::vector<TrackPoint> list_points_;
};

/**
 * @brief Optional flight-plan and identity information for a flight.
 */
struct FlightMetadata final {
    std::optional<std::string> origin{};
    std::optional<std::string> planned_destination{};
    std::optional<Polyline> planned_route{};
    std::optional<std::string> category{};
    std::optional<std::string> aircraft_type{};
    std::optional<std::string> aircraft_registration{};
    std::optional<std::string> hex_address{};
    std::optional<std::string> callsign{};
};

/**
 * @brief Reference airport record loaded from the rule parameters.
 */
struct Airport final {
    std::string code{};
    std::string name{};
    double lat{};
    double lon{};
    std::optional<double> elevation_ft{};
};

}  // namespace flight_anomaly
