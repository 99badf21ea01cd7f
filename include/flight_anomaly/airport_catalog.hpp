// === Airport Catalog =========================================================
//
// Read-only lookup over the configured airport list and the runway heading
// table. Built once from RuleParameters and shared across evaluations.

#pragma once

#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "flight_anomaly/types.hpp"

namespace flight_anomaly {

/** @brief Closest airport to a query point; airport is null for an empty catalog. */
struct NearestAirport final {
    const Airport* airport{nullptr};
    double distance_nm{std::numeric_limits<double>::infinity()};
};

class AirportCatalog final {
  public:
    AirportCatalog() = default;
    AirportCatalog(std::vector<Airport> airports, std::map<std::string, std::vector<double>> runway_headings);

    [[nodiscard]] const std::vector<Airport>& airports() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    [[nodiscard]] NearestAirport nearest(double lat, double lon) const;
    [[nodiscard]] NearestAirport nearest(const TrackPoint& point) const;

    /** @brief Distance to the nearest airport, or @p fallback_nm when the catalog is empty. */
    [[nodiscard]] double nearest_distance_nm(const TrackPoint& point, double fallback_nm) const;

    [[nodiscard]] const Airport* find(const std::string& code) const;

    /**
     * @brief True when @p heading_deg lies within @p tolerance_deg of a runway
     *        direction of @p code.
     *
     * Airports missing from the runway table count as aligned so that the
     * table never blocks detection on its own. An unknown heading is never
     * aligned with a listed runway.
     */
    [[nodiscard]] bool is_runway_aligned(
        const std::string& code,
        const std::optional<double>& heading_deg,
        double tolerance_deg = 30.0
    ) const;

  private:
    std::vector<Airport> list_airports_;
    std::map<std::string, std::vector<double>> map_runway_headings_;
};

}  // namespace flight_anomaly
