// === Flight Repository =======================================================
//
// Capability used by the proximity rule and by evaluate_flight to read points
// of every tracked flight. The engine never owns a repository; callers keep it
// alive for the duration of each evaluation.

#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "flight_anomaly/types.hpp"

namespace flight_anomaly {

/**
 * @brief Read-only access to stored flights.
 *
 * Implementations report lookup failures by throwing RepositoryError and must
 * tolerate concurrent calls from several evaluation threads.
 */
class FlightRepository {
  public:
    virtual ~FlightRepository() = default;

    /** @brief Samples of all flights with start_ts <= timestamp <= end_ts. */
    [[nodiscard]] virtual std::vector<TrackPoint> fetch_points_between(Timestamp start_ts, Timestamp end_ts) const = 0;

    [[nodiscard]] virtual std::optional<FlightTrack> fetch_flight(const std::string& flight_id) const = 0;
};

/**
 * @brief Map-backed repository of currently active flights.
 *
 * Readers share the lock so concurrent evaluations never block each other;
 * upserts take it exclusively.
 */
class InMemoryFlightRepository final : public FlightRepository {
  public:
    InMemoryFlightRepository() = default;

    void upsert_flight(FlightTrack track);
    void add_point(const TrackPoint& point);
    void remove_flight(const std::string& flight_id);

    [[nodiscard]] std::size_t flight_count() const;
    [[nodiscard]] std::vector<std::string> flight_ids() const;

    [[nodiscard]] std::vector<TrackPoint> fetch_points_between(Timestamp start_ts, Timestamp end_ts) const override;
    [[nodiscard]] std::optional<FlightTrack> fetch_flight(const std::string& flight_id) const override;

  private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, FlightTrack> map_flights_;
};

}  // namespace flight_anomaly
