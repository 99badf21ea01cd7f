// === Path Library ============================================================
//
// Learned "normal" geometry: centerline paths, altitude-banded tubes, turn
// zones, SID/STAR procedures and a coarse occupancy heatmap.
//
// `PathLibrary` is an immutable snapshot. Evaluations take a shared pointer to
// the current snapshot when they start and keep reading it even if the
// emerging-path promoter publishes a newer one mid-flight. `PathLibraryStore`
// owns the documents on disk, serialises promotions behind a single writer
// lock and publishes each new snapshot atomically.

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>
#include <spdlog/logger.h>

#include "flight_anomaly/rule_parameters.hpp"
#include "flight_anomaly/types.hpp"

namespace flight_anomaly {

/** @brief Centerline corridor with a uniform lateral half-width. */
struct PathRecord final {
    std::string id{};
    std::string type{"learned"};                  /**< learned or emerging. */
    std::optional<std::string> origin{};
    std::optional<std::string> destination{};
    Polyline centerline{};
    double width_nm{};
    int member_count{};
    std::vector<int> signature{};                 /**< Heading signature an emerging path was promoted from. */
};

/** @brief Closed lateral polygon plus an altitude band. */
struct TubeRecord final {
    std::string id{};
    std::optional<std::string> origin{};
    std::optional<std::string> destination{};
    Polygon geometry{};
    double min_alt_ft{0.0};
    double max_alt_ft{50000.0};
    int member_count{};
};

struct TurnZone final {
    std::string id{};
    double lat{};
    double lon{};
    double radius_nm{2.0};
};

/** @brief Published departure or arrival procedure centerline. */
struct ProcedureRecord final {
    std::string id{};
    std::string airport{};
    Polyline centerline{};
    double width_nm{6.0};
};

/** @brief Flights sharing one heading signature, waiting for promotion. */
struct EmergingBucket final {
    std::vector<int> signature{};
    int count{};
    std::vector<std::string> flight_ids{};
};

/**
 * @brief Row-major grid of historical sample counts.
 *
 * An empty heatmap treats every position as flightable. Positions outside a
 * loaded grid are not.
 */
class OccupancyHeatmap final {
  public:
    OccupancyHeatmap() = default;
    OccupancyHeatmap(GeoPoint origin, double cell_size_deg, int threshold, int rows, int cols, std::vector<int> counts);

    [[nodiscard]] bool loaded() const noexcept;
    [[nodiscard]] bool is_flightable(double lat, double lon) const;

  private:
    GeoPoint origin_{};
    double cell_size_deg_{};
    int threshold_{};
    int rows_{};
    int cols_{};
    std::vector<int> list_counts_{};
};

/** @brief Geometry eligible for one flight after origin/destination filtering. */
template <typename Record>
struct GeometrySelection final {
    std::vector<const Record*> records{};
    bool used_od_filter{false};
};

/** @brief Immutable, versioned view of all learned geometry. */
class PathLibrary final {
  public:
    PathLibrary() = default;
    PathLibrary(
        std::vector<PathRecord> paths,
        std::vector<TubeRecord> tubes,
        std::vector<TurnZone> turn_zones,
        std::vector<ProcedureRecord> procedures,
        OccupancyHeatmap heatmap,
        std::vector<EmergingBucket> emerging_buckets,
        std::uint64_t version = 0
    );

    [[nodiscard]] std::uint64_t version() const noexcept;
    [[nodiscard]] const std::vector<PathRecord>& paths() const noexcept;
    [[nodiscard]] const std::vector<TubeRecord>& tubes() const noexcept;
    [[nodiscard]] const std::vector<TurnZone>& turn_zones() const noexcept;
    [[nodiscard]] const std::vector<ProcedureRecord>& procedures() const noexcept;
    [[nodiscard]] const std::vector<EmergingBucket>& emerging_buckets() const noexcept;
    [[nodiscard]] const OccupancyHeatmap& heatmap() const noexcept;

    /**
     * @brief Paths for a flight, preferring exact O/D, then one-sided, then
     *        untagged geometry. A flight with no O/D sees every path.
     */
    [[nodiscard]] GeometrySelection<PathRecord> select_paths(
        const std::optional<std::string>& origin,
        const std::optional<std::string>& destination
    ) const;

    [[nodiscard]] GeometrySelection<TubeRecord> select_tubes(
        const std::optional<std::string>& origin,
        const std::optional<std::string>& destination
    ) const;

    /** @brief True when the point lies inside a turn zone grown by @p tolerance_nm. */
    [[nodiscard]] bool is_in_turn_zone(double lat, double lon, double tolerance_nm) const;

    /** @brief True when the point lies within width + @p tolerance_nm of a SID or STAR. */
    [[nodiscard]] bool is_on_procedure(double lat, double lon, double tolerance_nm) const;

    /** @brief True when the point lies inside the buffered corridor of any path. */
    [[nodiscard]] bool is_in_learned_corridor(double lat, double lon) const;

    [[nodiscard]] bool is_flightable(double lat, double lon) const;

  private:
    std::vector<PathRecord> list_paths_{};
    std::vector<TubeRecord> list_tubes_{};
    std::vector<TurnZone> list_turn_zones_{};
    std::vector<ProcedureRecord> list_procedures_{};
    std::vector<EmergingBucket> list_emerging_buckets_{};
    std::vector<Polygon> list_corridors_{};
    OccupancyHeatmap struct_heatmap_{};
    std::uint64_t version_{0};
};

/** @brief On-disk locations of the geometry documents; empty paths are skipped. */
struct LibraryDocumentPaths final {
    std::filesystem::path paths_file{};
    std::filesystem::path tubes_file{};
    std::filesystem::path heatmap_file{};
    std::filesystem::path turns_file{};
    std::filesystem::path sid_file{};
    std::filesystem::path star_file{};
};

/** @brief Outcome of adding one off-path flight to the emerging buckets. */
struct EmergingUpdate final {
    std::vector<int> signature{};
    int bucket_count{};
    std::optional<std::string> promoted_path_id{};
};

/**
 * @brief Owner of the learned geometry and the only writer to it.
 */
class PathLibraryStore final {
  public:
    /** @brief Load every document; throws ConfigurationError on malformed input. */
    PathLibraryStore(LibraryDocumentPaths documents, PathLearningParameters parameters);

    /** @brief Wrap an in-memory library; promotions are kept in memory only. */
    PathLibraryStore(PathLibrary library, PathLearningParameters parameters);

    PathLibraryStore(const PathLibraryStore&) = delete;
    PathLibraryStore& operator=(const PathLibraryStore&) = delete;

    [[nodiscard]] std::shared_ptr<const PathLibrary> snapshot() const;

    /**
     * @brief Bucket a flight's far-off samples by heading signature and promote
     *        the bucket into a new centerline path once it is full.
     *
     * A flight already present in its bucket is not counted twice. Returns
     * nothing when the samples produce an empty signature.
     *
     * @param flight_id Identifier recorded in the bucket.
     * @param track_points Full time-sorted track, resampled on promotion.
     * @param far_points Samples far from every known corridor.
     */
    std::optional<EmergingUpdate> record_off_path_flight(
        const std::string& flight_id,
        const std::vector<TrackPoint>& track_points,
        const std::vector<TrackPoint>& far_points
    );

  private:
    void publish(std::shared_ptr<const PathLibrary> library);
    void persist(const PathLibrary& library) const;

    std::shared_ptr<spdlog::logger> logger_;
    LibraryDocumentPaths struct_documents_{};
    PathLearningParameters struct_parameters_{};
    bool persistent_{false};
    mutable std::mutex snapshot_mutex_{};
    std::mutex writer_mutex_{};
    std::shared_ptr<const PathLibrary> library_{};
};

/** @brief Parse one geometry document layer; exposed for tests and tools. */
std::vector<PathRecord> parse_path_records(const nlohmann::json& document, double default_width_nm);
std::vector<EmergingBucket> parse_emerging_buckets(const nlohmann::json& document);
std::vector<TubeRecord> parse_tube_records(const nlohmann::json& document, int min_od_members);
std::vector<TurnZone> parse_turn_zones(const nlohmann::json& document);
std::vector<ProcedureRecord> parse_procedures(const nlohmann::json& document);
/** @brief Cell size and threshold fall back to the configured values when the document omits them. */
OccupancyHeatmap parse_heatmap(const nlohmann::json& document, double default_cell_deg, int default_threshold);

}  // namespace flight_anomaly
