#include "flight_anomaly/path_library.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "flight_anomaly/errors.hpp"
#include "flight_anomaly/geodesy.hpp"
#include "flight_anomaly/logging.hpp"
#include "flight_anomaly/trajectory.hpp"

namespace flight_anomaly {

namespace {

using nlohmann::json;

constexpr const char* k_unknown_code{"UNK"};
constexpr const char* k_emerging_type{"emerging"};

std::optional<std::string> normalize_code(const std::optional<std::string>& code) {
    if (!code || code->empty() || *code == k_unknown_code) {
        return std::nullopt;
    }
    return code;
}

std::optional<std::string> optional_code(const json& entry, const char* key) {
    const auto iter = entry.find(key);
    if (iter == entry.end() || !iter->is_string()) {
        return std::nullopt;
    }
    return normalize_code(iter->get<std::string>());
}

Polyline parse_centerline(const json& entry) {
    Polyline centerline{};
    const auto iter = entry.find("centerline");
    if (iter == entry.end() || !iter->is_array()) {
        return centerline;
    }
    for (const json& vertex : *iter) {
        if (vertex.contains("lat") && vertex.contains("lon")) {
            centerline.push_back(GeoPoint{vertex.at("lat").get<double>(), vertex.at("lon").get<double>()});
        }
    }
    return centerline;
}

json centerline_to_json(const Polyline& centerline) {
    json vertices = json::array();
    for (const GeoPoint& vertex : centerline) {
        vertices.push_back(json{{"lat", vertex.lat}, {"lon", vertex.lon}});
    }
    return vertices;
}

json code_to_json(const std::optional<std::string>& code) {
    return code ? json(*code) : json(nullptr);
}

json path_to_json(const PathRecord& path) {
    json entry{
        {"id", path.id},
        {"type", path.type},
        {"origin", code_to_json(path.origin)},
        {"destination", code_to_json(path.destination)},
        {"centerline", centerline_to_json(path.centerline)},
        {"width_nm", path.width_nm},
        {"member_count", path.member_count},
    };
    if (!path.signature.empty()) {
        entry["signature"] = path.signature;
    }
    return entry;
}

json bucket_to_json(const EmergingBucket& bucket) {
    return json{
        {"signature", bucket.signature},
        {"count", bucket.count},
        {"flight_ids", bucket.flight_ids},
    };
}

// A missing document is an empty layer; an unreadable or malformed one is fatal.
template <typename Result>
Result load_layer(const std::filesystem::path& path, const std::function<Result(const json&)>& parser) {
    if (path.empty() || !std::filesystem::exists(path)) {
        return Result{};
    }
    const json document = read_json_document(path);
    try {
        return parser(document);
    } catch (const json::exception& error) {
        throw ConfigurationError("Malformed geometry document " + path.string() + ": " + error.what());
    }
}

// Tier 0: exact pair, tier 1: one side matches and the other is untagged,
// tier 2: fully untagged geometry.
template <typename Record>
GeometrySelection<Record> select_by_od(
    const std::vector<Record>& records,
    const std::optional<std::string>& raw_origin,
    const std::optional<std::string>& raw_destination
) {
    const std::optional<std::string> origin = normalize_code(raw_origin);
    const std::optional<std::string> destination = normalize_code(raw_destination);

    GeometrySelection<Record> selection{};
    if (!origin && !destination) {
        for (const Record& record : records) {
            selection.records.push_back(&record);
        }
        return selection;
    }

    const auto tier_of = [&origin, &destination](const Record& record) -> int {
        const bool origin_match = origin && record.origin == origin;
        const bool destination_match = destination && record.destination == destination;
        if (origin && destination) {
            if (origin_match && destination_match) {
                return 0;
            }
            if ((origin_match && !record.destination) || (!record.origin && destination_match)) {
                return 1;
            }
        } else if (origin_match || destination_match) {
            return 0;
        }
        if (!record.origin && !record.destination) {
            return 2;
        }
        return -1;
    };

    for (int tier = 0; tier <= 2; ++tier) {
        for (const Record& record : records) {
            if (tier_of(record) == tier) {
                selection.records.push_back(&record);
            }
        }
        if (!selection.records.empty()) {
            selection.used_od_filter = tier < 2;
            return selection;
        }
    }
    return selection;
}

double population_stddev(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double mean = 0.0;
    for (const double value : values) {
        mean += value;
    }
    mean /= static_cast<double>(values.size());
    double variance = 0.0;
    for (const double value : values) {
        variance += (value - mean) * (value - mean);
    }
    return std::sqrt(variance / static_cast<double>(values.size()));
}

}  // namespace

OccupancyHeatmap::OccupancyHeatmap(GeoPoint origin, double cell_size_deg, int threshold, int rows, int cols, std::vector<int> counts)
    : origin_(origin),
      cell_size_deg_(cell_size_deg),
      threshold_(threshold),
      rows_(rows),
      cols_(cols),
      list_counts_(std::move(counts)) {
    if (cell_size_deg_ <= 0.0 || rows_ < 0 || cols_ < 0) {
        throw std::invalid_argument("Heatmap requires a positive cell size and non-negative dimensions");
    }
    if (list_counts_.size() != static_cast<std::size_t>(rows_) * static_cast<std::size_t>(cols_)) {
        throw std::invalid_argument("Heatmap counts do not match rows x cols");
    }
}

bool OccupancyHeatmap::loaded() const noexcept {
    return !list_counts_.empty();
}

bool OccupancyHeatmap::is_flightable(double lat, double lon) const {
    if (!loaded()) {
        return true;
    }
    // Truncation toward zero matches how the grid was built.
    const int row = static_cast<int>((lat - origin_.lat) / cell_size_deg_);
    const int col = static_cast<int>((lon - origin_.lon) / cell_size_deg_);
    if (row < 0 || col < 0 || row >= rows_ || col >= cols_) {
        return false;
    }
    return list_counts_[static_cast<std::size_t>(row) * static_cast<std::size_t>(cols_) + static_cast<std::size_t>(col)] >= threshold_;
}

PathLibrary::PathLibrary(
    std::vector<PathRecord> paths,
    std::vector<TubeRecord> tubes,
    std::vector<TurnZone> turn_zones,
    std::vector<ProcedureRecord> procedures,
    OccupancyHeatmap heatmap,
    std::vector<EmergingBucket> emerging_buckets,
    std::uint64_t version
)
    : list_paths_(std::move(paths)),
      list_tubes_(std::move(tubes)),
      list_turn_zones_(std::move(turn_zones)),
      list_procedures_(std::move(procedures)),
      list_emerging_buckets_(std::move(emerging_buckets)),
      struct_heatmap_(std::move(heatmap)),
      version_(version) {
    for (const PathRecord& path : list_paths_) {
        Polygon corridor = geodesy::create_corridor_polygon(path.centerline, path.width_nm);
        if (!corridor.empty()) {
            list_corridors_.push_back(std::move(corridor));
        }
    }
}

std::uint64_t PathLibrary::version() const noexcept {
    return version_;
}

const std::vector<PathRecord>& PathLibrary::paths() const noexcept {
    return list_paths_;
}

const std::vector<TubeRecord>& PathLibrary::tubes() const noexcept {
    return list_tubes_;
}

const std::vector<TurnZone>& PathLibrary::turn_zones() const noexcept {
    return list_turn_zones_;
}

const std::vector<ProcedureRecord>& PathLibrary::procedures() const noexcept {
    return list_procedures_;
}

const std::vector<EmergingBucket>& PathLibrary::emerging_buckets() const noexcept {
    return list_emerging_buckets_;
}

const OccupancyHeatmap& PathLibrary::heatmap() const noexcept {
    return struct_heatmap_;
}

GeometrySelection<PathRecord> PathLibrary::select_paths(
    const std::optional<std::string>& origin,
    const std::optional<std::string>& destination
) const {
    return select_by_od(list_paths_, origin, destination);
}

GeometrySelection<TubeRecord> PathLibrary::select_tubes(
    const std::optional<std::string>& origin,
    const std::optional<std::string>& destination
) const {
    return select_by_od(list_tubes_, origin, destination);
}

bool PathLibrary::is_in_turn_zone(double lat, double lon, double tolerance_nm) const {
    return std::any_of(list_turn_zones_.begin(), list_turn_zones_.end(), [&](const TurnZone& zone) {
        return geodesy::haversine_nm(lat, lon, zone.lat, zone.lon) <= zone.radius_nm + tolerance_nm;
    });
}

bool PathLibrary::is_on_procedure(double lat, double lon, double tolerance_nm) const {
    const GeoPoint point{lat, lon};
    return std::any_of(list_procedures_.begin(), list_procedures_.end(), [&](const ProcedureRecord& procedure) {
        if (procedure.centerline.size() < 2) {
            return false;
        }
        const geodesy::PolylineProjection projection = geodesy::point_to_polyline_distance_nm(point, procedure.centerline);
        return projection.distance_nm <= procedure.width_nm + tolerance_nm;
    });
}

bool PathLibrary::is_in_learned_corridor(double lat, double lon) const {
    const GeoPoint point{lat, lon};
    return std::any_of(list_corridors_.begin(), list_corridors_.end(), [&point](const Polygon& corridor) {
        return geodesy::is_point_in_polygon(point, corridor);
    });
}

bool PathLibrary::is_flightable(double lat, double lon) const {
    return struct_heatmap_.is_flightable(lat, lon);
}

std::vector<PathRecord> parse_path_records(const json& document, double default_width_nm) {
    std::vector<PathRecord> paths{};
    const auto append = [&paths, default_width_nm](const json& entries, const std::string& default_type) {
        for (const json& entry : entries) {
            PathRecord path{};
            path.id = entry.value("id", std::string{"unknown"});
            path.type = entry.value("type", default_type);
            path.origin = optional_code(entry, "origin");
            path.destination = optional_code(entry, "destination");
            path.centerline = parse_centerline(entry);
            path.width_nm = entry.value("width_nm", default_width_nm);
            path.member_count = entry.value("member_count", entry.value("num_flights", 0));
            path.signature = entry.value("signature", std::vector<int>{});
            paths.push_back(std::move(path));
        }
    };
    if (const auto iter = document.find("paths"); iter != document.end() && iter->is_array()) {
        append(*iter, "learned");
    }
    if (const auto iter = document.find("emerging_paths"); iter != document.end() && iter->is_array()) {
        append(*iter, k_emerging_type);
    }
    return paths;
}

std::vector<EmergingBucket> parse_emerging_buckets(const json& document) {
    std::vector<EmergingBucket> buckets{};
    const auto iter = document.find("emerging_buckets");
    if (iter == document.end() || !iter->is_array()) {
        return buckets;
    }
    for (const json& entry : *iter) {
        EmergingBucket bucket{};
        bucket.signature = entry.value("signature", std::vector<int>{});
        bucket.count = entry.value("count", 0);
        bucket.flight_ids = entry.value("flight_ids", std::vector<std::string>{});
        buckets.push_back(std::move(bucket));
    }
    return buckets;
}

std::vector<TubeRecord> parse_tube_records(const json& document, int min_od_members) {
    std::vector<TubeRecord> parsed{};
    const auto iter = document.find("tubes");
    if (iter == document.end() || !iter->is_array()) {
        return parsed;
    }
    for (const json& entry : *iter) {
        TubeRecord tube{};
        tube.id = entry.value("id", std::string{"unknown"});
        tube.origin = optional_code(entry, "origin");
        tube.destination = optional_code(entry, "destination");
        tube.min_alt_ft = entry.value("min_alt_ft", 0.0);
        tube.max_alt_ft = entry.value("max_alt_ft", 50000.0);
        tube.member_count = entry.value("member_count", 0);
        if (const auto geometry = entry.find("geometry"); geometry != entry.end() && geometry->is_array()) {
            for (const json& vertex : *geometry) {
                if (vertex.is_array() && vertex.size() >= 2) {
                    tube.geometry.push_back(GeoPoint{vertex[0].get<double>(), vertex[1].get<double>()});
                }
            }
        }
        parsed.push_back(std::move(tube));
    }

    // Sparse O/D pairs are not trusted as reference geometry.
    std::vector<TubeRecord> kept{};
    for (const TubeRecord& tube : parsed) {
        int pair_members = 0;
        for (const TubeRecord& other : parsed) {
            if (other.origin == tube.origin && other.destination == tube.destination) {
                pair_members += other.member_count;
            }
        }
        if (pair_members > min_od_members) {
            kept.push_back(tube);
        }
    }
    return kept;
}

std::vector<TurnZone> parse_turn_zones(const json& document) {
    std::vector<TurnZone> zones{};
    const auto iter = document.find("zones");
    if (iter == document.end() || !iter->is_array()) {
        return zones;
    }
    for (const json& entry : *iter) {
        if (!entry.contains("lat") || !entry.contains("lon")) {
            continue;
        }
        TurnZone zone{};
        zone.id = entry.value("id", std::string{});
        zone.lat = entry.at("lat").get<double>();
        zone.lon = entry.at("lon").get<double>();
        zone.radius_nm = entry.value("radius_nm", zone.radius_nm);
        zones.push_back(std::move(zone));
    }
    return zones;
}

std::vector<ProcedureRecord> parse_procedures(const json& document) {
    std::vector<ProcedureRecord> procedures{};
    const auto iter = document.find("procedures");
    if (iter == document.end() || !iter->is_array()) {
        return procedures;
    }
    for (const json& entry : *iter) {
        ProcedureRecord procedure{};
        procedure.id = entry.value("id", std::string{});
        procedure.airport = entry.value("airport", std::string{});
        procedure.centerline = parse_centerline(entry);
        procedure.width_nm = entry.value("width_nm", procedure.width_nm);
        procedures.push_back(std::move(procedure));
    }
    return procedures;
}

OccupancyHeatmap parse_heatmap(const json& document, double default_cell_deg, int default_threshold) {
    const json& origin = document.at("origin");
    if (!origin.is_array() || origin.size() < 2) {
        throw ConfigurationError("Heatmap origin must be [lat, lon]");
    }
    try {
        return OccupancyHeatmap{
            GeoPoint{origin[0].get<double>(), origin[1].get<double>()},
            document.value("cell_size_deg", default_cell_deg),
            document.value("threshold", default_threshold),
            document.at("rows").get<int>(),
            document.at("cols").get<int>(),
            document.at("counts").get<std::vector<int>>(),
        };
    } catch (const std::invalid_argument& error) {
        throw ConfigurationError(std::string{"Invalid heatmap: "} + error.what());
    }
}

PathLibraryStore::PathLibraryStore(LibraryDocumentPaths documents, PathLearningParameters parameters)
    : logger_(get_logger()),
      struct_documents_(std::move(documents)),
      struct_parameters_(std::move(parameters)),
      persistent_(!struct_documents_.paths_file.empty()) {
    const double default_width = struct_parameters_.default_width_nm;
    const int min_members = struct_parameters_.tube_min_od_members;

    auto paths = load_layer<std::vector<PathRecord>>(struct_documents_.paths_file, [default_width](const json& document) {
        return parse_path_records(document, default_width);
    });
    auto buckets = load_layer<std::vector<EmergingBucket>>(struct_documents_.paths_file, parse_emerging_buckets);
    auto tubes = load_layer<std::vector<TubeRecord>>(struct_documents_.tubes_file, [min_members](const json& document) {
        return parse_tube_records(document, min_members);
    });
    auto zones = load_layer<std::vector<TurnZone>>(struct_documents_.turns_file, parse_turn_zones);
    auto procedures = load_layer<std::vector<ProcedureRecord>>(struct_documents_.sid_file, parse_procedures);
    auto arrivals = load_layer<std::vector<ProcedureRecord>>(struct_documents_.star_file, parse_procedures);
    procedures.insert(procedures.end(), arrivals.begin(), arrivals.end());
    const double cell_deg = struct_parameters_.heatmap_cell_deg;
    const int threshold = struct_parameters_.heatmap_threshold;
    auto heatmap = load_layer<OccupancyHeatmap>(struct_documents_.heatmap_file, [cell_deg, threshold](const json& document) {
        return parse_heatmap(document, cell_deg, threshold);
    });

    logger_->info(
        "Path library loaded: paths={} tubes={} turn_zones={} procedures={} heatmap={}",
        paths.size(),
        tubes.size(),
        zones.size(),
        procedures.size(),
        heatmap.loaded()
    );

    library_ = std::make_shared<const PathLibrary>(
        std::move(paths),
        std::move(tubes),
        std::move(zones),
        std::move(procedures),
        std::move(heatmap),
        std::move(buckets)
    );
}

PathLibraryStore::PathLibraryStore(PathLibrary library, PathLearningParameters parameters)
    : logger_(get_logger()),
      struct_parameters_(std::move(parameters)),
      library_(std::make_shared<const PathLibrary>(std::move(library))) {}

std::shared_ptr<const PathLibrary> PathLibraryStore::snapshot() const {
    std::scoped_lock lock{snapshot_mutex_};
    return library_;
}

void PathLibraryStore::publish(std::shared_ptr<const PathLibrary> library) {
    std::scoped_lock lock{snapshot_mutex_};
    library_ = std::move(library);
}

std::optional<EmergingUpdate> PathLibraryStore::record_off_path_flight(
    const std::string& flight_id,
    const std::vector<TrackPoint>& track_points,
    const std::vector<TrackPoint>& far_points
) {
    if (far_points.empty()) {
        return std::nullopt;
    }
    std::vector<int> signature = compress_heading_signature(
        far_points,
        struct_parameters_.emerging_bin_seconds,
        struct_parameters_.emerging_similarity_deg
    );
    if (signature.empty()) {
        return std::nullopt;
    }

    std::scoped_lock writer_lock{writer_mutex_};
    const std::shared_ptr<const PathLibrary> current = snapshot();

    std::vector<EmergingBucket> buckets = current->emerging_buckets();
    auto bucket = std::find_if(buckets.begin(), buckets.end(), [&signature](const EmergingBucket& candidate) {
        return candidate.signature == signature;
    });
    if (bucket == buckets.end()) {
        buckets.push_back(EmergingBucket{signature, 0, {}});
        bucket = std::prev(buckets.end());
    }

    EmergingUpdate update{};
    update.signature = signature;
    if (std::find(bucket->flight_ids.begin(), bucket->flight_ids.end(), flight_id) != bucket->flight_ids.end()) {
        update.bucket_count = bucket->count;
        return update;
    }
    bucket->count += 1;
    bucket->flight_ids.push_back(flight_id);
    update.bucket_count = bucket->count;

    std::vector<PathRecord> paths = current->paths();
    if (struct_parameters_.promotion_enabled && bucket->count >= struct_parameters_.emerging_bucket_size) {
        const std::vector<ResampledPoint> resampled = resample_track_points(track_points, struct_parameters_.num_samples);
        if (!resampled.empty()) {
            PathRecord promoted{};
            promoted.type = k_emerging_type;
            for (const ResampledPoint& sample : resampled) {
                promoted.centerline.push_back(GeoPoint{sample.lat, sample.lon});
            }
            std::vector<double> offsets{};
            offsets.reserve(track_points.size());
            for (const TrackPoint& point : track_points) {
                offsets.push_back(geodesy::point_to_polyline_distance_nm(GeoPoint{point.lat, point.lon}, promoted.centerline).distance_nm);
            }
            promoted.width_nm = std::max(population_stddev(offsets), struct_parameters_.min_emerging_width_nm);

            const auto emerging_count = std::count_if(paths.begin(), paths.end(), [](const PathRecord& path) {
                return path.type == k_emerging_type;
            });
            promoted.id = "emerging_" + std::to_string(emerging_count + 1);
            promoted.member_count = bucket->count;
            promoted.signature = signature;
            update.promoted_path_id = promoted.id;

            logger_->info("Promoted emerging path {} from {} flights (width {:.2f} nm)", promoted.id, promoted.member_count, promoted.width_nm);
            paths.push_back(std::move(promoted));
            buckets.erase(bucket);
        }
    }

    auto next = std::make_shared<const PathLibrary>(
        std::move(paths),
        current->tubes(),
        current->turn_zones(),
        current->procedures(),
        current->heatmap(),
        std::move(buckets),
        current->version() + 1
    );
    persist(*next);
    publish(std::move(next));
    return update;
}

void PathLibraryStore::persist(const PathLibrary& library) const {
    if (!persistent_) {
        return;
    }

    json document{
        {"paths", json::array()},
        {"emerging_paths", json::array()},
        {"emerging_buckets", json::array()},
    };
    for (const PathRecord& path : library.paths()) {
        document[path.type == k_emerging_type ? "emerging_paths" : "paths"].push_back(path_to_json(path));
    }
    for (const EmergingBucket& bucket : library.emerging_buckets()) {
        document["emerging_buckets"].push_back(bucket_to_json(bucket));
    }

    const std::filesystem::path& target = struct_documents_.paths_file;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path());
    }
    std::filesystem::path temporary = target;
    temporary += ".tmp";
    {
        std::ofstream stream{temporary, std::ios::trunc};
        if (!stream) {
            throw std::runtime_error("Unable to write path library to " + temporary.string());
        }
        stream << document.dump(2);
        if (!stream) {
            throw std::runtime_error("Failed while writing path library to " + temporary.string());
        }
    }
    std::filesystem::rename(temporary, target);
    logger_->debug("Persisted path library version {} to {}", library.version(), target.string());
}

}  // namespace flight_anomaly
