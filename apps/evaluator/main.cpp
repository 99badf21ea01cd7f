#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "flight_anomaly/configuration.hpp"
#include "flight_anomaly/flight_repository.hpp"
#include "flight_anomaly/logging.hpp"
#include "flight_anomaly/path_library.hpp"
#include "flight_anomaly/rule_engine.hpp"
#include "flight_anomaly/track_io.hpp"
#include "flight_anomaly/version.hpp"

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <track.json> [metadata.json]\n"
              << "Environment: FLIGHT_ANOMALY_CONFIG_ROOT, FLIGHT_ANOMALY_LOG_LEVEL\n";
}

}  // namespace

int main(int argc, char** argv) {
    using namespace flight_anomaly;

    if (argc < 2 || argc > 3) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        const char* config_root = std::getenv("FLIGHT_ANOMALY_CONFIG_ROOT");
        Configuration configuration = ConfigurationLoader::load(config_root != nullptr ? config_root : "data");

        get_logger()->info("flight_anomaly_evaluator {}", k_version);

        const FlightTrack track = load_track(argv[1]);
        std::optional<FlightMetadata> metadata;
        if (argc == 3) {
            metadata = load_metadata(argv[2]);
        }

        InMemoryFlightRepository repository{};
        repository.upsert_flight(track);

        PathLibraryStore library_store{configuration.documents, configuration.parameters.path_learning};
        const RuleEngine engine{
            configuration.parameters,
            configuration.definitions,
            library_store,
            &repository,
            configuration.workers,
        };

        const FlightReport report = engine.evaluate_track(track, metadata.has_value() ? &*metadata : nullptr);
        std::cout << nlohmann::json(report).dump(2) << '\n';
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
