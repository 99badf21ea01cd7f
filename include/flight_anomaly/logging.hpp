// === Logging =================================================================
//
// One process-wide spdlog logger shared by the engine, the rules, the path
// library and the evaluator. Reports own stdout, so the console sink writes to
// stderr; the rotating file sink keeps one JSON object per line.

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace flight_anomaly {

/** @brief Sink layout and verbosity of the shared logger. */
struct LogSettings final {
    std::string log_directory{"logs"};
    std::string file_name{"flight_anomaly.log"};
    std::string level{"info"};
    std::size_t max_file_size_bytes{10 * 1024 * 1024};
    std::size_t max_files{5};
};

/**
 * @brief Build the shared logger on first use and return it.
 *
 * Later calls return the existing logger and ignore @p settings. Throws
 * std::runtime_error when the log directory cannot be created.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const LogSettings& settings);

/** @brief The shared logger; throws std::runtime_error before initialize_logger. */
std::shared_ptr<spdlog::logger> get_logger();

/** @brief Apply a level name such as "debug"; unknown names fall back to info. */
void set_log_level(const std::string& level_name);

/** @brief @p text as a quoted, escaped JSON string for inline structured events. */
[[nodiscard]] std::string json_quoted(std::string_view text);

}  // namespace flight_anomaly
