#include "flight_anomaly/logging.hpp"

#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace flight_anomaly {

namespace {
constexpr const char* k_logger_name{"flight_anomaly"};
constexpr const char* k_console_pattern{"[%l] %v"};
constexpr const char* k_file_pattern{R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","logger":"%n","msg":%v})"};

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> shared_logger;

std::vector<spdlog::sink_ptr> make_sinks(const LogSettings& settings) {
    const std::filesystem::path directory{settings.log_directory};
    std::error_code error;
    std::filesystem::create_directories(directory, error);
    if (error) {
        throw std::runtime_error("Unable to create log directory at " + directory.string() + ": " + error.message());
    }

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(k_console_pattern);

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (directory / settings.file_name).string(),
        settings.max_file_size_bytes,
        settings.max_files
    );
    file_sink->set_pattern(k_file_pattern);
    return {console_sink, file_sink};
}

void apply_level(spdlog::logger& logger, const std::string& level_name) {
    const auto level = spdlog::level::from_str(level_name);
    // from_str maps unknown names to off; only "off" itself may silence the engine.
    if (level == spdlog::level::off && level_name != "off") {
        logger.set_level(spdlog::level::info);
        logger.warn("Unknown log level {}; using info", json_quoted(level_name));
        return;
    }
    logger.set_level(level);
}

}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const LogSettings& settings) {
    std::scoped_lock lock{logger_mutex};
    if (shared_logger) {
        return shared_logger;
    }

    const auto sinks = make_sinks(settings);
    auto logger = std::make_shared<spdlog::logger>(k_logger_name, sinks.begin(), sinks.end());
    apply_level(*logger, settings.level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    shared_logger = std::move(logger);
    return shared_logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    std::scoped_lock lock{logger_mutex};
    if (!shared_logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return shared_logger;
}

void set_log_level(const std::string& level_name) {
    apply_level(*get_logger(), level_name);
}

std::string json_quoted(std::string_view text) {
    return nlohmann::json(std::string{text}).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace flight_anomaly
