// === Test Logging ============================================================
//
// Every test translation unit that builds a rule evaluator, the engine or the
// path library store initialises the shared logger through this helper first.

#pragma once

#include <filesystem>

#include "flight_anomaly/logging.hpp"

namespace flight_anomaly::test {

inline void ensure_logger_initialized() {
    static const bool initialized = []() {
        LogSettings settings{};
        settings.log_directory = (std::filesystem::temp_directory_path() / "flight_anomaly_tests_logs").string();
        settings.level = "warn";
        return initialize_logger(settings) != nullptr;
    }();
    static_cast<void>(initialized);
}

}  // namespace flight_anomaly::test
