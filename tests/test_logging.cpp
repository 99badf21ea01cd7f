#include <catch2/catch.hpp>

#include "flight_anomaly/logging.hpp"
#include "logging_test_fixture.hpp"

using namespace flight_anomaly;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    flight_anomaly::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("Structured log values are quoted JSON strings") {
    REQUIRE(json_quoted("ely381") == R"("ely381")");
    REQUIRE(json_quoted(R"(bad "track" file)") == R"("bad \"track\" file")");
    REQUIRE(json_quoted("line\nbreak") == R"("line\nbreak")");
}

TEST_CASE("Log levels are applied by name") {
    const auto logger = get_logger();
    REQUIRE(initialize_logger(LogSettings{}) == logger);

    set_log_level("debug");
    REQUIRE(logger->level() == spdlog::level::debug);

    set_log_level("chatty");
    REQUIRE(logger->level() == spdlog::level::info);

    set_log_level("warn");
    REQUIRE(logger->level() == spdlog::level::warn);
}
