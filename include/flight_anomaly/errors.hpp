// === Errors ==================================================================
//
// Exception types raised across module boundaries. Configuration errors are
// fatal at startup; repository errors are caught by the rule that issued the
// query and turned into a skipped result.

#pragma once

#include <stdexcept>
#include <string>

namespace flight_anomaly {

/** @brief Raised when a rule or geometry document is missing or malformed. */
class ConfigurationError final : public std::runtime_error {
  public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/** @brief Raised by FlightRepository implementations when a lookup fails. */
class RepositoryError final : public std::runtime_error {
  public:
    explicit RepositoryError(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace flight_anomaly
