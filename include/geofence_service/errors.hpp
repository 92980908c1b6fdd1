// === Errors ==================================================================
//
// Exception taxonomy surfaced by the geofence core. Validation failures reject
// a single request; configuration failures are fatal at startup.

#pragma once

#include <stdexcept>
#include <string>

namespace geofence_service {

/** @brief Malformed or out-of-range request input; the store is never touched. */
class ValidationError final : public std::invalid_argument {
  public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

/** @brief Inconsistent zone definitions or unreadable configuration. */
class ConfigurationError final : public std::runtime_error {
  public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/** @brief A compare-and-set commit observed a version other than the one read. */
class StateConflictError final : public std::runtime_error {
  public:
    explicit StateConflictError(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace geofence_service
