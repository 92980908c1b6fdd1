// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed by the service: logging,
// zone source, engine timing policy, and dispatcher sizing.
// `ConfigurationLoader` translates environment variables into this structure
// so downstream modules never touch `std::getenv` directly.

#pragma once

#include <cstddef>
#include <string>

#include "geofence_service/transition_engine.hpp"

namespace geofence_service {

/**
 * @brief Immutable bundle of runtime knobs for the geofence service.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};    /**< Destination directory for structured logs. */
    std::string log_level{};        /**< spdlog level name. */
    std::string environment{};      /**< Deployment label reported by health checks. */
    std::string zones_path{};       /**< JSON file holding zone definitions. */
    EngineConfig engine{};          /**< Debounce and future-skew policy. */
    std::size_t worker_threads{};   /**< Event dispatcher pool size. */
    std::size_t queue_capacity{};   /**< Pending events before the reader blocks. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /** @brief Read the environment, initialize logging, and return the result. */
    static Configuration load();

  private:
    static EngineConfig load_engine_config();
};

}  // namespace geofence_service
