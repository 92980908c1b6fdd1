// === Zone Loader =============================================================
//
// Reads zone definitions from the JSON file named by the configuration. Shape
// checks happen here; geometric validation belongs to the ZoneRegistry.

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "geofence_service/zone.hpp"

namespace geofence_service {

/**
 * @brief Load every zone listed under the top-level "zones" array.
 *
 * @throws ConfigurationError when the file cannot be read or parsed, or when
 *         an entry is missing required fields.
 */
[[nodiscard]] std::vector<Zone> load_zones(const std::filesystem::path& path_zones_file);

/** @brief Same as load_zones() for an in-memory JSON document. */
[[nodiscard]] std::vector<Zone> parse_zones(const std::string& json_text);

/** @brief Decode a single zone entry; throws ConfigurationError on bad shape. */
[[nodiscard]] Zone zone_from_json(const nlohmann::json& json);

}  // namespace geofence_service
