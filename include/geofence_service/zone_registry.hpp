// === Zone Registry ===========================================================
//
// Immutable, process-lifetime collection of zone definitions. Validation runs
// once at construction; afterwards the registry is read without locking.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "geofence_service/logging.hpp"
#include "geofence_service/zone.hpp"

namespace geofence_service {

/** @brief Read-only lookup over the zones loaded at startup. */
class ZoneRegistry final {
  public:
    /**
     * @brief Validate and adopt @p zones.
     *
     * @throws ConfigurationError on duplicate or empty ids, out-of-range
     *         coordinates, non-positive radii, or polygons with fewer than
     *         three distinct vertices.
     */
    explicit ZoneRegistry(std::vector<Zone> zones);

    /** @brief Every zone in load order. */
    [[nodiscard]] const std::vector<Zone>& all() const noexcept;
    /** @brief Zone with @p identifier, or std::nullopt. */
    [[nodiscard]] std::optional<Zone> by_id(const std::string& identifier) const;
    [[nodiscard]] std::size_t size() const noexcept;

  private:
    static void validate_zone(const Zone& zone);

    std::vector<Zone> list_zones_;
    std::unordered_map<std::string, std::size_t> map_index_by_id_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace geofence_service
