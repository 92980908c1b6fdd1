#include "geofence_service/zone_registry.hpp"

#include <cmath>

#include <fmt/format.h>

#include "geofence_service/errors.hpp"
#include "geofence_service/geometry.hpp"

namespace geofence_service {

namespace {
constexpr std::size_t k_min_polygon_vertices{3};
}  // namespace

ZoneRegistry::ZoneRegistry(std::vector<Zone> zones)
    : list_zones_(std::move(zones)),
      logger_(get_logger()) {
    map_index_by_id_.reserve(list_zones_.size());
    for (std::size_t index = 0; index < list_zones_.size(); ++index) {
        const Zone& zone = list_zones_[index];
        validate_zone(zone);
        if (!map_index_by_id_.emplace(zone.identifier, index).second) {
            throw ConfigurationError(fmt::format("Duplicate zone id '{}'", zone.identifier));
        }
    }
    logger_->info("Zone registry loaded with {} zones", list_zones_.size());
}

const std::vector<Zone>& ZoneRegistry::all() const noexcept {
    return list_zones_;
}

std::optional<Zone> ZoneRegistry::by_id(const std::string& identifier) const {
    const auto iterator_index = map_index_by_id_.find(identifier);
    if (iterator_index == map_index_by_id_.end()) {
        return std::nullopt;
    }
    return list_zones_[iterator_index->second];
}

std::size_t ZoneRegistry::size() const noexcept {
    return list_zones_.size();
}

void ZoneRegistry::validate_zone(const Zone& zone) {
    if (zone.identifier.empty()) {
        throw ConfigurationError("Zone id must not be empty");
    }
    switch (zone.kind) {
        case ZoneKind::Circle:
            if (!is_valid_position(zone.center)) {
                throw ConfigurationError(fmt::format("Zone '{}' has an out-of-range center", zone.identifier));
            }
            if (!std::isfinite(zone.radius_m) || zone.radius_m <= 0.0) {
                throw ConfigurationError(fmt::format("Zone '{}' needs a positive radius, got {}", zone.identifier, zone.radius_m));
            }
            break;
        case ZoneKind::Polygon:
            for (const Position& vertex : zone.ring) {
                if (!is_valid_position(vertex)) {
                    throw ConfigurationError(fmt::format("Zone '{}' has an out-of-range vertex", zone.identifier));
                }
            }
            if (count_distinct_vertices(zone.ring) < k_min_polygon_vertices) {
                throw ConfigurationError(fmt::format("Zone '{}' is a degenerate polygon ({} distinct vertices)",
                                                     zone.identifier,
                                                     count_distinct_vertices(zone.ring)));
            }
            break;
    }
}

}  // namespace geofence_service
