#include "geofence_service/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace geofence_service {

namespace {

constexpr double k_metres_per_degree_lat{111'132.0};  /**< Mean metres per degree of latitude. */
constexpr double k_metres_per_degree_lon{111'320.0};  /**< Metres per degree of longitude at the equator. */
constexpr double k_boundary_tolerance_m{1e-6};        /**< Slack absorbing projection round-off on edges. */
constexpr std::size_t k_min_polygon_vertices{3};

constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

bool same_vertex(const Position& lhs, const Position& rhs) noexcept {
    return lhs.latitude_deg == rhs.latitude_deg && lhs.longitude_deg == rhs.longitude_deg;
}

/**
 * @brief True when @p point lies on segment [a, b] within the boundary tolerance.
 */
bool on_segment(const PlanarPoint& point, const PlanarPoint& a, const PlanarPoint& b) noexcept {
    const double edge_x = b.x_m - a.x_m;
    const double edge_y = b.y_m - a.y_m;
    const double edge_length = std::hypot(edge_x, edge_y);
    if (edge_length == 0.0) {
        return std::hypot(point.x_m - a.x_m, point.y_m - a.y_m) <= k_boundary_tolerance_m;
    }
    const double cross = edge_x * (point.y_m - a.y_m) - edge_y * (point.x_m - a.x_m);
    if (std::abs(cross) / edge_length > k_boundary_tolerance_m) {
        return false;
    }
    const double dot = (point.x_m - a.x_m) * edge_x + (point.y_m - a.y_m) * edge_y;
    const double slack = k_boundary_tolerance_m * edge_length;
    return dot >= -slack && dot <= edge_length * edge_length + slack;
}

bool circle_contains(const Zone& zone, const Position& position) noexcept {
    if (!(zone.radius_m > 0.0) || !is_valid_position(zone.center)) {
        return false;
    }
    return planar_distance_m(zone.center, position) <= zone.radius_m;
}

/**
 * @brief Even-odd ray casting on the projected ring, with edges counted inside.
 */
bool polygon_contains(const Zone& zone, const Position& position) noexcept {
    const std::vector<Position>& ring = zone.ring;
    if (count_distinct_vertices(ring) < k_min_polygon_vertices) {
        return false;
    }
    if (!std::all_of(ring.begin(), ring.end(), [](const Position& vertex) { return is_valid_position(vertex); })) {
        return false;
    }

    const Position& origin = ring.front();
    const PlanarPoint point = project_to_plane(position, origin);

    bool inside = false;
    const std::size_t count = ring.size();
    for (std::size_t index = 0, previous = count - 1; index < count; previous = index++) {
        const PlanarPoint a = project_to_plane(ring[previous], origin);
        const PlanarPoint b = project_to_plane(ring[index], origin);
        if (on_segment(point, a, b)) {
            return true;
        }
        if ((b.y_m > point.y_m) != (a.y_m > point.y_m)) {
            const double crossing_x = (a.x_m - b.x_m) * (point.y_m - b.y_m) / (a.y_m - b.y_m) + b.x_m;
            if (point.x_m < crossing_x) {
                inside = !inside;
            }
        }
    }
    return inside;
}

}  // namespace

bool is_valid_position(const Position& position) noexcept {
    return std::isfinite(position.latitude_deg)
        && std::isfinite(position.longitude_deg)
        && position.latitude_deg >= -90.0 && position.latitude_deg <= 90.0
        && position.longitude_deg >= -180.0 && position.longitude_deg <= 180.0;
}

PlanarPoint project_to_plane(const Position& position, const Position& origin) noexcept {
    const double scale_lon = k_metres_per_degree_lon * std::cos(degrees_to_radians(origin.latitude_deg));
    return PlanarPoint{
        (position.longitude_deg - origin.longitude_deg) * scale_lon,
        (position.latitude_deg - origin.latitude_deg) * k_metres_per_degree_lat
    };
}

double planar_distance_m(const Position& from, const Position& to) noexcept {
    const PlanarPoint offset = project_to_plane(to, from);
    return std::hypot(offset.x_m, offset.y_m);
}

std::size_t count_distinct_vertices(const std::vector<Position>& ring) noexcept {
    std::size_t distinct = 0;
    for (std::size_t index = 0; index < ring.size(); ++index) {
        const auto first_match = std::find_if(ring.begin(), ring.begin() + static_cast<std::ptrdiff_t>(index),
                                              [&](const Position& vertex) { return same_vertex(vertex, ring[index]); });
        if (first_match == ring.begin() + static_cast<std::ptrdiff_t>(index)) {
            ++distinct;
        }
    }
    return distinct;
}

bool contains(const Zone& zone, const Position& position) noexcept {
    if (!is_valid_position(position)) {
        return false;
    }
    switch (zone.kind) {
        case ZoneKind::Circle:
            return circle_contains(zone, position);
        case ZoneKind::Polygon:
            return polygon_contains(zone, position);
    }
    return false;
}

std::vector<std::string> zones_containing(const std::vector<Zone>& zones, const Position& position) {
    std::vector<std::string> list_zone_ids;
    for (const Zone& zone : zones) {
        if (contains(zone, position)) {
            list_zone_ids.push_back(zone.identifier);
        }
    }
    return list_zone_ids;
}

}  // namespace geofence_service
