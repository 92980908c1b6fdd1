// === Zone ====================================================================
//
// Static zone definitions (circles and polygons) loaded once at startup and
// owned by the ZoneRegistry for the lifetime of the process.

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "geofence_service/types.hpp"

namespace geofence_service {

/** @brief Geometry family of a zone. */
enum class ZoneKind {
    Circle,   /**< Center plus radius in metres. */
    Polygon   /**< Ordered ring of vertices, implicitly closed. */
};

/**
 * @brief Named region used for containment tests.
 *
 * Circle zones use @ref center and @ref radius_m; polygon zones use @ref ring.
 * The unused members are left empty.
 */
struct Zone final {
    std::string identifier{};       /**< Unique, immutable zone id. */
    std::string name{};             /**< Human-readable label. */
    ZoneKind kind{ZoneKind::Circle};
    Position center{};              /**< Circle center. */
    double radius_m{};              /**< Circle radius in metres. */
    std::vector<Position> ring{};   /**< Polygon vertices without the closing point. */
};

[[nodiscard]] std::string_view to_string(ZoneKind kind) noexcept;

/** @brief Parse "circle" or "polygon"; std::nullopt for anything else. */
[[nodiscard]] std::optional<ZoneKind> zone_kind_from_string(std::string_view text) noexcept;

}  // namespace geofence_service
