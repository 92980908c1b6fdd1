// === Geometry Evaluator ======================================================
//
// Pure containment tests for circle and polygon zones. Coordinates are
// projected onto a local flat plane (equirectangular approximation) which is
// accurate for zones spanning a few kilometres.

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "geofence_service/types.hpp"
#include "geofence_service/zone.hpp"

namespace geofence_service {

/** @brief Position projected to metres on the local plane. */
struct PlanarPoint final {
    double x_m{};  /**< Eastward metres. */
    double y_m{};  /**< Northward metres. */
};

/** @brief True when both coordinates are finite and within their ranges. */
[[nodiscard]] bool is_valid_position(const Position& position) noexcept;

/**
 * @brief Project @p position to metres relative to @p origin.
 *
 * Longitude differences are scaled by the cosine of the origin latitude so the
 * projection is stable for every vertex of a single zone.
 */
[[nodiscard]] PlanarPoint project_to_plane(const Position& position, const Position& origin) noexcept;

/** @brief Flat-earth distance between two positions in metres. */
[[nodiscard]] double planar_distance_m(const Position& from, const Position& to) noexcept;

/** @brief Number of pairwise-distinct vertices in a ring. */
[[nodiscard]] std::size_t count_distinct_vertices(const std::vector<Position>& ring) noexcept;

/**
 * @brief Decide whether @p position lies inside @p zone.
 *
 * Boundaries are inclusive for both kinds. Degenerate geometry (fewer than
 * three distinct polygon vertices, a non-positive radius, non-finite
 * coordinates) never contains anything.
 */
[[nodiscard]] bool contains(const Zone& zone, const Position& position) noexcept;

/** @brief Ids of every zone in @p zones containing @p position, in input order. */
[[nodiscard]] std::vector<std::string> zones_containing(const std::vector<Zone>& zones, const Position& position);

}  // namespace geofence_service
