// === Timestamps ==============================================================
//
// ISO-8601 conversions for wall-clock time points. Output is always UTC with
// millisecond precision and a trailing 'Z'.

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "geofence_service/types.hpp"

namespace geofence_service {

/** @brief Format @p time as YYYY-MM-DDTHH:MM:SS.mmmZ. */
[[nodiscard]] std::string format_iso8601(WallTime time);

/**
 * @brief Parse YYYY-MM-DDTHH:MM:SS[.fraction][Z|+HH:MM|-HH:MM].
 *
 * A space may replace the 'T'. Timestamps without a zone designator are UTC.
 * Returns std::nullopt on any syntax or range error.
 */
[[nodiscard]] std::optional<WallTime> parse_iso8601(std::string_view text);

}  // namespace geofence_service
