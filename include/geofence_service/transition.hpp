#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "geofence_service/types.hpp"

namespace geofence_service {

/** @brief Inbound vehicle position report. */
struct LocationEvent final {
    std::string vehicle_id{};                /**< Reporting vehicle. */
    Position position{};                     /**< Reported position. */
    WallTime timestamp{};                    /**< Device-side event time. */
    std::optional<std::string> event_id{};   /**< Client idempotency key. */
    std::optional<double> speed_kmh{};       /**< Carried through; unused for geometry. */
    std::optional<double> heading_deg{};     /**< Carried through; unused for geometry. */
};

/** @brief How an accepted event was handled. */
enum class TransitionOutcome {
    Applied,    /**< Zones were re-evaluated and the diff committed. */
    Duplicate,  /**< Event id matched the last accepted id; nothing changed. */
    Debounced   /**< Position and timestamp advanced; zone evaluation skipped. */
};

/** @brief Enter/exit sets produced by one event, both sorted by zone id. */
struct TransitionResult final {
    std::string vehicle_id{};
    std::vector<std::string> entered{};
    std::vector<std::string> exited{};
    WallTime at{};
    Position position{};
    TransitionOutcome outcome{TransitionOutcome::Applied};

    [[nodiscard]] bool empty() const noexcept { return entered.empty() && exited.empty(); }
};

[[nodiscard]] std::string_view to_string(TransitionOutcome outcome) noexcept;

}  // namespace geofence_service
