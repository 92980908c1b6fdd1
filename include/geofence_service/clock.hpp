// === Clock ===================================================================
//
// Wall-clock source injected into the transition engine so that the future
// timestamp guard and the debounce window can be driven from tests.

#pragma once

#include "geofence_service/types.hpp"

namespace geofence_service {

/** @brief Abstract source of the current wall-clock time. */
class Clock {
  public:
    virtual ~Clock() = default;

    /** @brief Current processing time. */
    [[nodiscard]] virtual WallTime now() const = 0;
};

/** @brief Clock backed by std::chrono::system_clock. */
class SystemClock final : public Clock {
  public:
    [[nodiscard]] WallTime now() const override;
};

}  // namespace geofence_service
