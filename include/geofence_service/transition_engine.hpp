// === Transition Engine =======================================================
//
// Turns a location event into enter/exit transitions. Validation runs first
// and never touches the store; idempotency, debounce, evaluation and commit
// then run under the vehicle's exclusive lock so events for one vehicle are
// linearized while other vehicles proceed in parallel.

#pragma once

#include <memory>
#include <set>
#include <string>

#include "geofence_service/clock.hpp"
#include "geofence_service/logging.hpp"
#include "geofence_service/transition.hpp"
#include "geofence_service/vehicle_state_store.hpp"
#include "geofence_service/zone_registry.hpp"

namespace geofence_service {

/**
 * @brief Timing policy for the engine.
 *
 * Populated from Configuration at startup and immutable afterwards.
 */
struct EngineConfig final {
    Duration debounce_window{Duration{2.0}};   /**< Minimum processing interval since the last accepted event; 0 disables. */
    Duration max_future_skew{Duration{1.0}};   /**< Tolerated lead of event time over processing time. */
};

/** @brief Stateless orchestrator over the registry, store and clock. */
class TransitionEngine final {
  public:
    TransitionEngine(const ZoneRegistry& registry, VehicleStateStore& store, const Clock& clock, EngineConfig config);

    /**
     * @brief Process one event end to end.
     *
     * @throws ValidationError if the event is malformed or too far in the
     *         future; the store is left untouched.
     * @throws StateConflictError if the commit lost a compare-and-set race.
     */
    [[nodiscard]] TransitionResult process_event(const LocationEvent& event);

  private:
    void validate(const LocationEvent& event, WallTime now) const;
    [[nodiscard]] bool within_debounce(const VehicleState& previous, WallTime now) const;
    [[nodiscard]] std::set<std::string> evaluate_membership(const Position& position) const;
    void commit(const VehicleState& previous, VehicleState next);

    const ZoneRegistry& registry_;
    VehicleStateStore& store_;
    const Clock& clock_;
    EngineConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace geofence_service
