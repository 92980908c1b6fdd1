#include "geofence_service/transition_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "geofence_service/errors.hpp"
#include "geofence_service/geometry.hpp"
#include "geofence_service/timestamp.hpp"

namespace geofence_service {

namespace {

constexpr double k_max_heading_deg{360.0};

std::vector<std::string> set_minus(const std::set<std::string>& lhs, const std::set<std::string>& rhs) {
    std::vector<std::string> list_difference;
    std::set_difference(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), std::back_inserter(list_difference));
    return list_difference;
}

TransitionResult make_result(const LocationEvent& event, TransitionOutcome outcome) {
    TransitionResult result{};
    result.vehicle_id = event.vehicle_id;
    result.at = event.timestamp;
    result.position = event.position;
    result.outcome = outcome;
    return result;
}

}  // namespace

std::string_view to_string(TransitionOutcome outcome) noexcept {
    switch (outcome) {
        case TransitionOutcome::Applied:
            return "applied";
        case TransitionOutcome::Duplicate:
            return "duplicate";
        case TransitionOutcome::Debounced:
            return "debounced";
    }
    return "unknown";
}

TransitionEngine::TransitionEngine(const ZoneRegistry& registry, VehicleStateStore& store, const Clock& clock, EngineConfig config)
    : registry_(registry),
      store_(store),
      clock_(clock),
      config_(config),
      logger_(get_logger()) {
    if (config_.debounce_window.count() < 0.0 || config_.max_future_skew.count() < 0.0) {
        throw ConfigurationError("Debounce window and future skew must not be negative");
    }
}

TransitionResult TransitionEngine::process_event(const LocationEvent& event) {
    const WallTime now = clock_.now();
    try {
        validate(event, now);
    } catch (const ValidationError& exc) {
        logger_->warn("Rejected event for vehicle '{}': {}", event.vehicle_id, exc.what());
        throw;
    }

    const std::unique_lock<std::mutex> vehicle_lock = store_.acquire(event.vehicle_id);
    const VehicleState previous = store_.get(event.vehicle_id);
    // Sampled under the lock so processing times never run backwards per vehicle.
    const WallTime processed_at = clock_.now();

    if (event.event_id.has_value() && previous.last_event_id == event.event_id) {
        logger_->debug("Duplicate event {} for vehicle {}", event.event_id.value(), event.vehicle_id);
        return make_result(event, TransitionOutcome::Duplicate);
    }

    VehicleState next = previous;
    next.last_event_time = event.timestamp;
    next.last_position = event.position;
    next.last_processed_time = processed_at;
    if (previous.last_event_time.has_value() && event.timestamp < previous.last_event_time.value()) {
        logger_->debug("Vehicle {} reported an older timestamp {}; accepting as latest",
                       event.vehicle_id,
                       format_iso8601(event.timestamp));
    }

    if (within_debounce(previous, processed_at)) {
        // An id-less debounced event keeps the previous idempotency key.
        if (event.event_id.has_value()) {
            next.last_event_id = event.event_id;
        }
        commit(previous, std::move(next));
        logger_->debug("Debounced event for vehicle {} at {}", event.vehicle_id, format_iso8601(event.timestamp));
        return make_result(event, TransitionOutcome::Debounced);
    }

    std::set<std::string> membership = evaluate_membership(event.position);
    TransitionResult result = make_result(event, TransitionOutcome::Applied);
    result.entered = set_minus(membership, previous.current_zones);
    result.exited = set_minus(previous.current_zones, membership);

    next.current_zones = std::move(membership);
    next.last_event_id = event.event_id;
    commit(previous, std::move(next));

    if (!result.empty()) {
        logger_->info("vehicle={} entered=[{}] exited=[{}] lat={} lon={} ts={}",
                      event.vehicle_id,
                      fmt::join(result.entered, ","),
                      fmt::join(result.exited, ","),
                      event.position.latitude_deg,
                      event.position.longitude_deg,
                      format_iso8601(event.timestamp));
    }
    return result;
}

void TransitionEngine::validate(const LocationEvent& event, WallTime now) const {
    if (event.vehicle_id.empty()) {
        throw ValidationError("vehicle_id must not be empty");
    }
    if (!is_valid_position(event.position)) {
        throw ValidationError(fmt::format("position ({}, {}) is out of range",
                                          event.position.latitude_deg,
                                          event.position.longitude_deg));
    }
    if (event.speed_kmh.has_value() && (!std::isfinite(event.speed_kmh.value()) || event.speed_kmh.value() < 0.0)) {
        throw ValidationError(fmt::format("speed_kmh {} must be non-negative", event.speed_kmh.value()));
    }
    if (event.heading_deg.has_value()
        && (!std::isfinite(event.heading_deg.value()) || event.heading_deg.value() < 0.0 || event.heading_deg.value() > k_max_heading_deg)) {
        throw ValidationError(fmt::format("heading_deg {} must be within [0, 360]", event.heading_deg.value()));
    }
    if (event.timestamp > now + to_wall_duration(config_.max_future_skew)) {
        throw ValidationError(fmt::format("timestamp {} is in the future", format_iso8601(event.timestamp)));
    }
}

bool TransitionEngine::within_debounce(const VehicleState& previous, WallTime now) const {
    if (config_.debounce_window.count() <= 0.0 || !previous.last_processed_time.has_value()) {
        return false;
    }
    const Duration elapsed = now - previous.last_processed_time.value();
    return elapsed < config_.debounce_window;
}

std::set<std::string> TransitionEngine::evaluate_membership(const Position& position) const {
    const std::vector<std::string> list_zone_ids = zones_containing(registry_.all(), position);
    return std::set<std::string>(list_zone_ids.begin(), list_zone_ids.end());
}

void TransitionEngine::commit(const VehicleState& previous, VehicleState next) {
    if (!store_.compare_and_set(previous.vehicle_id, previous.version, std::move(next))) {
        throw StateConflictError(fmt::format("Vehicle {} changed during processing (expected version {})",
                                             previous.vehicle_id,
                                             previous.version));
    }
}

}  // namespace geofence_service
