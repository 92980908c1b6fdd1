// === Vehicle State Store =====================================================
//
// Key-value contract for per-vehicle state plus the in-memory implementation.
// Writers serialize per vehicle through acquire(); commits are versioned
// compare-and-set so a stale read can never overwrite a newer state.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "geofence_service/vehicle_state.hpp"

namespace geofence_service {

/** @brief Abstract per-vehicle state store. */
class VehicleStateStore {
  public:
    virtual ~VehicleStateStore() = default;

    /**
     * @brief Take exclusive write access to @p vehicle_id.
     *
     * Holders for different vehicles never block each other.
     */
    [[nodiscard]] virtual std::unique_lock<std::mutex> acquire(const std::string& vehicle_id) = 0;

    /** @brief Latest committed state, or an empty version-0 state when unseen. */
    [[nodiscard]] virtual VehicleState get(const std::string& vehicle_id) const = 0;

    /** @brief Latest committed state, or std::nullopt when never committed. */
    [[nodiscard]] virtual std::optional<VehicleState> find(const std::string& vehicle_id) const = 0;

    /**
     * @brief Replace the state of @p vehicle_id if its version still equals
     *        @p expected_version.
     *
     * On success the stored version becomes expected_version + 1. On failure
     * nothing changes.
     */
    [[nodiscard]] virtual bool compare_and_set(const std::string& vehicle_id,
                                               std::uint64_t expected_version,
                                               VehicleState new_state) = 0;

    /** @brief Number of vehicles with at least one committed state. */
    [[nodiscard]] virtual std::size_t size() const = 0;
};

/**
 * @brief Sharded in-memory store.
 *
 * Shard locks are held only for map lookups; each vehicle owns a writer mutex
 * (held by the engine across evaluate-and-commit) and a reader/writer lock
 * guarding the state snapshot itself.
 */
class InMemoryVehicleStateStore final : public VehicleStateStore {
  public:
    [[nodiscard]] std::unique_lock<std::mutex> acquire(const std::string& vehicle_id) override;
    [[nodiscard]] VehicleState get(const std::string& vehicle_id) const override;
    [[nodiscard]] std::optional<VehicleState> find(const std::string& vehicle_id) const override;
    [[nodiscard]] bool compare_and_set(const std::string& vehicle_id,
                                       std::uint64_t expected_version,
                                       VehicleState new_state) override;
    [[nodiscard]] std::size_t size() const override;

  private:
    struct VehicleSlot final {
        std::mutex writer_mutex;
        mutable std::shared_mutex state_mutex;
        VehicleState state;
    };

    struct Shard final {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<VehicleSlot>> map_slots;
    };

    static constexpr std::size_t k_shard_count{16};

    [[nodiscard]] Shard& shard_for(const std::string& vehicle_id) const;
    [[nodiscard]] std::shared_ptr<VehicleSlot> find_slot(const std::string& vehicle_id) const;
    [[nodiscard]] std::shared_ptr<VehicleSlot> find_or_create_slot(const std::string& vehicle_id);

    mutable std::array<Shard, k_shard_count> array_shards_;
};

}  // namespace geofence_service
