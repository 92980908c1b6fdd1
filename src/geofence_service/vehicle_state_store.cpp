#include "geofence_service/vehicle_state_store.hpp"

#include <functional>
#include <utility>

namespace geofence_service {

InMemoryVehicleStateStore::Shard& InMemoryVehicleStateStore::shard_for(const std::string& vehicle_id) const {
    const std::size_t shard_index = std::hash<std::string>{}(vehicle_id) % k_shard_count;
    return array_shards_[shard_index];
}

std::shared_ptr<InMemoryVehicleStateStore::VehicleSlot> InMemoryVehicleStateStore::find_slot(const std::string& vehicle_id) const {
    Shard& shard = shard_for(vehicle_id);
    std::shared_lock lock(shard.mutex);
    const auto iterator_slot = shard.map_slots.find(vehicle_id);
    if (iterator_slot == shard.map_slots.end()) {
        return nullptr;
    }
    return iterator_slot->second;
}

std::shared_ptr<InMemoryVehicleStateStore::VehicleSlot> InMemoryVehicleStateStore::find_or_create_slot(const std::string& vehicle_id) {
    if (auto slot = find_slot(vehicle_id)) {
        return slot;
    }
    Shard& shard = shard_for(vehicle_id);
    std::unique_lock lock(shard.mutex);
    auto& slot = shard.map_slots[vehicle_id];
    if (!slot) {
        slot = std::make_shared<VehicleSlot>();
        slot->state.vehicle_id = vehicle_id;
    }
    return slot;
}

std::unique_lock<std::mutex> InMemoryVehicleStateStore::acquire(const std::string& vehicle_id) {
    // Slots are never erased, so the mutex outlives the returned lock.
    const std::shared_ptr<VehicleSlot> slot = find_or_create_slot(vehicle_id);
    return std::unique_lock<std::mutex>(slot->writer_mutex);
}

VehicleState InMemoryVehicleStateStore::get(const std::string& vehicle_id) const {
    const std::shared_ptr<VehicleSlot> slot = find_slot(vehicle_id);
    if (!slot) {
        VehicleState empty_state{};
        empty_state.vehicle_id = vehicle_id;
        return empty_state;
    }
    std::shared_lock lock(slot->state_mutex);
    return slot->state;
}

std::optional<VehicleState> InMemoryVehicleStateStore::find(const std::string& vehicle_id) const {
    const std::shared_ptr<VehicleSlot> slot = find_slot(vehicle_id);
    if (!slot) {
        return std::nullopt;
    }
    std::shared_lock lock(slot->state_mutex);
    if (slot->state.version == 0) {
        return std::nullopt;
    }
    return slot->state;
}

bool InMemoryVehicleStateStore::compare_and_set(const std::string& vehicle_id,
                                                std::uint64_t expected_version,
                                                VehicleState new_state) {
    const std::shared_ptr<VehicleSlot> slot = find_or_create_slot(vehicle_id);
    new_state.vehicle_id = vehicle_id;
    new_state.version = expected_version + 1;

    std::unique_lock lock(slot->state_mutex);
    if (slot->state.version != expected_version) {
        return false;
    }
    std::swap(slot->state, new_state);
    return true;
}

std::size_t InMemoryVehicleStateStore::size() const {
    std::size_t committed = 0;
    for (const Shard& shard : array_shards_) {
        std::shared_lock shard_lock(shard.mutex);
        for (const auto& entry : shard.map_slots) {
            std::shared_lock slot_lock(entry.second->state_mutex);
            if (entry.second->state.version != 0) {
                ++committed;
            }
        }
    }
    return committed;
}

}  // namespace geofence_service
