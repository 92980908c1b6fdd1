#include <chrono>
#include <future>
#include <thread>

#include <catch2/catch.hpp>

#include "geofence_service/vehicle_state_store.hpp"

using namespace geofence_service;

namespace {
constexpr auto k_short_wait = std::chrono::milliseconds{50};
constexpr auto k_long_wait = std::chrono::seconds{5};
}  // namespace

TEST_CASE("Unseen vehicles read as an empty version-0 state") {
    InMemoryVehicleStateStore store{};

    const VehicleState state = store.get("MH12AB1234");
    REQUIRE(state.vehicle_id == "MH12AB1234");
    REQUIRE(state.version == 0);
    REQUIRE(state.current_zones.empty());
    REQUIRE_FALSE(state.last_event_time.has_value());
    REQUIRE_FALSE(state.last_event_id.has_value());
    REQUIRE_FALSE(store.find("MH12AB1234").has_value());
    REQUIRE(store.size() == 0);
}

TEST_CASE("compare_and_set commits against the expected version only") {
    InMemoryVehicleStateStore store{};

    VehicleState first{};
    first.current_zones = {"downtown"};
    first.last_event_id = "e1";
    REQUIRE(store.compare_and_set("v1", 0, first));

    const std::optional<VehicleState> committed = store.find("v1");
    REQUIRE(committed.has_value());
    REQUIRE(committed->version == 1);
    REQUIRE(committed->vehicle_id == "v1");
    REQUIRE(committed->current_zones == std::set<std::string>{"downtown"});

    VehicleState stale{};
    stale.current_zones = {"airport"};
    REQUIRE_FALSE(store.compare_and_set("v1", 0, stale));

    const VehicleState unchanged = store.get("v1");
    REQUIRE(unchanged.version == 1);
    REQUIRE(unchanged.current_zones == std::set<std::string>{"downtown"});
    REQUIRE(unchanged.last_event_id == std::optional<std::string>{"e1"});
    REQUIRE(store.size() == 1);
}

TEST_CASE("Acquiring a vehicle does not block other vehicles") {
    InMemoryVehicleStateStore store{};
    const std::unique_lock<std::mutex> lock_a = store.acquire("A");

    auto future_b = std::async(std::launch::async, [&store]() {
        const std::unique_lock<std::mutex> lock_b = store.acquire("B");
        VehicleState state{};
        return store.compare_and_set("B", 0, state);
    });

    REQUIRE(future_b.wait_for(k_long_wait) == std::future_status::ready);
    REQUIRE(future_b.get());
}

TEST_CASE("Acquiring the same vehicle serializes writers") {
    InMemoryVehicleStateStore store{};
    std::unique_lock<std::mutex> lock_first = store.acquire("A");

    auto future_second = std::async(std::launch::async, [&store]() {
        const std::unique_lock<std::mutex> lock_second = store.acquire("A");
        return store.get("A").version;
    });

    REQUIRE(future_second.wait_for(k_short_wait) == std::future_status::timeout);
    REQUIRE(store.compare_and_set("A", 0, VehicleState{}));
    lock_first.unlock();

    REQUIRE(future_second.wait_for(k_long_wait) == std::future_status::ready);
    REQUIRE(future_second.get() == 1);
}

TEST_CASE("Readers are not blocked by a held writer lock") {
    InMemoryVehicleStateStore store{};
    REQUIRE(store.compare_and_set("A", 0, VehicleState{}));
    const std::unique_lock<std::mutex> lock_writer = store.acquire("A");

    auto future_read = std::async(std::launch::async, [&store]() { return store.find("A").has_value(); });
    REQUIRE(future_read.wait_for(k_long_wait) == std::future_status::ready);
    REQUIRE(future_read.get());
}
