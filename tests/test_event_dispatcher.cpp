#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "geofence_service/event_dispatcher.hpp"
#include "logging_test_fixture.hpp"

using namespace geofence_service;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    geofence_service::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("EventDispatcher drains every submitted task on shutdown") {
    EventDispatcher dispatcher{4};
    REQUIRE(dispatcher.worker_count() == 4);

    std::atomic<int> completed{0};
    for (int index = 0; index < 200; ++index) {
        dispatcher.submit([&completed]() { completed.fetch_add(1); });
    }
    dispatcher.shutdown();

    REQUIRE(completed.load() == 200);
    REQUIRE(dispatcher.pending() == 0);
}

TEST_CASE("EventDispatcher keeps running after a task throws") {
    EventDispatcher dispatcher{1};
    std::atomic<int> completed{0};

    dispatcher.submit([]() { throw std::runtime_error("boom"); });
    dispatcher.submit([&completed]() { completed.fetch_add(1); });
    dispatcher.shutdown();

    REQUIRE(completed.load() == 1);
}

TEST_CASE("EventDispatcher refuses work after shutdown") {
    EventDispatcher dispatcher{2};
    dispatcher.shutdown();
    REQUIRE_THROWS_AS(dispatcher.submit([]() {}), std::runtime_error);
}

TEST_CASE("EventDispatcher blocks submitters while the queue is full") {
    EventDispatcher dispatcher{1, 2};
    REQUIRE(dispatcher.queue_capacity() == 2);

    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<int> completed{0};

    dispatcher.submit([&started, gate]() {
        started.set_value();
        gate.wait();
    });
    started.get_future().wait();
    dispatcher.submit([&completed]() { completed.fetch_add(1); });
    dispatcher.submit([&completed]() { completed.fetch_add(1); });
    REQUIRE(dispatcher.pending() == 2);

    std::future<void> blocked_submit = std::async(std::launch::async, [&dispatcher, &completed]() {
        dispatcher.submit([&completed]() { completed.fetch_add(1); });
    });
    REQUIRE(blocked_submit.wait_for(std::chrono::milliseconds(100)) == std::future_status::timeout);
    REQUIRE(dispatcher.pending() == 2);

    release.set_value();
    blocked_submit.get();
    dispatcher.shutdown();
    REQUIRE(completed.load() == 3);
}

TEST_CASE("EventDispatcher requires at least one worker and a queue") {
    REQUIRE_THROWS_AS(EventDispatcher{0}, std::invalid_argument);
    REQUIRE_THROWS_AS(EventDispatcher(1, 0), std::invalid_argument);
}
