#include <mutex>
#include <vector>

#include <catch2/catch.hpp>

#include "geofence_service/line_protocol.hpp"
#include "geofence_service/timestamp.hpp"
#include "logging_test_fixture.hpp"
#include "manual_clock.hpp"
#include "zone_fixtures.hpp"

using namespace geofence_service;
using geofence_service::test::k_downtown_center;
using geofence_service::test::make_circle;
using geofence_service::test::ManualClock;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    geofence_service::test::ensure_logger_initialized();
    return true;
}();

const WallTime k_start_time{std::chrono::seconds{1'748'772'000}};  // 2025-06-01T10:00:00Z

/** @brief Thread-safe response collector. */
class CollectingSink final {
  public:
    ResponseSink sink() {
        return [this](const nlohmann::json& response) {
            std::scoped_lock lock(mutex_);
            list_responses_.push_back(response);
        };
    }

    std::vector<nlohmann::json> responses() const {
        std::scoped_lock lock(mutex_);
        return list_responses_;
    }

  private:
    mutable std::mutex mutex_;
    std::vector<nlohmann::json> list_responses_;
};

struct ProtocolHarness {
    ProtocolHarness()
        : clock(k_start_time),
          service({make_circle("downtown", k_downtown_center, 500.0)}, EngineConfig{Duration{0.0}, Duration{1.0}}, clock, "test"),
          dispatcher(2),
          protocol(service, dispatcher, collector.sink()) {}

    ManualClock clock;
    GeofenceService service;
    CollectingSink collector;
    EventDispatcher dispatcher;
    LineProtocol protocol;
};
}  // namespace

TEST_CASE("LineProtocol answers inline requests immediately") {
    ProtocolHarness harness{};

    harness.protocol.handle_line(R"({"op": "health"})");
    harness.protocol.handle_line(R"({"op": "zones"})");
    harness.protocol.handle_line(R"({"op": "status", "vehicle_id": "ghost"})");
    harness.protocol.handle_line("   ");

    const std::vector<nlohmann::json> responses = harness.collector.responses();
    REQUIRE(responses.size() == 3);
    REQUIRE(responses[0]["status"] == "ok");
    REQUIRE(responses[0]["env"] == "test");
    REQUIRE(responses[0]["workers"] == 2);
    REQUIRE(responses[0]["queued_events"] == 0);
    REQUIRE(responses[1]["zones"].is_array());
    REQUIRE(responses[1]["zones"][0]["id"] == "downtown");
    REQUIRE(responses[2]["error"] == "not_found");
    REQUIRE(responses[2]["vehicle_id"] == "ghost");
}

TEST_CASE("LineProtocol processes events on the dispatcher") {
    ProtocolHarness harness{};
    const std::string timestamp = format_iso8601(harness.clock.now());

    harness.protocol.handle_line(R"({"op": "event", "vehicle_id": "MH12AB1234", "position": {"lat": 18.5204, "lon": 73.8567}, "timestamp": ")"
                                 + timestamp + R"(", "event_id": "e1"})");
    harness.dispatcher.shutdown();

    const std::vector<nlohmann::json> responses = harness.collector.responses();
    REQUIRE(responses.size() == 1);
    REQUIRE(responses[0]["entered"] == nlohmann::json::array({"downtown"}));

    harness.protocol.handle_line(R"({"op": "status", "vehicle_id": "MH12AB1234"})");
    const nlohmann::json status = harness.collector.responses().back();
    REQUIRE(status["current_zones"] == nlohmann::json::array({"downtown"}));
    REQUIRE(status["last_event_ts"] == timestamp);
}

TEST_CASE("LineProtocol defaults to the event operation and reports validation errors") {
    ProtocolHarness harness{};

    harness.protocol.handle_line(R"({"vehicle_id": "v1", "position": {"lat": 95.0, "lon": 0.0}, "timestamp": "2025-06-01T10:00:00Z"})");
    harness.dispatcher.shutdown();

    const std::vector<nlohmann::json> responses = harness.collector.responses();
    REQUIRE(responses.size() == 1);
    REQUIRE(responses[0]["error"] == "validation");
}

TEST_CASE("LineProtocol reports malformed and unknown requests") {
    ProtocolHarness harness{};

    harness.protocol.handle_line("{oops");
    harness.protocol.handle_line("[]");
    harness.protocol.handle_line(R"({"op": "replay"})");

    const std::vector<nlohmann::json> responses = harness.collector.responses();
    REQUIRE(responses.size() == 3);
    REQUIRE(responses[0]["error"] == "malformed");
    REQUIRE(responses[1]["error"] == "malformed");
    REQUIRE(responses[2]["error"] == "unknown_op");
}

TEST_CASE("LineProtocol errors identify the request that failed") {
    ProtocolHarness harness{};

    harness.protocol.handle_line(
        R"({"request_id": "r1", "vehicle_id": "v1", "event_id": "a", "position": {"lat": 95.0, "lon": 0.0}, "timestamp": "2025-06-01T10:00:00Z"})");
    harness.protocol.handle_line(
        R"({"request_id": 2, "vehicle_id": "v2", "event_id": "b", "position": {"lat": 0.0, "lon": 0.0}, "timestamp": "yesterday"})");
    harness.dispatcher.shutdown();

    const std::vector<nlohmann::json> responses = harness.collector.responses();
    REQUIRE(responses.size() == 2);
    for (const nlohmann::json& response : responses) {
        REQUIRE(response["error"] == "validation");
        if (response["request_id"] == "r1") {
            REQUIRE(response["vehicle_id"] == "v1");
            REQUIRE(response["event_id"] == "a");
            REQUIRE(response["detail"].get<std::string>().find("out of range") != std::string::npos);
        } else {
            REQUIRE(response["request_id"] == 2);
            REQUIRE(response["vehicle_id"] == "v2");
            REQUIRE(response["event_id"] == "b");
            REQUIRE(response["detail"].get<std::string>().find("ISO-8601") != std::string::npos);
        }
    }
}

TEST_CASE("LineProtocol echoes the request id on inline and event responses") {
    ProtocolHarness harness{};
    const std::string timestamp = format_iso8601(harness.clock.now());

    harness.protocol.handle_line(R"({"op": "event", "request_id": "ev-1", "vehicle_id": "v1", "position": {"lat": 18.5204, "lon": 73.8567}, "timestamp": ")"
                                 + timestamp + R"("})");
    harness.dispatcher.shutdown();
    harness.protocol.handle_line(R"({"op": "status", "request_id": "st-1", "vehicle_id": "v1"})");
    harness.protocol.handle_line(R"({"op": "zones", "request_id": "zn-1"})");
    harness.protocol.handle_line(R"({"op": "health", "request_id": 7})");
    harness.protocol.handle_line(R"({"op": "health", "request_id": [1]})");

    const std::vector<nlohmann::json> responses = harness.collector.responses();
    REQUIRE(responses.size() == 5);
    REQUIRE(responses[0]["request_id"] == "ev-1");
    REQUIRE(responses[0]["entered"] == nlohmann::json::array({"downtown"}));
    REQUIRE_FALSE(responses[0].contains("event_id"));
    REQUIRE(responses[1]["request_id"] == "st-1");
    REQUIRE(responses[1]["current_zones"] == nlohmann::json::array({"downtown"}));
    REQUIRE(responses[2]["request_id"] == "zn-1");
    REQUIRE(responses[3]["request_id"] == 7);
    REQUIRE(responses[4]["error"] == "malformed");
}
