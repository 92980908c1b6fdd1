// === Line Protocol ===========================================================
//
// Front end that accepts one JSON request per line and produces one JSON
// response per request. Event requests run on the dispatcher; status, zone and
// health requests are answered inline, so responses are not in request order.
// Every response echoes the request's optional `request_id`, and event
// responses also echo `vehicle_id` and `event_id`, for correlation.

#pragma once

#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "geofence_service/event_dispatcher.hpp"
#include "geofence_service/geofence_service.hpp"
#include "geofence_service/logging.hpp"

namespace geofence_service {

/** @brief Receives each response document; must be safe to call from workers. */
using ResponseSink = std::function<void(const nlohmann::json&)>;

class LineProtocol final {
  public:
    LineProtocol(GeofenceService& service, EventDispatcher& dispatcher, ResponseSink sink);

    /** @brief Handle one request line; blank lines are ignored. */
    void handle_line(const std::string& line);

  private:
    void handle_event(nlohmann::json request, nlohmann::json correlation);
    void handle_status(const nlohmann::json& request, const nlohmann::json& correlation);

    GeofenceService& service_;
    EventDispatcher& dispatcher_;
    ResponseSink sink_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace geofence_service
