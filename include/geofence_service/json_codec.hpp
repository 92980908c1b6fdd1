// === JSON Codec ==============================================================
//
// Wire representation of events, transitions, statuses, zones and health
// reports for the line-delimited JSON front end. Field names follow the public
// API of the service: snake_case keys, ISO-8601 UTC timestamps.

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "geofence_service/geofence_service.hpp"
#include "geofence_service/transition.hpp"
#include "geofence_service/zone.hpp"

namespace geofence_service {

class JsonCodec final {
  public:
    /**
     * @brief Decode an inbound location event.
     *
     * Unknown keys are rejected.
     * @throws ValidationError on missing, mistyped or unknown fields.
     */
    static LocationEvent location_event_from_json(const nlohmann::json& json);

    static nlohmann::json transition_to_json(const TransitionResult& result);
    static nlohmann::json status_to_json(const VehicleStatus& status);
    static nlohmann::json zone_to_json(const Zone& zone);
    static nlohmann::json zones_to_json(const std::vector<Zone>& zones);
    static nlohmann::json health_to_json(const HealthReport& report);
    static nlohmann::json error_to_json(const std::string& error, const std::string& detail);

  private:
    static nlohmann::json position_to_json(const Position& position);
    static Position position_from_json(const nlohmann::json& json);
};

}  // namespace geofence_service
