#include "geofence_service/json_codec.hpp"

#include <array>
#include <string_view>

#include <fmt/format.h>

#include "geofence_service/errors.hpp"
#include "geofence_service/timestamp.hpp"

namespace geofence_service {

namespace {

constexpr std::array<std::string_view, 6> k_event_fields{
    "vehicle_id", "position", "timestamp", "speed_kmh", "heading_deg", "event_id"
};

bool is_known_event_field(const std::string& key) {
    for (const std::string_view field : k_event_fields) {
        if (key == field) {
            return true;
        }
    }
    return false;
}

std::optional<double> optional_number(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || json[key].is_null()) {
        return std::nullopt;
    }
    if (!json[key].is_number()) {
        throw ValidationError(fmt::format("'{}' must be a number", key));
    }
    return json[key].get<double>();
}

}  // namespace

LocationEvent JsonCodec::location_event_from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ValidationError("event must be a JSON object");
    }
    for (const auto& item : json.items()) {
        if (!is_known_event_field(item.key())) {
            throw ValidationError(fmt::format("unexpected field '{}'", item.key()));
        }
    }

    LocationEvent event{};
    if (!json.contains("vehicle_id") || !json["vehicle_id"].is_string()) {
        throw ValidationError("'vehicle_id' must be a string");
    }
    event.vehicle_id = json["vehicle_id"].get<std::string>();

    if (!json.contains("position")) {
        throw ValidationError("'position' is required");
    }
    event.position = position_from_json(json["position"]);

    if (!json.contains("timestamp") || !json["timestamp"].is_string()) {
        throw ValidationError("'timestamp' must be an ISO-8601 string");
    }
    const std::string str_timestamp = json["timestamp"].get<std::string>();
    const std::optional<WallTime> timestamp = parse_iso8601(str_timestamp);
    if (!timestamp.has_value()) {
        throw ValidationError(fmt::format("'timestamp' {} is not ISO-8601", str_timestamp));
    }
    event.timestamp = timestamp.value();

    event.speed_kmh = optional_number(json, "speed_kmh");
    event.heading_deg = optional_number(json, "heading_deg");

    if (json.contains("event_id") && !json["event_id"].is_null()) {
        if (!json["event_id"].is_string()) {
            throw ValidationError("'event_id' must be a string");
        }
        event.event_id = json["event_id"].get<std::string>();
    }
    return event;
}

nlohmann::json JsonCodec::transition_to_json(const TransitionResult& result) {
    nlohmann::json j;
    j["vehicle_id"] = result.vehicle_id;
    j["entered"] = result.entered;
    j["exited"] = result.exited;
    j["at"] = format_iso8601(result.at);
    j["position"] = position_to_json(result.position);
    j["outcome"] = std::string{to_string(result.outcome)};
    return j;
}

nlohmann::json JsonCodec::status_to_json(const VehicleStatus& status) {
    nlohmann::json j;
    j["vehicle_id"] = status.vehicle_id;
    j["current_zones"] = status.current_zones;
    j["last_event_ts"] = status.last_event_time.has_value() ? nlohmann::json(format_iso8601(status.last_event_time.value()))
                                                            : nlohmann::json(nullptr);
    j["last_position"] = status.last_position.has_value() ? position_to_json(status.last_position.value())
                                                          : nlohmann::json(nullptr);
    return j;
}

nlohmann::json JsonCodec::zone_to_json(const Zone& zone) {
    nlohmann::json j;
    j["id"] = zone.identifier;
    j["name"] = zone.name;
    j["type"] = std::string{to_string(zone.kind)};
    if (zone.kind == ZoneKind::Circle) {
        j["center"] = position_to_json(zone.center);
        j["radius_m"] = zone.radius_m;
        j["points"] = nullptr;
    } else {
        j["center"] = nullptr;
        j["radius_m"] = nullptr;
        nlohmann::json points = nlohmann::json::array();
        for (const Position& vertex : zone.ring) {
            points.push_back(position_to_json(vertex));
        }
        j["points"] = points;
    }
    return j;
}

nlohmann::json JsonCodec::zones_to_json(const std::vector<Zone>& zones) {
    nlohmann::json j = nlohmann::json::array();
    for (const Zone& zone : zones) {
        j.push_back(zone_to_json(zone));
    }
    return j;
}

nlohmann::json JsonCodec::health_to_json(const HealthReport& report) {
    nlohmann::json j;
    j["status"] = report.status;
    j["env"] = report.environment;
    j["zones"] = report.zone_count;
    j["vehicles"] = report.tracked_vehicles;
    j["version"] = report.version;
    return j;
}

nlohmann::json JsonCodec::error_to_json(const std::string& error, const std::string& detail) {
    nlohmann::json j;
    j["error"] = error;
    j["detail"] = detail;
    return j;
}

nlohmann::json JsonCodec::position_to_json(const Position& position) {
    nlohmann::json j;
    j["lat"] = position.latitude_deg;
    j["lon"] = position.longitude_deg;
    return j;
}

Position JsonCodec::position_from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ValidationError("'position' must be an object");
    }
    if (!json.contains("lat") || !json["lat"].is_number() || !json.contains("lon") || !json["lon"].is_number()) {
        throw ValidationError("'position' requires numeric 'lat' and 'lon'");
    }
    return Position{json["lat"].get<double>(), json["lon"].get<double>()};
}

}  // namespace geofence_service
