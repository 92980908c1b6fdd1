#include "geofence_service/zone_loader.hpp"

#include <fstream>

#include <fmt/format.h>

#include "geofence_service/errors.hpp"
#include "geofence_service/logging.hpp"

namespace geofence_service {

namespace {

double require_number(const nlohmann::json& json, const char* key, const std::string& context) {
    if (!json.contains(key) || !json[key].is_number()) {
        throw ConfigurationError(fmt::format("{}: '{}' must be a number", context, key));
    }
    return json[key].get<double>();
}

Position position_from_json(const nlohmann::json& json, const std::string& context) {
    if (!json.is_object()) {
        throw ConfigurationError(fmt::format("{}: position must be an object", context));
    }
    return Position{require_number(json, "lat", context), require_number(json, "lon", context)};
}

std::vector<Zone> zones_from_document(const nlohmann::json& document) {
    if (!document.is_object() || !document.contains("zones") || !document["zones"].is_array()) {
        throw ConfigurationError("Zone document must contain a 'zones' array");
    }
    std::vector<Zone> list_zones;
    list_zones.reserve(document["zones"].size());
    for (const nlohmann::json& entry : document["zones"]) {
        list_zones.push_back(zone_from_json(entry));
    }
    return list_zones;
}

}  // namespace

Zone zone_from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigurationError("Zone entry must be an object");
    }
    if (!json.contains("id") || !json["id"].is_string()) {
        throw ConfigurationError("Zone entry requires a string 'id'");
    }

    Zone zone{};
    zone.identifier = json["id"].get<std::string>();
    const std::string context = fmt::format("zone '{}'", zone.identifier);
    zone.name = json.value("name", zone.identifier);

    const std::string str_kind = json.value("type", std::string{});
    const std::optional<ZoneKind> kind = zone_kind_from_string(str_kind);
    if (!kind.has_value()) {
        throw ConfigurationError(fmt::format("{}: unknown type '{}'", context, str_kind));
    }
    zone.kind = kind.value();

    if (zone.kind == ZoneKind::Circle) {
        if (!json.contains("center")) {
            throw ConfigurationError(fmt::format("{}: circle requires 'center'", context));
        }
        zone.center = position_from_json(json["center"], context);
        zone.radius_m = require_number(json, "radius_m", context);
    } else {
        if (!json.contains("points") || !json["points"].is_array()) {
            throw ConfigurationError(fmt::format("{}: polygon requires a 'points' array", context));
        }
        for (const nlohmann::json& point : json["points"]) {
            zone.ring.push_back(position_from_json(point, context));
        }
        // Rings may be written closed; keep them open internally.
        if (zone.ring.size() > 1
            && zone.ring.front().latitude_deg == zone.ring.back().latitude_deg
            && zone.ring.front().longitude_deg == zone.ring.back().longitude_deg) {
            zone.ring.pop_back();
        }
    }
    return zone;
}

std::vector<Zone> parse_zones(const std::string& json_text) {
    try {
        return zones_from_document(nlohmann::json::parse(json_text));
    } catch (const nlohmann::json::exception& exc) {
        throw ConfigurationError(fmt::format("Malformed zone document: {}", exc.what()));
    }
}

std::vector<Zone> load_zones(const std::filesystem::path& path_zones_file) {
    std::ifstream stream_zones(path_zones_file);
    if (!stream_zones) {
        throw ConfigurationError(fmt::format("Unable to open zone file {}", path_zones_file.string()));
    }

    std::vector<Zone> list_zones;
    try {
        list_zones = zones_from_document(nlohmann::json::parse(stream_zones));
    } catch (const nlohmann::json::exception& exc) {
        throw ConfigurationError(fmt::format("Malformed zone file {}: {}", path_zones_file.string(), exc.what()));
    }
    get_logger()->info("Read {} zone definitions from {}", list_zones.size(), path_zones_file.string());
    return list_zones;
}

}  // namespace geofence_service
