#include "geofence_service/zone.hpp"

namespace geofence_service {

std::string_view to_string(ZoneKind kind) noexcept {
    switch (kind) {
        case ZoneKind::Circle:
            return "circle";
        case ZoneKind::Polygon:
            return "polygon";
    }
    return "unknown";
}

std::optional<ZoneKind> zone_kind_from_string(std::string_view text) noexcept {
    if (text == "circle") {
        return ZoneKind::Circle;
    }
    if (text == "polygon") {
        return ZoneKind::Polygon;
    }
    return std::nullopt;
}

}  // namespace geofence_service
