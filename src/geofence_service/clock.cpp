#include "geofence_service/clock.hpp"

namespace geofence_service {

WallTime SystemClock::now() const {
    return WallClock::now();
}

}  // namespace geofence_service
