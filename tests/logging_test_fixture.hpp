#pragma once

#include "geofence_service/logging.hpp"

#include <filesystem>
#include <memory>

namespace geofence_service::test {

inline void ensure_logger_initialized() {
    static const std::shared_ptr<spdlog::logger> logger_handle = []() {
        const auto log_dir = std::filesystem::temp_directory_path() / "geofence_service_tests_logs";
        return geofence_service::initialize_logger(log_dir.string());
    }();
    (void)logger_handle;
}

}  // namespace geofence_service::test
