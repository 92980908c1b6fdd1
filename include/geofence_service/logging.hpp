#pragma once

#include <memory>
#include <string>

#include <spdlog/formatter.h>
#include <spdlog/logger.h>

namespace geofence_service {

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

/**
 * @brief Formatter for the rotating file sink: one JSON object per line with
 *        UTC timestamp, level and the JSON-escaped message.
 */
std::unique_ptr<spdlog::formatter> make_json_log_formatter();

}  // namespace geofence_service
