// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the geofence service.
//
// Responsibilities
// - Enforce defaults and sane bounds for the debounce window, future-timestamp
//   skew, worker count and dispatcher queue capacity.
// - Surface clear diagnostics via the logging subsystem whenever user input
//   cannot be parsed or violates expectations.
// - Shield the rest of the codebase from `std::getenv` lookups by returning a
//   fully-populated configuration object.
//
// Note: zone definitions are not read here; only their path is resolved.

#include "geofence_service/configuration.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "geofence_service/logging.hpp"

namespace geofence_service {

namespace {
constexpr double k_default_debounce_seconds{2.0};
constexpr double k_default_max_future_skew_seconds{1.0};
constexpr int k_default_worker_threads{4};
constexpr int k_default_queue_capacity{1024};
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};
constexpr std::string_view k_default_environment{"development"};
constexpr std::string_view k_default_zones_path{"configs/zones.json"};

double parse_non_negative_double(const char* variable_name, double fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (!std::isfinite(parsed_value) || parsed_value < 0.0) {
            get_logger()->warn("{}={} is out of range; using fallback {}", variable_name, raw_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse double from {}; using fallback {}", variable_name, fallback);
        return fallback;
    }
}

int parse_positive_int(const char* variable_name, int fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        return parsed_value <= 0 ? fallback : parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse integer from {}; using fallback {}", variable_name, fallback);
        return fallback;
    }
}

std::string parse_string(const char* variable_name, std::string_view fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("GEOFENCE_LOG_DIR", k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.log_level = parse_string("GEOFENCE_LOG_LEVEL", k_default_log_level);
    set_log_level(config.log_level);

    config.environment = parse_string("GEOFENCE_ENV", k_default_environment);
    config.zones_path = parse_string("GEOFENCE_ZONES_PATH", k_default_zones_path);
    config.engine = load_engine_config();
    config.worker_threads = static_cast<std::size_t>(parse_positive_int("GEOFENCE_WORKER_THREADS", k_default_worker_threads));
    config.queue_capacity = static_cast<std::size_t>(parse_positive_int("GEOFENCE_QUEUE_CAPACITY", k_default_queue_capacity));

    logger->info("Configuration loaded: env={} zones_path={} debounce_s={} max_future_skew_s={} workers={} queue_capacity={}",
                 config.environment,
                 config.zones_path,
                 config.engine.debounce_window.count(),
                 config.engine.max_future_skew.count(),
                 config.worker_threads,
                 config.queue_capacity);

    return config;
}

EngineConfig ConfigurationLoader::load_engine_config() {
    EngineConfig engine{};
    engine.debounce_window = Duration{parse_non_negative_double("GEOFENCE_DEBOUNCE_SECONDS", k_default_debounce_seconds)};
    engine.max_future_skew = Duration{parse_non_negative_double("GEOFENCE_MAX_FUTURE_SKEW_SECONDS", k_default_max_future_skew_seconds)};
    return engine;
}

}  // namespace geofence_service
