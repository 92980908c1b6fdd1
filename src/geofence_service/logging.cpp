#include "geofence_service/logging.hpp"

#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace geofence_service {

namespace {
std::once_flag logger_once_flag;
std::shared_ptr<spdlog::logger> shared_logger;
constexpr std::size_t k_max_file_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_max_files{5};
constexpr char k_logger_name[] = "geofence_service";
constexpr char k_json_message_flag{'*'};

/** @brief `%*`: the message payload as a quoted, escaped JSON string. */
class JsonMessageFlag final : public spdlog::custom_flag_formatter {
  public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        const std::string str_payload(msg.payload.data(), msg.payload.size());
        // Replace invalid UTF-8 rather than throwing from inside a sink.
        const std::string str_escaped = nlohmann::json(str_payload).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        dest.append(str_escaped.data(), str_escaped.data() + str_escaped.size());
    }

    [[nodiscard]] std::unique_ptr<custom_flag_formatter> clone() const override {
        return std::make_unique<JsonMessageFlag>();
    }
};
}  // namespace

std::unique_ptr<spdlog::formatter> make_json_log_formatter() {
    auto formatter = std::make_unique<spdlog::pattern_formatter>(spdlog::pattern_time_type::utc);
    formatter->add_flag<JsonMessageFlag>(k_json_message_flag)
        .set_pattern(R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","msg":%*})");
    return formatter;
}

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::call_once(
        logger_once_flag,
        [&log_directory]() {
            const std::filesystem::path path_log_dir{log_directory};
            std::error_code error_directory;
            std::filesystem::create_directories(path_log_dir, error_directory);
            if (error_directory) {
                throw std::runtime_error("Unable to create log directory at " + path_log_dir.string());
            }

            const std::filesystem::path path_log_file = path_log_dir / "geofence_service.log";

            // stdout carries protocol responses, so console logging goes to stderr.
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_pattern("[%l] %v");
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path_log_file.string(),
                k_max_file_size_bytes,
                k_max_files
            );
            file_sink->set_formatter(make_json_log_formatter());

            spdlog::sinks_init_list sinks{console_sink, file_sink};
            shared_logger = std::make_shared<spdlog::logger>(k_logger_name, sinks);
            shared_logger->set_level(spdlog::level::info);
            spdlog::register_logger(shared_logger);
        }
    );
    return shared_logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!shared_logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return shared_logger;
}

void set_log_level(const std::string& str_level) {
    if (!shared_logger) {
        return;
    }
    const auto level = spdlog::level::from_str(str_level);
    if (level == spdlog::level::off && str_level != "off") {
        shared_logger->warn("Unknown log level {}; defaulting to info", str_level);
        shared_logger->set_level(spdlog::level::info);
        return;
    }
    shared_logger->set_level(level);
}

}  // namespace geofence_service
