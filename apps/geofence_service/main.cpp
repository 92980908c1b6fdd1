#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "geofence_service/clock.hpp"
#include "geofence_service/configuration.hpp"
#include "geofence_service/event_dispatcher.hpp"
#include "geofence_service/geofence_service.hpp"
#include "geofence_service/line_protocol.hpp"
#include "geofence_service/logging.hpp"
#include "geofence_service/zone_loader.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}
}  // namespace

int main() {
    using namespace geofence_service;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        const Configuration configuration = ConfigurationLoader::load();

        const SystemClock clock{};
        GeofenceService service{load_zones(configuration.zones_path), configuration.engine, clock, configuration.environment};
        std::mutex output_mutex;
        EventDispatcher dispatcher{configuration.worker_threads, configuration.queue_capacity};

        LineProtocol protocol{service, dispatcher, [&output_mutex](const nlohmann::json& response) {
            std::scoped_lock lock(output_mutex);
            std::cout << response.dump() << '\n' << std::flush;
        }};

        std::string line;
        while (!should_terminate.load() && std::getline(std::cin, line)) {
            protocol.handle_line(line);
        }

        dispatcher.shutdown();
        get_logger()->info("Input closed; geofence service exiting");
        get_logger()->flush();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
