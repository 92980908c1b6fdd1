#include "geofence_service/line_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "geofence_service/errors.hpp"
#include "geofence_service/json_codec.hpp"

namespace geofence_service {

namespace {

constexpr char k_request_id_key[] = "request_id";

/** @brief Event identity echoed on event responses, including failures. */
nlohmann::json event_identity_of(const nlohmann::json& request) {
    nlohmann::json correlation = nlohmann::json::object();
    for (const char* key : {"vehicle_id", "event_id"}) {
        if (request.contains(key) && request[key].is_string()) {
            correlation[key] = request[key];
        }
    }
    return correlation;
}

nlohmann::json correlated(nlohmann::json response, const nlohmann::json& correlation) {
    response.update(correlation);
    return response;
}

}  // namespace

LineProtocol::LineProtocol(GeofenceService& service, EventDispatcher& dispatcher, ResponseSink sink)
    : service_(service),
      dispatcher_(dispatcher),
      sink_(std::move(sink)),
      logger_(get_logger()) {}

void LineProtocol::handle_line(const std::string& line) {
    const bool blank = std::all_of(line.begin(), line.end(), [](char character) {
        return std::isspace(static_cast<unsigned char>(character)) != 0;
    });
    if (blank) {
        return;
    }

    nlohmann::json request;
    try {
        request = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& exc) {
        sink_(JsonCodec::error_to_json("malformed", exc.what()));
        return;
    }
    if (!request.is_object()) {
        sink_(JsonCodec::error_to_json("malformed", "request must be a JSON object"));
        return;
    }

    std::string str_op = "event";
    if (request.contains("op")) {
        if (!request["op"].is_string()) {
            sink_(JsonCodec::error_to_json("malformed", "'op' must be a string"));
            return;
        }
        str_op = request["op"].get<std::string>();
        request.erase("op");
    }

    nlohmann::json correlation = nlohmann::json::object();
    if (request.contains(k_request_id_key)) {
        const nlohmann::json& request_id = request[k_request_id_key];
        if (!request_id.is_string() && !request_id.is_number_integer()) {
            sink_(JsonCodec::error_to_json("malformed", "'request_id' must be a string or an integer"));
            return;
        }
        correlation[k_request_id_key] = request_id;
        request.erase(k_request_id_key);
    }

    if (str_op == "event") {
        handle_event(std::move(request), std::move(correlation));
    } else if (str_op == "status") {
        handle_status(request, correlation);
    } else if (str_op == "zones") {
        nlohmann::json response;
        response["zones"] = JsonCodec::zones_to_json(service_.list_zones());
        sink_(correlated(std::move(response), correlation));
    } else if (str_op == "health") {
        nlohmann::json response = JsonCodec::health_to_json(service_.health());
        response["workers"] = dispatcher_.worker_count();
        response["queued_events"] = dispatcher_.pending();
        sink_(correlated(std::move(response), correlation));
    } else {
        sink_(correlated(JsonCodec::error_to_json("unknown_op", str_op), correlation));
    }
}

void LineProtocol::handle_event(nlohmann::json request, nlohmann::json correlation) {
    correlation.update(event_identity_of(request));
    // Workers may outlive this object, so capture collaborators rather than `this`.
    dispatcher_.submit([&service = service_,
                        sink = sink_,
                        logger = logger_,
                        request = std::move(request),
                        correlation = std::move(correlation)]() {
        try {
            const LocationEvent event = JsonCodec::location_event_from_json(request);
            sink(correlated(JsonCodec::transition_to_json(service.process_event(event)), correlation));
        } catch (const ValidationError& exc) {
            sink(correlated(JsonCodec::error_to_json("validation", exc.what()), correlation));
        } catch (const StateConflictError& exc) {
            logger->error("State conflict: {}", exc.what());
            sink(correlated(JsonCodec::error_to_json("conflict", exc.what()), correlation));
        } catch (const std::exception& exc) {
            logger->error("Failed to process event {}: {}", correlation.dump(), exc.what());
            sink(correlated(JsonCodec::error_to_json("internal", "Internal error"), correlation));
        }
    });
}

void LineProtocol::handle_status(const nlohmann::json& request, const nlohmann::json& correlation) {
    if (!request.contains("vehicle_id") || !request["vehicle_id"].is_string()) {
        sink_(correlated(JsonCodec::error_to_json("validation", "'vehicle_id' must be a string"), correlation));
        return;
    }
    const std::string vehicle_id = request["vehicle_id"].get<std::string>();
    const std::optional<VehicleStatus> status = service_.get_status(vehicle_id);
    if (!status.has_value()) {
        nlohmann::json response = JsonCodec::error_to_json("not_found", vehicle_id);
        response["vehicle_id"] = vehicle_id;
        sink_(correlated(std::move(response), correlation));
        return;
    }
    sink_(correlated(JsonCodec::status_to_json(status.value()), correlation));
}

}  // namespace geofence_service
