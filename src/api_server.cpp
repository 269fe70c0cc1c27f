// SPDX-License-Identifier: Apache-2.0
#include "api_server.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include <everest/logging.hpp>

namespace parking {

namespace {
using json = nlohmann::json;

void set_json_response(httplib::Response& res, const json& payload, int status = 200) {
    res.status = status;
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
    res.set_header("Access-Control-Allow-Methods", "GET,POST,DELETE,OPTIONS");
    // Ids come URL-decoded from the path and may not be valid UTF-8.
    res.set_content(payload.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void set_failure(httplib::Response& res, const std::string& message, int status) {
    set_json_response(res, json{{"status", "failure"}, {"message", message}}, status);
}

json parse_body_object(const httplib::Request& req) {
    if (req.body.empty()) return json::object();
    auto j = json::parse(req.body);
    if (!j.is_object()) {
        throw std::invalid_argument("Request body must be a JSON object");
    }
    return j;
}

json coordinates_json(const Coordinates& c) {
    return json::array({c[0], c[1]});
}

// Runs a handler body and translates failures into the documented error responses.
template <typename Fn> void guarded(httplib::Response& res, Fn&& fn) {
    try {
        fn();
    } catch (const GarageDeletionError& e) {
        const auto& partial = e.partial();
        set_json_response(res,
                          json{{"status", "failure"},
                               {"message", e.what()},
                               {"garageId", partial.garage_id},
                               {"deletedSpots", partial.deleted_spot_ids},
                               {"spotsDeletedCount", partial.deleted_spot_ids.size()}},
                          http_status_for(e.kind()));
    } catch (const StoreError& e) {
        set_failure(res, e.what(), http_status_for(e.kind()));
    } catch (const json::exception& e) {
        set_failure(res, std::string("Malformed request: ") + e.what(), 400);
    } catch (const std::invalid_argument& e) {
        set_failure(res, e.what(), 400);
    }
}
} // namespace

int http_status_for(StoreErrorKind kind) {
    switch (kind) {
    case StoreErrorKind::UpstreamUnavailable:
        return 503;
    case StoreErrorKind::NotFound:
        return 404;
    case StoreErrorKind::ConflictOrRejected:
        return 409;
    case StoreErrorKind::PartialFailure:
        return 502;
    }
    return 500;
}

ApiServer::ApiServer(ApiConfig cfg, std::shared_ptr<BookingCoordinator> booking,
                     std::shared_ptr<GarageLifecycleManager> garages, std::shared_ptr<ConnectionRegistry> registry)
    : cfg_(std::move(cfg)), booking_(std::move(booking)), garages_(std::move(garages)), registry_(std::move(registry)) {}

ApiServer::~ApiServer() {
    stop();
}

bool ApiServer::start() {
    if (started_.exchange(true)) return false;
    setup_routes();
    server_.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr eptr) {
        std::string msg = "Unhandled server error";
        if (eptr) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& e) {
                msg = e.what();
            }
        }
        EVLOG_error << "Request failed: " << msg;
        set_failure(res, msg, 500);
    });
    server_.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (!res.body.empty()) return;
        set_failure(res, "Not found", res.status > 0 ? res.status : 404);
    });
    server_.set_payload_max_length(1024 * 1024);

    const auto host = cfg_.host.empty() ? "0.0.0.0" : cfg_.host.c_str();
    if (cfg_.port > 0) {
        if (!server_.bind_to_port(host, cfg_.port)) {
            EVLOG_error << "Cannot bind request API to " << host << ":" << cfg_.port;
            return false;
        }
        port_ = cfg_.port;
    } else {
        port_ = server_.bind_to_any_port(host);
        if (port_ <= 0) {
            EVLOG_error << "Cannot bind request API to " << host;
            return false;
        }
    }

    server_thread_ = std::thread([this]() { server_.listen_after_bind(); });
    // stop() is a no-op until the accept loop runs, so do not hand back a half-started server.
    for (int i = 0; i < 2000 && !server_.is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EVLOG_info << "Request API listening on http://" << host << ":" << port_;
    return true;
}

void ApiServer::stop() {
    if (!started_ || stopped_.exchange(true)) {
        return;
    }
    server_.stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

void ApiServer::setup_routes() {
    server_.Options(R"(/.*)", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        res.set_header("Access-Control-Allow-Methods", "GET,POST,DELETE,OPTIONS");
        res.status = 200;
    });

    server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        set_json_response(res, json{{"ok", true}, {"machines", registry_->size()}});
    });

    server_.Post("/find-spot",
                 [this](const httplib::Request& req, httplib::Response& res) { handle_find_spot(req, res); });
    server_.Post("/book-spot",
                 [this](const httplib::Request& req, httplib::Response& res) { handle_book_spot(req, res); });
    server_.Post(R"(/clear-spot/(.+))",
                 [this](const httplib::Request& req, httplib::Response& res) { handle_clear_spot(req, res); });
    server_.Post("/clear-all-spots",
                 [this](const httplib::Request&, httplib::Response& res) { handle_clear_all_spots(res); });
    server_.Post("/parking-garage",
                 [this](const httplib::Request& req, httplib::Response& res) { handle_register_garage(req, res); });
    server_.Delete(R"(/delete-garage/(.+))",
                   [this](const httplib::Request& req, httplib::Response& res) { handle_delete_garage(req, res); });
}

void ApiServer::handle_find_spot(const httplib::Request& req, httplib::Response& res) {
    guarded(res, [&]() {
        const auto body = parse_body_object(req);
        BookingRequest request;
        request.requires_disabled = body.value("requires_disabled", false);
        request.requires_female = body.value("requires_female", false);
        request.requires_ev = body.value("requires_ev", false);

        const auto spot = booking_->allocate(request);
        if (!spot) {
            set_json_response(res, json{{"status", "failure"}, {"message", "No suitable spots available."}});
            return;
        }
        set_json_response(res, json{{"status", "success"},
                                    {"assigned_spot_id", spot->id},
                                    {"spot_number", spot->spot_number ? json(*spot->spot_number) : json(nullptr)},
                                    {"coordinates", coordinates_json(spot->position())},
                                    {"message", "Spot reserved successfully."}});
    });
}

void ApiServer::handle_book_spot(const httplib::Request& req, httplib::Response& res) {
    guarded(res, [&]() {
        const auto body = parse_body_object(req);
        const auto spot_id = body.value("spot_id", std::string{});
        if (spot_id.empty()) {
            throw std::invalid_argument("spot_id is required");
        }
        const auto confirmation = booking_->confirm_booking(spot_id);
        set_json_response(res, json{{"status", "success"},
                                    {"message", "Spot " + spot_id + " is now locked. Other users will not see it."},
                                    {"coordinates", coordinates_json(confirmation.coordinates)},
                                    {"machines_notified", confirmation.machines_notified}});
    });
}

void ApiServer::handle_clear_spot(const httplib::Request& req, httplib::Response& res) {
    guarded(res, [&]() {
        const std::string spot_id = req.matches[1];
        booking_->release_spot(spot_id);
        set_json_response(res, json{{"status", "success"},
                                    {"message", "Spot " + spot_id + " is now free and available for new bookings."}});
    });
}

void ApiServer::handle_clear_all_spots(httplib::Response& res) {
    guarded(res, [&]() {
        const auto summary = booking_->release_all_spots();
        set_json_response(res, json{{"status", "success"},
                                    {"message", std::to_string(summary.total) + " Spots are now free."},
                                    {"released", summary.released},
                                    {"total", summary.total}});
    });
}

void ApiServer::handle_register_garage(const httplib::Request& req, httplib::Response& res) {
    guarded(res, [&]() {
        garages_->register_garage(json::parse(req.body));
        set_json_response(res, json{{"status", "success"}, {"message", "Parking Garage registered successfully."}});
    });
}

void ApiServer::handle_delete_garage(const httplib::Request& req, httplib::Response& res) {
    guarded(res, [&]() {
        const std::string garage_id = req.matches[1];
        const auto result = garages_->delete_garage(garage_id);
        set_json_response(res, json{{"message", "Garage and related spots deleted successfully"},
                                    {"garageId", result.garage_id},
                                    {"deletedSpots", result.deleted_spot_ids},
                                    {"spotsDeletedCount", result.deleted_spot_ids.size()}});
    });
}

} // namespace parking
