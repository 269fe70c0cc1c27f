// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "booking_coordinator.hpp"
#include "connection_registry.hpp"
#include "garage_lifecycle.hpp"
#include "service_config.hpp"

#include <atomic>
#include <memory>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace parking {

/// \brief HTTP front door: allocation, booking confirmation, spot release and garage lifecycle.
class ApiServer {
public:
    ApiServer(ApiConfig cfg, std::shared_ptr<BookingCoordinator> booking,
              std::shared_ptr<GarageLifecycleManager> garages, std::shared_ptr<ConnectionRegistry> registry);
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    bool start();
    void stop();

    int port() const { return port_; }

private:
    ApiConfig cfg_;
    std::shared_ptr<BookingCoordinator> booking_;
    std::shared_ptr<GarageLifecycleManager> garages_;
    std::shared_ptr<ConnectionRegistry> registry_;
    httplib::Server server_;
    std::thread server_thread_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
    int port_{0};

    void setup_routes();
    void handle_find_spot(const httplib::Request& req, httplib::Response& res);
    void handle_book_spot(const httplib::Request& req, httplib::Response& res);
    void handle_clear_spot(const httplib::Request& req, httplib::Response& res);
    void handle_clear_all_spots(httplib::Response& res);
    void handle_register_garage(const httplib::Request& req, httplib::Response& res);
    void handle_delete_garage(const httplib::Request& req, httplib::Response& res);
};

/// \brief HTTP status reported to callers for a store failure of \p kind.
int http_status_for(StoreErrorKind kind);

} // namespace parking
