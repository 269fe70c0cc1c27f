// SPDX-License-Identifier: Apache-2.0
#include "api_server.hpp"
#include "booking_coordinator.hpp"
#include "connection_registry.hpp"
#include "garage_lifecycle.hpp"
#include "http_entity_store_client.hpp"
#include "machine_gateway.hpp"
#include "service_config.hpp"
#include "simulated_entity_store.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include <everest/logging.hpp>

namespace {
std::atomic<bool> keep_running{true};

void handle_signal(int) {
    keep_running = false;
}

struct CliOptions {
    std::string config_path{"configs/parking.json"};
    bool force_simulation{false};
};

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--simulate") {
            opts.force_simulation = true;
        }
    }
    return opts;
}
} // namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);

    parking::ServiceConfig cfg;
    try {
        cfg = parking::load_service_config(opts.config_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return 1;
    }
    if (opts.force_simulation) {
        cfg.simulation.enabled = true;
    }

    if (parking::fs::exists(cfg.logging_config)) {
        Everest::Logging::init(cfg.logging_config.string(), "parking-dispatch");
    } else {
        std::cerr << "Logging config " << cfg.logging_config << " not found; using default log sink" << std::endl;
    }

    std::shared_ptr<parking::EntityStoreClient> store;
    if (cfg.simulation.enabled) {
        try {
            std::vector<nlohmann::json> seed;
            if (!cfg.simulation.seed_file.empty()) {
                seed = parking::SimulatedEntityStore::load_seed_file(cfg.simulation.seed_file);
            }
            store = std::make_shared<parking::SimulatedEntityStore>(std::move(seed));
        } catch (const std::exception& e) {
            EVLOG_error << "Failed to seed simulated store: " << e.what();
            return 1;
        }
        EVLOG_warning << "Running against the simulated entity store; no broker is contacted";
    } else {
        store = std::make_shared<parking::HttpEntityStoreClient>(cfg.broker);
        EVLOG_info << "Using context broker at " << cfg.broker.url;
    }

    auto registry = std::make_shared<parking::ConnectionRegistry>();
    auto booking = std::make_shared<parking::BookingCoordinator>(cfg.broker, store, registry);
    auto garages = std::make_shared<parking::GarageLifecycleManager>(cfg.broker, store);

    parking::MachineGateway gateway(cfg.machines, registry);
    if (!gateway.start()) {
        EVLOG_error << "Failed to start machine gateway";
        return 1;
    }
    parking::ApiServer api(cfg.api, booking, garages, registry);
    if (!api.start()) {
        EVLOG_error << "Failed to start request API";
        gateway.stop();
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    while (keep_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    EVLOG_info << "Shutting down";
    api.stop();
    gateway.stop();
    return 0;
}
