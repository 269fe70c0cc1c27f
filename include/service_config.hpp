// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace parking {

namespace fs = std::filesystem;

struct BrokerConfig {
    std::string url{"http://127.0.0.1:1026/ngsi-ld/v1"}; // base URL, without trailing /entities
    std::string spot_type{"SmartIndoorParkingSpot"};
    std::string garage_type{"ParkingGarage"};
    std::string garage_relationship{"refParkingGarage"};
    std::string context_link;      // Optional JSON-LD @context sent as Link header
    std::string tenant;            // Optional NGSILD-Tenant header
    int connect_timeout_ms{2000};
    int request_timeout_ms{5000};  // Whole-transfer ceiling; expiry => UpstreamUnavailable
    int page_size{100};            // limit= used when paging through entity listings
};

struct ApiConfig {
    std::string host{"0.0.0.0"};
    int port{8000};
};

struct MachineGatewayConfig {
    std::string host{"0.0.0.0"};
    int port{8001};                // 0 => ephemeral port
    std::string path{"/ws/machine"};
    int idle_timeout_s{30};
    int io_threads{1};
};

struct SimulationConfig {
    bool enabled{false};
    fs::path seed_file; // JSON array of entities loaded into the simulated store
};

struct ServiceConfig {
    BrokerConfig broker;
    ApiConfig api;
    MachineGatewayConfig machines;
    SimulationConfig simulation;
    fs::path logging_config;
};

/// \brief Load parking.json and populate a ServiceConfig with absolute paths.
ServiceConfig load_service_config(const fs::path& config_path);

} // namespace parking
