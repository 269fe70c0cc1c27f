// SPDX-License-Identifier: Apache-2.0
#include "service_config.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace parking {

namespace {
fs::path make_absolute(const fs::path& base, const fs::path& relative_or_absolute) {
    if (relative_or_absolute.empty() || relative_or_absolute.is_absolute()) {
        return relative_or_absolute;
    }
    return fs::weakly_canonical(base / relative_or_absolute);
}

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error("Invalid config: " + message);
    }
}

void validate(const ServiceConfig& cfg) {
    require(!cfg.broker.url.empty(), "broker.url must not be empty");
    require(cfg.broker.connect_timeout_ms > 0, "broker.connectTimeoutMs must be > 0");
    require(cfg.broker.request_timeout_ms > 0, "broker.requestTimeoutMs must be > 0");
    require(cfg.broker.page_size > 0 && cfg.broker.page_size <= 1000, "broker.pageSize must be in 1..1000");
    require(!cfg.broker.spot_type.empty(), "broker.spotType must not be empty");
    require(!cfg.broker.garage_relationship.empty(), "broker.garageRelationship must not be empty");
    require(cfg.api.port >= 0 && cfg.api.port <= 65535, "api.port out of range");
    require(cfg.machines.port >= 0 && cfg.machines.port <= 65535, "machines.port out of range");
    require(!cfg.machines.path.empty() && cfg.machines.path.front() == '/', "machines.path must start with '/'");
    require(cfg.machines.idle_timeout_s > 0, "machines.idleTimeoutSeconds must be > 0");
    require(cfg.machines.io_threads >= 1, "machines.ioThreads must be >= 1");
}
} // namespace

ServiceConfig load_service_config(const fs::path& config_path) {
    if (!fs::exists(config_path)) {
        throw std::runtime_error("Config file not found: " + config_path.string());
    }

    std::ifstream file(config_path);
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Config file " + config_path.string() + " is not valid JSON: " + e.what());
    }
    const auto base_dir = config_path.parent_path().empty() ? fs::current_path() : config_path.parent_path();

    ServiceConfig cfg{};
    try {
        const auto broker = json.value("broker", nlohmann::json::object());
        cfg.broker.url = strip_trailing_slash(broker.value("url", cfg.broker.url));
        cfg.broker.spot_type = broker.value("spotType", cfg.broker.spot_type);
        cfg.broker.garage_type = broker.value("garageType", cfg.broker.garage_type);
        cfg.broker.garage_relationship = broker.value("garageRelationship", cfg.broker.garage_relationship);
        cfg.broker.context_link = broker.value("contextLink", "");
        cfg.broker.tenant = broker.value("tenant", "");
        cfg.broker.connect_timeout_ms = broker.value("connectTimeoutMs", cfg.broker.connect_timeout_ms);
        cfg.broker.request_timeout_ms = broker.value("requestTimeoutMs", cfg.broker.request_timeout_ms);
        cfg.broker.page_size = broker.value("pageSize", cfg.broker.page_size);

        const auto api = json.value("api", nlohmann::json::object());
        cfg.api.host = api.value("host", cfg.api.host);
        cfg.api.port = api.value("port", cfg.api.port);

        const auto machines = json.value("machines", nlohmann::json::object());
        cfg.machines.host = machines.value("host", cfg.machines.host);
        cfg.machines.port = machines.value("port", cfg.machines.port);
        cfg.machines.path = machines.value("path", cfg.machines.path);
        cfg.machines.idle_timeout_s = machines.value("idleTimeoutSeconds", cfg.machines.idle_timeout_s);
        cfg.machines.io_threads = machines.value("ioThreads", cfg.machines.io_threads);

        const auto simulation = json.value("simulation", nlohmann::json::object());
        cfg.simulation.enabled = simulation.value("enabled", false);
        cfg.simulation.seed_file = make_absolute(base_dir, simulation.value("seedFile", ""));

        cfg.logging_config = make_absolute(base_dir, json.value("loggingConfig", "logging.ini"));
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Config file " + config_path.string() + " has a mistyped field: " + e.what());
    }

    validate(cfg);
    return cfg;
}

} // namespace parking
