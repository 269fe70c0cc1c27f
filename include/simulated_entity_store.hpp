// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "entity_store_client.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace parking {

/// \brief Simple in-process entity store so booking flows can be exercised without a context broker.
///
/// Mirrors the broker contract the service depends on: store-order listing, 404 on unknown ids and
/// single-writer-wins on the free -> occupied transition (a second occupy is rejected with 409).
class SimulatedEntityStore : public EntityStoreClient {
public:
    SimulatedEntityStore() = default;
    explicit SimulatedEntityStore(std::vector<nlohmann::json> entities);
    ~SimulatedEntityStore() override = default;

    std::vector<nlohmann::json> list_entities(const std::string& type,
                                              const std::optional<std::string>& query = std::nullopt) override;
    nlohmann::json get_entity(const std::string& id) override;
    void update_attributes(const std::string& id, const nlohmann::json& attrs) override;
    void create_entity(const nlohmann::json& entity) override;
    void delete_entity(const std::string& id) override;

    /// \brief Load a JSON array of entities from disk (simulation seed file).
    static std::vector<nlohmann::json> load_seed_file(const std::filesystem::path& path);

    // Simulation controls for tests/harnesses
    void set_unavailable(bool unavailable);
    void fail_delete(const std::string& id);
    bool contains(const std::string& id) const;
    std::size_t size() const;
    std::size_t update_count() const;

private:
    mutable std::mutex mutex_;
    std::vector<nlohmann::json> entities_; // insertion order == store iteration order
    std::set<std::string> failing_deletes_;
    bool unavailable_{false};
    std::size_t update_count_{0};

    void check_available() const;
    std::vector<nlohmann::json>::iterator find_locked(const std::string& id);
};

} // namespace parking
