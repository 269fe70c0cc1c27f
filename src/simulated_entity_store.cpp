// SPDX-License-Identifier: Apache-2.0
#include "simulated_entity_store.hpp"
#include "ngsi_entity.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace parking {

namespace {

std::string entity_id(const nlohmann::json& entity) {
    const auto it = entity.find("id");
    if (it == entity.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

bool entity_has_type(const nlohmann::json& entity, const std::string& type) {
    const auto it = entity.find("type");
    return it != entity.end() && it->is_string() && it->get<std::string>() == type;
}

// Supports the single form the service issues: <attribute>==<value>
bool matches_query(const nlohmann::json& entity, const std::string& query) {
    const auto pos = query.find("==");
    if (pos == std::string::npos) {
        throw StoreError(StoreErrorKind::ConflictOrRejected, "Unsupported query: " + query, 400);
    }
    const auto attribute = query.substr(0, pos);
    auto expected = query.substr(pos + 2);
    if (expected.size() >= 2 && expected.front() == '"' && expected.back() == '"') {
        expected = expected.substr(1, expected.size() - 2);
    }
    const auto value = NgsiAttribute::of(entity, attribute).unwrap();
    return value && value->is_string() && value->get<std::string>() == expected;
}

std::optional<std::string> status_of(const nlohmann::json& attrs_or_entity) {
    const auto value = NgsiAttribute::of(attrs_or_entity, "status").unwrap();
    if (!value || !value->is_string()) return std::nullopt;
    return value->get<std::string>();
}

} // namespace

SimulatedEntityStore::SimulatedEntityStore(std::vector<nlohmann::json> entities) {
    for (auto& e : entities) {
        create_entity(e);
    }
}

std::vector<nlohmann::json> SimulatedEntityStore::list_entities(const std::string& type,
                                                                const std::optional<std::string>& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available();
    std::vector<nlohmann::json> out;
    for (const auto& e : entities_) {
        if (!entity_has_type(e, type)) continue;
        if (query && !matches_query(e, *query)) continue;
        out.push_back(e);
    }
    return out;
}

nlohmann::json SimulatedEntityStore::get_entity(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available();
    const auto it = find_locked(id);
    if (it == entities_.end()) {
        throw StoreError(StoreErrorKind::NotFound, "Entity " + id + " not found", 404);
    }
    return *it;
}

void SimulatedEntityStore::update_attributes(const std::string& id, const nlohmann::json& attrs) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available();
    if (!attrs.is_object()) {
        throw StoreError(StoreErrorKind::ConflictOrRejected, "Attribute payload must be an object", 400);
    }
    const auto it = find_locked(id);
    if (it == entities_.end()) {
        throw StoreError(StoreErrorKind::NotFound, "Entity " + id + " not found", 404);
    }
    const auto requested = status_of(attrs);
    if (requested && *requested == "occupied" && status_of(*it) == std::optional<std::string>{"occupied"}) {
        throw StoreError(StoreErrorKind::ConflictOrRejected, "Entity " + id + " is already occupied", 409);
    }
    for (const auto& [name, value] : attrs.items()) {
        (*it)[name] = value;
    }
    ++update_count_;
}

void SimulatedEntityStore::create_entity(const nlohmann::json& entity) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available();
    if (!entity.is_object()) {
        throw StoreError(StoreErrorKind::ConflictOrRejected, "Entity must be a JSON object", 400);
    }
    const auto id = entity_id(entity);
    if (id.empty()) {
        throw StoreError(StoreErrorKind::ConflictOrRejected, "Entity is missing an id", 400);
    }
    if (find_locked(id) != entities_.end()) {
        throw StoreError(StoreErrorKind::ConflictOrRejected, "Entity " + id + " already exists", 409);
    }
    entities_.push_back(entity);
}

void SimulatedEntityStore::delete_entity(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_available();
    if (failing_deletes_.count(id)) {
        throw StoreError(StoreErrorKind::ConflictOrRejected, "Delete of " + id + " rejected", 400);
    }
    const auto it = find_locked(id);
    if (it == entities_.end()) {
        throw StoreError(StoreErrorKind::NotFound, "Entity " + id + " not found", 404);
    }
    entities_.erase(it);
}

std::vector<nlohmann::json> SimulatedEntityStore::load_seed_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Unable to open simulation seed file: " + path.string());
    }
    const auto j = nlohmann::json::parse(in);
    if (!j.is_array()) {
        throw std::runtime_error("Simulation seed file must hold a JSON array: " + path.string());
    }
    return j.get<std::vector<nlohmann::json>>();
}

void SimulatedEntityStore::set_unavailable(bool unavailable) {
    std::lock_guard<std::mutex> lock(mutex_);
    unavailable_ = unavailable;
}

void SimulatedEntityStore::fail_delete(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_deletes_.insert(id);
}

bool SimulatedEntityStore::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entities_.begin(), entities_.end(),
                       [&id](const nlohmann::json& e) { return entity_id(e) == id; });
}

std::size_t SimulatedEntityStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entities_.size();
}

std::size_t SimulatedEntityStore::update_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return update_count_;
}

void SimulatedEntityStore::check_available() const {
    if (unavailable_) {
        throw StoreError(StoreErrorKind::UpstreamUnavailable, "Simulated store unavailable");
    }
}

std::vector<nlohmann::json>::iterator SimulatedEntityStore::find_locked(const std::string& id) {
    return std::find_if(entities_.begin(), entities_.end(),
                        [&id](const nlohmann::json& e) { return entity_id(e) == id; });
}

} // namespace parking
