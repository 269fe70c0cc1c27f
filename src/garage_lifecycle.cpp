// SPDX-License-Identifier: Apache-2.0
#include "garage_lifecycle.hpp"

#include <stdexcept>
#include <utility>

#include <everest/logging.hpp>

namespace parking {

GarageLifecycleManager::GarageLifecycleManager(BrokerConfig cfg, std::shared_ptr<EntityStoreClient> store)
    : cfg_(std::move(cfg)), store_(std::move(store)) {}

void GarageLifecycleManager::register_garage(const nlohmann::json& garage) {
    if (!garage.is_object() || !garage.contains("id") || !garage["id"].is_string() ||
        garage["id"].get<std::string>().empty()) {
        throw std::invalid_argument("Garage entity must be a JSON object with a non-empty string id");
    }
    store_->create_entity(garage);
    EVLOG_info << "Garage " << garage["id"].get<std::string>() << " registered";
}

GarageDeletionResult GarageLifecycleManager::delete_garage(const std::string& garage_id) {
    GarageDeletionResult result;
    result.garage_id = garage_id;

    const auto spots = store_->list_entities(cfg_.spot_type, relationship_query(cfg_.garage_relationship, garage_id));
    for (const auto& spot : spots) {
        const auto it = spot.find("id");
        if (it == spot.end() || !it->is_string()) continue;
        const auto spot_id = it->get<std::string>();
        try {
            store_->delete_entity(spot_id);
            result.deleted_spot_ids.push_back(spot_id);
        } catch (const StoreError& e) {
            EVLOG_warning << "Spot " << spot_id << " of garage " << garage_id << " not deleted: " << e.what();
            result.failed_spot_ids.push_back(spot_id);
        }
    }

    try {
        store_->delete_entity(garage_id);
    } catch (const StoreError& e) {
        EVLOG_error << "Garage " << garage_id << " not deleted after removing " << result.deleted_spot_ids.size()
                    << " spot(s): " << e.what();
        throw GarageDeletionError("Failed to delete garage " + garage_id + ": " + e.what(), e.http_status(),
                                  std::move(result));
    }
    EVLOG_info << "Garage " << garage_id << " deleted with " << result.deleted_spot_ids.size() << " spot(s)";
    return result;
}

} // namespace parking
