// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "entity_store_client.hpp"
#include "service_config.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace parking {

struct GarageDeletionResult {
    std::string garage_id;
    std::vector<std::string> deleted_spot_ids;
    std::vector<std::string> failed_spot_ids;
};

/// \brief Garage delete failed after its spots were (partly) removed. Nothing is rolled back.
class GarageDeletionError : public StoreError {
public:
    GarageDeletionError(const std::string& message, long http_status, GarageDeletionResult partial)
        : StoreError(StoreErrorKind::PartialFailure, message, http_status), partial_(std::move(partial)) {}

    const GarageDeletionResult& partial() const { return partial_; }

private:
    GarageDeletionResult partial_;
};

/// \brief Registration and cascading deletion of ParkingGarage entities.
class GarageLifecycleManager {
public:
    GarageLifecycleManager(BrokerConfig cfg, std::shared_ptr<EntityStoreClient> store);

    /// \brief Create a garage entity. Throws std::invalid_argument for a body without a string id.
    void register_garage(const nlohmann::json& garage);

    /// \brief Delete every spot referencing \p garage_id, then the garage itself.
    GarageDeletionResult delete_garage(const std::string& garage_id);

private:
    BrokerConfig cfg_;
    std::shared_ptr<EntityStoreClient> store_;
};

} // namespace parking
