// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "store_error.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace parking {

/// \brief Abstract access to the digital-twin entity store (NGSI-LD context broker).
///
/// Pure I/O: no business rules live behind this interface. Every call may block on the network and
/// reports failure by throwing StoreError.
class EntityStoreClient {
public:
    virtual ~EntityStoreClient() = default;

    /// \brief GET /entities?type=<type>[&q=<query>]; records are returned in store order.
    virtual std::vector<nlohmann::json> list_entities(const std::string& type,
                                                      const std::optional<std::string>& query = std::nullopt) = 0;

    /// \brief GET /entities/{id}
    virtual nlohmann::json get_entity(const std::string& id) = 0;

    /// \brief PATCH /entities/{id}/attrs
    virtual void update_attributes(const std::string& id, const nlohmann::json& attrs) = 0;

    /// \brief POST /entities
    virtual void create_entity(const nlohmann::json& entity) = 0;

    /// \brief DELETE /entities/{id}
    virtual void delete_entity(const std::string& id) = 0;
};

/// \brief NGSI-LD q filter selecting entities whose \p relationship points at \p target_id.
inline std::string relationship_query(const std::string& relationship, const std::string& target_id) {
    return relationship + "==" + target_id;
}

} // namespace parking
