// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "entity_store_client.hpp"
#include "service_config.hpp"

#include <string>
#include <vector>

namespace parking {

/// \brief libcurl-backed client for an NGSI-LD context broker (e.g. FIWARE Orion-LD).
class HttpEntityStoreClient : public EntityStoreClient {
public:
    explicit HttpEntityStoreClient(BrokerConfig cfg);
    ~HttpEntityStoreClient() override = default;

    std::vector<nlohmann::json> list_entities(const std::string& type,
                                              const std::optional<std::string>& query = std::nullopt) override;
    nlohmann::json get_entity(const std::string& id) override;
    void update_attributes(const std::string& id, const nlohmann::json& attrs) override;
    void create_entity(const nlohmann::json& entity) override;
    void delete_entity(const std::string& id) override;

private:
    struct HttpResponse {
        long status{0};
        std::string body;
    };

    BrokerConfig cfg_;

    HttpResponse perform(const std::string& method, const std::string& url, const std::string* body);
    std::string entity_url(const std::string& id) const;
    nlohmann::json parse_body(const HttpResponse& resp, const std::string& what) const;
    void ensure_success(const HttpResponse& resp, const std::string& what) const;
};

} // namespace parking
