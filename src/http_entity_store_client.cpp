// SPDX-License-Identifier: Apache-2.0
#include "http_entity_store_client.hpp"

#include <mutex>
#include <new>
#include <utility>

#include <curl/curl.h>
#include <everest/logging.hpp>

namespace parking {

namespace {

size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string url_escape(const std::string& raw) {
    char* escaped = curl_easy_escape(nullptr, raw.c_str(), static_cast<int>(raw.size()));
    if (!escaped) {
        throw std::bad_alloc();
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

[[noreturn]] void fail(StoreErrorKind kind, const std::string& message, long http_status = 0) {
    EVLOG_warning << "Entity store " << to_string(kind) << ": " << message
                  << (http_status ? " (HTTP " + std::to_string(http_status) + ")" : "");
    throw StoreError(kind, message, http_status);
}

} // namespace

HttpEntityStoreClient::HttpEntityStoreClient(BrokerConfig cfg) : cfg_(std::move(cfg)) {
    static std::once_flag curl_once;
    std::call_once(curl_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::vector<nlohmann::json> HttpEntityStoreClient::list_entities(const std::string& type,
                                                                 const std::optional<std::string>& query) {
    std::vector<nlohmann::json> out;
    for (int offset = 0;; offset += cfg_.page_size) {
        std::string url = cfg_.url + "/entities?type=" + url_escape(type);
        if (query) {
            url += "&q=" + url_escape(*query);
        }
        url += "&limit=" + std::to_string(cfg_.page_size) + "&offset=" + std::to_string(offset);

        const auto resp = perform("GET", url, nullptr);
        ensure_success(resp, "list " + type);
        auto page = parse_body(resp, "list " + type);
        if (!page.is_array()) {
            fail(StoreErrorKind::UpstreamUnavailable, "list " + type + ": broker returned a non-array body",
                 resp.status);
        }
        const auto count = page.size();
        for (auto& entity : page) {
            out.push_back(std::move(entity));
        }
        if (count < static_cast<std::size_t>(cfg_.page_size)) break;
    }
    return out;
}

nlohmann::json HttpEntityStoreClient::get_entity(const std::string& id) {
    const auto resp = perform("GET", entity_url(id), nullptr);
    ensure_success(resp, "get " + id);
    auto entity = parse_body(resp, "get " + id);
    if (!entity.is_object()) {
        fail(StoreErrorKind::UpstreamUnavailable, "get " + id + ": broker returned a non-object body", resp.status);
    }
    return entity;
}

void HttpEntityStoreClient::update_attributes(const std::string& id, const nlohmann::json& attrs) {
    const auto body = attrs.dump();
    const auto resp = perform("PATCH", entity_url(id) + "/attrs", &body);
    ensure_success(resp, "update " + id);
}

void HttpEntityStoreClient::create_entity(const nlohmann::json& entity) {
    const auto body = entity.dump();
    const auto resp = perform("POST", cfg_.url + "/entities", &body);
    const auto id = entity.is_object() && entity.contains("id") && entity["id"].is_string()
                        ? entity["id"].get<std::string>()
                        : std::string{"<no id>"};
    ensure_success(resp, "create " + id);
}

void HttpEntityStoreClient::delete_entity(const std::string& id) {
    const auto resp = perform("DELETE", entity_url(id), nullptr);
    ensure_success(resp, "delete " + id);
}

HttpEntityStoreClient::HttpResponse HttpEntityStoreClient::perform(const std::string& method, const std::string& url,
                                                                   const std::string* body) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        fail(StoreErrorKind::UpstreamUnavailable, "curl_easy_init failed");
    }

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, body ? "Content-Type: application/json" : "Accept: application/ld+json");
    if (!cfg_.context_link.empty()) {
        const auto link = "Link: <" + cfg_.context_link +
                          ">; rel=\"http://www.w3.org/ns/json-ld#context\"; type=\"application/ld+json\"";
        headers = curl_slist_append(headers, link.c_str());
    }
    if (!cfg_.tenant.empty()) {
        const auto tenant = "NGSILD-Tenant: " + cfg_.tenant;
        headers = curl_slist_append(headers, tenant.c_str());
    }

    HttpResponse resp;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(cfg_.connect_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(cfg_.request_timeout_ms));
    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
    } else if (method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    if (body) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body->size()));
    }

    const CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    }
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        fail(StoreErrorKind::UpstreamUnavailable, method + " " + url + ": " + curl_easy_strerror(res));
    }
    EVLOG_debug << method << " " << url << " -> " << resp.status;
    return resp;
}

std::string HttpEntityStoreClient::entity_url(const std::string& id) const {
    return cfg_.url + "/entities/" + url_escape(id);
}

nlohmann::json HttpEntityStoreClient::parse_body(const HttpResponse& resp, const std::string& what) const {
    try {
        return nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::exception& e) {
        fail(StoreErrorKind::UpstreamUnavailable, what + ": unparsable broker response: " + e.what(), resp.status);
    }
}

void HttpEntityStoreClient::ensure_success(const HttpResponse& resp, const std::string& what) const {
    if (resp.status >= 200 && resp.status < 300) return;
    std::string detail = resp.body;
    if (detail.size() > 512) {
        detail = detail.substr(0, 512) + "...";
    }
    fail(kind_from_http_status(resp.status), what + " rejected by broker: " + detail, resp.status);
}

} // namespace parking
