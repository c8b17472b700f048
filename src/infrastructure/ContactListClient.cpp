#include "infrastructure/ContactListClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace campaignflow::infrastructure {

using domain::ContactList;
using domain::ListApiCredentials;
using domain::ListLookup;
using json = nlohmann::json;

namespace {

constexpr const char* kUserAgent = "CampaignFlow/1.0";
constexpr int kPageSize = 1000;

std::string Pick(const std::string& preferred, const std::string& fallback) {
    return preferred.empty() ? fallback : preferred;
}

ListLookup Failure(std::string reason) {
    ListLookup lookup;
    lookup.error = std::move(reason);
    return lookup;
}

std::string StringAttr(const json& attrs, const char* key) {
    if (attrs.contains(key) && attrs[key].is_string()) {
        return attrs[key].get<std::string>();
    }
    return "";
}

} // namespace

ContactListClient::ContactListClient(ListApiCredentials defaults, int timeoutSeconds)
    : m_defaults(std::move(defaults)), m_timeoutSeconds(timeoutSeconds) {}

std::optional<ContactListClient::Endpoint> ContactListClient::SplitBaseUrl(const std::string& baseUrl) {
    std::string url = baseUrl;
    while (!url.empty() && url.back() == '/') url.pop_back();

    auto scheme = url.find("://");
    if (scheme == std::string::npos || scheme == 0) return std::nullopt;
    auto hostStart = scheme + 3;
    if (hostStart >= url.size()) return std::nullopt;

    Endpoint endpoint;
    auto pathStart = url.find('/', hostStart);
    if (pathStart == std::string::npos) {
        endpoint.origin = url;
    } else {
        endpoint.origin = url.substr(0, pathStart);
        endpoint.pathPrefix = url.substr(pathStart);
    }
    const std::string suffix = "/v2";
    if (endpoint.pathPrefix.size() < suffix.size() ||
        endpoint.pathPrefix.compare(endpoint.pathPrefix.size() - suffix.size(), suffix.size(), suffix) != 0) {
        endpoint.pathPrefix += suffix;
    }
    return endpoint;
}

ListLookup ContactListClient::ParseSmartLists(const std::string& body) {
    json doc;
    try {
        doc = json::parse(body);
    } catch (const json::parse_error& e) {
        return Failure(std::string("invalid JSON from list API: ") + e.what());
    }
    if (!doc.is_object() || !doc.contains("data") || !doc["data"].is_array()) {
        return Failure("list API response has no 'data' array");
    }

    ListLookup lookup;
    for (const auto& item : doc["data"]) {
        if (!item.is_object() || !item.contains("attributes") || !item["attributes"].is_object()) continue;
        const auto& attrs = item["attributes"];
        if (StringAttr(attrs, "list_type") != "smart") continue;

        ContactList list;
        if (item.contains("id") && item["id"].is_string()) {
            list.id = item["id"].get<std::string>();
        } else if (item.contains("id") && item["id"].is_number_integer()) {
            list.id = std::to_string(item["id"].get<long long>());
        } else {
            continue;
        }
        list.name = StringAttr(attrs, "name");
        list.displayName = Pick(StringAttr(attrs, "display_name"), list.name);
        for (const char* key : {"contacts_count", "contact_count", "size"}) {
            if (attrs.contains(key) && attrs[key].is_number_integer()) {
                list.size = attrs[key].get<long long>();
                break;
            }
        }
        lookup.lists.push_back(std::move(list));
    }
    return lookup;
}

ListLookup ContactListClient::fetchLists(const std::string& locationId, const ListApiCredentials& credentials) {
    if (locationId.empty()) {
        return Failure("no location id");
    }
    const std::string apiUrl = Pick(credentials.apiUrl, m_defaults.apiUrl);
    const std::string apiKey = Pick(credentials.apiKey, m_defaults.apiKey);
    const std::string bearer = Pick(credentials.bearerToken, m_defaults.bearerToken);
    if (apiKey.empty()) return Failure("list API key not configured");
    if (bearer.empty()) return Failure("list API bearer token not configured");

    auto endpoint = SplitBaseUrl(apiUrl);
    if (!endpoint) {
        return Failure("invalid list API URL '" + apiUrl + "'");
    }

    httplib::Client cli(endpoint->origin);
    cli.set_connection_timeout(m_timeoutSeconds);
    cli.set_read_timeout(m_timeoutSeconds);

    httplib::Headers headers = {
        {"accept", "application/vnd.api+json"},
        {"authorization", "Bearer " + bearer},
        {"x-api-key", apiKey},
        {"user-agent", kUserAgent}
    };
    const std::string path = endpoint->pathPrefix + "/locations/" + locationId +
                             "/contact_lists?page.size=" + std::to_string(kPageSize);

    auto res = cli.Get(path, headers);
    if (!res) {
        return Failure("list API request failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        return Failure("list API returned HTTP " + std::to_string(res->status));
    }

    auto lookup = ParseSmartLists(res->body);
    if (lookup.ok()) {
        std::cout << "[ContactListClient] " << lookup.lists.size() << " smart list(s) for " << locationId << std::endl;
    }
    return lookup;
}

} // namespace campaignflow::infrastructure
