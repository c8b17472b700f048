/**
 * @file ContactListClient.hpp
 * @brief ListProvider over the contact-lists REST API.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/ListProvider.hpp"

namespace campaignflow::infrastructure {

/**
 * @class ContactListClient
 * @brief Fetches GET {api}/v2/locations/{id}/contact_lists and keeps the smart lists.
 *
 * Per-request credentials override the configured ones field by field. https URLs need
 * cpp-httplib built with OpenSSL support.
 */
class ContactListClient : public domain::ListProvider {
public:
    struct Endpoint {
        std::string origin;     ///< scheme://host[:port]
        std::string pathPrefix; ///< Always ends in /v2.
    };

    explicit ContactListClient(domain::ListApiCredentials defaults, int timeoutSeconds = 30);

    domain::ListLookup fetchLists(const std::string& locationId,
                                  const domain::ListApiCredentials& credentials) override;

    /** @brief Splits a base URL and appends /v2 when missing. nullopt for a malformed URL. */
    static std::optional<Endpoint> SplitBaseUrl(const std::string& baseUrl);

    /** @brief Reads a JSON:API contact_lists document, keeping list_type == "smart". */
    static domain::ListLookup ParseSmartLists(const std::string& body);

private:
    domain::ListApiCredentials m_defaults;
    int m_timeoutSeconds;
};

} // namespace campaignflow::infrastructure
