/**
 * @file ClientContext.hpp
 * @brief Per-connection context supplied by the client handshake.
 */

#pragma once

#include <optional>
#include <string>

namespace campaignflow::domain {

/**
 * @struct ClientLocation
 * @brief Business location the campaign is configured for.
 */
struct ClientLocation {
    std::string id;
    std::string name;
    std::string timezone;
    std::string managementSystem;
    std::string website;
    std::string phone;
    std::string state;
    std::string postalCode;
    std::string country;
    std::string currency;
};

/**
 * @struct ListApiCredentials
 * @brief Credentials for the contact-list directory. Empty values fall back to server configuration.
 */
struct ListApiCredentials {
    std::string apiKey;
    std::string bearerToken;
    std::string apiUrl;
};

struct ClientContext {
    std::optional<ClientLocation> location;
    ListApiCredentials credentials;
};

} // namespace campaignflow::domain
