/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading server configuration (settings.json plus environment).
 *
 * Provides a unified way to access configuration without scattering JSON parsing
 * logic throughout the codebase.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace campaignflow::infrastructure {

/**
 * @struct ServerConfig
 * @brief Every tunable of the service, with working defaults.
 */
struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    int workerThreads = 64;

    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string ollamaModel = "qwen2.5:7b";

    std::string contactsApiUrl = "https://api.staging.hirefrederick.com/v2";
    std::string contactsApiKey;
    std::string contactsBearerToken;
    std::string defaultLocationId;

    int maxClarifications = 5;     ///< Clamped to 0..5.
    bool resumeOnReconnect = true;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from configDir, then applies environment overrides.
     * Missing or malformed files leave the defaults in place.
     */
    static ServerConfig Load(const std::string& configDir);

    /** @brief Overlays the keys present in a settings object onto base. */
    static ServerConfig FromJson(const nlohmann::json& settings, ServerConfig base = {});

    /**
     * @brief Applies CAMPAIGNFLOW_PORT, OLLAMA_HOST, OLLAMA_MODEL, CONTACTS_API_URL,
     *        CONTACTS_API_KEY, CONTACTS_BEARER_TOKEN and DEFAULT_LOCATION_ID.
     */
    static void ApplyEnvironment(ServerConfig& config);
};

} // namespace campaignflow::infrastructure
