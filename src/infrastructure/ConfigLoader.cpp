/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace campaignflow::infrastructure {

namespace {

template <typename T>
void Read(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

const char* Env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

// Accepts "host", "host:port" and "http://host:port".
void SplitHostPort(const std::string& value, std::string& host, int& port) {
    std::string rest = value;
    auto scheme = rest.find("://");
    if (scheme != std::string::npos) rest = rest.substr(scheme + 3);
    while (!rest.empty() && rest.back() == '/') rest.pop_back();

    auto colon = rest.rfind(':');
    if (colon == std::string::npos) {
        host = rest;
        return;
    }
    host = rest.substr(0, colon);
    try {
        port = std::stoi(rest.substr(colon + 1));
    } catch (const std::exception&) {
        std::cerr << "[ConfigLoader] Invalid port in '" << value << "', keeping " << port << std::endl;
    }
}

} // namespace

ServerConfig ConfigLoader::FromJson(const nlohmann::json& settings, ServerConfig base) {
    if (!settings.is_object()) {
        std::cerr << "[ConfigLoader] settings.json is not an object, using defaults" << std::endl;
        return base;
    }
    Read(settings, "host", base.host);
    Read(settings, "port", base.port);
    Read(settings, "worker_threads", base.workerThreads);
    Read(settings, "ollama_host", base.ollamaHost);
    Read(settings, "ollama_port", base.ollamaPort);
    Read(settings, "ollama_model", base.ollamaModel);
    Read(settings, "contacts_api_url", base.contactsApiUrl);
    Read(settings, "contacts_api_key", base.contactsApiKey);
    Read(settings, "contacts_bearer_token", base.contactsBearerToken);
    Read(settings, "default_location_id", base.defaultLocationId);
    Read(settings, "max_clarifications", base.maxClarifications);
    Read(settings, "resume_on_reconnect", base.resumeOnReconnect);

    base.maxClarifications = std::clamp(base.maxClarifications, 0, 5);
    return base;
}

void ConfigLoader::ApplyEnvironment(ServerConfig& config) {
    if (const char* port = Env("CAMPAIGNFLOW_PORT")) {
        try {
            config.port = std::stoi(port);
        } catch (const std::exception&) {
            std::cerr << "[ConfigLoader] Ignoring invalid CAMPAIGNFLOW_PORT '" << port << "'" << std::endl;
        }
    }
    if (const char* host = Env("OLLAMA_HOST")) SplitHostPort(host, config.ollamaHost, config.ollamaPort);
    if (const char* model = Env("OLLAMA_MODEL")) config.ollamaModel = model;
    if (const char* url = Env("CONTACTS_API_URL")) config.contactsApiUrl = url;
    if (const char* key = Env("CONTACTS_API_KEY")) config.contactsApiKey = key;
    if (const char* token = Env("CONTACTS_BEARER_TOKEN")) config.contactsBearerToken = token;
    if (const char* location = Env("DEFAULT_LOCATION_ID")) config.defaultLocationId = location;
}

ServerConfig ConfigLoader::Load(const std::string& configDir) {
    ServerConfig config;
    std::filesystem::path configPath = std::filesystem::path(configDir) / "settings.json";

    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            nlohmann::json j;
            f >> j;
            config = FromJson(j, config);
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        }
    } else {
        std::cout << "[ConfigLoader] No settings.json in " << configDir << ", using defaults" << std::endl;
    }

    ApplyEnvironment(config);
    return config;
}

} // namespace campaignflow::infrastructure
