#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "infrastructure/ConfigLoader.hpp"

using namespace campaignflow::infrastructure;

namespace {

const char* kEnvVars[] = {
    "CAMPAIGNFLOW_PORT", "OLLAMA_HOST", "OLLAMA_MODEL", "CONTACTS_API_URL",
    "CONTACTS_API_KEY", "CONTACTS_BEARER_TOKEN", "DEFAULT_LOCATION_ID"
};

void ClearEnvironment() {
    for (const char* name : kEnvVars) {
        unsetenv(name);
    }
}

void WriteSettings(const std::filesystem::path& dir, const std::string& content) {
    std::ofstream out(dir / "settings.json");
    out << content;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;
    ClearEnvironment();

    std::string testRoot = "test_project_root_config";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    // Defaults
    ServerConfig defaults = ConfigLoader::Load(testRoot);
    assert(defaults.port == 8000);
    assert(defaults.ollamaHost == "localhost" && defaults.ollamaPort == 11434);
    assert(defaults.maxClarifications == 5);
    assert(defaults.resumeOnReconnect);
    std::cout << "[PASS] Missing settings.json yields defaults." << std::endl;

    // File values, with a bad type ignored and the cap clamped
    WriteSettings(testRoot, R"({
        "host": "127.0.0.1",
        "port": 9100,
        "ollama_model": "llama3.1:8b",
        "contacts_api_key": "file-key",
        "default_location_id": "loc-file",
        "max_clarifications": 12,
        "resume_on_reconnect": false,
        "ollama_port": "not a number"
    })");
    ServerConfig fromFile = ConfigLoader::Load(testRoot);
    assert(fromFile.host == "127.0.0.1" && fromFile.port == 9100);
    assert(fromFile.ollamaModel == "llama3.1:8b");
    assert(fromFile.contactsApiKey == "file-key");
    assert(fromFile.defaultLocationId == "loc-file");
    assert(fromFile.maxClarifications == 5);
    assert(!fromFile.resumeOnReconnect);
    assert(fromFile.ollamaPort == 11434);
    std::cout << "[PASS] settings.json values applied." << std::endl;

    // Environment overrides the file
    setenv("CAMPAIGNFLOW_PORT", "9200", 1);
    setenv("OLLAMA_HOST", "http://gpu-box:11500/", 1);
    setenv("CONTACTS_API_KEY", "env-key", 1);
    setenv("DEFAULT_LOCATION_ID", "loc-env", 1);
    ServerConfig fromEnv = ConfigLoader::Load(testRoot);
    assert(fromEnv.port == 9200);
    assert(fromEnv.ollamaHost == "gpu-box" && fromEnv.ollamaPort == 11500);
    assert(fromEnv.contactsApiKey == "env-key");
    assert(fromEnv.defaultLocationId == "loc-env");
    assert(fromEnv.ollamaModel == "llama3.1:8b" && "Unset variables keep file values.");

    setenv("CAMPAIGNFLOW_PORT", "eighty", 1);
    setenv("OLLAMA_HOST", "plainhost", 1);
    ServerConfig badEnv = ConfigLoader::Load(testRoot);
    assert(badEnv.port == 9100 && "Invalid port override is ignored.");
    assert(badEnv.ollamaHost == "plainhost" && badEnv.ollamaPort == 11434);
    ClearEnvironment();
    std::cout << "[PASS] Environment overrides." << std::endl;

    // Malformed file
    WriteSettings(testRoot, "{ \"port\": ");
    ServerConfig malformed = ConfigLoader::Load(testRoot);
    assert(malformed.port == 8000);
    WriteSettings(testRoot, "[1, 2, 3]");
    assert(ConfigLoader::Load(testRoot).port == 8000);
    std::cout << "[PASS] Malformed settings.json falls back to defaults." << std::endl;

    std::filesystem::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
