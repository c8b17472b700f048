#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "app/CampaignServerApp.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace campaignflow;

namespace {

void PrintUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config <dir>] [--port <port>] [--print-graph]\n"
              << "  --config <dir>   directory holding settings.json (default: current directory)\n"
              << "  --port <port>    listen port, overrides settings.json and CAMPAIGNFLOW_PORT\n"
              << "  --print-graph    print the workflow as a Mermaid flowchart and exit" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    std::string configDir = std::filesystem::current_path().string();
    int portOverride = 0;
    bool printGraph = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configDir = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            try {
                portOverride = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return EXIT_FAILURE;
            }
        } else if (arg == "--print-graph") {
            printGraph = true;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return EXIT_SUCCESS;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            PrintUsage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    if (printGraph) {
        app::CampaignServerApp::PrintGraph(std::cout);
        return EXIT_SUCCESS;
    }

    auto config = infrastructure::ConfigLoader::Load(configDir);
    if (portOverride > 0) {
        config.port = portOverride;
    }

    app::CampaignServerApp server(std::move(config));
    return server.Run();
}
