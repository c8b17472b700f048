/**
 * @file CampaignServerApp.hpp
 * @brief Main application class for the CampaignFlow server.
 */

#pragma once

#include <memory>
#include <ostream>
#include "infrastructure/ConfigLoader.hpp"

namespace campaignflow::application {
class ConversationService;
class SessionRegistry;
}

namespace campaignflow::infrastructure {
class SseTransport;
}

namespace campaignflow::app {

/**
 * @class CampaignServerApp
 * @brief Orchestrates the server lifecycle: composition, the serve loop and shutdown.
 */
class CampaignServerApp {
public:
    explicit CampaignServerApp(infrastructure::ServerConfig config);
    ~CampaignServerApp();

    /**
     * @brief Serves until RequestStop() or a SIGINT/SIGTERM.
     * @return Exit code (0 for success).
     */
    int Run();

    /** @brief Async-signal-safe stop request. */
    static void RequestStop();

    /** @brief Writes the workflow graph as a Mermaid flowchart. */
    static void PrintGraph(std::ostream& out);

private:
    /**
     * @brief Builds every service and binds the listening socket.
     * @return True if the server is ready to listen.
     */
    bool Init();

    /**
     * @brief Cancels sessions, waits for their tasks and stops the transport.
     */
    void Shutdown();

    infrastructure::ServerConfig m_config;
    std::shared_ptr<infrastructure::SseTransport> m_transport;
    std::shared_ptr<application::SessionRegistry> m_registry;
    std::shared_ptr<application::ConversationService> m_conversations;
};

} // namespace campaignflow::app
