/**
 * @file CampaignServerApp.cpp
 * @brief Implementation of the CampaignServerApp class.
 */
#include "app/CampaignServerApp.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include "application/AsyncTaskManager.hpp"
#include "application/CampaignNodes.hpp"
#include "application/CampaignWorkflow.hpp"
#include "application/CheckpointStore.hpp"
#include "application/ConversationService.hpp"
#include "application/SessionRegistry.hpp"
#include "infrastructure/ContactListClient.hpp"
#include "infrastructure/OllamaCompletionService.hpp"
#include "infrastructure/SseTransport.hpp"

namespace campaignflow::app {

namespace {

std::atomic<bool> g_stopRequested{false};

void HandleSignal(int) {
    g_stopRequested.store(true);
}

constexpr std::chrono::milliseconds kPollInterval{200};
constexpr std::chrono::seconds kShutdownTimeout{10};

} // namespace

CampaignServerApp::CampaignServerApp(infrastructure::ServerConfig config)
    : m_config(std::move(config)) {}

CampaignServerApp::~CampaignServerApp() = default;

void CampaignServerApp::RequestStop() {
    g_stopRequested.store(true);
}

void CampaignServerApp::PrintGraph(std::ostream& out) {
    // Nodes are never run here, so no backends are needed.
    auto nodes = std::make_shared<application::CampaignNodes>(nullptr, nullptr);
    out << application::BuildCampaignGraph(nodes).toMermaid();
}

bool CampaignServerApp::Init() {
    // Composition Root
    auto completion = std::make_shared<infrastructure::OllamaCompletionService>(
        m_config.ollamaHost, m_config.ollamaPort, m_config.ollamaModel);

    domain::ListApiCredentials listDefaults;
    listDefaults.apiUrl = m_config.contactsApiUrl;
    listDefaults.apiKey = m_config.contactsApiKey;
    listDefaults.bearerToken = m_config.contactsBearerToken;
    auto lists = std::make_shared<infrastructure::ContactListClient>(listDefaults);

    m_transport = std::make_shared<infrastructure::SseTransport>(m_config.workerThreads);
    auto checkpoints = std::make_shared<application::CheckpointStore>();
    m_registry = std::make_shared<application::SessionRegistry>(m_transport, checkpoints);
    auto taskManager = std::make_shared<application::AsyncTaskManager>();

    auto nodes = std::make_shared<application::CampaignNodes>(completion, lists, m_config.maxClarifications);
    std::shared_ptr<const application::WorkflowGraph> graph;
    try {
        graph = std::make_shared<application::WorkflowGraph>(application::BuildCampaignGraph(nodes));
    } catch (const std::exception& e) {
        std::cerr << "[CampaignServerApp] Workflow graph is invalid: " << e.what() << std::endl;
        return false;
    }

    application::ConversationOptions options;
    options.defaultLocationId = m_config.defaultLocationId;
    options.resumeOnReconnect = m_config.resumeOnReconnect;
    m_conversations = std::make_shared<application::ConversationService>(
        m_registry, graph, taskManager, m_transport, options);

    m_conversations->setSessionFinishedCallback(
        [](const std::string& sessionId, application::RunOutcome outcome, const domain::WorkflowState&) {
            std::cout << "[CampaignServerApp] Session " << sessionId << " finished: "
                      << application::RunOutcomeToString(outcome) << std::endl;
        });

    // The transport is owned by this app, so its callbacks may reach back through it.
    m_transport->setOnConnect([this](const std::string& clientId) {
        m_conversations->onConnect(clientId);
    });
    m_transport->setOnDisconnect([this](const std::string& clientId) {
        m_conversations->onDisconnect(clientId);
    });
    m_transport->setOnMessage([this](const std::string& clientId, const std::string& body) {
        m_conversations->handleRawMessage(clientId, body);
    });

    std::string model = completion->model();
    m_transport->setHealthProvider([this, model]() {
        return nlohmann::json{
            {"active_sessions", m_registry->size()},
            {"checkpoints", m_registry->checkpoints()->size()},
            {"model", model}
        };
    });

    return m_transport->bind(m_config.host, m_config.port);
}

int CampaignServerApp::Run() {
    if (!Init()) {
        Shutdown();
        return 1;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::atomic<bool> listenEnded{false};
    std::thread listener([this, &listenEnded] {
        if (!m_transport->listen()) {
            std::cerr << "[CampaignServerApp] Server loop exited with an error" << std::endl;
        }
        listenEnded.store(true);
    });

    std::cout << "[CampaignServerApp] Ready. Press Ctrl+C to stop." << std::endl;
    while (!g_stopRequested.load() && !listenEnded.load()) {
        std::this_thread::sleep_for(kPollInterval);
    }

    std::cout << "[CampaignServerApp] Shutting down..." << std::endl;
    Shutdown();
    listener.join();
    return 0;
}

void CampaignServerApp::Shutdown() {
    if (m_conversations) {
        m_conversations->shutdown(kShutdownTimeout);
    }
    if (m_transport) {
        m_transport->stop();
    }
}

} // namespace campaignflow::app
