/**
 * @file ConversationService.cpp
 * @brief Implementation of ConversationService.
 */

#include "application/ConversationService.hpp"
#include "domain/WorkflowErrors.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace campaignflow::application {

using namespace campaignflow::domain;

namespace {

std::string Trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

ConversationService::ConversationService(std::shared_ptr<SessionRegistry> registry,
                                         std::shared_ptr<const WorkflowGraph> graph,
                                         std::shared_ptr<AsyncTaskManager> tasks,
                                         std::shared_ptr<MessageTransport> transport,
                                         ConversationOptions options)
    : m_registry(std::move(registry)),
      m_graph(std::move(graph)),
      m_tasks(std::move(tasks)),
      m_transport(std::move(transport)),
      m_options(std::move(options)) {}

void ConversationService::setSessionFinishedCallback(SessionFinishedCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_onFinished = std::move(callback);
}

void ConversationService::onConnect(const std::string& clientId) {
    std::cout << "[ConversationService] Client connected: " << clientId << std::endl;

    // Stream re-opened before the old one was noticed as closed.
    if (auto live = m_registry->find(clientId)) {
        sendTo(clientId, OutboundType::Assistant, "Welcome back! Let's pick up where we left off.");
        if (auto pending = live->pendingQuestion(); pending && m_transport) {
            m_transport->send(clientId, OutboundMessage::ForQuestion(*pending));
        }
        return;
    }

    if (m_options.resumeOnReconnect) {
        if (auto checkpoint = m_registry->checkpoints()->load(clientId)) {
            if (resume(clientId, *checkpoint)) {
                return;
            }
        }
    }

    sendTo(clientId, OutboundType::Assistant, kWelcomeMessage);
}

void ConversationService::onDisconnect(const std::string& clientId) {
    std::cout << "[ConversationService] Client disconnected: " << clientId << std::endl;
    if (m_options.resumeOnReconnect) {
        m_registry->detach(clientId);
        return;
    }
    m_registry->cancel(clientId);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_contexts.erase(clientId);
}

void ConversationService::handleRawMessage(const std::string& clientId, const std::string& raw) {
    std::string error;
    auto message = InboundMessage::Parse(raw, &error);
    if (!message) {
        std::cerr << "[ConversationService] Ignoring malformed message from " << clientId
                  << ": " << error << std::endl;
        return;
    }
    handleMessage(clientId, *message);
}

void ConversationService::handleMessage(const std::string& clientId, const InboundMessage& message) {
    switch (message.type) {
        case InboundType::Handshake:
            storeHandshake(clientId, message);
            break;
        case InboundType::UserMessage:
            handleUserMessage(clientId, message.message);
            break;
        case InboundType::UserResponse:
            handleUserResponse(clientId, message);
            break;
        case InboundType::Cancel:
            if (m_registry->cancel(clientId)) {
                sendTo(clientId, OutboundType::System, "Campaign creation cancelled.");
            } else {
                sendTo(clientId, OutboundType::Error, "No active campaign session to cancel.");
            }
            break;
        case InboundType::Reset:
            m_registry->cancel(clientId);
            sendTo(clientId, OutboundType::System, "All set! Let's start fresh. What would you like to create?");
            break;
    }
}

void ConversationService::handleUserMessage(const std::string& clientId, const std::string& text) {
    const std::string prompt = Trim(text);
    if (prompt.empty()) {
        sendTo(clientId, OutboundType::Error, "Please describe the campaign you'd like to create.");
        return;
    }

    sendTo(clientId, OutboundType::User, prompt);

    if (auto session = m_registry->find(clientId)) {
        // Free text typed while a question is open answers that question.
        if (auto pending = session->pendingQuestion()) {
            if (!session->deliverReply(pending->id, prompt)) {
                std::cerr << "[ConversationService] " << clientId << ": reply to '" << pending->id
                          << "' not accepted" << std::endl;
            }
            return;
        }
        sendTo(clientId, OutboundType::Error, "I'm still working on your request. Please wait a moment.");
        return;
    }

    startCampaign(clientId, prompt);
}

void ConversationService::handleUserResponse(const std::string& clientId, const InboundMessage& message) {
    std::shared_ptr<Session> session;
    try {
        session = m_registry->get(clientId);
    } catch (const SessionNotFoundError& e) {
        std::cerr << "[ConversationService] " << e.what() << std::endl;
        sendTo(clientId, OutboundType::Error,
               "No active campaign session. Send a message to start a new one.");
        return;
    }

    auto pending = session->pendingQuestion();
    if (!pending || pending->id != message.questionId) {
        std::cerr << "[ConversationService] " << clientId << ": ignoring reply to '" << message.questionId
                  << "' (open: '" << (pending ? pending->id : std::string("none")) << "')" << std::endl;
        return;
    }

    if (!message.response.empty()) {
        sendTo(clientId, OutboundType::User, message.response);
    }
    session->deliverReply(message.questionId, message.response);
}

void ConversationService::storeHandshake(const std::string& clientId, const InboundMessage& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& context = m_contexts[clientId];
    if (message.location) {
        context.location = message.location;
    }
    if (message.credentials) {
        context.credentials = *message.credentials;
    }
    std::cout << "[ConversationService] Handshake from " << clientId << ": location "
              << (context.location ? context.location->id : std::string("(none)")) << std::endl;
}

ClientContext ConversationService::contextFor(const std::string& clientId) const {
    ClientContext context;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_contexts.find(clientId);
        if (it != m_contexts.end()) {
            context = it->second;
        }
    }
    if ((!context.location || context.location->id.empty()) && !m_options.defaultLocationId.empty()) {
        if (!context.location) context.location = ClientLocation{};
        context.location->id = m_options.defaultLocationId;
    }
    return context;
}

void ConversationService::startCampaign(const std::string& clientId, const std::string& prompt) {
    // A new request supersedes whatever was left from an earlier connection.
    m_registry->checkpoints()->erase(clientId);

    std::shared_ptr<Session> session;
    try {
        session = m_registry->create(clientId, contextFor(clientId));
    } catch (const SessionExistsError& e) {
        std::cerr << "[ConversationService] " << e.what() << std::endl;
        sendTo(clientId, OutboundType::Error, "A campaign is already in progress for this connection.");
        return;
    }

    session->state().userPrompt = prompt;
    std::cout << "[ConversationService] Starting campaign for " << clientId << std::endl;
    launch(session, "", TaskType::SessionWorkflow);
}

bool ConversationService::resume(const std::string& clientId, const Checkpoint& checkpoint) {
    std::shared_ptr<Session> session;
    try {
        session = m_registry->create(clientId, contextFor(clientId));
        session->prepareResume(checkpoint);
    } catch (const WorkflowError& e) {
        std::cerr << "[ConversationService] Could not resume " << clientId << ": " << e.what() << std::endl;
        m_registry->remove(clientId);
        return false;
    }

    std::cout << "[ConversationService] Resuming " << clientId << " at '" << checkpoint.nodeName << "'" << std::endl;
    sendTo(clientId, OutboundType::Assistant, "Welcome back! Let's pick up where we left off.");
    launch(session, checkpoint.nodeName, TaskType::SessionResume);
    return true;
}

void ConversationService::launch(const std::shared_ptr<Session>& session, const std::string& startNode, TaskType type) {
    SessionFinishedCallback onFinished;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        onFinished = m_onFinished;
    }

    auto graph = m_graph;
    auto registry = m_registry;
    m_tasks->SubmitTask(type, "session " + session->id(),
        [graph, registry, session, startNode, onFinished](std::shared_ptr<TaskStatus>) {
            RunOutcome outcome = graph->run(*session, startNode);
            if (outcome != RunOutcome::Interrupted) {
                registry->finish(session);
            }
            std::cout << "[ConversationService] Session " << session->id() << " "
                      << RunOutcomeToString(outcome) << std::endl;
            if (onFinished) {
                onFinished(session->id(), outcome, session->state());
            }
        });
}

bool ConversationService::isSessionActive(const std::string& clientId) const {
    return m_registry->find(clientId) != nullptr;
}

std::optional<PendingQuestion> ConversationService::pendingQuestion(const std::string& clientId) const {
    auto session = m_registry->find(clientId);
    if (!session) return std::nullopt;
    return session->pendingQuestion();
}

bool ConversationService::shutdown(std::chrono::milliseconds timeout) {
    m_registry->cancelAll();
    bool idle = m_tasks->WaitForIdle(timeout);
    if (!idle) {
        std::cerr << "[ConversationService] " << m_tasks->ActiveCount()
                  << " session task(s) still running at shutdown" << std::endl;
    }
    return idle;
}

void ConversationService::sendTo(const std::string& clientId, OutboundType type, const std::string& text) {
    if (m_transport) {
        m_transport->send(clientId, OutboundMessage::Make(type, text));
    }
}

} // namespace campaignflow::application
