/**
 * @file ConversationService.hpp
 * @brief Routes client messages to campaign sessions and manages their lifecycle.
 */

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "application/AsyncTaskManager.hpp"
#include "application/SessionRegistry.hpp"
#include "application/WorkflowGraph.hpp"
#include "domain/ClientContext.hpp"
#include "domain/MessageTransport.hpp"
#include "domain/Messages.hpp"
#include "domain/WorkflowState.hpp"

namespace campaignflow::application {

struct ConversationOptions {
    std::string defaultLocationId;   ///< Used when the client handshake names no location.
    bool resumeOnReconnect = true;   ///< Keep checkpoints across disconnects.
};

/**
 * @class ConversationService
 * @brief Inbound dispatch for every connected client.
 *
 * Thread-safe: transport threads call in concurrently, one execution task per session
 * runs the workflow graph.
 */
class ConversationService {
public:
    /** @brief Called from the session task once a run ends, with the state it ended in. */
    using SessionFinishedCallback = std::function<void(const std::string& sessionId, RunOutcome outcome,
                                                       const domain::WorkflowState& finalState)>;

    static constexpr const char* kWelcomeMessage =
        "Hey! Ready to create an amazing campaign? Tell me what you're thinking.";

    ConversationService(std::shared_ptr<SessionRegistry> registry,
                        std::shared_ptr<const WorkflowGraph> graph,
                        std::shared_ptr<AsyncTaskManager> tasks,
                        std::shared_ptr<domain::MessageTransport> transport,
                        ConversationOptions options = {});

    /** @brief Invoked from the session task after a run ends. */
    void setSessionFinishedCallback(SessionFinishedCallback callback);

    /**
     * @brief A client opened its stream.
     *
     * Greets the client and resumes a checkpointed session when one exists.
     */
    void onConnect(const std::string& clientId);

    /** @brief A client stream closed. The session is detached (or cancelled if resume is off). */
    void onDisconnect(const std::string& clientId);

    /** @brief Parses and dispatches a raw inbound message. Malformed input is logged and ignored. */
    void handleRawMessage(const std::string& clientId, const std::string& raw);

    void handleMessage(const std::string& clientId, const domain::InboundMessage& message);

    bool isSessionActive(const std::string& clientId) const;
    std::optional<domain::PendingQuestion> pendingQuestion(const std::string& clientId) const;

    /** @brief Tears down every session and waits for their tasks. */
    bool shutdown(std::chrono::milliseconds timeout);

private:
    void startCampaign(const std::string& clientId, const std::string& prompt);
    bool resume(const std::string& clientId, const Checkpoint& checkpoint);
    void launch(const std::shared_ptr<Session>& session, const std::string& startNode, TaskType type);
    void handleUserMessage(const std::string& clientId, const std::string& text);
    void handleUserResponse(const std::string& clientId, const domain::InboundMessage& message);
    void storeHandshake(const std::string& clientId, const domain::InboundMessage& message);
    domain::ClientContext contextFor(const std::string& clientId) const;
    void sendTo(const std::string& clientId, domain::OutboundType type, const std::string& text);

    std::shared_ptr<SessionRegistry> m_registry;
    std::shared_ptr<const WorkflowGraph> m_graph;
    std::shared_ptr<AsyncTaskManager> m_tasks;
    std::shared_ptr<domain::MessageTransport> m_transport;
    ConversationOptions m_options;

    mutable std::mutex m_mutex;
    std::map<std::string, domain::ClientContext> m_contexts;
    SessionFinishedCallback m_onFinished;
};

} // namespace campaignflow::application
