/**
 * @file Session.hpp
 * @brief One client's campaign conversation: state, waiter and outbound channel.
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "application/CheckpointStore.hpp"
#include "application/SuspensionBroker.hpp"
#include "domain/ClientContext.hpp"
#include "domain/MessageTransport.hpp"
#include "domain/Messages.hpp"
#include "domain/WorkflowState.hpp"

namespace campaignflow::application {

/**
 * @class Session
 * @brief Owned by the registry and by the task executing it.
 *
 * The WorkflowState is only touched by the executing task. Other threads interact
 * through deliverReply() and cancel().
 */
class Session {
public:
    Session(std::string id,
            std::shared_ptr<domain::MessageTransport> transport,
            std::shared_ptr<CheckpointStore> checkpoints,
            domain::ClientContext context = {});

    const std::string& id() const { return m_id; }
    domain::WorkflowState& state() { return m_state; }
    const domain::WorkflowState& state() const { return m_state; }
    const domain::ClientContext& context() const { return m_context; }
    const std::string& currentNode() const { return m_currentNode; }

    /**
     * @brief Suspends the session on a question until the reply arrives.
     * @return The reply text (possibly empty).
     * @throws domain::SessionCancelledError if the session is cancelled meanwhile.
     */
    std::string ask(domain::QuestionKind kind,
                    const std::string& prompt,
                    std::vector<domain::QuestionOption> options = {},
                    int questionNumber = 0,
                    int totalQuestions = 0);

    /** @brief Sends a message to the client unless the session was cancelled. */
    bool send(const domain::OutboundMessage& message);
    bool send(domain::OutboundType type, const std::string& text);

    /** @brief Records the node about to execute and checkpoints. */
    void enterNode(const std::string& nodeName);

    /** @brief Saves {state, node, open question}. Skipped once cancelled. */
    void checkpoint();

    /**
     * @brief Rebuilds state from a checkpoint. The checkpointed question is re-opened
     *        immediately so replies to it resolve, and the first ask() reuses its id.
     */
    void prepareResume(const Checkpoint& checkpoint);

    /** @brief True until the re-opened question of a resumed run has been asked again. */
    bool isResuming() const { return m_resumeQuestion.has_value(); }

    bool deliverReply(const std::string& questionId, const std::string& response);
    std::optional<domain::PendingQuestion> pendingQuestion() const;

    /**
     * @brief Tears down the session. The executing task observes it at its next suspension
     *        point or node boundary.
     * @param resumable true for a disconnect, where the last checkpoint stays usable.
     */
    void cancel(bool resumable = false);
    bool isCancelled() const { return m_cancelled.load(); }
    bool isResumable() const { return m_resumable.load(); }

private:
    std::string m_id;
    std::shared_ptr<domain::MessageTransport> m_transport;
    std::shared_ptr<CheckpointStore> m_checkpoints;
    domain::ClientContext m_context;

    domain::WorkflowState m_state;
    std::string m_currentNode;
    std::optional<domain::PendingQuestion> m_resumeQuestion;
    SuspensionBroker m_broker;

    std::atomic<bool> m_cancelled{false};
    std::atomic<bool> m_resumable{false};
    std::mutex m_lifecycleMutex;
};

} // namespace campaignflow::application
