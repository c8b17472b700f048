/**
 * @file Session.cpp
 * @brief Implementation of Session.
 */

#include "application/Session.hpp"
#include <chrono>

namespace campaignflow::application {

using namespace campaignflow::domain;

Session::Session(std::string id,
                 std::shared_ptr<MessageTransport> transport,
                 std::shared_ptr<CheckpointStore> checkpoints,
                 ClientContext context)
    : m_id(std::move(id)),
      m_transport(std::move(transport)),
      m_checkpoints(std::move(checkpoints)),
      m_context(std::move(context)),
      m_broker(m_id) {
    if (m_context.location && !m_context.location->id.empty()) {
        m_state.locationId = m_context.location->id;
    }
}

std::string Session::ask(QuestionKind kind,
                         const std::string& prompt,
                         std::vector<QuestionOption> options,
                         int questionNumber,
                         int totalQuestions) {
    PendingQuestion question;
    question.kind = kind;
    question.prompt = prompt;
    question.options = std::move(options);
    question.questionNumber = questionNumber;
    question.totalQuestions = totalQuestions;

    if (m_resumeQuestion) {
        question.id = m_resumeQuestion->id;
        question.createdAt = m_resumeQuestion->createdAt;
        m_resumeQuestion.reset();
    } else {
        question.id = SuspensionBroker::NextQuestionId();
        question.createdAt = std::chrono::system_clock::now();
    }

    m_broker.open(question);
    checkpoint();
    if (!m_broker.isAnswered()) {
        send(OutboundMessage::ForQuestion(question));
    }
    return m_broker.await();
}

bool Session::send(const OutboundMessage& message) {
    if (m_cancelled || !m_transport) {
        return false;
    }
    return m_transport->send(m_id, message);
}

bool Session::send(OutboundType type, const std::string& text) {
    return send(OutboundMessage::Make(type, text));
}

void Session::enterNode(const std::string& nodeName) {
    m_currentNode = nodeName;
    checkpoint();
}

void Session::checkpoint() {
    if (!m_checkpoints) return;

    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    if (m_cancelled) return;

    Checkpoint cp;
    cp.state = m_state;
    cp.nodeName = m_currentNode;
    cp.pendingQuestion = m_broker.pending();
    m_checkpoints->save(m_id, std::move(cp));
}

void Session::prepareResume(const Checkpoint& checkpoint) {
    m_state = checkpoint.state;
    m_currentNode = checkpoint.nodeName;
    m_resumeQuestion = checkpoint.pendingQuestion;
    if (m_context.location && !m_context.location->id.empty() && !m_state.locationId) {
        m_state.locationId = m_context.location->id;
    }
    if (m_resumeQuestion) {
        m_broker.open(*m_resumeQuestion);
    }
}

bool Session::deliverReply(const std::string& questionId, const std::string& response) {
    return m_broker.deliver(questionId, response);
}

std::optional<PendingQuestion> Session::pendingQuestion() const {
    return m_broker.pending();
}

void Session::cancel(bool resumable) {
    {
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);
        m_resumable = resumable;
        m_cancelled = true;
    }
    m_broker.cancel();
}

} // namespace campaignflow::application
