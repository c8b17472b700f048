/**
 * @file SuspensionBroker.cpp
 * @brief Implementation of SuspensionBroker.
 */

#include "application/SuspensionBroker.hpp"
#include "domain/WorkflowErrors.hpp"
#include <atomic>
#include <iostream>
#include <random>

namespace campaignflow::application {

using domain::InvariantViolationError;
using domain::PendingQuestion;
using domain::SessionCancelledError;

SuspensionBroker::SuspensionBroker(std::string sessionId)
    : m_sessionId(std::move(sessionId)) {}

void SuspensionBroker::open(const PendingQuestion& question) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_cancelled) {
        throw SessionCancelledError(m_sessionId);
    }
    if (m_pending && m_pending->id != question.id) {
        throw InvariantViolationError("question '" + question.id + "' opened while '" +
                                      m_pending->id + "' is still pending");
    }
    if (!m_pending) {
        m_reply.reset();
    }
    m_pending = question;
}

std::string SuspensionBroker::await() {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_pending) {
        throw InvariantViolationError("await without an open question");
    }
    m_cv.wait(lock, [this] { return m_cancelled || m_reply.has_value(); });
    if (m_cancelled) {
        throw SessionCancelledError(m_sessionId);
    }
    std::string reply = std::move(*m_reply);
    m_reply.reset();
    m_pending.reset();
    return reply;
}

bool SuspensionBroker::deliver(const std::string& questionId, const std::string& response) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancelled || !m_pending) {
            std::cerr << "[SuspensionBroker] " << m_sessionId
                      << ": reply for '" << questionId << "' with no open question, ignored" << std::endl;
            return false;
        }
        if (m_pending->id != questionId) {
            std::cerr << "[SuspensionBroker] " << m_sessionId << ": stale reply for '" << questionId
                      << "' (open: '" << m_pending->id << "'), ignored" << std::endl;
            return false;
        }
        if (m_reply) {
            std::cerr << "[SuspensionBroker] " << m_sessionId
                      << ": duplicate reply for '" << questionId << "', ignored" << std::endl;
            return false;
        }
        m_reply = response;
    }
    m_cv.notify_all();
    return true;
}

void SuspensionBroker::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = true;
    }
    m_cv.notify_all();
}

bool SuspensionBroker::isCancelled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelled;
}

bool SuspensionBroker::isAnswered() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reply.has_value();
}

std::optional<PendingQuestion> SuspensionBroker::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending;
}

std::string SuspensionBroker::NextQuestionId() {
    static std::atomic<unsigned long long> counter{0};
    static const char hex[] = "0123456789abcdef";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 15);

    std::string suffix;
    suffix.reserve(8);
    for (int i = 0; i < 8; ++i) {
        suffix += hex[dist(rng)];
    }
    return "q" + std::to_string(++counter) + "-" + suffix;
}

} // namespace campaignflow::application
