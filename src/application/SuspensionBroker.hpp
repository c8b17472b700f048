/**
 * @file SuspensionBroker.hpp
 * @brief Correlates one outbound question with exactly one inbound reply.
 */

#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include "domain/PendingQuestion.hpp"

namespace campaignflow::application {

/**
 * @class SuspensionBroker
 * @brief Per-session waiter. The session task blocks in await() until deliver() or cancel().
 *
 * The waiter is registered by open() before the question leaves the process, so a
 * reply racing the outbound message is never lost.
 */
class SuspensionBroker {
public:
    explicit SuspensionBroker(std::string sessionId);

    /**
     * @brief Registers the waiter for a question.
     *
     * Re-opening with the id of the question already open refreshes its content and
     * keeps any reply delivered in the meantime.
     * @throws domain::InvariantViolationError if a different question is open.
     * @throws domain::SessionCancelledError if the broker was cancelled.
     */
    void open(const domain::PendingQuestion& question);

    /**
     * @brief Blocks until the open question is answered.
     * @return The reply text; the question is closed on return.
     * @throws domain::SessionCancelledError when cancelled while waiting.
     * @throws domain::InvariantViolationError when no question is open.
     */
    std::string await();

    /**
     * @brief Resolves the open question.
     * @return false (no state change) when no question is open, the id does not match,
     *         or the question was already answered.
     */
    bool deliver(const std::string& questionId, const std::string& response);

    /** @brief Tears down the waiter. Idempotent. */
    void cancel();

    bool isCancelled() const;
    bool isAnswered() const;
    std::optional<domain::PendingQuestion> pending() const;

    /** @brief Process-unique question id. */
    static std::string NextQuestionId();

private:
    std::string m_sessionId;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::optional<domain::PendingQuestion> m_pending;
    std::optional<std::string> m_reply;
    bool m_cancelled = false;
};

} // namespace campaignflow::application
