/**
 * @file SessionRegistry.hpp
 * @brief Owns the live sessions, keyed by client id.
 */

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "application/CheckpointStore.hpp"
#include "application/Session.hpp"

namespace campaignflow::application {

/**
 * @class SessionRegistry
 * @brief Thread-safe map of active sessions. Teardown is driven by explicit events only.
 */
class SessionRegistry {
public:
    SessionRegistry(std::shared_ptr<domain::MessageTransport> transport,
                    std::shared_ptr<CheckpointStore> checkpoints);

    /**
     * @brief Creates and registers a session.
     * @throws domain::SessionExistsError if the id is already active.
     */
    std::shared_ptr<Session> create(const std::string& sessionId, domain::ClientContext context = {});

    /** @throws domain::SessionNotFoundError if the id is not active. */
    std::shared_ptr<Session> get(const std::string& sessionId) const;

    /** @return The session, or nullptr. */
    std::shared_ptr<Session> find(const std::string& sessionId) const;

    /** @brief Unregisters without cancelling. @return true if an entry was removed. */
    bool remove(const std::string& sessionId);

    /**
     * @brief Unregisters a session that ran to a terminal node and drops its checkpoint.
     *        No-op if the id now maps to a different session.
     */
    bool finish(const std::shared_ptr<Session>& session);

    /** @brief Explicit cancel: tears down the waiter, unregisters, drops the checkpoint. */
    bool cancel(const std::string& sessionId);

    /** @brief Transport disconnect: like cancel() but the checkpoint stays for resume. */
    bool detach(const std::string& sessionId);

    /** @brief Detaches every session. Used at shutdown. */
    void cancelAll();

    std::size_t size() const;
    std::vector<std::string> activeIds() const;

    std::shared_ptr<CheckpointStore> checkpoints() const { return m_checkpoints; }

private:
    std::shared_ptr<Session> take(const std::string& sessionId);

    std::shared_ptr<domain::MessageTransport> m_transport;
    std::shared_ptr<CheckpointStore> m_checkpoints;
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<Session>> m_sessions;
};

} // namespace campaignflow::application
