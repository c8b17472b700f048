/**
 * @file SessionRegistry.cpp
 * @brief Implementation of SessionRegistry.
 */

#include "application/SessionRegistry.hpp"
#include "domain/WorkflowErrors.hpp"
#include <iostream>

namespace campaignflow::application {

using domain::SessionExistsError;
using domain::SessionNotFoundError;

SessionRegistry::SessionRegistry(std::shared_ptr<domain::MessageTransport> transport,
                                 std::shared_ptr<CheckpointStore> checkpoints)
    : m_transport(std::move(transport)),
      m_checkpoints(checkpoints ? std::move(checkpoints) : std::make_shared<CheckpointStore>()) {}

std::shared_ptr<Session> SessionRegistry::create(const std::string& sessionId, domain::ClientContext context) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_sessions.count(sessionId)) {
        throw SessionExistsError(sessionId);
    }
    auto session = std::make_shared<Session>(sessionId, m_transport, m_checkpoints, std::move(context));
    m_sessions.emplace(sessionId, session);
    return session;
}

std::shared_ptr<Session> SessionRegistry::get(const std::string& sessionId) const {
    auto session = find(sessionId);
    if (!session) {
        throw SessionNotFoundError(sessionId);
    }
    return session;
}

std::shared_ptr<Session> SessionRegistry::find(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(sessionId);
    return it == m_sessions.end() ? nullptr : it->second;
}

bool SessionRegistry::remove(const std::string& sessionId) {
    return take(sessionId) != nullptr;
}

bool SessionRegistry::finish(const std::shared_ptr<Session>& session) {
    if (!session) return false;
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(session->id());
    if (it == m_sessions.end() || it->second != session) {
        return false;
    }
    m_sessions.erase(it);
    m_checkpoints->erase(session->id());
    return true;
}

bool SessionRegistry::cancel(const std::string& sessionId) {
    auto session = take(sessionId);
    if (session) {
        session->cancel();
    }
    // After cancel() the session can no longer write a checkpoint.
    const bool hadCheckpoint = m_checkpoints->erase(sessionId);
    if (!session && !hadCheckpoint) return false;
    std::cout << "[SessionRegistry] Cancelled " << sessionId << std::endl;
    return true;
}

bool SessionRegistry::detach(const std::string& sessionId) {
    auto session = take(sessionId);
    if (!session) return false;
    session->cancel(true);
    std::cout << "[SessionRegistry] Detached " << sessionId
              << (m_checkpoints->contains(sessionId) ? " (checkpoint kept)" : "") << std::endl;
    return true;
}

void SessionRegistry::cancelAll() {
    std::map<std::string, std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        sessions.swap(m_sessions);
    }
    for (auto& entry : sessions) {
        entry.second->cancel(true);
    }
    if (!sessions.empty()) {
        std::cout << "[SessionRegistry] Tore down " << sessions.size() << " session(s)" << std::endl;
    }
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

std::vector<std::string> SessionRegistry::activeIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> ids;
    ids.reserve(m_sessions.size());
    for (const auto& entry : m_sessions) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::shared_ptr<Session> SessionRegistry::take(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(sessionId);
    if (it == m_sessions.end()) return nullptr;
    auto session = it->second;
    m_sessions.erase(it);
    return session;
}

} // namespace campaignflow::application
