#include "application/CheckpointStore.hpp"

namespace campaignflow::application {

void CheckpointStore::save(const std::string& sessionId, Checkpoint checkpoint) {
    checkpoint.savedAt = std::chrono::system_clock::now();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_checkpoints[sessionId] = std::move(checkpoint);
}

std::optional<Checkpoint> CheckpointStore::load(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_checkpoints.find(sessionId);
    if (it == m_checkpoints.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CheckpointStore::erase(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_checkpoints.erase(sessionId) > 0;
}

bool CheckpointStore::contains(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_checkpoints.count(sessionId) > 0;
}

std::size_t CheckpointStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_checkpoints.size();
}

} // namespace campaignflow::application
