/**
 * @file CheckpointStore.hpp
 * @brief In-memory snapshots of suspended sessions, keyed by session id.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "domain/PendingQuestion.hpp"
#include "domain/WorkflowState.hpp"

namespace campaignflow::application {

/**
 * @struct Checkpoint
 * @brief Enough to rebuild a session at the node it was executing.
 */
struct Checkpoint {
    domain::WorkflowState state;
    std::string nodeName;
    std::optional<domain::PendingQuestion> pendingQuestion;
    std::chrono::system_clock::time_point savedAt{};
};

/**
 * @class CheckpointStore
 * @brief Thread-safe map of the latest checkpoint per session. Lives for the process lifetime.
 */
class CheckpointStore {
public:
    /** @brief Replaces the checkpoint of a session. */
    void save(const std::string& sessionId, Checkpoint checkpoint);

    std::optional<Checkpoint> load(const std::string& sessionId) const;

    /** @return true if a checkpoint was removed. */
    bool erase(const std::string& sessionId);

    bool contains(const std::string& sessionId) const;
    std::size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, Checkpoint> m_checkpoints;
};

} // namespace campaignflow::application
