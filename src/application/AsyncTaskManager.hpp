/**
 * @file AsyncTaskManager.hpp
 * @brief Centralized management for session execution tasks.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

namespace campaignflow::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    SessionWorkflow,
    SessionResume
};

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage; ///< Valid once isCompleted is true.
};

/**
 * @class AsyncTaskManager
 * @brief Runs each task on its own detached thread and tracks it until it finishes.
 *
 * Must be owned by a std::shared_ptr; running tasks keep the manager alive.
 */
class AsyncTaskManager : public std::enable_shared_from_this<AsyncTaskManager> {
public:
    AsyncTaskManager() = default;

    /** @brief Submits a new task to be executed in the background. */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.push_back(status);
        }

        auto self = shared_from_this();
        std::thread([self, status](auto userFunc, auto... userArgs) {
            try {
                userFunc(status, std::move(userArgs)...);
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
                std::cerr << "[AsyncTaskManager] Task " << status->id << " (" << status->description
                          << ") failed: " << e.what() << std::endl;
            }
            status->isCompleted = true;
            self->CleanupCompletedTasks();
        }, std::forward<F>(f), std::forward<Args>(args)...).detach();

        return status;
    }

    /** @brief Returns snapshots of all active tasks. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    std::size_t ActiveCount() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks.size();
    }

    /**
     * @brief Blocks until no task is running or the timeout expires.
     * @return true if idle.
     */
    bool WaitForIdle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        return m_idle.wait_for(lock, timeout, [this] { return m_activeTasks.empty(); });
    }

private:
    void CleanupCompletedTasks() {
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.erase(
                std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                    [](const auto& s) { return s->isCompleted.load(); }),
                m_activeTasks.end()
            );
        }
        m_idle.notify_all();
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::mutex m_tasksMutex;
    std::condition_variable m_idle;
};

} // namespace campaignflow::application
