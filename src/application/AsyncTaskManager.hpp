/**
 * @file AsyncTaskManager.hpp
 * @brief Centralized management for background generation jobs.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <mutex>
#include <atomic>
#include <memory>
#include <thread>
#include <algorithm>
#include "domain/Cancellation.hpp"

namespace blogforge::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    Generation,
    Export
};

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id = 0;
    TaskType type = TaskType::Generation;
    std::string description;
    std::atomic<float> progress{0.0f};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage; ///< Valid once isCompleted is set.
    domain::CancellationSource cancellation;

    void RequestCancel() { cancellation.cancel(); }
    domain::CancellationToken Token() const { return cancellation.token(); }
};

/**
 * @class AsyncTaskManager
 * @brief Runs jobs on their own threads and provides unified status tracking.
 *
 * Destruction cancels every job still running and joins its thread.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    ~AsyncTaskManager() {
        CancelAll();
        std::vector<std::thread> workers;
        {
            std::lock_guard<std::mutex> lock(m_workersMutex);
            workers.swap(m_workers);
        }
        for (auto& worker : workers) {
            if (worker.joinable()) worker.join();
        }
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /** @brief Submits a new task; @p f receives the task's status (and its cancellation token). */
    template<typename F>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.push_back(status);
        }

        JoinFinishedWorkers();

        std::thread worker([this, status, userFunc = std::forward<F>(f)]() mutable {
            try {
                userFunc(status);
                status->progress = 1.0f;
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
            }
            status->isCompleted = true;
            CleanupCompletedTasks();
        });

        std::lock_guard<std::mutex> lock(m_workersMutex);
        m_workers.push_back(std::move(worker));
        m_workerStatus.push_back(status);
        return status;
    }

    /** @brief Returns snapshots of all active tasks. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    /** @brief True when any task is still running. */
    bool IsBusy() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return !m_activeTasks.empty();
    }

    void CancelAll() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        for (const auto& status : m_activeTasks) {
            status->RequestCancel();
        }
    }

private:
    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
    }

    void JoinFinishedWorkers() {
        std::vector<std::thread> finished;
        {
            std::lock_guard<std::mutex> lock(m_workersMutex);
            for (std::size_t i = 0; i < m_workers.size();) {
                if (m_workerStatus[i]->isCompleted.load()) {
                    finished.push_back(std::move(m_workers[i]));
                    m_workers.erase(m_workers.begin() + static_cast<std::ptrdiff_t>(i));
                    m_workerStatus.erase(m_workerStatus.begin() + static_cast<std::ptrdiff_t>(i));
                } else {
                    ++i;
                }
            }
        }
        for (auto& worker : finished) {
            if (worker.joinable()) worker.join();
        }
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::mutex m_tasksMutex;

    std::vector<std::thread> m_workers;
    std::vector<std::shared_ptr<TaskStatus>> m_workerStatus;
    std::mutex m_workersMutex;
};

} // namespace blogforge::application
