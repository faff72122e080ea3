/**
 * @file AsyncTaskManager.hpp
 * @brief Fixed-size worker pool with unified status tracking for background runs.
 */

#pragma once

#include <string>
#include <vector>
#include <deque>
#include <thread>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <algorithm>
#include <iostream>

namespace beplanner::application {

/**
 * @struct TaskStatus
 * @brief Information about a queued, running or completed task.
 */
struct TaskStatus {
    int id = 0;
    std::string description;
    std::atomic<bool> isRunning{false};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;
};

/**
 * @class AsyncTaskManager
 * @brief Executes submitted tasks on a fixed number of worker threads.
 *
 * Exceptions escaping a task are caught by the task wrapper, recorded on its TaskStatus
 * and logged; they never terminate a worker. The destructor drains the queue before
 * joining the workers.
 */
class AsyncTaskManager {
public:
    explicit AsyncTaskManager(size_t workerCount = 4) {
        if (workerCount == 0) workerCount = 1;
        m_workers.reserve(workerCount);
        for (size_t i = 0; i < workerCount; ++i) {
            m_workers.emplace_back(&AsyncTaskManager::WorkerLoop, this);
        }
    }

    ~AsyncTaskManager() {
        Shutdown();
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /** @brief Queues a task. The callable receives its own TaskStatus. */
    std::shared_ptr<TaskStatus> SubmitTask(const std::string& description,
                                           std::function<void(std::shared_ptr<TaskStatus>)> work) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->description = description;

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            if (m_stopping) {
                status->failed = true;
                status->errorMessage = "Task manager is shutting down.";
                status->isCompleted = true;
                return status;
            }
            m_activeTasks.push_back(status);
            m_queue.push_back(QueuedTask{status, std::move(work)});
        }
        m_cv.notify_one();
        return status;
    }

    /** @brief Returns snapshots of all queued or running tasks. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    /** @brief Blocks until the queue is empty and no task is running. */
    void WaitForIdle() {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        m_idleCv.wait(lock, [this] { return m_activeTasks.empty(); });
    }

    /** @brief Stops accepting work, runs what is queued and joins the workers. */
    void Shutdown() {
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            if (m_stopping) return;
            m_stopping = true;
        }
        m_cv.notify_all();
        for (auto& worker : m_workers) {
            if (worker.joinable()) worker.join();
        }
    }

    size_t WorkerCount() const { return m_workers.size(); }

private:
    struct QueuedTask {
        std::shared_ptr<TaskStatus> status;
        std::function<void(std::shared_ptr<TaskStatus>)> work;
    };

    void WorkerLoop() {
        while (true) {
            QueuedTask task;
            {
                std::unique_lock<std::mutex> lock(m_tasksMutex);
                m_cv.wait(lock, [this] { return !m_queue.empty() || m_stopping; });
                if (m_queue.empty()) {
                    return; // Stopping and drained.
                }
                task = std::move(m_queue.front());
                m_queue.pop_front();
            }

            Run(task);
            CleanupCompletedTasks();
        }
    }

    static void Run(QueuedTask& task) {
        auto& status = task.status;
        status->isRunning = true;
        try {
            task.work(status);
        } catch (const std::exception& e) {
            status->failed = true;
            status->errorMessage = e.what();
            std::cerr << "[AsyncTaskManager] Task " << status->id << " (" << status->description
                      << ") failed: " << e.what() << std::endl;
        } catch (...) {
            status->failed = true;
            status->errorMessage = "Unknown error during task execution.";
            std::cerr << "[AsyncTaskManager] Task " << status->id << " (" << status->description
                      << ") failed with an unknown error." << std::endl;
        }
        status->isRunning = false;
        status->isCompleted = true;
    }

    void CleanupCompletedTasks() {
        bool idle = false;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.erase(
                std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                    [](const auto& s) { return s->isCompleted.load(); }),
                m_activeTasks.end()
            );
            idle = m_activeTasks.empty();
        }
        if (idle) m_idleCv.notify_all();
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::deque<QueuedTask> m_queue;
    std::mutex m_tasksMutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_stopping = false;
    std::vector<std::thread> m_workers;
};

} // namespace beplanner::application
