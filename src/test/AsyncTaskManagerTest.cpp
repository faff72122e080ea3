#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <cassert>
#include <stdexcept>

#include "application/AsyncTaskManager.hpp"

using namespace beplanner::application;

int main() {
    std::cout << "[Test] Starting AsyncTaskManager Stress Test..." << std::endl;

    const int NUM_TASKS = 50;
    std::atomic<int> executed{0};
    std::vector<std::shared_ptr<TaskStatus>> statuses;

    {
        AsyncTaskManager manager(4);
        assert(manager.WorkerCount() == 4);

        std::cout << "[Test] Submitting " << NUM_TASKS << " tasks..." << std::endl;
        for (int i = 0; i < NUM_TASKS; ++i) {
            statuses.push_back(manager.SubmitTask("task " + std::to_string(i),
                [&executed, i](std::shared_ptr<TaskStatus>) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                    if (i % 10 == 0) {
                        throw std::runtime_error("simulated stage crash");
                    }
                    executed++;
                }));
        }

        manager.WaitForIdle();
        assert(manager.GetActiveTasks().empty());
        assert(executed == NUM_TASKS - 5);

        int failed = 0;
        for (const auto& s : statuses) {
            assert(s->isCompleted);
            assert(!s->isRunning);
            if (s->failed) {
                failed++;
                assert(s->errorMessage == "simulated stage crash");
            }
        }
        assert(failed == 5);
        std::cout << "[PASS] Exceptions are recorded per task and never stop a worker." << std::endl;

        // Queued work still runs during shutdown.
        std::atomic<int> drained{0};
        for (int i = 0; i < 8; ++i) {
            manager.SubmitTask("drain", [&drained](std::shared_ptr<TaskStatus>) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                drained++;
            });
        }
        manager.Shutdown();
        assert(drained == 8);

        auto refused = manager.SubmitTask("late", [](std::shared_ptr<TaskStatus>) {});
        assert(refused->failed);
        assert(refused->isCompleted);
        std::cout << "[PASS] Shutdown drains the queue and refuses new work." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
