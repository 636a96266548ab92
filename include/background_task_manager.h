#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace facegate {

/**
 * @brief Bounded pool running side-effect tasks off the render path
 *
 * Alert dispatches, audit writes and registration uploads are submitted
 * here. The queue is bounded; a submission to a full queue is rejected.
 * shutdown() stops accepting work, runs everything already queued and joins
 * the workers, so in-flight side effects complete before the process exits.
 */
class BackgroundTaskManager {
public:
    /**
     * @brief Start the worker threads
     *
     * @param workerCount Number of worker threads
     * @param maxPending Maximum number of queued (not yet running) tasks
     */
    explicit BackgroundTaskManager(size_t workerCount = 2, size_t maxPending = 64);

    BackgroundTaskManager(const BackgroundTaskManager&) = delete;
    BackgroundTaskManager& operator=(const BackgroundTaskManager&) = delete;

    ~BackgroundTaskManager();

    /**
     * @brief Submit a task to be executed asynchronously
     *
     * @param taskType Short label used in logs (e.g. "alert", "audit")
     * @param taskFunc Work to run; returns false on failure
     * @return std::string Task ID, empty if the task was rejected
     */
    std::string submitTask(const std::string& taskType, std::function<bool()> taskFunc);

    /**
     * @brief Block until no task is queued or running
     *
     * @param timeout Upper bound on the wait
     * @return true if the manager became idle within the timeout
     */
    bool waitIdle(std::chrono::milliseconds timeout);

    /**
     * @brief Stop accepting tasks, drain the queue and join the workers
     */
    void shutdown();

    size_t getPendingCount() const;
    size_t getActiveCount() const;

    uint64_t getCompletedCount() const { return completed_.load(); }
    uint64_t getFailedCount() const { return failed_.load(); }
    uint64_t getRejectedCount() const { return rejected_.load(); }

    nlohmann::json getStatus() const;

private:
    struct Task {
        std::string id;
        std::string type;
        std::function<bool()> func;
        std::chrono::steady_clock::time_point createdAt;
    };

    void workerThread();
    void runTask(Task& task);

    static std::string generateTaskId();

    std::queue<Task> taskQueue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
    std::vector<std::thread> workers_;
    size_t maxPending_;
    size_t active_ = 0;
    bool accepting_ = true;

    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace facegate
