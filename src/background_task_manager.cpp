#include "background_task_manager.h"
#include "logger.h"
#include <uuid/uuid.h>

namespace facegate {

BackgroundTaskManager::BackgroundTaskManager(size_t workerCount, size_t maxPending)
    : maxPending_(maxPending == 0 ? 1 : maxPending) {
    if (workerCount == 0) {
        workerCount = 1;
    }

    workers_.reserve(workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
        workers_.emplace_back(&BackgroundTaskManager::workerThread, this);
    }

    LOG_INFO("BackgroundTaskManager", "Background task manager started with " +
             std::to_string(workerCount) + " workers, queue limit " + std::to_string(maxPending_));
}

BackgroundTaskManager::~BackgroundTaskManager() {
    shutdown();
}

std::string BackgroundTaskManager::generateTaskId() {
    uuid_t uuid;
    char uuid_str[37];
    uuid_generate(uuid);
    uuid_unparse_lower(uuid, uuid_str);
    return std::string(uuid_str);
}

std::string BackgroundTaskManager::submitTask(const std::string& taskType, std::function<bool()> taskFunc) {
    Task task;
    task.id = generateTaskId();
    task.type = taskType;
    task.func = std::move(taskFunc);
    task.createdAt = std::chrono::steady_clock::now();

    std::string taskId = task.id;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            rejected_++;
            LOG_WARN("BackgroundTaskManager", "Rejected [" + taskType + "] task, manager is shutting down");
            return std::string();
        }
        if (taskQueue_.size() >= maxPending_) {
            rejected_++;
            LOG_WARN("BackgroundTaskManager", "Rejected [" + taskType + "] task, queue is full (" +
                     std::to_string(taskQueue_.size()) + " pending)");
            return std::string();
        }
        taskQueue_.push(std::move(task));
    }

    cv_.notify_one();

    LOG_DEBUG("BackgroundTaskManager", "Task submitted: " + taskId + " [" + taskType + "]");
    return taskId;
}

bool BackgroundTaskManager::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCv_.wait_for(lock, timeout, [this] {
        return taskQueue_.empty() && active_ == 0;
    });
}

void BackgroundTaskManager::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_ && workers_.empty()) {
            return; // Already shut down
        }
        accepting_ = false;
        if (!taskQueue_.empty() || active_ > 0) {
            LOG_INFO("BackgroundTaskManager", "Draining " + std::to_string(taskQueue_.size()) +
                     " queued and " + std::to_string(active_) + " running tasks");
        }
    }

    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers_.clear();
    }

    LOG_INFO("BackgroundTaskManager", "Background task manager shut down (completed: " +
             std::to_string(completed_.load()) + ", failed: " + std::to_string(failed_.load()) +
             ", rejected: " + std::to_string(rejected_.load()) + ")");
}

size_t BackgroundTaskManager::getPendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return taskQueue_.size();
}

size_t BackgroundTaskManager::getActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

nlohmann::json BackgroundTaskManager::getStatus() const {
    nlohmann::json status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status["workers"] = workers_.size();
        status["pending"] = taskQueue_.size();
        status["active"] = active_;
        status["accepting"] = accepting_;
    }
    status["completed"] = completed_.load();
    status["failed"] = failed_.load();
    status["rejected"] = rejected_.load();
    return status;
}

void BackgroundTaskManager::workerThread() {
    while (true) {
        Task currentTask;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] {
                return !accepting_ || !taskQueue_.empty();
            });

            // Queued work is still run after shutdown() so side effects are not lost
            if (taskQueue_.empty()) {
                break;
            }

            currentTask = std::move(taskQueue_.front());
            taskQueue_.pop();
            active_++;
        }

        runTask(currentTask);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_--;
            if (taskQueue_.empty() && active_ == 0) {
                idleCv_.notify_all();
            }
        }
    }
}

void BackgroundTaskManager::runTask(Task& task) {
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - task.createdAt).count();
    LOG_TRACE("BackgroundTaskManager", "Starting task " + task.id + " [" + task.type + "] after " +
              std::to_string(waited) + "ms in queue");

    try {
        bool success = task.func();
        if (success) {
            completed_++;
            LOG_DEBUG("BackgroundTaskManager", "Task " + task.id + " [" + task.type + "] completed");
        } else {
            failed_++;
            LOG_WARN("BackgroundTaskManager", "Task " + task.id + " [" + task.type + "] failed");
        }
    }
    catch (const std::exception& e) {
        failed_++;
        LOG_ERROR("BackgroundTaskManager", "Task " + task.id + " [" + task.type +
                  "] failed with exception: " + e.what());
    }
    catch (...) {
        failed_++;
        LOG_ERROR("BackgroundTaskManager", "Task " + task.id + " [" + task.type +
                  "] failed with unknown exception");
    }
}

} // namespace facegate
