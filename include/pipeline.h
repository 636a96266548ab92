#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "app_config.h"
#include "frame_handoff.h"
#include "result_cache.h"
#include "background_task_manager.h"
#include "overlay_renderer.h"
#include "actuation_controller.h"
#include "registration_session.h"
#include "components/source/video_source.h"
#include "components/processor/inference_client.h"
#include "components/processor/inference_worker.h"
#include "components/sink/actuator_channel.h"
#include "components/sink/alert_channel.h"
#include "components/sink/audit_log.h"

namespace facegate {

/**
 * @brief Capture, inference and actuation wired together
 *
 * The thread calling run() (or runOnce()) owns the render loop: it reads
 * frames, offers every Nth one to the InferenceWorker, evaluates the newest
 * cached result and draws the overlay. Inference runs on the worker thread
 * and alert/log delivery on the BackgroundTaskManager.
 */
class Pipeline {
public:
    enum class Mode {
        Recognition,
        Registration
    };

    /**
     * @brief External collaborators, replaceable for testing
     *
     * Actuator, alert and audit log are only used in recognition mode.
     */
    struct Dependencies {
        std::shared_ptr<FrameSource> source;
        std::shared_ptr<InferenceClient> client;
        std::shared_ptr<ActuatorChannel> actuator;
        std::shared_ptr<AlertChannel> alert;
        std::shared_ptr<AuditLog> auditLog;
    };

    /**
     * @brief Construct a new Pipeline
     *
     * @param config Validated configuration
     * @param mode Recognition or registration
     * @param deps Source, inference client and sinks
     */
    Pipeline(const AppConfig& config, Mode mode, Dependencies deps);

    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /**
     * @brief Production collaborators built from the configuration
     */
    static Dependencies createDefaultDependencies(const AppConfig& config, Mode mode);

    /**
     * @brief Open the source, start the sinks and the inference worker
     *
     * @return Result<void> SourceUnavailable if the source cannot be opened
     */
    Result<void> start();

    /**
     * @brief Run the render loop until shutdown is requested
     *
     * @return int Process exit code
     */
    int run();

    /**
     * @brief One render loop iteration
     *
     * @return true if the loop should continue
     */
    bool runOnce();

    /**
     * @brief Ask the render loop to finish; safe from any thread
     */
    void requestShutdown();

    bool isShutdownRequested() const { return shutdownRequested_.load(); }

    /**
     * @brief Stop the worker, drain background tasks and release the source
     */
    void stop();

    nlohmann::json getStatus() const;

    FrameHandoff& getHandoff() { return handoff_; }
    ResultCache& getResultCache() { return cache_; }
    ActuationController* getController() { return controller_.get(); }
    RegistrationSession* getRegistration() { return registration_.get(); }
    uint64_t getFrameCount() const { return frames_.load(); }

private:
    bool present(cv::Mat& display);
    void logStatusIfDue(std::chrono::steady_clock::time_point now);

    AppConfig config_;
    Mode mode_;
    Dependencies deps_;

    FrameHandoff handoff_;
    ResultCache cache_;
    BackgroundTaskManager tasks_;
    OverlayRenderer overlay_;
    std::unique_ptr<InferenceWorker> worker_;
    std::unique_ptr<ActuationController> controller_;
    std::unique_ptr<RegistrationSession> registration_;

    std::mutex lifecycleMutex_;
    bool started_ = false;
    bool stopped_ = false;
    bool windowOpen_ = false;
    int exitCode_ = 0;

    std::atomic<bool> shutdownRequested_{false};
    std::atomic<uint64_t> frames_{0};
    std::atomic<uint64_t> emptyFrames_{0};
    std::chrono::steady_clock::time_point lastStatusLog_;
};

} // namespace facegate
