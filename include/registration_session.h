#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include "frame_types.h"
#include "background_task_manager.h"
#include "overlay_renderer.h"
#include "components/processor/inference_client.h"

namespace facegate {

/**
 * @brief Enrols a new identity by auto-capturing face samples
 *
 * Whenever the latest detection shows exactly one face and the capture
 * cooldown has elapsed, the current frame is saved to the image directory
 * and uploaded to the registration endpoint in the background. The session
 * completes once the requested number of samples has been taken.
 */
class RegistrationSession {
public:
    using Clock = std::chrono::steady_clock;

    struct Options {
        std::string userId;
        int samples = 10;
        std::chrono::milliseconds captureCooldown{800};
        std::string imageDir = "images";
        int jpegQuality = 90;
    };

    RegistrationSession(std::shared_ptr<InferenceClient> client,
                        BackgroundTaskManager& tasks,
                        Options options);

    /**
     * @brief Validate the user id and create the image directory
     *
     * @return Result<void> Error if the session cannot run
     */
    Result<void> prepare();

    /**
     * @brief Consider the current frame for capture
     *
     * @param frame Frame being displayed
     * @param latest Latest detection result, may be null
     * @param now Current time
     * @return true if a sample was captured from this frame
     */
    bool onFrame(const Frame& frame, const std::shared_ptr<const ResultSet>& latest, Clock::time_point now);

    /**
     * @brief Draw progress and guidance text
     */
    void drawStatus(cv::Mat& display, const OverlayRenderer& overlay,
                    const std::shared_ptr<const ResultSet>& latest) const;

    bool isComplete() const { return captured_ >= options_.samples; }
    int getCapturedCount() const { return captured_; }
    int getRegisteredCount() const { return registered_->load(); }

    nlohmann::json getStatus() const;

    /**
     * @brief File name for a saved sample, <user>_<YYYYmmdd_HHMMSS>_<index>.jpg
     */
    static std::string sampleFileName(const std::string& userId, const std::tm& localTime, int index);

private:
    std::shared_ptr<InferenceClient> client_;
    BackgroundTaskManager& tasks_;
    Options options_;

    int captured_ = 0;
    std::optional<Clock::time_point> lastCapture_;
    std::shared_ptr<std::atomic<int>> registered_;
};

} // namespace facegate
