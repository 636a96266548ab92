#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <opencv2/core.hpp>
#include "component.h"
#include "frame_handoff.h"
#include "result_cache.h"
#include "components/processor/inference_client.h"

namespace facegate {

/**
 * @brief Background processor running detect and recognize cycles
 *
 * Takes the newest frame from the handoff, runs one full remote inference
 * cycle on it and publishes the outcome to the result cache. Only one cycle
 * is ever in flight; frames offered meanwhile replace each other in the
 * handoff. Remote failures never stop the loop.
 */
class InferenceWorker : public ProcessorComponent {
public:
    struct Options {
        double minConfidence = 0.60;
        int cropPadding = 20;                         ///< Pixels added around each box before cropping
        int minFaceWidth = 40;                        ///< Narrower crops are not sent for recognition
        int jpegQuality = 90;
        std::chrono::milliseconds takeTimeout{100};
        bool detectOnly = false;                      ///< Skip the recognize stage
    };

    /**
     * @brief Construct a new Inference Worker
     *
     * @param id Component ID
     * @param handoff Frame source shared with the capture loop
     * @param cache Destination for completed results
     * @param client Remote inference service
     * @param options Cycle parameters
     */
    InferenceWorker(const std::string& id,
                    FrameHandoff& handoff,
                    ResultCache& cache,
                    std::shared_ptr<InferenceClient> client,
                    Options options);

    ~InferenceWorker() override;

    bool initialize() override;
    bool start() override;
    bool stop() override;
    nlohmann::json getStatus() const override;

    /**
     * @brief Run one complete inference cycle on a frame
     *
     * @param frame Frame to analyse
     * @return true if a ResultSet was published (including an error-flagged one),
     *         false if the cycle was skipped
     */
    bool processFrame(const Frame& frame);

    /**
     * @brief Apply the identity rule to a reported recognition
     *
     * The identity is kept only when it is not "unknown" (any case) and its
     * confidence reaches @p minConfidence.
     */
    static RecognitionResult applyThreshold(const RecognitionResult& reported, double minConfidence);

    /**
     * @brief Box with its corners clamped into @p bounds
     */
    static DetectionBox clampBox(const DetectionBox& box, const cv::Size& bounds);

    /**
     * @brief Box grown by @p padding on every side and clipped to @p bounds
     */
    static cv::Rect paddedRegion(const DetectionBox& box, int padding, const cv::Size& bounds);

    uint64_t getCycleCount() const { return cycles_.load(); }
    uint64_t getDetectFailureCount() const { return detectFailures_.load(); }
    uint64_t getRecognizeFailureCount() const { return recognizeFailures_.load(); }

private:
    void workerLoop();
    RecognitionResult recognizeBox(const Frame& frame, const DetectionBox& box);
    void setLastError(const std::string& error);

    FrameHandoff& handoff_;
    ResultCache& cache_;
    std::shared_ptr<InferenceClient> client_;
    Options options_;

    std::thread workerThread_;
    std::atomic<bool> stopRequested_;

    std::atomic<uint64_t> cycles_{0};
    std::atomic<uint64_t> detectFailures_{0};
    std::atomic<uint64_t> recognizeFailures_{0};
    std::atomic<uint64_t> encodeFailures_{0};
    std::atomic<int64_t> lastCycleMs_{0};

    mutable std::mutex errorMutex_;
    std::string lastError_;
};

} // namespace facegate
