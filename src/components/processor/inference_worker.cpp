#include "components/processor/inference_worker.h"
#include "utils/image_utils.h"
#include "logger.h"
#include <algorithm>
#include <cctype>

namespace facegate {

InferenceWorker::InferenceWorker(const std::string& id,
                                 FrameHandoff& handoff,
                                 ResultCache& cache,
                                 std::shared_ptr<InferenceClient> client,
                                 Options options)
    : ProcessorComponent(id),
      handoff_(handoff),
      cache_(cache),
      client_(std::move(client)),
      options_(options),
      stopRequested_(false) {
    config_["min_confidence"] = options_.minConfidence;
    config_["crop_padding"] = options_.cropPadding;
    config_["min_face_width"] = options_.minFaceWidth;
    config_["jpeg_quality"] = options_.jpegQuality;
    config_["take_timeout_ms"] = options_.takeTimeout.count();
    config_["detect_only"] = options_.detectOnly;
}

InferenceWorker::~InferenceWorker() {
    stop();
}

bool InferenceWorker::initialize() {
    if (!client_) {
        LOG_ERROR("InferenceWorker", "No inference client configured for " + id_);
        return false;
    }
    return true;
}

bool InferenceWorker::start() {
    if (running_) {
        return true;
    }
    if (!initialize()) {
        return false;
    }

    stopRequested_ = false;
    running_ = true;
    workerThread_ = std::thread(&InferenceWorker::workerLoop, this);

    LOG_INFO("InferenceWorker", "Inference worker " + id_ + " started" +
             (options_.detectOnly ? " in detect-only mode" : ""));
    return true;
}

bool InferenceWorker::stop() {
    stopRequested_ = true;
    if (workerThread_.joinable()) {
        workerThread_.join();
        LOG_INFO("InferenceWorker", "Inference worker " + id_ + " stopped after " +
                 std::to_string(cycles_.load()) + " cycles");
    }
    running_ = false;
    return true;
}

nlohmann::json InferenceWorker::getStatus() const {
    nlohmann::json status = Component::getStatus();
    status["cycles"] = cycles_.load();
    status["detect_failures"] = detectFailures_.load();
    status["recognize_failures"] = recognizeFailures_.load();
    status["encode_failures"] = encodeFailures_.load();
    status["last_cycle_ms"] = lastCycleMs_.load();

    std::lock_guard<std::mutex> lock(errorMutex_);
    if (!lastError_.empty()) {
        status["last_error"] = lastError_;
    }
    return status;
}

void InferenceWorker::workerLoop() {
    LOG_DEBUG("InferenceWorker", "Worker loop for " + id_ + " entered");

    while (!stopRequested_) {
        auto frame = handoff_.take(options_.takeTimeout);
        if (!frame) {
            if (handoff_.isClosed()) {
                break;
            }
            continue;
        }

        processFrame(*frame);
    }

    LOG_DEBUG("InferenceWorker", "Worker loop for " + id_ + " exiting");
}

bool InferenceWorker::processFrame(const Frame& frame) {
    auto cycleStart = std::chrono::steady_clock::now();

    if (frame.empty()) {
        LOG_WARN("InferenceWorker", "Skipping empty frame " + std::to_string(frame.sequenceId));
        return false;
    }

    auto encoded = utils::encodeJpeg(frame.image, options_.jpegQuality);
    if (encoded.isError()) {
        // Keep whatever the cache already holds
        encodeFailures_++;
        setLastError(encoded.getErrorDetail().toString());
        LOG_WARN("InferenceWorker", "Skipping frame " + std::to_string(frame.sequenceId) + ": " + encoded.getError());
        return false;
    }

    ResultSet resultSet;
    resultSet.sequenceId = frame.sequenceId;
    resultSet.frame = frame.image;

    auto detection = client_->detect(encoded.getValue());
    if (detection.isError()) {
        detectFailures_++;
        setLastError(detection.getErrorDetail().toString());
        LOG_WARN("InferenceWorker", "Detection failed for frame " + std::to_string(frame.sequenceId) +
                 ": " + detection.getErrorDetail().toString());

        resultSet.error = detection.getErrorDetail();
    } else {
        const auto& boxes = detection.getValue();
        resultSet.faces.reserve(boxes.size());

        for (const auto& box : boxes) {
            FaceResult face;
            face.box = clampBox(box, frame.image.size());
            if (!options_.detectOnly) {
                face.recognition = recognizeBox(frame, face.box);
            }
            resultSet.faces.push_back(std::move(face));
        }
    }

    resultSet.completedAt = std::chrono::steady_clock::now();
    size_t faceCount = resultSet.faces.size();
    cache_.publish(std::move(resultSet));
    cycles_++;

    auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - cycleStart).count();
    lastCycleMs_ = elapsedMs;

    LOG_DEBUG("InferenceWorker", "Frame " + std::to_string(frame.sequenceId) + ": " +
              std::to_string(faceCount) + " faces in " + std::to_string(elapsedMs) + "ms");
    return true;
}

RecognitionResult InferenceWorker::recognizeBox(const Frame& frame, const DetectionBox& box) {
    RecognitionResult unknown;

    cv::Rect region = paddedRegion(box, options_.cropPadding, frame.image.size());
    if (region.width <= 0 || region.height <= 0 || region.width < options_.minFaceWidth) {
        LOG_TRACE("InferenceWorker", "Face crop too small for recognition (" +
                  std::to_string(region.width) + "px wide)");
        return unknown;
    }

    auto encoded = utils::encodeJpeg(frame.image(region), options_.jpegQuality);
    if (encoded.isError()) {
        recognizeFailures_++;
        LOG_WARN("InferenceWorker", "Failed to encode face crop: " + encoded.getError());
        return unknown;
    }

    auto recognition = client_->recognize(encoded.getValue());
    if (recognition.isError()) {
        recognizeFailures_++;
        setLastError(recognition.getErrorDetail().toString());
        LOG_WARN("InferenceWorker", "Recognition failed for frame " + std::to_string(frame.sequenceId) +
                 ": " + recognition.getErrorDetail().toString());
        return unknown;
    }

    return applyThreshold(recognition.getValue(), options_.minConfidence);
}

RecognitionResult InferenceWorker::applyThreshold(const RecognitionResult& reported, double minConfidence) {
    std::string lowered = reported.identity;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    RecognitionResult result;
    result.confidence = reported.confidence;
    if (!lowered.empty() && lowered != "unknown" && reported.confidence >= minConfidence) {
        result.identity = reported.identity;
    }
    return result;
}

DetectionBox InferenceWorker::clampBox(const DetectionBox& box, const cv::Size& bounds) {
    auto clamp = [](int value, int upper) { return std::max(0, std::min(value, upper)); };

    DetectionBox clamped;
    clamped.xMin = clamp(box.xMin, bounds.width - 1);
    clamped.yMin = clamp(box.yMin, bounds.height - 1);
    clamped.xMax = clamp(box.xMax, bounds.width - 1);
    clamped.yMax = clamp(box.yMax, bounds.height - 1);
    return clamped;
}

cv::Rect InferenceWorker::paddedRegion(const DetectionBox& box, int padding, const cv::Size& bounds) {
    int x1 = std::max(0, box.xMin - padding);
    int y1 = std::max(0, box.yMin - padding);
    int x2 = std::min(bounds.width, box.xMax + padding);
    int y2 = std::min(bounds.height, box.yMax + padding);

    if (x2 <= x1 || y2 <= y1) {
        return cv::Rect();
    }
    return cv::Rect(x1, y1, x2 - x1, y2 - y1);
}

void InferenceWorker::setLastError(const std::string& error) {
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_ = error;
}

} // namespace facegate
