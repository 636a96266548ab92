#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <opencv2/core.hpp>
#include "frame_types.h"
#include "components/source/video_source.h"
#include "components/processor/inference_client.h"
#include "components/sink/actuator_channel.h"
#include "components/sink/alert_channel.h"
#include "components/sink/audit_log.h"

namespace facegate {
namespace test {

inline Frame makeFrame(uint64_t sequenceId, int width = 640, int height = 640) {
    Frame frame;
    frame.image = cv::Mat(height, width, CV_8UC3, cv::Scalar(40, 80, 120));
    frame.sequenceId = sequenceId;
    frame.capturedAt = std::chrono::steady_clock::now();
    return frame;
}

inline DetectionBox makeBox(int xMin, int yMin, int xMax, int yMax) {
    DetectionBox box;
    box.xMin = xMin;
    box.yMin = yMin;
    box.xMax = xMax;
    box.yMax = yMax;
    return box;
}

inline FaceResult knownFace(const std::string& identity, double confidence) {
    FaceResult face;
    face.box = makeBox(100, 100, 200, 220);
    face.recognition.identity = identity;
    face.recognition.confidence = confidence;
    return face;
}

inline FaceResult unknownFace(double confidence = 0.0) {
    FaceResult face;
    face.box = makeBox(300, 120, 380, 220);
    face.recognition.confidence = confidence;
    return face;
}

inline std::filesystem::path uniqueTempPath(const std::string& prefix) {
    static std::atomic<int> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
           (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
}

/**
 * @brief Poll @p condition until it holds or @p timeout passes
 */
inline bool waitFor(const std::function<bool()>& condition,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return condition();
}

/**
 * @brief InferenceClient whose answers are set by the test
 */
class ScriptedInferenceClient : public InferenceClient {
public:
    using DetectFn = std::function<Result<std::vector<DetectionBox>>(int call)>;
    using RecognizeFn = std::function<Result<RecognitionResult>(int call)>;

    DetectFn onDetect = [](int) {
        return Result<std::vector<DetectionBox>>::success(std::vector<DetectionBox>());
    };
    RecognizeFn onRecognize = [](int) {
        return Result<RecognitionResult>::success(RecognitionResult());
    };
    std::function<Result<void>(const std::string&)> onRegister = [](const std::string&) {
        return Result<void>::success();
    };

    Result<std::vector<DetectionBox>> detect(const std::vector<unsigned char>& jpeg) override {
        lastDetectBytes = jpeg.size();
        return onDetect(detectCalls++);
    }

    Result<RecognitionResult> recognize(const std::vector<unsigned char>&) override {
        return onRecognize(recognizeCalls++);
    }

    Result<void> registerFace(const std::vector<unsigned char>&, const std::string& userId) override {
        registerCalls++;
        return onRegister(userId);
    }

    std::atomic<int> detectCalls{0};
    std::atomic<int> recognizeCalls{0};
    std::atomic<int> registerCalls{0};
    std::atomic<size_t> lastDetectBytes{0};
};

class RecordingActuator : public ActuatorChannel {
public:
    RecordingActuator() : ActuatorChannel("test_actuator") {}

    Result<void> send(bool on) override {
        std::lock_guard<std::mutex> lock(mutex_);
        commands_.push_back(on);
        return Result<void>::success();
    }

    std::vector<bool> commands() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<bool> commands_;
};

/**
 * @brief AlertChannel that counts deliveries and can be held open
 */
class RecordingAlert : public AlertChannel {
public:
    RecordingAlert() : AlertChannel("test_alert") {}

    Result<void> sendAlert(const std::vector<unsigned char>& jpeg, const std::string& caption) override {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            lastCaption_ = caption;
            lastSnapshotBytes_ = jpeg.size();
            entered_++;
            cv_.notify_all();
            cv_.wait(lock, [this] { return !held_; });
        }
        delivered++;
        return Result<void>::success();
    }

    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        cv_.notify_all();
    }

    bool waitEntered(int count, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this, count] { return entered_ >= count; });
    }

    std::string lastCaption() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastCaption_;
    }

    size_t lastSnapshotBytes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastSnapshotBytes_;
    }

    std::atomic<int> delivered{0};

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool held_ = false;
    int entered_ = 0;
    std::string lastCaption_;
    size_t lastSnapshotBytes_ = 0;
};

class RecordingAuditLog : public AuditLog {
public:
    RecordingAuditLog() : AuditLog("test_audit") {}

    Result<void> append(const AuditRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
        return Result<void>::success();
    }

    std::vector<AuditRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<AuditRecord> records_;
};

/**
 * @brief FrameSource producing synthetic frames, with scripted read errors first
 */
class SyntheticFrameSource : public FrameSource {
public:
    explicit SyntheticFrameSource(int width = 800, int height = 600)
        : FrameSource("synthetic_source"), width_(width), height_(height) {}

    bool start() override {
        if (!startOk) {
            return false;
        }
        running_ = true;
        return true;
    }

    Result<Frame> read() override {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!scriptedErrors_.empty()) {
                ErrorKind kind = scriptedErrors_.front();
                scriptedErrors_.pop_front();
                return Result<Frame>::error(kind, "scripted read failure");
            }
        }
        if (maxFrames > 0 && produced >= maxFrames) {
            return Result<Frame>::error(ErrorKind::SourceUnavailable, "synthetic source exhausted");
        }
        return Result<Frame>::success(makeFrame(static_cast<uint64_t>(++produced), width_, height_));
    }

    void scriptError(ErrorKind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        scriptedErrors_.push_back(kind);
    }

    bool startOk = true;
    int maxFrames = 0;              ///< 0 means unlimited
    std::atomic<int> produced{0};

private:
    int width_;
    int height_;
    std::mutex mutex_;
    std::deque<ErrorKind> scriptedErrors_;
};

} // namespace test
} // namespace facegate
