#include "components/source/video_source.h"
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace facegate {

OpenCvVideoSource::OpenCvVideoSource(const std::string& id, const std::string& uri)
    : FrameSource(id), uri_(uri) {
    config_["uri"] = isCameraIndex(uri_) ? uri_ : std::string("<stream>");
}

OpenCvVideoSource::~OpenCvVideoSource() {
    stop();
}

bool OpenCvVideoSource::isCameraIndex(const std::string& uri) {
    return !uri.empty() && std::all_of(uri.begin(), uri.end(), [](unsigned char c) { return std::isdigit(c); });
}

const char* OpenCvVideoSource::ffmpegCaptureOptions() {
    return "rtsp_transport;tcp|fflags;nobuffer|flags;low_delay";
}

bool OpenCvVideoSource::initialize() {
    std::lock_guard<std::mutex> lock(captureMutex_);
    if (cap_.isOpened()) {
        return true;
    }

    try {
        if (isCameraIndex(uri_)) {
            int index = std::stoi(uri_);
            LOG_INFO("OpenCvVideoSource", "Opening local camera " + std::to_string(index));
            cap_.open(index);
        } else {
            // Must be set before the FFmpeg backend opens the stream; an existing value wins
            setenv("OPENCV_FFMPEG_CAPTURE_OPTIONS", ffmpegCaptureOptions(), 0);
            LOG_INFO("OpenCvVideoSource", "Opening network stream with FFmpeg backend");
            cap_.open(uri_, cv::CAP_FFMPEG);
        }
    } catch (const std::exception& e) {
        lastError_ = std::string("Initialization error: ") + e.what();
        LOG_ERROR("OpenCvVideoSource", lastError_);
        return false;
    }

    if (!cap_.isOpened()) {
        lastError_ = "Failed to open video source";
        LOG_ERROR("OpenCvVideoSource", lastError_ + " " + id_);
        return false;
    }

    cap_.set(cv::CAP_PROP_BUFFERSIZE, 1);

    double actualWidth = cap_.get(cv::CAP_PROP_FRAME_WIDTH);
    double actualHeight = cap_.get(cv::CAP_PROP_FRAME_HEIGHT);
    double actualFps = cap_.get(cv::CAP_PROP_FPS);

    LOG_INFO("OpenCvVideoSource", "Stream properties - Width: " + std::to_string(static_cast<int>(actualWidth)) +
             ", Height: " + std::to_string(static_cast<int>(actualHeight)) +
             ", FPS: " + std::to_string(actualFps));

    lastError_.clear();
    return true;
}

bool OpenCvVideoSource::start() {
    if (running_) {
        return true;
    }
    if (!initialize()) {
        return false;
    }
    running_ = true;
    return true;
}

bool OpenCvVideoSource::stop() {
    running_ = false;
    std::lock_guard<std::mutex> lock(captureMutex_);
    if (cap_.isOpened()) {
        cap_.release();
        LOG_INFO("OpenCvVideoSource", "Released video source " + id_ + " after " +
                 std::to_string(framesRead_.load()) + " frames");
    }
    return true;
}

nlohmann::json OpenCvVideoSource::getStatus() const {
    nlohmann::json status = Component::getStatus();
    status["frames_read"] = framesRead_.load();
    status["empty_frames"] = emptyFrames_.load();
    if (!lastError_.empty()) {
        status["last_error"] = lastError_;
    }
    return status;
}

Result<Frame> OpenCvVideoSource::read() {
    std::lock_guard<std::mutex> lock(captureMutex_);
    if (!cap_.isOpened()) {
        return Result<Frame>::error(ErrorKind::SourceUnavailable, "Video source is not open");
    }

    Frame frame;
    if (!cap_.read(frame.image) || frame.image.empty()) {
        emptyFrames_++;
        return Result<Frame>::error(ErrorKind::EmptyFrame, "Capture returned no image");
    }

    frame.sequenceId = nextSequenceId_++;
    frame.capturedAt = std::chrono::steady_clock::now();
    framesRead_++;
    return Result<Frame>::success(std::move(frame));
}

} // namespace facegate
