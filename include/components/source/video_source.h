#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <opencv2/videoio.hpp>
#include "component.h"
#include "frame_types.h"
#include "result.h"

namespace facegate {

/**
 * @brief Live, non-restartable sequence of frames
 */
class FrameSource : public SourceComponent {
public:
    explicit FrameSource(const std::string& id) : SourceComponent(id) {}

    /**
     * @brief Read the next frame
     *
     * Blocks until the device delivers a frame. A transient glitch is
     * reported as EmptyFrame and the caller simply reads again.
     *
     * @return Result<Frame> Captured frame with a fresh sequence id
     */
    virtual Result<Frame> read() = 0;
};

/**
 * @brief FrameSource backed by cv::VideoCapture
 *
 * A purely numeric URI selects a local camera index; anything else (RTSP,
 * HTTP, files) is opened through the FFmpeg backend configured for low
 * latency: RTSP over TCP, no demuxer buffering, single-frame capture buffer.
 */
class OpenCvVideoSource : public FrameSource {
public:
    /**
     * @brief Construct a new OpenCV video source
     *
     * @param id Component ID
     * @param uri Camera index or stream URL
     */
    OpenCvVideoSource(const std::string& id, const std::string& uri);

    ~OpenCvVideoSource() override;

    bool initialize() override;
    bool start() override;
    bool stop() override;
    nlohmann::json getStatus() const override;

    Result<Frame> read() override;

    /**
     * @brief Whether @p uri names a local camera index
     */
    static bool isCameraIndex(const std::string& uri);

    /**
     * @brief FFmpeg capture options applied to network streams
     */
    static const char* ffmpegCaptureOptions();

private:
    std::string uri_;
    cv::VideoCapture cap_;
    std::mutex captureMutex_;

    uint64_t nextSequenceId_ = 1;
    std::atomic<uint64_t> framesRead_{0};
    std::atomic<uint64_t> emptyFrames_{0};
    std::string lastError_;
};

} // namespace facegate
