#include "frame_handoff.h"
#include "logger.h"

namespace facegate {

bool FrameHandoff::offer(Frame frame) {
    bool evicted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (slot_.has_value()) {
            evicted = true;
            dropped_++;
        }
        slot_ = std::move(frame);
        offered_++;
    }
    cv_.notify_one();

    if (evicted) {
        LOG_TRACE("FrameHandoff", "Evicted unconsumed frame, inference is behind capture");
    }
    return evicted;
}

std::optional<Frame> FrameHandoff::take(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || slot_.has_value(); });

    if (closed_ || !slot_.has_value()) {
        return std::nullopt;
    }

    std::optional<Frame> frame = std::move(slot_);
    slot_.reset();
    consumed_++;
    return frame;
}

void FrameHandoff::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        slot_.reset();
    }
    cv_.notify_all();
}

bool FrameHandoff::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace facegate
