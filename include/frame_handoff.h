#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include "frame_types.h"

namespace facegate {

/**
 * @brief Single-slot, latest-wins buffer between capture and inference
 *
 * The producer never blocks: offering while the slot is still occupied
 * evicts the unconsumed frame. The consumer waits on a condition variable
 * for a bounded time. A frame is delivered at most once.
 */
class FrameHandoff {
public:
    FrameHandoff() = default;

    FrameHandoff(const FrameHandoff&) = delete;
    FrameHandoff& operator=(const FrameHandoff&) = delete;

    /**
     * @brief Place a frame in the slot, replacing any unconsumed one
     *
     * @param frame Frame to hand off
     * @return true if an older unconsumed frame was evicted
     */
    bool offer(Frame frame);

    /**
     * @brief Take the pending frame, waiting at most @p timeout for one
     *
     * @param timeout Upper bound on the wait
     * @return std::optional<Frame> The frame, or nullopt on timeout or after close()
     */
    std::optional<Frame> take(std::chrono::milliseconds timeout);

    /**
     * @brief Wake any waiting consumer and refuse further frames
     */
    void close();

    bool isClosed() const;

    uint64_t getOfferedCount() const { return offered_.load(); }
    uint64_t getConsumedCount() const { return consumed_.load(); }
    uint64_t getDroppedCount() const { return dropped_.load(); }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<Frame> slot_;
    bool closed_ = false;

    std::atomic<uint64_t> offered_{0};
    std::atomic<uint64_t> consumed_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace facegate
