#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include "frame_types.h"

namespace facegate {

/**
 * @brief Holds the most recently completed ResultSet
 *
 * One writer (the inference worker) replaces the cached value as a whole;
 * any number of readers obtain an immutable snapshot without waiting for the
 * writer. Readers may observe a value that lags the live stream.
 */
class ResultCache {
public:
    /**
     * @brief Construct a cache
     *
     * @param rejectStale Drop publications whose frame sequence id is not
     *                    newer than the cached one
     */
    explicit ResultCache(bool rejectStale = false);

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    /**
     * @brief Atomically replace the cached ResultSet
     *
     * @param resultSet Completed result of one inference cycle
     * @return true if the value was published, false if rejected as stale
     */
    bool publish(ResultSet resultSet);

    /**
     * @brief Get the latest ResultSet
     *
     * @return std::shared_ptr<const ResultSet> Snapshot, null before the first publication
     */
    std::shared_ptr<const ResultSet> read() const;

    /**
     * @brief Number of successful publications so far
     */
    uint64_t getGeneration() const { return generation_.load(); }

    uint64_t getRejectedCount() const { return rejected_.load(); }

private:
    std::shared_ptr<const ResultSet> latest_;
    bool rejectStale_;
    std::atomic<uint64_t> generation_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace facegate
