#include "result_cache.h"
#include "logger.h"

namespace facegate {

ResultCache::ResultCache(bool rejectStale)
    : rejectStale_(rejectStale) {
}

bool ResultCache::publish(ResultSet resultSet) {
    if (rejectStale_) {
        auto current = std::atomic_load(&latest_);
        if (current && resultSet.sequenceId <= current->sequenceId) {
            rejected_++;
            LOG_DEBUG("ResultCache", "Rejected stale result for frame " + std::to_string(resultSet.sequenceId) +
                      " (cached frame " + std::to_string(current->sequenceId) + ")");
            return false;
        }
    }

    auto next = std::make_shared<const ResultSet>(std::move(resultSet));
    std::atomic_store(&latest_, std::move(next));
    generation_++;
    return true;
}

std::shared_ptr<const ResultSet> ResultCache::read() const {
    return std::atomic_load(&latest_);
}

} // namespace facegate
