#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <nlohmann/json.hpp>
#include "frame_types.h"
#include "background_task_manager.h"
#include "components/sink/actuator_channel.h"
#include "components/sink/alert_channel.h"
#include "components/sink/audit_log.h"

namespace facegate {

/**
 * @brief Turns fresh recognition results into debounced side effects
 *
 * Three independent policies are evaluated once per newly published
 * ResultSet:
 *  - actuator: ON while any known identity is present, sent only on change
 *  - alert: at most one dispatch per cooldown window while the trigger holds
 *  - log: one audit row per identity when it enters the view, then one per
 *    cooldown while it stays; faces sharing an identity share one row
 *
 * Policy state is owned by the thread calling evaluate(). Alert and log
 * delivery run on the BackgroundTaskManager.
 */
class ActuationController {
public:
    using Clock = std::chrono::steady_clock;
    using AlertTrigger = std::function<bool(const ResultSet&)>;

    struct Options {
        std::chrono::milliseconds alertCooldown{15000};
        std::chrono::milliseconds logCooldown{3000};
        std::string alertCaption = "Alert: Unknown Face Detected!";
        int snapshotJpegQuality = 90;
    };

    /**
     * @brief Construct a new Actuation Controller
     *
     * @param actuator Actuator output, commanded synchronously
     * @param alert Alert output, used from background tasks
     * @param auditLog Audit store, used from background tasks
     * @param tasks Executor for alert and log delivery
     * @param options Cooldowns and alert text
     */
    ActuationController(std::shared_ptr<ActuatorChannel> actuator,
                        std::shared_ptr<AlertChannel> alert,
                        std::shared_ptr<AuditLog> auditLog,
                        BackgroundTaskManager& tasks,
                        Options options);

    /**
     * @brief Evaluate @p resultSet unless it is the one evaluated last
     *
     * @param resultSet Snapshot read from the ResultCache, may be null
     * @param now Evaluation time
     * @return true if the policies were evaluated
     */
    bool evaluateIfNew(const std::shared_ptr<const ResultSet>& resultSet, Clock::time_point now);

    /**
     * @brief Run all three policies against one ResultSet
     *
     * Error-flagged result sets leave every policy untouched.
     */
    void evaluate(const ResultSet& resultSet, Clock::time_point now);

    /**
     * @brief Replace the alert trigger predicate
     *
     * The default trigger fires when any face is labelled unknown.
     */
    void setAlertTrigger(AlertTrigger trigger);

    bool isActuatorOn() const { return actuatorOn_; }
    std::optional<Clock::time_point> getLastAlertTime() const { return lastAlert_; }
    std::optional<std::string> getLastLoggedIdentity() const { return lastLoggedIdentity_; }

    uint64_t getActuatorSendCount() const { return actuatorSends_; }
    uint64_t getAlertDispatchCount() const { return alertDispatches_; }
    uint64_t getLogWriteCount() const { return logWrites_; }

    nlohmann::json getStatus() const;

    /**
     * @brief Current local time as YYYY-MM-DD HH:MM:SS
     */
    static std::string wallClockTimestamp();

private:
    void evaluateActuator(const ResultSet& resultSet);
    void evaluateAlert(const ResultSet& resultSet, Clock::time_point now);
    void evaluateLog(const ResultSet& resultSet, Clock::time_point now);

    std::shared_ptr<ActuatorChannel> actuator_;
    std::shared_ptr<AlertChannel> alert_;
    std::shared_ptr<AuditLog> auditLog_;
    BackgroundTaskManager& tasks_;
    Options options_;
    AlertTrigger alertTrigger_;

    std::shared_ptr<const ResultSet> lastEvaluated_;

    bool actuatorOn_ = false;                                ///< Last value sent to the actuator
    std::optional<Clock::time_point> lastAlert_;             ///< Last alert dispatch initiation
    std::shared_ptr<std::atomic<bool>> alertInFlight_;       ///< Shared with the dispatch task
    std::optional<std::string> lastLoggedIdentity_;
    std::unordered_map<std::string, Clock::time_point> lastLogTimes_;   ///< Per identity
    std::unordered_set<std::string> identitiesInView_;                  ///< Last non-empty evaluated set

    uint64_t actuatorSends_ = 0;
    uint64_t alertDispatches_ = 0;
    uint64_t logWrites_ = 0;
};

} // namespace facegate
