#include "actuation_controller.h"
#include "utils/image_utils.h"
#include "logger.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace facegate {

ActuationController::ActuationController(std::shared_ptr<ActuatorChannel> actuator,
                                         std::shared_ptr<AlertChannel> alert,
                                         std::shared_ptr<AuditLog> auditLog,
                                         BackgroundTaskManager& tasks,
                                         Options options)
    : actuator_(std::move(actuator)),
      alert_(std::move(alert)),
      auditLog_(std::move(auditLog)),
      tasks_(tasks),
      options_(std::move(options)),
      alertTrigger_([](const ResultSet& resultSet) { return resultSet.anyUnknown(); }),
      alertInFlight_(std::make_shared<std::atomic<bool>>(false)) {
}

void ActuationController::setAlertTrigger(AlertTrigger trigger) {
    alertTrigger_ = std::move(trigger);
}

bool ActuationController::evaluateIfNew(const std::shared_ptr<const ResultSet>& resultSet, Clock::time_point now) {
    if (!resultSet || resultSet == lastEvaluated_) {
        return false;
    }
    // Holding the pointer keeps its address from being reused by a later result
    lastEvaluated_ = resultSet;
    evaluate(*resultSet, now);
    return true;
}

void ActuationController::evaluate(const ResultSet& resultSet, Clock::time_point now) {
    if (resultSet.hasError()) {
        LOG_DEBUG("ActuationController", "Skipping failed cycle for frame " + std::to_string(resultSet.sequenceId));
        return;
    }

    // Actuator first, the audit rows record the state it leaves behind
    evaluateActuator(resultSet);
    evaluateAlert(resultSet, now);
    evaluateLog(resultSet, now);
}

void ActuationController::evaluateActuator(const ResultSet& resultSet) {
    bool present = resultSet.anyKnown();
    if (present == actuatorOn_) {
        return;
    }

    // At-most-once: the new value is recorded even if the datagram is lost
    actuatorOn_ = present;
    actuatorSends_++;

    if (!actuator_) {
        return;
    }

    auto sent = actuator_->send(present);
    if (sent.isError()) {
        LOG_ERROR("ActuationController", "Actuator command " + std::string(present ? "ON" : "OFF") +
                  " failed: " + sent.getError());
    } else {
        LOG_INFO("ActuationController", "Actuator switched " + std::string(present ? "ON" : "OFF"));
    }
}

void ActuationController::evaluateAlert(const ResultSet& resultSet, Clock::time_point now) {
    if (!alertTrigger_ || !alertTrigger_(resultSet)) {
        return;
    }
    if (lastAlert_ && now - *lastAlert_ <= options_.alertCooldown) {
        return;
    }
    if (alertInFlight_->load()) {
        LOG_DEBUG("ActuationController", "Alert suppressed, previous dispatch still in flight");
        return;
    }
    if (!alert_) {
        return;
    }

    alertInFlight_->store(true);

    auto channel = alert_;
    auto inFlight = alertInFlight_;
    cv::Mat snapshot = resultSet.frame;
    std::string caption = options_.alertCaption;
    int quality = options_.snapshotJpegQuality;
    uint64_t sequenceId = resultSet.sequenceId;

    std::string taskId = tasks_.submitTask("alert", [channel, inFlight, snapshot, caption, quality, sequenceId]() {
        struct InFlightReset {
            std::shared_ptr<std::atomic<bool>> flag;
            ~InFlightReset() { flag->store(false); }
        } reset{inFlight};

        auto jpeg = utils::encodeJpeg(snapshot, quality);
        if (jpeg.isError()) {
            LOG_ERROR("ActuationController", "Alert snapshot for frame " + std::to_string(sequenceId) +
                      " could not be encoded: " + jpeg.getError());
            return false;
        }

        auto delivered = channel->sendAlert(jpeg.getValue(), caption);
        if (delivered.isError()) {
            LOG_ERROR("ActuationController", "Alert delivery failed: " + delivered.getErrorDetail().toString());
            return false;
        }
        return true;
    });

    if (taskId.empty()) {
        alertInFlight_->store(false);
        LOG_WARN("ActuationController", "Alert for frame " + std::to_string(resultSet.sequenceId) + " was not queued");
        return;
    }

    lastAlert_ = now;
    alertDispatches_++;
    LOG_INFO("ActuationController", "Alert dispatched for frame " + std::to_string(resultSet.sequenceId));
}

void ActuationController::evaluateLog(const ResultSet& resultSet, Clock::time_point now) {
    if (!auditLog_) {
        return;
    }

    std::unordered_set<std::string> inView;
    for (const auto& face : resultSet.faces) {
        const std::string& identity = face.recognition.identity;
        if (!inView.insert(identity).second) {
            continue;
        }

        auto last = lastLogTimes_.find(identity);
        bool entered = identitiesInView_.count(identity) == 0;
        bool cooldownElapsed = last == lastLogTimes_.end() || now - last->second >= options_.logCooldown;
        if (!entered && !cooldownElapsed) {
            continue;
        }

        AuditRecord record;
        record.sequence = resultSet.sequenceId;
        record.timestamp = wallClockTimestamp();
        record.identity = identity;
        record.confidence = face.recognition.confidence;
        record.status = face.recognition.isKnown() ? "Recognized" : "Unknown";
        record.actuatorState = actuatorOn_ ? "ON" : "OFF";

        auto log = auditLog_;
        std::string taskId = tasks_.submitTask("audit", [log, record]() {
            auto appended = log->append(record);
            if (appended.isError()) {
                LOG_ERROR("ActuationController", "Audit write failed: " + appended.getError());
                return false;
            }
            return true;
        });

        if (taskId.empty()) {
            LOG_WARN("ActuationController", "Audit record for " + identity + " was not queued");
            continue;
        }

        lastLoggedIdentity_ = identity;
        lastLogTimes_[identity] = now;
        logWrites_++;
    }

    // An empty set is a detection gap, not everyone leaving
    if (!inView.empty()) {
        identitiesInView_ = std::move(inView);
    }
}

nlohmann::json ActuationController::getStatus() const {
    nlohmann::json status;
    status["actuator_on"] = actuatorOn_;
    status["actuator_sends"] = actuatorSends_;
    status["alert_dispatches"] = alertDispatches_;
    status["alert_in_flight"] = alertInFlight_->load();
    status["log_writes"] = logWrites_;
    if (lastLoggedIdentity_) {
        status["last_logged_identity"] = *lastLoggedIdentity_;
    }
    return status;
}

std::string ActuationController::wallClockTimestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm localTime{};
    localtime_r(&now, &localTime);

    std::ostringstream ss;
    ss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace facegate
