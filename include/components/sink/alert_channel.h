#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>
#include "component.h"
#include "result.h"

namespace facegate {

/**
 * @brief Best-effort notification carrying a photo and a caption
 */
class AlertChannel : public SinkComponent {
public:
    explicit AlertChannel(const std::string& id) : SinkComponent(id) {}

    /**
     * @brief Deliver an alert
     *
     * May block for the transport timeout, so callers run it off the
     * render thread. Failures are reported but never retried.
     *
     * @param jpeg Snapshot of the frame that raised the alert
     * @param caption Message text
     * @return Result<void> Delivery outcome
     */
    virtual Result<void> sendAlert(const std::vector<unsigned char>& jpeg, const std::string& caption) = 0;
};

/**
 * @brief AlertChannel posting photos through the Telegram Bot API
 */
class TelegramAlertChannel : public AlertChannel {
public:
    TelegramAlertChannel(const std::string& id,
                         const std::string& botToken,
                         const std::string& chatId,
                         const std::string& apiBaseUrl = "https://api.telegram.org",
                         long timeoutMs = 10000);

    nlohmann::json getStatus() const override;

    Result<void> sendAlert(const std::vector<unsigned char>& jpeg, const std::string& caption) override;

    /**
     * @brief Interpret a sendPhoto response body
     */
    static Result<void> parseSendPhotoResponse(long statusCode, const std::string& body);

private:
    std::string botToken_;
    std::string chatId_;
    std::string apiBaseUrl_;
    long timeoutMs_;

    std::atomic<uint64_t> sentCount_{0};
    std::atomic<uint64_t> failedCount_{0};
};

/**
 * @brief AlertChannel used when no notification transport is configured
 */
class LogAlertChannel : public AlertChannel {
public:
    explicit LogAlertChannel(const std::string& id) : AlertChannel(id) {}

    Result<void> sendAlert(const std::vector<unsigned char>& jpeg, const std::string& caption) override;
};

} // namespace facegate
