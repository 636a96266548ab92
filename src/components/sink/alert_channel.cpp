#include "components/sink/alert_channel.h"
#include "utils/http_utils.h"
#include "logger.h"

namespace facegate {

TelegramAlertChannel::TelegramAlertChannel(const std::string& id,
                                           const std::string& botToken,
                                           const std::string& chatId,
                                           const std::string& apiBaseUrl,
                                           long timeoutMs)
    : AlertChannel(id),
      botToken_(botToken),
      chatId_(chatId),
      apiBaseUrl_(apiBaseUrl),
      timeoutMs_(timeoutMs) {
    config_["chat_id"] = chatId_;
    config_["api_base_url"] = apiBaseUrl_;
    config_["timeout_ms"] = timeoutMs_;
}

nlohmann::json TelegramAlertChannel::getStatus() const {
    nlohmann::json status = Component::getStatus();
    status["sent"] = sentCount_.load();
    status["failed"] = failedCount_.load();
    return status;
}

Result<void> TelegramAlertChannel::sendAlert(const std::vector<unsigned char>& jpeg, const std::string& caption) {
    std::string url = utils::joinUrl(apiBaseUrl_, "bot" + botToken_ + "/sendPhoto");

    std::vector<utils::MultipartPart> parts = {
        utils::MultipartPart::text("chat_id", chatId_),
        utils::MultipartPart::text("caption", caption),
        utils::MultipartPart::jpeg("photo", jpeg, "alert.jpg")
    };

    // Connection setup shares the overall budget with the upload
    auto response = utils::postMultipart(url, parts, timeoutMs_, timeoutMs_);
    if (response.isError()) {
        failedCount_++;
        return Result<void>::error(response.getErrorDetail());
    }

    auto outcome = parseSendPhotoResponse(response.getValue().statusCode, response.getValue().body);
    if (outcome.isError()) {
        failedCount_++;
        return outcome;
    }

    sentCount_++;
    LOG_INFO("TelegramAlertChannel", "Alert delivered to chat " + chatId_);
    return outcome;
}

Result<void> TelegramAlertChannel::parseSendPhotoResponse(long statusCode, const std::string& body) {
    nlohmann::json response;
    try {
        response = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error&) {
        return Result<void>::error(ErrorKind::MalformedResponse,
                                   "Telegram returned non-JSON body with status " + std::to_string(statusCode));
    }

    if (response.is_object() && response.contains("ok") && response["ok"].is_boolean() &&
        response["ok"].get<bool>() && statusCode >= 200 && statusCode < 300) {
        return Result<void>::success();
    }

    std::string description = "unknown error";
    if (response.is_object() && response.contains("description") && response["description"].is_string()) {
        description = response["description"].get<std::string>();
    }
    return Result<void>::error(ErrorKind::MalformedResponse,
                               "Telegram rejected alert (" + std::to_string(statusCode) + "): " + description);
}

Result<void> LogAlertChannel::sendAlert(const std::vector<unsigned char>& jpeg, const std::string& caption) {
    LOG_WARN("LogAlertChannel", caption + " (" + std::to_string(jpeg.size()) +
             " byte snapshot, no alert transport configured)");
    return Result<void>::success();
}

} // namespace facegate
