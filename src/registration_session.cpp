#include "registration_session.h"
#include "utils/image_utils.h"
#include "logger.h"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace facegate {

RegistrationSession::RegistrationSession(std::shared_ptr<InferenceClient> client,
                                         BackgroundTaskManager& tasks,
                                         Options options)
    : client_(std::move(client)),
      tasks_(tasks),
      options_(std::move(options)),
      registered_(std::make_shared<std::atomic<int>>(0)) {
}

Result<void> RegistrationSession::prepare() {
    if (options_.userId.empty()) {
        return Result<void>::error(ErrorKind::InvalidConfig, "A user name is required for registration");
    }
    if (options_.userId.find_first_of("/\\") != std::string::npos) {
        return Result<void>::error(ErrorKind::InvalidConfig, "User name must not contain path separators");
    }
    if (!client_) {
        return Result<void>::error(ErrorKind::InvalidConfig, "No inference client configured");
    }

    try {
        std::filesystem::create_directories(options_.imageDir);
    } catch (const std::filesystem::filesystem_error& e) {
        return Result<void>::error(ErrorKind::IoError,
                                   "Cannot create image directory " + options_.imageDir + ": " + e.what());
    }

    LOG_INFO("RegistrationSession", "Registering " + options_.userId + ", " + std::to_string(options_.samples) +
             " samples into " + options_.imageDir);
    return Result<void>::success();
}

std::string RegistrationSession::sampleFileName(const std::string& userId, const std::tm& localTime, int index) {
    std::ostringstream name;
    name << userId << "_" << std::put_time(&localTime, "%Y%m%d_%H%M%S") << "_" << index << ".jpg";
    return name.str();
}

bool RegistrationSession::onFrame(const Frame& frame,
                                  const std::shared_ptr<const ResultSet>& latest,
                                  Clock::time_point now) {
    if (isComplete() || !latest || latest->hasError() || latest->faces.size() != 1 || frame.empty()) {
        return false;
    }
    if (lastCapture_ && now - *lastCapture_ < options_.captureCooldown) {
        return false;
    }

    auto jpeg = utils::encodeJpeg(frame.image, options_.jpegQuality);
    if (jpeg.isError()) {
        LOG_WARN("RegistrationSession", "Skipping sample: " + jpeg.getError());
        return false;
    }

    auto wallNow = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm localTime{};
    localtime_r(&wallNow, &localTime);

    int index = captured_ + 1;
    std::filesystem::path path = std::filesystem::path(options_.imageDir) /
                                 sampleFileName(options_.userId, localTime, index);

    auto client = client_;
    auto registered = registered_;
    std::string userId = options_.userId;
    std::vector<unsigned char> bytes = jpeg.moveValue();

    std::string taskId = tasks_.submitTask("register", [client, registered, userId, path, bytes]() {
        std::ofstream out(path, std::ios::binary);
        if (!out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()))) {
            LOG_ERROR("RegistrationSession", "Failed to save sample " + path.string());
        } else {
            LOG_INFO("RegistrationSession", "Saved " + path.string());
        }

        auto result = client->registerFace(bytes, userId);
        if (result.isError()) {
            LOG_ERROR("RegistrationSession", "Register " + userId + " failed: " + result.getErrorDetail().toString());
            return false;
        }

        int total = ++(*registered);
        LOG_INFO("RegistrationSession", "Registered sample " + std::to_string(total) + " for " + userId);
        return true;
    });

    if (taskId.empty()) {
        LOG_WARN("RegistrationSession", "Sample " + std::to_string(index) + " was not queued");
        return false;
    }

    lastCapture_ = now;
    captured_ = index;

    if (isComplete()) {
        LOG_INFO("RegistrationSession", "Captured " + std::to_string(captured_) + " samples for " + options_.userId);
    }
    return true;
}

void RegistrationSession::drawStatus(cv::Mat& display, const OverlayRenderer& overlay,
                                     const std::shared_ptr<const ResultSet>& latest) const {
    overlay.drawStatusLine(display, "Registering: " + options_.userId + " | Saved: " +
                           std::to_string(captured_) + "/" + std::to_string(options_.samples) + " | q=Quit",
                           0, cv::Scalar(255, 255, 255));

    if (!latest) {
        return;
    }

    if (latest->hasError()) {
        overlay.drawStatusLine(display, "Detect error: " + latest->error->message, 1, OverlayRenderer::kUnknownColor);
    } else if (latest->faces.size() != 1) {
        overlay.drawStatusLine(display, "Show ONLY ONE face clearly!", 1, OverlayRenderer::kUnknownColor);
    } else {
        overlay.drawStatusLine(display, "OK: 1 face detected (auto capture soon)", 1, OverlayRenderer::kKnownColor);
    }
}

nlohmann::json RegistrationSession::getStatus() const {
    nlohmann::json status;
    status["user_id"] = options_.userId;
    status["target_samples"] = options_.samples;
    status["captured"] = captured_;
    status["registered"] = registered_->load();
    status["complete"] = isComplete();
    return status;
}

} // namespace facegate
