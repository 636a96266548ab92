#include "pipeline.h"
#include "utils/image_utils.h"
#include "logger.h"
#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

namespace facegate {

namespace {

std::chrono::milliseconds secondsToMs(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

} // namespace

Pipeline::Pipeline(const AppConfig& config, Mode mode, Dependencies deps)
    : config_(config),
      mode_(mode),
      deps_(std::move(deps)),
      cache_(config.inference.rejectStale),
      tasks_(static_cast<size_t>(config.tasks.workers), static_cast<size_t>(config.tasks.maxPending)) {

    InferenceWorker::Options workerOptions;
    workerOptions.minConfidence = config_.inference.minConfidence;
    workerOptions.cropPadding = config_.inference.cropPadding;
    workerOptions.minFaceWidth = config_.inference.minFaceWidth;
    workerOptions.jpegQuality = config_.inference.jpegQuality;
    workerOptions.takeTimeout = std::chrono::milliseconds(config_.inference.takeTimeoutMs);
    workerOptions.detectOnly = (mode_ == Mode::Registration);

    worker_ = std::make_unique<InferenceWorker>("inference_worker", handoff_, cache_, deps_.client, workerOptions);

    if (mode_ == Mode::Recognition) {
        ActuationController::Options controllerOptions;
        controllerOptions.alertCooldown = secondsToMs(config_.actuation.alertCooldownSec);
        controllerOptions.logCooldown = secondsToMs(config_.actuation.logCooldownSec);
        controllerOptions.alertCaption = config_.alert.caption;
        controllerOptions.snapshotJpegQuality = config_.inference.jpegQuality;

        controller_ = std::make_unique<ActuationController>(deps_.actuator, deps_.alert, deps_.auditLog,
                                                            tasks_, controllerOptions);
    } else {
        RegistrationSession::Options sessionOptions;
        sessionOptions.userId = config_.registration.userId;
        sessionOptions.samples = config_.registration.samples;
        sessionOptions.captureCooldown = secondsToMs(config_.registration.captureCooldownSec);
        sessionOptions.imageDir = config_.registration.imageDir;
        sessionOptions.jpegQuality = config_.inference.jpegQuality;

        registration_ = std::make_unique<RegistrationSession>(deps_.client, tasks_, sessionOptions);
    }
}

Pipeline::~Pipeline() {
    stop();
}

Pipeline::Dependencies Pipeline::createDefaultDependencies(const AppConfig& config, Mode mode) {
    Dependencies deps;
    deps.source = std::make_shared<OpenCvVideoSource>("video_source", config.source.uri);

    CodeProjectFaceClient::Options clientOptions;
    clientOptions.serverUrl = config.inference.serverUrl;
    clientOptions.connectTimeoutMs = config.inference.connectTimeoutMs;
    clientOptions.detectTimeoutMs = config.inference.detectTimeoutMs;
    clientOptions.recognizeTimeoutMs = config.inference.recognizeTimeoutMs;
    clientOptions.registerTimeoutMs = config.inference.registerTimeoutMs;
    clientOptions.minConfidence = config.inference.minConfidence;
    deps.client = std::make_shared<CodeProjectFaceClient>(clientOptions);

    if (mode == Mode::Recognition) {
        deps.actuator = std::make_shared<UdpActuatorChannel>("actuator",
                                                             config.actuation.actuatorHost,
                                                             config.actuation.actuatorPort,
                                                             config.actuation.onCommand,
                                                             config.actuation.offCommand);

        if (config.alert.isConfigured()) {
            deps.alert = std::make_shared<TelegramAlertChannel>("telegram_alert",
                                                                config.alert.botToken,
                                                                config.alert.chatId,
                                                                config.alert.apiBaseUrl,
                                                                config.alert.timeoutMs);
        } else {
            LOG_WARN("Pipeline", "Telegram credentials not set, alerts will only be logged");
            deps.alert = std::make_shared<LogAlertChannel>("log_alert");
        }

        deps.auditLog = std::make_shared<SqliteAuditLog>("audit_log", config.audit.dbPath);
    }
    return deps;
}

Result<void> Pipeline::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (started_) {
        return Result<void>::success();
    }

    if (!deps_.source || !deps_.client) {
        return Result<void>::error(ErrorKind::InvalidConfig, "Pipeline needs a frame source and an inference client");
    }

    if (registration_) {
        auto prepared = registration_->prepare();
        if (prepared.isError()) {
            return prepared;
        }
    }

    if (!deps_.source->start()) {
        return Result<void>::error(ErrorKind::SourceUnavailable,
                                   "Cannot open video source " + deps_.source->getId());
    }

    // Sink failures degrade the pipeline but do not stop it; each failed
    // delivery is reported when it happens.
    if (deps_.actuator && !deps_.actuator->start()) {
        LOG_ERROR("Pipeline", "Actuator channel failed to start, commands will fail");
    }
    if (deps_.alert && !deps_.alert->start()) {
        LOG_ERROR("Pipeline", "Alert channel failed to start, alerts will fail");
    }
    if (deps_.auditLog && !deps_.auditLog->start()) {
        LOG_ERROR("Pipeline", "Audit log failed to start, records will be lost");
    }

    if (!worker_->start()) {
        deps_.source->stop();
        return Result<void>::error(ErrorKind::InvalidConfig, "Inference worker failed to start");
    }

    lastStatusLog_ = std::chrono::steady_clock::now();
    started_ = true;
    LOG_INFO("Pipeline", std::string("Pipeline started in ") +
             (mode_ == Mode::Recognition ? "recognition" : "registration") + " mode");
    return Result<void>::success();
}

void Pipeline::requestShutdown() {
    shutdownRequested_.store(true);
}

bool Pipeline::runOnce() {
    if (shutdownRequested_) {
        return false;
    }

    auto frameResult = deps_.source->read();
    if (frameResult.isError()) {
        if (frameResult.getErrorKind() == ErrorKind::EmptyFrame) {
            emptyFrames_++;
            return !shutdownRequested_;
        }
        LOG_ERROR("Pipeline", "Frame source failed: " + frameResult.getErrorDetail().toString());
        exitCode_ = 1;
        requestShutdown();
        return false;
    }

    Frame frame = frameResult.moveValue();
    frame.image = utils::centerSquare(frame.image, config_.source.frameSize);

    uint64_t index = ++frames_;
    if (config_.source.offerEveryN <= 1 || index % static_cast<uint64_t>(config_.source.offerEveryN) == 0) {
        handoff_.offer(frame);
    }

    auto now = std::chrono::steady_clock::now();
    auto latest = cache_.read();

    if (controller_) {
        controller_->evaluateIfNew(latest, now);
    }
    if (registration_) {
        registration_->onFrame(frame, latest, now);
        if (registration_->isComplete()) {
            LOG_INFO("Pipeline", "Registration complete");
            requestShutdown();
        }
    }

    cv::Mat display = frame.image.clone();
    overlay_.drawTimestamp(display);
    if (latest) {
        overlay_.drawResults(display, *latest);
        if (latest->hasError() && !registration_) {
            overlay_.drawErrorBanner(display, *latest->error);
        }
    }
    if (registration_) {
        registration_->drawStatus(display, overlay_, latest);
    }

    if (!present(display)) {
        requestShutdown();
    }

    logStatusIfDue(now);
    return !shutdownRequested_;
}

bool Pipeline::present(cv::Mat& display) {
    if (!config_.display.enabled) {
        return true;
    }

    cv::Mat scaled;
    cv::resize(display, scaled, cv::Size(config_.display.displaySize, config_.display.displaySize));
    cv::imshow(config_.display.windowName, scaled);
    windowOpen_ = true;

    int key = cv::waitKey(1) & 0xFF;
    if (key == 'q' || key == 27) {
        LOG_INFO("Pipeline", "Quit requested from keyboard");
        return false;
    }
    return true;
}

void Pipeline::logStatusIfDue(std::chrono::steady_clock::time_point now) {
    if (config_.display.statusIntervalSec <= 0) {
        return;
    }
    if (now - lastStatusLog_ < std::chrono::seconds(config_.display.statusIntervalSec)) {
        return;
    }
    lastStatusLog_ = now;
    LOG_INFO("Pipeline", "Status: " + getStatus().dump());
}

int Pipeline::run() {
    while (runOnce()) {
    }
    stop();
    return exitCode_;
}

void Pipeline::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!started_ || stopped_) {
        return;
    }
    stopped_ = true;
    requestShutdown();

    LOG_INFO("Pipeline", "Shutting down");

    handoff_.close();
    worker_->stop();

    // Pending alert, log and register tasks still run before the sinks close
    tasks_.shutdown();

    if (deps_.actuator) {
        deps_.actuator->stop();
    }
    if (deps_.alert) {
        deps_.alert->stop();
    }
    if (deps_.auditLog) {
        deps_.auditLog->stop();
    }
    deps_.source->stop();

    if (windowOpen_) {
        cv::destroyAllWindows();
        windowOpen_ = false;
    }

    LOG_INFO("Pipeline", "Final status: " + getStatus().dump());
}

nlohmann::json Pipeline::getStatus() const {
    nlohmann::json status;
    status["mode"] = mode_ == Mode::Recognition ? "recognition" : "registration";
    status["frames"] = frames_.load();
    status["empty_frames"] = emptyFrames_.load();
    status["handoff"] = {
        {"offered", handoff_.getOfferedCount()},
        {"consumed", handoff_.getConsumedCount()},
        {"dropped", handoff_.getDroppedCount()}
    };
    status["results"] = {
        {"generation", cache_.getGeneration()},
        {"rejected", cache_.getRejectedCount()}
    };
    status["source"] = deps_.source ? deps_.source->getStatus() : nlohmann::json();
    status["inference"] = worker_->getStatus();
    status["tasks"] = tasks_.getStatus();
    if (controller_) {
        status["actuation"] = controller_->getStatus();
    }
    if (registration_) {
        status["registration"] = registration_->getStatus();
    }
    return status;
}

} // namespace facegate
