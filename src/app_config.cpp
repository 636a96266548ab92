#include "app_config.h"
#include "logger.h"
#include <cstdlib>
#include <cstring>
#include <fstream>

namespace facegate {

namespace {

template<typename T>
void readField(const nlohmann::json& section, const char* key, T& target) {
    if (!section.contains(key) || section[key].is_null()) {
        return;
    }
    target = section[key].get<T>();
}

const nlohmann::json& sectionOf(const nlohmann::json& config, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (config.contains(name) && config[name].is_object()) {
        return config[name];
    }
    return empty;
}

const char* envValue(const char* name) {
    const char* value = getenv(name);
    if (value && strlen(value) > 0) {
        return value;
    }
    return nullptr;
}

} // namespace

AppConfig::AppConfig() = default;

Result<AppConfig> AppConfig::fromJson(const nlohmann::json& config, const AppConfig& base) {
    if (!config.is_object()) {
        return Result<AppConfig>::error(ErrorKind::InvalidConfig, "Configuration root must be a JSON object");
    }

    AppConfig appConfig = base;

    try {
        const auto& source = sectionOf(config, "source");
        readField(source, "uri", appConfig.source.uri);
        readField(source, "frame_size", appConfig.source.frameSize);
        readField(source, "offer_every_n", appConfig.source.offerEveryN);

        const auto& inference = sectionOf(config, "inference");
        readField(inference, "server_url", appConfig.inference.serverUrl);
        readField(inference, "connect_timeout_ms", appConfig.inference.connectTimeoutMs);
        readField(inference, "detect_timeout_ms", appConfig.inference.detectTimeoutMs);
        readField(inference, "recognize_timeout_ms", appConfig.inference.recognizeTimeoutMs);
        readField(inference, "register_timeout_ms", appConfig.inference.registerTimeoutMs);
        readField(inference, "min_confidence", appConfig.inference.minConfidence);
        readField(inference, "crop_padding", appConfig.inference.cropPadding);
        readField(inference, "min_face_width", appConfig.inference.minFaceWidth);
        readField(inference, "jpeg_quality", appConfig.inference.jpegQuality);
        readField(inference, "take_timeout_ms", appConfig.inference.takeTimeoutMs);
        readField(inference, "reject_stale", appConfig.inference.rejectStale);

        const auto& actuation = sectionOf(config, "actuation");
        readField(actuation, "actuator_host", appConfig.actuation.actuatorHost);
        readField(actuation, "actuator_port", appConfig.actuation.actuatorPort);
        readField(actuation, "on_command", appConfig.actuation.onCommand);
        readField(actuation, "off_command", appConfig.actuation.offCommand);
        readField(actuation, "alert_cooldown_sec", appConfig.actuation.alertCooldownSec);
        readField(actuation, "log_cooldown_sec", appConfig.actuation.logCooldownSec);

        const auto& alert = sectionOf(config, "alert");
        readField(alert, "bot_token", appConfig.alert.botToken);
        readField(alert, "chat_id", appConfig.alert.chatId);
        readField(alert, "api_base_url", appConfig.alert.apiBaseUrl);
        readField(alert, "caption", appConfig.alert.caption);
        readField(alert, "timeout_ms", appConfig.alert.timeoutMs);

        const auto& audit = sectionOf(config, "audit");
        readField(audit, "db_path", appConfig.audit.dbPath);

        const auto& display = sectionOf(config, "display");
        readField(display, "enabled", appConfig.display.enabled);
        readField(display, "display_size", appConfig.display.displaySize);
        readField(display, "window_name", appConfig.display.windowName);
        readField(display, "status_interval_sec", appConfig.display.statusIntervalSec);

        const auto& registration = sectionOf(config, "registration");
        readField(registration, "user_id", appConfig.registration.userId);
        readField(registration, "samples", appConfig.registration.samples);
        readField(registration, "capture_cooldown_sec", appConfig.registration.captureCooldownSec);
        readField(registration, "image_dir", appConfig.registration.imageDir);

        const auto& tasks = sectionOf(config, "tasks");
        readField(tasks, "workers", appConfig.tasks.workers);
        readField(tasks, "max_pending", appConfig.tasks.maxPending);
    } catch (const nlohmann::json::exception& e) {
        return Result<AppConfig>::error(ErrorKind::InvalidConfig,
                                         "Failed to parse configuration: " + std::string(e.what()));
    }

    return Result<AppConfig>::success(std::move(appConfig));
}

Result<AppConfig> AppConfig::fromFile(const std::string& path, const AppConfig& base) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<AppConfig>::error(ErrorKind::IoError, "Cannot open configuration file: " + path);
    }

    nlohmann::json config;
    try {
        file >> config;
    } catch (const nlohmann::json::parse_error& e) {
        return Result<AppConfig>::error(ErrorKind::InvalidConfig,
                                         "Invalid JSON in " + path + ": " + e.what());
    }

    LOG_INFO("AppConfig", "Loaded configuration file: " + path);
    return fromJson(config, base);
}

nlohmann::json AppConfig::toJson() const {
    nlohmann::json config;

    config["source"] = {
        {"uri", source.uri},
        {"frame_size", source.frameSize},
        {"offer_every_n", source.offerEveryN}
    };

    config["inference"] = {
        {"server_url", inference.serverUrl},
        {"connect_timeout_ms", inference.connectTimeoutMs},
        {"detect_timeout_ms", inference.detectTimeoutMs},
        {"recognize_timeout_ms", inference.recognizeTimeoutMs},
        {"register_timeout_ms", inference.registerTimeoutMs},
        {"min_confidence", inference.minConfidence},
        {"crop_padding", inference.cropPadding},
        {"min_face_width", inference.minFaceWidth},
        {"jpeg_quality", inference.jpegQuality},
        {"take_timeout_ms", inference.takeTimeoutMs},
        {"reject_stale", inference.rejectStale}
    };

    config["actuation"] = {
        {"actuator_host", actuation.actuatorHost},
        {"actuator_port", actuation.actuatorPort},
        {"on_command", actuation.onCommand},
        {"off_command", actuation.offCommand},
        {"alert_cooldown_sec", actuation.alertCooldownSec},
        {"log_cooldown_sec", actuation.logCooldownSec}
    };

    // The bot token is a credential and is never echoed back
    config["alert"] = {
        {"chat_id", alert.chatId},
        {"api_base_url", alert.apiBaseUrl},
        {"caption", alert.caption},
        {"timeout_ms", alert.timeoutMs},
        {"configured", alert.isConfigured()}
    };

    config["audit"] = {
        {"db_path", audit.dbPath}
    };

    config["display"] = {
        {"enabled", display.enabled},
        {"display_size", display.displaySize},
        {"window_name", display.windowName},
        {"status_interval_sec", display.statusIntervalSec}
    };

    config["registration"] = {
        {"user_id", registration.userId},
        {"samples", registration.samples},
        {"capture_cooldown_sec", registration.captureCooldownSec},
        {"image_dir", registration.imageDir}
    };

    config["tasks"] = {
        {"workers", tasks.workers},
        {"max_pending", tasks.maxPending}
    };

    return config;
}

void AppConfig::applyEnvironment() {
    if (const char* serverUrl = envValue("AI_SERVER_URL")) {
        inference.serverUrl = serverUrl;
        LOG_INFO("AppConfig", "Using AI server URL from environment: " + inference.serverUrl);
    }

    if (const char* videoSource = envValue("VIDEO_SOURCE")) {
        source.uri = videoSource;
        LOG_INFO("AppConfig", "Using video source from environment");
    }

    if (const char* token = envValue("TELEGRAM_BOT_TOKEN")) {
        alert.botToken = token;
        LOG_INFO("AppConfig", "Using Telegram bot token from environment");
    }

    if (const char* chatId = envValue("TELEGRAM_CHAT_ID")) {
        alert.chatId = chatId;
        LOG_INFO("AppConfig", "Using Telegram chat id from environment: " + alert.chatId);
    }

    if (const char* actuatorAddr = envValue("ACTUATOR_ADDR")) {
        std::string addr(actuatorAddr);
        auto colon = addr.rfind(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 >= addr.size()) {
            LOG_WARN("AppConfig", "Ignoring ACTUATOR_ADDR, expected host:port but got: " + addr);
        } else {
            try {
                int port = std::stoi(addr.substr(colon + 1));
                actuation.actuatorHost = addr.substr(0, colon);
                actuation.actuatorPort = port;
                LOG_INFO("AppConfig", "Using actuator address from environment: " + addr);
            } catch (const std::exception&) {
                LOG_WARN("AppConfig", "Ignoring ACTUATOR_ADDR with invalid port: " + addr);
            }
        }
    }
}

Result<void> AppConfig::validate() const {
    auto fail = [](const std::string& msg) {
        return Result<void>::error(ErrorKind::InvalidConfig, msg);
    };

    if (source.uri.empty()) return fail("source.uri must not be empty");
    if (source.frameSize <= 0) return fail("source.frame_size must be positive");
    if (source.offerEveryN <= 0) return fail("source.offer_every_n must be positive");

    if (inference.serverUrl.empty()) return fail("inference.server_url must not be empty");
    if (inference.connectTimeoutMs <= 0) return fail("inference.connect_timeout_ms must be positive");
    if (inference.detectTimeoutMs <= 0) return fail("inference.detect_timeout_ms must be positive");
    if (inference.recognizeTimeoutMs <= 0) return fail("inference.recognize_timeout_ms must be positive");
    if (inference.registerTimeoutMs <= 0) return fail("inference.register_timeout_ms must be positive");
    if (inference.minConfidence < 0.0 || inference.minConfidence > 1.0) {
        return fail("inference.min_confidence must be within [0, 1]");
    }
    if (inference.cropPadding < 0) return fail("inference.crop_padding must not be negative");
    if (inference.minFaceWidth < 0) return fail("inference.min_face_width must not be negative");
    if (inference.jpegQuality < 1 || inference.jpegQuality > 100) {
        return fail("inference.jpeg_quality must be within [1, 100]");
    }
    if (inference.takeTimeoutMs <= 0) return fail("inference.take_timeout_ms must be positive");

    if (actuation.actuatorHost.empty()) return fail("actuation.actuator_host must not be empty");
    if (actuation.actuatorPort <= 0 || actuation.actuatorPort > 65535) {
        return fail("actuation.actuator_port must be within [1, 65535]");
    }
    if (actuation.alertCooldownSec <= 0.0) return fail("actuation.alert_cooldown_sec must be positive");
    if (actuation.logCooldownSec <= 0.0) return fail("actuation.log_cooldown_sec must be positive");

    if (alert.timeoutMs <= 0) return fail("alert.timeout_ms must be positive");
    if (audit.dbPath.empty()) return fail("audit.db_path must not be empty");
    if (display.displaySize <= 0) return fail("display.display_size must be positive");
    if (display.statusIntervalSec <= 0) return fail("display.status_interval_sec must be positive");

    if (registration.samples <= 0) return fail("registration.samples must be positive");
    if (registration.captureCooldownSec <= 0.0) return fail("registration.capture_cooldown_sec must be positive");

    if (tasks.workers <= 0) return fail("tasks.workers must be positive");
    if (tasks.maxPending <= 0) return fail("tasks.max_pending must be positive");

    return Result<void>::success();
}

} // namespace facegate
