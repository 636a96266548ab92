#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "result.h"

namespace facegate {

/**
 * @brief Complete runtime configuration of the recognition pipeline
 *
 * Values are layered: built-in defaults, then a JSON config file, then
 * command line options, then environment variables (highest precedence).
 */
class AppConfig {
public:
    struct SourceConfig {
        std::string uri = "0";         ///< Camera index or stream URL
        int frameSize = 640;           ///< Side of the square working frame
        int offerEveryN = 2;           ///< Hand every Nth frame to inference
    };

    struct InferenceConfig {
        std::string serverUrl = "http://localhost:32168/v1";
        int connectTimeoutMs = 1000;
        int detectTimeoutMs = 3000;
        int recognizeTimeoutMs = 4000;
        int registerTimeoutMs = 2500;
        double minConfidence = 0.60;
        int cropPadding = 20;
        int minFaceWidth = 40;
        int jpegQuality = 90;
        int takeTimeoutMs = 100;       ///< Worker wait for a frame before re-checking shutdown
        bool rejectStale = false;      ///< Sequence-id gating on cache publication
    };

    struct ActuationConfig {
        std::string actuatorHost = "127.0.0.1";
        int actuatorPort = 5005;
        std::string onCommand = "ON";
        std::string offCommand = "OFF";
        double alertCooldownSec = 15.0;
        double logCooldownSec = 3.0;
    };

    struct AlertConfig {
        std::string botToken;
        std::string chatId;
        std::string apiBaseUrl = "https://api.telegram.org";
        std::string caption = "Alert: Unknown Face Detected!";
        int timeoutMs = 10000;

        bool isConfigured() const { return !botToken.empty() && !chatId.empty(); }
    };

    struct AuditConfig {
        std::string dbPath = "./data/audit.db";
    };

    struct DisplayConfig {
        bool enabled = true;
        int displaySize = 800;
        std::string windowName = "facegate";
        int statusIntervalSec = 30;
    };

    struct RegistrationConfig {
        std::string userId;
        int samples = 10;
        double captureCooldownSec = 0.8;
        std::string imageDir = "images";
    };

    struct TaskConfig {
        int workers = 2;
        int maxPending = 64;
    };

    AppConfig();

    /**
     * @brief Build a configuration from JSON, starting from @p base
     *
     * Missing keys keep the value from @p base.
     *
     * @param config JSON object with optional section objects
     * @param base Values used for keys that are absent
     * @return Result<AppConfig> Parsed configuration or a parse error
     */
    static Result<AppConfig> fromJson(const nlohmann::json& config, const AppConfig& base = AppConfig());

    /**
     * @brief Load and parse a JSON configuration file
     *
     * @param path File path
     * @param base Values used for keys that are absent from the file
     * @return Result<AppConfig> Parsed configuration or an IO/parse error
     */
    static Result<AppConfig> fromFile(const std::string& path, const AppConfig& base = AppConfig());

    nlohmann::json toJson() const;

    /**
     * @brief Apply environment overrides
     *
     * Reads AI_SERVER_URL, VIDEO_SOURCE, TELEGRAM_BOT_TOKEN, TELEGRAM_CHAT_ID
     * and ACTUATOR_ADDR (host:port).
     */
    void applyEnvironment();

    /**
     * @brief Check value ranges
     *
     * @return Result<void> Error naming the first invalid field
     */
    Result<void> validate() const;

    SourceConfig source;
    InferenceConfig inference;
    ActuationConfig actuation;
    AlertConfig alert;
    AuditConfig audit;
    DisplayConfig display;
    RegistrationConfig registration;
    TaskConfig tasks;
};

} // namespace facegate
