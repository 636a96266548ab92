#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "app_config.h"
#include "logger.h"
#include "test_support.h"

using namespace facegate;
using facegate::test::uniqueTempPath;

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~ScopedEnv() {
        unsetenv(name_);
    }

private:
    const char* name_;
};

} // namespace

TEST(AppConfigTest, DefaultsAreValid) {
    AppConfig config;

    EXPECT_TRUE(config.validate().isSuccess());
    EXPECT_EQ(config.source.uri, "0");
    EXPECT_EQ(config.source.frameSize, 640);
    EXPECT_EQ(config.inference.serverUrl, "http://localhost:32168/v1");
    EXPECT_DOUBLE_EQ(config.inference.minConfidence, 0.60);
    EXPECT_EQ(config.inference.detectTimeoutMs, 3000);
    EXPECT_EQ(config.inference.recognizeTimeoutMs, 4000);
    EXPECT_EQ(config.actuation.actuatorPort, 5005);
    EXPECT_DOUBLE_EQ(config.actuation.alertCooldownSec, 15.0);
    EXPECT_DOUBLE_EQ(config.actuation.logCooldownSec, 3.0);
    EXPECT_FALSE(config.alert.isConfigured());
    EXPECT_FALSE(config.inference.rejectStale);
}

TEST(AppConfigTest, JsonOverridesOnlyGivenKeys) {
    nlohmann::json json = {
        {"source", {{"uri", "rtsp://camera.local/stream"}}},
        {"inference", {{"min_confidence", 0.75}, {"reject_stale", true}}},
        {"actuation", {{"alert_cooldown_sec", 30}}},
        {"tasks", {{"workers", 4}}}
    };

    auto result = AppConfig::fromJson(json);

    ASSERT_TRUE(result.isSuccess()) << result.getError();
    const auto& config = result.getValue();
    EXPECT_EQ(config.source.uri, "rtsp://camera.local/stream");
    EXPECT_EQ(config.source.frameSize, 640);
    EXPECT_DOUBLE_EQ(config.inference.minConfidence, 0.75);
    EXPECT_TRUE(config.inference.rejectStale);
    EXPECT_DOUBLE_EQ(config.actuation.alertCooldownSec, 30.0);
    EXPECT_DOUBLE_EQ(config.actuation.logCooldownSec, 3.0);
    EXPECT_EQ(config.tasks.workers, 4);
}

TEST(AppConfigTest, JsonStartsFromBase) {
    AppConfig base;
    base.audit.dbPath = "/var/lib/facegate/audit.db";

    auto result = AppConfig::fromJson({{"display", {{"enabled", false}}}}, base);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.getValue().audit.dbPath, "/var/lib/facegate/audit.db");
    EXPECT_FALSE(result.getValue().display.enabled);
}

TEST(AppConfigTest, WrongTypesAreInvalidConfig) {
    auto wrongType = AppConfig::fromJson({{"source", {{"frame_size", "large"}}}});
    ASSERT_TRUE(wrongType.isError());
    EXPECT_EQ(wrongType.getErrorKind(), ErrorKind::InvalidConfig);

    auto notObject = AppConfig::fromJson(nlohmann::json::array());
    ASSERT_TRUE(notObject.isError());
    EXPECT_EQ(notObject.getErrorKind(), ErrorKind::InvalidConfig);
}

TEST(AppConfigTest, ValidateRejectsOutOfRangeValues) {
    AppConfig config;
    config.inference.minConfidence = 1.5;
    EXPECT_TRUE(config.validate().isError());

    config = AppConfig();
    config.actuation.alertCooldownSec = 0;
    auto result = config.validate();
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.getError().find("alert_cooldown_sec"), std::string::npos);

    config = AppConfig();
    config.actuation.actuatorPort = 70000;
    EXPECT_TRUE(config.validate().isError());

    config = AppConfig();
    config.inference.detectTimeoutMs = -1;
    EXPECT_TRUE(config.validate().isError());

    config = AppConfig();
    config.source.uri.clear();
    EXPECT_TRUE(config.validate().isError());
}

TEST(AppConfigTest, ToJsonNeverIncludesBotToken) {
    AppConfig config;
    config.alert.botToken = "123456:secret";
    config.alert.chatId = "-100200300";

    auto json = config.toJson();

    EXPECT_FALSE(json["alert"].contains("bot_token"));
    EXPECT_EQ(json["alert"]["chat_id"], "-100200300");
    EXPECT_TRUE(json["alert"]["configured"].get<bool>());
    EXPECT_EQ(json.dump().find("secret"), std::string::npos);
}

TEST(AppConfigTest, EnvironmentOverridesEverything) {
    ScopedEnv server("AI_SERVER_URL", "http://gpu-box:32168/v1");
    ScopedEnv source("VIDEO_SOURCE", "rtsp://door/stream");
    ScopedEnv token("TELEGRAM_BOT_TOKEN", "42:abc");
    ScopedEnv chat("TELEGRAM_CHAT_ID", "777");
    ScopedEnv actuator("ACTUATOR_ADDR", "192.168.1.50:6000");

    AppConfig config;
    config.inference.serverUrl = "http://from-file/v1";
    config.applyEnvironment();

    EXPECT_EQ(config.inference.serverUrl, "http://gpu-box:32168/v1");
    EXPECT_EQ(config.source.uri, "rtsp://door/stream");
    EXPECT_TRUE(config.alert.isConfigured());
    EXPECT_EQ(config.actuation.actuatorHost, "192.168.1.50");
    EXPECT_EQ(config.actuation.actuatorPort, 6000);
}

TEST(AppConfigTest, MalformedActuatorAddressIsIgnored) {
    ScopedEnv actuator("ACTUATOR_ADDR", "no-port-here");

    AppConfig config;
    config.applyEnvironment();

    EXPECT_EQ(config.actuation.actuatorHost, "127.0.0.1");
    EXPECT_EQ(config.actuation.actuatorPort, 5005);
}

TEST(AppConfigTest, LoadsFromFile) {
    auto path = uniqueTempPath("facegate_config").string() + ".json";
    {
        std::ofstream out(path);
        out << R"({"audit": {"db_path": "/tmp/facegate-test.db"}, "registration": {"samples": 5}})";
    }

    auto result = AppConfig::fromFile(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(result.isSuccess()) << result.getError();
    EXPECT_EQ(result.getValue().audit.dbPath, "/tmp/facegate-test.db");
    EXPECT_EQ(result.getValue().registration.samples, 5);
}

TEST(AppConfigTest, MissingOrBrokenFileIsReported) {
    auto missing = AppConfig::fromFile("/nonexistent/facegate.json");
    ASSERT_TRUE(missing.isError());
    EXPECT_EQ(missing.getErrorKind(), ErrorKind::IoError);

    auto path = uniqueTempPath("facegate_broken").string() + ".json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    auto broken = AppConfig::fromFile(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(broken.isError());
    EXPECT_EQ(broken.getErrorKind(), ErrorKind::InvalidConfig);
}

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::TRACE);
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::OFF);
    EXPECT_EQ(parseLogLevel("verbose"), LogLevel::INFO);
}

TEST(LoggerTest, LevelFiltersMessages) {
    auto& logger = Logger::getInstance();
    LogLevel previous = logger.getLogLevel();

    logger.setLogLevel(LogLevel::WARN);
    EXPECT_FALSE(logger.isEnabled(LogLevel::INFO));
    EXPECT_TRUE(logger.isEnabled(LogLevel::ERROR));

    logger.setLogLevel(LogLevel::OFF);
    EXPECT_FALSE(logger.isEnabled(LogLevel::FATAL));

    logger.setLogLevel(previous);
}
