#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <string>

namespace facegate {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL,
    OFF
};

/**
 * @brief Process-wide logger shared by the render loop, the inference worker
 * and the background tasks
 *
 * Lines are written as "YYYY-MM-DD HH:MM:SS.mmm [LEVEL] [Source] message" to
 * the console (ERROR and FATAL on stderr) and, when configured, appended to a
 * log file.
 */
class Logger {
public:
    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    /**
     * @brief Append all further output to @p filename
     *
     * The parent directory is created when missing.
     *
     * @param filename Path to the log file
     * @return true if the file is open for appending
     */
    bool setOutputFile(const std::string& filename);

    void closeLogFile();

    /**
     * @brief Whether a message at @p level passes the current threshold
     */
    bool isEnabled(LogLevel level) const;

    /**
     * @brief Format and emit one line
     *
     * @param level Severity
     * @param source Component or class emitting the message
     * @param message Text to log
     */
    void log(LogLevel level, const std::string& source, const std::string& message);

    static const char* levelName(LogLevel level);

    ~Logger();

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string timestamp();

    std::atomic<LogLevel> level_;
    std::ofstream logFile_;
    std::mutex writeMutex_;
};

/**
 * @brief Parse a log level name (trace, debug, info, warn, error, fatal, off)
 *
 * @param level Level name, case-insensitive
 * @return LogLevel Parsed level, INFO when the name is not recognised
 */
LogLevel parseLogLevel(const std::string& level);

} // namespace facegate

// The message expression is only evaluated when the level is enabled
#define FACEGATE_LOG(level, source, message)                                      \
    do {                                                                          \
        auto& facegateLogger_ = facegate::Logger::getInstance();                  \
        if (facegateLogger_.isEnabled(level)) {                                   \
            facegateLogger_.log(level, source, message);                          \
        }                                                                         \
    } while (0)

#define LOG_TRACE(source, message) FACEGATE_LOG(facegate::LogLevel::TRACE, source, message)
#define LOG_DEBUG(source, message) FACEGATE_LOG(facegate::LogLevel::DEBUG, source, message)
#define LOG_INFO(source, message) FACEGATE_LOG(facegate::LogLevel::INFO, source, message)
#define LOG_WARN(source, message) FACEGATE_LOG(facegate::LogLevel::WARN, source, message)
#define LOG_ERROR(source, message) FACEGATE_LOG(facegate::LogLevel::ERROR, source, message)
#define LOG_FATAL(source, message) FACEGATE_LOG(facegate::LogLevel::FATAL, source, message)
