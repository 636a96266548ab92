#include "logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace facegate {

Logger::Logger()
    : level_(LogLevel::INFO) {
}

Logger::~Logger() {
    closeLogFile();
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::setLogLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::getLogLevel() const {
    return level_.load(std::memory_order_relaxed);
}

bool Logger::setOutputFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }

    std::filesystem::path directory = std::filesystem::path(filename).parent_path();
    if (!directory.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec) {
            std::cerr << "Cannot create log directory " << directory << ": " << ec.message() << std::endl;
            return false;
        }
    }

    logFile_.open(filename, std::ios::out | std::ios::app);
    return logFile_.is_open();
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(writeMutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

bool Logger::isEnabled(LogLevel level) const {
    LogLevel threshold = level_.load(std::memory_order_relaxed);
    return threshold != LogLevel::OFF && level != LogLevel::OFF && level >= threshold;
}

void Logger::log(LogLevel level, const std::string& source, const std::string& message) {
    if (!isEnabled(level)) {
        return;
    }

    std::ostringstream line;
    line << timestamp() << " [" << levelName(level) << "] [" << source << "] " << message;
    const std::string text = line.str();

    std::lock_guard<std::mutex> lock(writeMutex_);
    std::ostream& console = level >= LogLevel::ERROR ? std::cerr : std::cout;
    console << text << std::endl;

    if (logFile_.is_open()) {
        logFile_ << text << '\n';
        logFile_.flush();
    }
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default:              return "OFF  ";
    }
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm localTime{};
    localtime_r(&seconds, &localTime);

    std::ostringstream ss;
    ss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S") << '.'
       << std::setfill('0') << std::setw(3) << millis;
    return ss.str();
}

LogLevel parseLogLevel(const std::string& level) {
    std::string name = level;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "fatal") return LogLevel::FATAL;
    if (name == "off") return LogLevel::OFF;
    return LogLevel::INFO;
}

} // namespace facegate
