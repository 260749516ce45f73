#include "logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <filesystem>

namespace zwatch {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

LogLevel stringToLogLevel(const std::string& level) {
    const std::string name = toLower(level);
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "fatal") return LogLevel::FATAL;
    if (name == "off") return LogLevel::OFF;
    return LogLevel::INFO;
}

bool isValidLogLevel(const std::string& level) {
    static const char* names[] = {"trace", "debug", "info", "warn", "warning", "error", "fatal", "off"};
    const std::string name = toLower(level);
    return std::any_of(std::begin(names), std::end(names),
                       [&name](const char* candidate) { return name == candidate; });
}

Logger::Logger()
    : currentLevel_(LogLevel::INFO),
      consoleLogging_(true) {
}

Logger::~Logger() {
    closeLogFile();
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::setLogLevel(LogLevel level) {
    currentLevel_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::getLogLevel() const {
    return currentLevel_.load(std::memory_order_relaxed);
}

bool Logger::setOutputFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(logMutex_);

    if (logFile_.is_open()) {
        logFile_.close();
    }

    std::filesystem::path directory = std::filesystem::path(filename).parent_path();
    if (!directory.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec) {
            std::cerr << "Failed to create log directory " << directory << ": " << ec.message() << std::endl;
            return false;
        }
    }

    logFile_.open(filename, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        return false;
    }

    return true;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::enableConsoleLogging(bool enable) {
    consoleLogging_.store(enable, std::memory_order_relaxed);
}

void Logger::log(LogLevel level, const std::string& source, const std::string& message) {
    const LogLevel threshold = currentLevel_.load(std::memory_order_relaxed);
    if (threshold == LogLevel::OFF || level < threshold) {
        return;
    }

    std::stringstream logStream;
    logStream << getCurrentTimestamp() << " ["
              << levelToString(level) << "] ["
              << source << "] "
              << message;

    const std::string logMessage = logStream.str();

    std::lock_guard<std::mutex> lock(logMutex_);

    if (consoleLogging_.load(std::memory_order_relaxed)) {
        if (level >= LogLevel::ERROR) {
            std::cerr << logMessage << std::endl;
        } else {
            std::cout << logMessage << std::endl;
        }
    }

    if (logFile_.is_open()) {
        logFile_ << logMessage << '\n';
        logFile_.flush();
    }
}

void Logger::trace(const std::string& source, const std::string& message) {
    log(LogLevel::TRACE, source, message);
}

void Logger::debug(const std::string& source, const std::string& message) {
    log(LogLevel::DEBUG, source, message);
}

void Logger::info(const std::string& source, const std::string& message) {
    log(LogLevel::INFO, source, message);
}

void Logger::warn(const std::string& source, const std::string& message) {
    log(LogLevel::WARN, source, message);
}

void Logger::error(const std::string& source, const std::string& message) {
    log(LogLevel::ERROR, source, message);
}

void Logger::fatal(const std::string& source, const std::string& message) {
    log(LogLevel::FATAL, source, message);
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF  ";
        default:              return "UNKN ";
    }
}

std::string Logger::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto nowTimeT = std::chrono::system_clock::to_time_t(now);
    auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm localTime{};
    localtime_r(&nowTimeT, &localTime);

    std::stringstream ss;
    ss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << nowMs.count();

    return ss.str();
}

} // namespace zwatch
