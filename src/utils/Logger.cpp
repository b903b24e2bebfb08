#include "Logger.hpp"
#include <iostream>
#include <iomanip>
#include <fstream>
#include <ctime>
#include <chrono>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <unistd.h>

namespace hotmacro {

struct Logger::Impl {
    std::ofstream logFile;
    std::string currentFilename;
};

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : pImpl(std::make_unique<Impl>())
    , currentLevel(LOG_INFO) {
    // No colors when stderr is redirected
    coloredOutput = isatty(STDERR_FILENO) != 0;
}

Logger::~Logger() {
    if (pImpl->logFile.is_open()) {
        pImpl->logFile.close();
    }
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex);
    if (pImpl->logFile.is_open()) {
        pImpl->logFile.close();
    }
    pImpl->logFile.open(filename, std::ios::app);
    pImpl->currentFilename = filename;
    if (!pImpl->logFile.is_open()) {
        std::cerr << "Logger: could not open log file " << filename << std::endl;
    }
}

void Logger::setLogLevel(Level level) {
    std::lock_guard<std::mutex> lock(mutex);
    currentLevel = level;
}

Logger::Level Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex);
    return currentLevel;
}

bool Logger::parseLevel(const std::string& name, Level& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") { out = LOG_DEBUG; return true; }
    if (lower == "info") { out = LOG_INFO; return true; }
    if (lower == "warning" || lower == "warn") { out = LOG_WARNING; return true; }
    if (lower == "error") { out = LOG_ERROR; return true; }
    if (lower == "fatal") { out = LOG_FATAL; return true; }
    return false;
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex);
    if (level < currentLevel) return;

    std::string logMessage = getCurrentTimestamp() + " [" + getLevelString(level) + "] " + message + "\n";

    if (pImpl->logFile.is_open()) {
        pImpl->logFile << logMessage;
        pImpl->logFile.flush();
    }

    if (coloredOutput) {
        std::cerr << getColorCode(level) << logMessage << resetColorCode();
    } else {
        std::cerr << logMessage;
    }
}

std::string Logger::getLevelString(Level level) const {
    switch (level) {
        case LOG_DEBUG: return "DEBUG";
        case LOG_INFO: return "INFO";
        case LOG_WARNING: return "WARNING";
        case LOG_ERROR: return "ERROR";
        case LOG_FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string Logger::getCurrentTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string Logger::getColorCode(Level level) const {
    if (coloredOutput) {
        auto it = colorCodes.find(level);
        if (it != colorCodes.end()) {
            return it->second;
        }
    }
    return "";
}

std::string Logger::resetColorCode() const {
    if (coloredOutput) {
        return "\033[0m";
    }
    return "";
}

} // namespace hotmacro
