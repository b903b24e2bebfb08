#pragma once
#include <string>
#include <mutex>
#include <memory>
#include <unordered_map>
#include <fmt/format.h>

namespace hotmacro {

class Logger {
public:
    enum Level { LOG_DEBUG, LOG_INFO, LOG_WARNING, LOG_ERROR, LOG_FATAL };

    static Logger& getInstance();

    void setLogFile(const std::string& filename);
    void setLogLevel(Level level);
    Level getLogLevel() const;

    // Parse "debug", "info", "warning"/"warn", "error", "fatal"
    static bool parseLevel(const std::string& name, Level& out);

    void debug(const std::string& message)   { log(LOG_DEBUG, message); }
    void info(const std::string& message)    { log(LOG_INFO, message); }
    void warning(const std::string& message) { log(LOG_WARNING, message); }
    void error(const std::string& message)   { log(LOG_ERROR, message); }

    /**
     * fmt-style formatting
     * Usage: Logger::getInstance().debug("Value: {}, Name: {}", 42, "test");
     */
    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        logFormatted(LOG_DEBUG, format, args...);
    }

    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        logFormatted(LOG_INFO, format, args...);
    }

    template<typename... Args>
    void warning(const std::string& format, Args&&... args) {
        logFormatted(LOG_WARNING, format, args...);
    }

    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        logFormatted(LOG_ERROR, format, args...);
    }

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template<typename... Args>
    void logFormatted(Level level, const std::string& format, Args&... args) {
        if (level < getLogLevel()) return;
        try {
            log(level, fmt::vformat(format, fmt::make_format_args(args...)));
        } catch (const fmt::format_error& e) {
            log(LOG_ERROR, "Logger format error: " + std::string(e.what()) +
                           " | Original format: " + format);
            log(level, format); // Fallback to unformatted message
        }
    }

    void log(Level level, const std::string& message);
    std::string getLevelString(Level level) const;
    std::string getCurrentTimestamp() const;
    std::string getColorCode(Level level) const;
    std::string resetColorCode() const;

    struct Impl;
    std::unique_ptr<Impl> pImpl;
    mutable std::mutex mutex;
    Level currentLevel;
    bool coloredOutput = true;

    // Color codes
    std::unordered_map<Level, std::string> colorCodes = {
        {LOG_DEBUG, "\033[36m"},    // Cyan
        {LOG_INFO, "\033[32m"},     // Green
        {LOG_WARNING, "\033[33m"},  // Yellow
        {LOG_ERROR, "\033[31m"},    // Red
        {LOG_FATAL, "\033[35m"}     // Magenta
    };
};

inline void debug(const std::string& message) {
    Logger::getInstance().debug(message);
}
inline void info(const std::string& message) {
    Logger::getInstance().info(message);
}
inline void warning(const std::string& message) {
    Logger::getInstance().warning(message);
}
inline void error(const std::string& message) {
    Logger::getInstance().error(message);
}
template<typename... Args>
inline void debug(const std::string& format, Args&&... args) {
    Logger::getInstance().debug(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void info(const std::string& format, Args&&... args) {
    Logger::getInstance().info(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void warning(const std::string& format, Args&&... args) {
    Logger::getInstance().warning(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void error(const std::string& format, Args&&... args) {
    Logger::getInstance().error(format, std::forward<Args>(args)...);
}
} // namespace hotmacro
