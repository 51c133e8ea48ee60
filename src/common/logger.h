#ifndef LOGGER_H
#define LOGGER_H

#include <iostream>
#include <fstream>
#include <string>
#include <sstream>
#include <mutex>
#include <ctime>

namespace Logger {

// Log levels
enum class Level {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    None = 4  // Disable all logging
};

// Current log level (can be changed at runtime)
inline Level& currentLevel() {
    static Level level = Level::Info;
    return level;
}

inline void setLevel(Level level) {
    currentLevel() = level;
}

// Parse "debug", "info", "warning"/"warn", "error", "none". Unknown names map to Info.
inline Level levelFromString(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "warning" || name == "warn") return Level::Warning;
    if (name == "error") return Level::Error;
    if (name == "none") return Level::None;
    return Level::Info;
}

inline bool shouldLog(Level level) {
    return static_cast<int>(level) >= static_cast<int>(currentLevel());
}

// Worker threads log concurrently, every sink write goes through this lock
inline std::mutex& outputMutex() {
    static std::mutex mutex;
    return mutex;
}

inline std::ofstream& logFile() {
    static std::ofstream file;
    return file;
}

// Mirror all output into an append-only file. Empty path closes the file.
inline bool setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(outputMutex());
    if (logFile().is_open()) {
        logFile().close();
    }
    if (path.empty()) return true;
    logFile().open(path, std::ios::app);
    return logFile().is_open();
}

inline void output(const std::string& message) {
    std::lock_guard<std::mutex> lock(outputMutex());
    std::cout << message;
    std::cout.flush();
    if (logFile().is_open()) {
        logFile() << message;
        logFile().flush();
    }
}

inline std::string timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local_tm;
    localtime_r(&now, &local_tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local_tm);
    return buffer;
}

// Build a tag carrying run context, e.g. "Download[uid=42 step=download]"
// Empty values are left out.
inline std::string contextTag(const std::string& component,
                              const std::string& uid,
                              const std::string& step = "",
                              const std::string& vid = "") {
    std::ostringstream oss;
    oss << component;
    if (uid.empty() && step.empty() && vid.empty()) {
        return oss.str();
    }
    oss << "[";
    bool first = true;
    auto add = [&oss, &first](const char* key, const std::string& value) {
        if (value.empty()) return;
        if (!first) oss << " ";
        oss << key << "=" << value;
        first = false;
    };
    add("uid", uid);
    add("step", step);
    add("vid", vid);
    oss << "]";
    return oss.str();
}

inline void log(Level level, const std::string& tag, const std::string& message) {
    if (!shouldLog(level)) return;

    std::ostringstream oss;
    oss << timestamp() << " ";
    switch (level) {
        case Level::Debug:   oss << "[DEBUG] "; break;
        case Level::Info:    oss << "[INFO] "; break;
        case Level::Warning: oss << "[WARN] "; break;
        case Level::Error:   oss << "[ERROR] "; break;
        default: break;
    }

    if (!tag.empty()) {
        oss << tag << ": ";
    }
    oss << message << "\n";

    output(oss.str());
}

inline void debug(const std::string& tag, const std::string& message) {
    log(Level::Debug, tag, message);
}

inline void info(const std::string& tag, const std::string& message) {
    log(Level::Info, tag, message);
}

inline void warn(const std::string& tag, const std::string& message) {
    log(Level::Warning, tag, message);
}

inline void error(const std::string& tag, const std::string& message) {
    log(Level::Error, tag, message);
}

// Usage: LOG_DEBUG("MyClass", "Something happened: " << value);
#define LOG_DEBUG(tag, msg) do { \
    if (Logger::shouldLog(Logger::Level::Debug)) { \
        std::ostringstream _log_oss; \
        _log_oss << msg; \
        Logger::debug(tag, _log_oss.str()); \
    } \
} while(0)

#define LOG_INFO(tag, msg) do { \
    if (Logger::shouldLog(Logger::Level::Info)) { \
        std::ostringstream _log_oss; \
        _log_oss << msg; \
        Logger::info(tag, _log_oss.str()); \
    } \
} while(0)

#define LOG_WARN(tag, msg) do { \
    if (Logger::shouldLog(Logger::Level::Warning)) { \
        std::ostringstream _log_oss; \
        _log_oss << msg; \
        Logger::warn(tag, _log_oss.str()); \
    } \
} while(0)

#define LOG_ERROR(tag, msg) do { \
    if (Logger::shouldLog(Logger::Level::Error)) { \
        std::ostringstream _log_oss; \
        _log_oss << msg; \
        Logger::error(tag, _log_oss.str()); \
    } \
} while(0)

} // namespace Logger

#endif // LOGGER_H
