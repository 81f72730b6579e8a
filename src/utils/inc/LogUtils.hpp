#pragma once
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <iostream>
#include <string>
#include <memory>

namespace LogUtils {

enum class Level {
    Trace,
    Debug,
    Info,
    Warn,
    Error
};

// Initialize the log system; an empty log_file disables the file sink
void init(Level level = Level::Info,
          const std::string& log_file = "log/flowrun.log",
          size_t max_file_size = 1024 * 1024 * 5,
          size_t max_files = 3);

void shutdown();
void set_level(Level level);

// Accepts trace/debug/info/warn/error, case-insensitive; unknown names map to Info
Level parse_level(const std::string& name);

// Logger instance
extern std::shared_ptr<spdlog::logger> logger;

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

template <typename... Args>
inline void trace(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->trace(fmt, std::forward<Args>(args)...);
    }
}

template <typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->debug(fmt, std::forward<Args>(args)...);
    }
}

template <typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->info(fmt, std::forward<Args>(args)...);
    } else {
        std::cerr << "[INFO] " << fmt::format(fmt, std::forward<Args>(args)...) << std::endl;
    }
}

template <typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->warn(fmt, std::forward<Args>(args)...);
    } else {
        std::cerr << "[WARN] " << fmt::format(fmt, std::forward<Args>(args)...) << std::endl;
    }
}

template <typename... Args>
inline void error(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->error(fmt, std::forward<Args>(args)...);
    } else {
        std::cerr << "[ERROR] " << fmt::format(fmt, std::forward<Args>(args)...) << std::endl;
    }
}

class LoggerGuard {
public:
    LoggerGuard(Level level = Level::Info,
                const std::string& log_file = "log/flowrun.log") {
        LogUtils::init(level, log_file);
    }

    ~LoggerGuard() {
        LogUtils::shutdown();
    }

    LoggerGuard(const LoggerGuard&) = delete;
    LoggerGuard& operator=(const LoggerGuard&) = delete;
};

}
