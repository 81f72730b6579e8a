#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <chrono>
#include <cstring>
#include <memory>
#include <vector>
#include <filesystem>

namespace LogUtils {

std::shared_ptr<spdlog::logger> logger;

static spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info:  return spdlog::level::info;
        case Level::Warn:  return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        default:           return spdlog::level::info;
    }
}

// %* expands to the fixed-width upper-case level name
class LevelFullNameFormatter : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        const char* name = level_name(msg.level);
        dest.append(name, name + std::strlen(name));
    }

    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<LevelFullNameFormatter>();
    }

private:
    static const char* level_name(spdlog::level::level_enum level) {
        switch (level) {
            case spdlog::level::trace:    return "TRACE";
            case spdlog::level::debug:    return "DEBUG";
            case spdlog::level::warn:     return "WARN ";
            case spdlog::level::err:      return "ERROR";
            case spdlog::level::critical: return "FATAL";
            default:                      return "INFO ";
        }
    }
};

static const char* const log_pattern = "%Y-%m-%d %H:%M:%S.%f %t %* %v";

static std::unique_ptr<spdlog::formatter> make_formatter() {
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    // The pattern is compiled on set_pattern, so the custom flag must come first
    formatter->add_flag<LevelFullNameFormatter>('*').set_pattern(log_pattern);
    return formatter;
}

void init(Level level, const std::string& log_file, size_t max_file_size, size_t max_files) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!log_file.empty()) {
        std::filesystem::path parent_dir = std::filesystem::path(log_file).parent_path();
        if (!parent_dir.empty()) {
            std::filesystem::create_directories(parent_dir);
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, max_file_size, max_files));
    }

    spdlog::init_thread_pool(8192, 1);
    logger = std::make_shared<spdlog::async_logger>(
        "flowrun_logger", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);

    logger->set_formatter(make_formatter());
    logger->set_level(to_spdlog_level(level));
    logger->flush_on(spdlog::level::warn);
    spdlog::flush_every(std::chrono::seconds(1));
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

void shutdown() {
    if (logger) logger->flush();
    logger.reset();
    spdlog::shutdown();
}

void set_level(Level level) {
    if (logger) logger->set_level(to_spdlog_level(level));
}

Level parse_level(const std::string& name) {
    const std::string lower = StringUtils::to_lower(StringUtils::trimmed(name));
    if (lower == "trace") return Level::Trace;
    if (lower == "debug") return Level::Debug;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    return Level::Info;
}

void debug(const std::string& msg) {
    if (logger) logger->debug(msg);
}

void info(const std::string& msg) {
    if (logger) {
        logger->info(msg);
    } else {
        std::cerr << "[INFO] " << msg << std::endl;
    }
}

void warn(const std::string& msg) {
    if (logger) {
        logger->warn(msg);
    } else {
        std::cerr << "[WARN] " << msg << std::endl;
    }
}

void error(const std::string& msg) {
    if (logger) {
        logger->error(msg);
    } else {
        std::cerr << "[ERROR] " << msg << std::endl;
    }
}

}
