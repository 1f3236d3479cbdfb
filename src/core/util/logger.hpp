/// @file logger.hpp
/// @brief Engine logging utilities using spdlog

#pragma once

// Enable all log levels at compile time
#ifndef SPDLOG_ACTIVE_LEVEL
    #define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace laxy {

/// @brief Initialize the logging system
/// @param log_file Path to the log file (empty disables the file sink)
/// @param console_output Enable console output
/// @return true if initialization succeeded
inline bool init_logging(const std::filesystem::path& log_file, bool console_output = true) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (!log_file.empty()) {
            std::error_code ec;
            if (log_file.has_parent_path()) {
                std::filesystem::create_directories(log_file.parent_path(), ec);
            }
            auto file_sink =
                std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), true);
            file_sink->set_level(spdlog::level::trace);
            sinks.push_back(file_sink);
        }

        // Console goes to stderr so command output stays clean
        if (console_output) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::warn);
            sinks.push_back(console_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("laxy", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::trace);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");

        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::info);

        return true;
    } catch (const spdlog::spdlog_ex&) {
        return false;
    }
}

/// @brief Apply a textual level ("trace" .. "off") to the default logger
inline void set_log_level(std::string_view level) {
    spdlog::set_level(spdlog::level::from_str(std::string(level)));
}

/// @brief Shutdown the logging system
inline void shutdown_logging() {
    spdlog::shutdown();
}

// Convenience macros for logging with source location
#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

}  // namespace laxy
