/**
 * @file Logger.hpp
 * @brief Logging wrapper around spdlog.
 *
 * Owns the process-wide spdlog logger used by the export engine and the CLI.
 * A colour console sink and a rotating file sink under the cache directory
 * are installed on init(); if the file sink cannot be created the logger
 * degrades to console only.
 *
 * @section Dependencies
 * - spdlog
 */

#pragma once
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <string_view>

namespace rs {

class Logger {
public:
    static void init(std::string_view appName = "reelsync",
                     bool debug = false);
    static void shutdown();

    // Switch between info and debug after init (CLI --debug, config reload)
    static void setDebug(bool debug);

    static std::filesystem::path logFile();

    static std::shared_ptr<spdlog::logger>& get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::filesystem::path logFile_;
};

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(rs::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(rs::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(rs::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(rs::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(rs::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(rs::Logger::get(), __VA_ARGS__)

} // namespace rs
