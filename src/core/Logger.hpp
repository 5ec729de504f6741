/**
 * @file Logger.hpp
 * @brief Logging wrapper around spdlog.
 *
 * Initializes and owns the songtok spdlog instance: colored console output
 * plus a rotating log file under the cache directory. The LOG_* macros carry
 * source location into the file sink.
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

namespace st {

class Logger {
public:
    static void init(std::string_view appName = "songtok", bool debug = false);
    static void shutdown();

    // Switches between debug and info level; [general] debug drives this
    static void setDebug(bool debug);

    static std::shared_ptr<spdlog::logger>& get();

    // Empty when running console-only
    static const std::filesystem::path& logFile() {
        return logFile_;
    }

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::filesystem::path logFile_;
};

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(st::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(st::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(st::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(st::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(st::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(st::Logger::get(), __VA_ARGS__)

} // namespace st
