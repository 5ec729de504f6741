#include "Logger.hpp"
#include <string>
#include <vector>
#include "util/FileUtils.hpp"

namespace st {

namespace {

constexpr std::size_t kMaxLogBytes = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

spdlog::level::level_enum levelFor(bool debug) {
    return debug ? spdlog::level::debug : spdlog::level::info;
}

spdlog::sink_ptr makeConsoleSink() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_pattern("%^[%H:%M:%S.%e] [%l]%$ %v");
    return sink;
}

// Throws spdlog_ex when the directory or the file cannot be created
spdlog::sink_ptr makeFileSink(const std::filesystem::path& logFile) {
    if (!file::ensureDir(logFile.parent_path())) {
        throw spdlog::spdlog_ex("cannot create log directory " +
                                logFile.parent_path().string());
    }
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile.string(), kMaxLogBytes, kMaxLogFiles);
    sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
    return sink;
}

} // namespace

std::shared_ptr<spdlog::logger> Logger::logger_;
std::filesystem::path Logger::logFile_;

void Logger::init(std::string_view appName, bool debug) {
    const std::string name(appName);
    spdlog::drop(name);
    logFile_.clear();

    try {
        auto path = file::cacheDir() / "logs" / (name + ".log");
        std::vector<spdlog::sink_ptr> sinks{makeConsoleSink(),
                                            makeFileSink(path)};
        logger_ = std::make_shared<spdlog::logger>(
                name, sinks.begin(), sinks.end());
        logFile_ = path;
    } catch (const spdlog::spdlog_ex& ex) {
        spdlog::drop(name);
        logger_ = std::make_shared<spdlog::logger>(name, makeConsoleSink());
        logger_->warn("Failed to create file logger: {}", ex.what());
    }

    logger_->set_level(levelFor(debug));
    logger_->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger_);
    spdlog::set_default_logger(logger_);

    if (!logFile_.empty())
        LOG_DEBUG("Logging to {}", logFile_.string());
}

void Logger::setDebug(bool debug) {
    get()->set_level(levelFor(debug));
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
    }
    logger_.reset();
    logFile_.clear();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    if (!logger_) {
        init();
    }
    return logger_;
}

} // namespace st
