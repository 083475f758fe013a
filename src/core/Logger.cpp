#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace rs {

std::shared_ptr<spdlog::logger> Logger::logger_;
std::filesystem::path Logger::logFile_;

namespace {
spdlog::level::level_enum levelFor(bool debug) {
    return debug ? spdlog::level::debug : spdlog::level::info;
}
} // namespace

void Logger::init(std::string_view appName, bool debug) {
    const std::string name(appName);
    try {
        spdlog::drop(name);

        std::vector<spdlog::sink_ptr> sinks;

        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("%^[%H:%M:%S.%e] [%l]%$ %v");
        sinks.push_back(console);

        auto logDir = file::cacheDir() / "logs";
        file::ensureDir(logDir);

        logFile_ = logDir / (name + ".log");
        auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile_.string(), 1024 * 1024 * 5, 3);
        rotating->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
        sinks.push_back(rotating);

        logger_ = std::make_shared<spdlog::logger>(
                name, sinks.begin(), sinks.end());

        logger_->set_level(levelFor(debug));
        logger_->flush_on(spdlog::level::warn);

        spdlog::register_logger(logger_);
        spdlog::set_default_logger(logger_);

        LOG_DEBUG("Logger initialized. Log file: {}", logFile_.string());

    } catch (const spdlog::spdlog_ex& ex) {
        spdlog::drop(name);
        logFile_.clear();
        logger_ = spdlog::stderr_color_mt(name);
        logger_->set_level(levelFor(debug));
        logger_->warn("Failed to create file logger: {}", ex.what());
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
    }
    logger_.reset();
    spdlog::shutdown();
}

void Logger::setDebug(bool debug) {
    get()->set_level(levelFor(debug));
}

std::filesystem::path Logger::logFile() {
    return logFile_;
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    if (!logger_) {
        init();
    }
    return logger_;
}

} // namespace rs
