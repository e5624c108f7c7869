#include "Logger.hpp"

#include <spdlog/pattern_formatter.h>
#include <algorithm>
#include <cctype>
#include <vector>

namespace AudioGate {

namespace {
constexpr const char* kLoggerName = "audiogate";
constexpr std::size_t kMaxFileSize = 1024 * 1024 * 5; // 5MB
constexpr std::size_t kMaxFiles = 3;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& logFilePath, Level level, bool consoleOutput) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (logger_) {
        spdlog::drop(logger_->name());
        logger_.reset();
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (consoleOutput) {
            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");
            sinks.push_back(consoleSink);
        }

        if (!logFilePath.empty()) {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFilePath, kMaxFileSize, kMaxFiles);
            fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");
            sinks.push_back(fileSink);
        }

        logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
        // Security events must survive an abrupt shutdown
        logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger_);

        logger_->info("Logger initialized (file: {})", logFilePath.empty() ? "<none>" : logFilePath);

    } catch (const spdlog::spdlog_ex& ex) {
        logger_ = spdlog::stdout_color_mt("audiogate_fallback");
        logger_->error("Logger initialization failed: {}", ex.what());
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_) {
        logger_ = spdlog::get(kLoggerName);
        if (!logger_) {
            logger_ = spdlog::stdout_color_mt(kLoggerName);
        }
    }
    return logger_;
}

void Logger::setLevel(Level level) {
    get()->set_level(static_cast<spdlog::level::level_enum>(level));
}

void Logger::flush() {
    get()->flush();
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
        spdlog::drop(logger_->name());
        logger_.reset();
    }
}

Logger::Level Logger::levelFromString(const std::string& name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return Level::Trace;
    if (lowered == "debug") return Level::Debug;
    if (lowered == "warn" || lowered == "warning") return Level::Warn;
    if (lowered == "error") return Level::Error;
    if (lowered == "critical") return Level::Critical;
    return Level::Info;
}

} // namespace AudioGate
