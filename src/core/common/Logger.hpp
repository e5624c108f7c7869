#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <mutex>
#include <string>

namespace AudioGate {

class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    static Logger& instance();

    /**
     * @brief Set up the console and rotating file sinks.
     * @param logFilePath Target of the rotating file sink; empty for console only
     * @param level Minimum level that reaches the sinks
     * @param consoleOutput Whether to attach the coloured stdout sink
     */
    void initialize(const std::string& logFilePath = "audiogate.log",
                    Level level = Level::Info,
                    bool consoleOutput = true);

    void setLevel(Level level);
    void flush();
    void shutdown();

    // Accepts trace|debug|info|warn|warning|error|critical, falls back to Info
    static Level levelFromString(const std::string& name);

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        get()->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        get()->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        get()->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        get()->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        get()->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        get()->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger() = default;

    // Lazily falls back to a console logger so early calls never dereference null
    std::shared_ptr<spdlog::logger> get();

    std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

#define AUDIOGATE_TRACE(...) AudioGate::Logger::instance().trace(__VA_ARGS__)
#define AUDIOGATE_DEBUG(...) AudioGate::Logger::instance().debug(__VA_ARGS__)
#define AUDIOGATE_INFO(...) AudioGate::Logger::instance().info(__VA_ARGS__)
#define AUDIOGATE_WARN(...) AudioGate::Logger::instance().warn(__VA_ARGS__)
#define AUDIOGATE_ERROR(...) AudioGate::Logger::instance().error(__VA_ARGS__)
#define AUDIOGATE_CRITICAL(...) AudioGate::Logger::instance().critical(__VA_ARGS__)

} // namespace AudioGate
