#ifndef AIRSTREAM_LOGGER_H
#define AIRSTREAM_LOGGER_H

#include <atomic>
#include <chrono>
#include <format>
#include <iostream>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

#include "formatters.hpp"

// Define Log Levels
enum class LogLevel { VERBOSE = 0, DEBUG = 1, INFO = 2, WARNING = 3, ERROR = 4 };

class Logger {
  public:
    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) { m_level.store(level); }

    LogLevel getLevel() const { return m_level.load(); }

    // Maps the command line debug level onto a minimum log level
    static LogLevel levelFromDebug(int debugLevel) {
        if (debugLevel <= 0) return LogLevel::INFO;
        if (debugLevel == 1) return LogLevel::DEBUG;
        return LogLevel::VERBOSE;
    }

    template <typename... Args>
    void log(LogLevel level,
             std::source_location location = std::source_location::current(),
             std::format_string<Args...> fmt = "",
             Args&&... args) {
        if (level < m_level.load()) {
            return;
        }

        std::string message;
        try {
            message = std::format(fmt, std::forward<Args>(args)...);
        } catch (const std::format_error& e) {
            message = std::format("!!! Formatting Error: {} !!!", e.what());
            level = LogLevel::ERROR;
        }
        logSyncRaw(buildLine(level, location, message));
    }

  private:
    Logger() : m_level(LogLevel::INFO) {}

    ~Logger() = default;

    void logSyncRaw(const std::string& output) {
        std::lock_guard<std::mutex> lock(m_output_mutex);
        std::cout << output << std::endl;
    }

    static std::string buildLine(LogLevel level, const std::source_location& location,
                                 std::string_view message) {
        auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
        bool is_multiline = (message.find('\n') != std::string_view::npos);
        return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}]{}{}", now, levelToString(level),
                           trimFunctionName(location.function_name()),
                           (is_multiline ? "\n" : " "), message);
    }

    static std::string_view
    trimFunctionName(std::string_view full_name) noexcept {
        size_t params_pos = full_name.find('(');
        if (params_pos == std::string_view::npos) {
            params_pos = full_name.length();
        }
        std::string_view name_and_prefix = full_name.substr(0, params_pos);
        size_t last_space_pos = name_and_prefix.rfind(' ');
        std::string_view candidate =
            (last_space_pos == std::string_view::npos)
                ? name_and_prefix
                : name_and_prefix.substr(last_space_pos + 1);
        size_t last_colon_pos = candidate.rfind("::");
        if (last_colon_pos == std::string_view::npos) {
            return candidate;
        }
        size_t prev_colon_pos = (last_colon_pos > 0)
                                    ? candidate.rfind("::", last_colon_pos - 1)
                                    : std::string_view::npos;
        if (prev_colon_pos == std::string_view::npos) {
            return candidate;
        }
        return candidate.substr(prev_colon_pos + 2);
    }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARNING: return "WARNING";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::VERBOSE: return "VERBOSE";
            default: return "UNKNOWN";
        }
    }

    std::atomic<LogLevel> m_level;
    std::mutex m_output_mutex;
};

#define LOG_VERBOSE(fmt, ...)                                                    \
    Logger::getInstance().log(LogLevel::VERBOSE, std::source_location::current(), \
                              fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_DEBUG(fmt, ...)                                                    \
    Logger::getInstance().log(LogLevel::DEBUG, std::source_location::current(), \
                              fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_INFO(fmt, ...)                                                     \
    Logger::getInstance().log(LogLevel::INFO, std::source_location::current(), \
                              fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_WARN(fmt, ...)                                                     \
    Logger::getInstance().log(LogLevel::WARNING,                               \
                              std::source_location::current(),                 \
                              fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_ERROR(fmt, ...)                                                    \
    Logger::getInstance().log(LogLevel::ERROR,                                 \
                              std::source_location::current(),                 \
                              fmt __VA_OPT__(, ) __VA_ARGS__)

#endif // AIRSTREAM_LOGGER_H
