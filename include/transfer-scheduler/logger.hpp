#pragma once

#include <types/config.hpp>
#include <atomic>
#include <cstdint>
#include <fmt/format.h>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace TransferScheduler
{

enum class LogLevel : std::uint8_t
{
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERR = 4,
    FATAL = 5,
    OFF = 6
};

enum class LogOutput : std::uint8_t
{
    CONSOLE = 0,
    FILE = 1,
    BOTH = 2,
    DISABLED = 3
};

enum class LogCategory : std::uint32_t
{
    GENERAL = 1 << 0,
    QUEUE = 1 << 1,     // pending queue insertion and removal
    ADMISSION = 1 << 2, // processQueue cycles
    TRANSFER = 1 << 3,  // worker creation and stop requests
    PROGRESS = 1 << 4,  // progress reports and completion
    BUDGET = 1 << 5,
    NOTIFY = 1 << 6,
    CONFIG = 1 << 7,
    METRICS = 1 << 8,
    ALL = 0xFFFFFFFF
};

/**
 * Process-wide logger shared by the scheduler, its collaborators and the demo.
 *
 * Nothing is written until initialize() succeeds. Level, output and category
 * filters are read without locking so that disabled calls stay cheap on the
 * scheduler's hot paths. Lines are written as
 * "[timestamp] [LEVEL] [CAT] message".
 */
class Logger
{
    public:
    // Returns false and leaves the logger untouched on an unknown level or output name
    static bool initialize(const LoggingConfig &config);
    static void shutdown();

    static void setLevel(LogLevel level);
    static void setCategories(LogCategory categories);

    template <typename... Args>
    static void log(LogLevel level, LogCategory category, std::string_view format, Args &&...args);

    template <typename... Args>
    static void trace(LogCategory category, std::string_view format, Args &&...args)
    {
        log(LogLevel::TRACE, category, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(LogCategory category, std::string_view format, Args &&...args)
    {
        log(LogLevel::DEBUG, category, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(LogCategory category, std::string_view format, Args &&...args)
    {
        log(LogLevel::INFO, category, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(LogCategory category, std::string_view format, Args &&...args)
    {
        log(LogLevel::WARN, category, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(LogCategory category, std::string_view format, Args &&...args)
    {
        log(LogLevel::ERR, category, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void fatal(LogCategory category, std::string_view format, Args &&...args)
    {
        log(LogLevel::FATAL, category, format, std::forward<Args>(args)...);
    }

    // GENERAL category shorthands, used by the demo front end
    template <typename... Args>
    static void info(std::string_view format, Args &&...args)
    {
        log(LogLevel::INFO, LogCategory::GENERAL, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(std::string_view format, Args &&...args)
    {
        log(LogLevel::DEBUG, LogCategory::GENERAL, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(std::string_view format, Args &&...args)
    {
        log(LogLevel::WARN, LogCategory::GENERAL, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(std::string_view format, Args &&...args)
    {
        log(LogLevel::ERR, LogCategory::GENERAL, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void fatal(std::string_view format, Args &&...args)
    {
        log(LogLevel::FATAL, LogCategory::GENERAL, format, std::forward<Args>(args)...);
    }

    static bool isEnabled(LogLevel level);
    static bool isEnabled(LogCategory category);

    // Case-insensitive; "warning" is accepted for WARN
    static std::optional<LogLevel> parseLevel(std::string_view name);
    static std::optional<LogOutput> parseOutput(std::string_view name);

    // Comma separated names or "all". Unknown names are reported on stderr and skipped.
    static LogCategory parseCategories(const std::string &categories_str);

    // Fixed width, as printed in the level column
    static std::string_view levelToString(LogLevel level);
    static std::string_view categoryToString(LogCategory category);

    private:
    Logger() = default;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    static Logger &getInstance();
    void write(LogLevel level, LogCategory category, const std::string &message);

    std::atomic<bool> initialized{ false };
    std::atomic<LogLevel> current_level{ LogLevel::INFO };
    std::atomic<LogOutput> output_type{ LogOutput::CONSOLE };
    std::atomic<std::uint32_t> enabled_categories{ static_cast<std::uint32_t>(LogCategory::ALL) };

    // Guards the file and interleaving of whole lines
    std::mutex write_mutex;
    std::ofstream log_file;
};

template <typename... Args>
void Logger::log(LogLevel level, LogCategory category, std::string_view format, Args &&...args)
{
#ifndef TRANSFER_SCHEDULER_NO_LOGGING
    if (!isEnabled(level) || !isEnabled(category))
    {
        return;
    }

    if constexpr (sizeof...(args) == 0)
    {
        getInstance().write(level, category, std::string(format));
    }
    else
    {
        getInstance().write(level, category, fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
    }
#endif
}

} // namespace TransferScheduler
