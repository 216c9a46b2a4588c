#include <transfer-scheduler/logger.hpp>
#include <transfer-scheduler/string_utils.hpp>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fmt/chrono.h>
#include <iostream>

namespace TransferScheduler
{

namespace
{

constexpr const char *DEFAULT_LOG_FILE = "transfer-scheduler.log";

struct CategoryName
{
    std::string_view config_name;
    std::string_view short_name;
    LogCategory category;
};

constexpr CategoryName CATEGORY_NAMES[] = {
    { "general", "GEN", LogCategory::GENERAL },    { "queue", "QUE", LogCategory::QUEUE },
    { "admission", "ADM", LogCategory::ADMISSION }, { "transfer", "XFR", LogCategory::TRANSFER },
    { "progress", "PRG", LogCategory::PROGRESS },  { "budget", "BDG", LogCategory::BUDGET },
    { "notify", "NTF", LogCategory::NOTIFY },      { "config", "CFG", LogCategory::CONFIG },
    { "metrics", "MET", LogCategory::METRICS },
};

struct LevelName
{
    std::string_view config_name;
    std::string_view column;
    LogLevel level;
};

constexpr LevelName LEVEL_NAMES[] = {
    { "trace", "TRACE", LogLevel::TRACE }, { "debug", "DEBUG", LogLevel::DEBUG },
    { "info", "INFO ", LogLevel::INFO },   { "warn", "WARN ", LogLevel::WARN },
    { "error", "ERROR", LogLevel::ERR },   { "fatal", "FATAL", LogLevel::FATAL },
    { "off", "OFF  ", LogLevel::OFF },
};

bool writesToFile(LogOutput output)
{
    return output == LogOutput::FILE || output == LogOutput::BOTH;
}

bool writesToConsole(LogOutput output)
{
    return output == LogOutput::CONSOLE || output == LogOutput::BOTH;
}

std::string currentTimestamp()
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);

    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03d}", local_tm, ms.count());
}

} // namespace

bool Logger::initialize(const LoggingConfig &config)
{
    const auto level = parseLevel(config.level);
    const auto output = parseOutput(config.output);
    if (!level || !output)
    {
        fmt::print(stderr, "[Logger] Invalid logging configuration (level '{}', output '{}')\n", config.level,
                   config.output);
        return false;
    }

    const LogCategory categories = parseCategories(config.categories);

    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.write_mutex);

    if (instance.log_file.is_open())
    {
        instance.log_file.close();
    }

    LogOutput effective_output = *output;
    if (writesToFile(effective_output))
    {
        const std::string filename = config.file.empty() ? DEFAULT_LOG_FILE : config.file;
        instance.log_file.open(filename, std::ios::app);
        if (!instance.log_file.is_open())
        {
            fmt::print(stderr, "[Logger] Could not open log file '{}', falling back to console output\n", filename);
            effective_output = LogOutput::CONSOLE;
        }
    }

    instance.current_level = *level;
    instance.output_type = effective_output;
    instance.enabled_categories = static_cast<std::uint32_t>(categories);
    instance.initialized = true;
    return true;
}

void Logger::shutdown()
{
    Logger &instance = getInstance();
    std::lock_guard<std::mutex> lock(instance.write_mutex);

    instance.initialized = false;
    if (instance.log_file.is_open())
    {
        instance.log_file.close();
    }
}

void Logger::setLevel(LogLevel level)
{
    getInstance().current_level = level;
}

void Logger::setCategories(LogCategory categories)
{
    getInstance().enabled_categories = static_cast<std::uint32_t>(categories);
}

bool Logger::isEnabled(LogLevel level)
{
    const Logger &instance = getInstance();
    return instance.initialized && instance.output_type != LogOutput::DISABLED && level != LogLevel::OFF &&
           level >= instance.current_level.load();
}

bool Logger::isEnabled(LogCategory category)
{
    return (getInstance().enabled_categories.load() & static_cast<std::uint32_t>(category)) != 0;
}

std::optional<LogLevel> Logger::parseLevel(std::string_view name)
{
    const std::string lowered = StringUtils::toLower(std::string(name));
    if (lowered == "warning")
    {
        return LogLevel::WARN;
    }
    for (const auto &entry : LEVEL_NAMES)
    {
        if (lowered == entry.config_name)
        {
            return entry.level;
        }
    }
    return std::nullopt;
}

std::optional<LogOutput> Logger::parseOutput(std::string_view name)
{
    const std::string lowered = StringUtils::toLower(std::string(name));
    if (lowered == "console")
        return LogOutput::CONSOLE;
    if (lowered == "file")
        return LogOutput::FILE;
    if (lowered == "both")
        return LogOutput::BOTH;
    if (lowered == "disabled")
        return LogOutput::DISABLED;
    return std::nullopt;
}

LogCategory Logger::parseCategories(const std::string &categories_str)
{
    const std::string lowered = StringUtils::toLower(StringUtils::trim(categories_str));
    if (lowered == "all")
    {
        return LogCategory::ALL;
    }

    std::uint32_t mask = 0;
    for (const std::string &name : StringUtils::split(lowered, ','))
    {
        const std::string category = StringUtils::trim(name);
        if (category.empty())
        {
            continue;
        }

        bool known = false;
        for (const auto &entry : CATEGORY_NAMES)
        {
            if (category == entry.config_name)
            {
                mask |= static_cast<std::uint32_t>(entry.category);
                known = true;
                break;
            }
        }

        if (!known)
        {
            fmt::print(stderr, "[Logger] Unknown log category '{}' ignored\n", category);
        }
    }

    return static_cast<LogCategory>(mask);
}

std::string_view Logger::levelToString(LogLevel level)
{
    for (const auto &entry : LEVEL_NAMES)
    {
        if (entry.level == level)
        {
            return entry.column;
        }
    }
    return "UNKN ";
}

std::string_view Logger::categoryToString(LogCategory category)
{
    for (const auto &entry : CATEGORY_NAMES)
    {
        if (entry.category == category)
        {
            return entry.short_name;
        }
    }
    return "UNK";
}

Logger &Logger::getInstance()
{
    static Logger instance;
    return instance;
}

void Logger::write(LogLevel level, LogCategory category, const std::string &message)
{
    const std::string line =
    fmt::format("[{}] [{}] [{}] {}\n", currentTimestamp(), levelToString(level), categoryToString(category), message);

    std::lock_guard<std::mutex> lock(write_mutex);
    if (!initialized)
    {
        return;
    }

    const LogOutput output = output_type;
    if (writesToConsole(output))
    {
        std::ostream &stream = level >= LogLevel::WARN ? std::cerr : std::cout;
        stream << line;
    }
    if (writesToFile(output) && log_file.is_open())
    {
        log_file << line;
        log_file.flush();
    }
}

} // namespace TransferScheduler
