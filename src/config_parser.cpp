#include <transfer-scheduler/config_parser.hpp>
#include <transfer-scheduler/logger.hpp>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace TransferScheduler
{

namespace
{

// Non-negative integers only, a negative or fractional value is a type error
template <typename T>
void readUnsigned(const nlohmann::json &section, const char *key, T &target)
{
    if (!section.contains(key))
    {
        return;
    }

    const auto &value = section[key];
    if (!value.is_number_unsigned())
    {
        throw std::invalid_argument(fmt::format("'{}' must be a non-negative integer", key));
    }
    target = value.get<T>();
}

void readBool(const nlohmann::json &section, const char *key, bool &target)
{
    if (section.contains(key) && section[key].is_boolean())
    {
        target = section[key];
    }
}

void readString(const nlohmann::json &section, const char *key, std::string &target)
{
    if (section.contains(key) && section[key].is_string())
    {
        target = section[key];
    }
}

} // namespace

std::optional<Config> ConfigParser::parseJsonFile(const std::string &file_path)
{
    Logger::debug(LogCategory::CONFIG, "Opening config file: {}", file_path);

    std::ifstream file(file_path, std::ios::in);
    if (!file.is_open())
    {
        if (std::filesystem::exists(file_path))
        {
            Logger::error(LogCategory::CONFIG, "Config file {} exists but cannot be opened", file_path);
        }
        else
        {
            Logger::error(LogCategory::CONFIG, "Config file {} does not exist", file_path);
        }
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    Logger::debug(LogCategory::CONFIG, "Read {} bytes from {}", content.size(), file_path);

    return parseJsonString(content);
}

std::optional<Config> ConfigParser::parseJsonString(std::string_view json_content)
{
    try
    {
        nlohmann::json j = nlohmann::json::parse(json_content);
        if (!j.is_object())
        {
            Logger::error(LogCategory::CONFIG, "Configuration root must be a JSON object");
            return std::nullopt;
        }

        Config config;

        // Parse scheduler section
        if (j.contains("scheduler") && j["scheduler"].is_object())
        {
            const auto &scheduler = j["scheduler"];

            readUnsigned(scheduler, "max_concurrent_downloads", config.scheduler.max_concurrent_downloads);
            readUnsigned(scheduler, "max_bandwidth", config.scheduler.max_bandwidth);
            readUnsigned(scheduler, "queue_size", config.scheduler.queue_size);
            readBool(scheduler, "auto_remove_completed", config.scheduler.auto_remove_completed);
            readUnsigned(scheduler, "max_completed_history", config.scheduler.max_completed_history);
            readBool(scheduler, "requeue_resumed_by_priority", config.scheduler.requeue_resumed_by_priority);
        }

        // Parse logging section
        if (j.contains("logging") && j["logging"].is_object())
        {
            const auto &logging = j["logging"];

            readString(logging, "level", config.logging.level);
            readString(logging, "output", config.logging.output);
            readString(logging, "file", config.logging.file);
            readString(logging, "categories", config.logging.categories);
        }

        // Parse metrics section
        if (j.contains("metrics") && j["metrics"].is_object())
        {
            const auto &metrics = j["metrics"];

            readBool(metrics, "enabled", config.metrics.enabled);
            readString(metrics, "bind_address", config.metrics.bind_address);
            readUnsigned(metrics, "port", config.metrics.port);
            readString(metrics, "endpoint_path", config.metrics.endpoint_path);
        }

        if (auto problem = validate(config))
        {
            Logger::error(LogCategory::CONFIG, "Invalid configuration: {}", *problem);
            return std::nullopt;
        }

        Logger::debug(LogCategory::CONFIG, "Configuration parsed: max_concurrent={}, queue_size={}, metrics={}",
                      config.scheduler.max_concurrent_downloads, config.scheduler.queue_size,
                      config.metrics.enabled ? "on" : "off");
        return config;
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error(LogCategory::CONFIG, "JSON parsing error: {}", e.what());
        return std::nullopt;
    }
    catch (const std::exception &e)
    {
        Logger::error(LogCategory::CONFIG, "Configuration parsing error: {}", e.what());
        return std::nullopt;
    }
}

std::optional<std::string> ConfigParser::validate(const SchedulerConfig &config)
{
    if (config.max_concurrent_downloads == 0)
    {
        return "max_concurrent_downloads must be greater than 0";
    }
    if (config.queue_size == 0)
    {
        return "queue_size must be greater than 0";
    }
    if (config.max_completed_history == 0)
    {
        return "max_completed_history must be greater than 0";
    }
    return std::nullopt;
}

std::optional<std::string> ConfigParser::validate(const Config &config)
{
    if (auto problem = validate(config.scheduler))
    {
        return problem;
    }
    if (!Logger::parseLevel(config.logging.level))
    {
        return fmt::format("unknown log level '{}'", config.logging.level);
    }
    if (!Logger::parseOutput(config.logging.output))
    {
        return fmt::format("unknown log output '{}'", config.logging.output);
    }
    if (config.metrics.port < 0 || config.metrics.port > 65535)
    {
        return fmt::format("metrics port {} is out of range", config.metrics.port);
    }
    if (config.metrics.endpoint_path.empty() || config.metrics.endpoint_path.front() != '/')
    {
        return "metrics endpoint_path must start with '/'";
    }
    return std::nullopt;
}

} // namespace TransferScheduler
