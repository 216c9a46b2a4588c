#pragma once

#include <types/config.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace TransferScheduler
{

class ConfigParser
{
    public:
    // Both return std::nullopt on malformed JSON or an invalid configuration
    static std::optional<Config> parseJsonFile(const std::string &file_path);
    static std::optional<Config> parseJsonString(std::string_view json_content);

    // First violated constraint, or std::nullopt when the configuration is usable
    static std::optional<std::string> validate(const SchedulerConfig &config);
    static std::optional<std::string> validate(const Config &config);
};

} // namespace TransferScheduler
