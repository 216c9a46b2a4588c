#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace TransferScheduler
{

const char *const TIME_FORMAT_ISO8601 = "%Y-%m-%dT%H:%M:%SZ";

class TimeUtils
{
    public:
    static std::string formatDuration(std::chrono::system_clock::duration duration);

    // Always rendered in UTC
    static std::string formatTimestamp(std::chrono::system_clock::time_point tp, const char *format = TIME_FORMAT_ISO8601);

    static std::int64_t toUnixMillis(std::chrono::system_clock::time_point tp);
};

} // namespace TransferScheduler
