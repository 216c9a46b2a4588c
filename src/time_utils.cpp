#include <transfer-scheduler/time_utils.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace TransferScheduler
{

std::string TimeUtils::formatDuration(std::chrono::system_clock::duration duration)
{
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    auto seconds = millis / 1000;

    if (seconds < 1)
        return std::to_string(millis) + " ms";
    else if (seconds < 60)
        return std::to_string(seconds) + " seconds";
    else if (seconds < 3600)
        return std::to_string(seconds / 60) + " minutes";
    else if (seconds < 86400)
        return std::to_string(seconds / 3600) + " hours";
    else
        return std::to_string(seconds / 86400) + " days";
}

std::string TimeUtils::formatTimestamp(std::chrono::system_clock::time_point tp, const char *format)
{
    auto time_t = std::chrono::system_clock::to_time_t(tp);

    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

std::int64_t TimeUtils::toUnixMillis(std::chrono::system_clock::time_point tp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace TransferScheduler
