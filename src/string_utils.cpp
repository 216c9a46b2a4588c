#include <transfer-scheduler/string_utils.hpp>
#include <cctype>
#include <charconv>
#include <fmt/format.h>

namespace TransferScheduler
{

std::string StringUtils::toLower(std::string_view str)
{
    std::string result(str);
    for (char &c : result)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

std::string StringUtils::trim(std::string_view str)
{
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos)
    {
        return {};
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(start, end - start + 1));
}

std::vector<std::string> StringUtils::split(std::string_view str, char delimiter)
{
    std::vector<std::string> parts;
    size_t start = 0;

    while (true)
    {
        size_t pos = str.find(delimiter, start);
        if (pos == std::string_view::npos)
        {
            parts.emplace_back(str.substr(start));
            break;
        }
        parts.emplace_back(str.substr(start, pos - start));
        start = pos + 1;
    }

    return parts;
}

std::optional<std::uint64_t> StringUtils::parseUnsigned(std::string_view str)
{
    if (str.empty())
    {
        return std::nullopt;
    }

    std::uint64_t value = 0;
    const char *end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data(), end, value);
    if (ec != std::errc() || ptr != end)
    {
        return std::nullopt;
    }
    return value;
}

const char *StringUtils::getNextArg(char *argv[], int &index, int argc)
{
    if (index + 1 < argc)
    {
        return argv[++index];
    }
    return nullptr;
}

std::string StringUtils::formatBytes(std::uint64_t bytes)
{
    const char *units[] = { "B", "KB", "MB", "GB" };
    int unit = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024 && unit < 3)
    {
        size /= 1024;
        unit++;
    }

    return fmt::format("{:.2f} {}", size, units[unit]);
}

} // namespace TransferScheduler
