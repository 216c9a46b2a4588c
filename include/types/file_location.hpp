#pragma once

#include <cstdint>
#include <string>

namespace TransferScheduler
{

// Where the content lives on the server. The scheduler never interprets it,
// it only forwards it to the worker and compares it for equality.
struct RemoteFileLocation
{
    std::int64_t file_id{};
    std::int64_t access_hash{};
    std::string url;

    static RemoteFileLocation common(std::int64_t id, std::int64_t hash)
    {
        RemoteFileLocation location;
        location.file_id = id;
        location.access_hash = hash;
        return location;
    }

    static RemoteFileLocation web(const std::string &address)
    {
        RemoteFileLocation location;
        location.url = address;
        return location;
    }

    bool isEmpty() const
    {
        return file_id == 0 && url.empty();
    }

    bool operator==(const RemoteFileLocation &) const = default;
};

struct LocalFileLocation
{
    std::string path;

    static LocalFileLocation empty()
    {
        return {};
    }

    bool isEmpty() const
    {
        return path.empty();
    }

    bool operator==(const LocalFileLocation &) const = default;
};

} // namespace TransferScheduler
