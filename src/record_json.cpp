#include <transfer-scheduler/record_json.hpp>
#include <transfer-scheduler/download_scheduler.hpp>
#include <transfer-scheduler/time_utils.hpp>

namespace TransferScheduler
{

namespace
{

nlohmann::json timestampOrNull(const std::optional<DownloadRecord::Clock::time_point> &tp)
{
    if (!tp)
    {
        return nullptr;
    }
    return TimeUtils::formatTimestamp(*tp);
}

} // namespace

nlohmann::json toJson(const RemoteFileLocation &remote)
{
    nlohmann::json j;
    if (!remote.url.empty())
    {
        j["url"] = remote.url;
    }
    else
    {
        j["file_id"] = remote.file_id;
        j["access_hash"] = remote.access_hash;
    }
    return j;
}

nlohmann::json toJson(const DownloadRecord &record)
{
    nlohmann::json j;
    j["id"] = record.downloadId();
    j["state"] = stateToString(record.state());
    j["priority"] = priorityToString(record.priority());
    j["remote"] = toJson(record.remote());
    j["local_path"] = record.local().path;
    j["size"] = record.size();
    j["expected_size"] = record.expectedSize();
    j["downloaded_size"] = record.downloadedSize();
    j["progress"] = record.progress();
    j["created_at"] = TimeUtils::formatTimestamp(record.createdAt());
    j["started_at"] = timestampOrNull(record.startedAt());
    j["completed_at"] = timestampOrNull(record.completedAt());

    if (record.errorMessage())
    {
        j["error"] = *record.errorMessage();
    }
    else
    {
        j["error"] = nullptr;
    }
    return j;
}

nlohmann::json snapshotToJson(const DownloadScheduler &scheduler)
{
    nlohmann::json j;
    j["active"] = scheduler.activeCount();
    j["pending"] = scheduler.pendingCount();
    j["total"] = scheduler.totalCount();
    j["completed_history"] = scheduler.completedHistory();

    nlohmann::json downloads = nlohmann::json::array();
    for (const auto &record : scheduler.snapshot())
    {
        downloads.push_back(toJson(record));
    }
    j["downloads"] = std::move(downloads);
    return j;
}

} // namespace TransferScheduler
