#pragma once

#include "download_record.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace TransferScheduler
{

class DownloadScheduler;

nlohmann::json toJson(const RemoteFileLocation &remote);
nlohmann::json toJson(const DownloadRecord &record);

// Records plus the scheduler's counters and completion history
nlohmann::json snapshotToJson(const DownloadScheduler &scheduler);

} // namespace TransferScheduler
