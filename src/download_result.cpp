#include <transfer-scheduler/download_result.hpp>
#include <fmt/format.h>

namespace TransferScheduler
{

std::string statusToString(DownloadStatus status)
{
    switch (status)
    {
    case DownloadStatus::SUCCESS:
        return "success";
    case DownloadStatus::QUEUE_FULL:
        return "queue full";
    case DownloadStatus::DOWNLOAD_NOT_FOUND:
        return "download not found";
    case DownloadStatus::ALREADY_PAUSED:
        return "already paused";
    case DownloadStatus::ALREADY_COMPLETED:
        return "already completed";
    case DownloadStatus::INVALID_STATE_TRANSITION:
        return "invalid state transition";
    case DownloadStatus::STILL_ACTIVE:
        return "still active";
    }
    return "unknown";
}

DownloadResult DownloadResult::success(DownloadId download_id)
{
    return DownloadResult(DownloadStatus::SUCCESS, download_id);
}

DownloadResult DownloadResult::queueFull(size_t capacity)
{
    DownloadResult result(DownloadStatus::QUEUE_FULL, 0);
    result.queue_capacity = capacity;
    return result;
}

DownloadResult DownloadResult::notFound(DownloadId download_id)
{
    return DownloadResult(DownloadStatus::DOWNLOAD_NOT_FOUND, download_id);
}

DownloadResult DownloadResult::alreadyPaused(DownloadId download_id)
{
    return DownloadResult(DownloadStatus::ALREADY_PAUSED, download_id);
}

DownloadResult DownloadResult::alreadyCompleted(DownloadId download_id)
{
    return DownloadResult(DownloadStatus::ALREADY_COMPLETED, download_id);
}

DownloadResult DownloadResult::invalidTransition(DownloadId download_id, DownloadState from, DownloadState to)
{
    DownloadResult result(DownloadStatus::INVALID_STATE_TRANSITION, download_id);
    result.from_state = from;
    result.to_state = to;
    return result;
}

DownloadResult DownloadResult::stillActive(DownloadId download_id, DownloadState state)
{
    DownloadResult result(DownloadStatus::STILL_ACTIVE, download_id);
    result.from_state = state;
    result.to_state = state;
    return result;
}

std::string DownloadResult::message() const
{
    switch (status_code)
    {
    case DownloadStatus::SUCCESS:
        return "success";
    case DownloadStatus::QUEUE_FULL:
        return fmt::format("download queue is full (capacity {})", queue_capacity);
    case DownloadStatus::DOWNLOAD_NOT_FOUND:
        return fmt::format("download {} not found", download_id);
    case DownloadStatus::ALREADY_PAUSED:
        return fmt::format("download {} is already paused", download_id);
    case DownloadStatus::ALREADY_COMPLETED:
        return fmt::format("download {} is already completed", download_id);
    case DownloadStatus::INVALID_STATE_TRANSITION:
        return fmt::format("download {}: invalid state transition {} -> {}", download_id, stateToString(from_state),
                           stateToString(to_state));
    case DownloadStatus::STILL_ACTIVE:
        return fmt::format("download {} is still {}", download_id, stateToString(from_state));
    }
    return "unknown";
}

} // namespace TransferScheduler
