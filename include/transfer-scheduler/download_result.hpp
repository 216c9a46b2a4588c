#pragma once

#include <types/download_state.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace TransferScheduler
{

enum class DownloadStatus : std::uint8_t
{
    SUCCESS = 0,
    QUEUE_FULL, // Admission rejected, retry later or drop the request
    DOWNLOAD_NOT_FOUND, // Unknown or already removed id
    ALREADY_PAUSED,
    ALREADY_COMPLETED,
    INVALID_STATE_TRANSITION,
    STILL_ACTIVE // remove() on a pending or active download
};

std::string statusToString(DownloadStatus status);

/**
 * Outcome of a scheduler operation.
 *
 * Carries the status code plus whatever context the failure has: the
 * download id, the queue capacity for QUEUE_FULL, the attempted transition
 * for INVALID_STATE_TRANSITION. add() also reports the allocated id here.
 */
class DownloadResult
{
    public:
    static DownloadResult success(DownloadId download_id = 0);
    static DownloadResult queueFull(size_t capacity);
    static DownloadResult notFound(DownloadId download_id);
    static DownloadResult alreadyPaused(DownloadId download_id);
    static DownloadResult alreadyCompleted(DownloadId download_id);
    static DownloadResult invalidTransition(DownloadId download_id, DownloadState from, DownloadState to);
    static DownloadResult stillActive(DownloadId download_id, DownloadState state);

    bool ok() const
    {
        return status_code == DownloadStatus::SUCCESS;
    }

    DownloadStatus status() const
    {
        return status_code;
    }

    DownloadId downloadId() const
    {
        return download_id;
    }

    size_t capacity() const
    {
        return queue_capacity;
    }

    DownloadState fromState() const
    {
        return from_state;
    }

    DownloadState toState() const
    {
        return to_state;
    }

    std::string message() const;

    private:
    DownloadResult(DownloadStatus status, DownloadId id) : status_code(status), download_id(id)
    {
    }

    DownloadStatus status_code{ DownloadStatus::SUCCESS };
    DownloadId download_id{};
    size_t queue_capacity{};
    DownloadState from_state{ DownloadState::PENDING };
    DownloadState to_state{ DownloadState::PENDING };
};

} // namespace TransferScheduler
