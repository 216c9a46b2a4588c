#pragma once

#include "download_result.hpp"
#include <types/download_state.hpp>
#include <types/file_location.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace TransferScheduler
{

class DownloadRecord
{
    public:
    using Clock = std::chrono::system_clock;

    DownloadRecord(DownloadId download_id,
                   RemoteFileLocation remote,
                   LocalFileLocation local,
                   std::int64_t size,
                   DownloadPriority priority);

    DownloadId downloadId() const
    {
        return download_id;
    }

    const RemoteFileLocation &remote() const
    {
        return remote_location;
    }

    const LocalFileLocation &local() const
    {
        return local_location;
    }

    std::int64_t size() const
    {
        return total_size;
    }

    std::int64_t expectedSize() const
    {
        return expected_size;
    }

    std::int64_t downloadedSize() const
    {
        return downloaded_size;
    }

    DownloadPriority priority() const
    {
        return download_priority;
    }

    DownloadState state() const
    {
        return current_state;
    }

    Clock::time_point createdAt() const
    {
        return created_at;
    }

    std::optional<Clock::time_point> startedAt() const
    {
        return started_at;
    }

    std::optional<Clock::time_point> completedAt() const
    {
        return completed_at;
    }

    const std::optional<std::string> &errorMessage() const
    {
        return error_message;
    }

    bool isPending() const
    {
        return current_state == DownloadState::PENDING;
    }

    bool isActive() const
    {
        return current_state == DownloadState::ACTIVE;
    }

    bool isPaused() const
    {
        return current_state == DownloadState::PAUSED;
    }

    bool isCompleted() const
    {
        return current_state == DownloadState::COMPLETED;
    }

    bool isCancelled() const
    {
        return current_state == DownloadState::CANCELLED;
    }

    bool isFailed() const
    {
        return current_state == DownloadState::FAILED;
    }

    // 0.0 - 100.0, always 0 for downloads without a known size
    double progress() const;

    // Clamped to [0, expected size]
    void updateDownloadedSize(std::int64_t size);

    // Ignored unless positive
    void updateExpectedSize(std::int64_t size);

    // Fails with INVALID_STATE_TRANSITION and leaves the record untouched
    // when the target is not reachable from the current state.
    DownloadResult transitionTo(DownloadState new_state);

    void setError(const std::string &message);
    void clearError();

    std::string describe() const;

    private:
    DownloadId download_id;
    RemoteFileLocation remote_location;
    LocalFileLocation local_location;
    std::int64_t total_size;
    std::int64_t expected_size;
    std::int64_t downloaded_size{};
    DownloadPriority download_priority;
    DownloadState current_state{ DownloadState::PENDING };

    Clock::time_point created_at;
    std::optional<Clock::time_point> started_at;
    std::optional<Clock::time_point> completed_at;
    std::optional<std::string> error_message;
};

} // namespace TransferScheduler
