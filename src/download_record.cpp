#include <transfer-scheduler/download_record.hpp>
#include <algorithm>
#include <fmt/format.h>
#include <utility>

namespace TransferScheduler
{

DownloadRecord::DownloadRecord(DownloadId download_id,
                               RemoteFileLocation remote,
                               LocalFileLocation local,
                               std::int64_t size,
                               DownloadPriority priority)
: download_id(download_id), remote_location(std::move(remote)), local_location(std::move(local)), total_size(size),
  expected_size(size), download_priority(priority), created_at(Clock::now())
{
}

double DownloadRecord::progress() const
{
    if (expected_size <= 0)
    {
        return 0.0;
    }
    return (static_cast<double>(downloaded_size) / static_cast<double>(expected_size)) * 100.0;
}

void DownloadRecord::updateDownloadedSize(std::int64_t size)
{
    downloaded_size = std::clamp<std::int64_t>(size, 0, std::max<std::int64_t>(expected_size, 0));
}

void DownloadRecord::updateExpectedSize(std::int64_t size)
{
    if (size > 0)
    {
        expected_size = size;
        downloaded_size = std::min(downloaded_size, expected_size);
    }
}

DownloadResult DownloadRecord::transitionTo(DownloadState new_state)
{
    if (!canTransition(current_state, new_state))
    {
        return DownloadResult::invalidTransition(download_id, current_state, new_state);
    }

    DownloadState previous = current_state;
    current_state = new_state;

    if (new_state == DownloadState::ACTIVE && previous == DownloadState::PENDING)
    {
        started_at = Clock::now();
    }
    else if (new_state == DownloadState::PENDING && previous == DownloadState::ACTIVE)
    {
        // Admission rolled back, the download never really started
        started_at.reset();
    }

    if (isTerminal(new_state))
    {
        completed_at = Clock::now();
    }

    return DownloadResult::success(download_id);
}

void DownloadRecord::setError(const std::string &message)
{
    error_message = message;
}

void DownloadRecord::clearError()
{
    error_message.reset();
}

std::string DownloadRecord::describe() const
{
    return fmt::format("download {} [{}] {}/{} bytes ({:.1f}%) priority={}", download_id, stateToString(current_state),
                       downloaded_size, expected_size, progress(), priorityToString(download_priority));
}

} // namespace TransferScheduler
