#pragma once

#include <cstdint>
#include <string>

namespace TransferScheduler
{

using DownloadId = std::uint64_t;

enum class DownloadState : std::uint8_t
{
    PENDING, // Queued, not yet admitted
    ACTIVE, // Admitted, a worker exists
    PAUSED, // Held by the caller, worker signalled to stop
    COMPLETED, // All bytes reported
    CANCELLED, // Stopped by the caller
    FAILED // Worker could not be created
};

enum class DownloadPriority : std::uint8_t
{
    LOW = 0,
    NORMAL = 1,
    HIGH = 2
};

inline bool isTerminal(DownloadState state)
{
    return state == DownloadState::COMPLETED || state == DownloadState::CANCELLED || state == DownloadState::FAILED;
}

// Transition graph. ACTIVE -> PENDING is the admission rollback and
// PAUSED -> PENDING is the resume re-queue.
inline bool canTransition(DownloadState from, DownloadState to)
{
    switch (from)
    {
    case DownloadState::PENDING:
        return to == DownloadState::ACTIVE || to == DownloadState::PAUSED || to == DownloadState::CANCELLED;
    case DownloadState::ACTIVE:
        return to == DownloadState::PAUSED || to == DownloadState::COMPLETED || to == DownloadState::CANCELLED ||
               to == DownloadState::FAILED || to == DownloadState::PENDING;
    case DownloadState::PAUSED:
        // ACTIVE only via updateProgress reaching 100% on a paused download
        return to == DownloadState::ACTIVE || to == DownloadState::PENDING || to == DownloadState::CANCELLED;
    case DownloadState::COMPLETED:
    case DownloadState::CANCELLED:
    case DownloadState::FAILED:
        return false;
    }
    return false;
}

inline std::string stateToString(DownloadState state)
{
    switch (state)
    {
    case DownloadState::PENDING:
        return "pending";
    case DownloadState::ACTIVE:
        return "active";
    case DownloadState::PAUSED:
        return "paused";
    case DownloadState::COMPLETED:
        return "completed";
    case DownloadState::CANCELLED:
        return "cancelled";
    case DownloadState::FAILED:
        return "failed";
    }
    return "unknown";
}

inline std::string priorityToString(DownloadPriority priority)
{
    switch (priority)
    {
    case DownloadPriority::LOW:
        return "low";
    case DownloadPriority::NORMAL:
        return "normal";
    case DownloadPriority::HIGH:
        return "high";
    }
    return "unknown";
}

} // namespace TransferScheduler
