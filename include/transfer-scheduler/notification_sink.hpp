#pragma once

#include <types/download_state.hpp>
#include <cstdint>
#include <string>

namespace TransferScheduler
{

/**
 * Receives download lifecycle events from the scheduler.
 *
 * Events are delivered on the thread that caused them, after the scheduler
 * has released its locks, so an implementation may call back into the
 * scheduler. Implementations must not block for long.
 */
class NotificationSink
{
    public:
    virtual ~NotificationSink() = default;

    virtual void onAdded(DownloadId /*download_id*/)
    {
    }

    virtual void onStarted(DownloadId /*download_id*/)
    {
    }

    virtual void onPaused(DownloadId /*download_id*/)
    {
    }

    virtual void onResumed(DownloadId /*download_id*/)
    {
    }

    virtual void onCancelled(DownloadId /*download_id*/)
    {
    }

    virtual void onRemoved(DownloadId /*download_id*/)
    {
    }

    virtual void onCompleted(DownloadId /*download_id*/)
    {
    }

    virtual void onFailed(DownloadId /*download_id*/, const std::string & /*reason*/)
    {
    }

    virtual void onProgress(DownloadId /*download_id*/, std::int64_t /*downloaded*/, std::int64_t /*expected*/, double /*percent*/)
    {
    }
};

// Default listener, drops everything
class NullNotificationSink : public NotificationSink
{
};

} // namespace TransferScheduler
