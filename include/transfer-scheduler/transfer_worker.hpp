#pragma once

#include <types/download_state.hpp>
#include <types/file_location.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace TransferScheduler
{

// Everything a worker needs to move the bytes of one admitted download
struct TransferRequest
{
    DownloadId download_id{};
    RemoteFileLocation remote;
    LocalFileLocation local;
    std::int64_t expected_size{};
    DownloadPriority priority{ DownloadPriority::NORMAL };
};

/**
 * Handle for the out-of-band transfer of one download.
 *
 * The scheduler only keeps the handle alive while the download is active and
 * asks it to stop on pause or cancel. Progress is reported back through
 * DownloadScheduler::updateProgress.
 */
class TransferWorker
{
    public:
    TransferWorker(TransferRequest request, std::shared_ptr<std::atomic<bool>> stop_flag);
    virtual ~TransferWorker() = default;

    TransferWorker(const TransferWorker &) = delete;
    TransferWorker &operator=(const TransferWorker &) = delete;

    // Sets the shared stop flag, then runs onStopRequested() once
    void requestStop();

    bool isStopRequested() const;

    const TransferRequest &request() const
    {
        return transfer_request;
    }

    DownloadId downloadId() const
    {
        return transfer_request.download_id;
    }

    protected:
    virtual void onStopRequested()
    {
    }

    private:
    TransferRequest transfer_request;
    std::shared_ptr<std::atomic<bool>> stop_flag;
};

/**
 * Thrown by a factory when a worker cannot be created. A retryable failure
 * sends the download back to the pending queue, anything else fails it.
 */
class WorkerCreationError : public std::runtime_error
{
    public:
    WorkerCreationError(const std::string &message, bool retryable) : std::runtime_error(message), retryable(retryable)
    {
    }

    bool isRetryable() const
    {
        return retryable;
    }

    private:
    bool retryable;
};

class TransferWorkerFactory
{
    public:
    virtual ~TransferWorkerFactory() = default;

    virtual std::unique_ptr<TransferWorker> createWorker(const TransferRequest &request,
                                                         std::shared_ptr<std::atomic<bool>> stop_flag) = 0;
};

// Validates the request and hands out plain TransferWorker handles
class DefaultTransferWorkerFactory : public TransferWorkerFactory
{
    public:
    std::unique_ptr<TransferWorker> createWorker(const TransferRequest &request,
                                                 std::shared_ptr<std::atomic<bool>> stop_flag) override;
};

} // namespace TransferScheduler
