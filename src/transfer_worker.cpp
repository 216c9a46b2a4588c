#include <transfer-scheduler/transfer_worker.hpp>
#include <transfer-scheduler/logger.hpp>
#include <fmt/format.h>
#include <utility>

namespace TransferScheduler
{

TransferWorker::TransferWorker(TransferRequest request, std::shared_ptr<std::atomic<bool>> stop_flag)
: transfer_request(std::move(request)), stop_flag(std::move(stop_flag))
{
    if (!this->stop_flag)
    {
        this->stop_flag = std::make_shared<std::atomic<bool>>(false);
    }
}

void TransferWorker::requestStop()
{
    if (stop_flag->exchange(true))
    {
        return;
    }

    Logger::debug(LogCategory::TRANSFER, "Stop requested for download {}", transfer_request.download_id);
    onStopRequested();
}

bool TransferWorker::isStopRequested() const
{
    return stop_flag->load();
}

std::unique_ptr<TransferWorker> DefaultTransferWorkerFactory::createWorker(const TransferRequest &request,
                                                                           std::shared_ptr<std::atomic<bool>> stop_flag)
{
    if (request.remote.isEmpty())
    {
        throw WorkerCreationError(fmt::format("download {} has no remote location", request.download_id), false);
    }

    if (request.expected_size < 0)
    {
        throw WorkerCreationError(
        fmt::format("download {} has negative size {}", request.download_id, request.expected_size), false);
    }

    return std::make_unique<TransferWorker>(request, std::move(stop_flag));
}

} // namespace TransferScheduler
