#include <transfer-scheduler/resource_budget.hpp>
#include <transfer-scheduler/logger.hpp>
#include <algorithm>
#include <mutex>

namespace TransferScheduler
{

std::atomic<std::uint64_t> ResourceBudget::next_request_id{ 1 };

std::string resourceTypeToString(ResourceType type)
{
    switch (type)
    {
    case ResourceType::DOWNLOAD:
        return "download";
    case ResourceType::UPLOAD:
        return "upload";
    case ResourceType::GENERATE:
        return "generate";
    }
    return "unknown";
}

std::optional<ResourceType> parseResourceType(const std::string &name)
{
    if (name == "download")
    {
        return ResourceType::DOWNLOAD;
    }
    if (name == "upload")
    {
        return ResourceType::UPLOAD;
    }
    if (name == "generate")
    {
        return ResourceType::GENERATE;
    }
    return std::nullopt;
}

ResourceBudget::ResourceBudget(std::uint64_t max_download_bandwidth, size_t max_concurrent, std::uint64_t max_upload_bandwidth)
: max_concurrent(std::max<size_t>(max_concurrent, 1))
{
    if (max_download_bandwidth > 0)
    {
        max_download_speed = max_download_bandwidth;
    }
    if (max_upload_bandwidth > 0)
    {
        max_upload_speed = max_upload_bandwidth;
    }

    Logger::debug(LogCategory::BUDGET, "Resource budget: max_concurrent={}, download_limit={}, upload_limit={}",
                  this->max_concurrent, max_download_bandwidth, max_upload_bandwidth);
}

bool ResourceBudget::requestResource(const ResourceRequest &request)
{
    std::unique_lock<std::shared_mutex> lock(budget_mutex);

    if (canStartLocked())
    {
        incrementActiveLocked(request.type);
        Logger::trace(LogCategory::BUDGET, "Granted {} request {}", resourceTypeToString(request.type), request.request_id);
        return true;
    }

    // Insert after every request of equal or higher priority
    auto pos = std::find_if(waiting_requests.begin(), waiting_requests.end(),
                            [&request](const ResourceRequest &queued)
                            {
                                return queued.priority < request.priority;
                            });
    waiting_requests.insert(pos, request);

    Logger::debug(LogCategory::BUDGET, "Queued {} request {} ({} waiting)", resourceTypeToString(request.type),
                  request.request_id, waiting_requests.size());
    return false;
}

bool ResourceBudget::releaseResource(std::uint64_t request_id)
{
    std::unique_lock<std::shared_mutex> lock(budget_mutex);

    auto it = std::find_if(waiting_requests.begin(), waiting_requests.end(),
                           [request_id](const ResourceRequest &queued)
                           {
                               return queued.request_id == request_id;
                           });
    if (it == waiting_requests.end())
    {
        return false;
    }

    waiting_requests.erase(it);
    promoteQueuedLocked();
    return true;
}

void ResourceBudget::releaseResourceType(ResourceType type)
{
    std::unique_lock<std::shared_mutex> lock(budget_mutex);

    switch (type)
    {
    case ResourceType::DOWNLOAD:
        if (active_downloads > 0)
        {
            --active_downloads;
        }
        break;
    case ResourceType::UPLOAD:
        if (active_uploads > 0)
        {
            --active_uploads;
        }
        break;
    case ResourceType::GENERATE:
        if (active_generates > 0)
        {
            --active_generates;
        }
        break;
    }

    promoteQueuedLocked();
}

size_t ResourceBudget::activeCount(ResourceType type) const
{
    std::shared_lock<std::shared_mutex> lock(budget_mutex);

    switch (type)
    {
    case ResourceType::DOWNLOAD:
        return active_downloads;
    case ResourceType::UPLOAD:
        return active_uploads;
    case ResourceType::GENERATE:
        return active_generates;
    }
    return 0;
}

size_t ResourceBudget::totalActive() const
{
    std::shared_lock<std::shared_mutex> lock(budget_mutex);
    return active_downloads + active_uploads + active_generates;
}

size_t ResourceBudget::queuedCount() const
{
    std::shared_lock<std::shared_mutex> lock(budget_mutex);
    return waiting_requests.size();
}

bool ResourceBudget::canStart(ResourceType /*type*/) const
{
    std::shared_lock<std::shared_mutex> lock(budget_mutex);
    return canStartLocked();
}

std::optional<std::uint64_t> ResourceBudget::bandwidthLimit(ResourceType type) const
{
    std::shared_lock<std::shared_mutex> lock(budget_mutex);

    switch (type)
    {
    case ResourceType::DOWNLOAD:
        return max_download_speed;
    case ResourceType::UPLOAD:
        return max_upload_speed;
    case ResourceType::GENERATE:
        return std::nullopt;
    }
    return std::nullopt;
}

size_t ResourceBudget::maxConcurrent() const
{
    std::shared_lock<std::shared_mutex> lock(budget_mutex);
    return max_concurrent;
}

void ResourceBudget::clearQueue()
{
    std::unique_lock<std::shared_mutex> lock(budget_mutex);
    waiting_requests.clear();
}

std::uint64_t ResourceBudget::nextRequestId()
{
    return next_request_id.fetch_add(1);
}

bool ResourceBudget::canStartLocked() const
{
    return active_downloads + active_uploads + active_generates < max_concurrent;
}

void ResourceBudget::incrementActiveLocked(ResourceType type)
{
    switch (type)
    {
    case ResourceType::DOWNLOAD:
        ++active_downloads;
        break;
    case ResourceType::UPLOAD:
        ++active_uploads;
        break;
    case ResourceType::GENERATE:
        ++active_generates;
        break;
    }
}

void ResourceBudget::promoteQueuedLocked()
{
    while (!waiting_requests.empty() && canStartLocked())
    {
        const ResourceRequest next = waiting_requests.front();
        waiting_requests.erase(waiting_requests.begin());
        incrementActiveLocked(next.type);
        Logger::debug(LogCategory::BUDGET, "Promoted queued {} request {}", resourceTypeToString(next.type), next.request_id);
    }
}

} // namespace TransferScheduler
