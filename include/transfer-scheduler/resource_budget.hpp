#pragma once

#include <types/download_state.hpp>
#include <atomic>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace TransferScheduler
{

enum class ResourceType : std::uint8_t
{
    DOWNLOAD = 0,
    UPLOAD = 1,
    GENERATE = 2
};

std::string resourceTypeToString(ResourceType type);
std::optional<ResourceType> parseResourceType(const std::string &name);

struct ResourceRequest
{
    std::uint64_t request_id{};
    ResourceType type{ ResourceType::DOWNLOAD };
    DownloadPriority priority{ DownloadPriority::NORMAL };
    std::uint64_t size{};
};

/**
 * Aggregate bandwidth and concurrency limits shared by every transfer kind.
 *
 * A request is granted immediately while the total number of active
 * resources is below the concurrency limit, otherwise it waits in a queue
 * ordered by priority (arrival order within a priority). Freeing a slot
 * with releaseResourceType() promotes waiting requests.
 */
class ResourceBudget
{
    public:
    static constexpr size_t DEFAULT_MAX_CONCURRENT = 8;

    // A bandwidth of 0 means unlimited. max_concurrent is raised to at least 1.
    explicit ResourceBudget(std::uint64_t max_download_bandwidth = 0,
                            size_t max_concurrent = DEFAULT_MAX_CONCURRENT,
                            std::uint64_t max_upload_bandwidth = 0);

    // True when granted immediately, false when queued
    bool requestResource(const ResourceRequest &request);

    // Drops a queued request. Returns false if no such request is waiting.
    bool releaseResource(std::uint64_t request_id);

    // Frees one active slot of the given type, then promotes queued requests
    void releaseResourceType(ResourceType type);

    size_t activeCount(ResourceType type) const;
    size_t totalActive() const;
    size_t queuedCount() const;
    bool canStart(ResourceType type) const;

    // nullopt means unlimited; GENERATE is never limited
    std::optional<std::uint64_t> bandwidthLimit(ResourceType type) const;

    size_t maxConcurrent() const;
    void clearQueue();

    static std::uint64_t nextRequestId();

    private:
    bool canStartLocked() const;
    void incrementActiveLocked(ResourceType type);
    void promoteQueuedLocked();

    mutable std::shared_mutex budget_mutex;
    std::optional<std::uint64_t> max_download_speed;
    std::optional<std::uint64_t> max_upload_speed;
    size_t max_concurrent;
    size_t active_downloads{};
    size_t active_uploads{};
    size_t active_generates{};
    std::vector<ResourceRequest> waiting_requests;

    static std::atomic<std::uint64_t> next_request_id;
};

} // namespace TransferScheduler
