#pragma once

#include "download_record.hpp"
#include "download_result.hpp"
#include "notification_sink.hpp"
#include "resource_budget.hpp"
#include "transfer_worker.hpp"
#include <types/config.hpp>
#include <types/download_state.hpp>
#include <types/file_location.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace TransferScheduler
{

// Outcome of one processQueue() cycle
struct AdmissionSummary
{
    size_t started{};
    size_t deferred{}; // retryable worker failures, back in the queue
    size_t failed{}; // permanent worker failures
};

/**
 * Coordinates many concurrent downloads.
 *
 * Work registered with add() waits in a priority-ordered pending queue until
 * processQueue() admits it into the active set, up to
 * max_concurrent_downloads. Each admission creates one TransferWorker.
 * Progress reported through updateProgress() drives completion.
 *
 * The scheduler has no threads of its own. Every operation may be called
 * from any thread. Notifications are delivered after internal locks are
 * released.
 */
class DownloadScheduler
{
    public:
    // Throws std::invalid_argument for an invalid configuration
    explicit DownloadScheduler(const SchedulerConfig &config,
                               std::shared_ptr<NotificationSink> sink = std::make_shared<NullNotificationSink>(),
                               std::shared_ptr<TransferWorkerFactory> factory = std::make_shared<DefaultTransferWorkerFactory>());
    ~DownloadScheduler();

    DownloadScheduler(const DownloadScheduler &) = delete;
    DownloadScheduler &operator=(const DownloadScheduler &) = delete;

    // On success downloadId() holds the new id
    DownloadResult add(const RemoteFileLocation &remote,
                       const LocalFileLocation &local,
                       std::int64_t size,
                       DownloadPriority priority = DownloadPriority::NORMAL);

    DownloadResult pause(DownloadId download_id);
    DownloadResult resume(DownloadId download_id);
    DownloadResult cancel(DownloadId download_id);

    // Only for downloads that are neither pending nor active
    DownloadResult remove(DownloadId download_id);

    AdmissionSummary processQueue();

    DownloadResult updateProgress(DownloadId download_id, std::int64_t downloaded);

    // Bulk variants return the number of downloads the operation succeeded on
    size_t pauseAll();
    size_t resumeAll();
    size_t cancelAll();

    size_t clearCompleted();

    std::optional<double> progress(DownloadId download_id) const;
    std::optional<DownloadRecord> downloadInfo(DownloadId download_id) const;
    std::optional<DownloadState> state(DownloadId download_id) const;

    size_t activeCount() const;
    size_t pendingCount() const;
    size_t totalCount() const;

    std::vector<DownloadId> completedHistory() const;

    // Copies of every record, ordered by id
    std::vector<DownloadRecord> snapshot() const;

    const SchedulerConfig &config() const
    {
        return scheduler_config;
    }

    const ResourceBudget &resourceBudget() const
    {
        return resource_budget;
    }

    private:
    struct QueueEntry
    {
        DownloadId download_id;
        DownloadPriority priority;
    };

    struct ActiveTransfer
    {
        std::unique_ptr<TransferWorker> worker;
        std::shared_ptr<std::atomic<bool>> stop_flag;
    };

    using Notification = std::function<void(NotificationSink &)>;

    // Callers must hold queue_mutex exclusively
    void insertByPriorityLocked(const QueueEntry &entry);
    bool eraseFromQueueLocked(DownloadId download_id);
    bool isQueuedLocked(DownloadId download_id) const;

    // Callers must hold active_mutex exclusively
    std::unique_ptr<TransferWorker> extractWorkerLocked(DownloadId download_id);

    void failAdmission(DownloadId download_id, const std::string &reason, std::vector<Notification> &events);
    void stopWorker(std::unique_ptr<TransferWorker> worker);
    void deliver(const std::vector<Notification> &events);
    void updateGauges() const;

    SchedulerConfig scheduler_config;
    std::shared_ptr<NotificationSink> notification_sink;
    std::shared_ptr<TransferWorkerFactory> worker_factory;
    ResourceBudget resource_budget;

    std::atomic<DownloadId> next_download_id{ 1 };

    // Lock order: records, queue, active, history
    mutable std::shared_mutex records_mutex;
    std::map<DownloadId, DownloadRecord> records;

    mutable std::shared_mutex queue_mutex;
    std::deque<QueueEntry> pending_queue;

    mutable std::shared_mutex active_mutex;
    std::unordered_map<DownloadId, ActiveTransfer> active_transfers;

    mutable std::shared_mutex history_mutex;
    std::deque<DownloadId> completed_history;

    // Serializes processQueue() so concurrent callers cannot overshoot the ceiling
    std::mutex admission_mutex;
};

} // namespace TransferScheduler
