#include <transfer-scheduler/download_scheduler.hpp>
#include <transfer-scheduler/config_parser.hpp>
#include <transfer-scheduler/logger.hpp>
#include <transfer-scheduler/metrics_collector.hpp>
#include <algorithm>
#include <stdexcept>

namespace TransferScheduler
{

DownloadScheduler::DownloadScheduler(const SchedulerConfig &config,
                                     std::shared_ptr<NotificationSink> sink,
                                     std::shared_ptr<TransferWorkerFactory> factory)
: scheduler_config(config), notification_sink(std::move(sink)), worker_factory(std::move(factory)),
  resource_budget(config.max_bandwidth, config.max_concurrent_downloads)
{
    if (auto problem = ConfigParser::validate(config))
    {
        throw std::invalid_argument("Invalid scheduler configuration: " + *problem);
    }

    if (!notification_sink)
    {
        notification_sink = std::make_shared<NullNotificationSink>();
    }
    if (!worker_factory)
    {
        worker_factory = std::make_shared<DefaultTransferWorkerFactory>();
    }

    Logger::info(LogCategory::GENERAL, "Download scheduler created: max_concurrent={}, queue_size={}, history={}",
                 scheduler_config.max_concurrent_downloads, scheduler_config.queue_size,
                 scheduler_config.max_completed_history);
}

DownloadScheduler::~DownloadScheduler()
{
    std::unordered_map<DownloadId, ActiveTransfer> remaining;
    {
        std::unique_lock<std::shared_mutex> lock(active_mutex);
        remaining.swap(active_transfers);
    }

    for (auto &[id, transfer] : remaining)
    {
        stopWorker(std::move(transfer.worker));
    }
}

DownloadResult DownloadScheduler::add(const RemoteFileLocation &remote,
                                      const LocalFileLocation &local,
                                      std::int64_t size,
                                      DownloadPriority priority)
{
    DownloadId download_id = 0;
    size_t queued = 0;
    {
        std::unique_lock<std::shared_mutex> records_lock(records_mutex);
        std::unique_lock<std::shared_mutex> queue_lock(queue_mutex);

        if (pending_queue.size() >= scheduler_config.queue_size)
        {
            queue_lock.unlock();
            records_lock.unlock();

            Logger::warn(LogCategory::QUEUE, "Queue full ({} entries), rejecting download", scheduler_config.queue_size);
            GlobalMetrics::instance().recordDownloadRejected();
            return DownloadResult::queueFull(scheduler_config.queue_size);
        }

        download_id = next_download_id.fetch_add(1);
        records.emplace(download_id, DownloadRecord(download_id, remote, local, size, priority));
        insertByPriorityLocked({ download_id, priority });
        queued = pending_queue.size();
    }

    Logger::debug(LogCategory::QUEUE, "Download {} queued with {} priority ({} pending)", download_id,
                  priorityToString(priority), queued);
    GlobalMetrics::instance().recordDownloadQueued();
    updateGauges();

    notification_sink->onAdded(download_id);
    return DownloadResult::success(download_id);
}

DownloadResult DownloadScheduler::pause(DownloadId download_id)
{
    std::unique_ptr<TransferWorker> worker;
    {
        std::unique_lock<std::shared_mutex> records_lock(records_mutex);

        auto it = records.find(download_id);
        if (it == records.end())
        {
            Logger::debug(LogCategory::GENERAL, "pause: download {} not found", download_id);
            return DownloadResult::notFound(download_id);
        }

        DownloadRecord &record = it->second;
        if (record.isPaused())
        {
            return DownloadResult::alreadyPaused(download_id);
        }
        if (record.isCompleted())
        {
            return DownloadResult::alreadyCompleted(download_id);
        }

        const bool was_active = record.isActive();
        DownloadResult result = record.transitionTo(DownloadState::PAUSED);
        if (!result.ok())
        {
            Logger::debug(LogCategory::GENERAL, "pause: {}", result.message());
            return result;
        }

        if (was_active)
        {
            std::unique_lock<std::shared_mutex> active_lock(active_mutex);
            worker = extractWorkerLocked(download_id);
        }
    }

    stopWorker(std::move(worker));

    Logger::info(LogCategory::GENERAL, "Download {} paused", download_id);
    GlobalMetrics::instance().recordDownloadPaused();
    updateGauges();

    notification_sink->onPaused(download_id);
    return DownloadResult::success(download_id);
}

DownloadResult DownloadScheduler::resume(DownloadId download_id)
{
    {
        std::unique_lock<std::shared_mutex> records_lock(records_mutex);

        auto it = records.find(download_id);
        if (it == records.end())
        {
            Logger::debug(LogCategory::GENERAL, "resume: download {} not found", download_id);
            return DownloadResult::notFound(download_id);
        }

        DownloadRecord &record = it->second;
        if (!record.isPaused())
        {
            return DownloadResult::invalidTransition(download_id, record.state(), DownloadState::ACTIVE);
        }

        DownloadResult result = record.transitionTo(DownloadState::PENDING);
        if (!result.ok())
        {
            return result;
        }

        std::unique_lock<std::shared_mutex> queue_lock(queue_mutex);
        if (!isQueuedLocked(download_id))
        {
            if (scheduler_config.requeue_resumed_by_priority)
            {
                insertByPriorityLocked({ download_id, record.priority() });
            }
            else
            {
                pending_queue.push_back({ download_id, record.priority() });
            }
        }
    }

    Logger::info(LogCategory::GENERAL, "Download {} resumed", download_id);
    GlobalMetrics::instance().recordDownloadResumed();
    updateGauges();

    notification_sink->onResumed(download_id);
    return DownloadResult::success(download_id);
}

DownloadResult DownloadScheduler::cancel(DownloadId download_id)
{
    std::unique_ptr<TransferWorker> worker;
    {
        std::unique_lock<std::shared_mutex> records_lock(records_mutex);

        auto it = records.find(download_id);
        if (it == records.end())
        {
            Logger::debug(LogCategory::GENERAL, "cancel: download {} not found", download_id);
            return DownloadResult::notFound(download_id);
        }

        DownloadRecord &record = it->second;
        if (record.isCompleted())
        {
            return DownloadResult::alreadyCompleted(download_id);
        }

        {
            std::unique_lock<std::shared_mutex> queue_lock(queue_mutex);
            eraseFromQueueLocked(download_id);
        }
        {
            std::unique_lock<std::shared_mutex> active_lock(active_mutex);
            worker = extractWorkerLocked(download_id);
        }

        DownloadResult result = record.transitionTo(DownloadState::CANCELLED);
        if (!result.ok())
        {
            records_lock.unlock();
            stopWorker(std::move(worker));
            Logger::debug(LogCategory::GENERAL, "cancel: {}", result.message());
            return result;
        }
    }

    stopWorker(std::move(worker));

    Logger::info(LogCategory::GENERAL, "Download {} cancelled", download_id);
    GlobalMetrics::instance().recordDownloadCancelled();
    updateGauges();

    notification_sink->onCancelled(download_id);
    return DownloadResult::success(download_id);
}

DownloadResult DownloadScheduler::remove(DownloadId download_id)
{
    {
        std::unique_lock<std::shared_mutex> records_lock(records_mutex);

        auto it = records.find(download_id);
        if (it == records.end())
        {
            return DownloadResult::notFound(download_id);
        }

        if (it->second.isPending() || it->second.isActive())
        {
            Logger::debug(LogCategory::GENERAL, "remove: download {} is still {}", download_id,
                          stateToString(it->second.state()));
            return DownloadResult::stillActive(download_id, it->second.state());
        }

        records.erase(it);

        {
            std::unique_lock<std::shared_mutex> queue_lock(queue_mutex);
            eraseFromQueueLocked(download_id);
        }
        {
            std::unique_lock<std::shared_mutex> history_lock(history_mutex);
            completed_history.erase(std::remove(completed_history.begin(), completed_history.end(), download_id),
                                    completed_history.end());
        }
    }

    Logger::debug(LogCategory::GENERAL, "Download {} removed", download_id);
    updateGauges();

    notification_sink->onRemoved(download_id);
    return DownloadResult::success(download_id);
}

AdmissionSummary DownloadScheduler::processQueue()
{
    std::lock_guard<std::mutex> admission_lock(admission_mutex);

    AdmissionSummary summary;
    const size_t active = activeCount();
    if (active >= scheduler_config.max_concurrent_downloads)
    {
        Logger::trace(LogCategory::ADMISSION, "No free slots ({} active)", active);
        return summary;
    }

    const size_t available = scheduler_config.max_concurrent_downloads - active;
    std::vector<QueueEntry> deferred;
    std::vector<Notification> events;

    while (summary.started < available)
    {
        QueueEntry entry{};
        {
            std::unique_lock<std::shared_mutex> queue_lock(queue_mutex);
            if (pending_queue.empty())
            {
                break;
            }
            entry = pending_queue.front();
            pending_queue.pop_front();
        }

        TransferRequest request;
        {
            std::unique_lock<std::shared_mutex> records_lock(records_mutex);

            auto it = records.find(entry.download_id);
            if (it == records.end())
            {
                continue;
            }

            DownloadRecord &record = it->second;
            if (record.isPaused())
            {
                Logger::trace(LogCategory::ADMISSION, "Dropping paused download {} from the queue", entry.download_id);
                continue;
            }

            if (!record.transitionTo(DownloadState::ACTIVE).ok())
            {
                Logger::trace(LogCategory::ADMISSION, "Skipping download {} in state {}", entry.download_id,
                              stateToString(record.state()));
                continue;
            }

            request.download_id = record.downloadId();
            request.remote = record.remote();
            request.local = record.local();
            request.expected_size = record.expectedSize();
            request.priority = record.priority();
        }

        auto stop_flag = std::make_shared<std::atomic<bool>>(false);
        std::unique_ptr<TransferWorker> worker;
        try
        {
            worker = worker_factory->createWorker(request, stop_flag);
            if (!worker)
            {
                throw WorkerCreationError("worker factory returned no worker", false);
            }
        }
        catch (const WorkerCreationError &e)
        {
            if (e.isRetryable())
            {
                Logger::warn(LogCategory::TRANSFER, "Worker for download {} unavailable, deferring: {}",
                             request.download_id, e.what());

                std::unique_lock<std::shared_mutex> records_lock(records_mutex);
                auto it = records.find(request.download_id);
                if (it != records.end() && it->second.isActive() &&
                    it->second.transitionTo(DownloadState::PENDING).ok())
                {
                    deferred.push_back(entry);
                    ++summary.deferred;
                    GlobalMetrics::instance().recordDownloadDeferred();
                }
                continue;
            }

            failAdmission(request.download_id, e.what(), events);
            ++summary.failed;
            GlobalMetrics::instance().recordDownloadFailed("worker_rejected");
            continue;
        }
        catch (const std::exception &e)
        {
            failAdmission(request.download_id, e.what(), events);
            ++summary.failed;
            GlobalMetrics::instance().recordDownloadFailed("worker_error");
            continue;
        }

        bool registered = false;
        {
            std::unique_lock<std::shared_mutex> records_lock(records_mutex);
            auto it = records.find(request.download_id);
            if (it != records.end() && it->second.isActive())
            {
                std::unique_lock<std::shared_mutex> active_lock(active_mutex);
                active_transfers.emplace(request.download_id, ActiveTransfer{ std::move(worker), stop_flag });
                registered = true;
            }
        }

        if (!registered)
        {
            // Paused or cancelled while the worker was being created
            Logger::debug(LogCategory::ADMISSION, "Download {} left the active state during admission", request.download_id);
            stopWorker(std::move(worker));
            continue;
        }

        ++summary.started;
        GlobalMetrics::instance().recordDownloadStarted();
        Logger::info(LogCategory::ADMISSION, "Download {} started", request.download_id);

        const DownloadId started_id = request.download_id;
        events.emplace_back(
        [started_id](NotificationSink &sink)
        {
            sink.onStarted(started_id);
        });
    }

    if (!deferred.empty())
    {
        std::unique_lock<std::shared_mutex> records_lock(records_mutex);
        std::unique_lock<std::shared_mutex> queue_lock(queue_mutex);
        for (const auto &entry : deferred)
        {
            // Cancelled, paused or already re-queued by resume while this cycle ran
            auto it = records.find(entry.download_id);
            if (it == records.end() || !it->second.isPending() || isQueuedLocked(entry.download_id))
            {
                continue;
            }
            insertByPriorityLocked(entry);
        }
    }

    if (summary.started > 0 || summary.deferred > 0 || summary.failed > 0)
    {
        Logger::debug(LogCategory::ADMISSION, "Admission cycle: started={}, deferred={}, failed={}", summary.started,
                      summary.deferred, summary.failed);
        updateGauges();
    }

    deliver(events);
    return summary;
}

DownloadResult DownloadScheduler::updateProgress(DownloadId download_id, std::int64_t downloaded)
{
    std::unique_ptr<TransferWorker> finished_worker;
    std::vector<DownloadId> evicted;
    bool completed = false;
    double duration_seconds = 0.0;
    std::int64_t reported = 0;
    std::int64_t expected = 0;
    double percent = 0.0;
    std::int64_t delta = 0;

    {
        std::unique_lock<std::shared_mutex> records_lock(records_mutex);

        auto it = records.find(download_id);
        if (it == records.end())
        {
            return DownloadResult::notFound(download_id);
        }

        DownloadRecord &record = it->second;
        if (record.isCompleted())
        {
            return DownloadResult::success(download_id);
        }

        const std::int64_t previous = record.downloadedSize();
        record.updateDownloadedSize(downloaded);
        reported = record.downloadedSize();
        expected = record.expectedSize();
        percent = record.progress();
        delta = reported - previous;

        if (percent >= 100.0)
        {
            if (record.isPending() || record.isPaused())
            {
                DownloadResult promoted = record.transitionTo(DownloadState::ACTIVE);
                if (!promoted.ok())
                {
                    return promoted;
                }
                std::unique_lock<std::shared_mutex> queue_lock(queue_mutex);
                eraseFromQueueLocked(download_id);
            }

            // Cancelled and failed records keep the counter but never complete
            DownloadResult result = record.transitionTo(DownloadState::COMPLETED);
            if (!result.ok())
            {
                Logger::debug(LogCategory::PROGRESS, "updateProgress: {}", result.message());
                return result;
            }
            completed = true;

            if (record.startedAt() && record.completedAt())
            {
                duration_seconds = std::chrono::duration<double>(*record.completedAt() - *record.startedAt()).count();
            }

            {
                std::unique_lock<std::shared_mutex> active_lock(active_mutex);
                finished_worker = extractWorkerLocked(download_id);
            }

            {
                std::unique_lock<std::shared_mutex> history_lock(history_mutex);
                completed_history.push_back(download_id);

                if (scheduler_config.auto_remove_completed &&
                    completed_history.size() > scheduler_config.max_completed_history)
                {
                    const size_t excess = completed_history.size() - scheduler_config.max_completed_history;
                    evicted.assign(completed_history.begin(), completed_history.begin() + excess);
                    completed_history.erase(completed_history.begin(), completed_history.begin() + excess);
                }
            }

            for (DownloadId old_id : evicted)
            {
                records.erase(old_id);
            }
        }
    }

    if (delta > 0)
    {
        GlobalMetrics::instance().recordBytesReported(static_cast<std::uint64_t>(delta));
    }

    if (!completed)
    {
        Logger::trace(LogCategory::PROGRESS, "Download {} at {:.1f}% ({}/{})", download_id, percent, reported, expected);
        notification_sink->onProgress(download_id, reported, expected, percent);
        return DownloadResult::success(download_id);
    }

    // The worker finished on its own, dropping the handle is enough
    finished_worker.reset();

    Logger::info(LogCategory::PROGRESS, "Download {} completed ({} bytes)", download_id, reported);
    if (!evicted.empty())
    {
        Logger::debug(LogCategory::PROGRESS, "Evicted {} downloads from completion history", evicted.size());
    }
    GlobalMetrics::instance().recordDownloadCompleted(duration_seconds);
    GlobalMetrics::instance().recordHistoryEvictions(evicted.size());
    updateGauges();

    notification_sink->onCompleted(download_id);
    return DownloadResult::success(download_id);
}

size_t DownloadScheduler::pauseAll()
{
    std::vector<DownloadId> eligible;
    {
        std::shared_lock<std::shared_mutex> lock(records_mutex);
        for (const auto &[id, record] : records)
        {
            if (record.isPending() || record.isActive())
            {
                eligible.push_back(id);
            }
        }
    }

    size_t paused = 0;
    for (DownloadId id : eligible)
    {
        if (pause(id).ok())
        {
            ++paused;
        }
    }
    return paused;
}

size_t DownloadScheduler::resumeAll()
{
    std::vector<DownloadId> eligible;
    {
        std::shared_lock<std::shared_mutex> lock(records_mutex);
        for (const auto &[id, record] : records)
        {
            if (record.isPaused())
            {
                eligible.push_back(id);
            }
        }
    }

    size_t resumed = 0;
    for (DownloadId id : eligible)
    {
        if (resume(id).ok())
        {
            ++resumed;
        }
    }
    return resumed;
}

size_t DownloadScheduler::cancelAll()
{
    std::vector<DownloadId> eligible;
    {
        std::shared_lock<std::shared_mutex> lock(records_mutex);
        for (const auto &entry : records)
        {
            eligible.push_back(entry.first);
        }
    }

    size_t cancelled = 0;
    for (DownloadId id : eligible)
    {
        if (cancel(id).ok())
        {
            ++cancelled;
        }
    }
    return cancelled;
}

size_t DownloadScheduler::clearCompleted()
{
    size_t cleared = 0;
    {
        std::unique_lock<std::shared_mutex> records_lock(records_mutex);
        std::unique_lock<std::shared_mutex> history_lock(history_mutex);

        auto keep = completed_history.begin();
        for (auto it = completed_history.begin(); it != completed_history.end(); ++it)
        {
            auto record = records.find(*it);
            if (record != records.end() && record->second.isCompleted())
            {
                records.erase(record);
                ++cleared;
            }
            else
            {
                *keep++ = *it;
            }
        }
        completed_history.erase(keep, completed_history.end());
    }

    if (cleared > 0)
    {
        Logger::debug(LogCategory::GENERAL, "Cleared {} completed downloads", cleared);
        updateGauges();
    }
    return cleared;
}

std::optional<double> DownloadScheduler::progress(DownloadId download_id) const
{
    std::shared_lock<std::shared_mutex> lock(records_mutex);
    auto it = records.find(download_id);
    if (it == records.end())
    {
        return std::nullopt;
    }
    return it->second.progress();
}

std::optional<DownloadRecord> DownloadScheduler::downloadInfo(DownloadId download_id) const
{
    std::shared_lock<std::shared_mutex> lock(records_mutex);
    auto it = records.find(download_id);
    if (it == records.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<DownloadState> DownloadScheduler::state(DownloadId download_id) const
{
    std::shared_lock<std::shared_mutex> lock(records_mutex);
    auto it = records.find(download_id);
    if (it == records.end())
    {
        return std::nullopt;
    }
    return it->second.state();
}

size_t DownloadScheduler::activeCount() const
{
    std::shared_lock<std::shared_mutex> lock(active_mutex);
    return active_transfers.size();
}

size_t DownloadScheduler::pendingCount() const
{
    std::shared_lock<std::shared_mutex> lock(queue_mutex);
    return pending_queue.size();
}

size_t DownloadScheduler::totalCount() const
{
    std::shared_lock<std::shared_mutex> lock(records_mutex);
    return records.size();
}

std::vector<DownloadId> DownloadScheduler::completedHistory() const
{
    std::shared_lock<std::shared_mutex> lock(history_mutex);
    return { completed_history.begin(), completed_history.end() };
}

std::vector<DownloadRecord> DownloadScheduler::snapshot() const
{
    std::shared_lock<std::shared_mutex> lock(records_mutex);

    std::vector<DownloadRecord> result;
    result.reserve(records.size());
    for (const auto &entry : records)
    {
        result.push_back(entry.second);
    }
    return result;
}

void DownloadScheduler::insertByPriorityLocked(const QueueEntry &entry)
{
    auto pos = std::find_if(pending_queue.begin(), pending_queue.end(),
                            [&entry](const QueueEntry &queued)
                            {
                                return queued.priority < entry.priority;
                            });
    pending_queue.insert(pos, entry);
}

bool DownloadScheduler::eraseFromQueueLocked(DownloadId download_id)
{
    auto it = std::find_if(pending_queue.begin(), pending_queue.end(),
                           [download_id](const QueueEntry &queued)
                           {
                               return queued.download_id == download_id;
                           });
    if (it == pending_queue.end())
    {
        return false;
    }
    pending_queue.erase(it);
    return true;
}

bool DownloadScheduler::isQueuedLocked(DownloadId download_id) const
{
    return std::any_of(pending_queue.begin(), pending_queue.end(),
                       [download_id](const QueueEntry &queued)
                       {
                           return queued.download_id == download_id;
                       });
}

std::unique_ptr<TransferWorker> DownloadScheduler::extractWorkerLocked(DownloadId download_id)
{
    auto it = active_transfers.find(download_id);
    if (it == active_transfers.end())
    {
        return nullptr;
    }

    std::unique_ptr<TransferWorker> worker = std::move(it->second.worker);
    active_transfers.erase(it);
    return worker;
}

void DownloadScheduler::failAdmission(DownloadId download_id, const std::string &reason, std::vector<Notification> &events)
{
    Logger::error(LogCategory::TRANSFER, "Worker for download {} could not be created: {}", download_id, reason);

    {
        std::unique_lock<std::shared_mutex> records_lock(records_mutex);
        auto it = records.find(download_id);
        if (it == records.end() || !it->second.isActive())
        {
            return;
        }
        it->second.setError(reason);
        if (!it->second.transitionTo(DownloadState::FAILED).ok())
        {
            return;
        }
    }

    events.emplace_back(
    [download_id, reason](NotificationSink &sink)
    {
        sink.onFailed(download_id, reason);
    });
}

void DownloadScheduler::stopWorker(std::unique_ptr<TransferWorker> worker)
{
    if (worker)
    {
        worker->requestStop();
    }
}

void DownloadScheduler::deliver(const std::vector<Notification> &events)
{
    for (const auto &event : events)
    {
        event(*notification_sink);
    }
}

void DownloadScheduler::updateGauges() const
{
    auto &metrics = GlobalMetrics::instance();
    if (!metrics.isEnabled())
    {
        return;
    }

    metrics.updateActiveDownloads(activeCount());
    metrics.updatePendingDownloads(pendingCount());

    std::shared_lock<std::shared_mutex> lock(history_mutex);
    metrics.updateCompletedHistory(completed_history.size());
}

} // namespace TransferScheduler
