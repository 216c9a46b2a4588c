#include <transfer-scheduler/prometheus_metrics_impl.hpp>
#include <transfer-scheduler/logger.hpp>
#include <prometheus/counter.h>
#include <prometheus/exposer.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace TransferScheduler
{

PrometheusMetricsImpl::PrometheusMetricsImpl(const MetricsConfig &config) : config(config)
{
    try
    {
        // Create HTTP exposer for metrics endpoint
        std::string bindAddr = config.bind_address + ":" + std::to_string(config.port);
        exposer = std::make_unique<prometheus::Exposer>(bindAddr, 2); // bind_address, num_threads

        registry = std::make_shared<prometheus::Registry>();
        exposer->RegisterCollectable(registry, config.endpoint_path);

        // Admission metrics
        downloadsQueuedTotal = &prometheus::BuildCounter()
                                .Name("transfer_downloads_queued_total")
                                .Help("Total number of downloads accepted into the pending queue")
                                .Register(*registry)
                                .Add({});

        downloadsRejectedTotal = &prometheus::BuildCounter()
                                  .Name("transfer_downloads_rejected_total")
                                  .Help("Total number of downloads rejected because the queue was full")
                                  .Register(*registry)
                                  .Add({});

        downloadsStartedTotal = &prometheus::BuildCounter()
                                 .Name("transfer_downloads_started_total")
                                 .Help("Total number of downloads admitted into the active set")
                                 .Register(*registry)
                                 .Add({});

        downloadsDeferredTotal = &prometheus::BuildCounter()
                                  .Name("transfer_downloads_deferred_total")
                                  .Help("Total number of admissions rolled back for a later retry")
                                  .Register(*registry)
                                  .Add({});

        downloadsFailedTotalFamily = &prometheus::BuildCounter()
                                      .Name("transfer_downloads_failed_total")
                                      .Help("Total number of downloads whose worker could not be created")
                                      .Register(*registry);

        // Lifecycle metrics
        downloadsCompletedTotal = &prometheus::BuildCounter()
                                   .Name("transfer_downloads_completed_total")
                                   .Help("Total number of downloads completed")
                                   .Register(*registry)
                                   .Add({});

        downloadsCancelledTotal = &prometheus::BuildCounter()
                                   .Name("transfer_downloads_cancelled_total")
                                   .Help("Total number of downloads cancelled")
                                   .Register(*registry)
                                   .Add({});

        downloadsPausedTotal = &prometheus::BuildCounter()
                                .Name("transfer_downloads_paused_total")
                                .Help("Total number of pause operations")
                                .Register(*registry)
                                .Add({});

        downloadsResumedTotal = &prometheus::BuildCounter()
                                 .Name("transfer_downloads_resumed_total")
                                 .Help("Total number of resume operations")
                                 .Register(*registry)
                                 .Add({});

        historyEvictionsTotal = &prometheus::BuildCounter()
                                 .Name("transfer_history_evictions_total")
                                 .Help("Total number of completed downloads evicted from history")
                                 .Register(*registry)
                                 .Add({});

        bytesReportedTotal = &prometheus::BuildCounter()
                              .Name("transfer_bytes_reported_total")
                              .Help("Total number of bytes reported through progress updates")
                              .Register(*registry)
                              .Add({});

        auto downloadDurationBuckets =
        prometheus::Histogram::BucketBoundaries{ 0.1, 0.5, 1.0, 2.5, 5.0, 10.0, 30.0, 60.0, 300.0, 900.0, 3600.0 };
        downloadDurationSeconds = &prometheus::BuildHistogram()
                                   .Name("transfer_download_duration_seconds")
                                   .Help("Time from admission to completion")
                                   .Register(*registry)
                                   .Add({}, downloadDurationBuckets);

        // Gauges
        activeDownloads = &prometheus::BuildGauge()
                           .Name("transfer_active_downloads")
                           .Help("Current number of active downloads")
                           .Register(*registry)
                           .Add({});

        pendingDownloads = &prometheus::BuildGauge()
                            .Name("transfer_pending_downloads")
                            .Help("Current number of queued downloads")
                            .Register(*registry)
                            .Add({});

        completedHistory = &prometheus::BuildGauge()
                            .Name("transfer_completed_history")
                            .Help("Current number of downloads kept in completion history")
                            .Register(*registry)
                            .Add({});

        Logger::info(LogCategory::METRICS, "Metrics server started on {}{}", bindAddr, config.endpoint_path);
    }
    catch (const std::exception &e)
    {
        Logger::error(LogCategory::METRICS, "Failed to initialize metrics: {}", e.what());
        throw;
    }
}

PrometheusMetricsImpl::~PrometheusMetricsImpl() = default;

void PrometheusMetricsImpl::recordDownloadQueued()
{
    downloadsQueuedTotal->Increment();
}

void PrometheusMetricsImpl::recordDownloadRejected()
{
    downloadsRejectedTotal->Increment();
}

void PrometheusMetricsImpl::recordDownloadStarted()
{
    downloadsStartedTotal->Increment();
}

void PrometheusMetricsImpl::recordDownloadDeferred()
{
    downloadsDeferredTotal->Increment();
}

void PrometheusMetricsImpl::recordDownloadFailed(std::string_view reason)
{
    if (downloadsFailedTotalFamily)
    {
        auto &counter = downloadsFailedTotalFamily->Add({ { "reason", std::string(reason) } });
        counter.Increment();
    }
}

void PrometheusMetricsImpl::recordDownloadCompleted(double durationSeconds)
{
    downloadsCompletedTotal->Increment();
    downloadDurationSeconds->Observe(durationSeconds);
}

void PrometheusMetricsImpl::recordDownloadCancelled()
{
    downloadsCancelledTotal->Increment();
}

void PrometheusMetricsImpl::recordDownloadPaused()
{
    downloadsPausedTotal->Increment();
}

void PrometheusMetricsImpl::recordDownloadResumed()
{
    downloadsResumedTotal->Increment();
}

void PrometheusMetricsImpl::recordHistoryEvictions(size_t count)
{
    historyEvictionsTotal->Increment(static_cast<double>(count));
}

void PrometheusMetricsImpl::recordBytesReported(std::uint64_t bytes)
{
    bytesReportedTotal->Increment(static_cast<double>(bytes));
}

void PrometheusMetricsImpl::updateActiveDownloads(size_t count)
{
    activeDownloads->Set(static_cast<double>(count));
}

void PrometheusMetricsImpl::updatePendingDownloads(size_t count)
{
    pendingDownloads->Set(static_cast<double>(count));
}

void PrometheusMetricsImpl::updateCompletedHistory(size_t count)
{
    completedHistory->Set(static_cast<double>(count));
}

std::string PrometheusMetricsImpl::getMetricsUrl() const
{
    return "http://" + config.bind_address + ":" + std::to_string(config.port) + config.endpoint_path;
}

} // namespace TransferScheduler
