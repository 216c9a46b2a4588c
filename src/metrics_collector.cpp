#include <transfer-scheduler/metrics_collector.hpp>
#include <transfer-scheduler/logger.hpp>

namespace TransferScheduler
{

MetricsCollector::MetricsCollector(const MetricsConfig &config)
{
    if (config.enabled)
    {
        implementation = std::make_unique<PrometheusMetricsImpl>(config);
    }
}

bool MetricsCollector::isEnabled() const
{
    return implementation != nullptr;
}

void MetricsCollector::recordDownloadQueued()
{
    if (implementation)
    {
        implementation->recordDownloadQueued();
    }
}

void MetricsCollector::recordDownloadRejected()
{
    if (implementation)
    {
        implementation->recordDownloadRejected();
    }
}

void MetricsCollector::recordDownloadStarted()
{
    if (implementation)
    {
        implementation->recordDownloadStarted();
    }
}

void MetricsCollector::recordDownloadDeferred()
{
    if (implementation)
    {
        implementation->recordDownloadDeferred();
    }
}

void MetricsCollector::recordDownloadFailed(std::string_view reason)
{
    if (implementation)
    {
        implementation->recordDownloadFailed(reason);
    }
}

void MetricsCollector::recordDownloadCompleted(double durationSeconds)
{
    if (implementation)
    {
        implementation->recordDownloadCompleted(durationSeconds);
    }
}

void MetricsCollector::recordDownloadCancelled()
{
    if (implementation)
    {
        implementation->recordDownloadCancelled();
    }
}

void MetricsCollector::recordDownloadPaused()
{
    if (implementation)
    {
        implementation->recordDownloadPaused();
    }
}

void MetricsCollector::recordDownloadResumed()
{
    if (implementation)
    {
        implementation->recordDownloadResumed();
    }
}

void MetricsCollector::recordHistoryEvictions(size_t count)
{
    if (implementation && count > 0)
    {
        implementation->recordHistoryEvictions(count);
    }
}

void MetricsCollector::recordBytesReported(std::uint64_t bytes)
{
    if (implementation && bytes > 0)
    {
        implementation->recordBytesReported(bytes);
    }
}

void MetricsCollector::updateActiveDownloads(size_t count)
{
    if (implementation)
    {
        implementation->updateActiveDownloads(count);
    }
}

void MetricsCollector::updatePendingDownloads(size_t count)
{
    if (implementation)
    {
        implementation->updatePendingDownloads(count);
    }
}

void MetricsCollector::updateCompletedHistory(size_t count)
{
    if (implementation)
    {
        implementation->updateCompletedHistory(count);
    }
}

std::string MetricsCollector::getMetricsUrl() const
{
    if (implementation)
    {
        return implementation->getMetricsUrl();
    }
    return "";
}

// Global metrics instance
std::unique_ptr<MetricsCollector> GlobalMetrics::metrics_instance = nullptr;

MetricsCollector &GlobalMetrics::instance()
{
    if (!metrics_instance)
    {
        static MetricsCollector no_op_metrics{ MetricsConfig{} };
        return no_op_metrics;
    }

    return *metrics_instance;
}

void GlobalMetrics::initialize(const MetricsConfig &config)
{
    if (config.enabled)
    {
        try
        {
            metrics_instance = std::make_unique<MetricsCollector>(config);
            Logger::info(LogCategory::METRICS, "Global metrics initialized: {}", metrics_instance->getMetricsUrl());
        }
        catch (const std::exception &e)
        {
            Logger::error(LogCategory::METRICS, "Failed to initialize global metrics: {}", e.what());
            metrics_instance = nullptr;
        }
    }
    else
    {
        Logger::info(LogCategory::METRICS, "Metrics disabled in configuration");
        metrics_instance = nullptr;
    }
}

void GlobalMetrics::shutdown()
{
    if (metrics_instance)
    {
        Logger::info(LogCategory::METRICS, "Shutting down global metrics");
        metrics_instance.reset();
    }
}

} // namespace TransferScheduler
