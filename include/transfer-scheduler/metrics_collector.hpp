#pragma once

#include "prometheus_metrics_impl.hpp"
#include <types/config.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace TransferScheduler
{

// Every record call is a no-op when the collector was built with
// metrics disabled.
class MetricsCollector
{
    public:
    explicit MetricsCollector(const MetricsConfig &config);
    ~MetricsCollector() = default;

    // Disable copy/move for simplicity
    MetricsCollector(const MetricsCollector &) = delete;
    MetricsCollector &operator=(const MetricsCollector &) = delete;
    MetricsCollector(MetricsCollector &&) = delete;
    MetricsCollector &operator=(MetricsCollector &&) = delete;

    bool isEnabled() const;

    // Admission metrics
    void recordDownloadQueued();
    void recordDownloadRejected();
    void recordDownloadStarted();
    void recordDownloadDeferred();
    void recordDownloadFailed(std::string_view reason = "unknown");

    // Lifecycle metrics
    void recordDownloadCompleted(double durationSeconds);
    void recordDownloadCancelled();
    void recordDownloadPaused();
    void recordDownloadResumed();
    void recordHistoryEvictions(size_t count);
    void recordBytesReported(std::uint64_t bytes);

    // Gauges
    void updateActiveDownloads(size_t count);
    void updatePendingDownloads(size_t count);
    void updateCompletedHistory(size_t count);

    // Get metrics endpoint URL
    std::string getMetricsUrl() const;

    private:
    std::unique_ptr<PrometheusMetricsImpl> implementation;
};

// Process-wide collector. Stays a no-op until initialize() is called with
// metrics enabled.
class GlobalMetrics
{
    public:
    static void initialize(const MetricsConfig &config);
    static void shutdown();
    static MetricsCollector &instance();

    private:
    static std::unique_ptr<MetricsCollector> metrics_instance;
};

} // namespace TransferScheduler
