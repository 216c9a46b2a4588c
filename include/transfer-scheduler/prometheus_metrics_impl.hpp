#pragma once

#include <types/config.hpp>
#include <memory>
#include <string>
#include <string_view>

// Forward declarations
namespace prometheus
{
class Registry;
class Exposer;
template <typename T>
class Family;
class Counter;
class Gauge;
class Histogram;
} // namespace prometheus

namespace TransferScheduler
{

class PrometheusMetricsImpl
{
    public:
    explicit PrometheusMetricsImpl(const MetricsConfig &config);
    ~PrometheusMetricsImpl();

    // Admission metrics
    void recordDownloadQueued();
    void recordDownloadRejected();
    void recordDownloadStarted();
    void recordDownloadDeferred();
    void recordDownloadFailed(std::string_view reason);

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

    // Configuration
    std::string getMetricsUrl() const;

    private:
    MetricsConfig config;
    std::unique_ptr<prometheus::Exposer> exposer;
    std::shared_ptr<prometheus::Registry> registry;

    prometheus::Counter *downloadsQueuedTotal;
    prometheus::Counter *downloadsRejectedTotal;
    prometheus::Counter *downloadsStartedTotal;
    prometheus::Counter *downloadsDeferredTotal;
    prometheus::Family<prometheus::Counter> *downloadsFailedTotalFamily;

    prometheus::Counter *downloadsCompletedTotal;
    prometheus::Counter *downloadsCancelledTotal;
    prometheus::Counter *downloadsPausedTotal;
    prometheus::Counter *downloadsResumedTotal;
    prometheus::Counter *historyEvictionsTotal;
    prometheus::Counter *bytesReportedTotal;
    prometheus::Histogram *downloadDurationSeconds;

    prometheus::Gauge *activeDownloads;
    prometheus::Gauge *pendingDownloads;
    prometheus::Gauge *completedHistory;
};

} // namespace TransferScheduler
