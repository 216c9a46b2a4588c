#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace TransferScheduler
{

struct SchedulerConfig
{
    size_t max_concurrent_downloads = 3;
    std::uint64_t max_bandwidth = 0; // bytes per second, 0 = unlimited
    size_t queue_size = 100;
    bool auto_remove_completed = true;
    size_t max_completed_history = 100;
    bool requeue_resumed_by_priority = false;
};

struct LoggingConfig
{
    std::string level = "info";
    std::string output = "console";
    std::string file = "transfer-scheduler.log";
    std::string categories = "all";
};

struct MetricsConfig
{
    bool enabled = false;
    std::string bind_address = "127.0.0.1";
    int port = 9464;
    std::string endpoint_path = "/metrics";
};

struct Config
{
    SchedulerConfig scheduler;
    LoggingConfig logging;
    MetricsConfig metrics;
};

} // namespace TransferScheduler
