#include <transfer-scheduler/config_parser.hpp>
#include <transfer-scheduler/download_scheduler.hpp>
#include <transfer-scheduler/logger.hpp>
#include <transfer-scheduler/metrics_collector.hpp>
#include <transfer-scheduler/record_json.hpp>
#include <transfer-scheduler/string_utils.hpp>
#include <transfer-scheduler/time_utils.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace TransferScheduler;

// Command line parsing structure
struct ProgramOptions
{
    std::optional<std::string> config_file;
    size_t downloads = 8;
    std::uint64_t chunk = 64 * 1024;
    bool show_help = false;
    bool test_config_only = false;
    bool dump_json = false;

    // Command line values override the config file
    std::optional<std::string> log_level;
    std::optional<std::string> log_output;
    std::optional<std::string> log_file;
};

void printUsage()
{
    std::string usage =
    "Usage: transfer-scheduler-demo [OPTIONS]\n"
    "\n"
    "Options:\n"
    "  -c, --config FILE      JSON configuration file\n"
    "  -n, --downloads N      Number of simulated downloads (default: 8)\n"
    "      --chunk BYTES      Bytes reported per download per step (default: 65536)\n"
    "      --test-config      Load and print the configuration, then exit\n"
    "      --dump-json        Print a JSON snapshot of every download at the end\n"
    "  -h, --help             Show this help message\n"
    "\n"
    "Logging Options:\n"
    "  -l, --log-level LEVEL  Set log level: trace, debug, info, warn, error, fatal, off (default: info)\n"
    "  -o, --log-output TYPE  Set output: console, file, both, disabled (default: console)\n"
    "  -f, --log-file FILE    Log file path (default: transfer-scheduler.log)\n"
    "\n"
    "Examples:\n"
    "  transfer-scheduler-demo --config scheduler.json --downloads 20\n"
    "  transfer-scheduler-demo --log-level debug --dump-json\n"
    "  transfer-scheduler-demo --test-config --config scheduler.json";

    Logger::info(usage);
}

ProgramOptions parseCommandLine(int argc, char *argv[])
{
    ProgramOptions options;

    for (int i = 1; i < argc; i++)
    {
        std::string arg{ argv[i] };

        if (arg == "-c" || arg == "--config")
        {
            const char *config_path = StringUtils::getNextArg(argv, i, argc);
            if (config_path)
            {
                options.config_file = config_path;
            }
            else
            {
                Logger::error("Error: --config requires a file path");
                options.show_help = true;
                break;
            }
        }
        else if (arg == "-n" || arg == "--downloads")
        {
            const char *count = StringUtils::getNextArg(argv, i, argc);
            auto value = count ? StringUtils::parseUnsigned(count) : std::nullopt;
            if (value)
            {
                options.downloads = static_cast<size_t>(*value);
            }
            else
            {
                Logger::error("Error: --downloads requires a non-negative number");
                options.show_help = true;
                break;
            }
        }
        else if (arg == "--chunk")
        {
            const char *chunk = StringUtils::getNextArg(argv, i, argc);
            auto value = chunk ? StringUtils::parseUnsigned(chunk) : std::nullopt;
            if (value && *value > 0)
            {
                options.chunk = *value;
            }
            else
            {
                Logger::error("Error: --chunk requires a positive byte count");
                options.show_help = true;
                break;
            }
        }
        else if (arg == "--test-config")
        {
            options.test_config_only = true;
        }
        else if (arg == "--dump-json")
        {
            options.dump_json = true;
        }
        else if (arg == "-l" || arg == "--log-level")
        {
            const char *log_level = StringUtils::getNextArg(argv, i, argc);
            if (log_level)
            {
                options.log_level = log_level;
            }
            else
            {
                Logger::error("Error: --log-level requires a level (trace, debug, info, warn, error, fatal, off)");
                options.show_help = true;
                break;
            }
        }
        else if (arg == "-o" || arg == "--log-output")
        {
            const char *log_output = StringUtils::getNextArg(argv, i, argc);
            if (log_output)
            {
                options.log_output = log_output;
            }
            else
            {
                Logger::error("Error: --log-output requires a type (console, file, both, disabled)");
                options.show_help = true;
                break;
            }
        }
        else if (arg == "-f" || arg == "--log-file")
        {
            const char *log_file = StringUtils::getNextArg(argv, i, argc);
            if (log_file)
            {
                options.log_file = log_file;
            }
            else
            {
                Logger::error("Error: --log-file requires a file path");
                options.show_help = true;
                break;
            }
        }
        else if (arg == "-h" || arg == "--help")
        {
            options.show_help = true;
            break;
        }
        else
        {
            Logger::error("Unknown argument: {}", arg);
            options.show_help = true;
            break;
        }
    }

    return options;
}

int testConfigOnly(const Config &config)
{
    Logger::info("[CONFIG TEST] === Config Parsing Test ===");
    Logger::info("[CONFIG TEST]   max_concurrent_downloads: {}", config.scheduler.max_concurrent_downloads);
    Logger::info("[CONFIG TEST]   max_bandwidth: {}", config.scheduler.max_bandwidth == 0 ?
                                                       std::string("unlimited") :
                                                       StringUtils::formatBytes(config.scheduler.max_bandwidth) + "/s");
    Logger::info("[CONFIG TEST]   queue_size: {}", config.scheduler.queue_size);
    Logger::info("[CONFIG TEST]   auto_remove_completed: {}", config.scheduler.auto_remove_completed);
    Logger::info("[CONFIG TEST]   max_completed_history: {}", config.scheduler.max_completed_history);
    Logger::info("[CONFIG TEST]   requeue_resumed_by_priority: {}", config.scheduler.requeue_resumed_by_priority);
    Logger::info("[CONFIG TEST]   logging: level={}, output={}, categories={}", config.logging.level,
                 config.logging.output, config.logging.categories);
    Logger::info("[CONFIG TEST]   metrics: enabled={}, endpoint={}:{}{}", config.metrics.enabled,
                 config.metrics.bind_address, config.metrics.port, config.metrics.endpoint_path);
    Logger::info("[CONFIG TEST] Config test completed successfully!");
    return 0;
}

// Logs every scheduler event and counts terminal ones
class LoggingNotificationSink : public NotificationSink
{
    public:
    void onAdded(DownloadId download_id) override
    {
        Logger::debug(LogCategory::NOTIFY, "[{}] added", download_id);
    }

    void onStarted(DownloadId download_id) override
    {
        Logger::info(LogCategory::NOTIFY, "[{}] started", download_id);
    }

    void onPaused(DownloadId download_id) override
    {
        Logger::info(LogCategory::NOTIFY, "[{}] paused", download_id);
    }

    void onResumed(DownloadId download_id) override
    {
        Logger::info(LogCategory::NOTIFY, "[{}] resumed", download_id);
    }

    void onCancelled(DownloadId download_id) override
    {
        Logger::info(LogCategory::NOTIFY, "[{}] cancelled", download_id);
        ++finished;
    }

    void onCompleted(DownloadId download_id) override
    {
        Logger::info(LogCategory::NOTIFY, "[{}] completed", download_id);
        ++finished;
    }

    void onFailed(DownloadId download_id, const std::string &reason) override
    {
        Logger::warn(LogCategory::NOTIFY, "[{}] failed: {}", download_id, reason);
        ++finished;
    }

    void onProgress(DownloadId download_id, std::int64_t downloaded, std::int64_t expected, double percent) override
    {
        Logger::debug(LogCategory::NOTIFY, "[{}] {:.1f}% ({} / {})", download_id, percent,
                      StringUtils::formatBytes(static_cast<std::uint64_t>(downloaded)),
                      StringUtils::formatBytes(static_cast<std::uint64_t>(expected)));
    }

    size_t finishedCount() const
    {
        return finished.load();
    }

    private:
    std::atomic<size_t> finished{ 0 };
};

// Pretends to move bytes. The demo loop reports progress on its behalf.
class SimulatedTransferWorker : public TransferWorker
{
    public:
    using TransferWorker::TransferWorker;

    protected:
    void onStopRequested() override
    {
        Logger::debug(LogCategory::TRANSFER, "Simulated transfer {} stopping", downloadId());
    }
};

class SimulatedWorkerFactory : public TransferWorkerFactory
{
    public:
    std::unique_ptr<TransferWorker> createWorker(const TransferRequest &request,
                                                 std::shared_ptr<std::atomic<bool>> stop_flag) override
    {
        if (request.remote.isEmpty())
        {
            throw WorkerCreationError("no remote location", false);
        }
        return std::make_unique<SimulatedTransferWorker>(request, std::move(stop_flag));
    }
};

int runDemo(const Config &config, const ProgramOptions &options)
{
    auto sink = std::make_shared<LoggingNotificationSink>();
    DownloadScheduler scheduler(config.scheduler, sink, std::make_shared<SimulatedWorkerFactory>());

    const auto chunk = static_cast<std::int64_t>(options.chunk);
    const DownloadPriority priorities[] = { DownloadPriority::LOW, DownloadPriority::NORMAL, DownloadPriority::HIGH };

    std::vector<DownloadId> ids;
    for (size_t i = 0; i < options.downloads; ++i)
    {
        auto remote = RemoteFileLocation::common(static_cast<std::int64_t>(1000 + i), static_cast<std::int64_t>(0x5eed + i));
        LocalFileLocation local{ "downloads/file_" + std::to_string(i) + ".bin" };
        std::int64_t size = chunk * static_cast<std::int64_t>(2 + i % 4);

        DownloadResult result = scheduler.add(remote, local, size, priorities[i % 3]);
        if (!result.ok())
        {
            Logger::warn("Could not add download {}: {}", i, result.message());
            continue;
        }
        ids.push_back(result.downloadId());
    }

    Logger::info("Queued {} downloads, {} pending", ids.size(), scheduler.pendingCount());

    // Exercise pause/resume and cancel on the first downloads
    std::optional<DownloadId> paused_id;
    if (ids.size() > 1)
    {
        DownloadResult cancelled = scheduler.cancel(ids.back());
        if (!cancelled.ok())
        {
            Logger::warn("Could not cancel download {}: {}", ids.back(), cancelled.message());
        }
    }
    if (!ids.empty() && scheduler.pause(ids.front()).ok())
    {
        paused_id = ids.front();
    }

    const auto start_time = std::chrono::system_clock::now();
    size_t step = 0;
    const size_t max_steps = options.downloads * 16 + 64;

    while ((scheduler.activeCount() > 0 || scheduler.pendingCount() > 0 || paused_id) && step < max_steps)
    {
        ++step;
        AdmissionSummary summary = scheduler.processQueue();
        if (summary.started > 0)
        {
            Logger::debug("Step {}: admitted {} downloads", step, summary.started);
        }

        for (const auto &record : scheduler.snapshot())
        {
            if (record.isActive())
            {
                DownloadResult result = scheduler.updateProgress(record.downloadId(), record.downloadedSize() + chunk);
                if (!result.ok())
                {
                    Logger::warn("Progress update rejected: {}", result.message());
                }
            }
        }

        if (paused_id && step == 3)
        {
            DownloadResult resumed = scheduler.resume(*paused_id);
            if (!resumed.ok())
            {
                Logger::warn("Could not resume download {}: {}", *paused_id, resumed.message());
            }
            paused_id.reset();
        }
    }

    const auto elapsed = std::chrono::system_clock::now() - start_time;
    Logger::info("Demo finished after {} steps ({}): {} finished, {} records kept, history={}", step,
                 TimeUtils::formatDuration(elapsed), sink->finishedCount(), scheduler.totalCount(),
                 scheduler.completedHistory().size());

    if (options.dump_json)
    {
        std::cout << snapshotToJson(scheduler).dump(2) << std::endl;
    }

    return 0;
}

int main(int argc, char *argv[])
{
    if (!Logger::initialize(LoggingConfig{}))
    {
        return 1;
    }

    ProgramOptions options = parseCommandLine(argc, argv);
    if (options.show_help)
    {
        printUsage();
        return 0;
    }

    Config config;
    if (options.config_file)
    {
        auto loaded = ConfigParser::parseJsonFile(*options.config_file);
        if (!loaded)
        {
            Logger::error("Failed to load configuration from {}", *options.config_file);
            return 1;
        }
        config = *loaded;
    }

    LoggingConfig logging = config.logging;
    logging.level = options.log_level.value_or(logging.level);
    logging.output = options.log_output.value_or(logging.output);
    logging.file = options.log_file.value_or(logging.file);
    if (!Logger::initialize(logging))
    {
        Logger::error("Invalid logging options: level '{}', output '{}'", logging.level, logging.output);
        return 1;
    }

    if (options.test_config_only)
    {
        return testConfigOnly(config);
    }

    GlobalMetrics::initialize(config.metrics);

    int result = 1;
    try
    {
        result = runDemo(config, options);
    }
    catch (const std::exception &e)
    {
        Logger::fatal("Demo failed: {}", e.what());
    }

    GlobalMetrics::shutdown();
    Logger::shutdown();
    return result;
}
