#include <catch2/catch_test_macros.hpp>
#include <transfer-scheduler/resource_budget.hpp>

using namespace TransferScheduler;

namespace
{

ResourceRequest makeRequest(ResourceType type, DownloadPriority priority = DownloadPriority::NORMAL)
{
    ResourceRequest request;
    request.request_id = ResourceBudget::nextRequestId();
    request.type = type;
    request.priority = priority;
    request.size = 1024;
    return request;
}

} // namespace

TEST_CASE("Budget defaults", "[budget]")
{
    ResourceBudget budget;

    REQUIRE(budget.maxConcurrent() == ResourceBudget::DEFAULT_MAX_CONCURRENT);
    REQUIRE(budget.totalActive() == 0);
    REQUIRE(budget.queuedCount() == 0);
    REQUIRE(budget.canStart(ResourceType::DOWNLOAD));
    REQUIRE_FALSE(budget.bandwidthLimit(ResourceType::DOWNLOAD).has_value());
    REQUIRE_FALSE(budget.bandwidthLimit(ResourceType::UPLOAD).has_value());
}

TEST_CASE("Bandwidth limits", "[budget]")
{
    ResourceBudget budget(1000000, 4, 500000);

    REQUIRE(budget.bandwidthLimit(ResourceType::DOWNLOAD) == std::optional<std::uint64_t>(1000000));
    REQUIRE(budget.bandwidthLimit(ResourceType::UPLOAD) == std::optional<std::uint64_t>(500000));
    REQUIRE_FALSE(budget.bandwidthLimit(ResourceType::GENERATE).has_value());
}

TEST_CASE("Concurrency limit is raised to at least one", "[budget]")
{
    ResourceBudget budget(0, 0);
    REQUIRE(budget.maxConcurrent() == 1);
}

TEST_CASE("Requests are granted until the limit, then queued", "[budget]")
{
    ResourceBudget budget(0, 2);

    REQUIRE(budget.requestResource(makeRequest(ResourceType::DOWNLOAD)));
    REQUIRE(budget.requestResource(makeRequest(ResourceType::UPLOAD)));
    REQUIRE(budget.activeCount(ResourceType::DOWNLOAD) == 1);
    REQUIRE(budget.activeCount(ResourceType::UPLOAD) == 1);
    REQUIRE(budget.totalActive() == 2);
    REQUIRE_FALSE(budget.canStart(ResourceType::GENERATE));

    REQUIRE_FALSE(budget.requestResource(makeRequest(ResourceType::GENERATE)));
    REQUIRE(budget.queuedCount() == 1);
    REQUIRE(budget.activeCount(ResourceType::GENERATE) == 0);
}

TEST_CASE("Releasing a slot promotes the highest priority request", "[budget]")
{
    ResourceBudget budget(0, 1);
    REQUIRE(budget.requestResource(makeRequest(ResourceType::DOWNLOAD)));

    ResourceRequest low = makeRequest(ResourceType::UPLOAD, DownloadPriority::LOW);
    ResourceRequest high = makeRequest(ResourceType::GENERATE, DownloadPriority::HIGH);
    REQUIRE_FALSE(budget.requestResource(low));
    REQUIRE_FALSE(budget.requestResource(high));
    REQUIRE(budget.queuedCount() == 2);

    budget.releaseResourceType(ResourceType::DOWNLOAD);

    REQUIRE(budget.activeCount(ResourceType::DOWNLOAD) == 0);
    REQUIRE(budget.activeCount(ResourceType::GENERATE) == 1);
    REQUIRE(budget.activeCount(ResourceType::UPLOAD) == 0);
    REQUIRE(budget.queuedCount() == 1);
}

TEST_CASE("Queued requests can be withdrawn", "[budget]")
{
    ResourceBudget budget(0, 1);
    REQUIRE(budget.requestResource(makeRequest(ResourceType::DOWNLOAD)));

    ResourceRequest waiting = makeRequest(ResourceType::DOWNLOAD);
    REQUIRE_FALSE(budget.requestResource(waiting));

    REQUIRE(budget.releaseResource(waiting.request_id));
    REQUIRE(budget.queuedCount() == 0);
    REQUIRE_FALSE(budget.releaseResource(waiting.request_id));

    SECTION("clearQueue drops everything waiting")
    {
        REQUIRE_FALSE(budget.requestResource(makeRequest(ResourceType::UPLOAD)));
        REQUIRE_FALSE(budget.requestResource(makeRequest(ResourceType::UPLOAD)));
        budget.clearQueue();
        REQUIRE(budget.queuedCount() == 0);
        REQUIRE(budget.totalActive() == 1);
    }
}

TEST_CASE("Releasing an idle type is harmless", "[budget]")
{
    ResourceBudget budget(0, 2);
    budget.releaseResourceType(ResourceType::UPLOAD);
    REQUIRE(budget.activeCount(ResourceType::UPLOAD) == 0);
    REQUIRE(budget.totalActive() == 0);
}

TEST_CASE("Resource type names", "[budget]")
{
    REQUIRE(resourceTypeToString(ResourceType::DOWNLOAD) == "download");
    REQUIRE(resourceTypeToString(ResourceType::UPLOAD) == "upload");
    REQUIRE(resourceTypeToString(ResourceType::GENERATE) == "generate");
    REQUIRE(parseResourceType("upload") == std::optional<ResourceType>(ResourceType::UPLOAD));
    REQUIRE_FALSE(parseResourceType("invalid").has_value());
}
