#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <transfer-scheduler/download_record.hpp>

using namespace TransferScheduler;
using Catch::Matchers::WithinAbs;

namespace
{

DownloadRecord makeRecord(std::int64_t size = 1000)
{
    return DownloadRecord(7, RemoteFileLocation::common(1, 2), LocalFileLocation{ "out.bin" }, size,
                          DownloadPriority::NORMAL);
}

} // namespace

TEST_CASE("New records start pending with nothing downloaded", "[record]")
{
    DownloadRecord record = makeRecord();

    REQUIRE(record.downloadId() == 7);
    REQUIRE(record.isPending());
    REQUIRE(record.size() == 1000);
    REQUIRE(record.expectedSize() == 1000);
    REQUIRE(record.downloadedSize() == 0);
    REQUIRE_FALSE(record.startedAt().has_value());
    REQUIRE_FALSE(record.completedAt().has_value());
    REQUIRE_FALSE(record.errorMessage().has_value());
}

TEST_CASE("Progress is downloaded over expected", "[record][progress]")
{
    SECTION("Half way")
    {
        DownloadRecord record = makeRecord(1000);
        record.updateDownloadedSize(500);
        REQUIRE_THAT(record.progress(), WithinAbs(50.0, 1e-9));
    }

    SECTION("Downloaded bytes are clamped to the expected size")
    {
        DownloadRecord record = makeRecord(1000);
        record.updateDownloadedSize(5000);
        REQUIRE(record.downloadedSize() == 1000);
        REQUIRE_THAT(record.progress(), WithinAbs(100.0, 1e-9));

        record.updateDownloadedSize(-20);
        REQUIRE(record.downloadedSize() == 0);
    }

    SECTION("Unknown size reports zero")
    {
        DownloadRecord record = makeRecord(0);
        record.updateDownloadedSize(10);
        REQUIRE(record.downloadedSize() == 0);
        REQUIRE(record.progress() == 0.0);
    }

    SECTION("Expected size only grows to positive values")
    {
        DownloadRecord record = makeRecord(1000);
        record.updateDownloadedSize(800);
        record.updateExpectedSize(-1);
        REQUIRE(record.expectedSize() == 1000);

        record.updateExpectedSize(400);
        REQUIRE(record.expectedSize() == 400);
        REQUIRE(record.downloadedSize() == 400);
    }
}

TEST_CASE("State machine allows only the documented transitions", "[record][state]")
{
    SECTION("Pending")
    {
        REQUIRE(canTransition(DownloadState::PENDING, DownloadState::ACTIVE));
        REQUIRE(canTransition(DownloadState::PENDING, DownloadState::PAUSED));
        REQUIRE(canTransition(DownloadState::PENDING, DownloadState::CANCELLED));
        REQUIRE_FALSE(canTransition(DownloadState::PENDING, DownloadState::COMPLETED));
        REQUIRE_FALSE(canTransition(DownloadState::PENDING, DownloadState::FAILED));
    }

    SECTION("Active")
    {
        REQUIRE(canTransition(DownloadState::ACTIVE, DownloadState::PAUSED));
        REQUIRE(canTransition(DownloadState::ACTIVE, DownloadState::COMPLETED));
        REQUIRE(canTransition(DownloadState::ACTIVE, DownloadState::CANCELLED));
        REQUIRE(canTransition(DownloadState::ACTIVE, DownloadState::FAILED));
        REQUIRE(canTransition(DownloadState::ACTIVE, DownloadState::PENDING));
    }

    SECTION("Paused")
    {
        REQUIRE(canTransition(DownloadState::PAUSED, DownloadState::ACTIVE));
        REQUIRE(canTransition(DownloadState::PAUSED, DownloadState::PENDING));
        REQUIRE(canTransition(DownloadState::PAUSED, DownloadState::CANCELLED));
        REQUIRE_FALSE(canTransition(DownloadState::PAUSED, DownloadState::COMPLETED));
    }

    SECTION("Terminal states have no exits")
    {
        for (auto from : { DownloadState::COMPLETED, DownloadState::CANCELLED, DownloadState::FAILED })
        {
            REQUIRE(isTerminal(from));
            for (auto to : { DownloadState::PENDING, DownloadState::ACTIVE, DownloadState::PAUSED,
                             DownloadState::COMPLETED, DownloadState::CANCELLED, DownloadState::FAILED })
            {
                REQUIRE_FALSE(canTransition(from, to));
            }
        }
    }
}

TEST_CASE("transitionTo stamps timestamps and rejects invalid moves", "[record][state]")
{
    DownloadRecord record = makeRecord();

    SECTION("Admission stamps started_at, completion stamps completed_at")
    {
        REQUIRE(record.transitionTo(DownloadState::ACTIVE).ok());
        REQUIRE(record.startedAt().has_value());

        REQUIRE(record.transitionTo(DownloadState::COMPLETED).ok());
        REQUIRE(record.completedAt().has_value());
        REQUIRE(*record.completedAt() >= *record.startedAt());
    }

    SECTION("Admission rollback clears started_at")
    {
        REQUIRE(record.transitionTo(DownloadState::ACTIVE).ok());
        REQUIRE(record.transitionTo(DownloadState::PENDING).ok());
        REQUIRE_FALSE(record.startedAt().has_value());
        REQUIRE(record.isPending());
    }

    SECTION("Invalid transition reports both states and changes nothing")
    {
        DownloadResult result = record.transitionTo(DownloadState::COMPLETED);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.status() == DownloadStatus::INVALID_STATE_TRANSITION);
        REQUIRE(result.downloadId() == 7);
        REQUIRE(result.fromState() == DownloadState::PENDING);
        REQUIRE(result.toState() == DownloadState::COMPLETED);
        REQUIRE(record.isPending());
        REQUIRE_FALSE(record.completedAt().has_value());
    }

    SECTION("Cancellation and failure are terminal")
    {
        REQUIRE(record.transitionTo(DownloadState::CANCELLED).ok());
        REQUIRE(record.completedAt().has_value());
        REQUIRE_FALSE(record.transitionTo(DownloadState::ACTIVE).ok());
        REQUIRE(record.isCancelled());
    }
}

TEST_CASE("DownloadResult messages carry their context", "[record][result]")
{
    REQUIRE(DownloadResult::success(3).ok());
    REQUIRE(DownloadResult::success(3).downloadId() == 3);

    DownloadResult full = DownloadResult::queueFull(100);
    REQUIRE(full.status() == DownloadStatus::QUEUE_FULL);
    REQUIRE(full.capacity() == 100);
    REQUIRE(full.message().find("100") != std::string::npos);

    DownloadResult missing = DownloadResult::notFound(42);
    REQUIRE(missing.status() == DownloadStatus::DOWNLOAD_NOT_FOUND);
    REQUIRE(missing.message().find("42") != std::string::npos);

    DownloadResult transition = DownloadResult::invalidTransition(5, DownloadState::CANCELLED, DownloadState::ACTIVE);
    REQUIRE(transition.message().find("cancelled") != std::string::npos);
    REQUIRE(transition.message().find("active") != std::string::npos);

    REQUIRE(statusToString(DownloadStatus::STILL_ACTIVE) != statusToString(DownloadStatus::SUCCESS));
}
