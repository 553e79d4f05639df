// Scheduler and pipeline tests against in-memory stages (run via CTest).

// Standard Library Includes
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <format>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Project Includes
#include <ferry/pipeline/DedupeLedger.hpp>
#include <ferry/pipeline/Errors.hpp>
#include <ferry/pipeline/Job.hpp>
#include <ferry/pipeline/PipelineStats.hpp>
#include <ferry/pipeline/Scheduler.hpp>
#include <ferry/pipeline/StagingStore.hpp>
#include <ferry/pipeline/TransferPipeline.hpp>
#include <ferry/pipeline/Uploader.hpp>

#include "Fakes.hpp"
#include "TestContext.hpp"

namespace
{
using ferry::pipeline::auth_expired_error;
using ferry::pipeline::DedupeLedger;
using ferry::pipeline::DestinationMetadata;
using ferry::pipeline::duplicate_source_error;
using ferry::pipeline::DuplicatePolicy;
using ferry::pipeline::ErrorKind;
using ferry::pipeline::JobStatus;
using ferry::pipeline::Notifier;
using ferry::pipeline::PipelineStats;
using ferry::pipeline::Scheduler;
using ferry::pipeline::StagingStore;
using ferry::pipeline::transfer_network_error;
using ferry::pipeline::TransferPipeline;
using ferry::pipeline::TransferSource;
using ferry::pipeline::Uploader;
using ferry::testing::FakeDownloader;
using ferry::testing::FakeSinkApi;
using ferry::testing::RecordingNotifier;
using ferry::testing::ScratchDirectory;
using ferry::testing::TestContext;
using ferry::testing::ThrowingNotifier;
using namespace std::chrono_literals;

struct HarnessOptions
{
    std::size_t finishedHistory  = 100;
    bool        dryRun           = false;
    bool        throwingNotifier = false;
};

/**
 * @brief A scheduler wired to fake stages and a scratch data directory.
 *
 * Tests drive it synchronously through `run_next()` unless they call
 * `scheduler.start()` themselves.
 */
struct Harness
{
    explicit Harness(const HarnessOptions& options = {})
        : scratch("ferry-scheduler"),
          staging(scratch.path() / "cache"),
          uploader(sink, 16),
          pipeline(
              downloader,
              uploader,
              staging,
              options.throwingNotifier ? static_cast<Notifier&>(thrower)
                                       : static_cast<Notifier&>(recorder),
              TransferPipeline::Settings { .dryRun = options.dryRun }
          ),
          ledger(scratch.path() / "processed_sources.json"),
          stats(scratch.path() / "analytics.json"),
          scheduler(
              pipeline,
              ledger,
              stats,
              options.throwingNotifier ? static_cast<Notifier&>(thrower)
                                       : static_cast<Notifier&>(recorder),
              Scheduler::Settings {
                  .pausePollInterval = 20ms,
                  .quiescenceDelay   = 10ms,
                  .saveInterval      = 1min,
                  .finishedHistory   = options.finishedHistory,
              }
          )
    {
    }

    auto enqueue(const std::string& name, DuplicatePolicy policy = DuplicatePolicy::REJECT)
        -> std::uint64_t
    {
        return scheduler.enqueue(
            TransferSource {
                .sourceId = std::format("https://catalog.test/movies/{}", name),
                .url      = std::format("https://files.test/{}.mp4", name),
            },
            DestinationMetadata { .title = name },
            policy
        );
    }

    [[nodiscard]]
    auto status_of(std::uint64_t jobId) const -> std::optional<JobStatus>
    {
        const auto snapshot = scheduler.status(jobId);

        return snapshot.has_value() ? std::optional(snapshot->status) : std::nullopt;
    }

    [[nodiscard]]
    auto staging_is_empty() const -> bool
    {
        return std::filesystem::is_empty(staging.directory());
    }

    ScratchDirectory  scratch;
    StagingStore      staging;
    FakeDownloader    downloader;
    FakeSinkApi       sink;
    Uploader          uploader;
    RecordingNotifier recorder;
    ThrowingNotifier  thrower;
    TransferPipeline  pipeline;
    DedupeLedger      ledger;
    PipelineStats     stats;
    Scheduler         scheduler;
};

// Polls `condition` for up to `timeout`
auto eventually(const std::function<bool()>& condition, std::chrono::milliseconds timeout)
    -> bool
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (std::chrono::steady_clock::now() < deadline)
    {
        if (condition())
        {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }

    return condition();
}

auto test_jobs_run_in_fifo_order(TestContext& t) -> void
{
    Harness h;

    const auto first  = h.enqueue("alpha");
    const auto second = h.enqueue("bravo");
    const auto third  = h.enqueue("charlie");

    t.check(h.scheduler.queue().size() == 3, "three jobs should be queued");

    t.check(h.scheduler.run_next(), "first job should run");
    t.check(h.scheduler.run_next(), "second job should run");
    t.check(h.scheduler.run_next(), "third job should run");
    t.check(!h.scheduler.run_next(), "an empty queue should have nothing to run");

    t.check(
        h.downloader.requestedUrls
            == std::vector<std::string> {
                "https://files.test/alpha.mp4",
                "https://files.test/bravo.mp4",
                "https://files.test/charlie.mp4",
            },
        "jobs should be downloaded in enqueue order"
    );

    for (const auto jobId : { first, second, third })
    {
        t.check(
            h.status_of(jobId) == JobStatus::COMPLETED,
            std::format("job {} should be completed", jobId)
        );
    }

    const auto last = h.scheduler.status(third);
    t.check(
        last.has_value() && last->externalId == "video-3",
        "the sink id should be recorded on the job"
    );
    t.check(
        last.has_value() && last->bytesTransferred == 64,
        "transferred bytes should be recorded on the job"
    );

    t.check(h.scheduler.queue().empty(), "finished jobs should leave the queue");
    t.check(!h.scheduler.active_job().has_value(), "the slot should be free");
    t.check(h.ledger.size() == 3, "every completed source should be in the ledger");

    const auto stats = h.stats.snapshot();
    t.check(stats.totalJobs == 3, "three jobs should have started");
    t.check(stats.successCount == 3, "three jobs should have succeeded");
    t.check(stats.failureCount == 0, "nothing should have failed");
    t.check(stats.totalBytes == 3 * 64, "every payload should be counted");

    t.check(h.recorder.started_count() == 3, "each job should announce its start");
    t.check(h.recorder.finished_count() == 3, "each job should finish exactly once");
    t.check(
        !h.recorder.progress.empty() && h.recorder.progress.back().second.percent == 100,
        "the last progress update should report completion"
    );
    t.check(h.staging_is_empty(), "no staged files should remain");
}

auto test_cancel_pending_job(TestContext& t) -> void
{
    Harness h;

    const auto first  = h.enqueue("alpha");
    const auto second = h.enqueue("bravo");

    t.check(h.scheduler.cancel(second), "a queued job should be cancellable");
    t.check(
        h.status_of(second) == JobStatus::CANCELLED,
        "a pending job should be cancelled immediately"
    );
    t.check(h.recorder.finished_count() == 1, "the withdrawal should be announced once");
    t.check(h.scheduler.queue().size() == 1, "the cancelled job should leave the queue");

    t.check(h.scheduler.run_next(), "the remaining job should run");
    t.check(!h.scheduler.run_next(), "the cancelled job should never run");
    t.check(h.status_of(first) == JobStatus::COMPLETED, "first job should complete");
    t.check(h.downloader.requestedUrls.size() == 1, "only one job should download");

    t.check(!h.scheduler.cancel(second), "a finished job is no longer cancellable");
    t.check(!h.scheduler.cancel(424242), "an unknown id should not be cancellable");
    t.check(h.recorder.finished_count() == 2, "no duplicate final notifications");
}

auto test_cancel_active_before_progress(TestContext& t) -> void
{
    Harness       h;
    std::uint64_t jobId = 0;

    h.downloader.beforeStart = [&](const std::string&)
    { [[maybe_unused]] const bool found = h.scheduler.cancel(jobId); };

    jobId = h.enqueue("alpha");

    t.check(h.scheduler.run_next(), "the job should be claimed");
    t.check(
        h.status_of(jobId) == JobStatus::CANCELLED,
        "the active job should end cancelled"
    );
    t.check(!h.ledger.contains("https://catalog.test/movies/alpha"), "no ledger entry");
    t.check(h.stats.snapshot().failureCount == 0, "cancelling is not a failure");
    t.check(h.stats.snapshot().successCount == 0, "cancelling is not a success");
    t.check(h.sink.openedTitles.empty(), "nothing should reach the sink");
    t.check(h.staging_is_empty(), "the staged file should be removed");
    t.check(h.recorder.finished_count() == 1, "the job should finish exactly once");

    const auto snapshot = h.scheduler.status(jobId);
    t.check(
        snapshot.has_value() && snapshot->cancelled,
        "the snapshot should carry the cancelled flag"
    );
}

auto test_remove_pending_while_active_runs(TestContext& t) -> void
{
    Harness       h;
    std::uint64_t pendingId = 0;
    bool          removed   = false;

    h.downloader.afterChunk = [&](std::size_t chunk)
    {
        if (chunk == 0 && !removed)
        {
            removed = h.scheduler.remove(pendingId);
        }
    };

    const auto activeId = h.enqueue("alpha");
    pendingId           = h.enqueue("bravo");

    t.check(h.scheduler.run_next(), "the first job should run");
    t.check(removed, "the pending job should be removable while another runs");
    t.check(h.status_of(activeId) == JobStatus::COMPLETED, "the active job finishes");
    t.check(h.status_of(pendingId) == JobStatus::CANCELLED, "the removed job is cancelled");
    t.check(!h.scheduler.run_next(), "the scheduler should go idle afterwards");
    t.check(h.scheduler.queue().empty(), "the queue should be empty");
}

auto test_auth_expiry_fails_only_that_job(TestContext& t) -> void
{
    Harness h;

    h.sink.openFailure = std::make_exception_ptr(
        auth_expired_error("Sink refused the token. Re-authenticate and retry")
    );

    const auto first  = h.enqueue("alpha");
    const auto second = h.enqueue("bravo");

    t.check(h.scheduler.run_next(), "the first job should run");

    const auto failed = h.scheduler.status(first);
    t.check(
        failed.has_value() && failed->status == JobStatus::FAILED,
        "the job should fail"
    );
    t.check(
        failed.has_value() && failed->errorKind == ErrorKind::AUTH_EXPIRED,
        "the failure should be classified as an expired credential"
    );
    t.check_contains(
        failed.has_value() ? failed->error.value_or("") : "",
        "Re-authenticate",
        "the message should tell the operator what to do"
    );
    t.check(h.staging_is_empty(), "the staged payload should be removed");

    h.sink.openFailure = nullptr;

    t.check(h.scheduler.run_next(), "the next job should still run");
    t.check(h.status_of(second) == JobStatus::COMPLETED, "the next job should succeed");

    const auto stats = h.stats.snapshot();
    t.check(stats.failureCount == 1, "one failure should be counted");
    t.check(stats.successCount == 1, "one success should be counted");
}

auto test_network_failure(TestContext& t) -> void
{
    Harness h;

    h.downloader.failure
        = std::make_exception_ptr(transfer_network_error("Connection reset by peer"));

    const auto jobId = h.enqueue("alpha");

    t.check(h.scheduler.run_next(), "the job should run");

    const auto snapshot = h.scheduler.status(jobId);
    t.check(
        snapshot.has_value() && snapshot->errorKind == ErrorKind::NETWORK,
        "a download failure should be classified as a network error"
    );
    t.check(h.sink.openedTitles.empty(), "a failed download should not upload");
    t.check(h.ledger.size() == 0, "a failed job should not enter the ledger");
    t.check(h.staging_is_empty(), "the partial payload should be removed");
}

auto test_repost_policy(TestContext& t) -> void
{
    Harness h;

    h.enqueue("alpha");
    t.check(h.scheduler.run_next(), "the first transfer should run");

    bool rejected = false;
    try
    {
        h.enqueue("alpha");
    }
    catch (const duplicate_source_error&)
    {
        rejected = true;
    }

    t.check(rejected, "a transferred source should be rejected by default");
    t.check(h.stats.snapshot().duplicatesSkipped == 1, "the skip should be counted");
    t.check(h.scheduler.queue().empty(), "a rejected job should not be queued");

    const auto repost = h.enqueue("alpha", DuplicatePolicy::ALLOW_REPOST);
    t.check(h.scheduler.run_next(), "the repost should run");
    t.check(h.status_of(repost) == JobStatus::COMPLETED, "the repost should complete");

    const auto stats = h.stats.snapshot();
    t.check(h.ledger.size() == 1, "the ledger should hold the source once");
    t.check(stats.successCount == 2, "both transfers should count");
    t.check(stats.totalBytes == 2 * 64, "both payloads should count");
}

auto test_duplicate_within_queue(TestContext& t) -> void
{
    Harness h;

    h.enqueue("alpha");

    bool rejected = false;
    try
    {
        h.enqueue("alpha");
    }
    catch (const duplicate_source_error& dse)
    {
        rejected = true;
        t.check(dse.kind() == ErrorKind::DUPLICATE_SOURCE, "kind should be duplicate");
    }

    t.check(rejected, "a source already waiting should be rejected");
    t.check(h.scheduler.queue().size() == 1, "only one copy should be queued");
}

auto test_finished_history_is_bounded(TestContext& t) -> void
{
    Harness h(HarnessOptions { .finishedHistory = 2 });

    const auto first  = h.enqueue("alpha");
    const auto second = h.enqueue("bravo");
    const auto third  = h.enqueue("charlie");

    for (const auto jobId : { first, second, third })
    {
        [[maybe_unused]]
        const bool cancelled = h.scheduler.cancel(jobId);
    }

    const auto history = h.scheduler.finished();
    t.check(history.size() == 2, "history should keep the two newest jobs");
    t.check(
        history.size() == 2 && history.front().id == second && history.back().id == third,
        "the oldest entry should be dropped first"
    );
    t.check(!h.scheduler.status(first).has_value(), "a dropped job should be unknown");
}

auto test_dry_run_skips_both_stages(TestContext& t) -> void
{
    Harness h(HarnessOptions { .dryRun = true });

    const auto jobId = h.enqueue("alpha");

    t.check(h.scheduler.run_next(), "the dry run should run");

    const auto snapshot = h.scheduler.status(jobId);
    t.check(
        snapshot.has_value() && snapshot->status == JobStatus::COMPLETED,
        "a dry run should complete"
    );
    t.check(
        snapshot.has_value() && snapshot->externalId == std::format("dry-run-{}", jobId),
        "a dry run should report a placeholder id"
    );
    t.check(h.downloader.requestedUrls.empty(), "nothing should be downloaded");
    t.check(h.sink.openedTitles.empty(), "nothing should be uploaded");
}

auto test_notifier_failures_are_isolated(TestContext& t) -> void
{
    Harness h(HarnessOptions { .throwingNotifier = true });

    const auto jobId = h.enqueue("alpha");

    t.check(h.scheduler.run_next(), "the job should run");
    t.check(
        h.status_of(jobId) == JobStatus::COMPLETED,
        "a failing notifier should not fail the job"
    );
}

auto test_state_is_persisted(TestContext& t) -> void
{
    Harness h;

    h.enqueue("alpha");
    t.check(h.scheduler.run_next(), "the job should run");

    DedupeLedger reloaded(h.scratch.path() / "processed_sources.json");
    reloaded.load();
    t.check(
        reloaded.contains("https://catalog.test/movies/alpha"),
        "the ledger should be saved when a job finishes"
    );

    PipelineStats reloadedStats(h.scratch.path() / "analytics.json");
    reloadedStats.load();
    t.check(
        reloadedStats.snapshot().successCount == 1,
        "analytics should be saved when a job finishes"
    );
}

auto test_worker_thread(TestContext& t) -> void
{
    Harness h;
    h.downloader.chunkDelay = 50ms;

    const auto first  = h.enqueue("alpha");
    const auto second = h.enqueue("bravo");

    h.scheduler.set_paused(second, true);
    h.scheduler.start();

    t.check(
        eventually(
            [&]
            {
                const auto active = h.scheduler.active_job();
                return active.has_value() && active->id == first;
            },
            2s
        ),
        "the worker should pick up the first job"
    );

    t.check(h.scheduler.cancel(first), "the active job should accept a cancel");
    t.check(
        eventually([&] { return h.status_of(first) == JobStatus::CANCELLED; }, 2s),
        "the active job should stop at its next suspension point"
    );

    t.check(
        eventually(
            [&] { return h.status_of(second) == JobStatus::PROCESSING; },
            2s
        ),
        "a paused job should still be claimed"
    );

    std::this_thread::sleep_for(150ms);
    t.check(
        h.status_of(second) == JobStatus::PROCESSING && h.downloader.requestedUrls.size() == 1,
        "a paused job should hold before downloading"
    );

    t.check(h.scheduler.set_paused(second, false), "the paused job should resume");
    t.check(
        eventually([&] { return h.status_of(second) == JobStatus::COMPLETED; }, 5s),
        "the resumed job should complete"
    );

    h.scheduler.stop();
    t.check(h.recorder.finished_count() == 2, "each job should finish exactly once");
    t.check(h.staging_is_empty(), "no staged files should remain");
}
} // namespace

auto main() -> int
{
    TestContext t;
    test_jobs_run_in_fifo_order(t);
    test_cancel_pending_job(t);
    test_cancel_active_before_progress(t);
    test_remove_pending_while_active_runs(t);
    test_auth_expiry_fails_only_that_job(t);
    test_network_failure(t);
    test_repost_policy(t);
    test_duplicate_within_queue(t);
    test_finished_history_is_bounded(t);
    test_dry_run_skips_both_stages(t);
    test_notifier_failures_are_isolated(t);
    test_state_is_persisted(t);
    test_worker_thread(t);

    return t.finish("ferry_scheduler_tests");
}
