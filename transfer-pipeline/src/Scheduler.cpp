/**
 * @file Scheduler.cpp
 * @brief FIFO job queue with a single active transfer slot
 */

// Header Being Defined
#include <ferry/pipeline/Scheduler.hpp>

// Standard Library Includes
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// Third Party Includes
#include <spdlog/spdlog.h>

// Project Includes
#include <ferry/pipeline/ControlFlags.hpp>
#include <ferry/pipeline/Formatting.hpp>

namespace ferry::pipeline
{
Scheduler::Scheduler(
    TransferPipeline& pipeline,
    DedupeLedger&     ledger,
    PipelineStats&    stats,
    Notifier&         notifier,
    Settings          settings
)
    : m_Pipeline(pipeline),
      m_Ledger(ledger),
      m_Stats(stats),
      m_Notifier(notifier),
      m_Settings(settings),
      m_WakeRequested(false)
{
}

Scheduler::~Scheduler()
{
    this->stop();
}

auto Scheduler::enqueue(
    TransferSource      source,
    DestinationMetadata destination,
    DuplicatePolicy     policy
) -> std::uint64_t
{
    auto job = std::make_shared<Job>(
        std::move(source),
        std::move(destination),
        m_Settings.pausePollInterval
    );

    std::size_t waiting = 0;

    {
        const std::lock_guard<std::mutex> queueLock(m_QueueMutex);

        if (policy == DuplicatePolicy::REJECT)
        {
            const bool alreadyQueued = std::ranges::any_of(
                m_Queue,
                [&](const auto& queued)
                { return queued->source.sourceId == job->source.sourceId; }
            );

            if (alreadyQueued || m_Ledger.contains(job->source.sourceId))
            {
                m_Stats.record_duplicate();

                throw duplicate_source_error(
                    std::format(
                        "Source {} was already transferred or is queued",
                        job->source.sourceId
                    )
                );
            }
        }

        m_Queue.push_back(job);
        waiting = m_Queue.size();
    }

    spdlog::info(
        "Queued job {} for \"{}\" ({} in queue)",
        job->id,
        job->destination.title,
        waiting
    );

    this->schedule_next();

    return job->id;
}

auto Scheduler::find_queued(std::uint64_t jobId) const -> std::shared_ptr<Job>
{
    const auto found = std::ranges::find_if(
        m_Queue,
        [jobId](const auto& job) { return job->id == jobId; }
    );

    return found != m_Queue.end() ? *found : nullptr;
}

auto Scheduler::set_paused(std::uint64_t jobId, bool paused) -> bool
{
    const std::lock_guard<std::mutex> queueLock(m_QueueMutex);

    const auto job = this->find_queued(jobId);

    if (job == nullptr)
    {
        return false;
    }

    job->flags->set_paused(paused);
    spdlog::info("Job {} {}", jobId, paused ? "paused" : "resumed");

    return true;
}

auto Scheduler::cancel(std::uint64_t jobId) -> bool
{
    return this->withdraw(jobId, "Cancelled");
}

auto Scheduler::remove(std::uint64_t jobId) -> bool
{
    return this->withdraw(jobId, "Removed");
}

auto Scheduler::withdraw(std::uint64_t jobId, const char* action) -> bool
{
    std::optional<JobSnapshot> withdrawn;

    {
        const std::lock_guard<std::mutex> queueLock(m_QueueMutex);

        const auto job = this->find_queued(jobId);

        if (job == nullptr)
        {
            return false;
        }

        job->flags->cancel();

        if (m_ActiveJob.has_value() && m_ActiveJob.value() == job)
        {
            // The active job unwinds at its next suspension point and is
            // retired by the worker
            spdlog::info("{} active job {}, waiting for it to stop", action, jobId);
            return true;
        }

        job->status = JobStatus::CANCELLED;
        std::erase(m_Queue, job);

        withdrawn = job->snapshot();
        this->remember_finished(withdrawn.value());
    }

    spdlog::info("{} pending job {}", action, jobId);
    this->notify_finished(withdrawn.value());

    return true;
}

auto Scheduler::status(std::uint64_t jobId) const -> std::optional<JobSnapshot>
{
    const std::lock_guard<std::mutex> queueLock(m_QueueMutex);

    if (const auto job = this->find_queued(jobId); job != nullptr)
    {
        return job->snapshot();
    }

    const auto found = std::ranges::find_if(
        m_Finished,
        [jobId](const auto& snapshot) { return snapshot.id == jobId; }
    );

    if (found == m_Finished.end())
    {
        return std::nullopt;
    }

    return *found;
}

auto Scheduler::queue() const -> std::vector<JobSnapshot>
{
    const std::lock_guard<std::mutex> queueLock(m_QueueMutex);

    std::vector<JobSnapshot> snapshots;
    snapshots.reserve(m_Queue.size());

    for (const auto& job : m_Queue)
    {
        snapshots.emplace_back(job->snapshot());
    }

    return snapshots;
}

auto Scheduler::finished() const -> std::vector<JobSnapshot>
{
    const std::lock_guard<std::mutex> queueLock(m_QueueMutex);

    return { m_Finished.begin(), m_Finished.end() };
}

auto Scheduler::active_job() const -> std::optional<JobSnapshot>
{
    const std::lock_guard<std::mutex> queueLock(m_QueueMutex);

    if (!m_ActiveJob.has_value())
    {
        return std::nullopt;
    }

    return m_ActiveJob.value()->snapshot();
}

auto Scheduler::remember_finished(const JobSnapshot& snapshot) -> void
{
    m_Finished.push_back(snapshot);

    while (m_Finished.size() > m_Settings.finishedHistory)
    {
        m_Finished.pop_front();
    }
}

auto Scheduler::schedule_next() -> void
{
    {
        const std::lock_guard<std::mutex> wakeLock(m_WakeMutex);
        m_WakeRequested = true;
    }

    m_WakeVariable.notify_all();
}

auto Scheduler::claim_next() -> std::shared_ptr<Job>
{
    const std::lock_guard<std::mutex> queueLock(m_QueueMutex);

    if (m_ActiveJob.has_value())
    {
        return nullptr;
    }

    // Paused pending jobs are still eligible; they block at their first
    // suspension point
    const auto next = std::ranges::find_if(
        m_Queue,
        [](const auto& job)
        { return job->status == JobStatus::PENDING && !job->flags->is_cancelled(); }
    );

    if (next == m_Queue.end())
    {
        return nullptr;
    }

    (*next)->status = JobStatus::PROCESSING;
    m_ActiveJob     = *next;

    return *next;
}

auto Scheduler::run_next() -> bool
{
    const auto job = this->claim_next();

    if (job == nullptr)
    {
        return false;
    }

    m_Stats.record_started();
    this->notify_started(job->snapshot());

    Outcome outcome {};

    try
    {
        const PipelineResult result = m_Pipeline.run(*job);

        outcome.status           = JobStatus::COMPLETED;
        outcome.externalId       = result.externalId;
        outcome.bytesTransferred = result.bytesTransferred;
    }
    catch (const cancelled_exception& ce)
    {
        outcome.status = JobStatus::CANCELLED;
        outcome.error  = ce.what();
    }
    catch (const pipeline_error& pe)
    {
        outcome.status    = JobStatus::FAILED;
        outcome.error     = pe.what();
        outcome.errorKind = pe.kind();
    }
    catch (const std::exception& e)
    {
        outcome.status    = JobStatus::FAILED;
        outcome.error     = e.what();
        outcome.errorKind = ErrorKind::INTERNAL;
    }

    this->finish(job, outcome);

    return true;
}

auto Scheduler::finish(const std::shared_ptr<Job>& job, const Outcome& outcome)
    -> void
{
    switch (outcome.status)
    {
    case JobStatus::COMPLETED:
        m_Ledger.record(job->source.sourceId);
        m_Stats.record_success(outcome.bytesTransferred);
        spdlog::info(
            "Job {} completed: \"{}\" is now {} ({})",
            job->id,
            job->destination.title,
            outcome.externalId.value_or(""),
            format_bytes(outcome.bytesTransferred)
        );
        break;

    case JobStatus::FAILED:
        m_Stats.record_failure();
        spdlog::error(
            "Job {} failed with {}: {}",
            job->id,
            to_string(outcome.errorKind.value_or(ErrorKind::INTERNAL)),
            outcome.error.value_or("")
        );
        break;

    default:
        spdlog::info("Job {} cancelled", job->id);
        break;
    }

    JobSnapshot snapshot;

    {
        const std::lock_guard<std::mutex> queueLock(m_QueueMutex);

        job->status           = outcome.status;
        job->error            = outcome.error;
        job->errorKind        = outcome.errorKind;
        job->externalId       = outcome.externalId;
        job->bytesTransferred = outcome.bytesTransferred;

        std::erase(m_Queue, job);
        m_ActiveJob.reset();

        snapshot = job->snapshot();
        this->remember_finished(snapshot);
    }

    this->save_state();
    this->notify_finished(snapshot);
}

auto Scheduler::notify_started(const JobSnapshot& snapshot) -> void
{
    try
    {
        m_Notifier.on_started(snapshot);
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Start notification for job {} failed: {}", snapshot.id, e.what());
    }
}

auto Scheduler::notify_finished(const JobSnapshot& snapshot) -> void
{
    try
    {
        m_Notifier.on_finished(snapshot);
    }
    catch (const std::exception& e)
    {
        spdlog::warn(
            "Final notification for job {} failed: {}",
            snapshot.id,
            e.what()
        );
    }
}

auto Scheduler::save_state() -> void
{
    const std::lock_guard<std::mutex> persistLock(m_PersistMutex);

    if (!m_Ledger.save())
    {
        spdlog::warn("Dedupe ledger was not saved");
    }

    if (!m_Stats.save())
    {
        spdlog::warn("Analytics were not saved");
    }
}

auto Scheduler::worker_loop(const std::stop_token& stopToken) -> void
{
    while (true)
    {
        {
            std::unique_lock<std::mutex> wakeLock(m_WakeMutex);
            m_WakeVariable.wait(
                wakeLock,
                [&] { return m_WakeRequested || stopToken.stop_requested(); }
            );

            if (stopToken.stop_requested())
            {
                spdlog::info("Scheduler worker stop requested");
                return;
            }

            m_WakeRequested = false;
        }

        if (!this->run_next())
        {
            spdlog::trace("Nothing eligible to run, worker going idle");
            continue;
        }

        std::unique_lock<std::mutex> wakeLock(m_WakeMutex);
        m_WakeVariable.wait_for(
            wakeLock,
            m_Settings.quiescenceDelay,
            [&] { return stopToken.stop_requested(); }
        );

        if (stopToken.stop_requested())
        {
            spdlog::info("Scheduler worker stop requested");
            return;
        }

        m_WakeRequested = true;
    }
}

auto Scheduler::saver_loop(const std::stop_token& stopToken) -> void
{
    while (true)
    {
        std::unique_lock<std::mutex> saveLock(m_SaveMutex);
        m_SaveVariable.wait_for(
            saveLock,
            m_Settings.saveInterval,
            [&] { return stopToken.stop_requested(); }
        );

        if (stopToken.stop_requested())
        {
            return;
        }

        saveLock.unlock();

        spdlog::trace("Periodic save");
        this->save_state();
    }
}

auto Scheduler::start() -> void
{
    spdlog::trace("Starting scheduler worker thread");
    m_Worker = std::jthread([this](const std::stop_token& stopToken)
                            { this->worker_loop(stopToken); });
    m_Saver  = std::jthread([this](const std::stop_token& stopToken)
                           { this->saver_loop(stopToken); });
    spdlog::info("Scheduler started!");

    // Jobs restored or enqueued before start
    this->schedule_next();
}

auto Scheduler::stop() -> void
{
    if (!m_Worker.joinable() && !m_Saver.joinable())
    {
        return;
    }

    spdlog::info("Stopping scheduler");

    m_Worker.request_stop();
    m_Saver.request_stop();

    {
        const std::lock_guard<std::mutex> queueLock(m_QueueMutex);

        if (m_ActiveJob.has_value())
        {
            m_ActiveJob.value()->flags->cancel();
        }
    }

    {
        const std::lock_guard<std::mutex> wakeLock(m_WakeMutex);
    }
    m_WakeVariable.notify_all();

    {
        const std::lock_guard<std::mutex> saveLock(m_SaveMutex);
    }
    m_SaveVariable.notify_all();

    if (m_Worker.joinable())
    {
        m_Worker.join();
    }

    if (m_Saver.joinable())
    {
        m_Saver.join();
    }

    this->save_state();
    spdlog::info("Scheduler stopped!");
}
} // namespace ferry::pipeline
