/**
 * @file Scheduler.hpp
 * @brief FIFO job queue with a single active transfer slot
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

// Project Includes
#include <ferry/pipeline/DedupeLedger.hpp>
#include <ferry/pipeline/Errors.hpp>
#include <ferry/pipeline/Job.hpp>
#include <ferry/pipeline/Notifier.hpp>
#include <ferry/pipeline/PipelineStats.hpp>
#include <ferry/pipeline/TransferPipeline.hpp>

namespace ferry::pipeline
{
enum class DuplicatePolicy : std::uint8_t
{
    REJECT,
    ALLOW_REPOST,
};

class Scheduler
{
  public: // Structs
    struct Settings
    {
        std::chrono::milliseconds pausePollInterval = std::chrono::seconds(2);
        std::chrono::milliseconds quiescenceDelay   = std::chrono::seconds(2);
        std::chrono::milliseconds saveInterval      = std::chrono::minutes(5);
        std::size_t               finishedHistory   = 100;
    };

  public: // Constructors
    Scheduler(
        TransferPipeline& pipeline,
        DedupeLedger&     ledger,
        PipelineStats&    stats,
        Notifier&         notifier,
        Settings          settings
    );
    Scheduler(Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    auto operator=(Scheduler&) -> Scheduler = delete;
    auto operator=(Scheduler&&) -> Scheduler = delete;

    ~Scheduler();

  public: // Methods
    /**
     * @brief Appends a PENDING job and wakes the worker.
     *
     * With `DuplicatePolicy::REJECT`, a source that already completed or is
     * still queued throws `duplicate_source_error` and counts as a skipped
     * duplicate.
     *
     * @return the new job's id
     */
    auto enqueue(
        TransferSource      source,
        DestinationMetadata destination,
        DuplicatePolicy     policy = DuplicatePolicy::REJECT
    ) -> std::uint64_t;

    auto set_paused(std::uint64_t jobId, bool paused) -> bool;

    /**
     * @brief A pending job is withdrawn at once; the active job is signalled
     *        and finishes CANCELLED at its next suspension point.
     * @return false if the job is not queued
     */
    auto cancel(std::uint64_t jobId) -> bool;
    auto remove(std::uint64_t jobId) -> bool;

    [[nodiscard]]
    auto status(std::uint64_t jobId) const -> std::optional<JobSnapshot>;

    [[nodiscard]]
    auto queue() const -> std::vector<JobSnapshot>;

    [[nodiscard]]
    auto finished() const -> std::vector<JobSnapshot>;

    [[nodiscard]]
    auto active_job() const -> std::optional<JobSnapshot>;

    auto schedule_next() -> void;

    /**
     * @brief Runs the first eligible job to a terminal state on the calling
     *        thread.
     * @return false if the slot was occupied or nothing was eligible
     */
    auto run_next() -> bool;

    auto start() -> void;
    auto stop() -> void;

    auto save_state() -> void;

  private: // Structs
    struct Outcome
    {
        JobStatus                  status = JobStatus::FAILED;
        std::optional<std::string> error;
        std::optional<ErrorKind>   errorKind;
        std::optional<std::string> externalId;
        std::uint64_t              bytesTransferred = 0;
    };

  private: // Methods
    auto worker_loop(const std::stop_token& stopToken) -> void;
    auto saver_loop(const std::stop_token& stopToken) -> void;
    auto withdraw(std::uint64_t jobId, const char* action) -> bool;
    auto claim_next() -> std::shared_ptr<Job>;
    auto finish(const std::shared_ptr<Job>& job, const Outcome& outcome)
        -> void;
    auto remember_finished(const JobSnapshot& snapshot) -> void;
    auto find_queued(std::uint64_t jobId) const -> std::shared_ptr<Job>;
    auto notify_started(const JobSnapshot& snapshot) -> void;
    auto notify_finished(const JobSnapshot& snapshot) -> void;

  private: // Members
    TransferPipeline& m_Pipeline;
    DedupeLedger&     m_Ledger;
    PipelineStats&    m_Stats;
    Notifier&         m_Notifier;
    Settings          m_Settings;

    std::deque<std::shared_ptr<Job>>    m_Queue;
    std::optional<std::shared_ptr<Job>> m_ActiveJob;
    std::deque<JobSnapshot>             m_Finished;
    mutable std::mutex                  m_QueueMutex;

    bool                    m_WakeRequested;
    std::condition_variable m_WakeVariable;
    std::mutex              m_WakeMutex;

    std::condition_variable m_SaveVariable;
    std::mutex              m_SaveMutex;
    std::mutex              m_PersistMutex;

    std::jthread m_Worker;
    std::jthread m_Saver;
};
} // namespace ferry::pipeline
