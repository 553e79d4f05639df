/**
 * @file Notifier.hpp
 * @brief Outbound job events for the operator interface
 */

#pragma once

// Standard Library Includes
#include <vector>

// Project Includes
#include <ferry/pipeline/Job.hpp>
#include <ferry/pipeline/ProgressThrottler.hpp>

namespace ferry::pipeline
{
/**
 * @brief Receives job events from the scheduler thread.
 *
 * Delivery is best-effort: an exception thrown here is logged by the caller
 * and never turns into a job failure. `on_finished` is called exactly once
 * per job.
 */
class Notifier
{
  public: // Constructors
    virtual ~Notifier() = default;

  public: // Methods
    virtual auto on_started(const JobSnapshot& job) -> void = 0;
    virtual auto on_progress(const JobSnapshot& job, const ProgressUpdate& update)
        -> void                                              = 0;
    virtual auto on_finished(const JobSnapshot& job) -> void = 0;
};

/**
 * @brief Forwards every event to each registered notifier, isolating
 *        failures of one from the others.
 */
class NotifierGroup : public Notifier
{
  public: // Methods
    auto add(Notifier& notifier) -> void;

    auto on_started(const JobSnapshot& job) -> void override;
    auto on_progress(const JobSnapshot& job, const ProgressUpdate& update)
        -> void override;
    auto on_finished(const JobSnapshot& job) -> void override;

  private: // Members
    std::vector<Notifier*> m_Notifiers;
};
} // namespace ferry::pipeline
