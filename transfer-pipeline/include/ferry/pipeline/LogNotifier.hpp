/**
 * @file LogNotifier.hpp
 * @brief Writes job events to the service log
 */

#pragma once

// Project Includes
#include <ferry/pipeline/Job.hpp>
#include <ferry/pipeline/Notifier.hpp>
#include <ferry/pipeline/ProgressThrottler.hpp>

namespace ferry::pipeline
{
class LogNotifier : public Notifier
{
  public: // Methods
    auto on_started(const JobSnapshot& job) -> void override;
    auto on_progress(const JobSnapshot& job, const ProgressUpdate& update)
        -> void override;
    auto on_finished(const JobSnapshot& job) -> void override;
};
} // namespace ferry::pipeline
