/**
 * @file Notifier.cpp
 * @brief Outbound job events for the operator interface
 */

// Header Being Defined
#include <ferry/pipeline/Notifier.hpp>

// Standard Library Includes
#include <exception>

// Third Party Includes
#include <spdlog/spdlog.h>

namespace ferry::pipeline
{
auto NotifierGroup::add(Notifier& notifier) -> void
{
    m_Notifiers.emplace_back(&notifier);
}

auto NotifierGroup::on_started(const JobSnapshot& job) -> void
{
    for (auto* notifier : m_Notifiers)
    {
        try
        {
            notifier->on_started(job);
        }
        catch (const std::exception& e)
        {
            spdlog::warn("Dropped start notification for job {}: {}", job.id, e.what());
        }
    }
}

auto NotifierGroup::on_progress(
    const JobSnapshot&    job,
    const ProgressUpdate& update
) -> void
{
    for (auto* notifier : m_Notifiers)
    {
        try
        {
            notifier->on_progress(job, update);
        }
        catch (const std::exception& e)
        {
            spdlog::debug(
                "Skipped progress update for job {}: {}",
                job.id,
                e.what()
            );
        }
    }
}

auto NotifierGroup::on_finished(const JobSnapshot& job) -> void
{
    for (auto* notifier : m_Notifiers)
    {
        try
        {
            notifier->on_finished(job);
        }
        catch (const std::exception& e)
        {
            spdlog::error(
                "Failed to deliver final status for job {}: {}",
                job.id,
                e.what()
            );
        }
    }
}
} // namespace ferry::pipeline
