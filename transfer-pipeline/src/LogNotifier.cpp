/**
 * @file LogNotifier.cpp
 * @brief Writes job events to the service log
 */

// Header Being Defined
#include <ferry/pipeline/LogNotifier.hpp>

// Third Party Includes
#include <spdlog/spdlog.h>

// Project Includes
#include <ferry/pipeline/Errors.hpp>
#include <ferry/pipeline/Formatting.hpp>

namespace ferry::pipeline
{
auto LogNotifier::on_started(const JobSnapshot& job) -> void
{
    spdlog::info(
        "Job {} started: {} ({}, source: {})",
        job.id,
        job.destination.title,
        job.source.sizeLabel,
        job.source.provider
    );
}

auto LogNotifier::on_progress(
    const JobSnapshot&    job,
    const ProgressUpdate& update
) -> void
{
    spdlog::info(
        "Job {} {} {} {}% {} of {} at {}, ETA {}",
        job.id,
        to_string(update.stage),
        progress_bar(update.percent),
        update.percent,
        format_bytes(update.bytesMoved),
        update.totalBytes > 0 ? format_bytes(update.totalBytes) : "?",
        format_speed(update.bytesPerSecond),
        format_eta(update.eta)
    );
}

auto LogNotifier::on_finished(const JobSnapshot& job) -> void
{
    switch (job.status)
    {
    case JobStatus::COMPLETED:
        spdlog::info(
            "Job {} posted successfully: {} -> {}",
            job.id,
            job.destination.title,
            job.externalId.value_or("")
        );
        break;

    case JobStatus::CANCELLED:
        spdlog::info("Job {} cancelled: {}", job.id, job.destination.title);
        break;

    case JobStatus::FAILED:
        if (job.errorKind == ErrorKind::AUTH_EXPIRED)
        {
            spdlog::error(
                "Job {} needs operator action: {}",
                job.id,
                job.error.value_or("")
            );
            break;
        }

        spdlog::error(
            "Job {} failed ({}): {}",
            job.id,
            to_string(job.errorKind.value_or(ErrorKind::INTERNAL)),
            job.error.value_or("")
        );
        break;

    default:
        spdlog::warn(
            "Job {} reported finished while {}",
            job.id,
            to_string(job.status)
        );
    }
}
} // namespace ferry::pipeline
