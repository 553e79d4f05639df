/**
 * @file TransferPipeline.cpp
 * @brief Runs one job through staging, download and upload
 */

// Header Being Defined
#include <ferry/pipeline/TransferPipeline.hpp>

// Standard Library Includes
#include <chrono>
#include <exception>
#include <format>
#include <optional>
#include <utility>

// Third Party Includes
#include <spdlog/spdlog.h>

// Project Includes
#include <ferry/pipeline/ControlFlags.hpp>
#include <ferry/pipeline/Formatting.hpp>

namespace ferry::pipeline
{
TransferPipeline::TransferPipeline(
    Downloader&         downloader,
    Uploader&           uploader,
    const StagingStore& staging,
    Notifier&           notifier,
    Settings            settings
)
    : m_Downloader(downloader),
      m_Uploader(uploader),
      m_Staging(staging),
      m_Notifier(notifier),
      m_Settings(std::move(settings))
{
}

auto TransferPipeline::forward(
    const Job&                           job,
    const std::optional<ProgressUpdate>& update
) -> void
{
    if (!update.has_value())
    {
        return;
    }

    // Progress delivery is best-effort; a rate-limited channel must not fail
    // the transfer
    try
    {
        m_Notifier.on_progress(job.snapshot(), *update);
    }
    catch (const std::exception& e)
    {
        spdlog::debug("Skipped progress update for job {}: {}", job.id, e.what());
    }
}

auto TransferPipeline::run(const Job& job) -> PipelineResult
{
    ControlFlags& flags = *job.flags;

    if (m_Settings.dryRun)
    {
        spdlog::info(
            "Dry run: would transfer {} to the sink as \"{}\"",
            job.source.url,
            job.destination.title
        );
        flags.checkpoint();

        return PipelineResult { .externalId = std::format("dry-run-{}", job.id) };
    }

    flags.checkpoint();

    StagedFile staged = m_Staging.create(job.id);

    ProgressThrottler downloadThrottler(
        TransferStage::DOWNLOAD,
        m_Settings.downloadPolicy,
        std::chrono::steady_clock::now()
    );

    const DownloadResult downloaded = m_Downloader.download(
        job.source.url,
        staged,
        flags,
        [&](const ProgressSample& sample)
        { this->forward(job, downloadThrottler.observe(sample)); }
    );

    flags.checkpoint();

    const auto stagedPath = staged.finalize();

    spdlog::info(
        "Job {} staged {} at {}",
        job.id,
        format_bytes(downloaded.bytesWritten),
        stagedPath.string()
    );

    ProgressThrottler uploadThrottler(
        TransferStage::UPLOAD,
        m_Settings.uploadPolicy,
        std::chrono::steady_clock::now()
    );

    const UploadResult uploaded = m_Uploader.upload(
        stagedPath,
        job.destination,
        flags,
        [&](const ProgressSample& sample)
        { this->forward(job, uploadThrottler.observe(sample)); }
    );

    return PipelineResult {
        .externalId       = uploaded.externalId,
        .bytesTransferred = downloaded.bytesWritten,
    };
}
} // namespace ferry::pipeline
