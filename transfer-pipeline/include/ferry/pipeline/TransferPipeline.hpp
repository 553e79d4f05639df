/**
 * @file TransferPipeline.hpp
 * @brief Runs one job through staging, download and upload
 */

#pragma once

// Standard Library Includes
#include <cstdint>
#include <optional>
#include <string>

// Project Includes
#include <ferry/pipeline/Downloader.hpp>
#include <ferry/pipeline/Job.hpp>
#include <ferry/pipeline/Notifier.hpp>
#include <ferry/pipeline/ProgressThrottler.hpp>
#include <ferry/pipeline/StagingStore.hpp>
#include <ferry/pipeline/Uploader.hpp>

namespace ferry::pipeline
{
struct PipelineResult
{
    std::string   externalId;
    std::uint64_t bytesTransferred = 0;
};

class TransferPipeline
{
  public: // Structs
    struct Settings
    {
        ProgressThrottler::Policy downloadPolicy {};
        ProgressThrottler::Policy uploadPolicy { .percentOffset = 5 };
        bool                      dryRun = false;
    };

  public: // Constructors
    TransferPipeline(
        Downloader&         downloader,
        Uploader&           uploader,
        const StagingStore& staging,
        Notifier&           notifier,
        Settings            settings
    );

  public: // Methods
    /**
     * @brief Download stage, then upload stage. The staged file is removed
     *        before this returns or throws.
     *
     * Does not modify `job`; the caller records the outcome. Throws
     * `cancelled_exception` or a `pipeline_error`.
     */
    auto run(const Job& job) -> PipelineResult;

  private: // Methods
    auto forward(const Job& job, const std::optional<ProgressUpdate>& update)
        -> void;

  private: // Members
    Downloader&         m_Downloader;
    Uploader&           m_Uploader;
    const StagingStore& m_Staging;
    Notifier&           m_Notifier;
    Settings            m_Settings;
};
} // namespace ferry::pipeline
