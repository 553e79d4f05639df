/**
 * @file Downloader.hpp
 * @brief Download stage interface
 */

#pragma once

// Standard Library Includes
#include <cstdint>
#include <string>

// Project Includes
#include <ferry/pipeline/ControlFlags.hpp>
#include <ferry/pipeline/ProgressThrottler.hpp>
#include <ferry/pipeline/StagingStore.hpp>

namespace ferry::pipeline
{
struct DownloadResult
{
    std::uint64_t bytesWritten = 0;
};

/**
 * @brief Streams a remote payload into a staged file.
 *
 * Implementations emit a progress sample for every chunk received and treat
 * every chunk as a suspension point: `flags.checkpoint()` is polled after
 * the sample is forwarded. Bytes already staged are left in `sink` on
 * failure; removing them is the caller's job.
 *
 * Throws `transfer_network_error`, `transfer_timeout_error`,
 * `transfer_too_large_error`, `staging_io_error` or `cancelled_exception`.
 */
class Downloader
{
  public: // Constructors
    virtual ~Downloader() = default;

  public: // Methods
    virtual auto download(
        const std::string&      sourceUrl,
        StagedFile&             sink,
        ControlFlags&           flags,
        const ProgressCallback& onProgress
    ) -> DownloadResult = 0;
};
} // namespace ferry::pipeline
