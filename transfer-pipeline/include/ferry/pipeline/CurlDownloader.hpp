/**
 * @file CurlDownloader.hpp
 * @brief Download stage backed by libcurl
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <cstdint>
#include <string>

// Project Includes
#include <ferry/pipeline/ControlFlags.hpp>
#include <ferry/pipeline/Downloader.hpp>
#include <ferry/pipeline/ProgressThrottler.hpp>
#include <ferry/pipeline/StagingStore.hpp>

namespace ferry::pipeline
{
class CurlDownloader : public Downloader
{
  public: // Constructors
    CurlDownloader(std::uint64_t maxPayloadBytes, std::chrono::milliseconds timeout);

  public: // Methods
    auto download(
        const std::string&      sourceUrl,
        StagedFile&             sink,
        ControlFlags&           flags,
        const ProgressCallback& onProgress
    ) -> DownloadResult override;

  private: // Members
    std::uint64_t             m_MaxPayloadBytes;
    std::chrono::milliseconds m_Timeout;
};
} // namespace ferry::pipeline
