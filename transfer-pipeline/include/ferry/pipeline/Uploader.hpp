/**
 * @file Uploader.hpp
 * @brief Upload stage: streams a staged file to the sink in chunks
 */

#pragma once

// Standard Library Includes
#include <cstddef>
#include <filesystem>
#include <string>

// Project Includes
#include <ferry/pipeline/ControlFlags.hpp>
#include <ferry/pipeline/Job.hpp>
#include <ferry/pipeline/ProgressThrottler.hpp>
#include <ferry/pipeline/SinkApi.hpp>

namespace ferry::pipeline
{
struct UploadResult
{
    std::string externalId;
};

class Uploader
{
  public: // Constructors
    Uploader(SinkApi& sink, std::size_t chunkBytes);

  public: // Methods
    auto upload(
        const std::filesystem::path& stagedFile,
        const DestinationMetadata&   metadata,
        ControlFlags&                flags,
        const ProgressCallback&      onProgress
    ) -> UploadResult;

  private: // Members
    SinkApi&    m_Sink;
    std::size_t m_ChunkBytes;
};
} // namespace ferry::pipeline
