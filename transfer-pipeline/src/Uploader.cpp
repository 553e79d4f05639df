/**
 * @file Uploader.cpp
 * @brief Upload stage: streams a staged file to the sink in chunks
 */

// Header Being Defined
#include <ferry/pipeline/Uploader.hpp>

// Standard Library Includes
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

// Third Party Includes
#include <spdlog/spdlog.h>

// Project Includes
#include <ferry/pipeline/Errors.hpp>

namespace ferry::pipeline
{
Uploader::Uploader(SinkApi& sink, std::size_t chunkBytes)
    : m_Sink(sink),
      m_ChunkBytes(std::max<std::size_t>(chunkBytes, 1))
{
}

auto Uploader::upload(
    const std::filesystem::path& stagedFile,
    const DestinationMetadata&   metadata,
    ControlFlags&                flags,
    const ProgressCallback&      onProgress
) -> UploadResult
{
    flags.checkpoint();

    std::error_code     errorCode;
    const std::uint64_t totalBytes
        = std::filesystem::file_size(stagedFile, errorCode);

    if (errorCode)
    {
        throw staging_io_error(
            std::format(
                "Failed to stat staged file {}! Error message: {}",
                stagedFile.string(),
                errorCode.message()
            )
        );
    }

    if (totalBytes == 0)
    {
        throw staging_io_error(
            std::format("Staged file {} is empty", stagedFile.string())
        );
    }

    std::ifstream input(stagedFile, std::ios::binary);

    if (!input.good())
    {
        throw staging_io_error(
            std::format("Failed to open staged file {}", stagedFile.string())
        );
    }

    spdlog::info(
        "Uploading {} ({} bytes) in chunks of {} bytes",
        metadata.title,
        totalBytes,
        m_ChunkBytes
    );

    // Reports the reserved "preparing" share before the session is opened
    if (onProgress)
    {
        onProgress(ProgressSample {
            .bytesMoved = 0,
            .totalBytes = totalBytes,
            .timestamp  = std::chrono::steady_clock::now(),
        });
    }

    const std::string session = m_Sink.open_session(metadata, totalBytes);

    std::vector<char>          buffer(m_ChunkBytes);
    std::uint64_t              offset = 0;
    std::optional<std::string> externalId;

    while (offset < totalBytes && !externalId.has_value())
    {
        // Suspension point before every chunk write
        flags.checkpoint();

        const auto chunkLength = static_cast<std::size_t>(
            std::min<std::uint64_t>(m_ChunkBytes, totalBytes - offset)
        );

        input.seekg(static_cast<std::streamoff>(offset));
        input.read(buffer.data(), static_cast<std::streamsize>(chunkLength));

        if (static_cast<std::size_t>(input.gcount()) != chunkLength)
        {
            throw staging_io_error(
                std::format(
                    "Short read from staged file {} at offset {}",
                    stagedFile.string(),
                    offset
                )
            );
        }

        const ChunkReceipt receipt = m_Sink.send_chunk(
            session,
            offset,
            std::span<const char>(buffer.data(), chunkLength),
            totalBytes,
            flags
        );

        // The sink may persist less than it was sent; the rest is re-sent
        if (receipt.persistedBytes <= offset
            || receipt.persistedBytes > offset + chunkLength)
        {
            throw transfer_sink_error(
                std::format(
                    "Sink reported {} persisted bytes after a chunk at {}-{}",
                    receipt.persistedBytes,
                    offset,
                    offset + chunkLength
                )
            );
        }

        if (receipt.persistedBytes < offset + chunkLength)
        {
            spdlog::debug(
                "Sink kept {} of {} bytes at offset {}",
                receipt.persistedBytes - offset,
                chunkLength,
                offset
            );
        }

        offset     = receipt.persistedBytes;
        externalId = receipt.externalId;

        spdlog::trace("Uploaded {}/{} bytes", offset, totalBytes);

        if (onProgress)
        {
            onProgress(ProgressSample {
                .bytesMoved = offset,
                .totalBytes = totalBytes,
                .timestamp  = std::chrono::steady_clock::now(),
            });
        }
    }

    if (!externalId.has_value())
    {
        throw transfer_sink_error(
            "Sink accepted every chunk but never acknowledged the upload"
        );
    }

    spdlog::info("Upload of {} finished as {}", metadata.title, *externalId);

    return UploadResult { .externalId = *externalId };
}
} // namespace ferry::pipeline
