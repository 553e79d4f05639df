/**
 * @file SinkApi.hpp
 * @brief Ingestion protocol of the remote upload target
 */

#pragma once

// Standard Library Includes
#include <cstdint>
#include <optional>
#include <span>
#include <string>

// Project Includes
#include <ferry/pipeline/ControlFlags.hpp>
#include <ferry/pipeline/Job.hpp>

namespace ferry::pipeline
{
struct ChunkReceipt
{
    // Counted from the start of the payload; may stop short of the chunk end
    std::uint64_t              persistedBytes = 0;
    // Set once the final chunk has been accepted
    std::optional<std::string> externalId;
};

/**
 * @brief Resumable, chunked ingestion.
 *
 * Both calls throw `auth_expired_error` when the credential is rejected and
 * `transfer_sink_error` for anything else the sink reports. `send_chunk`
 * throws `cancelled_exception` when `flags` is cancelled mid-request.
 */
class SinkApi
{
  public: // Constructors
    virtual ~SinkApi() = default;

  public: // Methods
    /**
     * @return Opaque session handle passed back to `send_chunk`
     */
    virtual auto open_session(
        const DestinationMetadata& metadata,
        std::uint64_t              totalBytes
    ) -> std::string = 0;

    virtual auto send_chunk(
        const std::string&    session,
        std::uint64_t         offset,
        std::span<const char> chunk,
        std::uint64_t         totalBytes,
        ControlFlags&         flags
    ) -> ChunkReceipt = 0;
};
} // namespace ferry::pipeline
