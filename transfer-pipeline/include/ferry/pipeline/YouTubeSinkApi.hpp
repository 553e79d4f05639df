/**
 * @file YouTubeSinkApi.hpp
 * @brief Resumable video upload protocol over libcurl
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <cstdint>
#include <span>
#include <string>

// Project Includes
#include <ferry/pipeline/ControlFlags.hpp>
#include <ferry/pipeline/Credentials.hpp>
#include <ferry/pipeline/Http.hpp>
#include <ferry/pipeline/Job.hpp>
#include <ferry/pipeline/SinkApi.hpp>

namespace ferry::pipeline
{
/**
 * @brief Maps a rejected sink response to its error kind. A 401 or an OAuth
 *        `invalid_grant` / expired-token message is `auth_expired_error`;
 *        everything else is `transfer_sink_error`.
 */
[[noreturn]]
auto raise_sink_error(const http::Response& response) -> void;

/**
 * @brief Bytes the sink has persisted according to the `Range` header of a
 *        308 response. No header means nothing was persisted.
 */
[[nodiscard]]
auto persisted_bytes(const http::Response& response) -> std::uint64_t;

class YouTubeSinkApi : public SinkApi
{
  public: // Constructors
    YouTubeSinkApi(
        std::string               endpoint,
        CredentialProvider&       credentials,
        std::chrono::milliseconds requestTimeout
    );

  public: // Methods
    auto open_session(
        const DestinationMetadata& metadata,
        std::uint64_t              totalBytes
    ) -> std::string override;

    auto send_chunk(
        const std::string&    session,
        std::uint64_t         offset,
        std::span<const char> chunk,
        std::uint64_t         totalBytes,
        ControlFlags&         flags
    ) -> ChunkReceipt override;

  private: // Members
    std::string               m_Endpoint;
    CredentialProvider&       m_Credentials;
    std::chrono::milliseconds m_RequestTimeout;
};
} // namespace ferry::pipeline
