/**
 * @file YouTubeSinkApi.cpp
 * @brief Resumable video upload protocol over libcurl
 */

// Header Being Defined
#include <ferry/pipeline/YouTubeSinkApi.hpp>

// Standard Library Includes
#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

// Third Party Includes
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Project Includes
#include <ferry/pipeline/ControlFlags.hpp>
#include <ferry/pipeline/Errors.hpp>
#include <ferry/pipeline/Http.hpp>

namespace ferry::pipeline
{
namespace
{
constexpr std::size_t MAX_TITLE_LENGTH = 100;

constexpr long HTTP_OK                = 200;
constexpr long HTTP_CREATED           = 201;
constexpr long HTTP_RESUME_INCOMPLETE = 308;
constexpr long HTTP_UNAUTHORIZED      = 401;

// Cuts on a UTF-8 code point boundary
auto truncate_title(const std::string& title) -> std::string
{
    if (title.size() <= MAX_TITLE_LENGTH)
    {
        return title;
    }

    std::size_t length = MAX_TITLE_LENGTH;
    while (length > 0
           && (static_cast<unsigned char>(title.at(length)) & 0xC0U) == 0x80U)
    {
        length--;
    }

    return title.substr(0, length);
}

auto sink_error_message(const http::Response& response) -> std::string
{
    const auto body = nlohmann::json::parse(response.body, nullptr, false);

    if (!body.is_discarded() && body.is_object() && body.contains("error"))
    {
        const auto& error = body.at("error");

        if (error.is_object())
        {
            return error.value("message", response.body);
        }

        if (error.is_string())
        {
            return std::format(
                "{} {}",
                error.get<std::string>(),
                body.value("error_description", "")
            );
        }
    }

    return response.body.empty() ? std::format("HTTP {}", response.status)
                                 : response.body;
}
} // namespace

YouTubeSinkApi::YouTubeSinkApi(
    std::string               endpoint,
    CredentialProvider&       credentials,
    std::chrono::milliseconds requestTimeout
)
    : m_Endpoint(std::move(endpoint)),
      m_Credentials(credentials),
      m_RequestTimeout(requestTimeout)
{
}

auto raise_sink_error(const http::Response& response) -> void
{
    const std::string message = sink_error_message(response);

    if (response.status == HTTP_UNAUTHORIZED
        || message.find("invalid_grant") != std::string::npos
        || message.find("Token has been expired") != std::string::npos)
    {
        spdlog::warn("Sink rejected the credential: {}", message);
        throw auth_expired_error(
            "Sink authentication expired. Re-authenticate the uploader and "
            "re-enqueue the job."
        );
    }

    throw transfer_sink_error(
        std::format("Sink upload failed (HTTP {}): {}", response.status, message)
    );
}

auto persisted_bytes(const http::Response& response) -> std::uint64_t
{
    const auto range = response.headers.find("range");

    if (range == response.headers.end())
    {
        return 0;
    }

    // "bytes=0-<last persisted byte>"
    constexpr std::string_view PREFIX = "bytes=0-";

    const std::string_view value(range->second);
    const char*            end  = value.data() + value.size();
    std::uint64_t          last = 0;

    const auto [parsedEnd, errorCode] = std::from_chars(
        value.data() + std::min(PREFIX.size(), value.size()),
        end,
        last
    );

    if (!value.starts_with(PREFIX) || errorCode != std::errc {} || parsedEnd != end)
    {
        throw transfer_sink_error(
            std::format("Sink sent an unreadable Range header: {}", value)
        );
    }

    return last + 1;
}

auto YouTubeSinkApi::open_session(
    const DestinationMetadata& metadata,
    std::uint64_t              totalBytes
) -> std::string
{
    const nlohmann::json resource = {
        { "snippet",
         {
              { "title", truncate_title(metadata.title) },
              { "description", metadata.description },
              { "tags", metadata.tags },
              { "categoryId", metadata.categoryId },
          } },
        {  "status",
         {
              { "privacyStatus", metadata.privacyStatus },
              { "selfDeclaredMadeForKids", false },
          } },
    };
    const std::string body = resource.dump();

    http::Request request {};
    request.method  = "POST";
    request.url     = std::format(
        "{}?uploadType=resumable&part=snippet,status",
        m_Endpoint
    );
    request.headers = {
        std::format("Authorization: Bearer {}", m_Credentials.access_token()),
        "Content-Type: application/json; charset=UTF-8",
        std::format("X-Upload-Content-Length: {}", totalBytes),
        "X-Upload-Content-Type: video/*",
    };
    request.body    = body;
    request.timeout = m_RequestTimeout;

    http::Response response;
    try
    {
        response = http::perform(request);
    }
    catch (const http::http_error& he)
    {
        throw transfer_sink_error(
            std::format("Failed to open upload session: {}", he.what())
        );
    }

    if (response.status != HTTP_OK || !response.headers.contains("location"))
    {
        raise_sink_error(response);
    }

    spdlog::debug("Opened upload session for {}", metadata.title);

    return response.headers.at("location");
}

auto YouTubeSinkApi::send_chunk(
    const std::string&    session,
    std::uint64_t         offset,
    std::span<const char> chunk,
    std::uint64_t         totalBytes,
    ControlFlags&         flags
) -> ChunkReceipt
{
    http::Request request {};
    request.method  = "PUT";
    request.url     = session;
    request.headers = {
        std::format("Authorization: Bearer {}", m_Credentials.access_token()),
        "Content-Type: video/*",
        std::format(
            "Content-Range: bytes {}-{}/{}",
            offset,
            offset + chunk.size() - 1,
            totalBytes
        ),
    };
    request.body           = std::string_view(chunk.data(), chunk.size());
    request.timeout        = m_RequestTimeout;
    request.abortRequested = [&flags]() { return flags.is_cancelled(); };

    http::Response response;
    try
    {
        response = http::perform(request);
    }
    catch (const http::http_error& he)
    {
        if (he.code == CURLE_ABORTED_BY_CALLBACK)
        {
            flags.throw_if_cancelled();
        }

        throw transfer_sink_error(
            std::format("Chunk at offset {} failed: {}", offset, he.what())
        );
    }

    if (response.status == HTTP_RESUME_INCOMPLETE)
    {
        return ChunkReceipt { .persistedBytes = persisted_bytes(response) };
    }

    if (response.status != HTTP_OK && response.status != HTTP_CREATED)
    {
        raise_sink_error(response);
    }

    const auto resource = nlohmann::json::parse(response.body, nullptr, false);

    if (resource.is_discarded() || !resource.contains("id"))
    {
        throw transfer_sink_error(
            "Sink finished the upload without returning an id"
        );
    }

    return ChunkReceipt {
        .persistedBytes = totalBytes,
        .externalId     = resource.at("id").get<std::string>(),
    };
}
} // namespace ferry::pipeline
