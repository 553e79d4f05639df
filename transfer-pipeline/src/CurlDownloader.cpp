/**
 * @file CurlDownloader.cpp
 * @brief Download stage backed by libcurl
 */

// Header Being Defined
#include <ferry/pipeline/CurlDownloader.hpp>

// Standard Library Includes
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <format>
#include <span>
#include <string>

// Third Party Includes
#include <curl/curl.h>
#include <spdlog/spdlog.h>

// Project Includes
#include <ferry/pipeline/ControlFlags.hpp>
#include <ferry/pipeline/Errors.hpp>
#include <ferry/pipeline/Http.hpp>
#include <ferry/pipeline/ProgressThrottler.hpp>
#include <ferry/pipeline/StagingStore.hpp>

namespace ferry::pipeline
{
namespace
{
struct TransferContext
{
    CURL*                                 handle;
    StagedFile&                           sink;
    ControlFlags&                         flags;
    const ProgressCallback&               onProgress;
    std::uint64_t                         maxPayloadBytes;
    std::chrono::milliseconds             timeout;
    std::chrono::steady_clock::time_point started;
    // Time spent blocked at a paused checkpoint does not count against the
    // timeout
    std::chrono::steady_clock::duration   paused {};
    std::uint64_t                         received = 0;
    bool                                  tooLarge = false;
    bool                                  timedOut = false;
    // Exceptions cannot cross libcurl's C frames; parked here until
    // curl_easy_perform() returns
    std::exception_ptr                    error;

    [[nodiscard]]
    auto active_time_exceeded() const -> bool
    {
        return std::chrono::steady_clock::now() - started - paused > timeout;
    }
};

auto content_length(CURL* handle) -> std::uint64_t
{
    curl_off_t length = -1;
    curl_easy_getinfo(handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);

    return length > 0 ? static_cast<std::uint64_t>(length) : 0;
}

auto write_callback(char* data, std::size_t size, std::size_t count, void* userdata)
    -> std::size_t
{
    auto&             context = *static_cast<TransferContext*>(userdata);
    const std::size_t length  = size * count;

    if (context.received + length > context.maxPayloadBytes)
    {
        context.tooLarge = true;
        return 0;
    }

    try
    {
        context.sink.append(std::span<const char>(data, length));
        context.received += length;

        if (context.onProgress)
        {
            context.onProgress(ProgressSample {
                .bytesMoved = context.received,
                .totalBytes = content_length(context.handle),
                .timestamp  = std::chrono::steady_clock::now(),
            });
        }

        const auto beforeCheckpoint = std::chrono::steady_clock::now();
        context.flags.checkpoint();
        context.paused += std::chrono::steady_clock::now() - beforeCheckpoint;
    }
    catch (...)
    {
        context.error = std::current_exception();
        return 0;
    }

    if (context.active_time_exceeded())
    {
        context.timedOut = true;
        return 0;
    }

    return length;
}

// Keeps cancellation and the timeout responsive while the connection is
// stalled
auto transfer_info_callback(
    void* userdata,
    [[maybe_unused]] curl_off_t downloadTotal,
    [[maybe_unused]] curl_off_t downloadNow,
    [[maybe_unused]] curl_off_t uploadTotal,
    [[maybe_unused]] curl_off_t uploadNow
) -> int
{
    auto& context = *static_cast<TransferContext*>(userdata);

    if (context.flags.is_cancelled())
    {
        return 1;
    }

    if (context.active_time_exceeded())
    {
        context.timedOut = true;
        return 1;
    }

    return 0;
}
} // namespace

CurlDownloader::CurlDownloader(
    std::uint64_t             maxPayloadBytes,
    std::chrono::milliseconds timeout
)
    : m_MaxPayloadBytes(maxPayloadBytes),
      m_Timeout(timeout)
{
}

auto CurlDownloader::download(
    const std::string&      sourceUrl,
    StagedFile&             sink,
    ControlFlags&           flags,
    const ProgressCallback& onProgress
) -> DownloadResult
{
    flags.checkpoint();

    auto handle = http::make_easy_handle();

    std::array<char, CURL_ERROR_SIZE> errorBuffer {};

    TransferContext context {
        .handle          = handle.get(),
        .sink            = sink,
        .flags           = flags,
        .onProgress      = onProgress,
        .maxPayloadBytes = m_MaxPayloadBytes,
        .timeout         = m_Timeout,
        .started         = std::chrono::steady_clock::now(),
    };

    curl_easy_setopt(handle.get(), CURLOPT_URL, sourceUrl.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, errorBuffer.data());
    // The timeout is enforced by the callbacks rather than CURLOPT_TIMEOUT_MS,
    // which would also count the time spent paused
    curl_easy_setopt(
        handle.get(),
        CURLOPT_CONNECTTIMEOUT_MS,
        static_cast<long>(m_Timeout.count())
    );
    curl_easy_setopt(
        handle.get(),
        CURLOPT_MAXFILESIZE_LARGE,
        static_cast<curl_off_t>(m_MaxPayloadBytes)
    );
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, &write_callback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &context);
    curl_easy_setopt(handle.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(
        handle.get(),
        CURLOPT_XFERINFOFUNCTION,
        &transfer_info_callback
    );
    curl_easy_setopt(handle.get(), CURLOPT_XFERINFODATA, &context);

    spdlog::info("Downloading {}", sourceUrl);

    const CURLcode result = curl_easy_perform(handle.get());

    if (context.error)
    {
        std::rethrow_exception(context.error);
    }

    if (context.tooLarge || result == CURLE_FILESIZE_EXCEEDED)
    {
        throw transfer_too_large_error(
            std::format(
                "Payload exceeds the {} byte limit",
                m_MaxPayloadBytes
            )
        );
    }

    if (result == CURLE_ABORTED_BY_CALLBACK)
    {
        flags.throw_if_cancelled();
    }

    if (context.timedOut)
    {
        throw transfer_timeout_error(
            std::format(
                "Download timed out after {}s of transfer time",
                std::chrono::duration_cast<std::chrono::seconds>(m_Timeout)
                    .count()
            )
        );
    }

    const std::string reason = errorBuffer.front() != '\0'
                                 ? std::string(errorBuffer.data())
                                 : std::string(curl_easy_strerror(result));

    if (result == CURLE_OPERATION_TIMEDOUT)
    {
        throw transfer_timeout_error(
            std::format("Download connection timed out: {}", reason)
        );
    }

    if (result != CURLE_OK)
    {
        throw transfer_network_error(
            std::format("Download failed: {}", reason)
        );
    }

    if (context.received == 0)
    {
        throw transfer_network_error("Source returned an empty payload");
    }

    if (onProgress)
    {
        onProgress(ProgressSample {
            .bytesMoved = context.received,
            .totalBytes = context.received,
            .timestamp  = std::chrono::steady_clock::now(),
        });
    }

    spdlog::info("Downloaded {} bytes from {}", context.received, sourceUrl);

    return DownloadResult { .bytesWritten = context.received };
}
} // namespace ferry::pipeline
