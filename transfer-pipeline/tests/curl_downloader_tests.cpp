// libcurl download stage tests against local file:// payloads (run via CTest).

// Standard Library Includes
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <thread>

// Project Includes
#include <ferry/pipeline/ControlFlags.hpp>
#include <ferry/pipeline/CurlDownloader.hpp>
#include <ferry/pipeline/Errors.hpp>
#include <ferry/pipeline/Http.hpp>
#include <ferry/pipeline/ProgressThrottler.hpp>
#include <ferry/pipeline/StagingStore.hpp>

#include "TestContext.hpp"

namespace
{
using ferry::pipeline::cancelled_exception;
using ferry::pipeline::ControlFlags;
using ferry::pipeline::CurlDownloader;
using ferry::pipeline::ProgressCallback;
using ferry::pipeline::ProgressSample;
using ferry::pipeline::StagingStore;
using ferry::pipeline::transfer_network_error;
using ferry::pipeline::transfer_timeout_error;
using ferry::pipeline::transfer_too_large_error;
using ferry::testing::ScratchDirectory;
using ferry::testing::TestContext;
using namespace std::chrono_literals;

constexpr std::uint64_t PAYLOAD_BYTES = 256ULL * 1024;

auto write_payload(const std::filesystem::path& file, std::uint64_t bytes)
    -> std::string
{
    std::ofstream output(file, std::ios::binary);
    output << std::string(bytes, 'd');

    return "file://" + file.string();
}

// Runs one download into a fresh staged file and reports which error, if
// any, ended it
struct DownloadRun
{
    std::uint64_t      bytesWritten = 0;
    std::exception_ptr error;
};

auto run_download(
    const ScratchDirectory& scratch,
    CurlDownloader&         downloader,
    const std::string&      url,
    ControlFlags&           flags,
    const ProgressCallback& onProgress
) -> DownloadRun
{
    const StagingStore store(scratch.path() / "cache");
    auto               staged = store.create(1);

    DownloadRun run {};
    try
    {
        run.bytesWritten = downloader.download(url, staged, flags, onProgress).bytesWritten;
    }
    catch (const std::exception&)
    {
        run.error = std::current_exception();
    }

    return run;
}

template <typename Error>
auto ended_with(const DownloadRun& run) -> bool
{
    if (!run.error)
    {
        return false;
    }

    try
    {
        std::rethrow_exception(run.error);
    }
    catch (const Error&)
    {
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }

    return false;
}

auto test_downloads_whole_payload(TestContext& t) -> void
{
    const ScratchDirectory scratch("ferry-download");
    const auto             url = write_payload(scratch.path() / "movie.mp4", PAYLOAD_BYTES);

    CurlDownloader downloader(PAYLOAD_BYTES * 2, 5s);
    ControlFlags   flags(20ms);

    std::uint64_t lastReported = 0;
    const auto    run          = run_download(
        scratch,
        downloader,
        url,
        flags,
        [&](const ProgressSample& sample) { lastReported = sample.bytesMoved; }
    );

    t.check(!run.error, "a readable payload should download");
    t.check(run.bytesWritten == PAYLOAD_BYTES, "every byte should be staged");
    t.check(lastReported == PAYLOAD_BYTES, "the final sample should cover the payload");
}

auto test_pause_does_not_count_against_timeout(TestContext& t) -> void
{
    const ScratchDirectory scratch("ferry-download");
    const auto             url = write_payload(scratch.path() / "movie.mp4", PAYLOAD_BYTES);

    CurlDownloader downloader(PAYLOAD_BYTES * 2, 300ms);
    ControlFlags   flags(20ms);

    std::jthread resumer;
    bool         pausedOnce = false;

    const auto run = run_download(
        scratch,
        downloader,
        url,
        flags,
        [&](const ProgressSample&)
        {
            if (pausedOnce)
            {
                return;
            }

            pausedOnce = true;
            flags.set_paused(true);
            resumer = std::jthread(
                [&flags]()
                {
                    std::this_thread::sleep_for(600ms);
                    flags.set_paused(false);
                }
            );
        }
    );

    t.check(pausedOnce, "the download should have been paused");
    t.check(!run.error, "a pause longer than the timeout should not fail the download");
    t.check(run.bytesWritten == PAYLOAD_BYTES, "the download should resume to the end");
}

auto test_slow_transfer_times_out(TestContext& t) -> void
{
    const ScratchDirectory scratch("ferry-download");
    const auto             url = write_payload(scratch.path() / "movie.mp4", PAYLOAD_BYTES);

    CurlDownloader downloader(PAYLOAD_BYTES * 2, 50ms);
    ControlFlags   flags(20ms);

    // Unpaused time spent per chunk counts against the budget
    const auto run = run_download(
        scratch,
        downloader,
        url,
        flags,
        [](const ProgressSample&) { std::this_thread::sleep_for(120ms); }
    );

    t.check(
        ended_with<transfer_timeout_error>(run),
        "exceeding the active time budget should be a timeout"
    );
}

auto test_oversized_payload_is_rejected(TestContext& t) -> void
{
    const ScratchDirectory scratch("ferry-download");
    const auto             url = write_payload(scratch.path() / "movie.mp4", 4096);

    CurlDownloader downloader(1000, 5s);
    ControlFlags   flags(20ms);

    const auto run = run_download(scratch, downloader, url, flags, {});

    t.check(
        ended_with<transfer_too_large_error>(run),
        "a payload above the ceiling should be too large"
    );
}

auto test_unreadable_and_empty_sources(TestContext& t) -> void
{
    const ScratchDirectory scratch("ferry-download");

    CurlDownloader downloader(PAYLOAD_BYTES, 5s);
    ControlFlags   flags(20ms);

    const auto missing = run_download(
        scratch,
        downloader,
        "file://" + (scratch.path() / "absent.mp4").string(),
        flags,
        {}
    );
    t.check(
        ended_with<transfer_network_error>(missing),
        "a source that cannot be read should be a network error"
    );

    const auto empty = run_download(
        scratch,
        downloader,
        write_payload(scratch.path() / "empty.mp4", 0),
        flags,
        {}
    );
    t.check(
        ended_with<transfer_network_error>(empty),
        "an empty payload should be a network error"
    );
}

auto test_cancel_mid_download(TestContext& t) -> void
{
    const ScratchDirectory scratch("ferry-download");
    const auto             url = write_payload(scratch.path() / "movie.mp4", PAYLOAD_BYTES);

    CurlDownloader downloader(PAYLOAD_BYTES * 2, 5s);
    ControlFlags   flags(20ms);

    std::uint64_t moved = 0;
    const auto    run   = run_download(
        scratch,
        downloader,
        url,
        flags,
        [&](const ProgressSample& sample)
        {
            moved = sample.bytesMoved;
            flags.cancel();
        }
    );

    t.check(ended_with<cancelled_exception>(run), "a cancel should end the download");
    t.check(moved < PAYLOAD_BYTES, "the download should stop before the end");
}
} // namespace

auto main() -> int
{
    const ferry::pipeline::http::CurlGlobal curlGlobal {};

    TestContext t;
    test_downloads_whole_payload(t);
    test_pause_does_not_count_against_timeout(t);
    test_slow_transfer_times_out(t);
    test_oversized_payload_is_rejected(t);
    test_unreadable_and_empty_sources(t);
    test_cancel_mid_download(t);

    return t.finish("ferry_curl_downloader_tests");
}
