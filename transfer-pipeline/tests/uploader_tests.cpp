// Upload stage unit tests (run via CTest).

// Standard Library Includes
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

// Project Includes
#include <ferry/pipeline/ControlFlags.hpp>
#include <ferry/pipeline/Errors.hpp>
#include <ferry/pipeline/Job.hpp>
#include <ferry/pipeline/Uploader.hpp>

#include "Fakes.hpp"
#include "TestContext.hpp"

namespace
{
using ferry::pipeline::auth_expired_error;
using ferry::pipeline::cancelled_exception;
using ferry::pipeline::ControlFlags;
using ferry::pipeline::DestinationMetadata;
using ferry::pipeline::ProgressSample;
using ferry::pipeline::staging_io_error;
using ferry::pipeline::transfer_sink_error;
using ferry::pipeline::Uploader;
using ferry::testing::FakeSinkApi;
using ferry::testing::ScratchDirectory;
using ferry::testing::TestContext;
using namespace std::chrono_literals;

auto write_payload(const std::filesystem::path& file, std::size_t bytes) -> void
{
    std::ofstream output(file, std::ios::binary);
    output << std::string(bytes, 'p');
}

auto test_chunks_cover_the_file(TestContext& t) -> void
{
    const ScratchDirectory scratch("ferry-uploader");
    const auto             staged = scratch.path() / "1.part";
    write_payload(staged, 25);

    FakeSinkApi  sink;
    Uploader     uploader(sink, 10);
    ControlFlags flags(20ms);

    std::vector<std::uint64_t> reported;

    const auto result = uploader.upload(
        staged,
        DestinationMetadata { .title = "Big Buck Bunny" },
        flags,
        [&](const ProgressSample& sample) { reported.emplace_back(sample.bytesMoved); }
    );

    t.check(result.externalId == "video-1", "the acknowledgement should be returned");
    t.check(sink.openedTitles.size() == 1, "exactly one session should be opened");
    t.check(
        !sink.declaredTotals.empty() && sink.declaredTotals.front() == 25,
        "the session should declare the staged size"
    );

    t.check(sink.chunks.size() == 3, "25 bytes in 10 byte chunks needs 3 writes");
    if (sink.chunks.size() == 3)
    {
        t.check(sink.chunks.at(0).offset == 0, "first chunk starts at 0");
        t.check(sink.chunks.at(1).offset == 10, "second chunk starts at 10");
        t.check(sink.chunks.at(2).offset == 20, "third chunk starts at 20");
        t.check(sink.chunks.at(2).length == 5, "last chunk carries the remainder");
        t.check(
            sink.chunks.at(0).session == "session-1",
            "chunks should reuse the opened session"
        );
    }

    t.check(
        reported == std::vector<std::uint64_t> { 0, 10, 20, 25 },
        "progress should open at zero and follow every chunk"
    );
}

auto test_empty_file_is_rejected(TestContext& t) -> void
{
    const ScratchDirectory scratch("ferry-uploader");
    const auto             staged = scratch.path() / "2.part";
    write_payload(staged, 0);

    FakeSinkApi  sink;
    Uploader     uploader(sink, 10);
    ControlFlags flags(20ms);

    bool threw = false;
    try
    {
        [[maybe_unused]]
        const auto result = uploader.upload(staged, {}, flags, {});
    }
    catch (const staging_io_error& sie)
    {
        threw = true;
        t.check_contains(sie.what(), "empty", "message should name the problem");
    }

    t.check(threw, "an empty staged file should raise a staging error");
    t.check(sink.openedTitles.empty(), "no session should be opened for it");

    bool missingThrew = false;
    try
    {
        [[maybe_unused]]
        const auto result
            = uploader.upload(scratch.path() / "absent.part", {}, flags, {});
    }
    catch (const staging_io_error&)
    {
        missingThrew = true;
    }

    t.check(missingThrew, "a missing staged file should raise a staging error");
}

auto test_cancelled_before_start(TestContext& t) -> void
{
    const ScratchDirectory scratch("ferry-uploader");
    const auto             staged = scratch.path() / "3.part";
    write_payload(staged, 25);

    FakeSinkApi  sink;
    Uploader     uploader(sink, 10);
    ControlFlags flags(20ms);
    flags.cancel();

    bool threw = false;
    try
    {
        [[maybe_unused]]
        const auto result = uploader.upload(staged, {}, flags, {});
    }
    catch (const cancelled_exception&)
    {
        threw = true;
    }

    t.check(threw, "a cancelled job should not upload");
    t.check(sink.openedTitles.empty(), "no session should be opened once cancelled");
}

auto test_missing_acknowledgement(TestContext& t) -> void
{
    const ScratchDirectory scratch("ferry-uploader");
    const auto             staged = scratch.path() / "4.part";
    write_payload(staged, 12);

    FakeSinkApi sink;
    sink.neverAcknowledge = true;

    Uploader     uploader(sink, 10);
    ControlFlags flags(20ms);

    bool threw = false;
    try
    {
        [[maybe_unused]]
        const auto result = uploader.upload(staged, {}, flags, {});
    }
    catch (const transfer_sink_error&)
    {
        threw = true;
    }

    t.check(threw, "an upload the sink never acknowledges should fail");
    t.check(sink.chunks.size() == 2, "every chunk should still have been sent");
}

auto test_auth_failure_propagates(TestContext& t) -> void
{
    const ScratchDirectory scratch("ferry-uploader");
    const auto             staged = scratch.path() / "5.part";
    write_payload(staged, 30);

    FakeSinkApi sink;
    sink.chunkFailure = std::make_exception_ptr(
        auth_expired_error("Token revoked. Re-authenticate the sink account")
    );
    sink.failOnChunk = 1;

    Uploader     uploader(sink, 10);
    ControlFlags flags(20ms);

    bool threw = false;
    try
    {
        [[maybe_unused]]
        const auto result = uploader.upload(staged, {}, flags, {});
    }
    catch (const auth_expired_error& aee)
    {
        threw = true;
        t.check_contains(aee.what(), "Re-authenticate", "message should be kept");
    }

    t.check(threw, "an expired credential should surface as auth_expired_error");
    t.check(sink.chunks.size() == 1, "upload should stop at the rejected chunk");
}
auto test_partially_persisted_chunks_are_resent(TestContext& t) -> void
{
    const ScratchDirectory scratch("ferry-uploader");
    const auto             staged = scratch.path() / "6.part";
    write_payload(staged, 25);

    FakeSinkApi sink;
    sink.keepBytes = 6;

    Uploader     uploader(sink, 10);
    ControlFlags flags(20ms);

    const auto result = uploader.upload(staged, {}, flags, {});

    std::vector<std::uint64_t> offsets;
    for (const auto& chunk : sink.chunks)
    {
        offsets.emplace_back(chunk.offset);
    }

    t.check(result.externalId == "video-1", "the upload should still finish");
    t.check(
        offsets == std::vector<std::uint64_t> { 0, 6, 12, 18, 24 },
        "each chunk should start where the sink stopped persisting"
    );
    t.check(
        !sink.chunks.empty() && sink.chunks.back().length == 1,
        "the last chunk should carry only the missing byte"
    );
}

auto test_pause_mid_upload_resumes_in_place(TestContext& t) -> void
{
    const ScratchDirectory scratch("ferry-uploader");
    const auto             staged = scratch.path() / "7.part";
    write_payload(staged, 30);

    FakeSinkApi  sink;
    Uploader     uploader(sink, 10);
    ControlFlags flags(20ms);

    std::jthread resumer;
    sink.duringChunk = [&](std::size_t index, ControlFlags& chunkFlags)
    {
        if (index != 0)
        {
            return;
        }

        chunkFlags.set_paused(true);
        resumer = std::jthread(
            [&chunkFlags]()
            {
                std::this_thread::sleep_for(150ms);
                chunkFlags.set_paused(false);
            }
        );
    };

    const auto started = std::chrono::steady_clock::now();
    const auto result  = uploader.upload(staged, {}, flags, {});
    const auto elapsed = std::chrono::steady_clock::now() - started;

    t.check(result.externalId == "video-1", "a resumed upload should finish");
    t.check(sink.openedTitles.size() == 1, "resuming should not open a new session");
    t.check(sink.chunks.size() == 3, "no chunk should be sent twice");
    if (sink.chunks.size() == 3)
    {
        t.check(
            sink.chunks.at(1).offset == 10,
            "the upload should continue at the next offset"
        );
    }
    t.check(elapsed >= 150ms, "the next chunk should wait for the resume");
}

auto test_cancel_during_chunk(TestContext& t) -> void
{
    const ScratchDirectory scratch("ferry-uploader");
    const auto             staged = scratch.path() / "8.part";
    write_payload(staged, 30);

    FakeSinkApi sink;
    sink.duringChunk = [](std::size_t index, ControlFlags& chunkFlags)
    {
        if (index == 1)
        {
            chunkFlags.cancel();
        }
    };

    Uploader     uploader(sink, 10);
    ControlFlags flags(20ms);

    bool threw = false;
    try
    {
        [[maybe_unused]]
        const auto result = uploader.upload(staged, {}, flags, {});
    }
    catch (const cancelled_exception&)
    {
        threw = true;
    }

    t.check(threw, "a cancel during a chunk should end the upload as cancelled");
    t.check(sink.chunks.size() == 2, "no chunk should follow the cancelled one");
    t.check(sink.acknowledged == 0, "a cancelled upload is never acknowledged");
}
} // namespace

auto main() -> int
{
    TestContext t;
    test_chunks_cover_the_file(t);
    test_empty_file_is_rejected(t);
    test_cancelled_before_start(t);
    test_missing_acknowledgement(t);
    test_auth_failure_propagates(t);
    test_partially_persisted_chunks_are_resent(t);
    test_pause_mid_upload_resumes_in_place(t);
    test_cancel_during_chunk(t);

    return t.finish("ferry_uploader_tests");
}
