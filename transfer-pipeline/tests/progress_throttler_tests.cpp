// Progress throttler unit tests (run via CTest).

// Standard Library Includes
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

// Project Includes
#include <ferry/pipeline/ProgressThrottler.hpp>

#include "TestContext.hpp"

namespace
{
using ferry::pipeline::ProgressSample;
using ferry::pipeline::ProgressThrottler;
using ferry::pipeline::TransferStage;
using ferry::testing::TestContext;
using namespace std::chrono_literals;

const auto EPOCH = std::chrono::steady_clock::time_point {};

auto sample_at(
    std::chrono::milliseconds offset,
    std::uint64_t             moved,
    std::uint64_t             total
) -> ProgressSample
{
    return ProgressSample {
        .bytesMoved = moved,
        .totalBytes = total,
        .timestamp  = EPOCH + offset,
    };
}

auto test_min_interval_suppresses_early_updates(TestContext& t) -> void
{
    ProgressThrottler throttler(TransferStage::DOWNLOAD, {}, EPOCH);

    t.check(
        !throttler.observe(sample_at(1s, 10, 100)).has_value(),
        "an update one second after start should be suppressed"
    );

    const auto second = throttler.observe(sample_at(3s, 20, 100));
    t.check(second.has_value(), "a changed percent after 3s should be emitted");
    if (second.has_value())
    {
        t.check(second->percent == 20, "emitted percent should be 20");
        t.check(
            second->stage == TransferStage::DOWNLOAD,
            "emitted stage should be download"
        );
    }

    t.check(
        !throttler.observe(sample_at(4s, 30, 100)).has_value(),
        "a change one second after an emission should be suppressed"
    );
}

auto test_max_interval_forces_heartbeat(TestContext& t) -> void
{
    ProgressThrottler throttler(TransferStage::DOWNLOAD, {}, EPOCH);

    t.check(
        throttler.observe(sample_at(3s, 20, 100)).has_value(),
        "first change after the minimum interval should be emitted"
    );
    t.check(
        !throttler.observe(sample_at(8s, 20, 100)).has_value(),
        "unchanged percent before the maximum interval should be suppressed"
    );
    t.check(
        throttler.observe(sample_at(13s, 20, 100)).has_value(),
        "unchanged percent after the maximum interval should be emitted"
    );
}

auto test_final_update_always_emitted(TestContext& t) -> void
{
    ProgressThrottler throttler(TransferStage::UPLOAD, {}, EPOCH);

    t.check(
        throttler.observe(sample_at(3s, 50, 100)).has_value(),
        "50% after 3s should be emitted"
    );

    const auto final = throttler.observe(sample_at(3500ms, 100, 100));
    t.check(final.has_value(), "100% should bypass the minimum interval");
    if (final.has_value())
    {
        t.check(final->percent == 100, "final update should report 100%");
    }

    t.check(
        !throttler.observe(sample_at(4s, 100, 100)).has_value(),
        "a repeated 100% should not be emitted again"
    );
}

auto test_percent_offset_and_unknown_total(TestContext& t) -> void
{
    ProgressThrottler upload(
        TransferStage::UPLOAD,
        ProgressThrottler::Policy { .percentOffset = 5 },
        EPOCH
    );

    t.check(
        upload.percent_of(sample_at(0ms, 0, 100)) == 5,
        "no progress should map to the reserved offset"
    );
    t.check(
        upload.percent_of(sample_at(0ms, 50, 100)) == 52,
        "half way should map to 5 + 95/2 rounded down"
    );
    t.check(
        upload.percent_of(sample_at(0ms, 100, 100)) == 100,
        "completion should map to 100"
    );
    t.check(
        upload.percent_of(sample_at(0ms, 40, 0)) == 5,
        "unknown total should report the offset"
    );

    ProgressThrottler download(TransferStage::DOWNLOAD, {}, EPOCH);
    t.check(
        download.percent_of(sample_at(0ms, 500, 100)) == 100,
        "overshoot should clamp to 100"
    );
}

auto test_speed_and_eta(TestContext& t) -> void
{
    ProgressThrottler throttler(TransferStage::DOWNLOAD, {}, EPOCH);

    const auto update = throttler.observe(sample_at(4s, 4000, 10000));
    t.check(update.has_value(), "update after 4s should be emitted");
    if (update.has_value())
    {
        t.check(
            update->bytesPerSecond > 999.0 && update->bytesPerSecond < 1001.0,
            "speed should be 1000 B/s"
        );
        t.check(update->eta == 6s, "eta should be 6s for 6000 remaining bytes");
        t.check(update->bytesMoved == 4000, "bytes moved should be reported");
        t.check(update->totalBytes == 10000, "total bytes should be reported");
    }
}

auto test_emission_bounds_over_steady_stream(TestContext& t) -> void
{
    ProgressThrottler throttler(TransferStage::DOWNLOAD, {}, EPOCH);

    constexpr std::uint64_t TOTAL = 1'000'000;
    constexpr int           STEPS = 1000;

    std::vector<std::chrono::milliseconds> emittedAt;
    std::optional<int>                     lastPercent;

    // 100 seconds of activity sampled every 100ms
    for (int step = 1; step <= STEPS; step++)
    {
        const auto offset = std::chrono::milliseconds(step * 100);
        const auto moved  = (TOTAL * static_cast<std::uint64_t>(step)) / STEPS;

        if (const auto update = throttler.observe(sample_at(offset, moved, TOTAL)))
        {
            emittedAt.emplace_back(offset);
            lastPercent = update->percent;
        }
    }

    t.check(lastPercent == 100, "the stream should end with a 100% emission");

    bool minimumHeld = true;
    bool maximumHeld = emittedAt.empty() || emittedAt.front() <= 10s;

    for (std::size_t index = 1; index < emittedAt.size(); index++)
    {
        const auto gap    = emittedAt.at(index) - emittedAt.at(index - 1);
        const bool isLast = index + 1 == emittedAt.size();

        minimumHeld = minimumHeld && (isLast || gap >= 3s);
        maximumHeld = maximumHeld && gap <= 10s;
    }

    t.check(minimumHeld, "non-final emissions should be at least 3s apart");
    t.check(maximumHeld, "emissions should be at most 10s apart");
}

auto test_opening_sample_is_announced(TestContext& t) -> void
{
    ProgressThrottler upload(
        TransferStage::UPLOAD,
        ProgressThrottler::Policy { .percentOffset = 5 },
        EPOCH
    );

    const auto preparing = upload.observe(sample_at(0ms, 0, 100));
    t.check(preparing.has_value(), "a stage should announce itself before any byte");
    if (preparing.has_value())
    {
        t.check(preparing->percent == 5, "the announcement sits at the reserved percent");
        t.check(preparing->eta == 0s, "nothing moved means no eta");
    }

    t.check(
        !upload.observe(sample_at(0ms, 0, 100)).has_value(),
        "the announcement is made once"
    );
    t.check(
        !upload.observe(sample_at(1s, 10, 100)).has_value(),
        "the minimum interval still applies after the announcement"
    );
}
} // namespace

auto main() -> int
{
    TestContext t;
    test_min_interval_suppresses_early_updates(t);
    test_max_interval_forces_heartbeat(t);
    test_final_update_always_emitted(t);
    test_percent_offset_and_unknown_total(t);
    test_speed_and_eta(t);
    test_emission_bounds_over_steady_stream(t);
    test_opening_sample_is_announced(t);

    return t.finish("ferry_progress_throttler_tests");
}
