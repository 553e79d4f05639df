/**
 * @file ProgressThrottler.cpp
 * @brief Bounds the rate of progress updates sent to the operator
 */

// Header Being Defined
#include <ferry/pipeline/ProgressThrottler.hpp>

// Standard Library Includes
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ferry::pipeline
{
auto to_string(TransferStage stage) -> std::string_view
{
    switch (stage)
    {
    case TransferStage::DOWNLOAD:
        return "download";
    case TransferStage::UPLOAD:
        return "upload";
    }

    return "unknown";
}

ProgressThrottler::ProgressThrottler(
    TransferStage                         stage,
    Policy                                policy,
    std::chrono::steady_clock::time_point start
)
    : m_Stage(stage),
      m_Policy(policy),
      m_Start(start),
      m_LastEmit(start),
      m_LastEmittedPercent(-1)
{
    m_Policy.percentOffset = std::clamp(m_Policy.percentOffset, 0, 100);
}

auto ProgressThrottler::percent_of(const ProgressSample& sample) const -> int
{
    if (sample.totalBytes == 0)
    {
        return m_Policy.percentOffset;
    }

    const auto span  = static_cast<std::uint64_t>(100 - m_Policy.percentOffset);
    const auto moved = std::min(sample.bytesMoved, sample.totalBytes);

    return m_Policy.percentOffset
         + static_cast<int>((moved * span) / sample.totalBytes);
}

auto ProgressThrottler::observe(const ProgressSample& sample)
    -> std::optional<ProgressUpdate>
{
    const int  percent        = this->percent_of(sample);
    const auto sinceLastEmit  = sample.timestamp - m_LastEmit;
    const bool percentChanged = percent != m_LastEmittedPercent;
    const bool reachedEnd     = percent == 100 && m_LastEmittedPercent != 100;
    // A stage announces itself once before any byte has moved
    const bool opening        = m_LastEmittedPercent < 0 && sample.bytesMoved == 0;

    const bool shouldEmit
        = (percentChanged && sinceLastEmit >= m_Policy.minInterval)
       || sinceLastEmit >= m_Policy.maxInterval || reachedEnd || opening;

    if (!shouldEmit)
    {
        return std::nullopt;
    }

    m_LastEmit           = sample.timestamp;
    m_LastEmittedPercent = percent;

    const std::chrono::duration<double> elapsed = sample.timestamp - m_Start;

    ProgressUpdate update {};
    update.stage      = m_Stage;
    update.percent    = percent;
    update.bytesMoved = sample.bytesMoved;
    update.totalBytes = sample.totalBytes;

    if (elapsed.count() > 0.0)
    {
        update.bytesPerSecond
            = static_cast<double>(sample.bytesMoved) / elapsed.count();
    }

    if (update.bytesPerSecond > 0.0 && sample.totalBytes > sample.bytesMoved)
    {
        const auto remaining
            = static_cast<double>(sample.totalBytes - sample.bytesMoved);
        update.eta = std::chrono::seconds(
            static_cast<std::int64_t>(remaining / update.bytesPerSecond)
        );
    }

    return update;
}
} // namespace ferry::pipeline
