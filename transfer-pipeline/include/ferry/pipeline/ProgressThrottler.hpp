/**
 * @file ProgressThrottler.hpp
 * @brief Bounds the rate of progress updates sent to the operator
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace ferry::pipeline
{
enum class TransferStage : std::uint8_t
{
    DOWNLOAD,
    UPLOAD,
};

[[nodiscard]]
auto to_string(TransferStage stage) -> std::string_view;

struct ProgressSample
{
    std::uint64_t                         bytesMoved = 0;
    // 0 when the total is not known yet
    std::uint64_t                         totalBytes = 0;
    std::chrono::steady_clock::time_point timestamp;
};

// Invoked by a transfer stage for every chunk it moves
using ProgressCallback = std::function<void(const ProgressSample&)>;

struct ProgressUpdate
{
    TransferStage        stage          = TransferStage::DOWNLOAD;
    int                  percent        = 0;
    std::uint64_t        bytesMoved     = 0;
    std::uint64_t        totalBytes     = 0;
    double               bytesPerSecond = 0.0;
    std::chrono::seconds eta { 0 };
};

class ProgressThrottler
{
  public: // Structs
    struct Policy
    {
        std::chrono::milliseconds minInterval { 3000 };
        std::chrono::milliseconds maxInterval { 10000 };
        // Raw progress is mapped onto [percentOffset, 100]
        int                       percentOffset = 0;
    };

  public: // Constructors
    ProgressThrottler(
        TransferStage                         stage,
        Policy                                policy,
        std::chrono::steady_clock::time_point start
    );

  public: // Methods
    [[nodiscard]]
    auto observe(const ProgressSample& sample) -> std::optional<ProgressUpdate>;

    [[nodiscard]]
    auto percent_of(const ProgressSample& sample) const -> int;

  private: // Members
    TransferStage                         m_Stage;
    Policy                                m_Policy;
    std::chrono::steady_clock::time_point m_Start;
    std::chrono::steady_clock::time_point m_LastEmit;
    int                                   m_LastEmittedPercent;
};
} // namespace ferry::pipeline
