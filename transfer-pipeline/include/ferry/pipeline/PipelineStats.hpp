/**
 * @file PipelineStats.hpp
 * @brief Aggregate job counters, persisted alongside the ledger
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

// Third Party Library Includes
#include <nlohmann/json.hpp>

namespace ferry::pipeline
{
struct StatsSnapshot
{
    std::uint64_t                                      totalJobs         = 0;
    std::uint64_t                                      successCount      = 0;
    std::uint64_t                                      failureCount      = 0;
    std::uint64_t                                      duplicatesSkipped = 0;
    std::uint64_t                                      totalBytes        = 0;
    std::chrono::time_point<std::chrono::system_clock> startTime;
    std::optional<std::string>                         lastSaved;
};

auto to_json(nlohmann::json& json, const StatsSnapshot& stats) -> void;

class PipelineStats
{
  public: // Constructors
    explicit PipelineStats(std::filesystem::path file);
    PipelineStats(PipelineStats&) = delete;
    PipelineStats(PipelineStats&&) = delete;
    auto operator=(PipelineStats&) -> PipelineStats = delete;
    auto operator=(PipelineStats&&) -> PipelineStats = delete;

  public: // Methods
    // Missing or corrupt files keep the zeroed counters
    auto load() -> void;
    auto save() -> bool;

    auto record_started() -> void;
    auto record_success(std::uint64_t bytes) -> void;
    auto record_failure() -> void;
    auto record_duplicate() -> void;

    [[nodiscard]]
    auto snapshot() const -> StatsSnapshot;

  private: // Members
    std::filesystem::path m_File;
    StatsSnapshot         m_Stats;
    mutable std::mutex    m_StatsMutex;
};
} // namespace ferry::pipeline
