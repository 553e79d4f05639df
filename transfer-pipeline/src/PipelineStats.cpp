/**
 * @file PipelineStats.cpp
 * @brief Aggregate job counters, persisted alongside the ledger
 */

// Header Being Defined
#include <ferry/pipeline/PipelineStats.hpp>

// Standard Library Includes
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <format>
#include <mutex>
#include <string>
#include <utility>

// Third Party Includes
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Project Includes
#include <ferry/pipeline/JsonFile.hpp>

namespace ferry::pipeline
{
auto to_json(nlohmann::json& json, const StatsSnapshot& stats) -> void
{
    json = nlohmann::json {
        {         "totalJobs",         stats.totalJobs },
        {      "successCount",      stats.successCount },
        {      "failureCount",      stats.failureCount },
        { "duplicatesSkipped", stats.duplicatesSkipped },
        {        "totalBytes",        stats.totalBytes },
        {         "startTime",
          std::chrono::duration_cast<std::chrono::milliseconds>(
              stats.startTime.time_since_epoch()
          )
              .count() },
    };

    json["lastSaved"] = stats.lastSaved.has_value()
                          ? nlohmann::json(stats.lastSaved.value())
                          : nlohmann::json(nullptr);
}

PipelineStats::PipelineStats(std::filesystem::path file)
    : m_File(std::move(file))
{
    m_Stats.startTime = std::chrono::system_clock::now();
}

auto PipelineStats::load() -> void
{
    const auto json = load_json_file(m_File);

    if (!json.has_value() || !json->is_object())
    {
        spdlog::info("No saved analytics, starting fresh");
        return;
    }

    StatsSnapshot loaded {};

    try
    {
        loaded.totalJobs    = json->value("totalJobs", std::uint64_t { 0 });
        loaded.successCount = json->value("successCount", std::uint64_t { 0 });
        loaded.failureCount = json->value("failureCount", std::uint64_t { 0 });
        loaded.duplicatesSkipped
            = json->value("duplicatesSkipped", std::uint64_t { 0 });
        loaded.totalBytes = json->value("totalBytes", std::uint64_t { 0 });

        const auto startTime = json->value("startTime", std::int64_t { 0 });
        loaded.startTime
            = startTime > 0
                ? std::chrono::system_clock::time_point(
                      std::chrono::milliseconds(startTime)
                  )
                : std::chrono::system_clock::now();

        if (json->contains("lastSaved") && json->at("lastSaved").is_string())
        {
            loaded.lastSaved = json->at("lastSaved").get<std::string>();
        }
    }
    catch (const nlohmann::json::exception& je)
    {
        spdlog::warn(
            "Ignoring malformed analytics file {}: {}",
            m_File.string(),
            je.what()
        );
        return;
    }

    const std::lock_guard<std::mutex> statsLock(m_StatsMutex);
    m_Stats = loaded;

    spdlog::info("Analytics loaded: {} jobs processed", m_Stats.totalJobs);
}

auto PipelineStats::save() -> bool
{
    nlohmann::json json;

    {
        const std::lock_guard<std::mutex> statsLock(m_StatsMutex);
        m_Stats.lastSaved = std::format(
            "{:%FT%TZ}",
            std::chrono::floor<std::chrono::seconds>(
                std::chrono::system_clock::now()
            )
        );
        json = m_Stats;
    }

    return save_json_file(m_File, json);
}

auto PipelineStats::record_started() -> void
{
    const std::lock_guard<std::mutex> statsLock(m_StatsMutex);
    m_Stats.totalJobs++;
}

auto PipelineStats::record_success(std::uint64_t bytes) -> void
{
    const std::lock_guard<std::mutex> statsLock(m_StatsMutex);
    m_Stats.successCount++;
    m_Stats.totalBytes += bytes;
}

auto PipelineStats::record_failure() -> void
{
    const std::lock_guard<std::mutex> statsLock(m_StatsMutex);
    m_Stats.failureCount++;
}

auto PipelineStats::record_duplicate() -> void
{
    const std::lock_guard<std::mutex> statsLock(m_StatsMutex);
    m_Stats.duplicatesSkipped++;
}

auto PipelineStats::snapshot() const -> StatsSnapshot
{
    const std::lock_guard<std::mutex> statsLock(m_StatsMutex);

    return m_Stats;
}
} // namespace ferry::pipeline
