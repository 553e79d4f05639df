/**
 * @file DedupeLedger.cpp
 * @brief Persisted set of sources that completed at least once
 */

// Header Being Defined
#include <ferry/pipeline/DedupeLedger.hpp>

// Standard Library Includes
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <format>
#include <mutex>
#include <set>
#include <string>
#include <utility>

// Third Party Includes
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Project Includes
#include <ferry/pipeline/JsonFile.hpp>

namespace ferry::pipeline
{
DedupeLedger::DedupeLedger(std::filesystem::path file)
    : m_File(std::move(file))
{
}

auto DedupeLedger::load() -> void
{
    std::set<std::string> sources;

    if (const auto json = load_json_file(m_File);
        json.has_value() && json->is_object())
    {
        for (const auto& source : json->value("sources", nlohmann::json::array()))
        {
            if (source.is_string())
            {
                sources.emplace(source.get<std::string>());
            }
        }
    }

    const std::lock_guard<std::mutex> ledgerLock(m_LedgerMutex);
    m_Sources = std::move(sources);

    spdlog::info("Loaded {} processed sources", m_Sources.size());
}

auto DedupeLedger::save() const -> bool
{
    nlohmann::json json;

    {
        const std::lock_guard<std::mutex> ledgerLock(m_LedgerMutex);
        json["sources"] = m_Sources;
        json["count"]   = m_Sources.size();
    }

    json["lastUpdated"] = std::format(
        "{:%FT%TZ}",
        std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now())
    );

    return save_json_file(m_File, json);
}

auto DedupeLedger::record(const std::string& sourceId) -> bool
{
    const std::lock_guard<std::mutex> ledgerLock(m_LedgerMutex);

    return m_Sources.emplace(sourceId).second;
}

auto DedupeLedger::contains(const std::string& sourceId) const -> bool
{
    const std::lock_guard<std::mutex> ledgerLock(m_LedgerMutex);

    return m_Sources.contains(sourceId);
}

auto DedupeLedger::size() const -> std::size_t
{
    const std::lock_guard<std::mutex> ledgerLock(m_LedgerMutex);

    return m_Sources.size();
}
} // namespace ferry::pipeline
