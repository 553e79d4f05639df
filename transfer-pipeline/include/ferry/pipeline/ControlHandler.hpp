/**
 * @file ControlHandler.hpp
 * @brief Operator commands, JSON in and JSON out
 */

#pragma once

// Standard Library Includes
#include <string>
#include <string_view>

// Third Party Library Includes
#include <nlohmann/json.hpp>

// Project Includes
#include <ferry/pipeline/CatalogClient.hpp>
#include <ferry/pipeline/DedupeLedger.hpp>
#include <ferry/pipeline/PipelineStats.hpp>
#include <ferry/pipeline/Scheduler.hpp>

namespace ferry::pipeline
{
/**
 * @brief Requests look like `{"command": "pause", "job_id": 17}`.
 *
 * Replies are `{"status": "ok", ...}` or
 * `{"status": "error", "kind": ..., "message": ...}`. No request can make
 * `handle` throw.
 */
class ControlHandler
{
  public: // Constructors
    ControlHandler(
        Scheduler&           scheduler,
        const PipelineStats& stats,
        const DedupeLedger&  ledger,
        const CatalogClient& catalog
    );

  public: // Methods
    [[nodiscard]]
    auto handle(const nlohmann::json& request) -> nlohmann::json;

    [[nodiscard]]
    auto handle_message(const std::string& message) -> std::string;

  private: // Methods
    auto enqueue(const nlohmann::json& request) -> nlohmann::json;
    auto set_paused(const nlohmann::json& request, bool paused)
        -> nlohmann::json;
    auto cancel(const nlohmann::json& request) -> nlohmann::json;
    auto remove(const nlohmann::json& request) -> nlohmann::json;
    auto status(const nlohmann::json& request) const -> nlohmann::json;
    auto queue() const -> nlohmann::json;
    auto stats() const -> nlohmann::json;
    auto search(const nlohmann::json& request) const -> nlohmann::json;
    auto details(const nlohmann::json& request) const -> nlohmann::json;
    auto sources(const nlohmann::json& request) const -> nlohmann::json;

  private: // Static Methods
    static auto ok(nlohmann::json payload = nlohmann::json::object())
        -> nlohmann::json;
    static auto error(std::string_view kind, std::string_view message)
        -> nlohmann::json;

  private: // Members
    Scheduler&           m_Scheduler;
    const PipelineStats& m_Stats;
    const DedupeLedger&  m_Ledger;
    const CatalogClient& m_Catalog;
};
} // namespace ferry::pipeline
