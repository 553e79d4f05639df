/**
 * @file DedupeLedger.hpp
 * @brief Persisted set of sources that completed at least once
 */

#pragma once

// Standard Library Includes
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>

namespace ferry::pipeline
{
class DedupeLedger
{
  public: // Constructors
    explicit DedupeLedger(std::filesystem::path file);
    DedupeLedger(DedupeLedger&) = delete;
    DedupeLedger(DedupeLedger&&) = delete;
    auto operator=(DedupeLedger&) -> DedupeLedger = delete;
    auto operator=(DedupeLedger&&) -> DedupeLedger = delete;

  public: // Methods
    /**
     * @brief Replaces the in-memory set with the file's contents. A missing
     *        or corrupt file leaves the ledger empty.
     */
    auto load() -> void;

    /**
     * @brief Best-effort write. Failures are logged.
     * @return true if the file was written
     */
    auto save() const -> bool;

    /**
     * @return false if the source was already recorded
     */
    auto record(const std::string& sourceId) -> bool;

    [[nodiscard]]
    auto contains(const std::string& sourceId) const -> bool;

    [[nodiscard]]
    auto size() const -> std::size_t;

  private: // Members
    std::filesystem::path m_File;
    std::set<std::string> m_Sources;
    mutable std::mutex    m_LedgerMutex;
};
} // namespace ferry::pipeline
