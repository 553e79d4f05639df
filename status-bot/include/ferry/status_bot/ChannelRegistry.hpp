/**
 * @file ChannelRegistry.hpp
 * @brief Chat channels subscribed to transfer updates, one id per line
 */

#pragma once

// Standard Library Includes
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace ferry::status_bot
{
class ChannelRegistry
{
  public: // Constructors
    explicit ChannelRegistry(std::filesystem::path file);
    ChannelRegistry(ChannelRegistry&) = delete;
    ChannelRegistry(ChannelRegistry&&) = delete;
    auto operator=(ChannelRegistry&) -> ChannelRegistry = delete;
    auto operator=(ChannelRegistry&&) -> ChannelRegistry = delete;

  public: // Methods
    // A missing file means no subscriptions
    [[nodiscard]]
    auto channels() const -> std::vector<std::string>;

    [[nodiscard]]
    auto contains(const std::string& channelId) const -> bool;

    /**
     * @return false if the channel was already subscribed
     */
    auto add(const std::string& channelId) -> bool;

    /**
     * @return false if the channel was not subscribed
     */
    auto remove(const std::string& channelId) -> bool;

  private: // Methods
    auto read_channels() const -> std::vector<std::string>;
    auto write_channels(const std::vector<std::string>& channels) const -> void;

  private: // Members
    std::filesystem::path m_File;
    mutable std::mutex    m_FileMutex;
};
} // namespace ferry::status_bot
