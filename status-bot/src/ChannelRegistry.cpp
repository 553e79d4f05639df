/**
 * @file ChannelRegistry.cpp
 * @brief Chat channels subscribed to transfer updates, one id per line
 */

// Header Being Defined
#include <ferry/status_bot/ChannelRegistry.hpp>

// Standard Library Includes
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Third Party Includes
#include <spdlog/spdlog.h>

namespace ferry::status_bot
{
ChannelRegistry::ChannelRegistry(std::filesystem::path file)
    : m_File(std::move(file))
{
}

auto ChannelRegistry::read_channels() const -> std::vector<std::string>
{
    std::ifstream            channelsFile(m_File);
    std::vector<std::string> channels {};
    std::string              channel;

    while (std::getline(channelsFile, channel))
    {
        if (!channel.empty())
        {
            channels.emplace_back(channel);
        }
    }

    return channels;
}

auto ChannelRegistry::write_channels(const std::vector<std::string>& channels)
    const -> void
{
    if (m_File.has_parent_path())
    {
        std::filesystem::create_directories(m_File.parent_path());
    }

    std::ofstream channelsFile(m_File, std::ios::trunc);

    if (!channelsFile.good())
    {
        std::string errorMessage(BUFSIZ, '\0');

        throw std::runtime_error(
            std::format(
                "Failed to write channels file {}! OS Error: {}",
                m_File.string(),
                // NOLINTNEXTLINE(*-include-cleaner)
                ::strerror_r(errno, errorMessage.data(), errorMessage.size())
            )
        );
    }

    for (const auto& channel : channels)
    {
        channelsFile << channel << '\n';
    }
}

auto ChannelRegistry::channels() const -> std::vector<std::string>
{
    const std::lock_guard<std::mutex> fileLock(m_FileMutex);

    return this->read_channels();
}

auto ChannelRegistry::contains(const std::string& channelId) const -> bool
{
    const std::lock_guard<std::mutex> fileLock(m_FileMutex);

    return std::ranges::contains(this->read_channels(), channelId);
}

auto ChannelRegistry::add(const std::string& channelId) -> bool
{
    const std::lock_guard<std::mutex> fileLock(m_FileMutex);

    auto channels = this->read_channels();

    if (std::ranges::contains(channels, channelId))
    {
        return false;
    }

    channels.emplace_back(channelId);
    this->write_channels(channels);
    spdlog::info("Channel {} subscribed", channelId);

    return true;
}

auto ChannelRegistry::remove(const std::string& channelId) -> bool
{
    const std::lock_guard<std::mutex> fileLock(m_FileMutex);

    auto channels = this->read_channels();

    if (std::erase(channels, channelId) == 0)
    {
        return false;
    }

    this->write_channels(channels);
    spdlog::info("Channel {} unsubscribed", channelId);

    return true;
}
} // namespace ferry::status_bot
