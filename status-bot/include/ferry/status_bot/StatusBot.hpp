/**
 * @file StatusBot.hpp
 * @brief Chat front-end relaying transfer events and operator commands
 */

#pragma once

// Standard Library Includes
#include <cstdint>
#include <filesystem>
#include <stop_token>
#include <string>
#include <thread>

// Third Party Library Includes
#include <dpp/dpp.h>

// Project Includes
#include <ferry/status_bot/ChannelRegistry.hpp>
#include <ferry/status_bot/ControlClient.hpp>

namespace ferry::status_bot
{
struct BotSettings
{
    std::string           token;
    std::filesystem::path channelsFile    = "/status-bot/channels.txt";
    std::string           controlEndpoint = "tcp://localhost:9281";
    std::string           eventEndpoint   = "tcp://localhost:9282";
};

enum class SubscriptionState : std::uint8_t
{
    SUBSCRIBED,
    UNSUBSCRIBED
};

class StatusBot
{
  public: // Constructors
    explicit StatusBot(const BotSettings& settings);
    StatusBot(StatusBot&) = delete;
    StatusBot(StatusBot&&) = delete;
    auto operator=(StatusBot&) -> StatusBot = delete;
    auto operator=(StatusBot&&) -> StatusBot = delete;

    ~StatusBot();

  public: // Methods
    // Blocks for the life of the gateway connection
    auto run() -> void;

  private: // Methods
    auto init_logging() -> void;
    auto register_commands() -> void;
    auto handle_command(const dpp::slashcommand_t& slash) -> void;
    auto set_subscription_state(
        const dpp::slashcommand_t& slash,
        SubscriptionState          state
    ) -> void;
    auto forward_command(
        const dpp::slashcommand_t&      slash,
        const dpp::command_data_option& subcommand
    ) -> void;
    auto broadcast(const std::string& message) -> void;
    auto event_listener(const std::stop_token& stopToken) -> void;

  private: // Members
    dpp::cluster    m_Bot;
    ChannelRegistry m_Channels;
    ControlClient   m_Control;
    std::string     m_EventEndpoint;
    std::jthread    m_EventThread;
};
} // namespace ferry::status_bot
