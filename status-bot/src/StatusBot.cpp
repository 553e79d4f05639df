/**
 * @file StatusBot.cpp
 * @brief Chat front-end relaying transfer events and operator commands
 */

// Header Being Defined
#include <ferry/status_bot/StatusBot.hpp>

// Standard Library Includes
#include <algorithm>
#include <array>
#include <cstdint>
#include <exception>
#include <format>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <variant>

// Third Party Includes
#include <dpp/dpp.h>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <zmq.hpp>

// Project Includes
#include <ferry/status_bot/Messages.hpp>

namespace ferry::status_bot
{
namespace
{
constexpr int RECEIVE_TIMEOUT_MS = 500;

constexpr std::array<std::string_view, 4> JOB_COMMANDS {
    "pause",
    "resume",
    "cancel",
    "remove",
};

auto job_command_option(const char* name, const char* description)
    -> dpp::command_option
{
    return dpp::command_option { dpp::co_sub_command, name, description }
        .add_option(
            dpp::command_option {
                dpp::co_integer,
                "job_id",
                "Job id as shown by /transfer queue",
                true
            }
        );
}
} // namespace

StatusBot::StatusBot(const BotSettings& settings)
try
    : m_Bot(settings.token),
      m_Channels(settings.channelsFile),
      m_Control(settings.controlEndpoint),
      m_EventEndpoint(settings.eventEndpoint)
{
    this->init_logging();

    m_Bot.on_ready(
        [this](const dpp::ready_t&)
        {
            if (dpp::run_once<struct register_transfer_commands>())
            {
                this->register_commands();
            }
        }
    );

    m_Bot.on_slashcommand([this](const dpp::slashcommand_t& slash)
                          { this->handle_command(slash); });
}
catch (const std::exception& e)
{
    spdlog::error("Failed to set up the status bot: {}", e.what());
    throw;
}

StatusBot::~StatusBot()
{
    if (m_EventThread.joinable())
    {
        m_EventThread.request_stop();
        m_EventThread.join();
    }
}

auto StatusBot::run() -> void
{
    m_EventThread = std::jthread([this](const std::stop_token& stopToken)
                                 { this->event_listener(stopToken); });

    spdlog::info("Starting bot");
    m_Bot.start(dpp::st_wait);
}

auto StatusBot::init_logging() -> void
{
    m_Bot.on_log(
        [](const dpp::log_t& event)
        {
            switch (event.severity)
            {
            case dpp::loglevel::ll_trace:
                spdlog::trace(event.message);
                break;
            case dpp::loglevel::ll_debug:
                spdlog::debug(event.message);
                break;
            case dpp::loglevel::ll_info:
                spdlog::info(event.message);
                break;
            case dpp::loglevel::ll_warning:
                spdlog::warn(event.message);
                break;
            case dpp::loglevel::ll_error:
                spdlog::error(event.message);
                break;
            case dpp::loglevel::ll_critical:
                spdlog::critical(event.message);
                break;
            }
        }
    );
}

auto StatusBot::register_commands() -> void
{
    dpp::slashcommand transfer {
        "transfer",
        "Control the transfer pipeline",
        m_Bot.me.id
    };

    transfer.add_option(
        dpp::command_option {
            dpp::co_sub_command,
            "queue",
            "Show queued and active transfers"
        }
    );
    transfer.add_option(job_command_option("pause", "Pause a transfer"));
    transfer.add_option(job_command_option("resume", "Resume a paused transfer"));
    transfer.add_option(job_command_option("cancel", "Cancel a transfer"));
    transfer.add_option(
        job_command_option("remove", "Remove a transfer from the queue")
    );
    transfer.add_option(
        dpp::command_option {
            dpp::co_sub_command,
            "stats",
            "Show transfer analytics"
        }
    );
    transfer.add_option(
        dpp::command_option {
            dpp::co_sub_command,
            "subscribe",
            "Post transfer progress in this channel"
        }
    );
    transfer.add_option(
        dpp::command_option {
            dpp::co_sub_command,
            "unsubscribe",
            "Stop posting transfer progress in this channel"
        }
    );

    m_Bot.global_command_create(
        transfer,
        [](const dpp::confirmation_callback_t& callback)
        {
            if (callback.is_error())
            {
                spdlog::error(
                    "Failed creating global command: {}",
                    callback.get_error().message
                );
            }
            else
            {
                spdlog::info("Created commands");
            }
        }
    );
}

auto StatusBot::handle_command(const dpp::slashcommand_t& slash) -> void
{
    const dpp::command_interaction interaction
        = slash.command.get_command_interaction();

    if (slash.command.get_command_name() != "transfer"
        || interaction.options.empty())
    {
        return;
    }

    const auto& subcommand = interaction.options.at(0);

    spdlog::debug("Received /transfer {}", subcommand.name);

    if (subcommand.name == "subscribe" || subcommand.name == "unsubscribe")
    {
        this->set_subscription_state(
            slash,
            subcommand.name == "subscribe" ? SubscriptionState::SUBSCRIBED
                                           : SubscriptionState::UNSUBSCRIBED
        );
        return;
    }

    this->forward_command(slash, subcommand);
}

auto StatusBot::set_subscription_state(
    const dpp::slashcommand_t& slash,
    SubscriptionState          state
) -> void
{
    const std::string channelId = slash.command.channel_id.str();

    try
    {
        if (state == SubscriptionState::SUBSCRIBED)
        {
            slash.reply(
                m_Channels.add(channelId)
                    ? "This channel is now subscribed to transfer updates."
                    : "This channel is already subscribed to transfer updates."
            );
            return;
        }

        slash.reply(
            m_Channels.remove(channelId)
                ? "This channel will no longer receive transfer updates."
                : "This channel is not receiving transfer updates."
        );
    }
    catch (const std::exception& e)
    {
        spdlog::error("Subscription change for {} failed: {}", channelId, e.what());
        slash.reply("Could not update the subscription, check the bot's logs.");
    }
}

auto StatusBot::forward_command(
    const dpp::slashcommand_t&      slash,
    const dpp::command_data_option& subcommand
) -> void
{
    nlohmann::json request {
        { "command", subcommand.name },
    };

    const bool targetsJob = std::ranges::any_of(
        JOB_COMMANDS,
        [&](std::string_view command) { return command == subcommand.name; }
    );

    if (targetsJob)
    {
        if (subcommand.options.empty()
            || !std::holds_alternative<std::int64_t>(
                subcommand.options.at(0).value
            ))
        {
            slash.reply("A job id is required.");
            return;
        }

        request["job_id"] = std::get<std::int64_t>(subcommand.options.at(0).value);
    }

    // The control socket can take longer than the interaction deadline
    slash.thinking();

    std::string text;

    try
    {
        text = format_reply(subcommand.name, m_Control.request(request));
    }
    catch (const control_unavailable_error& cue)
    {
        spdlog::warn("/transfer {} failed: {}", subcommand.name, cue.what());
        text = std::format("⚠️ {}", cue.what());
    }
    catch (const zmq::error_t& ze)
    {
        spdlog::error("/transfer {} failed: {}", subcommand.name, ze.what());
        text = "⚠️ Could not reach the transfer pipeline.";
    }

    slash.edit_original_response(dpp::message(text));
}

auto StatusBot::broadcast(const std::string& message) -> void
{
    const auto channels = m_Channels.channels();

    spdlog::trace("Broadcasting to {{ {} }}", fmt::join(channels, ", "));

    for (const auto& channel : channels)
    {
        m_Bot.message_create(
            dpp::message { dpp::snowflake { channel }, message },
            [channel](const dpp::confirmation_callback_t& callback)
            {
                // Rate limited or missing channels lose this update only
                if (callback.is_error())
                {
                    spdlog::warn(
                        "Update to channel {} skipped: {}",
                        channel,
                        callback.get_error().message
                    );
                }
            }
        );
    }
}

auto StatusBot::event_listener(const std::stop_token& stopToken) -> void
{
    zmq::context_t socketContext {};
    zmq::socket_t  socket { socketContext, zmq::socket_type::sub };

    socket.set(zmq::sockopt::rcvtimeo, RECEIVE_TIMEOUT_MS);
    socket.set(zmq::sockopt::subscribe, "progress");
    socket.set(zmq::sockopt::subscribe, "finished");
    socket.connect(m_EventEndpoint);

    spdlog::info("Listening for transfer events on {}", m_EventEndpoint);

    while (!stopToken.stop_requested())
    {
        zmq::message_t topic;
        zmq::message_t body;

        if (!socket.recv(topic, zmq::recv_flags::none).has_value())
        {
            continue;
        }

        if (!topic.more() || !socket.recv(body, zmq::recv_flags::none).has_value())
        {
            spdlog::warn("Dropped a truncated event on topic {}", topic.to_string());
            continue;
        }

        const auto payload
            = nlohmann::json::parse(body.to_string(), nullptr, false);

        if (payload.is_discarded())
        {
            spdlog::warn("Dropped an unreadable {} event", topic.to_string());
            continue;
        }

        if (const auto message = format_event(topic.to_string(), payload))
        {
            this->broadcast(message.value());
        }
    }

    spdlog::info("Event listener stop requested");
}
} // namespace ferry::status_bot
