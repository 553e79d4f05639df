/**
 * @file main.cpp
 * @brief Status bot entry point
 */

// Standard Library Includes
#include <cstdlib>
#include <exception>
#include <fstream>
#include <string>

// Third Party Includes
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

// Project Includes
#include <ferry/status_bot/StatusBot.hpp>

namespace
{
auto env_or(const char* key, const std::string& fallback) -> std::string
{
    // NOLINTNEXTLINE(*-mt-unsafe)
    const auto* value = std::getenv(key);

    return value != nullptr ? value : fallback;
}
} // namespace

auto main() -> int
{
    using namespace ferry::status_bot;

    spdlog::cfg::load_env_levels();

    BotSettings settings {};
    settings.channelsFile
        = env_or("CHANNELS_FILE", settings.channelsFile.string());
    settings.controlEndpoint
        = env_or("CONTROL_ENDPOINT", settings.controlEndpoint);
    settings.eventEndpoint = env_or("EVENT_ENDPOINT", settings.eventEndpoint);

    // The bot token is the only content of the token file
    const std::string tokenFile = env_or("BOT_TOKEN_FILE", "/status-bot/.env");
    std::ifstream     env(tokenFile);
    env >> settings.token;

    if (settings.token.empty())
    {
        spdlog::error("No bot token found in {}", tokenFile);
        return EXIT_FAILURE;
    }

    try
    {
        StatusBot bot(settings);
        bot.run();
    }
    catch (const std::exception& e)
    {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
