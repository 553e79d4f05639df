/**
 * @file Messages.hpp
 * @brief Chat text for pipeline events and control replies
 */

#pragma once

// Standard Library Includes
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

// Third Party Library Includes
#include <nlohmann/json.hpp>

namespace ferry::status_bot
{
/**
 * @brief Renders a published event.
 * @return nullopt for topics that are not broadcast or unreadable payloads
 */
[[nodiscard]]
auto format_event(std::string_view topic, const nlohmann::json& payload)
    -> std::optional<std::string>;

/**
 * @brief Renders the control socket's reply to a `/transfer` sub-command.
 *        Error replies are rendered the same way for every sub-command.
 */
[[nodiscard]]
auto format_reply(std::string_view subcommand, const nlohmann::json& reply)
    -> std::string;

// Cuts to at most `limit` bytes on a code point boundary, marking the cut
[[nodiscard]]
auto short_title(const std::string& title, std::size_t limit = 40)
    -> std::string;
} // namespace ferry::status_bot
