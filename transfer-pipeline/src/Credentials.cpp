/**
 * @file Credentials.cpp
 * @brief Access to the sink credential maintained by the auth collaborator
 */

// Header Being Defined
#include <ferry/pipeline/Credentials.hpp>

// Standard Library Includes
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <utility>

// Third Party Includes
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Project Includes
#include <ferry/pipeline/Errors.hpp>

namespace ferry::pipeline
{
TokenFileCredentials::TokenFileCredentials(std::filesystem::path tokenFile)
    : m_TokenFile(std::move(tokenFile))
{
}

auto TokenFileCredentials::access_token() -> std::string
{
    std::ifstream tokenStream(m_TokenFile);

    if (!tokenStream.good())
    {
        throw auth_expired_error(
            std::format(
                "No sink credential found at {}. Re-authenticate the uploader.",
                m_TokenFile.string()
            )
        );
    }

    const auto token = nlohmann::json::parse(tokenStream, nullptr, false);

    if (token.is_discarded() || !token.is_object()
        || !token.contains("access_token"))
    {
        throw auth_expired_error(
            std::format(
                "Sink credential {} is unreadable. Re-authenticate the "
                "uploader.",
                m_TokenFile.string()
            )
        );
    }

    if (token.contains("expiry_date") && token.at("expiry_date").is_number())
    {
        const auto expiry = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(token.at("expiry_date").get<std::int64_t>())
        );

        if (expiry <= std::chrono::system_clock::now())
        {
            throw auth_expired_error(
                "Sink credential has expired. Re-authenticate the uploader."
            );
        }
    }

    spdlog::trace("Loaded sink credential from {}", m_TokenFile.string());

    return token.at("access_token").get<std::string>();
}
} // namespace ferry::pipeline
