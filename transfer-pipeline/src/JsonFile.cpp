/**
 * @file JsonFile.cpp
 * @brief Load/save helpers for the service's JSON state files
 */

// Header Being Defined
#include <ferry/pipeline/JsonFile.hpp>

// Standard Library Includes
#include <filesystem>
#include <fstream>
#include <optional>
#include <system_error>

// Third Party Includes
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ferry::pipeline
{
auto load_json_file(const std::filesystem::path& file)
    -> std::optional<nlohmann::json>
{
    std::ifstream stream(file);

    if (!stream.good())
    {
        spdlog::debug("{} not found", file.string());
        return std::nullopt;
    }

    auto json = nlohmann::json::parse(stream, nullptr, false);

    if (json.is_discarded())
    {
        spdlog::warn("{} is not valid JSON, ignoring it", file.string());
        return std::nullopt;
    }

    return json;
}

auto save_json_file(
    const std::filesystem::path& file,
    const nlohmann::json&        json
) -> bool
{
    std::error_code errorCode;

    if (file.has_parent_path())
    {
        std::filesystem::create_directories(file.parent_path(), errorCode);
    }

    auto temporaryFile = file;
    temporaryFile += ".tmp";

    {
        std::ofstream stream(temporaryFile, std::ios::trunc);
        stream << json.dump(2);

        if (!stream.good())
        {
            spdlog::error("Failed to write {}", temporaryFile.string());
            return false;
        }
    }

    std::filesystem::rename(temporaryFile, file, errorCode);

    if (errorCode)
    {
        spdlog::error(
            "Failed to replace {}! Error message: {}",
            file.string(),
            errorCode.message()
        );
        return false;
    }

    return true;
}
} // namespace ferry::pipeline
