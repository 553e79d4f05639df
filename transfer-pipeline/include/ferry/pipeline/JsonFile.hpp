/**
 * @file JsonFile.hpp
 * @brief Load/save helpers for the service's JSON state files
 */

#pragma once

// Standard Library Includes
#include <filesystem>
#include <optional>

// Third Party Library Includes
#include <nlohmann/json.hpp>

namespace ferry::pipeline
{
/**
 * @return std::nullopt if the file is missing or not valid JSON
 */
[[nodiscard]]
auto load_json_file(const std::filesystem::path& file)
    -> std::optional<nlohmann::json>;

/**
 * @brief Writes through a temporary file and renames it into place so a
 *        crash mid-write never leaves a truncated file behind.
 */
auto save_json_file(const std::filesystem::path& file, const nlohmann::json& json)
    -> bool;
} // namespace ferry::pipeline
