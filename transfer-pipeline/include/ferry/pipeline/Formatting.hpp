/**
 * @file Formatting.hpp
 * @brief Human readable renderings of transfer figures
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <cstdint>
#include <string>

namespace ferry::pipeline
{
// 1536 -> "1.50 KB"
[[nodiscard]]
auto format_bytes(std::uint64_t bytes) -> std::string;

[[nodiscard]]
auto format_speed(double bytesPerSecond) -> std::string;

// "4m 05s"
[[nodiscard]]
auto format_eta(std::chrono::seconds eta) -> std::string;

// Ten-cell bar, one cell per 10%
[[nodiscard]]
auto progress_bar(int percent) -> std::string;
} // namespace ferry::pipeline
