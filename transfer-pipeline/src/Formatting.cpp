/**
 * @file Formatting.cpp
 * @brief Human readable renderings of transfer figures
 */

// Header Being Defined
#include <ferry/pipeline/Formatting.hpp>

// Standard Library Includes
#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace ferry::pipeline
{
auto format_bytes(std::uint64_t bytes) -> std::string
{
    using namespace std::string_view_literals;
    constexpr std::array UNITS = { "B"sv, "KB"sv, "MB"sv, "GB"sv, "TB"sv };
    constexpr double     STEP  = 1024.0;

    auto        value = static_cast<double>(bytes);
    std::size_t unit  = 0;

    while (value >= STEP && unit + 1 < UNITS.size())
    {
        value /= STEP;
        unit++;
    }

    if (unit == 0)
    {
        return std::format("{} B", bytes);
    }

    return std::format("{:.2f} {}", value, UNITS.at(unit));
}

auto format_speed(double bytesPerSecond) -> std::string
{
    return std::format(
        "{}/s",
        format_bytes(static_cast<std::uint64_t>(std::max(bytesPerSecond, 0.0)))
    );
}

auto format_eta(std::chrono::seconds eta) -> std::string
{
    const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(eta);
    const auto seconds = eta - minutes;

    return std::format("{}m {:02}s", minutes.count(), seconds.count());
}

auto progress_bar(int percent) -> std::string
{
    constexpr int CELLS  = 10;
    const int     filled = std::clamp(percent, 0, 100) / CELLS;

    std::string bar;
    for (int cell = 0; cell < CELLS; cell++)
    {
        bar += cell < filled ? "█" : "░";
    }

    return bar;
}
} // namespace ferry::pipeline
