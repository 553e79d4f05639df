/**
 * @file PipelineConfig.hpp
 * @brief Service configuration loaded from JSON and the environment
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

// Third Party Library Includes
#include <nlohmann/json.hpp>

namespace ferry::pipeline
{
struct PipelineConfig
{
    std::filesystem::path dataDirectory    = "data";
    std::filesystem::path stagingDirectory = "data/cache";

    std::uint64_t             maxPayloadBytes = 4ULL * 1024 * 1024 * 1024;
    std::chrono::milliseconds downloadTimeout = std::chrono::minutes(30);
    std::size_t               uploadChunkBytes      = 10ULL * 1024 * 1024;
    int                       uploadReservedPercent = 5;
    std::chrono::milliseconds sinkRequestTimeout    = std::chrono::minutes(10);

    std::chrono::milliseconds pausePollInterval  = std::chrono::seconds(2);
    std::chrono::milliseconds quiescenceDelay    = std::chrono::seconds(2);
    std::chrono::milliseconds saveInterval       = std::chrono::minutes(5);
    std::chrono::milliseconds throttleMinInterval = std::chrono::seconds(3);
    std::chrono::milliseconds throttleMaxInterval = std::chrono::seconds(10);
    std::size_t               finishedHistory     = 100;

    std::string           sinkEndpoint
        = "https://www.googleapis.com/upload/youtube/v3/videos";
    std::filesystem::path sinkTokenFile = "data/youtube_token.json";

    std::string catalogBaseUrl;
    std::string catalogApiKey;

    std::string controlEndpoint = "tcp://*:9281";
    std::string eventEndpoint   = "tcp://*:9282";

    bool dryRun = false;

    [[nodiscard]]
    static auto from_json(const nlohmann::json& json) -> PipelineConfig;

    /**
     * @brief Reads `file` (missing file means defaults) and applies the
     *        `CONTROL_PORT`, `EVENT_PORT`, `DRY_RUN` and `CATALOG_API_KEY`
     *        environment overrides.
     */
    [[nodiscard]]
    static auto load(const std::filesystem::path& file) -> PipelineConfig;

    [[nodiscard]]
    auto ledger_file() const -> std::filesystem::path
    {
        return dataDirectory / "processed_sources.json";
    }

    [[nodiscard]]
    auto stats_file() const -> std::filesystem::path
    {
        return dataDirectory / "analytics.json";
    }
};
} // namespace ferry::pipeline
