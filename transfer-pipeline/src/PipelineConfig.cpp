/**
 * @file PipelineConfig.cpp
 * @brief Service configuration loaded from JSON and the environment
 */

// Header Being Defined
#include <ferry/pipeline/PipelineConfig.hpp>

// Standard Library Includes
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>
#include <string>

// Third Party Includes
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ferry::pipeline
{
namespace
{
// Non-final resumable upload chunks must be a multiple of this size
constexpr std::size_t UPLOAD_CHUNK_ALIGNMENT = 256ULL * 1024;

auto milliseconds_value(
    const nlohmann::json&     json,
    const char*               key,
    std::chrono::milliseconds fallback
) -> std::chrono::milliseconds
{
    return std::chrono::milliseconds(json.value(key, fallback.count()));
}

auto seconds_value(
    const nlohmann::json&     json,
    const char*               key,
    std::chrono::milliseconds fallback
) -> std::chrono::milliseconds
{
    const auto fallbackSeconds
        = std::chrono::duration_cast<std::chrono::seconds>(fallback);

    return std::chrono::seconds(json.value(key, fallbackSeconds.count()));
}
} // namespace

auto PipelineConfig::from_json(const nlohmann::json& json) -> PipelineConfig
{
    PipelineConfig config {};

    config.dataDirectory
        = json.value("data_directory", config.dataDirectory.string());
    config.stagingDirectory = json.value(
        "staging_directory",
        (config.dataDirectory / "cache").string()
    );

    config.maxPayloadBytes
        = json.value("max_payload_bytes", config.maxPayloadBytes);
    config.downloadTimeout = seconds_value(
        json,
        "download_timeout_seconds",
        config.downloadTimeout
    );
    config.uploadChunkBytes
        = json.value("upload_chunk_bytes", config.uploadChunkBytes);
    config.uploadReservedPercent = std::clamp(
        json.value("upload_reserved_percent", config.uploadReservedPercent),
        0,
        99
    );

    config.pausePollInterval = milliseconds_value(
        json,
        "pause_poll_milliseconds",
        config.pausePollInterval
    );
    config.quiescenceDelay = milliseconds_value(
        json,
        "quiescence_milliseconds",
        config.quiescenceDelay
    );
    config.saveInterval
        = seconds_value(json, "save_interval_seconds", config.saveInterval);
    config.throttleMinInterval = milliseconds_value(
        json,
        "throttle_min_milliseconds",
        config.throttleMinInterval
    );
    config.throttleMaxInterval = milliseconds_value(
        json,
        "throttle_max_milliseconds",
        config.throttleMaxInterval
    );
    config.finishedHistory
        = json.value("finished_history", config.finishedHistory);

    if (json.contains("sink"))
    {
        const auto& sink    = json.at("sink");
        config.sinkEndpoint = sink.value("endpoint", config.sinkEndpoint);
        config.sinkTokenFile
            = sink.value("token_file", config.sinkTokenFile.string());
        config.sinkRequestTimeout = seconds_value(
            sink,
            "request_timeout_seconds",
            config.sinkRequestTimeout
        );
    }

    if (json.contains("catalog"))
    {
        const auto& catalog   = json.at("catalog");
        config.catalogBaseUrl = catalog.value("base_url", config.catalogBaseUrl);
        config.catalogApiKey  = catalog.value("api_key", config.catalogApiKey);
    }

    config.controlEndpoint
        = json.value("control_endpoint", config.controlEndpoint);
    config.eventEndpoint = json.value("event_endpoint", config.eventEndpoint);

    if (config.throttleMaxInterval < config.throttleMinInterval)
    {
        throw std::runtime_error(
            "throttle_max_milliseconds must not be shorter than "
            "throttle_min_milliseconds"
        );
    }

    if (config.uploadChunkBytes == 0
        || config.uploadChunkBytes % UPLOAD_CHUNK_ALIGNMENT != 0)
    {
        throw std::runtime_error(
            std::format(
                "upload_chunk_bytes must be a positive multiple of {}, got {}",
                UPLOAD_CHUNK_ALIGNMENT,
                config.uploadChunkBytes
            )
        );
    }

    return config;
}

auto PipelineConfig::load(const std::filesystem::path& file) -> PipelineConfig
{
    PipelineConfig config {};
    std::ifstream  configFile(file);

    if (configFile.good())
    {
        config = PipelineConfig::from_json(nlohmann::json::parse(configFile));
        spdlog::info("Loaded configuration from {}", file.string());
    }
    else
    {
        std::string errorMessage(BUFSIZ, '\0');

        spdlog::warn(
            "Failed to open config file {}, using defaults. OS Error: {}",
            file.string(),
            // NOLINTNEXTLINE(*-include-cleaner)
            ::strerror_r(errno, errorMessage.data(), errorMessage.size())
        );
    }

    // NOLINTBEGIN(*-mt-unsafe)
    if (const auto* controlPort = std::getenv("CONTROL_PORT"))
    {
        config.controlEndpoint = std::format("tcp://*:{}", controlPort);
    }

    if (const auto* eventPort = std::getenv("EVENT_PORT"))
    {
        config.eventEndpoint = std::format("tcp://*:{}", eventPort);
    }

    if (const auto* apiKey = std::getenv("CATALOG_API_KEY"))
    {
        config.catalogApiKey = apiKey;
    }

    if (const auto* dryRunPtr = std::getenv("DRY_RUN"))
    {
        std::string dryRun(dryRunPtr);
        std::transform(
            std::begin(dryRun),
            std::end(dryRun),
            std::begin(dryRun),
            [](auto c) { return std::toupper(c); }
        );

        config.dryRun = dryRun == "TRUE";
    }
    // NOLINTEND(*-mt-unsafe)

    if (config.dryRun)
    {
        spdlog::info("Dry run enabled. No bytes will be transferred.");
    }

    return config;
}
} // namespace ferry::pipeline
