/**
 * @file Job.hpp
 * @brief One source-to-sink transfer request
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Third Party Library Includes
#include <nlohmann/json.hpp>

// Project Includes
#include <ferry/pipeline/ControlFlags.hpp>
#include <ferry/pipeline/Errors.hpp>

namespace ferry::pipeline
{
enum class JobStatus : std::uint8_t
{
    PENDING,
    PROCESSING,
    COMPLETED,
    FAILED,
    CANCELLED,
};

[[nodiscard]]
auto to_string(JobStatus status) -> std::string_view;

[[nodiscard]]
auto is_terminal(JobStatus status) -> bool;

struct TransferSource
{
    // Dedupe key, usually the catalog link of the title
    std::string sourceId;
    std::string url;
    std::string sizeLabel;
    std::string provider;
    std::string quality;
};

// Opaque to the pipeline; handed to the sink unchanged
struct DestinationMetadata
{
    std::string              title;
    std::string              description;
    std::vector<std::string> tags;
    std::string              categoryId    = "1";
    std::string              privacyStatus = "public";
};

struct JobSnapshot
{
    std::uint64_t                                      id = 0;
    TransferSource                                     source;
    DestinationMetadata                                destination;
    JobStatus                                          status = JobStatus::PENDING;
    bool                                               paused    = false;
    bool                                               cancelled = false;
    std::chrono::time_point<std::chrono::system_clock> addedAt;
    std::optional<std::string>                         error;
    std::optional<ErrorKind>                           errorKind;
    std::optional<std::string>                         externalId;
    std::uint64_t                                      bytesTransferred = 0;
};

/**
 * @brief A queued transfer. Status fields are mutated only while the owning
 *        scheduler holds its lock; `flags` is shared with the operator.
 */
struct Job
{
    Job(TransferSource            source,
        DestinationMetadata       destination,
        std::chrono::milliseconds pollInterval);

    [[nodiscard]]
    auto snapshot() const -> JobSnapshot;

    const std::uint64_t                                      id;
    const TransferSource                                     source;
    const DestinationMetadata                                destination;
    const std::chrono::time_point<std::chrono::system_clock> addedAt;
    const std::shared_ptr<ControlFlags>                      flags;

    JobStatus                  status = JobStatus::PENDING;
    std::optional<std::string> error;
    std::optional<ErrorKind>   errorKind;
    std::optional<std::string> externalId;
    std::uint64_t              bytesTransferred = 0;

    [[nodiscard]]
    static auto next_id() -> std::uint64_t;
};

auto to_json(nlohmann::json& json, const TransferSource& source) -> void;
auto from_json(const nlohmann::json& json, TransferSource& source) -> void;
auto to_json(nlohmann::json& json, const DestinationMetadata& destination)
    -> void;
auto from_json(const nlohmann::json& json, DestinationMetadata& destination)
    -> void;
auto to_json(nlohmann::json& json, const JobSnapshot& snapshot) -> void;
} // namespace ferry::pipeline
