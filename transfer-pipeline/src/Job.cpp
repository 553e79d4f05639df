/**
 * @file Job.cpp
 * @brief One source-to-sink transfer request
 */

// Header Being Defined
#include <ferry/pipeline/Job.hpp>

// Standard Library Includes
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

// Third Party Includes
#include <nlohmann/json.hpp>

namespace ferry::pipeline
{
auto to_string(JobStatus status) -> std::string_view
{
    switch (status)
    {
    case JobStatus::PENDING:
        return "pending";
    case JobStatus::PROCESSING:
        return "processing";
    case JobStatus::COMPLETED:
        return "completed";
    case JobStatus::FAILED:
        return "failed";
    case JobStatus::CANCELLED:
        return "cancelled";
    }

    return "unknown";
}

auto is_terminal(JobStatus status) -> bool
{
    return status == JobStatus::COMPLETED || status == JobStatus::FAILED
        || status == JobStatus::CANCELLED;
}

auto Job::next_id() -> std::uint64_t
{
    static std::atomic<std::uint64_t> lastID { 0 };

    const auto now = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        )
            .count()
    );

    // Millisecond timestamps, bumped when two jobs land in the same tick
    std::uint64_t previous = lastID.load();
    std::uint64_t next     = 0;
    do
    {
        next = std::max(now, previous + 1);
    } while (!lastID.compare_exchange_weak(previous, next));

    return next;
}

Job::Job(
    TransferSource            source,
    DestinationMetadata       destination,
    std::chrono::milliseconds pollInterval
)
    : id(Job::next_id()),
      source(std::move(source)),
      destination(std::move(destination)),
      addedAt(std::chrono::system_clock::now()),
      flags(std::make_shared<ControlFlags>(pollInterval))
{
}

auto Job::snapshot() const -> JobSnapshot
{
    JobSnapshot snapshot {};
    snapshot.id               = id;
    snapshot.source           = source;
    snapshot.destination      = destination;
    snapshot.status           = status;
    snapshot.paused           = flags->is_paused();
    snapshot.cancelled        = flags->is_cancelled();
    snapshot.addedAt          = addedAt;
    snapshot.error            = error;
    snapshot.errorKind        = errorKind;
    snapshot.externalId       = externalId;
    snapshot.bytesTransferred = bytesTransferred;

    return snapshot;
}

auto to_json(nlohmann::json& json, const TransferSource& source) -> void
{
    json = nlohmann::json {
        {  "source_id",  source.sourceId },
        {        "url",       source.url },
        {       "size", source.sizeLabel },
        {   "provider",  source.provider },
        {    "quality",   source.quality },
    };
}

auto from_json(const nlohmann::json& json, TransferSource& source) -> void
{
    source.url       = json.at("url").get<std::string>();
    source.sourceId  = json.value("source_id", source.url);
    source.sizeLabel = json.value("size", "");
    source.provider  = json.value("provider", "");
    source.quality   = json.value("quality", "");
}

auto to_json(nlohmann::json& json, const DestinationMetadata& destination)
    -> void
{
    json = nlohmann::json {
        {          "title",          destination.title },
        {    "description",    destination.description },
        {           "tags",           destination.tags },
        {    "category_id",     destination.categoryId },
        { "privacy_status",  destination.privacyStatus },
    };
}

auto from_json(const nlohmann::json& json, DestinationMetadata& destination)
    -> void
{
    destination.title       = json.at("title").get<std::string>();
    destination.description = json.value("description", "");
    destination.tags = json.value("tags", std::vector<std::string> {});
    destination.categoryId    = json.value("category_id", "1");
    destination.privacyStatus = json.value("privacy_status", "public");
}

auto to_json(nlohmann::json& json, const JobSnapshot& snapshot) -> void
{
    json = nlohmann::json {
        {                "id",                             snapshot.id },
        {            "source",                         snapshot.source },
        {       "destination",                    snapshot.destination },
        {            "status",       std::string(to_string(snapshot.status)) },
        {            "paused",                         snapshot.paused },
        {         "cancelled",                      snapshot.cancelled },
        {          "added_at",
          std::format("{:%FT%TZ}",
                      std::chrono::floor<std::chrono::seconds>(snapshot.addedAt)) },
        { "bytes_transferred",               snapshot.bytesTransferred },
    };

    if (snapshot.error.has_value())
    {
        json["error"] = snapshot.error.value();
    }

    if (snapshot.errorKind.has_value())
    {
        json["error_kind"] = std::string(to_string(snapshot.errorKind.value()));
    }

    if (snapshot.externalId.has_value())
    {
        json["external_id"] = snapshot.externalId.value();
    }
}
} // namespace ferry::pipeline
