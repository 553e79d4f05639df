/**
 * @file ControlHandler.cpp
 * @brief Operator commands, JSON in and JSON out
 */

// Header Being Defined
#include <ferry/pipeline/ControlHandler.hpp>

// Standard Library Includes
#include <cstdint>
#include <exception>
#include <format>
#include <string>
#include <string_view>
#include <utility>

// Third Party Includes
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Project Includes
#include <ferry/pipeline/Errors.hpp>
#include <ferry/pipeline/Job.hpp>

namespace ferry::pipeline
{
namespace
{
constexpr std::string_view BAD_REQUEST = "BadRequest";
constexpr std::string_view NOT_FOUND   = "NotFound";

auto job_id_of(const nlohmann::json& request) -> std::uint64_t
{
    return request.at("job_id").get<std::uint64_t>();
}
} // namespace

ControlHandler::ControlHandler(
    Scheduler&           scheduler,
    const PipelineStats& stats,
    const DedupeLedger&  ledger,
    const CatalogClient& catalog
)
    : m_Scheduler(scheduler),
      m_Stats(stats),
      m_Ledger(ledger),
      m_Catalog(catalog)
{
}

auto ControlHandler::ok(nlohmann::json payload) -> nlohmann::json
{
    payload["status"] = "ok";

    return payload;
}

auto ControlHandler::error(std::string_view kind, std::string_view message)
    -> nlohmann::json
{
    return nlohmann::json {
        {  "status", "error" },
        {    "kind",    kind },
        { "message", message },
    };
}

auto ControlHandler::handle_message(const std::string& message) -> std::string
{
    const auto request = nlohmann::json::parse(message, nullptr, false);

    if (request.is_discarded())
    {
        spdlog::warn("Unreadable control request: {}", message);
        return ControlHandler::error(BAD_REQUEST, "Request is not valid JSON")
            .dump();
    }

    return this->handle(request).dump();
}

auto ControlHandler::handle(const nlohmann::json& request) -> nlohmann::json
{
    if (!request.is_object() || !request.contains("command")
        || !request.at("command").is_string())
    {
        return ControlHandler::error(BAD_REQUEST, "Missing \"command\"");
    }

    const auto command = request.at("command").get<std::string>();

    spdlog::debug("Control command {}", command);

    try
    {
        if (command == "enqueue")
        {
            return this->enqueue(request);
        }
        if (command == "pause")
        {
            return this->set_paused(request, true);
        }
        if (command == "resume")
        {
            return this->set_paused(request, false);
        }
        if (command == "cancel")
        {
            return this->cancel(request);
        }
        if (command == "remove")
        {
            return this->remove(request);
        }
        if (command == "status")
        {
            return this->status(request);
        }
        if (command == "queue")
        {
            return this->queue();
        }
        if (command == "stats")
        {
            return this->stats();
        }
        if (command == "search")
        {
            return this->search(request);
        }
        if (command == "details")
        {
            return this->details(request);
        }
        if (command == "sources")
        {
            return this->sources(request);
        }
    }
    catch (const nlohmann::json::exception& je)
    {
        return ControlHandler::error(
            BAD_REQUEST,
            std::format("Malformed {} request: {}", command, je.what())
        );
    }
    catch (const pipeline_error& pe)
    {
        spdlog::warn("{} failed: {}", command, pe.what());
        return ControlHandler::error(to_string(pe.kind()), pe.what());
    }
    catch (const std::exception& e)
    {
        spdlog::error("{} failed unexpectedly: {}", command, e.what());
        return ControlHandler::error(to_string(ErrorKind::INTERNAL), e.what());
    }

    return ControlHandler::error(
        BAD_REQUEST,
        std::format("Unknown command \"{}\"", command)
    );
}

auto ControlHandler::enqueue(const nlohmann::json& request) -> nlohmann::json
{
    auto source      = request.at("source").get<TransferSource>();
    auto destination = request.at("destination").get<DestinationMetadata>();

    if (source.url.empty())
    {
        return ControlHandler::error(BAD_REQUEST, "Source has no url");
    }

    if (source.sourceId.empty())
    {
        source.sourceId = source.url;
    }

    const auto policy = request.value("repost", false)
                          ? DuplicatePolicy::ALLOW_REPOST
                          : DuplicatePolicy::REJECT;

    const auto jobId = m_Scheduler.enqueue(
        std::move(source),
        std::move(destination),
        policy
    );

    return ControlHandler::ok({
        {   "job_id",                       jobId },
        { "position", m_Scheduler.queue().size() },
    });
}

auto ControlHandler::set_paused(const nlohmann::json& request, bool paused)
    -> nlohmann::json
{
    const auto jobId = job_id_of(request);

    if (!m_Scheduler.set_paused(jobId, paused))
    {
        return ControlHandler::error(
            NOT_FOUND,
            std::format("Job {} is not queued", jobId)
        );
    }

    return ControlHandler::ok({
        { "job_id", jobId },
        { "paused", paused },
    });
}

auto ControlHandler::cancel(const nlohmann::json& request) -> nlohmann::json
{
    const auto jobId = job_id_of(request);

    if (!m_Scheduler.cancel(jobId))
    {
        return ControlHandler::error(
            NOT_FOUND,
            std::format("Job {} is not queued", jobId)
        );
    }

    return ControlHandler::ok({
        { "job_id", jobId },
    });
}

auto ControlHandler::remove(const nlohmann::json& request) -> nlohmann::json
{
    const auto jobId = job_id_of(request);

    if (!m_Scheduler.remove(jobId))
    {
        return ControlHandler::error(
            NOT_FOUND,
            std::format("Job {} is not queued", jobId)
        );
    }

    return ControlHandler::ok({
        { "job_id", jobId },
    });
}

auto ControlHandler::status(const nlohmann::json& request) const
    -> nlohmann::json
{
    const auto jobId    = job_id_of(request);
    const auto snapshot = m_Scheduler.status(jobId);

    if (!snapshot.has_value())
    {
        return ControlHandler::error(
            NOT_FOUND,
            std::format("Job {} is unknown", jobId)
        );
    }

    return ControlHandler::ok({
        { "job", snapshot.value() },
    });
}

auto ControlHandler::queue() const -> nlohmann::json
{
    const auto active = m_Scheduler.active_job();

    return ControlHandler::ok({
        { "active",
          active.has_value() ? nlohmann::json(active.value())
                             : nlohmann::json(nullptr) },
        {   "jobs", m_Scheduler.queue() },
    });
}

auto ControlHandler::stats() const -> nlohmann::json
{
    return ControlHandler::ok({
        {        "stats",        m_Stats.snapshot() },
        { "queue_length", m_Scheduler.queue().size() },
        {   "ledger_size",          m_Ledger.size() },
    });
}

auto ControlHandler::search(const nlohmann::json& request) const
    -> nlohmann::json
{
    return ControlHandler::ok({
        { "results",
          m_Catalog.search(request.at("query").get<std::string>()) },
    });
}

auto ControlHandler::details(const nlohmann::json& request) const
    -> nlohmann::json
{
    return ControlHandler::ok({
        { "details",
          m_Catalog.get_details(request.at("link").get<std::string>()) },
    });
}

auto ControlHandler::sources(const nlohmann::json& request) const
    -> nlohmann::json
{
    return ControlHandler::ok({
        { "sources",
          m_Catalog.get_sources(request.at("link").get<std::string>()) },
    });
}
} // namespace ferry::pipeline
