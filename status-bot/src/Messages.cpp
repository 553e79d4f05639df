/**
 * @file Messages.cpp
 * @brief Chat text for pipeline events and control replies
 */

// Header Being Defined
#include <ferry/status_bot/Messages.hpp>

// Standard Library Includes
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

// Third Party Includes
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Project Includes
#include <ferry/pipeline/Formatting.hpp>

namespace ferry::status_bot
{
namespace
{
using pipeline::format_bytes;
using pipeline::format_eta;
using pipeline::format_speed;
using pipeline::progress_bar;

auto job_title(const nlohmann::json& job) -> std::string
{
    return short_title(
        job.value("destination", nlohmann::json::object())
            .value("title", std::string { "untitled" })
    );
}

auto job_size(const nlohmann::json& job) -> std::string
{
    return job.value("source", nlohmann::json::object())
        .value("size", std::string {});
}

auto format_progress(const nlohmann::json& payload) -> std::string
{
    const auto& job      = payload.at("job");
    const auto& progress = payload.at("progress");

    const int           percent    = progress.value("percent", 0);
    const std::uint64_t moved      = progress.value("bytes_moved", std::uint64_t { 0 });
    const std::uint64_t total      = progress.value("total_bytes", std::uint64_t { 0 });
    const double        speed      = progress.value("bytes_per_second", 0.0);
    const auto          etaSeconds = progress.value("eta_seconds", std::int64_t { 0 });

    const bool uploading = progress.value("stage", std::string {}) == "upload";

    std::string_view heading = uploading ? "Uploading" : "Downloading";
    if (uploading && moved == 0)
    {
        heading = "Preparing chunked upload";
    }

    return std::format(
        "{} **{}** (job {})\n🎬 {}\n{} {}%\n📦 {} / {}\n⚡ Speed: {}\n⏱️ ETA: {}",
        uploading ? "📺" : "📥",
        heading,
        job.value("id", std::uint64_t { 0 }),
        job_title(job),
        progress_bar(percent),
        percent,
        format_bytes(moved),
        total > 0 ? format_bytes(total) : std::string { "?" },
        format_speed(speed),
        format_eta(std::chrono::seconds(etaSeconds))
    );
}

auto format_finished(const nlohmann::json& payload) -> std::string
{
    const auto& job    = payload.at("job");
    const auto  status = job.value("status", std::string {});
    const auto  id     = job.value("id", std::uint64_t { 0 });

    if (status == "completed")
    {
        const auto externalId = job.value("external_id", nlohmann::json(nullptr));

        return std::format(
            "✅ **Posted Successfully!** (job {})\n🎬 {}\n💾 {}{}\n{} 100%",
            id,
            job_title(job),
            job_size(job),
            externalId.is_string()
                ? std::format(
                      "\n📺 Video: https://youtu.be/{}",
                      externalId.get<std::string>()
                  )
                : std::string {},
            progress_bar(100)
        );
    }

    if (status == "cancelled")
    {
        return std::format(
            "❌ **Task Cancelled** (job {})\n🎬 {}\n\nTask was cancelled by operator",
            id,
            job_title(job)
        );
    }

    const auto error = job.value("error", nlohmann::json(nullptr));
    const auto kind  = job.value("error_kind", nlohmann::json(nullptr));

    return std::format(
        "{} (job {})\n🎬 {}\n\n{}",
        kind.is_string() && kind.get<std::string>() == "AuthExpiredError"
            ? "🔐 **Action Needed**"
            : "❌ **Error**",
        id,
        job_title(job),
        error.is_string() ? error.get<std::string>() : std::string { "Unknown error" }
    );
}

auto format_queue(const nlohmann::json& reply) -> std::string
{
    const auto& jobs = reply.at("jobs");

    if (jobs.empty())
    {
        return "📋 The queue is empty.";
    }

    std::string text = std::format("📋 **Queue ({})**\n", jobs.size());

    for (std::size_t position = 0; position < jobs.size(); position++)
    {
        const auto& job = jobs.at(position);

        text += std::format(
            "\n{}. {} `{}` {}{}{}",
            position + 1,
            job_title(job),
            job.value("id", std::uint64_t { 0 }),
            job.value("status", std::string {}),
            job.value("paused", false) ? " (Paused)" : "",
            job.value("cancelled", false) ? " (Cancelled)" : ""
        );
    }

    return text;
}

auto format_stats(const nlohmann::json& reply) -> std::string
{
    const auto& stats = reply.at("stats");

    const auto total     = stats.value("totalJobs", std::uint64_t { 0 });
    const auto succeeded = stats.value("successCount", std::uint64_t { 0 });
    const auto bytes     = stats.value("totalBytes", std::uint64_t { 0 });

    const auto startTime = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(stats.value("startTime", std::int64_t { 0 }))
    );
    const auto uptime = std::chrono::duration_cast<std::chrono::minutes>(
        std::chrono::system_clock::now() - startTime
    );

    const auto lastSaved = stats.value("lastSaved", nlohmann::json(nullptr));

    return std::format(
        "📊 **Analytics**\n\n"
        "🎬 Total Jobs: {}\n"
        "✅ Success: {}\n"
        "❌ Failed: {}\n"
        "🔍 Duplicates: {}\n"
        "📈 Success Rate: {:.1f}%\n\n"
        "💾 Total Size: {}\n"
        "📏 Avg Size: {}\n\n"
        "⏱️ Uptime: {} min\n"
        "📋 Queue: {}\n"
        "🗂️ History: {}\n\n"
        "💾 Last Saved: {}",
        total,
        succeeded,
        stats.value("failureCount", std::uint64_t { 0 }),
        stats.value("duplicatesSkipped", std::uint64_t { 0 }),
        total > 0 ? (static_cast<double>(succeeded) * 100.0) / static_cast<double>(total)
                  : 0.0,
        format_bytes(bytes),
        format_bytes(succeeded > 0 ? bytes / succeeded : 0),
        uptime.count(),
        reply.value("queue_length", std::uint64_t { 0 }),
        reply.value("ledger_size", std::uint64_t { 0 }),
        lastSaved.is_string() ? lastSaved.get<std::string>() : std::string { "Never" }
    );
}
} // namespace

auto short_title(const std::string& title, std::size_t limit) -> std::string
{
    if (title.size() <= limit)
    {
        return title;
    }

    std::size_t length = limit;
    while (length > 0
           && (static_cast<unsigned char>(title.at(length)) & 0xC0U) == 0x80U)
    {
        length--;
    }

    return title.substr(0, length) + "...";
}

auto format_event(std::string_view topic, const nlohmann::json& payload)
    -> std::optional<std::string>
{
    if (!payload.is_object() || !payload.contains("job"))
    {
        return std::nullopt;
    }

    try
    {
        if (topic == "progress" && payload.contains("progress"))
        {
            return format_progress(payload);
        }

        if (topic == "finished")
        {
            return format_finished(payload);
        }
    }
    catch (const nlohmann::json::exception& je)
    {
        spdlog::debug("Skipping malformed {} event: {}", topic, je.what());
        return std::nullopt;
    }

    return std::nullopt;
}

auto format_reply(std::string_view subcommand, const nlohmann::json& reply)
    -> std::string
{
    if (reply.value("status", std::string {}) != "ok")
    {
        return std::format(
            "⚠️ {}",
            reply.value("message", std::string { "The pipeline rejected the request" })
        );
    }

    try
    {
        if (subcommand == "queue")
        {
            return format_queue(reply);
        }

        if (subcommand == "stats")
        {
            return format_stats(reply);
        }
    }
    catch (const nlohmann::json::exception& je)
    {
        return std::format("⚠️ Unexpected reply from the pipeline: {}", je.what());
    }

    const auto jobId = reply.value("job_id", std::uint64_t { 0 });

    if (subcommand == "pause")
    {
        return std::format("⏸️ Job {} paused.", jobId);
    }

    if (subcommand == "resume")
    {
        return std::format("▶️ Job {} resumed.", jobId);
    }

    if (subcommand == "cancel")
    {
        return std::format("❌ Job {} cancelled.", jobId);
    }

    if (subcommand == "remove")
    {
        return std::format("✅ Job {} removed.", jobId);
    }

    return "✅ Done.";
}
} // namespace ferry::status_bot
