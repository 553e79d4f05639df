/**
 * @file EventPublisher.cpp
 * @brief Publishes job events as JSON on a ZeroMQ PUB socket
 */

// Header Being Defined
#include <ferry/pipeline/EventPublisher.hpp>

// Standard Library Includes
#include <mutex>
#include <string>
#include <string_view>

// Third Party Includes
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <zmq.hpp>

namespace ferry::pipeline
{
namespace
{
auto progress_json(const ProgressUpdate& update) -> nlohmann::json
{
    return nlohmann::json {
        {            "stage", std::string(to_string(update.stage)) },
        {          "percent",                       update.percent },
        {      "bytes_moved",                    update.bytesMoved },
        {      "total_bytes",                    update.totalBytes },
        { "bytes_per_second",                update.bytesPerSecond },
        {      "eta_seconds",                   update.eta.count() },
    };
}
} // namespace

EventPublisher::EventPublisher(const std::string& endpoint)
    : m_Socket(m_Context, zmq::socket_type::pub)
{
    m_Socket.bind(endpoint);
    spdlog::info("Publishing job events on {}", endpoint);
}

auto EventPublisher::publish(
    std::string_view      topic,
    const nlohmann::json& payload
) -> void
{
    const std::string body = payload.dump();

    const std::lock_guard<std::mutex> socketLock(m_SocketMutex);

    // PUB drops for slow subscribers instead of blocking
    const auto sent
        = m_Socket.send(zmq::buffer(topic), zmq::send_flags::sndmore)
       && m_Socket.send(zmq::buffer(body), zmq::send_flags::dontwait);

    if (!sent)
    {
        spdlog::debug("Dropped {} event", topic);
    }
}

auto EventPublisher::on_started(const JobSnapshot& job) -> void
{
    this->publish("started", nlohmann::json { { "job", job } });
}

auto EventPublisher::on_progress(
    const JobSnapshot&    job,
    const ProgressUpdate& update
) -> void
{
    this->publish(
        "progress",
        nlohmann::json {
            {      "job",                  job },
            { "progress", progress_json(update) },
        }
    );
}

auto EventPublisher::on_finished(const JobSnapshot& job) -> void
{
    this->publish("finished", nlohmann::json { { "job", job } });
}
} // namespace ferry::pipeline
