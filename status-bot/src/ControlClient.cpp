/**
 * @file ControlClient.cpp
 * @brief Sends operator commands to the pipeline's control socket
 */

// Header Being Defined
#include <ferry/status_bot/ControlClient.hpp>

// Standard Library Includes
#include <chrono>
#include <format>
#include <mutex>
#include <string>
#include <utility>

// Third Party Includes
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <zmq.hpp>

namespace ferry::status_bot
{
ControlClient::ControlClient(
    std::string               endpoint,
    std::chrono::milliseconds replyTimeout
)
    : m_Endpoint(std::move(endpoint)),
      m_ReplyTimeout(replyTimeout)
{
}

auto ControlClient::connect() -> void
{
    m_Socket.emplace(m_Context, zmq::socket_type::req);
    m_Socket->set(zmq::sockopt::rcvtimeo, static_cast<int>(m_ReplyTimeout.count()));
    m_Socket->set(zmq::sockopt::linger, 0);
    m_Socket->connect(m_Endpoint);

    spdlog::debug("Connected to control socket {}", m_Endpoint);
}

auto ControlClient::request(const nlohmann::json& command) -> nlohmann::json
{
    const std::lock_guard<std::mutex> socketLock(m_SocketMutex);

    if (!m_Socket.has_value())
    {
        this->connect();
    }

    if (!m_Socket->send(zmq::message_t(command.dump()), zmq::send_flags::none)
             .has_value())
    {
        m_Socket.reset();

        throw control_unavailable_error(
            "The transfer pipeline is not accepting commands"
        );
    }

    zmq::message_t reply;

    if (!m_Socket->recv(reply, zmq::recv_flags::none).has_value())
    {
        // A REQ socket that missed its reply cannot send again
        m_Socket.reset();

        throw control_unavailable_error(
            std::format(
                "The transfer pipeline did not answer within {}",
                m_ReplyTimeout
            )
        );
    }

    auto parsed = nlohmann::json::parse(reply.to_string(), nullptr, false);

    if (parsed.is_discarded() || !parsed.is_object())
    {
        throw control_unavailable_error(
            "The transfer pipeline sent an unreadable reply"
        );
    }

    return parsed;
}
} // namespace ferry::status_bot
