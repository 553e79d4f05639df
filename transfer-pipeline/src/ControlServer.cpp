/**
 * @file ControlServer.cpp
 * @brief Serves operator commands on a ZeroMQ REP socket
 */

// Header Being Defined
#include <ferry/pipeline/ControlServer.hpp>

// Standard Library Includes
#include <chrono>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>

// Third Party Includes
#include <spdlog/spdlog.h>
#include <zmq.hpp>

namespace ferry::pipeline
{
namespace
{
// Bounds how long a stop request waits for the blocking receive
constexpr std::chrono::milliseconds RECEIVE_TIMEOUT { 500 };
} // namespace

ControlServer::ControlServer(ControlHandler& handler, std::string endpoint)
    : m_Handler(handler),
      m_Endpoint(std::move(endpoint))
{
}

ControlServer::~ControlServer()
{
    this->stop();
}

auto ControlServer::start() -> void
{
    spdlog::trace("Starting control thread");
    m_ControlThread = std::jthread([this](const std::stop_token& stopToken)
                                   { this->control_loop(stopToken); });
}

auto ControlServer::stop() -> void
{
    if (!m_ControlThread.joinable())
    {
        return;
    }

    m_ControlThread.request_stop();
    m_ControlThread.join();
    spdlog::info("Control thread joined!");
}

auto ControlServer::control_loop(const std::stop_token& stopToken) -> void
{
    zmq::socket_t socket { m_Context, zmq::socket_type::rep };

    socket.set(
        zmq::sockopt::rcvtimeo,
        static_cast<int>(RECEIVE_TIMEOUT.count())
    );
    socket.set(zmq::sockopt::linger, 0);
    socket.bind(m_Endpoint);

    spdlog::info("Control surface listening on {}", m_Endpoint);

    zmq::message_t request;

    while (!stopToken.stop_requested())
    {
        zmq::recv_result_t received;

        try
        {
            received = socket.recv(request, zmq::recv_flags::none);
        }
        catch (const zmq::error_t& ze)
        {
            spdlog::error("Control socket receive failed: {}", ze.what());
            return;
        }

        if (!received.has_value())
        {
            // Timed out, check for a stop request
            continue;
        }

        const std::string reply = m_Handler.handle_message(request.to_string());

        if (!socket.send(zmq::buffer(reply), zmq::send_flags::none).has_value())
        {
            spdlog::warn("Control reply was not sent");
        }
    }

    spdlog::info("Control thread stop requested");
}
} // namespace ferry::pipeline
