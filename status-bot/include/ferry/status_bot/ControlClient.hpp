/**
 * @file ControlClient.hpp
 * @brief Sends operator commands to the pipeline's control socket
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

// Third Party Library Includes
#include <nlohmann/json.hpp>
#include <zmq.hpp>

namespace ferry::status_bot
{
struct control_unavailable_error : std::runtime_error
{
    explicit control_unavailable_error(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

class ControlClient
{
  public: // Constructors
    explicit ControlClient(
        std::string               endpoint,
        std::chrono::milliseconds replyTimeout = std::chrono::seconds(5)
    );
    ControlClient(ControlClient&) = delete;
    ControlClient(ControlClient&&) = delete;
    auto operator=(ControlClient&) -> ControlClient = delete;
    auto operator=(ControlClient&&) -> ControlClient = delete;

  public: // Methods
    /**
     * @brief One request, one reply. Throws `control_unavailable_error` when
     *        the pipeline does not answer in time or answers with garbage.
     */
    auto request(const nlohmann::json& command) -> nlohmann::json;

  private: // Methods
    auto connect() -> void;

  private: // Members
    std::string                  m_Endpoint;
    std::chrono::milliseconds    m_ReplyTimeout;
    zmq::context_t               m_Context;
    std::optional<zmq::socket_t> m_Socket;
    std::mutex                   m_SocketMutex;
};
} // namespace ferry::status_bot
