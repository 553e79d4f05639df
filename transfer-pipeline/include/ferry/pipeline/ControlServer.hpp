/**
 * @file ControlServer.hpp
 * @brief Serves operator commands on a ZeroMQ REP socket
 */

#pragma once

// Standard Library Includes
#include <stop_token>
#include <string>
#include <thread>

// Third Party Library Includes
#include <zmq.hpp>

// Project Includes
#include <ferry/pipeline/ControlHandler.hpp>

namespace ferry::pipeline
{
class ControlServer
{
  public: // Constructors
    ControlServer(ControlHandler& handler, std::string endpoint);
    ControlServer(ControlServer&) = delete;
    ControlServer(ControlServer&&) = delete;
    auto operator=(ControlServer&) -> ControlServer = delete;
    auto operator=(ControlServer&&) -> ControlServer = delete;

    ~ControlServer();

  public: // Methods
    auto start() -> void;
    auto stop() -> void;

  private: // Methods
    auto control_loop(const std::stop_token& stopToken) -> void;

  private: // Members
    ControlHandler& m_Handler;
    std::string     m_Endpoint;
    zmq::context_t  m_Context;
    std::jthread    m_ControlThread;
};
} // namespace ferry::pipeline
