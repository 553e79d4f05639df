/**
 * @file EventPublisher.hpp
 * @brief Publishes job events as JSON on a ZeroMQ PUB socket
 */

#pragma once

// Standard Library Includes
#include <mutex>
#include <string>
#include <string_view>

// Third Party Library Includes
#include <nlohmann/json.hpp>
#include <zmq.hpp>

// Project Includes
#include <ferry/pipeline/Job.hpp>
#include <ferry/pipeline/Notifier.hpp>
#include <ferry/pipeline/ProgressThrottler.hpp>

namespace ferry::pipeline
{
/**
 * @brief Topics: `started`, `progress`, `finished`. Each message is a two
 *        frame multipart: topic, then the JSON payload.
 */
class EventPublisher : public Notifier
{
  public: // Constructors
    explicit EventPublisher(const std::string& endpoint);
    EventPublisher(EventPublisher&) = delete;
    EventPublisher(EventPublisher&&) = delete;
    auto operator=(EventPublisher&) -> EventPublisher = delete;
    auto operator=(EventPublisher&&) -> EventPublisher = delete;

  public: // Methods
    auto on_started(const JobSnapshot& job) -> void override;
    auto on_progress(const JobSnapshot& job, const ProgressUpdate& update)
        -> void override;
    auto on_finished(const JobSnapshot& job) -> void override;

  private: // Methods
    auto publish(std::string_view topic, const nlohmann::json& payload) -> void;

  private: // Members
    zmq::context_t m_Context;
    zmq::socket_t  m_Socket;
    // Events can originate from the scheduler and the control thread
    std::mutex     m_SocketMutex;
};
} // namespace ferry::pipeline
