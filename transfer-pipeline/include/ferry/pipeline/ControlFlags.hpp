/**
 * @file ControlFlags.hpp
 * @brief Pause/cancel state shared between the operator and the pipeline
 */

#pragma once

// Standard Library Includes
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ferry::pipeline
{
/**
 * @brief The only mutable state shared across the control boundary.
 *
 * Written by the operator-facing thread at any time, polled by the pipeline
 * at every suspension point. Waits are cancellable: `cancel()` wakes a
 * pipeline that is sleeping out a pause interval.
 */
class ControlFlags
{
  public: // Constructors
    explicit ControlFlags(
        std::chrono::milliseconds pollInterval = std::chrono::seconds(2)
    );
    ControlFlags(ControlFlags&) = delete;
    ControlFlags(ControlFlags&&) = delete;
    auto operator=(ControlFlags&) -> ControlFlags = delete;
    auto operator=(ControlFlags&&) -> ControlFlags = delete;

  public: // Methods
    auto set_paused(bool paused) -> void;
    auto cancel() -> void;

    [[nodiscard]]
    auto is_paused() const -> bool
    {
        return m_Paused.load();
    }

    [[nodiscard]]
    auto is_cancelled() const -> bool
    {
        return m_Cancelled.load();
    }

    /**
     * @brief Suspension point. Blocks while paused, re-checking every poll
     *        interval, and throws `cancelled_exception` once cancelled.
     */
    auto checkpoint() -> void;

    auto throw_if_cancelled() const -> void;

    /**
     * @brief Sleeps for `duration` unless cancelled first.
     * @return false if the wait ended because of cancellation
     */
    auto sleep_for(std::chrono::milliseconds duration) -> bool;

  private: // Members
    std::atomic<bool>         m_Paused;
    std::atomic<bool>         m_Cancelled;
    std::chrono::milliseconds m_PollInterval;
    std::mutex                m_WaitMutex;
    std::condition_variable   m_WaitVariable;
};
} // namespace ferry::pipeline
