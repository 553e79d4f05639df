/**
 * @file ControlFlags.cpp
 * @brief Pause/cancel state shared between the operator and the pipeline
 */

// Header Being Defined
#include <ferry/pipeline/ControlFlags.hpp>

// Standard Library Includes
#include <chrono>
#include <mutex>

// Third Party Includes
#include <spdlog/spdlog.h>

// Project Includes
#include <ferry/pipeline/Errors.hpp>

namespace ferry::pipeline
{
ControlFlags::ControlFlags(std::chrono::milliseconds pollInterval)
    : m_Paused(false),
      m_Cancelled(false),
      m_PollInterval(pollInterval)
{
}

auto ControlFlags::set_paused(bool paused) -> void
{
    {
        const std::lock_guard<std::mutex> waitLock(m_WaitMutex);
        m_Paused.store(paused);
    }

    m_WaitVariable.notify_all();
}

auto ControlFlags::cancel() -> void
{
    {
        const std::lock_guard<std::mutex> waitLock(m_WaitMutex);
        m_Cancelled.store(true);
    }

    m_WaitVariable.notify_all();
}

auto ControlFlags::throw_if_cancelled() const -> void
{
    if (m_Cancelled.load())
    {
        throw cancelled_exception();
    }
}

auto ControlFlags::checkpoint() -> void
{
    this->throw_if_cancelled();

    if (!m_Paused.load())
    {
        return;
    }

    spdlog::debug("Transfer paused, polling every {}ms", m_PollInterval.count());

    std::unique_lock<std::mutex> waitLock(m_WaitMutex);
    while (m_Paused.load() && !m_Cancelled.load())
    {
        m_WaitVariable.wait_for(waitLock, m_PollInterval);
    }
    waitLock.unlock();

    this->throw_if_cancelled();

    spdlog::debug("Transfer resumed");
}

auto ControlFlags::sleep_for(std::chrono::milliseconds duration) -> bool
{
    std::unique_lock<std::mutex> waitLock(m_WaitMutex);

    return !m_WaitVariable.wait_for(
        waitLock,
        duration,
        [this]() { return m_Cancelled.load(); }
    );
}
} // namespace ferry::pipeline
