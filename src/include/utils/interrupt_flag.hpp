#pragma once

/*******************************************************************************
 * @file interrupt_flag.hpp
 * @brief Cooperative, per-thread interruption flag.
 *
 * A thread is "interrupted" when its flag is set. Blocking operations that honour
 * interruption (NativeFileHandle::read_at) check the flag and abort by closing
 * the handle they were using. The flag stays set until someone clears it with
 * test_and_clear(), so code that recovers from the abort can restore it for
 * its caller.
 *
 * Another thread may interrupt a thread by holding a reference to that thread's
 * flag (obtained by the target itself via this_thread_interrupt_flag()). The
 * reference is valid only while the target thread is alive.
 ******************************************************************************/
#include <atomic>

#include "nestjar_utils_export.h"

namespace nestjar::basics
{

class NESTJAR_UTILS_EXPORT InterruptFlag
{
  public:
    InterruptFlag() noexcept = default;
    InterruptFlag(const InterruptFlag &) = delete;
    InterruptFlag &operator=(const InterruptFlag &) = delete;

    void set() noexcept { m_flag.store(true, std::memory_order_release); }

    [[nodiscard]] bool is_set() const noexcept { return m_flag.load(std::memory_order_acquire); }

    /// Clears the flag and returns whether it was set.
    bool test_and_clear() noexcept { return m_flag.exchange(false, std::memory_order_acq_rel); }

  private:
    std::atomic<bool> m_flag{false};
};

/**
 * @brief Returns the calling thread's interrupt flag.
 */
NESTJAR_UTILS_EXPORT InterruptFlag &this_thread_interrupt_flag() noexcept;

} // namespace nestjar::basics
