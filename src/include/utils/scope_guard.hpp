#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace nestjar::basics
{

/**
 * @class ScopeGuard
 * @brief Runs a callable when the enclosing scope exits, normally or by exception.
 *
 * Movable, not copyable. A moved-from or dismissed guard does nothing. The
 * destructor is `noexcept`, so the callable must not throw; a cleanup that can
 * fail has to handle the failure itself.
 *
 * @code
 *  auto restore = nestjar::basics::make_scope_guard([&] { buf.limit(old_limit); });
 *  channel.read(buf, pos); // limit restored even if this throws
 * @endcode
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");
    static_assert(std::is_nothrow_invocable_v<Callable &>,
                  "ScopeGuard's callable must be noexcept.");

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            std::invoke(m_func);
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    constexpr void dismiss() noexcept { m_active = false; }

    /**
     * @brief Runs the callable now (once) and dismisses the guard.
     */
    void invoke() noexcept
    {
        if (m_active)
        {
            m_active = false;
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Preferred way to create a ScopeGuard; the callable is stored by value.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace nestjar::basics
