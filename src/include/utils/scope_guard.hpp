#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace lockhub::basics
{

/**
 * @class ScopeGuard
 * @brief RAII guard that executes a callable on scope exit unless dismissed.
 *
 * Movable, not copyable. The destructor is `noexcept`: exceptions thrown by the
 * callable are caught and dropped, so cleanup logic should not throw.
 *
 * @code
 *  int fd = ::open(path, O_RDWR);
 *  auto guard = lockhub::basics::make_scope_guard([&]() { ::close(fd); });
 *  ... // may throw
 *  guard.dismiss(); // ownership handed over
 * @endcode
 *
 * Not thread-safe.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");

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
            try
            {
                std::invoke(m_func);
            }
            catch (...)
            {
                // Destructor must not throw; see class docs.
            }
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    constexpr void dismiss() noexcept { m_active = false; }

  private:
    Callable m_func;
    bool m_active{true};
};

template <typename F> [[nodiscard]] auto make_scope_guard(F &&fn)
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(fn));
}

} // namespace lockhub::basics
