#pragma once
#include <concepts>
#include <cstdio>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

namespace leapcal::basics
{

/**
 * @class ScopeGuard
 * @brief An RAII-style guard that executes a callable on scope exit.
 *
 * The cleanup action runs when the current scope is exited, whether by normal
 * execution or by an exception. It is movable but not copyable, enforcing unique
 * ownership of the cleanup action.
 *
 * @code
 *  int main(int argc, char **argv)
 *  {
 *      auto logger_guard = leapcal::basics::make_scope_guard(
 *          [] { leapcal::utils::Logger::instance().shutdown(); });
 *      ...
 *      return run(...);
 *  } // logger is drained and joined on every return path
 * @endcode
 *
 * ### Exceptions
 *
 * The destructor is `noexcept`. A `std::exception` escaping the callable during
 * destruction is reported on stderr and not rethrown, since rethrowing from a
 * destructor during unwinding calls `std::terminate`. Use `invoke_and_rethrow()`
 * when the caller needs to observe a cleanup failure.
 *
 * ### Thread Safety
 *
 * Not thread-safe. A single guard must not be shared between threads without
 * external synchronization.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");
    static_assert(std::is_move_constructible_v<Callable> || std::is_copy_constructible_v<Callable>,
                  "ScopeGuard's callable must be move- or copy-constructible.");

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    /// Transfers ownership of the cleanup action; @p other no longer executes.
    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept { invoke(); }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /// Deactivates the guard, preventing the callable from being executed.
    constexpr void dismiss() noexcept { m_active = false; }

    /**
     * @brief Executes the callable now if active, then dismisses the guard.
     *
     * A `std::exception` thrown by the callable is reported on stderr.
     */
    void invoke() noexcept
    {
        if (!m_active)
            return;
        m_active = false; // Must dismiss before invoke to prevent double execution.
        try
        {
            std::invoke(m_func);
        }
        catch (const std::exception &ex)
        {
            std::fprintf(stderr, "[leapcal::ScopeGuard] cleanup failed: %s\n", ex.what());
        }
    }

    /// Like invoke(), but exceptions from the callable propagate to the caller.
    void invoke_and_rethrow()
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
 * @brief Factory for ScopeGuard; the callable is always stored by value.
 *
 * Ensure that any references captured by @p f remain valid until the guard executes.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace leapcal::basics
