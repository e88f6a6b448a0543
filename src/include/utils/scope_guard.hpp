#pragma once

#include <cstdio>
#include <exception>
#include <type_traits>
#include <utility>

namespace servefleet::basics
{

/**
 * @brief Runs a cleanup callable when the scope ends unless dismissed first.
 *
 * Used for rollback: arm the guard, do the fallible work, `dismiss()` on success. The
 * destructor never throws; an exception from the callable is reported on stderr.
 */
template <typename Fn> class ScopeGuard
{
  public:
    explicit ScopeGuard(Fn fn) noexcept(std::is_nothrow_move_constructible_v<Fn>)
        : m_fn(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Fn>)
        : m_fn(std::move(other.m_fn)), m_armed(std::exchange(other.m_armed, false))
    {
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    ~ScopeGuard()
    {
        if (!m_armed)
            return;
        try
        {
            m_fn();
        }
        catch (const std::exception &e)
        {
            std::fprintf(stderr, "[ScopeGuard] cleanup action threw: %s\n", e.what());
        }
    }

    void dismiss() noexcept { m_armed = false; }
    [[nodiscard]] explicit operator bool() const noexcept { return m_armed; }

  private:
    Fn m_fn;
    bool m_armed = true;
};

template <typename F> ScopeGuard<std::decay_t<F>> make_scope_guard(F &&f)
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace servefleet::basics
