#pragma once
/**
 * @file release_stack.hpp
 * @brief LIFO stack of named release closures.
 *
 * Every acquired resource pushes its release step. `release()` runs all of them in reverse
 * order, continuing past failures, and only then reports:
 *  - nothing failed: returns;
 *  - one step failed and no exception was in flight: that exception is rethrown unchanged;
 *  - otherwise: TeardownError listing every failed step, carrying the in-flight exception.
 */
#include "servefleet_utils_export.h"

#include <exception>
#include <functional>
#include <string>
#include <vector>

#include "environment/errors.hpp"

namespace servefleet::env
{

class SERVEFLEET_UTILS_EXPORT ReleaseStack
{
  public:
    using Step = std::function<void()>;
    /// A step that is told about the exception that ended the scope, if any.
    using ContextStep = std::function<void(std::exception_ptr in_flight)>;

    ReleaseStack() = default;
    ReleaseStack(const ReleaseStack &) = delete;
    ReleaseStack &operator=(const ReleaseStack &) = delete;
    ReleaseStack(ReleaseStack &&) noexcept = default;
    ReleaseStack &operator=(ReleaseStack &&) noexcept = default;

    void push(std::string name, Step step);
    void push_with_exception(std::string name, ContextStep step);

    /**
     * @brief Runs every step (newest first) and empties the stack.
     * @return The failed steps, in execution order.
     */
    std::vector<TeardownError::Failure> unwind(std::exception_ptr in_flight) noexcept;

    /**
     * @brief `unwind()` followed by the error policy described above.
     */
    void release(std::exception_ptr in_flight = nullptr);

    [[nodiscard]] bool empty() const noexcept { return m_steps.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return m_steps.size(); }
    /// Step names, oldest first.
    [[nodiscard]] std::vector<std::string> names() const;

  private:
    struct Entry
    {
        std::string name;
        ContextStep step;
    };
    std::vector<Entry> m_steps;
};

} // namespace servefleet::env
