#include "environment/release_stack.hpp"

#include "sfl_service.hpp"

namespace servefleet::env
{

void ReleaseStack::push(std::string name, Step step)
{
    m_steps.push_back(
        {std::move(name), [s = std::move(step)](std::exception_ptr /*in_flight*/) { s(); }});
}

void ReleaseStack::push_with_exception(std::string name, ContextStep step)
{
    m_steps.push_back({std::move(name), std::move(step)});
}

std::vector<std::string> ReleaseStack::names() const
{
    std::vector<std::string> out;
    out.reserve(m_steps.size());
    for (const auto &e : m_steps)
        out.push_back(e.name);
    return out;
}

std::vector<TeardownError::Failure> ReleaseStack::unwind(std::exception_ptr in_flight) noexcept
{
    std::vector<TeardownError::Failure> failures;
    while (!m_steps.empty())
    {
        Entry entry = std::move(m_steps.back());
        m_steps.pop_back();
        try
        {
            entry.step(in_flight);
            SFL_DEBUG("ReleaseStack: released '{}'", entry.name);
        }
        catch (...)
        {
            // Recorded and reported by release(); the remaining steps still run.
            std::exception_ptr ep = std::current_exception();
            std::string message = describe_exception(ep);
            LOGGER_ERROR("Teardown step '{}' failed: {}", entry.name, message);
            failures.push_back({std::move(entry.name), std::move(ep), std::move(message)});
        }
    }
    return failures;
}

void ReleaseStack::release(std::exception_ptr in_flight)
{
    std::vector<TeardownError::Failure> failures = unwind(in_flight);
    if (failures.empty())
        return;
    if (failures.size() == 1 && !in_flight)
    {
        std::rethrow_exception(failures.front().error);
    }
    throw TeardownError(std::move(failures), std::move(in_flight));
}

} // namespace servefleet::env
