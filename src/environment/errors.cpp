#include "environment/errors.hpp"

#include <fmt/format.h>

namespace servefleet::env
{

std::string describe_exception(const std::exception_ptr &ep)
{
    if (!ep)
        return "no exception";
    try
    {
        std::rethrow_exception(ep);
    }
    catch (const std::exception &e)
    {
        return e.what();
    }
    catch (...)
    {
        // Non-standard exception types carry no message; the pointer itself is kept by the caller.
        return "unknown exception";
    }
}

TeardownError::TeardownError(std::vector<Failure> failures, std::exception_ptr in_flight)
    : std::runtime_error(compose(failures, in_flight)), m_failures(std::move(failures)),
      m_in_flight(std::move(in_flight))
{
}

std::string TeardownError::compose(const std::vector<Failure> &failures,
                                   const std::exception_ptr &in_flight)
{
    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), "Teardown failed in {} step(s): ", failures.size());
    bool first = true;
    for (const auto &f : failures)
    {
        if (!first)
            fmt::format_to(std::back_inserter(out), "; ");
        first = false;
        fmt::format_to(std::back_inserter(out), "{}: {}", f.step, f.message);
    }
    if (in_flight)
    {
        fmt::format_to(std::back_inserter(out), " (while handling: {})",
                       describe_exception(in_flight));
    }
    return fmt::to_string(out);
}

} // namespace servefleet::env
