#pragma once
/**
 * @file errors.hpp
 * @brief Exception types raised by the test environment.
 *
 * | Error                | Base                 | Raised by                                   |
 * |----------------------|----------------------|---------------------------------------------|
 * | ConfigurationError   | std::runtime_error   | override / CLI documents, route sources     |
 * | NestedScopeError     | std::logic_error     | entering a second TestEnvironment scope     |
 * | FleetStartError      | std::runtime_error   | fleet launchers                             |
 * | ReadinessError       | EnvironmentError     | ensure_started                              |
 * | TeardownError        | std::runtime_error   | release steps                               |
 * | SharedStoreError     | std::runtime_error   | stash / cache clients                       |
 */
#include "servefleet_utils_export.h"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace servefleet::env
{

class SERVEFLEET_UTILS_EXPORT EnvironmentError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

class SERVEFLEET_UTILS_EXPORT ConfigurationError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

class SERVEFLEET_UTILS_EXPORT NestedScopeError : public std::logic_error
{
  public:
    NestedScopeError() : std::logic_error("A TestEnvironment object cannot be nested") {}
};

class SERVEFLEET_UTILS_EXPORT FleetStartError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// Some fleet servers died or never accepted connections.
class SERVEFLEET_UTILS_EXPORT ReadinessError : public EnvironmentError
{
  public:
    using EnvironmentError::EnvironmentError;
};

/**
 * @brief A stash or cache request failed. `code()` is the service error code
 *        ("DUPLICATE_KEY", "INVALID_REQUEST", ...) or "TIMEOUT".
 */
class SERVEFLEET_UTILS_EXPORT SharedStoreError : public std::runtime_error
{
  public:
    SharedStoreError(std::string code, const std::string &message)
        : std::runtime_error(message), m_code(std::move(code))
    {
    }

    [[nodiscard]] const std::string &code() const noexcept { return m_code; }

  private:
    std::string m_code;
};

/**
 * @brief One or more release steps failed.
 *
 * `what()` lists every failed step as "<step>: <message>" separated by "; ". The exception
 * that was in flight when teardown began (if any) is preserved in `in_flight()`.
 */
class SERVEFLEET_UTILS_EXPORT TeardownError : public std::runtime_error
{
  public:
    struct Failure
    {
        std::string step;
        std::exception_ptr error;
        std::string message;
    };

    TeardownError(std::vector<Failure> failures, std::exception_ptr in_flight);

    [[nodiscard]] const std::vector<Failure> &failures() const noexcept { return m_failures; }
    [[nodiscard]] std::exception_ptr in_flight() const noexcept { return m_in_flight; }

  private:
    static std::string compose(const std::vector<Failure> &failures,
                               const std::exception_ptr &in_flight);

    std::vector<Failure> m_failures;
    std::exception_ptr m_in_flight;
};

/**
 * @brief Best-effort message of an exception_ptr ("unknown exception" for non-std types).
 */
SERVEFLEET_UTILS_EXPORT std::string describe_exception(const std::exception_ptr &ep);

} // namespace servefleet::env
