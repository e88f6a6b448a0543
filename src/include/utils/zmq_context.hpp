#pragma once
/**
 * @file zmq_context.hpp
 * @brief Shared ZeroMQ context as a named static lifecycle module.
 *
 * Provides the single `zmq::context_t` used by the long-lived services of the process
 * (stash, cache). Register `GetZMQContextModule()` with the `LifecycleGuard`, after the
 * logger, then call `get_zmq_context()`.
 */
#include "servefleet_utils_export.h"

#include <zmq.hpp>

#include <string>
#include <string_view>

#include "utils/module_def.hpp"

namespace servefleet::ipc
{

/**
 * @brief Returns the process-wide ZeroMQ context.
 * @pre The "ZMQContext" module has been started. Calling this earlier is fatal.
 */
[[nodiscard]] SERVEFLEET_UTILS_EXPORT zmq::context_t &get_zmq_context();

/** @brief True while the shared context exists. */
[[nodiscard]] SERVEFLEET_UTILS_EXPORT bool zmq_context_available() noexcept;

/**
 * @brief ModuleDef for the shared context ("ZMQContext", depends on the logger).
 */
SERVEFLEET_UTILS_EXPORT servefleet::utils::ModuleDef GetZMQContextModule();

/**
 * @brief Builds an `ipc://` endpoint in the temp directory that is unique per process and
 *        per call, e.g. "ipc:///tmp/sfl-log-4242-9f3a0c1d.sock".
 */
[[nodiscard]] SERVEFLEET_UTILS_EXPORT std::string unique_ipc_endpoint(std::string_view tag);

} // namespace servefleet::ipc
