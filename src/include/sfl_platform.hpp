#pragma once
/**
 * @file sfl_platform.hpp
 * @brief Layer 0: process and thread identity on the host OS.
 *
 * servefleet forks servers, signals them and binds ipc:// sockets, all of which need a
 * POSIX host.
 */
#include <cstdint>
#include <string>

#if !defined(__unix__) && !(defined(__APPLE__) && defined(__MACH__))
#error "servefleet only builds on POSIX hosts."
#endif

#if __cplusplus < 202002L
#error "servefleet needs C++20 (source_location, designated initializers)."
#endif

#include "servefleet_utils_export.h"

namespace servefleet::platform
{

SERVEFLEET_UTILS_EXPORT std::uint64_t get_pid() noexcept;

/// Kernel thread id where the OS exposes one (Linux gettid), else a hash of std::thread::id.
SERVEFLEET_UTILS_EXPORT std::uint64_t get_native_thread_id() noexcept;

/// Basename of the running binary, or its absolute path with `include_path`. "unknown" when
/// it cannot be determined.
SERVEFLEET_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/// "major.minor.rolling" of this build.
SERVEFLEET_UTILS_EXPORT const char *get_version_string() noexcept;

/// kill(pid, 0) check. EPERM counts as alive; pid 0 never is.
SERVEFLEET_UTILS_EXPORT bool is_process_alive(std::uint64_t pid) noexcept;

} // namespace servefleet::platform
