#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

#include "servefleet_utils_export.h"

namespace servefleet::format_tools
{

/// Local time as "YYYY-MM-DD HH:MM:SS.uuuuuu".
SERVEFLEET_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point tp);

/// `2 * nbytes` lowercase hex characters from a per-thread random engine.
SERVEFLEET_UTILS_EXPORT std::string random_hex_id(std::size_t nbytes = 16);

constexpr std::string_view filename_only(std::string_view path) noexcept
{
    const auto slash = path.rfind('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

} // namespace servefleet::format_tools
