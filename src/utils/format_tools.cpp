#include "utils/format_tools.hpp"

#include <iterator>
#include <random>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace servefleet::format_tools
{

std::string formatted_time(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;
    const auto whole = floor<seconds>(tp);
    const auto micros = duration_cast<microseconds>(tp - whole).count();
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06d}", fmt::localtime(system_clock::to_time_t(whole)),
                       micros);
}

std::string random_hex_id(std::size_t nbytes)
{
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> byte(0, 255);
    std::string out;
    out.reserve(nbytes * 2);
    for (std::size_t i = 0; i < nbytes; ++i)
        fmt::format_to(std::back_inserter(out), "{:02x}", byte(engine));
    return out;
}

} // namespace servefleet::format_tools
