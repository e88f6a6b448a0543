#include "utils/debug_info.hpp"

#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>

namespace servefleet::debug
{

void print_stack_trace() noexcept
{
    constexpr int kMaxFrames = 64;
    void *frames[kMaxFrames];
    const int count = ::backtrace(frames, kMaxFrames);
    std::fputs("Stack Trace (most recent call first):\n", stderr);
    for (int i = 0; i < count; ++i)
    {
        const char *name = nullptr;
        char *demangled = nullptr;
        Dl_info info;
        if (::dladdr(frames[i], &info) != 0 && info.dli_sname != nullptr)
        {
            int status = 0;
            demangled = abi::__cxa_demangle(info.dli_sname, nullptr, nullptr, &status);
            name = (status == 0 && demangled != nullptr) ? demangled : info.dli_sname;
        }
        std::fprintf(stderr, "  #%02d  %p  %s\n", i, frames[i], name ? name : "[unknown]");
        std::free(demangled);
    }
    std::fflush(stderr);
}

} // namespace servefleet::debug
