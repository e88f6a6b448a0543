#include "utils/zmq_context.hpp"
#include "utils/debug_info.hpp"
#include "utils/logger.hpp"
#include "sfl_platform.hpp"

#include <atomic>
#include <filesystem>

#include <fmt/format.h>

namespace servefleet::ipc
{

namespace
{
constexpr std::chrono::milliseconds kZMQContextShutdownTimeoutMs{2000};
std::atomic<zmq::context_t *> g_context{nullptr};

void do_zmq_context_startup(const char * /*arg*/)
{
    if (g_context.load(std::memory_order_acquire) != nullptr)
        return;
    g_context.store(new zmq::context_t(1), std::memory_order_release);
    LOGGER_INFO("ZMQContext: ZeroMQ context created.");
}

void do_zmq_context_shutdown(const char * /*arg*/)
{
    zmq::context_t *ctx = g_context.exchange(nullptr, std::memory_order_acq_rel);
    if (ctx == nullptr)
        return;
    // Blocks until every socket created from the context is closed.
    delete ctx;
    LOGGER_INFO("ZMQContext: ZeroMQ context destroyed.");
}
} // namespace

zmq::context_t &get_zmq_context()
{
    zmq::context_t *ctx = g_context.load(std::memory_order_acquire);
    if (ctx == nullptr)
    {
        SFL_PANIC("ZMQ context used before the ZMQContext module was started");
    }
    return *ctx;
}

bool zmq_context_available() noexcept
{
    return g_context.load(std::memory_order_acquire) != nullptr;
}

std::string unique_ipc_endpoint(std::string_view tag)
{
    static std::atomic<uint32_t> counter{0};
    const std::filesystem::path dir = std::filesystem::temp_directory_path();
    const std::string file =
        fmt::format("sfl-{}-{}-{}-{}.sock", tag, servefleet::platform::get_pid(),
                    counter.fetch_add(1, std::memory_order_relaxed),
                    servefleet::format_tools::random_hex_id(4));
    return "ipc://" + (dir / file).string();
}

servefleet::utils::ModuleDef GetZMQContextModule()
{
    servefleet::utils::ModuleDef module("ZMQContext");
    module.add_dependency("servefleet::utils::Logger");
    module.set_startup(&do_zmq_context_startup);
    module.set_shutdown(&do_zmq_context_shutdown, kZMQContextShutdownTimeoutMs);
    return module;
}

} // namespace servefleet::ipc
