#include "utils/lifecycle.hpp"
#include "utils/debug_info.hpp"
#include "sfl_platform.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include <fmt/ranges.h>

namespace servefleet::utils
{

struct ModuleSpec
{
    std::string name;
    std::vector<std::string> needs;
    LifecycleCallback start = nullptr;
    std::string start_arg;
    LifecycleCallback stop = nullptr;
    std::string stop_arg;
    std::chrono::milliseconds stop_timeout{0};
};

ModuleDef::ModuleDef(std::string_view name) : m_spec(std::make_unique<ModuleSpec>())
{
    if (name.empty())
        throw std::invalid_argument("lifecycle module name is empty");
    if (name.size() > MAX_MODULE_NAME_LEN)
        throw std::length_error(fmt::format("lifecycle module name longer than {} characters",
                                            MAX_MODULE_NAME_LEN));
    m_spec->name = std::string(name);
}

ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&) noexcept = default;

void ModuleDef::add_dependency(std::string_view name)
{
    if (!name.empty())
        m_spec->needs.emplace_back(name);
}

void ModuleDef::set_startup(LifecycleCallback fn, std::string_view arg)
{
    m_spec->start = fn;
    m_spec->start_arg = std::string(arg);
}

void ModuleDef::set_shutdown(LifecycleCallback fn, std::chrono::milliseconds timeout,
                             std::string_view arg)
{
    m_spec->stop = fn;
    m_spec->stop_timeout = timeout;
    m_spec->stop_arg = std::string(arg);
}

namespace
{
[[noreturn]] void lifecycle_fatal(const std::string &what)
{
    fmt::print(stderr, "[SFL_LifeCycle] FATAL: {}. Aborting.\n", what);
    debug::print_stack_trace();
    std::abort();
}

// Runs the callback on its own thread and stops waiting at the deadline. A callback that
// overruns is left running detached; the shared flag outlives this frame.
enum class StopResult
{
    Done,
    Threw,
    TimedOut
};

StopResult run_with_deadline(const ModuleSpec &spec, std::string &error)
{
    struct Shared
    {
        std::atomic<bool> finished{false};
        std::string error;
    };
    auto shared = std::make_shared<Shared>();
    std::thread runner(
        [fn = spec.stop, arg = spec.stop_arg, shared]()
        {
            try
            {
                fn(arg.c_str());
            }
            catch (const std::exception &e)
            {
                shared->error = e.what();
            }
            shared->finished.store(true, std::memory_order_release);
        });

    if (spec.stop_timeout.count() > 0)
    {
        const auto deadline = std::chrono::steady_clock::now() + spec.stop_timeout;
        while (!shared->finished.load(std::memory_order_acquire))
        {
            if (std::chrono::steady_clock::now() >= deadline)
            {
                runner.detach();
                return StopResult::TimedOut;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    runner.join();
    if (!shared->error.empty())
    {
        error = shared->error;
        return StopResult::Threw;
    }
    return StopResult::Done;
}
} // namespace

struct LifecycleManager::Impl
{
    std::mutex mu;
    std::vector<ModuleSpec> pending;
    std::vector<ModuleSpec> started; // in start order
    std::atomic<bool> initialized{false};
    std::atomic<bool> finalized{false};

    // Kahn's algorithm; ties keep registration order.
    std::vector<ModuleSpec> order_by_dependencies(std::vector<ModuleSpec> specs)
    {
        std::map<std::string, std::size_t, std::less<>> index;
        for (std::size_t i = 0; i < specs.size(); ++i)
        {
            if (!index.emplace(specs[i].name, i).second)
                lifecycle_fatal("Duplicate module name: " + specs[i].name);
        }
        std::vector<std::size_t> missing(specs.size(), 0);
        std::vector<std::vector<std::size_t>> unblocks(specs.size());
        for (std::size_t i = 0; i < specs.size(); ++i)
        {
            for (const auto &dep : specs[i].needs)
            {
                auto it = index.find(dep);
                if (it == index.end())
                {
                    lifecycle_fatal("Undefined dependency: " + dep + " (required by " +
                                    specs[i].name + ")");
                }
                unblocks[it->second].push_back(i);
                ++missing[i];
            }
        }

        std::vector<std::size_t> ready;
        for (std::size_t i = 0; i < specs.size(); ++i)
        {
            if (missing[i] == 0)
                ready.push_back(i);
        }
        std::vector<std::size_t> order;
        for (std::size_t head = 0; head < ready.size(); ++head)
        {
            order.push_back(ready[head]);
            for (std::size_t next : unblocks[ready[head]])
            {
                if (--missing[next] == 0)
                    ready.push_back(next);
            }
        }
        if (order.size() != specs.size())
        {
            std::vector<std::string> stuck;
            for (std::size_t i = 0; i < specs.size(); ++i)
            {
                if (missing[i] > 0)
                    stuck.push_back(specs[i].name);
            }
            lifecycle_fatal(
                fmt::format("Circular dependency detected involving: {}", fmt::join(stuck, ", ")));
        }

        std::vector<ModuleSpec> sorted;
        sorted.reserve(specs.size());
        for (std::size_t i : order)
            sorted.push_back(std::move(specs[i]));
        return sorted;
    }
};

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<Impl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager manager;
    return manager;
}

void LifecycleManager::register_module(ModuleDef &&def)
{
    if (!def.m_spec)
        return;
    std::lock_guard<std::mutex> lk(pImpl->mu);
    if (pImpl->initialized.load(std::memory_order_acquire))
    {
        SFL_PANIC("[SFL_LifeCycle] PID[{}] FATAL: register_module('{}') called after "
                  "initialization.",
                  platform::get_pid(), def.m_spec->name);
    }
    pImpl->pending.push_back(std::move(*def.m_spec));
}

void LifecycleManager::initialize(std::source_location loc)
{
    if (pImpl->initialized.exchange(true, std::memory_order_acq_rel))
        return;
    std::vector<ModuleSpec> specs;
    {
        std::lock_guard<std::mutex> lk(pImpl->mu);
        specs.swap(pImpl->pending);
    }
    SFL_DEBUG("[SFL_LifeCycle] initialize() from {}", debug::where(loc));
    for (auto &spec : pImpl->order_by_dependencies(std::move(specs)))
    {
        try
        {
            if (spec.start)
                spec.start(spec.start_arg.c_str());
        }
        catch (const std::exception &e)
        {
            lifecycle_fatal("Exception during startup of '" + spec.name + "': " + e.what());
        }
        SFL_DEBUG("[SFL_LifeCycle]   started '{}'", spec.name);
        pImpl->started.push_back(std::move(spec));
    }
}

void LifecycleManager::finalize(std::source_location loc)
{
    if (!pImpl->initialized.load(std::memory_order_acquire) ||
        pImpl->finalized.exchange(true, std::memory_order_acq_rel))
        return;
    SFL_DEBUG("[SFL_LifeCycle] finalize() from {}", debug::where(loc));
    for (auto it = pImpl->started.rbegin(); it != pImpl->started.rend(); ++it)
    {
        if (!it->stop)
            continue;
        std::string error;
        switch (run_with_deadline(*it, error))
        {
        case StopResult::Done:
            SFL_DEBUG("[SFL_LifeCycle]   stopped '{}'", it->name);
            break;
        case StopResult::TimedOut:
            fmt::print(stderr, "[SFL_LifeCycle] WARNING: module '{}' shutdown timed out after {}ms.\n",
                       it->name, it->stop_timeout.count());
            break;
        case StopResult::Threw:
            fmt::print(stderr, "[SFL_LifeCycle] ERROR: module '{}' threw on shutdown: {}\n",
                       it->name, error);
            break;
        }
    }
}

bool LifecycleManager::is_initialized() const noexcept
{
    return pImpl->initialized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_finalized() const noexcept
{
    return pImpl->finalized.load(std::memory_order_acquire);
}

namespace
{
std::atomic<bool> g_guard_owned{false};
} // namespace

LifecycleGuard::LifecycleGuard(std::vector<ModuleDef> &&modules, std::source_location loc)
    : m_loc(loc)
{
    bool expected = false;
    if (!g_guard_owned.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
    {
        SFL_DEBUG("[SFL_LifeCycle] PID[{}] WARNING: LifecycleGuard constructed but an owner "
                  "already exists; its modules are ignored ({})",
                  platform::get_pid(), debug::where(loc));
        return;
    }
    m_owner = true;
    for (auto &m : modules)
        RegisterModule(std::move(m));
    InitializeApp(loc);
}

LifecycleGuard::LifecycleGuard(ModuleDef &&module, std::source_location loc)
    : LifecycleGuard(
          [&]
          {
              std::vector<ModuleDef> one;
              one.push_back(std::move(module));
              return one;
          }(),
          loc)
{
}

LifecycleGuard::~LifecycleGuard()
{
    if (m_owner)
        FinalizeApp(m_loc);
}

} // namespace servefleet::utils
