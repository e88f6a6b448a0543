#include "utils/logger.hpp"
#include "utils/debug_info.hpp"
#include "utils/log_sink.hpp"
#include "sfl_platform.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <thread>
#include <variant>

namespace servefleet::utils
{

namespace
{
enum class State
{
    Uninitialized,
    Running,
    Stopping,
    Stopped
};

std::atomic<State> g_state{State::Uninitialized};

void require_started(const char *what)
{
    if (g_state.load(std::memory_order_acquire) == State::Uninitialized)
    {
        SFL_PANIC("Logger method '{}' was called before the Logger module was "
                  "initialized via LifecycleManager. Aborting.",
                  what);
    }
}

bool running() noexcept
{
    return g_state.load(std::memory_order_acquire) == State::Running;
}

struct SwapSink
{
    std::unique_ptr<LogSink> sink;
    std::promise<bool> done;
};

struct FlushMarker
{
    std::promise<void> done;
};

using QueueItem = std::variant<LogRecord, SwapSink, FlushMarker>;

struct FilterEntry
{
    Logger::FilterHandle handle;
    Logger::ComponentFilter filter;
};

LogRecord make_record(Logger::Level lvl, std::string_view component, std::string body)
{
    return LogRecord{std::chrono::system_clock::now(),
                     platform::get_pid(),
                     platform::get_native_thread_id(),
                     static_cast<int>(lvl),
                     std::string(component),
                     std::move(body)};
}
} // namespace

struct Logger::Impl
{
    std::mutex queue_mu;
    std::condition_variable queue_cv;
    std::deque<QueueItem> queue;
    bool stop_requested = false;
    std::thread writer;

    // Touched only by the writer thread once it runs.
    std::unique_ptr<LogSink> sink = std::make_unique<StderrSink>();

    std::atomic<Level> threshold{Level::L_INFO};

    mutable std::shared_mutex filter_mu;
    std::map<std::string, std::vector<FilterEntry>, std::less<>> filters;
    std::atomic<FilterHandle> next_handle{1};

    ~Impl() { stop(); }

    // Leaves `item` untouched when the queue is closed.
    bool enqueue(QueueItem &&item)
    {
        {
            std::lock_guard<std::mutex> lk(queue_mu);
            if (stop_requested)
                return false;
            queue.push_back(std::move(item));
        }
        queue_cv.notify_one();
        return true;
    }

    void emit(const LogRecord &rec)
    {
        try
        {
            sink->write(rec);
        }
        catch (const std::exception &e)
        {
            std::fprintf(stderr, "[LOGGER] %s: %s\n", sink->description().c_str(), e.what());
        }
    }

    void run()
    {
        std::deque<QueueItem> batch;
        for (;;)
        {
            {
                std::unique_lock<std::mutex> lk(queue_mu);
                queue_cv.wait(lk, [this] { return stop_requested || !queue.empty(); });
                if (queue.empty())
                    break;
                batch.swap(queue);
            }
            for (auto &item : batch)
            {
                if (auto *rec = std::get_if<LogRecord>(&item))
                {
                    emit(*rec);
                }
                else if (auto *swap = std::get_if<SwapSink>(&item))
                {
                    sink->flush();
                    sink = std::move(swap->sink);
                    swap->done.set_value(true);
                }
                else
                {
                    sink->flush();
                    std::get<FlushMarker>(item).done.set_value();
                }
            }
            batch.clear();
        }
        emit(make_record(Level::L_SYSTEM, {}, "Logger is shutting down."));
        sink->flush();
    }

    void stop()
    {
        {
            std::lock_guard<std::mutex> lk(queue_mu);
            stop_requested = true;
        }
        queue_cv.notify_one();
        if (writer.joinable())
            writer.join();
    }
};

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger logger;
    return logger;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_state.load(std::memory_order_acquire) != State::Uninitialized;
}

bool Logger::set_console()
{
    require_started("Logger::set_console");
    QueueItem item{SwapSink{std::make_unique<StderrSink>(), {}}};
    auto done = std::get<SwapSink>(item).done.get_future();
    if (!running() || !pImpl->enqueue(std::move(item)))
        return false;
    return done.get();
}

bool Logger::set_logfile(const std::string &path, bool use_flock)
{
    require_started("Logger::set_logfile");
    std::unique_ptr<LogSink> file;
    try
    {
        file = std::make_unique<LogFileSink>(path, use_flock);
    }
    catch (const std::exception &e)
    {
        submit(Level::L_ERROR, e.what());
        return false;
    }
    QueueItem item{SwapSink{std::move(file), {}}};
    auto done = std::get<SwapSink>(item).done.get_future();
    if (!running() || !pImpl->enqueue(std::move(item)))
        return false;
    return done.get();
}

void Logger::flush()
{
    require_started("Logger::flush");
    QueueItem item{FlushMarker{}};
    auto done = std::get<FlushMarker>(item).done.get_future();
    if (running() && pImpl->enqueue(std::move(item)))
        done.wait();
}

void Logger::set_level(Level lvl)
{
    require_started("Logger::set_level");
    pImpl->threshold.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    require_started("Logger::level");
    return pImpl->threshold.load(std::memory_order_relaxed);
}

Logger::FilterHandle Logger::push_component_filter(std::string component,
                                                   ComponentFilter filter)
{
    require_started("Logger::push_component_filter");
    if (!filter)
        throw std::invalid_argument("empty filter for component '" + component + "'");
    const FilterHandle handle = pImpl->next_handle.fetch_add(1, std::memory_order_relaxed);
    std::unique_lock<std::shared_mutex> lk(pImpl->filter_mu);
    pImpl->filters[std::move(component)].push_back(FilterEntry{handle, std::move(filter)});
    return handle;
}

bool Logger::pop_component_filter(std::string_view component, FilterHandle handle) noexcept
{
    std::unique_lock<std::shared_mutex> lk(pImpl->filter_mu);
    auto it = pImpl->filters.find(component);
    if (it == pImpl->filters.end())
        return false;
    auto &stack = it->second;
    auto entry = std::find_if(stack.begin(), stack.end(),
                              [handle](const FilterEntry &e) { return e.handle == handle; });
    if (entry == stack.end())
        return false;
    stack.erase(entry);
    if (stack.empty())
        pImpl->filters.erase(it);
    return true;
}

bool Logger::has_component_filter(std::string_view component) const
{
    std::shared_lock<std::shared_mutex> lk(pImpl->filter_mu);
    return pImpl->filters.find(component) != pImpl->filters.end();
}

bool Logger::write_record(std::string_view component, Level lvl, std::string_view body) noexcept
{
    if (!running())
        return false;
    try
    {
        {
            std::shared_lock<std::shared_mutex> lk(pImpl->filter_mu);
            auto it = pImpl->filters.find(component);
            if (it != pImpl->filters.end())
            {
                const auto mapped = it->second.back().filter(lvl);
                if (!mapped)
                    return false;
                lvl = *mapped;
            }
        }
        if (!accepts(lvl))
            return false;
        return pImpl->enqueue(make_record(lvl, component, std::string(body)));
    }
    catch (const std::exception &e)
    {
        SFL_DEBUG("Logger::write_record dropped a '{}' record: {}", component, e.what());
        return false;
    }
}

bool Logger::accepts(Level lvl) const noexcept
{
    return running() && static_cast<int>(lvl) >=
                            static_cast<int>(pImpl->threshold.load(std::memory_order_relaxed));
}

void Logger::submit(Level lvl, std::string body) noexcept
{
    if (!running())
        return;
    try
    {
        pImpl->enqueue(make_record(lvl, {}, std::move(body)));
    }
    catch (const std::exception &e)
    {
        SFL_DEBUG("Logger dropped a record: {}", e.what());
    }
}

Logger::ComponentFilter make_level_filter(Logger::Level min_level)
{
    return [min_level](Logger::Level lvl) -> std::optional<Logger::Level>
    {
        if (static_cast<int>(lvl) < static_cast<int>(min_level))
            return std::nullopt;
        return lvl;
    };
}

Logger::ComponentFilter make_level_rewriter(Logger::ComponentFilter inner,
                                            std::vector<Logger::Level> from, Logger::Level to)
{
    return [inner = std::move(inner), from = std::move(from),
            to](Logger::Level lvl) -> std::optional<Logger::Level>
    {
        auto kept = inner ? inner(lvl) : std::optional<Logger::Level>(lvl);
        if (kept && std::find(from.begin(), from.end(), *kept) != from.end())
            return to;
        return kept;
    };
}

namespace
{
constexpr std::pair<Logger::Level, const char *> kLevelNames[] = {
    {Logger::Level::L_TRACE, "trace"},     {Logger::Level::L_DEBUG, "debug"},
    {Logger::Level::L_INFO, "info"},       {Logger::Level::L_WARNING, "warning"},
    {Logger::Level::L_ERROR, "error"},     {Logger::Level::L_CRITICAL, "critical"},
    {Logger::Level::L_SYSTEM, "system"},
};
} // namespace

std::optional<Logger::Level> level_from_name(std::string_view name) noexcept
{
    for (const auto &[lvl, text] : kLevelNames)
    {
        if (lvl != Logger::Level::L_SYSTEM && name == text)
            return lvl;
    }
    return std::nullopt;
}

const char *level_name(Logger::Level lvl) noexcept
{
    for (const auto &[l, text] : kLevelNames)
    {
        if (l == lvl)
            return text;
    }
    return "unknown";
}

void logger_module_start(const char *)
{
    auto &impl = *Logger::instance().pImpl;
    if (!impl.writer.joinable())
        impl.writer = std::thread([&impl] { impl.run(); });
    g_state.store(State::Running, std::memory_order_release);
}

void logger_module_stop(const char *)
{
    State expected = State::Running;
    if (g_state.compare_exchange_strong(expected, State::Stopping, std::memory_order_acq_rel))
    {
        Logger::instance().pImpl->stop();
        g_state.store(State::Stopped, std::memory_order_release);
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("servefleet::utils::Logger");
    module.set_startup(&logger_module_start);
    module.set_shutdown(&logger_module_stop, std::chrono::milliseconds(5000));
    return module;
}

} // namespace servefleet::utils
