/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous process logger with owner-tracked component filters.
 *
 * Callers format on their own thread and hand the finished record to a queue; one
 * background writer owns the sink (stderr by default, or a log file) and does all I/O.
 *
 * Records that carry a component name (those forwarded by the log proxy through
 * `write_record`) first pass the component's active filter, which may drop them or
 * change their level, and then the global threshold.
 *
 * Filters are layered per component. `push_component_filter` returns a handle, and only
 * `pop_component_filter` with that handle removes the entry; the most recently pushed
 * surviving entry is the active one. Two owners of the same component therefore never
 * remove each other's filter.
 *
 * The logger is a lifecycle module. Configuring it before `GetLifecycleModule()` has
 * been started is a fatal contract violation; log calls made outside the running window
 * are dropped.
 ******************************************************************************/
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "servefleet_utils_export.h"
#include "utils/module_def.hpp"

namespace servefleet::utils
{

class SERVEFLEET_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_CRITICAL = 5,
        L_SYSTEM = 6,
    };

    /// `std::nullopt` drops the record; any other value becomes its level.
    using ComponentFilter = std::function<std::optional<Level>(Level)>;

    /// Identifies one pushed filter. Zero is never issued.
    using FilterHandle = std::uint64_t;

    static Logger &instance();
    static ModuleDef GetLifecycleModule();

    /// True once the module has been started, including after it has shut down.
    static bool lifecycle_initialized() noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    ~Logger();

    /// Sink switches are applied by the writer thread in queue order. Both calls block until
    /// the switch has happened and report whether it did.
    bool set_console();
    bool set_logfile(const std::string &path, bool use_flock = true);

    /// Returns once every record queued before the call has reached the sink.
    void flush();

    void set_level(Level lvl);
    Level level() const;

    /**
     * @brief Installs `filter` on top of the component's filter stack.
     * @throws std::invalid_argument if `filter` is empty.
     */
    [[nodiscard]] FilterHandle push_component_filter(std::string component,
                                                     ComponentFilter filter);

    /// Removes exactly the entry `handle` names. Returns false if it is already gone.
    bool pop_component_filter(std::string_view component, FilterHandle handle) noexcept;

    [[nodiscard]] bool has_component_filter(std::string_view component) const;

    /**
     * @brief Accepts a record that was formatted elsewhere.
     * @return true if the record survived filtering and was queued.
     */
    bool write_record(std::string_view component, Level lvl, std::string_view body) noexcept;

    template <typename... Args>
    void log(Level lvl, fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        if (!accepts(lvl))
            return;
        try
        {
            submit(lvl, fmt::format(fmt_str, std::forward<Args>(args)...));
        }
        catch (const std::exception &ex)
        {
            submit(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }

  private:
    Logger();

    friend void logger_module_start(const char *);
    friend void logger_module_stop(const char *);

    bool accepts(Level lvl) const noexcept;
    void submit(Level lvl, std::string body) noexcept;

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

/// Admits records at or above `min_level`, unchanged.
SERVEFLEET_UTILS_EXPORT Logger::ComponentFilter make_level_filter(Logger::Level min_level);

/// Runs `inner`, then maps any surviving level listed in `from` to `to`.
SERVEFLEET_UTILS_EXPORT Logger::ComponentFilter
make_level_rewriter(Logger::ComponentFilter inner, std::vector<Logger::Level> from,
                    Logger::Level to);

/// "trace", "debug", "info", "warning", "error" or "critical".
SERVEFLEET_UTILS_EXPORT std::optional<Logger::Level> level_from_name(std::string_view name) noexcept;
SERVEFLEET_UTILS_EXPORT const char *level_name(Logger::Level lvl) noexcept;

} // namespace servefleet::utils

#define SFL_LOG_AT(lvl, fmt, ...)                                                                  \
    ::servefleet::utils::Logger::instance().log(::servefleet::utils::Logger::Level::lvl,          \
                                                FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_TRACE(fmt, ...) SFL_LOG_AT(L_TRACE, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...) SFL_LOG_AT(L_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...) SFL_LOG_AT(L_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...) SFL_LOG_AT(L_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...) SFL_LOG_AT(L_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_CRITICAL(fmt, ...) SFL_LOG_AT(L_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...) SFL_LOG_AT(L_SYSTEM, fmt __VA_OPT__(, ) __VA_ARGS__)
