#pragma once
/**
 * @file proxy_logging.hpp
 * @brief Cross-process logging proxy.
 *
 * Worker processes (the fleet servers) have no access to the structured `Logger` of the
 * orchestrating process. They hold a `LoggerProxy`, which serializes each call into a
 * `LogRecord` and pushes it onto the `LogQueue`: a ZeroMQ PULL socket bound by the
 * orchestrator to an `ipc://` endpoint. A single consumer thread reads the queue until the
 * end-of-stream sentinel and hands every record to `Logger::write_record`, where the
 * component filter installed by `ProxyLoggingContext` applies.
 *
 * Wire format, two frames per message:
 *   frame 0: one byte, 'R' (record) or 'E' (end of stream)
 *   frame 1: JSON `{"severity","component","message","fields","source"}` (records only)
 *
 * ```cpp
 * ProxyLoggingContext ctx("servefleet.server");
 * LoggerProxy &log = ctx.start();
 * log.info("listening", {{"port", 8000}});
 * // in another process:
 * auto remote = LoggerProxy::connect(ctx.endpoint(), "servefleet.server");
 * remote->error("bind failed");   // arrives as a warning
 * ```
 */
#include "servefleet_utils_export.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include "utils/logger.hpp"

namespace servefleet::env
{

enum class Severity
{
    Critical,
    Error,
    Warning,
    Info,
    Debug,
};

SERVEFLEET_UTILS_EXPORT const char *severity_name(Severity s) noexcept;
SERVEFLEET_UTILS_EXPORT std::optional<Severity> severity_from_name(std::string_view name) noexcept;
SERVEFLEET_UTILS_EXPORT servefleet::utils::Logger::Level to_logger_level(Severity s) noexcept;

struct SERVEFLEET_UTILS_EXPORT LogRecord
{
    Severity severity{Severity::Info};
    std::string component;
    std::string message;
    nlohmann::json fields = nlohmann::json::object();
    /// Emitter id of the producing LoggerProxy.
    std::string source;

    [[nodiscard]] nlohmann::json to_json() const;
    /// @throws std::invalid_argument on a missing or unknown severity.
    [[nodiscard]] static LogRecord from_json(const nlohmann::json &j);

    /// Text handed to the logger: the message, followed by the fields when there are any.
    [[nodiscard]] std::string body() const;
};

inline constexpr char kFrameRecord = 'R';
inline constexpr char kFrameEnd = 'E';

/**
 * @class LoggerProxy
 * @brief Producer handle for the log queue. Performs no logger I/O.
 *
 * Each proxy owns its own ZeroMQ context and PUSH socket, so it can be created in any
 * process that knows the queue endpoint. Thread-safe.
 */
class SERVEFLEET_UTILS_EXPORT LoggerProxy
{
  public:
    /**
     * @brief Connects a new producer to the queue at `endpoint`.
     * @param component Component name stamped on every record.
     * @throws zmq::error_t if the endpoint is invalid.
     */
    static std::unique_ptr<LoggerProxy> connect(const std::string &endpoint,
                                                std::string component);

    ~LoggerProxy();
    LoggerProxy(const LoggerProxy &) = delete;
    LoggerProxy &operator=(const LoggerProxy &) = delete;

    void critical(std::string_view message, nlohmann::json fields = nlohmann::json::object());
    void error(std::string_view message, nlohmann::json fields = nlohmann::json::object());
    void warning(std::string_view message, nlohmann::json fields = nlohmann::json::object());
    void info(std::string_view message, nlohmann::json fields = nlohmann::json::object());
    void debug(std::string_view message, nlohmann::json fields = nlohmann::json::object());

    /** @brief Enqueues one record. Returns false if the queue refused it. */
    bool log(Severity severity, std::string_view message, nlohmann::json fields);

    /** @brief Enqueues the end-of-stream sentinel. */
    bool send_end_of_stream();

    [[nodiscard]] const std::string &component() const noexcept { return m_component; }
    /// Process-unique emitter id (random hex).
    [[nodiscard]] const std::string &emitter_id() const noexcept { return m_emitter_id; }
    [[nodiscard]] const std::string &endpoint() const noexcept { return m_endpoint; }

  private:
    LoggerProxy(const std::string &endpoint, std::string component);

    bool send_frames(char type, const std::string *payload);

    std::string m_endpoint;
    std::string m_component;
    std::string m_emitter_id;
    zmq::context_t m_ctx{1};
    std::mutex m_mutex;
    zmq::socket_t m_socket;
};

/**
 * @class ProxyLoggingContext
 * @brief Owns the log queue, its consumer thread and the component filter.
 *
 * `start()` pushes a filter for the component (admit info and above, rewrite error to
 * warning), binds the queue and starts the consumer. The context pops only the filter it
 * pushed, so a second context for the same component never strips the first one's filter. `stop()` sends the sentinel and waits up
 * to `join_timeout` for the consumer; on timeout the consumer is asked to close and detached.
 * `stop()` is idempotent and is called by the destructor.
 */
class SERVEFLEET_UTILS_EXPORT ProxyLoggingContext
{
  public:
    static constexpr const char *kDefaultComponent = "servefleet.server";
    static constexpr std::chrono::milliseconds kDefaultJoinTimeout{1000};

    explicit ProxyLoggingContext(std::string component = kDefaultComponent,
                                 std::chrono::milliseconds join_timeout = kDefaultJoinTimeout);
    ~ProxyLoggingContext();

    ProxyLoggingContext(const ProxyLoggingContext &) = delete;
    ProxyLoggingContext &operator=(const ProxyLoggingContext &) = delete;

    /**
     * @brief Starts the consumer and returns the in-process producer.
     * @throws std::logic_error if already running.
     */
    LoggerProxy &start();

    /**
     * @brief Sends the sentinel and waits for the consumer.
     * @return true if the consumer finished within the timeout, false if it was detached
     *         (or the context was not running).
     */
    bool stop();

    [[nodiscard]] bool is_running() const noexcept;
    /** @pre is_running() */
    [[nodiscard]] LoggerProxy &logger();
    [[nodiscard]] const std::string &endpoint() const noexcept { return m_endpoint; }
    [[nodiscard]] const std::string &component() const noexcept { return m_component; }

  private:
    struct ConsumerState;

    // Reads the queue until the end-of-stream frame or a close request.
    static void consume(const std::shared_ptr<ConsumerState> &st);

    std::string m_component;
    std::chrono::milliseconds m_join_timeout;
    std::string m_endpoint;
    std::shared_ptr<ConsumerState> m_state;
    std::unique_ptr<LoggerProxy> m_logger;
    servefleet::utils::Logger::FilterHandle m_filter = 0;
};

} // namespace servefleet::env
