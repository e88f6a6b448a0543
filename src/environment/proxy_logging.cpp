#include "environment/proxy_logging.hpp"

#include "sfl_service.hpp"

#include <zmq_addon.hpp>

#include <condition_variable>
#include <thread>
#include <utility>
#include <vector>

namespace servefleet::env
{

using servefleet::utils::Logger;

namespace
{
// Kept short so a close request is noticed promptly.
constexpr std::chrono::milliseconds kPollTimeout{100};
// Pending records are delivered for at most this long once a producer is destroyed.
constexpr int kProducerLingerMs = 1000;
} // namespace

// ============================================================================
// Severity / LogRecord
// ============================================================================

const char *severity_name(Severity s) noexcept
{
    switch (s)
    {
    case Severity::Critical:
        return "critical";
    case Severity::Error:
        return "error";
    case Severity::Warning:
        return "warning";
    case Severity::Info:
        return "info";
    case Severity::Debug:
        return "debug";
    }
    return "info";
}

std::optional<Severity> severity_from_name(std::string_view name) noexcept
{
    if (name == "critical")
        return Severity::Critical;
    if (name == "error")
        return Severity::Error;
    if (name == "warning")
        return Severity::Warning;
    if (name == "info")
        return Severity::Info;
    if (name == "debug")
        return Severity::Debug;
    return std::nullopt;
}

Logger::Level to_logger_level(Severity s) noexcept
{
    switch (s)
    {
    case Severity::Critical:
        return Logger::Level::L_CRITICAL;
    case Severity::Error:
        return Logger::Level::L_ERROR;
    case Severity::Warning:
        return Logger::Level::L_WARNING;
    case Severity::Info:
        return Logger::Level::L_INFO;
    case Severity::Debug:
        return Logger::Level::L_DEBUG;
    }
    return Logger::Level::L_INFO;
}

nlohmann::json LogRecord::to_json() const
{
    return nlohmann::json{{"severity", severity_name(severity)},
                          {"component", component},
                          {"message", message},
                          {"fields", fields},
                          {"source", source}};
}

LogRecord LogRecord::from_json(const nlohmann::json &j)
{
    const std::string sev = j.value("severity", "");
    const auto parsed = severity_from_name(sev);
    if (!parsed)
    {
        throw std::invalid_argument("LogRecord: unknown severity '" + sev + "'");
    }
    LogRecord rec;
    rec.severity = *parsed;
    rec.component = j.value("component", "");
    rec.message = j.value("message", "");
    if (j.contains("fields") && j["fields"].is_object())
    {
        rec.fields = j["fields"];
    }
    rec.source = j.value("source", "");
    return rec;
}

std::string LogRecord::body() const
{
    if (fields.empty())
        return message;
    return fmt::format("{} {}", message, fields.dump());
}

// ============================================================================
// LoggerProxy
// ============================================================================

LoggerProxy::LoggerProxy(const std::string &endpoint, std::string component)
    : m_endpoint(endpoint), m_component(std::move(component)),
      m_emitter_id(servefleet::format_tools::random_hex_id()),
      m_socket(m_ctx, zmq::socket_type::push)
{
    // Unbounded FIFO: never drop on the producer side.
    m_socket.set(zmq::sockopt::sndhwm, 0);
    m_socket.set(zmq::sockopt::linger, kProducerLingerMs);
    m_socket.connect(m_endpoint);
}

LoggerProxy::~LoggerProxy()
{
    m_socket.close();
}

std::unique_ptr<LoggerProxy> LoggerProxy::connect(const std::string &endpoint,
                                                  std::string component)
{
    return std::unique_ptr<LoggerProxy>(new LoggerProxy(endpoint, std::move(component)));
}

void LoggerProxy::critical(std::string_view message, nlohmann::json fields)
{
    log(Severity::Critical, message, std::move(fields));
}

void LoggerProxy::error(std::string_view message, nlohmann::json fields)
{
    log(Severity::Error, message, std::move(fields));
}

void LoggerProxy::warning(std::string_view message, nlohmann::json fields)
{
    log(Severity::Warning, message, std::move(fields));
}

void LoggerProxy::info(std::string_view message, nlohmann::json fields)
{
    log(Severity::Info, message, std::move(fields));
}

void LoggerProxy::debug(std::string_view message, nlohmann::json fields)
{
    log(Severity::Debug, message, std::move(fields));
}

bool LoggerProxy::log(Severity severity, std::string_view message, nlohmann::json fields)
{
    LogRecord rec;
    rec.severity = severity;
    rec.component = m_component;
    rec.message = std::string(message);
    if (fields.is_object())
    {
        rec.fields = std::move(fields);
    }
    rec.source = m_emitter_id;
    const std::string payload = rec.to_json().dump();
    return send_frames(kFrameRecord, &payload);
}

bool LoggerProxy::send_end_of_stream()
{
    return send_frames(kFrameEnd, nullptr);
}

bool LoggerProxy::send_frames(char type, const std::string *payload)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto more = payload != nullptr ? zmq::send_flags::sndmore : zmq::send_flags::none;
    if (!m_socket.send(zmq::message_t(&type, 1), more | zmq::send_flags::dontwait))
        return false;
    if (payload != nullptr)
    {
        return m_socket
            .send(zmq::message_t(payload->data(), payload->size()), zmq::send_flags::none)
            .has_value();
    }
    return true;
}

// ============================================================================
// ProxyLoggingContext
// ============================================================================

struct ProxyLoggingContext::ConsumerState
{
    zmq::context_t ctx{1};
    zmq::socket_t pull{ctx, zmq::socket_type::pull};
    std::thread thread;
    std::atomic<bool> close_requested{false};
    std::mutex mu;
    std::condition_variable cv;
    bool finished{false};
};

namespace
{

void forward_frames(const std::vector<zmq::message_t> &frames)
{
    if (frames.size() < 2)
    {
        LOGGER_WARN("LogQueue: malformed record (expected 2 frames, got {})", frames.size());
        return;
    }
    try
    {
        const LogRecord rec =
            LogRecord::from_json(nlohmann::json::parse(frames[1].to_string()));
        Logger::instance().write_record(rec.component, to_logger_level(rec.severity), rec.body());
    }
    catch (const nlohmann::json::exception &e)
    {
        LOGGER_WARN("LogQueue: malformed JSON: {}", e.what());
    }
    catch (const std::invalid_argument &e)
    {
        LOGGER_WARN("LogQueue: {}", e.what());
    }
}

} // namespace

void ProxyLoggingContext::consume(const std::shared_ptr<ConsumerState> &st)
{
    auto mark_finished = servefleet::basics::make_scope_guard(
        [&st]()
        {
            {
                std::lock_guard<std::mutex> lock(st->mu);
                st->finished = true;
            }
            st->cv.notify_all();
        });

    try
    {
        while (!st->close_requested.load(std::memory_order_acquire))
        {
            std::vector<zmq::pollitem_t> items = {{st->pull.handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items, kPollTimeout);
            if ((items[0].revents & ZMQ_POLLIN) == 0)
                continue;

            std::vector<zmq::message_t> frames;
            static_cast<void>(zmq::recv_multipart(st->pull, std::back_inserter(frames)));
            if (frames.empty() || frames[0].size() != 1)
            {
                LOGGER_WARN("LogQueue: malformed message ({} frames)", frames.size());
                continue;
            }
            const char type = *frames[0].data<char>();
            if (type == kFrameEnd)
                break;
            if (type != kFrameRecord)
            {
                LOGGER_WARN("LogQueue: unknown frame type '{}'", type);
                continue;
            }
            forward_frames(frames);
        }
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_ERROR("LogQueue: consumer stopped on ZeroMQ error: {}", e.what());
    }
    st->pull.close();
}

ProxyLoggingContext::ProxyLoggingContext(std::string component,
                                         std::chrono::milliseconds join_timeout)
    : m_component(std::move(component)), m_join_timeout(join_timeout)
{
}

ProxyLoggingContext::~ProxyLoggingContext()
{
    if (is_running())
    {
        static_cast<void>(stop());
    }
}

bool ProxyLoggingContext::is_running() const noexcept
{
    return m_state != nullptr;
}

LoggerProxy &ProxyLoggingContext::logger()
{
    if (!m_logger)
    {
        throw std::logic_error("ProxyLoggingContext '" + m_component + "' is not running");
    }
    return *m_logger;
}

LoggerProxy &ProxyLoggingContext::start()
{
    if (is_running())
    {
        throw std::logic_error("ProxyLoggingContext '" + m_component + "' already started");
    }

    auto &logger = Logger::instance();
    const auto filter = logger.push_component_filter(
        m_component, servefleet::utils::make_level_rewriter(
                         servefleet::utils::make_level_filter(Logger::Level::L_INFO),
                         {Logger::Level::L_ERROR}, Logger::Level::L_WARNING));
    auto remove_filter = servefleet::basics::make_scope_guard(
        [&]() { logger.pop_component_filter(m_component, filter); });

    auto state = std::make_shared<ConsumerState>();
    m_endpoint = servefleet::ipc::unique_ipc_endpoint("log");
    state->pull.bind(m_endpoint);
    m_logger = LoggerProxy::connect(m_endpoint, m_component);

    state->thread = std::thread([state]() { consume(state); });
    m_state = std::move(state);
    m_filter = filter;
    remove_filter.dismiss();

    LOGGER_DEBUG("LogQueue: proxy for '{}' listening on {}", m_component, m_endpoint);
    return *m_logger;
}

bool ProxyLoggingContext::stop()
{
    if (!is_running())
        return false;

    std::shared_ptr<ConsumerState> state = std::move(m_state);
    m_state.reset();

    if (!m_logger->send_end_of_stream())
    {
        state->close_requested.store(true, std::memory_order_release);
    }

    bool finished = false;
    {
        std::unique_lock<std::mutex> lock(state->mu);
        finished = state->cv.wait_for(lock, m_join_timeout, [&] { return state->finished; });
    }

    if (finished)
    {
        state->thread.join();
    }
    else
    {
        state->close_requested.store(true, std::memory_order_release);
        state->thread.detach();
        LOGGER_DEBUG("LogQueue: consumer for '{}' did not finish within {} ms; detached",
                     m_component, m_join_timeout.count());
    }

    m_logger.reset();
    Logger::instance().pop_component_filter(m_component, std::exchange(m_filter, 0));
    return finished;
}

} // namespace servefleet::env
