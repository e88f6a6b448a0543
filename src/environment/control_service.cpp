#include "control_service.hpp"

#include "environment/errors.hpp"
#include "sfl_service.hpp"

#include <zmq_addon.hpp>

#include <vector>

namespace servefleet::env::detail
{

namespace
{
// Service poll timeout; bounds how long stop() waits for the loop to notice.
constexpr std::chrono::milliseconds kPollTimeout{100};

void send_reply(zmq::socket_t &socket, const zmq::message_t &identity,
                const std::string &msg_type_ack, const zmq::message_t &seq,
                const nlohmann::json &body)
{
    const std::string text = body.dump();
    std::vector<zmq::message_t> out;
    out.emplace_back(identity.data(), identity.size());
    out.emplace_back(&kFrameTypeControl, 1);
    out.emplace_back(msg_type_ack.data(), msg_type_ack.size());
    out.emplace_back(seq.data(), seq.size());
    out.emplace_back(text.data(), text.size());
    if (!zmq::send_multipart(socket, out))
        LOGGER_WARN("control reply {} could not be queued", msg_type_ack);
}
} // namespace

nlohmann::json make_success(nlohmann::json body)
{
    body["status"] = "success";
    return body;
}

nlohmann::json make_error(const std::string &error_code, const std::string &message)
{
    return {{"status", "error"}, {"error_code", error_code}, {"message", message}};
}

ControlService::ControlService(std::string name, Handler handler)
    : m_name(std::move(name)), m_handler(std::move(handler))
{
}

ControlService::~ControlService()
{
    stop();
}

const std::string &ControlService::start(std::string endpoint)
{
    if (is_running())
    {
        throw std::logic_error(m_name + ": already running on " + m_endpoint);
    }
    if (endpoint.empty())
    {
        endpoint = servefleet::ipc::unique_ipc_endpoint(m_name);
    }

    zmq::socket_t router(servefleet::ipc::get_zmq_context(), zmq::socket_type::router);
    router.set(zmq::sockopt::linger, 0);
    router.bind(endpoint);
    m_endpoint = router.get(zmq::sockopt::last_endpoint);

    m_stop_requested.store(false, std::memory_order_release);
    m_thread = std::thread([this, sock = std::move(router)]() mutable { run(std::move(sock)); });
    LOGGER_INFO("{}: listening on {}", m_name, m_endpoint);
    return m_endpoint;
}

void ControlService::stop()
{
    if (!is_running())
        return;
    m_stop_requested.store(true, std::memory_order_release);
    m_thread.join();
    LOGGER_INFO("{}: stopped.", m_name);
}

void ControlService::run(zmq::socket_t router)
{
    try
    {
        while (!m_stop_requested.load(std::memory_order_acquire))
        {
            std::vector<zmq::pollitem_t> items = {{router.handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items, kPollTimeout);
            if ((items[0].revents & ZMQ_POLLIN) == 0)
                continue;

            std::vector<zmq::message_t> frames;
            static_cast<void>(zmq::recv_multipart(router, std::back_inserter(frames)));
            if (frames.size() < 5)
            {
                LOGGER_WARN("{}: malformed message (expected 5 frames, got {})", m_name,
                            frames.size());
                continue;
            }

            const std::string msg_type = frames[2].to_string();
            nlohmann::json reply;
            try
            {
                reply = m_handler(msg_type, nlohmann::json::parse(frames[4].to_string()));
            }
            catch (const nlohmann::json::exception &e)
            {
                LOGGER_WARN("{}: malformed JSON: {}", m_name, e.what());
                reply = make_error("INVALID_REQUEST", e.what());
            }
            catch (const std::exception &e)
            {
                LOGGER_ERROR("{}: handler for {} threw: {}", m_name, msg_type, e.what());
                reply = make_error("INTERNAL_ERROR", e.what());
            }
            const std::string ack =
                reply.value("status", "") == "success" ? msg_type + "_ACK" : "ERROR";
            send_reply(router, frames[0], ack, frames[3], reply);
        }
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_ERROR("{}: service loop stopped on ZeroMQ error: {}", m_name, e.what());
    }
    router.close();
}

ControlClient::ControlClient(std::string service_name, const std::string &endpoint,
                             std::chrono::milliseconds timeout)
    : m_service_name(std::move(service_name)), m_timeout(timeout),
      m_socket(m_ctx, zmq::socket_type::dealer)
{
    m_socket.set(zmq::sockopt::linger, 0);
    m_socket.connect(endpoint);
}

ControlClient::~ControlClient()
{
    m_socket.close();
}

nlohmann::json ControlClient::request(const std::string &msg_type, const nlohmann::json &payload)
{
    const std::string seq = std::to_string(m_next_seq++);
    const std::string body = payload.dump();
    std::vector<zmq::message_t> out;
    out.emplace_back(&kFrameTypeControl, 1);
    out.emplace_back(msg_type.data(), msg_type.size());
    out.emplace_back(seq.data(), seq.size());
    out.emplace_back(body.data(), body.size());
    if (!zmq::send_multipart(m_socket, out))
    {
        throw SharedStoreError("TIMEOUT",
                               fmt::format("{}: could not send {}", m_service_name, msg_type));
    }

    // Reply layout as seen by DEALER: ['C', ack_type, seq, json_body]
    std::vector<zmq::message_t> frames;
    const auto deadline = std::chrono::steady_clock::now() + m_timeout;
    for (;;)
    {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
        {
            throw SharedStoreError("TIMEOUT", fmt::format("{}: no reply to {} within {} ms",
                                                          m_service_name, msg_type,
                                                          m_timeout.count()));
        }
        std::vector<zmq::pollitem_t> items = {{m_socket.handle(), 0, ZMQ_POLLIN, 0}};
        zmq::poll(items, remaining);
        if ((items[0].revents & ZMQ_POLLIN) == 0)
            continue;

        frames.clear();
        if (!zmq::recv_multipart(m_socket, std::back_inserter(frames), zmq::recv_flags::dontwait))
            continue;
        if (frames.size() < 4)
        {
            throw SharedStoreError("INVALID_REPLY",
                                   fmt::format("{}: malformed reply to {} ({} frames)",
                                               m_service_name, msg_type, frames.size()));
        }
        if (frames[2].to_string_view() == seq)
            break;
        LOGGER_DEBUG("{}: dropped stale {} reply (seq {}, waiting for {})", m_service_name,
                     frames[1].to_string_view(), frames[2].to_string_view(), seq);
    }

    nlohmann::json reply;
    try
    {
        reply = nlohmann::json::parse(frames[3].to_string());
    }
    catch (const nlohmann::json::exception &e)
    {
        throw SharedStoreError("INVALID_REPLY", fmt::format("{}: malformed reply to {}: {}",
                                                            m_service_name, msg_type, e.what()));
    }
    if (reply.value("status", "") != "success")
    {
        throw SharedStoreError(reply.value("error_code", "ERROR"),
                               fmt::format("{}: {} failed: {}", m_service_name, msg_type,
                                           reply.value("message", "")));
    }
    return reply;
}

} // namespace servefleet::env::detail
