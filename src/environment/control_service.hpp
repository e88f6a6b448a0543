#pragma once
/**
 * @file control_service.hpp
 * @brief ROUTER request/reply loop shared by the stash and the cache, and its DEALER client.
 *
 * Request layout:  [identity, 'C', msg_type, seq, json_body]   (identity added by ROUTER)
 * Reply layout:    [identity, 'C', ack_type, seq, json_body]
 * `seq` is an opaque frame chosen by the client and echoed unchanged.
 * `ack_type` is "<msg_type>_ACK" when the handler's reply has `"status": "success"`, otherwise
 * "ERROR". All socket I/O happens on the service thread; start() and stop() are called from
 * the owner.
 */
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>
#include <zmq.hpp>

namespace servefleet::env::detail
{

inline constexpr char kFrameTypeControl = 'C';

nlohmann::json make_success(nlohmann::json body = nlohmann::json::object());
nlohmann::json make_error(const std::string &error_code, const std::string &message);

class ControlService
{
  public:
    using Handler =
        std::function<nlohmann::json(const std::string &msg_type, const nlohmann::json &payload)>;

    ControlService(std::string name, Handler handler);
    ~ControlService();

    ControlService(const ControlService &) = delete;
    ControlService &operator=(const ControlService &) = delete;

    /**
     * @brief Binds `endpoint` (a fresh ipc:// endpoint when empty) and starts the loop.
     * @return The bound endpoint.
     * @throws std::logic_error if already running; zmq::error_t if the bind fails.
     */
    const std::string &start(std::string endpoint);

    /** @brief Stops the loop and joins the thread. Idempotent. */
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return m_thread.joinable(); }
    [[nodiscard]] const std::string &endpoint() const noexcept { return m_endpoint; }

  private:
    void run(zmq::socket_t router);

    std::string m_name;
    Handler m_handler;
    std::string m_endpoint;
    std::atomic<bool> m_stop_requested{false};
    std::thread m_thread;
};

/**
 * @brief Request/reply client for a ControlService. Owns its own ZeroMQ context so it can be
 *        used from processes that do not run the lifecycle modules. Not thread-safe.
 *
 * Every request carries a new sequence number. A reply whose number differs from the
 * pending request's (a late answer to an earlier, timed-out request) is dropped.
 */
class ControlClient
{
  public:
    ControlClient(std::string service_name, const std::string &endpoint,
                  std::chrono::milliseconds timeout);
    ~ControlClient();

    ControlClient(const ControlClient &) = delete;
    ControlClient &operator=(const ControlClient &) = delete;

    /**
     * @brief Sends one request and waits for its reply.
     * @return The reply body of a successful request.
     * @throws SharedStoreError with the service's error code, or "TIMEOUT".
     */
    nlohmann::json request(const std::string &msg_type, const nlohmann::json &payload);

  private:
    std::string m_service_name;
    std::chrono::milliseconds m_timeout;
    std::uint64_t m_next_seq = 1;
    zmq::context_t m_ctx{1};
    zmq::socket_t m_socket;
};

} // namespace servefleet::env::detail
