#pragma once
/**
 * @file shared_store.hpp
 * @brief Stash and cache services reachable by the fleet's worker processes.
 *
 * Both services run a ZeroMQ ROUTER loop on their own thread and serialize every request
 * there. Their endpoints are handed to the fleet through the FleetContext.
 *
 * Stash messages:  PUT {id, path, value}   TAKE {id, path}
 * Cache messages:  SET {key, value}   GET {key}   DEL {key}   KEYS {}
 *
 * The services use the shared context, so the "ZMQContext" lifecycle module must be running.
 * Clients own their context and work in any process.
 */
#include "servefleet_utils_export.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace servefleet::env
{

namespace detail
{
class ControlService;
class ControlClient;
} // namespace detail

inline constexpr std::chrono::milliseconds kDefaultStoreTimeout{2000};

/**
 * @class StashServer
 * @brief One-shot object store keyed by (id, path). A value can be put once and taken once.
 */
class SERVEFLEET_UTILS_EXPORT StashServer
{
  public:
    StashServer();
    ~StashServer();

    StashServer(const StashServer &) = delete;
    StashServer &operator=(const StashServer &) = delete;

    /**
     * @brief Binds and starts the service thread; returns once bound.
     * @param endpoint Endpoint to bind; a fresh ipc:// endpoint when empty.
     * @return The bound endpoint.
     */
    const std::string &start(std::string endpoint = {});
    /** @brief Stops the service thread. Idempotent. Stored values are discarded. */
    void stop();

    [[nodiscard]] bool is_running() const noexcept;
    [[nodiscard]] const std::string &endpoint() const noexcept;
    /** @brief Number of stored entries. */
    [[nodiscard]] std::size_t size() const;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

class SERVEFLEET_UTILS_EXPORT StashClient
{
  public:
    explicit StashClient(const std::string &endpoint,
                         std::chrono::milliseconds timeout = kDefaultStoreTimeout);
    ~StashClient();

    /** @throws SharedStoreError "DUPLICATE_KEY" if (id, path) already holds a value. */
    void put(const std::string &id, const std::string &path, const nlohmann::json &value);

    /** @brief Returns and removes the value at (id, path); nullopt when there is none. */
    std::optional<nlohmann::json> take(const std::string &id, const std::string &path);

  private:
    std::unique_ptr<detail::ControlClient> m_client;
};

/**
 * @class CacheManager
 * @brief Shared key/value map for the duration of one environment scope.
 */
class SERVEFLEET_UTILS_EXPORT CacheManager
{
  public:
    CacheManager();
    ~CacheManager();

    CacheManager(const CacheManager &) = delete;
    CacheManager &operator=(const CacheManager &) = delete;

    const std::string &start(std::string endpoint = {});
    void stop();

    [[nodiscard]] bool is_running() const noexcept;
    [[nodiscard]] const std::string &endpoint() const noexcept;
    [[nodiscard]] std::size_t size() const;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

class SERVEFLEET_UTILS_EXPORT CacheClient
{
  public:
    explicit CacheClient(const std::string &endpoint,
                         std::chrono::milliseconds timeout = kDefaultStoreTimeout);
    ~CacheClient();

    void set(const std::string &key, const nlohmann::json &value);
    std::optional<nlohmann::json> get(const std::string &key);
    /** @return true if the key existed. */
    bool erase(const std::string &key);
    std::vector<std::string> keys();

  private:
    std::unique_ptr<detail::ControlClient> m_client;
};

} // namespace servefleet::env
