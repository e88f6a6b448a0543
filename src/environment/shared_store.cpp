#include "environment/shared_store.hpp"

#include "control_service.hpp"
#include "environment/errors.hpp"
#include "sfl_service.hpp"

#include <map>
#include <mutex>
#include <utility>

namespace servefleet::env
{

using detail::make_error;
using detail::make_success;

namespace
{
bool has_string(const nlohmann::json &req, const char *key)
{
    return req.contains(key) && req.at(key).is_string();
}
} // namespace

// ============================================================================
// StashServer
// ============================================================================

struct StashServer::Impl
{
    // Guards `entries` against size() queries from the owner thread.
    mutable std::mutex mu;
    std::map<std::pair<std::string, std::string>, nlohmann::json> entries;
    detail::ControlService service;

    Impl()
        : service("Stash",
                  [this](const std::string &msg_type, const nlohmann::json &payload)
                  { return handle(msg_type, payload); })
    {
    }

    nlohmann::json handle(const std::string &msg_type, const nlohmann::json &req)
    {
        if (!has_string(req, "id") || !has_string(req, "path"))
        {
            return make_error("INVALID_REQUEST", "Missing or non-string 'id' / 'path'");
        }
        auto key = std::make_pair(req.at("id").get<std::string>(),
                                  req.at("path").get<std::string>());
        std::lock_guard<std::mutex> lock(mu);
        if (msg_type == "PUT")
        {
            if (entries.count(key) != 0)
            {
                return make_error("DUPLICATE_KEY", "Stash already holds a value for id '" +
                                                       key.first + "' at '" + key.second + "'");
            }
            entries.emplace(std::move(key), req.value("value", nlohmann::json(nullptr)));
            return make_success();
        }
        if (msg_type == "TAKE")
        {
            nlohmann::json value(nullptr);
            auto it = entries.find(key);
            if (it != entries.end())
            {
                value = std::move(it->second);
                entries.erase(it);
            }
            return make_success({{"found", !value.is_null()}, {"value", std::move(value)}});
        }
        LOGGER_WARN("Stash: unknown msg_type '{}'", msg_type);
        return make_error("UNKNOWN_MSG_TYPE", "Unknown message type: " + msg_type);
    }
};

StashServer::StashServer() : pImpl(std::make_unique<Impl>()) {}

StashServer::~StashServer()
{
    stop();
}

const std::string &StashServer::start(std::string endpoint)
{
    return pImpl->service.start(std::move(endpoint));
}

void StashServer::stop()
{
    pImpl->service.stop();
    std::lock_guard<std::mutex> lock(pImpl->mu);
    pImpl->entries.clear();
}

bool StashServer::is_running() const noexcept
{
    return pImpl->service.is_running();
}

const std::string &StashServer::endpoint() const noexcept
{
    return pImpl->service.endpoint();
}

std::size_t StashServer::size() const
{
    std::lock_guard<std::mutex> lock(pImpl->mu);
    return pImpl->entries.size();
}

StashClient::StashClient(const std::string &endpoint, std::chrono::milliseconds timeout)
    : m_client(std::make_unique<detail::ControlClient>("Stash", endpoint, timeout))
{
}

StashClient::~StashClient() = default;

void StashClient::put(const std::string &id, const std::string &path,
                      const nlohmann::json &value)
{
    static_cast<void>(m_client->request("PUT", {{"id", id}, {"path", path}, {"value", value}}));
}

std::optional<nlohmann::json> StashClient::take(const std::string &id, const std::string &path)
{
    const nlohmann::json reply = m_client->request("TAKE", {{"id", id}, {"path", path}});
    if (!reply.value("found", false))
        return std::nullopt;
    return reply.at("value");
}

// ============================================================================
// CacheManager
// ============================================================================

struct CacheManager::Impl
{
    mutable std::mutex mu;
    std::map<std::string, nlohmann::json> entries;
    detail::ControlService service;

    Impl()
        : service("Cache",
                  [this](const std::string &msg_type, const nlohmann::json &payload)
                  { return handle(msg_type, payload); })
    {
    }

    nlohmann::json handle(const std::string &msg_type, const nlohmann::json &req)
    {
        std::lock_guard<std::mutex> lock(mu);
        if (msg_type == "KEYS")
        {
            nlohmann::json keys = nlohmann::json::array();
            for (const auto &[k, v] : entries)
                keys.push_back(k);
            return make_success({{"keys", std::move(keys)}});
        }
        if (!has_string(req, "key"))
        {
            return make_error("INVALID_REQUEST", "Missing or non-string 'key'");
        }
        const std::string key = req.at("key").get<std::string>();
        if (msg_type == "SET")
        {
            entries[key] = req.value("value", nlohmann::json(nullptr));
            return make_success();
        }
        if (msg_type == "GET")
        {
            auto it = entries.find(key);
            if (it == entries.end())
                return make_success({{"found", false}, {"value", nullptr}});
            return make_success({{"found", true}, {"value", it->second}});
        }
        if (msg_type == "DEL")
        {
            return make_success({{"removed", entries.erase(key) != 0}});
        }
        LOGGER_WARN("Cache: unknown msg_type '{}'", msg_type);
        return make_error("UNKNOWN_MSG_TYPE", "Unknown message type: " + msg_type);
    }
};

CacheManager::CacheManager() : pImpl(std::make_unique<Impl>()) {}

CacheManager::~CacheManager()
{
    stop();
}

const std::string &CacheManager::start(std::string endpoint)
{
    return pImpl->service.start(std::move(endpoint));
}

void CacheManager::stop()
{
    pImpl->service.stop();
    std::lock_guard<std::mutex> lock(pImpl->mu);
    pImpl->entries.clear();
}

bool CacheManager::is_running() const noexcept
{
    return pImpl->service.is_running();
}

const std::string &CacheManager::endpoint() const noexcept
{
    return pImpl->service.endpoint();
}

std::size_t CacheManager::size() const
{
    std::lock_guard<std::mutex> lock(pImpl->mu);
    return pImpl->entries.size();
}

CacheClient::CacheClient(const std::string &endpoint, std::chrono::milliseconds timeout)
    : m_client(std::make_unique<detail::ControlClient>("Cache", endpoint, timeout))
{
}

CacheClient::~CacheClient() = default;

void CacheClient::set(const std::string &key, const nlohmann::json &value)
{
    static_cast<void>(m_client->request("SET", {{"key", key}, {"value", value}}));
}

std::optional<nlohmann::json> CacheClient::get(const std::string &key)
{
    const nlohmann::json reply = m_client->request("GET", {{"key", key}});
    if (!reply.value("found", false))
        return std::nullopt;
    return reply.at("value");
}

bool CacheClient::erase(const std::string &key)
{
    return m_client->request("DEL", {{"key", key}}).value("removed", false);
}

std::vector<std::string> CacheClient::keys()
{
    const nlohmann::json reply = m_client->request("KEYS", nlohmann::json::object());
    return reply.value("keys", std::vector<std::string>{});
}

} // namespace servefleet::env
