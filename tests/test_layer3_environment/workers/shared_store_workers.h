#pragma once
#include <string>

namespace servefleet::tests::worker::shared_store
{

int stash_put_take(const std::string &log_path);
int stash_cross_process(const std::string &log_path);
int stash_take_in_child(const std::string &endpoint);
int cache_operations(const std::string &log_path);
int client_timeout(const std::string &log_path);
int client_drops_stale_reply(const std::string &log_path);
int service_lifecycle(const std::string &log_path);
int service_without_zmq_context_aborts();

} // namespace servefleet::tests::worker::shared_store
