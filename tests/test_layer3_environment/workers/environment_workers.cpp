/**
 * @file environment_workers.cpp
 * @brief Worker functions for the TestEnvironment lifecycle.
 *
 * A TestEnvironment holds a process-wide scope token and installs a logger component
 * filter, so every scenario runs in its own process. Most scenarios use an in-memory
 * fleet launcher; process_fleet_end_to_end spawns real child processes.
 */
#include "environment_workers.h"
#include "sfl_environment.hpp"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"
#include "gtest/gtest.h"

#include <atomic>
#include <csignal>

#include <sys/stat.h>

using namespace servefleet::tests::helper;
using namespace servefleet::env;
using servefleet::utils::Logger;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace servefleet::tests::worker
{
namespace environment
{

namespace
{

class FakeServer : public ServerHandle
{
  public:
    bool is_alive() override { return m_alive.load(); }
    void terminate() override
    {
        m_alive = false;
        ++m_terminations;
    }
    int pid() const override { return 0; }

    int terminations() const { return m_terminations.load(); }

  private:
    std::atomic<bool> m_alive{true};
    std::atomic<int> m_terminations{0};
};

class FakeLauncher : public FleetLauncher
{
  public:
    ServerFleet start(const EffectiveConfig &config, const RouteTable &routes,
                      const FleetContext &context) override
    {
        ++starts;
        last_context = context;
        routes_seen = routes.size();
        if (fail)
        {
            throw FleetStartError("fleet: server http:8000 failed to start: simulated");
        }
        ServerFleet fleet;
        for (const auto &[scheme, ports] : config.ports)
        {
            for (int port : ports)
            {
                auto server = std::make_shared<FakeServer>();
                servers.push_back(server);
                fleet[scheme].push_back({port, server});
            }
        }
        return fleet;
    }

    bool all_terminated() const
    {
        for (const auto &s : servers)
        {
            if (s->terminations() != 1)
                return false;
        }
        return true;
    }

    int starts{0};
    bool fail{false};
    std::size_t routes_seen{0};
    FleetContext last_context;
    std::vector<std::shared_ptr<FakeServer>> servers;
};

// Records its release and optionally fails it.
class RecordingExtra : public ExtraSubsystem
{
  public:
    RecordingExtra(std::string name, std::vector<std::string> &log, bool fail)
        : m_name(std::move(name)), m_log(log), m_fail(fail)
    {
    }

    void release(std::exception_ptr in_flight) override
    {
        m_log.push_back(fmt::format("{}:{}", m_name, in_flight ? describe_exception(in_flight)
                                                               : std::string("none")));
        if (m_fail)
            throw std::runtime_error(m_name + " release failed");
    }

  private:
    std::string m_name;
    std::vector<std::string> &m_log;
    bool m_fail;
};

ExtraStarter recording_extra(std::string name, std::vector<std::string> &log, bool fail = false)
{
    return [name = std::move(name), &log, fail](const nlohmann::json &, const EffectiveConfig &)
    { return std::make_unique<RecordingExtra>(name, log, fail); };
}

// Settings whose route sources exist under `dir`. Port probing is disabled.
EnvironmentSettings make_settings(const TempDir &dir)
{
    write_text_file(dir.path() / "resources" / "testdriver.js", "// driver\n");
    write_text_file(dir.path() / "runner" / "testdriver-extra.js", "// extra\n");
    fs::create_directories(dir.path() / "tests");

    EnvironmentSettings s;
    s.test_paths["/"] = TestPathEntry{dir.path() / "tests", std::nullopt};
    s.runner_dir = dir.path() / "runner";
    s.repo_root = dir.path();
    s.third_party_dir = dir.path() / "third_party";
    s.options = {{"test_server_port", false}};
    return s;
}

bool sigint_ignored()
{
    struct sigaction sa = {};
    ::sigaction(SIGINT, nullptr, &sa);
    return sa.sa_handler == SIG_IGN;
}

template <typename Fn> int run_env_worker(Fn fn, const char *name, const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            fn();
        },
        name, Logger::GetLifecycleModule(), servefleet::ipc::GetZMQContextModule());
}

} // namespace

int enter_and_exit(const std::string &log_path)
{
    return run_env_worker(
        [&]()
        {
            TempDir dir("env-enter");
            auto launcher = std::make_shared<FakeLauncher>();
            nlohmann::json seen_options;
            std::vector<std::string> observer_log;
            EnvironmentSettings settings = make_settings(dir);
            settings.options["browser_host"] = "web-platform.test";
            settings.env_extras.push_back(
                [&seen_options, &observer_log](const nlohmann::json &options,
                                               const EffectiveConfig &config)
                    -> std::unique_ptr<ExtraSubsystem>
                {
                    seen_options = options;
                    EXPECT_EQ(config.browser_host, "web-platform.test");
                    return std::make_unique<RecordingExtra>("observer", observer_log, false);
                });

            TestEnvironment env(std::move(settings), launcher);
            EXPECT_FALSE(env.test_server_port());
            EXPECT_FALSE(env.settings().options.contains("test_server_port"));
            EXPECT_THROW(static_cast<void>(env.config()), std::logic_error);

            env.enter();
            ASSERT_TRUE(env.is_active());
            EXPECT_TRUE(TestEnvironment::scope_active());
            EXPECT_FALSE(seen_options.contains("test_server_port"));
            EXPECT_EQ(seen_options["browser_host"], "web-platform.test");

            EXPECT_EQ(launcher->starts, 1);
            EXPECT_EQ(launcher->routes_seen, env.routes().size());
            EXPECT_EQ(launcher->last_context.log_endpoint, env.log_endpoint());
            EXPECT_EQ(launcher->last_context.stash_endpoint, env.stash_endpoint());
            EXPECT_EQ(launcher->last_context.cache_endpoint, env.cache_endpoint());
            EXPECT_EQ(fleet_size(env.fleet()), 7u);
            EXPECT_FALSE(env.config().check_subdomains);

            StashClient stash(env.stash_endpoint());
            stash.put("id", "/p", 1);
            EXPECT_EQ(stash.take("id", "/p"), nlohmann::json(1));
            CacheClient cache(env.cache_endpoint());
            cache.set("k", "v");
            EXPECT_EQ(cache.get("k"), nlohmann::json("v"));

            env.server_logger().info("scope is live");
            EXPECT_EQ(env.ensure_started(), 1);
            EXPECT_TRUE(env.test_servers().ready());
            EXPECT_FALSE(env.interrupts_ignored());

            env.exit();
            EXPECT_FALSE(env.is_active());
            EXPECT_FALSE(TestEnvironment::scope_active());
            EXPECT_TRUE(launcher->all_terminated());
            EXPECT_EQ(observer_log, (std::vector<std::string>{"observer:none"}));
            EXPECT_THROW(static_cast<void>(env.fleet()), std::logic_error);
            EXPECT_THROW(static_cast<void>(env.stash_endpoint()), std::logic_error);
            env.exit(); // No-op once released.

            Logger::instance().flush();
            ASSERT_TRUE(wait_for_string_in_file(log_path, "scope is live", 5s));
        },
        "environment::enter_and_exit", log_path);
}

int nested_scope_rejected(const std::string &log_path)
{
    return run_env_worker(
        [&]()
        {
            TempDir dir("env-nested");
            auto launcher1 = std::make_shared<FakeLauncher>();
            auto launcher2 = std::make_shared<FakeLauncher>();
            TestEnvironment outer(make_settings(dir), launcher1);
            TestEnvironment inner(make_settings(dir), launcher2);

            outer.enter();
            EXPECT_THROW(outer.enter(), NestedScopeError);
            EXPECT_THROW(inner.enter(), NestedScopeError);

            EXPECT_TRUE(outer.is_active());
            EXPECT_FALSE(inner.is_active());
            EXPECT_TRUE(TestEnvironment::scope_active());
            EXPECT_EQ(launcher2->starts, 0);

            // The rejected entries must leave the outer scope's server filter in place:
            // its server errors are still demoted to warnings.
            EXPECT_TRUE(
                Logger::instance().has_component_filter(ProxyLoggingContext::kDefaultComponent));
            outer.server_logger().error("outer server error after rejected entry");
            ASSERT_TRUE(wait_for_string_in_file(log_path, "outer server error after rejected entry",
                                                5s));
            Logger::instance().flush();
            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            const auto at = contents.find("outer server error after rejected entry");
            ASSERT_NE(at, std::string::npos);
            const auto line_start = contents.rfind('\n', at);
            const std::string line = contents.substr(
                line_start == std::string::npos ? 0 : line_start + 1,
                at - (line_start == std::string::npos ? 0 : line_start + 1));
            EXPECT_NE(line.find("[WARN  ]"), std::string::npos) << line;
            EXPECT_NE(line.find("[servefleet.server]"), std::string::npos) << line;

            outer.exit();
            EXPECT_FALSE(TestEnvironment::scope_active());
            EXPECT_FALSE(
                Logger::instance().has_component_filter(ProxyLoggingContext::kDefaultComponent));

            // The token is free again.
            inner.enter();
            EXPECT_EQ(launcher2->starts, 1);
            inner.exit();
        },
        "environment::nested_scope_rejected", log_path);
}

int teardown_continues_after_failure(const std::string &log_path)
{
    return run_env_worker(
        [&]()
        {
            TempDir dir("env-teardown");
            std::vector<std::string> released;
            auto launcher = std::make_shared<FakeLauncher>();
            EnvironmentSettings settings = make_settings(dir);
            settings.env_extras.push_back(recording_extra("first", released));
            settings.env_extras.push_back(recording_extra("broken", released, true));
            settings.env_extras.push_back(recording_extra("last", released));

            TestEnvironment env(std::move(settings), launcher);
            env.enter();
            try
            {
                env.exit();
                FAIL() << "expected the extra's release error";
            }
            catch (const std::runtime_error &e)
            {
                EXPECT_STREQ(e.what(), "broken release failed");
            }

            EXPECT_EQ(released,
                      (std::vector<std::string>{"last:none", "broken:none", "first:none"}));
            EXPECT_TRUE(launcher->all_terminated());
            EXPECT_FALSE(env.is_active());
            EXPECT_FALSE(TestEnvironment::scope_active());
            EXPECT_FALSE(Logger::instance().has_component_filter(
                ProxyLoggingContext::kDefaultComponent));

            Logger::instance().flush();
            ASSERT_TRUE(
                wait_for_string_in_file(log_path, "Teardown step 'extra #1' failed", 5s));
        },
        "environment::teardown_continues_after_failure", log_path);
}

int extras_see_in_flight_exception(const std::string &log_path)
{
    return run_env_worker(
        [&]()
        {
            TempDir dir("env-inflight");
            std::vector<std::string> released;
            EnvironmentSettings settings = make_settings(dir);
            settings.env_extras.push_back(recording_extra("a", released));
            settings.env_extras.push_back(recording_extra("b", released, true));

            TestEnvironment env(std::move(settings), std::make_shared<FakeLauncher>());
            env.enter();
            const auto in_flight = std::make_exception_ptr(std::runtime_error("test failed"));
            try
            {
                env.exit(in_flight);
                FAIL() << "expected TeardownError";
            }
            catch (const TeardownError &e)
            {
                EXPECT_EQ(e.in_flight(), in_flight);
                ASSERT_EQ(e.failures().size(), 1u);
                EXPECT_EQ(e.failures()[0].step, "extra #1");
                EXPECT_STREQ(e.what(), "Teardown failed in 1 step(s): extra #1: b release "
                                       "failed (while handling: test failed)");
            }
            EXPECT_EQ(released,
                      (std::vector<std::string>{"b:test failed", "a:test failed"}));
        },
        "environment::extras_see_in_flight_exception", log_path);
}

int fleet_start_failure_unwinds(const std::string &log_path)
{
    return run_env_worker(
        [&]()
        {
            TempDir dir("env-fleetfail");
            std::vector<std::string> released;
            auto launcher = std::make_shared<FakeLauncher>();
            launcher->fail = true;
            EnvironmentSettings settings = make_settings(dir);
            settings.env_extras.push_back(recording_extra("extra", released));

            TestEnvironment env(std::move(settings), launcher);
            try
            {
                env.enter();
                FAIL() << "expected FleetStartError";
            }
            catch (const FleetStartError &e)
            {
                EXPECT_STREQ(e.what(), "fleet: server http:8000 failed to start: simulated");
            }
            EXPECT_FALSE(env.is_active());
            EXPECT_FALSE(TestEnvironment::scope_active());
            ASSERT_EQ(released.size(), 1u);
            EXPECT_EQ(released[0],
                      "extra:fleet: server http:8000 failed to start: simulated");
            EXPECT_FALSE(Logger::instance().has_component_filter(
                ProxyLoggingContext::kDefaultComponent));

            // A failed enter leaves the object reusable.
            launcher->fail = false;
            env.enter();
            EXPECT_TRUE(env.is_active());
            env.exit();
        },
        "environment::fleet_start_failure_unwinds", log_path);
}

int interrupts_ignored_for_interactive_debugger(const std::string &log_path)
{
    return run_env_worker(
        [&]()
        {
            TempDir dir("env-sigint");
            ASSERT_FALSE(sigint_ignored());

            // Interactive debugger without debugger support: SIGINT stays default.
            {
                EnvironmentSettings settings = make_settings(dir);
                settings.debug_info = DebugInfo{true, "gdb", {}};
                TestEnvironment env(std::move(settings), std::make_shared<FakeLauncher>());
                env.enter();
                EXPECT_FALSE(env.interrupts_ignored());
                EXPECT_FALSE(sigint_ignored());
                env.exit();
            }

            // A non-boolean flag counts as unsupported.
            {
                EnvironmentSettings settings = make_settings(dir);
                settings.options["supports_debugger"] = "yes";
                settings.debug_info = DebugInfo{true, "gdb", {}};
                TestEnvironment env(std::move(settings), std::make_shared<FakeLauncher>());
                ASSERT_NO_THROW(env.enter());
                EXPECT_FALSE(env.interrupts_ignored());
                EXPECT_FALSE(sigint_ignored());
                env.exit();
            }

            // Supported but not interactive: SIGINT stays default.
            {
                EnvironmentSettings settings = make_settings(dir);
                settings.options["supports_debugger"] = true;
                settings.debug_info = DebugInfo{false, "rr", {}};
                TestEnvironment env(std::move(settings), std::make_shared<FakeLauncher>());
                env.enter();
                EXPECT_FALSE(sigint_ignored());
                env.exit();
            }

            {
                EnvironmentSettings settings = make_settings(dir);
                settings.options["supports_debugger"] = true;
                settings.debug_info = DebugInfo{true, "gdb", {}};
                TestEnvironment env(std::move(settings), std::make_shared<FakeLauncher>());
                env.enter();
                EXPECT_TRUE(env.interrupts_ignored());
                EXPECT_TRUE(sigint_ignored());
                env.exit();
                EXPECT_FALSE(env.interrupts_ignored());
                EXPECT_FALSE(sigint_ignored());
            }
        },
        "environment::interrupts_ignored_for_interactive_debugger", log_path);
}

int scoped_environment_raii(const std::string &log_path)
{
    return run_env_worker(
        [&]()
        {
            TempDir dir("env-scoped");
            auto launcher = std::make_shared<FakeLauncher>();
            TestEnvironment env(make_settings(dir), launcher);
            {
                ScopedEnvironment scope(env);
                EXPECT_TRUE(env.is_active());
                EXPECT_EQ(&scope.environment(), &env);
            }
            EXPECT_FALSE(env.is_active());
            EXPECT_TRUE(launcher->all_terminated());

            // A teardown failure in the destructor is logged, not thrown.
            std::vector<std::string> released;
            EnvironmentSettings settings = make_settings(dir);
            settings.env_extras.push_back(recording_extra("broken", released, true));
            TestEnvironment failing(std::move(settings), std::make_shared<FakeLauncher>());
            {
                ScopedEnvironment scope(failing);
            }
            EXPECT_EQ(released, (std::vector<std::string>{"broken:none"}));
            EXPECT_FALSE(TestEnvironment::scope_active());

            // close() reports it.
            released.clear();
            {
                ScopedEnvironment scope(failing);
                EXPECT_THROW(scope.close(), std::runtime_error);
            }
            EXPECT_EQ(released, (std::vector<std::string>{"broken:none"}));

            Logger::instance().flush();
            ASSERT_TRUE(wait_for_string_in_file(log_path, "TestEnvironment teardown failed", 5s));
        },
        "environment::scoped_environment_raii", log_path);
}

int process_fleet_end_to_end(const std::string &log_path)
{
    return run_env_worker(
        [&]()
        {
            TempDir dir("env-process");
            const fs::path script = dir / "fake-server.sh";
            write_text_file(script, "#!/bin/sh\nexec sleep 30\n");
            ASSERT_EQ(::chmod(script.c_str(), 0755), 0);

            EnvironmentSettings settings = make_settings(dir);
            LaunchSpec spec{script, {"--flag"}, dir / "work"};
            auto launcher = std::make_shared<ProcessFleetLauncher>(spec);
            TestEnvironment env(std::move(settings), launcher);

            env.enter();
            EXPECT_EQ(fleet_size(env.fleet()), 7u);
            std::vector<std::shared_ptr<ServerHandle>> handles;
            for (const auto &[scheme, servers] : env.fleet())
            {
                for (const auto &entry : servers)
                {
                    EXPECT_GT(entry.handle->pid(), 0);
                    EXPECT_TRUE(entry.handle->is_alive()) << scheme << ":" << entry.port;
                    handles.push_back(entry.handle);
                }
            }
            EXPECT_EQ(env.ensure_started(), 1);

            std::string config_json;
            ASSERT_TRUE(read_file_contents((dir / "work" / "config.json").string(), config_json));
            const auto config = nlohmann::json::parse(config_json);
            EXPECT_EQ(config["ports"]["http"], nlohmann::json({8000, 8001}));
            EXPECT_EQ(config["check_subdomains"], false);
            std::string routes_json;
            ASSERT_TRUE(read_file_contents((dir / "work" / "routes.json").string(), routes_json));
            EXPECT_EQ(nlohmann::json::parse(routes_json).size(), env.routes().size());

            env.exit();
            for (const auto &h : handles)
            {
                EXPECT_FALSE(h->is_alive());
            }
        },
        "environment::process_fleet_end_to_end", log_path);
}

} // namespace environment
} // namespace servefleet::tests::worker

namespace
{
struct EnvironmentWorkerRegistrar
{
    EnvironmentWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos || mode.substr(0, dot) != "environment")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                if (argc < 3)
                {
                    fmt::print(stderr, "ERROR: environment scenario '{}' needs a log path\n",
                               scenario);
                    return 1;
                }
                using namespace servefleet::tests::worker::environment;
                const std::string log_path = argv[2];
                if (scenario == "enter_and_exit")
                    return enter_and_exit(log_path);
                if (scenario == "nested_scope_rejected")
                    return nested_scope_rejected(log_path);
                if (scenario == "teardown_continues_after_failure")
                    return teardown_continues_after_failure(log_path);
                if (scenario == "extras_see_in_flight_exception")
                    return extras_see_in_flight_exception(log_path);
                if (scenario == "fleet_start_failure_unwinds")
                    return fleet_start_failure_unwinds(log_path);
                if (scenario == "interrupts_ignored_for_interactive_debugger")
                    return interrupts_ignored_for_interactive_debugger(log_path);
                if (scenario == "scoped_environment_raii")
                    return scoped_environment_raii(log_path);
                if (scenario == "process_fleet_end_to_end")
                    return process_fleet_end_to_end(log_path);
                fmt::print(stderr, "ERROR: Unknown environment scenario '{}'\n", scenario);
                return 1;
            });
    }
};
static EnvironmentWorkerRegistrar g_environment_registrar;
} // namespace
