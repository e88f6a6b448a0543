#include "sfl_environment.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include <fmt/format.h>

namespace
{

using namespace servefleet;

std::atomic<bool> g_stop_requested{false}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void signal_handler(int /*sig*/)
{
    g_stop_requested.store(true);
}

struct CliArgs
{
    std::string config_path;
    std::string log_file;
    bool wait_ready = false;
    bool verbose = false;
};

void print_usage(std::FILE *out, const std::string &prog)
{
    fmt::print(out,
               "usage: {0} --config FILE [--wait-ready] [--log-file FILE] [--verbose]\n"
               "       {0} --version | --help\n"
               "\n"
               "  --config FILE    environment description to start (required)\n"
               "  --wait-ready     block until every configured port accepts connections\n"
               "  --log-file FILE  send log records to FILE rather than stderr\n"
               "  --verbose        lower the log threshold to debug\n",
               prog);
}

// Returns the exit code for an early exit, or std::nullopt to keep going.
std::optional<int> parse_args(int argc, char *argv[], CliArgs &args)
{
    const std::string prog = argc > 0 ? argv[0] : "servefleet";
    auto fail = [&prog](const std::string &why)
    {
        fmt::print(stderr, "{}: {}\n", prog, why);
        print_usage(stderr, prog);
        return 1;
    };

    int i = 1;
    auto value_of = [&](std::string &out)
    {
        if (i + 1 >= argc || argv[i + 1][0] == '\0')
            return false;
        out = argv[++i];
        return true;
    };

    for (; i < argc; ++i)
    {
        const std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(stdout, prog);
            return 0;
        }
        if (arg == "--version")
        {
            fmt::print("servefleet {}\n", platform::get_version_string());
            return 0;
        }
        if (arg == "--wait-ready")
            args.wait_ready = true;
        else if (arg == "--verbose")
            args.verbose = true;
        else if (arg == "--config" || arg == "--log-file")
        {
            std::string &target = arg == "--config" ? args.config_path : args.log_file;
            if (!value_of(target))
                return fail(fmt::format("{} needs a file name", arg));
        }
        else
            return fail(fmt::format("unrecognised option '{}'", arg));
    }
    if (args.config_path.empty())
        return fail("no --config given");
    return std::nullopt;
}

} // anonymous namespace

int main(int argc, char *argv[])
{
    CliArgs args;
    if (const auto early = parse_args(argc, argv, args))
        return *early;

    // ── Load config (before any module starts, so errors go straight to stderr) ──
    env::EnvironmentFile file;
    try
    {
        file = env::load_environment_file(args.config_path);
    }
    catch (const env::ConfigurationError &e)
    {
        fmt::print(stderr, "servefleet: {}\n", e.what());
        return 1;
    }

    utils::LifecycleGuard lifecycle(utils::MakeModDefList(utils::Logger::GetLifecycleModule(),
                                                          ipc::GetZMQContextModule()));

    auto &logger = utils::Logger::instance();
    if (args.verbose)
    {
        logger.set_level(utils::Logger::Level::L_DEBUG);
    }
    if (!args.log_file.empty() && !logger.set_logfile(args.log_file))
    {
        fmt::print(stderr, "servefleet: cannot open log file '{}'\n", args.log_file);
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    env::TestEnvironment environment(
        std::move(file.settings),
        std::make_shared<env::ProcessFleetLauncher>(std::move(file.launch)));

    try
    {
        environment.enter();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("servefleet: environment failed to start: {}", e.what());
        return 1;
    }

    int rc = 0;
    try
    {
        if (args.wait_ready)
        {
            const int polls = environment.ensure_started();
            LOGGER_INFO("servefleet: fleet ready after {} poll(s)", polls);
        }

        LOGGER_INFO("servefleet: running; log endpoint {}, stash {}, cache {}",
                    environment.log_endpoint(), environment.stash_endpoint(),
                    environment.cache_endpoint());
        while (!g_stop_requested.load())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        LOGGER_INFO("servefleet: shutdown requested");
    }
    catch (const env::ReadinessError &e)
    {
        LOGGER_ERROR("servefleet: {}", e.what());
        rc = 1;
    }

    try
    {
        environment.exit();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("servefleet: teardown failed: {}", e.what());
        rc = 1;
    }
    return rc;
}
