/**
 * @file logger_workers.cpp
 * @brief Logger scenarios. All but one start the Logger module and log to the file named
 *        by their first argument.
 */
#include "logger_workers.h"
#include "sfl_service.hpp"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"
#include "gtest/gtest.h"

#include <map>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace servefleet::tests::helper;
using servefleet::utils::Logger;
using Level = servefleet::utils::Logger::Level;
using namespace std::chrono_literals;

namespace servefleet::tests::worker::logger
{

namespace
{
constexpr const char *kServer = "servefleet.server";

template <typename Fn> int with_logfile(const std::string &log_path, const char *name, Fn fn)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            fn(Logger::instance());
        },
        name, Logger::GetLifecycleModule());
}

std::string flushed_contents(const std::string &log_path)
{
    Logger::instance().flush();
    std::string text;
    EXPECT_TRUE(read_file_contents(log_path, text)) << log_path;
    return text;
}

servefleet::utils::Logger::ComponentFilter errors_as_warnings()
{
    return servefleet::utils::make_level_rewriter(
        servefleet::utils::make_level_filter(Level::L_INFO), {Level::L_ERROR}, Level::L_WARNING);
}
} // namespace

int levels_and_labels(const std::string &log_path)
{
    return with_logfile(log_path, "logger::levels_and_labels",
                        [&](Logger &log)
                        {
                            log.set_level(Level::L_TRACE);
                            LOGGER_TRACE("t {}", 1);
                            LOGGER_DEBUG("d {}", 2);
                            LOGGER_INFO("i {}", 3);
                            LOGGER_WARN("w {}", 4);
                            LOGGER_ERROR("e {}", 5);
                            LOGGER_CRITICAL("c {}", 6);
                            LOGGER_SYSTEM("s {}", 7);

                            const std::string text = flushed_contents(log_path);
                            EXPECT_EQ(count_lines(text, "[TRACE ]"), 1u);
                            EXPECT_EQ(count_lines(text, "[DEBUG ]"), 1u);
                            EXPECT_EQ(count_lines(text, "[INFO  ]"), 1u);
                            EXPECT_EQ(count_lines(text, "[WARN  ]"), 1u);
                            EXPECT_EQ(count_lines(text, "[ERROR ]"), 1u);
                            EXPECT_EQ(count_lines(text, "[CRIT  ]"), 1u);
                            EXPECT_EQ(count_lines(text, "[SYSTEM]"), 1u);
                            EXPECT_NE(text.find("] e 5\n"), std::string::npos);
                            EXPECT_EQ(count_lines(text, "[PID:"), 7u);
                        });
}

int global_threshold(const std::string &log_path)
{
    return with_logfile(log_path, "logger::global_threshold",
                        [&](Logger &log)
                        {
                            EXPECT_EQ(log.level(), Level::L_INFO);
                            LOGGER_DEBUG("below default");
                            log.set_level(Level::L_WARNING);
                            LOGGER_INFO("below warning");
                            LOGGER_WARN("at warning");
                            LOGGER_SYSTEM("system always passes");

                            const std::string text = flushed_contents(log_path);
                            EXPECT_EQ(text.find("below"), std::string::npos);
                            EXPECT_NE(text.find("at warning"), std::string::npos);
                            EXPECT_NE(text.find("system always passes"), std::string::npos);
                        });
}

int concurrent_writers(const std::string &log_path)
{
    return with_logfile(log_path, "logger::concurrent_writers",
                        [&](Logger &)
                        {
                            constexpr int kThreads = 6;
                            constexpr int kEach = 250;
                            std::vector<std::thread> writers;
                            for (int t = 0; t < kThreads; ++t)
                            {
                                writers.emplace_back(
                                    [t]()
                                    {
                                        for (int n = 0; n < kEach; ++n)
                                            LOGGER_INFO("writer {} line {}", t, n);
                                    });
                            }
                            for (auto &w : writers)
                                w.join();

                            const std::string text = flushed_contents(log_path);
                            EXPECT_EQ(count_lines(text, "writer "),
                                      static_cast<size_t>(kThreads * kEach));
                            EXPECT_EQ(count_lines(text, "writer 3 line 249"), 1u);
                        });
}

int flush_drains_queue(const std::string &log_path)
{
    return with_logfile(log_path, "logger::flush_drains_queue",
                        [&](Logger &)
                        {
                            for (int n = 0; n < 2000; ++n)
                                LOGGER_INFO("queued {}", n);
                            // No sleep: flush alone must make every record visible.
                            const std::string text = flushed_contents(log_path);
                            EXPECT_EQ(count_lines(text, "queued "), 2000u);
                        });
}

int finalize_drains_and_closes(const std::string &log_path)
{
    return with_logfile(log_path, "logger::finalize_drains_and_closes",
                        [&](Logger &log)
                        {
                            for (int n = 0; n < 500; ++n)
                                LOGGER_INFO("pending {}", n);

                            std::vector<std::thread> closers;
                            for (int t = 0; t < 4; ++t)
                                closers.emplace_back([]() { servefleet::utils::FinalizeApp(); });
                            for (auto &c : closers)
                                c.join();

                            LOGGER_ERROR("after shutdown");
                            EXPECT_FALSE(log.write_record(kServer, Level::L_CRITICAL, "late"));
                            log.flush(); // Returns immediately once stopped.

                            std::string text;
                            ASSERT_TRUE(read_file_contents(log_path, text));
                            EXPECT_EQ(count_lines(text, "pending "), 500u);
                            EXPECT_EQ(count_lines(text, "Logger is shutting down."), 1u);
                            EXPECT_EQ(text.find("after shutdown"), std::string::npos);
                            EXPECT_EQ(text.find("late"), std::string::npos);
                        });
}

int unwritable_logfile(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            Logger &log = Logger::instance();
            EXPECT_FALSE(log.set_logfile("/nonexistent-servefleet-dir/out.log"));
            // The console sink stays in place.
            LOGGER_INFO("still on console");
            ASSERT_TRUE(log.set_logfile(log_path));
            LOGGER_INFO("now in the file");
            const std::string text = flushed_contents(log_path);
            EXPECT_NE(text.find("now in the file"), std::string::npos);
            EXPECT_EQ(text.find("still on console"), std::string::npos);
        },
        "logger::unwritable_logfile", Logger::GetLifecycleModule());
}

int component_filter_rewrites(const std::string &log_path)
{
    return with_logfile(log_path, "logger::component_filter_rewrites",
                        [&](Logger &log)
                        {
                            log.set_level(Level::L_TRACE);
                            const auto handle = log.push_component_filter(kServer, errors_as_warnings());
                            EXPECT_NE(handle, 0u);
                            EXPECT_TRUE(log.has_component_filter(kServer));

                            EXPECT_TRUE(log.write_record(kServer, Level::L_INFO, "listening"));
                            EXPECT_TRUE(log.write_record(kServer, Level::L_ERROR, "bind failed"));
                            EXPECT_TRUE(log.write_record(kServer, Level::L_CRITICAL, "crashed"));
                            EXPECT_FALSE(log.write_record(kServer, Level::L_DEBUG, "noise"));
                            EXPECT_TRUE(log.write_record("servefleet.other", Level::L_DEBUG, "unfiltered"));

                            EXPECT_TRUE(log.pop_component_filter(kServer, handle));
                            EXPECT_FALSE(log.has_component_filter(kServer));
                            EXPECT_TRUE(log.write_record(kServer, Level::L_ERROR, "raw error"));

                            const std::string text = flushed_contents(log_path);
                            EXPECT_EQ(count_lines(text, "[INFO  ] ", std::nullopt), 1u);
                            EXPECT_EQ(count_lines(text, "bind failed"), 1u);
                            EXPECT_EQ(count_lines(text, "bind failed", "[WARN  ]"), 0u);
                            EXPECT_EQ(count_lines(text, "[CRIT  ]"), 1u);
                            EXPECT_EQ(text.find("noise"), std::string::npos);
                            EXPECT_NE(text.find("[servefleet.other] unfiltered"), std::string::npos);
                            EXPECT_EQ(count_lines(text, "[ERROR ]"), 1u);
                            EXPECT_EQ(count_lines(text, "raw error", "[ERROR ]"), 0u);
                            EXPECT_EQ(count_lines(text, "raw error"), 1u);
                        });
}

int layered_component_filters(const std::string &log_path)
{
    return with_logfile(log_path, "logger::layered_component_filters",
                        [&](Logger &log)
                        {
                            log.set_level(Level::L_TRACE);
                            const auto outer = log.push_component_filter(kServer, errors_as_warnings());
                            const auto inner = log.push_component_filter(
                                kServer, servefleet::utils::make_level_filter(Level::L_CRITICAL));
                            EXPECT_NE(outer, inner);

                            // The most recent filter is the active one.
                            EXPECT_FALSE(log.write_record(kServer, Level::L_ERROR, "dropped by inner"));

                            // Removing the inner entry leaves the outer one in force.
                            EXPECT_TRUE(log.pop_component_filter(kServer, inner));
                            EXPECT_FALSE(log.pop_component_filter(kServer, inner));
                            ASSERT_TRUE(log.has_component_filter(kServer));
                            EXPECT_TRUE(log.write_record(kServer, Level::L_ERROR, "outer demotes"));

                            // Removing out of order keeps the newer entry.
                            const auto newer = log.push_component_filter(
                                kServer, servefleet::utils::make_level_filter(Level::L_TRACE));
                            EXPECT_TRUE(log.pop_component_filter(kServer, outer));
                            EXPECT_TRUE(log.write_record(kServer, Level::L_ERROR, "newer passes"));
                            EXPECT_TRUE(log.pop_component_filter(kServer, newer));
                            EXPECT_FALSE(log.has_component_filter(kServer));

                            EXPECT_FALSE(log.pop_component_filter(kServer, 0));
                            EXPECT_FALSE(log.pop_component_filter("servefleet.nobody", outer));
                            EXPECT_THROW(static_cast<void>(log.push_component_filter(kServer, {})),
                                         std::invalid_argument);

                            const std::string text = flushed_contents(log_path);
                            EXPECT_EQ(text.find("dropped by inner"), std::string::npos);
                            EXPECT_EQ(count_lines(text, "outer demotes", "[WARN  ]"), 0u);
                            EXPECT_EQ(count_lines(text, "outer demotes"), 1u);
                            EXPECT_EQ(count_lines(text, "newer passes", "[ERROR ]"), 0u);
                            EXPECT_EQ(count_lines(text, "newer passes"), 1u);
                        });
}

int filtered_record_meets_threshold(const std::string &log_path)
{
    return with_logfile(log_path, "logger::filtered_record_meets_threshold",
                        [&](Logger &log)
                        {
                            log.set_level(Level::L_ERROR);
                            const auto handle = log.push_component_filter(kServer, errors_as_warnings());
                            // Demoted to a warning first, then dropped by the threshold.
                            EXPECT_FALSE(log.write_record(kServer, Level::L_ERROR, "demoted"));
                            EXPECT_TRUE(log.write_record(kServer, Level::L_CRITICAL, "kept"));
                            EXPECT_TRUE(log.pop_component_filter(kServer, handle));

                            const std::string text = flushed_contents(log_path);
                            EXPECT_EQ(text.find("demoted"), std::string::npos);
                            EXPECT_EQ(count_lines(text, "[CRIT  ]", std::nullopt), 1u);
                        });
}

int shared_file_writer(const std::string &log_path, const std::string &tag, int count)
{
    return with_logfile(log_path, "logger::shared_file_writer",
                        [&](Logger &)
                        {
                            for (int n = 0; n < count; ++n)
                                LOGGER_INFO("{} #{} 0123456789abcdefghijklmnopqrstuvwxyz", tag, n);
                        });
}

int configure_before_start()
{
    // No lifecycle: this call is fatal.
    static_cast<void>(Logger::instance().push_component_filter(
        kServer, servefleet::utils::make_level_filter(Level::L_INFO)));
    return 0;
}

} // namespace servefleet::tests::worker::logger

namespace
{
int dispatch_logger(int argc, char **argv)
{
    using namespace servefleet::tests::worker::logger;
    static const std::map<std::string, int (*)(const std::string &), std::less<>> with_path = {
        {"logger.levels_and_labels", levels_and_labels},
        {"logger.global_threshold", global_threshold},
        {"logger.concurrent_writers", concurrent_writers},
        {"logger.flush_drains_queue", flush_drains_queue},
        {"logger.finalize_drains_and_closes", finalize_drains_and_closes},
        {"logger.unwritable_logfile", unwritable_logfile},
        {"logger.component_filter_rewrites", component_filter_rewrites},
        {"logger.layered_component_filters", layered_component_filters},
        {"logger.filtered_record_meets_threshold", filtered_record_meets_threshold},
    };
    if (argc < 2)
        return -1;
    const std::string_view mode = argv[1];
    if (mode == "logger.configure_before_start")
        return configure_before_start();
    if (mode == "logger.shared_file_writer" && argc > 4)
        return shared_file_writer(argv[2], argv[3], std::stoi(argv[4]));
    const auto it = with_path.find(mode);
    if (it == with_path.end() || argc < 3)
        return -1;
    return it->second(argv[2]);
}

[[maybe_unused]] const bool g_logger_registered = (register_worker_dispatcher(dispatch_logger), true);
} // namespace
