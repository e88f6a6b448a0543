#include "test_entrypoint.h"

#include <string_view>
#include <vector>

#include <gtest/gtest.h>

std::string g_self_exe_path;

namespace
{
std::vector<WorkerDispatchFn> &dispatchers()
{
    static std::vector<WorkerDispatchFn> registered;
    return registered;
}

// "area.scenario" but not a gtest flag such as --gtest_filter=Suite.Name.
bool is_worker_mode(std::string_view arg)
{
    return !arg.empty() && arg.front() != '-' && arg.find('.') != std::string_view::npos;
}
} // namespace

void register_worker_dispatcher(WorkerDispatchFn fn)
{
    dispatchers().push_back(fn);
}

// Runs either one worker scenario or the whole suite. The suite itself starts no lifecycle
// module; tests that need one spawn a worker.
int main(int argc, char **argv)
{
    if (argc > 0)
        g_self_exe_path = argv[0];

    if (argc > 1 && is_worker_mode(argv[1]))
    {
        for (WorkerDispatchFn fn : dispatchers())
        {
            const int rc = fn(argc, argv);
            if (rc != -1)
                return rc;
        }
    }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
