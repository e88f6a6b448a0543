#pragma once
/**
 * @file test_entrypoint.h
 * @brief Worker dispatch for test binaries that re-execute themselves.
 *
 * A test binary started as `<exe> area.scenario [args...]` runs one worker scenario instead of
 * the GoogleTest suite. Worker files register a dispatcher from a static initializer.
 */
#include <string>

/// argv[0] of the running test binary.
extern std::string g_self_exe_path;

/// Returns the worker's exit code, or -1 when argv[1] names a scenario it does not own.
using WorkerDispatchFn = int (*)(int argc, char **argv);

void register_worker_dispatcher(WorkerDispatchFn fn);
