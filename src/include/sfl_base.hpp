#pragma once
// Layer 1: formatting helpers, panic/debug output, scope guards and module definitions.
#include "sfl_platform.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/module_def.hpp"
