#pragma once
// Layer 2: the lifecycle manager and the process-wide services it starts.
#include "sfl_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/zmq_context.hpp"
