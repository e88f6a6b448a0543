#pragma once
/**
 * @file sfl_environment.hpp
 * @brief Layer 3: the test environment built on sfl_service.
 *
 * Configuration assembly, the cross-process logging proxy, stash and cache services, the
 * server fleet, route table, readiness poller and the TestEnvironment lifecycle controller.
 */
#include "sfl_service.hpp"

#include "environment/errors.hpp"
#include "environment/effective_config.hpp"
#include "environment/config_assembler.hpp"
#include "environment/proxy_logging.hpp"
#include "environment/shared_store.hpp"
#include "environment/route_builder.hpp"
#include "environment/server_fleet.hpp"
#include "environment/readiness.hpp"
#include "environment/release_stack.hpp"
#include "environment/test_environment.hpp"
#include "environment/environment_file.hpp"
