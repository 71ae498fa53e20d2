#pragma once

// Main header file for the reachability library
// Include this file to access all connectivity checking functionality

#include "types.hpp"
#include "exceptions.hpp"
#include "logger.hpp"
#include "console_logger.hpp"
#include "endpoint.hpp"
#include "expectation.hpp"
#include "outcome_matcher.hpp"
#include "unactivated_registry.hpp"
#include "probe_dispatcher.hpp"
#include "checker.hpp"
#include "probe_command.hpp"
#include "result_codec.hpp"
#include "workload.hpp"
#include "conn_config.hpp"

namespace reachability {

// Checker logging through the console
using default_checker = checker<console_logger>;

} // namespace reachability
