#pragma once

#include <spdlog/spdlog.h>

namespace relay::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// Installs the async default logger configured from the --log_* flags.
/// Safe to call more than once; later calls are no-ops until shutdown().
void init();

/// Flushes and drops every registered logger. Call once at process exit.
void shutdown();

}  // namespace relay::log
