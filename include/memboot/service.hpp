#pragma once

#include "memboot/config.hpp"
#include "memboot/exec.hpp"
#include "memboot/health.hpp"
#include "memboot/types.hpp"

namespace memboot {

// ============================================================================
// Worker Service
// ============================================================================

// Start the worker detached from this process and poll `probe` until it
// reports ok or the retry deadline passes. A worker that is already
// healthy is not started again. Never fails: an unreachable worker is a
// ServiceUnreachable warning pointing at the log directory.
StepResult launch_service(const InstallConfig& config,
                          const ToolLocations& tools,
                          HealthProbe& probe);

// ============================================================================
// Prewarm
// ============================================================================

// Argument vector actually run for the prewarm job: the configured command,
// wrapped in `timeout <hard_timeout>` when that utility resolves.
std::vector<std::string> prewarm_command(const InstallConfig& config, const ToolLocations& tools);

// Run the vector-database engine once against the real data directory so
// it downloads its models, then terminate it after the grace period.
// Best effort: Ok or PrewarmFailure warning, never Failed.
StepResult run_prewarm(const InstallConfig& config, const ToolLocations& tools);

} // namespace memboot
