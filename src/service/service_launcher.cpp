#include "memboot/service.hpp"

#include <spdlog/spdlog.h>

namespace memboot {

StepResult launch_service(const InstallConfig& config,
                          const ToolLocations& tools,
                          HealthProbe& probe) {
    const std::string port = std::to_string(config.service.port);
    const std::string log_hint = "check logs at " + config.paths.logs_dir + "/";

    auto existing = probe.check();
    if (existing.ok) {
        return StepResult::already_satisfied("Worker already running on port " + port);
    }

    spdlog::info("Starting worker...");

    CommandSpec spec;
    spec.argv = config.service.command;
    auto spawned = spawn_detached(spec, tools);
    if (!spawned.ok) {
        return StepResult::warning(ErrorKind::ServiceUnreachable,
                                   "Worker could not be started (" + spawned.error + ") - " + log_hint);
    }
    spdlog::debug("worker spawned as pid {}", spawned.pid);

    auto wait = wait_for_healthy(probe, RetryPolicy::from_config(config));
    if (!wait.healthy) {
        StepResult result = StepResult::warning(ErrorKind::ServiceUnreachable,
                                                "Worker may not have started - " + log_hint);
        if (!wait.last_error.empty()) {
            result.details.push_back("last health check: " + wait.last_error);
        }
        return result;
    }

    StepResult result = StepResult::ok("Worker running on port " + port);
    result.details.push_back("healthy after " + std::to_string(wait.attempts) + " check(s), " +
                             std::to_string(wait.elapsed.count()) + " ms");
    return result;
}

} // namespace memboot
