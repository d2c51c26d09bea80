#include "memboot/service.hpp"

#include <spdlog/spdlog.h>

namespace memboot {

std::vector<std::string> prewarm_command(const InstallConfig& config, const ToolLocations& tools) {
    std::vector<std::string> argv;
    if (config.prewarm.hard_timeout.count() > 0 && tools.resolve("timeout")) {
        argv = {"timeout", std::to_string(config.prewarm.hard_timeout.count())};
    }
    argv.insert(argv.end(), config.prewarm.command.begin(), config.prewarm.command.end());
    return argv;
}

StepResult run_prewarm(const InstallConfig& config, const ToolLocations& tools) {
    if (!config.prewarm.enabled) {
        return StepResult::skipped("Prewarm disabled");
    }

    if (config.prewarm.command.empty() || !tools.resolve(config.prewarm.command.front())) {
        return StepResult::warning(ErrorKind::PrewarmFailure,
                                   "Prewarm skipped: command not found: " +
                                       (config.prewarm.command.empty() ? std::string("<empty>")
                                                                       : config.prewarm.command.front()));
    }

    spdlog::info("Pre-warming vector database (downloading embedding models)...");

    CommandSpec spec;
    spec.argv = prewarm_command(config, tools);

    auto run = run_bounded(spec, tools, config.prewarm.grace);
    if (!run.ok) {
        return StepResult::warning(ErrorKind::PrewarmFailure, "Prewarm skipped: " + run.error);
    }

    if (run.exited && run.exit_code != 0) {
        return StepResult::warning(ErrorKind::PrewarmFailure,
                                   "Prewarm exited with status " + std::to_string(run.exit_code) +
                                       "; models will download on first use");
    }

    StepResult result = StepResult::ok("Vector database models cached");
    if (run.terminated) {
        result.details.push_back("prewarm process stopped after " +
                                 std::to_string(config.prewarm.grace.count()) + " ms");
    }
    return result;
}

} // namespace memboot
