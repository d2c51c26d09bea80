#include "memboot/pipeline.hpp"
#include "memboot/build_sync.hpp"
#include "memboot/layout.hpp"
#include "memboot/registry.hpp"
#include "memboot/service.hpp"
#include "memboot/shell_profile.hpp"
#include "memboot/tool_ensurer.hpp"
#include "memboot/verifier.hpp"

namespace memboot {

std::string tool_step_name(const ToolSpec& tool) {
    return "tool:" + tool.name;
}

Orchestrator make_install_pipeline(const InstallConfig& config) {
    Orchestrator pipeline;

    for (const auto& tool : config.tools) {
        pipeline.add_step(tool_step_name(tool), FailurePolicy::Fatal,
            [tool](InstallContext& ctx) {
                return ensure_tool(tool, ctx.tools, ctx.child_stdout_to_stderr);
            });
    }

    pipeline.add_step(STEP_SHELL_PROFILES, FailurePolicy::Advisory, [](InstallContext& ctx) {
        const auto& shell = ctx.config.shell;
        return configure_shell_profiles(shell.profiles, shell.marker, shell.line);
    });

    pipeline.add_step(STEP_DIRECTORIES, FailurePolicy::Fatal, [](InstallContext& ctx) {
        return provision_directories(ctx.config.required_directories());
    });

    pipeline.add_step(STEP_REGISTRY, FailurePolicy::Advisory, [](InstallContext& ctx) {
        return register_marketplace(ctx.config);
    });

    pipeline.add_step(STEP_BUILD_SYNC, FailurePolicy::Fatal, [](InstallContext& ctx) {
        return build_and_sync(ctx.config, ctx.tools, ctx.child_stdout_to_stderr);
    });

    pipeline.add_step(STEP_PREWARM, FailurePolicy::Advisory, [](InstallContext& ctx) {
        return run_prewarm(ctx.config, ctx.tools);
    });

    pipeline.add_step(STEP_SERVICE, FailurePolicy::Advisory, [](InstallContext& ctx) {
        if (ctx.health_probe) {
            return launch_service(ctx.config, ctx.tools, *ctx.health_probe);
        }
        HttpHealthProbe probe(ctx.config.health_url(), ctx.config.service.request_timeout);
        return launch_service(ctx.config, ctx.tools, probe);
    });

    pipeline.add_step(STEP_VERIFY, FailurePolicy::Fatal, [](InstallContext& ctx) {
        ctx.verification = verify_installation(ctx.config, ctx.tools);
        return verification_step_result(*ctx.verification);
    });

    return pipeline;
}

InstallContext make_install_context(const InstallConfig& config) {
    InstallContext ctx;
    ctx.config = config;
    ctx.tools = ToolLocations::from_environment();
    return ctx;
}

} // namespace memboot
