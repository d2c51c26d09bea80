/**
 * memboot CLI - Entry Point
 *
 * Bootstrap installer for the claude-mem plugin.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

namespace memboot::cli {

namespace {

void print_guidance(const InstallConfig& config, Output& out) {
    const auto& id = config.identity;
    out.text("");
    out.text("Next steps:");
    out.text("  1. Restart your terminal (or: source ~/.bashrc)");
    out.text("  2. Run: claude /plugin install " + id.vendor + "/" + id.plugin_name);
    out.text("  3. Restart Claude Code");
    out.text("");
    out.text("Web viewer: " + config.web_url());
}

void report_step(const StepResult& result, Output& out) {
    switch (result.outcome) {
        case StepOutcome::Ok:
        case StepOutcome::AlreadySatisfied:
        case StepOutcome::Skipped:
            out.success(result.message);
            break;
        case StepOutcome::Warning:
            out.warning(result.message);
            break;
        case StepOutcome::Failed:
            out.error(result.message);
            break;
    }
    if (result.outcome != StepOutcome::Failed) {
        for (const auto& line : result.details) out.note(line);
    }
}

} // namespace

int run_installer(const CliOptions& opts) {
    Output out(opts);

    auto home = get_env("HOME");
    if (!home || home->empty()) {
        return out.fail("HOME is not set");
    }

    std::string source_dir = resolve_source_dir(opts.source);
    if (!is_directory(source_dir)) {
        return out.fail("source directory not found: " + source_dir);
    }

    InstallConfig config;
    std::string config_file = resolve_config_file(opts.config_file);
    if (config_file.empty()) {
        config = make_default_config(*home, source_dir);
    } else {
        spdlog::debug("loading config overrides from {}", config_file);
        auto loaded = load_install_config(config_file, *home, source_dir);
        if (!loaded.ok) {
            return out.fail(loaded.error);
        }
        for (const auto& w : loaded.warnings) out.warning(w);
        config = std::move(loaded.config);
    }

    out.header("Claude-mem Installer");

    auto pipeline = make_install_pipeline(config);
    auto ctx = make_install_context(config);
    ctx.child_stdout_to_stderr = out.json_mode();

    StepObserver observer;
    observer.on_start = [&out](const InstallationStep& step) {
        out.progress(step_title(step.name()));
    };
    observer.on_finish = [&out](const InstallationStep&, const StepResult& result) {
        report_step(result, out);
    };

    auto report = pipeline.run(ctx, &observer);

    if (out.json_mode()) {
        out.json(report_to_json(report));
        return report.exit_code();
    }

    if (report.state == RunState::Aborted) {
        out.error("Installation aborted at " + report.aborted_step + ": " + report.abort_error);
        return report.exit_code();
    }

    auto advisories = report.advisories();
    out.text("");
    if (advisories.empty()) {
        out.success("Installation complete!");
    } else {
        out.success("Installation complete with " + std::to_string(advisories.size()) +
                    " warning(s)");
    }
    print_guidance(config, out);

    return report.exit_code();
}

} // namespace memboot::cli

int main(int argc, char** argv) {
    using namespace memboot::cli;

    CLI::App app{"memboot - claude-mem plugin installer"};
    app.set_version_flag("-V,--version", MEMBOOT_VERSION);

    CliOptions opts;

    app.add_option("--source", opts.source, "Plugin project directory (default: current directory)");
    app.add_option("--config", opts.config_file, "JSON config overrides (default: $MEMBOOT_CONFIG)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? 0 : EXIT_CONFIG_ERROR;
    }

    configure_logging(opts);

    return run_installer(opts);
}
