#include "memboot/tool_ensurer.hpp"

#include <spdlog/spdlog.h>

namespace memboot {

namespace {

std::string first_line(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    size_t end = text.find_first_of("\r\n", start);
    std::string line = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
    while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) line.pop_back();
    return line;
}

std::string describe(const ToolSpec& tool, const ToolLocations& tools) {
    auto version = probe_tool_version(tool, tools);
    return version ? tool.name + " " + *version : tool.name + " (version unknown)";
}

} // namespace

std::optional<std::string> probe_tool_version(const ToolSpec& tool, const ToolLocations& tools) {
    if (tool.version_command.empty()) return std::nullopt;

    CommandSpec spec;
    spec.argv = tool.version_command;
    spec.capture_output = true;

    auto result = run_command(spec, tools);
    if (!result.succeeded()) {
        spdlog::debug("version probe for {} failed: {}", tool.name,
                      result.error.empty() ? "exit " + std::to_string(result.exit_code) : result.error);
        return std::nullopt;
    }

    auto line = first_line(result.output);
    if (line.empty()) return std::nullopt;
    return line;
}

StepResult ensure_tool(const ToolSpec& tool, ToolLocations& tools, bool stdout_to_stderr) {
    if (auto path = tools.resolve(tool.probe)) {
        spdlog::debug("{} resolved at {}", tool.probe, *path);
        return StepResult::already_satisfied(describe(tool, tools) + " already installed");
    }

    if (tool.install_script.empty()) {
        return StepResult::failed(ErrorKind::MissingTool,
                                  tool.probe + " not found and no install procedure is configured");
    }

    spdlog::info("Installing {}...", tool.name);

    CommandSpec spec;
    spec.argv = {"/bin/sh", "-c", tool.install_script};
    spec.stdout_to_stderr = stdout_to_stderr;
    auto result = run_command(spec, tools);
    if (!result.ok) {
        return StepResult::failed(ErrorKind::MissingTool,
                                  "install of " + tool.name + " failed: " + result.error);
    }
    if (result.exit_code != 0) {
        return StepResult::failed(ErrorKind::MissingTool,
                                  "install of " + tool.name + " exited with status " +
                                      std::to_string(result.exit_code));
    }

    if (!tool.path_segment.empty()) {
        tools.prepend(tool.path_segment);
    }

    if (!tools.resolve(tool.probe)) {
        return StepResult::failed(ErrorKind::MissingTool,
                                  tool.probe + " still not found after install (looked in " +
                                      tools.search_path() + ")");
    }

    return StepResult::ok(describe(tool, tools) + " installed");
}

} // namespace memboot
