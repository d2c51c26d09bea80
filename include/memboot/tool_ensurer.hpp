#pragma once

#include "memboot/config.hpp"
#include "memboot/exec.hpp"
#include "memboot/types.hpp"

#include <optional>
#include <string>

namespace memboot {

// ============================================================================
// Tool Ensurer
// ============================================================================

// First line of the tool's version output, or nullopt if the probe fails
std::optional<std::string> probe_tool_version(const ToolSpec& tool, const ToolLocations& tools);

// Make sure `tool.probe` resolves. A missing tool is installed once through
// its install script and its path segment is prepended to `tools` so later
// steps see it in this run. Failure is MissingTool. The install script's
// stdout goes to stderr when `stdout_to_stderr` is set.
StepResult ensure_tool(const ToolSpec& tool, ToolLocations& tools, bool stdout_to_stderr = false);

} // namespace memboot
