#pragma once

#include "memboot/config.hpp"
#include "memboot/orchestrator.hpp"

namespace memboot {

// Step names as they appear in reports
constexpr const char* STEP_SHELL_PROFILES = "shell-profiles";
constexpr const char* STEP_DIRECTORIES = "directories";
constexpr const char* STEP_REGISTRY = "registry";
constexpr const char* STEP_BUILD_SYNC = "build-sync";
constexpr const char* STEP_PREWARM = "prewarm";
constexpr const char* STEP_SERVICE = "service";
constexpr const char* STEP_VERIFY = "verify";

// "tool:<name>" for each configured tool
std::string tool_step_name(const ToolSpec& tool);

// The installer pipeline in its fixed order:
//
//   tool:<each tool>  fatal
//   shell-profiles    advisory
//   directories       fatal
//   registry          advisory
//   build-sync        fatal
//   prewarm           advisory
//   service           advisory
//   verify            fatal
Orchestrator make_install_pipeline(const InstallConfig& config);

// Context seeded with the configuration and the inherited PATH
InstallContext make_install_context(const InstallConfig& config);

} // namespace memboot
