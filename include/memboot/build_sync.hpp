#pragma once

#include "memboot/config.hpp"
#include "memboot/exec.hpp"
#include "memboot/mirror.hpp"
#include "memboot/types.hpp"

#include <string>

namespace memboot {

// ============================================================================
// Build and Sync
// ============================================================================

struct ManifestVersionResult {
    bool ok = false;
    std::string version;
    std::string error;
};

// Read the "version" string from a plugin manifest (plugin.json)
ManifestVersionResult read_manifest_version(const std::string& manifest_path);

// Cache destination for one built version: <cache_root>/<version>
std::string versioned_cache_dir(const InstallConfig& config, const std::string& version);

// Install dependencies, build, mirror into the marketplace tree and the
// versioned cache tree, lift the marketplace descriptor to the tree root,
// then install dependencies again inside the marketplace tree.
//
// Every sub-step except the descriptor copy fails the step: the install
// and build commands with BuildFailure, the mirrors with FilesystemError.
// Nothing is mirrored when the build fails. With `stdout_to_stderr` the
// install and build commands write their stdout to stderr instead.
StepResult build_and_sync(const InstallConfig& config,
                          const ToolLocations& tools,
                          bool stdout_to_stderr = false);

} // namespace memboot
