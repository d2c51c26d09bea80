#pragma once

#include "memboot/config.hpp"
#include "memboot/types.hpp"

#include <string>

namespace memboot {

// ============================================================================
// Marketplace Registry
// ============================================================================
//
// known_marketplaces.json is a single JSON object keyed by marketplace id:
//
//   {
//     "thedotmack": {
//       "source": { "source": "directory", "path": "<marketplace dir>" },
//       "installLocation": "<marketplace dir>",
//       "lastUpdated": "<ISO-8601>"
//     }
//   }
//
// Other keys belong to other marketplaces and are preserved in their
// original order on every write.

struct RegistryEntry {
    std::string key;
    std::string source_path;
    std::string install_location;
    std::string last_updated;
};

enum class RegistryMergeStatus {
    Added,
    AlreadyPresent,
    Error
};

struct RegistryMergeResult {
    RegistryMergeStatus status = RegistryMergeStatus::Error;
    bool created_file = false;
    std::string error;

    bool ok() const { return status != RegistryMergeStatus::Error; }
};

// Read-modify-write merge of `entry` into the registry at `path`.
// A missing file is first created as {}. An existing key is left untouched,
// including its lastUpdated. Every write is an atomic replace; a file that
// does not hold a JSON object is reported and never overwritten.
RegistryMergeResult merge_registry_entry(const std::string& path, const RegistryEntry& entry);

// Registry step: failures degrade to a RegistryWriteError warning
StepResult register_marketplace(const InstallConfig& config);

} // namespace memboot
