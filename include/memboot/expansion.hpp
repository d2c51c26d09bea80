#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace memboot {

// ============================================================================
// Placeholder Expansion
// ============================================================================

constexpr size_t MAX_PLACEHOLDERS = 128;

struct ExpansionResult {
    bool ok = false;
    std::string value;
    std::vector<std::string> missing;  // names found in neither map nor environment
    std::string error;
};

// Expand ${NAME} references. Lookup order: `variables`, then the process
// environment; unresolved names expand to empty and are listed in `missing`.
// A '$' not followed by '{' is copied literally.
ExpansionResult expand_placeholders(const std::string& input,
                                    const std::unordered_map<std::string, std::string>& variables);

} // namespace memboot
