#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace memboot {

// ============================================================================
// Mirror Sync
// ============================================================================
//
// Make `destination` an exact copy of `source` (rsync -a --delete
// semantics): files, directories and symlinks present only in the
// destination are removed, changed files are replaced, and modification
// times and permissions follow the source. Entries whose name is listed in
// `excludes` are skipped at every depth on both sides, so an excluded
// directory in the destination is neither mirrored nor deleted.

struct MirrorOptions {
    std::vector<std::string> excludes = {".git"};
};

struct MirrorStats {
    size_t copied = 0;     // files and links written
    size_t unchanged = 0;  // files skipped because size and mtime matched
    size_t removed = 0;    // destination-only entries deleted
};

struct MirrorResult {
    bool ok = false;
    std::string error;
    MirrorStats stats;
};

MirrorResult mirror_tree(const std::string& source,
                         const std::string& destination,
                         const MirrorOptions& options = {});

} // namespace memboot
