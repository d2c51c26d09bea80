#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace memboot {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// The temp file lives beside the target so the rename never crosses a
// filesystem boundary. Readers observe either the old or the new content.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// Append a line to an existing file. Fails if the file does not exist.
AtomicWriteResult append_to_file(const std::string& path, const std::string& content);

// ============================================================================
// Path Utilities
// ============================================================================

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// True if the file exists and has any execute bit set
bool is_executable_file(const std::string& path);

// Read entire file; nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// Split a PATH-style list on ':'. Empty elements become "." as in sh(1);
// an empty list yields no entries.
std::vector<std::string> split_search_path(const std::string& value);

// Current time as ISO-8601 with seconds precision and UTC designator
std::string get_current_timestamp();

// Random RFC 4122 version 4 UUID
std::string generate_uuid();

} // namespace memboot
