#pragma once

/**
 * @file exec.hpp
 * @brief Process spawning for installer steps
 *
 * Every external command a step runs goes through this module. Commands
 * are resolved against an explicit ToolLocations value instead of the
 * process PATH, and the child receives that search path as its PATH.
 */

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace memboot {

// ============================================================================
// Tool Locations
// ============================================================================

/**
 * Ordered command search path threaded through the installer.
 *
 * Starts from the inherited PATH; tools installed during the run prepend
 * their bin directory so later steps resolve them without a new shell.
 */
class ToolLocations {
public:
    ToolLocations() = default;
    explicit ToolLocations(std::vector<std::string> directories);

    // Build from the PATH of the current process
    static ToolLocations from_environment();

    // Put a directory at the front; an existing entry is moved, not duplicated
    void prepend(const std::string& directory);

    bool contains(const std::string& directory) const;

    // Absolute path of the first executable named `command`, or nullopt.
    // Names containing '/' are checked as given.
    std::optional<std::string> resolve(const std::string& command) const;

    // ':'-joined value suitable for a child PATH
    std::string search_path() const;

    const std::vector<std::string>& directories() const { return directories_; }

private:
    std::vector<std::string> directories_;
};

// ============================================================================
// Commands
// ============================================================================

struct CommandSpec {
    std::vector<std::string> argv;
    std::string cwd;              // empty = inherit
    bool capture_output = false;  // collect stdout into ExecResult::output
    bool silence = false;         // redirect stdio to /dev/null
    bool stdout_to_stderr = false; // child stdout joins stderr (keeps our stdout clean)
};

struct ExecResult {
    bool ok = false;       // process was spawned and reaped
    int exit_code = -1;    // 128 + signal for signalled children
    std::string output;    // captured stdout when requested
    std::string error;

    bool succeeded() const { return ok && exit_code == 0; }
};

/**
 * Run a command and wait for it to exit.
 */
ExecResult run_command(const CommandSpec& spec, const ToolLocations& tools);

struct SpawnResult {
    bool ok = false;
    pid_t pid = -1;
    std::string error;
};

/**
 * Start a command that outlives the caller.
 *
 * The child is double-forked into a new session with stdio on /dev/null,
 * so it is reparented away from this process and never becomes a zombie
 * of it. The returned pid is the grandchild.
 */
SpawnResult spawn_detached(const CommandSpec& spec, const ToolLocations& tools);

struct BoundedRunResult {
    bool ok = false;          // process was spawned
    bool exited = false;      // exited on its own within the grace period
    bool terminated = false;  // killed after the grace period
    int exit_code = -1;
    std::string error;
};

/**
 * Run a command in its own process group for at most `grace`.
 *
 * If it has not exited by then the whole group receives SIGTERM, then
 * SIGKILL if it is still alive after `kill_timeout`.
 */
BoundedRunResult run_bounded(const CommandSpec& spec,
                             const ToolLocations& tools,
                             std::chrono::milliseconds grace,
                             std::chrono::milliseconds kill_timeout = std::chrono::milliseconds(2000));

// Quote argv for log messages
std::string format_command(const std::vector<std::string>& argv);

} // namespace memboot
