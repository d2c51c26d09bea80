#include "memboot/exec.hpp"
#include "memboot/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

extern "C" char** environ;

namespace memboot {

// ============================================================================
// ToolLocations
// ============================================================================

ToolLocations::ToolLocations(std::vector<std::string> directories)
    : directories_(std::move(directories)) {}

ToolLocations ToolLocations::from_environment() {
    auto path = get_env("PATH");
    return ToolLocations(split_search_path(path.value_or("/usr/local/bin:/usr/bin:/bin")));
}

void ToolLocations::prepend(const std::string& directory) {
    directories_.erase(std::remove(directories_.begin(), directories_.end(), directory),
                       directories_.end());
    directories_.insert(directories_.begin(), directory);
}

bool ToolLocations::contains(const std::string& directory) const {
    return std::find(directories_.begin(), directories_.end(), directory) != directories_.end();
}

std::optional<std::string> ToolLocations::resolve(const std::string& command) const {
    if (command.empty()) return std::nullopt;

    if (command.find('/') != std::string::npos) {
        if (is_executable_file(command)) return command;
        return std::nullopt;
    }

    for (const auto& dir : directories_) {
        std::string candidate = join_path(dir, command);
        if (!is_executable_file(candidate)) continue;

        // Children may chdir before exec, so relative entries are pinned here
        std::filesystem::path p(candidate);
        if (p.is_relative()) {
            std::error_code ec;
            auto absolute = std::filesystem::absolute(p, ec);
            if (!ec) return absolute.lexically_normal().string();
        }
        return candidate;
    }
    return std::nullopt;
}

std::string ToolLocations::search_path() const {
    std::string joined;
    for (size_t i = 0; i < directories_.size(); ++i) {
        if (i > 0) joined += ':';
        joined += directories_[i];
    }
    return joined;
}

// ============================================================================
// Process Helpers
// ============================================================================

namespace {

// Argument and environment arrays prepared before fork(); the child only
// touches them through async-signal-safe calls.
struct PreparedCommand {
    std::string binary;
    std::vector<std::string> argv_strings;
    std::vector<std::string> env_strings;
    std::vector<char*> argv;
    std::vector<char*> envp;
};

std::vector<std::string> build_environment(const ToolLocations& tools) {
    std::vector<std::string> env;
    for (char** ep = environ; *ep; ++ep) {
        if (std::strncmp(*ep, "PATH=", 5) == 0) continue;
        env.emplace_back(*ep);
    }
    env.push_back("PATH=" + tools.search_path());
    return env;
}

bool prepare(const CommandSpec& spec, const ToolLocations& tools,
             PreparedCommand& out, std::string& error) {
    if (spec.argv.empty()) {
        error = "empty command";
        return false;
    }

    auto binary = tools.resolve(spec.argv[0]);
    if (!binary) {
        error = "command not found: " + spec.argv[0];
        return false;
    }

    out.binary = *binary;
    out.argv_strings = spec.argv;
    out.env_strings = build_environment(tools);

    for (auto& s : out.argv_strings) {
        out.argv.push_back(const_cast<char*>(s.c_str()));
    }
    out.argv.push_back(nullptr);

    for (auto& s : out.env_strings) {
        out.envp.push_back(const_cast<char*>(s.c_str()));
    }
    out.envp.push_back(nullptr);
    return true;
}

void redirect_to_null(int target_fd) {
    int null_fd = open("/dev/null", O_RDWR);
    if (null_fd >= 0) {
        dup2(null_fd, target_fd);
        if (null_fd > STDERR_FILENO) close(null_fd);
    }
}

// Child side after fork(): set up stdio and cwd, then exec. On failure the
// errno is written to err_fd (close-on-exec) and the child exits 127.
[[noreturn]] void exec_child(const PreparedCommand& cmd, const CommandSpec& spec,
                             int out_fd, int err_fd) {
    if (spec.silence || spec.capture_output) {
        redirect_to_null(STDIN_FILENO);
    }
    if (out_fd >= 0) {
        dup2(out_fd, STDOUT_FILENO);
        close(out_fd);
    } else if (spec.silence) {
        redirect_to_null(STDOUT_FILENO);
    } else if (spec.stdout_to_stderr) {
        dup2(STDERR_FILENO, STDOUT_FILENO);
    }
    if (spec.silence || spec.capture_output) {
        redirect_to_null(STDERR_FILENO);
    }

    if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) {
        int e = errno;
        ssize_t ignored = write(err_fd, &e, sizeof(e));
        (void)ignored;
        _exit(127);
    }

    execve(cmd.binary.c_str(), cmd.argv.data(), cmd.envp.data());

    int e = errno;
    ssize_t ignored = write(err_fd, &e, sizeof(e));
    (void)ignored;
    _exit(127);
}

// Reads the exec-status pipe. Returns 0 if exec succeeded, else the errno.
int read_exec_errno(int fd) {
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(fd, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(fd);
    return n == static_cast<ssize_t>(sizeof(child_errno)) ? child_errno : 0;
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

pid_t wait_retry(pid_t pid, int* status, int options) {
    pid_t rc;
    do {
        rc = waitpid(pid, status, options);
    } while (rc < 0 && errno == EINTR);
    return rc;
}

} // namespace

// ============================================================================
// run_command
// ============================================================================

ExecResult run_command(const CommandSpec& spec, const ToolLocations& tools) {
    ExecResult result;

    PreparedCommand cmd;
    if (!prepare(spec, tools, cmd, result.error)) {
        return result;
    }

    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    int out_pipe[2] = {-1, -1};
    if (spec.capture_output && pipe2(out_pipe, O_CLOEXEC) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        close(err_pipe[0]);
        close(err_pipe[1]);
        return result;
    }

    spdlog::debug("exec: {}", format_command(spec.argv));

    pid_t pid = fork();
    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        close(err_pipe[0]);
        close(err_pipe[1]);
        if (out_pipe[0] >= 0) {
            close(out_pipe[0]);
            close(out_pipe[1]);
        }
        return result;
    }

    if (pid == 0) {
        close(err_pipe[0]);
        if (out_pipe[0] >= 0) close(out_pipe[0]);
        exec_child(cmd, spec, out_pipe[1], err_pipe[1]);
    }

    close(err_pipe[1]);
    if (out_pipe[1] >= 0) {
        close(out_pipe[1]);
        char buffer[4096];
        ssize_t n;
        while ((n = read(out_pipe[0], buffer, sizeof(buffer))) != 0) {
            if (n < 0) {
                if (errno == EINTR) continue;
                break;
            }
            result.output.append(buffer, static_cast<size_t>(n));
        }
        close(out_pipe[0]);
    }

    int child_errno = read_exec_errno(err_pipe[0]);

    int status = 0;
    if (wait_retry(pid, &status, 0) == -1) {
        result.error = "waitpid failed: " + std::string(strerror(errno));
        return result;
    }

    if (child_errno != 0) {
        result.error = "failed to execute " + cmd.binary + ": " + strerror(child_errno);
        result.exit_code = 127;
        return result;
    }

    result.exit_code = decode_status(status);
    if (result.exit_code < 0) {
        result.error = "process terminated abnormally";
        return result;
    }

    result.ok = true;
    return result;
}

// ============================================================================
// spawn_detached
// ============================================================================

SpawnResult spawn_detached(const CommandSpec& spec, const ToolLocations& tools) {
    SpawnResult result;

    CommandSpec detached = spec;
    detached.silence = true;
    detached.capture_output = false;

    PreparedCommand cmd;
    if (!prepare(detached, tools, cmd, result.error)) {
        return result;
    }

    int err_pipe[2];
    int pid_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }
    if (pipe2(pid_pipe, O_CLOEXEC) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        close(err_pipe[0]);
        close(err_pipe[1]);
        return result;
    }

    spdlog::debug("spawn detached: {}", format_command(spec.argv));

    pid_t intermediate = fork();
    if (intermediate == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        close(err_pipe[0]);
        close(err_pipe[1]);
        close(pid_pipe[0]);
        close(pid_pipe[1]);
        return result;
    }

    if (intermediate == 0) {
        close(err_pipe[0]);
        close(pid_pipe[0]);
        setsid();

        pid_t grandchild = fork();
        if (grandchild == 0) {
            close(pid_pipe[1]);
            exec_child(cmd, detached, -1, err_pipe[1]);
        }

        ssize_t ignored = write(pid_pipe[1], &grandchild, sizeof(grandchild));
        (void)ignored;
        _exit(grandchild < 0 ? 1 : 0);
    }

    close(err_pipe[1]);
    close(pid_pipe[1]);

    pid_t grandchild = -1;
    ssize_t n;
    do {
        n = read(pid_pipe[0], &grandchild, sizeof(grandchild));
    } while (n < 0 && errno == EINTR);
    close(pid_pipe[0]);

    int status = 0;
    wait_retry(intermediate, &status, 0);

    int child_errno = read_exec_errno(err_pipe[0]);

    if (n != static_cast<ssize_t>(sizeof(grandchild)) || grandchild <= 0) {
        result.error = "failed to fork detached process";
        return result;
    }
    if (child_errno != 0) {
        result.error = "failed to execute " + cmd.binary + ": " + strerror(child_errno);
        return result;
    }

    result.pid = grandchild;
    result.ok = true;
    return result;
}

// ============================================================================
// run_bounded
// ============================================================================

BoundedRunResult run_bounded(const CommandSpec& spec,
                             const ToolLocations& tools,
                             std::chrono::milliseconds grace,
                             std::chrono::milliseconds kill_timeout) {
    BoundedRunResult result;

    CommandSpec bounded = spec;
    bounded.silence = true;
    bounded.capture_output = false;

    PreparedCommand cmd;
    if (!prepare(bounded, tools, cmd, result.error)) {
        return result;
    }

    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    spdlog::debug("exec bounded ({} ms): {}", grace.count(), format_command(spec.argv));

    pid_t pid = fork();
    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        close(err_pipe[0]);
        close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        close(err_pipe[0]);
        setpgid(0, 0);
        exec_child(cmd, bounded, -1, err_pipe[1]);
    }

    // Also set from the parent so kill(-pid) is valid before the child runs
    setpgid(pid, pid);
    close(err_pipe[1]);

    int child_errno = read_exec_errno(err_pipe[0]);
    if (child_errno != 0) {
        int status = 0;
        wait_retry(pid, &status, 0);
        result.error = "failed to execute " + cmd.binary + ": " + strerror(child_errno);
        return result;
    }

    result.ok = true;

    const auto poll_interval = std::chrono::milliseconds(50);
    int status = 0;
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t rc = wait_retry(pid, &status, WNOHANG);
        if (rc == pid) {
            result.exited = true;
            result.exit_code = decode_status(status);
            // Reap stragglers the command may have left in its group
            kill(-pid, SIGTERM);
            return result;
        }
        if (rc < 0) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
        std::this_thread::sleep_for(poll_interval);
    }

    kill(-pid, SIGTERM);
    result.terminated = true;

    auto kill_deadline = std::chrono::steady_clock::now() + kill_timeout;
    while (std::chrono::steady_clock::now() < kill_deadline) {
        pid_t rc = wait_retry(pid, &status, WNOHANG);
        if (rc == pid) {
            result.exit_code = decode_status(status);
            return result;
        }
        if (rc < 0) {
            return result;
        }
        std::this_thread::sleep_for(poll_interval);
    }

    kill(-pid, SIGKILL);
    if (wait_retry(pid, &status, 0) == pid) {
        result.exit_code = decode_status(status);
    }
    return result;
}

std::string format_command(const std::vector<std::string>& argv) {
    std::string cmd;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) cmd += " ";

        bool needs_quotes = argv[i].empty() ||
                            argv[i].find(' ') != std::string::npos ||
                            argv[i].find('\t') != std::string::npos;

        if (needs_quotes) cmd += "\"";
        cmd += argv[i];
        if (needs_quotes) cmd += "\"";
    }
    return cmd;
}

} // namespace memboot
