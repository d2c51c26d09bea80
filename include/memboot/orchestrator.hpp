#pragma once

/**
 * @file orchestrator.hpp
 * @brief Sequential step runner for the installer
 *
 * The Orchestrator owns an ordered list of InstallationSteps and runs them
 * one at a time against a shared InstallContext:
 *
 *   Pending -> Running(step 1) -> ... -> Completed
 *                               \-> Aborted
 *
 * A step whose policy is Fatal and whose outcome is Failed aborts the run
 * immediately; later steps neither run nor appear in the report. Every
 * other outcome, including Failed from an Advisory step, advances.
 */

#include "memboot/config.hpp"
#include "memboot/exec.hpp"
#include "memboot/health.hpp"
#include "memboot/types.hpp"
#include "memboot/verifier.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace memboot {

// ============================================================================
// Install Context
// ============================================================================

/**
 * State shared between steps. Besides the filesystem this is the only
 * channel between them.
 */
struct InstallContext {
    InstallConfig config;
    ToolLocations tools;

    // Health probe used by the service step; an HttpHealthProbe on the
    // configured endpoint is used when null
    HealthProbe* health_probe = nullptr;

    // Send the stdout of install and build commands to stderr, leaving
    // stdout to the caller (set for --json)
    bool child_stdout_to_stderr = false;

    // Filled in by the verification step
    std::optional<VerificationReport> verification;
};

// ============================================================================
// Steps
// ============================================================================

class InstallationStep {
public:
    using RunFn = std::function<StepResult(InstallContext&)>;

    InstallationStep(std::string name, size_t ordinal, FailurePolicy policy, RunFn run)
        : name_(std::move(name)), ordinal_(ordinal), policy_(policy), run_(std::move(run)) {}

    const std::string& name() const { return name_; }
    size_t ordinal() const { return ordinal_; }
    FailurePolicy policy() const { return policy_; }

    StepResult run(InstallContext& ctx) const { return run_(ctx); }

private:
    std::string name_;
    size_t ordinal_;
    FailurePolicy policy_;
    RunFn run_;
};

// ============================================================================
// Report
// ============================================================================

enum class RunState {
    Pending,
    Running,
    Completed,
    Aborted
};

inline const char* run_state_to_string(RunState s) {
    switch (s) {
        case RunState::Pending: return "pending";
        case RunState::Running: return "running";
        case RunState::Completed: return "completed";
        case RunState::Aborted: return "aborted";
        default: return "unknown";
    }
}

struct StepRecord {
    std::string name;
    size_t ordinal = 0;
    FailurePolicy policy = FailurePolicy::Fatal;
    StepResult result;
};

struct InstallationReport {
    RunState state = RunState::Pending;
    std::vector<StepRecord> steps;

    // Set when state == Aborted
    std::string aborted_step;
    std::string abort_error;
    ErrorKind abort_kind = ErrorKind::None;

    std::optional<VerificationReport> verification;

    // True iff no fatal step failed
    bool succeeded() const;

    // 0 on success with a clean verification, 1 otherwise
    int exit_code() const;

    // Records whose outcome is Warning, or Failed under an advisory policy
    std::vector<const StepRecord*> advisories() const;
};

nlohmann::json report_to_json(const InstallationReport& report);

// ============================================================================
// Orchestrator
// ============================================================================

struct StepObserver {
    std::function<void(const InstallationStep&)> on_start;
    std::function<void(const InstallationStep&, const StepResult&)> on_finish;
};

class Orchestrator {
public:
    // Steps run in the order they are added; the ordinal is their position
    void add_step(std::string name, FailurePolicy policy, InstallationStep::RunFn run);

    const std::vector<InstallationStep>& steps() const { return steps_; }

    RunState state() const { return state_; }

    // Run every step in order. An exception escaping a step is converted
    // into a Failed(Unexpected) result for that step.
    InstallationReport run(InstallContext& ctx, const StepObserver* observer = nullptr);

private:
    std::vector<InstallationStep> steps_;
    RunState state_ = RunState::Pending;
};

} // namespace memboot
