#pragma once

#include <optional>
#include <string>
#include <vector>

namespace memboot {

// ============================================================================
// Step Outcomes
// ============================================================================

enum class StepOutcome {
    Ok,
    AlreadySatisfied,
    Skipped,
    Warning,
    Failed
};

inline const char* outcome_to_string(StepOutcome o) {
    switch (o) {
        case StepOutcome::Ok: return "ok";
        case StepOutcome::AlreadySatisfied: return "already-satisfied";
        case StepOutcome::Skipped: return "skipped";
        case StepOutcome::Warning: return "warning";
        case StepOutcome::Failed: return "failed";
        default: return "unknown";
    }
}

// ============================================================================
// Error Taxonomy
// ============================================================================

enum class ErrorKind {
    None,
    MissingTool,
    FilesystemError,
    RegistryWriteError,
    BuildFailure,
    ServiceUnreachable,
    PrewarmFailure,
    VerificationFailed,
    ConfigError,
    Unexpected
};

inline const char* error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None: return "none";
        case ErrorKind::MissingTool: return "missing_tool";
        case ErrorKind::FilesystemError: return "filesystem_error";
        case ErrorKind::RegistryWriteError: return "registry_write_error";
        case ErrorKind::BuildFailure: return "build_failure";
        case ErrorKind::ServiceUnreachable: return "service_unreachable";
        case ErrorKind::PrewarmFailure: return "prewarm_failure";
        case ErrorKind::VerificationFailed: return "verification_failed";
        case ErrorKind::ConfigError: return "config_error";
        case ErrorKind::Unexpected: return "unexpected";
        default: return "unknown";
    }
}

// ============================================================================
// Step Result
// ============================================================================

struct StepResult {
    StepOutcome outcome = StepOutcome::Ok;
    ErrorKind error_kind = ErrorKind::None;
    std::string message;               // warning text or raw error text
    std::vector<std::string> details;  // informational lines for the report

    static StepResult ok(std::string message = {}) {
        StepResult r;
        r.message = std::move(message);
        return r;
    }

    static StepResult already_satisfied(std::string message = {}) {
        StepResult r;
        r.outcome = StepOutcome::AlreadySatisfied;
        r.message = std::move(message);
        return r;
    }

    static StepResult skipped(std::string message = {}) {
        StepResult r;
        r.outcome = StepOutcome::Skipped;
        r.message = std::move(message);
        return r;
    }

    static StepResult warning(ErrorKind kind, std::string message) {
        StepResult r;
        r.outcome = StepOutcome::Warning;
        r.error_kind = kind;
        r.message = std::move(message);
        return r;
    }

    static StepResult failed(ErrorKind kind, std::string message) {
        StepResult r;
        r.outcome = StepOutcome::Failed;
        r.error_kind = kind;
        r.message = std::move(message);
        return r;
    }

    bool is_failed() const { return outcome == StepOutcome::Failed; }
};

// ============================================================================
// Failure Policy
// ============================================================================

enum class FailurePolicy {
    Fatal,
    Advisory
};

inline const char* policy_to_string(FailurePolicy p) {
    switch (p) {
        case FailurePolicy::Fatal: return "fatal";
        case FailurePolicy::Advisory: return "advisory";
        default: return "unknown";
    }
}

} // namespace memboot
