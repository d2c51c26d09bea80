#pragma once

#include "memboot/config.hpp"
#include "memboot/exec.hpp"
#include "memboot/types.hpp"

#include <string>
#include <vector>

namespace memboot {

// ============================================================================
// Installation Verification
// ============================================================================

struct VerificationReport {
    std::vector<std::string> errors;
    std::vector<std::string> notes;  // informational, never counted

    size_t error_count() const { return errors.size(); }
};

// Re-check the end state without consulting earlier step results:
// every tool probe resolves, the deployed plugin tree exists. A missing
// database is only a note (it is created on first use).
VerificationReport verify_installation(const InstallConfig& config, const ToolLocations& tools);

// Step form: Failed(VerificationFailed) iff the error count is non-zero
StepResult verification_step_result(const VerificationReport& report);

} // namespace memboot
