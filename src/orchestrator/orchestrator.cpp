#include "memboot/orchestrator.hpp"

#include <exception>

#include <spdlog/spdlog.h>

namespace memboot {

// ============================================================================
// InstallationReport
// ============================================================================

bool InstallationReport::succeeded() const {
    if (state != RunState::Completed) return false;
    for (const auto& step : steps) {
        if (step.policy == FailurePolicy::Fatal && step.result.is_failed()) {
            return false;
        }
    }
    return true;
}

int InstallationReport::exit_code() const {
    if (!succeeded()) return 1;
    if (verification && verification->error_count() > 0) return 1;
    return 0;
}

std::vector<const StepRecord*> InstallationReport::advisories() const {
    std::vector<const StepRecord*> result;
    for (const auto& step : steps) {
        if (step.result.outcome == StepOutcome::Warning ||
            (step.result.is_failed() && step.policy == FailurePolicy::Advisory)) {
            result.push_back(&step);
        }
    }
    return result;
}

nlohmann::json report_to_json(const InstallationReport& report) {
    nlohmann::json j;
    j["ok"] = report.exit_code() == 0;
    j["state"] = run_state_to_string(report.state);

    nlohmann::json steps = nlohmann::json::array();
    for (const auto& step : report.steps) {
        nlohmann::json s;
        s["name"] = step.name;
        s["ordinal"] = step.ordinal;
        s["policy"] = policy_to_string(step.policy);
        s["outcome"] = outcome_to_string(step.result.outcome);
        if (!step.result.message.empty()) {
            s["message"] = step.result.message;
        }
        if (step.result.error_kind != ErrorKind::None) {
            s["error_kind"] = error_kind_to_string(step.result.error_kind);
        }
        if (!step.result.details.empty()) {
            s["details"] = step.result.details;
        }
        steps.push_back(std::move(s));
    }
    j["steps"] = std::move(steps);

    if (report.state == RunState::Aborted) {
        j["aborted_step"] = report.aborted_step;
        j["error"] = report.abort_error;
        j["error_kind"] = error_kind_to_string(report.abort_kind);
    }

    if (report.verification) {
        j["verification"] = {
            {"error_count", report.verification->error_count()},
            {"errors", report.verification->errors},
            {"notes", report.verification->notes},
        };
    }

    return j;
}

// ============================================================================
// Orchestrator
// ============================================================================

void Orchestrator::add_step(std::string name, FailurePolicy policy, InstallationStep::RunFn run) {
    steps_.emplace_back(std::move(name), steps_.size() + 1, policy, std::move(run));
}

InstallationReport Orchestrator::run(InstallContext& ctx, const StepObserver* observer) {
    InstallationReport report;
    state_ = RunState::Running;
    report.state = state_;

    for (const auto& step : steps_) {
        if (observer && observer->on_start) observer->on_start(step);
        spdlog::debug("step {} ({}) starting", step.ordinal(), step.name());

        StepResult result;
        try {
            result = step.run(ctx);
        } catch (const std::exception& e) {
            result = StepResult::failed(ErrorKind::Unexpected, e.what());
        }

        spdlog::debug("step {} ({}) finished: {}", step.ordinal(), step.name(),
                      outcome_to_string(result.outcome));
        if (observer && observer->on_finish) observer->on_finish(step, result);

        report.steps.push_back({step.name(), step.ordinal(), step.policy(), result});

        if (result.is_failed() && step.policy() == FailurePolicy::Fatal) {
            state_ = RunState::Aborted;
            report.state = state_;
            report.aborted_step = step.name();
            report.abort_error = result.message;
            report.abort_kind = result.error_kind;
            report.verification = ctx.verification;
            return report;
        }
    }

    state_ = RunState::Completed;
    report.state = state_;
    report.verification = ctx.verification;
    return report;
}

} // namespace memboot
