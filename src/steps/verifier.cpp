#include "memboot/verifier.hpp"
#include "memboot/platform.hpp"

namespace memboot {

VerificationReport verify_installation(const InstallConfig& config, const ToolLocations& tools) {
    VerificationReport report;

    for (const auto& tool : config.tools) {
        if (!tools.resolve(tool.probe)) {
            report.errors.push_back(tool.probe + " not in PATH");
        }
    }

    if (!is_directory(config.deployed_plugin_dir())) {
        report.errors.push_back("Plugin not synced (" + config.deployed_plugin_dir() + " missing)");
    }

    if (!is_regular_file(config.paths.database_file)) {
        report.notes.push_back("Database not yet created (will be on first use)");
    }

    return report;
}

StepResult verification_step_result(const VerificationReport& report) {
    StepResult result;
    if (report.error_count() == 0) {
        result = StepResult::ok("Installation verified");
    } else {
        std::string message = std::to_string(report.error_count()) + " errors found:";
        for (const auto& e : report.errors) message += " " + e + ";";
        message.pop_back();
        result = StepResult::failed(ErrorKind::VerificationFailed, message);
    }
    result.details = report.notes;
    return result;
}

} // namespace memboot
