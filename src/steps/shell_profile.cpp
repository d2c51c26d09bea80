#include "memboot/shell_profile.hpp"
#include "memboot/platform.hpp"

#include <spdlog/spdlog.h>

namespace memboot {

ProfileUpdate ensure_profile_line(const std::string& path,
                                  const std::string& marker,
                                  const std::string& line) {
    ProfileUpdate update;
    update.path = path;

    if (!is_regular_file(path)) {
        update.state = ProfileState::Missing;
        return update;
    }

    auto content = read_file(path);
    if (!content) {
        update.state = ProfileState::Error;
        update.error = "cannot read " + path;
        return update;
    }

    if (content->find(marker) != std::string::npos) {
        update.state = ProfileState::AlreadyConfigured;
        return update;
    }

    // Keep the appended line on its own even if the file lacks a final newline
    std::string addition;
    if (!content->empty() && content->back() != '\n') {
        addition += '\n';
    }
    addition += line;
    addition += '\n';

    auto result = append_to_file(path, addition);
    if (!result.ok) {
        update.state = ProfileState::Error;
        update.error = result.error;
        return update;
    }

    update.state = ProfileState::Appended;
    return update;
}

StepResult configure_shell_profiles(const std::vector<std::string>& profiles,
                                    const std::string& marker,
                                    const std::string& line) {
    bool modified = false;
    std::vector<std::string> errors;
    std::vector<std::string> details;

    for (const auto& profile : profiles) {
        auto update = ensure_profile_line(profile, marker, line);
        switch (update.state) {
            case ProfileState::Missing:
                spdlog::debug("profile {} does not exist, skipped", profile);
                break;
            case ProfileState::AlreadyConfigured:
                spdlog::debug("profile {} already configured", profile);
                break;
            case ProfileState::Appended:
                modified = true;
                details.push_back("updated " + profile);
                break;
            case ProfileState::Error:
                errors.push_back(update.error);
                break;
        }
    }

    StepResult result;
    if (!errors.empty()) {
        std::string message = "could not update shell profile:";
        for (const auto& e : errors) message += " " + e + ";";
        message.pop_back();
        result = StepResult::warning(ErrorKind::FilesystemError, message);
    } else if (modified) {
        result = StepResult::ok("PATH added to shell profiles");
    } else {
        result = StepResult::already_satisfied("PATH already configured");
    }
    result.details = std::move(details);
    return result;
}

} // namespace memboot
