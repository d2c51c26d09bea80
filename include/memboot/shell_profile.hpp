#pragma once

#include "memboot/types.hpp"

#include <string>
#include <vector>

namespace memboot {

// ============================================================================
// Shell Profile Configuration
// ============================================================================

enum class ProfileState {
    Missing,            // file does not exist; never created
    AlreadyConfigured,  // marker substring present
    Appended,
    Error
};

struct ProfileUpdate {
    std::string path;
    ProfileState state = ProfileState::Missing;
    std::string error;
};

// Append `line` to `path` unless the file contains `marker`. Existing
// content is never rewritten.
ProfileUpdate ensure_profile_line(const std::string& path,
                                  const std::string& marker,
                                  const std::string& line);

// Ok if any profile was modified, AlreadySatisfied otherwise; append
// errors degrade to Warning.
StepResult configure_shell_profiles(const std::vector<std::string>& profiles,
                                    const std::string& marker,
                                    const std::string& line);

} // namespace memboot
