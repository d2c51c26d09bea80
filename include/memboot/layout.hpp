#pragma once

#include "memboot/types.hpp"

#include <string>
#include <vector>

namespace memboot {

// Create each directory with its missing parents. Existing directories and
// their contents are left alone. Any creation failure is a fatal
// FilesystemError naming the path.
StepResult provision_directories(const std::vector<std::string>& directories);

} // namespace memboot
