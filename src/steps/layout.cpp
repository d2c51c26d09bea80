#include "memboot/layout.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

namespace memboot {

namespace fs = std::filesystem;

StepResult provision_directories(const std::vector<std::string>& directories) {
    std::vector<std::string> created;

    for (const auto& dir : directories) {
        std::error_code ec;
        if (fs::is_directory(dir, ec)) {
            continue;
        }

        fs::create_directories(dir, ec);
        if (ec) {
            return StepResult::failed(ErrorKind::FilesystemError,
                                      "cannot create " + dir + ": " + ec.message());
        }
        if (!fs::is_directory(dir, ec)) {
            return StepResult::failed(ErrorKind::FilesystemError,
                                      "cannot create " + dir + ": path exists and is not a directory");
        }

        spdlog::debug("created {}", dir);
        created.push_back("created " + dir);
    }

    StepResult result = created.empty()
        ? StepResult::already_satisfied("Directories present")
        : StepResult::ok("Directories created");
    result.details = std::move(created);
    return result;
}

} // namespace memboot
