#include "memboot/build_sync.hpp"
#include "memboot/platform.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace memboot {

namespace fs = std::filesystem;

namespace {

// Runs one external build command; empty string on success, else the error
std::string run_build_command(const std::vector<std::string>& argv,
                              const std::string& cwd,
                              const ToolLocations& tools,
                              bool stdout_to_stderr) {
    CommandSpec spec;
    spec.argv = argv;
    spec.cwd = cwd;
    spec.stdout_to_stderr = stdout_to_stderr;

    auto result = run_command(spec, tools);
    if (!result.ok) {
        return format_command(argv) + ": " + result.error;
    }
    if (result.exit_code != 0) {
        return format_command(argv) + " exited with status " + std::to_string(result.exit_code) +
               " in " + cwd;
    }
    return {};
}

bool is_safe_path_component(const std::string& value) {
    return !value.empty() && value != "." && value != ".." &&
           value.find('/') == std::string::npos && value.find('\0') == std::string::npos;
}

std::string describe(const MirrorStats& stats) {
    return std::to_string(stats.copied) + " copied, " + std::to_string(stats.unchanged) +
           " unchanged, " + std::to_string(stats.removed) + " removed";
}

// Best effort: the descriptor copy never fails the build step
std::string lift_marketplace_descriptor(const InstallConfig& config) {
    std::string nested = join_path(config.paths.marketplace_dir, config.build.marketplace_descriptor);
    if (!is_regular_file(nested)) {
        return {};
    }

    std::string root_copy = join_path(config.paths.marketplace_dir,
                                      fs::path(nested).filename().string());
    std::error_code ec;
    fs::copy_file(nested, root_copy, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return "cannot copy " + nested + ": " + ec.message();
    }
    auto mtime = fs::last_write_time(nested, ec);
    if (!ec) {
        fs::last_write_time(root_copy, mtime, ec);
    }
    return {};
}

} // namespace

ManifestVersionResult read_manifest_version(const std::string& manifest_path) {
    ManifestVersionResult result;

    auto content = read_file(manifest_path);
    if (!content) {
        result.error = "cannot read plugin manifest " + manifest_path;
        return result;
    }

    try {
        auto j = nlohmann::json::parse(*content);
        if (!j.is_object() || !j.contains("version") || !j["version"].is_string()) {
            result.error = manifest_path + " has no version string";
            return result;
        }
        result.version = j["version"].get<std::string>();
    } catch (const nlohmann::json::parse_error& e) {
        result.error = manifest_path + " is not valid JSON: " + e.what();
        return result;
    }

    if (!is_safe_path_component(result.version)) {
        result.error = "plugin version \"" + result.version + "\" is not usable as a directory name";
        result.version.clear();
        return result;
    }

    result.ok = true;
    return result;
}

std::string versioned_cache_dir(const InstallConfig& config, const std::string& version) {
    return join_path(config.paths.cache_root, version);
}

StepResult build_and_sync(const InstallConfig& config,
                          const ToolLocations& tools,
                          bool stdout_to_stderr) {
    const std::string& source = config.source_dir;

    spdlog::info("Installing dependencies...");
    if (auto err = run_build_command(config.build.install_command, source, tools, stdout_to_stderr);
        !err.empty()) {
        return StepResult::failed(ErrorKind::BuildFailure, err);
    }

    spdlog::info("Building plugin...");
    if (auto err = run_build_command(config.build.build_command, source, tools, stdout_to_stderr);
        !err.empty()) {
        return StepResult::failed(ErrorKind::BuildFailure, err);
    }

    auto manifest = read_manifest_version(join_path(source, config.build.plugin_manifest));
    if (!manifest.ok) {
        return StepResult::failed(ErrorKind::BuildFailure, manifest.error);
    }

    spdlog::info("Syncing to marketplace...");
    MirrorOptions options;
    options.excludes = config.build.excludes;

    auto live = mirror_tree(source, config.paths.marketplace_dir, options);
    if (!live.ok) {
        return StepResult::failed(ErrorKind::FilesystemError, "marketplace sync failed: " + live.error);
    }

    std::string cache_dir = versioned_cache_dir(config, manifest.version);
    auto cached = mirror_tree(join_path(source, config.build.build_output), cache_dir, options);
    if (!cached.ok) {
        return StepResult::failed(ErrorKind::FilesystemError, "cache sync failed: " + cached.error);
    }

    std::string descriptor_error = lift_marketplace_descriptor(config);

    if (auto err = run_build_command(config.build.install_command, config.paths.marketplace_dir,
                                     tools, stdout_to_stderr);
        !err.empty()) {
        return StepResult::failed(ErrorKind::BuildFailure, err);
    }

    StepResult result = descriptor_error.empty()
        ? StepResult::ok("Plugin synced (v" + manifest.version + ")")
        : StepResult::warning(ErrorKind::FilesystemError,
                              "Plugin synced (v" + manifest.version + ") but " + descriptor_error);
    result.details.push_back(config.paths.marketplace_dir + ": " + describe(live.stats));
    result.details.push_back(cache_dir + ": " + describe(cached.stats));
    return result;
}

} // namespace memboot
