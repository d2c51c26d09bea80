/**
 * memboot CLI - Common utilities and types
 */

#pragma once

#include <memboot/config.hpp>
#include <memboot/orchestrator.hpp>
#include <memboot/pipeline.hpp>
#include <memboot/platform.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace memboot::cli {

/**
 * Options parsed from the command line.
 */
struct CliOptions {
    std::string source;       // --source
    std::string config_file;  // --config
    bool json = false;        // --json
    bool verbose = false;     // -v, --verbose
    bool quiet = false;       // -q, --quiet
};

constexpr int EXIT_CONFIG_ERROR = 2;

/**
 * Route spdlog to stderr so stdout stays clean for --json, and pick the
 * level from -v / -q.
 */
inline void configure_logging(const CliOptions& opts) {
    auto logger = spdlog::stderr_color_mt("memboot");
    logger->set_pattern("%^%l%$: %v");
    spdlog::set_default_logger(logger);

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Resolve the plugin project directory.
 * Priority: --source flag > current directory
 */
inline std::string resolve_source_dir(const std::string& override_source) {
    std::error_code ec;
    std::filesystem::path dir = override_source.empty()
        ? std::filesystem::current_path(ec)
        : std::filesystem::path(override_source);
    auto absolute = std::filesystem::absolute(dir, ec);
    if (ec) return dir.lexically_normal().string();
    return absolute.lexically_normal().string();
}

/**
 * Resolve the config overrides file.
 * Priority: --config flag > MEMBOOT_CONFIG env > none
 */
inline std::string resolve_config_file(const std::string& override_file) {
    if (!override_file.empty()) return override_file;
    return get_env("MEMBOOT_CONFIG").value_or("");
}

/**
 * Output utilities.
 *
 * In JSON mode nothing but the final document reaches stdout; warnings
 * are collected and attached to it.
 */
class Output {
public:
    explicit Output(const CliOptions& opts) : json_(opts.json), quiet_(opts.quiet) {}

    bool json_mode() const { return json_; }

    void header(const std::string& title) const {
        if (json_ || quiet_) return;
        std::cout << "\n" << title << "\n" << std::string(title.size(), '=') << "\n\n";
    }

    void progress(const std::string& msg) const {
        if (json_ || quiet_) return;
        std::cout << "==> " << msg << std::endl;
    }

    void success(const std::string& msg) const {
        if (json_ || quiet_) return;
        std::cout << "\xE2\x9C\x93 " << msg << std::endl;
    }

    void warning(const std::string& msg) {
        if (json_) {
            warnings_.push_back(msg);
        } else if (!quiet_) {
            std::cerr << "! " << msg << std::endl;
        }
    }

    void error(const std::string& msg) const {
        if (json_) return;
        std::cerr << "\xE2\x9C\x97 " << msg << std::endl;
    }

    void note(const std::string& msg) const {
        if (json_ || quiet_) return;
        std::cout << "  " << msg << std::endl;
    }

    void text(const std::string& msg) const {
        if (json_ || quiet_) return;
        std::cout << msg << std::endl;
    }

    // Emit a JSON document with any collected warnings attached
    void json(nlohmann::json j) const {
        if (!warnings_.empty() && !j.contains("warnings")) {
            j["warnings"] = warnings_;
        }
        std::cout << j.dump(2) << std::endl;
    }

    // Configuration or command-line failure, reported before any step runs
    int fail(const std::string& msg) const {
        if (json_) {
            nlohmann::json j;
            j["ok"] = false;
            j["error"] = msg;
            j["error_kind"] = error_kind_to_string(ErrorKind::ConfigError);
            json(std::move(j));
        } else {
            std::cerr << "Error: " << msg << std::endl;
        }
        return EXIT_CONFIG_ERROR;
    }

private:
    bool json_;
    bool quiet_;
    std::vector<std::string> warnings_;
};

/**
 * Human title for a pipeline step.
 */
inline std::string step_title(const std::string& name) {
    if (name.rfind("tool:", 0) == 0) return "Checking " + name.substr(5) + "...";
    if (name == STEP_SHELL_PROFILES) return "Configuring shell PATH...";
    if (name == STEP_DIRECTORIES) return "Creating directories...";
    if (name == STEP_REGISTRY) return "Registering marketplace...";
    if (name == STEP_BUILD_SYNC) return "Building and syncing plugin...";
    if (name == STEP_PREWARM) return "Pre-warming vector database...";
    if (name == STEP_SERVICE) return "Starting worker service...";
    if (name == STEP_VERIFY) return "Verifying installation...";
    return name + "...";
}

} // namespace memboot::cli
