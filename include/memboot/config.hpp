#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace memboot {

// ============================================================================
// Tool Dependency
// ============================================================================

struct ToolSpec {
    std::string name;                          // report name, e.g. "bun"
    std::string probe;                         // command that must resolve, e.g. "uvx"
    std::vector<std::string> version_command;  // e.g. {"bun", "--version"}
    std::string install_script;                // run through /bin/sh -c
    std::string path_segment;                  // bin directory the installer populates
};

// ============================================================================
// Install Configuration
// ============================================================================

struct InstallIdentity {
    std::string marketplace_id = "thedotmack";
    std::string vendor = "thedotmack";
    std::string plugin_name = "claude-mem";
};

struct InstallConfig {
    std::string home;
    std::string source_dir;  // plugin project checkout
    InstallIdentity identity;

    struct {
        std::string plugins_dir;      // ~/.claude/plugins
        std::string marketplace_dir;  // <plugins>/marketplaces/<marketplace_id>
        std::string cache_root;       // <plugins>/cache/<vendor>/<plugin>
        std::string registry_file;    // <plugins>/known_marketplaces.json
        std::string data_dir;         // ~/.claude-mem
        std::string logs_dir;
        std::string vector_db_dir;
        std::string database_file;
    } paths;

    std::vector<ToolSpec> tools;

    struct {
        std::vector<std::string> profiles;
        std::string marker;  // substring meaning "already configured"
        std::string line;    // appended verbatim, never expanded
    } shell;

    struct {
        std::vector<std::string> install_command;
        std::vector<std::string> build_command;
        std::string plugin_manifest;         // relative to source_dir
        std::string build_output;            // relative to source_dir
        std::string marketplace_descriptor;  // relative to marketplace_dir
        std::vector<std::string> excludes;   // entry names never mirrored
    } build;

    struct {
        bool enabled = true;
        std::vector<std::string> command;
        std::chrono::seconds hard_timeout{30};
        std::chrono::milliseconds grace{10000};
    } prewarm;

    struct {
        std::vector<std::string> command;
        std::string host = "127.0.0.1";
        int port = 37777;
        std::string health_path = "/api/health";
        std::chrono::milliseconds initial_delay{500};
        std::chrono::milliseconds interval{500};
        std::chrono::milliseconds max_interval{2000};
        double backoff = 1.5;
        std::chrono::milliseconds deadline{15000};
        std::chrono::milliseconds request_timeout{2000};
    } service;

    // Directories the provisioning step must create
    std::vector<std::string> required_directories() const;

    // Deployed plugin subtree inside the marketplace tree
    std::string deployed_plugin_dir() const;

    std::string health_url() const;
    std::string web_url() const;
};

// Build the reference configuration for a home directory and source tree
InstallConfig make_default_config(const std::string& home,
                                  const std::string& source_dir,
                                  const InstallIdentity& identity = {});

// ============================================================================
// Config File Loading
// ============================================================================

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    InstallConfig config;
    std::vector<std::string> warnings;
};

// Apply JSON overrides on top of the defaults for `home` and `source_dir`.
// String values may contain ${HOME}, ${SOURCE_DIR}, ${PLUGINS_DIR},
// ${MARKETPLACE_DIR}, ${CACHE_DIR}, ${DATA_DIR}, ${VECTOR_DB_DIR} and
// ${LOGS_DIR}; other names fall back to the process environment.
ConfigParseResult parse_install_config(const std::string& json_str,
                                       const std::string& home,
                                       const std::string& source_dir,
                                       const std::string& source_path = "");

ConfigParseResult load_install_config(const std::string& path,
                                      const std::string& home,
                                      const std::string& source_dir);

} // namespace memboot
