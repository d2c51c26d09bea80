#include "memboot/config.hpp"
#include "memboot/expansion.hpp"
#include "memboot/platform.hpp"

#include <functional>
#include <optional>
#include <set>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace memboot {

// ============================================================================
// InstallConfig
// ============================================================================

std::vector<std::string> InstallConfig::required_directories() const {
    return {
        paths.cache_root,
        paths.marketplace_dir,
        paths.logs_dir,
        paths.vector_db_dir,
    };
}

std::string InstallConfig::deployed_plugin_dir() const {
    return join_path(paths.marketplace_dir, build.build_output);
}

std::string InstallConfig::health_url() const {
    return "http://" + service.host + ":" + std::to_string(service.port) + service.health_path;
}

std::string InstallConfig::web_url() const {
    return "http://localhost:" + std::to_string(service.port);
}

InstallConfig make_default_config(const std::string& home,
                                  const std::string& source_dir,
                                  const InstallIdentity& identity) {
    InstallConfig config;
    config.home = home;
    config.source_dir = source_dir;
    config.identity = identity;

    auto& p = config.paths;
    p.plugins_dir = home + "/.claude/plugins";
    p.marketplace_dir = p.plugins_dir + "/marketplaces/" + identity.marketplace_id;
    p.cache_root = p.plugins_dir + "/cache/" + identity.vendor + "/" + identity.plugin_name;
    p.registry_file = p.plugins_dir + "/known_marketplaces.json";
    p.data_dir = home + "/.claude-mem";
    p.logs_dir = p.data_dir + "/logs";
    p.vector_db_dir = p.data_dir + "/vector-db";
    p.database_file = p.data_dir + "/claude-mem.db";

    ToolSpec bun;
    bun.name = "bun";
    bun.probe = "bun";
    bun.version_command = {"bun", "--version"};
    bun.install_script = "curl -fsSL https://bun.sh/install | bash";
    bun.path_segment = home + "/.bun/bin";

    ToolSpec uv;
    uv.name = "uv";
    uv.probe = "uvx";
    uv.version_command = {"uv", "--version"};
    uv.install_script = "curl -LsSf https://astral.sh/uv/install.sh | sh";
    uv.path_segment = home + "/.local/bin";

    config.tools = {bun, uv};

    config.shell.profiles = {home + "/.bashrc", home + "/.profile", home + "/.zshrc"};
    config.shell.marker = ".bun/bin";
    config.shell.line = "export PATH=\"$HOME/.bun/bin:$HOME/.local/bin:$PATH\"";

    config.build.install_command = {"npm", "install", "--silent"};
    config.build.build_command = {"npm", "run", "build", "--silent"};
    config.build.plugin_manifest = "plugin/.claude-plugin/plugin.json";
    config.build.build_output = "plugin";
    config.build.marketplace_descriptor = ".claude-plugin/marketplace.json";
    config.build.excludes = {".git"};

    config.prewarm.command = {"uvx", "--python", "3.13", "chroma-mcp",
                              "--client-type", "persistent",
                              "--data-dir", p.vector_db_dir};

    config.service.command = {"bun", p.marketplace_dir + "/plugin/scripts/worker-service.cjs", "start"};

    return config;
}

// ============================================================================
// JSON Overrides
// ============================================================================

namespace {

using nlohmann::json;

class OverrideReader {
public:
    OverrideReader(const InstallConfig& base, std::vector<std::string>& warnings)
        : warnings_(warnings) {
        variables_ = {
            {"HOME", base.home},
            {"SOURCE_DIR", base.source_dir},
            {"PLUGINS_DIR", base.paths.plugins_dir},
            {"MARKETPLACE_DIR", base.paths.marketplace_dir},
            {"CACHE_DIR", base.paths.cache_root},
            {"DATA_DIR", base.paths.data_dir},
            {"LOGS_DIR", base.paths.logs_dir},
            {"VECTOR_DB_DIR", base.paths.vector_db_dir},
        };
    }

    bool failed() const { return !error_.empty(); }
    const std::string& error() const { return error_; }

    void string_field(const json& j, const std::string& section, const std::string& key,
                      std::string& out, bool expand = true) {
        if (failed() || !j.contains(key)) return;
        const auto& v = j[key];
        if (!v.is_string()) {
            fail(section, key, "string");
            return;
        }
        out = expand ? expand_value(v.get<std::string>()) : v.get<std::string>();
    }

    void string_array(const json& j, const std::string& section, const std::string& key,
                      std::vector<std::string>& out) {
        if (failed() || !j.contains(key)) return;
        const auto& v = j[key];
        if (!v.is_array()) {
            fail(section, key, "array of strings");
            return;
        }
        std::vector<std::string> values;
        for (const auto& elem : v) {
            if (!elem.is_string()) {
                fail(section, key, "array of strings");
                return;
            }
            values.push_back(expand_value(elem.get<std::string>()));
        }
        out = std::move(values);
    }

    void command_field(const json& j, const std::string& section, const std::string& key,
                       std::vector<std::string>& out) {
        std::vector<std::string> values = out;
        string_array(j, section, key, values);
        if (failed()) return;
        if (values.empty()) {
            error_ = qualified(section, key) + " must not be empty";
            return;
        }
        out = std::move(values);
    }

    template <typename Duration>
    void duration_field(const json& j, const std::string& section, const std::string& key,
                        Duration& out) {
        if (failed() || !j.contains(key)) return;
        const auto& v = j[key];
        if (!v.is_number_integer() || v.get<long long>() < 0) {
            fail(section, key, "non-negative integer");
            return;
        }
        out = Duration(v.get<long long>());
    }

    void int_field(const json& j, const std::string& section, const std::string& key,
                   int& out, int min_value, int max_value) {
        if (failed() || !j.contains(key)) return;
        const auto& v = j[key];
        if (!v.is_number_integer() || v.get<long long>() < min_value ||
            v.get<long long>() > max_value) {
            fail(section, key, "integer in [" + std::to_string(min_value) + ", " +
                                   std::to_string(max_value) + "]");
            return;
        }
        out = v.get<int>();
    }

    void bool_field(const json& j, const std::string& section, const std::string& key, bool& out) {
        if (failed() || !j.contains(key)) return;
        if (!j[key].is_boolean()) {
            fail(section, key, "boolean");
            return;
        }
        out = j[key].get<bool>();
    }

    void number_field(const json& j, const std::string& section, const std::string& key,
                      double& out, double min_value) {
        if (failed() || !j.contains(key)) return;
        if (!j[key].is_number() || j[key].get<double>() < min_value) {
            fail(section, key, "number >= " + std::to_string(min_value));
            return;
        }
        out = j[key].get<double>();
    }

    void object_section(const json& j, const std::string& key,
                        const std::set<std::string>& known,
                        const std::function<void(const json&)>& read) {
        if (failed() || !j.contains(key)) return;
        const auto& section = j[key];
        if (!section.is_object()) {
            fail("", key, "object");
            return;
        }
        for (auto it = section.begin(); it != section.end(); ++it) {
            if (known.count(it.key()) == 0) {
                warnings_.push_back("unknown config key: " + key + "." + it.key());
            }
        }
        read(section);
    }

private:
    std::unordered_map<std::string, std::string> variables_;
    std::vector<std::string>& warnings_;
    std::string error_;

    static std::string qualified(const std::string& section, const std::string& key) {
        return section.empty() ? key : section + "." + key;
    }

    void fail(const std::string& section, const std::string& key, const std::string& expected) {
        error_ = qualified(section, key) + " must be " + expected;
    }

    std::string expand_value(const std::string& raw) {
        auto expanded = expand_placeholders(raw, variables_);
        if (!expanded.ok) {
            error_ = expanded.error + " in \"" + raw + "\"";
            return raw;
        }
        for (const auto& name : expanded.missing) {
            warnings_.push_back("undefined placeholder ${" + name + "} expanded to empty");
        }
        return expanded.value;
    }
};

std::optional<std::string> get_identity_string(const json& j, const std::string& key,
                                               std::string& error) {
    if (!j.contains(key)) return std::nullopt;
    if (!j[key].is_string() || j[key].get<std::string>().empty()) {
        error = key + " must be a non-empty string";
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

} // namespace

ConfigParseResult parse_install_config(const std::string& json_str,
                                       const std::string& home,
                                       const std::string& source_dir,
                                       const std::string& source_path) {
    ConfigParseResult result;
    std::string where = source_path.empty() ? "" : source_path + ": ";

    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        result.error = where + "parse error: " + e.what();
        return result;
    }

    if (!j.is_object()) {
        result.error = where + "config must be a JSON object";
        return result;
    }

    // Identity first: every derived path depends on it
    InstallIdentity identity;
    std::string error;
    if (auto v = get_identity_string(j, "marketplace_id", error)) identity.marketplace_id = *v;
    if (auto v = get_identity_string(j, "vendor", error)) identity.vendor = *v;
    if (auto v = get_identity_string(j, "plugin_name", error)) identity.plugin_name = *v;
    if (!error.empty()) {
        result.error = where + error;
        return result;
    }

    result.config = make_default_config(home, source_dir, identity);
    InstallConfig& config = result.config;

    static const std::set<std::string> top_level = {
        "marketplace_id", "vendor", "plugin_name", "tools", "shell", "build", "prewarm", "service"};
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (top_level.count(it.key()) == 0) {
            result.warnings.push_back("unknown config key: " + it.key());
        }
    }

    OverrideReader reader(config, result.warnings);

    if (j.contains("tools")) {
        if (!j["tools"].is_array()) {
            result.error = where + "tools must be an array";
            return result;
        }
        std::vector<ToolSpec> tools;
        for (const auto& entry : j["tools"]) {
            if (!entry.is_object()) {
                result.error = where + "tools entries must be objects";
                return result;
            }
            ToolSpec tool;
            reader.string_field(entry, "tools[]", "name", tool.name);
            reader.string_field(entry, "tools[]", "probe", tool.probe);
            reader.string_array(entry, "tools[]", "version_command", tool.version_command);
            reader.string_field(entry, "tools[]", "install_script", tool.install_script);
            reader.string_field(entry, "tools[]", "path_segment", tool.path_segment);
            if (reader.failed()) break;
            if (tool.name.empty()) {
                result.error = where + "tools[].name is required";
                return result;
            }
            if (tool.probe.empty()) tool.probe = tool.name;
            tools.push_back(std::move(tool));
        }
        config.tools = std::move(tools);
    }

    reader.object_section(j, "shell", {"profiles", "marker", "line"}, [&](const json& s) {
        reader.string_array(s, "shell", "profiles", config.shell.profiles);
        reader.string_field(s, "shell", "marker", config.shell.marker);
        reader.string_field(s, "shell", "line", config.shell.line, false);
    });

    reader.object_section(j, "build",
        {"install_command", "build_command", "plugin_manifest", "build_output",
         "marketplace_descriptor", "excludes"},
        [&](const json& b) {
            reader.command_field(b, "build", "install_command", config.build.install_command);
            reader.command_field(b, "build", "build_command", config.build.build_command);
            reader.string_field(b, "build", "plugin_manifest", config.build.plugin_manifest);
            reader.string_field(b, "build", "build_output", config.build.build_output);
            reader.string_field(b, "build", "marketplace_descriptor",
                                config.build.marketplace_descriptor);
            reader.string_array(b, "build", "excludes", config.build.excludes);
        });

    reader.object_section(j, "prewarm", {"enabled", "command", "timeout_seconds", "grace_ms"},
        [&](const json& p) {
            reader.bool_field(p, "prewarm", "enabled", config.prewarm.enabled);
            reader.command_field(p, "prewarm", "command", config.prewarm.command);
            reader.duration_field(p, "prewarm", "timeout_seconds", config.prewarm.hard_timeout);
            reader.duration_field(p, "prewarm", "grace_ms", config.prewarm.grace);
        });

    reader.object_section(j, "service",
        {"command", "host", "port", "health_path", "initial_delay_ms", "interval_ms",
         "max_interval_ms", "backoff", "deadline_ms", "request_timeout_ms"},
        [&](const json& s) {
            reader.command_field(s, "service", "command", config.service.command);
            reader.string_field(s, "service", "host", config.service.host);
            reader.int_field(s, "service", "port", config.service.port, 1, 65535);
            reader.string_field(s, "service", "health_path", config.service.health_path);
            reader.duration_field(s, "service", "initial_delay_ms", config.service.initial_delay);
            reader.duration_field(s, "service", "interval_ms", config.service.interval);
            reader.duration_field(s, "service", "max_interval_ms", config.service.max_interval);
            reader.number_field(s, "service", "backoff", config.service.backoff, 1.0);
            reader.duration_field(s, "service", "deadline_ms", config.service.deadline);
            reader.duration_field(s, "service", "request_timeout_ms",
                                  config.service.request_timeout);
        });

    if (reader.failed()) {
        result.error = where + reader.error();
        return result;
    }

    if (config.service.health_path.empty() || config.service.health_path[0] != '/') {
        result.error = where + "service.health_path must start with '/'";
        return result;
    }

    result.ok = true;
    return result;
}

ConfigParseResult load_install_config(const std::string& path,
                                      const std::string& home,
                                      const std::string& source_dir) {
    auto content = read_file(path);
    if (!content) {
        ConfigParseResult result;
        result.error = "cannot read config file: " + path;
        return result;
    }
    return parse_install_config(*content, home, source_dir, path);
}

} // namespace memboot
