#include <doctest/doctest.h>
#include <memboot/config.hpp>

#include "test_support.hpp"

using namespace memboot;
using memboot::test::TempDir;
using memboot::test::write_text;

TEST_CASE("make_default_config derives every path from HOME") {
    auto config = make_default_config("/home/u", "/src/claude-mem");

    CHECK(config.paths.plugins_dir == "/home/u/.claude/plugins");
    CHECK(config.paths.marketplace_dir == "/home/u/.claude/plugins/marketplaces/thedotmack");
    CHECK(config.paths.cache_root == "/home/u/.claude/plugins/cache/thedotmack/claude-mem");
    CHECK(config.paths.registry_file == "/home/u/.claude/plugins/known_marketplaces.json");
    CHECK(config.paths.data_dir == "/home/u/.claude-mem");
    CHECK(config.paths.logs_dir == "/home/u/.claude-mem/logs");
    CHECK(config.paths.vector_db_dir == "/home/u/.claude-mem/vector-db");
    CHECK(config.paths.database_file == "/home/u/.claude-mem/claude-mem.db");
    CHECK(config.deployed_plugin_dir() == "/home/u/.claude/plugins/marketplaces/thedotmack/plugin");
}

TEST_CASE("make_default_config tools and commands") {
    auto config = make_default_config("/home/u", "/src");

    REQUIRE(config.tools.size() == 2);
    CHECK(config.tools[0].name == "bun");
    CHECK(config.tools[0].probe == "bun");
    CHECK(config.tools[0].path_segment == "/home/u/.bun/bin");
    CHECK(config.tools[1].name == "uv");
    CHECK(config.tools[1].probe == "uvx");
    CHECK(config.tools[1].path_segment == "/home/u/.local/bin");

    CHECK(config.shell.profiles ==
          std::vector<std::string>{"/home/u/.bashrc", "/home/u/.profile", "/home/u/.zshrc"});
    CHECK(config.shell.marker == ".bun/bin");
    CHECK(config.shell.line == "export PATH=\"$HOME/.bun/bin:$HOME/.local/bin:$PATH\"");

    CHECK(config.build.install_command == std::vector<std::string>{"npm", "install", "--silent"});
    CHECK(config.build.excludes == std::vector<std::string>{".git"});

    REQUIRE_FALSE(config.prewarm.command.empty());
    CHECK(config.prewarm.command.front() == "uvx");
    CHECK(config.prewarm.command.back() == "/home/u/.claude-mem/vector-db");
    CHECK(config.prewarm.hard_timeout == std::chrono::seconds(30));

    CHECK(config.service.command.front() == "bun");
    CHECK(config.health_url() == "http://127.0.0.1:37777/api/health");
    CHECK(config.web_url() == "http://localhost:37777");
}

TEST_CASE("required_directories covers cache, marketplace, logs and vector db") {
    auto config = make_default_config("/home/u", "/src");
    auto dirs = config.required_directories();
    REQUIRE(dirs.size() == 4);
    CHECK(dirs[0] == config.paths.cache_root);
    CHECK(dirs[1] == config.paths.marketplace_dir);
    CHECK(dirs[2] == config.paths.logs_dir);
    CHECK(dirs[3] == config.paths.vector_db_dir);
}

TEST_CASE("parse_install_config with an empty object yields defaults") {
    auto result = parse_install_config("{}", "/home/u", "/src");
    REQUIRE(result.ok);
    CHECK(result.warnings.empty());
    CHECK(result.config.service.port == 37777);
    CHECK(result.config.paths.marketplace_dir == "/home/u/.claude/plugins/marketplaces/thedotmack");
}

TEST_CASE("parse_install_config identity overrides flow into paths") {
    auto result = parse_install_config(
        R"({"marketplace_id": "acme", "vendor": "acme-inc", "plugin_name": "widget"})",
        "/home/u", "/src");
    REQUIRE(result.ok);
    CHECK(result.config.paths.marketplace_dir == "/home/u/.claude/plugins/marketplaces/acme");
    CHECK(result.config.paths.cache_root == "/home/u/.claude/plugins/cache/acme-inc/widget");
    CHECK(result.config.service.command[1] ==
          "/home/u/.claude/plugins/marketplaces/acme/plugin/scripts/worker-service.cjs");
}

TEST_CASE("parse_install_config section overrides") {
    auto result = parse_install_config(R"({
        "shell": {"profiles": ["${HOME}/.bashrc"], "line": "export PATH=\"${HOME}/x:$PATH\""},
        "build": {"install_command": ["bun", "install"], "excludes": [".git", "node_modules"]},
        "prewarm": {"enabled": false, "timeout_seconds": 5, "grace_ms": 100},
        "service": {"port": 4000, "health_path": "/healthz", "deadline_ms": 250, "backoff": 2.0}
    })", "/home/u", "/src");

    REQUIRE(result.ok);
    const auto& c = result.config;
    CHECK(c.shell.profiles == std::vector<std::string>{"/home/u/.bashrc"});
    // The profile line is written verbatim for the shell to expand
    CHECK(c.shell.line == "export PATH=\"${HOME}/x:$PATH\"");
    CHECK(c.build.install_command == std::vector<std::string>{"bun", "install"});
    CHECK(c.build.excludes.size() == 2);
    CHECK_FALSE(c.prewarm.enabled);
    CHECK(c.prewarm.hard_timeout == std::chrono::seconds(5));
    CHECK(c.prewarm.grace == std::chrono::milliseconds(100));
    CHECK(c.service.port == 4000);
    CHECK(c.health_url() == "http://127.0.0.1:4000/healthz");
    CHECK(c.service.deadline == std::chrono::milliseconds(250));
    CHECK(c.service.backoff == doctest::Approx(2.0));
}

TEST_CASE("parse_install_config replaces the tool list") {
    auto result = parse_install_config(R"({
        "tools": [{"name": "node", "version_command": ["node", "-v"], "path_segment": "${HOME}/n/bin"}]
    })", "/home/u", "/src");

    REQUIRE(result.ok);
    REQUIRE(result.config.tools.size() == 1);
    CHECK(result.config.tools[0].name == "node");
    CHECK(result.config.tools[0].probe == "node");
    CHECK(result.config.tools[0].path_segment == "/home/u/n/bin");
}

TEST_CASE("parse_install_config warns on unknown keys") {
    auto result = parse_install_config(R"({"colour": "blue", "service": {"speed": 1}})",
                                       "/home/u", "/src");
    REQUIRE(result.ok);
    REQUIRE(result.warnings.size() == 2);
    CHECK(result.warnings[0] == "unknown config key: colour");
    CHECK(result.warnings[1] == "unknown config key: service.speed");
}

TEST_CASE("parse_install_config rejects wrong types") {
    SUBCASE("not JSON") {
        auto result = parse_install_config("{not json", "/home/u", "/src", "cfg.json");
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("cfg.json: parse error") == 0);
    }

    SUBCASE("not an object") {
        CHECK_FALSE(parse_install_config("[]", "/home/u", "/src").ok);
    }

    SUBCASE("port out of range") {
        auto result = parse_install_config(R"({"service": {"port": 70000}})", "/home/u", "/src");
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("service.port") != std::string::npos);
    }

    SUBCASE("empty command") {
        auto result = parse_install_config(R"({"build": {"build_command": []}})", "/home/u", "/src");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "build.build_command must not be empty");
    }

    SUBCASE("empty identity") {
        auto result = parse_install_config(R"({"vendor": ""})", "/home/u", "/src");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "vendor must be a non-empty string");
    }

    SUBCASE("health path without leading slash") {
        auto result = parse_install_config(R"({"service": {"health_path": "api"}})", "/home/u", "/src");
        CHECK_FALSE(result.ok);
    }

    SUBCASE("negative duration") {
        CHECK_FALSE(parse_install_config(R"({"service": {"deadline_ms": -1}})", "/home/u", "/src").ok);
    }
}

TEST_CASE("load_install_config reads a file") {
    TempDir tmp;
    std::string path = tmp.file("memboot.json");
    write_text(path, R"({"service": {"port": 40000}})");

    auto result = load_install_config(path, "/home/u", "/src");
    REQUIRE(result.ok);
    CHECK(result.config.service.port == 40000);

    auto missing = load_install_config(tmp.file("nope.json"), "/home/u", "/src");
    CHECK_FALSE(missing.ok);
    CHECK(missing.error.find("cannot read config file") == 0);
}
