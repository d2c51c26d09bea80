#include <doctest/doctest.h>
#include <memboot/tool_ensurer.hpp>

#include "test_support.hpp"

using namespace memboot;
using namespace memboot::test;

namespace {

ToolSpec fake_tool(const std::string& name, const std::string& segment) {
    ToolSpec tool;
    tool.name = name;
    tool.probe = name;
    tool.version_command = {name, "--version"};
    tool.path_segment = segment;
    return tool;
}

// Shell snippet that "installs" an executable printing `version`
std::string installer_for(const std::string& dir, const std::string& name,
                          const std::string& version) {
    return "mkdir -p '" + dir + "' && printf '#!/bin/sh\\necho " + version + "\\n' > '" + dir +
           "/" + name + "' && chmod +x '" + dir + "/" + name + "'";
}

} // namespace

TEST_CASE("ensure_tool reports an existing tool with its version") {
    TempDir tmp;
    write_script(tmp.file("bin/memboot-bun"), "echo 1.1.38");
    auto tools = tools_with(tmp.file("bin"));
    auto tool = fake_tool("memboot-bun", tmp.file("unused"));
    tool.install_script = "exit 99";

    auto result = ensure_tool(tool, tools);
    CHECK(result.outcome == StepOutcome::AlreadySatisfied);
    CHECK(result.message == "memboot-bun 1.1.38 already installed");
    CHECK_FALSE(tools.contains(tmp.file("unused")));
}

TEST_CASE("ensure_tool installs a missing tool and extends the search path") {
    TempDir tmp;
    std::string segment = tmp.file("home/.bun/bin");
    auto tools = tools_with(tmp.file("bin"));
    auto tool = fake_tool("memboot-bun", segment);
    tool.install_script = installer_for(segment, "memboot-bun", "1.2.0");

    auto result = ensure_tool(tool, tools);
    CHECK(result.outcome == StepOutcome::Ok);
    CHECK(result.message == "memboot-bun 1.2.0 installed");
    CHECK(tools.directories().front() == segment);
    CHECK(tools.resolve("memboot-bun").has_value());

    // Second run finds it without installing
    auto again = ensure_tool(tool, tools);
    CHECK(again.outcome == StepOutcome::AlreadySatisfied);
}

TEST_CASE("ensure_tool can keep installer output off stdout") {
    TempDir tmp;
    std::string segment = tmp.file("home/.bun/bin");
    auto tools = tools_with(tmp.file("bin"));
    auto tool = fake_tool("memboot-bun", segment);
    tool.install_script = "echo 'Downloading bun...' && " + installer_for(segment, "memboot-bun", "1.2.0");

    StdioCapture capture(tmp);
    auto result = ensure_tool(tool, tools, true);
    capture.restore();

    CHECK(result.outcome == StepOutcome::Ok);
    CHECK(capture.out().find("Downloading bun...") == std::string::npos);
    CHECK(capture.err().find("Downloading bun...") != std::string::npos);
}

TEST_CASE("ensure_tool fails when the installer fails") {
    TempDir tmp;
    auto tools = tools_with(tmp.file("bin"));
    auto tool = fake_tool("memboot-uvx", tmp.file("home/.local/bin"));
    tool.install_script = "exit 7";

    auto result = ensure_tool(tool, tools);
    CHECK(result.outcome == StepOutcome::Failed);
    CHECK(result.error_kind == ErrorKind::MissingTool);
    CHECK(result.message.find("exited with status 7") != std::string::npos);
}

TEST_CASE("ensure_tool fails when the installer leaves the tool unresolvable") {
    TempDir tmp;
    auto tools = tools_with(tmp.file("bin"));
    auto tool = fake_tool("memboot-uvx", tmp.file("home/.local/bin"));
    tool.install_script = "true";

    auto result = ensure_tool(tool, tools);
    CHECK(result.is_failed());
    CHECK(result.error_kind == ErrorKind::MissingTool);
    CHECK(result.message.find("still not found after install") != std::string::npos);
}

TEST_CASE("ensure_tool without an install procedure") {
    TempDir tmp;
    auto tools = tools_with(tmp.file("bin"));
    auto tool = fake_tool("memboot-none", "");

    auto result = ensure_tool(tool, tools);
    CHECK(result.is_failed());
    CHECK(result.error_kind == ErrorKind::MissingTool);
}

TEST_CASE("probe_tool_version returns the first non-empty line") {
    TempDir tmp;
    write_script(tmp.file("bin/memboot-uv"), "echo\necho 'uv 0.4.0 (abc)  '\necho second");
    auto tools = tools_with(tmp.file("bin"));

    auto tool = fake_tool("memboot-uv", "");
    auto version = probe_tool_version(tool, tools);
    REQUIRE(version.has_value());
    CHECK(*version == "uv 0.4.0 (abc)");

    write_script(tmp.file("bin/memboot-uv"), "exit 1");
    CHECK_FALSE(probe_tool_version(tool, tools).has_value());
}
