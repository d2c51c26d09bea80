#include <doctest/doctest.h>
#include <memboot/service.hpp>

#include "test_support.hpp"

#include <thread>

using namespace memboot;
using namespace memboot::test;
using std::chrono::milliseconds;

namespace {

struct ServiceFixture {
    TempDir tmp;
    InstallConfig config;
    ToolLocations tools;
    std::string marker;

    ServiceFixture() {
        config = make_default_config(tmp.file("home"), tmp.file("src"));
        tools = tools_with(tmp.file("bin"));
        marker = tmp.file("worker-started");

        write_script(tmp.file("bin/memboot-worker"), "touch '" + marker + "'");
        config.service.command = {"memboot-worker", "start"};
        config.service.initial_delay = milliseconds(0);
        config.service.interval = milliseconds(10);
        config.service.max_interval = milliseconds(20);
        config.service.deadline = milliseconds(1000);

        config.prewarm.command = {"memboot-uvx", "chroma-mcp"};
        config.prewarm.grace = milliseconds(5000);
    }

    bool worker_started() const { return wait_for_path(marker); }
};

} // namespace

// ============================================================================
// Worker service
// ============================================================================

TEST_CASE("launch_service does not start a second worker") {
    ServiceFixture f;
    ScriptedProbe probe({true});

    auto result = launch_service(f.config, f.tools, probe);
    CHECK(result.outcome == StepOutcome::AlreadySatisfied);
    CHECK(result.message == "Worker already running on port 37777");
    CHECK(probe.calls() == 1);
    std::this_thread::sleep_for(milliseconds(100));
    CHECK_FALSE(path_exists(f.marker));
}

TEST_CASE("launch_service starts the worker and waits for health") {
    ServiceFixture f;
    ScriptedProbe probe({false, false, true});

    auto result = launch_service(f.config, f.tools, probe);
    CHECK(result.outcome == StepOutcome::Ok);
    CHECK(result.message == "Worker running on port 37777");
    CHECK(f.worker_started());
}

TEST_CASE("launch_service warns when the worker never becomes healthy") {
    ServiceFixture f;
    f.config.service.deadline = milliseconds(100);
    ScriptedProbe probe({false});

    auto result = launch_service(f.config, f.tools, probe);
    CHECK(result.outcome == StepOutcome::Warning);
    CHECK(result.error_kind == ErrorKind::ServiceUnreachable);
    CHECK(result.message ==
          "Worker may not have started - check logs at " + f.config.paths.logs_dir + "/");
}

TEST_CASE("launch_service warns when the worker cannot be spawned") {
    ServiceFixture f;
    f.config.service.command = {"memboot-no-such-runtime", "worker.cjs", "start"};
    ScriptedProbe probe({false});

    auto result = launch_service(f.config, f.tools, probe);
    CHECK(result.outcome == StepOutcome::Warning);
    CHECK(result.error_kind == ErrorKind::ServiceUnreachable);
    CHECK(result.message.find("command not found") != std::string::npos);
}

// ============================================================================
// Prewarm
// ============================================================================

TEST_CASE("prewarm_command wraps the command in timeout when available") {
    ServiceFixture f;

    ToolLocations bare({f.tmp.file("bin")});
    CHECK(prewarm_command(f.config, bare) == f.config.prewarm.command);

    if (f.tools.resolve("timeout")) {
        auto argv = prewarm_command(f.config, f.tools);
        REQUIRE(argv.size() == f.config.prewarm.command.size() + 2);
        CHECK(argv[0] == "timeout");
        CHECK(argv[1] == "30");
        CHECK(argv[2] == "memboot-uvx");
    }

    f.config.prewarm.hard_timeout = std::chrono::seconds(0);
    CHECK(prewarm_command(f.config, f.tools) == f.config.prewarm.command);
}

TEST_CASE("run_prewarm outcomes") {
    ServiceFixture f;

    SUBCASE("disabled") {
        f.config.prewarm.enabled = false;
        CHECK(run_prewarm(f.config, f.tools).outcome == StepOutcome::Skipped);
    }

    SUBCASE("engine not installed") {
        auto result = run_prewarm(f.config, f.tools);
        CHECK(result.outcome == StepOutcome::Warning);
        CHECK(result.error_kind == ErrorKind::PrewarmFailure);
    }

    SUBCASE("engine exits cleanly") {
        write_script(f.tmp.file("bin/memboot-uvx"), "exit 0");
        auto result = run_prewarm(f.config, f.tools);
        CHECK(result.outcome == StepOutcome::Ok);
        CHECK(result.message == "Vector database models cached");
        CHECK(result.details.empty());
    }

    SUBCASE("engine exits with an error") {
        write_script(f.tmp.file("bin/memboot-uvx"), "exit 2");
        auto result = run_prewarm(f.config, f.tools);
        CHECK(result.outcome == StepOutcome::Warning);
        CHECK(result.error_kind == ErrorKind::PrewarmFailure);
    }

    SUBCASE("engine keeps running and is stopped after the grace period") {
        write_script(f.tmp.file("bin/memboot-uvx"), "sleep 30");
        f.config.prewarm.grace = milliseconds(200);

        auto start = std::chrono::steady_clock::now();
        auto result = run_prewarm(f.config, f.tools);
        auto elapsed = std::chrono::steady_clock::now() - start;

        CHECK(result.outcome == StepOutcome::Ok);
        REQUIRE(result.details.size() == 1);
        CHECK(result.details[0] == "prewarm process stopped after 200 ms");
        CHECK(elapsed < std::chrono::seconds(10));
    }
}
