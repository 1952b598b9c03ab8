#include <catch2/catch_test_macros.hpp>
#include "../src/remesh/ExternalRemesher.hpp"
#include "TestMeshes.hpp"
#include <algorithm>

using namespace retopo;
using namespace retopo::remesh;
using namespace retopo::test;

namespace {

ExternalRemesherInvoker makeInvoker(const TempDir& dir, const std::filesystem::path& tool) {
    ExternalRemesherConfig config;
    config.toolPath = tool;
    config.workingRoot = dir.path() / "work";
    return ExternalRemesherInvoker{config};
}

RemesherOptions quickOptions() {
    RemesherOptions options;
    options.timeout = std::chrono::seconds{10};
    return options;
}

} // namespace

TEST_CASE("Remesher command line", "[external_remesher]") {
    SECTION("Default options") {
        auto args = buildArguments("in.ply", "out.ply", 1500, RemesherOptions{});

        REQUIRE(args == std::vector<std::string>{
            "-o", "out.ply", "-f", "1500", "-r", "4", "-p", "4", "-c", "30", "-S", "2", "-b", "in.ply"});
    }

    SECTION("Deterministic without boundary alignment") {
        RemesherOptions options;
        options.alignBoundaries = false;
        options.deterministic = true;
        options.creaseAngleDegrees = 22.5f;
        options.smoothIterations = 0;

        auto args = buildArguments("a.ply", "b.ply", 500, options);
        REQUIRE(std::find(args.begin(), args.end(), "-b") == args.end());
        REQUIRE(std::find(args.begin(), args.end(), "-d") != args.end());
        REQUIRE(args[9] == "22.5");
        REQUIRE(args[11] == "0");
        REQUIRE(args.back() == "a.ply");
    }
}

TEST_CASE("Remesher tool resolution", "[external_remesher]") {
    TempDir dir;

    SECTION("Configured path that does not exist is missing") {
        ExternalRemesherConfig config;
        config.toolPath = dir.path() / "no-such-tool";
        config.searchLocations = {writeTool(dir, "fallback", "exit 0")};
        ExternalRemesherInvoker invoker{config};

        REQUIRE_FALSE(invoker.resolveTool().has_value());

        auto outcome = invoker.invoke(makeCube(), 4, quickOptions());
        auto* missing = std::get_if<ToolMissing>(&outcome);
        REQUIRE(missing != nullptr);
        REQUIRE(missing->detail.find("no-such-tool") != std::string::npos);
    }

    SECTION("Configured file without execute permission is missing") {
        auto plain = dir.write("plain-tool", "#!/bin/sh\nexit 0\n");
        std::filesystem::permissions(plain,
                                     std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace);
        auto invoker = makeInvoker(dir, plain);

        REQUIRE_FALSE(invoker.resolveTool().has_value());

        auto outcome = invoker.invoke(makeCube(), 4, quickOptions());
        auto* missing = std::get_if<ToolMissing>(&outcome);
        REQUIRE(missing != nullptr);
        REQUIRE(missing->detail.find("plain-tool") != std::string::npos);
    }

    SECTION("Non-executable search locations are skipped") {
        auto plain = dir.write("plain-tool", "#!/bin/sh\nexit 0\n");
        std::filesystem::permissions(plain, std::filesystem::perms::owner_read,
                                     std::filesystem::perm_options::replace);
        auto runnable = writeTool(dir, "runnable", "exit 0");
        ExternalRemesherConfig config;
        config.searchLocations = {plain, runnable};
        ExternalRemesherInvoker invoker{config};

        REQUIRE(invoker.resolveTool() == runnable);
    }

    SECTION("Search locations are tried in order") {
        auto second = writeTool(dir, "second", "exit 0");
        auto third = writeTool(dir, "third", "exit 0");
        ExternalRemesherConfig config;
        config.searchLocations = {dir.path() / "first", second, third};
        ExternalRemesherInvoker invoker{config};

        REQUIRE(invoker.resolveTool() == second);
    }

    SECTION("Nothing found") {
        ExternalRemesherConfig config;
        config.searchLocations = {dir.path() / "a", dir.path() / "b"};
        auto invoker = createExternalRemesher(config);

        auto outcome = invoker->invoke(makeCube(), 4, quickOptions());
        REQUIRE(std::holds_alternative<ToolMissing>(outcome));
        REQUIRE_FALSE(succeeded(outcome));
    }

    SECTION("Default locations are platform specific") {
        REQUIRE_FALSE(defaultToolLocations().empty());
    }
}

TEST_CASE("Remesher process outcomes", "[external_remesher]") {
    TempDir dir;

    SECTION("Success reads the output file back") {
        // 把输入原样复制为输出
        auto tool = writeTool(dir, "copy-tool", kCopyToolScript);
        auto invoker = makeInvoker(dir, tool);

        auto outcome = invoker.invoke(makeCube(), 4, quickOptions());
        REQUIRE(succeeded(outcome));
        const auto& mesh = std::get<RemesherSuccess>(outcome).mesh;
        REQUIRE(mesh.faceCount() == 6);
        REQUIRE(mesh.vertexCount() == 8);
        REQUIRE(describe(outcome) == "success (6 faces)");
    }

    SECTION("Non-zero exit keeps stderr") {
        auto tool = writeTool(dir, "fail-tool", "echo \"non-manifold input\" >&2\nexit 3");
        auto invoker = makeInvoker(dir, tool);

        auto outcome = invoker.invoke(makeCube(), 4, quickOptions());
        auto* failed = std::get_if<ProcessFailed>(&outcome);
        REQUIRE(failed != nullptr);
        REQUIRE(failed->exitCode == 3);
        REQUIRE(failed->stderrText == "non-manifold input");
        REQUIRE(describe(outcome) == "process failed (exit 3): non-manifold input");
    }

    SECTION("Zero exit without output file") {
        auto tool = writeTool(dir, "lazy-tool", "exit 0");
        auto invoker = makeInvoker(dir, tool);

        auto outcome = invoker.invoke(makeCube(), 4, quickOptions());
        auto* failed = std::get_if<ProcessFailed>(&outcome);
        REQUIRE(failed != nullptr);
        REQUIRE(failed->exitCode == 0);
        REQUIRE(failed->stderrText == "no output file produced");
    }

    SECTION("Unreadable output file") {
        auto tool = writeTool(dir, "garbage-tool", "echo garbage > \"$2\"");
        auto invoker = makeInvoker(dir, tool);

        auto outcome = invoker.invoke(makeCube(), 4, quickOptions());
        auto* failed = std::get_if<ProcessFailed>(&outcome);
        REQUIRE(failed != nullptr);
        REQUIRE(failed->stderrText.find("cannot read remesher output") != std::string::npos);
    }

    SECTION("Output with out-of-range values is a process failure") {
        // 材质索引远超合理范围
        auto tool = writeTool(dir, "overflow-tool", R"(printf 'ply\nformat ascii 1.0\nelement vertex 3\nproperty float x\nproperty float y\nproperty float z\nelement face 1\nproperty list uchar int vertex_indices\nproperty int material_index\nend_header\n0 0 0\n1 0 0\n0 1 0\n3 0 1 2 2000000000\n' > "$2")");
        auto invoker = makeInvoker(dir, tool);

        auto outcome = invoker.invoke(makeCube(), 4, quickOptions());
        auto* failed = std::get_if<ProcessFailed>(&outcome);
        REQUIRE(failed != nullptr);
        REQUIRE(failed->stderrText == "cannot read remesher output: invalid PLY format");
    }

    SECTION("Timeout terminates the process") {
        auto tool = writeTool(dir, "slow-tool", "exec sleep 30");
        auto invoker = makeInvoker(dir, tool);
        RemesherOptions options;
        options.timeout = std::chrono::seconds{1};

        const auto started = std::chrono::steady_clock::now();
        auto outcome = invoker.invoke(makeCube(), 4, options);
        const auto elapsed = std::chrono::steady_clock::now() - started;

        auto* timedOut = std::get_if<ProcessTimedOut>(&outcome);
        REQUIRE(timedOut != nullptr);
        REQUIRE(timedOut->timeout == std::chrono::seconds{1});
        REQUIRE(elapsed < std::chrono::seconds{10});
        REQUIRE(describe(outcome) == "timed out after 1s");
    }

    SECTION("Temporary files are removed") {
        auto tool = writeTool(dir, "copy-tool", kCopyToolScript);
        auto invoker = makeInvoker(dir, tool);
        std::filesystem::create_directories(dir.path() / "work");

        auto outcome = invoker.invoke(makeCube(), 4, quickOptions());
        REQUIRE(succeeded(outcome));
        REQUIRE(std::filesystem::is_empty(dir.path() / "work"));
    }

    SECTION("Temporary files can be retained") {
        auto tool = writeTool(dir, "copy-tool", kCopyToolScript);
        auto invoker = makeInvoker(dir, tool);
        auto options = quickOptions();
        options.retainTemporaryFiles = true;

        auto outcome = invoker.invoke(makeCube(), 4, options);
        REQUIRE(succeeded(outcome));

        size_t kept = 0;
        for (const auto& entry : std::filesystem::directory_iterator(dir.path() / "work")) {
            REQUIRE(std::filesystem::exists(entry.path() / "input.ply"));
            REQUIRE(std::filesystem::exists(entry.path() / "output.ply"));
            ++kept;
        }
        REQUIRE(kept == 1);
    }
}

TEST_CASE("Outcome descriptions", "[external_remesher]") {
    REQUIRE(describe(ToolMissing{}) == "tool missing");
    REQUIRE(describe(ToolMissing{"not found"}) == "tool missing: not found");
    REQUIRE(describe(ProcessFailed{-1, ""}) == "process failed (exit -1)");
}
