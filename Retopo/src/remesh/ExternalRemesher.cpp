#include "remesh/ExternalRemesher.hpp"
#include "io/PlyIO.hpp"
#include <boost/process.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <random>
#include <system_error>

namespace retopo::remesh {

namespace bp = boost::process;

namespace {

constexpr size_t kMaxStderrBytes = 4096;

template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// 调用期间的临时目录，析构时删除
class TempWorkspace {
public:
    TempWorkspace(const std::filesystem::path& root, bool retain)
        : retain_(retain) {
        static std::atomic<unsigned> counter{0};
        std::error_code ec;
        const auto base = root.empty() ? std::filesystem::temp_directory_path(ec) : root;
        if (ec) {
            error_ = ec.message();
            return;
        }
        std::random_device device;
        dir_ = base / fmt::format("retopo-{:08x}-{}", device(), counter.fetch_add(1));
        std::filesystem::create_directories(dir_, ec);
        if (ec) {
            error_ = ec.message();
            dir_.clear();
        }
    }

    ~TempWorkspace() {
        if (dir_.empty()) {
            return;
        }
        if (retain_) {
            spdlog::info("external remesher: temporary files kept in {}", dir_.string());
            return;
        }
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
        if (ec) {
            spdlog::warn("external remesher: failed to remove {}: {}", dir_.string(), ec.message());
        }
    }

    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    bool valid() const noexcept { return !dir_.empty(); }
    const std::string& error() const noexcept { return error_; }
    std::filesystem::path file(const char* name) const { return dir_ / name; }

private:
    std::filesystem::path dir_;
    std::string error_;
    bool retain_{false};
};

std::string readTail(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return {};
    }
    std::string text{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (text.size() > kMaxStderrBytes) {
        text.erase(0, text.size() - kMaxStderrBytes);
    }
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

bool isExecutableFile(const std::filesystem::path& path) {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::is_regular_file(status)) {
        return false;
    }
#if defined(_WIN32)
    return true;
#else
    using std::filesystem::perms;
    return (status.permissions() & (perms::owner_exec | perms::group_exec | perms::others_exec)) != perms::none;
#endif
}

} // namespace

std::vector<std::filesystem::path> defaultToolLocations() {
    std::vector<std::filesystem::path> locations;
#if defined(_WIN32)
    locations.emplace_back("C:/Program Files/Instant Meshes/Instant Meshes.exe");
    if (const char* local = std::getenv("LOCALAPPDATA")) {
        locations.emplace_back(std::filesystem::path(local) / "Instant Meshes" / "Instant Meshes.exe");
    }
#elif defined(__APPLE__)
    locations.emplace_back("/Applications/Instant Meshes.app/Contents/MacOS/Instant Meshes");
    if (const char* home = std::getenv("HOME")) {
        locations.emplace_back(std::filesystem::path(home) / "Applications/Instant Meshes.app/Contents/MacOS/Instant Meshes");
    }
#else
    locations.emplace_back("/usr/local/bin/instant-meshes");
    locations.emplace_back("/usr/bin/instant-meshes");
    locations.emplace_back("/opt/instant-meshes/Instant Meshes");
    if (const char* home = std::getenv("HOME")) {
        locations.emplace_back(std::filesystem::path(home) / ".local/bin/instant-meshes");
    }
#endif
    return locations;
}

std::string describe(const RemesherOutcome& outcome) {
    return std::visit(Overloaded{
        [](const RemesherSuccess& success) {
            return fmt::format("success ({} faces)", success.mesh.faceCount());
        },
        [](const ToolMissing& missing) {
            return missing.detail.empty() ? std::string("tool missing") : "tool missing: " + missing.detail;
        },
        [](const ProcessTimedOut& timedOut) {
            return fmt::format("timed out after {}s", timedOut.timeout.count());
        },
        [](const ProcessFailed& failed) {
            return failed.stderrText.empty()
                ? fmt::format("process failed (exit {})", failed.exitCode)
                : fmt::format("process failed (exit {}): {}", failed.exitCode, failed.stderrText);
        }}, outcome);
}

std::vector<std::string> buildArguments(const std::filesystem::path& input,
                                        const std::filesystem::path& output,
                                        size_t targetFaces,
                                        const RemesherOptions& options) {
    std::vector<std::string> args{
        "-o", output.string(),
        "-f", std::to_string(targetFaces),
        "-r", "4",
        "-p", "4",
        "-c", fmt::format("{}", options.creaseAngleDegrees),
        "-S", std::to_string(options.smoothIterations)};
    if (options.alignBoundaries) {
        args.emplace_back("-b");
    }
    if (options.deterministic) {
        args.emplace_back("-d");
    }
    args.push_back(input.string());
    return args;
}

ExternalRemesherInvoker::ExternalRemesherInvoker(ExternalRemesherConfig config)
    : config_(std::move(config)) {}

std::optional<std::filesystem::path> ExternalRemesherInvoker::resolveTool() const {
    if (config_.toolPath) {
        if (isExecutableFile(*config_.toolPath)) {
            return config_.toolPath;
        }
        return std::nullopt;
    }
    for (const auto& candidate : config_.searchLocations) {
        if (isExecutableFile(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

RemesherOutcome ExternalRemesherInvoker::invoke(const core::Mesh& input, size_t targetFaces,
                                                const RemesherOptions& options) const {
    const auto tool = resolveTool();
    if (!tool) {
        const auto detail = config_.toolPath
            ? "configured path is not an executable file: " + config_.toolPath->string()
            : std::string("not found in default install locations");
        spdlog::debug("external remesher: {}", detail);
        return ToolMissing{detail};
    }

    TempWorkspace workspace(config_.workingRoot, options.retainTemporaryFiles);
    if (!workspace.valid()) {
        return ProcessFailed{-1, "cannot create temporary directory: " + workspace.error()};
    }

    const auto inputPath = workspace.file("input.ply");
    const auto outputPath = workspace.file("output.ply");
    const auto stdoutPath = workspace.file("stdout.log");
    const auto stderrPath = workspace.file("stderr.log");

    if (auto written = io::writePly(input, inputPath); !written) {
        return ProcessFailed{-1, "cannot write interchange file: " + std::string(io::toString(written.error()))};
    }

    const auto args = buildArguments(inputPath, outputPath, targetFaces, options);
    if (spdlog::should_log(spdlog::level::debug)) {
        std::string commandLine = tool->string();
        for (const auto& arg : args) {
            commandLine += ' ' + arg;
        }
        spdlog::debug("external remesher: {}", commandLine);
    }

    std::error_code ec;
    std::optional<bp::child> child;
    try {
        child.emplace(bp::exe = tool->string(),
                      bp::args = args,
                      bp::std_in < bp::null,
                      bp::std_out > stdoutPath.string(),
                      bp::std_err > stderrPath.string(),
                      ec);
    } catch (const bp::process_error& e) {
        return ProcessFailed{-1, e.what()};
    }
    if (ec) {
        return ProcessFailed{-1, "launch failed: " + ec.message()};
    }

    const auto started = std::chrono::steady_clock::now();
    const bool exited = child->wait_for(options.timeout, ec);
    if (ec) {
        std::error_code killError;
        child->terminate(killError);
        return ProcessFailed{-1, "wait failed: " + ec.message()};
    }
    if (!exited) {
        // terminate 会同时回收子进程
        std::error_code killError;
        child->terminate(killError);
        if (killError) {
            spdlog::warn("external remesher: terminate failed: {}", killError.message());
        }
        return ProcessTimedOut{options.timeout};
    }

    const int exitCode = child->exit_code();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    spdlog::debug("external remesher: exit {} after {}ms", exitCode, elapsed.count());

    if (exitCode != 0) {
        return ProcessFailed{exitCode, readTail(stderrPath)};
    }

    std::error_code existsError;
    if (!std::filesystem::exists(outputPath, existsError)) {
        auto text = readTail(stderrPath);
        return ProcessFailed{exitCode, text.empty() ? std::string("no output file produced") : text};
    }

    try {
        io::StandardPlyReader reader;
        auto mesh = reader.readPly(outputPath);
        if (!mesh) {
            return ProcessFailed{exitCode, "cannot read remesher output: " + std::string(io::toString(mesh.error()))};
        }

        // 工具输出可能带有未被引用的顶点
        return RemesherSuccess{mesh->compacted()};
    } catch (const std::exception& e) {
        return ProcessFailed{exitCode, std::string("cannot read remesher output: ") + e.what()};
    }
}

std::unique_ptr<IExternalRemesher> createExternalRemesher(ExternalRemesherConfig config) {
    return std::make_unique<ExternalRemesherInvoker>(std::move(config));
}

} // namespace retopo::remesh
