#pragma once

#include "../core/Mesh.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace retopo::remesh {

// 外部重拓扑工具的四种结果
struct RemesherSuccess {
    core::Mesh mesh;
};

struct ToolMissing {
    std::string detail;
};

struct ProcessTimedOut {
    std::chrono::seconds timeout{0};
};

struct ProcessFailed {
    int exitCode{-1};
    std::string stderrText;
};

using RemesherOutcome = std::variant<RemesherSuccess, ToolMissing, ProcessTimedOut, ProcessFailed>;

// 单模型与批处理的默认超时
inline constexpr std::chrono::seconds kSingleModelTimeout{300};
inline constexpr std::chrono::seconds kBatchTimeout{600};

// 每次调用的参数
struct RemesherOptions {
    std::chrono::seconds timeout{kSingleModelTimeout};
    float creaseAngleDegrees{30.0f};
    int smoothIterations{2};
    bool alignBoundaries{true};
    bool deterministic{false};
    bool retainTemporaryFiles{false};
};

// 工具定位与临时目录
struct ExternalRemesherConfig {
    std::optional<std::filesystem::path> toolPath;          // 显式配置优先；不存在即视为缺失
    std::vector<std::filesystem::path> searchLocations;     // 未配置时依次查找，通常取 defaultToolLocations()
    std::filesystem::path workingRoot;                      // 空 = 系统临时目录
};

// 当前平台的默认安装位置
[[nodiscard]] std::vector<std::filesystem::path> defaultToolLocations();

// 简短的结果描述，用于日志和回退记录
[[nodiscard]] std::string describe(const RemesherOutcome& outcome);

[[nodiscard]] inline bool succeeded(const RemesherOutcome& outcome) noexcept {
    return std::holds_alternative<RemesherSuccess>(outcome);
}

// 外部重拓扑接口
class IExternalRemesher {
public:
    virtual ~IExternalRemesher() = default;

    virtual RemesherOutcome invoke(const core::Mesh& input, size_t targetFaces, const RemesherOptions& options) const = 0;
};

// 以子进程方式运行命令行重拓扑工具，同步等待并受超时约束
class ExternalRemesherInvoker : public IExternalRemesher {
public:
    explicit ExternalRemesherInvoker(ExternalRemesherConfig config);

    RemesherOutcome invoke(const core::Mesh& input, size_t targetFaces, const RemesherOptions& options) const override;

    // 解析可执行文件位置；找不到返回空
    [[nodiscard]] std::optional<std::filesystem::path> resolveTool() const;

    const ExternalRemesherConfig& config() const noexcept { return config_; }

private:
    ExternalRemesherConfig config_;
};

// 纯函数：-o <out> -f <target> -r 4 -p 4 -c <crease> -S <smooth> -b [-d] <in>
[[nodiscard]] std::vector<std::string> buildArguments(const std::filesystem::path& input,
                                                      const std::filesystem::path& output,
                                                      size_t targetFaces,
                                                      const RemesherOptions& options);

// 工厂函数
[[nodiscard]] std::unique_ptr<IExternalRemesher> createExternalRemesher(ExternalRemesherConfig config);

} // namespace retopo::remesh
