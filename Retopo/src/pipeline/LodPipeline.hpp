#pragma once

#include "../core/AttributeBudget.hpp"
#include "../core/Mesh.hpp"
#include "../core/Types.hpp"
#include "../remesh/StrategySelector.hpp"
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace retopo::pipeline {

// 管道错误类型
enum class PipelineError {
    MalformedMesh,
    SelectionFailed,
    ConfigError
};

[[nodiscard]] std::string_view toString(PipelineError error) noexcept;

struct PipelineFailure {
    PipelineError error{PipelineError::MalformedMesh};
    std::string message;
};

// 管道配置：每次处理一个模型时可以整体替换
struct PipelineConfig {
    std::vector<core::LodSpec> lods{core::defaultLodSpecs()};
    core::CleanupPolicy cleanup;
    bool enableLogging{true};
};

// 进度回调函数类型
using ProgressCallback = std::function<void(double progress, const std::string& message)>;
using LogCallback = std::function<void(const std::string& level, const std::string& message)>;

// 单个 LOD 的结果
struct LodResult {
    std::string label;
    core::Mesh mesh;
    size_t targetFaceCount{0};
    size_t faceCount{0};
    remesh::StrategyKind strategyUsed{remesh::StrategyKind::None};
    core::AttributeBudgetResult budget;
    core::IslandReport islands;
    std::vector<remesh::StrategyAttempt> trail;
};

// 管道结果
struct PipelineResult {
    std::vector<LodResult> lods;
    core::MeshStats sourceStats;
    core::IslandReport sourceIslands;
    std::chrono::milliseconds processingTime{0};

    // 所有 LOD 的预算警告
    [[nodiscard]] std::vector<std::string> warnings() const;
    [[nodiscard]] bool anyOverLimit() const noexcept;
};

// 函数式管道组件
namespace components {

// 校验阶段：结构错误的网格直接失败
[[nodiscard]] std::expected<core::MeshStats, PipelineFailure>
validateSource(const core::Mesh& source, const ProgressCallback& progress = nullptr);

// 核心处理阶段：对原始网格选择策略，再做属性预算清理
[[nodiscard]] std::expected<LodResult, PipelineFailure>
buildLod(const core::Mesh& source,
         const core::LodSpec& spec,
         const remesh::StrategySelector& selector,
         const core::CleanupPolicy& policy);

} // namespace components

// 主管道类
class LodPipeline {
public:
    LodPipeline(PipelineConfig config, remesh::StrategySelector selector)
        : config_(std::move(config)), selector_(std::move(selector)) {}

    // 按 LOD 顺序执行；源网格不会被修改
    [[nodiscard]] std::expected<PipelineResult, PipelineFailure> execute(const core::Mesh& source);

    // 执行管道（带回调）
    [[nodiscard]] std::expected<PipelineResult, PipelineFailure>
    execute(const core::Mesh& source,
            const ProgressCallback& progressCallback,
            const LogCallback& logCallback = nullptr);

    // 配置访问
    const PipelineConfig& config() const noexcept { return config_; }
    void updateConfig(PipelineConfig newConfig) { config_ = std::move(newConfig); }

    const remesh::StrategySelector& selector() const noexcept { return selector_; }

private:
    PipelineConfig config_;
    remesh::StrategySelector selector_;

    // 内部状态
    mutable std::chrono::steady_clock::time_point startTime_;
    mutable double currentProgress_{0.0};

    // 辅助方法
    void updateProgress(double progress, const std::string& message,
                        const ProgressCallback& callback) const;
    void log(const std::string& level, const std::string& message,
             const LogCallback& callback) const;
};

// 函数式管道构建器
class PipelineBuilder {
public:
    PipelineBuilder() = default;

    // 链式配置
    PipelineBuilder& withLods(std::vector<core::LodSpec> lods) {
        config_.lods = std::move(lods);
        return *this;
    }

    PipelineBuilder& withCleanupPolicy(core::CleanupPolicy policy) {
        config_.cleanup = policy;
        return *this;
    }

    PipelineBuilder& withSelectorConfig(remesh::SelectorConfig config) {
        selectorConfig_ = std::move(config);
        return *this;
    }

    PipelineBuilder& withExternalRemesher(std::shared_ptr<const remesh::IExternalRemesher> external) {
        external_ = std::move(external);
        return *this;
    }

    PipelineBuilder& withQuadRemesher(std::shared_ptr<const core::IQuadRemesher> quadRemesher) {
        quadRemesher_ = std::move(quadRemesher);
        return *this;
    }

    PipelineBuilder& withDecimator(std::shared_ptr<const core::IDecimator> decimator) {
        decimator_ = std::move(decimator);
        return *this;
    }

    PipelineBuilder& withLogging(bool enable) {
        config_.enableLogging = enable;
        return *this;
    }

    // 构建管道；未指定的内置重拓扑/减面使用默认实现
    [[nodiscard]] LodPipeline build();

private:
    PipelineConfig config_;
    remesh::SelectorConfig selectorConfig_;
    std::shared_ptr<const remesh::IExternalRemesher> external_;
    std::shared_ptr<const core::IQuadRemesher> quadRemesher_;
    std::shared_ptr<const core::IDecimator> decimator_;
};

// 工厂函数
[[nodiscard]] PipelineBuilder createPipeline();

// 验证配置
[[nodiscard]] std::expected<void, PipelineError> validateConfig(const PipelineConfig& config);

} // namespace retopo::pipeline
