#include "pipeline/LodPipeline.hpp"
#include <spdlog/spdlog.h>

namespace retopo::pipeline {

std::string_view toString(PipelineError error) noexcept {
    switch (error) {
        case PipelineError::MalformedMesh: return "malformed mesh";
        case PipelineError::SelectionFailed: return "no strategy produced a mesh";
        case PipelineError::ConfigError: return "invalid pipeline configuration";
    }
    return "unknown pipeline error";
}

std::vector<std::string> PipelineResult::warnings() const {
    std::vector<std::string> all;
    for (const auto& lod : lods) {
        for (const auto& warning : lod.budget.warnings) {
            all.push_back(lod.label + ": " + warning);
        }
    }
    return all;
}

bool PipelineResult::anyOverLimit() const noexcept {
    for (const auto& lod : lods) {
        if (lod.budget.overLimit) {
            return true;
        }
    }
    return false;
}

namespace components {

std::expected<core::MeshStats, PipelineFailure>
validateSource(const core::Mesh& source, const ProgressCallback& progress) {
    if (progress) {
        progress(0.05, "校验输入网格...");
    }

    if (auto valid = source.validate(); !valid) {
        return std::unexpected(PipelineFailure{PipelineError::MalformedMesh,
                                               std::string(core::toString(valid.error()))});
    }

    return core::computeStats(source);
}

std::expected<LodResult, PipelineFailure>
buildLod(const core::Mesh& source,
         const core::LodSpec& spec,
         const remesh::StrategySelector& selector,
         const core::CleanupPolicy& policy) {
    auto selected = selector.select(source, spec.targetFaceCount);
    if (!selected) {
        std::string message = spec.label + ": " + std::string(remesh::toString(selected.error().error));
        if (!selected.error().trail.empty()) {
            message += " (" + selected.error().trail.back().reason + ")";
        }
        return std::unexpected(PipelineFailure{PipelineError::SelectionFailed, std::move(message)});
    }

    auto& outcome = selected.value();
    // LOD0 即使没有被重拓扑也要做预算清理
    auto enforced = core::enforceBudget(outcome.mesh, policy);

    LodResult result;
    result.label = spec.label;
    result.targetFaceCount = spec.targetFaceCount;
    result.mesh = std::move(enforced.mesh);
    result.faceCount = result.mesh.faceCount();
    result.strategyUsed = outcome.strategy;
    result.budget = std::move(enforced.result);
    result.islands = outcome.islands;
    result.trail = std::move(outcome.trail);
    return result;
}

} // namespace components

// LodPipeline 实现
std::expected<PipelineResult, PipelineFailure> LodPipeline::execute(const core::Mesh& source) {
    return execute(source, nullptr, nullptr);
}

std::expected<PipelineResult, PipelineFailure>
LodPipeline::execute(const core::Mesh& source,
                     const ProgressCallback& progressCallback,
                     const LogCallback& logCallback) {
    PipelineResult result;
    startTime_ = std::chrono::steady_clock::now();
    currentProgress_ = 0.0;

    log("debug", "开始执行LOD生成管道", logCallback);

    // 步骤1: 校验
    auto stats = components::validateSource(source, progressCallback);
    if (!stats) {
        log("warn", "输入网格无效: " + stats.error().message, logCallback);
        return std::unexpected(stats.error());
    }
    result.sourceStats = stats.value();

    // 步骤2: 逐个 LOD 在原始网格上生成
    const auto& specs = config_.lods;
    for (size_t i = 0; i < specs.size(); ++i) {
        updateProgress(0.1 + 0.9 * static_cast<double>(i) / static_cast<double>(specs.size()),
                       "生成 " + specs[i].label, progressCallback);

        auto lod = components::buildLod(source, specs[i], selector_, config_.cleanup);
        if (!lod) {
            log("error", "LOD生成失败: " + lod.error().message, logCallback);
            return std::unexpected(lod.error());
        }

        log("info", lod->label + ": " + std::to_string(lod->faceCount) + " faces via "
                + std::string(remesh::toString(lod->strategyUsed))
                + ", " + std::to_string(lod->budget.bufferCount) + " vertex buffers", logCallback);
        for (const auto& warning : lod->budget.warnings) {
            log("warn", lod->label + ": " + warning, logCallback);
        }

        result.lods.push_back(std::move(lod.value()));
    }

    if (!result.lods.empty()) {
        result.sourceIslands = result.lods.front().islands;
    }

    updateProgress(1.0, "处理完成", progressCallback);

    auto endTime = std::chrono::steady_clock::now();
    result.processingTime = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime_);

    log("debug", "LOD生成管道执行成功，耗时: " + std::to_string(result.processingTime.count()) + "ms", logCallback);

    return result;
}

void LodPipeline::updateProgress(double progress, const std::string& message,
                                 const ProgressCallback& callback) const {
    currentProgress_ = progress;
    if (callback) {
        callback(progress, message);
    }
}

void LodPipeline::log(const std::string& level, const std::string& message,
                      const LogCallback& callback) const {
    if (config_.enableLogging) {
        if (callback) {
            callback(level, message);
        } else {
            // 使用默认日志记录
            if (level == "error") {
                spdlog::error(message);
            } else if (level == "warn") {
                spdlog::warn(message);
            } else if (level == "info") {
                spdlog::info(message);
            } else if (level == "debug") {
                spdlog::debug(message);
            } else {
                spdlog::trace(message);
            }
        }
    }
}

LodPipeline PipelineBuilder::build() {
    auto quadRemesher = quadRemesher_ ? quadRemesher_ : std::shared_ptr<const core::IQuadRemesher>(core::createQuadRemesher());
    auto decimator = decimator_ ? decimator_ : std::shared_ptr<const core::IDecimator>(core::createDecimator());
    return LodPipeline{config_, remesh::StrategySelector{external_, std::move(quadRemesher), std::move(decimator), selectorConfig_}};
}

// 工厂函数实现
PipelineBuilder createPipeline() {
    return PipelineBuilder{};
}

std::expected<void, PipelineError> validateConfig(const PipelineConfig& config) {
    if (config.lods.empty()) {
        return std::unexpected(PipelineError::ConfigError);
    }
    for (const auto& spec : config.lods) {
        if (spec.label.empty() || spec.targetFaceCount == 0) {
            return std::unexpected(PipelineError::ConfigError);
        }
    }
    if (config.cleanup.maxBuffers == 0) {
        return std::unexpected(PipelineError::ConfigError);
    }
    return {};
}

} // namespace retopo::pipeline
