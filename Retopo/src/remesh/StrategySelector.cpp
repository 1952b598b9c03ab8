#include "remesh/StrategySelector.hpp"
#include <spdlog/spdlog.h>

namespace retopo::remesh {

std::string_view toString(StrategyKind kind) noexcept {
    switch (kind) {
        case StrategyKind::None: return "none";
        case StrategyKind::External: return "external";
        case StrategyKind::QuadRemesh: return "quad_remesh";
        case StrategyKind::Decimate: return "decimate";
    }
    return "unknown";
}

std::string_view toString(SelectionError error) noexcept {
    switch (error) {
        case SelectionError::EmptyMesh: return "empty mesh";
        case SelectionError::DecimationFailed: return "decimation fallback failed";
    }
    return "unknown selection error";
}

bool isMeshSoup(const core::IslandReport& report, size_t threshold) noexcept {
    return report.islandCount == 0 || report.islandCount >= threshold;
}

StrategySelector::StrategySelector(std::shared_ptr<const IExternalRemesher> external,
                                   std::shared_ptr<const core::IQuadRemesher> quadRemesher,
                                   std::shared_ptr<const core::IDecimator> decimator,
                                   SelectorConfig config)
    : external_(std::move(external)),
      quadRemesher_(std::move(quadRemesher)),
      decimator_(std::move(decimator)),
      config_(std::move(config)) {}

std::expected<core::Mesh, std::string>
StrategySelector::runQuadRemesher(const core::Mesh& source, size_t targetFaces) const {
    if (!quadRemesher_) {
        return std::unexpected(std::string("no quad remesher configured"));
    }
    // 内部错误可能以异常形式抛出，统一转成错误值
    try {
        return quadRemesher_->remesh(source, targetFaces);
    } catch (const std::exception& e) {
        return std::unexpected(std::string("internal error: ") + e.what());
    }
}

std::expected<StrategyOutcome, SelectionFailure>
StrategySelector::select(const core::Mesh& source, size_t targetFaces) const {
    if (source.empty()) {
        return std::unexpected(SelectionFailure{SelectionError::EmptyMesh, {}});
    }

    StrategyOutcome outcome;

    // 1. 拓扑分析；图用完即弃
    {
        const auto graph = core::MeshGraph::build(source, config_.graphOptions);
        outcome.islands = core::analyzeIslands(graph);
    }
    outcome.classifiedAsSoup = isMeshSoup(outcome.islands, config_.islandThreshold);

    spdlog::debug("strategy: {} faces, {} islands (largest {}), target {}",
                  source.faceCount(), outcome.islands.islandCount,
                  outcome.islands.largestIslandFaceCount, targetFaces);

    if (targetFaces >= source.faceCount()) {
        outcome.mesh = source;
        outcome.strategy = StrategyKind::None;
        outcome.trail.push_back({StrategyKind::None, true,
                                 "target " + std::to_string(targetFaces) + " >= current face count "
                                     + std::to_string(source.faceCount())});
        return outcome;
    }

    // 2. 非碎片网格先尝试外部工具
    if (outcome.classifiedAsSoup) {
        const auto reason = "mesh soup: " + std::to_string(outcome.islands.islandCount)
            + " islands (threshold " + std::to_string(config_.islandThreshold) + "), external remesher skipped";
        spdlog::info("strategy: {}", reason);
        outcome.trail.push_back({StrategyKind::External, false, reason});
    } else if (!external_) {
        outcome.trail.push_back({StrategyKind::External, false, "no external remesher configured"});
    } else {
        RemesherOutcome result;
        try {
            result = external_->invoke(source, targetFaces, config_.remesherOptions);
        } catch (const std::exception& e) {
            result = ProcessFailed{-1, std::string("internal error: ") + e.what()};
        }
        if (auto* success = std::get_if<RemesherSuccess>(&result)) {
            outcome.mesh = std::move(success->mesh);
            outcome.strategy = StrategyKind::External;
            outcome.trail.push_back({StrategyKind::External, true, describe(result)});
            return outcome;
        }
        const auto reason = describe(result);
        spdlog::warn("strategy: external remesher unavailable ({}), falling back to quad remesher", reason);
        outcome.trail.push_back({StrategyKind::External, false, reason});
    }

    // 3. 内置四边形重拓扑
    auto quad = runQuadRemesher(source, targetFaces);
    if (quad) {
        outcome.mesh = std::move(quad.value());
        outcome.strategy = StrategyKind::QuadRemesh;
        outcome.trail.push_back({StrategyKind::QuadRemesh, true,
                                 std::to_string(outcome.mesh.faceCount()) + " faces"});
        return outcome;
    }
    spdlog::warn("strategy: quad remesher failed ({}), falling back to decimation", quad.error());
    outcome.trail.push_back({StrategyKind::QuadRemesh, false, quad.error()});

    // 4. 减面兜底：目标按三角形计，取面数目标的 2 倍
    const size_t targetTriangles = targetFaces * 2;
    if (!decimator_) {
        outcome.trail.push_back({StrategyKind::Decimate, false, "no decimator configured"});
        return std::unexpected(SelectionFailure{SelectionError::DecimationFailed, std::move(outcome.trail)});
    }

    std::expected<core::Mesh, std::string> decimated;
    try {
        decimated = decimator_->decimate(source, targetTriangles);
    } catch (const std::exception& e) {
        decimated = std::unexpected(std::string("internal error: ") + e.what());
    }

    if (!decimated) {
        spdlog::error("strategy: decimation failed: {}", decimated.error());
        outcome.trail.push_back({StrategyKind::Decimate, false, decimated.error()});
        return std::unexpected(SelectionFailure{SelectionError::DecimationFailed, std::move(outcome.trail)});
    }

    outcome.mesh = std::move(decimated.value());
    outcome.strategy = StrategyKind::Decimate;
    outcome.trail.push_back({StrategyKind::Decimate, true,
                             std::to_string(outcome.mesh.triangleCount()) + " triangles (target "
                                 + std::to_string(targetTriangles) + ")"});
    return outcome;
}

} // namespace retopo::remesh
