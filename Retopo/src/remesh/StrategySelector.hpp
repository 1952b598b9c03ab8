#pragma once

#include "ExternalRemesher.hpp"
#include "../core/MeshGraph.hpp"
#include "../core/Remeshing.hpp"
#include "../core/TopologyAnalyzer.hpp"
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace retopo::remesh {

// 岛数达到该值即视为 AI 网格碎片
inline constexpr size_t kDefaultIslandThreshold = 50;

// 最终生成 LOD 的策略
enum class StrategyKind {
    None,        // 目标不小于当前面数，原样复制
    External,
    QuadRemesh,
    Decimate
};

[[nodiscard]] std::string_view toString(StrategyKind kind) noexcept;

// 回退链上的一次尝试
struct StrategyAttempt {
    StrategyKind strategy{StrategyKind::None};
    bool succeeded{false};
    std::string reason;
};

struct SelectorConfig {
    size_t islandThreshold{kDefaultIslandThreshold};
    core::GraphOptions graphOptions{core::kDefaultWeldTolerance};
    RemesherOptions remesherOptions;
};

struct StrategyOutcome {
    core::Mesh mesh;
    StrategyKind strategy{StrategyKind::None};
    core::IslandReport islands;
    bool classifiedAsSoup{false};
    std::vector<StrategyAttempt> trail;
};

enum class SelectionError {
    EmptyMesh,
    DecimationFailed
};

// 选择失败时附带完整回退记录
struct SelectionFailure {
    SelectionError error{SelectionError::DecimationFailed};
    std::vector<StrategyAttempt> trail;
};

[[nodiscard]] std::string_view toString(SelectionError error) noexcept;

// 重拓扑策略选择器：外部工具 -> 内置四边形重拓扑 -> 减面到目标 x2 三角形
class StrategySelector {
public:
    StrategySelector(std::shared_ptr<const IExternalRemesher> external,
                     std::shared_ptr<const core::IQuadRemesher> quadRemesher,
                     std::shared_ptr<const core::IDecimator> decimator,
                     SelectorConfig config = {});

    // 对一个 LOD 请求选择并执行策略；源网格不会被修改
    [[nodiscard]] std::expected<StrategyOutcome, SelectionFailure>
    select(const core::Mesh& source, size_t targetFaces) const;

    const SelectorConfig& config() const noexcept { return config_; }
    void setConfig(SelectorConfig config) { config_ = std::move(config); }

private:
    std::expected<core::Mesh, std::string> runQuadRemesher(const core::Mesh& source, size_t targetFaces) const;

    std::shared_ptr<const IExternalRemesher> external_;
    std::shared_ptr<const core::IQuadRemesher> quadRemesher_;
    std::shared_ptr<const core::IDecimator> decimator_;
    SelectorConfig config_;
};

// 纯函数：是否按碎片处理（岛数为 0 也算）
[[nodiscard]] bool isMeshSoup(const core::IslandReport& report, size_t threshold) noexcept;

} // namespace retopo::remesh
