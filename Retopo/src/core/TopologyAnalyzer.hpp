#pragma once

#include "MeshGraph.hpp"

namespace retopo::core {

// 连通分量（岛）统计，按网格快照生成一次
struct IslandReport {
    size_t islandCount{0};
    size_t largestIslandFaceCount{0};

    bool operator==(const IslandReport&) const = default;
};

// 纯函数：BFS 统计面邻接图的连通分量数与最大岛面数
[[nodiscard]] IslandReport analyzeIslands(const MeshGraph& graph);

// 便利函数：构图并统计
[[nodiscard]] IslandReport analyzeIslands(const Mesh& mesh, const GraphOptions& options = {});

} // namespace retopo::core
