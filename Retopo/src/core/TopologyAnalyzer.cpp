#include "core/TopologyAnalyzer.hpp"
#include <algorithm>
#include <queue>

namespace retopo::core {

IslandReport analyzeIslands(const MeshGraph& graph) {
    IslandReport report;
    std::vector<bool> visited(graph.sourceFaceCount(), false);
    std::queue<MeshGraph::FaceId> frontier;

    // nodes() 已经按面 id 升序
    for (const auto start : graph.nodes()) {
        if (visited[start]) {
            continue;
        }

        ++report.islandCount;
        size_t islandSize = 0;
        visited[start] = true;
        frontier.push(start);

        while (!frontier.empty()) {
            const auto face = frontier.front();
            frontier.pop();
            ++islandSize;

            for (const auto next : graph.neighbors(face)) {
                if (!visited[next] && graph.contains(next)) {
                    visited[next] = true;
                    frontier.push(next);
                }
            }
        }

        report.largestIslandFaceCount = std::max(report.largestIslandFaceCount, islandSize);
    }

    return report;
}

IslandReport analyzeIslands(const Mesh& mesh, const GraphOptions& options) {
    // 图只在本次调用中存活
    return analyzeIslands(MeshGraph::build(mesh, options));
}

} // namespace retopo::core
