#pragma once

#include "Mesh.hpp"
#include <cstdint>
#include <vector>

namespace retopo::core {

// 重拓扑前合并重合顶点的默认距离
inline constexpr float kDefaultWeldTolerance = 0.0001f;

// 构图选项
struct GraphOptions {
    // > 0 时先按位置合并重合顶点（UV 接缝处拆开的顶点），再归一化边
    float weldTolerance{0.0f};
};

// 面邻接图：共享一条边的两个面相邻。只读视图，按请求构建、用完即弃
class MeshGraph {
public:
    using FaceId = uint32_t;

    MeshGraph() = default;

    // 通过边 -> 面索引构建，退化面不进入图
    [[nodiscard]] static MeshGraph build(const Mesh& mesh, const GraphOptions& options = {});

    // 由手写邻接表构建（测试、合成图）；邻接关系按无向边对称化
    [[nodiscard]] static MeshGraph fromAdjacency(std::vector<std::vector<FaceId>> adjacency);

    // 图中的面（升序）
    const std::vector<FaceId>& nodes() const noexcept { return nodes_; }
    const std::vector<FaceId>& neighbors(FaceId face) const noexcept;

    bool contains(FaceId face) const noexcept {
        return face < included_.size() && included_[face];
    }

    size_t nodeCount() const noexcept { return nodes_.size(); }
    size_t sourceFaceCount() const noexcept { return included_.size(); }
    size_t excludedFaceCount() const noexcept { return included_.size() - nodes_.size(); }
    size_t edgeCount() const noexcept;
    bool empty() const noexcept { return nodes_.empty(); }

private:
    std::vector<std::vector<FaceId>> adjacency_;
    std::vector<bool> included_;
    std::vector<FaceId> nodes_;
};

// 按位置把重合顶点映射到同一个规范索引
[[nodiscard]] std::vector<Index> canonicalVertexIds(const Mesh& mesh, float tolerance);

} // namespace retopo::core
