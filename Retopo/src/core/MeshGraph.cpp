#include "core/MeshGraph.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>
#include <tuple>
#include <unordered_map>

namespace retopo::core {

namespace {

const std::vector<MeshGraph::FaceId> kNoNeighbors;

uint64_t edgeKey(Index a, Index b) noexcept {
    if (a > b) {
        std::swap(a, b);
    }
    return (static_cast<uint64_t>(a) << 32) | static_cast<uint64_t>(b);
}

void sortUnique(std::vector<MeshGraph::FaceId>& list) {
    std::sort(list.begin(), list.end());
    list.erase(std::unique(list.begin(), list.end()), list.end());
}

struct CellKey {
    int64_t x, y, z;
    bool operator==(const CellKey&) const = default;
};

struct CellKeyHash {
    size_t operator()(const CellKey& key) const noexcept {
        uint64_t h = static_cast<uint64_t>(key.x) * 73856093ULL;
        h ^= static_cast<uint64_t>(key.y) * 19349663ULL;
        h ^= static_cast<uint64_t>(key.z) * 83492791ULL;
        return static_cast<size_t>(h);
    }
};

} // namespace

std::vector<Index> canonicalVertexIds(const Mesh& mesh, float tolerance) {
    const auto& positions = mesh.vertices().positions;
    std::vector<Index> canonical(positions.size());
    std::iota(canonical.begin(), canonical.end(), Index{0});

    if (tolerance <= 0.0f) {
        return canonical;
    }

    // 量化到 tolerance 网格，只在相邻 27 个格子里找重合点
    std::unordered_map<CellKey, std::vector<Index>, CellKeyHash> grid;
    grid.reserve(positions.size());
    const float inv = 1.0f / tolerance;
    const float toleranceSq = tolerance * tolerance;

    for (Index i = 0; i < positions.size(); ++i) {
        const auto& p = positions[i];
        CellKey cell{static_cast<int64_t>(std::floor(p[0] * inv)),
                     static_cast<int64_t>(std::floor(p[1] * inv)),
                     static_cast<int64_t>(std::floor(p[2] * inv))};

        bool merged = false;
        for (int dx = -1; dx <= 1 && !merged; ++dx) {
            for (int dy = -1; dy <= 1 && !merged; ++dy) {
                for (int dz = -1; dz <= 1 && !merged; ++dz) {
                    auto it = grid.find(CellKey{cell.x + dx, cell.y + dy, cell.z + dz});
                    if (it == grid.end()) {
                        continue;
                    }
                    for (const auto candidate : it->second) {
                        const auto& q = positions[candidate];
                        const float ex = p[0] - q[0];
                        const float ey = p[1] - q[1];
                        const float ez = p[2] - q[2];
                        if (ex * ex + ey * ey + ez * ez <= toleranceSq) {
                            canonical[i] = canonical[candidate];
                            merged = true;
                            break;
                        }
                    }
                }
            }
        }

        if (!merged) {
            grid[cell].push_back(i);
        }
    }

    return canonical;
}

MeshGraph MeshGraph::build(const Mesh& mesh, const GraphOptions& options) {
    MeshGraph graph;
    const auto& faces = mesh.faces();
    graph.adjacency_.resize(faces.size());
    graph.included_.assign(faces.size(), false);

    if (faces.empty()) {
        return graph;
    }

    const auto canonical = canonicalVertexIds(mesh, options.weldTolerance);
    auto resolve = [&canonical](Index index) {
        return index < canonical.size() ? canonical[index] : index;
    };

    // 构建边 -> 面索引
    std::unordered_map<uint64_t, std::vector<FaceId>> edgeFaces;
    edgeFaces.reserve(faces.size() * 2);

    std::vector<Index> resolved;
    for (FaceId faceId = 0; faceId < faces.size(); ++faceId) {
        const auto& face = faces[faceId];
        resolved.clear();
        std::transform(face.indices.begin(), face.indices.end(), std::back_inserter(resolved), resolve);

        if (isDegenerate(Face{resolved, face.materialIndex})) {
            continue;
        }
        graph.included_[faceId] = true;
        graph.nodes_.push_back(faceId);

        for (size_t j = 0; j < resolved.size(); ++j) {
            const auto a = resolved[j];
            const auto b = resolved[(j + 1) % resolved.size()];
            if (a == b) {
                continue;
            }
            auto& owners = edgeFaces[edgeKey(a, b)];
            if (owners.empty() || owners.back() != faceId) {
                owners.push_back(faceId);
            }
        }
    }

    // 非流形边上的所有面两两相邻
    for (const auto& [key, owners] : edgeFaces) {
        for (size_t i = 0; i < owners.size(); ++i) {
            for (size_t j = i + 1; j < owners.size(); ++j) {
                graph.adjacency_[owners[i]].push_back(owners[j]);
                graph.adjacency_[owners[j]].push_back(owners[i]);
            }
        }
    }

    for (auto& list : graph.adjacency_) {
        sortUnique(list);
    }

    return graph;
}

MeshGraph MeshGraph::fromAdjacency(std::vector<std::vector<FaceId>> adjacency) {
    MeshGraph graph;
    const auto count = adjacency.size();
    graph.adjacency_.resize(count);
    graph.included_.assign(count, true);
    graph.nodes_.resize(count);
    std::iota(graph.nodes_.begin(), graph.nodes_.end(), FaceId{0});

    for (FaceId face = 0; face < count; ++face) {
        for (const auto other : adjacency[face]) {
            if (other >= count || other == face) {
                continue;
            }
            graph.adjacency_[face].push_back(other);
            graph.adjacency_[other].push_back(face);
        }
    }

    for (auto& list : graph.adjacency_) {
        sortUnique(list);
    }

    return graph;
}

const std::vector<MeshGraph::FaceId>& MeshGraph::neighbors(FaceId face) const noexcept {
    if (face >= adjacency_.size()) {
        return kNoNeighbors;
    }
    return adjacency_[face];
}

size_t MeshGraph::edgeCount() const noexcept {
    size_t total = 0;
    for (const auto& list : adjacency_) {
        total += list.size();
    }
    return total / 2;
}

} // namespace retopo::core
