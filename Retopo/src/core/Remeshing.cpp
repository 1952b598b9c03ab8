#include "core/Remeshing.hpp"
#include <meshoptimizer.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <map>
#include <optional>
#include <queue>
#include <unordered_map>

namespace retopo::core {

namespace {

enum CellState : uint8_t {
    Empty = 0,      // 洪泛之后仍为 Empty 的就是内部
    Surface = 1,
    Exterior = 2
};

struct SampleSum {
    Vec3 sum{0.0f, 0.0f, 0.0f};
    uint32_t count{0};
};

struct VoxelGrid {
    std::array<size_t, 3> dims{0, 0, 0};
    Vec3 origin{0.0f, 0.0f, 0.0f};
    float cellSize{0.0f};
    std::vector<uint8_t> state;
    std::unordered_map<size_t, SampleSum> samples;

    size_t index(size_t x, size_t y, size_t z) const noexcept {
        return x + dims[0] * (y + dims[1] * z);
    }

    bool inside(long x, long y, long z) const noexcept {
        return x >= 0 && y >= 0 && z >= 0
            && static_cast<size_t>(x) < dims[0] && static_cast<size_t>(y) < dims[1] && static_cast<size_t>(z) < dims[2];
    }
};

size_t toCell(float value, float origin, float cellSize, size_t dim) noexcept {
    const auto cell = static_cast<long>(std::floor((value - origin) / cellSize));
    return static_cast<size_t>(std::clamp<long>(cell, 0, static_cast<long>(dim) - 1));
}

float distance(const Vec3& a, const Vec3& b) noexcept {
    const float dx = a[0] - b[0];
    const float dy = a[1] - b[1];
    const float dz = a[2] - b[2];
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

// 在三角形上按 0.5 个体素的步长采样，标记表面格子并累加采样点
void rasterizeTriangle(VoxelGrid& grid, const Vec3& p0, const Vec3& p1, const Vec3& p2) {
    const float longest = std::max({distance(p0, p1), distance(p1, p2), distance(p2, p0)});
    const auto steps = std::max<size_t>(1, static_cast<size_t>(std::ceil(longest / (0.5f * grid.cellSize))));
    const float inv = 1.0f / static_cast<float>(steps);

    for (size_t i = 0; i <= steps; ++i) {
        for (size_t j = 0; i + j <= steps; ++j) {
            const float a = static_cast<float>(i) * inv;
            const float b = static_cast<float>(j) * inv;
            Vec3 p{};
            for (int k = 0; k < 3; ++k) {
                p[k] = p0[k] + a * (p1[k] - p0[k]) + b * (p2[k] - p0[k]);
            }
            const auto cell = grid.index(toCell(p[0], grid.origin[0], grid.cellSize, grid.dims[0]),
                                         toCell(p[1], grid.origin[1], grid.cellSize, grid.dims[1]),
                                         toCell(p[2], grid.origin[2], grid.cellSize, grid.dims[2]));
            grid.state[cell] = Surface;
            auto& sample = grid.samples[cell];
            for (int k = 0; k < 3; ++k) {
                sample.sum[k] += p[k];
            }
            ++sample.count;
        }
    }
}

VoxelGrid voxelize(const Mesh& mesh, const Vec3& boundsMin, const Vec3& extent, float cellSize) {
    VoxelGrid grid;
    grid.cellSize = cellSize;
    for (int k = 0; k < 3; ++k) {
        // 每侧至少留一层空格子，保证角落属于外部
        grid.dims[k] = static_cast<size_t>(std::ceil(extent[k] / cellSize)) + 3;
        grid.origin[k] = boundsMin[k] - cellSize;
    }
    grid.state.assign(grid.dims[0] * grid.dims[1] * grid.dims[2], Empty);

    const auto& positions = mesh.vertices().positions;
    for (const auto& face : mesh.faces()) {
        if (isDegenerate(face)) {
            continue;
        }
        for (size_t j = 1; j + 1 < face.arity(); ++j) {
            rasterizeTriangle(grid, positions[face.indices[0]], positions[face.indices[j]], positions[face.indices[j + 1]]);
        }
    }

    return grid;
}

// 从角落出发 6 邻域洪泛，标记外部
void floodExterior(VoxelGrid& grid) {
    static constexpr std::array<std::array<long, 3>, 6> kDirections = {{
        {1, 0, 0}, {-1, 0, 0}, {0, 1, 0}, {0, -1, 0}, {0, 0, 1}, {0, 0, -1}}};

    std::queue<std::array<long, 3>> frontier;
    grid.state[0] = Exterior;
    frontier.push({0, 0, 0});

    while (!frontier.empty()) {
        const auto cell = frontier.front();
        frontier.pop();
        for (const auto& d : kDirections) {
            const long x = cell[0] + d[0];
            const long y = cell[1] + d[1];
            const long z = cell[2] + d[2];
            if (!grid.inside(x, y, z)) {
                continue;
            }
            auto& state = grid.state[grid.index(x, y, z)];
            if (state == Empty) {
                state = Exterior;
                frontier.push({x, y, z});
            }
        }
    }
}

// 遍历所有实体格子与外部相邻的面
template<typename Visitor>
void forEachBoundaryFace(const VoxelGrid& grid, Visitor&& visitor) {
    for (size_t z = 0; z < grid.dims[2]; ++z) {
        for (size_t y = 0; y < grid.dims[1]; ++y) {
            for (size_t x = 0; x < grid.dims[0]; ++x) {
                if (grid.state[grid.index(x, y, z)] == Exterior) {
                    continue;
                }
                const std::array<long, 3> cell{static_cast<long>(x), static_cast<long>(y), static_cast<long>(z)};
                for (int axis = 0; axis < 3; ++axis) {
                    for (int sign : {1, -1}) {
                        auto neighbor = cell;
                        neighbor[axis] += sign;
                        const bool open = !grid.inside(neighbor[0], neighbor[1], neighbor[2])
                            || grid.state[grid.index(neighbor[0], neighbor[1], neighbor[2])] == Exterior;
                        if (open) {
                            visitor(cell, axis, sign);
                        }
                    }
                }
            }
        }
    }
}

size_t countBoundaryFaces(const VoxelGrid& grid) {
    size_t count = 0;
    forEachBoundaryFace(grid, [&count](const std::array<long, 3>&, int, int) { ++count; });
    return count;
}

// 角点周围 8 个格子中表面格子采样的平均位置
std::optional<Vec3> projectCorner(const VoxelGrid& grid, const std::array<long, 3>& corner) {
    Vec3 sum{0.0f, 0.0f, 0.0f};
    uint32_t count = 0;
    for (long dz = -1; dz <= 0; ++dz) {
        for (long dy = -1; dy <= 0; ++dy) {
            for (long dx = -1; dx <= 0; ++dx) {
                const long x = corner[0] + dx;
                const long y = corner[1] + dy;
                const long z = corner[2] + dz;
                if (!grid.inside(x, y, z)) {
                    continue;
                }
                auto it = grid.samples.find(grid.index(x, y, z));
                if (it == grid.samples.end() || it->second.count == 0) {
                    continue;
                }
                for (int k = 0; k < 3; ++k) {
                    sum[k] += it->second.sum[k] / static_cast<float>(it->second.count);
                }
                ++count;
            }
        }
    }
    if (count == 0) {
        return std::nullopt;
    }
    for (int k = 0; k < 3; ++k) {
        sum[k] /= static_cast<float>(count);
    }
    return sum;
}

Mesh extractQuadSurface(const VoxelGrid& grid, const QuadRemeshConfig& config) {
    const size_t cx = grid.dims[0] + 1;
    const size_t cy = grid.dims[1] + 1;

    std::unordered_map<size_t, Index> cornerIds;
    std::vector<std::array<long, 3>> corners;
    Mesh::Faces faces;

    auto cornerVertex = [&](const std::array<long, 3>& c) -> Index {
        const size_t key = static_cast<size_t>(c[0]) + cx * (static_cast<size_t>(c[1]) + cy * static_cast<size_t>(c[2]));
        auto [it, inserted] = cornerIds.try_emplace(key, static_cast<Index>(corners.size()));
        if (inserted) {
            corners.push_back(c);
        }
        return it->second;
    };

    // 正向面 (u,v) 逆时针，反向面取反
    static constexpr std::array<std::array<int, 2>, 4> kPositive = {{{0, 0}, {1, 0}, {1, 1}, {0, 1}}};
    static constexpr std::array<std::array<int, 2>, 4> kNegative = {{{0, 0}, {0, 1}, {1, 1}, {1, 0}}};

    forEachBoundaryFace(grid, [&](const std::array<long, 3>& cell, int axis, int sign) {
        const int u = (axis + 1) % 3;
        const int v = (axis + 2) % 3;
        const auto& pattern = sign > 0 ? kPositive : kNegative;
        Face face;
        face.indices.reserve(4);
        for (const auto& offset : pattern) {
            auto corner = cell;
            corner[axis] += sign > 0 ? 1 : 0;
            corner[u] += offset[0];
            corner[v] += offset[1];
            face.indices.push_back(cornerVertex(corner));
        }
        faces.push_back(std::move(face));
    });

    std::vector<Vec3> positions(corners.size());
    for (size_t i = 0; i < corners.size(); ++i) {
        if (auto projected = projectCorner(grid, corners[i])) {
            positions[i] = *projected;
        } else {
            for (int k = 0; k < 3; ++k) {
                positions[i][k] = grid.origin[k] + static_cast<float>(corners[i][k]) * grid.cellSize;
            }
        }
    }

    // 拉普拉斯平滑
    if (config.smoothIterations > 0) {
        std::vector<std::vector<Index>> ring(positions.size());
        for (const auto& face : faces) {
            for (size_t k = 0; k < face.arity(); ++k) {
                const auto a = face.indices[k];
                const auto b = face.indices[(k + 1) % face.arity()];
                ring[a].push_back(b);
                ring[b].push_back(a);
            }
        }
        for (auto& list : ring) {
            std::sort(list.begin(), list.end());
            list.erase(std::unique(list.begin(), list.end()), list.end());
        }

        for (int iteration = 0; iteration < config.smoothIterations; ++iteration) {
            auto next = positions;
            for (size_t i = 0; i < positions.size(); ++i) {
                if (ring[i].empty()) {
                    continue;
                }
                Vec3 average{0.0f, 0.0f, 0.0f};
                for (const auto n : ring[i]) {
                    for (int k = 0; k < 3; ++k) {
                        average[k] += positions[n][k];
                    }
                }
                for (int k = 0; k < 3; ++k) {
                    average[k] /= static_cast<float>(ring[i].size());
                    next[i][k] = positions[i][k] + config.smoothFactor * (average[k] - positions[i][k]);
                }
            }
            positions = std::move(next);
        }
    }

    VertexAttributes vertices;
    vertices.positions = std::move(positions);
    Mesh result{std::move(vertices), std::move(faces)};
    auto normals = computeVertexNormals(result);
    auto withNormals = result.vertices();
    withNormals.normals = std::move(normals);
    return result.withVertices(std::move(withNormals));
}

} // namespace

std::vector<Vec3> computeVertexNormals(const Mesh& mesh) {
    const auto& positions = mesh.vertices().positions;
    std::vector<Vec3> normals(positions.size(), Vec3{0.0f, 0.0f, 0.0f});

    for (const auto& face : mesh.faces()) {
        // Newell 法线，大小与面积成正比
        Vec3 n{0.0f, 0.0f, 0.0f};
        for (size_t k = 0; k < face.arity(); ++k) {
            const auto& a = positions[face.indices[k]];
            const auto& b = positions[face.indices[(k + 1) % face.arity()]];
            n[0] += (a[1] - b[1]) * (a[2] + b[2]);
            n[1] += (a[2] - b[2]) * (a[0] + b[0]);
            n[2] += (a[0] - b[0]) * (a[1] + b[1]);
        }
        for (const auto index : face.indices) {
            for (int k = 0; k < 3; ++k) {
                normals[index][k] += n[k];
            }
        }
    }

    for (auto& n : normals) {
        const float length = std::sqrt(n[0] * n[0] + n[1] * n[1] + n[2] * n[2]);
        if (length > 0.0f) {
            for (int k = 0; k < 3; ++k) {
                n[k] /= length;
            }
        } else {
            n = {0.0f, 0.0f, 1.0f};
        }
    }

    return normals;
}

std::expected<Mesh, std::string> VoxelQuadRemesher::remesh(const Mesh& mesh, size_t targetFaces) const {
    if (mesh.empty()) {
        return std::unexpected(std::string("voxel remesh: empty input mesh"));
    }
    if (targetFaces == 0) {
        return std::unexpected(std::string("voxel remesh: target face count is zero"));
    }

    const auto stats = computeStats(mesh);
    const auto [boundsMin, boundsMax] = computeBoundingBox(mesh);
    Vec3 extent{};
    for (int k = 0; k < 3; ++k) {
        extent[k] = boundsMax[k] - boundsMin[k];
    }
    const float maxExtent = std::max({extent[0], extent[1], extent[2]});
    if (maxExtent <= 0.0f || stats.surfaceArea <= 0.0f) {
        return std::unexpected(std::string("voxel remesh: mesh has zero extent or area"));
    }

    const float minCell = maxExtent / static_cast<float>(config_.maxResolution);
    const auto target = static_cast<float>(targetFaces);
    // 体素表面的面积大约是原表面的 1.5 倍
    float cellSize = std::sqrt(1.5f * stats.surfaceArea / target);

    std::optional<VoxelGrid> best;
    size_t bestCount = 0;

    for (int iteration = 0; iteration <= config_.fitIterations; ++iteration) {
        cellSize = std::max(cellSize, minCell);
        auto grid = voxelize(mesh, boundsMin, extent, cellSize);
        floodExterior(grid);
        const size_t count = countBoundaryFaces(grid);

        spdlog::debug("voxel remesh: cell {:.5f} -> {} quads (target {})", cellSize, count, targetFaces);

        if (count > 0) {
            const auto diff = [target](size_t c) { return std::abs(static_cast<float>(c) - target); };
            if (!best || diff(count) < diff(bestCount)) {
                best = std::move(grid);
                bestCount = count;
            }
            if (diff(count) <= config_.fitTolerance * target) {
                break;
            }
            const float previous = cellSize;
            cellSize *= std::sqrt(static_cast<float>(count) / target);
            if (cellSize <= minCell && previous <= minCell) {
                break;
            }
        } else {
            cellSize *= 0.5f;
        }
    }

    if (!best) {
        return std::unexpected(std::string("voxel remesh: voxel grid produced no surface"));
    }

    auto result = extractQuadSurface(*best, config_);
    if (result.faceCount() == 0) {
        return std::unexpected(std::string("voxel remesh: no quads extracted"));
    }
    if (!mesh.materials().empty()) {
        result = result.withMaterials({mesh.materials().front()});
    }

    spdlog::debug("voxel remesh: {} faces -> {} quads", mesh.faceCount(), result.faceCount());
    return result;
}

std::expected<Mesh, std::string> MeshoptDecimator::decimate(const Mesh& mesh, size_t targetTriangles) const {
    if (mesh.empty()) {
        return std::unexpected(std::string("decimate: empty input mesh"));
    }

    const auto triangles = mesh.triangulated();
    const size_t totalTriangles = triangles.triangleCount();
    if (totalTriangles <= targetTriangles) {
        return mesh;
    }

    const auto& vertices = triangles.vertices();
    const size_t vertexCount = vertices.size();

    // 转换顶点数据为 meshoptimizer 格式（仅使用位置）
    std::vector<float> vertexData;
    vertexData.reserve(vertexCount * 3);
    for (const auto& pos : vertices.positions) {
        vertexData.insert(vertexData.end(), pos.begin(), pos.end());
    }

    // 按材质分组，每组按比例分配目标
    std::map<uint32_t, std::vector<unsigned int>> groups;
    for (const auto& face : triangles.faces()) {
        auto& group = groups[face.materialIndex];
        group.insert(group.end(), face.indices.begin(), face.indices.end());
    }

    std::vector<unsigned int> combined;
    std::vector<uint32_t> triangleMaterials;

    for (const auto& [material, indices] : groups) {
        const size_t groupTriangles = indices.size() / 3;
        const size_t groupTarget = std::max<size_t>(
            1, static_cast<size_t>(static_cast<double>(targetTriangles) * groupTriangles / totalTriangles));
        const size_t targetIndexCount = groupTarget * 3;

        std::vector<unsigned int> simplified(indices.size());
        float resultError = 0.0f;
        size_t resultCount = meshopt_simplify(
            simplified.data(),
            indices.data(),
            indices.size(),
            vertexData.data(),
            vertexCount,
            sizeof(float) * 3,
            targetIndexCount,
            config_.targetError,
            0,
            &resultError);

        if (config_.allowSloppyPass && resultCount > static_cast<size_t>(targetIndexCount * config_.sloppyThreshold)) {
            // 拓扑保持的简化停滞（碎片、边界过多）时改用 sloppy
            std::vector<unsigned int> sloppy(resultCount);
            const size_t sloppyCount = meshopt_simplifySloppy(
                sloppy.data(),
                simplified.data(),
                resultCount,
                vertexData.data(),
                vertexCount,
                sizeof(float) * 3,
                targetIndexCount,
                config_.targetError,
                &resultError);
            if (sloppyCount > 0) {
                sloppy.resize(sloppyCount);
                simplified = std::move(sloppy);
                resultCount = sloppyCount;
            }
        }

        simplified.resize(resultCount);
        combined.insert(combined.end(), simplified.begin(), simplified.end());
        triangleMaterials.insert(triangleMaterials.end(), resultCount / 3, material);

        spdlog::debug("meshoptimizer: material {} {} -> {} triangles (error: {:.4f})",
                      material, groupTriangles, resultCount / 3, resultError);
    }

    if (combined.empty()) {
        return std::unexpected(std::string("decimate: simplification removed every triangle"));
    }

    // 压缩未引用的顶点
    std::vector<unsigned int> remap(vertexCount);
    const size_t uniqueCount = meshopt_optimizeVertexFetchRemap(remap.data(), combined.data(), combined.size(), vertexCount);
    meshopt_remapIndexBuffer(combined.data(), combined.data(), combined.size(), remap.data());

    auto remapStream = [&](const auto& stream) {
        using Element = typename std::decay_t<decltype(stream)>::value_type;
        std::vector<Element> result(uniqueCount);
        meshopt_remapVertexBuffer(result.data(), stream.data(), vertexCount, sizeof(Element), remap.data());
        return result;
    };

    VertexAttributes compact;
    compact.positions = remapStream(vertices.positions);
    if (vertices.hasNormals()) {
        compact.normals = remapStream(vertices.normals);
    }
    for (const auto& layer : vertices.uvLayers) {
        compact.uvLayers.push_back({layer.name, remapStream(layer.coords)});
    }
    for (const auto& layer : vertices.colorLayers) {
        compact.colorLayers.push_back({layer.name, remapStream(layer.values)});
    }
    for (const auto& target : vertices.morphTargets) {
        compact.morphTargets.push_back({target.name, remapStream(target.positionDeltas)});
    }

    Mesh::CustomAttributes attributes;
    for (const auto& attr : triangles.customAttributes()) {
        if (attr.domain != AttributeDomain::Vertex || attr.elementCount() != vertexCount) {
            continue;
        }
        CustomAttribute remapped{attr.name, attr.domain, attr.components, std::vector<float>(uniqueCount * attr.components)};
        meshopt_remapVertexBuffer(remapped.data.data(), attr.data.data(), vertexCount,
                                  sizeof(float) * attr.components, remap.data());
        attributes.push_back(std::move(remapped));
    }

    Mesh::Faces faces;
    faces.reserve(combined.size() / 3);
    for (size_t i = 0; i + 2 < combined.size(); i += 3) {
        faces.push_back(Face{{combined[i], combined[i + 1], combined[i + 2]}, triangleMaterials[i / 3]});
    }

    return Mesh{std::move(compact), std::move(faces), triangles.materials(), std::move(attributes)};
}

std::unique_ptr<IQuadRemesher> createQuadRemesher(QuadRemeshConfig config) {
    return std::make_unique<VoxelQuadRemesher>(config);
}

std::unique_ptr<IDecimator> createDecimator(DecimationConfig config) {
    return std::make_unique<MeshoptDecimator>(config);
}

} // namespace retopo::core
