#include "core/Mesh.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <numeric>

namespace retopo::core {

namespace {

constexpr Index kUnused = std::numeric_limits<Index>::max();

template<typename T>
std::vector<T> remapStream(const std::vector<T>& stream, const std::vector<Index>& remap, size_t newCount) {
    std::vector<T> result(newCount);
    for (size_t i = 0; i < stream.size() && i < remap.size(); ++i) {
        if (remap[i] != kUnused) {
            result[remap[i]] = stream[i];
        }
    }
    return result;
}

template<typename T>
void appendStream(std::vector<T>& target, const std::vector<T>& source) {
    target.insert(target.end(), source.begin(), source.end());
}

Vec3 cross(const Vec3& a, const Vec3& b) noexcept {
    return {a[1] * b[2] - a[2] * b[1], a[2] * b[0] - a[0] * b[2], a[0] * b[1] - a[1] * b[0]};
}

float triangleArea(const Vec3& v0, const Vec3& v1, const Vec3& v2) noexcept {
    Vec3 edge1{v1[0] - v0[0], v1[1] - v0[1], v1[2] - v0[2]};
    Vec3 edge2{v2[0] - v0[0], v2[1] - v0[1], v2[2] - v0[2]};
    auto c = cross(edge1, edge2);
    return 0.5f * std::sqrt(c[0] * c[0] + c[1] * c[1] + c[2] * c[2]);
}

} // namespace

std::string_view toString(MeshError error) noexcept {
    switch (error) {
        case MeshError::NoVertices: return "mesh has no vertices";
        case MeshError::NoFaces: return "mesh has no faces";
        case MeshError::IndexOutOfRange: return "face index out of vertex range";
        case MeshError::FaceArityTooSmall: return "face with fewer than 3 indices";
        case MeshError::AttributeSizeMismatch: return "vertex attribute stream length mismatch";
        case MeshError::AllFacesDegenerate: return "all faces are degenerate";
    }
    return "unknown mesh error";
}

size_t Mesh::triangleCount() const noexcept {
    size_t count = 0;
    for (const auto& face : faces_) {
        if (face.arity() >= 3) {
            count += face.arity() - 2;
        }
    }
    return count;
}

std::expected<void, MeshError> Mesh::validate() const {
    if (vertices_.empty()) {
        return std::unexpected(MeshError::NoVertices);
    }
    if (faces_.empty()) {
        return std::unexpected(MeshError::NoFaces);
    }

    const size_t count = vertices_.size();
    if (vertices_.hasNormals() && vertices_.normals.size() != count) {
        return std::unexpected(MeshError::AttributeSizeMismatch);
    }
    for (const auto& layer : vertices_.uvLayers) {
        if (layer.coords.size() != count) {
            return std::unexpected(MeshError::AttributeSizeMismatch);
        }
    }
    for (const auto& layer : vertices_.colorLayers) {
        if (layer.values.size() != count) {
            return std::unexpected(MeshError::AttributeSizeMismatch);
        }
    }
    for (const auto& target : vertices_.morphTargets) {
        if (target.positionDeltas.size() != count) {
            return std::unexpected(MeshError::AttributeSizeMismatch);
        }
    }

    size_t degenerate = 0;
    for (const auto& face : faces_) {
        if (face.arity() < 3) {
            return std::unexpected(MeshError::FaceArityTooSmall);
        }
        for (const auto index : face.indices) {
            if (index >= count) {
                return std::unexpected(MeshError::IndexOutOfRange);
            }
        }
        if (isDegenerate(face)) {
            ++degenerate;
        }
    }
    if (degenerate == faces_.size()) {
        return std::unexpected(MeshError::AllFacesDegenerate);
    }

    return {};
}

Mesh Mesh::triangulated() const {
    Faces triangles;
    triangles.reserve(triangleCount());

    for (const auto& face : faces_) {
        if (face.arity() < 3) {
            continue;
        }
        for (size_t j = 1; j + 1 < face.arity(); ++j) {
            triangles.push_back(Face{{face.indices[0], face.indices[j], face.indices[j + 1]}, face.materialIndex});
        }
    }

    // 三角化后面域属性无法一一对应，只保留顶点域
    CustomAttributes vertexAttributes;
    std::copy_if(customAttributes_.begin(), customAttributes_.end(), std::back_inserter(vertexAttributes),
                 [](const CustomAttribute& attr) { return attr.domain == AttributeDomain::Vertex; });

    return Mesh{vertices_, std::move(triangles), materials_, std::move(vertexAttributes)};
}

Mesh Mesh::compacted() const {
    std::vector<Index> remap(vertices_.size(), kUnused);
    Index next = 0;

    Faces newFaces;
    newFaces.reserve(faces_.size());
    for (const auto& face : faces_) {
        Face remapped{{}, face.materialIndex};
        remapped.indices.reserve(face.arity());
        for (const auto index : face.indices) {
            if (index >= remap.size()) {
                continue;
            }
            if (remap[index] == kUnused) {
                remap[index] = next++;
            }
            remapped.indices.push_back(remap[index]);
        }
        newFaces.push_back(std::move(remapped));
    }

    const size_t newCount = next;
    Vertices newVertices;
    newVertices.positions = remapStream(vertices_.positions, remap, newCount);
    if (vertices_.hasNormals()) {
        newVertices.normals = remapStream(vertices_.normals, remap, newCount);
    }
    for (const auto& layer : vertices_.uvLayers) {
        newVertices.uvLayers.push_back({layer.name, remapStream(layer.coords, remap, newCount)});
    }
    for (const auto& layer : vertices_.colorLayers) {
        newVertices.colorLayers.push_back({layer.name, remapStream(layer.values, remap, newCount)});
    }
    for (const auto& target : vertices_.morphTargets) {
        newVertices.morphTargets.push_back({target.name, remapStream(target.positionDeltas, remap, newCount)});
    }

    CustomAttributes newAttributes;
    for (const auto& attr : customAttributes_) {
        if (attr.domain == AttributeDomain::Face) {
            newAttributes.push_back(attr);
            continue;
        }
        CustomAttribute remapped{attr.name, attr.domain, attr.components, {}};
        remapped.data.resize(newCount * attr.components);
        for (size_t i = 0; i < attr.elementCount() && i < remap.size(); ++i) {
            if (remap[i] == kUnused) {
                continue;
            }
            std::copy_n(attr.data.begin() + static_cast<std::ptrdiff_t>(i * attr.components), attr.components,
                        remapped.data.begin() + static_cast<std::ptrdiff_t>(remap[i] * attr.components));
        }
        newAttributes.push_back(std::move(remapped));
    }

    return Mesh{std::move(newVertices), std::move(newFaces), materials_, std::move(newAttributes)};
}

Mesh Mesh::merge(std::span<const Mesh> meshes) {
    if (meshes.empty()) {
        return Mesh{};
    }

    if (meshes.size() == 1) {
        return meshes[0];
    }

    // 只保留所有网格都具备的图层
    bool allNormals = true;
    size_t uvLayers = std::numeric_limits<size_t>::max();
    size_t colorLayers = std::numeric_limits<size_t>::max();
    size_t morphTargets = std::numeric_limits<size_t>::max();
    for (const auto& mesh : meshes) {
        allNormals = allNormals && mesh.vertices().hasNormals();
        uvLayers = std::min(uvLayers, mesh.vertices().uvLayers.size());
        colorLayers = std::min(colorLayers, mesh.vertices().colorLayers.size());
        morphTargets = std::min(morphTargets, mesh.vertices().morphTargets.size());
    }

    const auto& first = meshes[0].vertices();
    Vertices merged;
    for (size_t i = 0; i < uvLayers; ++i) {
        merged.uvLayers.push_back({first.uvLayers[i].name, {}});
    }
    for (size_t i = 0; i < colorLayers; ++i) {
        merged.colorLayers.push_back({first.colorLayers[i].name, {}});
    }
    for (size_t i = 0; i < morphTargets; ++i) {
        merged.morphTargets.push_back({first.morphTargets[i].name, {}});
    }

    Faces mergedFaces;
    Materials mergedMaterials;
    Index vertexOffset = 0;

    for (const auto& mesh : meshes) {
        const auto& vertices = mesh.vertices();
        appendStream(merged.positions, vertices.positions);
        if (allNormals) {
            appendStream(merged.normals, vertices.normals);
        }
        for (size_t i = 0; i < uvLayers; ++i) {
            appendStream(merged.uvLayers[i].coords, vertices.uvLayers[i].coords);
        }
        for (size_t i = 0; i < colorLayers; ++i) {
            appendStream(merged.colorLayers[i].values, vertices.colorLayers[i].values);
        }
        for (size_t i = 0; i < morphTargets; ++i) {
            appendStream(merged.morphTargets[i].positionDeltas, vertices.morphTargets[i].positionDeltas);
        }

        const auto materialOffset = static_cast<uint32_t>(mergedMaterials.size());
        appendStream(mergedMaterials, mesh.materials());

        for (const auto& face : mesh.faces()) {
            Face shifted{{}, face.materialIndex + materialOffset};
            shifted.indices.reserve(face.arity());
            std::transform(face.indices.begin(), face.indices.end(), std::back_inserter(shifted.indices),
                           [vertexOffset](Index idx) { return idx + vertexOffset; });
            mergedFaces.push_back(std::move(shifted));
        }

        vertexOffset += static_cast<Index>(vertices.size());
    }

    return Mesh{std::move(merged), std::move(mergedFaces), std::move(mergedMaterials)};
}

bool isDegenerate(const Face& face) noexcept {
    if (face.arity() < 3) {
        return true;
    }
    // 面通常很小，直接两两比较
    size_t distinct = 0;
    for (size_t i = 0; i < face.indices.size(); ++i) {
        bool seen = false;
        for (size_t j = 0; j < i; ++j) {
            if (face.indices[j] == face.indices[i]) {
                seen = true;
                break;
            }
        }
        if (!seen && ++distinct >= 3) {
            return false;
        }
    }
    return true;
}

MeshStats computeStats(const Mesh& mesh) noexcept {
    MeshStats stats;

    if (mesh.empty()) {
        return stats;
    }

    stats.vertexCount = mesh.vertexCount();
    stats.faceCount = mesh.faceCount();
    stats.triangleCount = mesh.triangleCount();

    auto [min, max] = computeBoundingBox(mesh);
    stats.boundingBoxMin = min;
    stats.boundingBoxMax = max;

    const auto& positions = mesh.vertices().positions;
    for (const auto& face : mesh.faces()) {
        if (face.arity() == 4) {
            ++stats.quadCount;
        }
        if (isDegenerate(face)) {
            ++stats.degenerateFaceCount;
            continue;
        }
        // 扇形分解计算面积（简化版本）
        for (size_t j = 1; j + 1 < face.arity(); ++j) {
            const auto i0 = face.indices[0];
            const auto i1 = face.indices[j];
            const auto i2 = face.indices[j + 1];
            if (i0 < positions.size() && i1 < positions.size() && i2 < positions.size()) {
                stats.surfaceArea += triangleArea(positions[i0], positions[i1], positions[i2]);
            }
        }
    }

    return stats;
}

std::pair<Vec3, Vec3> computeBoundingBox(const Mesh& mesh) noexcept {
    const auto& positions = mesh.vertices().positions;
    if (positions.empty()) {
        return {{0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 0.0f}};
    }

    auto minPos = positions[0];
    auto maxPos = positions[0];

    for (const auto& pos : positions) {
        for (int i = 0; i < 3; ++i) {
            minPos[i] = std::min(minPos[i], pos[i]);
            maxPos[i] = std::max(maxPos[i], pos[i]);
        }
    }

    return {minPos, maxPos};
}

} // namespace retopo::core
