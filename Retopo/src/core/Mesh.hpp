#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace retopo::core {

// 基础数据类型
using Vec3 = std::array<float, 3>;
using Vec2 = std::array<float, 2>;
using Color = std::array<float, 4>;
using Index = uint32_t;

// 命名的逐顶点图层
struct UvLayer {
    std::string name;
    std::vector<Vec2> coords;
};

struct ColorLayer {
    std::string name;
    std::vector<Color> values;
};

// 变形目标（只存位置增量）
struct MorphTarget {
    std::string name;
    std::vector<Vec3> positionDeltas;
};

enum class AttributeDomain {
    Vertex,
    Face
};

// 非标准的自定义属性，按 domain 存储 components 个分量
struct CustomAttribute {
    std::string name;
    AttributeDomain domain{AttributeDomain::Vertex};
    size_t components{1};
    std::vector<float> data;

    size_t elementCount() const noexcept { return components == 0 ? 0 : data.size() / components; }
};

// 顶点属性集合；normals 为空表示没有法线
struct VertexAttributes {
    std::vector<Vec3> positions;
    std::vector<Vec3> normals;
    std::vector<UvLayer> uvLayers;
    std::vector<ColorLayer> colorLayers;
    std::vector<MorphTarget> morphTargets;

    size_t size() const noexcept { return positions.size(); }
    bool empty() const noexcept { return positions.empty(); }
    bool hasNormals() const noexcept { return !normals.empty(); }
};

// 多边形面（arity >= 3）
struct Face {
    std::vector<Index> indices;
    uint32_t materialIndex{0};

    size_t arity() const noexcept { return indices.size(); }
};

struct Material {
    std::string name;
    bool usesVertexColor{false};
    bool requiresTangent{false};
};

enum class MeshError {
    NoVertices,
    NoFaces,
    IndexOutOfRange,
    FaceArityTooSmall,
    AttributeSizeMismatch,
    AllFacesDegenerate
};

[[nodiscard]] std::string_view toString(MeshError error) noexcept;

// 不可变网格结构：所有修改都返回新实例
class Mesh {
public:
    using Vertices = VertexAttributes;
    using Faces = std::vector<Face>;
    using Materials = std::vector<Material>;
    using CustomAttributes = std::vector<CustomAttribute>;

    Mesh() = default;
    Mesh(Vertices vertices, Faces faces, Materials materials = {}, CustomAttributes customAttributes = {})
        : vertices_(std::move(vertices)), faces_(std::move(faces)),
          materials_(std::move(materials)), customAttributes_(std::move(customAttributes)) {}

    // 访问器（只读）
    const Vertices& vertices() const noexcept { return vertices_; }
    const Faces& faces() const noexcept { return faces_; }
    const Materials& materials() const noexcept { return materials_; }
    const CustomAttributes& customAttributes() const noexcept { return customAttributes_; }

    // 查询方法
    size_t vertexCount() const noexcept { return vertices_.size(); }
    size_t faceCount() const noexcept { return faces_.size(); }
    size_t triangleCount() const noexcept;
    bool empty() const noexcept { return vertices_.empty() || faces_.empty(); }

    // 创建新实例的函数式操作
    [[nodiscard]] Mesh withVertices(Vertices newVertices) const {
        return Mesh{std::move(newVertices), faces_, materials_, customAttributes_};
    }

    [[nodiscard]] Mesh withFaces(Faces newFaces) const {
        return Mesh{vertices_, std::move(newFaces), materials_, customAttributes_};
    }

    [[nodiscard]] Mesh withMaterials(Materials newMaterials) const {
        return Mesh{vertices_, faces_, std::move(newMaterials), customAttributes_};
    }

    [[nodiscard]] Mesh withCustomAttributes(CustomAttributes newAttributes) const {
        return Mesh{vertices_, faces_, materials_, std::move(newAttributes)};
    }

    // 结构校验：索引越界、面的顶点数、属性长度
    [[nodiscard]] std::expected<void, MeshError> validate() const;

    // 扇形三角化，保留材质索引
    [[nodiscard]] Mesh triangulated() const;

    // 删除未被引用的顶点并重映射所有逐顶点数据
    [[nodiscard]] Mesh compacted() const;

    // 多个网格首尾相接合并
    [[nodiscard]] static Mesh merge(std::span<const Mesh> meshes);

private:
    Vertices vertices_;
    Faces faces_;
    Materials materials_;
    CustomAttributes customAttributes_;
};

// 面是否退化（不同顶点数少于 3）
[[nodiscard]] bool isDegenerate(const Face& face) noexcept;

// 网格统计信息
struct MeshStats {
    size_t vertexCount{0};
    size_t faceCount{0};
    size_t triangleCount{0};
    size_t quadCount{0};
    size_t degenerateFaceCount{0};
    Vec3 boundingBoxMin{0.0f, 0.0f, 0.0f};
    Vec3 boundingBoxMax{0.0f, 0.0f, 0.0f};
    float surfaceArea{0.0f};
};

// 纯函数：计算网格统计
[[nodiscard]] MeshStats computeStats(const Mesh& mesh) noexcept;

// 纯函数：计算包围盒
[[nodiscard]] std::pair<Vec3, Vec3> computeBoundingBox(const Mesh& mesh) noexcept;

} // namespace retopo::core
