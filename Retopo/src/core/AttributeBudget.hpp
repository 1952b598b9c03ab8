#pragma once

#include "Mesh.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace retopo::core {

// WebGPU 基线一次可绑定的顶点缓冲数
inline constexpr size_t kMaxVertexBuffers = 8;

// 从网格推导出的属性集合
struct AttributeSet {
    bool hasPosition{true};
    bool hasNormal{false};
    size_t uvLayerCount{0};
    size_t colorLayerCount{0};
    size_t morphTargetCount{0};
    bool hasTangent{false};
};

// 清理策略：每一步都可以单独关闭
struct CleanupPolicy {
    bool trimUvLayers{true};
    bool trimColorLayers{true};
    bool removeMorphTargets{true};
    bool removeCustomAttributes{true};
    size_t maxBuffers{kMaxVertexBuffers};
};

struct RemovedAttributes {
    size_t uvLayers{0};
    size_t vertexColors{0};
    size_t shapeKeys{0};
    size_t customAttributes{0};

    size_t total() const noexcept { return uvLayers + vertexColors + shapeKeys + customAttributes; }
};

struct AttributeBudgetResult {
    size_t bufferCountBefore{0};
    size_t bufferCount{0};
    bool overLimit{false};
    RemovedAttributes removed;
    // 初始计数以及每个执行过的步骤之后的计数
    std::vector<size_t> countHistory;
    std::vector<std::string> warnings;
};

struct BudgetEnforcement {
    Mesh mesh;
    AttributeBudgetResult result;
};

// 纯函数：从网格推导属性集合
[[nodiscard]] AttributeSet measureAttributes(const Mesh& mesh) noexcept;

// 纯函数：顶点缓冲数 = 位置 + 法线 + UV 层 + 颜色层 + 变形目标 + 切线
[[nodiscard]] size_t countBuffers(const AttributeSet& attributes) noexcept;

// 自定义属性白名单（位置、法线、主 UV、拓扑内部字段、材质索引、锐边/锐面标记）
[[nodiscard]] bool isAllowedCustomAttribute(std::string_view name) noexcept;

// 按固定顺序清理直到缓冲数不超过上限；已合规的网格原样返回
[[nodiscard]] BudgetEnforcement enforceBudget(const Mesh& mesh, const CleanupPolicy& policy = {});

} // namespace retopo::core
