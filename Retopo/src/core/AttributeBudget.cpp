#include "core/AttributeBudget.hpp"
#include <algorithm>
#include <array>
#include <spdlog/spdlog.h>

namespace retopo::core {

namespace {

constexpr std::array<std::string_view, 7> kAllowedAttributes = {
    "position", "normal", "uv", "uv0", "material_index", "sharp_edge", "sharp_face"};

bool anyMaterial(const Mesh& mesh, bool Material::*flag) {
    return std::any_of(mesh.materials().begin(), mesh.materials().end(),
                       [flag](const Material& material) { return material.*flag; });
}

} // namespace

AttributeSet measureAttributes(const Mesh& mesh) noexcept {
    const auto& vertices = mesh.vertices();
    AttributeSet attributes;
    attributes.hasNormal = vertices.hasNormals();
    attributes.uvLayerCount = vertices.uvLayers.size();
    attributes.colorLayerCount = vertices.colorLayers.size();
    attributes.morphTargetCount = vertices.morphTargets.size();
    attributes.hasTangent = anyMaterial(mesh, &Material::requiresTangent);
    return attributes;
}

size_t countBuffers(const AttributeSet& attributes) noexcept {
    return 1
        + (attributes.hasNormal ? 1 : 0)
        + attributes.uvLayerCount
        + attributes.colorLayerCount
        + attributes.morphTargetCount
        + (attributes.hasTangent ? 1 : 0);
}

bool isAllowedCustomAttribute(std::string_view name) noexcept {
    // 以 '.' 开头的是宿主的拓扑内部字段
    if (!name.empty() && name.front() == '.') {
        return true;
    }
    return std::find(kAllowedAttributes.begin(), kAllowedAttributes.end(), name) != kAllowedAttributes.end();
}

BudgetEnforcement enforceBudget(const Mesh& mesh, const CleanupPolicy& policy) {
    AttributeBudgetResult result;
    result.bufferCountBefore = countBuffers(measureAttributes(mesh));
    result.bufferCount = result.bufferCountBefore;
    result.countHistory.push_back(result.bufferCount);

    if (result.bufferCount <= policy.maxBuffers) {
        return {mesh, std::move(result)};
    }

    Mesh working = mesh;
    auto recount = [&]() {
        result.bufferCount = countBuffers(measureAttributes(working));
        result.countHistory.push_back(result.bufferCount);
        return result.bufferCount <= policy.maxBuffers;
    };

    // 1. 只保留第一个 UV 层
    if (policy.trimUvLayers && working.vertices().uvLayers.size() > 1) {
        auto vertices = working.vertices();
        result.removed.uvLayers = vertices.uvLayers.size() - 1;
        vertices.uvLayers.resize(1);
        working = working.withVertices(std::move(vertices));
        spdlog::debug("attribute budget: removed {} extra UV layers", result.removed.uvLayers);
        if (recount()) {
            return {std::move(working), std::move(result)};
        }
    }

    // 2. 没有材质读取顶点色时全部删除，否则只保留第一个
    if (policy.trimColorLayers && !working.vertices().colorLayers.empty()) {
        auto vertices = working.vertices();
        const size_t keep = anyMaterial(working, &Material::usesVertexColor) ? 1 : 0;
        if (vertices.colorLayers.size() > keep) {
            result.removed.vertexColors = vertices.colorLayers.size() - keep;
            vertices.colorLayers.resize(keep);
            working = working.withVertices(std::move(vertices));
            spdlog::debug("attribute budget: removed {} color layers", result.removed.vertexColors);
            if (recount()) {
                return {std::move(working), std::move(result)};
            }
        }
    }

    // 3. 删除变形目标；会破坏基于变形的动画，必须显式报告
    if (!working.vertices().morphTargets.empty()) {
        if (policy.removeMorphTargets) {
            auto vertices = working.vertices();
            result.removed.shapeKeys = vertices.morphTargets.size();
            vertices.morphTargets.clear();
            working = working.withVertices(std::move(vertices));
            result.warnings.push_back("removed " + std::to_string(result.removed.shapeKeys)
                                      + " morph targets; morph-based animation is lost");
            spdlog::warn("attribute budget: {}", result.warnings.back());
            if (recount()) {
                return {std::move(working), std::move(result)};
            }
        } else {
            result.warnings.push_back(std::to_string(working.vertices().morphTargets.size())
                                      + " morph targets kept over budget (removal disabled by policy)");
            spdlog::warn("attribute budget: {}", result.warnings.back());
        }
    }

    // 4. 删除白名单以外的自定义属性
    if (policy.removeCustomAttributes && !working.customAttributes().empty()) {
        Mesh::CustomAttributes kept;
        for (const auto& attr : working.customAttributes()) {
            if (isAllowedCustomAttribute(attr.name)) {
                kept.push_back(attr);
            } else {
                ++result.removed.customAttributes;
            }
        }
        if (result.removed.customAttributes > 0) {
            working = working.withCustomAttributes(std::move(kept));
            spdlog::debug("attribute budget: removed {} custom attributes", result.removed.customAttributes);
            if (recount()) {
                return {std::move(working), std::move(result)};
            }
        }
    }

    result.overLimit = result.bufferCount > policy.maxBuffers;
    if (result.overLimit) {
        result.warnings.push_back("vertex buffer count " + std::to_string(result.bufferCount)
                                  + " exceeds limit of " + std::to_string(policy.maxBuffers));
        spdlog::warn("attribute budget: {}", result.warnings.back());
    }

    return {std::move(working), std::move(result)};
}

} // namespace retopo::core
