#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace retopo::core {

// 单个 LOD 级别的目标
struct LodSpec {
    std::string label;
    size_t targetFaceCount{0};

    bool operator==(const LodSpec&) const = default;
};

// 默认 LOD 目标（四边形面数）
inline std::vector<LodSpec> defaultLodSpecs() {
    return {{"LOD0", 4000}, {"LOD1", 1500}, {"LOD2", 500}};
}

} // namespace retopo::core
