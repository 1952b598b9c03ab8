#pragma once

#include "Mesh.hpp"
#include <expected>
#include <memory>
#include <string>

namespace retopo::core {

// 内置四边形重拓扑接口：输出以四边形为主的单一连通网格，目标按四边形面数计
class IQuadRemesher {
public:
    virtual ~IQuadRemesher() = default;

    virtual std::string name() const = 0;

    // 内部失败返回错误信息；调用方也要准备好接住异常
    virtual std::expected<Mesh, std::string> remesh(const Mesh& mesh, size_t targetFaces) const = 0;
};

// 塌缩式减面接口，目标按三角形数计
class IDecimator {
public:
    virtual ~IDecimator() = default;

    virtual std::string name() const = 0;

    virtual std::expected<Mesh, std::string> decimate(const Mesh& mesh, size_t targetTriangles) const = 0;
};

// 体素重拓扑配置
struct QuadRemeshConfig {
    size_t maxResolution{192};    // 每个轴的最大体素数
    int fitIterations{4};         // 调整体素尺寸以逼近目标面数的次数
    float fitTolerance{0.1f};     // 面数相对误差在此范围内即停止
    int smoothIterations{2};      // 投影后的拉普拉斯平滑次数
    float smoothFactor{0.3f};
};

// 体素化 -> 外部洪泛 -> 提取实体与外部之间的边界四边形 -> 投影回表面 -> 平滑
class VoxelQuadRemesher : public IQuadRemesher {
public:
    explicit VoxelQuadRemesher(QuadRemeshConfig config = {})
        : config_(config) {}

    std::string name() const override { return "voxel-quad"; }

    std::expected<Mesh, std::string> remesh(const Mesh& mesh, size_t targetFaces) const override;

    const QuadRemeshConfig& config() const noexcept { return config_; }

private:
    QuadRemeshConfig config_;
};

// 减面配置
struct DecimationConfig {
    float targetError{1.0f};          // 兜底路径，允许任意误差以达到目标
    bool allowSloppyPass{true};       // 拓扑保持的简化停滞时再做一次 sloppy 简化
    float sloppyThreshold{1.5f};      // 结果超过目标的倍数时触发
};

// 基于 meshoptimizer 的减面，按材质分组简化并压缩顶点流
class MeshoptDecimator : public IDecimator {
public:
    explicit MeshoptDecimator(DecimationConfig config = {})
        : config_(config) {}

    std::string name() const override { return "meshoptimizer"; }

    std::expected<Mesh, std::string> decimate(const Mesh& mesh, size_t targetTriangles) const override;

private:
    DecimationConfig config_;
};

// 纯函数：按面计算面积加权的顶点法线
[[nodiscard]] std::vector<Vec3> computeVertexNormals(const Mesh& mesh);

// 工厂函数
[[nodiscard]] std::unique_ptr<IQuadRemesher> createQuadRemesher(QuadRemeshConfig config = {});
[[nodiscard]] std::unique_ptr<IDecimator> createDecimator(DecimationConfig config = {});

} // namespace retopo::core
