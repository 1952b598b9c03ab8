#pragma once

#include "../core/Mesh.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace retopo::io {

// GLB 导出错误类型
enum class ExportError {
    InvalidPath,
    WriteError,
    JsonError,
    EmptyModel
};

[[nodiscard]] std::string_view toString(ExportError error) noexcept;

// 导出配置
struct GlbExportConfig {
    bool writeCombinedFile{true};     // 额外写出 <model>_all_lods.glb
    bool includeNormals{true};
    bool includeMorphTargets{true};
    std::string generator{"retopo"};
};

// 带名字的网格：一个 LOD 对应一个节点
struct NamedMesh {
    std::string name;
    core::Mesh mesh;
};

// glTF 文档与二进制缓冲
struct GltfDocument {
    nlohmann::json json;
    std::vector<uint8_t> binary;
};

// 纯函数：构建 glTF JSON 与 BIN（多边形面扇形三角化，每个材质一个 primitive）
[[nodiscard]] std::expected<GltfDocument, ExportError>
buildGltf(std::span<const NamedMesh> meshes,
          const std::optional<std::string>& skeletonReference = std::nullopt,
          const GlbExportConfig& config = {});

// 纯函数：打包为 GLB 容器（12 字节头 + JSON 块 + BIN 块）
[[nodiscard]] std::expected<std::vector<uint8_t>, ExportError> packGlb(const GltfDocument& document);

// 逐 LOD 写出 GLB 文件
class GlbExporter {
public:
    explicit GlbExporter(GlbExportConfig config = {})
        : config_(std::move(config)) {}

    // 写出 <dir>/<model>_<LOD>.glb 以及可选的 <model>_all_lods.glb，返回写出的文件
    [[nodiscard]] std::expected<std::vector<std::filesystem::path>, ExportError>
    exportModel(const std::filesystem::path& outputDir,
                std::string_view modelName,
                std::span<const NamedMesh> lods,
                const std::optional<std::string>& skeletonReference = std::nullopt) const;

    const GlbExportConfig& config() const noexcept { return config_; }

private:
    GlbExportConfig config_;

    std::expected<void, ExportError> writeFile(const std::filesystem::path& path,
                                               std::span<const NamedMesh> meshes,
                                               const std::optional<std::string>& skeletonReference) const;
};

} // namespace retopo::io
