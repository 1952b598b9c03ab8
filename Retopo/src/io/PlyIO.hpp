#pragma once

#include "../core/Mesh.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace retopo::io {

// PLY 读写错误类型
enum class PlyError {
    FileNotFound,
    InvalidFormat,
    UnsupportedFormat,
    ReadError,
    WriteError,
    EmptyMesh
};

[[nodiscard]] std::string_view toString(PlyError error) noexcept;

// 单个属性声明；list 属性带计数类型
struct PlyProperty {
    std::string name;
    std::string type;
    bool isList{false};
    std::string countType;
};

struct PlyElement {
    std::string name;
    size_t count{0};
    std::vector<PlyProperty> properties;
};

// PLY 文件元数据
struct PlyMetadata {
    std::string format;  // ascii, binary_little_endian, binary_big_endian
    std::vector<PlyElement> elements;
    size_t vertexCount{0};
    size_t faceCount{0};
    bool hasNormals{false};
    bool hasColors{false};
    bool hasTexCoords{false};
};

// PLY 读取器接口
class IPlyReader {
public:
    virtual ~IPlyReader() = default;

    // 读取 PLY 文件，保留多边形面
    virtual std::expected<core::Mesh, PlyError>
    readPly(const std::filesystem::path& filePath) const = 0;

    // 读取元数据（不加载完整网格）
    virtual std::expected<PlyMetadata, PlyError>
    readMetadata(const std::filesystem::path& filePath) const = 0;
};

// 标准 PLY 读取器：ascii 与 binary_little_endian
class StandardPlyReader : public IPlyReader {
public:
    StandardPlyReader() = default;

    std::expected<core::Mesh, PlyError>
    readPly(const std::filesystem::path& filePath) const override;

    std::expected<PlyMetadata, PlyError>
    readMetadata(const std::filesystem::path& filePath) const override;

    // 从流读取（测试与内存数据）
    std::expected<core::Mesh, PlyError> readPly(std::istream& stream) const;

private:
    std::expected<PlyMetadata, PlyError> parseHeader(std::istream& stream) const;
};

// 写出选项
struct PlyWriteOptions {
    bool writeNormals{true};
    bool writeTexCoords{true};   // 仅第一个 UV 层
    bool writeColors{true};      // 仅第一个颜色层
    std::string comment{"retopo interchange"};
};

// 写出 ASCII 多边形 PLY（外部重拓扑工具的交换格式）
[[nodiscard]] std::expected<void, PlyError>
writePly(const core::Mesh& mesh, const std::filesystem::path& filePath, const PlyWriteOptions& options = {});

[[nodiscard]] std::expected<void, PlyError>
writePly(const core::Mesh& mesh, std::ostream& stream, const PlyWriteOptions& options = {});

// 工厂函数
[[nodiscard]] std::unique_ptr<IPlyReader> createPlyReader();

} // namespace retopo::io
