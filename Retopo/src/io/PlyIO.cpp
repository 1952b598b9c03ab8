#include "io/PlyIO.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <limits>
#include <new>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace retopo::io {

namespace {

// 头部声明的数量不可信，预分配最多这么多
constexpr size_t kMaxReserve = size_t{1} << 20;
// 单个 list 属性的元素上限
constexpr double kMaxListCount = 65536.0;
// material_index 上限；每个槽位都会生成占位材质
constexpr double kMaxMaterialSlots = 65536.0;

// 非负整数且小于 limit 时写入 out
bool toIndex(double value, double limit, uint32_t& out) noexcept {
    if (!std::isfinite(value) || value < 0.0 || value >= limit || value != std::floor(value)) {
        return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
}

// 类型名 -> 字节数；未知类型返回 0
size_t typeSize(const std::string& type) noexcept {
    if (type == "char" || type == "uchar" || type == "int8" || type == "uint8") {
        return 1;
    }
    if (type == "short" || type == "ushort" || type == "int16" || type == "uint16") {
        return 2;
    }
    if (type == "int" || type == "uint" || type == "int32" || type == "uint32"
        || type == "float" || type == "float32") {
        return 4;
    }
    if (type == "double" || type == "float64") {
        return 8;
    }
    return 0;
}

bool isByteType(const std::string& type) noexcept {
    return type == "uchar" || type == "uint8";
}

template<typename T>
bool readRaw(std::istream& stream, double& out) {
    T value{};
    if (!stream.read(reinterpret_cast<char*>(&value), sizeof(T))) {
        return false;
    }
    out = static_cast<double>(value);
    return true;
}

// 二进制（小端）数据源
class BinarySource {
public:
    explicit BinarySource(std::istream& stream) : stream_(stream) {}

    bool beginRecord() { return true; }

    bool next(const std::string& type, double& out) {
        if (type == "char" || type == "int8") return readRaw<int8_t>(stream_, out);
        if (type == "uchar" || type == "uint8") return readRaw<uint8_t>(stream_, out);
        if (type == "short" || type == "int16") return readRaw<int16_t>(stream_, out);
        if (type == "ushort" || type == "uint16") return readRaw<uint16_t>(stream_, out);
        if (type == "int" || type == "int32") return readRaw<int32_t>(stream_, out);
        if (type == "uint" || type == "uint32") return readRaw<uint32_t>(stream_, out);
        if (type == "float" || type == "float32") return readRaw<float>(stream_, out);
        if (type == "double" || type == "float64") return readRaw<double>(stream_, out);
        return false;
    }

private:
    std::istream& stream_;
};

// ASCII 数据源：每个元素实例一行
class AsciiSource {
public:
    explicit AsciiSource(std::istream& stream) : stream_(stream) {}

    bool beginRecord() {
        std::string line;
        // 跳过空行
        while (std::getline(stream_, line)) {
            if (line.find_first_not_of(" \t\r") != std::string::npos) {
                line_.clear();
                line_.str(line);
                return true;
            }
        }
        return false;
    }

    bool next(const std::string&, double& out) {
        return static_cast<bool>(line_ >> out);
    }

private:
    std::istream& stream_;
    std::istringstream line_;
};

// 顶点属性到网格字段的映射
struct VertexLayout {
    std::optional<size_t> position[3];
    std::optional<size_t> normal[3];
    std::optional<size_t> texCoord[2];
    std::optional<size_t> color[4];
    bool byteColor{false};
    std::vector<size_t> customSlots;
};

VertexLayout mapVertexProperties(const PlyElement& element) {
    VertexLayout layout;
    for (size_t i = 0; i < element.properties.size(); ++i) {
        const auto& name = element.properties[i].name;
        if (element.properties[i].isList) {
            continue;
        }
        if (name == "x") layout.position[0] = i;
        else if (name == "y") layout.position[1] = i;
        else if (name == "z") layout.position[2] = i;
        else if (name == "nx") layout.normal[0] = i;
        else if (name == "ny") layout.normal[1] = i;
        else if (name == "nz") layout.normal[2] = i;
        else if (name == "u" || name == "s" || name == "texture_u") layout.texCoord[0] = i;
        else if (name == "v" || name == "t" || name == "texture_v") layout.texCoord[1] = i;
        else if (name == "red") { layout.color[0] = i; layout.byteColor = isByteType(element.properties[i].type); }
        else if (name == "green") layout.color[1] = i;
        else if (name == "blue") layout.color[2] = i;
        else if (name == "alpha") layout.color[3] = i;
        else layout.customSlots.push_back(i);
    }
    return layout;
}

template<typename Source>
std::expected<core::Mesh, PlyError> readBody(Source& source, const PlyMetadata& metadata) {
    core::VertexAttributes vertices;
    core::Mesh::Faces faces;
    core::Mesh::CustomAttributes customAttributes;
    bool sawVertices = false;

    std::vector<double> values;

    for (const auto& element : metadata.elements) {
        const bool isVertex = element.name == "vertex";
        const bool isFace = element.name == "face";

        VertexLayout layout;
        if (isVertex) {
            sawVertices = true;
            layout = mapVertexProperties(element);
            if (!layout.position[0] || !layout.position[1] || !layout.position[2]) {
                return std::unexpected(PlyError::InvalidFormat);
            }
            const auto reserve = std::min(element.count, kMaxReserve);
            vertices.positions.reserve(reserve);
            if (metadata.hasNormals) {
                vertices.normals.reserve(reserve);
            }
            if (metadata.hasTexCoords) {
                vertices.uvLayers.push_back({"UVMap", {}});
            }
            if (metadata.hasColors) {
                vertices.colorLayers.push_back({"Col", {}});
            }
            for (const auto slot : layout.customSlots) {
                customAttributes.push_back({element.properties[slot].name, core::AttributeDomain::Vertex, 1, {}});
            }
        }
        if (isFace) {
            faces.reserve(std::min(element.count, kMaxReserve));
        }

        for (size_t record = 0; record < element.count; ++record) {
            if (!source.beginRecord()) {
                return std::unexpected(PlyError::ReadError);
            }

            values.assign(element.properties.size(), 0.0);
            core::Face face;

            for (size_t p = 0; p < element.properties.size(); ++p) {
                const auto& property = element.properties[p];
                if (!property.isList) {
                    if (!source.next(property.type, values[p])) {
                        return std::unexpected(PlyError::ReadError);
                    }
                    continue;
                }

                double countValue = 0.0;
                if (!source.next(property.countType, countValue)) {
                    return std::unexpected(PlyError::ReadError);
                }
                uint32_t count = 0;
                if (!toIndex(countValue, kMaxListCount, count)) {
                    return std::unexpected(PlyError::InvalidFormat);
                }
                const bool isIndexList = isFace && (property.name == "vertex_indices" || property.name == "vertex_index");
                for (size_t k = 0; k < count; ++k) {
                    double index = 0.0;
                    if (!source.next(property.type, index)) {
                        return std::unexpected(PlyError::ReadError);
                    }
                    if (isIndexList) {
                        // 越界（相对顶点数）留给 Mesh::validate
                        core::Index vertexIndex = 0;
                        if (!toIndex(index, static_cast<double>(std::numeric_limits<core::Index>::max()), vertexIndex)) {
                            return std::unexpected(PlyError::InvalidFormat);
                        }
                        face.indices.push_back(vertexIndex);
                    }
                }
            }

            if (isVertex) {
                auto at = [&values](const std::optional<size_t>& slot, double fallback) {
                    return static_cast<float>(slot ? values[*slot] : fallback);
                };
                vertices.positions.push_back({at(layout.position[0], 0), at(layout.position[1], 0), at(layout.position[2], 0)});
                if (metadata.hasNormals) {
                    vertices.normals.push_back({at(layout.normal[0], 0), at(layout.normal[1], 0), at(layout.normal[2], 0)});
                }
                if (metadata.hasTexCoords) {
                    vertices.uvLayers.front().coords.push_back({at(layout.texCoord[0], 0), at(layout.texCoord[1], 0)});
                }
                if (metadata.hasColors) {
                    const float scale = layout.byteColor ? 1.0f / 255.0f : 1.0f;
                    const double opaque = layout.byteColor ? 255.0 : 1.0;
                    vertices.colorLayers.front().values.push_back({at(layout.color[0], 0) * scale,
                                                                   at(layout.color[1], 0) * scale,
                                                                   at(layout.color[2], 0) * scale,
                                                                   at(layout.color[3], opaque) * scale});
                }
                for (size_t c = 0; c < layout.customSlots.size(); ++c) {
                    customAttributes[c].data.push_back(static_cast<float>(values[layout.customSlots[c]]));
                }
            } else if (isFace) {
                for (size_t p = 0; p < element.properties.size(); ++p) {
                    if (element.properties[p].name == "material_index" && !element.properties[p].isList) {
                        if (!toIndex(values[p], kMaxMaterialSlots, face.materialIndex)) {
                            return std::unexpected(PlyError::InvalidFormat);
                        }
                    }
                }
                faces.push_back(std::move(face));
            }
        }
    }

    if (!sawVertices) {
        return std::unexpected(PlyError::InvalidFormat);
    }

    core::Mesh mesh{std::move(vertices), std::move(faces), {}, std::move(customAttributes)};
    if (mesh.empty()) {
        return std::unexpected(PlyError::EmptyMesh);
    }

    // 面引用了材质时补齐占位材质
    uint32_t maxMaterial = 0;
    for (const auto& face : mesh.faces()) {
        maxMaterial = std::max(maxMaterial, face.materialIndex);
    }
    core::Mesh::Materials materials(maxMaterial + 1);
    for (uint32_t i = 0; i < materials.size(); ++i) {
        materials[i].name = "material_" + std::to_string(i);
    }

    return mesh.withMaterials(std::move(materials));
}

} // namespace

std::string_view toString(PlyError error) noexcept {
    switch (error) {
        case PlyError::FileNotFound: return "file not found";
        case PlyError::InvalidFormat: return "invalid PLY format";
        case PlyError::UnsupportedFormat: return "unsupported PLY format";
        case PlyError::ReadError: return "PLY read error";
        case PlyError::WriteError: return "PLY write error";
        case PlyError::EmptyMesh: return "PLY contains an empty mesh";
    }
    return "unknown PLY error";
}

// StandardPlyReader 实现
std::expected<core::Mesh, PlyError> StandardPlyReader::readPly(const std::filesystem::path& filePath) const {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(PlyError::FileNotFound);
    }
    return readPly(file);
}

std::expected<core::Mesh, PlyError> StandardPlyReader::readPly(std::istream& stream) const {
    // 解析头部
    auto metadataResult = parseHeader(stream);
    if (!metadataResult) {
        return std::unexpected(metadataResult.error());
    }

    const auto& metadata = metadataResult.value();

    // 头部数量与实际内容不符时分配可能失败
    try {
        if (metadata.format == "ascii") {
            AsciiSource source(stream);
            return readBody(source, metadata);
        }
        if (metadata.format == "binary_little_endian") {
            BinarySource source(stream);
            return readBody(source, metadata);
        }
    } catch (const std::bad_alloc&) {
        return std::unexpected(PlyError::InvalidFormat);
    } catch (const std::length_error&) {
        return std::unexpected(PlyError::InvalidFormat);
    }
    return std::unexpected(PlyError::UnsupportedFormat);
}

std::expected<PlyMetadata, PlyError> StandardPlyReader::readMetadata(const std::filesystem::path& filePath) const {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(PlyError::FileNotFound);
    }

    return parseHeader(file);
}

std::expected<PlyMetadata, PlyError> StandardPlyReader::parseHeader(std::istream& stream) const {
    PlyMetadata metadata;
    std::string line;

    auto trim = [](std::string& text) {
        while (!text.empty() && (text.back() == '\r' || text.back() == ' ')) {
            text.pop_back();
        }
    };

    // 读取第一行，应该是 "ply"
    if (!std::getline(stream, line)) {
        return std::unexpected(PlyError::InvalidFormat);
    }
    trim(line);
    if (line != "ply") {
        return std::unexpected(PlyError::InvalidFormat);
    }

    bool ended = false;
    while (std::getline(stream, line)) {
        trim(line);
        std::istringstream iss(line);
        std::string keyword;
        iss >> keyword;

        if (keyword == "format") {
            iss >> metadata.format;
        } else if (keyword == "element") {
            PlyElement element;
            if (!(iss >> element.name >> element.count)) {
                return std::unexpected(PlyError::InvalidFormat);
            }
            if (element.name == "vertex") {
                metadata.vertexCount = element.count;
            } else if (element.name == "face") {
                metadata.faceCount = element.count;
            }
            metadata.elements.push_back(std::move(element));
        } else if (keyword == "property") {
            if (metadata.elements.empty()) {
                return std::unexpected(PlyError::InvalidFormat);
            }
            PlyProperty property;
            std::string type;
            iss >> type;
            if (type == "list") {
                property.isList = true;
                iss >> property.countType >> property.type;
                if (typeSize(property.countType) == 0) {
                    return std::unexpected(PlyError::InvalidFormat);
                }
            } else {
                property.type = type;
            }
            iss >> property.name;
            if (property.name.empty() || typeSize(property.type) == 0) {
                return std::unexpected(PlyError::InvalidFormat);
            }

            if (metadata.elements.back().name == "vertex") {
                const auto& name = property.name;
                if (name == "nx" || name == "ny" || name == "nz") {
                    metadata.hasNormals = true;
                } else if (name == "red" || name == "green" || name == "blue" || name == "alpha") {
                    metadata.hasColors = true;
                } else if (name == "u" || name == "v" || name == "s" || name == "t"
                           || name == "texture_u" || name == "texture_v") {
                    metadata.hasTexCoords = true;
                }
            }
            metadata.elements.back().properties.push_back(std::move(property));
        } else if (keyword == "end_header") {
            ended = true;
            break;
        }
    }

    if (!ended || metadata.format.empty()) {
        return std::unexpected(PlyError::InvalidFormat);
    }
    if (metadata.format != "ascii" && metadata.format != "binary_little_endian") {
        return std::unexpected(PlyError::UnsupportedFormat);
    }

    return metadata;
}

std::expected<void, PlyError>
writePly(const core::Mesh& mesh, std::ostream& stream, const PlyWriteOptions& options) {
    const auto& vertices = mesh.vertices();
    const bool normals = options.writeNormals && vertices.hasNormals();
    const bool texCoords = options.writeTexCoords && !vertices.uvLayers.empty();
    const bool colors = options.writeColors && !vertices.colorLayers.empty();

    stream << "ply\n"
           << "format ascii 1.0\n";
    if (!options.comment.empty()) {
        stream << "comment " << options.comment << "\n";
    }
    stream << "element vertex " << vertices.size() << "\n"
           << "property float x\nproperty float y\nproperty float z\n";
    if (normals) {
        stream << "property float nx\nproperty float ny\nproperty float nz\n";
    }
    if (texCoords) {
        stream << "property float s\nproperty float t\n";
    }
    if (colors) {
        stream << "property uchar red\nproperty uchar green\nproperty uchar blue\nproperty uchar alpha\n";
    }
    stream << "element face " << mesh.faceCount() << "\n"
           << "property list uchar int vertex_indices\n"
           << "end_header\n";

    stream << std::setprecision(std::numeric_limits<float>::max_digits10);

    auto toByte = [](float value) {
        return static_cast<int>(std::clamp(value, 0.0f, 1.0f) * 255.0f + 0.5f);
    };

    for (size_t i = 0; i < vertices.size(); ++i) {
        const auto& p = vertices.positions[i];
        stream << p[0] << ' ' << p[1] << ' ' << p[2];
        if (normals) {
            const auto& n = vertices.normals[i];
            stream << ' ' << n[0] << ' ' << n[1] << ' ' << n[2];
        }
        if (texCoords) {
            const auto& uv = vertices.uvLayers.front().coords[i];
            stream << ' ' << uv[0] << ' ' << uv[1];
        }
        if (colors) {
            const auto& c = vertices.colorLayers.front().values[i];
            stream << ' ' << toByte(c[0]) << ' ' << toByte(c[1]) << ' ' << toByte(c[2]) << ' ' << toByte(c[3]);
        }
        stream << '\n';
    }

    for (const auto& face : mesh.faces()) {
        if (face.arity() > std::numeric_limits<uint8_t>::max()) {
            return std::unexpected(PlyError::WriteError);
        }
        stream << face.arity();
        for (const auto index : face.indices) {
            stream << ' ' << index;
        }
        stream << '\n';
    }

    if (!stream) {
        return std::unexpected(PlyError::WriteError);
    }
    return {};
}

std::expected<void, PlyError>
writePly(const core::Mesh& mesh, const std::filesystem::path& filePath, const PlyWriteOptions& options) {
    std::ofstream file(filePath);
    if (!file.is_open()) {
        return std::unexpected(PlyError::WriteError);
    }
    return writePly(mesh, file, options);
}

std::unique_ptr<IPlyReader> createPlyReader() {
    return std::make_unique<StandardPlyReader>();
}

} // namespace retopo::io
