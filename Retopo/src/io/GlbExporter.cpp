#include "io/GlbExporter.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <limits>
#include <map>

namespace retopo::io {

namespace {

constexpr uint32_t kGlbMagic = 0x46546C67;       // "glTF"
constexpr uint32_t kGlbVersion = 2;
constexpr uint32_t kChunkJson = 0x4E4F534A;      // "JSON"
constexpr uint32_t kChunkBin = 0x004E4942;       // "BIN\0"

constexpr int kComponentFloat = 5126;
constexpr int kComponentUnsignedInt = 5125;
constexpr int kArrayBuffer = 34962;
constexpr int kElementArrayBuffer = 34963;

void appendU32(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

// 缓冲视图与访问器的累积构建
class BufferBuilder {
public:
    size_t addView(const void* data, size_t byteLength, int target) {
        while (binary_.size() % 4 != 0) {
            binary_.push_back(0);
        }
        const size_t offset = binary_.size();
        binary_.resize(offset + byteLength);
        if (byteLength > 0) {
            std::memcpy(binary_.data() + offset, data, byteLength);
        }
        views_.push_back({{"buffer", 0}, {"byteOffset", offset}, {"byteLength", byteLength}, {"target", target}});
        return views_.size() - 1;
    }

    size_t addVec3(const std::vector<core::Vec3>& values, bool withBounds) {
        const auto view = addView(values.data(), values.size() * sizeof(core::Vec3), kArrayBuffer);
        nlohmann::json accessor{{"bufferView", view}, {"componentType", kComponentFloat},
                                {"count", values.size()}, {"type", "VEC3"}};
        if (withBounds && !values.empty()) {
            core::Vec3 lo = values.front();
            core::Vec3 hi = values.front();
            for (const auto& v : values) {
                for (int k = 0; k < 3; ++k) {
                    lo[k] = std::min(lo[k], v[k]);
                    hi[k] = std::max(hi[k], v[k]);
                }
            }
            accessor["min"] = {lo[0], lo[1], lo[2]};
            accessor["max"] = {hi[0], hi[1], hi[2]};
        }
        accessors_.push_back(std::move(accessor));
        return accessors_.size() - 1;
    }

    template<typename T>
    size_t addFloats(const std::vector<T>& values, const char* type) {
        const auto view = addView(values.data(), values.size() * sizeof(T), kArrayBuffer);
        accessors_.push_back({{"bufferView", view}, {"componentType", kComponentFloat},
                              {"count", values.size()}, {"type", type}});
        return accessors_.size() - 1;
    }

    size_t addIndices(const std::vector<uint32_t>& indices) {
        const auto view = addView(indices.data(), indices.size() * sizeof(uint32_t), kElementArrayBuffer);
        accessors_.push_back({{"bufferView", view}, {"componentType", kComponentUnsignedInt},
                              {"count", indices.size()}, {"type", "SCALAR"}});
        return accessors_.size() - 1;
    }

    nlohmann::json& views() noexcept { return views_; }
    nlohmann::json& accessors() noexcept { return accessors_; }
    std::vector<uint8_t>& binary() noexcept { return binary_; }

private:
    nlohmann::json views_ = nlohmann::json::array();
    nlohmann::json accessors_ = nlohmann::json::array();
    std::vector<uint8_t> binary_;
};

nlohmann::json buildMesh(const NamedMesh& named, BufferBuilder& buffers, nlohmann::json& materials,
                         const GlbExportConfig& config) {
    const auto mesh = named.mesh.triangulated();
    const auto& vertices = mesh.vertices();

    nlohmann::json attributes;
    attributes["POSITION"] = buffers.addVec3(vertices.positions, true);
    if (config.includeNormals && vertices.hasNormals()) {
        attributes["NORMAL"] = buffers.addVec3(vertices.normals, false);
    }
    for (size_t i = 0; i < vertices.uvLayers.size(); ++i) {
        // glTF 的 UV 原点在左上角
        auto coords = vertices.uvLayers[i].coords;
        for (auto& uv : coords) {
            uv[1] = 1.0f - uv[1];
        }
        attributes["TEXCOORD_" + std::to_string(i)] = buffers.addFloats(coords, "VEC2");
    }
    for (size_t i = 0; i < vertices.colorLayers.size(); ++i) {
        attributes["COLOR_" + std::to_string(i)] = buffers.addFloats(vertices.colorLayers[i].values, "VEC4");
    }

    nlohmann::json targets = nlohmann::json::array();
    nlohmann::json targetNames = nlohmann::json::array();
    if (config.includeMorphTargets) {
        for (const auto& target : vertices.morphTargets) {
            targets.push_back({{"POSITION", buffers.addVec3(target.positionDeltas, true)}});
            targetNames.push_back(target.name);
        }
    }

    // 材质索引 -> 全局材质索引
    const size_t materialBase = materials.size();
    for (const auto& material : mesh.materials()) {
        materials.push_back({{"name", material.name},
                             {"pbrMetallicRoughness", {{"metallicFactor", 0.0}, {"roughnessFactor", 1.0}}}});
    }

    std::map<uint32_t, std::vector<uint32_t>> groups;
    for (const auto& face : mesh.faces()) {
        auto& group = groups[face.materialIndex];
        group.insert(group.end(), face.indices.begin(), face.indices.end());
    }

    nlohmann::json primitives = nlohmann::json::array();
    for (const auto& [materialIndex, indices] : groups) {
        nlohmann::json primitive{{"attributes", attributes}, {"indices", buffers.addIndices(indices)}, {"mode", 4}};
        if (materialIndex < mesh.materials().size()) {
            primitive["material"] = materialBase + materialIndex;
        }
        if (!targets.empty()) {
            primitive["targets"] = targets;
        }
        primitives.push_back(std::move(primitive));
    }

    nlohmann::json result{{"name", named.name}, {"primitives", primitives}};
    if (!targets.empty()) {
        result["extras"] = {{"targetNames", targetNames}};
    }
    return result;
}

} // namespace

std::string_view toString(ExportError error) noexcept {
    switch (error) {
        case ExportError::InvalidPath: return "invalid output path";
        case ExportError::WriteError: return "write error";
        case ExportError::JsonError: return "glTF JSON error";
        case ExportError::EmptyModel: return "nothing to export";
    }
    return "unknown export error";
}

std::expected<GltfDocument, ExportError>
buildGltf(std::span<const NamedMesh> meshes,
          const std::optional<std::string>& skeletonReference,
          const GlbExportConfig& config) {
    if (meshes.empty()) {
        return std::unexpected(ExportError::EmptyModel);
    }

    try {
        BufferBuilder buffers;
        nlohmann::json gltfMeshes = nlohmann::json::array();
        nlohmann::json nodes = nlohmann::json::array();
        nlohmann::json materials = nlohmann::json::array();

        for (const auto& named : meshes) {
            if (named.mesh.empty()) {
                return std::unexpected(ExportError::EmptyModel);
            }
            gltfMeshes.push_back(buildMesh(named, buffers, materials, config));
            nodes.push_back({{"name", named.name}, {"mesh", gltfMeshes.size() - 1}});
        }

        nlohmann::json sceneNodes = nlohmann::json::array();
        for (size_t i = 0; i < nodes.size(); ++i) {
            sceneNodes.push_back(i);
        }

        nlohmann::json scene{{"nodes", sceneNodes}};
        if (skeletonReference) {
            scene["extras"] = {{"skeleton", *skeletonReference}};
        }

        while (buffers.binary().size() % 4 != 0) {
            buffers.binary().push_back(0);
        }

        GltfDocument document;
        document.json = {
            {"asset", {{"version", "2.0"}, {"generator", config.generator}}},
            {"scene", 0},
            {"scenes", nlohmann::json::array({scene})},
            {"nodes", nodes},
            {"meshes", gltfMeshes},
            {"accessors", buffers.accessors()},
            {"bufferViews", buffers.views()},
            {"buffers", nlohmann::json::array({{{"byteLength", buffers.binary().size()}}})}};
        if (!materials.empty()) {
            document.json["materials"] = materials;
        }
        document.binary = std::move(buffers.binary());
        return document;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("glTF build failed: {}", e.what());
        return std::unexpected(ExportError::JsonError);
    }
}

std::expected<std::vector<uint8_t>, ExportError> packGlb(const GltfDocument& document) {
    std::string jsonText;
    try {
        jsonText = document.json.dump();
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("glTF serialization failed: {}", e.what());
        return std::unexpected(ExportError::JsonError);
    }
    // JSON 块用空格补齐，BIN 块用 0 补齐到 4 字节
    while (jsonText.size() % 4 != 0) {
        jsonText.push_back(' ');
    }
    auto binary = document.binary;
    while (binary.size() % 4 != 0) {
        binary.push_back(0);
    }

    const size_t total = 12 + 8 + jsonText.size() + (binary.empty() ? 0 : 8 + binary.size());
    if (total > std::numeric_limits<uint32_t>::max()) {
        return std::unexpected(ExportError::WriteError);
    }

    std::vector<uint8_t> glb;
    glb.reserve(total);
    appendU32(glb, kGlbMagic);
    appendU32(glb, kGlbVersion);
    appendU32(glb, static_cast<uint32_t>(total));

    appendU32(glb, static_cast<uint32_t>(jsonText.size()));
    appendU32(glb, kChunkJson);
    glb.insert(glb.end(), jsonText.begin(), jsonText.end());

    if (!binary.empty()) {
        appendU32(glb, static_cast<uint32_t>(binary.size()));
        appendU32(glb, kChunkBin);
        glb.insert(glb.end(), binary.begin(), binary.end());
    }

    return glb;
}

std::expected<void, ExportError> GlbExporter::writeFile(const std::filesystem::path& path,
                                                        std::span<const NamedMesh> meshes,
                                                        const std::optional<std::string>& skeletonReference) const {
    auto document = buildGltf(meshes, skeletonReference, config_);
    if (!document) {
        return std::unexpected(document.error());
    }
    auto glb = packGlb(document.value());
    if (!glb) {
        return std::unexpected(glb.error());
    }

    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(ExportError::WriteError);
    }

    const auto& data = glb.value();
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));

    if (!file.good()) {
        return std::unexpected(ExportError::WriteError);
    }

    return {};
}

std::expected<std::vector<std::filesystem::path>, ExportError>
GlbExporter::exportModel(const std::filesystem::path& outputDir,
                         std::string_view modelName,
                         std::span<const NamedMesh> lods,
                         const std::optional<std::string>& skeletonReference) const {
    if (lods.empty()) {
        return std::unexpected(ExportError::EmptyModel);
    }
    if (modelName.empty()) {
        return std::unexpected(ExportError::InvalidPath);
    }

    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        spdlog::error("cannot create {}: {}", outputDir.string(), ec.message());
        return std::unexpected(ExportError::InvalidPath);
    }

    std::vector<std::filesystem::path> written;
    const std::string model(modelName);

    for (size_t i = 0; i < lods.size(); ++i) {
        auto path = outputDir / (model + "_" + lods[i].name + ".glb");
        if (auto result = writeFile(path, lods.subspan(i, 1), skeletonReference); !result) {
            return std::unexpected(result.error());
        }
        written.push_back(std::move(path));
    }

    if (config_.writeCombinedFile) {
        auto path = outputDir / (model + "_all_lods.glb");
        if (auto result = writeFile(path, lods, skeletonReference); !result) {
            return std::unexpected(result.error());
        }
        written.push_back(std::move(path));
    }

    spdlog::debug("exported {} files for {}", written.size(), model);
    return written;
}

} // namespace retopo::io
