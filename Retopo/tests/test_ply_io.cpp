#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/io/PlyIO.hpp"
#include "TestMeshes.hpp"
#include <cstring>
#include <sstream>

using namespace retopo;
using namespace retopo::io;
using namespace retopo::test;

namespace {

const char* kAsciiQuad = R"(ply
format ascii 1.0
comment exported by a sculpting tool
element vertex 4
property float x
property float y
property float z
property float quality
element face 2
property list uchar int vertex_indices
property int material_index
end_header
0 0 0 0.25
1 0 0 0.5
1 1 0 0.75

0 1 0 1
4 0 1 2 3 0
3 0 2 3 2
)";

template<typename T>
void appendBinary(std::string& buffer, T value) {
    char bytes[sizeof(T)];
    std::memcpy(bytes, &value, sizeof(T));
    buffer.append(bytes, sizeof(T));
}

} // namespace

TEST_CASE("PLY ASCII reading", "[ply]") {
    StandardPlyReader reader;
    std::istringstream stream(kAsciiQuad);

    auto mesh = reader.readPly(stream);
    REQUIRE(mesh.has_value());

    SECTION("Polygon faces are kept") {
        REQUIRE(mesh->vertexCount() == 4);
        REQUIRE(mesh->faceCount() == 2);
        REQUIRE(mesh->faces()[0].arity() == 4);
        REQUIRE(mesh->faces()[1].indices == std::vector<core::Index>{0, 2, 3});
    }

    SECTION("Material indices create placeholder materials") {
        REQUIRE(mesh->faces()[1].materialIndex == 2);
        REQUIRE(mesh->materials().size() == 3);
        REQUIRE(mesh->materials()[2].name == "material_2");
    }

    SECTION("Unknown vertex properties become custom attributes") {
        REQUIRE(mesh->customAttributes().size() == 1);
        const auto& quality = mesh->customAttributes()[0];
        REQUIRE(quality.name == "quality");
        REQUIRE(quality.domain == core::AttributeDomain::Vertex);
        REQUIRE(quality.data.size() == 4);
        REQUIRE(quality.data[3] == Catch::Approx(1.0f));
    }

    SECTION("No optional layers") {
        REQUIRE_FALSE(mesh->vertices().hasNormals());
        REQUIRE(mesh->vertices().uvLayers.empty());
        REQUIRE(mesh->vertices().colorLayers.empty());
    }
}

TEST_CASE("PLY binary reading", "[ply]") {
    std::string data =
        "ply\n"
        "format binary_little_endian 1.0\n"
        "element vertex 3\n"
        "property float x\n"
        "property float y\n"
        "property float z\n"
        "property uchar red\n"
        "property uchar green\n"
        "property uchar blue\n"
        "element face 1\n"
        "property list uchar uint vertex_indices\n"
        "end_header\n";

    const float positions[3][3] = {{0.0f, 0.0f, 0.0f}, {2.0f, 0.0f, 0.0f}, {0.0f, 2.0f, 0.0f}};
    for (const auto& p : positions) {
        appendBinary(data, p[0]);
        appendBinary(data, p[1]);
        appendBinary(data, p[2]);
        appendBinary<uint8_t>(data, 255);
        appendBinary<uint8_t>(data, 0);
        appendBinary<uint8_t>(data, 51);
    }
    appendBinary<uint8_t>(data, 3);
    appendBinary<uint32_t>(data, 0);
    appendBinary<uint32_t>(data, 1);
    appendBinary<uint32_t>(data, 2);

    StandardPlyReader reader;
    std::istringstream stream(data, std::ios::binary);
    auto mesh = reader.readPly(stream);

    REQUIRE(mesh.has_value());
    REQUIRE(mesh->vertexCount() == 3);
    REQUIRE(mesh->vertices().positions[1][0] == Catch::Approx(2.0f));
    REQUIRE(mesh->faces()[0].indices == std::vector<core::Index>{0, 1, 2});

    // 字节颜色归一化，缺省 alpha 为不透明
    REQUIRE(mesh->vertices().colorLayers.size() == 1);
    const auto& color = mesh->vertices().colorLayers[0].values[0];
    REQUIRE(color[0] == Catch::Approx(1.0f));
    REQUIRE(color[2] == Catch::Approx(0.2f));
    REQUIRE(color[3] == Catch::Approx(1.0f));
}

TEST_CASE("PLY errors", "[ply]") {
    StandardPlyReader reader;

    SECTION("Missing file") {
        auto mesh = reader.readPly(std::filesystem::path("does/not/exist.ply"));
        REQUIRE(mesh.error() == PlyError::FileNotFound);
    }

    SECTION("Not a PLY file") {
        std::istringstream stream("OFF\n3 1 0\n");
        REQUIRE(reader.readPly(stream).error() == PlyError::InvalidFormat);
    }

    SECTION("Big endian is not supported") {
        std::istringstream stream("ply\nformat binary_big_endian 1.0\nelement vertex 0\nend_header\n");
        REQUIRE(reader.readPly(stream).error() == PlyError::UnsupportedFormat);
    }

    SECTION("Truncated body") {
        std::istringstream stream(
            "ply\nformat ascii 1.0\nelement vertex 3\nproperty float x\nproperty float y\nproperty float z\n"
            "element face 1\nproperty list uchar int vertex_indices\nend_header\n0 0 0\n1 0 0\n");
        REQUIRE(reader.readPly(stream).error() == PlyError::ReadError);
    }

    SECTION("Header counts larger than the body") {
        std::istringstream stream(
            "ply\nformat ascii 1.0\nelement vertex 4000000000000000000\nproperty float x\nproperty float y\n"
            "property float z\nelement face 4000000000000000000\nproperty list uchar int vertex_indices\n"
            "end_header\n0 0 0\n1 0 0\n0 1 0\n");
        REQUIRE(reader.readPly(stream).error() == PlyError::ReadError);
    }

    SECTION("Material indices out of range") {
        const std::string header =
            "ply\nformat ascii 1.0\nelement vertex 3\nproperty float x\nproperty float y\nproperty float z\n"
            "element face 1\nproperty list uchar int vertex_indices\nproperty int material_index\nend_header\n"
            "0 0 0\n1 0 0\n0 1 0\n";
        for (const auto* face : {"3 0 1 2 2000000000\n", "3 0 1 2 -1\n", "3 0 1 2 1.5\n"}) {
            std::istringstream stream(header + face);
            REQUIRE(reader.readPly(stream).error() == PlyError::InvalidFormat);
        }
    }

    SECTION("Face lists out of range") {
        const std::string header =
            "ply\nformat ascii 1.0\nelement vertex 3\nproperty float x\nproperty float y\nproperty float z\n"
            "element face 1\nproperty list int int vertex_indices\nend_header\n0 0 0\n1 0 0\n0 1 0\n";
        for (const auto* face : {"-3 0 1 2\n", "2000000000 0 1 2\n", "3 0 -1 2\n", "3 0 1 5000000000\n"}) {
            std::istringstream stream(header + face);
            REQUIRE(reader.readPly(stream).error() == PlyError::InvalidFormat);
        }
    }

    SECTION("No faces") {
        std::istringstream stream(
            "ply\nformat ascii 1.0\nelement vertex 1\nproperty float x\nproperty float y\nproperty float z\n"
            "end_header\n0 0 0\n");
        REQUIRE(reader.readPly(stream).error() == PlyError::EmptyMesh);
    }
}

TEST_CASE("PLY writing", "[ply]") {
    auto source = withLayers(makeCube(), 2, 1, 0, true);

    std::ostringstream out;
    REQUIRE(writePly(source, out).has_value());
    const auto text = out.str();

    SECTION("Header describes the first UV and color layer only") {
        REQUIRE(text.rfind("ply\nformat ascii 1.0\n", 0) == 0);
        REQUIRE(text.find("property float s\nproperty float t\n") != std::string::npos);
        REQUIRE(text.find("property uchar red") != std::string::npos);
        REQUIRE(text.find("property list uchar int vertex_indices") != std::string::npos);
        REQUIRE(text.find("element face 6") != std::string::npos);
    }

    SECTION("Written mesh reads back") {
        StandardPlyReader reader;
        std::istringstream in(text);
        auto mesh = reader.readPly(in);

        REQUIRE(mesh.has_value());
        REQUIRE(mesh->vertexCount() == 8);
        REQUIRE(mesh->faceCount() == 6);
        REQUIRE(mesh->faces()[0].arity() == 4);
        REQUIRE(mesh->vertices().hasNormals());
        REQUIRE(mesh->vertices().uvLayers.size() == 1);
        REQUIRE(mesh->vertices().uvLayers[0].coords[0][0] == Catch::Approx(0.5f));
        REQUIRE(mesh->vertices().colorLayers.size() == 1);
        REQUIRE(mesh->vertices().colorLayers[0].values[0][0] == Catch::Approx(1.0f));
    }

    SECTION("Optional streams can be disabled") {
        PlyWriteOptions options;
        options.writeNormals = false;
        options.writeColors = false;
        options.comment.clear();

        std::ostringstream plain;
        REQUIRE(writePly(source, plain, options).has_value());
        REQUIRE(plain.str().find("nx") == std::string::npos);
        REQUIRE(plain.str().find("red") == std::string::npos);
        REQUIRE(plain.str().find("comment") == std::string::npos);
    }

    SECTION("Files and metadata") {
        TempDir dir;
        const auto path = dir.path() / "cube.ply";
        REQUIRE(writePly(source, path).has_value());

        auto reader = createPlyReader();
        auto metadata = reader->readMetadata(path);
        REQUIRE(metadata.has_value());
        REQUIRE(metadata->format == "ascii");
        REQUIRE(metadata->vertexCount == 8);
        REQUIRE(metadata->faceCount == 6);
        REQUIRE(metadata->hasNormals);
        REQUIRE(metadata->hasTexCoords);

        REQUIRE(reader->readPly(path).has_value());
    }
}
