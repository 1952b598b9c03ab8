#include <catch2/catch_test_macros.hpp>
#include "../src/core/MeshGraph.hpp"
#include "../src/core/TopologyAnalyzer.hpp"
#include "TestMeshes.hpp"

using namespace retopo::core;
using namespace retopo::test;

namespace {

// 两个三角形共用一条边，但接缝处的顶点被拆成了两份
Mesh makeSplitSeam() {
    VertexAttributes vertices;
    vertices.positions = {
        {0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f},
        {1.0f, 0.0f, 0.0f}, {1.0f, 1.0f, 0.0f}, {0.0f, 1.0f, 0.0f}
    };
    return Mesh{std::move(vertices), {Face{{0, 1, 2}, 0}, Face{{3, 4, 5}, 0}}};
}

} // namespace

TEST_CASE("MeshGraph construction", "[mesh_graph]") {
    SECTION("Closed cube") {
        auto graph = MeshGraph::build(makeCube());

        REQUIRE(graph.nodeCount() == 6);
        REQUIRE(graph.edgeCount() == 12);
        for (const auto face : graph.nodes()) {
            REQUIRE(graph.neighbors(face).size() == 4);
        }
    }

    SECTION("Grid adjacency is edge based") {
        auto graph = MeshGraph::build(makeGrid(3, 3));

        REQUIRE(graph.neighbors(0) == std::vector<MeshGraph::FaceId>{1, 3});
        REQUIRE(graph.neighbors(4).size() == 4);
    }

    SECTION("Shared vertex is not adjacency") {
        VertexAttributes vertices;
        vertices.positions = {
            {0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f},
            {-1.0f, 0.0f, 0.0f}, {0.0f, -1.0f, 0.0f}
        };
        Mesh mesh{std::move(vertices), {Face{{0, 1, 2}, 0}, Face{{0, 3, 4}, 0}}};

        auto graph = MeshGraph::build(mesh);
        REQUIRE(graph.neighbors(0).empty());
        REQUIRE(graph.neighbors(1).empty());
    }

    SECTION("Degenerate faces are excluded") {
        auto mesh = makeTriangle().withFaces({Face{{0, 1, 2}, 0}, Face{{0, 0, 1}, 0}});
        auto graph = MeshGraph::build(mesh);

        REQUIRE(graph.nodeCount() == 1);
        REQUIRE(graph.excludedFaceCount() == 1);
        REQUIRE(graph.contains(0));
        REQUIRE_FALSE(graph.contains(1));
    }

    SECTION("Out of range queries") {
        auto graph = MeshGraph::build(makeTriangle());
        REQUIRE(graph.neighbors(42).empty());
        REQUIRE_FALSE(graph.contains(42));
    }

    SECTION("Empty mesh") {
        auto graph = MeshGraph::build(Mesh{});
        REQUIRE(graph.empty());
        REQUIRE(graph.edgeCount() == 0);
    }
}

TEST_CASE("MeshGraph welding", "[mesh_graph]") {
    auto mesh = makeSplitSeam();

    SECTION("Without welding the seam splits the mesh") {
        auto graph = MeshGraph::build(mesh);
        REQUIRE(graph.edgeCount() == 0);
    }

    SECTION("Welding joins coincident vertices") {
        auto graph = MeshGraph::build(mesh, GraphOptions{1e-5f});
        REQUIRE(graph.edgeCount() == 1);
        REQUIRE(graph.neighbors(0) == std::vector<MeshGraph::FaceId>{1});
    }

    SECTION("Canonical ids") {
        auto ids = canonicalVertexIds(mesh, 1e-5f);
        REQUIRE(ids[3] == 1);
        REQUIRE(ids[5] == 2);
        REQUIRE(ids[4] == 4);

        auto identity = canonicalVertexIds(mesh, 0.0f);
        REQUIRE(identity[3] == 3);
    }
}

TEST_CASE("MeshGraph from adjacency", "[mesh_graph]") {
    SECTION("Adjacency is symmetrized") {
        auto graph = MeshGraph::fromAdjacency({{1}, {}, {3}, {}});

        REQUIRE(graph.nodeCount() == 4);
        REQUIRE(graph.neighbors(1) == std::vector<MeshGraph::FaceId>{0});
        REQUIRE(graph.edgeCount() == 2);
    }

    SECTION("Self loops and unknown faces are ignored") {
        auto graph = MeshGraph::fromAdjacency({{0, 7}, {0}});

        REQUIRE(graph.neighbors(0) == std::vector<MeshGraph::FaceId>{1});
        REQUIRE(graph.edgeCount() == 1);
    }
}

TEST_CASE("Island analysis", "[topology]") {
    SECTION("Closed mesh is one island") {
        auto report = analyzeIslands(makeCube());
        REQUIRE(report.islandCount == 1);
        REQUIRE(report.largestIslandFaceCount == 6);
    }

    SECTION("Triangle soup") {
        auto report = analyzeIslands(makeTriangleSoup(49));
        REQUIRE(report.islandCount == 49);
        REQUIRE(report.largestIslandFaceCount == 1);
    }

    SECTION("Largest island") {
        std::vector<Mesh> parts{makeGrid(4, 4), makeTriangle(10.0f), makeTriangle(12.0f)};
        auto report = analyzeIslands(Mesh::merge(parts));
        REQUIRE(report.islandCount == 3);
        REQUIRE(report.largestIslandFaceCount == 16);
    }

    SECTION("Welding changes the island count") {
        REQUIRE(analyzeIslands(makeSplitSeam()).islandCount == 2);
        REQUIRE(analyzeIslands(makeSplitSeam(), GraphOptions{1e-5f}).islandCount == 1);
    }

    SECTION("Synthetic graph") {
        auto graph = MeshGraph::fromAdjacency({{1}, {2}, {}, {4}, {}, {}});
        REQUIRE(analyzeIslands(graph) == IslandReport{3, 3});
    }

    SECTION("Empty graph has no islands") {
        REQUIRE(analyzeIslands(Mesh{}).islandCount == 0);
    }

    SECTION("Degenerate faces do not count as islands") {
        auto mesh = makeTriangle().withFaces({Face{{0, 1, 2}, 0}, Face{{1, 1, 2}, 0}});
        REQUIRE(analyzeIslands(mesh).islandCount == 1);
    }
}
