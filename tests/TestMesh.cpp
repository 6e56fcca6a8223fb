#include "TestHelpers.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace loom;
using namespace loom::test;

namespace {

Mesh builtCube() {
    Mesh mesh = PrimitiveBuilder::createCube(2.0f);
    rebuildEdges(mesh);
    recalculateNormals(mesh);
    return mesh;
}

} // namespace

TEST(Mesh, CreateFaceRejectsFewerThanThreeVertices) {
    Mesh mesh;
    VertexId a = mesh.createVertex({0, 0, 0});
    VertexId b = mesh.createVertex({1, 0, 0});

    ASSERT_EQ(mesh.createFace({a, b}), kInvalidId);
    ASSERT_TRUE(mesh.faces.empty());
}

TEST(Mesh, FaceBoundaryWrapsAroundToTheFirstCorner) {
    Face face;
    face.vertexIds = {3, 7, 9};

    auto sides = faceBoundary(face);
    ASSERT_EQ(sides.size(), 3u);
    ASSERT_EQ(sides[2].first, 9u);
    ASSERT_EQ(sides[2].second, 3u);
}

TEST(Mesh, RebuildEdgesOnCubeGivesTwelveEdgesWithTwoFacesEach) {
    Mesh mesh = builtCube();

    ASSERT_EQ(mesh.edges.size(), 12u);
    for (const auto& e : mesh.edges) {
        ASSERT_EQ(e.faceIds.size(), 2u);
        ASSERT_LT(e.vertexIds[0], e.vertexIds[1]);
    }
}

TEST(Mesh, RebuildEdgesIsIdempotent) {
    Mesh mesh = builtCube();
    std::vector<Edge> first = mesh.edges;

    rebuildEdges(mesh);

    ASSERT_EQ(mesh.edges.size(), first.size());
    for (size_t i = 0; i < first.size(); ++i) {
        ASSERT_EQ(mesh.edges[i].id, first[i].id);
        ASSERT_EQ(mesh.edges[i].vertexIds, first[i].vertexIds);
        ASSERT_EQ(mesh.edges[i].faceIds, first[i].faceIds);
    }
}

TEST(Mesh, RebuildEdgesKeepsIdAndFlagsOfSurvivingPairs) {
    Mesh mesh = builtCube();
    const Edge* bottomFront = mesh.findEdgeByVertices(4, 5);
    ASSERT_NE(bottomFront, nullptr);
    EdgeId id = bottomFront->id;
    for (auto& e : mesh.edges) {
        if (e.id == id) {
            e.selected = true;
            e.seam = true;
        }
    }

    mesh.faces.erase(mesh.faces.begin() + kCubeTop);
    rebuildEdges(mesh);

    const Edge* after = mesh.findEdgeByVertices(4, 5);
    ASSERT_NE(after, nullptr);
    ASSERT_EQ(after->id, id);
    ASSERT_TRUE(after->selected);
    ASSERT_TRUE(after->seam);
    ASSERT_EQ(boundaryEdges(mesh).size(), 4u);
}

TEST(Mesh, NewEdgesGetFreshIds) {
    Mesh mesh = builtCube();
    uint32_t next = mesh.nextEdgeId;

    mesh.createFace({0, 2, 6});
    rebuildEdges(mesh);

    const Edge* diagonal = mesh.findEdgeByVertices(0, 6);
    ASSERT_NE(diagonal, nullptr);
    ASSERT_GE(diagonal->id, next);
}

TEST(Mesh, RecalculateNormalsPointOutwardOnCube) {
    Mesh mesh = builtCube();

    const Face* top = mesh.findFace(kCubeTop);
    ASSERT_NE(top, nullptr);
    EXPECT_NEAR(top->normal.y, 1.0f, 1e-5f);

    const Vertex* corner = mesh.findVertex(6);
    float k = 1.0f / std::sqrt(3.0f);
    EXPECT_NEAR(corner->normal.x, k, 1e-5f);
    EXPECT_NEAR(corner->normal.y, k, 1e-5f);
    EXPECT_NEAR(corner->normal.z, k, 1e-5f);
}

TEST(Mesh, DegenerateFaceKeepsTheDefaultNormal) {
    Mesh mesh;
    VertexId a = mesh.createVertex({0, 0, 0});
    VertexId b = mesh.createVertex({1, 0, 0});
    VertexId c = mesh.createVertex({2, 0, 0});
    mesh.createFace({a, b, c});

    recalculateNormals(mesh);

    ASSERT_EQ(mesh.faces[0].normal, glm::vec3(0.0f, 1.0f, 0.0f));
    ASSERT_EQ(mesh.vertices[0].normal, glm::vec3(0.0f, 1.0f, 0.0f));
}

TEST(Mesh, ValidateTopologyReportsDanglingVertexReferences) {
    Mesh mesh = builtCube();
    ASSERT_TRUE(validateTopology(mesh));

    mesh.createFace({0, 1, 99});
    ASSERT_FALSE(validateTopology(mesh));
}

TEST(Mesh, ValidateTopologyReportsMismatchedLoopUVs) {
    Mesh mesh = builtCube();
    mesh.faces[0].uvs = {{0, 0}, {1, 0}};

    ASSERT_FALSE(validateTopology(mesh));
}

TEST(Mesh, CubeBuilderCanCarryLoopUVs) {
    Mesh mesh = PrimitiveBuilder::createCube(2.0f, true);

    for (const auto& f : mesh.faces) {
        ASSERT_TRUE(f.hasLoopUVs());
    }
    ASSERT_EQ(mesh.vertices.size(), 8u);
    ASSERT_EQ(mesh.faces.size(), 6u);
}
