#include "TestHelpers.hpp"

#include <gtest/gtest.h>

using namespace loom;
using namespace loom::test;

TEST(MeshStore, AddMeshAssignsIdAndDerivesEdges) {
    MeshStore meshes;
    MeshId first = addCube(meshes);
    MeshId second = addCube(meshes);

    ASSERT_NE(first, second);
    ASSERT_EQ(meshes.meshCount(), 2u);
    ASSERT_EQ(meshes.revision(first), 1u);

    auto mesh = meshes.snapshot(first);
    ASSERT_NE(mesh, nullptr);
    ASSERT_EQ(mesh->id, first);
    ASSERT_EQ(mesh->edges.size(), 12u);
}

TEST(MeshStore, UnknownIdsGiveNullSnapshotAndZeroRevision) {
    MeshStore meshes;

    ASSERT_EQ(meshes.snapshot(42), nullptr);
    ASSERT_EQ(meshes.revision(42), 0u);
    ASSERT_FALSE(meshes.updateMesh(42, [](Mesh&) {}));
    ASSERT_FALSE(meshes.removeMesh(42));
}

TEST(MeshStore, SnapshotIsUnaffectedByLaterUpdates) {
    MeshStore meshes;
    MeshId id = addCube(meshes);
    auto before = meshes.snapshot(id);

    ASSERT_TRUE(meshes.updateMesh(id, [](Mesh& m) { m.findVertex(0)->position.x = -5.0f; },
                                  MeshChange::Geometry));

    ASSERT_FLOAT_EQ(before->findVertex(0)->position.x, -1.0f);
    ASSERT_FLOAT_EQ(meshes.snapshot(id)->findVertex(0)->position.x, -5.0f);
    ASSERT_EQ(meshes.revision(id), 2u);
}

TEST(MeshStore, NestedUpdateIsRejected) {
    MeshStore meshes;
    MeshId id = addCube(meshes);
    bool nested = true;
    bool updatingInside = false;

    bool outer = meshes.updateMesh(id, [&](Mesh&) {
        updatingInside = meshes.isUpdating();
        nested = meshes.updateMesh(id, [](Mesh&) {});
    });

    ASSERT_TRUE(outer);
    ASSERT_TRUE(updatingInside);
    ASSERT_FALSE(nested);
    ASSERT_FALSE(meshes.isUpdating());
    ASSERT_EQ(meshes.revision(id), 2u);
}

TEST(MeshStore, AttributeChangesSkipNormalRecalculation) {
    MeshStore meshes;
    MeshId id = addCube(meshes);
    auto raise = [](Mesh& m) { m.findVertex(7)->position.y = 3.0f; };

    ASSERT_TRUE(meshes.updateMesh(id, raise, MeshChange::Attributes));
    ASSERT_NEAR(meshes.snapshot(id)->findFace(kCubeTop)->normal.y, 1.0f, 1e-5f);

    ASSERT_TRUE(meshes.updateMesh(id, raise, MeshChange::Geometry));
    ASSERT_LT(meshes.snapshot(id)->findFace(kCubeTop)->normal.y, 0.99f);
}

TEST(MeshStore, DeleteFacesLeavesOpenBoundary) {
    MeshStore meshes;
    MeshId id = addCube(meshes);

    ASSERT_TRUE(meshes.deleteFaces(id, {kCubeTop}));

    auto mesh = meshes.snapshot(id);
    ASSERT_EQ(mesh->faces.size(), 5u);
    ASSERT_EQ(mesh->edges.size(), 12u);
    ASSERT_EQ(boundaryEdges(*mesh).size(), 4u);
    ASSERT_EQ(mesh->vertices.size(), 8u);
}

TEST(MeshStore, DeleteVerticesDropsEveryFaceTouchingThem) {
    MeshStore meshes;
    MeshId id = addCube(meshes);

    ASSERT_TRUE(meshes.deleteVertices(id, {6}));

    auto mesh = meshes.snapshot(id);
    ASSERT_EQ(mesh->vertices.size(), 7u);
    ASSERT_EQ(mesh->faces.size(), 3u);
    ASSERT_EQ(mesh->findFace(kCubeFront), nullptr);
    ASSERT_EQ(mesh->findFace(kCubeRight), nullptr);
    ASSERT_EQ(mesh->findFace(kCubeTop), nullptr);
    ASSERT_TRUE(validateTopology(*mesh));
}

TEST(MeshStore, DeleteEdgesDropsTheFacesThatProduceThem) {
    MeshStore meshes;
    MeshId id = addCube(meshes);
    EdgeId topFront = edgeBetween(meshes, id, 6, 7);

    ASSERT_TRUE(meshes.deleteEdges(id, {topFront}));

    auto mesh = meshes.snapshot(id);
    ASSERT_EQ(mesh->faces.size(), 4u);
    ASSERT_EQ(mesh->findEdgeByVertices(6, 7), nullptr);
    ASSERT_EQ(mesh->vertices.size(), 8u);
}

TEST(MeshStore, EmptyDeletionsDoNothing) {
    MeshStore meshes;
    MeshId id = addCube(meshes);

    ASSERT_FALSE(meshes.deleteFaces(id, {}));
    ASSERT_FALSE(meshes.deleteVertices(id, {}));
    ASSERT_EQ(meshes.revision(id), 1u);
}

TEST(MeshStore, MergeVerticesCollapsesOntoCentroid) {
    MeshStore meshes;
    MeshId id = addCube(meshes);

    ASSERT_EQ(meshes.mergeVertices(id, {6, 7}), 6u);

    auto mesh = meshes.snapshot(id);
    ASSERT_EQ(mesh->vertices.size(), 7u);
    ASSERT_EQ(mesh->findVertex(7), nullptr);

    glm::vec3 p = mesh->findVertex(6)->position;
    EXPECT_NEAR(p.x, 0.0f, 1e-5f);
    EXPECT_NEAR(p.y, 1.0f, 1e-5f);
    EXPECT_NEAR(p.z, 1.0f, 1e-5f);

    // Top and front lose a corner, the left side just swaps one
    ASSERT_EQ(mesh->faces.size(), 6u);
    ASSERT_EQ(mesh->findFace(kCubeTop)->vertexIds.size(), 3u);
    ASSERT_EQ(mesh->findFace(kCubeFront)->vertexIds.size(), 3u);
    ASSERT_EQ(mesh->findFace(kCubeLeft)->vertexIds.size(), 4u);
    ASSERT_TRUE(validateTopology(*mesh));
}

TEST(MeshStore, MergeKeepsLoopUVsParallelToCorners) {
    MeshStore meshes;
    MeshId id = addCube(meshes, true);

    ASSERT_NE(meshes.mergeVertices(id, {6, 7}), kInvalidId);

    for (const auto& f : meshes.snapshot(id)->faces) {
        ASSERT_TRUE(f.hasLoopUVs());
    }
}

TEST(MeshStore, MergeNeedsTwoVerticesAndAnExistingTarget) {
    MeshStore meshes;
    MeshId id = addCube(meshes);

    ASSERT_EQ(meshes.mergeVertices(id, {6}), kInvalidId);
    ASSERT_EQ(meshes.mergeVertices(id, {99, 6}), kInvalidId);
    ASSERT_EQ(meshes.revision(id), 1u);
}

TEST(MeshStore, AddMeshKeepsCountersAheadOfExistingIds) {
    Mesh mesh;
    Vertex v;
    v.id = 40;
    mesh.vertices.push_back(v);

    MeshStore meshes;
    MeshId id = meshes.addMesh(mesh);

    VertexId created = kInvalidId;
    meshes.updateMesh(id, [&](Mesh& m) { created = m.createVertex({1, 2, 3}); });
    ASSERT_EQ(created, 41u);
}
