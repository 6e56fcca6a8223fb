#include "TestHelpers.hpp"

#include <gtest/gtest.h>

using namespace loom;
using namespace loom::test;

namespace {

Ray rayDown(float x, float z) {
    Ray ray;
    ray.origin = {x, 10.0f, z};
    ray.direction = {0.0f, -1.0f, 0.0f};
    return ray;
}

} // namespace

TEST(Raycast, IntersectTriangleHitAndMiss) {
    glm::vec3 a(0, 0, 0), b(1, 0, 0), c(0, 0, 1);

    EXPECT_NEAR(intersectTriangle(rayDown(0.2f, 0.2f), a, b, c), 10.0f, 1e-5f);
    EXPECT_LT(intersectTriangle(rayDown(0.8f, 0.8f), a, b, c), 0.0f);

    // Parallel to the triangle's plane
    Ray flat;
    flat.origin = {-1.0f, 0.0f, 0.2f};
    flat.direction = {1.0f, 0.0f, 0.0f};
    EXPECT_LT(intersectTriangle(flat, a, b, c), 0.0f);
}

TEST(Raycast, ClosestFaceOfTheCubeIsHit) {
    MeshStore meshes;
    MeshId id = addCube(meshes);

    Ray ray;
    ray.origin = {0.3f, -0.2f, 5.0f};

    MeshRayHit hit = raycastFaces(*meshes.snapshot(id), Transform(), ray);

    ASSERT_TRUE(hit.hit);
    ASSERT_EQ(hit.faceId, kCubeFront);
    EXPECT_NEAR(hit.distance, 4.0f, 1e-5f);
    EXPECT_NEAR(hit.position.z, 1.0f, 1e-5f);
}

TEST(Raycast, ObjectTransformIsRespected) {
    MeshStore meshes;
    MeshId id = addCube(meshes);
    Transform moved;
    moved.setPosition({10.0f, 0.0f, 0.0f});

    Ray ray;
    ray.origin = {0.0f, 0.0f, 5.0f};
    ASSERT_FALSE(raycastFaces(*meshes.snapshot(id), moved, ray).hit);

    ray.origin = {10.3f, -0.2f, 5.0f};
    MeshRayHit hit = raycastFaces(*meshes.snapshot(id), moved, ray);
    ASSERT_TRUE(hit.hit);
    EXPECT_NEAR(hit.position.x, 10.3f, 1e-5f);
}

TEST(Raycast, MissReportsNoFace) {
    MeshStore meshes;
    MeshId id = addCube(meshes);

    MeshRayHit hit = raycastFaces(*meshes.snapshot(id), Transform(), rayDown(5.0f, 5.0f));

    ASSERT_FALSE(hit.hit);
    ASSERT_EQ(hit.faceId, kInvalidId);
}

TEST(Raycast, PointSegmentDistanceClampsToTheEnds) {
    glm::vec3 a(0, 0, 0), b(2, 0, 0);

    EXPECT_NEAR(pointSegmentDistance({1, 1, 0}, a, b), 1.0f, 1e-6f);
    EXPECT_NEAR(pointSegmentDistance({4, 0, 0}, a, b), 2.0f, 1e-6f);
    EXPECT_NEAR(pointSegmentDistance({0, 0, 3}, a, a), 3.0f, 1e-6f);
}

TEST(Raycast, ClosestFaceEdgeNearTheRightSideOfTheFront) {
    MeshStore meshes;
    MeshId id = addCube(meshes);
    auto mesh = meshes.snapshot(id);

    EdgeId edge = closestFaceEdge(*mesh, Transform(), kCubeFront, {0.9f, 0.0f, 1.0f});
    ASSERT_EQ(edge, edgeBetween(meshes, id, 5, 6));

    edge = closestFaceEdge(*mesh, Transform(), kCubeFront, {0.0f, 0.95f, 1.0f});
    ASSERT_EQ(edge, edgeBetween(meshes, id, 6, 7));

    ASSERT_EQ(closestFaceEdge(*mesh, Transform(), 99, {0.0f, 0.0f, 0.0f}), kInvalidId);
}
