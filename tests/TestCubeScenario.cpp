#include "TestHelpers.hpp"

#include <gtest/gtest.h>

using namespace loom;
using namespace loom::test;

// End-to-end edits on the default cube, driven through the stores directly
class CubeScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        cubeId = addCube(meshes);
        scene.addObject("Cube", cubeId);
        ASSERT_TRUE(selection.enterEditMode(cubeId));
    }

    MeshStore meshes;
    SceneStore scene;
    ToolStore tools;
    EditorSettings settings;
    NullPointerCapture capture;
    SelectionStore selection{meshes, scene, tools};
    TransformOperation transform{tools, settings, capture};
    MeshId cubeId = kInvalidId;
};

TEST_F(CubeScenarioTest, TopFaceBecomesFourVertices) {
    ASSERT_TRUE(selection.selectFaces(cubeId, {kCubeTop}));
    ASSERT_TRUE(selection.setSelectionMode(SelectionMode::Vertex));

    ASSERT_EQ(sorted(selection.getSelectedVertexIds()), (std::vector<VertexId>{2, 3, 6, 7}));
}

TEST_F(CubeScenarioTest, SingleLoopCutThroughTheTopSplitsFourFaces) {
    EdgeId topFront = edgeBetween(meshes, cubeId, 6, 7);

    ASSERT_TRUE(applyLoopCut(meshes, cubeId, topFront, 1, 0.5f));

    auto mesh = meshes.snapshot(cubeId);
    ASSERT_EQ(mesh->vertices.size(), 12u);
    ASSERT_EQ(mesh->faces.size(), 10u);
    ASSERT_TRUE(validateTopology(*mesh));

    // The new ring sits at x = 0 around top, back, bottom and front
    size_t onRing = 0;
    for (const auto& v : mesh->vertices) {
        if (v.id >= 8) {
            EXPECT_NEAR(v.position.x, 0.0f, 1e-5f);
            onRing++;
        }
    }
    ASSERT_EQ(onRing, 4u);

    // Left and right are untouched; every other face is now a half quad
    ASSERT_NE(mesh->findFace(kCubeLeft), nullptr);
    ASSERT_NE(mesh->findFace(kCubeRight), nullptr);
    ASSERT_EQ(mesh->findFace(kCubeTop), nullptr);
    for (const auto& f : mesh->faces) {
        ASSERT_EQ(f.vertexIds.size(), 4u);
    }
}

TEST_F(CubeScenarioTest, MovingTheTopVerticesCommitsOnlyThem) {
    ASSERT_TRUE(selection.selectVertices(cubeId, {2, 3, 6, 7}));
    auto target = std::make_unique<VertexTransformTarget>(meshes, cubeId, selection.getSelectedVertexIds());
    ASSERT_TRUE(transform.start(ToolKind::Move, std::move(target)));

    TransformDelta delta;
    delta.translation = {1.0f, 0.0f, 0.0f};
    ASSERT_TRUE(transform.setDelta(delta));
    ASSERT_TRUE(transform.commit());

    auto mesh = meshes.snapshot(cubeId);
    for (const auto& v : mesh->vertices) {
        bool top = v.id == 2 || v.id == 3 || v.id == 6 || v.id == 7;
        float expected = PrimitiveBuilder::createCube().vertices[v.id].position.x + (top ? 1.0f : 0.0f);
        EXPECT_NEAR(v.position.x, expected, 1e-5f) << "vertex " << v.id;
    }
}

TEST_F(CubeScenarioTest, CancelledMoveChangesNothing) {
    ASSERT_TRUE(selection.selectVertices(cubeId, {2, 3, 6, 7}));
    uint64_t revision = meshes.revision(cubeId);
    auto before = meshes.snapshot(cubeId);

    auto target = std::make_unique<VertexTransformTarget>(meshes, cubeId, selection.getSelectedVertexIds());
    ASSERT_TRUE(transform.start(ToolKind::Move, std::move(target)));
    TransformDelta delta;
    delta.translation = {1.0f, 0.0f, 0.0f};
    ASSERT_TRUE(transform.setDelta(delta));
    transform.cancel();

    ASSERT_EQ(meshes.revision(cubeId), revision);
    auto after = meshes.snapshot(cubeId);
    for (size_t i = 0; i < before->vertices.size(); ++i) {
        ASSERT_EQ(after->vertices[i].position, before->vertices[i].position);
    }
}
