#include "TestHelpers.hpp"

#include <gtest/gtest.h>

using namespace loom;
using namespace loom::test;

class SelectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        cubeId = addCube(meshes);
        cubeObj = scene.addObject("Cube", cubeId);
    }

    std::vector<VertexId> selectedVertices() const {
        return sorted(selection.getSelectedVertexIds());
    }

    MeshStore meshes;
    SceneStore scene;
    ToolStore tools;
    SelectionStore selection{meshes, scene, tools};
    MeshId cubeId = kInvalidId;
    ObjectId cubeObj = kInvalidId;
};

TEST_F(SelectionTest, StartsInObjectModeWithNothingSelected) {
    ASSERT_EQ(selection.getViewMode(), ViewMode::Object);
    ASSERT_FALSE(selection.hasSelection());
    ASSERT_EQ(selection.getEditMeshId(), kInvalidId);
}

TEST_F(SelectionTest, ComponentCallsAreIgnoredInObjectMode) {
    ASSERT_FALSE(selection.selectVertices(cubeId, {0, 1}));
    ASSERT_FALSE(selection.toggleFaceSelection(cubeId, kCubeTop));
    ASSERT_FALSE(selection.setSelectionMode(SelectionMode::Edge));
    ASSERT_FALSE(selection.hasSelection());
}

TEST_F(SelectionTest, ObjectCallsAreIgnoredInEditMode) {
    ASSERT_TRUE(selection.enterEditMode(cubeId));

    ASSERT_FALSE(selection.selectObjects({cubeObj}));
    ASSERT_FALSE(selection.toggleObjectSelection(cubeObj));
}

TEST_F(SelectionTest, EnterEditModeResetsToVertexModeAndKeepsObjects) {
    ASSERT_TRUE(selection.selectObjects({cubeObj}));

    ASSERT_TRUE(selection.enterEditMode(cubeId));
    ASSERT_TRUE(selection.isEditing());
    ASSERT_EQ(selection.getEditMeshId(), cubeId);
    ASSERT_EQ(selection.getSelectionMode(), SelectionMode::Vertex);
    ASSERT_EQ(selection.getSelection().objectIds.count(cubeObj), 1u);

    selection.exitEditMode();
    ASSERT_EQ(selection.getViewMode(), ViewMode::Object);
    ASSERT_EQ(selection.getSelection().objectIds.count(cubeObj), 1u);
}

TEST_F(SelectionTest, SetViewModeEntersAndLeavesEditMode) {
    ASSERT_TRUE(selection.selectObjects({cubeObj}));

    ASSERT_FALSE(selection.setViewMode(ViewMode::Edit));
    ASSERT_FALSE(selection.setViewMode(ViewMode::Edit, 99));
    ASSERT_EQ(selection.getViewMode(), ViewMode::Object);

    ASSERT_TRUE(selection.setViewMode(ViewMode::Edit, cubeId));
    ASSERT_TRUE(selection.isEditing());
    ASSERT_EQ(selection.getEditMeshId(), cubeId);
    ASSERT_EQ(selection.getSelection().objectIds.count(cubeObj), 1u);

    ASSERT_TRUE(selection.setViewMode(ViewMode::Object));
    ASSERT_EQ(selection.getViewMode(), ViewMode::Object);
    ASSERT_EQ(selection.getEditMeshId(), kInvalidId);
    ASSERT_EQ(selection.getSelection().objectIds.count(cubeObj), 1u);
}

TEST_F(SelectionTest, ClearInEditModeKeepsTheObjectSelection) {
    ASSERT_TRUE(selection.selectObjects({cubeObj}));
    ASSERT_TRUE(selection.enterEditMode(cubeId));
    ASSERT_TRUE(selection.selectVertices(cubeId, {1, 2}));

    selection.clearSelection();
    ASSERT_TRUE(selection.getSelection().vertexIds.empty());
    ASSERT_EQ(selection.getSelection().objectIds.count(cubeObj), 1u);

    selection.exitEditMode();
    ASSERT_EQ(selection.getSelection().objectIds.count(cubeObj), 1u);

    selection.clearSelection();
    ASSERT_TRUE(selection.getSelection().objectIds.empty());
}

TEST_F(SelectionTest, EnterEditModeRejectsUnknownMesh) {
    ASSERT_FALSE(selection.enterEditMode(99));
    ASSERT_FALSE(selection.isEditing());
}

TEST_F(SelectionTest, CallsForAnotherMeshAreIgnored) {
    MeshId other = addCube(meshes);
    ASSERT_TRUE(selection.enterEditMode(cubeId));

    ASSERT_FALSE(selection.selectVertices(other, {0}));
    ASSERT_FALSE(selection.selectVertices(kInvalidId, {0}));
    ASSERT_FALSE(selection.hasSelection());
}

TEST_F(SelectionTest, FaceToVertexGivesTheFaceCorners) {
    ASSERT_TRUE(selection.enterEditMode(cubeId));
    ASSERT_TRUE(selection.selectFaces(cubeId, {kCubeTop}));

    ASSERT_TRUE(selection.setSelectionMode(SelectionMode::Vertex));

    std::vector<VertexId> expected = {2, 3, 6, 7};
    ASSERT_EQ(std::vector<VertexId>(selection.getSelection().vertexIds.begin(),
                                    selection.getSelection().vertexIds.end()), expected);
    ASSERT_TRUE(selection.getSelection().faceIds.empty());
}

TEST_F(SelectionTest, VertexToEdgeToFaceFollowsFullCoverage) {
    ASSERT_TRUE(selection.enterEditMode(cubeId));
    ASSERT_TRUE(selection.selectVertices(cubeId, {2, 3, 6, 7}));

    ASSERT_TRUE(selection.setSelectionMode(SelectionMode::Edge));
    ASSERT_EQ(selection.getSelection().edgeIds.size(), 4u);

    ASSERT_TRUE(selection.setSelectionMode(SelectionMode::Face));
    ASSERT_EQ(selection.getSelection().faceIds, std::set<FaceId>{kCubeTop});
}

TEST_F(SelectionTest, PartialVertexSelectionPromotesToNoFace) {
    ASSERT_TRUE(selection.enterEditMode(cubeId));
    ASSERT_TRUE(selection.selectVertices(cubeId, {2, 3, 6}));

    ASSERT_TRUE(selection.setSelectionMode(SelectionMode::Face));

    ASSERT_TRUE(selection.getSelection().faceIds.empty());
}

TEST(SelectionPromotion, RoundTripOnAnIsolatedQuadRecoversTheVertices) {
    Mesh quad = PrimitiveBuilder::createGrid(1, 1);
    rebuildEdges(quad);

    Selection sel;
    sel.vertexIds = {0, 1, 2, 3};

    Selection faces = promoteSelection(sel, SelectionMode::Vertex, SelectionMode::Face, quad);
    ASSERT_EQ(faces.faceIds.size(), 1u);
    Selection back = promoteSelection(faces, SelectionMode::Face, SelectionMode::Vertex, quad);
    ASSERT_EQ(back.vertexIds, sel.vertexIds);

    Selection edges = promoteSelection(sel, SelectionMode::Vertex, SelectionMode::Edge, quad);
    ASSERT_EQ(edges.edgeIds.size(), 4u);
    Selection edgeFaces = promoteSelection(edges, SelectionMode::Edge, SelectionMode::Face, quad);
    ASSERT_EQ(edgeFaces.faceIds, faces.faceIds);
    Selection fromEdges = promoteSelection(edges, SelectionMode::Edge, SelectionMode::Vertex, quad);
    ASSERT_EQ(fromEdges.vertexIds, sel.vertexIds);
}

TEST(SelectionPromotion, OnlyTheTargetSetIsFilled) {
    Mesh quad = PrimitiveBuilder::createGrid(1, 1);
    rebuildEdges(quad);

    Selection sel;
    sel.faceIds = {0};

    Selection edges = promoteSelection(sel, SelectionMode::Face, SelectionMode::Edge, quad);
    ASSERT_EQ(edges.selectionMode, SelectionMode::Edge);
    ASSERT_EQ(edges.edgeIds.size(), 4u);
    ASSERT_TRUE(edges.faceIds.empty());
    ASSERT_TRUE(edges.vertexIds.empty());
}

TEST_F(SelectionTest, LockedObjectsAreFiltered) {
    ObjectId locked = scene.addObject("Locked", addCube(meshes));
    ASSERT_TRUE(scene.setLocked(locked, true));

    ASSERT_TRUE(selection.selectObjects({cubeObj, locked}));
    ASSERT_EQ(selection.getSelection().objectIds, std::set<ObjectId>{cubeObj});

    ASSERT_FALSE(selection.toggleObjectSelection(locked));

    selection.selectAll();
    ASSERT_EQ(selection.getSelection().objectIds, std::set<ObjectId>{cubeObj});
}

TEST_F(SelectionTest, ToggleAddsThenRemoves) {
    ASSERT_TRUE(selection.enterEditMode(cubeId));

    ASSERT_TRUE(selection.toggleVertexSelection(cubeId, 4));
    ASSERT_EQ(selection.getSelectionCount(), 1u);
    ASSERT_TRUE(selection.toggleVertexSelection(cubeId, 4));
    ASSERT_FALSE(selection.hasSelection());
}

TEST_F(SelectionTest, AdditiveSelectKeepsEarlierIds) {
    ASSERT_TRUE(selection.enterEditMode(cubeId));

    ASSERT_TRUE(selection.selectVertices(cubeId, {0}));
    ASSERT_TRUE(selection.selectVertices(cubeId, {1}, true));
    ASSERT_EQ(selectedVertices(), (std::vector<VertexId>{0, 1}));

    ASSERT_TRUE(selection.selectVertices(cubeId, {5}));
    ASSERT_EQ(selectedVertices(), (std::vector<VertexId>{5}));
}

TEST_F(SelectionTest, SelectionFlagsAreMirroredIntoTheMesh) {
    ASSERT_TRUE(selection.enterEditMode(cubeId));
    ASSERT_TRUE(selection.selectVertices(cubeId, {3}));

    auto mesh = meshes.snapshot(cubeId);
    ASSERT_TRUE(mesh->findVertex(3)->selected);
    ASSERT_FALSE(mesh->findVertex(2)->selected);

    selection.clearSelection();
    ASSERT_FALSE(meshes.snapshot(cubeId)->findVertex(3)->selected);
}

TEST_F(SelectionTest, SelectAllUsesTheCurrentComponentMode) {
    ASSERT_TRUE(selection.enterEditMode(cubeId));

    selection.selectAll();
    ASSERT_EQ(selection.getSelection().vertexIds.size(), 8u);

    ASSERT_TRUE(selection.setSelectionMode(SelectionMode::Edge));
    selection.selectAll();
    ASSERT_EQ(selection.getSelection().edgeIds.size(), 12u);
    ASSERT_TRUE(selection.getSelection().vertexIds.empty());
}

TEST_F(SelectionTest, SelectedVertexIdsResolveEdgesAndFaces) {
    ASSERT_TRUE(selection.enterEditMode(cubeId));

    ASSERT_TRUE(selection.selectEdges(cubeId, {edgeBetween(meshes, cubeId, 6, 7)}));
    ASSERT_EQ(selectedVertices(), (std::vector<VertexId>{6, 7}));

    ASSERT_TRUE(selection.selectFaces(cubeId, {kCubeBottom}));
    ASSERT_EQ(selectedVertices(), (std::vector<VertexId>{0, 1, 4, 5}));
}

TEST_F(SelectionTest, EdgeRingSelectionWalksTheQuads) {
    ASSERT_TRUE(selection.enterEditMode(cubeId));

    ASSERT_TRUE(selection.selectEdgeRing(edgeBetween(meshes, cubeId, 5, 6)));

    ASSERT_EQ(selection.getSelectionMode(), SelectionMode::Edge);
    ASSERT_EQ(selection.getSelection().edgeIds.size(), 4u);
}

TEST_F(SelectionTest, EdgeLoopSelectionOnAGrid) {
    MeshId gridId = meshes.addMesh(PrimitiveBuilder::createGrid(3, 3));
    ASSERT_TRUE(selection.enterEditMode(gridId));

    ASSERT_TRUE(selection.selectEdgeLoop(edgeBetween(meshes, gridId, 5, 6)));

    ASSERT_EQ(selection.getSelection().edgeIds.size(), 3u);
    ASSERT_EQ(selectedVertices(), (std::vector<VertexId>{4, 5, 6, 7}));
}

TEST_F(SelectionTest, ModeChangesResetTheActiveTool) {
    ASSERT_TRUE(tools.startOperation(ToolKind::Move, ObjectTransformData{}));

    ASSERT_TRUE(selection.enterEditMode(cubeId));
    ASSERT_FALSE(tools.isActive());

    ASSERT_TRUE(tools.startOperation(ToolKind::Scale, ObjectTransformData{}));
    selection.exitEditMode();
    ASSERT_FALSE(tools.isActive());
}

TEST_F(SelectionTest, PruneMissingDropsDeletedIds) {
    ASSERT_TRUE(selection.enterEditMode(cubeId));
    ASSERT_TRUE(selection.selectFaces(cubeId, {kCubeTop, kCubeFront}));

    ASSERT_TRUE(meshes.deleteFaces(cubeId, {kCubeTop}));
    selection.pruneMissing();

    ASSERT_EQ(selection.getSelection().faceIds, std::set<FaceId>{kCubeFront});
}

TEST_F(SelectionTest, ResetClearsEverything) {
    ASSERT_TRUE(selection.selectObjects({cubeObj}));
    ASSERT_TRUE(selection.enterEditMode(cubeId));
    ASSERT_TRUE(selection.selectVertices(cubeId, {1}));

    selection.reset();

    ASSERT_FALSE(selection.hasSelection());
    ASSERT_EQ(selection.getViewMode(), ViewMode::Object);
    ASSERT_FALSE(meshes.snapshot(cubeId)->findVertex(1)->selected);
}
