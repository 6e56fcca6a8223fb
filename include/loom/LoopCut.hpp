#pragma once

#include <loom/MeshStore.hpp>
#include <loom/Raycast.hpp>
#include <loom/Settings.hpp>
#include <loom/ToolState.hpp>
#include <loom/Topology.hpp>
#include <loom/TransformOperation.hpp>

#include <vector>

namespace loom {

constexpr int kMinLoopCutSegments = 1;
constexpr int kMaxLoopCutSegments = 64;

// Cut positions for `segments` cuts, shifted by slideT around the even spacing.
// Measured from each edge's canonical low end.
std::vector<float> loopCutPositions(int segments, float slideT);

// Inserts `segments` edge loops across the quads crossed from edgeId. Spans are
// recomputed from the current mesh when none are given. Every physical edge gets
// exactly `segments` new vertices, shared by the faces on both sides of it.
// Returns false, leaving the mesh untouched, when there is nothing to cut.
bool applyLoopCut(MeshStore& meshes, MeshId meshId, EdgeId edgeId, int segments, float slideT,
                  const std::vector<FaceSpan>& spans = {});

/**
 * Two-phase loop cut: Choose tracks the hovered edge and previews the cuts,
 * Slide locks the loop and shifts the cuts along it until confirmed.
 * All state lives in the tool store's LoopCutData.
 */
class LoopCutTool {
public:
    LoopCutTool(ToolStore& tools, MeshStore& meshes, const EditorSettings& settings);

    bool begin(MeshId meshId, const Transform& objectTransform = Transform());

    // Choose phase: picks the hit face's closest side under the ray
    bool hover(const Ray& ray, const Transform& objectTransform);
    bool hoverEdge(EdgeId edgeId);

    void adjustSegments(int delta);
    void setSegments(int segments);

    // Choose: locks the hovered loop and starts sliding. Slide: commits.
    bool confirm(const ViewContext& view = ViewContext());

    void slide(float movementX, float movementY);
    void setSlide(float slideT);

    bool commit();
    void cancel();

    bool isActive() const;
    const LoopCutData* getData() const;

private:
    LoopCutData* data();
    void refreshPreview(LoopCutData& d) const;

    ToolStore& m_tools;
    MeshStore& m_meshes;
    const EditorSettings& m_settings;
};

} // namespace loom
