#pragma once

#include <loom/Mesh.hpp>
#include <loom/Scene.hpp>

#include <set>
#include <vector>

namespace loom {

class MeshStore;
class ToolStore;

enum class ViewMode {
    Object,
    Edit
};

enum class SelectionMode {
    Vertex,
    Edge,
    Face
};

inline const char* getSelectionModeName(SelectionMode mode) {
    switch (mode) {
        case SelectionMode::Vertex: return "Vertex";
        case SelectionMode::Edge:   return "Edge";
        case SelectionMode::Face:   return "Face";
        default: return "Unknown";
    }
}

struct Selection {
    ViewMode viewMode = ViewMode::Object;
    SelectionMode selectionMode = SelectionMode::Vertex;
    MeshId meshId = kInvalidId;             // Edit target
    std::set<VertexId> vertexIds;
    std::set<EdgeId> edgeIds;
    std::set<FaceId> faceIds;
    std::set<ObjectId> objectIds;           // Kept while editing, restored on exit
};

// Converts the component selection from one mode to another using the mesh's
// edges. Only the set belonging to nextMode is filled in the result.
//   vertex -> edge : edges with both ends selected
//   vertex -> face : faces with every corner selected
//   edge   -> vertex: endpoints of the selected edges
//   edge   -> face : faces whose boundary edges are all selected
//   face   -> vertex/edge: corners / boundary edges of the selected faces
Selection promoteSelection(const Selection& selection, SelectionMode prevMode,
                           SelectionMode nextMode, const Mesh& mesh);

/**
 * Object and component selection.
 *
 * Component calls only work in edit mode and only on the mesh being edited;
 * object calls only work in object mode. Anything else is ignored and returns
 * false. Changing view mode resets the active tool.
 */
class SelectionStore {
public:
    SelectionStore(MeshStore& meshes, SceneStore& scene, ToolStore& tools);

    const Selection& getSelection() const { return m_selection; }
    ViewMode getViewMode() const { return m_selection.viewMode; }
    SelectionMode getSelectionMode() const { return m_selection.selectionMode; }
    MeshId getEditMeshId() const { return m_selection.meshId; }
    bool isEditing() const { return m_selection.viewMode == ViewMode::Edit; }

    // Edit mode goes through enterEditMode(meshId), object mode through exitEditMode()
    bool setViewMode(ViewMode mode, MeshId meshId = kInvalidId);
    bool setSelectionMode(SelectionMode mode);

    bool enterEditMode(MeshId meshId);
    void exitEditMode();

    bool selectVertices(MeshId meshId, const std::vector<VertexId>& ids, bool additive = false);
    bool selectEdges(MeshId meshId, const std::vector<EdgeId>& ids, bool additive = false);
    bool selectFaces(MeshId meshId, const std::vector<FaceId>& ids, bool additive = false);
    bool toggleVertexSelection(MeshId meshId, VertexId id);
    bool toggleEdgeSelection(MeshId meshId, EdgeId id);
    bool toggleFaceSelection(MeshId meshId, FaceId id);

    // Edge mode selections built from topology walks
    bool selectEdgeLoop(EdgeId edgeId, bool additive = false);
    bool selectEdgeRing(EdgeId edgeId, bool additive = false);

    // Locked objects are skipped
    bool selectObjects(const std::vector<ObjectId>& ids, bool additive = false);
    bool toggleObjectSelection(ObjectId id);

    // Components in edit mode, objects in object mode
    void clearSelection();
    void selectAll();
    bool hasSelection() const;
    size_t getSelectionCount() const;
    void reset();

    // Component selection resolved to vertices for the current mode
    std::vector<VertexId> getSelectedVertexIds() const;

    // Drops ids that no longer exist in the edited mesh (after topology edits)
    void pruneMissing();

private:
    bool canEditComponents(MeshId meshId) const;
    void clearComponents();
    void syncMeshFlags();

    MeshStore& m_meshes;
    SceneStore& m_scene;
    ToolStore& m_tools;
    Selection m_selection;
};

} // namespace loom
