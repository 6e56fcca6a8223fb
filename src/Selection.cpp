#include <loom/Selection.hpp>
#include <loom/MeshStore.hpp>
#include <loom/ToolState.hpp>
#include <loom/Topology.hpp>
#include <loom/Log.hpp>

#include <algorithm>
#include <iterator>

namespace loom {

namespace {

std::vector<EdgeId> faceEdgeIds(const Face& face, const MeshAdjacency& adj) {
    std::vector<EdgeId> ids;
    for (const auto& [a, b] : faceBoundary(face)) {
        if (const Edge* e = adj.edgeBetween(a, b)) ids.push_back(e->id);
    }
    return ids;
}

template <typename T>
void toggleId(std::set<T>& ids, T id) {
    auto it = ids.find(id);
    if (it != ids.end()) ids.erase(it);
    else ids.insert(id);
}

} // namespace

Selection promoteSelection(const Selection& selection, SelectionMode prevMode,
                           SelectionMode nextMode, const Mesh& mesh) {
    Selection result = selection;
    result.selectionMode = nextMode;
    if (prevMode == nextMode) return result;

    result.vertexIds.clear();
    result.edgeIds.clear();
    result.faceIds.clear();

    MeshAdjacency adj = buildAdjacency(mesh);

    switch (nextMode) {
        case SelectionMode::Vertex:
            if (prevMode == SelectionMode::Edge) {
                for (const auto& e : mesh.edges) {
                    if (!selection.edgeIds.count(e.id)) continue;
                    result.vertexIds.insert(e.vertexIds[0]);
                    result.vertexIds.insert(e.vertexIds[1]);
                }
            } else {
                for (const auto& f : mesh.faces) {
                    if (!selection.faceIds.count(f.id)) continue;
                    result.vertexIds.insert(f.vertexIds.begin(), f.vertexIds.end());
                }
            }
            break;

        case SelectionMode::Edge:
            if (prevMode == SelectionMode::Vertex) {
                for (const auto& e : mesh.edges) {
                    if (selection.vertexIds.count(e.vertexIds[0]) && selection.vertexIds.count(e.vertexIds[1])) {
                        result.edgeIds.insert(e.id);
                    }
                }
            } else {
                for (const auto& f : mesh.faces) {
                    if (!selection.faceIds.count(f.id)) continue;
                    for (EdgeId eid : faceEdgeIds(f, adj)) result.edgeIds.insert(eid);
                }
            }
            break;

        case SelectionMode::Face:
            for (const auto& f : mesh.faces) {
                bool all = true;
                if (prevMode == SelectionMode::Vertex) {
                    for (VertexId vid : f.vertexIds) {
                        if (!selection.vertexIds.count(vid)) { all = false; break; }
                    }
                } else {
                    for (EdgeId eid : faceEdgeIds(f, adj)) {
                        if (!selection.edgeIds.count(eid)) { all = false; break; }
                    }
                }
                if (all && !f.vertexIds.empty()) result.faceIds.insert(f.id);
            }
            break;
    }

    return result;
}

SelectionStore::SelectionStore(MeshStore& meshes, SceneStore& scene, ToolStore& tools)
    : m_meshes(meshes), m_scene(scene), m_tools(tools) {
}

bool SelectionStore::setViewMode(ViewMode mode, MeshId meshId) {
    if (mode == ViewMode::Edit) return enterEditMode(meshId);
    exitEditMode();
    return true;
}

bool SelectionStore::setSelectionMode(SelectionMode mode) {
    if (!isEditing()) return false;

    SelectionMode prevMode = m_selection.selectionMode;
    if (prevMode == mode) return true;

    auto mesh = m_meshes.snapshot(m_selection.meshId);
    if (!mesh) {
        clearComponents();
        m_selection.selectionMode = mode;
        return true;
    }

    m_selection = promoteSelection(m_selection, prevMode, mode, *mesh);
    syncMeshFlags();

    logOut() << "[Selection] " << getSelectionModeName(prevMode) << " -> "
             << getSelectionModeName(mode) << " (" << getSelectionCount() << " selected)" << std::endl;
    return true;
}

bool SelectionStore::enterEditMode(MeshId meshId) {
    if (!m_meshes.contains(meshId)) {
        logErr() << "[Selection] Can't edit unknown mesh " << meshId << std::endl;
        return false;
    }

    m_tools.reset();
    m_selection.viewMode = ViewMode::Edit;
    m_selection.meshId = meshId;
    m_selection.selectionMode = SelectionMode::Vertex;
    clearComponents();
    syncMeshFlags();

    logOut() << "[Selection] Editing mesh " << meshId << std::endl;
    return true;
}

void SelectionStore::exitEditMode() {
    m_tools.reset();
    clearComponents();
    syncMeshFlags();
    m_selection.viewMode = ViewMode::Object;
    m_selection.meshId = kInvalidId;
    m_selection.selectionMode = SelectionMode::Vertex;
}

bool SelectionStore::canEditComponents(MeshId meshId) const {
    return isEditing() && meshId != kInvalidId && meshId == m_selection.meshId;
}

void SelectionStore::clearComponents() {
    m_selection.vertexIds.clear();
    m_selection.edgeIds.clear();
    m_selection.faceIds.clear();
}

bool SelectionStore::selectVertices(MeshId meshId, const std::vector<VertexId>& ids, bool additive) {
    if (!canEditComponents(meshId)) return false;

    m_selection.selectionMode = SelectionMode::Vertex;
    if (!additive) m_selection.vertexIds.clear();
    m_selection.vertexIds.insert(ids.begin(), ids.end());
    m_selection.edgeIds.clear();
    m_selection.faceIds.clear();
    syncMeshFlags();
    return true;
}

bool SelectionStore::selectEdges(MeshId meshId, const std::vector<EdgeId>& ids, bool additive) {
    if (!canEditComponents(meshId)) return false;

    m_selection.selectionMode = SelectionMode::Edge;
    if (!additive) m_selection.edgeIds.clear();
    m_selection.edgeIds.insert(ids.begin(), ids.end());
    m_selection.vertexIds.clear();
    m_selection.faceIds.clear();
    syncMeshFlags();
    return true;
}

bool SelectionStore::selectFaces(MeshId meshId, const std::vector<FaceId>& ids, bool additive) {
    if (!canEditComponents(meshId)) return false;

    m_selection.selectionMode = SelectionMode::Face;
    if (!additive) m_selection.faceIds.clear();
    m_selection.faceIds.insert(ids.begin(), ids.end());
    m_selection.vertexIds.clear();
    m_selection.edgeIds.clear();
    syncMeshFlags();
    return true;
}

bool SelectionStore::toggleVertexSelection(MeshId meshId, VertexId id) {
    if (!canEditComponents(meshId)) return false;

    m_selection.selectionMode = SelectionMode::Vertex;
    toggleId(m_selection.vertexIds, id);
    m_selection.edgeIds.clear();
    m_selection.faceIds.clear();
    syncMeshFlags();
    return true;
}

bool SelectionStore::toggleEdgeSelection(MeshId meshId, EdgeId id) {
    if (!canEditComponents(meshId)) return false;

    m_selection.selectionMode = SelectionMode::Edge;
    toggleId(m_selection.edgeIds, id);
    m_selection.vertexIds.clear();
    m_selection.faceIds.clear();
    syncMeshFlags();
    return true;
}

bool SelectionStore::toggleFaceSelection(MeshId meshId, FaceId id) {
    if (!canEditComponents(meshId)) return false;

    m_selection.selectionMode = SelectionMode::Face;
    toggleId(m_selection.faceIds, id);
    m_selection.vertexIds.clear();
    m_selection.edgeIds.clear();
    syncMeshFlags();
    return true;
}

bool SelectionStore::selectEdgeLoop(EdgeId edgeId, bool additive) {
    if (!isEditing()) return false;
    auto mesh = m_meshes.snapshot(m_selection.meshId);
    if (!mesh) return false;

    auto loop = computeEdgeLoop(*mesh, edgeId);
    if (loop.empty()) return false;
    return selectEdges(m_selection.meshId, loop, additive);
}

bool SelectionStore::selectEdgeRing(EdgeId edgeId, bool additive) {
    if (!isEditing()) return false;
    auto mesh = m_meshes.snapshot(m_selection.meshId);
    if (!mesh) return false;

    auto ring = computeEdgeRing(*mesh, edgeId);
    if (ring.empty()) return false;
    return selectEdges(m_selection.meshId, ring, additive);
}

bool SelectionStore::selectObjects(const std::vector<ObjectId>& ids, bool additive) {
    if (m_selection.viewMode != ViewMode::Object) return false;

    if (!additive) m_selection.objectIds.clear();
    for (ObjectId id : ids) {
        const SceneObject* obj = m_scene.findObject(id);
        if (obj && obj->locked) continue;
        m_selection.objectIds.insert(id);
    }
    m_selection.meshId = kInvalidId;
    clearComponents();
    return true;
}

bool SelectionStore::toggleObjectSelection(ObjectId id) {
    if (m_selection.viewMode != ViewMode::Object) return false;

    const SceneObject* obj = m_scene.findObject(id);
    if (obj && obj->locked) return false;

    toggleId(m_selection.objectIds, id);
    m_selection.meshId = kInvalidId;
    clearComponents();
    return true;
}

void SelectionStore::clearSelection() {
    if (isEditing()) {
        // The object selection is restored on exit
        clearComponents();
        syncMeshFlags();
        return;
    }
    m_selection.objectIds.clear();
}

void SelectionStore::selectAll() {
    if (m_selection.viewMode == ViewMode::Object) {
        m_selection.objectIds.clear();
        for (const auto& obj : m_scene.getObjects()) {
            if (!obj.locked) m_selection.objectIds.insert(obj.id);
        }
        clearComponents();
        m_selection.meshId = kInvalidId;
        return;
    }

    auto mesh = m_meshes.snapshot(m_selection.meshId);
    if (!mesh) return;

    clearComponents();
    switch (m_selection.selectionMode) {
        case SelectionMode::Vertex:
            for (const auto& v : mesh->vertices) m_selection.vertexIds.insert(v.id);
            break;
        case SelectionMode::Edge:
            for (const auto& e : mesh->edges) m_selection.edgeIds.insert(e.id);
            break;
        case SelectionMode::Face:
            for (const auto& f : mesh->faces) m_selection.faceIds.insert(f.id);
            break;
    }
    syncMeshFlags();
}

bool SelectionStore::hasSelection() const {
    return !m_selection.vertexIds.empty() || !m_selection.edgeIds.empty() ||
           !m_selection.faceIds.empty() || !m_selection.objectIds.empty();
}

size_t SelectionStore::getSelectionCount() const {
    return m_selection.vertexIds.size() + m_selection.edgeIds.size() +
           m_selection.faceIds.size() + m_selection.objectIds.size();
}

void SelectionStore::reset() {
    if (isEditing()) {
        clearComponents();
        syncMeshFlags();
    }
    m_selection = Selection();
}

std::vector<VertexId> SelectionStore::getSelectedVertexIds() const {
    std::set<VertexId> result;
    if (!isEditing()) return {};

    switch (m_selection.selectionMode) {
        case SelectionMode::Vertex:
            result = m_selection.vertexIds;
            break;
        case SelectionMode::Edge:
        case SelectionMode::Face: {
            auto mesh = m_meshes.snapshot(m_selection.meshId);
            if (!mesh) return {};
            Selection asVertices = promoteSelection(m_selection, m_selection.selectionMode,
                                                    SelectionMode::Vertex, *mesh);
            result = std::move(asVertices.vertexIds);
            break;
        }
    }
    return std::vector<VertexId>(result.begin(), result.end());
}

void SelectionStore::pruneMissing() {
    if (!isEditing()) return;
    auto mesh = m_meshes.snapshot(m_selection.meshId);
    if (!mesh) {
        clearComponents();
        return;
    }

    auto vertexIndex = buildVertexIndex(*mesh);
    auto faceIndex = buildFaceIndex(*mesh);
    std::set<EdgeId> liveEdges;
    for (const auto& e : mesh->edges) liveEdges.insert(e.id);

    for (auto it = m_selection.vertexIds.begin(); it != m_selection.vertexIds.end();) {
        it = vertexIndex.count(*it) ? std::next(it) : m_selection.vertexIds.erase(it);
    }
    for (auto it = m_selection.edgeIds.begin(); it != m_selection.edgeIds.end();) {
        it = liveEdges.count(*it) ? std::next(it) : m_selection.edgeIds.erase(it);
    }
    for (auto it = m_selection.faceIds.begin(); it != m_selection.faceIds.end();) {
        it = faceIndex.count(*it) ? std::next(it) : m_selection.faceIds.erase(it);
    }
    syncMeshFlags();
}

void SelectionStore::syncMeshFlags() {
    MeshId meshId = m_selection.meshId;
    if (meshId == kInvalidId || m_meshes.isUpdating()) return;

    auto mesh = m_meshes.snapshot(meshId);
    if (!mesh) return;

    // Skip the publish when the flags already match
    bool dirty = false;
    for (const auto& v : mesh->vertices) dirty |= v.selected != (m_selection.vertexIds.count(v.id) > 0);
    for (const auto& e : mesh->edges) dirty |= e.selected != (m_selection.edgeIds.count(e.id) > 0);
    for (const auto& f : mesh->faces) dirty |= f.selected != (m_selection.faceIds.count(f.id) > 0);
    if (!dirty) return;

    const Selection& sel = m_selection;
    bool applied = m_meshes.updateMesh(meshId, [&sel](Mesh& draft) {
        for (auto& v : draft.vertices) v.selected = sel.vertexIds.count(v.id) > 0;
        for (auto& e : draft.edges) e.selected = sel.edgeIds.count(e.id) > 0;
        for (auto& f : draft.faces) f.selected = sel.faceIds.count(f.id) > 0;
    }, MeshChange::Attributes);
    if (!applied) {
        logErr() << "[Selection] Failed to mirror selection flags on mesh " << meshId << std::endl;
    }
}

} // namespace loom
