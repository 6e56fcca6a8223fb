#include <loom/EditSession.hpp>
#include <loom/Log.hpp>

#include <limits>
#include <memory>

namespace loom {

EditSession::EditSession(MeshStore& meshes, SceneStore& scene, const EditorSettings& settings)
    : m_meshes(meshes)
    , m_scene(scene)
    , m_settings(settings)
    , m_capture(m_nullCapture)
    , m_selection(meshes, scene, m_tools)
    , m_transform(m_tools, settings, m_capture)
    , m_loopCut(m_tools, meshes, settings) {
}

EditSession::EditSession(MeshStore& meshes, SceneStore& scene, const EditorSettings& settings,
                         PointerCapture& capture)
    : m_meshes(meshes)
    , m_scene(scene)
    , m_settings(settings)
    , m_capture(capture)
    , m_selection(meshes, scene, m_tools)
    , m_transform(m_tools, settings, m_capture)
    , m_loopCut(m_tools, meshes, settings) {
}

Transform EditSession::getEditTransform() const {
    const SceneObject* obj = m_scene.findObjectByMesh(m_selection.getEditMeshId());
    return obj ? obj->transform : Transform();
}

bool EditSession::handleEvent(const InputEvent& event, const ViewContext& view, const std::optional<Ray>& pickRay) {
    if (event.type == InputEventType::PointerMove || event.type == InputEventType::PointerDown) {
        m_lastCursor = event.getClientPosition();
    }

    // A running operation owns the input until it commits or cancels
    if (m_transform.isActive()) {
        m_transform.handleEvent(event, view);
        return true;
    }
    if (m_loopCut.isActive()) {
        return handleLoopCutEvent(event, view, pickRay);
    }

    switch (event.type) {
        case InputEventType::KeyDown:
            return handleKey(event);

        case InputEventType::PointerDown:
            if (event.button != Input::MOUSE_LEFT || !pickRay) return false;
            pick(*pickRay, event.shiftKey);
            return true;

        default:
            return false;
    }
}

bool EditSession::handleLoopCutEvent(const InputEvent& event, const ViewContext& view,
                                     const std::optional<Ray>& pickRay) {
    const LoopCutData* data = m_loopCut.getData();
    bool sliding = data && data->phase == LoopCutPhase::Slide;

    switch (event.type) {
        case InputEventType::PointerMove:
            if (sliding) {
                m_loopCut.slide(event.movementX, event.movementY);
            } else if (pickRay) {
                m_loopCut.hover(*pickRay, getEditTransform());
            }
            return true;

        case InputEventType::PointerDown:
            if (event.button == Input::MOUSE_LEFT) {
                m_loopCut.confirm(view);
                if (sliding) m_selection.pruneMissing();
            } else if (event.button == Input::MOUSE_RIGHT) {
                m_loopCut.cancel();
            }
            return true;

        case InputEventType::Wheel:
            // Ctrl+wheel changes the cut count; plain wheel stays with the camera
            if (!event.ctrlKey) return false;
            if (event.wheelDelta > 0.0f) m_loopCut.adjustSegments(-1);
            else if (event.wheelDelta < 0.0f) m_loopCut.adjustSegments(1);
            return true;

        case InputEventType::KeyDown:
            if (event.key == Input::KEY_ESCAPE) {
                m_loopCut.cancel();
            } else if (event.key == Input::KEY_ENTER) {
                m_loopCut.confirm(view);
                if (sliding) m_selection.pruneMissing();
            }
            return true;

        default:
            return true;
    }
}

bool EditSession::handleKey(const InputEvent& event) {
    switch (event.key) {
        case Input::KEY_TAB:
            toggleEditMode();
            return true;

        case Input::KEY_1:
        case Input::KEY_2:
        case Input::KEY_3: {
            if (!m_selection.isEditing()) return false;
            SelectionMode mode = event.key == Input::KEY_1 ? SelectionMode::Vertex
                               : event.key == Input::KEY_2 ? SelectionMode::Edge
                               : SelectionMode::Face;
            m_selection.setSelectionMode(mode);
            return true;
        }

        case Input::KEY_G:
            startTransform(ToolKind::Move);
            return true;

        case Input::KEY_R:
            // Ctrl+R is loop cut, plain R rotates
            if (event.ctrlKey) startLoopCut();
            else startTransform(ToolKind::Rotate);
            return true;

        case Input::KEY_S:
            startTransform(ToolKind::Scale);
            return true;

        case Input::KEY_E:
            if (!m_selection.isEditing()) return false;
            startTransform(ToolKind::Extrude);
            return true;

        case Input::KEY_I:
            if (!m_selection.isEditing()) return false;
            startTransform(ToolKind::Inset);
            return true;

        case Input::KEY_A:
            if (event.altKey) m_selection.clearSelection();
            else m_selection.selectAll();
            return true;

        case Input::KEY_DELETE:
            deleteSelection();
            return true;

        default:
            return false;
    }
}

bool EditSession::toggleEditMode() {
    if (m_selection.isEditing()) {
        m_transform.cancel();
        m_selection.setViewMode(ViewMode::Object);
        logOut() << "[Session] Object mode" << std::endl;
        return true;
    }

    const auto& objectIds = m_selection.getSelection().objectIds;
    if (objectIds.empty()) {
        logErr() << "[Session] Select an object to edit" << std::endl;
        return false;
    }

    const SceneObject* obj = m_scene.findObject(*objectIds.begin());
    if (!obj) {
        logErr() << "[Session] Selected object " << *objectIds.begin() << " no longer exists" << std::endl;
        return false;
    }

    m_transform.cancel();
    if (!m_selection.setViewMode(ViewMode::Edit, obj->meshId)) return false;
    logOut() << "[Session] Edit mode on '" << obj->name << "'" << std::endl;
    return true;
}

bool EditSession::startTransform(ToolKind kind) {
    std::unique_ptr<TransformTarget> target;

    if (kind == ToolKind::Extrude || kind == ToolKind::Inset) {
        const auto& faceIds = m_selection.getSelection().faceIds;
        if (!m_selection.isEditing() || m_selection.getSelectionMode() != SelectionMode::Face || faceIds.empty()) {
            logErr() << "[Session] " << getToolKindName(kind) << " needs selected faces" << std::endl;
            return false;
        }
        target = std::make_unique<FaceExtrudeTarget>(m_meshes, m_selection.getEditMeshId(),
                                                     std::vector<FaceId>(faceIds.begin(), faceIds.end()),
                                                     getEditTransform(), m_settings.localSpaceEdits);
    } else if (m_selection.isEditing()) {
        MeshId meshId = m_selection.getEditMeshId();
        std::vector<VertexId> vertexIds = m_selection.getSelectedVertexIds();
        if (m_uvEditorFocused) {
            target = std::make_unique<UVTransformTarget>(m_meshes, meshId, std::move(vertexIds));
        } else {
            target = std::make_unique<VertexTransformTarget>(m_meshes, meshId, std::move(vertexIds),
                                                             getEditTransform(), m_settings.localSpaceEdits);
        }
    } else {
        const auto& ids = m_selection.getSelection().objectIds;
        target = std::make_unique<ObjectTransformTarget>(m_scene, std::vector<ObjectId>(ids.begin(), ids.end()));
    }

    return m_transform.start(kind, std::move(target), m_lastCursor);
}

bool EditSession::startLoopCut() {
    if (!m_selection.isEditing()) {
        logErr() << "[Session] Loop cut needs edit mode" << std::endl;
        return false;
    }
    return m_loopCut.begin(m_selection.getEditMeshId(), getEditTransform());
}

bool EditSession::deleteSelection() {
    const Selection& sel = m_selection.getSelection();

    if (!m_selection.isEditing()) {
        std::vector<ObjectId> ids(sel.objectIds.begin(), sel.objectIds.end());
        size_t removed = 0;
        for (ObjectId id : ids) {
            const SceneObject* obj = m_scene.findObject(id);
            if (obj && !obj->locked && m_scene.removeObject(id)) removed++;
        }
        m_selection.clearSelection();
        if (removed > 0) logOut() << "[Session] Deleted " << removed << " object(s)" << std::endl;
        return removed > 0;
    }

    MeshId meshId = m_selection.getEditMeshId();
    bool deleted = false;
    switch (m_selection.getSelectionMode()) {
        case SelectionMode::Vertex:
            deleted = m_meshes.deleteVertices(meshId, std::vector<VertexId>(sel.vertexIds.begin(), sel.vertexIds.end()));
            break;
        case SelectionMode::Edge:
            deleted = m_meshes.deleteEdges(meshId, std::vector<EdgeId>(sel.edgeIds.begin(), sel.edgeIds.end()));
            break;
        case SelectionMode::Face:
            deleted = m_meshes.deleteFaces(meshId, std::vector<FaceId>(sel.faceIds.begin(), sel.faceIds.end()));
            break;
    }
    m_selection.pruneMissing();
    return deleted;
}

bool EditSession::pick(const Ray& ray, bool additive) {
    if (!m_selection.isEditing()) {
        ObjectId best = kInvalidId;
        float bestDistance = std::numeric_limits<float>::max();
        for (const auto& obj : m_scene.getObjects()) {
            if (!obj.visible) continue;
            auto mesh = m_meshes.snapshot(obj.meshId);
            if (!mesh) continue;
            MeshRayHit hit = raycastFaces(*mesh, obj.transform, ray);
            if (hit.hit && hit.distance < bestDistance) {
                bestDistance = hit.distance;
                best = obj.id;
            }
        }

        if (best == kInvalidId) {
            if (!additive) m_selection.clearSelection();
            return false;
        }
        return additive ? m_selection.toggleObjectSelection(best) : m_selection.selectObjects({best});
    }

    MeshId meshId = m_selection.getEditMeshId();
    auto mesh = m_meshes.snapshot(meshId);
    if (!mesh) return false;

    Transform transform = getEditTransform();
    MeshRayHit hit = raycastFaces(*mesh, transform, ray);
    if (!hit.hit) {
        if (!additive) m_selection.clearSelection();
        return false;
    }

    switch (m_selection.getSelectionMode()) {
        case SelectionMode::Face:
            return additive ? m_selection.toggleFaceSelection(meshId, hit.faceId)
                            : m_selection.selectFaces(meshId, {hit.faceId});

        case SelectionMode::Edge: {
            EdgeId edgeId = closestFaceEdge(*mesh, transform, hit.faceId, hit.position);
            if (edgeId == kInvalidId) return false;
            return additive ? m_selection.toggleEdgeSelection(meshId, edgeId)
                            : m_selection.selectEdges(meshId, {edgeId});
        }

        case SelectionMode::Vertex: {
            // Corner of the hit face nearest to the hit point
            const Face* face = mesh->findFace(hit.faceId);
            if (!face) return false;
            VertexId best = kInvalidId;
            float bestDistance = std::numeric_limits<float>::max();
            for (VertexId vid : face->vertexIds) {
                const Vertex* v = mesh->findVertex(vid);
                if (!v) continue;
                float d = glm::length(transform.localToWorld(v->position) - hit.position);
                if (d < bestDistance) {
                    bestDistance = d;
                    best = vid;
                }
            }
            if (best == kInvalidId) return false;
            return additive ? m_selection.toggleVertexSelection(meshId, best)
                            : m_selection.selectVertices(meshId, {best});
        }
    }
    return false;
}

} // namespace loom
