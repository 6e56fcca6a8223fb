#include <loom/TransformOperation.hpp>
#include <loom/Extrude.hpp>
#include <loom/Log.hpp>

#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>

namespace loom {

float snapValue(float value, float step) {
    float safeStep = std::max(1e-6f, std::abs(step));
    return std::round(value / safeStep) * safeStep;
}

float snapScaleValue(float value, float gridSize) {
    float scaleStep = std::max(0.01f, std::abs(gridSize) * 0.1f);
    return std::max(0.01f, snapValue(value, scaleStep));
}

float snapRotationRadians(float value, float gridSize) {
    float degreesStep = std::max(1.0f, std::abs(gridSize) * 15.0f);
    return snapValue(value, glm::radians(degreesStep));
}

namespace {

glm::vec3 axisMask(AxisLock axis) {
    switch (axis) {
        case AxisLock::X: return {1.0f, 0.0f, 0.0f};
        case AxisLock::Y: return {0.0f, 1.0f, 0.0f};
        case AxisLock::Z: return {0.0f, 0.0f, 1.0f};
        default: return {1.0f, 1.0f, 1.0f};
    }
}

// Rotation axis for 3D targets; Y when nothing is locked
glm::vec3 rotationAxis(AxisLock axis) {
    return axis == AxisLock::None ? glm::vec3(0.0f, 1.0f, 0.0f) : axisMask(axis);
}

// Per-axis factors: the locked axis only, or all of them
glm::vec3 scaleFactors(float scale, AxisLock axis) {
    glm::vec3 mask = axisMask(axis);
    return glm::vec3(1.0f) + mask * (scale - 1.0f);
}

glm::vec2 transformUV(const glm::vec2& original, const glm::vec2& pivot, ToolKind kind,
                      const TransformDelta& delta, AxisLock axis) {
    glm::vec2 p = original - pivot;
    switch (kind) {
        case ToolKind::Move: {
            float ax = axis == AxisLock::Y ? 0.0f : 1.0f;
            float ay = axis == AxisLock::X ? 0.0f : 1.0f;
            return original + glm::vec2(delta.translation.x * ax, delta.translation.y * ay);
        }
        case ToolKind::Rotate: {
            float c = std::cos(delta.angle);
            float s = std::sin(delta.angle);
            glm::vec2 r(p.x * c - p.y * s, p.x * s + p.y * c);
            // A locked axis keeps the original component on the other one
            if (axis == AxisLock::X) r.y = p.y;
            else if (axis == AxisLock::Y) r.x = p.x;
            return pivot + r;
        }
        case ToolKind::Scale: {
            float sx = axis == AxisLock::Y ? 1.0f : delta.scale;
            float sy = axis == AxisLock::X ? 1.0f : delta.scale;
            return pivot + glm::vec2(p.x * sx, p.y * sy);
        }
        default:
            return original;
    }
}

} // namespace

// ---------------------------------------------------------------------------
// VertexTransformTarget
// ---------------------------------------------------------------------------

VertexTransformTarget::VertexTransformTarget(MeshStore& meshes, MeshId meshId, std::vector<VertexId> vertexIds,
                                             const Transform& objectTransform, bool localSpace)
    : m_meshes(meshes)
    , m_meshId(meshId)
    , m_vertexIds(std::move(vertexIds))
    , m_objectTransform(objectTransform)
    , m_localSpace(localSpace) {
}

ToolLocalData VertexTransformTarget::capture() const {
    auto mesh = m_meshes.snapshot(m_meshId);
    if (!mesh) return std::monostate{};

    auto vertexIndex = buildVertexIndex(*mesh);
    VertexTransformData data;
    data.meshId = m_meshId;
    data.objectTransform = m_objectTransform;

    std::unordered_set<VertexId> seen;
    for (VertexId vid : m_vertexIds) {
        auto it = vertexIndex.find(vid);
        if (it == vertexIndex.end() || !seen.insert(vid).second) continue;
        data.vertexIds.push_back(vid);
        data.originals.push_back(mesh->vertices[it->second].position);
    }
    if (data.vertexIds.empty()) return std::monostate{};

    for (const auto& p : data.originals) data.pivot += p;
    data.pivot /= static_cast<float>(data.originals.size());
    data.positions = data.originals;
    return data;
}

void VertexTransformTarget::apply(ToolLocalData& data, ToolKind kind, const TransformDelta& delta, AxisLock axis) const {
    auto* d = std::get_if<VertexTransformData>(&data);
    if (!d) return;

    switch (kind) {
        case ToolKind::Move: {
            glm::vec3 offset = m_localSpace ? d->objectTransform.worldToLocalDelta(delta.translation)
                                            : delta.translation;
            offset *= axisMask(axis);
            for (size_t i = 0; i < d->originals.size(); ++i) {
                d->positions[i] = d->originals[i] + offset;
            }
            break;
        }
        case ToolKind::Rotate: {
            glm::mat4 rot = glm::rotate(glm::mat4(1.0f), delta.angle, rotationAxis(axis));
            for (size_t i = 0; i < d->originals.size(); ++i) {
                d->positions[i] = d->pivot + glm::vec3(rot * glm::vec4(d->originals[i] - d->pivot, 0.0f));
            }
            break;
        }
        case ToolKind::Scale: {
            glm::vec3 factors = scaleFactors(delta.scale, axis);
            for (size_t i = 0; i < d->originals.size(); ++i) {
                d->positions[i] = d->pivot + (d->originals[i] - d->pivot) * factors;
            }
            break;
        }
        default:
            d->positions = d->originals;
            break;
    }
}

bool VertexTransformTarget::commit(const ToolLocalData& data) {
    const auto* d = std::get_if<VertexTransformData>(&data);
    if (!d) return false;

    return m_meshes.updateMesh(d->meshId, [d](Mesh& mesh) {
        auto vertexIndex = buildVertexIndex(mesh);
        for (size_t i = 0; i < d->vertexIds.size(); ++i) {
            auto it = vertexIndex.find(d->vertexIds[i]);
            if (it != vertexIndex.end()) {
                mesh.vertices[it->second].position = d->positions[i];
            }
        }
    }, MeshChange::Geometry);
}

glm::vec3 VertexTransformTarget::getWorldPivot(const ToolLocalData& data) const {
    const auto* d = std::get_if<VertexTransformData>(&data);
    return d ? d->objectTransform.localToWorld(d->pivot) : glm::vec3(0.0f);
}

// ---------------------------------------------------------------------------
// ObjectTransformTarget
// ---------------------------------------------------------------------------

ObjectTransformTarget::ObjectTransformTarget(SceneStore& scene, std::vector<ObjectId> objectIds)
    : m_scene(scene)
    , m_objectIds(std::move(objectIds)) {
}

ToolLocalData ObjectTransformTarget::capture() const {
    ObjectTransformData data;
    std::unordered_set<ObjectId> seen;
    for (ObjectId id : m_objectIds) {
        const SceneObject* obj = m_scene.findObject(id);
        if (!obj || obj->locked || !seen.insert(id).second) continue;
        data.objectIds.push_back(id);
        data.originals.push_back(obj->transform);
    }
    if (data.objectIds.empty()) return std::monostate{};

    for (const auto& t : data.originals) data.pivot += t.getPosition();
    data.pivot /= static_cast<float>(data.originals.size());
    data.transforms = data.originals;
    return data;
}

void ObjectTransformTarget::apply(ToolLocalData& data, ToolKind kind, const TransformDelta& delta, AxisLock axis) const {
    auto* d = std::get_if<ObjectTransformData>(&data);
    if (!d) return;

    for (size_t i = 0; i < d->originals.size(); ++i) {
        const Transform& orig = d->originals[i];
        Transform t = orig;
        switch (kind) {
            case ToolKind::Move:
                t.setPosition(orig.getPosition() + delta.translation * axisMask(axis));
                break;
            case ToolKind::Rotate:
                t.setRotation(orig.getRotation() + rotationAxis(axis) * delta.angle);
                break;
            case ToolKind::Scale:
                t.setScale(orig.getScale() * scaleFactors(delta.scale, axis));
                break;
            default:
                break;
        }
        d->transforms[i] = t;
    }
}

bool ObjectTransformTarget::commit(const ToolLocalData& data) {
    const auto* d = std::get_if<ObjectTransformData>(&data);
    if (!d) return false;

    std::vector<std::pair<ObjectId, Transform>> updates;
    for (size_t i = 0; i < d->objectIds.size(); ++i) {
        const SceneObject* obj = m_scene.findObject(d->objectIds[i]);
        if (!obj || obj->locked) continue;
        updates.emplace_back(d->objectIds[i], d->transforms[i]);
    }
    if (updates.empty()) return false;
    return m_scene.setTransforms(updates);
}

glm::vec3 ObjectTransformTarget::getWorldPivot(const ToolLocalData& data) const {
    const auto* d = std::get_if<ObjectTransformData>(&data);
    return d ? d->pivot : glm::vec3(0.0f);
}

// ---------------------------------------------------------------------------
// UVTransformTarget
// ---------------------------------------------------------------------------

UVTransformTarget::UVTransformTarget(MeshStore& meshes, MeshId meshId, std::vector<VertexId> vertexIds)
    : m_meshes(meshes)
    , m_meshId(meshId)
    , m_vertexIds(std::move(vertexIds)) {
}

ToolLocalData UVTransformTarget::capture() const {
    auto mesh = m_meshes.snapshot(m_meshId);
    if (!mesh) return std::monostate{};

    auto vertexIndex = buildVertexIndex(*mesh);
    UVTransformData data;
    data.meshId = m_meshId;

    std::unordered_set<VertexId> selected;
    for (VertexId vid : m_vertexIds) {
        auto it = vertexIndex.find(vid);
        if (it == vertexIndex.end() || !selected.insert(vid).second) continue;
        data.vertexIds.push_back(vid);
        data.originals.push_back(mesh->vertices[it->second].uv);
    }
    if (data.vertexIds.empty()) return std::monostate{};

    // Corner UVs of the selected vertices; the first one seen per vertex feeds the pivot
    std::unordered_map<VertexId, glm::vec2> firstLoopUV;
    for (const auto& face : mesh->faces) {
        if (!face.hasLoopUVs()) continue;
        for (size_t c = 0; c < face.vertexIds.size(); ++c) {
            VertexId vid = face.vertexIds[c];
            if (!selected.count(vid)) continue;

            LoopUVRef ref;
            ref.faceId = face.id;
            ref.corner = c;
            ref.vertexId = vid;
            ref.original = face.uvs[c];
            ref.uv = face.uvs[c];
            data.loops.push_back(ref);
            firstLoopUV.emplace(vid, face.uvs[c]);
        }
    }

    if (!firstLoopUV.empty()) {
        for (const auto& [vid, uv] : firstLoopUV) data.pivot += uv;
        data.pivot /= static_cast<float>(firstLoopUV.size());
    } else {
        for (const auto& uv : data.originals) data.pivot += uv;
        data.pivot /= static_cast<float>(data.originals.size());
    }

    data.uvs = data.originals;
    return data;
}

void UVTransformTarget::apply(ToolLocalData& data, ToolKind kind, const TransformDelta& delta, AxisLock axis) const {
    auto* d = std::get_if<UVTransformData>(&data);
    if (!d) return;

    for (size_t i = 0; i < d->originals.size(); ++i) {
        d->uvs[i] = transformUV(d->originals[i], d->pivot, kind, delta, axis);
    }
    for (auto& loop : d->loops) {
        loop.uv = transformUV(loop.original, d->pivot, kind, delta, axis);
    }
}

bool UVTransformTarget::commit(const ToolLocalData& data) {
    const auto* d = std::get_if<UVTransformData>(&data);
    if (!d) return false;

    return m_meshes.updateMesh(d->meshId, [d](Mesh& mesh) {
        auto vertexIndex = buildVertexIndex(mesh);
        for (size_t i = 0; i < d->vertexIds.size(); ++i) {
            auto it = vertexIndex.find(d->vertexIds[i]);
            if (it != vertexIndex.end()) mesh.vertices[it->second].uv = d->uvs[i];
        }

        auto faceIndex = buildFaceIndex(mesh);
        for (const auto& loop : d->loops) {
            auto it = faceIndex.find(loop.faceId);
            if (it == faceIndex.end()) continue;
            Face& face = mesh.faces[it->second];
            if (loop.corner < face.uvs.size()) face.uvs[loop.corner] = loop.uv;
        }
    }, MeshChange::Attributes);
}

glm::vec3 UVTransformTarget::getWorldPivot(const ToolLocalData& data) const {
    const auto* d = std::get_if<UVTransformData>(&data);
    return d ? glm::vec3(d->pivot, 0.0f) : glm::vec3(0.0f);
}

// ---------------------------------------------------------------------------
// FaceExtrudeTarget
// ---------------------------------------------------------------------------

FaceExtrudeTarget::FaceExtrudeTarget(MeshStore& meshes, MeshId meshId, std::vector<FaceId> faceIds,
                                     const Transform& objectTransform, bool localSpace)
    : m_meshes(meshes)
    , m_meshId(meshId)
    , m_faceIds(std::move(faceIds))
    , m_objectTransform(objectTransform)
    , m_localSpace(localSpace) {
}

ToolLocalData FaceExtrudeTarget::capture() const {
    auto mesh = m_meshes.snapshot(m_meshId);
    if (!mesh) return std::monostate{};

    FaceRegion region = collectFaceRegion(*mesh, m_faceIds);
    if (region.faceIds.empty()) return std::monostate{};

    FaceExtrudeData data;
    data.meshId = m_meshId;
    data.objectTransform = m_objectTransform;
    data.faceIds = region.faceIds;
    data.normal = averageFaceNormal(*mesh, region.faceIds);

    auto vertexIndex = buildVertexIndex(*mesh);
    for (VertexId vid : region.vertexIds) {
        auto it = vertexIndex.find(vid);
        if (it == vertexIndex.end()) continue;
        data.vertexIds.push_back(vid);
        data.originals.push_back(mesh->vertices[it->second].position);
    }
    if (data.vertexIds.empty()) return std::monostate{};

    for (const auto& p : data.originals) data.pivot += p;
    data.pivot /= static_cast<float>(data.originals.size());
    data.positions = data.originals;
    return data;
}

void FaceExtrudeTarget::apply(ToolLocalData& data, ToolKind kind, const TransformDelta& delta, AxisLock axis) const {
    auto* d = std::get_if<FaceExtrudeData>(&data);
    if (!d) return;

    switch (kind) {
        case ToolKind::Extrude: {
            glm::vec3 offset = m_localSpace ? d->objectTransform.worldToLocalDelta(delta.translation)
                                            : delta.translation;
            glm::vec3 step = offset * axisMask(axis);
            // Free motion only counts along the normal
            if (axis == AxisLock::None && glm::length(d->normal) > 0.0f) {
                step = d->normal * glm::dot(offset, d->normal);
            }
            for (size_t i = 0; i < d->originals.size(); ++i) {
                d->positions[i] = d->originals[i] + step;
            }
            break;
        }
        case ToolKind::Inset: {
            float s = std::clamp(delta.scale, kMinInsetScale, kMaxInsetScale);
            for (size_t i = 0; i < d->originals.size(); ++i) {
                d->positions[i] = d->pivot + (d->originals[i] - d->pivot) * s;
            }
            break;
        }
        default:
            d->positions = d->originals;
            break;
    }
}

bool FaceExtrudeTarget::commit(const ToolLocalData& data) {
    const auto* d = std::get_if<FaceExtrudeData>(&data);
    if (!d) return false;

    std::unordered_map<VertexId, glm::vec3> positions;
    for (size_t i = 0; i < d->vertexIds.size(); ++i) {
        positions[d->vertexIds[i]] = d->positions[i];
    }
    return extrudeFaceRegion(m_meshes, d->meshId, d->faceIds, positions);
}

glm::vec3 FaceExtrudeTarget::getWorldPivot(const ToolLocalData& data) const {
    const auto* d = std::get_if<FaceExtrudeData>(&data);
    return d ? d->objectTransform.localToWorld(d->pivot) : glm::vec3(0.0f);
}

// ---------------------------------------------------------------------------
// TransformOperation
// ---------------------------------------------------------------------------

TransformOperation::TransformOperation(ToolStore& tools, const EditorSettings& settings, PointerCapture& capture)
    : m_tools(tools)
    , m_settings(settings)
    , m_capture(capture) {
}

TransformOperation::~TransformOperation() {
    if (m_target) cancel();
}

bool TransformOperation::start(ToolKind kind, std::unique_ptr<TransformTarget> target, const glm::vec2& cursor) {
    if (!target) return false;
    if (!target->supports(kind)) {
        logErr() << "[Transform] " << target->getName() << " can't " << getToolKindName(kind) << std::endl;
        return false;
    }

    if (isActive() || m_tools.isActive()) {
        logErr() << "[Transform] " << getToolKindName(kind) << " refused, another operation is active" << std::endl;
        return false;
    }
    if (m_target) finish();  // Left over from a tool store reset

    ToolLocalData data = target->capture();
    if (std::holds_alternative<std::monostate>(data)) {
        logErr() << "[Transform] Nothing to " << getToolKindName(kind) << " (" << target->getName() << ")" << std::endl;
        return false;
    }

    if (!m_tools.startOperation(kind, std::move(data))) return false;

    m_target = std::move(target);
    m_kind = kind;
    m_accum = TransformDelta();
    m_startCursor = cursor;

    if (!m_target->isPlanar() && !m_capture.acquire()) {
        logErr() << "[Transform] Pointer capture unavailable, continuing without it" << std::endl;
    }

    logOut() << "[Transform] " << getToolKindName(kind) << " " << m_target->getName()
             << " (" << m_tools.getPreviewSize() << ")" << std::endl;
    return true;
}

bool TransformOperation::isActive() const {
    return m_target && m_tools.isActive() && m_tools.getTool() == m_kind;
}

TransformDelta TransformOperation::getEffectiveDelta() const {
    TransformDelta d = m_accum;
    if (!m_settings.gridSnapping || !m_target) return d;

    // Snap the accumulated value, never the per-entity results
    float grid = m_settings.gridSize;
    float step = m_target->isPlanar() ? m_settings.uvGridSize : grid;
    d.translation = glm::vec3(snapValue(d.translation.x, step),
                              snapValue(d.translation.y, step),
                              snapValue(d.translation.z, step));
    d.angle = snapRotationRadians(d.angle, grid);
    d.scale = snapScaleValue(d.scale, grid);
    return d;
}

void TransformOperation::refreshPreview() {
    m_target->apply(m_tools.getLocalData(), m_kind, getEffectiveDelta(), m_tools.getAxisLock());
}

bool TransformOperation::update(const InputEvent& event, const ViewContext& view) {
    if (!isActive()) return false;

    if (m_target->isPlanar()) {
        // Absolute: derived from the cursor's position relative to where it started
        glm::vec2 startUV = view.screenToUV(m_startCursor);
        glm::vec2 nowUV = view.screenToUV(event.getClientPosition());
        glm::vec2 pivot = glm::vec2(m_target->getWorldPivot(m_tools.getLocalData()));

        switch (m_kind) {
            case ToolKind::Move:
                m_accum.translation = glm::vec3(nowUV - startUV, 0.0f);
                break;
            case ToolKind::Rotate: {
                float a0 = std::atan2(startUV.y - pivot.y, startUV.x - pivot.x);
                float a1 = std::atan2(nowUV.y - pivot.y, nowUV.x - pivot.x);
                m_accum.angle = a1 - a0;
                break;
            }
            case ToolKind::Scale: {
                float d0 = glm::length(startUV - pivot);
                if (d0 < 1e-6f) d0 = 1e-6f;
                m_accum.scale = std::max(0.01f, glm::length(nowUV - pivot) / d0);
                break;
            }
            default:
                break;
        }
    } else {
        switch (m_kind) {
            case ToolKind::Move:
            case ToolKind::Extrude: {
                glm::vec3 pivot = m_target->getWorldPivot(m_tools.getLocalData());
                float factor = glm::length(view.cameraPosition - pivot) * m_settings.moveSensitivity;
                glm::vec3 delta = view.cameraRight * (event.movementX * factor)
                                - view.cameraUp * (event.movementY * factor);
                m_accum.translation += delta;
                break;
            }
            case ToolKind::Rotate:
                m_accum.angle += (event.movementX + event.movementY) * m_settings.rotateSensitivity;
                break;
            case ToolKind::Scale:
            case ToolKind::Inset:
                m_accum.scale *= std::max(0.01f, 1.0f + event.movementX * m_settings.scaleSensitivity);
                m_accum.scale = std::max(0.01f, m_accum.scale);
                break;
            default:
                break;
        }
    }

    refreshPreview();
    return true;
}

bool TransformOperation::setDelta(const TransformDelta& delta) {
    if (!isActive()) return false;
    m_accum = delta;
    m_accum.scale = std::max(0.01f, m_accum.scale);
    refreshPreview();
    return true;
}

void TransformOperation::setAxisLock(AxisLock axis) {
    if (!isActive()) return;
    m_tools.setAxisLock(axis);
    refreshPreview();
}

void TransformOperation::toggleAxisLock(AxisLock axis) {
    if (!isActive()) return;
    m_tools.toggleAxisLock(axis);
    refreshPreview();
}

bool TransformOperation::handleEvent(const InputEvent& event, const ViewContext& view) {
    if (!isActive()) {
        // The tool store was reset underneath us (mode change)
        if (m_target) finish();
        return false;
    }

    switch (event.type) {
        case InputEventType::PointerMove:
            update(event, view);
            return true;

        case InputEventType::PointerDown:
            if (event.button == Input::MOUSE_LEFT) {
                commit();
            } else if (event.button == Input::MOUSE_RIGHT) {
                cancel();
            }
            return true;

        case InputEventType::KeyDown:
            switch (event.key) {
                case Input::KEY_ESCAPE: cancel(); return true;
                case Input::KEY_ENTER:  commit(); return true;
                case Input::KEY_X:      toggleAxisLock(AxisLock::X); return true;
                case Input::KEY_Y:      toggleAxisLock(AxisLock::Y); return true;
                case Input::KEY_Z:      toggleAxisLock(AxisLock::Z); return true;
                default: return false;
            }

        default:
            return false;
    }
}

bool TransformOperation::commit() {
    if (!isActive()) return false;

    bool written = m_target->commit(m_tools.getLocalData());
    if (written) {
        logOut() << "[Transform] Committed " << getToolKindName(m_kind) << " on "
                 << m_target->getName() << std::endl;
    } else {
        logErr() << "[Transform] Commit of " << getToolKindName(m_kind) << " failed" << std::endl;
    }
    finish();
    return written;
}

void TransformOperation::cancel() {
    if (!m_target) return;
    logOut() << "[Transform] Cancelled " << getToolKindName(m_kind) << std::endl;
    finish();
}

void TransformOperation::finish() {
    if (m_capture.isAcquired()) m_capture.release();
    if (m_tools.isActive() && m_tools.getTool() == m_kind) m_tools.endOperation();
    m_target.reset();
    m_kind = ToolKind::None;
    m_accum = TransformDelta();
}

} // namespace loom
