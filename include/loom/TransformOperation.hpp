#pragma once

#include <loom/Input.hpp>
#include <loom/MeshStore.hpp>
#include <loom/Scene.hpp>
#include <loom/Settings.hpp>
#include <loom/ToolState.hpp>

#include <glm/glm.hpp>
#include <memory>
#include <vector>

namespace loom {

// Grid snapping of accumulated values
float snapValue(float value, float step);
float snapScaleValue(float value, float gridSize);         // Step 0.1*grid, floored at 0.01
float snapRotationRadians(float value, float gridSize);    // Step 15 degrees * grid

// Camera and 2D editor placement needed to turn pointer motion into deltas
struct ViewContext {
    glm::vec3 cameraPosition{0.0f, 0.0f, 5.0f};
    glm::vec3 cameraRight{1.0f, 0.0f, 0.0f};
    glm::vec3 cameraUp{0.0f, 1.0f, 0.0f};

    // UV editor: client pixel of uv (0,0) and zoom
    glm::vec2 uvViewOrigin{0.0f};
    float uvPixelsPerUnit = 512.0f;

    glm::vec2 screenToUV(const glm::vec2& client) const {
        return (client - uvViewOrigin) / (uvPixelsPerUnit > 0.0f ? uvPixelsPerUnit : 1.0f);
    }
};

// Accumulated since the operation started
struct TransformDelta {
    glm::vec3 translation{0.0f};
    float angle = 0.0f;         // Radians
    float scale = 1.0f;         // Factor, strictly positive
};

/**
 * What an interactive transform edits. A target snapshots its entities into a
 * tool payload, recomputes the payload's preview from those originals for a
 * given delta, and writes the preview back to its store on commit.
 */
class TransformTarget {
public:
    virtual ~TransformTarget() = default;

    // Monostate when no entity is affected
    virtual ToolLocalData capture() const = 0;

    virtual void apply(ToolLocalData& data, ToolKind kind, const TransformDelta& delta, AxisLock axis) const = 0;

    virtual bool commit(const ToolLocalData& data) = 0;

    // World-space pivot of a captured payload (camera distance scaling)
    virtual glm::vec3 getWorldPivot(const ToolLocalData& data) const = 0;

    // UV targets follow the cursor in the 2D editor instead of accumulating motion
    virtual bool isPlanar() const { return false; }

    virtual bool supports(ToolKind kind) const {
        return kind == ToolKind::Move || kind == ToolKind::Rotate || kind == ToolKind::Scale;
    }

    virtual const char* getName() const = 0;
};

class VertexTransformTarget : public TransformTarget {
public:
    VertexTransformTarget(MeshStore& meshes, MeshId meshId, std::vector<VertexId> vertexIds,
                          const Transform& objectTransform = Transform(), bool localSpace = true);

    ToolLocalData capture() const override;
    void apply(ToolLocalData& data, ToolKind kind, const TransformDelta& delta, AxisLock axis) const override;
    bool commit(const ToolLocalData& data) override;
    glm::vec3 getWorldPivot(const ToolLocalData& data) const override;
    const char* getName() const override { return "Vertices"; }

private:
    MeshStore& m_meshes;
    MeshId m_meshId;
    std::vector<VertexId> m_vertexIds;
    Transform m_objectTransform;
    bool m_localSpace;
};

class ObjectTransformTarget : public TransformTarget {
public:
    ObjectTransformTarget(SceneStore& scene, std::vector<ObjectId> objectIds);

    ToolLocalData capture() const override;
    void apply(ToolLocalData& data, ToolKind kind, const TransformDelta& delta, AxisLock axis) const override;
    bool commit(const ToolLocalData& data) override;
    glm::vec3 getWorldPivot(const ToolLocalData& data) const override;
    const char* getName() const override { return "Objects"; }

private:
    SceneStore& m_scene;
    std::vector<ObjectId> m_objectIds;
};

class UVTransformTarget : public TransformTarget {
public:
    UVTransformTarget(MeshStore& meshes, MeshId meshId, std::vector<VertexId> vertexIds);

    ToolLocalData capture() const override;
    void apply(ToolLocalData& data, ToolKind kind, const TransformDelta& delta, AxisLock axis) const override;
    bool commit(const ToolLocalData& data) override;
    glm::vec3 getWorldPivot(const ToolLocalData& data) const override;
    bool isPlanar() const override { return true; }
    const char* getName() const override { return "UVs"; }

private:
    MeshStore& m_meshes;
    MeshId m_meshId;
    std::vector<VertexId> m_vertexIds;
};

// Extrude moves the region along its averaged normal (or the locked axis),
// inset scales it towards its centroid. Commit builds the bridge quads.
class FaceExtrudeTarget : public TransformTarget {
public:
    FaceExtrudeTarget(MeshStore& meshes, MeshId meshId, std::vector<FaceId> faceIds,
                      const Transform& objectTransform = Transform(), bool localSpace = true);

    ToolLocalData capture() const override;
    void apply(ToolLocalData& data, ToolKind kind, const TransformDelta& delta, AxisLock axis) const override;
    bool commit(const ToolLocalData& data) override;
    glm::vec3 getWorldPivot(const ToolLocalData& data) const override;
    bool supports(ToolKind kind) const override {
        return kind == ToolKind::Extrude || kind == ToolKind::Inset;
    }
    const char* getName() const override { return "Faces"; }

private:
    MeshStore& m_meshes;
    MeshId m_meshId;
    std::vector<FaceId> m_faceIds;
    Transform m_objectTransform;
    bool m_localSpace;
};

/**
 * Accumulator-driven move/rotate/scale, extrude and inset.
 *
 * Every update recomputes the preview from the start-of-operation snapshot, so
 * the same accumulated delta always gives the same result. Nothing reaches the
 * stores before commit().
 */
class TransformOperation {
public:
    TransformOperation(ToolStore& tools, const EditorSettings& settings, PointerCapture& capture);
    ~TransformOperation();

    TransformOperation(const TransformOperation&) = delete;
    TransformOperation& operator=(const TransformOperation&) = delete;

    // kind must be one the target supports. cursor is the client position at
    // start (reference point for planar targets).
    bool start(ToolKind kind, std::unique_ptr<TransformTarget> target, const glm::vec2& cursor = glm::vec2(0.0f));

    // Routes reserved input while active: pointer motion updates, left button or
    // Enter commits, Escape cancels, X/Y/Z toggle the axis lock.
    // Returns true when the event was consumed.
    bool handleEvent(const InputEvent& event, const ViewContext& view);

    bool update(const InputEvent& event, const ViewContext& view);

    // Replaces the accumulated delta (typed values, tests)
    bool setDelta(const TransformDelta& delta);

    void setAxisLock(AxisLock axis);
    void toggleAxisLock(AxisLock axis);

    bool commit();
    void cancel();

    bool isActive() const;
    ToolKind getKind() const { return m_kind; }
    const TransformDelta& getDelta() const { return m_accum; }
    TransformDelta getEffectiveDelta() const;     // After snapping

private:
    void refreshPreview();
    void finish();

    ToolStore& m_tools;
    const EditorSettings& m_settings;
    PointerCapture& m_capture;

    std::unique_ptr<TransformTarget> m_target;
    ToolKind m_kind = ToolKind::None;
    TransformDelta m_accum;
    glm::vec2 m_startCursor{0.0f};
};

} // namespace loom
