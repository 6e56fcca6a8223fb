#pragma once

#include <loom/Mesh.hpp>
#include <loom/Scene.hpp>
#include <loom/Topology.hpp>
#include <loom/Transform.hpp>

#include <glm/glm.hpp>
#include <utility>
#include <variant>
#include <vector>

namespace loom {

enum class ToolKind {
    None,
    Move,
    Rotate,
    Scale,
    Extrude,
    Inset,
    LoopCut
};

enum class AxisLock {
    None,
    X,
    Y,
    Z
};

inline const char* getToolKindName(ToolKind kind) {
    switch (kind) {
        case ToolKind::None:    return "None";
        case ToolKind::Move:    return "Move";
        case ToolKind::Rotate:  return "Rotate";
        case ToolKind::Scale:   return "Scale";
        case ToolKind::Extrude: return "Extrude";
        case ToolKind::Inset:   return "Inset";
        case ToolKind::LoopCut: return "LoopCut";
        default: return "Unknown";
    }
}

// Per-tool payloads. Each holds the start-of-operation snapshot plus the live
// preview a renderer draws while the operation runs.

struct ObjectTransformData {
    std::vector<ObjectId> objectIds;
    std::vector<Transform> originals;
    std::vector<Transform> transforms;      // Preview
    glm::vec3 pivot{0.0f};
};

struct VertexTransformData {
    MeshId meshId = kInvalidId;
    Transform objectTransform;              // Placement of the mesh being edited
    std::vector<VertexId> vertexIds;
    std::vector<glm::vec3> originals;       // Local space
    std::vector<glm::vec3> positions;       // Preview, local space
    glm::vec3 pivot{0.0f};                  // Local space
};

// A face corner whose loop UV belongs to a selected vertex
struct LoopUVRef {
    FaceId faceId = kInvalidId;
    size_t corner = 0;
    VertexId vertexId = kInvalidId;
    glm::vec2 original{0.0f};
    glm::vec2 uv{0.0f};                     // Preview
};

struct UVTransformData {
    MeshId meshId = kInvalidId;
    std::vector<VertexId> vertexIds;
    std::vector<glm::vec2> originals;       // Per-vertex uv
    std::vector<glm::vec2> uvs;             // Preview
    std::vector<LoopUVRef> loops;
    glm::vec2 pivot{0.0f};
};

// Extrude/inset of a face region. Previews the new corner positions; the
// topology is only built on commit.
struct FaceExtrudeData {
    MeshId meshId = kInvalidId;
    Transform objectTransform;
    std::vector<FaceId> faceIds;
    std::vector<VertexId> vertexIds;        // Region corners
    std::vector<glm::vec3> originals;       // Local space
    std::vector<glm::vec3> positions;       // Preview, local space
    glm::vec3 normal{0.0f};                 // Averaged region normal, local space
    glm::vec3 pivot{0.0f};                  // Corner centroid, local space
};

enum class LoopCutPhase {
    Choose,
    Slide
};

struct LoopCutData {
    MeshId meshId = kInvalidId;
    Transform objectTransform;
    LoopCutPhase phase = LoopCutPhase::Choose;
    EdgeId edgeId = kInvalidId;             // Hovered (Choose) or locked (Slide) edge
    int segments = 1;
    float slideT = 0.5f;
    std::vector<FaceSpan> spans;
    std::vector<std::pair<glm::vec3, glm::vec3>> previewLines;  // World space
    glm::vec2 slideAxis{1.0f, 0.0f};        // Screen space, unit length
};

using ToolLocalData = std::variant<std::monostate,
                                   ObjectTransformData,
                                   VertexTransformData,
                                   UVTransformData,
                                   FaceExtrudeData,
                                   LoopCutData>;

/**
 * Which interactive tool owns input right now. Only one operation can be
 * active; a second start is refused until the first one ends.
 */
class ToolStore {
public:
    ToolStore() = default;

    bool startOperation(ToolKind kind, ToolLocalData data);
    void endOperation();
    void reset();

    bool isActive() const { return m_active; }
    ToolKind getTool() const { return m_tool; }

    AxisLock getAxisLock() const { return m_axisLock; }
    void setAxisLock(AxisLock lock) { m_axisLock = lock; }
    // Same axis again clears the lock
    void toggleAxisLock(AxisLock axis);

    const ToolLocalData& getLocalData() const { return m_localData; }
    ToolLocalData& getLocalData() { return m_localData; }

    // Number of elements the current payload previews (0 for none)
    size_t getPreviewSize() const;

private:
    ToolKind m_tool = ToolKind::None;
    bool m_active = false;
    AxisLock m_axisLock = AxisLock::None;
    ToolLocalData m_localData;
};

} // namespace loom
