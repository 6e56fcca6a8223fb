#pragma once

#include <glm/glm.hpp>
#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace loom {

using VertexId = uint32_t;
using EdgeId = uint32_t;
using FaceId = uint32_t;
using MeshId = uint32_t;
using MaterialId = uint32_t;

constexpr uint32_t kInvalidId = UINT32_MAX;

struct Vertex {
    VertexId id = kInvalidId;
    glm::vec3 position{0.0f};
    glm::vec3 normal{0.0f, 1.0f, 0.0f};
    glm::vec2 uv{0.0f};
    std::optional<glm::vec2> uv2;   // Secondary channel (lightmaps/AO)
    bool selected = false;
};

// Undirected edge, derived from the face list by rebuildEdges()
struct Edge {
    EdgeId id = kInvalidId;
    std::array<VertexId, 2> vertexIds{kInvalidId, kInvalidId};  // Lower id first
    std::vector<FaceId> faceIds;                                 // Adjacent faces
    bool selected = false;
    bool seam = false;          // UV seam marker
};

struct Face {
    FaceId id = kInvalidId;
    std::vector<VertexId> vertexIds;    // Winding order matters
    std::vector<glm::vec2> uvs;         // Per-corner (loop) UVs, parallel to vertexIds or empty
    std::optional<MaterialId> materialId;
    glm::vec3 normal{0.0f, 1.0f, 0.0f};
    bool selected = false;

    bool hasLoopUVs() const { return !uvs.empty() && uvs.size() == vertexIds.size(); }
    bool isQuad() const { return vertexIds.size() == 4; }
};

enum class ShadingMode {
    Flat,
    Smooth
};

// Indexed polygon mesh. Entities reference each other by id only; ids are drawn
// from per-mesh counters and never reused.
struct Mesh {
    MeshId id = kInvalidId;
    std::string name;
    std::vector<Vertex> vertices;
    std::vector<Edge> edges;
    std::vector<Face> faces;
    ShadingMode shading = ShadingMode::Flat;
    std::optional<MaterialId> materialId;
    bool visible = true;
    bool locked = false;

    uint32_t nextVertexId = 0;
    uint32_t nextEdgeId = 0;
    uint32_t nextFaceId = 0;

    // Construction helpers
    VertexId createVertex(const glm::vec3& position,
                          const glm::vec3& normal = glm::vec3(0.0f, 1.0f, 0.0f),
                          const glm::vec2& uv = glm::vec2(0.0f));

    // Returns kInvalidId when fewer than 3 vertex ids are given
    FaceId createFace(const std::vector<VertexId>& vertexIds);

    // Lookups (linear; algorithms that need many lookups build an index instead)
    const Vertex* findVertex(VertexId id) const;
    Vertex* findVertex(VertexId id);
    const Edge* findEdge(EdgeId id) const;
    const Edge* findEdgeByVertices(VertexId a, VertexId b) const;
    const Face* findFace(FaceId id) const;
    Face* findFace(FaceId id);

    glm::vec3 getFaceNormal(const Face& face) const;
    glm::vec3 getFaceCenter(const Face& face) const;
};

// Key for an undirected vertex pair
using EdgeKey = uint64_t;

inline EdgeKey makeEdgeKey(VertexId v0, VertexId v1) {
    uint32_t minV = std::min(v0, v1);
    uint32_t maxV = std::max(v0, v1);
    return (static_cast<uint64_t>(minV) << 32) | maxV;
}

// Consecutive (wrapping) vertex pairs of a face, in winding order
std::vector<std::pair<VertexId, VertexId>> faceBoundary(const Face& face);

// id -> position in the mesh's vertex/face arrays
std::unordered_map<VertexId, size_t> buildVertexIndex(const Mesh& mesh);
std::unordered_map<FaceId, size_t> buildFaceIndex(const Mesh& mesh);

// Regenerates every Edge from the face list in O(total face corners).
// Pairs that already had an edge keep its id and flags, new pairs get fresh ids.
// Referenced vertex ids are not checked here; see validateTopology().
void rebuildEdges(Mesh& mesh);

// Face normals from the first three corners, vertex normals as the normalized
// sum of adjacent face normals
void recalculateNormals(Mesh& mesh);

// Reports dangling vertex references, short faces and mismatched loop UV arrays.
// Returns true when the mesh is consistent.
bool validateTopology(const Mesh& mesh);

} // namespace loom
