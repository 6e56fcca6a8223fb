#pragma once

#include <loom/MeshStore.hpp>

#include <glm/glm.hpp>
#include <unordered_map>
#include <vector>

namespace loom {

constexpr float kMinInsetScale = 0.05f;
constexpr float kMaxInsetScale = 2.0f;

// A side used by exactly one face of the region, in that face's winding
struct RegionSide {
    FaceId faceId = kInvalidId;
    VertexId from = kInvalidId;
    VertexId to = kInvalidId;
};

// Selected faces treated as one connected patch
struct FaceRegion {
    std::vector<FaceId> faceIds;            // Existing faces, mesh order
    std::vector<VertexId> vertexIds;        // Corners, first seen first
    std::vector<RegionSide> boundary;
};

FaceRegion collectFaceRegion(const Mesh& mesh, const std::vector<FaceId>& faceIds);

// Normalized sum of the faces' normals, zero when they cancel out
glm::vec3 averageFaceNormal(const Mesh& mesh, const std::vector<FaceId>& faceIds);

// Detaches the region and bridges the gap. Corners on the region boundary, or
// shared with faces outside it, are duplicated at `positions`; the region faces
// move onto the duplicates and keep their ids. Each boundary side a->b gets the
// quad [a, b, b', a'], so the new faces follow the region's winding. Corners
// used only by the region move in place. Corners missing from `positions` stay
// where they are.
// Returns false, leaving the mesh untouched, when no region face exists.
bool extrudeFaceRegion(MeshStore& meshes, MeshId meshId, const std::vector<FaceId>& faceIds,
                       const std::unordered_map<VertexId, glm::vec3>& positions);

// Pushes the region `distance` along its averaged normal
bool extrudeFaces(MeshStore& meshes, MeshId meshId, const std::vector<FaceId>& faceIds, float distance);

// Shrinks the region towards the centroid of its corners and rings it with
// quads. scale is clamped to [kMinInsetScale, kMaxInsetScale].
bool insetFaces(MeshStore& meshes, MeshId meshId, const std::vector<FaceId>& faceIds, float scale);

} // namespace loom
