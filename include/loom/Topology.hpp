#pragma once

#include <loom/Mesh.hpp>

#include <glm/glm.hpp>
#include <unordered_map>
#include <utility>
#include <vector>

namespace loom {

using VertexPair = std::pair<VertexId, VertexId>;

// Lookup tables over one mesh. Pointers are into that mesh and live as long as it does.
struct MeshAdjacency {
    std::unordered_map<EdgeKey, const Edge*> edgeByKey;
    std::unordered_map<EdgeId, const Edge*> edgeById;
    std::unordered_map<FaceId, const Face*> faceById;
    std::unordered_map<VertexId, const Vertex*> vertexById;
    std::unordered_map<VertexId, std::vector<const Edge*>> edgesByVertex;

    const Edge* edgeBetween(VertexId a, VertexId b) const;
};

MeshAdjacency buildAdjacency(const Mesh& mesh);

// One quad crossed by a loop: the edge it was entered through and the one opposite.
// Both pairs start at the corner they share with the edge that follows the entry edge.
struct FaceSpan {
    FaceId faceId = kInvalidId;
    VertexPair parallelA{kInvalidId, kInvalidId};
    VertexPair parallelB{kInvalidId, kInvalidId};
};

// Walks from each face of the start edge across opposite quad edges. Stops at
// non-quads, already visited faces and edges without exactly two faces.
std::vector<FaceSpan> computeEdgeLoopFaceSpans(const Mesh& mesh, EdgeId startEdgeId);

// Start edge plus every opposite edge crossed by the spans
std::vector<EdgeId> computeEdgeRing(const Mesh& mesh, EdgeId startEdgeId);

// Edges continuing straight through valence-4 vertices of a quad grid
std::vector<EdgeId> computeEdgeLoop(const Mesh& mesh, EdgeId startEdgeId);

// Faces crossed by the spans, in walk order
std::vector<FaceId> computeFaceLoop(const Mesh& mesh, EdgeId startEdgeId);

// Edges used by fewer than two faces
std::vector<EdgeId> boundaryEdges(const Mesh& mesh);

// Position at t along edge (0 = first vertex). Missing vertices yield the origin.
glm::vec3 evalEdgePoint(const Mesh& mesh, const VertexPair& edge, float t);

// Orders the pair so the "low" end comes first: lower coordinate on the edge's
// dominant axis, lower id when the ends tie on that axis
VertexPair canonicalEdgeOrder(const Mesh& mesh, VertexId a, VertexId b);

// Same as evalEdgePoint, with t measured from the canonical low end
glm::vec3 canonicalEdgePoint(const Mesh& mesh, VertexId a, VertexId b, float t);

} // namespace loom
