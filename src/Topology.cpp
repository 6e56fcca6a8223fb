#include <loom/Topology.hpp>

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace loom {

const Edge* MeshAdjacency::edgeBetween(VertexId a, VertexId b) const {
    auto it = edgeByKey.find(makeEdgeKey(a, b));
    return it == edgeByKey.end() ? nullptr : it->second;
}

MeshAdjacency buildAdjacency(const Mesh& mesh) {
    MeshAdjacency adj;
    adj.vertexById.reserve(mesh.vertices.size());
    adj.edgeById.reserve(mesh.edges.size());
    adj.edgeByKey.reserve(mesh.edges.size());
    adj.faceById.reserve(mesh.faces.size());

    for (const auto& v : mesh.vertices) {
        adj.vertexById[v.id] = &v;
    }
    for (const auto& e : mesh.edges) {
        adj.edgeById[e.id] = &e;
        adj.edgeByKey[makeEdgeKey(e.vertexIds[0], e.vertexIds[1])] = &e;
        adj.edgesByVertex[e.vertexIds[0]].push_back(&e);
        adj.edgesByVertex[e.vertexIds[1]].push_back(&e);
    }
    for (const auto& f : mesh.faces) {
        adj.faceById[f.id] = &f;
    }
    return adj;
}

namespace {

// Orients edge so it starts at the corner it shares with neighbor
VertexPair orientTowards(const VertexPair& edge, const VertexPair& neighbor) {
    auto [a, b] = edge;
    if (a == neighbor.first || a == neighbor.second) return {a, b};
    if (b == neighbor.first || b == neighbor.second) return {b, a};
    return edge;
}

} // namespace

std::vector<FaceSpan> computeEdgeLoopFaceSpans(const Mesh& mesh, EdgeId startEdgeId) {
    std::vector<FaceSpan> spans;

    MeshAdjacency adj = buildAdjacency(mesh);
    auto startIt = adj.edgeById.find(startEdgeId);
    if (startIt == adj.edgeById.end()) return spans;

    const Edge* startEdge = startIt->second;
    EdgeKey startKey = makeEdgeKey(startEdge->vertexIds[0], startEdge->vertexIds[1]);
    std::unordered_set<FaceId> visited;

    auto expand = [&](FaceId faceId, EdgeKey enteredThrough) {
        FaceId current = faceId;
        EdgeKey throughKey = enteredThrough;

        // Each step visits a new face, so the walk is bounded by the face count
        while (visited.find(current) == visited.end()) {
            auto faceIt = adj.faceById.find(current);
            if (faceIt == adj.faceById.end() || !faceIt->second->isQuad()) break;
            const Face& face = *faceIt->second;

            auto sides = faceBoundary(face);
            int idx = -1;
            for (int i = 0; i < 4; ++i) {
                if (makeEdgeKey(sides[i].first, sides[i].second) == throughKey) {
                    idx = i;
                    break;
                }
            }
            if (idx < 0) break;

            int iOpp = (idx + 2) % 4;
            int iRight = (idx + 1) % 4;

            FaceSpan span;
            span.faceId = face.id;
            span.parallelA = orientTowards(sides[idx], sides[iRight]);
            span.parallelB = orientTowards(sides[iOpp], sides[iRight]);
            spans.push_back(span);
            visited.insert(face.id);

            // Cross the opposite edge into the next quad
            EdgeKey nextKey = makeEdgeKey(sides[iOpp].first, sides[iOpp].second);
            auto edgeIt = adj.edgeByKey.find(nextKey);
            if (edgeIt == adj.edgeByKey.end() || edgeIt->second->faceIds.size() != 2) break;

            const auto& faceIds = edgeIt->second->faceIds;
            current = faceIds[0] == current ? faceIds[1] : faceIds[0];
            throughKey = nextKey;
        }
    };

    for (FaceId fid : startEdge->faceIds) {
        expand(fid, startKey);
    }
    return spans;
}

std::vector<EdgeId> computeEdgeRing(const Mesh& mesh, EdgeId startEdgeId) {
    std::vector<EdgeId> ring;
    const Edge* start = mesh.findEdge(startEdgeId);
    if (!start) return ring;

    ring.push_back(startEdgeId);
    std::unordered_set<EdgeId> seen{startEdgeId};

    MeshAdjacency adj = buildAdjacency(mesh);
    for (const auto& span : computeEdgeLoopFaceSpans(mesh, startEdgeId)) {
        for (const VertexPair* side : {&span.parallelA, &span.parallelB}) {
            const Edge* e = adj.edgeBetween(side->first, side->second);
            if (e && seen.insert(e->id).second) {
                ring.push_back(e->id);
            }
        }
    }
    return ring;
}

std::vector<EdgeId> computeEdgeLoop(const Mesh& mesh, EdgeId startEdgeId) {
    std::vector<EdgeId> loop;
    MeshAdjacency adj = buildAdjacency(mesh);
    auto startIt = adj.edgeById.find(startEdgeId);
    if (startIt == adj.edgeById.end()) return loop;

    std::unordered_set<EdgeId> collected{startEdgeId};
    loop.push_back(startEdgeId);

    // Walk away from `from` along `edge`, one edge per vertex
    auto walk = [&](const Edge* edge, VertexId from) {
        const Edge* current = edge;
        VertexId vertex = from;
        for (size_t step = 0; step < mesh.edges.size(); ++step) {
            VertexId next = current->vertexIds[0] == vertex ? current->vertexIds[1] : current->vertexIds[0];

            auto incident = adj.edgesByVertex.find(next);
            if (incident == adj.edgesByVertex.end() || incident->second.size() != 4) break;

            // The continuation shares no face with the current edge
            const Edge* continuation = nullptr;
            int candidates = 0;
            for (const Edge* e : incident->second) {
                if (e == current) continue;
                bool sharesFace = false;
                for (FaceId fid : e->faceIds) {
                    if (std::find(current->faceIds.begin(), current->faceIds.end(), fid) != current->faceIds.end()) {
                        sharesFace = true;
                        break;
                    }
                }
                if (!sharesFace) {
                    continuation = e;
                    candidates++;
                }
            }
            if (candidates != 1) break;

            // All faces around the vertex must be quads
            bool allQuads = true;
            for (const Edge* e : incident->second) {
                for (FaceId fid : e->faceIds) {
                    auto faceIt = adj.faceById.find(fid);
                    if (faceIt == adj.faceById.end() || !faceIt->second->isQuad()) allQuads = false;
                }
            }
            if (!allQuads) break;

            if (!collected.insert(continuation->id).second) break;  // Closed
            loop.push_back(continuation->id);
            current = continuation;
            vertex = next;
        }
    };

    walk(startIt->second, startIt->second->vertexIds[0]);
    walk(startIt->second, startIt->second->vertexIds[1]);
    return loop;
}

std::vector<FaceId> computeFaceLoop(const Mesh& mesh, EdgeId startEdgeId) {
    std::vector<FaceId> faces;
    for (const auto& span : computeEdgeLoopFaceSpans(mesh, startEdgeId)) {
        faces.push_back(span.faceId);
    }
    return faces;
}

std::vector<EdgeId> boundaryEdges(const Mesh& mesh) {
    std::vector<EdgeId> result;
    for (const auto& e : mesh.edges) {
        if (e.faceIds.size() < 2) result.push_back(e.id);
    }
    return result;
}

glm::vec3 evalEdgePoint(const Mesh& mesh, const VertexPair& edge, float t) {
    const Vertex* a = mesh.findVertex(edge.first);
    const Vertex* b = mesh.findVertex(edge.second);
    if (!a || !b) return glm::vec3(0.0f);
    return a->position + (b->position - a->position) * t;
}

VertexPair canonicalEdgeOrder(const Mesh& mesh, VertexId a, VertexId b) {
    const Vertex* va = mesh.findVertex(a);
    const Vertex* vb = mesh.findVertex(b);
    VertexPair byId{std::min(a, b), std::max(a, b)};
    if (!va || !vb) return byId;

    glm::vec3 d = glm::abs(va->position - vb->position);
    float maxD = std::max(d.x, std::max(d.y, d.z));
    int axis = 1;
    if (maxD == d.x) axis = 0;
    else if (maxD == d.z) axis = 2;

    float pa = va->position[axis];
    float pb = vb->position[axis];
    if (pa == pb) return byId;
    return pa < pb ? VertexPair{a, b} : VertexPair{b, a};
}

glm::vec3 canonicalEdgePoint(const Mesh& mesh, VertexId a, VertexId b, float t) {
    return evalEdgePoint(mesh, canonicalEdgeOrder(mesh, a, b), t);
}

} // namespace loom
