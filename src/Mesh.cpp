#include <loom/Mesh.hpp>
#include <loom/Log.hpp>

namespace loom {

VertexId Mesh::createVertex(const glm::vec3& position, const glm::vec3& normal, const glm::vec2& uv) {
    Vertex v;
    v.id = nextVertexId++;
    v.position = position;
    v.normal = normal;
    v.uv = uv;
    vertices.push_back(v);
    return v.id;
}

FaceId Mesh::createFace(const std::vector<VertexId>& vertexIds) {
    if (vertexIds.size() < 3) return kInvalidId;

    Face f;
    f.id = nextFaceId++;
    f.vertexIds = vertexIds;
    faces.push_back(std::move(f));
    return faces.back().id;
}

const Vertex* Mesh::findVertex(VertexId vid) const {
    for (const auto& v : vertices) {
        if (v.id == vid) return &v;
    }
    return nullptr;
}

Vertex* Mesh::findVertex(VertexId vid) {
    for (auto& v : vertices) {
        if (v.id == vid) return &v;
    }
    return nullptr;
}

const Edge* Mesh::findEdge(EdgeId eid) const {
    for (const auto& e : edges) {
        if (e.id == eid) return &e;
    }
    return nullptr;
}

const Edge* Mesh::findEdgeByVertices(VertexId a, VertexId b) const {
    EdgeKey key = makeEdgeKey(a, b);
    for (const auto& e : edges) {
        if (makeEdgeKey(e.vertexIds[0], e.vertexIds[1]) == key) return &e;
    }
    return nullptr;
}

const Face* Mesh::findFace(FaceId fid) const {
    for (const auto& f : faces) {
        if (f.id == fid) return &f;
    }
    return nullptr;
}

Face* Mesh::findFace(FaceId fid) {
    for (auto& f : faces) {
        if (f.id == fid) return &f;
    }
    return nullptr;
}

glm::vec3 Mesh::getFaceNormal(const Face& face) const {
    if (face.vertexIds.size() < 3) return glm::vec3(0.0f, 1.0f, 0.0f);

    const Vertex* v0 = findVertex(face.vertexIds[0]);
    const Vertex* v1 = findVertex(face.vertexIds[1]);
    const Vertex* v2 = findVertex(face.vertexIds[2]);
    if (!v0 || !v1 || !v2) return glm::vec3(0.0f, 1.0f, 0.0f);

    glm::vec3 n = glm::cross(v1->position - v0->position, v2->position - v0->position);
    float len = glm::length(n);
    return len > 0.0001f ? n / len : glm::vec3(0.0f, 1.0f, 0.0f);
}

glm::vec3 Mesh::getFaceCenter(const Face& face) const {
    glm::vec3 center(0.0f);
    int count = 0;
    for (VertexId vid : face.vertexIds) {
        if (const Vertex* v = findVertex(vid)) {
            center += v->position;
            count++;
        }
    }
    return count > 0 ? center / static_cast<float>(count) : center;
}

std::vector<std::pair<VertexId, VertexId>> faceBoundary(const Face& face) {
    std::vector<std::pair<VertexId, VertexId>> result;
    size_t n = face.vertexIds.size();
    result.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        result.emplace_back(face.vertexIds[i], face.vertexIds[(i + 1) % n]);
    }
    return result;
}

std::unordered_map<VertexId, size_t> buildVertexIndex(const Mesh& mesh) {
    std::unordered_map<VertexId, size_t> index;
    index.reserve(mesh.vertices.size());
    for (size_t i = 0; i < mesh.vertices.size(); ++i) {
        index[mesh.vertices[i].id] = i;
    }
    return index;
}

std::unordered_map<FaceId, size_t> buildFaceIndex(const Mesh& mesh) {
    std::unordered_map<FaceId, size_t> index;
    index.reserve(mesh.faces.size());
    for (size_t i = 0; i < mesh.faces.size(); ++i) {
        index[mesh.faces[i].id] = i;
    }
    return index;
}

void rebuildEdges(Mesh& mesh) {
    // Previous edges by vertex pair, so surviving pairs keep id and flags
    std::unordered_map<EdgeKey, const Edge*> previous;
    previous.reserve(mesh.edges.size());
    for (const auto& e : mesh.edges) {
        previous[makeEdgeKey(e.vertexIds[0], e.vertexIds[1])] = &e;
    }

    std::vector<Edge> rebuilt;
    std::unordered_map<EdgeKey, size_t> slot;

    for (const auto& face : mesh.faces) {
        for (const auto& [a, b] : faceBoundary(face)) {
            if (a == b) continue;
            EdgeKey key = makeEdgeKey(a, b);

            auto it = slot.find(key);
            if (it != slot.end()) {
                auto& faceIds = rebuilt[it->second].faceIds;
                if (std::find(faceIds.begin(), faceIds.end(), face.id) == faceIds.end()) {
                    faceIds.push_back(face.id);
                }
                continue;
            }

            Edge e;
            auto prev = previous.find(key);
            if (prev != previous.end()) {
                e.id = prev->second->id;
                e.selected = prev->second->selected;
                e.seam = prev->second->seam;
            } else {
                e.id = mesh.nextEdgeId++;
            }
            e.vertexIds = {std::min(a, b), std::max(a, b)};
            e.faceIds.push_back(face.id);

            slot[key] = rebuilt.size();
            rebuilt.push_back(std::move(e));
        }
    }

    mesh.edges = std::move(rebuilt);
}

void recalculateNormals(Mesh& mesh) {
    auto vertexIndex = buildVertexIndex(mesh);
    std::vector<glm::vec3> accum(mesh.vertices.size(), glm::vec3(0.0f));

    for (auto& face : mesh.faces) {
        face.normal = glm::vec3(0.0f, 1.0f, 0.0f);
        if (face.vertexIds.size() < 3) continue;

        auto i0 = vertexIndex.find(face.vertexIds[0]);
        auto i1 = vertexIndex.find(face.vertexIds[1]);
        auto i2 = vertexIndex.find(face.vertexIds[2]);
        if (i0 == vertexIndex.end() || i1 == vertexIndex.end() || i2 == vertexIndex.end()) continue;

        const glm::vec3& p0 = mesh.vertices[i0->second].position;
        glm::vec3 n = glm::cross(mesh.vertices[i1->second].position - p0,
                                 mesh.vertices[i2->second].position - p0);
        float len = glm::length(n);
        if (len < 0.0001f) continue;  // Degenerate, keeps the default normal
        face.normal = n / len;

        for (VertexId vid : face.vertexIds) {
            auto it = vertexIndex.find(vid);
            if (it != vertexIndex.end()) {
                accum[it->second] += face.normal;
            }
        }
    }

    for (size_t i = 0; i < mesh.vertices.size(); ++i) {
        float len = glm::length(accum[i]);
        mesh.vertices[i].normal = len > 0.0001f ? accum[i] / len : glm::vec3(0.0f, 1.0f, 0.0f);
    }
}

bool validateTopology(const Mesh& mesh) {
    bool valid = true;
    auto vertexIndex = buildVertexIndex(mesh);

    for (const auto& face : mesh.faces) {
        if (face.vertexIds.size() < 3) {
            logErr() << "[Mesh] Face " << face.id << ": only " << face.vertexIds.size()
                     << " corners" << std::endl;
            valid = false;
        }
        for (VertexId vid : face.vertexIds) {
            if (vertexIndex.find(vid) == vertexIndex.end()) {
                logErr() << "[Mesh] Face " << face.id << ": missing vertex " << vid << std::endl;
                valid = false;
            }
        }
        if (!face.uvs.empty() && face.uvs.size() != face.vertexIds.size()) {
            logErr() << "[Mesh] Face " << face.id << ": loop UV count mismatch ("
                     << face.uvs.size() << " vs " << face.vertexIds.size() << ")" << std::endl;
            valid = false;
        }
    }

    for (const auto& edge : mesh.edges) {
        for (VertexId vid : edge.vertexIds) {
            if (vertexIndex.find(vid) == vertexIndex.end()) {
                logErr() << "[Mesh] Edge " << edge.id << ": missing vertex " << vid << std::endl;
                valid = false;
            }
        }
    }

    return valid;
}

} // namespace loom
