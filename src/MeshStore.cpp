#include <loom/MeshStore.hpp>
#include <loom/Log.hpp>

#include <unordered_set>

namespace loom {

namespace {

// Clears the update flag on every exit path out of updateMesh
struct UpdateScope {
    bool& flag;
    explicit UpdateScope(bool& f) : flag(f) { flag = true; }
    ~UpdateScope() { flag = false; }
};

} // namespace

MeshId MeshStore::addMesh(Mesh mesh) {
    MeshId id = m_nextMeshId++;
    mesh.id = id;

    // Counters must stay ahead of whatever ids the caller filled in
    for (const auto& v : mesh.vertices) mesh.nextVertexId = std::max(mesh.nextVertexId, v.id + 1);
    for (const auto& e : mesh.edges) mesh.nextEdgeId = std::max(mesh.nextEdgeId, e.id + 1);
    for (const auto& f : mesh.faces) mesh.nextFaceId = std::max(mesh.nextFaceId, f.id + 1);

    rebuildEdges(mesh);
    loom::recalculateNormals(mesh);

    logOut() << "[MeshStore] Added mesh " << id << " '" << mesh.name << "' ("
             << mesh.vertices.size() << " verts, " << mesh.faces.size() << " faces)" << std::endl;

    Entry entry;
    entry.mesh = std::make_shared<const Mesh>(std::move(mesh));
    entry.revision = 1;
    m_meshes[id] = std::move(entry);
    return id;
}

bool MeshStore::removeMesh(MeshId id) {
    if (m_updating) {
        logErr() << "[MeshStore] removeMesh called during an update, ignored" << std::endl;
        return false;
    }
    return m_meshes.erase(id) > 0;
}

bool MeshStore::contains(MeshId id) const {
    return m_meshes.find(id) != m_meshes.end();
}

std::shared_ptr<const Mesh> MeshStore::snapshot(MeshId id) const {
    auto it = m_meshes.find(id);
    if (it == m_meshes.end()) return nullptr;
    return it->second.mesh;
}

uint64_t MeshStore::revision(MeshId id) const {
    auto it = m_meshes.find(id);
    return it == m_meshes.end() ? 0 : it->second.revision;
}

std::vector<MeshId> MeshStore::meshIds() const {
    std::vector<MeshId> ids;
    ids.reserve(m_meshes.size());
    for (const auto& [id, entry] : m_meshes) {
        ids.push_back(id);
    }
    return ids;
}

bool MeshStore::updateMesh(MeshId id, const Mutator& mutator, MeshChange change) {
    if (m_updating) {
        logErr() << "[MeshStore] Nested update of mesh " << id << " rejected" << std::endl;
        return false;
    }

    auto it = m_meshes.find(id);
    if (it == m_meshes.end() || !mutator) return false;

    Mesh draft = *it->second.mesh;
    {
        UpdateScope scope(m_updating);
        mutator(draft);
    }
    draft.id = id;

    // Derived data is refreshed only once the mutator has returned
    if (change == MeshChange::Topology) {
        rebuildEdges(draft);
    }
    if (change != MeshChange::Attributes) {
        loom::recalculateNormals(draft);
    }

    it->second.mesh = std::make_shared<const Mesh>(std::move(draft));
    it->second.revision++;
    return true;
}

bool MeshStore::recalculateNormals(MeshId id) {
    return updateMesh(id, [](Mesh&) {}, MeshChange::Geometry);
}

bool MeshStore::deleteVertices(MeshId id, const std::vector<VertexId>& vertexIds) {
    if (vertexIds.empty()) return false;
    std::unordered_set<VertexId> drop(vertexIds.begin(), vertexIds.end());

    return updateMesh(id, [&](Mesh& mesh) {
        mesh.vertices.erase(std::remove_if(mesh.vertices.begin(), mesh.vertices.end(),
                                           [&](const Vertex& v) { return drop.count(v.id) > 0; }),
                            mesh.vertices.end());
        mesh.faces.erase(std::remove_if(mesh.faces.begin(), mesh.faces.end(),
                                        [&](const Face& f) {
                                            for (VertexId vid : f.vertexIds) {
                                                if (drop.count(vid)) return true;
                                            }
                                            return false;
                                        }),
                         mesh.faces.end());
    });
}

bool MeshStore::deleteEdges(MeshId id, const std::vector<EdgeId>& edgeIds) {
    if (edgeIds.empty()) return false;
    std::unordered_set<EdgeId> drop(edgeIds.begin(), edgeIds.end());

    // Edges are derived, so removing one means removing the faces that produce it
    return updateMesh(id, [&](Mesh& mesh) {
        std::unordered_set<EdgeKey> pairs;
        for (const auto& e : mesh.edges) {
            if (drop.count(e.id)) pairs.insert(makeEdgeKey(e.vertexIds[0], e.vertexIds[1]));
        }
        mesh.faces.erase(std::remove_if(mesh.faces.begin(), mesh.faces.end(),
                                        [&](const Face& f) {
                                            for (const auto& [a, b] : faceBoundary(f)) {
                                                if (pairs.count(makeEdgeKey(a, b))) return true;
                                            }
                                            return false;
                                        }),
                         mesh.faces.end());
    });
}

bool MeshStore::deleteFaces(MeshId id, const std::vector<FaceId>& faceIds) {
    if (faceIds.empty()) return false;
    std::unordered_set<FaceId> drop(faceIds.begin(), faceIds.end());

    return updateMesh(id, [&](Mesh& mesh) {
        mesh.faces.erase(std::remove_if(mesh.faces.begin(), mesh.faces.end(),
                                        [&](const Face& f) { return drop.count(f.id) > 0; }),
                         mesh.faces.end());
    });
}

VertexId MeshStore::mergeVertices(MeshId id, const std::vector<VertexId>& vertexIds) {
    if (vertexIds.size() < 2) return kInvalidId;

    auto current = snapshot(id);
    if (!current) return kInvalidId;

    VertexId keepId = vertexIds[0];
    if (!current->findVertex(keepId)) {
        logErr() << "[MeshStore] Merge target vertex " << keepId << " not found" << std::endl;
        return kInvalidId;
    }

    std::unordered_set<VertexId> mergeSet(vertexIds.begin(), vertexIds.end());

    bool applied = updateMesh(id, [&](Mesh& mesh) {
        glm::vec3 center(0.0f);
        glm::vec3 normal(0.0f);
        glm::vec2 uv(0.0f);
        int count = 0;
        for (const auto& v : mesh.vertices) {
            if (!mergeSet.count(v.id)) continue;
            center += v.position;
            normal += v.normal;
            uv += v.uv;
            count++;
        }

        if (Vertex* kept = mesh.findVertex(keepId)) {
            kept->position = center / static_cast<float>(count);
            kept->normal = normal / static_cast<float>(count);
            kept->uv = uv / static_cast<float>(count);
        }

        mesh.vertices.erase(std::remove_if(mesh.vertices.begin(), mesh.vertices.end(),
                                           [&](const Vertex& v) {
                                               return v.id != keepId && mergeSet.count(v.id) > 0;
                                           }),
                            mesh.vertices.end());

        std::vector<Face> kept;
        kept.reserve(mesh.faces.size());
        for (auto& face : mesh.faces) {
            bool loopUVs = face.hasLoopUVs();
            std::vector<VertexId> ids;
            std::vector<glm::vec2> uvs;
            for (size_t i = 0; i < face.vertexIds.size(); ++i) {
                VertexId vid = mergeSet.count(face.vertexIds[i]) ? keepId : face.vertexIds[i];
                // Collapse runs of the same corner
                if (!ids.empty() && ids.back() == vid) continue;
                ids.push_back(vid);
                if (loopUVs) uvs.push_back(face.uvs[i]);
            }
            if (ids.size() >= 2 && ids.front() == ids.back()) {
                ids.pop_back();
                if (loopUVs) uvs.pop_back();
            }

            std::unordered_set<VertexId> unique(ids.begin(), ids.end());
            // Fewer than 3 corners, or a pinch that is not adjacent: drop the face
            if (ids.size() < 3 || unique.size() != ids.size()) continue;

            face.vertexIds = std::move(ids);
            face.uvs = std::move(uvs);
            kept.push_back(std::move(face));
        }
        mesh.faces = std::move(kept);
    });

    if (!applied) return kInvalidId;

    logOut() << "[MeshStore] Merged " << mergeSet.size() << " vertices into " << keepId << std::endl;
    return keepId;
}

} // namespace loom
