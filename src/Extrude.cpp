#include <loom/Extrude.hpp>
#include <loom/Log.hpp>

#include <algorithm>
#include <unordered_set>

namespace loom {

FaceRegion collectFaceRegion(const Mesh& mesh, const std::vector<FaceId>& faceIds) {
    FaceRegion region;
    std::unordered_set<FaceId> wanted(faceIds.begin(), faceIds.end());
    std::unordered_set<VertexId> seen;
    std::unordered_map<EdgeKey, int> useCount;

    for (const auto& face : mesh.faces) {
        if (!wanted.count(face.id) || face.vertexIds.size() < 3) continue;
        region.faceIds.push_back(face.id);
        for (VertexId vid : face.vertexIds) {
            if (seen.insert(vid).second) region.vertexIds.push_back(vid);
        }
        for (const auto& [a, b] : faceBoundary(face)) {
            if (a != b) useCount[makeEdgeKey(a, b)]++;
        }
    }

    for (const auto& face : mesh.faces) {
        if (!wanted.count(face.id) || face.vertexIds.size() < 3) continue;
        for (const auto& [a, b] : faceBoundary(face)) {
            if (a == b || useCount[makeEdgeKey(a, b)] != 1) continue;
            region.boundary.push_back({face.id, a, b});
        }
    }
    return region;
}

glm::vec3 averageFaceNormal(const Mesh& mesh, const std::vector<FaceId>& faceIds) {
    std::unordered_set<FaceId> wanted(faceIds.begin(), faceIds.end());
    glm::vec3 sum(0.0f);
    for (const auto& face : mesh.faces) {
        if (wanted.count(face.id)) sum += mesh.getFaceNormal(face);
    }
    float len = glm::length(sum);
    return len > 0.0001f ? sum / len : glm::vec3(0.0f);
}

bool extrudeFaceRegion(MeshStore& meshes, MeshId meshId, const std::vector<FaceId>& faceIds,
                       const std::unordered_map<VertexId, glm::vec3>& positions) {
    auto mesh = meshes.snapshot(meshId);
    if (!mesh) {
        logErr() << "[Extrude] Unknown mesh " << meshId << std::endl;
        return false;
    }

    FaceRegion region = collectFaceRegion(*mesh, faceIds);
    if (region.faceIds.empty()) {
        logErr() << "[Extrude] No faces to extrude on mesh " << meshId << std::endl;
        return false;
    }

    auto vertexIndex = buildVertexIndex(*mesh);
    for (VertexId vid : region.vertexIds) {
        if (!vertexIndex.count(vid)) {
            logErr() << "[Extrude] Region corner " << vid << " is missing, nothing extruded" << std::endl;
            return false;
        }
    }

    // Corners the rest of the mesh (or a bridge quad) still needs in place
    std::unordered_set<FaceId> inRegion(region.faceIds.begin(), region.faceIds.end());
    std::unordered_set<VertexId> regionCorners(region.vertexIds.begin(), region.vertexIds.end());
    std::unordered_set<VertexId> split;
    for (const auto& side : region.boundary) {
        split.insert(side.from);
        split.insert(side.to);
    }
    for (const auto& face : mesh->faces) {
        if (inRegion.count(face.id)) continue;
        for (VertexId vid : face.vertexIds) {
            if (regionCorners.count(vid)) split.insert(vid);
        }
    }

    size_t duplicated = 0;
    size_t bridged = 0;

    bool applied = meshes.updateMesh(meshId, [&](Mesh& m) {
        auto index = buildVertexIndex(m);
        std::unordered_map<VertexId, VertexId> moved;

        for (VertexId vid : region.vertexIds) {
            size_t slot = index[vid];
            auto target = positions.find(vid);
            glm::vec3 position = target != positions.end() ? target->second : m.vertices[slot].position;

            if (!split.count(vid)) {
                m.vertices[slot].position = position;
                moved[vid] = vid;
                continue;
            }

            Vertex copy = m.vertices[slot];
            copy.id = m.nextVertexId++;
            copy.position = position;
            copy.selected = false;
            m.vertices.push_back(copy);
            moved[vid] = copy.id;
            duplicated++;
        }

        std::unordered_map<FaceId, std::optional<MaterialId>> materials;
        for (auto& face : m.faces) {
            if (!inRegion.count(face.id)) continue;
            for (VertexId& vid : face.vertexIds) vid = moved[vid];
            materials[face.id] = face.materialId;
        }

        for (const auto& side : region.boundary) {
            VertexId a = side.from;
            VertexId b = side.to;
            FaceId fid = m.createFace({a, b, moved[b], moved[a]});
            if (fid == kInvalidId) continue;
            m.faces.back().materialId = materials[side.faceId];
            bridged++;
        }
    }, MeshChange::Topology);

    if (!applied) return false;

    logOut() << "[Extrude] " << region.faceIds.size() << " face(s) on mesh " << meshId << ": "
             << duplicated << " new vertices, " << bridged << " bridge quads" << std::endl;
    return true;
}

bool extrudeFaces(MeshStore& meshes, MeshId meshId, const std::vector<FaceId>& faceIds, float distance) {
    auto mesh = meshes.snapshot(meshId);
    if (!mesh) {
        logErr() << "[Extrude] Unknown mesh " << meshId << std::endl;
        return false;
    }

    FaceRegion region = collectFaceRegion(*mesh, faceIds);
    glm::vec3 offset = averageFaceNormal(*mesh, region.faceIds) * distance;

    std::unordered_map<VertexId, glm::vec3> positions;
    for (VertexId vid : region.vertexIds) {
        if (const Vertex* v = mesh->findVertex(vid)) positions[vid] = v->position + offset;
    }
    return extrudeFaceRegion(meshes, meshId, region.faceIds, positions);
}

bool insetFaces(MeshStore& meshes, MeshId meshId, const std::vector<FaceId>& faceIds, float scale) {
    auto mesh = meshes.snapshot(meshId);
    if (!mesh) {
        logErr() << "[Inset] Unknown mesh " << meshId << std::endl;
        return false;
    }

    float s = std::clamp(scale, kMinInsetScale, kMaxInsetScale);
    FaceRegion region = collectFaceRegion(*mesh, faceIds);

    glm::vec3 center(0.0f);
    std::vector<const Vertex*> corners;
    for (VertexId vid : region.vertexIds) {
        if (const Vertex* v = mesh->findVertex(vid)) {
            corners.push_back(v);
            center += v->position;
        }
    }
    if (!corners.empty()) center /= static_cast<float>(corners.size());

    std::unordered_map<VertexId, glm::vec3> positions;
    for (const Vertex* v : corners) {
        positions[v->id] = center + (v->position - center) * s;
    }
    return extrudeFaceRegion(meshes, meshId, region.faceIds, positions);
}

} // namespace loom
