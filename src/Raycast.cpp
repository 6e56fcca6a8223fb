#include <loom/Raycast.hpp>

#include <cmath>
#include <limits>

namespace loom {

float intersectTriangle(const Ray& ray, const glm::vec3& v0, const glm::vec3& v1, const glm::vec3& v2) {
    glm::vec3 edge1 = v1 - v0;
    glm::vec3 edge2 = v2 - v0;
    glm::vec3 h = glm::cross(ray.direction, edge2);
    float a = glm::dot(edge1, h);

    if (std::abs(a) < 0.0001f) return -1.0f;  // Parallel

    float f = 1.0f / a;
    glm::vec3 s = ray.origin - v0;
    float u = f * glm::dot(s, h);
    if (u < 0.0f || u > 1.0f) return -1.0f;

    glm::vec3 q = glm::cross(s, edge1);
    float v = f * glm::dot(ray.direction, q);
    if (v < 0.0f || u + v > 1.0f) return -1.0f;

    float t = f * glm::dot(edge2, q);
    return t > 0.0001f ? t : -1.0f;
}

MeshRayHit raycastFaces(const Mesh& mesh, const Transform& transform, const Ray& ray) {
    MeshRayHit result;
    float closestDist = std::numeric_limits<float>::max();

    auto vertexIndex = buildVertexIndex(mesh);
    glm::mat4 model = transform.getMatrix();

    std::vector<glm::vec3> corners;
    for (const auto& face : mesh.faces) {
        if (face.vertexIds.size() < 3) continue;

        corners.clear();
        bool complete = true;
        for (VertexId vid : face.vertexIds) {
            auto it = vertexIndex.find(vid);
            if (it == vertexIndex.end()) {
                complete = false;
                break;
            }
            corners.push_back(glm::vec3(model * glm::vec4(mesh.vertices[it->second].position, 1.0f)));
        }
        if (!complete) continue;

        // Fan triangulation
        for (size_t i = 1; i + 1 < corners.size(); ++i) {
            float t = intersectTriangle(ray, corners[0], corners[i], corners[i + 1]);
            if (t > 0.0f && t < closestDist) {
                closestDist = t;
                result.hit = true;
                result.distance = t;
                result.position = ray.origin + ray.direction * t;
                result.faceId = face.id;
            }
        }
    }

    return result;
}

float pointSegmentDistance(const glm::vec3& p, const glm::vec3& a, const glm::vec3& b) {
    glm::vec3 ab = b - a;
    float lenSq = glm::dot(ab, ab);
    if (lenSq < 1e-12f) return glm::length(p - a);

    float t = glm::clamp(glm::dot(p - a, ab) / lenSq, 0.0f, 1.0f);
    return glm::length(p - (a + ab * t));
}

EdgeId closestFaceEdge(const Mesh& mesh, const Transform& transform, FaceId faceId, const glm::vec3& worldPoint) {
    const Face* face = mesh.findFace(faceId);
    if (!face) return kInvalidId;

    EdgeId best = kInvalidId;
    float bestDist = std::numeric_limits<float>::max();

    for (const auto& [a, b] : faceBoundary(*face)) {
        const Vertex* va = mesh.findVertex(a);
        const Vertex* vb = mesh.findVertex(b);
        const Edge* edge = mesh.findEdgeByVertices(a, b);
        if (!va || !vb || !edge) continue;

        float d = pointSegmentDistance(worldPoint, transform.localToWorld(va->position),
                                       transform.localToWorld(vb->position));
        if (d < bestDist) {
            bestDist = d;
            best = edge->id;
        }
    }
    return best;
}

} // namespace loom
