#pragma once

#include <loom/Mesh.hpp>
#include <loom/Transform.hpp>

#include <glm/glm.hpp>

namespace loom {

struct Ray {
    glm::vec3 origin{0.0f};
    glm::vec3 direction{0.0f, 0.0f, -1.0f};
};

struct MeshRayHit {
    bool hit = false;
    float distance = 0.0f;
    glm::vec3 position{0.0f};       // World space
    FaceId faceId = kInvalidId;
};

// Closest face hit, testing each face as a triangle fan of its world-space corners
MeshRayHit raycastFaces(const Mesh& mesh, const Transform& transform, const Ray& ray);

// Moller-Trumbore; returns the ray parameter or a negative value on a miss
float intersectTriangle(const Ray& ray, const glm::vec3& v0, const glm::vec3& v1, const glm::vec3& v2);

float pointSegmentDistance(const glm::vec3& p, const glm::vec3& a, const glm::vec3& b);

// Boundary edge of the face closest to a world-space point; kInvalidId when the
// face is unknown or none of its sides has an edge record
EdgeId closestFaceEdge(const Mesh& mesh, const Transform& transform, FaceId faceId, const glm::vec3& worldPoint);

} // namespace loom
