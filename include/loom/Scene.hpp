#pragma once

#include <loom/Mesh.hpp>
#include <loom/Transform.hpp>

#include <string>
#include <vector>

namespace loom {

using ObjectId = uint32_t;

// Placement of one mesh in the scene
struct SceneObject {
    ObjectId id = kInvalidId;
    std::string name;
    MeshId meshId = kInvalidId;
    Transform transform;
    bool visible = true;
    bool locked = false;        // Locked objects can't be selected in object mode
};

class SceneStore {
public:
    SceneStore() = default;

    ObjectId addObject(const std::string& name, MeshId meshId, const Transform& transform = Transform());
    bool removeObject(ObjectId id);
    void clear() { m_objects.clear(); m_revision++; }

    const SceneObject* findObject(ObjectId id) const;
    const SceneObject* findObjectByMesh(MeshId meshId) const;

    bool setTransform(ObjectId id, const Transform& transform);
    bool setLocked(ObjectId id, bool locked);

    // Applies every transform in one step (one revision bump)
    bool setTransforms(const std::vector<std::pair<ObjectId, Transform>>& transforms);

    const std::vector<SceneObject>& getObjects() const { return m_objects; }
    size_t getObjectCount() const { return m_objects.size(); }
    std::vector<ObjectId> getObjectIds() const;

    uint64_t getRevision() const { return m_revision; }

private:
    SceneObject* findMutable(ObjectId id);

    std::vector<SceneObject> m_objects;
    ObjectId m_nextId = 0;
    uint64_t m_revision = 0;
};

} // namespace loom
