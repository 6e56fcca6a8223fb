#include <loom/Scene.hpp>
#include <loom/Log.hpp>

#include <algorithm>

namespace loom {

ObjectId SceneStore::addObject(const std::string& name, MeshId meshId, const Transform& transform) {
    SceneObject obj;
    obj.id = m_nextId++;
    obj.name = name;
    obj.meshId = meshId;
    obj.transform = transform;
    m_objects.push_back(obj);
    m_revision++;

    logOut() << "[Scene] Added object " << obj.id << " '" << name << "' (mesh " << meshId << ")" << std::endl;
    return obj.id;
}

bool SceneStore::removeObject(ObjectId id) {
    auto it = std::find_if(m_objects.begin(), m_objects.end(),
                           [id](const SceneObject& o) { return o.id == id; });
    if (it == m_objects.end()) return false;
    m_objects.erase(it);
    m_revision++;
    return true;
}

const SceneObject* SceneStore::findObject(ObjectId id) const {
    for (const auto& obj : m_objects) {
        if (obj.id == id) return &obj;
    }
    return nullptr;
}

const SceneObject* SceneStore::findObjectByMesh(MeshId meshId) const {
    for (const auto& obj : m_objects) {
        if (obj.meshId == meshId) return &obj;
    }
    return nullptr;
}

SceneObject* SceneStore::findMutable(ObjectId id) {
    for (auto& obj : m_objects) {
        if (obj.id == id) return &obj;
    }
    return nullptr;
}

bool SceneStore::setTransform(ObjectId id, const Transform& transform) {
    SceneObject* obj = findMutable(id);
    if (!obj) return false;
    obj->transform = transform;
    m_revision++;
    return true;
}

bool SceneStore::setLocked(ObjectId id, bool locked) {
    SceneObject* obj = findMutable(id);
    if (!obj) return false;
    obj->locked = locked;
    m_revision++;
    return true;
}

bool SceneStore::setTransforms(const std::vector<std::pair<ObjectId, Transform>>& transforms) {
    // Validate first so a bad id leaves every object untouched
    for (const auto& [id, transform] : transforms) {
        if (!findObject(id)) {
            logErr() << "[Scene] Unknown object " << id << ", transforms not applied" << std::endl;
            return false;
        }
    }
    for (const auto& [id, transform] : transforms) {
        findMutable(id)->transform = transform;
    }
    m_revision++;
    return true;
}

std::vector<ObjectId> SceneStore::getObjectIds() const {
    std::vector<ObjectId> ids;
    ids.reserve(m_objects.size());
    for (const auto& obj : m_objects) {
        ids.push_back(obj.id);
    }
    return ids;
}

} // namespace loom
