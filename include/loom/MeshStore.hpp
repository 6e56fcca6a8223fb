#pragma once

#include <loom/Mesh.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace loom {

// What a mutator touched, and therefore what the store refreshes afterwards
enum class MeshChange {
    Attributes,     // Flags, UVs, names: nothing derived
    Geometry,       // Positions moved: normals recomputed
    Topology        // Face list changed: edges rebuilt, normals recomputed
};

/**
 * Owns every mesh and is the only place topology is written.
 *
 * Readers get immutable snapshots; a snapshot stays valid (and unchanged) after
 * later edits, which publish a new one and bump the mesh's revision.
 */
class MeshStore {
public:
    using Mutator = std::function<void(Mesh&)>;

    MeshStore() = default;

    // Takes ownership, assigns a fresh id, derives edges and normals
    MeshId addMesh(Mesh mesh);
    bool removeMesh(MeshId id);
    bool contains(MeshId id) const;

    // Null for unknown ids
    std::shared_ptr<const Mesh> snapshot(MeshId id) const;

    // Bumped on every published edit; 0 for unknown ids
    uint64_t revision(MeshId id) const;

    std::vector<MeshId> meshIds() const;
    size_t meshCount() const { return m_meshes.size(); }

    // Runs the mutator on a draft copy and publishes the result in one step.
    // Returns false for unknown ids and for calls made from inside a mutator.
    bool updateMesh(MeshId id, const Mutator& mutator, MeshChange change = MeshChange::Topology);
    bool isUpdating() const { return m_updating; }

    bool recalculateNormals(MeshId id);

    // Deletion operators. Faces touching removed elements are dropped, edges rebuilt.
    bool deleteVertices(MeshId id, const std::vector<VertexId>& vertexIds);
    bool deleteEdges(MeshId id, const std::vector<EdgeId>& edgeIds);
    bool deleteFaces(MeshId id, const std::vector<FaceId>& faceIds);

    // Collapses the vertices onto the first one, placed at their centroid.
    // Returns the surviving vertex id, kInvalidId when nothing was merged.
    VertexId mergeVertices(MeshId id, const std::vector<VertexId>& vertexIds);

private:
    struct Entry {
        std::shared_ptr<const Mesh> mesh;
        uint64_t revision = 0;
    };

    std::map<MeshId, Entry> m_meshes;
    MeshId m_nextMeshId = 0;
    bool m_updating = false;
};

} // namespace loom
