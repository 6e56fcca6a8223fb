#pragma once

#include <loom/Mesh.hpp>

namespace loom {

/**
 * Builders for simple editable meshes. Faces are quads wound counter-clockwise
 * seen from outside; edges and normals are derived when the mesh is added to a
 * MeshStore.
 */
class PrimitiveBuilder {
public:
    /**
     * Axis-aligned cube centered on the origin.
     * Vertex ids 0-3 are the -Z corners (-x-y, +x-y, +x+y, -x+y), 4-7 the +Z ones.
     * @param size Side length
     * @param loopUVs Give every face its own 0-1 corner UVs
     */
    static Mesh createCube(float size = 2.0f, bool loopUVs = false);

    /**
     * Flat grid of quads in the XZ plane, facing +Y.
     * Vertex (column i, row j) has id j * (columns + 1) + i.
     */
    static Mesh createGrid(int columns, int rows, float size = 2.0f);
};

} // namespace loom
