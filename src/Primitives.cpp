#include <loom/Primitives.hpp>

#include <algorithm>

namespace loom {

Mesh PrimitiveBuilder::createCube(float size, bool loopUVs) {
    Mesh mesh;
    mesh.name = "Cube";

    float h = size / 2.0f;
    glm::vec3 corners[8] = {
        {-h, -h, -h}, { h, -h, -h}, { h,  h, -h}, {-h,  h, -h},
        {-h, -h,  h}, { h, -h,  h}, { h,  h,  h}, {-h,  h,  h}
    };
    for (const auto& c : corners) {
        mesh.createVertex(c, glm::normalize(c));
    }

    auto addQuad = [&](VertexId c0, VertexId c1, VertexId c2, VertexId c3) {
        FaceId fid = mesh.createFace({c0, c1, c2, c3});
        if (loopUVs) {
            mesh.findFace(fid)->uvs = {{0, 0}, {1, 0}, {1, 1}, {0, 1}};
        }
    };

    addQuad(4, 5, 6, 7);    // +Z
    addQuad(1, 0, 3, 2);    // -Z
    addQuad(5, 1, 2, 6);    // +X
    addQuad(0, 4, 7, 3);    // -X
    addQuad(7, 6, 2, 3);    // +Y
    addQuad(0, 1, 5, 4);    // -Y

    return mesh;
}

Mesh PrimitiveBuilder::createGrid(int columns, int rows, float size) {
    Mesh mesh;
    mesh.name = "Grid";

    columns = std::max(1, columns);
    rows = std::max(1, rows);
    float half = size / 2.0f;

    for (int j = 0; j <= rows; ++j) {
        for (int i = 0; i <= columns; ++i) {
            float u = static_cast<float>(i) / columns;
            float v = static_cast<float>(j) / rows;
            mesh.createVertex({-half + u * size, 0.0f, -half + v * size}, {0, 1, 0}, {u, v});
        }
    }

    auto index = [columns](int i, int j) {
        return static_cast<VertexId>(j * (columns + 1) + i);
    };
    for (int j = 0; j < rows; ++j) {
        for (int i = 0; i < columns; ++i) {
            mesh.createFace({index(i, j), index(i, j + 1), index(i + 1, j + 1), index(i + 1, j)});
        }
    }

    return mesh;
}

} // namespace loom
