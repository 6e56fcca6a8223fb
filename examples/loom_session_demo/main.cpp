#include <loom/Loom.hpp>
#include <cstdlib>
#include <iostream>

using namespace loom;

namespace {

void printMesh(const MeshStore& meshes, MeshId meshId) {
    auto mesh = meshes.snapshot(meshId);
    if (!mesh) return;
    std::cout << "[Demo] '" << mesh->name << "' rev " << meshes.revision(meshId) << ": "
              << mesh->vertices.size() << " vertices, "
              << mesh->edges.size() << " edges, "
              << mesh->faces.size() << " faces" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    EditorSettings settings;
    if (argc > 1 && !SettingsSerializer::load(argv[1], settings)) {
        std::cerr << "Error: " << SettingsSerializer::getLastError() << std::endl;
        return EXIT_FAILURE;
    }

    MeshStore meshes;
    SceneStore scene;
    MeshId cubeId = meshes.addMesh(PrimitiveBuilder::createCube(2.0f, true));
    ObjectId cubeObj = scene.addObject("Cube", cubeId);
    printMesh(meshes, cubeId);

    EditSession session(meshes, scene, settings);
    ViewContext view;
    view.cameraPosition = glm::vec3(0.0f, 0.0f, 6.0f);

    // Object mode: pick the cube, enter edit mode
    session.getSelection().selectObjects({cubeObj});
    session.handleEvent(InputEvent::keyDown(Input::KEY_TAB), view);

    // Face mode: top face, then back to vertex mode (promotes to its 4 corners)
    session.handleEvent(InputEvent::keyDown(Input::KEY_3), view);
    session.getSelection().selectFaces(cubeId, {4});
    session.handleEvent(InputEvent::keyDown(Input::KEY_1), view);
    std::cout << "[Demo] " << session.getSelection().getSelectedVertexIds().size()
              << " vertices selected" << std::endl;

    // Grab, lock to X, drag right, commit
    session.handleEvent(InputEvent::keyDown(Input::KEY_G), view);
    session.handleEvent(InputEvent::keyDown(Input::KEY_X), view);
    for (int i = 0; i < 10; ++i) {
        session.handleEvent(InputEvent::pointerMove(10.0f, 3.0f), view);
    }
    session.handleEvent(InputEvent::keyDown(Input::KEY_ENTER), view);

    auto moved = meshes.snapshot(cubeId);
    for (VertexId vid : {3u, 2u, 6u, 7u}) {
        const Vertex* v = moved->findVertex(vid);
        std::cout << "[Demo] Vertex " << vid << " at (" << v->position.x << ", "
                  << v->position.y << ", " << v->position.z << ")" << std::endl;
    }

    // Loop cut around the cube through one of the front face's vertical edges
    InputEvent ctrlR = InputEvent::keyDown(Input::KEY_R);
    ctrlR.ctrlKey = true;
    session.handleEvent(ctrlR, view);

    auto current = meshes.snapshot(cubeId);
    const Edge* frontEdge = current->findEdgeByVertices(5, 6);
    if (frontEdge && session.getLoopCut().hoverEdge(frontEdge->id)) {
        session.handleEvent(InputEvent::wheel(-1.0f, true), view);      // 2 cuts
        session.handleEvent(InputEvent::pointerDown(Input::MOUSE_LEFT), view);
        session.handleEvent(InputEvent::pointerMove(30.0f, 0.0f), view);
        session.handleEvent(InputEvent::pointerDown(Input::MOUSE_LEFT), view);
    }
    printMesh(meshes, cubeId);

    // Start a scale and back out of it
    session.handleEvent(InputEvent::keyDown(Input::KEY_A), view);
    uint64_t before = meshes.revision(cubeId);
    session.handleEvent(InputEvent::keyDown(Input::KEY_S), view);
    session.handleEvent(InputEvent::pointerMove(80.0f, 0.0f), view);
    session.handleEvent(InputEvent::keyDown(Input::KEY_ESCAPE), view);
    std::cout << "[Demo] Scale cancelled, revision " << (meshes.revision(cubeId) == before ? "unchanged" : "changed")
              << std::endl;

    // Extrude the top face upwards, then inset the cap
    session.handleEvent(InputEvent::keyDown(Input::KEY_3), view);
    session.getSelection().selectFaces(cubeId, {4});
    session.handleEvent(InputEvent::keyDown(Input::KEY_E), view);
    session.handleEvent(InputEvent::pointerMove(0.0f, -40.0f), view);
    session.handleEvent(InputEvent::keyDown(Input::KEY_ENTER), view);
    session.handleEvent(InputEvent::keyDown(Input::KEY_I), view);
    session.handleEvent(InputEvent::pointerMove(-60.0f, 0.0f), view);
    session.handleEvent(InputEvent::keyDown(Input::KEY_ENTER), view);
    printMesh(meshes, cubeId);

    session.handleEvent(InputEvent::keyDown(Input::KEY_TAB), view);
    if (!validateTopology(*meshes.snapshot(cubeId))) {
        return EXIT_FAILURE;
    }

    std::cout << SettingsSerializer::toJsonString(settings) << std::endl;
    return EXIT_SUCCESS;
}
