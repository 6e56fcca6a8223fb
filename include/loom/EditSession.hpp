#pragma once

#include <loom/Input.hpp>
#include <loom/LoopCut.hpp>
#include <loom/MeshStore.hpp>
#include <loom/Raycast.hpp>
#include <loom/Scene.hpp>
#include <loom/Selection.hpp>
#include <loom/Settings.hpp>
#include <loom/ToolState.hpp>
#include <loom/TransformOperation.hpp>

#include <optional>

namespace loom {

/**
 * Routes the host's ordered input stream to selection, transforms and the loop
 * cut tool. An active operation sees every event first; otherwise keys map to
 * editor commands:
 *
 *   Tab        object/edit mode          1/2/3   vertex/edge/face mode
 *   G/R/S      move/rotate/scale         Ctrl+R  loop cut
 *   E/I        extrude/inset faces
 *   A          select all (Alt+A clears) Delete  delete components
 *   Left click pick (Shift adds)
 *
 * Picking and loop cut hovering need the ray under the cursor, which the host
 * builds from its camera and passes with the event.
 */
class EditSession {
public:
    EditSession(MeshStore& meshes, SceneStore& scene, const EditorSettings& settings);
    EditSession(MeshStore& meshes, SceneStore& scene, const EditorSettings& settings, PointerCapture& capture);

    EditSession(const EditSession&) = delete;
    EditSession& operator=(const EditSession&) = delete;

    // Returns true when the event was consumed
    bool handleEvent(const InputEvent& event, const ViewContext& view,
                     const std::optional<Ray>& pickRay = std::nullopt);

    // Commands (also reachable through handleEvent)
    bool toggleEditMode();
    bool startTransform(ToolKind kind);
    bool startLoopCut();
    bool deleteSelection();
    bool pick(const Ray& ray, bool additive);

    // Transforms started while the UV editor has focus edit UVs instead of positions
    void setUVEditorFocused(bool focused) { m_uvEditorFocused = focused; }
    bool isUVEditorFocused() const { return m_uvEditorFocused; }

    SelectionStore& getSelection() { return m_selection; }
    const SelectionStore& getSelection() const { return m_selection; }
    ToolStore& getTools() { return m_tools; }
    const ToolStore& getTools() const { return m_tools; }
    TransformOperation& getTransform() { return m_transform; }
    LoopCutTool& getLoopCut() { return m_loopCut; }

    MeshStore& getMeshes() { return m_meshes; }
    SceneStore& getScene() { return m_scene; }

private:
    bool handleLoopCutEvent(const InputEvent& event, const ViewContext& view, const std::optional<Ray>& pickRay);
    bool handleKey(const InputEvent& event);
    Transform getEditTransform() const;

    MeshStore& m_meshes;
    SceneStore& m_scene;
    const EditorSettings& m_settings;

    NullPointerCapture m_nullCapture;
    PointerCapture& m_capture;

    ToolStore m_tools;
    SelectionStore m_selection;
    TransformOperation m_transform;
    LoopCutTool m_loopCut;

    bool m_uvEditorFocused = false;
    glm::vec2 m_lastCursor{0.0f};
};

} // namespace loom
