#pragma once

#include <string>

namespace loom {

// User-tunable editing parameters
struct EditorSettings {
    // Transform sensitivities (per pixel of pointer movement)
    float moveSensitivity = 0.0025f;
    float rotateSensitivity = 0.005f;
    float scaleSensitivity = 0.005f;

    // Grid snapping
    bool gridSnapping = false;
    float gridSize = 1.0f;
    float uvGridSize = 0.0625f;             // UV moves in the 2D editor

    // Loop cut
    int loopCutSegments = 1;                // Clamped to [1, 64]
    float slideReferenceLength = 300.0f;    // Pixels; never below 300

    // Vertex edits are applied in object-local space
    bool localSpaceEdits = true;
};

class SettingsSerializer {
public:
    // Missing keys keep their defaults. On failure `out` is left untouched.
    static bool load(const std::string& filepath, EditorSettings& out);
    static bool save(const std::string& filepath, const EditorSettings& settings);

    static bool fromJsonString(const std::string& text, EditorSettings& out);
    static std::string toJsonString(const EditorSettings& settings);

    static const std::string& getLastError() { return s_lastError; }

private:
    static std::string s_lastError;
};

} // namespace loom
